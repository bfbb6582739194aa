#include "xrfcal/ResolutionCalibrator.hpp"
#include "xrfcal/CurveFit.hpp"
#include "xrfcal/Errors.hpp"
#include "xrfcal/FitStatistics.hpp"
#include "xrfcal/JsonUtils.hpp"
#include "xrfcal/ThreadPool.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace xrfcal {

namespace {

constexpr double MAD_TO_SIGMA = 1.4826;

std::string fmt(double v, int prec)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(prec) << v;
    return os.str();
}

void split(const std::vector<PeakMeasurement>& peaks, Vector& e, Vector& f)
{
    const Index n = static_cast<Index>(peaks.size());
    e.resize(n);
    f.resize(n);
    for (Index i = 0; i < n; ++i) {
        e[i] = peaks[static_cast<std::size_t>(i)].energy;
        f[i] = peaks[static_cast<std::size_t>(i)].fwhm;
    }
}

CurveModel resolution_curve(ResolutionModelKind kind)
{
    return [kind](const Vector& e, const Vector& p) {
        Vector out(e.size());
        for (Index i = 0; i < e.size(); ++i) out[i] = evaluate_resolution(kind, e[i], p);
        return out;
    };
}

Vector initial_vector(const ResolutionModelSpec& spec)
{
    return Eigen::Map<const Vector>(spec.initial.data(), static_cast<Index>(spec.initial.size()));
}

PeakFitterConfig calibration_fitter_config(const ResolutionCalibratorConfig& c)
{
    PeakFitterConfig f;
    f.shape      = ShapeKind::Gaussian;
    f.min_points = c.min_window_points;
    f.solver     = c.solver;
    f.verbose    = c.verbose;
    return f;
}

} // namespace

/* ------------------------------------------------------------------------ */

const ReferenceLineTable& default_reference_lines()
{
    static const ReferenceLineTable table = {
        {"Fe",   {{"Ka1", 6.404}, {"Ka2", 6.391}, {"Kb1", 7.058}, {"Al-Ka", 1.487}}},
        {"Cu",   {{"Ka1", 8.048}, {"Ka2", 8.028}, {"Kb1", 8.905}, {"Al-Ka", 1.487}}},
        {"Ti",   {{"Ka1", 4.511}, {"Ka2", 4.505}, {"Kb1", 4.932}, {"Al-Ka", 1.487}}},
        {"Zn",   {{"Ka1", 8.639}, {"Ka2", 8.616}, {"Kb1", 9.572}, {"Al-Ka", 1.487}}},
        {"Mg",   {{"Ka",  1.254}, {"Al-Ka", 1.487}}},
        {"ZrO2", {{"Zr-Ka1", 15.775}, {"Zr-Kb1", 17.668}}}
    };
    return table;
}

ReferenceSpectrum make_reference(const std::string& element, Spectrum spectrum)
{
    const auto& table = default_reference_lines();
    const auto it = table.find(element);
    if (it == table.end())
        throw ConfigurationError("No reference lines known for element '" + element + "'");
    return ReferenceSpectrum{element, std::move(spectrum), it->second};
}

void to_json(nlohmann::json& j, const PeakMeasurement& m)
{
    j = nlohmann::json{
        {"element",         m.element},
        {"line",            m.line},
        {"expected_energy", m.expected_energy},
        {"energy",          m.energy},
        {"amplitude",       m.amplitude},
        {"fwhm",            m.fwhm},
        {"fwhm_error",      m.fwhm_error},
        {"area",            m.area},
        {"r_squared",       m.r_squared}
    };
}

/* ------------------------------------------------------------------------ */

ResolutionCalibrator::ResolutionCalibrator(ResolutionCalibratorConfig cfg)
    : cfg_(std::move(cfg))
    , fitter_(calibration_fitter_config(cfg_))
{
    if (cfg_.fwhm_min <= 0.0 || cfg_.fwhm_max <= cfg_.fwhm_min)
        throw ConfigurationError("ResolutionCalibrator: invalid FWHM band");
    if (cfg_.window_half_width <= 0.0)
        throw ConfigurationError("ResolutionCalibrator: window half width must be positive");
}

PeakFitOutcome ResolutionCalibrator::measure_peak_width(const Vector& energy,
                                                        const Vector& net_counts,
                                                        double        expected) const
{
    std::vector<Index> idx;
    for (Index i = 0; i < energy.size(); ++i)
        if (std::abs(energy[i] - expected) <= cfg_.window_half_width) idx.push_back(i);

    if (static_cast<int>(idx.size()) < cfg_.min_window_points)
        return PeakFitOutcome::fail(FitFailure::InsufficientPoints,
                                    "insufficient points at " + fmt(expected, 3) + " keV");

    Vector x(static_cast<Index>(idx.size())), y(x.size());
    for (std::size_t i = 0; i < idx.size(); ++i) {
        x[static_cast<Index>(i)] = energy[idx[i]];
        y[static_cast<Index>(i)] = net_counts[idx[i]];
    }

    // local maximum close to the expected energy, whole window as fallback
    Index imax = -1;
    for (Index i = 0; i < x.size(); ++i) {
        if (std::abs(x[i] - expected) > cfg_.max_search) continue;
        if (imax < 0 || y[i] > y[imax]) imax = i;
    }
    if (imax < 0) y.maxCoeff(&imax);

    const double peak_counts = y[imax];
    const double threshold = expected > cfg_.high_energy_threshold ? cfg_.min_counts_high
                                                                   : cfg_.min_counts;
    if (peak_counts < threshold)
        return PeakFitOutcome::fail(FitFailure::TooWeak,
                                    "too weak at " + fmt(expected, 3) + " keV ("
                                    + fmt(peak_counts, 0) + " counts)");

    const double c0 = std::clamp(x[imax], expected - cfg_.center_tolerance,
                                 expected + cfg_.center_tolerance);

    Vector p0(3);
    p0 << peak_counts, c0, cfg_.initial_fwhm / FWHM_PER_SIGMA;
    const std::vector<double> lo = { 0.3 * peak_counts,
                                     expected - cfg_.center_tolerance,
                                     cfg_.fwhm_min / FWHM_PER_SIGMA };
    const std::vector<double> hi = { 2.0 * peak_counts,
                                     expected + cfg_.center_tolerance,
                                     cfg_.fwhm_max / FWHM_PER_SIGMA };

    PeakFitOutcome out = fitter_.fit_region(x, y, p0, lo, hi);
    if (!out.ok()) {
        out.reason = "fit failed at " + fmt(expected, 3) + " keV: " + out.reason;
        return out;
    }

    const Peak& pk = *out.peak;
    if (!(pk.r_squared > cfg_.min_r_squared))
        return PeakFitOutcome::fail(FitFailure::PoorQuality,
                                    "poor fit at " + fmt(expected, 3) + " keV (R2="
                                    + fmt(pk.r_squared, 3) + ")");
    if (!(pk.fwhm > cfg_.fwhm_min && pk.fwhm < cfg_.fwhm_max))
        return PeakFitOutcome::fail(FitFailure::WidthOutOfRange,
                                    "FWHM " + fmt(pk.fwhm * 1000.0, 1) + " eV out of range at "
                                    + fmt(expected, 3) + " keV");
    return out;
}

ReferenceMeasurement ResolutionCalibrator::measure_reference(const ReferenceSpectrum& ref) const
{
    ReferenceMeasurement rm;
    rm.element = ref.element;

    // a spectrum that cannot be prepared costs its own lines, not the batch
    const Vector& e = ref.spectrum.energy;
    Vector net;
    try {
        ref.spectrum.validate();
        const Vector bg = estimate_background(e, ref.spectrum.counts, cfg_.background);
        net = subtract_background(ref.spectrum.counts, bg);
    } catch (const std::runtime_error& err) {
        const std::string why = "reference " + ref.element + " skipped: " + err.what();
        rm.rejected.push_back({ref.element, "", 0.0, FitFailure::UnusableSpectrum, why});
        if (cfg_.verbose) std::cout << "[FWHM] " << why << "\n";
        return rm;
    }

    for (const auto& line : ref.lines) {
        const PeakFitOutcome o = measure_peak_width(e, net, line.energy);
        if (!o.ok()) {
            rm.rejected.push_back({ref.element, line.name, line.energy, o.failure, o.reason});
            if (cfg_.verbose)
                std::cout << "[FWHM] " << ref.element << ' ' << line.name << ": " << o.reason << "\n";
            continue;
        }

        const Peak& pk = *o.peak;
        PeakMeasurement m;
        m.element         = ref.element;
        m.line            = line.name;
        m.expected_energy = line.energy;
        m.energy          = pk.energy;
        m.amplitude       = pk.amplitude;
        m.fwhm            = pk.fwhm;
        if (pk.errors.size() > 2 && std::isfinite(pk.errors[2]))
            m.fwhm_error  = pk.errors[2] * FWHM_PER_SIGMA;
        m.area            = pk.area;
        m.r_squared       = pk.r_squared;
        rm.peaks.push_back(m);

        if (cfg_.verbose)
            std::cout << "[FWHM] " << ref.element << ' ' << line.name << " @ "
                      << fmt(pk.energy, 3) << " keV  FWHM=" << fmt(pk.fwhm * 1000.0, 1)
                      << " eV  R2=" << fmt(pk.r_squared, 4) << "\n";
    }
    return rm;
}

std::vector<ReferenceMeasurement>
ResolutionCalibrator::process(const std::vector<ReferenceSpectrum>& refs) const
{
    std::vector<ReferenceMeasurement> out;
    out.reserve(refs.size());

    if (cfg_.threads <= 1 || refs.size() < 2) {
        for (const auto& r : refs) out.push_back(measure_reference(r));
        return out;
    }

    ThreadPool pool(std::min<unsigned>(cfg_.threads, static_cast<unsigned>(refs.size())));
    std::vector<std::future<ReferenceMeasurement>> jobs;
    jobs.reserve(refs.size());
    for (const auto& r : refs)
        jobs.push_back(pool.enqueue([this, &r] { return measure_reference(r); }));
    for (auto& f : jobs) out.push_back(f.get());
    return out;
}

/* ------------------------------- outliers -------------------------------- */

OutlierFilterResult
ResolutionCalibrator::remove_outliers(const std::vector<PeakMeasurement>& peaks) const
{
    OutlierFilterResult res;
    res.kept = peaks;
    if (static_cast<int>(peaks.size()) < cfg_.outlier_min_peaks) return res;

    Vector e, f;
    split(peaks, e, f);

    const ResolutionModelSpec& spec = resolution_model_spec(ResolutionModelKind::Detector);
    const CurveModel curve = resolution_curve(ResolutionModelKind::Detector);

    CurveFitResult fit = curve_fit(curve, e, f, initial_vector(spec), spec.lower, spec.upper,
                                   Vector(), {}, cfg_.solver);
    res.r_squared_before = r_squared(f, fit.fitted);

    // residual scale per peak: robust spread, never below the peak's own width error
    const auto scales = [&](const Vector& r) {
        const double s = std::max(MAD_TO_SIGMA * median_absolute_deviation(r),
                                  cfg_.outlier_scale_floor);
        Vector out(r.size());
        for (Index i = 0; i < r.size(); ++i)
            out[i] = std::max(s, peaks[static_cast<std::size_t>(i)].fwhm_error);
        return out;
    };

    // Huber IRLS
    Vector w = Vector::Ones(e.size());
    for (int it = 0; it < cfg_.huber_iterations; ++it) {
        const Vector r = f - fit.fitted;
        const Vector s = scales(r);
        Vector w_new(e.size());
        for (Index i = 0; i < e.size(); ++i) {
            const double u = std::abs(r[i]) / s[i];
            w_new[i] = u <= cfg_.huber_k ? 1.0 : cfg_.huber_k / u;
        }
        const bool settled = (w_new - w).cwiseAbs().maxCoeff() < 1e-6;
        w = w_new;
        if (settled && it > 0) break;

        const Vector sigma = w.cwiseSqrt().cwiseInverse();
        fit = curve_fit(curve, e, f, fit.params, spec.lower, spec.upper, sigma, {}, cfg_.solver);
    }

    const Vector r = f - fit.fitted;
    const Vector s = scales(r);

    res.kept.clear();
    for (std::size_t i = 0; i < peaks.size(); ++i) {
        const Index k = static_cast<Index>(i);
        if (std::abs(r[k]) > cfg_.outlier_threshold * s[k]) {
            res.outliers.push_back(peaks[i]);
            if (cfg_.verbose)
                std::cout << "[FWHM] outlier " << peaks[i].element << ' ' << peaks[i].line
                          << "  residual=" << fmt(r[k] * 1000.0, 1) << " eV\n";
        } else {
            res.kept.push_back(peaks[i]);
        }
    }

    if (res.kept.size() >= 3) {
        Vector ek, fk;
        split(res.kept, ek, fk);
        const CurveFitResult refit = curve_fit(curve, ek, fk, fit.params, spec.lower, spec.upper,
                                               Vector(), {}, cfg_.solver);
        res.r_squared_after = r_squared(fk, refit.fitted);
    }
    return res;
}

/* ------------------------------ model fitting ----------------------------- */

ResolutionModel
ResolutionCalibrator::fit_resolution_model(const std::vector<PeakMeasurement>& peaks,
                                           ResolutionModelKind                 kind) const
{
    if (peaks.size() < 3)
        throw InsufficientDataError("insufficient peaks: " + std::to_string(peaks.size())
                                    + " measured, at least 3 required");

    Vector e, f;
    split(peaks, e, f);

    const ResolutionModelSpec& spec = resolution_model_spec(kind);
    const CurveFitResult fit = curve_fit(resolution_curve(kind), e, f, initial_vector(spec),
                                         spec.lower, spec.upper, Vector(), {}, cfg_.solver);

    const int n = static_cast<int>(e.size());
    const int k = static_cast<int>(spec.names.size());
    const double ss_res = (f - fit.fitted).squaredNorm();

    ResolutionModel m;
    m.kind             = kind;
    m.params           = fit.params;
    m.param_errors     = fit.errors;
    m.r_squared        = r_squared(f, fit.fitted);
    m.rmse             = rmse(f, fit.fitted);
    m.aic              = aic(ss_res, n, k);
    m.bic              = bic(ss_res, n, k);
    m.n_peaks          = n;
    m.energy_min       = e.minCoeff();
    m.energy_max       = e.maxCoeff();
    m.calibration_date = iso_timestamp_now();

    if (cfg_.verbose) std::cout << "[FWHM] " << m.describe() << "\n";
    return m;
}

ResolutionCalibrationResult
ResolutionCalibrator::calibrate(const std::vector<ReferenceSpectrum>& refs) const
{
    ResolutionCalibrationResult res;

    std::vector<PeakMeasurement> all;
    for (auto& rm : process(refs)) {
        all.insert(all.end(), rm.peaks.begin(), rm.peaks.end());
        res.rejected.insert(res.rejected.end(), rm.rejected.begin(), rm.rejected.end());
    }

    if (all.size() < 3) {
        res.message = "insufficient peaks: " + std::to_string(all.size())
                    + " accepted, at least 3 required";
        if (cfg_.verbose) std::cout << "[FWHM] " << res.message << "\n";
        return res;
    }

    try {
        if (cfg_.reject_outliers) {
            OutlierFilterResult filt = remove_outliers(all);
            res.used     = std::move(filt.kept);
            res.outliers = std::move(filt.outliers);
        } else {
            res.used = all;
        }
        res.model = fit_resolution_model(res.used, cfg_.model);
    } catch (const InsufficientDataError& e) {
        res.message = e.what();
        return res;
    } catch (const FitDivergenceError& e) {
        res.message = std::string("resolution fit failed: ") + e.what();
        return res;
    }

    res.success = true;
    res.message = "calibrated " + to_string(cfg_.model) + " model from "
                + std::to_string(res.used.size()) + " peaks ("
                + std::to_string(res.outliers.size()) + " outliers removed)";
    if (cfg_.verbose) std::cout << "[FWHM] " << res.message << "\n";
    return res;
}

std::vector<ResolutionModel>
ResolutionCalibrator::compare_models(const std::vector<PeakMeasurement>& peaks) const
{
    std::vector<ResolutionModel> models;
    for (ResolutionModelKind kind : all_resolution_model_kinds()) {
        try {
            models.push_back(fit_resolution_model(peaks, kind));
        } catch (const FitDivergenceError& e) {
            if (cfg_.verbose)
                std::cout << "[FWHM] " << to_string(kind) << " model skipped: " << e.what() << "\n";
        }
    }
    return rank_models(std::move(models));
}

std::vector<ResolutionModel> rank_models(std::vector<ResolutionModel> models)
{
    std::stable_sort(models.begin(), models.end(),
                     [](const ResolutionModel& a, const ResolutionModel& b) {
                         if (a.aic != b.aic) return a.aic < b.aic;
                         return a.bic < b.bic;
                     });
    return models;
}

} // namespace xrfcal
