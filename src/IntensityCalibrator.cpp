#include "xrfcal/IntensityCalibrator.hpp"
#include "xrfcal/CurveFit.hpp"
#include "xrfcal/Errors.hpp"
#include "xrfcal/FitStatistics.hpp"
#include "xrfcal/JsonUtils.hpp"
#include "xrfcal/ParameterSet.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace xrfcal {

namespace {

// order of ParameterSet::add below
enum : Index { P_FWHM0, P_EPS, P_SCALE, P_SCATTER, P_EFF_B, P_EFF_C };

Vector expand(const ParameterSet& ps, const Vector& free)
{
    Vector full(static_cast<Index>(ps.size()));
    Index k = 0;
    for (std::size_t i = 0; i < ps.size(); ++i) {
        const auto& p = ps.parameters()[i];
        full[static_cast<Index>(i)] = p.frozen ? p.value : free[k++];
    }
    return full;
}

SynthesisParameters unpack(const Vector& full)
{
    SynthesisParameters sp;
    sp.resolution.fwhm_0  = full[P_FWHM0];
    sp.resolution.epsilon = full[P_EPS];
    sp.intensity_scale    = full[P_SCALE];
    sp.scatter_scale      = full[P_SCATTER];
    sp.efficiency.a       = 1.0;
    sp.efficiency.b       = full[P_EFF_B];
    sp.efficiency.c       = full[P_EFF_C];
    return sp;
}

double fwhm_of(const DetectorParameters& d, double e)
{
    Vector p(2);
    p << d.fwhm_0, d.epsilon;
    return evaluate_resolution(ResolutionModelKind::Detector, e, p);
}

double local_max(const Vector& e, const Vector& y, double center, double half)
{
    double m = 0.0;
    for (Index i = 0; i < e.size(); ++i)
        if (std::abs(e[i] - center) < half) m = std::max(m, y[i]);
    return m;
}

CalibrationResult start_result(const IntensityCalibratorConfig& cfg,
                               const DetectorParameters&        d0,
                               std::size_t                      n_lines)
{
    CalibrationResult res;
    res.fwhm_0           = d0.fwhm_0;
    res.epsilon          = d0.epsilon;
    res.fwhm_model_type  = cfg.resolution ? to_string(cfg.resolution->kind) : "detector";
    res.fwhm_calibration = cfg.resolution;
    res.calibration_date = iso_timestamp_now();
    res.n_lines          = static_cast<int>(n_lines);
    return res;
}

// channels above the noise floor or within one FWHM of an expected line
std::vector<Index> select_channels(const Vector&                    e,
                                   const Vector&                    net,
                                   const std::vector<ElementLine>&  lines,
                                   const DetectorParameters&        d0,
                                   const IntensityCalibratorConfig& cfg)
{
    const double thr = std::max(cfg.min_mask_counts,
                                cfg.noise_sigma_factor * estimate_noise_der(net));
    std::vector<Index> used;
    for (Index i = 0; i < e.size(); ++i) {
        bool keep = net[i] > thr;
        for (std::size_t l = 0; !keep && l < lines.size(); ++l)
            keep = std::abs(e[i] - lines[l].energy) < fwhm_of(d0, lines[l].energy);
        if (keep) used.push_back(i);
    }
    return used;
}

// χ² per used channel and R² of the model against the net spectrum
void score(CalibrationResult& res, const Vector& net, const Vector& raw,
           const Vector& model, const std::vector<Index>& used)
{
    double chi2 = 0.0;
    for (Index i : used) {
        const double d = net[i] - model[i];
        chi2 += d * d / std::max(raw[i], 1.0);
    }
    res.chi_squared = chi2 / static_cast<double>(used.size());
    res.r_squared   = r_squared(net, model);

    if (!model.allFinite() || !std::isfinite(res.chi_squared) || !std::isfinite(res.r_squared)) {
        res.chi_squared = std::numeric_limits<double>::infinity();
        res.r_squared   = 0.0;
        res.success     = false;
        res.message     = "model spectrum is not finite";
    }
}

} // namespace

/* --------------------------------- JSON ---------------------------------- */

void to_json(nlohmann::json& j, const CalibrationResult& r)
{
    j = nlohmann::json{
        {"fwhm_0",            r.fwhm_0},
        {"epsilon",           r.epsilon},
        {"efficiency_params", {{"a", r.efficiency.a}, {"b", r.efficiency.b}, {"c", r.efficiency.c}}},
        {"chi_squared",       std::isfinite(r.chi_squared) ? nlohmann::json(r.chi_squared)
                                                           : nlohmann::json(nullptr)},
        {"r_squared",         r.r_squared},
        {"success",           r.success},
        {"message",           r.message},
        {"fwhm_model_type",   r.fwhm_model_type},
        {"fwhm_calibration",  r.fwhm_calibration ? nlohmann::json(*r.fwhm_calibration)
                                                 : nlohmann::json(nullptr)},
        {"calibration_date",  r.calibration_date},
        {"intensity_scale",   r.intensity_scale},
        {"scatter_scale",     r.scatter_scale},
        {"iterations",        r.iterations},
        {"n_lines",           r.n_lines}
    };
    if (r.tail) {
        j["tail_amplitude"] = r.tail->amplitude;
        j["tail_slope"]     = r.tail->slope;
    }
    if (!r.element_scales.empty()) j["element_scales"] = r.element_scales;
}

void from_json(const nlohmann::json& j, CalibrationResult& r)
{
    r = CalibrationResult{};
    r.fwhm_0  = j.at("fwhm_0").get<double>();
    r.epsilon = j.at("epsilon").get<double>();

    if (j.contains("efficiency_params") && j["efficiency_params"].is_object()) {
        const auto& e = j["efficiency_params"];
        r.efficiency.a = e.value("a", 1.0);
        r.efficiency.b = e.value("b", 0.0);
        r.efficiency.c = e.value("c", 0.0);
    }
    if (j.contains("chi_squared") && j["chi_squared"].is_number())
        r.chi_squared = j["chi_squared"].get<double>();

    r.r_squared        = j.value("r_squared", 0.0);
    r.success          = j.value("success", false);
    r.message          = j.value("message", std::string());
    r.fwhm_model_type  = j.value("fwhm_model_type", std::string("detector"));
    if (j.contains("fwhm_calibration") && j["fwhm_calibration"].is_object())
        r.fwhm_calibration = j["fwhm_calibration"].get<ResolutionModel>();
    r.calibration_date = j.value("calibration_date", std::string());
    r.intensity_scale  = j.value("intensity_scale", 1.0);
    r.scatter_scale    = j.value("scatter_scale", 0.0);
    r.iterations       = j.value("iterations", 0);
    r.n_lines          = j.value("n_lines", 0);
    if (j.contains("tail_amplitude"))
        r.tail = LineTail{j["tail_amplitude"].get<double>(), j.value("tail_slope", 2.0)};
    if (j.contains("element_scales") && j["element_scales"].is_object())
        r.element_scales = j["element_scales"].get<std::map<std::string, double>>();
}

void save_calibration(const CalibrationResult& r, const std::string& path)
{
    save_json(nlohmann::json(r), path);
}

CalibrationResult load_calibration(const std::string& path)
{
    const nlohmann::json j = load_json(path);
    try {
        return j.get<CalibrationResult>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed calibration in " + path + ": " + e.what());
    }
}

/* ------------------------------ calibrator -------------------------------- */

IntensityCalibrator::IntensityCalibrator(IntensityCalibratorConfig                  cfg,
                                         std::shared_ptr<const LineIntensitySource> source)
    : cfg_(std::move(cfg))
    , source_(std::move(source))
{
    if (!source_)
        throw ConfigurationError("IntensityCalibrator needs a line intensity source");
    if (cfg_.stride < 1)
        throw ConfigurationError("IntensityCalibrator: stride must be at least 1");
    if (!(cfg_.resolution_tolerance > 0.0 && cfg_.resolution_tolerance < 1.0))
        throw ConfigurationError("IntensityCalibrator: resolution tolerance must lie in (0, 1)");
    if (!std::isfinite(cfg_.penalty))
        throw ConfigurationError("IntensityCalibrator: penalty must be finite");
}

DetectorParameters IntensityCalibrator::starting_resolution() const
{
    return cfg_.resolution ? cfg_.resolution->detector_equivalent() : cfg_.initial_resolution;
}

CalibrationResult IntensityCalibrator::calibrate(const StandardSample&    sample,
                                                 const IterationCallback& callback) const
{
    const std::vector<ElementLine> lines = source_->expected_lines(sample, starting_resolution());
    if (cfg_.verbose)
        std::cout << "[Calib] " << lines.size() << " expected lines from the "
                  << to_string(source_->kind()) << " source\n";
    if (cfg_.refine_shape)
        return calibrate_with_shape_refinement(sample.spectrum, lines);
    return calibrate_lines(sample.spectrum, lines, callback);
}

CalibrationResult IntensityCalibrator::calibrate_lines(const Spectrum&                 spectrum,
                                                       const std::vector<ElementLine>& lines,
                                                       const IterationCallback&        callback) const
{
    const DetectorParameters d0 = starting_resolution();
    CalibrationResult res = start_result(cfg_, d0, lines.size());

    if (lines.empty()) {
        res.message = "no expected lines to calibrate against";
        if (cfg_.verbose) std::cout << "[Calib] " << res.message << "\n";
        return res;
    }

    spectrum.validate();
    const Vector& e   = spectrum.energy;
    const Vector& raw = spectrum.counts;
    const Vector  net = subtract_background(raw, estimate_background(e, raw, cfg_.background));

    const std::vector<Index> used = select_channels(e, net, lines, d0, cfg_);
    if (used.empty()) {
        res.message = "no channels above the noise floor";
        return res;
    }

    /* ---------------- parameters --------------------------------------- */
    ParameterSet ps;
    if (cfg_.resolution) {
        const double t = cfg_.resolution_tolerance;
        ps.add("fwhm_0",  d0.fwhm_0,  (1.0 - t) * d0.fwhm_0,  (1.0 + t) * d0.fwhm_0);
        ps.add("epsilon", d0.epsilon, (1.0 - t) * d0.epsilon, (1.0 + t) * d0.epsilon);
    } else {
        ps.add("fwhm_0",  d0.fwhm_0,  0.02,    0.2);
        ps.add("epsilon", d0.epsilon, 0.00005, 0.01);
    }

    SynthesisParameters unit;
    unit.resolution = d0;
    const double unit_max = synthesize(e, lines, unit).maxCoeff();
    double s0 = unit_max > 0.0 ? net.maxCoeff() / unit_max : 1.0;
    if (!(s0 > 0.0) || !std::isfinite(s0)) s0 = 1.0;
    ps.add("intensity_scale", s0, 1e-3 * s0, 1e3 * s0);

    const bool with_scatter = !cfg_.scatter.tube_lines.empty();
    double sc0 = 0.0;
    for (const auto& t : cfg_.scatter.tube_lines)
        if (t.intensity > 0.0)
            sc0 = std::max(sc0, local_max(e, net, t.energy, 2.0 * fwhm_of(d0, t.energy)) / t.intensity);
    ps.add("scatter_scale", sc0, 0.0, with_scatter ? 1e3 * std::max(sc0, s0) : 0.0, !with_scatter);

    ps.add("eff_b", 0.0, -0.5, 0.5, !cfg_.refine_efficiency);
    ps.add("eff_c", 0.0, -0.1, 0.1, !cfg_.refine_efficiency);

    /* ---------------- objective ---------------------------------------- */
    const auto objective_on = [&](const std::vector<Index>& idx) -> Objective {
        const Index n = static_cast<Index>(idx.size());
        Vector ee(n), yy(n), ww(n);
        for (Index k = 0; k < n; ++k) {
            const Index i = idx[static_cast<std::size_t>(k)];
            ee[k] = e[i];
            yy[k] = net[i];
            ww[k] = 1.0 / std::sqrt(std::max(raw[i], 1.0));
        }
        return [this, &ps, &lines, ee, yy, ww](const Vector& u) {
            const SynthesisParameters sp = unpack(expand(ps, ps.from_unit(u)));
            const Vector model = synthesize(ee, lines, sp, cfg_.scatter);
            const double f = (yy - model).cwiseProduct(ww).squaredNorm();
            return std::isfinite(f) ? f : cfg_.penalty;
        };
    };

    IterationCallback cb;
    if (callback)
        cb = [&](int it, const Vector& u, double f) { return callback(it, ps.from_unit(u), f); };

    std::vector<Index> search = used;
    if (cfg_.stride > 1) {
        search.clear();
        for (Index i : used)
            if (i % cfg_.stride == 0) search.push_back(i);
        if (search.empty()) search = used;
    }

    const auto minimizer = make_minimizer(cfg_.minimizer, cfg_.minimizer_options);
    const Index nf = static_cast<Index>(ps.n_free());
    const Vector lo = Vector::Zero(nf);
    const Vector hi = Vector::Ones(nf);

    MinimizerResult mr = minimizer->minimize(objective_on(search), ps.to_unit(ps.free_values()),
                                             lo, hi, cb);
    int iterations = mr.iterations;

    if (cfg_.stride > 1 && cfg_.polish && !mr.cancelled) {
        if (cfg_.verbose)
            std::cout << "[Calib] strided search done (f=" << mr.fun << "), polishing on the full grid\n";
        mr = minimizer->minimize(objective_on(used), mr.x, lo, hi, cb);
        iterations += mr.iterations;
    }

    /* ---------------- result ------------------------------------------- */
    ps.set_free_values(ps.from_unit(mr.x));
    const SynthesisParameters best = unpack(expand(ps, ps.free_values()));

    const Vector calc = synthesize(e, lines, best, cfg_.scatter);
    const double cmax = calc.maxCoeff();
    const Vector scaled = cmax > 0.0 ? Vector(calc * (net.maxCoeff() / cmax)) : calc;

    res.fwhm_0          = best.resolution.fwhm_0;
    res.epsilon         = best.resolution.epsilon;
    res.intensity_scale = best.intensity_scale;
    res.scatter_scale   = best.scatter_scale;
    res.efficiency      = best.efficiency;
    res.iterations      = iterations;
    res.success         = mr.success && !mr.cancelled;
    res.message         = mr.cancelled ? "cancelled by callback" : mr.message;
    score(res, net, raw, scaled, used);

    if (cfg_.verbose)
        std::cout << "[Calib] " << (res.success ? "done" : "failed") << ": FWHM0="
                  << std::fixed << std::setprecision(1) << res.fwhm_0 * 1000.0
                  << " eV, eps=" << std::setprecision(3) << res.epsilon * 1000.0
                  << " eV/keV, scale=" << std::setprecision(4) << res.intensity_scale
                  << ", R2=" << res.r_squared << ", chi2=" << res.chi_squared
                  << " (" << res.iterations << " iterations)\n";
    return res;
}

CalibrationResult
IntensityCalibrator::calibrate_with_shape_refinement(const Spectrum&                 spectrum,
                                                     const std::vector<ElementLine>& lines) const
{
    const ShapeRefinementOptions& so = cfg_.shape;
    const DetectorParameters d0 = starting_resolution();
    CalibrationResult res = start_result(cfg_, d0, lines.size());

    if (lines.empty()) {
        res.message = "no expected lines to calibrate against";
        if (cfg_.verbose) std::cout << "[Calib] " << res.message << "\n";
        return res;
    }

    spectrum.validate();
    const Vector& e   = spectrum.energy;
    const Vector& raw = spectrum.counts;
    const Vector  net = subtract_background(raw, estimate_background(e, raw, cfg_.background));

    const std::vector<Index> used = select_channels(e, net, lines, d0, cfg_);
    if (used.empty()) {
        res.message = "no channels above the noise floor";
        return res;
    }

    const Index n = static_cast<Index>(used.size());
    Vector ee(n), yy(n), sig(n);
    for (Index k = 0; k < n; ++k) {
        const Index i = used[static_cast<std::size_t>(k)];
        ee[k]  = e[i];
        yy[k]  = net[i];
        sig[k] = std::sqrt(std::max(raw[i], 1.0));
    }
    const Vector w2 = sig.cwiseAbs2().cwiseInverse();

    /* ---------------- parameters --------------------------------------- */
    // the element with the most expected intensity keeps scale 1
    std::map<std::string, double> totals;
    for (const auto& l : lines) totals[l.element] += l.intensity;
    std::string anchor = totals.begin()->first;
    for (const auto& [el, total] : totals)
        if (total > totals[anchor]) anchor = el;

    ParameterSet ps;
    ps.add("fwhm_0",         d0.fwhm_0,         so.fwhm_0_min,  so.fwhm_0_max);
    ps.add("epsilon",        d0.epsilon,        so.epsilon_min, so.epsilon_max);
    ps.add("tail_amplitude", so.tail_amplitude, 0.0,            so.tail_amplitude_max);
    ps.add("tail_slope",     so.tail_slope,     so.tail_slope_min, so.tail_slope_max);
    ps.add("eff_b", 0.0, -0.5, 0.5, !cfg_.refine_efficiency);
    ps.add("eff_c", 0.0, -0.1, 0.1, !cfg_.refine_efficiency);
    const std::size_t first_scale = ps.size();
    std::vector<std::string> elements;
    for (const auto& kv : totals) {
        elements.push_back(kv.first);
        ps.add("scale:" + kv.first, 1.0, so.element_scale_min, so.element_scale_max,
               kv.first == anchor);
    }

    const auto unpack_shape = [&](const Vector& p) {
        SynthesisParameters sp;
        sp.resolution.fwhm_0  = p[0];
        sp.resolution.epsilon = p[1];
        sp.tail.amplitude     = p[2];
        sp.tail.slope         = p[3];
        sp.efficiency.b       = p[4];
        sp.efficiency.c       = p[5];
        for (std::size_t k = 0; k < elements.size(); ++k)
            sp.element_scales[elements[k]] = p[static_cast<Index>(first_scale + k)];
        return sp;
    };

    // weighted least squares scale of a model against the measured channels
    const auto best_scale = [&](const Vector& calc) {
        const double cc = calc.cwiseProduct(w2).dot(calc);
        return cc > 0.0 ? calc.cwiseProduct(w2).dot(yy) / cc : 0.0;
    };

    const CurveModel model = [&](const Vector& xx, const Vector& p) -> Vector {
        const Vector calc = synthesize(xx, lines, unpack_shape(p));
        return calc * best_scale(calc);
    };

    Vector p0(static_cast<Index>(ps.size()));
    std::vector<double> lower, upper;
    std::vector<bool>   free_mask;
    for (std::size_t i = 0; i < ps.size(); ++i) {
        const auto& p = ps.parameters()[i];
        p0[static_cast<Index>(i)] = p.value;
        lower.push_back(p.lower);
        upper.push_back(p.upper);
        free_mask.push_back(!p.frozen);
    }

    /* ---------------- fit ---------------------------------------------- */
    CurveFitResult fit;
    try {
        fit = curve_fit(model, ee, yy, p0, lower, upper, sig, free_mask, so.solver);
    } catch (const FitDivergenceError& err) {
        res.message = std::string("shape refinement failed: ") + err.what();
        if (cfg_.verbose) std::cout << "[Calib] " << res.message << "\n";
        return res;
    }

    const SynthesisParameters best = unpack_shape(fit.params);
    const double scale = best_scale(synthesize(ee, lines, best));
    const Vector full  = synthesize(e, lines, best) * scale;

    res.fwhm_0          = best.resolution.fwhm_0;
    res.epsilon         = best.resolution.epsilon;
    res.intensity_scale = scale;
    res.scatter_scale   = 0.0;
    res.efficiency      = best.efficiency;
    res.tail            = best.tail;
    res.element_scales  = best.element_scales;
    res.iterations      = fit.iterations;
    res.success         = fit.converged;
    res.message         = fit.converged ? "shape refinement converged"
                                        : "shape refinement did not converge";
    score(res, net, raw, full, used);

    if (cfg_.verbose)
        std::cout << "[Calib] shape refinement " << (res.success ? "done" : "failed")
                  << ": FWHM0=" << std::fixed << std::setprecision(1) << res.fwhm_0 * 1000.0
                  << " eV, eps=" << std::setprecision(3) << res.epsilon * 1000.0
                  << " eV/keV, tail=" << std::setprecision(4) << res.tail->amplitude
                  << "/" << res.tail->slope << ", R2=" << res.r_squared
                  << ", chi2=" << res.chi_squared << " (" << res.iterations << " iterations)\n";
    return res;
}

} // namespace xrfcal
