#include "xrfcal/PeakFitter.hpp"
#include "xrfcal/CurveFit.hpp"
#include "xrfcal/Errors.hpp"
#include "xrfcal/FitStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

namespace xrfcal {

namespace {

std::string kev(double e)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3) << e << " keV";
    return os.str();
}

} // namespace

std::string to_string(FitFailure f)
{
    switch (f) {
        case FitFailure::None:               return "none";
        case FitFailure::InsufficientPoints: return "insufficient points";
        case FitFailure::TooWeak:            return "too weak";
        case FitFailure::FitFailed:          return "fit failed";
        case FitFailure::PoorQuality:        return "poor quality";
        case FitFailure::WidthOutOfRange:    return "width out of range";
        case FitFailure::UnusableSpectrum:   return "unusable spectrum";
    }
    return "unknown";
}

PeakFitOutcome PeakFitOutcome::success(Peak p)
{
    PeakFitOutcome o;
    o.peak = std::move(p);
    return o;
}

PeakFitOutcome PeakFitOutcome::fail(FitFailure f, std::string why)
{
    PeakFitOutcome o;
    o.failure = f;
    o.reason  = std::move(why);
    return o;
}

/* ------------------------------------------------------------------------ */

PeakFitter::PeakFitter(PeakFitterConfig cfg) : cfg_(std::move(cfg)) {}

double PeakFitter::estimate_fwhm(double energy) const
{
    double f = cfg_.resolution.predict(energy);
    if (!(f > 0.0)) f = default_detector_model().predict(energy);
    return f;
}

PeakFitOutcome PeakFitter::fit_single_peak(const Vector& energy,
                                           const Vector& counts,
                                           double        center) const
{
    if (energy.size() != counts.size())
        throw ConfigurationError("fit_single_peak: energy/counts size mismatch");

    const double fwhm_est = estimate_fwhm(center);
    const double k = center < cfg_.low_energy_threshold ? cfg_.low_energy_window_factor
                                                         : cfg_.window_factor;
    const double half = k * fwhm_est;

    std::vector<Index> idx;
    for (Index i = 0; i < energy.size(); ++i)
        if (std::abs(energy[i] - center) < half) idx.push_back(i);

    if (static_cast<int>(idx.size()) < cfg_.min_points)
        return PeakFitOutcome::fail(FitFailure::InsufficientPoints,
                                    "insufficient points at " + kev(center));

    Vector x(static_cast<Index>(idx.size())), y(x.size());
    for (std::size_t i = 0; i < idx.size(); ++i) {
        x[static_cast<Index>(i)] = energy[idx[i]];
        y[static_cast<Index>(i)] = counts[idx[i]];
    }

    const double amp = y.maxCoeff();
    if (!(amp > 0.0))
        return PeakFitOutcome::fail(FitFailure::TooWeak, "no signal at " + kev(center));

    const PeakShape& shape = peak_shape(cfg_.shape);
    const double width = shape.width_for_fwhm(fwhm_est);

    Vector extras = shape.initial_extras(width);
    if (cfg_.shape == ShapeKind::Voigt && extras.size() == 1)
        extras[0] = cfg_.voigt_gamma_ratio * width;

    Vector p0(3 + extras.size());
    p0[0] = amp;
    p0[1] = center;
    p0[2] = width;
    p0.tail(extras.size()) = extras;

    std::vector<double> lo = { cfg_.amplitude_lower_factor * amp,
                               center - cfg_.center_tolerance,
                               cfg_.width_lower_factor * width };
    std::vector<double> hi = { cfg_.amplitude_upper_factor * amp,
                               center + cfg_.center_tolerance,
                               cfg_.width_upper_factor * width };
    shape.extra_bounds(width, lo, hi);

    std::vector<bool> free_mask;
    if (cfg_.fix_shape) {
        free_mask.assign(static_cast<std::size_t>(p0.size()), false);
        free_mask[0] = true;
        free_mask[1] = true;
    }

    PeakFitOutcome out = fit_region(x, y, p0, lo, hi, free_mask);
    if (!out.ok() && out.failure == FitFailure::FitFailed)
        out.reason = "fit failed at " + kev(center) + (out.reason.empty() ? "" : ": " + out.reason);
    return out;
}

PeakFitOutcome PeakFitter::fit_region(const Vector&              x,
                                      const Vector&              y,
                                      const Vector&              p0,
                                      const std::vector<double>& lower,
                                      const std::vector<double>& upper,
                                      const std::vector<bool>&   free_mask) const
{
    const PeakShape& shape = peak_shape(cfg_.shape);
    if (p0.size() != shape.n_params())
        throw ConfigurationError("fit_region: expected " + std::to_string(shape.n_params())
                                 + " parameters for shape " + to_string(cfg_.shape));

    if (x.size() < cfg_.min_points)
        return PeakFitOutcome::fail(FitFailure::InsufficientPoints,
                                    "insufficient points in region");

    const CurveModel model = [&shape](const Vector& xx, const Vector& p) {
        return shape.evaluate(xx, p);
    };

    CurveFitResult fit;
    try {
        fit = curve_fit(model, x, y, p0, lower, upper, Vector(), free_mask, cfg_.solver);
    } catch (const FitDivergenceError& e) {
        if (cfg_.verbose) std::cout << "[Fit] " << e.what() << "\n";
        return PeakFitOutcome::fail(FitFailure::FitFailed, e.what());
    }

    if (!fit.converged)
        return PeakFitOutcome::fail(FitFailure::FitFailed, "no convergence");

    Peak pk;
    pk.shape     = cfg_.shape;
    pk.params    = fit.params;
    pk.errors    = fit.errors;
    pk.amplitude = fit.params[0];
    pk.energy    = fit.params[1];
    pk.fwhm      = shape.fwhm(fit.params);
    pk.area      = shape.area(fit.params);
    pk.r_squared = r_squared(y, fit.fitted);

    const auto names = shape.parameter_names();
    for (std::size_t i = 2; i < names.size(); ++i)
        pk.shape_params[names[i]] = fit.params[static_cast<Index>(i)];

    if (!std::isfinite(pk.fwhm) || !std::isfinite(pk.area))
        return PeakFitOutcome::fail(FitFailure::FitFailed, "non-finite peak parameters");

    if (cfg_.verbose)
        std::cout << "[Fit] " << to_string(cfg_.shape) << " @ " << kev(pk.energy)
                  << "  FWHM=" << std::fixed << std::setprecision(1) << pk.fwhm * 1000.0
                  << " eV  R2=" << std::setprecision(4) << pk.r_squared
                  << "  iter=" << fit.iterations << "\n";

    return PeakFitOutcome::success(std::move(pk));
}

PeakBatch PeakFitter::fit_peaks(const Vector&              energy,
                                const Vector&              counts,
                                const std::vector<double>& centers) const
{
    PeakBatch batch;
    for (double c : centers) {
        PeakFitOutcome o = fit_single_peak(energy, counts, c);
        if (o.ok())
            batch.peaks.push_back(std::move(*o.peak));
        else
            batch.failures.push_back({c, o.failure, o.reason});
    }
    return batch;
}

/* ------------------------------ peak search ------------------------------ */

std::vector<PeakCandidate> find_peaks(const Vector&            energy,
                                      const Vector&            counts,
                                      const PeakSearchOptions& opt)
{
    if (energy.size() != counts.size())
        throw ConfigurationError("find_peaks: energy/counts size mismatch");

    const Index n = counts.size();
    std::vector<PeakCandidate> out;
    if (n < 3) return out;

    // local maxima; flat tops report their middle channel
    std::vector<Index> maxima;
    Index i = 1;
    while (i < n - 1) {
        if (counts[i - 1] < counts[i]) {
            Index ahead = i + 1;
            while (ahead < n - 1 && counts[ahead] == counts[i]) ++ahead;
            if (counts[ahead] < counts[i]) {
                maxima.push_back((i + ahead - 1) / 2);
                i = ahead;
                continue;
            }
        }
        ++i;
    }

    if (opt.height)
        maxima.erase(std::remove_if(maxima.begin(), maxima.end(),
                                    [&](Index m) { return counts[m] < *opt.height; }),
                     maxima.end());

    // distance: higher peaks win, smaller neighbours within the window drop out
    if (opt.distance > 1 && maxima.size() > 1) {
        std::vector<std::size_t> order(maxima.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return counts[maxima[a]] > counts[maxima[b]];
        });
        std::vector<bool> keep(maxima.size(), true);
        for (std::size_t oi : order) {
            if (!keep[oi]) continue;
            for (std::size_t j = 0; j < maxima.size(); ++j) {
                if (j == oi || !keep[j]) continue;
                if (std::abs(maxima[j] - maxima[oi]) < opt.distance) keep[j] = false;
            }
        }
        std::vector<Index> kept;
        for (std::size_t j = 0; j < maxima.size(); ++j)
            if (keep[j]) kept.push_back(maxima[j]);
        maxima.swap(kept);
    }

    const double min_prom = opt.prominence ? *opt.prominence : 0.05 * counts.maxCoeff();

    for (Index m : maxima) {
        const double h = counts[m];

        double left_min = h;
        for (Index j = m - 1; j >= 0 && counts[j] <= h; --j)
            left_min = std::min(left_min, counts[j]);
        double right_min = h;
        for (Index j = m + 1; j < n && counts[j] <= h; ++j)
            right_min = std::min(right_min, counts[j]);

        const double prom = h - std::max(left_min, right_min);
        if (prom < min_prom) continue;

        out.push_back({m, energy[m], h, prom});
    }
    return out;
}

/* ------------------------------ reconstruction ---------------------------- */

Vector reconstruct_spectrum(const Vector&            energy,
                            const std::vector<Peak>& peaks,
                            const Vector&            background)
{
    Vector model = background.size() == energy.size() ? background
                                                      : Vector::Zero(energy.size()).eval();
    for (const auto& pk : peaks)
        model += peak_shape(pk.shape).evaluate(energy, pk.params);
    return model;
}

Vector calculate_residuals(const Vector&            energy,
                           const Vector&            counts,
                           const std::vector<Peak>& peaks,
                           const Vector&            background)
{
    if (energy.size() != counts.size())
        throw ConfigurationError("calculate_residuals: energy/counts size mismatch");
    return counts - reconstruct_spectrum(energy, peaks, background);
}

} // namespace xrfcal
