#pragma once
#include "Types.hpp"
#include "PeakShapes.hpp"
#include "ResolutionModel.hpp"
#include "SimpleLM.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xrfcal {

struct Peak {
    double    energy    = 0.0;           // fitted center, keV
    double    amplitude = 0.0;
    double    fwhm      = 0.0;           // keV
    double    area      = 0.0;
    ShapeKind shape     = ShapeKind::Gaussian;
    std::map<std::string, double> shape_params;   // width and extras by name
    Vector    params;                    // raw shape parameter vector
    Vector    errors;                    // one sigma errors of params
    std::string element;
    std::string line;
    double    r_squared    = 0.0;
    bool      is_tube_line = false;
};

enum class FitFailure {
    None,
    InsufficientPoints,     // window holds too few channels
    TooWeak,                // local maximum below the acceptance threshold
    FitFailed,              // solver did not converge or diverged
    PoorQuality,            // R² below the acceptance threshold
    WidthOutOfRange,        // fitted FWHM outside the plausible band
    UnusableSpectrum        // spectrum failed validation or background estimation
};

std::string to_string(FitFailure f);

/*  Either a fitted peak or a typed failure with a diagnostic message. */
struct PeakFitOutcome {
    std::optional<Peak> peak;
    FitFailure          failure = FitFailure::None;
    std::string         reason;

    bool ok() const { return peak.has_value(); }

    static PeakFitOutcome success(Peak p);
    static PeakFitOutcome fail(FitFailure f, std::string why);
};

struct PeakBatchFailure {
    double      center = 0.0;
    FitFailure  failure = FitFailure::None;
    std::string reason;
};

struct PeakBatch {
    std::vector<Peak>             peaks;
    std::vector<PeakBatchFailure> failures;
};

struct PeakFitterConfig {
    ShapeKind       shape      = ShapeKind::Gaussian;
    ResolutionModel resolution = default_detector_model();

    double window_factor            = 3.0;    // × FWHM estimate
    double low_energy_window_factor = 5.0;    // below low_energy_threshold
    double low_energy_threshold     = 3.0;    // keV
    int    min_points               = 5;

    double center_tolerance       = 0.2;      // keV
    double width_lower_factor     = 0.3;
    double width_upper_factor     = 3.0;
    double amplitude_lower_factor = 0.3;
    double amplitude_upper_factor = 2.0;

    double voigt_gamma_ratio = 0.15;          // γ/σ start value
    bool   fix_shape         = false;         // width (and extras) held at the model prediction

    LMSolverOptions solver;
    bool verbose = false;
};

struct PeakSearchOptions {
    std::optional<double> prominence;         // default 5 % of the maximum
    int                   distance = 10;      // channels
    std::optional<double> height;
};

struct PeakCandidate {
    Index  channel    = 0;
    double energy     = 0.0;
    double height     = 0.0;
    double prominence = 0.0;
};

class PeakFitter {
public:
    explicit PeakFitter(PeakFitterConfig cfg = {});

    const PeakFitterConfig& config() const { return cfg_; }

    // FWHM estimate of the active resolution model
    double estimate_fwhm(double energy) const;

    /*  Window → initial guess → bounded regression → quality.  Failures
     *  come back as a typed outcome, never as an exception.               */
    PeakFitOutcome fit_single_peak(const Vector& energy,
                                   const Vector& counts,
                                   double        center) const;

    /*  Regression and quality assessment on a caller prepared window with
     *  explicit start values and bounds (parameter layout of the shape).  */
    PeakFitOutcome fit_region(const Vector&              x,
                              const Vector&              y,
                              const Vector&              p0,
                              const std::vector<double>& lower,
                              const std::vector<double>& upper,
                              const std::vector<bool>&   free_mask = {}) const;

    /*  Independent sequential fits; a failing candidate never stops the
     *  remaining ones.                                                    */
    PeakBatch fit_peaks(const Vector&              energy,
                        const Vector&              counts,
                        const std::vector<double>& centers) const;

private:
    PeakFitterConfig cfg_;
};

std::vector<PeakCandidate> find_peaks(const Vector&            energy,
                                      const Vector&            counts,
                                      const PeakSearchOptions& opt = {});

// background plus every fitted peak
Vector reconstruct_spectrum(const Vector&            energy,
                            const std::vector<Peak>& peaks,
                            const Vector&            background);

// counts − reconstruct_spectrum(...)
Vector calculate_residuals(const Vector&            energy,
                           const Vector&            counts,
                           const std::vector<Peak>& peaks,
                           const Vector&            background);

} // namespace xrfcal
