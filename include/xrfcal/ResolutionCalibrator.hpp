#pragma once
#include "Types.hpp"
#include "Background.hpp"
#include "PeakFitter.hpp"
#include "ResolutionModel.hpp"
#include "SimpleLM.hpp"
#include "Spectrum.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace xrfcal {

struct ReferenceLine {
    std::string name;
    double      energy = 0.0;           // keV
};

using ReferenceLineTable = std::map<std::string, std::vector<ReferenceLine>>;

/*  Built-in line table for the usual pure-element references
 *  (Fe, Cu, Ti, Zn, Mg and cubic zirconia "ZrO2").                        */
const ReferenceLineTable& default_reference_lines();

struct ReferenceSpectrum {
    std::string                element;
    Spectrum                   spectrum;
    std::vector<ReferenceLine> lines;
};

// lines taken from default_reference_lines(); throws ConfigurationError for unknown elements
ReferenceSpectrum make_reference(const std::string& element, Spectrum spectrum);

struct PeakMeasurement {
    std::string element;
    std::string line;
    double expected_energy = 0.0;
    double energy          = 0.0;       // fitted center
    double amplitude       = 0.0;
    double fwhm            = 0.0;       // keV
    double fwhm_error      = 0.0;
    double area            = 0.0;
    double r_squared       = 0.0;
};

void to_json(nlohmann::json& j, const PeakMeasurement& m);

struct LineRejection {
    std::string element;
    std::string line;
    double      energy  = 0.0;
    FitFailure  failure = FitFailure::None;
    std::string reason;
};

struct ReferenceMeasurement {
    std::string                  element;
    std::vector<PeakMeasurement> peaks;
    std::vector<LineRejection>   rejected;
};

struct OutlierFilterResult {
    std::vector<PeakMeasurement> kept;
    std::vector<PeakMeasurement> outliers;
    double r_squared_before = 0.0;
    double r_squared_after  = 0.0;
};

struct ResolutionCalibratorConfig {
    BackgroundOptions background;                  // SNIP by default

    double window_half_width  = 0.3;               // keV
    int    min_window_points  = 10;
    double max_search         = 0.1;               // local maximum within ± keV
    double min_counts         = 80.0;
    double min_counts_high    = 150.0;             // above high_energy_threshold
    double high_energy_threshold = 10.0;           // keV

    double fwhm_min          = 0.080;              // keV
    double fwhm_max          = 0.300;
    double initial_fwhm      = 0.150;
    double center_tolerance  = 0.1;
    double min_r_squared     = 0.85;

    bool   reject_outliers     = true;
    int    outlier_min_peaks   = 6;
    double outlier_threshold   = 3.0;              // robust σ units
    double outlier_scale_floor = 0.002;            // keV
    double huber_k             = 1.345;
    int    huber_iterations    = 20;

    ResolutionModelKind model = ResolutionModelKind::Detector;
    unsigned threads = 1;                          // reference spectra in parallel

    LMSolverOptions solver;
    bool verbose = false;
};

struct ResolutionCalibrationResult {
    bool            success = false;
    std::string     message;
    ResolutionModel model;
    std::vector<PeakMeasurement> used;
    std::vector<PeakMeasurement> outliers;
    std::vector<LineRejection>   rejected;
};

class ResolutionCalibrator {
public:
    explicit ResolutionCalibrator(ResolutionCalibratorConfig cfg = {});

    const ResolutionCalibratorConfig& config() const { return cfg_; }

    /*  Gaussian FWHM of one line in a background subtracted spectrum.
     *  Acceptance (R², FWHM band, minimum counts) is applied here.        */
    PeakFitOutcome measure_peak_width(const Vector& energy,
                                      const Vector& net_counts,
                                      double        expected_energy) const;

    ReferenceMeasurement measure_reference(const ReferenceSpectrum& ref) const;

    // results are in input order regardless of the thread count
    std::vector<ReferenceMeasurement> process(const std::vector<ReferenceSpectrum>& refs) const;

    /*  Huber-weighted detector fit, robust residual scale from the MAD, and
     *  removal of every point beyond outlier_threshold scales.  Sets with
     *  fewer than outlier_min_peaks points are returned untouched.        */
    OutlierFilterResult remove_outliers(const std::vector<PeakMeasurement>& peaks) const;

    /*  Bounded least squares of FWHM(E).  Throws InsufficientDataError for
     *  fewer than three points and FitDivergenceError when the solver fails. */
    ResolutionModel fit_resolution_model(const std::vector<PeakMeasurement>& peaks,
                                         ResolutionModelKind                 kind) const;

    ResolutionCalibrationResult calibrate(const std::vector<ReferenceSpectrum>& refs) const;

    // every model kind that fits, best first
    std::vector<ResolutionModel> compare_models(const std::vector<PeakMeasurement>& peaks) const;

private:
    ResolutionCalibratorConfig cfg_;
    PeakFitter                 fitter_;
};

/*  AIC ascending, ties broken by BIC; stable for full ties. */
std::vector<ResolutionModel> rank_models(std::vector<ResolutionModel> models);

} // namespace xrfcal
