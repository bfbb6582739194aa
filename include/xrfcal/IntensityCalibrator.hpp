#pragma once
#include "Types.hpp"
#include "Background.hpp"
#include "BoundedMinimizer.hpp"
#include "LineIntensitySource.hpp"
#include "ResolutionModel.hpp"
#include "SimpleLM.hpp"
#include "SyntheticSpectrum.hpp"
#include <limits>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace xrfcal {

struct CalibrationResult {
    double          fwhm_0          = 0.0;     // keV
    double          epsilon         = 0.0;     // keV
    double          intensity_scale = 1.0;
    double          scatter_scale   = 0.0;
    EfficiencyCurve efficiency;
    std::optional<LineTail>       tail;             // shape refined fits only
    std::map<std::string, double> element_scales;   // shape refined fits only
    double          chi_squared     = std::numeric_limits<double>::infinity();
    double          r_squared       = 0.0;
    bool            success         = false;
    std::string     message;
    std::string     fwhm_model_type = "detector";
    std::optional<ResolutionModel> fwhm_calibration;
    std::string     calibration_date;
    int             iterations      = 0;
    int             n_lines         = 0;
};

// non-finite χ² is written as null and read back as +inf
void to_json(nlohmann::json& j, const CalibrationResult& r);
void from_json(const nlohmann::json& j, CalibrationResult& r);

void              save_calibration(const CalibrationResult& r, const std::string& path);
CalibrationResult load_calibration(const std::string& path);

/*  Bounds and start of the shape refined calibration. */
struct ShapeRefinementOptions {
    double fwhm_0_min     = 0.02,   fwhm_0_max     = 0.2;     // keV
    double epsilon_min    = 0.0005, epsilon_max    = 0.01;    // keV
    double tail_amplitude = 0.05,   tail_amplitude_max = 0.3;
    double tail_slope     = 2.0,    tail_slope_min = 0.5, tail_slope_max = 10.0;
    double element_scale_min = 0.5, element_scale_max = 2.0;
    LMSolverOptions solver;
};

struct IntensityCalibratorConfig {
    BackgroundOptions background;               // SNIP by default
    MinimizerKind     minimizer = MinimizerKind::QuasiNewton;
    MinimizerOptions  minimizer_options;

    // held within ±resolution_tolerance of the model when given
    std::optional<ResolutionModel> resolution;
    double             resolution_tolerance = 0.2;
    DetectorParameters initial_resolution;     // start without a model

    bool           refine_efficiency = true;
    ScatterOptions scatter;                     // scatter fitted when tube lines exist

    int  stride = 1;                            // channel down-sampling during the search
    bool polish = true;                         // full grid pass after a strided search

    double noise_sigma_factor = 3.0;            // channel mask: net > max(min_mask_counts, k·noise)
    double min_mask_counts    = 10.0;
    double penalty            = 1e10;           // objective value for non-finite states

    bool                   refine_shape = false;   // calibrate() takes the shape refined path
    ShapeRefinementOptions shape;

    bool verbose = false;
};

/*
 *  Fits global instrument parameters (resolution, intensity scale,
 *  scatter scale, efficiency b and c) so that the synthetic spectrum of
 *  the expected lines reproduces a background subtracted standard.
 */
class IntensityCalibrator {
public:
    // throws ConfigurationError for a null source or invalid options
    IntensityCalibrator(IntensityCalibratorConfig                  cfg,
                        std::shared_ptr<const LineIntensitySource> source);

    const IntensityCalibratorConfig& config() const { return cfg_; }

    // starting resolution: the model's detector equivalent or initial_resolution
    DetectorParameters starting_resolution() const;

    /*  Expected lines from the source, then calibrate_lines() or, with
     *  refine_shape, calibrate_with_shape_refinement().  The callback
     *  receives the free parameters in physical units; the shape refined
     *  path does not call it.                                             */
    CalibrationResult calibrate(const StandardSample&    sample,
                                const IterationCallback& callback = {}) const;

    CalibrationResult calibrate_lines(const Spectrum&                 spectrum,
                                      const std::vector<ElementLine>& lines,
                                      const IterationCallback&        callback = {}) const;

    /*  Bounded least squares over resolution, a low energy tail, the
     *  efficiency b and c, and one intensity scale per element.  The
     *  element with the largest expected intensity anchors the element
     *  scales at 1; the overall scale is solved in closed form at every
     *  evaluation and reported as intensity_scale.                        */
    CalibrationResult calibrate_with_shape_refinement(const Spectrum&                 spectrum,
                                                      const std::vector<ElementLine>& lines) const;

private:
    IntensityCalibratorConfig                  cfg_;
    std::shared_ptr<const LineIntensitySource> source_;
};

} // namespace xrfcal
