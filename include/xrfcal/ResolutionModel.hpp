#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace xrfcal {

/*
 *  FWHM(E) families, E in keV, FWHM in keV:
 *      detector     sqrt(fwhm_0² + 2.355²·ε·E)
 *      linear       a + b·E
 *      quadratic    a + b·E + c·E²
 *      exponential  a·exp(b·E)
 *      power        a·E^b
 */
enum class ResolutionModelKind { Detector, Linear, Quadratic, Exponential, Power };

ResolutionModelKind parse_resolution_model_kind(const std::string& name);
std::string         to_string(ResolutionModelKind kind);
const std::vector<ResolutionModelKind>& all_resolution_model_kinds();

// parameter names, fit bounds and start values of one family
struct ResolutionModelSpec {
    std::vector<std::string> names;
    std::vector<double>      lower;
    std::vector<double>      upper;
    std::vector<double>      initial;
};

const ResolutionModelSpec& resolution_model_spec(ResolutionModelKind kind);

// raw family value, no clamping
double evaluate_resolution(ResolutionModelKind kind, double energy, const Vector& p);

// (fwhm_0, epsilon) pair consumed by the intensity calibrator
struct DetectorParameters {
    double fwhm_0  = 0.080;
    double epsilon = 0.0004;
};

struct ResolutionModel {
    ResolutionModelKind kind = ResolutionModelKind::Detector;
    Vector params;                       // layout given by resolution_model_spec(kind)
    Vector param_errors;
    double r_squared  = 0.0;
    double rmse       = 0.0;             // keV
    double aic        = 0.0;
    double bic        = 0.0;
    int    n_peaks    = 0;
    double energy_min = 0.0;             // range of validity, keV
    double energy_max = 20.0;
    std::string calibration_date;

    // FWHM in keV, never negative
    double predict(double energy) const;
    Vector predict(const Vector& energies) const;

    // named parameter lookup; throws ConfigurationError for unknown names
    double parameter(const std::string& name) const;

    /*  Detector form (fwhm_0, ε) reproducing this model at 6 keV.  Non
     *  detector families assume the default ε and solve for fwhm_0.       */
    DetectorParameters detector_equivalent() const;

    std::string describe() const;
};

/*  Typical silicon drift detector: fwhm_0 = 80 eV, ε = 0.4 eV/keV. */
ResolutionModel default_detector_model();

/* persistence ---------------------------------------------------------------- */

void to_json(nlohmann::json& j, const ResolutionModel& m);

/*  Accepts the current document (has "model_type") and the legacy detector
 *  document with fwhm_0_keV / fwhm_0_eV keys.                            */
void from_json(const nlohmann::json& j, ResolutionModel& m);

void            save_resolution_model(const ResolutionModel& m, const std::string& path);
ResolutionModel load_resolution_model(const std::string& path);

} // namespace xrfcal
