#include "xrfcal/ResolutionModel.hpp"
#include "xrfcal/Errors.hpp"
#include "xrfcal/JsonUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <iomanip>

namespace xrfcal {

namespace {

constexpr double FANO_FACTOR2  = 2.355 * 2.355;
constexpr double REFERENCE_KEV = 6.0;

// default parameter set when a legacy document omits epsilon
constexpr DetectorParameters SDD_DEFAULT{};

} // namespace

ResolutionModelKind parse_resolution_model_kind(const std::string& name)
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "detector")    return ResolutionModelKind::Detector;
    if (key == "linear")      return ResolutionModelKind::Linear;
    if (key == "quadratic")   return ResolutionModelKind::Quadratic;
    if (key == "exponential") return ResolutionModelKind::Exponential;
    if (key == "power")       return ResolutionModelKind::Power;
    throw ConfigurationError("Unknown resolution model: " + name);
}

std::string to_string(ResolutionModelKind kind)
{
    switch (kind) {
        case ResolutionModelKind::Detector:    return "detector";
        case ResolutionModelKind::Linear:      return "linear";
        case ResolutionModelKind::Quadratic:   return "quadratic";
        case ResolutionModelKind::Exponential: return "exponential";
        case ResolutionModelKind::Power:       return "power";
    }
    return "detector";
}

const std::vector<ResolutionModelKind>& all_resolution_model_kinds()
{
    static const std::vector<ResolutionModelKind> kinds = {
        ResolutionModelKind::Detector,
        ResolutionModelKind::Linear,
        ResolutionModelKind::Quadratic,
        ResolutionModelKind::Exponential,
        ResolutionModelKind::Power
    };
    return kinds;
}

const ResolutionModelSpec& resolution_model_spec(ResolutionModelKind kind)
{
    static const ResolutionModelSpec detector{
        {"fwhm_0", "epsilon"}, {0.05, 0.0001}, {0.2, 0.01}, {0.1, 0.001}};
    static const ResolutionModelSpec linear{
        {"intercept", "slope"}, {0.05, 0.0}, {0.2, 0.02}, {0.1, 0.005}};
    static const ResolutionModelSpec quadratic{
        {"intercept", "linear_coef", "quadratic_coef"},
        {0.05, -0.01, -0.001}, {0.2, 0.02, 0.001}, {0.1, 0.005, 0.0001}};
    static const ResolutionModelSpec exponential{
        {"amplitude", "exponent"}, {0.05, 0.0}, {0.2, 0.1}, {0.1, 0.02}};
    static const ResolutionModelSpec power{
        {"amplitude", "power"}, {0.05, 0.0}, {0.2, 1.0}, {0.1, 0.3}};

    switch (kind) {
        case ResolutionModelKind::Detector:    return detector;
        case ResolutionModelKind::Linear:      return linear;
        case ResolutionModelKind::Quadratic:   return quadratic;
        case ResolutionModelKind::Exponential: return exponential;
        case ResolutionModelKind::Power:       return power;
    }
    throw ConfigurationError("Unknown resolution model kind");
}

double evaluate_resolution(ResolutionModelKind kind, double e, const Vector& p)
{
    switch (kind) {
        case ResolutionModelKind::Detector:
            return std::sqrt(std::max(0.0, p[0] * p[0] + FANO_FACTOR2 * p[1] * e));
        case ResolutionModelKind::Linear:
            return p[0] + p[1] * e;
        case ResolutionModelKind::Quadratic:
            return p[0] + p[1] * e + p[2] * e * e;
        case ResolutionModelKind::Exponential:
            return p[0] * std::exp(p[1] * e);
        case ResolutionModelKind::Power:
            return p[0] * std::pow(std::max(e, 0.0), p[1]);
    }
    return 0.0;
}

/* ------------------------------------------------------------------------ */

double ResolutionModel::predict(double energy) const
{
    const double v = evaluate_resolution(kind, energy, params);
    return (std::isfinite(v) && v > 0.0) ? v : 0.0;
}

Vector ResolutionModel::predict(const Vector& energies) const
{
    Vector out(energies.size());
    for (Index i = 0; i < energies.size(); ++i) out[i] = predict(energies[i]);
    return out;
}

double ResolutionModel::parameter(const std::string& name) const
{
    const auto& names = resolution_model_spec(kind).names;
    const auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end() || static_cast<Index>(it - names.begin()) >= params.size())
        throw ConfigurationError("Resolution model '" + to_string(kind)
                                 + "' has no parameter '" + name + "'");
    return params[it - names.begin()];
}

DetectorParameters ResolutionModel::detector_equivalent() const
{
    if (kind == ResolutionModelKind::Detector)
        return {params[0], params[1]};

    DetectorParameters d;
    const double f = predict(REFERENCE_KEV);
    d.epsilon = SDD_DEFAULT.epsilon;
    d.fwhm_0  = std::sqrt(std::max(0.0, f * f - FANO_FACTOR2 * d.epsilon * REFERENCE_KEV));
    return d;
}

std::string ResolutionModel::describe() const
{
    std::ostringstream os;
    os << std::fixed;
    if (kind == ResolutionModelKind::Detector) {
        os << "detector: FWHM0=" << std::setprecision(1) << params[0] * 1000.0
           << " eV, eps=" << std::setprecision(3) << params[1] * 1000.0 << " eV/keV";
    } else {
        os << to_string(kind) << ":";
        const auto& names = resolution_model_spec(kind).names;
        for (std::size_t i = 0; i < names.size() && static_cast<Index>(i) < params.size(); ++i)
            os << ' ' << names[i] << '=' << std::setprecision(6) << params[static_cast<Index>(i)];
    }
    os << ", R2=" << std::setprecision(4) << r_squared
       << ", RMSE=" << std::setprecision(1) << rmse * 1000.0 << " eV";
    return os.str();
}

ResolutionModel default_detector_model()
{
    ResolutionModel m;
    m.kind = ResolutionModelKind::Detector;
    m.params.resize(2);
    m.params << SDD_DEFAULT.fwhm_0, SDD_DEFAULT.epsilon;
    m.param_errors.resize(2);
    m.param_errors << 0.005, 0.0001;
    m.calibration_date = iso_timestamp_now();
    return m;
}

/* --------------------------------- JSON ---------------------------------- */

void to_json(nlohmann::json& j, const ResolutionModel& m)
{
    const auto& names = resolution_model_spec(m.kind).names;
    nlohmann::json p = nlohmann::json::object();
    nlohmann::json pe = nlohmann::json::object();
    for (std::size_t i = 0; i < names.size(); ++i) {
        const Index k = static_cast<Index>(i);
        p[names[i]]  = k < m.params.size() ? m.params[k] : 0.0;
        pe[names[i]] = k < m.param_errors.size() ? m.param_errors[k] : 0.0;
    }
    j = nlohmann::json{
        {"model_type",       to_string(m.kind)},
        {"parameters",       p},
        {"parameter_errors", pe},
        {"r_squared",        m.r_squared},
        {"rmse",             m.rmse},
        {"aic",              m.aic},
        {"bic",              m.bic},
        {"n_peaks",          m.n_peaks},
        {"energy_range",     {m.energy_min, m.energy_max}},
        {"calibration_date", m.calibration_date}
    };
}

void from_json(const nlohmann::json& j, ResolutionModel& m)
{
    m = ResolutionModel{};

    if (j.contains("model_type")) {
        m.kind = parse_resolution_model_kind(j.at("model_type").get<std::string>());
        const auto& names = resolution_model_spec(m.kind).names;
        const Index n = static_cast<Index>(names.size());
        m.params = Vector::Zero(n);
        m.param_errors = Vector::Zero(n);
        const auto& p = j.at("parameters");
        for (Index k = 0; k < n; ++k) {
            const auto& key = names[static_cast<std::size_t>(k)];
            if (!p.contains(key))
                throw ConfigurationError("Resolution model document lacks parameter '" + key + "'");
            m.params[k] = p.at(key).get<double>();
            if (j.contains("parameter_errors") && j["parameter_errors"].contains(key))
                m.param_errors[k] = j["parameter_errors"][key].get<double>();
        }
        m.r_squared = j.value("r_squared", 0.0);
        m.rmse      = j.value("rmse", 0.0);
        m.aic       = j.value("aic", 0.0);
        m.bic       = j.value("bic", 0.0);
        m.n_peaks   = j.value("n_peaks", 0);
        if (j.contains("energy_range") && j["energy_range"].size() == 2) {
            m.energy_min = j["energy_range"][0].get<double>();
            m.energy_max = j["energy_range"][1].get<double>();
        }
        m.calibration_date = j.value("calibration_date", std::string());
        return;
    }

    // legacy detector calibration document
    if (j.contains("fwhm_0_keV") || j.contains("fwhm_0_eV")) {
        double fwhm_0, epsilon;
        if (j.contains("fwhm_0_keV")) {
            fwhm_0 = j["fwhm_0_keV"].get<double>();
            epsilon = j.contains("epsilon_keV")
                ? j["epsilon_keV"].get<double>()
                : j.value("epsilon_eV_per_keV", SDD_DEFAULT.epsilon * 1000.0) / 1000.0;
        } else {
            fwhm_0  = j["fwhm_0_eV"].get<double>() / 1000.0;
            epsilon = j.value("epsilon_eV_per_keV", SDD_DEFAULT.epsilon * 1000.0) / 1000.0;
        }
        m.kind = ResolutionModelKind::Detector;
        m.params.resize(2);
        m.params << fwhm_0, epsilon;
        m.param_errors.resize(2);
        m.param_errors << j.value("fwhm_0_error_eV", 0.0) / 1000.0,
                          j.value("epsilon_error_eV_per_keV", 0.0) / 1000.0;
        m.r_squared = j.value("r_squared", 0.0);
        m.rmse      = j.value("rmse_eV", 0.0) / 1000.0;
        m.aic       = j.value("aic", 0.0);
        m.bic       = j.value("bic", 0.0);
        m.n_peaks   = j.value("n_peaks", 0);
        m.calibration_date = j.value("calibration_date", iso_timestamp_now());
        return;
    }

    throw ConfigurationError("Unknown resolution calibration format");
}

void save_resolution_model(const ResolutionModel& m, const std::string& path)
{
    save_json(nlohmann::json(m), path);
}

ResolutionModel load_resolution_model(const std::string& path)
{
    const nlohmann::json j = load_json(path);
    try {
        return j.get<ResolutionModel>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed resolution model in " + path + ": " + e.what());
    }
}

} // namespace xrfcal
