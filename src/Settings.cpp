#include "xrfcal/Settings.hpp"
#include "xrfcal/Errors.hpp"
#include "xrfcal/JsonUtils.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace xrfcal {

namespace {

constexpr const char* SETTINGS_FILE = "xrfcal_settings.json";

// json type and range errors surface as ConfigurationError naming the key
template <class T>
T as(const nlohmann::json& j, const char* key)
{
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Setting '") + key + "': " + e.what());
    }
}

template <class T>
void read(const nlohmann::json& j, const char* key, T& dst)
{
    if (j.contains(key) && !j[key].is_null()) dst = as<T>(j, key);
}

std::string executable_dir()
{
    std::error_code ec;
    const auto exe = fs::canonical("/proc/self/exe", ec);
    return ec ? std::string(".") : exe.parent_path().string();
}

} // namespace

nlohmann::json load_global_settings(const std::string& explicit_path)
{
    if (!explicit_path.empty()) {
        nlohmann::json j = load_json(explicit_path);
        expand_env(j);
        return j;
    }

    const std::vector<std::string> search_paths = {
        SETTINGS_FILE,
        (fs::path(executable_dir()) / SETTINGS_FILE).string(),
        std::string("../") + SETTINGS_FILE,
        std::string("../../") + SETTINGS_FILE
    };

    for (const auto& path : search_paths) {
        if (!fs::exists(path)) continue;
        try {
            nlohmann::json j = load_json(path);
            expand_env(j);
            std::cout << "Loaded settings from: " << path << std::endl;
            return j;
        } catch (const ConfigurationError& e) {
            std::cerr << e.what() << std::endl;
        }
    }
    return nlohmann::json::object();
}

/* -------------------------------- readers -------------------------------- */

void from_json(const nlohmann::json& j, BackgroundOptions& o)
{
    if (j.contains("method")) o.method = parse_background_method(as<std::string>(j, "method"));
    read(j, "snip_iterations",      o.snip_iterations);
    read(j, "snip_decreasing",      o.snip_decreasing);
    read(j, "als_lambda",           o.als_lambda);
    read(j, "als_p",                o.als_p);
    read(j, "als_iterations",       o.als_iterations);
    read(j, "poly_degree",          o.poly_degree);
    read(j, "linear_edge_fraction", o.linear_edge_fraction);
    read(j, "adaptive_window",      o.adaptive_window);
    read(j, "adaptive_percentile",  o.adaptive_percentile);
    if (j.contains("linear_endpoints")) {
        const auto ep = as<std::vector<Index>>(j, "linear_endpoints");
        if (ep.size() != 2)
            throw ConfigurationError("linear_endpoints needs exactly two channel indices");
        o.linear_endpoints = std::make_pair(ep[0], ep[1]);
    }
}

void from_json(const nlohmann::json& j, LMSolverOptions& o)
{
    read(j, "max_iterations",     o.max_iterations);
    read(j, "gradient_tolerance", o.gradient_tolerance);
    read(j, "step_tolerance",     o.step_tolerance);
    read(j, "chi2_tolerance",     o.chi2_tolerance);
    read(j, "initial_lambda",     o.initial_lambda);
    read(j, "verbose",            o.verbose);
}

void from_json(const nlohmann::json& j, MinimizerOptions& o)
{
    read(j, "max_iterations",     o.max_iterations);
    read(j, "max_function_evals", o.max_function_evals);
    read(j, "ftol",               o.ftol);
    read(j, "gtol",               o.gtol);
    read(j, "memory",             o.memory);
    read(j, "fd_step",            o.fd_step);
    read(j, "verbose",            o.verbose);
}

void from_json(const nlohmann::json& j, ScatterOptions& o)
{
    read(j, "scatter_angle", o.scatter_angle);
    read(j, "compton_ratio", o.compton_ratio);
    if (j.contains("lines")) {
        o.tube_lines.clear();
        for (const auto& l : j["lines"]) {
            TubeLine t;
            read(l, "name", t.name);
            t.energy = as<double>(l, "energy");
            read(l, "intensity", t.intensity);
            o.tube_lines.push_back(t);
        }
    }
}

void from_json(const nlohmann::json& j, ShapeRefinementOptions& o)
{
    read(j, "fwhm_0_min",         o.fwhm_0_min);
    read(j, "fwhm_0_max",         o.fwhm_0_max);
    read(j, "epsilon_min",        o.epsilon_min);
    read(j, "epsilon_max",        o.epsilon_max);
    read(j, "tail_amplitude",     o.tail_amplitude);
    read(j, "tail_amplitude_max", o.tail_amplitude_max);
    read(j, "tail_slope",         o.tail_slope);
    read(j, "tail_slope_min",     o.tail_slope_min);
    read(j, "tail_slope_max",     o.tail_slope_max);
    read(j, "element_scale_min",  o.element_scale_min);
    read(j, "element_scale_max",  o.element_scale_max);
    if (j.contains("solver")) o.solver = as<LMSolverOptions>(j, "solver");
}

void from_json(const nlohmann::json& j, PeakFitterConfig& o)
{
    if (j.contains("shape")) o.shape = parse_shape_kind(as<std::string>(j, "shape"));
    if (j.contains("resolution_model"))
        o.resolution = load_resolution_model(as<std::string>(j, "resolution_model"));
    read(j, "window_factor",            o.window_factor);
    read(j, "low_energy_window_factor", o.low_energy_window_factor);
    read(j, "low_energy_threshold",     o.low_energy_threshold);
    read(j, "min_points",               o.min_points);
    read(j, "center_tolerance",         o.center_tolerance);
    read(j, "width_lower_factor",       o.width_lower_factor);
    read(j, "width_upper_factor",       o.width_upper_factor);
    read(j, "amplitude_lower_factor",   o.amplitude_lower_factor);
    read(j, "amplitude_upper_factor",   o.amplitude_upper_factor);
    read(j, "voigt_gamma_ratio",        o.voigt_gamma_ratio);
    read(j, "fix_shape",                o.fix_shape);
    if (j.contains("solver")) o.solver = as<LMSolverOptions>(j, "solver");
    read(j, "verbose",                  o.verbose);
}

void from_json(const nlohmann::json& j, ResolutionCalibratorConfig& o)
{
    if (j.contains("background")) o.background = as<BackgroundOptions>(j, "background");
    read(j, "window_half_width",     o.window_half_width);
    read(j, "min_window_points",     o.min_window_points);
    read(j, "max_search",            o.max_search);
    read(j, "min_counts",            o.min_counts);
    read(j, "min_counts_high",       o.min_counts_high);
    read(j, "high_energy_threshold", o.high_energy_threshold);
    read(j, "fwhm_min",              o.fwhm_min);
    read(j, "fwhm_max",              o.fwhm_max);
    read(j, "initial_fwhm",          o.initial_fwhm);
    read(j, "center_tolerance",      o.center_tolerance);
    read(j, "min_r_squared",         o.min_r_squared);
    read(j, "reject_outliers",       o.reject_outliers);
    read(j, "outlier_min_peaks",     o.outlier_min_peaks);
    read(j, "outlier_threshold",     o.outlier_threshold);
    read(j, "outlier_scale_floor",   o.outlier_scale_floor);
    read(j, "huber_k",               o.huber_k);
    read(j, "huber_iterations",      o.huber_iterations);
    if (j.contains("model")) o.model = parse_resolution_model_kind(as<std::string>(j, "model"));
    read(j, "threads",               o.threads);
    if (j.contains("solver")) o.solver = as<LMSolverOptions>(j, "solver");
    read(j, "verbose",               o.verbose);
}

void from_json(const nlohmann::json& j, IntensityCalibratorConfig& o)
{
    if (j.contains("background")) o.background = as<BackgroundOptions>(j, "background");
    if (j.contains("minimizer"))  o.minimizer  = parse_minimizer_kind(as<std::string>(j, "minimizer"));
    if (j.contains("minimizer_options"))
        o.minimizer_options = as<MinimizerOptions>(j, "minimizer_options");
    if (j.contains("resolution_model") && j["resolution_model"].is_string())
        o.resolution = load_resolution_model(as<std::string>(j, "resolution_model"));
    read(j, "resolution_tolerance", o.resolution_tolerance);
    if (j.contains("initial_resolution")) {
        const auto& r = j["initial_resolution"];
        read(r, "fwhm_0",  o.initial_resolution.fwhm_0);
        read(r, "epsilon", o.initial_resolution.epsilon);
    }
    read(j, "refine_efficiency",  o.refine_efficiency);
    if (j.contains("tube")) o.scatter = as<ScatterOptions>(j, "tube");
    read(j, "stride",             o.stride);
    read(j, "polish",             o.polish);
    read(j, "noise_sigma_factor", o.noise_sigma_factor);
    read(j, "min_mask_counts",    o.min_mask_counts);
    read(j, "penalty",            o.penalty);
    read(j, "refine_shape",       o.refine_shape);
    if (j.contains("shape_refinement")) o.shape = as<ShapeRefinementOptions>(j, "shape_refinement");
    read(j, "verbose",            o.verbose);
}

} // namespace xrfcal
