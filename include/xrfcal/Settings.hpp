#pragma once
#include "Background.hpp"
#include "BoundedMinimizer.hpp"
#include "IntensityCalibrator.hpp"
#include "PeakFitter.hpp"
#include "ResolutionCalibrator.hpp"
#include "SimpleLM.hpp"
#include "SyntheticSpectrum.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace xrfcal {

/*
 *  xrfcal_settings.json is looked up in
 *      1. the working directory
 *      2. the directory of the executable
 *      3. ../ and ../../ (build and source trees)
 *  An explicit path must exist.  Without any file an empty object is
 *  returned and every reader below falls back to its defaults.  ${VAR}
 *  references are expanded.
 */
nlohmann::json load_global_settings(const std::string& explicit_path = "");

/*  Readers: missing keys keep the struct defaults, unknown enum names
 *  and values of the wrong type throw ConfigurationError.                 */
void from_json(const nlohmann::json& j, BackgroundOptions& o);
void from_json(const nlohmann::json& j, LMSolverOptions& o);
void from_json(const nlohmann::json& j, MinimizerOptions& o);
void from_json(const nlohmann::json& j, ScatterOptions& o);
void from_json(const nlohmann::json& j, ShapeRefinementOptions& o);
void from_json(const nlohmann::json& j, PeakFitterConfig& o);
void from_json(const nlohmann::json& j, ResolutionCalibratorConfig& o);
void from_json(const nlohmann::json& j, IntensityCalibratorConfig& o);

} // namespace xrfcal
