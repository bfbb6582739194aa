#pragma once
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace xrfcal {

/*  One characteristic line with its expected relative intensity
 *  (peak height in counts for measured sources).                          */
struct ElementLine {
    std::string element;
    std::string line;
    double      energy    = 0.0;        // keV
    double      intensity = 0.0;
};

struct EmissionLine {
    std::string name;
    double      energy = 0.0;           // keV
};

// series name ("K", "L", "M") → lines
using LineSeries = std::map<std::string, std::vector<EmissionLine>>;

// Kα1, Kα2, Kβ1, Lα1, Lα2, Lβ1 (Greek letters or the a/b spelling)
bool is_major_line(const std::string& name);

/* ---------------------------- atomic line data ---------------------------- */

class LineDatabase {
public:
    virtual ~LineDatabase() = default;
    // empty series for unknown symbols
    virtual LineSeries get_lines(const std::string& symbol) const = 0;
};

/*
 *  { "Fe": { "K": [ {"name": "Ka1", "energy": 6.404}, ... ],
 *            "L": [ ... ] },
 *    ... }
 *  "energy_keV" is accepted in place of "energy".
 */
class JsonLineDatabase final : public LineDatabase {
public:
    explicit JsonLineDatabase(const nlohmann::json& doc);
    static JsonLineDatabase from_file(const std::string& path);

    LineSeries get_lines(const std::string& symbol) const override;

private:
    std::map<std::string, LineSeries> table_;
};

/* ----------------------- fundamental parameters oracle --------------------- */

struct Geometry {
    double incident_angle = 45.0;       // degrees
    double takeoff_angle  = 45.0;
};

using Composition = std::map<std::string, double>;   // element → mass fraction

struct PredictedLine {
    double energy        = 0.0;         // keV
    double relative_rate = 0.0;
};

// element → line → prediction
using PredictedIntensities = std::map<std::string, std::map<std::string, PredictedLine>>;

class IntensityPredictor {
public:
    virtual ~IntensityPredictor() = default;
    virtual PredictedIntensities predict_intensities(const Composition& composition,
                                                     double             excitation_kev,
                                                     const Geometry&    geometry) const = 0;
};

} // namespace xrfcal
