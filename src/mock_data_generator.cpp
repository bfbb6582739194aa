// src/mock_data_generator.cpp

#include "xrfcal/JsonUtils.hpp"
#include "xrfcal/ResolutionCalibrator.hpp"
#include "xrfcal/Spectrum.hpp"
#include "xrfcal/SyntheticSpectrum.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace xrfcal;

namespace {

// Main configuration structure
struct MockDataConfig {
    // energy axis
    int    channels      = 2048;
    double channel_width = 0.01;     // keV
    double energy_offset = 0.0;

    // generating detector resolution
    double fwhm_0  = 0.085;          // keV
    double epsilon = 0.0003;         // keV

    // peak heights and continuum
    double peak_counts     = 3000.0;
    double continuum_level = 20.0;
    double continuum_slope = -0.5;

    // certified standard
    std::map<std::string, double> standard_ppm = {
        {"Fe", 50000.0}, {"Cu", 20000.0}, {"Ti", 10000.0}, {"Zn", 30000.0}
    };
    double excitation_energy = 40.0;

    std::uint32_t seed = 42;
    bool   noise      = true;
    std::string output_dir = "./mock_data/";
    bool   verbose    = false;
};

// relative height of a line inside its element
double line_weight(const std::string& name)
{
    if (name.find("Kb") != std::string::npos) return 0.17;
    if (name.find("Ka2") != std::string::npos) return 0.5;
    if (name == "Al-Ka") return 0.3;
    return 1.0;
}

// element symbol whose line database entry holds the line
std::string database_symbol(const std::string& reference)
{
    return reference == "ZrO2" ? "Zr" : reference;
}

Vector energy_axis(const MockDataConfig& c)
{
    Vector e(c.channels);
    for (int i = 0; i < c.channels; ++i) e[i] = c.energy_offset + (i + 0.5) * c.channel_width;
    return e;
}

MockDataConfig load_config_from_json(const std::string& filename)
{
    const nlohmann::json j = load_json(filename);
    MockDataConfig c;
    c.channels          = j.value("channels", c.channels);
    c.channel_width     = j.value("channel_width", c.channel_width);
    c.energy_offset     = j.value("energy_offset", c.energy_offset);
    c.fwhm_0            = j.value("fwhm_0", c.fwhm_0);
    c.epsilon           = j.value("epsilon", c.epsilon);
    c.peak_counts       = j.value("peak_counts", c.peak_counts);
    c.continuum_level   = j.value("continuum_level", c.continuum_level);
    c.continuum_slope   = j.value("continuum_slope", c.continuum_slope);
    c.excitation_energy = j.value("excitation_energy", c.excitation_energy);
    c.seed              = j.value("seed", c.seed);
    c.noise             = j.value("noise", c.noise);
    c.output_dir        = j.value("output", c.output_dir);
    c.verbose           = j.value("verbose", c.verbose);
    if (j.contains("standard"))
        c.standard_ppm = j["standard"].get<std::map<std::string, double>>();
    return c;
}

SynthesisParameters truth(const MockDataConfig& c)
{
    SynthesisParameters p;
    p.resolution.fwhm_0  = c.fwhm_0;
    p.resolution.epsilon = c.epsilon;
    return p;
}

MockSpectrumOptions noise_options(const MockDataConfig& c, std::uint32_t seed)
{
    MockSpectrumOptions o;
    o.continuum_level = c.continuum_level;
    o.continuum_slope = c.continuum_slope;
    o.poisson_noise   = c.noise;
    o.seed            = seed;
    return o;
}

/* ------------------------------------------------------------------------ */

void write_reference_set(const MockDataConfig& c)
{
    const Vector e = energy_axis(c);
    nlohmann::json refs = nlohmann::json::array();

    std::uint32_t seed = c.seed;
    for (const auto& [element, lines] : default_reference_lines()) {
        std::vector<ElementLine> el;
        for (const auto& l : lines)
            el.push_back({element, l.name, l.energy, c.peak_counts * line_weight(l.name)});

        Spectrum sp = make_mock_spectrum(e, el, truth(c), noise_options(c, seed++));
        const std::string file = element + ".txt";
        save_ascii(sp, (fs::path(c.output_dir) / file).string());
        refs.push_back({{"element", element}, {"file", file}});

        if (c.verbose)
            std::cout << "  " << std::setw(5) << element << ": " << el.size() << " lines -> "
                      << file << "\n";
    }

    const nlohmann::json cfg = {
        {"references",     refs},
        {"model",          "detector"},
        {"compare_models", true},
        {"output",         "resolution.json"},
        {"measurements",   "fwhm_measurements.json"},
        {"truth",          {{"fwhm_0", c.fwhm_0}, {"epsilon", c.epsilon}}}
    };
    save_json(cfg, (fs::path(c.output_dir) / "fwhm_config.json").string());
}

void write_standard(const MockDataConfig& c)
{
    const Vector e = energy_axis(c);

    // line database from the reference table, Al excluded
    nlohmann::json db = nlohmann::json::object();
    for (const auto& [element, lines] : default_reference_lines()) {
        const std::string sym = database_symbol(element);
        for (const auto& l : lines) {
            if (l.name == "Al-Ka") continue;
            std::string name = l.name;
            if (name.rfind("Zr-", 0) == 0) name = name.substr(3);
            db[sym]["K"].push_back({{"name", name}, {"energy", l.energy}});
        }
    }
    save_json(db, (fs::path(c.output_dir) / "lines.json").string());

    double max_ppm = 0.0;
    for (const auto& [el, ppm] : c.standard_ppm) max_ppm = std::max(max_ppm, ppm);

    std::vector<ElementLine> lines;
    for (const auto& [el, ppm] : c.standard_ppm) {
        if (!db.contains(el)) continue;
        for (const auto& l : db[el]["K"]) {
            const std::string name = l["name"].get<std::string>();
            const double energy = l["energy"].get<double>();
            if (energy >= c.excitation_energy) continue;
            lines.push_back({el, name, energy, c.peak_counts * line_weight(name) * ppm / max_ppm});
        }
    }

    Spectrum sp = make_mock_spectrum(e, lines, truth(c), noise_options(c, c.seed + 1000));
    save_ascii(sp, (fs::path(c.output_dir) / "standard.txt").string());

    const nlohmann::json cfg = {
        {"spectrum",          "standard.txt"},
        {"concentrations",    c.standard_ppm},
        {"excitation_energy", c.excitation_energy},
        {"source",            "measured"},
        {"line_database",     "lines.json"},
        {"resolution_model",  "resolution.json"},
        {"minimizer",         "lbfgsb"},
        {"refine_efficiency", false},
        {"output",            "calibration.json"}
    };
    save_json(cfg, (fs::path(c.output_dir) / "instrument_config.json").string());

    if (c.verbose)
        std::cout << "  standard: " << lines.size() << " lines -> standard.txt\n";
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("xrf_mock_generator",
                             "Generate synthetic XRF reference spectra and calibration configs");

    options.add_options()
        ("c,config", "Configuration JSON file", cxxopts::value<std::string>())
        ("channels", "Number of channels", cxxopts::value<int>()->default_value("2048"))
        ("channel-width", "Channel width (keV)", cxxopts::value<double>()->default_value("0.01"))
        ("fwhm0", "Generating FWHM_0 (eV)", cxxopts::value<double>()->default_value("85"))
        ("epsilon", "Generating epsilon (eV/keV)", cxxopts::value<double>()->default_value("0.3"))
        ("counts", "Height of the strongest line (counts)", cxxopts::value<double>()->default_value("3000"))
        ("continuum", "Continuum level at 0 keV (counts)", cxxopts::value<double>()->default_value("20"))
        ("seed", "Random seed", cxxopts::value<unsigned>()->default_value("42"))
        ("no-noise", "Write expected counts without Poisson sampling")
        ("o,output", "Output directory", cxxopts::value<std::string>()->default_value("./mock_data/"))
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n"
                      << "\nExample config.json:\n"
                      << "{\n"
                      << "  \"channels\": 2048, \"channel_width\": 0.01,\n"
                      << "  \"fwhm_0\": 0.085, \"epsilon\": 0.0003,\n"
                      << "  \"peak_counts\": 3000, \"seed\": 7,\n"
                      << "  \"standard\": {\"Fe\": 50000, \"Cu\": 20000},\n"
                      << "  \"output\": \"./mock_data/\"\n"
                      << "}\n";
            return 0;
        }

        MockDataConfig config;
        if (result.count("config")) {
            config = load_config_from_json(result["config"].as<std::string>());
        } else {
            config.channels        = result["channels"].as<int>();
            config.channel_width   = result["channel-width"].as<double>();
            config.fwhm_0          = result["fwhm0"].as<double>() / 1000.0;
            config.epsilon         = result["epsilon"].as<double>() / 1000.0;
            config.peak_counts     = result["counts"].as<double>();
            config.continuum_level = result["continuum"].as<double>();
            config.seed            = result["seed"].as<unsigned>();
            config.noise           = result.count("no-noise") == 0;
            config.output_dir      = result["output"].as<std::string>();
        }
        config.verbose = config.verbose || result.count("verbose") > 0;

        if (config.channels < 16 || !(config.channel_width > 0.0))
            throw std::runtime_error("need at least 16 channels of positive width");

        fs::create_directories(config.output_dir);

        std::cout << "Generating mock data in " << config.output_dir
                  << " (FWHM_0=" << config.fwhm_0 * 1000.0 << " eV, eps="
                  << config.epsilon * 1000.0 << " eV/keV)\n";

        write_reference_set(config);
        write_standard(config);

        std::cout << "Done. Run:\n  xrfcal --fwhm " << (fs::path(config.output_dir) / "fwhm_config.json").string()
                  << " --instrument " << (fs::path(config.output_dir) / "instrument_config.json").string()
                  << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
