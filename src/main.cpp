#include "xrfcal/Errors.hpp"
#include "xrfcal/FitStatistics.hpp"
#include "xrfcal/IntensityCalibrator.hpp"
#include "xrfcal/JsonUtils.hpp"
#include "xrfcal/LineDatabase.hpp"
#include "xrfcal/LineIntensitySource.hpp"
#include "xrfcal/PeakFitter.hpp"
#include "xrfcal/ResolutionCalibrator.hpp"
#include "xrfcal/Settings.hpp"
#include "xrfcal/Spectrum.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace fs = std::filesystem;
using namespace xrfcal;

namespace {

// relative paths in a config file are taken relative to that file
std::string resolve(const std::string& base_file, const std::string& p)
{
    const fs::path path(p);
    if (path.is_absolute()) return p;
    return (fs::path(base_file).parent_path() / path).string();
}

nlohmann::json merged(const nlohmann::json& global, const char* section, const nlohmann::json& local)
{
    nlohmann::json j = global.contains(section) ? global[section] : nlohmann::json::object();
    j.merge_patch(local);
    return j;
}

/* ------------------------------------------------------------------------ */
/*                         resolution (FWHM) calibration                     */
/* ------------------------------------------------------------------------ */
ResolutionModel run_fwhm_calibration(const std::string& cfg_path,
                                     const nlohmann::json& global,
                                     unsigned threads, bool verbose)
{
    nlohmann::json cfg = load_json(cfg_path);
    expand_env(cfg);

    auto rc = merged(global, "resolution", cfg).get<ResolutionCalibratorConfig>();
    if (threads > 0) rc.threads = threads;
    rc.verbose = rc.verbose || verbose;

    std::vector<ReferenceSpectrum> refs;
    for (const auto& r : cfg.at("references")) {
        const std::string element = r.at("element").get<std::string>();
        Spectrum sp = load_ascii(resolve(cfg_path, r.at("file").get<std::string>()));
        sp.label = element;

        if (r.contains("lines")) {
            ReferenceSpectrum ref{element, std::move(sp), {}};
            for (const auto& l : r["lines"])
                ref.lines.push_back({l.at("name").get<std::string>(), l.at("energy").get<double>()});
            refs.push_back(std::move(ref));
        } else {
            refs.push_back(make_reference(element, std::move(sp)));
        }
    }

    std::cout << "FWHM calibration: " << refs.size() << " reference spectra, model "
              << to_string(rc.model) << "\n";

    const ResolutionCalibrator calibrator(rc);
    const ResolutionCalibrationResult res = calibrator.calibrate(refs);

    for (const auto& rej : res.rejected)
        std::cout << "  rejected " << rej.element << ' ' << rej.line << ": " << rej.reason << "\n";
    for (const auto& o : res.outliers)
        std::cout << "  outlier  " << o.element << ' ' << o.line << " ("
                  << std::fixed << std::setprecision(1) << o.fwhm * 1000.0 << " eV)\n";

    if (!res.success)
        throw InsufficientDataError("FWHM calibration failed: " + res.message);

    std::cout << res.message << "\n  " << res.model.describe() << "\n";

    if (cfg.value("compare_models", false)) {
        std::cout << "\nModel comparison (best first):\n";
        for (const auto& m : calibrator.compare_models(res.used))
            std::cout << "  " << std::left << std::setw(12) << to_string(m.kind) << std::right
                      << " AIC=" << std::setw(9) << std::setprecision(2) << m.aic
                      << " BIC=" << std::setw(9) << m.bic
                      << " R2=" << std::setprecision(4) << m.r_squared << "\n";
    }

    if (cfg.contains("output")) {
        const std::string out = resolve(cfg_path, cfg["output"].get<std::string>());
        save_resolution_model(res.model, out);
        std::cout << "Resolution model written to " << out << "\n";
    }
    if (cfg.contains("measurements")) {
        const std::string out = resolve(cfg_path, cfg["measurements"].get<std::string>());
        save_json(nlohmann::json{{"used", res.used}, {"outliers", res.outliers}}, out);
    }
    return res.model;
}

/* ------------------------------------------------------------------------ */
/*                           instrument calibration                          */
/* ------------------------------------------------------------------------ */
void run_instrument_calibration(const std::string& cfg_path,
                                const nlohmann::json& global,
                                const std::optional<ResolutionModel>& fresh_model,
                                bool verbose)
{
    nlohmann::json cfg = load_json(cfg_path);
    expand_env(cfg);

    nlohmann::json ic_json = merged(global, "instrument", cfg);
    if (ic_json.contains("resolution_model") && ic_json["resolution_model"].is_string())
        ic_json["resolution_model"] = resolve(cfg_path, ic_json["resolution_model"].get<std::string>());
    auto ic = ic_json.get<IntensityCalibratorConfig>();
    if (!ic.resolution && fresh_model) ic.resolution = *fresh_model;
    ic.verbose = ic.verbose || verbose;

    StandardSample sample;
    sample.spectrum = load_ascii(resolve(cfg_path, cfg.at("spectrum").get<std::string>()));
    if (cfg.contains("concentrations_csv"))
        sample.concentrations_ppm =
            load_reference_concentrations(resolve(cfg_path, cfg["concentrations_csv"].get<std::string>()));
    if (cfg.contains("concentrations"))
        for (const auto& [el, v] : cfg["concentrations"].items())
            sample.concentrations_ppm[el] = v.get<double>();
    sample.excitation_energy = cfg.value("excitation_energy", sample.excitation_energy);
    if (cfg.contains("geometry")) {
        sample.geometry.incident_angle = cfg["geometry"].value("incident_angle", 45.0);
        sample.geometry.takeoff_angle  = cfg["geometry"].value("takeoff_angle", 45.0);
    }

    const IntensitySourceKind kind =
        parse_intensity_source_kind(cfg.value("source", std::string("measured")));
    std::shared_ptr<const LineDatabase> db;
    if (cfg.contains("line_database"))
        db = std::make_shared<JsonLineDatabase>(
            JsonLineDatabase::from_file(resolve(cfg_path, cfg["line_database"].get<std::string>())));

    MeasuredLineOptions mopt;
    mopt.background = ic.background;
    // no fundamental parameters backend is linked into the command line driver
    const auto source = make_line_source(kind, db, nullptr, mopt);

    std::cout << "Instrument calibration: " << sample.concentrations_ppm.size()
              << " certified elements, minimizer " << to_string(ic.minimizer) << "\n";

    const IntensityCalibrator calibrator(ic, source);
    const CalibrationResult res = calibrator.calibrate(sample);

    std::cout << (res.success ? "Calibration succeeded" : "Calibration failed")
              << " (" << res.message << ")\n"
              << std::fixed << std::setprecision(1)
              << "  FWHM_0    = " << res.fwhm_0 * 1000.0 << " eV\n"
              << std::setprecision(3)
              << "  epsilon   = " << res.epsilon * 1000.0 << " eV/keV\n"
              << std::setprecision(4)
              << "  scale     = " << res.intensity_scale << "\n"
              << "  scatter   = " << res.scatter_scale << "\n"
              << "  eff b, c  = " << res.efficiency.b << ", " << res.efficiency.c << "\n"
              << "  R2        = " << res.r_squared << "\n"
              << "  chi2      = " << res.chi_squared << "\n"
              << "  lines     = " << res.n_lines << "\n";
    if (res.tail)
        std::cout << "  tail      = " << res.tail->amplitude << " x exp(" << res.tail->slope
                  << " dE/sigma)\n";
    for (const auto& [el, s] : res.element_scales)
        std::cout << "  scale " << std::left << std::setw(4) << el << std::right << "= " << s << "\n";

    if (cfg.contains("output")) {
        const std::string out = resolve(cfg_path, cfg["output"].get<std::string>());
        save_calibration(res, out);
        std::cout << "Calibration written to " << out << "\n";
    }
}

/* ------------------------------------------------------------------------ */
/*                            peak search and fit                            */
/* ------------------------------------------------------------------------ */
void run_peak_fit(const std::string& spectrum_path,
                  const nlohmann::json& global,
                  const std::string& resolution_path,
                  bool verbose)
{
    const Spectrum sp = load_ascii(spectrum_path);

    const auto bg_opt = global.contains("background") ? global["background"].get<BackgroundOptions>()
                                                      : BackgroundOptions{};
    auto pf = global.contains("peaks") ? global["peaks"].get<PeakFitterConfig>() : PeakFitterConfig{};
    if (!resolution_path.empty()) pf.resolution = load_resolution_model(resolution_path);
    pf.verbose = pf.verbose || verbose;

    const Vector bg  = estimate_background(sp.energy, sp.counts, bg_opt);
    const Vector net = subtract_background(sp.counts, bg);

    std::vector<double> centers;
    for (const auto& c : find_peaks(sp.energy, net)) centers.push_back(c.energy);

    const PeakFitter fitter(pf);
    const PeakBatch batch = fitter.fit_peaks(sp.energy, net, centers);

    std::cout << centers.size() << " candidates, " << batch.peaks.size() << " fitted ("
              << to_string(pf.shape) << ")\n"
              << "   E [keV]   FWHM [eV]      height        area      R2\n";
    for (const auto& p : batch.peaks)
        std::cout << std::fixed << std::setprecision(3) << std::setw(10) << p.energy
                  << std::setprecision(1) << std::setw(12) << p.fwhm * 1000.0
                  << std::setw(12) << p.amplitude
                  << std::setw(12) << p.area
                  << std::setprecision(4) << std::setw(8) << p.r_squared << "\n";
    for (const auto& f : batch.failures)
        std::cout << "  skipped " << std::setprecision(3) << f.center << " keV: " << f.reason << "\n";

    const Vector fitted = reconstruct_spectrum(sp.energy, batch.peaks, bg);
    int n_params = 0;
    for (const auto& p : batch.peaks) n_params += static_cast<int>(p.params.size());
    const FitStatistics st = calculate_fit_statistics(sp.counts, fitted, n_params);
    std::cout << "chi2=" << std::setprecision(1) << st.chi_squared
              << "  reduced=" << std::setprecision(3) << st.reduced_chi_squared
              << "  R2=" << std::setprecision(4) << st.r_squared
              << "  dof=" << st.dof << "\n";
}

} // namespace

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("xrfcal", "XRF background, peak fitting and detector calibration");
        opts.add_options()
            ("fwhm", "FWHM calibration config JSON", cxxopts::value<std::string>())
            ("instrument", "Instrument calibration config JSON", cxxopts::value<std::string>())
            ("peaks", "Search and fit peaks in a two column spectrum", cxxopts::value<std::string>())
            ("resolution", "Resolution model JSON for --peaks", cxxopts::value<std::string>()->default_value(""))
            ("settings", "Global settings JSON (default: search xrfcal_settings.json)",
                cxxopts::value<std::string>()->default_value(""))
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("v,verbose", "Verbose output")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || (!cli.count("fwhm") && !cli.count("instrument") && !cli.count("peaks"))) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        const nlohmann::json global = load_global_settings(cli["settings"].as<std::string>());
        const bool verbose = cli.count("verbose") > 0 || global.value("verbose", false);

        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = global.value("threads", 0);
#ifdef _OPENMP
        if (nthreads > 0) omp_set_num_threads(nthreads);
#endif
        if (nthreads > 0) Eigen::setNbThreads(nthreads);

        std::optional<ResolutionModel> model;
        if (cli.count("fwhm"))
            model = run_fwhm_calibration(cli["fwhm"].as<std::string>(), global,
                                         static_cast<unsigned>(std::max(nthreads, 0)), verbose);
        if (cli.count("instrument"))
            run_instrument_calibration(cli["instrument"].as<std::string>(), global, model, verbose);
        if (cli.count("peaks"))
            run_peak_fit(cli["peaks"].as<std::string>(), global,
                         cli["resolution"].as<std::string>(), verbose);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time).count();

    int minutes = static_cast<int>(duration / 60);
    int seconds = static_cast<int>(duration % 60);

    std::cout << "\nTook: ";
    if (minutes > 0) std::cout << minutes << "m ";
    std::cout << seconds << "s\n";

    return 0;
}
