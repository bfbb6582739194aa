#include "xrfcal/LineIntensitySource.hpp"
#include "xrfcal/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace xrfcal {

namespace {

std::vector<std::string> split_csv(const std::string& line)
{
    std::vector<std::string> out;
    std::string cell;
    std::istringstream ss(line);
    while (std::getline(ss, cell, ',')) {
        const auto b = cell.find_first_not_of(" \t\r\"");
        const auto e = cell.find_last_not_of(" \t\r\"");
        out.push_back(b == std::string::npos ? std::string() : cell.substr(b, e - b + 1));
    }
    return out;
}

} // namespace

std::map<std::string, double> load_reference_concentrations(const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw ConfigurationError("Cannot open concentration table " + path);

    std::string line;
    if (!std::getline(in, line)) throw ConfigurationError("Empty concentration table " + path);

    const auto header = split_csv(line);
    const auto col = [&](const std::string& name) {
        const auto it = std::find(header.begin(), header.end(), name);
        if (it == header.end())
            throw ConfigurationError("Concentration table " + path + " lacks column " + name);
        return static_cast<std::size_t>(it - header.begin());
    };
    const std::size_t c_sym  = col("Symbol");
    const std::size_t c_conc = col("Concentration_mg_kg");

    std::map<std::string, double> out;
    while (std::getline(in, line)) {
        const auto cells = split_csv(line);
        if (cells.size() <= std::max(c_sym, c_conc) || cells[c_conc].empty()) continue;
        double v = 0.0;
        try {
            v = std::stod(cells[c_conc]);
        } catch (const std::exception&) {
            continue;                       // "n/a" style entries
        }
        if (std::isfinite(v) && v > 0.0) out[cells[c_sym]] = v;
    }
    return out;
}

IntensitySourceKind parse_intensity_source_kind(const std::string& name)
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "measured")                 return IntensitySourceKind::Measured;
    if (key == "predicted" || key == "fp") return IntensitySourceKind::Predicted;
    throw ConfigurationError("Unknown intensity source: " + name);
}

std::string to_string(IntensitySourceKind kind)
{
    return kind == IntensitySourceKind::Measured ? "measured" : "predicted";
}

/* ------------------------------ measured --------------------------------- */

MeasuredLineIntensities::MeasuredLineIntensities(std::shared_ptr<const LineDatabase> db,
                                                 MeasuredLineOptions                 opt)
    : db_(std::move(db))
    , opt_(std::move(opt))
{
    if (!db_) throw ConfigurationError("Measured line intensities need a line database");
}

std::vector<ElementLine>
MeasuredLineIntensities::expected_lines(const StandardSample&     sample,
                                        const DetectorParameters& resolution) const
{
    sample.spectrum.validate();
    const Vector& e = sample.spectrum.energy;
    const Vector  bg  = estimate_background(e, sample.spectrum.counts, opt_.background);
    const Vector  net = subtract_background(sample.spectrum.counts, bg);

    Vector res(2);
    res << resolution.fwhm_0, resolution.epsilon;

    std::vector<ElementLine> out;
    for (const auto& [element, ppm] : sample.concentrations_ppm) {
        if (ppm < opt_.min_concentration_ppm) continue;

        for (const auto& [series, lines] : db_->get_lines(element)) {
            for (const auto& l : lines) {
                if (l.energy >= sample.excitation_energy || !is_major_line(l.name)) continue;

                const double half = opt_.window_fwhm
                    * evaluate_resolution(ResolutionModelKind::Detector, l.energy, res);
                double peak = -1.0;
                for (Index i = 0; i < e.size(); ++i)
                    if (std::abs(e[i] - l.energy) < half) peak = std::max(peak, net[i]);

                if (peak > opt_.min_counts)
                    out.push_back({element, l.name, l.energy, peak});
            }
        }
    }
    return out;
}

/* ------------------------------ predicted -------------------------------- */

PredictedLineIntensities::PredictedLineIntensities(std::shared_ptr<const IntensityPredictor> p)
    : predictor_(std::move(p))
{
    if (!predictor_)
        throw ConfigurationError("Predicted line intensities requested without an intensity predictor");
}

std::vector<ElementLine>
PredictedLineIntensities::expected_lines(const StandardSample& sample,
                                         const DetectorParameters&) const
{
    Composition comp;
    double total = 0.0;
    for (const auto& [element, ppm] : sample.concentrations_ppm) {
        if (!(ppm > 0.0)) continue;
        comp[element] = ppm / 1e6;
        total += ppm / 1e6;
    }
    if (total > 0.0)
        for (auto& [element, w] : comp) w /= total;

    const PredictedIntensities pred =
        predictor_->predict_intensities(comp, sample.excitation_energy, sample.geometry);

    std::vector<ElementLine> out;
    for (const auto& [element, lines] : pred) {
        for (const auto& [name, pl] : lines) {
            if (pl.energy >= sample.excitation_energy) continue;
            if (!std::isfinite(pl.relative_rate) || pl.relative_rate <= 0.0) continue;
            out.push_back({element, name, pl.energy, pl.relative_rate});
        }
    }
    return out;
}

std::shared_ptr<const LineIntensitySource>
make_line_source(IntensitySourceKind                       kind,
                 std::shared_ptr<const LineDatabase>       db,
                 std::shared_ptr<const IntensityPredictor> predictor,
                 const MeasuredLineOptions&                opt)
{
    if (kind == IntensitySourceKind::Predicted)
        return std::make_shared<PredictedLineIntensities>(std::move(predictor));
    return std::make_shared<MeasuredLineIntensities>(std::move(db), opt);
}

} // namespace xrfcal
