#pragma once
#include "Background.hpp"
#include "LineDatabase.hpp"
#include "ResolutionModel.hpp"
#include "Spectrum.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace xrfcal {

/*  Reference standard of known composition. */
struct StandardSample {
    Spectrum                      spectrum;
    std::map<std::string, double> concentrations_ppm;
    double                        excitation_energy = 50.0;   // keV
    Geometry                      geometry;
};

/*  CSV with a header naming "Symbol" and "Concentration_mg_kg" columns;
 *  rows with empty or non-positive concentration are skipped.            */
std::map<std::string, double> load_reference_concentrations(const std::string& path);

enum class IntensitySourceKind { Measured, Predicted };

// "measured", "predicted" or "fp"
IntensitySourceKind parse_intensity_source_kind(const std::string& name);
std::string         to_string(IntensitySourceKind kind);

/*  Where the expected line intensities of a standard come from. */
class LineIntensitySource {
public:
    virtual ~LineIntensitySource() = default;

    virtual IntensitySourceKind kind() const = 0;

    virtual std::vector<ElementLine> expected_lines(const StandardSample&     sample,
                                                    const DetectorParameters& resolution) const = 0;
};

struct MeasuredLineOptions {
    double min_concentration_ppm = 100.0;
    double window_fwhm           = 2.0;     // ± FWHM multiples
    double min_counts            = 20.0;
    BackgroundOptions background;           // SNIP by default
};

/*  Background subtracted local maximum at every major line of every
 *  element above the concentration threshold and below the excitation
 *  energy.                                                                */
class MeasuredLineIntensities final : public LineIntensitySource {
public:
    explicit MeasuredLineIntensities(std::shared_ptr<const LineDatabase> db,
                                     MeasuredLineOptions                 opt = {});

    IntensitySourceKind kind() const override { return IntensitySourceKind::Measured; }

    std::vector<ElementLine> expected_lines(const StandardSample&     sample,
                                            const DetectorParameters& resolution) const override;

private:
    std::shared_ptr<const LineDatabase> db_;
    MeasuredLineOptions                 opt_;
};

/*  Delegates to a fundamental parameters predictor; the composition is
 *  handed over as normalised mass fractions.                              */
class PredictedLineIntensities final : public LineIntensitySource {
public:
    // throws ConfigurationError when predictor is null
    explicit PredictedLineIntensities(std::shared_ptr<const IntensityPredictor> predictor);

    IntensitySourceKind kind() const override { return IntensitySourceKind::Predicted; }

    std::vector<ElementLine> expected_lines(const StandardSample&     sample,
                                            const DetectorParameters& resolution) const override;

private:
    std::shared_ptr<const IntensityPredictor> predictor_;
};

/*  Factory used by configuration code.  Predicted without a predictor, or
 *  measured without a line database, is a ConfigurationError.            */
std::shared_ptr<const LineIntensitySource>
make_line_source(IntensitySourceKind                        kind,
                 std::shared_ptr<const LineDatabase>        db,
                 std::shared_ptr<const IntensityPredictor>  predictor,
                 const MeasuredLineOptions&                 opt = {});

} // namespace xrfcal
