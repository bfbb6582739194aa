#pragma once
#include "Types.hpp"
#include "LineDatabase.hpp"
#include "ResolutionModel.hpp"
#include "Spectrum.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace xrfcal {

/*  Relative detector efficiency a + b·E + c·E², clipped to [0.1, 1.5]. */
struct EfficiencyCurve {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;

    double operator()(double energy) const;
};

struct TubeLine {
    std::string name;
    double      energy    = 0.0;        // keV
    double      intensity = 1.0;        // relative
};

/*  Scattered tube radiation: a Rayleigh peak at E and a Compton peak at
 *  E' = E / (1 + E/511·(1 − cos θ)) for every tube line.                 */
struct ScatterOptions {
    std::vector<TubeLine> tube_lines;
    double scatter_angle = 90.0;        // degrees
    double compton_ratio = 1.0;         // Compton height relative to Rayleigh
};

/*  Incomplete charge collection: every line of height h gains
 *  h·amplitude·exp(slope·(E − E0)/σ) below its center E0.               */
struct LineTail {
    double amplitude = 0.0;             // relative to the peak height
    double slope     = 2.0;             // per σ of the line
};

struct SynthesisParameters {
    DetectorParameters resolution;
    double             intensity_scale = 1.0;
    double             scatter_scale   = 0.0;
    EfficiencyCurve    efficiency;
    LineTail           tail;
    std::map<std::string, double> element_scales;   // absent elements scale by 1
};

// Compton scattered energy, E and result in keV, θ in degrees
double compton_energy(double energy, double theta_deg);

/*  Σ lines  I·scale·s_el·eff(E)·G(E, FWHM(E))  plus the scatter peaks.
 *  Every Gaussian has peak height equal to its weighted intensity and
 *  FWHM from the detector form of the resolution.  Element lines carry
 *  the low energy tail when its amplitude is non-zero.                    */
Vector synthesize(const Vector&                   energy,
                  const std::vector<ElementLine>& lines,
                  const SynthesisParameters&      params,
                  const ScatterOptions&           scatter = {});

/* mock reference spectra ----------------------------------------------------- */

struct MockSpectrumOptions {
    double        continuum_level = 20.0;     // counts at 0 keV
    double        continuum_slope = -0.5;     // counts per keV, floored at 1
    bool          poisson_noise   = true;
    std::uint32_t seed            = 42;
};

/*  synthesize() on top of a linear continuum, optionally Poisson sampled. */
Spectrum make_mock_spectrum(const Vector&                   energy,
                            const std::vector<ElementLine>& lines,
                            const SynthesisParameters&      params,
                            const MockSpectrumOptions&      opt = {},
                            const ScatterOptions&           scatter = {});

} // namespace xrfcal
