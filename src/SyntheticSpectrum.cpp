#include "xrfcal/SyntheticSpectrum.hpp"
#include "xrfcal/PeakShapes.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace xrfcal {

namespace {

constexpr double ELECTRON_REST_KEV = 511.0;
constexpr double GAUSS_REACH       = 8.0;     // σ
constexpr double TAIL_REACH        = 20.0;    // decay lengths σ/slope

/*  Adds one height-normalised Gaussian, touching only channels within
 *  GAUSS_REACH σ of the center (energy is sorted).                        */
void add_gaussian(const Vector& energy, Vector& out, double height, double center, double fwhm)
{
    if (height == 0.0 || !(fwhm > 0.0)) return;
    const double sigma = fwhm / FWHM_PER_SIGMA;
    const double* b = energy.data();
    const double* e = b + energy.size();
    const Index i0 = std::lower_bound(b, e, center - GAUSS_REACH * sigma) - b;
    const Index i1 = std::upper_bound(b, e, center + GAUSS_REACH * sigma) - b;
    for (Index i = i0; i < i1; ++i)
        out[i] += gaussian(energy[i], height, center, sigma);
}

/*  Exponential tail below the center, cut after TAIL_REACH decay lengths. */
void add_tail(const Vector& energy, Vector& out, double height, double center, double fwhm,
              const LineTail& tail)
{
    if (height == 0.0 || tail.amplitude == 0.0 || !(fwhm > 0.0) || !(tail.slope > 0.0)) return;
    const double sigma = fwhm / FWHM_PER_SIGMA;
    const double* b = energy.data();
    const double* e = b + energy.size();
    const Index i0 = std::lower_bound(b, e, center - TAIL_REACH * sigma / tail.slope) - b;
    const Index i1 = std::lower_bound(b, e, center) - b;
    for (Index i = i0; i < i1; ++i)
        out[i] += height * tail.amplitude * std::exp(tail.slope * (energy[i] - center) / sigma);
}

} // namespace

double EfficiencyCurve::operator()(double energy) const
{
    return std::clamp(a + b * energy + c * energy * energy, 0.1, 1.5);
}

double compton_energy(double energy, double theta_deg)
{
    const double theta = theta_deg * M_PI / 180.0;
    return energy / (1.0 + energy / ELECTRON_REST_KEV * (1.0 - std::cos(theta)));
}

Vector synthesize(const Vector&                   energy,
                  const std::vector<ElementLine>& lines,
                  const SynthesisParameters&      p,
                  const ScatterOptions&           scatter)
{
    Vector out = Vector::Zero(energy.size());

    Vector res(2);
    res << p.resolution.fwhm_0, p.resolution.epsilon;
    const auto fwhm_at = [&res](double e) {
        return evaluate_resolution(ResolutionModelKind::Detector, e, res);
    };

    for (const auto& l : lines) {
        const auto   it = p.element_scales.find(l.element);
        const double s  = it == p.element_scales.end() ? 1.0 : it->second;
        const double h  = l.intensity * p.intensity_scale * s * p.efficiency(l.energy);
        add_gaussian(energy, out, h, l.energy, fwhm_at(l.energy));
        add_tail(energy, out, h, l.energy, fwhm_at(l.energy), p.tail);
    }

    if (p.scatter_scale != 0.0) {
        for (const auto& t : scatter.tube_lines) {
            const double h  = t.intensity * p.scatter_scale;
            const double ec = compton_energy(t.energy, scatter.scatter_angle);
            add_gaussian(energy, out, h * p.efficiency(t.energy), t.energy, fwhm_at(t.energy));
            add_gaussian(energy, out, h * scatter.compton_ratio * p.efficiency(ec), ec, fwhm_at(ec));
        }
    }
    return out;
}

Spectrum make_mock_spectrum(const Vector&                   energy,
                            const std::vector<ElementLine>& lines,
                            const SynthesisParameters&      params,
                            const MockSpectrumOptions&      opt,
                            const ScatterOptions&           scatter)
{
    Spectrum sp;
    sp.energy = energy;

    const Vector peaks = synthesize(energy, lines, params, scatter);
    Vector expected(energy.size());
    for (Index i = 0; i < energy.size(); ++i)
        expected[i] = std::max(1.0, opt.continuum_level + opt.continuum_slope * energy[i])
                    + std::max(0.0, peaks[i]);

    if (!opt.poisson_noise) {
        sp.counts = expected;
        return sp;
    }

    std::mt19937 rng(opt.seed);
    sp.counts.resize(energy.size());
    for (Index i = 0; i < energy.size(); ++i) {
        std::poisson_distribution<long> dist(expected[i]);
        sp.counts[i] = static_cast<double>(dist(rng));
    }
    return sp;
}

} // namespace xrfcal
