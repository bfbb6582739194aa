#pragma once
#include "Types.hpp"
#include <cmath>
#include <complex>
#include <string>
#include <vector>

namespace xrfcal {

constexpr double FWHM_PER_SIGMA = 2.3548200450309493;   // 2·sqrt(2 ln 2)
constexpr double SQRT_2PI       = 2.5066282746310002;

enum class ShapeKind { Gaussian, Lorentzian, Voigt, PseudoVoigt, Hypermet, TailGaussian };

/* "gaussian", "lorentzian", "voigt", "pseudo_voigt", "hypermet",
 * "tail_gaussian" (any case, '-' accepted for '_').                       */
ShapeKind   parse_shape_kind(const std::string& name);
std::string to_string(ShapeKind kind);

/*  Faddeeva function w(z) = exp(-z²)·erfc(-iz) for Im z ≥ 0
 *  (Humlicek 1982, four region rational approximation, |rel err| < 1e-4). */
std::complex<double> faddeeva(std::complex<double> z);

/*
 *  A peak profile with parameter layout
 *      p[0] = amplitude (peak height of the main component)
 *      p[1] = center (keV)
 *      p[2] = width (σ, or the half width γ for the Lorentzian)
 *      p[3..] shape specific extras
 */
class PeakShape {
public:
    virtual ~PeakShape() = default;

    virtual ShapeKind kind() const = 0;
    virtual std::vector<std::string> parameter_names() const = 0;
    int n_params() const { return static_cast<int>(parameter_names().size()); }

    virtual double evaluate(double x, const Vector& p) const = 0;
    Vector evaluate(const Vector& x, const Vector& p) const;

    virtual double area(const Vector& p) const = 0;
    virtual double fwhm(const Vector& p) const = 0;

    // width parameter that corresponds to a target FWHM
    virtual double width_for_fwhm(double fwhm) const { return fwhm / FWHM_PER_SIGMA; }

    // start values and bounds for p[3..], given the width guess
    virtual Vector initial_extras(double /*width*/) const { return Vector(); }
    virtual void extra_bounds(double /*width*/,
                              std::vector<double>& /*lower*/,
                              std::vector<double>& /*upper*/) const {}
};

/*  Registry lookup; the returned shapes are stateless singletons.        */
const PeakShape& peak_shape(ShapeKind kind);

/* convenience profiles ------------------------------------------------------ */

inline double gaussian(double x, double amplitude, double center, double sigma)
{
    const double d = (x - center) / sigma;
    return amplitude * std::exp(-0.5 * d * d);
}

inline double lorentzian(double x, double amplitude, double center, double gamma)
{
    const double d = x - center;
    return amplitude * gamma * gamma / (d * d + gamma * gamma);
}

/*  Olivero & Longbothum (1977) Voigt FWHM, accurate to 0.02 %.          */
double voigt_fwhm(double sigma, double gamma);

} // namespace xrfcal
