#include "xrfcal/PeakShapes.hpp"
#include "xrfcal/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace xrfcal {

using cplx = std::complex<double>;

std::complex<double> faddeeva(std::complex<double> z)
{
    const double x = z.real();
    const double y = z.imag();
    const cplx   t(y, -x);
    const double s = std::abs(x) + y;

    if (s >= 15.0) {
        return t * 0.5641896 / (0.5 + t * t);
    }
    if (s >= 5.5) {
        const cplx u = t * t;
        return t * (1.410474 + u * 0.5641896) / (0.75 + u * (3.0 + u));
    }
    if (y >= 0.195 * std::abs(x) - 0.176) {
        return (16.4955 + t * (20.20933 + t * (11.96482 + t * (3.778987 + t * 0.5642236))))
             / (16.4955 + t * (38.82363 + t * (39.27121 + t * (21.69274 + t * (6.699398 + t)))));
    }
    const cplx u = t * t;
    const cplx num = t * (36183.31 - u * (3321.9905 - u * (1540.787 - u * (219.0313
                   - u * (35.76683 - u * (1.320522 - u * 0.56419))))));
    const cplx den = 32066.6 - u * (24322.84 - u * (9022.228 - u * (2186.181
                   - u * (364.2191 - u * (61.57037 - u * (1.841439 - u))))));
    return std::exp(u) - num / den;
}

double voigt_fwhm(double sigma, double gamma)
{
    const double fg = FWHM_PER_SIGMA * sigma;
    const double fl = 2.0 * gamma;
    return 0.5346 * fl + std::sqrt(0.2166 * fl * fl + fg * fg);
}

Vector PeakShape::evaluate(const Vector& x, const Vector& p) const
{
    Vector y(x.size());
    for (Index i = 0; i < x.size(); ++i) y[i] = evaluate(x[i], p);
    return y;
}

namespace {

/* ------------------------------------------------------------------------ */

class GaussianShape final : public PeakShape {
public:
    ShapeKind kind() const override { return ShapeKind::Gaussian; }
    std::vector<std::string> parameter_names() const override
    { return {"amplitude", "center", "sigma"}; }

    double evaluate(double x, const Vector& p) const override
    { return gaussian(x, p[0], p[1], p[2]); }

    double area(const Vector& p) const override { return p[0] * p[2] * SQRT_2PI; }
    double fwhm(const Vector& p) const override { return FWHM_PER_SIGMA * p[2]; }
};

class LorentzianShape final : public PeakShape {
public:
    ShapeKind kind() const override { return ShapeKind::Lorentzian; }
    std::vector<std::string> parameter_names() const override
    { return {"amplitude", "center", "gamma"}; }

    double evaluate(double x, const Vector& p) const override
    { return lorentzian(x, p[0], p[1], p[2]); }

    double area(const Vector& p) const override { return M_PI * p[0] * p[2]; }
    double fwhm(const Vector& p) const override { return 2.0 * p[2]; }
    double width_for_fwhm(double fwhm) const override { return 0.5 * fwhm; }
};

/*  Height normalised Voigt:  amp · Re w(z) / Re w(iγ/(σ√2)),
 *  z = (x − c + iγ)/(σ√2).  Peak value equals amp at x = c.            */
class VoigtShape final : public PeakShape {
public:
    ShapeKind kind() const override { return ShapeKind::Voigt; }
    std::vector<std::string> parameter_names() const override
    { return {"amplitude", "center", "sigma", "gamma"}; }

    double evaluate(double x, const Vector& p) const override
    {
        const double s2 = p[2] * M_SQRT2;
        const double peak = faddeeva(cplx(0.0, p[3] / s2)).real();
        return p[0] * faddeeva(cplx((x - p[1]) / s2, p[3] / s2)).real() / peak;
    }

    double area(const Vector& p) const override
    {
        const double peak = faddeeva(cplx(0.0, p[3] / (p[2] * M_SQRT2))).real();
        return p[0] * p[2] * SQRT_2PI / peak;
    }

    double fwhm(const Vector& p) const override { return voigt_fwhm(p[2], p[3]); }

    Vector initial_extras(double width) const override
    {
        Vector e(1);
        e << 0.15 * width;
        return e;
    }

    void extra_bounds(double width, std::vector<double>& lo, std::vector<double>& hi) const override
    {
        lo.push_back(0.001);
        hi.push_back(2.0 * width);
    }
};

/*  (1−η)·G + η·L with both components sharing the FWHM 2.3548σ.          */
class PseudoVoigtShape final : public PeakShape {
public:
    ShapeKind kind() const override { return ShapeKind::PseudoVoigt; }
    std::vector<std::string> parameter_names() const override
    { return {"amplitude", "center", "sigma", "eta"}; }

    double evaluate(double x, const Vector& p) const override
    {
        const double hwhm = 0.5 * FWHM_PER_SIGMA * p[2];
        return p[0] * ((1.0 - p[3]) * gaussian(x, 1.0, p[1], p[2])
                       + p[3] * lorentzian(x, 1.0, p[1], hwhm));
    }

    double area(const Vector& p) const override
    {
        const double hwhm = 0.5 * FWHM_PER_SIGMA * p[2];
        return p[0] * ((1.0 - p[3]) * p[2] * SQRT_2PI + p[3] * M_PI * hwhm);
    }

    double fwhm(const Vector& p) const override { return FWHM_PER_SIGMA * p[2]; }

    Vector initial_extras(double) const override
    {
        Vector e(1);
        e << 0.3;
        return e;
    }

    void extra_bounds(double, std::vector<double>& lo, std::vector<double>& hi) const override
    {
        lo.push_back(0.0);
        hi.push_back(1.0);
    }
};

/*  Gaussian plus a low energy exponential tail amp·T·exp(S·(x − c)), x < c. */
class HypermetShape final : public PeakShape {
public:
    ShapeKind kind() const override { return ShapeKind::Hypermet; }
    std::vector<std::string> parameter_names() const override
    { return {"amplitude", "center", "sigma", "tail_amplitude", "tail_slope"}; }

    double evaluate(double x, const Vector& p) const override
    {
        double v = gaussian(x, p[0], p[1], p[2]);
        if (x < p[1]) v += p[0] * p[3] * std::exp(p[4] * (x - p[1]));
        return v;
    }

    double area(const Vector& p) const override
    { return p[0] * (p[2] * SQRT_2PI + p[3] / p[4]); }

    double fwhm(const Vector& p) const override { return FWHM_PER_SIGMA * p[2]; }

    Vector initial_extras(double) const override
    {
        Vector e(2);
        e << 0.1, 2.0;
        return e;
    }

    void extra_bounds(double, std::vector<double>& lo, std::vector<double>& hi) const override
    {
        lo.push_back(0.0);  hi.push_back(0.5);
        lo.push_back(0.5);  hi.push_back(10.0);
    }
};

/*  (1−f)·G(c, σ) + f·G(c − σ/2, σ_t).                                     */
class TailGaussianShape final : public PeakShape {
public:
    ShapeKind kind() const override { return ShapeKind::TailGaussian; }
    std::vector<std::string> parameter_names() const override
    { return {"amplitude", "center", "sigma", "tail_fraction", "tail_sigma"}; }

    double evaluate(double x, const Vector& p) const override
    {
        return (1.0 - p[3]) * gaussian(x, p[0], p[1], p[2])
             + p[3] * gaussian(x, p[0], p[1] - 0.5 * p[2], p[4]);
    }

    double area(const Vector& p) const override
    { return p[0] * SQRT_2PI * ((1.0 - p[3]) * p[2] + p[3] * p[4]); }

    double fwhm(const Vector& p) const override { return FWHM_PER_SIGMA * p[2]; }

    Vector initial_extras(double width) const override
    {
        Vector e(2);
        e << 0.15, 3.0 * width;
        return e;
    }

    void extra_bounds(double width, std::vector<double>& lo, std::vector<double>& hi) const override
    {
        lo.push_back(0.0);    hi.push_back(0.5);
        lo.push_back(width);  hi.push_back(10.0 * width);
    }
};

} // namespace

const PeakShape& peak_shape(ShapeKind kind)
{
    static const GaussianShape     gauss;
    static const LorentzianShape   lorentz;
    static const VoigtShape        voigt;
    static const PseudoVoigtShape  pvoigt;
    static const HypermetShape     hypermet;
    static const TailGaussianShape tail;

    switch (kind) {
        case ShapeKind::Gaussian:     return gauss;
        case ShapeKind::Lorentzian:   return lorentz;
        case ShapeKind::Voigt:        return voigt;
        case ShapeKind::PseudoVoigt:  return pvoigt;
        case ShapeKind::Hypermet:     return hypermet;
        case ShapeKind::TailGaussian: return tail;
    }
    throw ConfigurationError("Unknown peak shape kind");
}

ShapeKind parse_shape_kind(const std::string& name)
{
    std::string key;
    for (char c : name)
        key.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (key == "gaussian")                              return ShapeKind::Gaussian;
    if (key == "lorentzian")                            return ShapeKind::Lorentzian;
    if (key == "voigt")                                 return ShapeKind::Voigt;
    if (key == "pseudo_voigt" || key == "pseudovoigt")  return ShapeKind::PseudoVoigt;
    if (key == "hypermet")                              return ShapeKind::Hypermet;
    if (key == "tail_gaussian")                         return ShapeKind::TailGaussian;
    throw ConfigurationError("Unknown peak shape: " + name);
}

std::string to_string(ShapeKind kind)
{
    switch (kind) {
        case ShapeKind::Gaussian:     return "gaussian";
        case ShapeKind::Lorentzian:   return "lorentzian";
        case ShapeKind::Voigt:        return "voigt";
        case ShapeKind::PseudoVoigt:  return "pseudo_voigt";
        case ShapeKind::Hypermet:     return "hypermet";
        case ShapeKind::TailGaussian: return "tail_gaussian";
    }
    return "gaussian";
}

} // namespace xrfcal
