#include "xrfcal/CurveFit.hpp"
#include "xrfcal/Errors.hpp"
#include <cmath>
#include <string>

namespace xrfcal {

CurveFitFunctor::CurveFitFunctor(const CurveModel&          model,
                                 const Vector&              x,
                                 const Vector&              y,
                                 const Vector&              sigma,
                                 const std::vector<double>& lower,
                                 const std::vector<double>& upper)
    : model_(model)
    , x_(x)
    , y_(y)
    , lower_(lower)
    , upper_(upper)
{
    inv_sigma_ = Vector::Ones(y.size());
    if (sigma.size() == y.size()) {
        for (Index i = 0; i < y.size(); ++i)
            inv_sigma_[i] = sigma[i] > 0.0 ? 1.0 / sigma[i] : 1.0;
    }
}

Vector CurveFitFunctor::residuals_at(const Vector& p) const
{
    const Vector model = model_(x_, p);
    return (model - y_).cwiseProduct(inv_sigma_);
}

void CurveFitFunctor::operator()(const Vector& p,
                                 Vector*       residuals,
                                 Matrix*       jacobian) const
{
    const Vector r0 = residuals_at(p);
    if (residuals) *residuals = r0;
    if (!jacobian) return;

    const Index m = r0.size();
    const Index n = p.size();
    jacobian->resize(m, n);

    const double eps = 1e-7;
    for (Index j = 0; j < n; ++j) {
        const double h = eps * std::max(1.0, std::abs(p[j]));

        const bool blocked_up   = !upper_.empty() && p[j] + h > upper_[j];
        const bool blocked_down = !lower_.empty() && p[j] - h < lower_[j];

        Vector p_plus  = p;
        Vector p_minus = p;

        if (blocked_up && !blocked_down) {
            p_minus[j] -= h;
            jacobian->col(j) = (r0 - residuals_at(p_minus)) / h;
        } else if (blocked_down && !blocked_up) {
            p_plus[j] += h;
            jacobian->col(j) = (residuals_at(p_plus) - r0) / h;
        } else {
            p_plus[j]  += h;
            p_minus[j] -= h;
            jacobian->col(j) =
                (residuals_at(p_plus) - residuals_at(p_minus)) / (2.0 * h);
        }
    }
}

CurveFitResult curve_fit(const CurveModel&          model,
                         const Vector&              x,
                         const Vector&              y,
                         const Vector&              p0,
                         const std::vector<double>& lower,
                         const std::vector<double>& upper,
                         const Vector&              sigma,
                         const std::vector<bool>&   free_mask,
                         const LMSolverOptions&     options)
{
    const std::size_t n = static_cast<std::size_t>(p0.size());
    if (x.size() != y.size())
        throw ConfigurationError("curve_fit: x and y differ in length");
    if ((!lower.empty() && lower.size() != n) ||
        (!upper.empty() && upper.size() != n) ||
        (!free_mask.empty() && free_mask.size() != n))
        throw ConfigurationError("curve_fit: bounds or mask do not match the parameter count");
    for (std::size_t j = 0; j < n && !lower.empty() && !upper.empty(); ++j) {
        if (lower[j] > upper[j])
            throw ConfigurationError("curve_fit: lower bound above upper bound for parameter "
                                     + std::to_string(j));
    }

    CurveFitResult res;
    res.params = p0;
    for (std::size_t j = 0; j < n; ++j) {
        if (!lower.empty()) res.params[j] = std::max(res.params[j], lower[j]);
        if (!upper.empty()) res.params[j] = std::min(res.params[j], upper[j]);
    }

    CurveFitFunctor func(model, x, y, sigma, lower, upper);
    const LMSolverSummary summ =
        levenberg_marquardt(func, res.params, free_mask, lower, upper, options);

    if (summ.diverged || !res.params.allFinite() || !std::isfinite(summ.final_chi2))
        throw FitDivergenceError("curve_fit: non-finite model or parameters");

    res.chi2       = summ.final_chi2;
    res.iterations = summ.iterations;
    res.converged  = summ.converged;
    res.errors     = Eigen::Map<const Vector>(summ.param_uncertainties.data(),
                                              static_cast<Index>(n));
    res.fitted     = model(x, res.params);

    res.at_lower_bound.assign(n, false);
    res.at_upper_bound.assign(n, false);
    for (std::size_t j = 0; j < n; ++j) {
        if (!lower.empty())
            res.at_lower_bound[j] =
                std::abs(res.params[j] - lower[j]) <= 1e-9 * std::max(1.0, std::abs(lower[j]));
        if (!upper.empty())
            res.at_upper_bound[j] =
                std::abs(res.params[j] - upper[j]) <= 1e-9 * std::max(1.0, std::abs(upper[j]));
    }
    return res;
}

} // namespace xrfcal
