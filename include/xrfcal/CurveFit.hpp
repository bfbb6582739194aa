#pragma once
#include "SimpleLM.hpp"
#include <functional>

namespace xrfcal {

/*  y_model = f(x; p), evaluated for the whole abscissa at once. */
using CurveModel = std::function<Vector(const Vector& x, const Vector& p)>;

struct CurveFitResult {
    Vector params;
    Vector errors;                       // 1-σ from the covariance; 0 = frozen
    std::vector<bool> at_lower_bound;
    std::vector<bool> at_upper_bound;
    Vector fitted;                       // model at params
    double chi2       = 0.0;
    int    iterations = 0;
    bool   converged  = false;
};

/*
 *  Weighted residual functor with a bound-aware finite difference Jacobian:
 *  forward differences at the lower bound, backward at the upper bound,
 *  centred differences elsewhere.
 */
class CurveFitFunctor {
public:
    CurveFitFunctor(const CurveModel&          model,
                    const Vector&              x,
                    const Vector&              y,
                    const Vector&              sigma,
                    const std::vector<double>& lower,
                    const std::vector<double>& upper);

    void operator()(const Vector& p, Vector* residuals, Matrix* jacobian) const;

private:
    Vector residuals_at(const Vector& p) const;

    const CurveModel&          model_;
    const Vector&              x_;
    const Vector&              y_;
    Vector                     inv_sigma_;
    const std::vector<double>& lower_;
    const std::vector<double>& upper_;
};

/*
 *  Bounded nonlinear least squares  min Σ ((f(x;p) - y)/σ)².
 *  An empty sigma means unit weights, empty bounds mean unbounded, and an
 *  empty free_mask means all parameters are free.  p0 is clamped into the
 *  box.  Throws ConfigurationError for inconsistent sizes and
 *  FitDivergenceError when the model is non-finite at p0 or at the result.
 */
CurveFitResult curve_fit(const CurveModel&          model,
                         const Vector&              x,
                         const Vector&              y,
                         const Vector&              p0,
                         const std::vector<double>& lower,
                         const std::vector<double>& upper,
                         const Vector&              sigma     = Vector(),
                         const std::vector<bool>&   free_mask = {},
                         const LMSolverOptions&     options   = {});

} // namespace xrfcal
