#pragma once
#include "Types.hpp"
#include <vector>
#include <iostream>
#include <limits>
#include <cmath>
#include <algorithm>
#include <functional>
#include <utility>

namespace xrfcal {

/* ---------------------------  user visible bits  --------------------------- */

struct PowellSolverOptions {
    int    max_iterations        = 200;
    int    max_function_evals    = 20000;
    double relative_tolerance    = 1e-8;
    double absolute_tolerance    = 1e-12;
    double line_tolerance        = 1e-6;    // bracket width relative to the step
    bool   verbose               = false;
};

struct PowellSolverSummary {
    int    iterations         = 0;
    int    function_evals     = 0;
    double initial_value      = 0.0;
    double final_value        = 0.0;
    bool   converged          = false;
    bool   cancelled          = false;
};

/* ------------------------  internal helper functions  ----------------------- */

namespace detail {

/*  Range of t for which  p + t·dir  stays inside [lo, hi].                    */
inline std::pair<double, double> step_range(const Vector& p,
                                            const Vector& dir,
                                            const Vector& lo,
                                            const Vector& hi)
{
    double t_min = -std::numeric_limits<double>::infinity();
    double t_max =  std::numeric_limits<double>::infinity();
    for (Index i = 0; i < p.size(); ++i) {
        if (std::abs(dir[i]) <= std::numeric_limits<double>::epsilon()) continue;
        const double a = (lo[i] - p[i]) / dir[i];
        const double b = (hi[i] - p[i]) / dir[i];
        t_min = std::max(t_min, std::min(a, b));
        t_max = std::min(t_max, std::max(a, b));
    }
    return {t_min, t_max};
}

/*
 *  One dimensional minimisation of phi(t) = f(p + t·dir) restricted to the
 *  feasible step range.  A bracket is grown from the initial step by golden
 *  ratio expansion and then shrunk by golden section search.
 *  Returns (t_best, f_best); t_best == 0 means no improvement was found.
 */
template<typename Phi>
std::pair<double, double> line_minimize(Phi&&    phi,
                                        double   step,
                                        double   f0,
                                        double   t_min,
                                        double   t_max,
                                        double   rel_tol,
                                        int&     nfe,
                                        int      max_nfe)
{
    constexpr double gold  = 1.618033988749895;
    constexpr double cgold = 0.3819660112501051;

    if (!(t_min < t_max) || step == 0.0) return {0.0, f0};
    auto clampt = [&](double t) { return std::clamp(t, t_min, t_max); };
    auto eval = [&](double t) {
        if (t == 0.0) return f0;
        ++nfe;
        const double v = phi(t);
        return std::isfinite(v) ? v : std::numeric_limits<double>::infinity();
    };

    double lo, hi, x, fx;

    const double t1 = clampt(step);
    const double f1 = eval(t1);
    double t2 = 0.0, f2 = f0;
    if (!(f1 < f0)) {
        t2 = clampt(-step);
        f2 = eval(t2);
    }

    if (!(f1 < f0) && !(f2 < f0)) {
        // both trial points are uphill: the minimum is bracketed around 0
        lo = std::min(t1, t2);
        hi = std::max(t1, t2);
        x  = 0.0;
        fx = f0;
    } else {
        /* ---- downhill: grow the step until the function rises ---------- */
        double prev = 0.0;
        double cur  = (f1 < f0) ? t1 : t2;
        double fcur = (f1 < f0) ? f1 : f2;
        double next = cur;
        for (;;) {
            if (nfe >= max_nfe) return {cur, fcur};
            next = clampt(cur + gold * (cur - prev));
            if (next == cur) return {cur, fcur};        // stopped by a bound
            const double fn = eval(next);
            if (fn < fcur) {
                prev = cur;
                cur  = next;
                fcur = fn;
                continue;
            }
            break;
        }
        lo = std::min(prev, next);
        hi = std::max(prev, next);
        x  = cur;
        fx = fcur;
    }

    /* ---- golden section inside [lo, hi] -------------------------------- */
    const double scale = std::max(std::abs(x), std::abs(step));
    while (nfe < max_nfe && (hi - lo) > rel_tol * scale) {
        const bool right = (hi - x) > (x - lo);
        const double u  = right ? x + cgold * (hi - x) : x - cgold * (x - lo);
        const double fu = eval(u);
        if (fu < fx) {
            if (right) lo = x; else hi = x;
            x  = u;
            fx = fu;
        } else {
            if (right) hi = u; else lo = u;
        }
    }
    if (fx < f0) return {x, fx};
    return {0.0, f0};
}

} // namespace detail

/* -------------------  Powell's method driver routine  ---------------------- */
/*
 *  Derivative free minimisation of a scalar objective inside the box
 *  [lower, upper].  callback(iteration, x, f) runs once per sweep; returning
 *  false stops the search and flags the summary as cancelled.
 */
template<typename Objective>
PowellSolverSummary
powell(Objective&&                                               func,
       Vector&                                                   x,
       const Vector&                                             lower,
       const Vector&                                             upper,
       const PowellSolverOptions&                                opt = {},
       const std::function<bool(int, const Vector&, double)>&    callback = {})
{
    PowellSolverSummary summ;
    const Index n = x.size();

    for (Index i = 0; i < n; ++i)
        x[i] = std::clamp(x[i], lower[i], upper[i]);

    double fx = func(x);
    summ.function_evals = 1;
    summ.initial_value  = fx;

    // coordinate directions, each with its own trial step
    std::vector<Vector> dirs;
    std::vector<double> steps;
    for (Index i = 0; i < n; ++i) {
        Vector d = Vector::Zero(n);
        d[i] = 1.0;
        dirs.push_back(d);
        const double span = upper[i] - lower[i];
        double s = (x[i] != 0.0) ? 0.05 * std::abs(x[i]) : 0.05;
        if (std::isfinite(span) && span > 0.0) s = std::min(s, 0.25 * span);
        steps.push_back(s > 0.0 ? s : 1e-3);
    }

    for (int iter = 0; iter < opt.max_iterations; ++iter) {
        summ.iterations = iter + 1;
        if (summ.function_evals >= opt.max_function_evals) {
            if (opt.verbose)
                std::cout << "[Powell] max function evaluations reached\n";
            break;
        }

        const Vector x_start = x;
        const double f_start = fx;
        double biggest_drop  = 0.0;
        std::size_t biggest_idx = 0;

        for (std::size_t k = 0; k < dirs.size(); ++k) {
            const auto [t_lo, t_hi] = detail::step_range(x, dirs[k], lower, upper);
            auto phi = [&](double t) { return func(Vector(x + t * dirs[k])); };
            const auto [t, f] = detail::line_minimize(
                phi, steps[k], fx, t_lo, t_hi, opt.line_tolerance,
                summ.function_evals, opt.max_function_evals);
            if (t != 0.0 && f < fx) {
                x += t * dirs[k];
                if (fx - f > biggest_drop) {
                    biggest_drop = fx - f;
                    biggest_idx  = k;
                }
                fx = f;
                steps[k] = std::max(std::abs(t), 1e-12);
            } else {
                steps[k] *= 0.5;
            }
        }

        if (opt.verbose)
            std::cout << "[Powell] iter " << iter << " f=" << fx
                      << " nfe=" << summ.function_evals << "\n";

        if (callback && !callback(summ.iterations, x, fx)) {
            summ.cancelled = true;
            break;
        }

        if (2.0 * (f_start - fx) <=
            opt.relative_tolerance * (std::abs(f_start) + std::abs(fx)) + opt.absolute_tolerance) {
            summ.converged = true;
            break;
        }

        /* ---- replace the most productive direction by the net move ----- */
        Vector net = x - x_start;
        const double net_norm = net.norm();
        if (net_norm > 0.0) {
            net /= net_norm;
            const auto [t_lo, t_hi] = detail::step_range(x, net, lower, upper);
            auto phi = [&](double t) { return func(Vector(x + t * net)); };
            const auto [t, f] = detail::line_minimize(
                phi, 0.5 * net_norm, fx, t_lo, t_hi, opt.line_tolerance,
                summ.function_evals, opt.max_function_evals);
            if (t != 0.0 && f < fx) {
                x += t * net;
                fx = f;
            }
            dirs[biggest_idx]  = net;
            steps[biggest_idx] = std::max(net_norm, 1e-12);
        }
    }

    summ.final_value = fx;
    if (opt.verbose && !summ.converged && !summ.cancelled)
        std::cout << "[Powell] stopped without convergence\n";
    return summ;
}

} // namespace xrfcal
