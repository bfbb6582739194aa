#include "xrfcal/BoundedMinimizer.hpp"
#include "xrfcal/Powell.hpp"
#include "xrfcal/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>
#include <iostream>
#include <limits>

namespace xrfcal {

namespace {

std::string normalise_name(const std::string& s)
{
    std::string out;
    for (char c : s) {
        if (c == '-' || c == '_' || c == ' ') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

Vector project(const Vector& x, const Vector& lo, const Vector& hi)
{
    return x.cwiseMax(lo).cwiseMin(hi);
}

void check_box(const Vector& x0, const Vector& lo, const Vector& hi)
{
    if (lo.size() != x0.size() || hi.size() != x0.size())
        throw ConfigurationError("minimize: bounds do not match the parameter count");
    for (Index i = 0; i < x0.size(); ++i) {
        if (lo[i] > hi[i])
            throw ConfigurationError("minimize: lower bound above upper bound");
    }
}

} // namespace

MinimizerKind parse_minimizer_kind(const std::string& name)
{
    const std::string key = normalise_name(name);
    if (key == "lbfgsb" || key == "lbfgs" || key == "quasinewton") return MinimizerKind::QuasiNewton;
    if (key == "powell") return MinimizerKind::Powell;
    throw ConfigurationError("Unknown minimizer: " + name);
}

std::string to_string(MinimizerKind kind)
{
    switch (kind) {
        case MinimizerKind::QuasiNewton: return "lbfgsb";
        case MinimizerKind::Powell:      return "powell";
    }
    return "lbfgsb";
}

/* ------------------------------------------------------------------------ */
/*                      projected limited-memory BFGS                        */
/* ------------------------------------------------------------------------ */

Vector QuasiNewtonMinimizer::gradient(const Objective& f,
                                      const Vector&    x,
                                      double           fx,
                                      const Vector&    lower,
                                      const Vector&    upper,
                                      int&             nfe) const
{
    const Index n = x.size();
    Vector g(n);
    for (Index i = 0; i < n; ++i) {
        const double h = opt_.fd_step * std::max(1.0, std::abs(x[i]));
        const bool can_up   = x[i] + h <= upper[i];
        const bool can_down = x[i] - h >= lower[i];

        Vector xp = x, xm = x;
        if (can_up && can_down) {
            xp[i] += h;
            xm[i] -= h;
            g[i] = (f(xp) - f(xm)) / (2.0 * h);
            nfe += 2;
        } else if (can_up) {
            xp[i] += h;
            g[i] = (f(xp) - fx) / h;
            ++nfe;
        } else if (can_down) {
            xm[i] -= h;
            g[i] = (fx - f(xm)) / h;
            ++nfe;
        } else {
            g[i] = 0.0;                 // box narrower than the difference step
        }
        if (!std::isfinite(g[i])) g[i] = 0.0;
    }
    return g;
}

MinimizerResult QuasiNewtonMinimizer::minimize(const Objective&         f,
                                               const Vector&            x0,
                                               const Vector&            lower,
                                               const Vector&            upper,
                                               const IterationCallback& callback) const
{
    check_box(x0, lower, upper);

    MinimizerResult res;
    const Index n = x0.size();
    int nfe = 0;

    auto eval = [&](const Vector& p) {
        ++nfe;
        const double v = f(p);
        return std::isfinite(v) ? v : std::numeric_limits<double>::infinity();
    };

    Vector x  = project(x0, lower, upper);
    double fx = eval(x);
    if (!std::isfinite(fx)) {
        res.x = x;
        res.fun = fx;
        res.function_evals = nfe;
        res.message = "objective is not finite at the starting point";
        return res;
    }
    Vector g = gradient(f, x, fx, lower, upper, nfe);

    std::deque<Vector> S, Y;
    std::deque<double> rho;
    res.message = "maximum number of iterations reached";

    for (int it = 0; it < opt_.max_iterations; ++it) {
        res.iterations = it + 1;

        /* ---------- projected gradient and the pinned variables --------- */
        std::vector<bool> pinned(n, false);
        Vector pg = g;
        for (Index i = 0; i < n; ++i) {
            if ((x[i] <= lower[i] && g[i] > 0.0) || (x[i] >= upper[i] && g[i] < 0.0)) {
                pg[i] = 0.0;
                pinned[i] = true;
            }
        }
        const double pg_max = pg.lpNorm<Eigen::Infinity>();
        if (pg_max < opt_.gtol) {
            res.success = true;
            res.message = "projected gradient below tolerance";
            break;
        }

        /* ------------------------- two-loop recursion -------------------- */
        Vector q = pg;
        std::vector<double> alpha(S.size());
        for (std::size_t k = S.size(); k-- > 0;) {
            alpha[k] = rho[k] * S[k].dot(q);
            q -= alpha[k] * Y[k];
        }
        const double gamma = S.empty()
            ? 1.0 / std::max(pg.norm(), 1e-12)
            : S.back().dot(Y.back()) / Y.back().squaredNorm();
        Vector d = gamma * q;
        for (std::size_t k = 0; k < S.size(); ++k) {
            const double beta = rho[k] * Y[k].dot(d);
            d += S[k] * (alpha[k] - beta);
        }
        d = -d;
        for (Index i = 0; i < n; ++i)
            if (pinned[i]) d[i] = 0.0;

        if (!(g.dot(d) < 0.0) || !d.allFinite()) {
            // not a descent direction: drop the curvature memory
            S.clear(); Y.clear(); rho.clear();
            d = -pg / std::max(pg.norm(), 1e-12);
        }

        /* ------------- Armijo backtracking along the projected path ------ */
        double step = 1.0;
        bool   accepted = false;
        Vector x_new;
        double f_new = fx;
        for (int ls = 0; ls < 40 && nfe < opt_.max_function_evals; ++ls) {
            x_new = project(x + step * d, lower, upper);
            if ((x_new - x).lpNorm<Eigen::Infinity>() == 0.0) break;
            f_new = eval(x_new);
            if (f_new < fx && f_new <= fx + 1e-4 * g.dot(x_new - x)) {
                accepted = true;
                break;
            }
            step *= 0.5;
        }

        if (!accepted) {
            if (!S.empty()) {
                S.clear(); Y.clear(); rho.clear();
                continue;
            }
            // steepest descent cannot improve either: stationary to difference accuracy
            res.success = true;
            res.message = "no further decrease along the projected gradient";
            break;
        }

        const Vector g_new = gradient(f, x_new, f_new, lower, upper, nfe);
        const Vector s = x_new - x;
        const Vector y = g_new - g;
        const double sy = s.dot(y);
        if (sy > std::numeric_limits<double>::epsilon() * y.squaredNorm()) {
            S.push_back(s);
            Y.push_back(y);
            rho.push_back(1.0 / sy);
            if (static_cast<int>(S.size()) > opt_.memory) {
                S.pop_front(); Y.pop_front(); rho.pop_front();
            }
        }

        const double rel = (fx - f_new) / std::max({std::abs(fx), std::abs(f_new), 1.0});
        x  = x_new;
        fx = f_new;
        g  = g_new;

        if (opt_.verbose)
            std::cout << "[QN] iter " << it << " f=" << fx
                      << " |pg|=" << pg_max << " nfe=" << nfe << "\n";

        if (callback && !callback(res.iterations, x, fx)) {
            res.cancelled = true;
            res.message = "cancelled by iteration callback";
            break;
        }
        if (rel <= opt_.ftol) {
            res.success = true;
            res.message = "relative reduction of the objective below ftol";
            break;
        }
        if (nfe >= opt_.max_function_evals) {
            res.message = "maximum number of function evaluations reached";
            break;
        }
    }

    res.x = x;
    res.fun = fx;
    res.function_evals = nfe;
    if (opt_.verbose)
        std::cout << "[QN] " << res.message << " (f=" << fx << ")\n";
    return res;
}

/* ------------------------------------------------------------------------ */
/*                              Powell adapter                               */
/* ------------------------------------------------------------------------ */

MinimizerResult PowellMinimizer::minimize(const Objective&         f,
                                          const Vector&            x0,
                                          const Vector&            lower,
                                          const Vector&            upper,
                                          const IterationCallback& callback) const
{
    check_box(x0, lower, upper);

    PowellSolverOptions po;
    po.max_iterations     = opt_.max_iterations;
    po.max_function_evals = opt_.max_function_evals;
    po.relative_tolerance = opt_.ftol;
    po.verbose            = opt_.verbose;

    auto safe = [&f](const Vector& p) {
        const double v = f(p);
        return std::isfinite(v) ? v : std::numeric_limits<double>::infinity();
    };

    MinimizerResult res;
    res.x = x0;
    const PowellSolverSummary summ = powell(safe, res.x, lower, upper, po, callback);

    res.fun            = summ.final_value;
    res.iterations     = summ.iterations;
    res.function_evals = summ.function_evals;
    res.success        = summ.converged;
    res.cancelled      = summ.cancelled;
    if (summ.cancelled)
        res.message = "cancelled by iteration callback";
    else if (summ.converged)
        res.message = "relative reduction of the objective below ftol";
    else
        res.message = "iteration or evaluation budget exhausted";
    return res;
}

std::unique_ptr<BoundedMinimizer> make_minimizer(MinimizerKind kind,
                                                 const MinimizerOptions& opt)
{
    switch (kind) {
        case MinimizerKind::Powell:      return std::make_unique<PowellMinimizer>(opt);
        case MinimizerKind::QuasiNewton: return std::make_unique<QuasiNewtonMinimizer>(opt);
    }
    throw ConfigurationError("Unknown minimizer kind");
}

} // namespace xrfcal
