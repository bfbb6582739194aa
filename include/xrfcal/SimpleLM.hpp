#pragma once
#include "Types.hpp"
#include <vector>
#include <iostream>
#include <iomanip>
#include <limits>
#include <cmath>
#include <algorithm>

namespace xrfcal {

/* ---------------------------  user visible bits  --------------------------- */
/*  A value ≤ 0 means "determine automatically".                              */

struct LMSolverOptions {
    int    max_iterations        = 200;      // hard upper limit
    double gradient_tolerance    = 0;        // auto
    double step_tolerance        = 0;        // auto
    double chi2_tolerance        = 0;        // auto
    double initial_lambda        = 0;        // auto
    bool   verbose               = false;
};

struct LMSolverSummary {
    int    iterations         = 0;
    double initial_chi2       = 0.0;
    double final_chi2         = 0.0;
    bool   converged          = false;
    bool   diverged           = false;     // non-finite model output at start
    std::vector<double> param_uncertainties;   // 1-σ; 0 = fixed
};

/* --------------------  internal helper (column selection)  ----------------- */

inline
void build_free_index(const std::vector<bool>& mask,
                      int                      n,
                      Eigen::VectorXi&         map_full_to_reduced,
                      int&                     n_free)
{
    map_full_to_reduced.resize(n);
    n_free = 0;
    for (int j = 0; j < n; ++j) {
        if (mask.empty() || mask[j])
            map_full_to_reduced[j] = n_free++;
        else
            map_full_to_reduced[j] = -1;
    }
}

/*  Largest gradient component that still points into the feasible box.
 *  Components pinned at a bound with the descent direction leaving the box
 *  do not count towards convergence.                                      */
inline
double projected_gradient_max(const Eigen::VectorXd&     g_free,
                              const Eigen::VectorXd&     x,
                              const Eigen::VectorXi&     col_index,
                              const std::vector<double>& lower,
                              const std::vector<double>& upper)
{
    double gmax = 0.0;
    for (int j = 0; j < x.size(); ++j) {
        const int col = col_index[j];
        if (col < 0) continue;
        const double gj = g_free[col];
        if (!lower.empty() && x[j] <= lower[j] && gj > 0.0) continue;
        if (!upper.empty() && x[j] >= upper[j] && gj < 0.0) continue;
        gmax = std::max(gmax, std::abs(gj));
    }
    return gmax;
}

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*
 *  func(x, &r, &J) fills the residual vector r (size m) and, when J is not
 *  null, the m×n Jacobian dr/dx.  Frozen parameters (free_mask[j] == false)
 *  never move; lower/upper are projected bounds (empty == unbounded).
 */
template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                    func,
                    Eigen::VectorXd&             x,
                    const std::vector<bool>&     free_mask,
                    const std::vector<double>&   lower,
                    const std::vector<double>&   upper,
                    const LMSolverOptions&       user_opt = {})
{
    LMSolverSummary summ;
    const int n = static_cast<int>(x.size());
    LMSolverOptions opt = user_opt;               // mutable copy

    Eigen::VectorXi col_index;
    int n_free = 0;
    build_free_index(free_mask, n, col_index, n_free);
    summ.param_uncertainties.assign(n, 0.0);

    if (n_free == 0) {                            // nothing to fit
        if (opt.verbose)
            std::cout << "[LM]  Warning: all parameters are frozen, nothing to fit\n";
        summ.converged = true;
        return summ;
    }

    /* ---------------------- first model evaluation ------------------- */
    Eigen::VectorXd r;
    Eigen::MatrixXd J;
    func(x, &r, &J);

    double chi2 = r.squaredNorm();
    summ.initial_chi2 = chi2;
    if (!std::isfinite(chi2) || !J.allFinite()) {
        if (opt.verbose)
            std::cout << "[LM]  Warning: non-finite model at the initial guess\n";
        summ.diverged   = true;
        summ.final_chi2 = chi2;
        return summ;
    }

    const std::size_t m = static_cast<std::size_t>(r.size());
    const double eps = std::numeric_limits<double>::epsilon();

    /* ---------------- automatic tolerances and initial λ -------------- */
    {
        const double gmax0 = (J.transpose() * r).cwiseAbs().maxCoeff();
        if (opt.gradient_tolerance <= 0.0)
            opt.gradient_tolerance = gmax0 > 0.0 ? 1e-8 * gmax0 : 1e-12;

        if (opt.step_tolerance <= 0.0)
            opt.step_tolerance = 1e-10 * std::max(1.0, x.lpNorm<Eigen::Infinity>());

        if (opt.chi2_tolerance <= 0.0)
            opt.chi2_tolerance = 1e-10 * std::max(1.0, chi2);

        // damping is relative to diag(JᵀJ), so a dimensionless start suffices
        if (opt.initial_lambda <= 0.0)
            opt.initial_lambda = 1e-3;
    }
    double lambda = opt.initial_lambda;

    Eigen::MatrixXd Jf(m, n_free);
    Eigen::MatrixXd JTJ(n_free, n_free);
    Eigen::VectorXd diag_JTJ(n_free), g(n_free), g_step(n_free), dx_free(n_free), dx(n);

    auto reduce_jacobian = [&](const Eigen::MatrixXd& Jfull) {
        for (int j = 0; j < n; ++j) {
            const int col = col_index[j];
            if (col >= 0) Jf.col(col).noalias() = Jfull.col(j);
        }
        JTJ.setZero();
        JTJ.selfadjointView<Eigen::Lower>().rankUpdate(Jf.adjoint(), 1.0);
        JTJ.template triangularView<Eigen::StrictlyUpper>() = JTJ.transpose();
    };

    /* ------------------------- main iteration loop -------------------- */
    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;

        reduce_jacobian(J);
        g.noalias() = Jf.transpose() * r;

        if (projected_gradient_max(g, x, col_index, lower, upper)
                < opt.gradient_tolerance) {
            summ.converged = true;
            break;
        }

        diag_JTJ = JTJ.diagonal();

        /* ------- (JTJ + λ D) Δx = −g   (D = diag(JTJ)) -------------- */
        JTJ.diagonal().array() += lambda * (diag_JTJ.array() + 1e-20);

        // columns pinned at a bound with the descent pointing outside stay put
        g_step = g;
        for (int j = 0; j < n; ++j) {
            const int col = col_index[j];
            if (col < 0) continue;
            const bool pinned = (!lower.empty() && x[j] <= lower[j] && g[col] > 0.0)
                             || (!upper.empty() && x[j] >= upper[j] && g[col] < 0.0);
            if (!pinned) continue;
            JTJ.row(col).setZero();
            JTJ.col(col).setZero();
            JTJ(col, col) = 1.0;
            g_step[col]   = 0.0;
        }
        dx_free = -JTJ.ldlt().solve(g_step);

        if (!dx_free.allFinite()) {
            if (opt.verbose)
                std::cout << "[LM]  Warning: Inf/NaN in the normal equations, stopping\n";
            break;
        }

        dx.setZero();
        for (int j = 0; j < n; ++j) {
            const int col = col_index[j];
            if (col >= 0) dx[j] = dx_free[col];
        }

        if (dx.cwiseAbs().maxCoeff() < opt.step_tolerance) {
            summ.converged = true;
            break;
        }

        /* ------------- candidate point, projected into the box ---------- */
        Eigen::VectorXd x_try = x + dx;
        for (int j = 0; j < n; ++j) {
            if (!lower.empty()) x_try[j] = std::max(x_try[j], lower[j]);
            if (!upper.empty()) x_try[j] = std::min(x_try[j], upper[j]);
        }

        const Eigen::VectorXd dx_actual = x_try - x;
        for (int j = 0; j < n; ++j) {
            const int col = col_index[j];
            if (col >= 0) dx_free[col] = dx_actual[j];
        }

        if (dx_actual.cwiseAbs().maxCoeff() < opt.step_tolerance) {
            // every move is blocked by a bound
            summ.converged = true;
            break;
        }

        Eigen::VectorXd r_try;
        Eigen::MatrixXd J_try;
        func(x_try, &r_try, &J_try);
        double chi2_try = r_try.squaredNorm();
        if (!std::isfinite(chi2_try) || !J_try.allFinite())
            chi2_try = std::numeric_limits<double>::infinity();

        /* ------------------- Powell's ρ test ------------------------ */
        // reduction of ‖r + J·Δ‖² predicted for the projected step Δ
        const double pred_red = -2.0 * g.dot(dx_free) - (Jf * dx_free).squaredNorm();

        const bool   accept = chi2_try < chi2;
        const double rho    = pred_red > eps * chi2 ? (chi2 - chi2_try) / pred_red
                                                    : (accept ? 0.0 : -1.0);

        if (accept) {
            const double reduction = chi2 - chi2_try;
            x.swap(x_try);
            r.swap(r_try);
            J.swap(J_try);
            chi2 = chi2_try;

            /* adaptive λ (MINPACK style) */
            lambda *= std::max(1.0 / 3.0, 1.0 - std::pow(2.0 * rho - 1.0, 3.0));
            lambda  = std::max(lambda, 1e-18);

            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  rho=" << std::setprecision(3) << rho
                          << "  chi2=" << std::setprecision(6) << chi2
                          << "  lambda=" << std::setprecision(3) << lambda
                          << "  (accepted)\n";

            if (reduction < opt.chi2_tolerance) {
                summ.converged = true;
                break;
            }
        } else {
            lambda *= 2.0;
            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  rho=" << std::setprecision(3) << rho
                          << "  chi2=" << std::setprecision(6) << chi2_try
                          << "  lambda=" << std::setprecision(3) << lambda
                          << "  (rejected)\n";
            if (lambda > 1e16) {
                // no downhill step left at any damping
                summ.converged = true;
                break;
            }
        }
    }

    summ.final_chi2 = chi2;

    /* ---------------------  propagate uncertainties  ---------------- */
    reduce_jacobian(J);
    const double dof = static_cast<double>(
        m > static_cast<std::size_t>(n_free) ? m - n_free : 1);
    const double var = chi2 / dof;                        // σ² ≈ χ²/dof

    Eigen::MatrixXd cov =
        JTJ.ldlt().solve(Eigen::MatrixXd::Identity(n_free, n_free));
    cov *= var;

    for (int j = 0; j < n; ++j) {
        const int col = col_index[j];
        if (col >= 0 && std::isfinite(cov(col, col)))
            summ.param_uncertainties[j] = std::sqrt(std::max(0.0, cov(col, col)));
    }

    if (opt.verbose)
        std::cout << "[LM] done after " << summ.iterations << " iterations, chi2="
                  << chi2 << (summ.converged ? " (converged)\n" : " (not converged)\n");
    return summ;
}

} // namespace xrfcal
