#pragma once
#include "Types.hpp"
#include <functional>
#include <memory>
#include <string>

namespace xrfcal {

enum class MinimizerKind {
    QuasiNewton,     // projected limited-memory BFGS ("lbfgsb")
    Powell           // derivative free direction set ("powell")
};

/* Accepts "lbfgsb", "l-bfgs-b", "quasi-newton" and "powell" (any case). */
MinimizerKind parse_minimizer_kind(const std::string& name);
std::string   to_string(MinimizerKind kind);

using Objective = std::function<double(const Vector&)>;

/*  Called once per iteration with the current best point and value.
 *  Returning false cancels the minimisation.                            */
using IterationCallback = std::function<bool(int iteration, const Vector& x, double f)>;

struct MinimizerOptions {
    int    max_iterations     = 500;
    int    max_function_evals = 50000;
    double ftol               = 2.2e-9;  // relative reduction per iteration
    double gtol               = 1e-7;    // projected gradient, max norm
    int    memory             = 10;      // stored correction pairs
    double fd_step            = 1e-6;    // relative finite difference step
    bool   verbose            = false;
};

struct MinimizerResult {
    Vector      x;
    double      fun            = 0.0;
    int         iterations     = 0;
    int         function_evals = 0;
    bool        success        = false;
    bool        cancelled      = false;
    std::string message;
};

class BoundedMinimizer {
public:
    virtual ~BoundedMinimizer() = default;

    virtual MinimizerResult minimize(const Objective&         f,
                                     const Vector&            x0,
                                     const Vector&            lower,
                                     const Vector&            upper,
                                     const IterationCallback& callback = {}) const = 0;

    virtual MinimizerKind kind() const = 0;
};

/*
 *  Projected quasi-Newton method for box constraints: central difference
 *  gradients, two-loop L-BFGS recursion on the free variables, Armijo
 *  backtracking along the projected path.
 */
class QuasiNewtonMinimizer : public BoundedMinimizer {
public:
    explicit QuasiNewtonMinimizer(MinimizerOptions opt = {}) : opt_(opt) {}

    MinimizerResult minimize(const Objective&         f,
                             const Vector&            x0,
                             const Vector&            lower,
                             const Vector&            upper,
                             const IterationCallback& callback = {}) const override;

    MinimizerKind kind() const override { return MinimizerKind::QuasiNewton; }

private:
    Vector gradient(const Objective& f, const Vector& x, double fx,
                    const Vector& lower, const Vector& upper, int& nfe) const;

    MinimizerOptions opt_;
};

class PowellMinimizer : public BoundedMinimizer {
public:
    explicit PowellMinimizer(MinimizerOptions opt = {}) : opt_(opt) {}

    MinimizerResult minimize(const Objective&         f,
                             const Vector&            x0,
                             const Vector&            lower,
                             const Vector&            upper,
                             const IterationCallback& callback = {}) const override;

    MinimizerKind kind() const override { return MinimizerKind::Powell; }

private:
    MinimizerOptions opt_;
};

std::unique_ptr<BoundedMinimizer> make_minimizer(MinimizerKind kind,
                                                 const MinimizerOptions& opt = {});

} // namespace xrfcal
