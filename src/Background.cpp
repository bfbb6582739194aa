#include "xrfcal/Background.hpp"
#include "xrfcal/Errors.hpp"
#include <Eigen/Sparse>
#include <Eigen/SparseCholesky>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace xrfcal {

namespace {

// scipy.ndimage "reflect" boundary:  d c b a | a b c d | d c b a
inline Index reflect_index(Index i, Index n)
{
    const Index period = 2 * n;
    i %= period;
    if (i < 0) i += period;
    return (i < n) ? i : period - i - 1;
}

Vector clamp_nonnegative(Vector v)
{
    for (Index i = 0; i < v.size(); ++i)
        if (!(v[i] > 0.0)) v[i] = 0.0;       // also catches NaN
    return v;
}

} // namespace

BackgroundMethod parse_background_method(const std::string& name)
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "snip")                  return BackgroundMethod::SNIP;
    if (key == "als" || key == "asls")  return BackgroundMethod::AsLS;
    if (key == "polynomial")            return BackgroundMethod::Polynomial;
    if (key == "linear")                return BackgroundMethod::Linear;
    if (key == "adaptive")              return BackgroundMethod::Adaptive;
    if (key == "none")                  return BackgroundMethod::None;
    throw ConfigurationError("Unknown background method: " + name);
}

std::string to_string(BackgroundMethod m)
{
    switch (m) {
        case BackgroundMethod::SNIP:       return "snip";
        case BackgroundMethod::AsLS:       return "als";
        case BackgroundMethod::Polynomial: return "polynomial";
        case BackgroundMethod::Linear:     return "linear";
        case BackgroundMethod::Adaptive:   return "adaptive";
        case BackgroundMethod::None:       return "none";
    }
    return "snip";
}

/* ------------------------------------------------------------------------ */

Vector snip_background(const Vector& counts, int iterations, bool decreasing)
{
    const Index n = counts.size();
    Vector v(n);
    for (Index i = 0; i < n; ++i) {
        const double c = counts[i] > 0.0 ? counts[i] : 1.0;
        v[i] = std::log(std::log(std::sqrt(c + 1.0) + 1.0) + 1.0);
    }

    // clipping runs in place: channel i already sees the clipped i − w
    for (int k = 0; k < iterations; ++k) {
        const Index w = decreasing ? iterations - k : k + 1;
        for (Index i = w; i < n - w; ++i)
            v[i] = std::min(v[i], 0.5 * (v[i - w] + v[i + w]));
    }

    for (Index i = 0; i < n; ++i) {
        const double t = std::exp(std::exp(v[i]) - 1.0) - 1.0;
        v[i] = t * t - 1.0;
    }
    return clamp_nonnegative(std::move(v));
}

Vector als_background(const Vector& counts, double lambda, double p, int iterations)
{
    if (!(lambda > 0.0))
        throw ConfigurationError("AsLS smoothness lambda must be positive");
    if (!(p > 0.0 && p < 1.0))
        throw ConfigurationError("AsLS asymmetry p must lie in (0, 1)");

    const Index n = counts.size();
    if (n < 3)
        throw InsufficientDataError("AsLS needs at least 3 channels");

    using SpMat = Eigen::SparseMatrix<double>;

    // second order difference operator, (n−2) × n
    std::vector<Eigen::Triplet<double>> trip;
    trip.reserve(static_cast<std::size_t>(3 * (n - 2)));
    for (Index i = 0; i < n - 2; ++i) {
        trip.emplace_back(i, i,      1.0);
        trip.emplace_back(i, i + 1, -2.0);
        trip.emplace_back(i, i + 2,  1.0);
    }
    SpMat D(n - 2, n);
    D.setFromTriplets(trip.begin(), trip.end());
    const SpMat penalty = lambda * SpMat(D.transpose() * D);

    Vector w = Vector::Ones(n);
    Vector z = counts;
    Eigen::SimplicialLDLT<SpMat> solver;

    for (int it = 0; it < std::max(iterations, 1); ++it) {
        SpMat A = penalty;
        for (Index i = 0; i < n; ++i)
            A.coeffRef(i, i) += w[i];

        solver.compute(A);
        if (solver.info() != Eigen::Success)
            throw FitDivergenceError("AsLS: factorisation of the smoothing system failed");

        z = solver.solve(w.cwiseProduct(counts));
        if (solver.info() != Eigen::Success || !z.allFinite())
            throw FitDivergenceError("AsLS: smoothing system has no finite solution");

        for (Index i = 0; i < n; ++i)
            w[i] = counts[i] > z[i] ? p : 1.0 - p;
    }
    return clamp_nonnegative(std::move(z));
}

Vector polynomial_background(const Vector&      energy,
                             const Vector&      counts,
                             int                degree,
                             const ChannelMask& roi_mask)
{
    if (degree < 0)
        throw ConfigurationError("Polynomial background degree must be non-negative");

    const Index n = counts.size();
    if (!roi_mask.empty() && static_cast<Index>(roi_mask.size()) != n)
        throw ConfigurationError("Polynomial background: ROI mask length mismatch");
    std::vector<Index> used;
    for (Index i = 0; i < n; ++i)
        if (roi_mask.empty() || !roi_mask[static_cast<std::size_t>(i)]) used.push_back(i);

    const Index ncoef = degree + 1;
    if (static_cast<Index>(used.size()) < ncoef)
        throw InsufficientDataError("Polynomial background: fewer unmasked channels than coefficients");

    // work on x ∈ [-1, 1] to keep the Vandermonde matrix well conditioned
    const double e0 = energy.minCoeff();
    const double e1 = energy.maxCoeff();
    const double half = (e1 > e0) ? 0.5 * (e1 - e0) : 1.0;
    const double mid  = 0.5 * (e0 + e1);
    auto xn = [&](double e) { return (e - mid) / half; };

    Matrix A(static_cast<Index>(used.size()), ncoef);
    Vector b(static_cast<Index>(used.size()));
    for (std::size_t r = 0; r < used.size(); ++r) {
        const double x = xn(energy[used[r]]);
        double pw = 1.0;
        for (Index c = 0; c < ncoef; ++c) {
            A(static_cast<Index>(r), c) = pw;
            pw *= x;
        }
        b[static_cast<Index>(r)] = counts[used[r]];
    }
    const Vector coef = A.colPivHouseholderQr().solve(b);

    Vector bg(n);
    for (Index i = 0; i < n; ++i) {
        const double x = xn(energy[i]);
        double acc = 0.0;
        for (Index c = ncoef - 1; c >= 0; --c) acc = acc * x + coef[c];
        bg[i] = acc;
    }
    return clamp_nonnegative(std::move(bg));
}

Vector linear_background(const Vector& energy,
                         const Vector& counts,
                         double        edge_fraction,
                         const std::optional<std::pair<Index, Index>>& endpoints)
{
    const Index n = counts.size();
    if (n < 2)
        throw InsufficientDataError("Linear background needs at least 2 channels");

    double e_start, c_start, e_end, c_end;
    if (endpoints) {
        const auto [i0, i1] = *endpoints;
        if (i0 < 0 || i1 >= n || i0 >= i1)
            throw ConfigurationError("Linear background: endpoint channels out of range");
        e_start = energy[i0]; c_start = counts[i0];
        e_end   = energy[i1]; c_end   = counts[i1];
    } else {
        const Index k = std::max<Index>(1, static_cast<Index>(n * edge_fraction));
        e_start = energy.head(k).mean(); c_start = counts.head(k).mean();
        e_end   = energy.tail(k).mean(); c_end   = counts.tail(k).mean();
    }

    const double slope = (e_end > e_start) ? (c_end - c_start) / (e_end - e_start) : 0.0;
    Vector bg = (c_start + slope * (energy.array() - e_start)).matrix();
    return clamp_nonnegative(std::move(bg));
}

Vector adaptive_background(const Vector& counts, int window, double percentile)
{
    const Index n = counts.size();
    if (n == 0) return Vector();
    if (window < 1)
        throw ConfigurationError("Adaptive background window must be at least 1");
    if (percentile < 0.0 || percentile > 100.0)
        throw ConfigurationError("Adaptive background percentile must lie in [0, 100]");

    /* ---- moving rank filter, centred like scipy.ndimage --------------- */
    const Index size   = window;
    const Index origin = size / 2;
    Index rank = static_cast<Index>(size * percentile / 100.0);
    if (rank >= size) rank = size - 1;

    Vector filtered(n);
    #pragma omp parallel for schedule(static) if (n > 8192)
    for (Index i = 0; i < n; ++i) {
        std::vector<double> buf(static_cast<std::size_t>(size));
        for (Index k = 0; k < size; ++k)
            buf[static_cast<std::size_t>(k)] = counts[reflect_index(i - origin + k, n)];
        std::nth_element(buf.begin(), buf.begin() + rank, buf.end());
        filtered[i] = buf[static_cast<std::size_t>(rank)];
    }

    /* ---- Gaussian smoothing, σ = window/4, truncated at 4σ ------------ */
    const double sigma  = window / 4.0;
    const Index  radius = static_cast<Index>(4.0 * sigma + 0.5);
    std::vector<double> kernel(static_cast<std::size_t>(2 * radius + 1));
    double ksum = 0.0;
    for (Index k = -radius; k <= radius; ++k) {
        const double v = std::exp(-0.5 * (k * k) / (sigma * sigma));
        kernel[static_cast<std::size_t>(k + radius)] = v;
        ksum += v;
    }
    for (double& v : kernel) v /= ksum;

    Vector smooth(n);
    #pragma omp parallel for schedule(static) if (n > 8192)
    for (Index i = 0; i < n; ++i) {
        double acc = 0.0;
        for (Index k = -radius; k <= radius; ++k)
            acc += kernel[static_cast<std::size_t>(k + radius)] * filtered[reflect_index(i + k, n)];
        smooth[i] = acc;
    }
    return clamp_nonnegative(std::move(smooth));
}

/* ------------------------------------------------------------------------ */

Vector estimate_background(const Vector&            energy,
                           const Vector&            counts,
                           const BackgroundOptions& opt)
{
    if (energy.size() != counts.size())
        throw ConfigurationError("estimate_background: energy and counts differ in length");

    switch (opt.method) {
        case BackgroundMethod::SNIP:
            return snip_background(counts, opt.snip_iterations, opt.snip_decreasing);
        case BackgroundMethod::AsLS:
            return als_background(counts, opt.als_lambda, opt.als_p, opt.als_iterations);
        case BackgroundMethod::Polynomial:
            return polynomial_background(energy, counts, opt.poly_degree, opt.roi_mask);
        case BackgroundMethod::Linear:
            return linear_background(energy, counts, opt.linear_edge_fraction, opt.linear_endpoints);
        case BackgroundMethod::Adaptive:
            return adaptive_background(counts, opt.adaptive_window, opt.adaptive_percentile);
        case BackgroundMethod::None:
            return Vector::Zero(counts.size());
    }
    return Vector::Zero(counts.size());
}

Vector subtract_background(const Vector& counts, const Vector& background)
{
    if (counts.size() != background.size())
        throw ConfigurationError("subtract_background: length mismatch");
    return (counts - background).cwiseMax(0.0);
}

} // namespace xrfcal
