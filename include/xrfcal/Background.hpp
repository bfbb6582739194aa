#pragma once
#include "Types.hpp"
#include <optional>
#include <string>
#include <utility>

namespace xrfcal {

enum class BackgroundMethod { SNIP, AsLS, Polynomial, Linear, Adaptive, None };

/* "snip", "als"/"asls", "polynomial", "linear", "adaptive", "none" (any case).
 * Throws ConfigurationError for anything else.                              */
BackgroundMethod parse_background_method(const std::string& name);
std::string      to_string(BackgroundMethod m);

struct BackgroundOptions {
    BackgroundMethod method = BackgroundMethod::SNIP;

    // SNIP
    int    snip_iterations = 20;
    bool   snip_decreasing = true;

    // asymmetric least squares
    double als_lambda     = 1e5;
    double als_p          = 0.01;
    int    als_iterations = 10;

    // polynomial; roi_mask[i] == true excludes channel i from the fit
    int         poly_degree = 3;
    ChannelMask roi_mask;

    // linear; explicit endpoint channels override the 5 % edge means
    double linear_edge_fraction = 0.05;
    std::optional<std::pair<Index, Index>> linear_endpoints;

    // moving percentile filter
    int    adaptive_window     = 50;
    double adaptive_percentile = 5.0;
};

/*  Continuum estimate for the given counts.  Always the same length as
 *  counts and clamped to ≥ 0.                                              */
Vector estimate_background(const Vector&            energy,
                           const Vector&            counts,
                           const BackgroundOptions& opt = {});

/*  counts − background, element-wise, clamped to ≥ 0.                      */
Vector subtract_background(const Vector& counts, const Vector& background);

/* individual methods -------------------------------------------------------- */

Vector snip_background(const Vector& counts, int iterations = 20, bool decreasing = true);

Vector als_background(const Vector& counts, double lambda = 1e5, double p = 0.01,
                      int iterations = 10);

Vector polynomial_background(const Vector&      energy,
                             const Vector&      counts,
                             int                degree   = 3,
                             const ChannelMask& roi_mask = {});

Vector linear_background(const Vector& energy,
                         const Vector& counts,
                         double        edge_fraction = 0.05,
                         const std::optional<std::pair<Index, Index>>& endpoints = std::nullopt);

Vector adaptive_background(const Vector& counts, int window = 50, double percentile = 5.0);

} // namespace xrfcal
