#include "xrfcal/FitStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace xrfcal {

namespace {
constexpr double SS_RES_FLOOR = 1e-300;
}

FitStatistics calculate_fit_statistics(const Vector& observed,
                                       const Vector& fitted,
                                       int           n_params)
{
    FitStatistics st;
    const Vector resid = observed - fitted;

    for (Index i = 0; i < resid.size(); ++i) {
        const double var = observed[i] > 0.0 ? observed[i] : 1.0;
        st.chi_squared += resid[i] * resid[i] / var;
    }

    st.dof = static_cast<int>(observed.size()) - n_params;
    st.reduced_chi_squared = st.dof > 0
        ? st.chi_squared / st.dof
        : std::numeric_limits<double>::infinity();
    st.r_squared = r_squared(observed, fitted);
    return st;
}

double r_squared(const Vector& observed, const Vector& fitted)
{
    if (observed.size() == 0) return 0.0;
    const double ss_res = (observed - fitted).squaredNorm();
    const double ss_tot = (observed.array() - observed.mean()).square().sum();
    return ss_tot > 0.0 ? 1.0 - ss_res / ss_tot : 0.0;
}

double rmse(const Vector& observed, const Vector& fitted)
{
    if (observed.size() == 0) return 0.0;
    return std::sqrt((observed - fitted).squaredNorm() / observed.size());
}

double aic(double ss_res, int n, int k)
{
    const double s = std::max(ss_res, SS_RES_FLOOR);
    return n * std::log(s / n) + 2.0 * k;
}

double bic(double ss_res, int n, int k)
{
    const double s = std::max(ss_res, SS_RES_FLOOR);
    return n * std::log(s / n) + k * std::log(static_cast<double>(n));
}

double median(Vector v)
{
    const Index n = v.size();
    if (n == 0) return 0.0;
    std::sort(v.data(), v.data() + n);
    return (n % 2 == 0) ? 0.5 * (v[n / 2 - 1] + v[n / 2]) : v[n / 2];
}

double median_absolute_deviation(const Vector& v)
{
    const double m = median(v);
    return median((v.array() - m).abs().matrix());
}

} // namespace xrfcal
