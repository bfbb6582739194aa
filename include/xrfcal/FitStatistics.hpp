#pragma once
#include "Types.hpp"

namespace xrfcal {

struct FitStatistics {
    double chi_squared         = 0.0;   // Poisson weighted, σ² = max(counts, 1)
    double reduced_chi_squared = 0.0;   // +inf when dof ≤ 0
    double r_squared           = 0.0;
    int    dof                 = 0;
};

/*  Goodness of fit of a fitted count curve against the observed counts.  */
FitStatistics calculate_fit_statistics(const Vector& observed,
                                       const Vector& fitted,
                                       int           n_params);

/*  1 - SS_res/SS_tot;  0 when the observations have no spread.           */
double r_squared(const Vector& observed, const Vector& fitted);

double rmse(const Vector& observed, const Vector& fitted);

/*
 *  Gaussian likelihood information criteria
 *        AIC = n·ln(SS_res/n) + 2k ,   BIC = n·ln(SS_res/n) + k·ln n .
 *  SS_res is floored so a perfect fit still yields a finite value.
 */
double aic(double ss_res, int n, int k);
double bic(double ss_res, int n, int k);

double median(Vector v);
double median_absolute_deviation(const Vector& v);

} // namespace xrfcal
