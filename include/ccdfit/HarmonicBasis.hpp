#pragma once
#include "Types.hpp"
#include "BasisCache.hpp"
#include "Defaults.hpp"

namespace ccdfit {

constexpr int BASIS_COLUMNS = 8;

/**
 * Harmonic design matrix for a sequence of ordinal dates, always shaped
 * (dates.size(), 8):
 *
 *     col 0      t
 *     col 1, 2   cos(ωt),  sin(ωt)                  ω = 2π / avg_days_yr
 *     col 3, 4   cos(2ωt), sin(2ωt)                 num_coeffs >= 6
 *     col 5, 6   cos(3ωt), sin(3ωt)                 num_coeffs == 8
 *     col 7      0
 *
 * Columns not selected by num_coeffs are exactly zero.  An empty date
 * sequence yields a 0 x 8 matrix.
 */
Matrix build_coefficient_matrix(const Dates& dates,
                                int          num_coeffs  = 4,
                                double       avg_days_yr = AVG_DAYS_YR);

/**
 * Memoised build_coefficient_matrix().  The cache key is the exact date
 * sequence together with num_coeffs and avg_days_yr; repeated calls with
 * the same key return the same shared matrix.
 */
MatrixPtr coefficient_matrix(const Dates& dates,
                             int          num_coeffs  = 4,
                             double       avg_days_yr = AVG_DAYS_YR,
                             BasisCache&  cache       = BasisCache::instance());

} // namespace ccdfit
