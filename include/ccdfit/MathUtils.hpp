#pragma once
#include "Types.hpp"
#include <utility>

namespace ccdfit {

/*  residual = observed - predicted ,   rmse = sqrt( mean(residual²) )
 *  Returns { rmse, residual }.  Both inputs must have the same length.
 */
std::pair<double, Vector> calc_rmse(const Vector& observed,
                                    const Vector& predicted);

} // namespace ccdfit
