#include "ccdfit/MathUtils.hpp"
#include <cmath>
#include <stdexcept>

namespace ccdfit {

std::pair<double, Vector> calc_rmse(const Vector& observed,
                                    const Vector& predicted)
{
    if (observed.size() != predicted.size())
        throw std::invalid_argument("calc_rmse(): observed / predicted length mismatch.");
    if (observed.size() == 0)
        throw std::invalid_argument("calc_rmse(): empty input.");

    Vector residual = observed - predicted;
    const double rmse = std::sqrt(residual.squaredNorm() / residual.size());
    return {rmse, std::move(residual)};
}

} // namespace ccdfit
