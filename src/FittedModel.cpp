#include "ccdfit/FittedModel.hpp"
#include <algorithm>
#include <functional>

namespace ccdfit {

void check_fit_inputs(const Dates& dates, const Vector& observations)
{
    if (dates.empty())
        throw std::invalid_argument("fitted_model(): no observation dates");
    if (static_cast<Eigen::Index>(dates.size()) != observations.size())
        throw std::invalid_argument("fitted_model(): " + std::to_string(dates.size())
                                    + " dates but " + std::to_string(observations.size())
                                    + " observations");
    if (!observations.allFinite())
        throw std::invalid_argument("fitted_model(): observations contain NaN/Inf");
    if (std::adjacent_find(dates.begin(), dates.end(),
                           std::not_equal_to<>()) == dates.end())
        throw FitError("fitted_model(): need at least two distinct dates, got "
                       + std::to_string(dates.size()) + " observation(s) on one date");
}

FittedModel fitted_model(const Dates&        dates,
                         const Vector&       observations,
                         int                 degrees_of_freedom,
                         const LassoOptions& options,
                         double              avg_days_yr,
                         BasisCache&         cache)
{
    return fitted_model_with(LassoRegression{options}, dates, observations,
                             degrees_of_freedom, avg_days_yr, cache);
}

} // namespace ccdfit
