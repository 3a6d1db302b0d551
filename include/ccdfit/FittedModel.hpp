#pragma once
#include "Types.hpp"
#include "BasisCache.hpp"
#include "Defaults.hpp"
#include "HarmonicBasis.hpp"
#include "LassoSolver.hpp"
#include "MathUtils.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace ccdfit {

// Result of one harmonic fit: model, RMSE and residuals on the training data
template<typename Model>
struct BasicFittedModel {
    Model  model;
    double rmse = 0.0;
    Vector residual;      // observed - predicted, aligned with the inputs
};

using FittedModel = BasicFittedModel<LassoModel>;

/* invalid_argument for empty / mismatched / non-finite input,
 * FitError when fewer than two distinct dates are given                  */
void check_fit_inputs(const Dates& dates, const Vector& observations);

/*
 * Fit `observations` against the harmonic design matrix of `dates` with an
 * arbitrary regression engine
 *
 *     Regression :  (const Matrix& X, const Vector& y) -> Model
 *     Model      :  predict(const Matrix& X) -> Vector
 *
 * The engine reports failures by throwing (LassoRegression throws FitError).
 */
template<typename Regression>
auto fitted_model_with(Regression&&  fit,
                       const Dates&  dates,
                       const Vector& observations,
                       int           degrees_of_freedom = 4,
                       double        avg_days_yr        = AVG_DAYS_YR,
                       BasisCache&   cache              = BasisCache::instance())
    -> BasicFittedModel<std::decay_t<std::invoke_result_t<Regression&, const Matrix&, const Vector&>>>
{
    check_fit_inputs(dates, observations);

    const MatrixPtr X = coefficient_matrix(dates, degrees_of_freedom, avg_days_yr, cache);

    auto model = fit(*X, observations);
    const Vector predictions = model.predict(*X);
    auto [rmse, residual] = calc_rmse(observations, predictions);

    return {std::move(model), rmse, std::move(residual)};
}

/* Lasso (α = 0.1 unless overridden) on the harmonic basis */
FittedModel fitted_model(const Dates&        dates,
                         const Vector&       observations,
                         int                 degrees_of_freedom = 4,
                         const LassoOptions& options            = {},
                         double              avg_days_yr        = AVG_DAYS_YR,
                         BasisCache&         cache              = BasisCache::instance());

} // namespace ccdfit
