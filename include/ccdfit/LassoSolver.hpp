#pragma once
#include "Types.hpp"
#include <stdexcept>
#include <string>

namespace ccdfit {

/* ---------------------------  user visible bits  --------------------------- */

struct LassoOptions {
    double alpha          = 0.1;     // L1 penalty strength
    int    max_iterations = 1000;    // coordinate-descent epochs
    double tolerance      = 1e-4;    // duality gap, relative to ||y - ȳ||²
    bool   verbose        = false;   // chatty?
};

struct LassoSummary {
    int    iterations = 0;
    double dual_gap   = 0.0;         // final duality gap (unscaled)
    double gap_limit  = 0.0;         // tolerance the gap was compared with
    bool   converged  = false;
};

/*
 * A fitted L1-regularised linear model
 *
 *      ŷ = X · coef + intercept
 *
 * The coefficient vector has one entry per design-matrix column; columns
 * without variance keep a zero coefficient.
 */
struct LassoModel {
    Vector       coef;
    double       intercept = 0.0;
    LassoSummary summary;

    Vector predict(const Matrix& X) const;
};

/* Raised whenever a regression does not produce a usable model. */
class FitError : public std::runtime_error {
public:
    explicit FitError(const std::string& what, LassoSummary summary = {})
        : std::runtime_error(what), summary_(summary) {}

    const LassoSummary& summary() const { return summary_; }

private:
    LassoSummary summary_;
};

/* -------------------  coordinate-descent driver routine  ------------------ */

/*  Minimise   1/(2n) · ||y - Xw - b||²  +  α · ||w||₁
 *
 *  Columns of X and y are centred first so the intercept b stays
 *  unpenalised.  The returned model always carries its summary; callers
 *  decide what to do with summary.converged == false.
 */
LassoModel lasso_coordinate_descent(const Matrix&       X,
                                    const Vector&       y,
                                    const LassoOptions& opt = {});

/* Functor form of the solver, usable wherever a regression engine with
 * fit(X, y) -> model  is expected.  Throws FitError when the solver did
 * not converge.                                                            */
struct LassoRegression {
    LassoOptions options;

    LassoModel operator()(const Matrix& X, const Vector& y) const;
};

} // namespace ccdfit
