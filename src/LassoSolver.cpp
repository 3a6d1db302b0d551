#include "ccdfit/LassoSolver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace ccdfit {

Vector LassoModel::predict(const Matrix& X) const
{
    if (X.cols() != coef.size())
        throw std::invalid_argument("LassoModel::predict(): design matrix has "
                                    + std::to_string(X.cols()) + " columns, model has "
                                    + std::to_string(coef.size()) + " coefficients");
    Vector out = X * coef;
    out.array() += intercept;
    return out;
}

/* soft-thresholding operator  S(z, γ) = sign(z) · max(|z| - γ, 0)        */
static double soft_threshold(double z, double gamma)
{
    if (z >  gamma) return z - gamma;
    if (z < -gamma) return z + gamma;
    return 0.0;
}

/*  Duality gap of the current iterate (R = y_c - X_c w).
 *  The dual point is R scaled back into the feasible set
 *  ||X_cᵀ θ||_∞ ≤ l1_reg.                                                  */
static double duality_gap(const Matrix& Xc,
                          const Vector& yc,
                          const Vector& R,
                          const Vector& w,
                          double        l1_reg)
{
    const double dual_norm = (Xc.transpose() * R).cwiseAbs().maxCoeff();
    const double R_norm2   = R.squaredNorm();

    double scale = 1.0;
    double gap   = R_norm2;
    if (dual_norm > l1_reg) {
        scale = l1_reg / dual_norm;
        gap   = 0.5 * (R_norm2 + R_norm2 * scale * scale);
    }
    gap += l1_reg * w.lpNorm<1>() - scale * R.dot(yc);
    return gap;
}

LassoModel lasso_coordinate_descent(const Matrix&       X,
                                    const Vector&       y,
                                    const LassoOptions& opt)
{
    const Eigen::Index n = X.rows();
    const Eigen::Index p = X.cols();

    if (n == 0)
        throw std::invalid_argument("lasso_coordinate_descent(): no observations");
    if (y.size() != n)
        throw std::invalid_argument("lasso_coordinate_descent(): X has "
                                    + std::to_string(n) + " rows but y has "
                                    + std::to_string(y.size()) + " entries");
    if (!X.allFinite() || !y.allFinite())
        throw std::invalid_argument("lasso_coordinate_descent(): input contains NaN/Inf");
    if (opt.alpha < 0.0 || opt.max_iterations <= 0)
        throw std::invalid_argument("lasso_coordinate_descent(): invalid options");

    /* ---------- centre the problem (unpenalised intercept) ---------------- */
    const Eigen::RowVectorXd x_mean = X.colwise().mean();
    const double             y_mean = y.mean();

    const Matrix Xc = X.rowwise() - x_mean;
    const Vector yc = (y.array() - y_mean).matrix();
    const Vector col_norm2 = Xc.colwise().squaredNorm().transpose();

    const double l1_reg   = opt.alpha * static_cast<double>(n);
    const double gap_tol  = opt.tolerance * yc.squaredNorm();

    Vector w = Vector::Zero(p);
    Vector R = yc;                       // residual for w == 0

    LassoModel model;
    model.summary.gap_limit = gap_tol;

    for (int it = 0; it < opt.max_iterations; ++it)
    {
        double w_max   = 0.0;
        double d_w_max = 0.0;

        for (Eigen::Index j = 0; j < p; ++j)
        {
            if (col_norm2[j] == 0.0) continue;       // column carries no signal

            const double w_old = w[j];
            if (w_old != 0.0) R.noalias() += w_old * Xc.col(j);

            const double rho = Xc.col(j).dot(R);
            w[j] = soft_threshold(rho, l1_reg) / col_norm2[j];

            if (w[j] != 0.0) R.noalias() -= w[j] * Xc.col(j);

            d_w_max = std::max(d_w_max, std::abs(w[j] - w_old));
            w_max   = std::max(w_max,   std::abs(w[j]));
        }

        model.summary.iterations = it + 1;

        const bool last = (it == opt.max_iterations - 1);
        if (w_max == 0.0 || d_w_max / w_max < opt.tolerance || last)
        {
            const double gap = duality_gap(Xc, yc, R, w, l1_reg);
            model.summary.dual_gap = gap;

            if (opt.verbose)
                std::cout << "[Lasso] epoch " << std::setw(4) << it + 1
                          << "  gap " << std::scientific << std::setprecision(3) << gap
                          << "  limit " << gap_tol << std::defaultfloat << std::endl;

            if (gap < gap_tol) {
                model.summary.converged = true;
                break;
            }
        }
    }

    if (opt.verbose && !model.summary.converged)
        std::cout << "[Lasso]  Warning: no convergence after "
                  << model.summary.iterations << " epochs (gap "
                  << model.summary.dual_gap << ", limit " << gap_tol << ")" << std::endl;

    model.coef      = w;
    model.intercept = y_mean - x_mean.transpose().dot(w);
    return model;
}

LassoModel LassoRegression::operator()(const Matrix& X, const Vector& y) const
{
    LassoModel model = lasso_coordinate_descent(X, y, options);
    if (!model.summary.converged) {
        std::ostringstream msg;
        msg << "Lasso fit did not converge after " << model.summary.iterations
            << " iterations (duality gap " << model.summary.dual_gap
            << ", tolerance " << model.summary.gap_limit << ")";
        throw FitError(msg.str(), model.summary);
    }
    return model;
}

} // namespace ccdfit
