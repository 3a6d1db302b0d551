#include "ccdfit/HarmonicBasis.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace ccdfit {

static void check_basis_config(int num_coeffs, double avg_days_yr)
{
    if (num_coeffs != 4 && num_coeffs != 6 && num_coeffs != 8)
        throw std::invalid_argument("coefficient_matrix(): num_coeffs must be 4, 6 or 8, got "
                                    + std::to_string(num_coeffs));
    if (!(avg_days_yr > 0.0) || !std::isfinite(avg_days_yr))
        throw std::invalid_argument("coefficient_matrix(): avg_days_yr must be positive and finite");
}

Matrix build_coefficient_matrix(const Dates& dates,
                                int          num_coeffs,
                                double       avg_days_yr)
{
    check_basis_config(num_coeffs, avg_days_yr);

    const double w = 2.0 * M_PI / avg_days_yr;
    const Eigen::Index n = static_cast<Eigen::Index>(dates.size());

    Matrix m = Matrix::Zero(n, BASIS_COLUMNS);
    for (Eigen::Index i = 0; i < n; ++i)
    {
        const double t = static_cast<double>(dates[i]);
        m(i, 0) = t;
        m(i, 1) = std::cos(w * t);
        m(i, 2) = std::sin(w * t);

        if (num_coeffs >= 6) {
            m(i, 3) = std::cos(2 * w * t);
            m(i, 4) = std::sin(2 * w * t);
        }
        if (num_coeffs == 8) {
            m(i, 5) = std::cos(3 * w * t);
            m(i, 6) = std::sin(3 * w * t);
        }
    }
    return m;
}

MatrixPtr coefficient_matrix(const Dates& dates,
                             int          num_coeffs,
                             double       avg_days_yr,
                             BasisCache&  cache)
{
    check_basis_config(num_coeffs, avg_days_yr);

    BasisKey key{dates, num_coeffs, avg_days_yr};
    return cache.insert_if_absent(key, [&] {
        return build_coefficient_matrix(dates, num_coeffs, avg_days_yr);
    });
}

} // namespace ccdfit
