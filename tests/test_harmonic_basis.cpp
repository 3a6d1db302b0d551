#include "ccdfit/HarmonicBasis.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

namespace ccdfit_test {

using namespace ccdfit;

namespace {
Dates daily(std::int64_t first, std::int64_t last)
{
    Dates d;
    for (auto t = first; t <= last; ++t) d.push_back(t);
    return d;
}
} // namespace

TEST(HarmonicBasisTest, ShapeIsAlwaysEightColumns)
{
    const Dates dates = daily(730000, 730040);
    for (int nc : {4, 6, 8}) {
        const Matrix m = build_coefficient_matrix(dates, nc);
        EXPECT_EQ(m.rows(), static_cast<Eigen::Index>(dates.size())) << "num_coeffs " << nc;
        EXPECT_EQ(m.cols(), 8) << "num_coeffs " << nc;
        EXPECT_TRUE((m.col(7).array() == 0.0).all());
    }
}

TEST(HarmonicBasisTest, UnusedColumnsAreExactlyZero)
{
    const Dates dates = daily(1, 100);

    const Matrix m4 = build_coefficient_matrix(dates, 4);
    EXPECT_TRUE((m4.middleCols(3, 5).array() == 0.0).all());

    const Matrix m6 = build_coefficient_matrix(dates, 6);
    EXPECT_FALSE((m6.middleCols(3, 2).array() == 0.0).all());
    EXPECT_TRUE((m6.middleCols(5, 3).array() == 0.0).all());

    const Matrix m8 = build_coefficient_matrix(dates, 8);
    EXPECT_FALSE((m8.middleCols(3, 2).array() == 0.0).all());
    EXPECT_FALSE((m8.middleCols(5, 2).array() == 0.0).all());
    EXPECT_TRUE((m8.col(7).array() == 0.0).all());
}

TEST(HarmonicBasisTest, ColumnValues)
{
    const Dates dates = {0, 91, 730120};
    const double w = 2.0 * M_PI / AVG_DAYS_YR;
    const Matrix m = build_coefficient_matrix(dates, 8);

    for (std::size_t i = 0; i < dates.size(); ++i) {
        const double t = static_cast<double>(dates[i]);
        const auto r = static_cast<Eigen::Index>(i);
        EXPECT_DOUBLE_EQ(m(r, 0), t);
        EXPECT_NEAR(m(r, 1), std::cos(w * t), 1e-12);
        EXPECT_NEAR(m(r, 2), std::sin(w * t), 1e-12);
        EXPECT_NEAR(m(r, 3), std::cos(2 * w * t), 1e-12);
        EXPECT_NEAR(m(r, 4), std::sin(2 * w * t), 1e-12);
        EXPECT_NEAR(m(r, 5), std::cos(3 * w * t), 1e-12);
        EXPECT_NEAR(m(r, 6), std::sin(3 * w * t), 1e-12);
    }
    EXPECT_DOUBLE_EQ(m(0, 1), 1.0);
    EXPECT_DOUBLE_EQ(m(0, 2), 0.0);
}

TEST(HarmonicBasisTest, PeriodicInAnnualPeriod)
{
    const double period = 365.0;
    const Dates dates = {17, 17 + 365, 17 + 2 * 365};
    const Matrix m = build_coefficient_matrix(dates, 8, period);

    for (int c = 1; c <= 6; ++c) {
        EXPECT_NEAR(m(0, c), m(1, c), 1e-9) << "column " << c;
        EXPECT_NEAR(m(0, c), m(2, c), 1e-9) << "column " << c;
    }
}

TEST(HarmonicBasisTest, EmptyDatesGiveEmptyMatrix)
{
    BasisCache cache(4);
    const MatrixPtr m = coefficient_matrix({}, 4, AVG_DAYS_YR, cache);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->rows(), 0);
    EXPECT_EQ(m->cols(), 8);
}

TEST(HarmonicBasisTest, RejectsInvalidConfiguration)
{
    const Dates dates = daily(1, 10);
    EXPECT_THROW(build_coefficient_matrix(dates, 5), std::invalid_argument);
    EXPECT_THROW(build_coefficient_matrix(dates, 10), std::invalid_argument);
    EXPECT_THROW(build_coefficient_matrix(dates, 4, 0.0), std::invalid_argument);
    EXPECT_THROW(build_coefficient_matrix(dates, 4, std::nan("")), std::invalid_argument);

    BasisCache cache(4);
    EXPECT_THROW(coefficient_matrix(dates, 2, AVG_DAYS_YR, cache), std::invalid_argument);
    EXPECT_EQ(cache.size(), 0u);
}

} // namespace ccdfit_test
