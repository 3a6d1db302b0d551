#include "ccdfit/QualityFilter.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <vector>

namespace ccdfit_test {

using namespace ccdfit;

namespace {
QualityVector qa(std::initializer_list<int> codes)
{
    std::vector<int> v(codes);
    return Eigen::Map<const QualityVector>(v.data(), static_cast<Eigen::Index>(v.size()));
}

// 7 bands x n observations, every value comfortably inside all ranges
Matrix good_observations(Eigen::Index n)
{
    Matrix obs = Matrix::Constant(7, n, 5000.0);
    obs.row(THERMAL_IDX).setConstant(2900.0);
    return obs;
}

bool all_false(const Mask& m) { return !m.any(); }
} // namespace

// ============================================================================
// Category masks, counts and ratios
// ============================================================================

TEST(QualityMaskTest, SingleCategoryMasks)
{
    const QualityVector q = qa({0, 1, 2, 3, 4, 255, 0});

    EXPECT_EQ(mask_clear(q).count(), 2);
    EXPECT_TRUE(mask_clear(q)[0]);
    EXPECT_TRUE(mask_clear(q)[6]);
    EXPECT_TRUE(mask_water(q)[1]);
    EXPECT_TRUE(mask_snow(q)[3]);
    EXPECT_TRUE(mask_fill(q)[5]);
    EXPECT_EQ(mask_fill(q).count(), 1);

    const Mask cw = mask_clear_or_water(q);
    EXPECT_EQ(cw.count(), 3);
    EXPECT_TRUE(cw[0] && cw[1] && cw[6]);
    EXPECT_FALSE(cw[2] || cw[3] || cw[4] || cw[5]);
}

TEST(QualityMaskTest, CodesAreInjectable)
{
    QaCodes codes;
    codes.clear = 64;
    codes.water = 68;
    codes.snow  = 80;
    codes.fill  = 1;

    const QualityVector q = qa({64, 68, 80, 1, 0});
    EXPECT_EQ(mask_clear(q, codes.clear).count(), 1);
    EXPECT_EQ(count_clear_or_water(q, codes), 2);
    EXPECT_EQ(count_snow(q, codes), 1);
    EXPECT_EQ(count_fill(q, codes), 1);
    EXPECT_EQ(count_total(q, codes), 4);
}

TEST(QualityMaskTest, Counts)
{
    const QualityVector q = qa({0, 1, 2, 3, 3, 4, 255, 255});
    EXPECT_EQ(count_clear_or_water(q), 2);
    EXPECT_EQ(count_snow(q), 2);
    EXPECT_EQ(count_fill(q), 2);
    EXPECT_EQ(count_total(q), 6);
}

TEST(QualityMaskTest, RatioClear)
{
    EXPECT_DOUBLE_EQ(ratio_clear(qa({0, 1, 4, 4, 255})), 0.5);
    EXPECT_DOUBLE_EQ(ratio_clear(qa({0, 0, 1})), 1.0);
    EXPECT_DOUBLE_EQ(ratio_clear(qa({2, 3, 4})), 0.0);

    const double r = ratio_clear(qa({0, 2, 3, 4, 1, 255}));
    EXPECT_GE(r, 0.0);
    EXPECT_LE(r, 1.0);
}

TEST(QualityMaskTest, RatioClearOfAllFillIsNaN)
{
    EXPECT_TRUE(std::isnan(ratio_clear(qa({255, 255, 255}))));
    EXPECT_TRUE(std::isnan(ratio_clear(QualityVector(0))));
    EXPECT_FALSE(enough_clear(qa({255, 255}), 0.0));
}

TEST(QualityMaskTest, RatioSnowUsesEpsilon)
{
    EXPECT_DOUBLE_EQ(ratio_snow(qa({255, 255})), 0.0);
    EXPECT_DOUBLE_EQ(ratio_snow(qa({0, 3, 3, 4})), 2.0 / (1.0 + 2.0 + 0.01));

    const double all_snow = ratio_snow(qa({3, 3, 3, 3}));
    EXPECT_DOUBLE_EQ(all_snow, 4.0 / 4.01);
    EXPECT_LT(all_snow, 1.0);
}

TEST(QualityMaskTest, EnoughClearAndSnow)
{
    const QualityVector quarter = qa({0, 4, 4, 4});        // exactly 0.25 clear
    EXPECT_TRUE(enough_clear(quarter));
    EXPECT_FALSE(enough_clear(quarter, 0.26));

    EXPECT_TRUE(enough_snow(qa({3, 3, 3, 3, 3, 3, 3, 3, 0})));   // 8 / 9.01
    EXPECT_FALSE(enough_snow(qa({3, 0, 0})));
    EXPECT_TRUE(enough_snow(qa({3, 0, 0}), 0.3));
}

// ============================================================================
// Range filters
// ============================================================================

TEST(RangeFilterTest, SaturatedBoundariesAreExcluded)
{
    Matrix obs = good_observations(6);
    obs(3, 1) = 0.0;          // lower boundary
    obs(5, 2) = 10000.0;      // upper boundary
    obs(0, 3) = 9999.0;       // just inside
    obs(2, 3) = 1.0;          // just inside
    obs(1, 4) = -20.0;
    obs(THERMAL_IDX, 5) = -9999.0;   // thermal band is not checked here

    const Mask m = filter_saturated(obs);
    EXPECT_TRUE(m[0]);
    EXPECT_FALSE(m[1]);
    EXPECT_FALSE(m[2]);
    EXPECT_TRUE(m[3]);
    EXPECT_FALSE(m[4]);
    EXPECT_TRUE(m[5]);
}

TEST(RangeFilterTest, SaturationNeedsSixBands)
{
    EXPECT_THROW(filter_saturated(Matrix::Constant(5, 3, 100.0)), std::invalid_argument);
}

TEST(RangeFilterTest, ThermalBoundsAreStrictAndScaled)
{
    Vector t(5);
    t << 1800.0, 3400.0, 2600.0, 1800.5, 3399.5;
    const Mask m = filter_thermal(t, 180.0, 340.0);
    EXPECT_FALSE(m[0]);
    EXPECT_FALSE(m[1]);
    EXPECT_TRUE(m[2]);
    EXPECT_TRUE(m[3]);
    EXPECT_TRUE(m[4]);
}

TEST(RangeFilterTest, ThermalDefaults)
{
    Vector t(3);
    t << MIN_KELVIN * 10, MAX_KELVIN * 10, 0.5 * (MIN_KELVIN + MAX_KELVIN) * 10;
    const Mask m = filter_thermal(t);
    EXPECT_FALSE(m[0]);
    EXPECT_FALSE(m[1]);
    EXPECT_TRUE(m[2]);
}

// ============================================================================
// Composite filters
// ============================================================================

TEST(CompositeFilterTest, ClearIndexIsAlwaysFalse)
{
    // (quality == clear) AND (quality == water) cannot hold for distinct codes
    EXPECT_TRUE(all_false(clear_index(qa({0, 1, 2, 3, 4, 255}))));
    EXPECT_TRUE(all_false(clear_index(qa({0, 0, 0}))));
    EXPECT_TRUE(all_false(clear_index(qa({1, 1}))));
    EXPECT_EQ(clear_index(qa({0, 1})).size(), 2);
}

TEST(CompositeFilterTest, StandardFilterIsAlwaysFalse)
{
    const Matrix obs = good_observations(4);
    const Mask m = standard_filter(obs, qa({0, 1, 0, 1}));
    EXPECT_EQ(m.size(), 4);
    EXPECT_TRUE(all_false(m));
}

TEST(CompositeFilterTest, ClearOrWaterFilterSelectsUsableObservations)
{
    Matrix obs = good_observations(6);
    obs(2, 3) = 12000.0;                 // saturated
    obs(THERMAL_IDX, 4) = 1000.0;        // too cold

    const Mask m = clear_or_water_filter(obs, qa({0, 1, 4, 0, 0, 255}));
    EXPECT_TRUE(m[0]);
    EXPECT_TRUE(m[1]);
    EXPECT_FALSE(m[2]);     // cloud
    EXPECT_FALSE(m[3]);
    EXPECT_FALSE(m[4]);
    EXPECT_FALSE(m[5]);     // fill
}

TEST(CompositeFilterTest, ObservationFilterFollowsConfiguredMode)
{
    const Matrix        obs = good_observations(3);
    const QualityVector q   = qa({0, 1, 3});

    Defaults cfg;
    EXPECT_EQ(observation_filter(obs, q, cfg).count(), 0);

    cfg.filter = FilterMode::ClearOrWater;
    EXPECT_EQ(observation_filter(obs, q, cfg).count(), 2);
}

TEST(CompositeFilterTest, RejectsMisalignedInput)
{
    const Matrix obs = good_observations(3);
    EXPECT_THROW(standard_filter(obs, qa({0, 1})), std::invalid_argument);
    EXPECT_THROW(clear_or_water_filter(obs, qa({0, 1, 0}), 7), std::invalid_argument);
    EXPECT_THROW(clear_or_water_filter(obs, qa({0, 1, 0}), -1), std::invalid_argument);
}

} // namespace ccdfit_test
