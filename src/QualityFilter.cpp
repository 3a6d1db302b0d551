#include "ccdfit/QualityFilter.hpp"
#include <limits>
#include <stdexcept>
#include <string>

namespace ccdfit {

constexpr int    N_SPECTRAL_BANDS = 6;
constexpr double SATURATION_MAX   = 10000.0;

/* ------------------------------------------------------------------ */
Mask mask_snow(const QualityVector& quality, int snow)
{
    return quality.array() == snow;
}

Mask mask_clear(const QualityVector& quality, int clear)
{
    return quality.array() == clear;
}

Mask mask_water(const QualityVector& quality, int water)
{
    return quality.array() == water;
}

Mask mask_fill(const QualityVector& quality, int fill)
{
    return quality.array() == fill;
}

Mask mask_clear_or_water(const QualityVector& quality, const QaCodes& codes)
{
    return mask_clear(quality, codes.clear) || mask_water(quality, codes.water);
}

/* ------------------------------------------------------------------ */
int count_clear_or_water(const QualityVector& quality, const QaCodes& codes)
{
    return static_cast<int>(mask_clear_or_water(quality, codes).count());
}

int count_fill(const QualityVector& quality, const QaCodes& codes)
{
    return static_cast<int>(mask_fill(quality, codes.fill).count());
}

int count_snow(const QualityVector& quality, const QaCodes& codes)
{
    return static_cast<int>(mask_snow(quality, codes.snow).count());
}

int count_total(const QualityVector& quality, const QaCodes& codes)
{
    return static_cast<int>(quality.size()) - count_fill(quality, codes);
}

/* ------------------------------------------------------------------ */
double ratio_clear(const QualityVector& quality, const QaCodes& codes)
{
    const int total = count_total(quality, codes);
    if (total == 0) return std::numeric_limits<double>::quiet_NaN();
    return static_cast<double>(count_clear_or_water(quality, codes)) / total;
}

double ratio_snow(const QualityVector& quality, const QaCodes& codes)
{
    const int snowy = count_snow(quality, codes);
    const int clear = count_clear_or_water(quality, codes);
    return snowy / (clear + snowy + 0.01);
}

bool enough_clear(const QualityVector& quality, double threshold, const QaCodes& codes)
{
    return ratio_clear(quality, codes) >= threshold;     // NaN compares false
}

bool enough_snow(const QualityVector& quality, double threshold, const QaCodes& codes)
{
    return ratio_snow(quality, codes) >= threshold;
}

/* ------------------------------------------------------------------ */
Mask filter_saturated(const Matrix& observations)
{
    if (observations.rows() < N_SPECTRAL_BANDS)
        throw std::invalid_argument("filter_saturated(): expected at least "
                                    + std::to_string(N_SPECTRAL_BANDS) + " bands, got "
                                    + std::to_string(observations.rows()));

    Mask unsaturated = Mask::Constant(observations.cols(), true);
    for (int b = 0; b < N_SPECTRAL_BANDS; ++b) {
        const auto band = observations.row(b).transpose().array();
        unsaturated = unsaturated && (band > 0.0) && (band < SATURATION_MAX);
    }
    return unsaturated;
}

Mask filter_thermal(const Vector& thermal, double min_kelvin, double max_kelvin)
{
    // thresholds are unscaled, observations are scaled
    min_kelvin *= 10;
    max_kelvin *= 10;
    return (thermal.array() > min_kelvin) && (thermal.array() < max_kelvin);
}

/* ------------------------------------------------------------------ */
Mask clear_index(const QualityVector& quality, int clear, int water)
{
    return (quality.array() == clear) && (quality.array() == water);
}

static void check_composite_inputs(const char*          who,
                                   const Matrix&        observations,
                                   const QualityVector& quality,
                                   int                  thermal_idx)
{
    if (observations.cols() != quality.size())
        throw std::invalid_argument(std::string(who) + ": "
                                    + std::to_string(observations.cols())
                                    + " observations but "
                                    + std::to_string(quality.size()) + " quality codes");
    if (thermal_idx < 0 || thermal_idx >= observations.rows())
        throw std::invalid_argument(std::string(who) + ": thermal index "
                                    + std::to_string(thermal_idx) + " out of range");
}

Mask standard_filter(const Matrix&        observations,
                     const QualityVector& quality,
                     int                  thermal_idx,
                     const QaCodes&       codes,
                     double               min_kelvin,
                     double               max_kelvin)
{
    check_composite_inputs("standard_filter()", observations, quality, thermal_idx);

    const Vector thermal = observations.row(thermal_idx).transpose();
    return clear_index(quality, codes.clear, codes.water)
        && filter_thermal(thermal, min_kelvin, max_kelvin)
        && filter_saturated(observations);
}

Mask clear_or_water_filter(const Matrix&        observations,
                           const QualityVector& quality,
                           int                  thermal_idx,
                           const QaCodes&       codes,
                           double               min_kelvin,
                           double               max_kelvin)
{
    check_composite_inputs("clear_or_water_filter()", observations, quality, thermal_idx);

    const Vector thermal = observations.row(thermal_idx).transpose();
    return mask_clear_or_water(quality, codes)
        && filter_thermal(thermal, min_kelvin, max_kelvin)
        && filter_saturated(observations);
}

Mask observation_filter(const Matrix&        observations,
                        const QualityVector& quality,
                        const Defaults&      cfg)
{
    switch (cfg.filter) {
    case FilterMode::ClearOrWater:
        return clear_or_water_filter(observations, quality, cfg.thermal_idx,
                                     cfg.qa, cfg.min_kelvin, cfg.max_kelvin);
    case FilterMode::Standard:
    default:
        return standard_filter(observations, quality, cfg.thermal_idx,
                               cfg.qa, cfg.min_kelvin, cfg.max_kelvin);
    }
}

} // namespace ccdfit
