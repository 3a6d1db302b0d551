#pragma once
#include "LassoSolver.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace ccdfit {

/* Landsat CFMask category values                                          */
constexpr int QA_CLEAR  = 0;
constexpr int QA_WATER  = 1;
constexpr int QA_SHADOW = 2;
constexpr int QA_SNOW   = 3;
constexpr int QA_CLOUD  = 4;
constexpr int QA_FILL   = 255;

constexpr double CLEAR_PCT_THRESHOLD = 0.25;
constexpr double SNOW_PCT_THRESHOLD  = 0.75;

constexpr int    THERMAL_IDX = 6;
constexpr double MIN_KELVIN  = 179.95;    // -93.2 °C
constexpr double MAX_KELVIN  = 343.85;    //  70.7 °C

constexpr double      AVG_DAYS_YR       = 365.25;
constexpr std::size_t BASIS_CACHE_SIZE  = 1000;

struct QaCodes {
    int clear  = QA_CLEAR;
    int water  = QA_WATER;
    int shadow = QA_SHADOW;
    int snow   = QA_SNOW;
    int cloud  = QA_CLOUD;
    int fill   = QA_FILL;
};

// Which composite mask selects the observations that enter a fit
enum class FilterMode {
    Standard,        // standard_filter()       (clear AND water, see QualityFilter.hpp)
    ClearOrWater     // clear_or_water_filter()
};

FilterMode  filter_mode_from_string(const std::string& s);
std::string to_string(FilterMode m);

// Everything a fit needs that is not per-pixel data
struct Defaults {
    QaCodes      qa;
    double       clear_pct_threshold = CLEAR_PCT_THRESHOLD;
    double       snow_pct_threshold  = SNOW_PCT_THRESHOLD;
    int          thermal_idx         = THERMAL_IDX;
    double       min_kelvin          = MIN_KELVIN;
    double       max_kelvin          = MAX_KELVIN;
    double       avg_days_yr         = AVG_DAYS_YR;
    std::size_t  basis_cache_size    = BASIS_CACHE_SIZE;
    FilterMode   filter              = FilterMode::Standard;
    LassoOptions lasso;
};

/*
 * Overlay the keys present in `j` on top of the built-in defaults:
 *
 *   { "qa": { "clear": 0, "water": 1, "shadow": 2, "snow": 3,
 *             "cloud": 4, "fill": 255 },
 *     "clearPctThreshold": 0.25,  "snowPctThreshold": 0.75,
 *     "thermalIdx": 6,  "minKelvin": 179.95,  "maxKelvin": 343.85,
 *     "avgDaysYr": 365.25,  "basisCacheSize": 1000,
 *     "filter": "standard" | "clear-or-water",
 *     "lasso": { "alpha": 0.1, "maxIterations": 1000,
 *                "tolerance": 1e-4, "verbose": false } }
 */
Defaults load_defaults(const nlohmann::json& j);

} // namespace ccdfit
