#pragma once
#include "Types.hpp"
#include "Defaults.hpp"

/*
 *  Filters for pre-processing change-model inputs.
 *
 *  `quality` holds one CFMask category per observation, `observations` is
 *  band-major (rows = bands, columns = observations) and carries unscaled
 *  integer magnitudes.  Every function is pure; masks have one entry per
 *  observation.
 */
namespace ccdfit {

/* ---------- single-category masks ------------------------------------ */
Mask mask_snow (const QualityVector& quality, int snow  = QA_SNOW);
Mask mask_clear(const QualityVector& quality, int clear = QA_CLEAR);
Mask mask_water(const QualityVector& quality, int water = QA_WATER);
Mask mask_fill (const QualityVector& quality, int fill  = QA_FILL);

Mask mask_clear_or_water(const QualityVector& quality, const QaCodes& codes = {});

/* ---------- counts ---------------------------------------------------- */
int count_clear_or_water(const QualityVector& quality, const QaCodes& codes = {});
int count_fill          (const QualityVector& quality, const QaCodes& codes = {});
int count_snow          (const QualityVector& quality, const QaCodes& codes = {});
int count_total         (const QualityVector& quality, const QaCodes& codes = {});   // non-fill

/* ---------- ratios ---------------------------------------------------- */

/* clear-or-water / non-fill.  Quiet NaN when every observation is fill. */
double ratio_clear(const QualityVector& quality, const QaCodes& codes = {});

/* snow / (clear-or-water + snow + 0.01); the 0.01 keeps an all-fill input
 * finite (result 0).                                                      */
double ratio_snow(const QualityVector& quality, const QaCodes& codes = {});

bool enough_clear(const QualityVector& quality,
                  double threshold = CLEAR_PCT_THRESHOLD,
                  const QaCodes& codes = {});
bool enough_snow (const QualityVector& quality,
                  double threshold = SNOW_PCT_THRESHOLD,
                  const QaCodes& codes = {});

/* ---------- range filters --------------------------------------------- */

/* true where bands 0..5 all lie strictly inside (0, 10000) */
Mask filter_saturated(const Matrix& observations);

/* Thresholds are Kelvin; the data is Kelvin x 10, so the bounds are scaled
 * before the (strict) comparison.                                          */
Mask filter_thermal(const Vector& thermal,
                    double min_kelvin = MIN_KELVIN,
                    double max_kelvin = MAX_KELVIN);

/* ---------- composite filters ----------------------------------------- */

/*
 * (quality == clear) AND (quality == water).
 *
 * KNOWN DEFECT: a code cannot equal two distinct values at once, so with
 * the CFMask codes this is always all-false.  Kept as-is; the OR form lives
 * in mask_clear_or_water() / clear_or_water_filter().
 */
Mask clear_index(const QualityVector& quality,
                 int clear = QA_CLEAR,
                 int water = QA_WATER);

/* clear_index AND filter_thermal AND filter_saturated (inherits the defect) */
Mask standard_filter(const Matrix&        observations,
                     const QualityVector& quality,
                     int                  thermal_idx = THERMAL_IDX,
                     const QaCodes&       codes       = {},
                     double               min_kelvin  = MIN_KELVIN,
                     double               max_kelvin  = MAX_KELVIN);

/* mask_clear_or_water AND filter_thermal AND filter_saturated */
Mask clear_or_water_filter(const Matrix&        observations,
                           const QualityVector& quality,
                           int                  thermal_idx = THERMAL_IDX,
                           const QaCodes&       codes       = {},
                           double               min_kelvin  = MIN_KELVIN,
                           double               max_kelvin  = MAX_KELVIN);

/* dispatch on the configured FilterMode */
Mask observation_filter(const Matrix&        observations,
                        const QualityVector& quality,
                        const Defaults&      cfg);

} // namespace ccdfit
