#pragma once
#include "CommonTypes.hpp"
#include "Defaults.hpp"
#include "FittedModel.hpp"
#include "ThreadPool.hpp"
#include <vector>

namespace ccdfit {

struct PixelFit {
    Mask                     usable;        // composite filter over all observations
    Dates                    dates;         // dates of the usable observations
    double                   clear_ratio = 0.0;
    double                   snow_ratio  = 0.0;
    std::vector<FittedModel> bands;         // one fit per observation row
};

/* check that dates, observation columns and quality codes line up */
void validate_series(const PixelSeries& series);

/* keep only the columns (or entries) where `mask` is true */
Matrix select_columns(const Matrix& m, const Mask& mask);
Dates  select_dates(const Dates& d, const Mask& mask);

/*
 * Filter the series with the configured composite filter, then fit every
 * band against the usable observations.  Bands are fitted on `pool` when
 * one is given.  Throws FitError if no observation survives the filter or
 * a band does not converge.
 */
PixelFit fit_pixel(const PixelSeries& series,
                   const Defaults&    cfg,
                   int                degrees_of_freedom = 4,
                   ThreadPool*        pool               = nullptr,
                   BasisCache&        cache              = BasisCache::instance());

} // namespace ccdfit
