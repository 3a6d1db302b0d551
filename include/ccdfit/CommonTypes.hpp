#pragma once
#include "Types.hpp"

namespace ccdfit {

// One pixel's time series, all members aligned on the observation axis
struct PixelSeries {
    Dates          dates;          // ordinal days, chronological
    Matrix         observations;   // bands x observations (unscaled)
    QualityVector  quality;        // CFMask code per observation
};

} // namespace ccdfit
