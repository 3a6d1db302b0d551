#pragma once
#include "CommonTypes.hpp"
#include "PixelFit.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ccdfit {
nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

/*  { "dates": [n ints], "observations": [[n numbers] per band],
 *    "quality": [n ints] }                                               */
PixelSeries pixel_series_from_json(const nlohmann::json& j);

nlohmann::json to_json(const FittedModel& fit);
nlohmann::json to_json(const PixelFit& fit);
} // namespace ccdfit
