#include "ccdfit/Defaults.hpp"
#include <cmath>
#include <stdexcept>

namespace ccdfit {

FilterMode filter_mode_from_string(const std::string& s)
{
    if (s == "standard")       return FilterMode::Standard;
    if (s == "clear-or-water") return FilterMode::ClearOrWater;
    throw std::invalid_argument("Unknown filter mode: " + s);
}

std::string to_string(FilterMode m)
{
    return m == FilterMode::Standard ? "standard" : "clear-or-water";
}

/* copy j[key] into `out` when the key exists */
template<typename T>
static void overlay(const nlohmann::json& j, const char* key, T& out)
{
    if (j.contains(key)) out = j.at(key).get<T>();
}

Defaults load_defaults(const nlohmann::json& j)
{
    Defaults d;
    if (j.is_null()) return d;
    if (!j.is_object())
        throw std::runtime_error("load_defaults(): settings must be a JSON object");

    if (j.contains("qa")) {
        const auto& qa = j.at("qa");
        overlay(qa, "clear",  d.qa.clear);
        overlay(qa, "water",  d.qa.water);
        overlay(qa, "shadow", d.qa.shadow);
        overlay(qa, "snow",   d.qa.snow);
        overlay(qa, "cloud",  d.qa.cloud);
        overlay(qa, "fill",   d.qa.fill);
    }

    overlay(j, "clearPctThreshold", d.clear_pct_threshold);
    overlay(j, "snowPctThreshold",  d.snow_pct_threshold);
    overlay(j, "thermalIdx",        d.thermal_idx);
    overlay(j, "minKelvin",         d.min_kelvin);
    overlay(j, "maxKelvin",         d.max_kelvin);
    overlay(j, "avgDaysYr",         d.avg_days_yr);
    overlay(j, "basisCacheSize",    d.basis_cache_size);

    if (j.contains("filter"))
        d.filter = filter_mode_from_string(j.at("filter").get<std::string>());

    if (j.contains("lasso")) {
        const auto& l = j.at("lasso");
        overlay(l, "alpha",         d.lasso.alpha);
        overlay(l, "maxIterations", d.lasso.max_iterations);
        overlay(l, "tolerance",     d.lasso.tolerance);
        overlay(l, "verbose",       d.lasso.verbose);
    }

    /* ---------- sanity checks ------------------------------------------ */
    if (d.thermal_idx < 0)
        throw std::runtime_error("load_defaults(): thermalIdx must be >= 0");
    if (!(d.avg_days_yr > 0.0) || !std::isfinite(d.avg_days_yr))
        throw std::runtime_error("load_defaults(): avgDaysYr must be positive");
    if (d.min_kelvin >= d.max_kelvin)
        throw std::runtime_error("load_defaults(): minKelvin >= maxKelvin");
    if (d.basis_cache_size == 0)
        throw std::runtime_error("load_defaults(): basisCacheSize must be > 0");
    if (d.lasso.alpha < 0.0 || d.lasso.max_iterations <= 0 || d.lasso.tolerance <= 0.0)
        throw std::runtime_error("load_defaults(): invalid lasso settings");

    return d;
}

} // namespace ccdfit
