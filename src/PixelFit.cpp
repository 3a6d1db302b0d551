#include "ccdfit/PixelFit.hpp"
#include "ccdfit/QualityFilter.hpp"

#include <exception>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ccdfit {

void validate_series(const PixelSeries& s)
{
    const auto n = static_cast<Eigen::Index>(s.dates.size());
    if (s.observations.cols() != n)
        throw std::invalid_argument("validate_series(): " + std::to_string(n)
                                    + " dates but " + std::to_string(s.observations.cols())
                                    + " observation columns");
    if (s.quality.size() != n)
        throw std::invalid_argument("validate_series(): " + std::to_string(n)
                                    + " dates but " + std::to_string(s.quality.size())
                                    + " quality codes");
    if (!s.observations.allFinite())
        throw std::invalid_argument("validate_series(): observations contain NaN/Inf");
}

Matrix select_columns(const Matrix& m, const Mask& mask)
{
    Matrix out(m.rows(), mask.count());
    Eigen::Index k = 0;
    for (Eigen::Index j = 0; j < m.cols(); ++j)
        if (mask[j]) out.col(k++) = m.col(j);
    return out;
}

Dates select_dates(const Dates& d, const Mask& mask)
{
    Dates out;
    out.reserve(static_cast<std::size_t>(mask.count()));
    for (std::size_t i = 0; i < d.size(); ++i)
        if (mask[static_cast<Eigen::Index>(i)]) out.push_back(d[i]);
    return out;
}

PixelFit fit_pixel(const PixelSeries& series,
                   const Defaults&    cfg,
                   int                degrees_of_freedom,
                   ThreadPool*        pool,
                   BasisCache&        cache)
{
    validate_series(series);

    PixelFit out;
    out.clear_ratio = ratio_clear(series.quality, cfg.qa);
    out.snow_ratio  = ratio_snow(series.quality, cfg.qa);
    out.usable      = observation_filter(series.observations, series.quality, cfg);

    if (cfg.lasso.verbose)
        std::cout << "[ccdfit] " << out.usable.count() << " of " << series.dates.size()
                  << " observations pass the " << to_string(cfg.filter) << " filter"
                  << std::endl;

    if (out.usable.count() == 0)
        throw FitError("fit_pixel(): no usable observations after "
                       + to_string(cfg.filter) + " filtering");

    out.dates = select_dates(series.dates, out.usable);
    const Matrix obs = select_columns(series.observations, out.usable);

    auto fit_band = [&](Eigen::Index b) {
        const Vector y = obs.row(b).transpose();
        return fitted_model(out.dates, y, degrees_of_freedom,
                            cfg.lasso, cfg.avg_days_yr, cache);
    };

    out.bands.reserve(static_cast<std::size_t>(obs.rows()));
    if (pool == nullptr) {
        for (Eigen::Index b = 0; b < obs.rows(); ++b)
            out.bands.push_back(fit_band(b));
        return out;
    }

    std::vector<std::future<FittedModel>> pending;
    pending.reserve(static_cast<std::size_t>(obs.rows()));
    for (Eigen::Index b = 0; b < obs.rows(); ++b)
        pending.push_back(pool->enqueue(fit_band, b));

    // every future is waited on before `obs` / `out.dates` can go away
    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            out.bands.push_back(f.get());
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
    return out;
}

} // namespace ccdfit
