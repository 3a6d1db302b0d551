#include "ccdfit/JsonUtils.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <vector>

namespace ccdfit {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot open '" + path + "'");
    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in '" + path + "': " + e.what());
    }
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

/* ------------------------------------------------------------------ */
static Vector to_eigen(const std::vector<Real>& v)
{ return Eigen::Map<const Vector>(v.data(), static_cast<Eigen::Index>(v.size())); }

static std::vector<Real> to_std(const Vector& v)
{ return std::vector<Real>(v.data(), v.data() + v.size()); }

PixelSeries pixel_series_from_json(const nlohmann::json& j)
{
    for (const char* key : {"dates", "observations", "quality"})
        if (!j.contains(key))
            throw std::runtime_error(std::string("pixel series: missing \"") + key + "\"");

    PixelSeries s;
    s.dates = j.at("dates").get<Dates>();

    const auto bands = j.at("observations").get<std::vector<std::vector<Real>>>();
    const auto n     = static_cast<Eigen::Index>(s.dates.size());
    s.observations.resize(static_cast<Eigen::Index>(bands.size()), n);
    for (std::size_t b = 0; b < bands.size(); ++b) {
        if (static_cast<Eigen::Index>(bands[b].size()) != n)
            throw std::runtime_error("pixel series: band " + std::to_string(b) + " has "
                                     + std::to_string(bands[b].size()) + " values, expected "
                                     + std::to_string(n));
        s.observations.row(static_cast<Eigen::Index>(b)) = to_eigen(bands[b]).transpose();
    }

    const auto q = j.at("quality").get<std::vector<int>>();
    s.quality = Eigen::Map<const QualityVector>(q.data(), static_cast<Eigen::Index>(q.size()));
    return s;
}

/* ------------------------------------------------------------------ */
nlohmann::json to_json(const FittedModel& fit)
{
    nlohmann::json j;
    j["intercept"]    = fit.model.intercept;
    j["coefficients"] = to_std(fit.model.coef);
    j["rmse"]         = fit.rmse;
    j["residual"]     = to_std(fit.residual);
    j["iterations"]   = fit.model.summary.iterations;
    j["dualGap"]      = fit.model.summary.dual_gap;
    return j;
}

nlohmann::json to_json(const PixelFit& fit)
{
    nlohmann::json j;
    j["observations"] = fit.usable.size();
    j["usable"]       = fit.usable.count();
    j["dates"]        = fit.dates;
    // NaN is not representable in JSON
    j["clearRatio"]   = std::isnan(fit.clear_ratio) ? nlohmann::json(nullptr)
                                                    : nlohmann::json(fit.clear_ratio);
    j["snowRatio"]    = fit.snow_ratio;
    j["bands"]        = nlohmann::json::array();
    for (const auto& b : fit.bands) j["bands"].push_back(to_json(b));
    return j;
}

} // namespace ccdfit
