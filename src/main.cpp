#include "ccdfit/JsonUtils.hpp"
#include "ccdfit/Defaults.hpp"
#include "ccdfit/BasisCache.hpp"
#include "ccdfit/PixelFit.hpp"
#include "ccdfit/ThreadPool.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace ccdfit;

// Locate ccd_settings.json when --config is not given; nullopt = built-in defaults
static std::optional<std::string> find_settings_file()
{
    std::vector<std::string> search_paths = { "ccd_settings.json" };

    std::error_code ec;
    auto exe_path = fs::canonical("/proc/self/exe", ec);
    if (!ec) search_paths.push_back((exe_path.parent_path() / "ccd_settings.json").string());

    for (const auto& path : search_paths)
        if (fs::exists(path)) return path;
    return std::nullopt;
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("ccdfit", "Harmonic Lasso fit of one pixel's time series");
        opts.add_options()
            ("i,input", "Pixel time series JSON", cxxopts::value<std::string>())
            ("c,config", "Settings JSON (QA codes, thresholds, lasso)", cxxopts::value<std::string>())
            ("o,output", "Write the result JSON here instead of stdout", cxxopts::value<std::string>())
            ("df", "Degrees of freedom (4, 6 or 8)", cxxopts::value<int>()->default_value("4"))
            ("filter", "standard | clear-or-water", cxxopts::value<std::string>())
            ("threads", "Number of threads (0 = all cores, 1 = serial)", cxxopts::value<int>()->default_value("1"))
            ("cache-size", "Maximum number of cached design matrices", cxxopts::value<int>())
            ("v,verbose", "Print progress to stdout (combine with --output)")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("input")) {
            std::cout << opts.help() << '\n';
            return 0;
        }
        const bool verbose = cli.count("verbose") > 0;

        /* ---------- settings ------------------------------------------- */
        std::optional<std::string> settings_path;
        if (cli.count("config")) settings_path = cli["config"].as<std::string>();
        else                     settings_path = find_settings_file();

        Defaults cfg;
        if (settings_path) {
            auto settings = load_json(*settings_path);
            expand_env(settings);
            cfg = load_defaults(settings);
            if (verbose) std::cout << "[ccdfit] Loaded settings from: " << *settings_path << std::endl;
        }
        if (cli.count("filter"))     cfg.filter = filter_mode_from_string(cli["filter"].as<std::string>());
        if (cli.count("cache-size")) cfg.basis_cache_size = static_cast<std::size_t>(cli["cache-size"].as<int>());
        if (verbose)                 cfg.lasso.verbose = true;

        BasisCache::instance().set_capacity(cfg.basis_cache_size);

        /* ---------- input ---------------------------------------------- */
        auto input = load_json(cli["input"].as<std::string>());
        const PixelSeries series = pixel_series_from_json(input);
        if (verbose)
            std::cout << "[ccdfit] Loaded: " << fs::path(cli["input"].as<std::string>()).filename()
                      << " (" << series.observations.rows() << " bands, "
                      << series.dates.size() << " observations)" << std::endl;

        /* ---------- fit ------------------------------------------------- */
        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());

        std::unique_ptr<ThreadPool> pool;
        if (nthreads > 1) {
            pool = std::make_unique<ThreadPool>(static_cast<unsigned>(nthreads));
            Eigen::setNbThreads(1);          // parallelism is per band
        }

        const PixelFit fit = fit_pixel(series, cfg, cli["df"].as<int>(), pool.get());

        /* ---------- output ---------------------------------------------- */
        const std::string dump = to_json(fit).dump(2);
        if (cli.count("output")) {
            const auto out_path = cli["output"].as<std::string>();
            std::ofstream out(out_path);
            if (!out) throw std::runtime_error("Cannot write '" + out_path + "'");
            out << dump << '\n';
        } else {
            std::cout << dump << '\n';
        }

        if (verbose) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
            std::cout << "[ccdfit] Done in " << elapsed.count() << " ms" << std::endl;
        }
        return 0;
    }
    catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
}
