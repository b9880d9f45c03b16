/**
 * @file pipeline_config.hpp
 * @brief Top-level JSON configuration of the allocation pipeline
 *
 * Layout:
 * @code
 * {
 *   "data":      { "data_dir": "...", "base_currency": "ILS", "assets": [...], ... },
 *   "optimizer": { "max_single_asset": 0.4, "dust_policy": "zero", ... },
 *   "profiler":  { "weights": {...}, "thresholds": {...} },
 *   "backtest":  { "rebalance_interval_months": 1 },
 *   "cache":     { "path": "stats_cache.json" }
 * }
 * @endcode
 * Every section except "data" is optional and falls back to defaults.
 */

#pragma once

#include "backtest/performance_reconstructor.hpp"
#include "data/data_loader.hpp"
#include "optimizer/allocation_constraints.hpp"
#include "profile/risk_profiler.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace advisor
{
    namespace pipeline
    {

        struct PipelineConfig
        {
            data::DataConfig data_config;
            optimizer::OptimizerConfig optimizer_config;
            profile::ProfilerConfig profiler_config;
            backtest::BacktestConfig backtest_config;
            std::string cache_path; ///< Persisted statistics artifact; empty disables persistence

            /**
             * @brief Parse configuration
             * @throws ValidationError on missing sections or invalid values
             */
            static PipelineConfig from_json(const nlohmann::json &j);
        };

        /**
         * @brief Load configuration from a JSON file
         *
         * Relative data_dir and cache paths resolve against the directory of
         * the configuration file.
         *
         * @throws std::runtime_error if the file cannot be read or parsed
         * @throws ValidationError on invalid values
         */
        PipelineConfig load_pipeline_config(const std::string &path);

    } // namespace pipeline
} // namespace advisor
