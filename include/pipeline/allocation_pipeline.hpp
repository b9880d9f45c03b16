/**
 * @file allocation_pipeline.hpp
 * @brief End-to-end allocation: profile, normalize, estimate, optimize, replay
 *
 * Data flows strictly one way:
 *
 *   KYC / risk level -> RiskProfile ------------------------------+
 *                                                                 v
 *   DataContext -> NormalizedUniverse -> AssetStatistics -> optimizer -> weights
 *                         |                                                 |
 *                         +-----------> PerformanceReconstructor <----------+
 *
 * A profile with an error-severity consistency rule stops the run before
 * any data is touched and is returned as INCONSISTENT_RESPONSES.
 */

#pragma once

#include "backtest/performance_reconstructor.hpp"
#include "data/data_context.hpp"
#include "optimizer/allocation_constraints.hpp"
#include "optimizer/quadratic_solver.hpp"
#include "pipeline/pipeline_config.hpp"
#include "pipeline/statistics_cache.hpp"
#include "profile/kyc_response.hpp"
#include "profile/risk_profiler.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace advisor
{
    namespace pipeline
    {

        enum class PipelineStatus
        {
            OK,
            INCONSISTENT_RESPONSES ///< Error-severity KYC rule fired; no portfolio produced
        };

        std::string to_string(PipelineStatus status);

        /**
         * @struct AllocationRequest
         * @brief One allocation request
         *
         * Exactly one of kyc and risk_level must be set.
         */
        struct AllocationRequest
        {
            std::vector<std::string> universe;      ///< Asset ids; empty = every asset in the data context
            double amount = 0.0;                    ///< Investment amount in base currency
            double horizon_years = 0.0;             ///< Investment horizon
            std::optional<profile::KycResponse> kyc;
            std::optional<int> risk_level;          ///< Pre-resolved level, 1-10

            /**
             * @throws ValidationError on non-positive amount or horizon, or when
             *         not exactly one of kyc / risk_level is given
             */
            void validate() const;

            static AllocationRequest from_json(const nlohmann::json &j);
        };

        /**
         * @struct AllocationResult
         * @brief Everything returned to the caller for one request
         */
        struct AllocationResult
        {
            PipelineStatus status = PipelineStatus::OK;
            profile::RiskProfile risk_profile;
            std::vector<profile::RuleViolation> violations; ///< All triggered rules

            std::map<std::string, double> weights;          ///< Asset id -> fraction
            std::map<std::string, double> amounts;          ///< Asset id -> base currency amount
            double investment_amount = 0.0;
            double horizon_years = 0.0;
            double expected_return = 0.0;                   ///< Annualized, portfolio
            double volatility = 0.0;                        ///< Annualized, portfolio
            std::optional<double> sharpe_ratio;
            double projected_value = 0.0;                   ///< amount * (1 + expected_return)^horizon

            std::optional<optimizer::OptimizationResult> optimization;
            std::optional<backtest::PerformanceHistory> history;
            std::string base_currency;
            std::string statistics_key;
            std::vector<data::DroppedAsset> dropped;
            std::vector<std::string> warnings;

            bool ok() const { return status == PipelineStatus::OK; }

            nlohmann::json to_json() const;

            void print_summary() const;
        };

        /**
         * @class AllocationPipeline
         * @brief Runs allocation requests against an injected, read-only data context
         *
         * Usage Example:
         * @code
         * PipelineConfig config = load_pipeline_config("config.json");
         * auto context = data::DataLoader::load_context(config.data_config);
         * AllocationPipeline pipeline(context, config, std::make_shared<StatisticsCache>());
         *
         * AllocationRequest request;
         * request.amount = 100000.0;
         * request.horizon_years = 10.0;
         * request.risk_level = 5;
         * AllocationResult result = pipeline.run(request);
         * @endcode
         *
         * Thread Safety: run() is const and may be called concurrently; the
         * cache is the only shared mutable object. reload() must not race with run().
         */
        class AllocationPipeline
        {
        public:
            /**
             * @param context Loaded source data (required)
             * @param config Pipeline configuration
             * @param cache Shared statistics cache; statistics are recomputed per run when null
             * @param solver QP strategy for the optimizer; OSQP when null
             * @throws ValidationError if context is null
             */
            AllocationPipeline(data::DataContextPtr context,
                               PipelineConfig config,
                               std::shared_ptr<StatisticsCache> cache = nullptr,
                               std::shared_ptr<const optimizer::QuadraticSolverInterface> solver = nullptr);

            /**
             * @brief Run one request
             * @return OK result, or INCONSISTENT_RESPONSES carrying the rule violations
             * @throws ValidationError for bad requests or unknown asset ids
             * @throws DataError, InfeasibleConstraintsError, SolverError as raised by the stages
             */
            AllocationResult run(const AllocationRequest &request) const;

            /**
             * @brief Resolve the request's profile input
             */
            profile::RiskProfile resolve_profile(const AllocationRequest &request) const;

            /**
             * @brief Replace the data context after a reload and invalidate the cache
             */
            void reload(data::DataContextPtr context);

            const data::DataContext &context() const { return *context_; }
            const PipelineConfig &config() const { return config_; }
            const std::shared_ptr<StatisticsCache> &cache() const { return cache_; }

        private:
            data::DataContextPtr context_;
            PipelineConfig config_;
            std::shared_ptr<StatisticsCache> cache_;
            std::shared_ptr<const optimizer::QuadraticSolverInterface> solver_;
            profile::RiskProfiler profiler_;
        };

    } // namespace pipeline
} // namespace advisor
