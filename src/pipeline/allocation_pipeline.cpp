/**
 * @file allocation_pipeline.cpp
 * @brief Implementation of the end-to-end allocation pipeline
 */

#include "pipeline/allocation_pipeline.hpp"
#include "core/errors.hpp"
#include "data/series_normalizer.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "risk/asset_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace advisor
{
    namespace pipeline
    {

        std::string to_string(PipelineStatus status)
        {
            return status == PipelineStatus::OK ? "ok" : "inconsistent_responses";
        }

        // ============================================================================
        // AllocationRequest Implementation
        // ============================================================================

        void AllocationRequest::validate() const
        {
            if (!std::isfinite(amount) || amount <= 0.0)
            {
                throw ValidationError("Investment amount must be positive, got: " + std::to_string(amount));
            }

            if (!std::isfinite(horizon_years) || horizon_years <= 0.0)
            {
                throw ValidationError("Horizon must be positive, got: " + std::to_string(horizon_years));
            }

            if (kyc.has_value() == risk_level.has_value())
            {
                throw ValidationError("Request must carry exactly one of a KYC response or a risk level");
            }

            if (kyc)
            {
                kyc->validate();
            }
        }

        AllocationRequest AllocationRequest::from_json(const nlohmann::json &j)
        {
            AllocationRequest request;
            request.universe = j.value("universe", std::vector<std::string>{});
            request.amount = j.value("amount", 0.0);
            request.horizon_years = j.value("horizon_years", 0.0);

            if (j.contains("kyc"))
            {
                request.kyc = profile::KycResponse::from_json(j.at("kyc"));
            }
            if (j.contains("risk_level"))
            {
                request.risk_level = j.at("risk_level").get<int>();
            }

            request.validate();
            return request;
        }

        // ============================================================================
        // AllocationResult Implementation
        // ============================================================================

        nlohmann::json AllocationResult::to_json() const
        {
            nlohmann::json j;
            j["status"] = to_string(status);
            j["profile"] = risk_profile.to_json();

            nlohmann::json rules = nlohmann::json::array();
            for (const auto &v : violations)
            {
                rules.push_back({{"rule", v.rule},
                                 {"code", v.code},
                                 {"severity", profile::to_string(v.severity)},
                                 {"message", v.message}});
            }
            j["violations"] = rules;
            j["warnings"] = warnings;

            if (status != PipelineStatus::OK)
            {
                return j;
            }

            j["base_currency"] = base_currency;
            j["investment_amount"] = investment_amount;
            j["horizon_years"] = horizon_years;
            j["weights"] = weights;
            j["amounts"] = amounts;
            j["expected_return"] = expected_return;
            j["volatility"] = volatility;
            j["sharpe_ratio"] = sharpe_ratio ? nlohmann::json(*sharpe_ratio) : nlohmann::json(nullptr);
            j["projected_value"] = projected_value;

            if (optimization)
            {
                j["optimization"] = optimization->to_json();
            }
            if (history)
            {
                j["performance"] = history->to_json();
            }

            nlohmann::json dropped_json = nlohmann::json::array();
            for (const auto &d : dropped)
            {
                dropped_json.push_back({{"id", d.id}, {"reason", d.reason}});
            }
            j["dropped"] = dropped_json;
            j["statistics_key"] = statistics_key;
            return j;
        }

        void AllocationResult::print_summary() const
        {
            std::cout << "\n=== Allocation Result ===\n";
            std::cout << "Status: " << to_string(status) << "\n";
            std::cout << "Category: " << profile::category_name(risk_profile.category)
                      << " (risk level " << risk_profile.risk_level << ")\n";
            std::cout << std::string(50, '-') << "\n";

            if (status == PipelineStatus::OK)
            {
                std::cout << std::fixed << std::setprecision(2);
                std::cout << std::left << std::setw(14) << "Asset" << std::right << std::setw(10) << "Weight"
                          << std::setw(18) << ("Amount (" + base_currency + ")") << "\n";
                for (const auto &w : weights)
                {
                    if (w.second <= 0.0)
                        continue;
                    std::cout << std::left << std::setw(14) << w.first << std::right
                              << std::setw(9) << w.second * 100 << "%"
                              << std::setw(18) << amounts.at(w.first) << "\n";
                }
                std::cout << std::string(50, '-') << "\n";
                std::cout << "Expected return:  " << expected_return * 100 << "%\n";
                std::cout << "Volatility:       " << volatility * 100 << "%\n";
                if (sharpe_ratio)
                    std::cout << "Sharpe ratio:     " << std::setprecision(3) << *sharpe_ratio << "\n";
                else
                    std::cout << "Sharpe ratio:     undefined\n";
                std::cout << "Projected value:  " << std::setprecision(2) << projected_value
                          << " after " << horizon_years << " years\n";
            }
            else
            {
                std::cout << "No portfolio: responses are inconsistent\n";
            }

            for (const auto &v : violations)
            {
                std::cout << "  [" << profile::to_string(v.severity) << "] " << v.message << "\n";
            }
            for (const auto &w : warnings)
            {
                std::cout << "  Warning: " << w << "\n";
            }

            std::cout << "=========================\n"
                      << std::endl;
        }

        // ============================================================================
        // AllocationPipeline Implementation
        // ============================================================================

        AllocationPipeline::AllocationPipeline(data::DataContextPtr context,
                                               PipelineConfig config,
                                               std::shared_ptr<StatisticsCache> cache,
                                               std::shared_ptr<const optimizer::QuadraticSolverInterface> solver)
            : context_(std::move(context)),
              config_(std::move(config)),
              cache_(std::move(cache)),
              solver_(std::move(solver)),
              profiler_(config_.profiler_config)
        {
            if (!context_)
            {
                throw ValidationError("AllocationPipeline requires a data context");
            }
            config_.optimizer_config.validate();
            config_.backtest_config.validate();
        }

        void AllocationPipeline::reload(data::DataContextPtr context)
        {
            if (!context)
            {
                throw ValidationError("AllocationPipeline requires a data context");
            }
            context_ = std::move(context);
            if (cache_)
            {
                cache_->invalidate();
            }
        }

        profile::RiskProfile AllocationPipeline::resolve_profile(const AllocationRequest &request) const
        {
            if (request.kyc)
            {
                return profiler_.profile(*request.kyc);
            }
            if (request.risk_level)
            {
                return profiler_.from_risk_level(*request.risk_level);
            }
            throw ValidationError("Request carries neither a KYC response nor a risk level");
        }

        AllocationResult AllocationPipeline::run(const AllocationRequest &request) const
        {
            request.validate();

            AllocationResult result;
            result.investment_amount = request.amount;
            result.horizon_years = request.horizon_years;
            result.base_currency = context_->base_currency();

            // Step 1: profile
            result.risk_profile = resolve_profile(request);
            result.violations = result.risk_profile.violations;

            for (const auto &v : result.risk_profile.warnings())
            {
                result.warnings.push_back(v.message);
            }

            if (result.risk_profile.has_errors())
            {
                result.status = PipelineStatus::INCONSISTENT_RESPONSES;
                for (const auto &v : result.risk_profile.errors())
                {
                    std::cerr << "Warning: blocking consistency rule " << v.code << ": " << v.message << "\n";
                }
                return result;
            }

            // Step 2: normalize (sorted ids so statistics order matches the cache key)
            std::vector<std::string> ids = request.universe.empty() ? context_->asset_ids() : request.universe;
            std::sort(ids.begin(), ids.end());

            const data::SeriesNormalizer normalizer(config_.data_config.normalizer);
            const data::NormalizedUniverse universe = normalizer.normalize(*context_, ids);
            result.dropped = universe.report.dropped;
            result.warnings.insert(result.warnings.end(),
                                   universe.report.warnings.begin(), universe.report.warnings.end());

            // Step 3: statistics
            std::map<std::string, std::string> asset_classes;
            std::map<std::string, std::string> currencies;
            for (const auto &id : universe.tickers)
            {
                const data::AssetEntry &entry = context_->asset(id);
                asset_classes[id] = entry.asset_class;
                currencies[id] = entry.series.currency();
            }

            const risk::StatisticsEngine engine;
            auto compute = [&engine, &universe, &asset_classes, &currencies]()
            {
                return engine.compute(universe, asset_classes, currencies);
            };

            result.statistics_key = StatisticsCache::make_key(universe);
            std::shared_ptr<const risk::AssetStatistics> stats =
                cache_ ? cache_->get_or_compute(result.statistics_key, compute)
                       : std::make_shared<const risk::AssetStatistics>(compute());
            result.warnings.insert(result.warnings.end(), stats->warnings.begin(), stats->warnings.end());

            // Step 4: optimize
            const optimizer::AllocationConstraints constraints =
                optimizer::AllocationConstraints::from_profile(result.risk_profile, config_.optimizer_config, request.horizon_years);
            const optimizer::MeanVarianceOptimizer allocator(solver_);
            optimizer::OptimizationResult optimized = allocator.optimize(*stats, constraints);
            result.warnings.insert(result.warnings.end(), optimized.warnings.begin(), optimized.warnings.end());

            result.weights = optimized.weight_map();
            for (const auto &w : result.weights)
            {
                result.amounts[w.first] = w.second * request.amount;
            }
            result.expected_return = optimized.expected_return;
            result.volatility = optimized.volatility;
            result.sharpe_ratio = optimized.sharpe_ratio;
            result.projected_value = request.amount * std::pow(1.0 + optimized.expected_return, request.horizon_years);

            // Step 5: historical replay
            const backtest::PerformanceReconstructor reconstructor(config_.backtest_config.rebalance_interval_months);
            backtest::PerformanceHistory history = reconstructor.reconstruct(result.weights, universe, request.amount);

            const profile::CategoryConstraints &limits = result.risk_profile.constraints();
            if (history.max_drawdown > limits.max_drawdown)
            {
                std::ostringstream warning;
                warning << std::fixed << std::setprecision(1) << "Historical max drawdown "
                        << history.max_drawdown * 100 << "% exceeds the " << limits.max_drawdown * 100
                        << "% limit of the " << limits.name << " category";
                std::cerr << "Warning: " << warning.str() << "\n";
                result.warnings.push_back(warning.str());
            }

            result.optimization = std::move(optimized);
            result.history = std::move(history);
            result.status = PipelineStatus::OK;
            return result;
        }

    } // namespace pipeline
} // namespace advisor
