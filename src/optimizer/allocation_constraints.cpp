/**
 * @file allocation_constraints.cpp
 * @brief Implementation of optimizer configuration, constraints and result
 */

#include "optimizer/allocation_constraints.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace advisor
{
    namespace optimizer
    {

        DustPolicy parse_dust_policy(const std::string &text)
        {
            std::string lower;
            for (unsigned char c : text)
            {
                lower.push_back(static_cast<char>(std::tolower(c)));
            }

            if (lower == "zero")
                return DustPolicy::ZERO;
            if (lower == "floor")
                return DustPolicy::FLOOR;

            throw ValidationError("Unknown dust policy: '" + text + "' (expected zero or floor)");
        }

        std::string to_string(DustPolicy policy)
        {
            return policy == DustPolicy::ZERO ? "zero" : "floor";
        }

        // ============================================================================
        // ClassLimit Implementation
        // ============================================================================

        bool ClassLimit::matches(const std::string &asset_class, bool foreign) const
        {
            if (foreign_only && !foreign)
            {
                return false;
            }
            return asset_classes.empty() ||
                   std::find(asset_classes.begin(), asset_classes.end(), asset_class) != asset_classes.end();
        }

        void ClassLimit::validate() const
        {
            if (min_weight < 0.0 || max_weight > 1.0 || min_weight > max_weight)
            {
                throw ValidationError("Class limit '" + name + "' bounds [" + std::to_string(min_weight) + ", " +
                                      std::to_string(max_weight) + "] are not a sub-range of [0, 1]");
            }

            if (asset_classes.empty() && !foreign_only)
            {
                throw ValidationError("Class limit '" + name + "' must list asset_classes or set foreign_only");
            }
        }

        ClassLimit ClassLimit::from_json(const nlohmann::json &j)
        {
            ClassLimit limit;
            limit.name = j.value("name", std::string());
            if (j.contains("asset_classes"))
            {
                limit.asset_classes = j.at("asset_classes").get<std::vector<std::string>>();
            }
            limit.foreign_only = j.value("foreign_only", limit.foreign_only);
            limit.min_weight = j.value("min", limit.min_weight);
            limit.max_weight = j.value("max", limit.max_weight);

            if (limit.name.empty())
            {
                for (const auto &c : limit.asset_classes)
                {
                    limit.name += (limit.name.empty() ? "" : "+") + c;
                }
                if (limit.foreign_only)
                {
                    limit.name = limit.name.empty() ? "foreign" : "foreign " + limit.name;
                }
            }

            limit.validate();
            return limit;
        }

        // ============================================================================
        // OptimizerConfig Implementation
        // ============================================================================

        void OptimizerConfig::validate() const
        {
            if (max_single_asset <= 0.0 || max_single_asset > 1.0)
            {
                throw ValidationError("max_single_asset must be in (0, 1], got: " +
                                      std::to_string(max_single_asset));
            }

            if (min_weight_threshold < 0.0 || min_weight_threshold > max_single_asset)
            {
                throw ValidationError("min_weight_threshold must be in [0, max_single_asset], got: " +
                                      std::to_string(min_weight_threshold));
            }

            if (risk_aversion_coefficient <= 0.0)
            {
                throw ValidationError("risk_aversion_coefficient must be positive, got: " +
                                      std::to_string(risk_aversion_coefficient));
            }

            if (tolerance <= 0.0 || max_iterations <= 0)
            {
                throw ValidationError("Solver tolerance and max_iterations must be positive");
            }

            if (time_limit_seconds < 0.0)
            {
                throw ValidationError("time_limit_seconds must be non-negative");
            }

            if (short_horizon_max_equity < 0.0 || short_horizon_max_equity > 1.0)
            {
                throw ValidationError("short_horizon_max_equity must be in [0, 1]");
            }

            if (equity_classes.empty())
            {
                throw ValidationError("equity_classes must name at least one asset class");
            }

            for (const auto &limit : class_limits)
            {
                limit.validate();
            }
        }

        OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &j)
        {
            OptimizerConfig config;

            config.max_single_asset = j.value("max_single_asset", config.max_single_asset);
            config.min_weight_threshold = j.value("min_weight_threshold", config.min_weight_threshold);
            config.dust_policy = parse_dust_policy(j.value("dust_policy", std::string("zero")));
            config.risk_aversion_coefficient = j.value("risk_aversion_coefficient", config.risk_aversion_coefficient);
            config.tolerance = j.value("tolerance", config.tolerance);
            config.max_iterations = j.value("max_iterations", config.max_iterations);
            config.time_limit_seconds = j.value("time_limit_seconds", config.time_limit_seconds);
            config.short_horizon_years = j.value("short_horizon_years", config.short_horizon_years);
            config.short_horizon_max_equity = j.value("short_horizon_max_equity", config.short_horizon_max_equity);
            config.verbose = j.value("verbose", config.verbose);

            config.limit_international = j.value("limit_international", config.limit_international);

            if (j.contains("equity_classes"))
            {
                config.equity_classes = j.at("equity_classes").get<std::vector<std::string>>();
            }

            if (j.contains("alternative_classes"))
            {
                config.alternative_classes = j.at("alternative_classes").get<std::vector<std::string>>();
            }

            if (j.contains("class_limits"))
            {
                for (const auto &entry : j.at("class_limits"))
                {
                    config.class_limits.push_back(ClassLimit::from_json(entry));
                }
            }

            config.validate();
            return config;
        }

        // ============================================================================
        // AllocationConstraints Implementation
        // ============================================================================

        bool AllocationConstraints::is_equity(const std::string &asset_class) const
        {
            return std::find(equity_classes.begin(), equity_classes.end(), asset_class) != equity_classes.end();
        }

        void AllocationConstraints::validate() const
        {
            if (min_equity < 0.0 || max_equity > 1.0 || min_equity > max_equity)
            {
                throw ValidationError("Equity band [" + std::to_string(min_equity) + ", " +
                                      std::to_string(max_equity) + "] is not a sub-range of [0, 1]");
            }

            if (max_single_asset <= 0.0 || max_single_asset > 1.0)
            {
                throw ValidationError("max_single_asset must be in (0, 1], got: " +
                                      std::to_string(max_single_asset));
            }

            if (min_weight_threshold < 0.0 || min_weight_threshold > max_single_asset)
            {
                throw ValidationError("min_weight_threshold must be in [0, max_single_asset]");
            }

            if (target_volatility <= 0.0 || risk_aversion_coefficient <= 0.0)
            {
                throw ValidationError("target_volatility and risk_aversion_coefficient must be positive");
            }

            for (const auto &limit : class_limits)
            {
                limit.validate();
            }
        }

        AllocationConstraints AllocationConstraints::from_category(profile::RiskCategory category,
                                                                   const OptimizerConfig &config,
                                                                   double horizon_years)
        {
            if (!std::isfinite(horizon_years) || horizon_years <= 0.0)
            {
                throw ValidationError("Horizon must be positive, got: " + std::to_string(horizon_years));
            }

            const profile::CategoryConstraints &limits = profile::category_constraints(category);

            AllocationConstraints constraints;
            constraints.category = category;
            constraints.target_volatility = limits.target_volatility;
            constraints.max_drawdown = limits.max_drawdown;
            constraints.min_equity = limits.min_equity;
            constraints.max_equity = limits.max_equity;
            constraints.max_single_asset = config.max_single_asset;
            constraints.min_weight_threshold = config.min_weight_threshold;
            constraints.dust_policy = config.dust_policy;
            constraints.risk_aversion_coefficient = config.risk_aversion_coefficient;
            constraints.equity_classes = config.equity_classes;

            if (!config.alternative_classes.empty())
            {
                ClassLimit alternatives;
                alternatives.name = "alternatives";
                alternatives.asset_classes = config.alternative_classes;
                alternatives.max_weight = limits.alternatives_max;
                constraints.class_limits.push_back(alternatives);
            }
            if (config.limit_international)
            {
                ClassLimit international;
                international.name = "international";
                international.foreign_only = true;
                international.max_weight = limits.international_max;
                constraints.class_limits.push_back(international);
            }
            constraints.class_limits.insert(constraints.class_limits.end(),
                                            config.class_limits.begin(), config.class_limits.end());

            constraints.solver_options.tolerance = config.tolerance;
            constraints.solver_options.max_iterations = config.max_iterations;
            constraints.solver_options.time_limit_seconds = config.time_limit_seconds;
            constraints.solver_options.verbose = config.verbose;

            if (horizon_years < config.short_horizon_years)
            {
                constraints.max_equity = std::max(limits.min_equity,
                                                  std::min(limits.max_equity, config.short_horizon_max_equity));
            }

            constraints.validate();
            return constraints;
        }

        AllocationConstraints AllocationConstraints::from_profile(const profile::RiskProfile &risk_profile,
                                                                  const OptimizerConfig &config,
                                                                  double horizon_years)
        {
            if (risk_profile.has_errors())
            {
                std::string codes;
                for (const auto &violation : risk_profile.errors())
                {
                    codes += (codes.empty() ? "" : ", ") + violation.code;
                }
                throw ValidationError("Risk profile is not eligible for optimization: " + codes);
            }

            return from_category(risk_profile.category, config, horizon_years);
        }

        // ============================================================================
        // OptimizationResult Implementation
        // ============================================================================

        std::map<std::string, double> OptimizationResult::weight_map() const
        {
            std::map<std::string, double> out;
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                out[tickers[i]] = weights(static_cast<Eigen::Index>(i));
            }
            return out;
        }

        size_t OptimizationResult::num_positions(double threshold) const
        {
            size_t count = 0;
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (weights(i) > threshold)
                {
                    ++count;
                }
            }
            return count;
        }

        nlohmann::json OptimizationResult::to_json() const
        {
            nlohmann::json j;
            nlohmann::json w = nlohmann::json::object();
            nlohmann::json rc = nlohmann::json::object();
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                const auto idx = static_cast<Eigen::Index>(i);
                w[tickers[i]] = weights(idx);
                if (risk_contributions.size() == weights.size())
                {
                    rc[tickers[i]] = risk_contributions(idx);
                }
            }
            j["weights"] = w;
            j["risk_contributions"] = rc;
            j["expected_return"] = expected_return;
            j["volatility"] = volatility;
            j["sharpe_ratio"] = sharpe_ratio ? nlohmann::json(*sharpe_ratio) : nlohmann::json(nullptr);
            j["equity_weight"] = equity_weight;
            j["class_weights"] = class_weights;
            j["herfindahl_index"] = herfindahl_index;
            j["iterations"] = iterations;
            j["attempts"] = attempts;
            j["message"] = message;
            j["warnings"] = warnings;
            return j;
        }

        void OptimizationResult::print_summary() const
        {
            std::cout << "\n=== Optimization Result ===\n";
            std::cout << "Status: " << message << "\n";
            std::cout << "Iterations: " << iterations << " (" << attempts << " solve"
                      << (attempts == 1 ? "" : "s") << ")\n";
            std::cout << std::string(50, '-') << "\n";

            std::cout << "Portfolio Statistics:\n";
            std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                      << expected_return * 100 << "%\n";
            std::cout << "  Volatility:       " << volatility * 100 << "%\n";
            if (sharpe_ratio)
            {
                std::cout << "  Sharpe Ratio:     " << std::setprecision(3) << *sharpe_ratio << "\n";
            }
            else
            {
                std::cout << "  Sharpe Ratio:     undefined\n";
            }
            std::cout << "  Equity Weight:    " << std::setprecision(2) << equity_weight * 100 << "%\n";
            for (const auto &group : class_weights)
            {
                std::cout << "  " << std::left << std::setw(18) << (group.first + ":") << std::right
                          << group.second * 100 << "%\n";
            }
            std::cout << "  HHI:              " << std::setprecision(4) << herfindahl_index << "\n";

            std::cout << "\nWeights:\n";
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                const auto idx = static_cast<Eigen::Index>(i);
                std::cout << "  " << std::left << std::setw(12) << tickers[i] << std::right
                          << std::setw(8) << std::setprecision(2) << weights(idx) * 100 << "%";
                if (risk_contributions.size() == weights.size())
                {
                    std::cout << "   risk " << std::setw(7) << risk_contributions(idx) * 100 << "%";
                }
                std::cout << "\n";
            }
            std::cout << "  Non-zero positions: " << num_positions() << "\n";

            std::cout << "===========================\n"
                      << std::endl;
        }

    } // namespace optimizer
} // namespace advisor
