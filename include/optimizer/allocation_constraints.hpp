/**
 * @file allocation_constraints.hpp
 * @brief Optimizer configuration, per-request constraint set and result
 *
 * AllocationConstraints is the boundary between the risk profiler and the
 * optimizer: it is derived from a resolved risk category plus the
 * optimizer configuration, and carries nothing solver specific beyond the
 * solver budget.
 */

#pragma once

#include "optimizer/quadratic_solver.hpp"
#include "profile/risk_category.hpp"
#include "profile/risk_profiler.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace advisor
{
    namespace optimizer
    {

        /**
         * @enum DustPolicy
         * @brief Treatment of allocations below the minimum weight threshold
         */
        enum class DustPolicy
        {
            ZERO, ///< Force the asset out of the portfolio
            FLOOR ///< Raise the asset to the threshold
        };

        /**
         * @brief Parse "zero" or "floor"
         * @throws ValidationError for other values
         */
        DustPolicy parse_dust_policy(const std::string &text);
        std::string to_string(DustPolicy policy);

        /**
         * @struct ClassLimit
         * @brief Bounds on the aggregate weight of a group of assets
         *
         * An asset belongs to the group when its class is listed (or the list
         * is empty) and, for foreign_only groups, it is quoted outside the
         * base currency. Groups with no member in the universe are skipped.
         */
        struct ClassLimit
        {
            std::string name;
            std::vector<std::string> asset_classes; ///< Member classes; empty matches every class
            bool foreign_only = false;              ///< Only assets quoted outside the base currency
            double min_weight = 0.0;
            double max_weight = 1.0;

            bool matches(const std::string &asset_class, bool foreign) const;

            /**
             * @throws ValidationError if the bounds are not an ordered sub-range of [0, 1]
             *         or the group can match nothing specific
             */
            void validate() const;

            static ClassLimit from_json(const nlohmann::json &j);
        };

        /**
         * @struct OptimizerConfig
         * @brief "optimizer" section of the pipeline configuration
         */
        struct OptimizerConfig
        {
            double max_single_asset = 0.40;         ///< Concentration cap per asset
            double min_weight_threshold = 0.01;     ///< Dust threshold
            DustPolicy dust_policy = DustPolicy::ZERO;
            double risk_aversion_coefficient = 0.5; ///< lambda = coefficient / target volatility
            double tolerance = 1e-7;
            int max_iterations = 10000;
            double time_limit_seconds = 5.0;
            double short_horizon_years = 2.0;       ///< Horizons below this cap equity
            double short_horizon_max_equity = 0.5;
            std::vector<std::string> equity_classes{"equity"};
            std::vector<std::string> alternative_classes{"commodity", "reit", "alternative"};
            bool limit_international = true;        ///< Apply the category cap on foreign-currency assets
            std::vector<ClassLimit> class_limits;   ///< Extra limits applied to every category
            bool verbose = false;

            /**
             * @brief Validate configuration
             * @throws ValidationError on out-of-range values
             */
            void validate() const;

            static OptimizerConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct AllocationConstraints
         * @brief Constraint set for one optimization request
         *
         * Enforced:
         *   sum(w) = 1, 0 <= w_i <= max_single_asset
         *   min_equity <= sum(w_i : i equity) <= max_equity
         *   min_weight <= sum(w_i : i in group) <= max_weight for each class limit
         *   w_i = 0 or w_i >= min_weight_threshold (via dust policy)
         *
         * from_category() adds the category's caps on alternatives and on
         * foreign-currency ("international") exposure ahead of the
         * configured class limits.
         */
        struct AllocationConstraints
        {
            profile::RiskCategory category = profile::RiskCategory::MODERATE;
            double target_volatility = 0.12;
            double max_drawdown = 0.15;
            double min_equity = 0.0;
            double max_equity = 1.0;
            double max_single_asset = 0.40;
            double min_weight_threshold = 0.01;
            DustPolicy dust_policy = DustPolicy::ZERO;
            double risk_aversion_coefficient = 0.5;
            std::vector<std::string> equity_classes{"equity"};
            std::vector<ClassLimit> class_limits;
            SolverOptions solver_options;

            /**
             * @brief Risk aversion used in the objective
             *
             * Higher target volatility gives a lower lambda.
             */
            double risk_aversion() const { return risk_aversion_coefficient / target_volatility; }

            bool is_equity(const std::string &asset_class) const;

            /**
             * @brief Validate ranges (bounds in [0, 1], band ordered, positive target volatility)
             * @throws ValidationError if inconsistent
             */
            void validate() const;

            /**
             * @brief Constraints for a risk category
             * @param category Resolved category
             * @param config Optimizer configuration
             * @param horizon_years Investment horizon; below config.short_horizon_years
             *        the equity ceiling drops to short_horizon_max_equity (never below min_equity)
             */
            static AllocationConstraints from_category(profile::RiskCategory category,
                                                       const OptimizerConfig &config,
                                                       double horizon_years);

            /**
             * @brief Constraints for a resolved profile
             * @throws ValidationError if the profile carries an error-severity rule
             */
            static AllocationConstraints from_profile(const profile::RiskProfile &risk_profile,
                                                      const OptimizerConfig &config,
                                                      double horizon_years);
        };

        /**
         * @struct OptimizationResult
         * @brief Container for optimization results
         */
        struct OptimizationResult
        {
            std::vector<std::string> tickers;   ///< Asset ids, same order as weights
            Eigen::VectorXd weights;            ///< Optimal portfolio weights
            double expected_return = 0.0;       ///< Annualized
            double volatility = 0.0;            ///< Annualized
            std::optional<double> sharpe_ratio; ///< Empty when volatility is ~0
            double equity_weight = 0.0;         ///< Aggregate weight of equity-class assets
            std::map<std::string, double> class_weights; ///< Aggregate weight per enforced class limit
            Eigen::VectorXd risk_contributions; ///< Fraction of portfolio variance per asset
            double herfindahl_index = 0.0;      ///< sum(w_i^2)
            int iterations = 0;                 ///< Solver iterations over all solves
            int attempts = 0;                   ///< Solver calls including the retry and dust re-solves
            std::string message;                ///< Final solver status
            std::vector<std::string> warnings;

            /// Asset id -> weight, for every asset in the universe
            std::map<std::string, double> weight_map() const;

            /// Assets with weight above threshold
            size_t num_positions(double threshold = 1e-9) const;

            nlohmann::json to_json() const;

            void print_summary() const;
        };

    } // namespace optimizer
} // namespace advisor
