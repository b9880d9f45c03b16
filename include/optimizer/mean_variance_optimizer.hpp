/**
 * @file mean_variance_optimizer.hpp
 * @brief Constrained mean-variance allocator (Markowitz utility)
 *
 * Mathematical Formulation:
 *
 * Maximize:     mu^T * w - (lambda/2) * w^T * Sigma * w
 * Subject to:   sum(w_i) = 1
 *               0 <= w_i <= max_single_asset
 *               min_equity <= sum(w_i : i equity) <= max_equity
 *               min_g <= sum(w_i : i in g) <= max_g   for each class limit g
 *
 * which is handed to the solver as
 *
 * Minimize:     (1/2) * w^T * (lambda * Sigma) * w - mu^T * w
 *
 * where:
 * - w: portfolio weights
 * - Sigma: annualized covariance matrix
 * - mu: annualized expected returns
 * - lambda: risk_aversion_coefficient / category target volatility
 *
 * Allocations below min_weight_threshold are then zeroed or floored
 * according to the dust policy, with a re-solve on the adjusted bounds.
 */

#pragma once

#include "optimizer/allocation_constraints.hpp"
#include "optimizer/quadratic_solver.hpp"
#include "risk/asset_statistics.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace advisor
{
    namespace optimizer
    {

        /**
         * @class MeanVarianceOptimizer
         * @brief Mean-variance optimizer over an injected QP solver
         *
         * Solver failures that may be budget related (time limit, iteration
         * limit, inaccurate solution) are retried once with tolerance x10 and
         * twice the iteration and time budget. A second failure raises
         * SolverError; nothing partially constrained is ever returned.
         *
         * Usage Example:
         * @code
         * MeanVarianceOptimizer optimizer;   // OSQP
         * auto constraints = AllocationConstraints::from_category(
         *     profile::RiskCategory::MODERATE, OptimizerConfig(), 10.0);
         * OptimizationResult result = optimizer.optimize(stats, constraints);
         * result.print_summary();
         * @endcode
         *
         * Thread Safety: optimize() is const and keeps no state between calls.
         */
        class MeanVarianceOptimizer
        {
        public:
            /**
             * @brief Construct optimizer
             * @param solver QP strategy; OSQPSolver when null
             */
            explicit MeanVarianceOptimizer(std::shared_ptr<const QuadraticSolverInterface> solver = nullptr);

            /**
             * @brief Optimize portfolio weights
             * @param stats Annualized statistics of the universe
             * @param constraints Constraint set for the resolved category
             * @return Feasible, sum-to-one weights in stats asset order
             * @throws DataError if the statistics are malformed or the covariance is not PSD
             * @throws InfeasibleConstraintsError if the feasible region is empty
             * @throws SolverError if the solver fails twice or returns a constraint-violating point
             */
            OptimizationResult optimize(const risk::AssetStatistics &stats,
                                        const AllocationConstraints &constraints) const;

            std::string get_name() const;

            const QuadraticSolverInterface &solver() const { return *solver_; }

            /**
             * @brief Validate optimizer inputs
             * @throws DataError on dimension mismatch, NaN/Inf, asymmetry or a non-PSD covariance
             */
            static void validate_inputs(const Eigen::VectorXd &expected_returns,
                                        const Eigen::MatrixXd &covariance);

            /**
             * @brief Membership of each asset in each of constraints.class_limits
             * @return One flag vector per class limit, in stats asset order
             */
            static std::vector<std::vector<bool>> class_members(const risk::AssetStatistics &stats,
                                                                const AllocationConstraints &constraints);

            /**
             * @brief Explain why bounds, the equity band and class limits admit no portfolio
             *
             * For box bounds, one budget row and one equity row the check is
             * exact: equity weight must fit both its own bound sum and what
             * the non-equity bounds leave over. Each class limit is checked
             * the same way on its own; combinations of overlapping limits are
             * left to the solver.
             *
             * @param members Output of class_members(); empty skips class limits
             * @return Empty when feasible, otherwise a user-facing explanation
             */
            static std::optional<std::string> find_infeasibility(
                const Eigen::VectorXd &lower,
                const Eigen::VectorXd &upper,
                const std::vector<bool> &is_equity,
                const AllocationConstraints &constraints,
                const std::vector<std::vector<bool>> &members = {});

            /**
             * @brief Check if weights satisfy constraints
             * @param weights Portfolio weights
             * @param is_equity Equity flag per asset
             * @param constraints Constraints to check
             * @param tolerance Numerical tolerance
             * @param members Output of class_members(); empty skips class limits
             * @return Empty when satisfied, otherwise the first violation found
             */
            static std::optional<std::string> check_constraints(
                const Eigen::VectorXd &weights,
                const std::vector<bool> &is_equity,
                const AllocationConstraints &constraints,
                double tolerance = 1e-6,
                const std::vector<std::vector<bool>> &members = {});

        private:
            std::shared_ptr<const QuadraticSolverInterface> solver_;

            QuadraticProblem build_problem(const risk::AssetStatistics &stats,
                                           const std::vector<bool> &is_equity,
                                           const std::vector<std::vector<bool>> &members,
                                           const AllocationConstraints &constraints,
                                           const Eigen::VectorXd &lower,
                                           const Eigen::VectorXd &upper) const;

            /**
             * @brief Solve with at most one relaxed retry
             * @return Cleaned weights (noise clipped, renormalized)
             */
            Eigen::VectorXd solve_with_retry(const QuadraticProblem &problem,
                                             const SolverOptions &options,
                                             OptimizationResult &result) const;
        };

    } // namespace optimizer
} // namespace advisor
