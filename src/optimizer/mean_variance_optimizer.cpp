/**
 * @file mean_variance_optimizer.cpp
 * @brief Implementation of mean-variance portfolio optimizer
 */

#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/osqp_solver.hpp"
#include "core/errors.hpp"
#include "risk/risk_model.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace advisor
{
    namespace optimizer
    {

        namespace
        {
            constexpr double kWeightNoise = 1e-9;
            constexpr double kFeasibilitySlack = 1e-9;

            std::string percent(double value)
            {
                std::ostringstream out;
                out << std::fixed << std::setprecision(1) << value * 100.0 << "%";
                return out.str();
            }

            bool has_member(const std::vector<bool> &flags)
            {
                return std::find(flags.begin(), flags.end(), true) != flags.end();
            }

            double group_weight(const Eigen::VectorXd &weights, const std::vector<bool> &flags)
            {
                double total = 0.0;
                for (Eigen::Index i = 0; i < weights.size(); ++i)
                {
                    if (flags[static_cast<size_t>(i)])
                    {
                        total += weights(i);
                    }
                }
                return total;
            }
        } // namespace

        MeanVarianceOptimizer::MeanVarianceOptimizer(std::shared_ptr<const QuadraticSolverInterface> solver)
            : solver_(solver ? std::move(solver)
                             : std::shared_ptr<const QuadraticSolverInterface>(std::make_shared<OSQPSolver>()))
        {
        }

        std::string MeanVarianceOptimizer::get_name() const
        {
            return "MeanVarianceOptimizer(" + solver_->get_name() + ")";
        }

        void MeanVarianceOptimizer::validate_inputs(const Eigen::VectorXd &expected_returns,
                                                    const Eigen::MatrixXd &covariance)
        {
            if (expected_returns.size() == 0)
            {
                throw DataError("Expected returns vector is empty");
            }

            if (expected_returns.size() != covariance.rows() ||
                expected_returns.size() != covariance.cols())
            {
                throw DataError(
                    "Dimension mismatch: expected returns size (" +
                    std::to_string(expected_returns.size()) +
                    ") does not match covariance dimensions (" +
                    std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) + ")");
            }

            if (!expected_returns.allFinite())
            {
                throw DataError("Expected returns contain NaN or Inf values");
            }

            if (!covariance.allFinite())
            {
                throw DataError("Covariance matrix contains NaN or Inf values");
            }

            const double scale = std::max(1.0, covariance.cwiseAbs().maxCoeff());
            const double asymmetry = (covariance - covariance.transpose()).cwiseAbs().maxCoeff();
            if (asymmetry > 1e-8 * scale)
            {
                throw DataError("Covariance matrix is not symmetric (max asymmetry: " +
                                std::to_string(asymmetry) + ")");
            }

            const risk::DefinitenessCheck check = risk::RiskModel::check_definiteness(
                covariance, 1e-10 * std::max(1.0, covariance.diagonal().maxCoeff()));
            if (!check.positive_semidefinite)
            {
                throw DataError("Covariance matrix is not positive semi-definite (min eigenvalue: " +
                                std::to_string(check.min_eigenvalue) + ")");
            }
        }

        std::vector<std::vector<bool>> MeanVarianceOptimizer::class_members(const risk::AssetStatistics &stats,
                                                                            const AllocationConstraints &constraints)
        {
            std::vector<std::vector<bool>> members;
            members.reserve(constraints.class_limits.size());
            for (const auto &limit : constraints.class_limits)
            {
                std::vector<bool> flags(stats.num_assets(), false);
                for (size_t i = 0; i < stats.num_assets(); ++i)
                {
                    flags[i] = limit.matches(stats.assets[i].asset_class, stats.is_foreign(i));
                }
                members.push_back(std::move(flags));
            }
            return members;
        }

        std::optional<std::string> MeanVarianceOptimizer::find_infeasibility(
            const Eigen::VectorXd &lower,
            const Eigen::VectorXd &upper,
            const std::vector<bool> &is_equity,
            const AllocationConstraints &constraints,
            const std::vector<std::vector<bool>> &members)
        {
            double equity_lower = 0.0;
            double equity_upper = 0.0;
            double other_lower = 0.0;
            double other_upper = 0.0;
            size_t num_equity = 0;

            for (Eigen::Index i = 0; i < lower.size(); ++i)
            {
                if (is_equity[static_cast<size_t>(i)])
                {
                    equity_lower += lower(i);
                    equity_upper += upper(i);
                    ++num_equity;
                }
                else
                {
                    other_lower += lower(i);
                    other_upper += upper(i);
                }
            }
            const size_t num_other = static_cast<size_t>(lower.size()) - num_equity;

            if (equity_upper + other_upper < 1.0 - kFeasibilitySlack)
            {
                return "Weights cannot sum to 100%: " + std::to_string(lower.size()) +
                       " assets with max_single_asset " + percent(constraints.max_single_asset) +
                       " reach at most " + percent(equity_upper + other_upper);
            }

            if (equity_lower + other_lower > 1.0 + kFeasibilitySlack)
            {
                return "Minimum weights already sum to " + percent(equity_lower + other_lower);
            }

            // Equity weight e must satisfy both its own bounds and 1 - e within the non-equity bounds
            const double reachable_low = std::max(equity_lower, 1.0 - other_upper);
            const double reachable_high = std::min(equity_upper, 1.0 - other_lower);

            if (std::max(reachable_low, constraints.min_equity) >
                std::min(reachable_high, constraints.max_equity) + kFeasibilitySlack)
            {
                return "Equity band [" + percent(constraints.min_equity) + ", " +
                       percent(constraints.max_equity) + "] is unreachable: with " +
                       std::to_string(num_equity) + " equity and " + std::to_string(num_other) +
                       " non-equity assets capped at " + percent(constraints.max_single_asset) +
                       " the equity weight can only range over [" + percent(std::max(0.0, reachable_low)) +
                       ", " + percent(std::max(0.0, reachable_high)) + "]";
            }

            const size_t groups = std::min(members.size(), constraints.class_limits.size());
            for (size_t g = 0; g < groups; ++g)
            {
                const ClassLimit &limit = constraints.class_limits[g];
                const std::vector<bool> &flags = members[g];
                if (!has_member(flags))
                {
                    continue;
                }

                double in_lower = 0.0;
                double in_upper = 0.0;
                double out_lower = 0.0;
                double out_upper = 0.0;
                for (Eigen::Index i = 0; i < lower.size(); ++i)
                {
                    if (flags[static_cast<size_t>(i)])
                    {
                        in_lower += lower(i);
                        in_upper += upper(i);
                    }
                    else
                    {
                        out_lower += lower(i);
                        out_upper += upper(i);
                    }
                }

                const double low = std::max(in_lower, 1.0 - out_upper);
                const double high = std::min(in_upper, 1.0 - out_lower);
                if (std::max(low, limit.min_weight) > std::min(high, limit.max_weight) + kFeasibilitySlack)
                {
                    return "Class limit '" + limit.name + "' [" + percent(limit.min_weight) + ", " +
                           percent(limit.max_weight) + "] is unreachable: its assets can only hold [" +
                           percent(std::max(0.0, low)) + ", " + percent(std::max(0.0, high)) + "]";
                }
            }

            return std::nullopt;
        }

        std::optional<std::string> MeanVarianceOptimizer::check_constraints(
            const Eigen::VectorXd &weights,
            const std::vector<bool> &is_equity,
            const AllocationConstraints &constraints,
            double tolerance,
            const std::vector<std::vector<bool>> &members)
        {
            if (static_cast<size_t>(weights.size()) != is_equity.size())
            {
                return std::string("Weight vector size does not match the universe");
            }

            if (!weights.allFinite())
            {
                return std::string("Weights contain NaN or Inf");
            }

            double equity = 0.0;
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (weights(i) < -tolerance)
                {
                    return "Negative weight " + std::to_string(weights(i)) + " for asset " + std::to_string(i);
                }
                if (weights(i) > constraints.max_single_asset + tolerance)
                {
                    return "Weight " + percent(weights(i)) + " for asset " + std::to_string(i) +
                           " exceeds max_single_asset " + percent(constraints.max_single_asset);
                }
                if (is_equity[static_cast<size_t>(i)])
                {
                    equity += weights(i);
                }
            }

            const double sum = weights.sum();
            if (std::abs(sum - 1.0) > tolerance)
            {
                return "Weights sum to " + std::to_string(sum);
            }

            if (equity < constraints.min_equity - tolerance || equity > constraints.max_equity + tolerance)
            {
                return "Equity weight " + percent(equity) + " outside [" + percent(constraints.min_equity) +
                       ", " + percent(constraints.max_equity) + "]";
            }

            const size_t groups = std::min(members.size(), constraints.class_limits.size());
            for (size_t g = 0; g < groups; ++g)
            {
                if (members[g].size() != is_equity.size() || !has_member(members[g]))
                {
                    continue;
                }
                const ClassLimit &limit = constraints.class_limits[g];
                const double held = group_weight(weights, members[g]);
                if (held < limit.min_weight - tolerance || held > limit.max_weight + tolerance)
                {
                    return "Class '" + limit.name + "' weight " + percent(held) + " outside [" +
                           percent(limit.min_weight) + ", " + percent(limit.max_weight) + "]";
                }
            }

            return std::nullopt;
        }

        QuadraticProblem MeanVarianceOptimizer::build_problem(const risk::AssetStatistics &stats,
                                                              const std::vector<bool> &is_equity,
                                                              const std::vector<std::vector<bool>> &members,
                                                              const AllocationConstraints &constraints,
                                                              const Eigen::VectorXd &lower,
                                                              const Eigen::VectorXd &upper) const
        {
            const Eigen::Index n = stats.expected_returns.size();

            // maximize mu^T w - (lambda/2) w^T Sigma w  ==  minimize (1/2) w^T (lambda Sigma) w - mu^T w
            QuadraticProblem problem;
            problem.P = constraints.risk_aversion() * stats.covariance;
            problem.q = -stats.expected_returns;

            problem.A_eq = Eigen::MatrixXd::Ones(1, n);
            problem.b_eq = Eigen::VectorXd::Ones(1);

            // One row for the equity band, one per class limit with members
            std::vector<const std::vector<bool> *> rows;
            std::vector<std::pair<double, double>> bands;
            if (has_member(is_equity))
            {
                rows.push_back(&is_equity);
                bands.emplace_back(constraints.min_equity, constraints.max_equity);
            }
            for (size_t g = 0; g < members.size(); ++g)
            {
                if (has_member(members[g]))
                {
                    rows.push_back(&members[g]);
                    bands.emplace_back(constraints.class_limits[g].min_weight, constraints.class_limits[g].max_weight);
                }
            }

            if (!rows.empty())
            {
                const Eigen::Index m = static_cast<Eigen::Index>(rows.size());
                problem.A_ineq = Eigen::MatrixXd::Zero(m, n);
                problem.b_ineq_lower.resize(m);
                problem.b_ineq_upper.resize(m);
                for (Eigen::Index r = 0; r < m; ++r)
                {
                    const std::vector<bool> &flags = *rows[static_cast<size_t>(r)];
                    for (Eigen::Index i = 0; i < n; ++i)
                    {
                        if (flags[static_cast<size_t>(i)])
                        {
                            problem.A_ineq(r, i) = 1.0;
                        }
                    }
                    problem.b_ineq_lower(r) = bands[static_cast<size_t>(r)].first;
                    problem.b_ineq_upper(r) = bands[static_cast<size_t>(r)].second;
                }
            }

            problem.lower_bounds = lower;
            problem.upper_bounds = upper;
            return problem;
        }

        Eigen::VectorXd MeanVarianceOptimizer::solve_with_retry(const QuadraticProblem &problem,
                                                                const SolverOptions &options,
                                                                OptimizationResult &result) const
        {
            SolverResult outcome = solver_->solve(problem, options);
            ++result.attempts;
            result.iterations += outcome.iterations;

            if (!outcome.success)
            {
                if (outcome.status == SolverStatus::PRIMAL_INFEASIBLE)
                {
                    throw InfeasibleConstraintsError("Solver reports an empty feasible region (" +
                                                     outcome.message + ")");
                }
                if (outcome.status == SolverStatus::DUAL_INFEASIBLE ||
                    outcome.status == SolverStatus::NON_CONVEX)
                {
                    throw SolverError(solver_->get_name() + " rejected the problem: " +
                                          to_string(outcome.status),
                                      false);
                }

                SolverOptions relaxed = options;
                relaxed.tolerance *= 10.0;
                relaxed.max_iterations *= 2;
                relaxed.time_limit_seconds *= 2.0;

                std::ostringstream warning;
                warning << solver_->get_name() << " " << to_string(outcome.status)
                        << " on first attempt; retried with tolerance " << std::scientific
                        << std::setprecision(1) << relaxed.tolerance;
                std::cerr << "Warning: " << warning.str() << "\n";
                result.warnings.push_back(warning.str());

                const bool first_retryable = outcome.is_retryable();
                outcome = solver_->solve(problem, relaxed);
                ++result.attempts;
                result.iterations += outcome.iterations;

                if (!outcome.success)
                {
                    if (outcome.status == SolverStatus::PRIMAL_INFEASIBLE)
                    {
                        throw InfeasibleConstraintsError("Solver reports an empty feasible region (" +
                                                         outcome.message + ")");
                    }
                    throw SolverError(solver_->get_name() + " failed after retry: " +
                                          to_string(outcome.status),
                                      first_retryable || outcome.is_retryable());
                }
            }

            result.message = to_string(outcome.status);

            if (outcome.solution.size() != problem.q.size() || !outcome.solution.allFinite())
            {
                throw SolverError(solver_->get_name() + " returned a malformed solution", false);
            }

            Eigen::VectorXd weights = outcome.solution.cwiseMax(problem.lower_bounds).cwiseMin(problem.upper_bounds);
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (weights(i) < kWeightNoise)
                {
                    weights(i) = 0.0;
                }
            }

            const double total = weights.sum();
            if (total <= 0.0)
            {
                throw SolverError(solver_->get_name() + " returned an all-zero allocation", false);
            }
            return weights / total;
        }

        OptimizationResult MeanVarianceOptimizer::optimize(const risk::AssetStatistics &stats,
                                                           const AllocationConstraints &constraints) const
        {
            constraints.validate();

            const size_t n = stats.num_assets();
            if (n == 0)
            {
                throw DataError("Asset statistics contain no assets");
            }
            validate_inputs(stats.expected_returns, stats.covariance);
            if (static_cast<size_t>(stats.expected_returns.size()) != n)
            {
                throw DataError("Asset list and expected returns disagree in size");
            }

            std::vector<bool> is_equity(n, false);
            for (size_t i = 0; i < n; ++i)
            {
                is_equity[i] = constraints.is_equity(stats.assets[i].asset_class);
            }

            const std::vector<std::vector<bool>> members = class_members(stats, constraints);

            const Eigen::Index size = static_cast<Eigen::Index>(n);
            Eigen::VectorXd lower = Eigen::VectorXd::Zero(size);
            Eigen::VectorXd upper = Eigen::VectorXd::Constant(size, constraints.max_single_asset);

            if (auto reason = find_infeasibility(lower, upper, is_equity, constraints, members))
            {
                throw InfeasibleConstraintsError(*reason);
            }

            OptimizationResult result;
            result.tickers = stats.tickers();

            for (size_t g = 0; g < members.size(); ++g)
            {
                const ClassLimit &limit = constraints.class_limits[g];
                if (!has_member(members[g]) && limit.min_weight > 0.0)
                {
                    const std::string warning = "Class limit '" + limit.name +
                                                "' has no assets in the universe; its minimum is not applied";
                    std::cerr << "Warning: " << warning << "\n";
                    result.warnings.push_back(warning);
                }
            }

            Eigen::VectorXd weights = solve_with_retry(
                build_problem(stats, is_equity, members, constraints, lower, upper), constraints.solver_options, result);

            // Dust: each pass fixes at least one more asset, so n passes suffice
            const double threshold = constraints.min_weight_threshold;
            for (size_t pass = 0; threshold > 0.0 && pass < n; ++pass)
            {
                std::vector<Eigen::Index> dust;
                for (Eigen::Index i = 0; i < size; ++i)
                {
                    if (weights(i) > 0.0 && weights(i) < threshold - kWeightNoise &&
                        lower(i) < threshold && upper(i) > 0.0)
                    {
                        dust.push_back(i);
                    }
                }

                if (dust.empty())
                {
                    break;
                }

                // Configured policy first, the other one when it empties the feasible region
                const DustPolicy fallback = constraints.dust_policy == DustPolicy::ZERO ? DustPolicy::FLOOR
                                                                                         : DustPolicy::ZERO;
                std::optional<std::string> first_reason;
                bool applied = false;
                for (DustPolicy policy : {constraints.dust_policy, fallback})
                {
                    Eigen::VectorXd next_lower = lower;
                    Eigen::VectorXd next_upper = upper;
                    for (Eigen::Index i : dust)
                    {
                        if (policy == DustPolicy::ZERO)
                            next_upper(i) = 0.0;
                        else
                            next_lower(i) = threshold;
                    }

                    if (auto reason = find_infeasibility(next_lower, next_upper, is_equity, constraints, members))
                    {
                        if (!first_reason)
                            first_reason = reason;
                        continue;
                    }

                    if (policy != constraints.dust_policy)
                    {
                        const std::string warning = "Dust policy '" + to_string(constraints.dust_policy) +
                                                    "' infeasible (" + *first_reason + "); applied '" +
                                                    to_string(policy) + "' instead";
                        std::cerr << "Warning: " << warning << "\n";
                        result.warnings.push_back(warning);
                    }

                    lower = next_lower;
                    upper = next_upper;
                    applied = true;
                    break;
                }

                if (!applied)
                {
                    const std::string warning = "Dust policy not applied: " + *first_reason;
                    std::cerr << "Warning: " << warning << "\n";
                    result.warnings.push_back(warning);
                    break;
                }

                weights = solve_with_retry(
                    build_problem(stats, is_equity, members, constraints, lower, upper), constraints.solver_options, result);
            }

            if (auto violation = check_constraints(weights, is_equity, constraints, 1e-6, members))
            {
                throw SolverError("Solution violates constraints: " + *violation, false);
            }

            // Portfolio statistics
            result.weights = weights;
            result.expected_return = weights.dot(stats.expected_returns);

            const Eigen::VectorXd marginal = stats.covariance * weights;
            const double variance = weights.dot(marginal);
            result.volatility = std::sqrt(std::max(0.0, variance));

            if (result.volatility > 1e-10)
            {
                result.sharpe_ratio = (result.expected_return - stats.mean_risk_free) / result.volatility;
            }
            else
            {
                std::cerr << "Warning: portfolio volatility is ~0; Sharpe ratio undefined\n";
                result.warnings.push_back("Portfolio volatility is ~0; Sharpe ratio undefined");
            }

            result.equity_weight = 0.0;
            for (size_t i = 0; i < n; ++i)
            {
                if (is_equity[i])
                {
                    result.equity_weight += weights(static_cast<Eigen::Index>(i));
                }
            }

            for (size_t g = 0; g < members.size(); ++g)
            {
                if (has_member(members[g]))
                {
                    result.class_weights[constraints.class_limits[g].name] = group_weight(weights, members[g]);
                }
            }

            result.risk_contributions = variance > 1e-16
                                            ? Eigen::VectorXd(weights.cwiseProduct(marginal) / variance)
                                            : Eigen::VectorXd(Eigen::VectorXd::Zero(size));
            result.herfindahl_index = weights.squaredNorm();

            return result;
        }

    } // namespace optimizer
} // namespace advisor
