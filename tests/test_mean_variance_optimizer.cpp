/**
 * @file test_mean_variance_optimizer.cpp
 * @brief Unit tests for MeanVarianceOptimizer and AllocationConstraints
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <memory>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/osqp_solver.hpp"
#include "profile/risk_profiler.hpp"
#include "risk/asset_statistics.hpp"
#include "test_fixtures.hpp"

using namespace advisor;
using namespace advisor::optimizer;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class OptimizerTestFixture
{
protected:
    risk::AssetStatistics balanced_stats_;
    std::vector<bool> balanced_equity_;

    OptimizerTestFixture()
    {
        auto context = testing::balanced_context();
        data::NormalizedUniverse u = data::SeriesNormalizer().normalize(*context);

        std::map<std::string, std::string> classes;
        for (const auto &id : u.tickers)
        {
            classes[id] = context->asset(id).asset_class;
        }
        balanced_stats_ = risk::StatisticsEngine().compute(u, classes);

        for (const auto &asset : balanced_stats_.assets)
        {
            balanced_equity_.push_back(asset.asset_class == "equity");
        }
    }

    /// Hand-built statistics: uncorrelated assets with the given returns and variances
    static risk::AssetStatistics make_stats(const std::vector<std::string> &ids,
                                            const std::vector<std::string> &classes,
                                            const Eigen::VectorXd &mu,
                                            const Eigen::VectorXd &variances)
    {
        risk::AssetStatistics stats;
        for (size_t i = 0; i < ids.size(); ++i)
        {
            risk::AssetStats a;
            a.id = ids[i];
            a.asset_class = classes[i];
            stats.assets.push_back(a);
        }
        stats.expected_returns = mu;
        stats.covariance = variances.asDiagonal();
        stats.volatilities = variances.cwiseSqrt();
        stats.mean_risk_free = 0.03;
        return stats;
    }

    /// Constraints without an equity band, for universes with no equity asset
    static AllocationConstraints open_constraints(double max_single, double threshold)
    {
        AllocationConstraints c;
        c.min_equity = 0.0;
        c.max_equity = 1.0;
        c.max_single_asset = max_single;
        c.min_weight_threshold = threshold;
        return c;
    }
};

// ============================================================================
// Test solvers
// ============================================================================

namespace
{
    /// Always reports the given failure
    class FailingSolver : public QuadraticSolverInterface
    {
    public:
        explicit FailingSolver(SolverStatus status) : status_(status) {}

        SolverResult solve(const QuadraticProblem &problem, const SolverOptions &options) const override
        {
            problem.validate();
            ++calls;
            last_options = options;
            SolverResult result;
            result.status = status_;
            result.iterations = 7;
            result.message = to_string(status_);
            return result;
        }

        std::string get_name() const override { return "Failing"; }

        mutable int calls = 0;
        mutable SolverOptions last_options;

    private:
        SolverStatus status_;
    };

    /// Times out on the first call, then delegates to OSQP
    class FlakySolver : public QuadraticSolverInterface
    {
    public:
        SolverResult solve(const QuadraticProblem &problem, const SolverOptions &options) const override
        {
            ++calls;
            options_seen.push_back(options);
            if (calls == 1)
            {
                SolverResult result;
                result.status = SolverStatus::TIME_LIMIT;
                return result;
            }
            return osqp_.solve(problem, options);
        }

        std::string get_name() const override { return "Flaky"; }

        mutable int calls = 0;
        mutable std::vector<SolverOptions> options_seen;

    private:
        OSQPSolver osqp_;
    };
}

// ============================================================================
// Category portfolios
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Every category yields a feasible portfolio", "[Optimizer]")
{
    MeanVarianceOptimizer allocator;
    OptimizerConfig config;

    for (size_t c = 0; c < profile::kNumRiskCategories; ++c)
    {
        const auto category = static_cast<profile::RiskCategory>(c);
        INFO("Category: " << profile::category_name(category));

        AllocationConstraints constraints = AllocationConstraints::from_category(category, config, 10.0);
        OptimizationResult result = allocator.optimize(balanced_stats_, constraints);

        REQUIRE(result.weights.size() == 5);
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-6));
        REQUIRE(result.weights.minCoeff() >= -1e-9);
        REQUIRE(result.weights.maxCoeff() <= config.max_single_asset + 1e-6);
        REQUIRE(result.equity_weight >= constraints.min_equity - 1e-6);
        REQUIRE(result.equity_weight <= constraints.max_equity + 1e-6);
        REQUIRE_FALSE(MeanVarianceOptimizer::check_constraints(result.weights, balanced_equity_, constraints).has_value());

        REQUIRE(result.volatility > 0.0);
        REQUIRE(result.sharpe_ratio.has_value());
        REQUIRE_THAT(result.risk_contributions.sum(), WithinAbs(1.0, 1e-9));
        REQUIRE(result.attempts >= 1);
        REQUIRE(result.tickers == balanced_stats_.tickers());
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Higher categories take more equity", "[Optimizer]")
{
    MeanVarianceOptimizer allocator;
    OptimizerConfig config;

    auto equity_for = [&](profile::RiskCategory category)
    {
        return allocator.optimize(balanced_stats_,
                                  AllocationConstraints::from_category(category, config, 10.0))
            .equity_weight;
    };

    const double ultra = equity_for(profile::RiskCategory::ULTRA_CONSERVATIVE);
    const double very = equity_for(profile::RiskCategory::VERY_AGGRESSIVE);
    REQUIRE(ultra <= 0.20 + 1e-6);
    REQUIRE(very >= 0.70 - 1e-6);
    REQUIRE(very > ultra);
}

TEST_CASE_METHOD(OptimizerTestFixture, "Short horizon caps equity", "[Optimizer][Constraints]")
{
    OptimizerConfig config;

    AllocationConstraints long_term =
        AllocationConstraints::from_category(profile::RiskCategory::AGGRESSIVE, config, 10.0);
    AllocationConstraints short_term =
        AllocationConstraints::from_category(profile::RiskCategory::AGGRESSIVE, config, 1.0);

    REQUIRE_THAT(long_term.max_equity, WithinAbs(0.80, 1e-12));
    // The short-horizon cap never cuts below the category floor
    REQUIRE_THAT(short_term.max_equity, WithinAbs(0.55, 1e-12));

    AllocationConstraints moderate =
        AllocationConstraints::from_category(profile::RiskCategory::MODERATE, config, 1.5);
    REQUIRE_THAT(moderate.max_equity, WithinAbs(0.50, 1e-12));

    OptimizationResult result = MeanVarianceOptimizer().optimize(balanced_stats_, short_term);
    REQUIRE(result.equity_weight <= 0.55 + 1e-6);
}

TEST_CASE_METHOD(OptimizerTestFixture, "Optimization is deterministic", "[Optimizer]")
{
    MeanVarianceOptimizer allocator;
    AllocationConstraints constraints =
        AllocationConstraints::from_category(profile::RiskCategory::MODERATE, OptimizerConfig(), 10.0);

    OptimizationResult first = allocator.optimize(balanced_stats_, constraints);
    OptimizationResult second = allocator.optimize(balanced_stats_, constraints);
    REQUIRE(first.weights == second.weights);
    REQUIRE(first.iterations == second.iterations);
}

// ============================================================================
// Known solutions
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Two assets pinned by the equity band", "[Optimizer]")
{
    Eigen::VectorXd mu(2);
    mu << 0.10, 0.04;
    Eigen::VectorXd var(2);
    var << 0.04, 0.01;
    risk::AssetStatistics stats = make_stats({"EQ", "BOND"}, {"equity", "bond"}, mu, var);

    AllocationConstraints constraints = open_constraints(1.0, 0.01);
    constraints.min_equity = 0.5;
    constraints.max_equity = 0.5;

    OptimizationResult result = MeanVarianceOptimizer().optimize(stats, constraints);
    REQUIRE_THAT(result.weights(0), WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(result.weights(1), WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(result.expected_return, WithinAbs(0.07, 1e-6));
    REQUIRE_THAT(result.herfindahl_index, WithinAbs(0.5, 1e-6));
    REQUIRE(result.weight_map().at("BOND") == result.weights(1));
}

TEST_CASE_METHOD(OptimizerTestFixture, "Dust allocations follow the dust policy", "[Optimizer][Dust]")
{
    // lambda * var = (0.5 / 0.12) * 0.04, so the raw optimum is (0.98, 0.02)
    Eigen::VectorXd mu(2);
    mu << 0.18, 0.02;
    Eigen::VectorXd var(2);
    var << 0.04, 0.04;
    risk::AssetStatistics stats = make_stats({"A", "B"}, {"bond", "bond"}, mu, var);

    SECTION("Without a threshold the small position survives")
    {
        OptimizationResult result = MeanVarianceOptimizer().optimize(stats, open_constraints(1.0, 0.0));
        REQUIRE_THAT(result.weights(1), WithinAbs(0.02, 1e-5));
        REQUIRE(result.attempts == 1);
    }

    SECTION("Zero policy removes it")
    {
        AllocationConstraints constraints = open_constraints(1.0, 0.05);
        constraints.dust_policy = DustPolicy::ZERO;
        OptimizationResult result = MeanVarianceOptimizer().optimize(stats, constraints);
        REQUIRE(result.weights(1) == 0.0);
        REQUIRE_THAT(result.weights(0), WithinAbs(1.0, 1e-9));
        REQUIRE(result.num_positions() == 1);
        REQUIRE(result.attempts == 2);
    }

    SECTION("Floor policy raises it")
    {
        AllocationConstraints constraints = open_constraints(1.0, 0.05);
        constraints.dust_policy = DustPolicy::FLOOR;
        OptimizationResult result = MeanVarianceOptimizer().optimize(stats, constraints);
        REQUIRE_THAT(result.weights(1), WithinAbs(0.05, 1e-6));
        REQUIRE_THAT(result.weights(0), WithinAbs(0.95, 1e-6));
    }

    SECTION("Zero policy falls back to the floor when zeroing is infeasible")
    {
        // With A capped at 98% the portfolio cannot drop B entirely
        AllocationConstraints constraints = open_constraints(0.98, 0.05);
        constraints.dust_policy = DustPolicy::ZERO;
        OptimizationResult result = MeanVarianceOptimizer().optimize(stats, constraints);
        REQUIRE_THAT(result.weights(1), WithinAbs(0.05, 1e-6));
        REQUIRE_THAT(result.weights(0), WithinAbs(0.95, 1e-6));
        REQUIRE(result.attempts == 2);
        REQUIRE_FALSE(result.warnings.empty());
        REQUIRE_THAT(result.warnings.front(), ContainsSubstring("applied 'floor' instead"));
    }

    SECTION("Dust is kept with a warning when neither policy is feasible")
    {
        // B is the only equity and the band pins it at 2%
        risk::AssetStatistics pinned = make_stats({"A", "B"}, {"bond", "equity"}, mu, var);
        AllocationConstraints constraints = open_constraints(1.0, 0.05);
        constraints.min_equity = 0.02;
        constraints.max_equity = 0.02;
        OptimizationResult result = MeanVarianceOptimizer().optimize(pinned, constraints);
        REQUIRE_THAT(result.weights(1), WithinAbs(0.02, 1e-6));
        REQUIRE(result.attempts == 1);
        REQUIRE_FALSE(result.warnings.empty());
        REQUIRE_THAT(result.warnings.front(), ContainsSubstring("Dust policy not applied"));
    }
}

// ============================================================================
// Asset class limits
// ============================================================================

TEST_CASE("Category tables become class limits", "[Optimizer][ClassLimits]")
{
    OptimizerConfig config;
    AllocationConstraints moderate =
        AllocationConstraints::from_category(profile::RiskCategory::MODERATE, config, 10.0);

    REQUIRE(moderate.class_limits.size() == 2);
    REQUIRE(moderate.class_limits[0].name == "alternatives");
    REQUIRE_THAT(moderate.class_limits[0].max_weight, WithinAbs(0.10, 1e-12));
    REQUIRE(moderate.class_limits[0].matches("commodity", false));
    REQUIRE_FALSE(moderate.class_limits[0].matches("equity", true));

    REQUIRE(moderate.class_limits[1].name == "international");
    REQUIRE_THAT(moderate.class_limits[1].max_weight, WithinAbs(0.40, 1e-12));
    REQUIRE(moderate.class_limits[1].matches("equity", true));
    REQUIRE(moderate.class_limits[1].matches("bond", true));
    REQUIRE_FALSE(moderate.class_limits[1].matches("equity", false));

    SECTION("Configured limits are appended and the defaults can be switched off")
    {
        OptimizerConfig custom = OptimizerConfig::from_json(
            {{"limit_international", false},
             {"alternative_classes", nlohmann::json::array()},
             {"class_limits", {{{"asset_classes", {"bond"}}, {"min", 0.25}}}}});
        AllocationConstraints c =
            AllocationConstraints::from_category(profile::RiskCategory::CONSERVATIVE, custom, 10.0);
        REQUIRE(c.class_limits.size() == 1);
        REQUIRE(c.class_limits[0].name == "bond");
        REQUIRE_THAT(c.class_limits[0].min_weight, WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(c.class_limits[0].max_weight, WithinAbs(1.0, 1e-12));
    }

    SECTION("Invalid limits")
    {
        REQUIRE_THROWS_AS(OptimizerConfig::from_json({{"class_limits", {{{"asset_classes", {"bond"}}, {"min", 0.6}, {"max", 0.4}}}}}),
                          ValidationError);
        REQUIRE_THROWS_AS(OptimizerConfig::from_json({{"class_limits", {{{"max", 0.4}}}}}), ValidationError);
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Class limits bind the allocation", "[Optimizer][ClassLimits]")
{
    Eigen::VectorXd mu(4);
    mu << 0.08, 0.30, 0.04, 0.30;
    Eigen::VectorXd var(4);
    var << 0.03, 0.04, 0.005, 0.04;
    risk::AssetStatistics stats =
        make_stats({"EQ_DOM", "EQ_US", "BOND", "GOLD"}, {"equity", "equity", "bond", "commodity"}, mu, var);
    stats.base_currency = "ILS";
    stats.assets[0].currency = "ILS";
    stats.assets[1].currency = "USD";
    stats.assets[2].currency = "ILS";
    stats.assets[3].currency = "ILS";
    REQUIRE(stats.is_foreign(1));
    REQUIRE_FALSE(stats.is_foreign(3));

    OptimizerConfig config;
    config.max_single_asset = 0.60;
    AllocationConstraints constraints =
        AllocationConstraints::from_category(profile::RiskCategory::MODERATE, config, 10.0);

    SECTION("Unconstrained, the two high-return assets split the portfolio")
    {
        AllocationConstraints open = constraints;
        open.class_limits.clear();
        OptimizationResult result = MeanVarianceOptimizer().optimize(stats, open);
        REQUIRE_THAT(result.weights(1), WithinAbs(0.5, 1e-4));
        REQUIRE_THAT(result.weights(3), WithinAbs(0.5, 1e-4));
        REQUIRE(result.class_weights.empty());
    }

    SECTION("International and alternatives caps hold")
    {
        OptimizationResult result = MeanVarianceOptimizer().optimize(stats, constraints);
        REQUIRE_THAT(result.weights(1), WithinAbs(0.40, 1e-4));
        REQUIRE_THAT(result.weights(3), WithinAbs(0.10, 1e-4));
        // The rest goes to the domestic assets, equity capped at 65%
        REQUIRE_THAT(result.weights(0), WithinAbs(0.25, 1e-4));
        REQUIRE_THAT(result.weights(2), WithinAbs(0.25, 1e-4));

        REQUIRE(result.class_weights.at("international") <= 0.40 + 1e-6);
        REQUIRE(result.class_weights.at("alternatives") <= 0.10 + 1e-6);

        const std::vector<bool> equity{true, true, false, false};
        const auto members = MeanVarianceOptimizer::class_members(stats, constraints);
        REQUIRE(members[1] == std::vector<bool>{false, true, false, false});
        REQUIRE_FALSE(MeanVarianceOptimizer::check_constraints(result.weights, equity, constraints, 1e-6, members).has_value());

        Eigen::VectorXd too_foreign(4);
        too_foreign << 0.15, 0.50, 0.30, 0.05;
        auto violation = MeanVarianceOptimizer::check_constraints(too_foreign, equity, constraints, 1e-6, members);
        REQUIRE(violation.has_value());
        REQUIRE_THAT(*violation, ContainsSubstring("international"));
    }

    SECTION("Unreachable class minimum is reported before solving")
    {
        ClassLimit bond_floor;
        bond_floor.name = "bond floor";
        bond_floor.asset_classes = {"bond"};
        bond_floor.min_weight = 0.70;
        constraints.class_limits.push_back(bond_floor);

        auto solver = std::make_shared<FailingSolver>(SolverStatus::UNKNOWN);
        try
        {
            MeanVarianceOptimizer(solver).optimize(stats, constraints);
            FAIL("Expected InfeasibleConstraintsError");
        }
        catch (const InfeasibleConstraintsError &e)
        {
            REQUIRE_THAT(e.what(), ContainsSubstring("Class limit 'bond floor'"));
        }
        REQUIRE(solver->calls == 0);
    }

    SECTION("A minimum on a class absent from the universe is skipped with a warning")
    {
        ClassLimit reit_floor;
        reit_floor.name = "reit floor";
        reit_floor.asset_classes = {"reit"};
        reit_floor.min_weight = 0.05;
        constraints.class_limits.push_back(reit_floor);

        OptimizationResult result = MeanVarianceOptimizer().optimize(stats, constraints);
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-6));
        REQUIRE_FALSE(result.warnings.empty());
        REQUIRE_THAT(result.warnings.front(), ContainsSubstring("reit floor"));
    }
}

// ============================================================================
// Failure handling
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Infeasible constraints are reported before solving", "[Optimizer][Infeasible]")
{
    SECTION("Concentration cap cannot reach 100%")
    {
        Eigen::VectorXd mu(2);
        mu << 0.08, 0.05;
        Eigen::VectorXd var(2);
        var << 0.04, 0.02;
        risk::AssetStatistics stats = make_stats({"A", "B"}, {"bond", "bond"}, mu, var);

        auto solver = std::make_shared<FailingSolver>(SolverStatus::UNKNOWN);
        MeanVarianceOptimizer allocator(solver);
        REQUIRE_THROWS_AS(allocator.optimize(stats, open_constraints(0.4, 0.01)), InfeasibleConstraintsError);
        REQUIRE(solver->calls == 0);
    }

    SECTION("Equity ceiling below what the bonds leave over")
    {
        AllocationConstraints constraints =
            AllocationConstraints::from_category(profile::RiskCategory::MODERATE, OptimizerConfig(), 10.0);
        constraints.min_equity = 0.0;
        constraints.max_equity = 0.1;

        try
        {
            MeanVarianceOptimizer().optimize(balanced_stats_, constraints);
            FAIL("Expected InfeasibleConstraintsError");
        }
        catch (const InfeasibleConstraintsError &e)
        {
            REQUIRE_THAT(e.what(), ContainsSubstring("Equity band"));
        }
    }

    SECTION("Solver-detected infeasibility")
    {
        MeanVarianceOptimizer allocator(std::make_shared<FailingSolver>(SolverStatus::PRIMAL_INFEASIBLE));
        AllocationConstraints constraints =
            AllocationConstraints::from_category(profile::RiskCategory::MODERATE, OptimizerConfig(), 10.0);
        REQUIRE_THROWS_AS(allocator.optimize(balanced_stats_, constraints), InfeasibleConstraintsError);
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Solver failures retry once", "[Optimizer][Retry]")
{
    AllocationConstraints constraints =
        AllocationConstraints::from_category(profile::RiskCategory::MODERATE, OptimizerConfig(), 10.0);

    SECTION("Persistent iteration limit")
    {
        auto solver = std::make_shared<FailingSolver>(SolverStatus::MAX_ITERATIONS);
        MeanVarianceOptimizer allocator(solver);
        try
        {
            allocator.optimize(balanced_stats_, constraints);
            FAIL("Expected SolverError");
        }
        catch (const SolverError &e)
        {
            REQUIRE(e.retryable());
        }
        REQUIRE(solver->calls == 2);
        REQUIRE_THAT(solver->last_options.tolerance, WithinAbs(constraints.solver_options.tolerance * 10.0, 1e-15));
        REQUIRE(solver->last_options.max_iterations == constraints.solver_options.max_iterations * 2);
    }

    SECTION("Non-convex problems are not retried")
    {
        auto solver = std::make_shared<FailingSolver>(SolverStatus::NON_CONVEX);
        MeanVarianceOptimizer allocator(solver);
        try
        {
            allocator.optimize(balanced_stats_, constraints);
            FAIL("Expected SolverError");
        }
        catch (const SolverError &e)
        {
            REQUIRE_FALSE(e.retryable());
        }
        REQUIRE(solver->calls == 1);
    }

    SECTION("Recovery on the second attempt")
    {
        auto solver = std::make_shared<FlakySolver>();
        MeanVarianceOptimizer allocator(solver);
        OptimizationResult result = allocator.optimize(balanced_stats_, constraints);

        REQUIRE(result.attempts >= 2);
        REQUIRE_FALSE(result.warnings.empty());
        REQUIRE_THAT(result.warnings.front(), ContainsSubstring("retried"));
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-6));
        REQUIRE(solver->options_seen[1].time_limit_seconds == constraints.solver_options.time_limit_seconds * 2.0);
        REQUIRE(allocator.get_name() == "MeanVarianceOptimizer(Flaky)");
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Input validation", "[Optimizer][Validation]")
{
    SECTION("Dimension mismatch")
    {
        REQUIRE_THROWS_AS(MeanVarianceOptimizer::validate_inputs(Eigen::VectorXd::Ones(3),
                                                                 Eigen::MatrixXd::Identity(2, 2)),
                          DataError);
    }

    SECTION("Empty returns")
    {
        REQUIRE_THROWS_AS(MeanVarianceOptimizer::validate_inputs(Eigen::VectorXd(), Eigen::MatrixXd()), DataError);
    }

    SECTION("Asymmetric covariance")
    {
        Eigen::MatrixXd cov(2, 2);
        cov << 0.04, 0.01,
               0.02, 0.04;
        REQUIRE_THROWS_AS(MeanVarianceOptimizer::validate_inputs(Eigen::VectorXd::Ones(2), cov), DataError);
    }

    SECTION("Covariance not positive semi-definite")
    {
        Eigen::MatrixXd cov(2, 2);
        cov << 0.01, 0.05,
               0.05, 0.01;
        REQUIRE_THROWS_AS(MeanVarianceOptimizer::validate_inputs(Eigen::VectorXd::Ones(2), cov), DataError);
    }

    SECTION("NaN expected return")
    {
        Eigen::VectorXd mu = Eigen::VectorXd::Ones(2);
        mu(1) = std::nan("");
        REQUIRE_THROWS_AS(MeanVarianceOptimizer::validate_inputs(mu, Eigen::MatrixXd::Identity(2, 2)), DataError);
    }

    SECTION("Bad constraint values")
    {
        AllocationConstraints constraints = open_constraints(1.0, 0.01);
        constraints.min_equity = 0.7;
        constraints.max_equity = 0.3;
        REQUIRE_THROWS_AS(MeanVarianceOptimizer().optimize(balanced_stats_, constraints), ValidationError);
        REQUIRE_THROWS_AS(AllocationConstraints::from_category(profile::RiskCategory::MODERATE,
                                                               OptimizerConfig(), 0.0),
                          ValidationError);
    }
}

TEST_CASE("Constraints from a resolved profile", "[Optimizer][Constraints]")
{
    profile::RiskProfiler profiler;
    OptimizerConfig config;

    profile::RiskProfile eligible = profiler.profile(profile::KycResponse(50, 50, 50, 50, 50, 50));
    AllocationConstraints constraints = AllocationConstraints::from_profile(eligible, config, 10.0);
    REQUIRE(constraints.category == profile::RiskCategory::MODERATE);
    REQUIRE_THAT(constraints.target_volatility, WithinAbs(0.12, 1e-12));
    REQUIRE_THAT(constraints.risk_aversion(), WithinAbs(0.5 / 0.12, 1e-12));

    profile::RiskProfile blocked = profiler.profile(profile::KycResponse(60, 70, 50, 30, 50, 70));
    REQUIRE_THROWS_AS(AllocationConstraints::from_profile(blocked, config, 10.0), ValidationError);
}

TEST_CASE("Optimizer configuration parsing", "[Optimizer][Config]")
{
    nlohmann::json j = {{"max_single_asset", 0.35}, {"dust_policy", "floor"}, {"equity_classes", {"equity", "reit"}}};
    OptimizerConfig config = OptimizerConfig::from_json(j);
    REQUIRE(config.max_single_asset == 0.35);
    REQUIRE(config.dust_policy == DustPolicy::FLOOR);
    REQUIRE(config.equity_classes.size() == 2);

    AllocationConstraints constraints =
        AllocationConstraints::from_category(profile::RiskCategory::AGGRESSIVE, config, 10.0);
    REQUIRE(constraints.is_equity("reit"));
    REQUIRE_FALSE(constraints.is_equity("bond"));

    REQUIRE_THROWS_AS(OptimizerConfig::from_json({{"max_single_asset", 1.5}}), ValidationError);
    REQUIRE_THROWS_AS(OptimizerConfig::from_json({{"dust_policy", "round"}}), ValidationError);
}
