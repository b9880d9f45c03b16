/**
 * @file test_allocation_pipeline.cpp
 * @brief End-to-end tests of the allocation pipeline on in-memory data
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "pipeline/allocation_pipeline.hpp"
#include "test_fixtures.hpp"

#include <cmath>
#include <future>
#include <numeric>
#include <vector>

using namespace advisor;
using namespace advisor::pipeline;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace
{
    AllocationRequest level_request(int level, double amount = 100000.0, double horizon = 10.0)
    {
        AllocationRequest request;
        request.amount = amount;
        request.horizon_years = horizon;
        request.risk_level = level;
        return request;
    }

    double sum_values(const std::map<std::string, double> &m)
    {
        return std::accumulate(m.begin(), m.end(), 0.0,
                               [](double acc, const std::pair<const std::string, double> &e)
                               { return acc + e.second; });
    }
}

TEST_CASE("Pipeline produces a complete allocation", "[Pipeline]")
{
    auto cache = std::make_shared<StatisticsCache>();
    AllocationPipeline allocation(testing::balanced_context(), PipelineConfig(), cache);

    AllocationResult result = allocation.run(level_request(5));

    REQUIRE(result.ok());
    REQUIRE(result.risk_profile.category == profile::RiskCategory::MODERATE);
    REQUIRE(result.weights.size() == 5);
    REQUIRE_THAT(sum_values(result.weights), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(sum_values(result.amounts), WithinRel(100000.0, 1e-6));
    for (const auto &w : result.weights)
    {
        REQUIRE(w.second >= 0.0);
        REQUIRE(w.second <= 0.40 + 1e-6);
        REQUIRE_THAT(result.amounts.at(w.first), WithinAbs(w.second * 100000.0, 1e-6));
    }

    SECTION("Portfolio statistics")
    {
        REQUIRE(result.optimization.has_value());
        REQUIRE(result.optimization->equity_weight >= 0.30 - 1e-6);
        REQUIRE(result.optimization->equity_weight <= 0.65 + 1e-6);
        REQUIRE(result.volatility > 0.0);
        REQUIRE_THAT(result.projected_value,
                     WithinRel(100000.0 * std::pow(1.0 + result.expected_return, 10.0), 1e-12));
        REQUIRE(result.base_currency == "ILS");
    }

    SECTION("Historical replay over the normalized window")
    {
        REQUIRE(result.history.has_value());
        REQUIRE(result.history->values.size() == 121);
        REQUIRE(result.history->values.front() == 100000.0);
        REQUIRE(result.history->dates.front() == data::Date(2014, 12, 31));
        REQUIRE(result.history->dates.back() == data::Date(2024, 12, 31));
    }

    SECTION("Statistics are shared across requests")
    {
        REQUIRE(cache->misses() == 1);
        AllocationResult aggressive = allocation.run(level_request(8));
        REQUIRE(cache->hits() == 1);
        REQUIRE(cache->size() == 1);
        REQUIRE(aggressive.statistics_key == result.statistics_key);
        REQUIRE(aggressive.optimization->equity_weight >= 0.55 - 1e-6);
    }

    SECTION("JSON output")
    {
        nlohmann::json j = result.to_json();
        REQUIRE(j["status"] == "ok");
        REQUIRE(j["weights"].size() == 5);
        REQUIRE(j["profile"]["category"] == "Moderate");
        REQUIRE(j.contains("performance"));
    }
}

TEST_CASE("Inconsistent KYC responses produce no portfolio", "[Pipeline]")
{
    auto cache = std::make_shared<StatisticsCache>();
    AllocationPipeline allocation(testing::balanced_context(), PipelineConfig(), cache);

    AllocationRequest request;
    request.amount = 50000.0;
    request.horizon_years = 5.0;
    request.kyc = profile::KycResponse(60, 70, 50, 30, 50, 70);

    AllocationResult result = allocation.run(request);

    REQUIRE(result.status == PipelineStatus::INCONSISTENT_RESPONSES);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.violations.size() == 1);
    REQUIRE(result.violations[0].code == "low_capacity_high_loss");
    REQUIRE(result.weights.empty());
    REQUIRE_FALSE(result.optimization.has_value());
    REQUIRE_FALSE(result.history.has_value());
    // Data is never touched
    REQUIRE(cache->misses() == 0);

    nlohmann::json j = result.to_json();
    REQUIRE(j["status"] == "inconsistent_responses");
    REQUIRE_FALSE(j.contains("weights"));
}

TEST_CASE("KYC warnings are carried into the result", "[Pipeline]")
{
    AllocationPipeline allocation(testing::balanced_context(), PipelineConfig());

    AllocationRequest request;
    request.amount = 20000.0;
    request.horizon_years = 3.0;
    request.kyc = profile::KycResponse(20, 80, 50, 80, 50, 80);

    AllocationResult result = allocation.run(request);
    REQUIRE(result.ok());
    REQUIRE(result.risk_profile.category == profile::RiskCategory::CONSERVATIVE);
    REQUIRE(result.violations.size() == 1);
    REQUIRE_FALSE(result.warnings.empty());
    REQUIRE(result.warnings.front() == result.violations[0].message);
}

TEST_CASE("Universe selection", "[Pipeline]")
{
    AllocationPipeline allocation(testing::balanced_context(), PipelineConfig());

    SECTION("Subset of the loaded assets")
    {
        AllocationRequest request = level_request(5);
        request.universe = {"EQ_US", "BOND_GOV", "EQ_IL"};
        AllocationResult result = allocation.run(request);
        REQUIRE(result.weights.size() == 3);
        REQUIRE(result.weights.count("EQ_EM") == 0);
        REQUIRE(result.statistics_key.rfind("BOND_GOV,EQ_IL,EQ_US|", 0) == 0);
    }

    SECTION("Unknown asset")
    {
        AllocationRequest request = level_request(5);
        request.universe = {"EQ_US", "NOPE"};
        REQUIRE_THROWS_AS(allocation.run(request), ValidationError);
    }

    SECTION("Equity band unreachable without equities")
    {
        AllocationRequest request = level_request(5);
        request.universe = {"BOND_GOV", "BOND_CORP"};
        REQUIRE_THROWS_AS(allocation.run(request), InfeasibleConstraintsError);
    }
}

TEST_CASE("Short horizons cap equity", "[Pipeline]")
{
    AllocationPipeline allocation(testing::balanced_context(), PipelineConfig());
    AllocationResult result = allocation.run(level_request(8, 10000.0, 1.0));
    REQUIRE(result.optimization->equity_weight <= 0.55 + 1e-6);
}

TEST_CASE("Request validation", "[Pipeline][Validation]")
{
    AllocationPipeline allocation(testing::balanced_context(), PipelineConfig());

    SECTION("Non-positive amount")
    {
        REQUIRE_THROWS_AS(allocation.run(level_request(5, 0.0)), ValidationError);
    }

    SECTION("Non-positive horizon")
    {
        REQUIRE_THROWS_AS(allocation.run(level_request(5, 1000.0, -1.0)), ValidationError);
    }

    SECTION("Both profile inputs")
    {
        AllocationRequest request = level_request(5);
        request.kyc = profile::KycResponse(50, 50, 50, 50, 50, 50);
        REQUIRE_THROWS_AS(allocation.run(request), ValidationError);
    }

    SECTION("Neither profile input")
    {
        AllocationRequest request = level_request(5);
        request.risk_level.reset();
        REQUIRE_THROWS_AS(allocation.run(request), ValidationError);
    }

    SECTION("Risk level out of range")
    {
        REQUIRE_THROWS_AS(allocation.run(level_request(11)), ValidationError);
    }

    SECTION("JSON requests")
    {
        AllocationRequest parsed = AllocationRequest::from_json(
            {{"risk_level", 3}, {"amount", 1000.0}, {"horizon_years", 5.0}, {"universe", {"EQ_IL", "BOND_GOV"}}});
        REQUIRE(parsed.risk_level == 3);
        REQUIRE(parsed.universe.size() == 2);
        REQUIRE_THROWS_AS(AllocationRequest::from_json({{"amount", 1000.0}, {"horizon_years", 5.0}}),
                          ValidationError);
    }

    SECTION("Missing context")
    {
        REQUIRE_THROWS_AS(AllocationPipeline(nullptr, PipelineConfig()), ValidationError);
    }
}

TEST_CASE("Reload invalidates cached statistics", "[Pipeline]")
{
    auto cache = std::make_shared<StatisticsCache>();
    AllocationPipeline allocation(testing::balanced_context(), PipelineConfig(), cache);

    allocation.run(level_request(5));
    const auto generation = cache->generation();

    allocation.reload(testing::balanced_context());
    REQUIRE(cache->size() == 0);
    REQUIRE(cache->generation() == generation + 1);

    allocation.run(level_request(5));
    REQUIRE(cache->misses() == 2);
    REQUIRE(cache->hits() == 0);
}

TEST_CASE("Concurrent requests agree", "[Pipeline]")
{
    auto cache = std::make_shared<StatisticsCache>();
    const AllocationPipeline allocation(testing::balanced_context(), PipelineConfig(), cache);

    std::vector<std::future<AllocationResult>> futures;
    for (int i = 0; i < 4; ++i)
    {
        futures.push_back(std::async(std::launch::async, [&allocation]()
                                     { return allocation.run(level_request(6)); }));
    }

    std::vector<AllocationResult> results;
    for (auto &f : futures)
    {
        results.push_back(f.get());
    }

    for (const auto &r : results)
    {
        REQUIRE(r.ok());
        REQUIRE(r.weights == results.front().weights);
    }
    REQUIRE(cache->size() == 1);
}
