/**
 * @file test_risk_profiler.cpp
 * @brief Unit tests for KYC scoring, consistency rules and category mapping
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "optimizer/allocation_constraints.hpp"
#include "profile/kyc_response.hpp"
#include "profile/risk_category.hpp"
#include "profile/risk_profiler.hpp"

using namespace advisor;
using namespace advisor::profile;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Category table
// ============================================================================

TEST_CASE("Score to category boundaries", "[RiskCategory]")
{
    REQUIRE(category_for_score(0.0) == RiskCategory::ULTRA_CONSERVATIVE);
    REQUIRE(category_for_score(25.9) == RiskCategory::ULTRA_CONSERVATIVE);
    REQUIRE(category_for_score(26.0) == RiskCategory::CONSERVATIVE);
    REQUIRE(category_for_score(45.99) == RiskCategory::CONSERVATIVE);
    REQUIRE(category_for_score(46.0) == RiskCategory::MODERATE);
    REQUIRE(category_for_score(66.0) == RiskCategory::AGGRESSIVE);
    REQUIRE(category_for_score(85.9) == RiskCategory::AGGRESSIVE);
    REQUIRE(category_for_score(86.0) == RiskCategory::VERY_AGGRESSIVE);
    REQUIRE(category_for_score(100.0) == RiskCategory::VERY_AGGRESSIVE);

    REQUIRE_THROWS_AS(category_for_score(-0.1), ValidationError);
    REQUIRE_THROWS_AS(category_for_score(100.1), ValidationError);
}

TEST_CASE("Risk levels", "[RiskCategory]")
{
    SECTION("Level from score splits each category in two")
    {
        REQUIRE(risk_level_for_score(0.0) == 1);
        REQUIRE(risk_level_for_score(25.9) == 2);
        REQUIRE(risk_level_for_score(26.0) == 3);
        REQUIRE(risk_level_for_score(50.0) == 5);
        REQUIRE(risk_level_for_score(60.0) == 6);
        REQUIRE(risk_level_for_score(86.0) == 9);
        REQUIRE(risk_level_for_score(100.0) == 10);
    }

    SECTION("Category from level")
    {
        REQUIRE(category_for_risk_level(1) == RiskCategory::ULTRA_CONSERVATIVE);
        REQUIRE(category_for_risk_level(2) == RiskCategory::ULTRA_CONSERVATIVE);
        REQUIRE(category_for_risk_level(5) == RiskCategory::MODERATE);
        REQUIRE(category_for_risk_level(8) == RiskCategory::AGGRESSIVE);
        REQUIRE(category_for_risk_level(10) == RiskCategory::VERY_AGGRESSIVE);
        REQUIRE_THROWS_AS(category_for_risk_level(0), ValidationError);
        REQUIRE_THROWS_AS(category_for_risk_level(11), ValidationError);
    }

    SECTION("Level and score agree on the category")
    {
        for (int score = 0; score <= 100; ++score)
        {
            const double s = static_cast<double>(score);
            REQUIRE(category_for_risk_level(risk_level_for_score(s)) == category_for_score(s));
        }
    }
}

TEST_CASE("Category constraints table", "[RiskCategory]")
{
    const CategoryConstraints &moderate = category_constraints(RiskCategory::MODERATE);
    REQUIRE(std::string(moderate.name) == "Moderate");
    REQUIRE_THAT(moderate.target_volatility, WithinAbs(0.12, 1e-12));
    REQUIRE_THAT(moderate.max_drawdown, WithinAbs(0.15, 1e-12));
    REQUIRE_THAT(moderate.min_equity, WithinAbs(0.30, 1e-12));
    REQUIRE_THAT(moderate.max_equity, WithinAbs(0.65, 1e-12));

    for (size_t i = 1; i < kNumRiskCategories; ++i)
    {
        REQUIRE(kCategoryTable[i].score_lower > kCategoryTable[i - 1].score_lower);
        REQUIRE(kCategoryTable[i].target_volatility > kCategoryTable[i - 1].target_volatility);
        REQUIRE(kCategoryTable[i].min_equity <= kCategoryTable[i].max_equity);
    }

    REQUIRE(parse_category("very aggressive") == RiskCategory::VERY_AGGRESSIVE);
    REQUIRE(parse_category("Ultra Conservative") == RiskCategory::ULTRA_CONSERVATIVE);
    REQUIRE_THROWS_AS(parse_category("reckless"), ValidationError);
}

// ============================================================================
// Scoring
// ============================================================================

TEST_CASE("Weighted composite score", "[RiskProfiler]")
{
    RiskProfiler profiler;

    SECTION("Uniform answers")
    {
        RiskProfile p = profiler.profile(KycResponse(50, 50, 50, 50, 50, 50));
        REQUIRE_THAT(*p.composite_score, WithinAbs(50.0, 1e-12));
        REQUIRE(p.category == RiskCategory::MODERATE);
        REQUIRE(p.risk_level == 5);
        REQUIRE(p.violations.empty());
        REQUIRE(p.confidence == 1.0);
        REQUIRE(p.is_eligible());
    }

    SECTION("Sleep test does not enter the weighted sum")
    {
        RiskProfile a = profiler.profile(KycResponse(60, 60, 60, 60, 60, 40));
        RiskProfile b = profiler.profile(KycResponse(60, 60, 60, 60, 60, 80));
        REQUIRE(*a.composite_score == *b.composite_score);
    }

    SECTION("Extremes")
    {
        REQUIRE(*profiler.profile(KycResponse(0, 0, 0, 0, 0, 0)).composite_score == 0.0);
        RiskProfile top = profiler.profile(KycResponse(100, 100, 100, 100, 100, 100));
        REQUIRE_THAT(*top.composite_score, WithinAbs(100.0, 1e-12));
        REQUIRE(top.category == RiskCategory::VERY_AGGRESSIVE);
        REQUIRE(top.risk_level == 10);
    }

    SECTION("Profiling is pure")
    {
        const KycResponse r(35, 75, 20, 30, 90, 20);
        RiskProfile first = profiler.profile(r);
        RiskProfile second = profiler.profile(r);
        REQUIRE(first == second);
    }

    SECTION("Out-of-range answers")
    {
        REQUIRE_THROWS_AS(KycResponse(50, 50, 50, 50, 50, 101), ValidationError);
        KycResponse r;
        r.experience = -1;
        REQUIRE_THROWS_AS(profiler.profile(r), ValidationError);
    }
}

// ============================================================================
// Consistency rules
// ============================================================================

TEST_CASE("Consistency rules", "[RiskProfiler][Rules]")
{
    RiskProfiler profiler;

    SECTION("Rule 1: short horizon with high loss tolerance reduces the score")
    {
        RiskProfile p = profiler.profile(KycResponse(20, 80, 50, 80, 50, 80));
        REQUIRE(p.violations.size() == 1);
        REQUIRE(p.violations[0].rule == 1);
        REQUIRE(p.violations[0].severity == Severity::WARNING);
        REQUIRE_THAT(*p.base_score, WithinAbs(56.0, 1e-12));
        REQUIRE_THAT(*p.composite_score, WithinAbs(56.0 * 0.8, 1e-12));
        REQUIRE(p.category == RiskCategory::CONSERVATIVE);
        REQUIRE_THAT(p.confidence, WithinAbs(0.9, 1e-12));
        REQUIRE(p.is_eligible());
    }

    SECTION("Rule 1 thresholds are strict")
    {
        RiskProfile p = profiler.profile(KycResponse(30, 80, 50, 80, 50, 80));
        REQUIRE(p.violations.empty());
        p = profiler.profile(KycResponse(20, 70, 50, 80, 50, 70));
        REQUIRE(p.violations.empty());
    }

    SECTION("Rule 2: inexperience with aggressive goals caps the score")
    {
        RiskProfile p = profiler.profile(KycResponse(90, 90, 20, 90, 90, 90));
        REQUIRE(p.violations.size() == 1);
        REQUIRE(p.violations[0].rule == 2);
        REQUIRE_THAT(*p.base_score, WithinAbs(76.0, 1e-12));
        REQUIRE_THAT(*p.composite_score, WithinAbs(65.0, 1e-12));
        REQUIRE(p.category == RiskCategory::MODERATE);
        REQUIRE(p.risk_level == 6);
    }

    SECTION("Rule 3: low capacity with high loss tolerance blocks the profile")
    {
        RiskProfile p = profiler.profile(KycResponse(60, 70, 50, 30, 50, 70));
        REQUIRE(p.violations.size() == 1);
        REQUIRE(p.violations[0].rule == 3);
        REQUIRE(p.violations[0].severity == Severity::ERROR);
        REQUIRE(p.has_errors());
        REQUIRE_FALSE(p.is_eligible());
        REQUIRE(p.errors().size() == 1);
        REQUIRE(p.warnings().empty());
        REQUIRE_THAT(*p.composite_score, WithinAbs(45.0, 1e-12));
    }

    SECTION("Rule 4: sleep test overrides stated loss tolerance")
    {
        RiskProfile p = profiler.profile(KycResponse(80, 80, 80, 80, 50, 10));
        REQUIRE(p.violations.size() == 1);
        REQUIRE(p.violations[0].rule == 4);
        // Loss tolerance replaced by the sleep test answer
        REQUIRE_THAT(*p.base_score, WithinAbs(0.25 * 80 + 0.30 * 10 + 0.20 * 80 + 0.15 * 80 + 0.10 * 50, 1e-12));
    }

    SECTION("Every rule at once")
    {
        RiskProfile p = profiler.profile(KycResponse(10, 80, 10, 10, 90, 10));
        REQUIRE(p.violations.size() == 4);
        for (size_t i = 0; i < 4; ++i)
        {
            REQUIRE(p.violations[i].rule == static_cast<int>(i + 1));
        }
        REQUIRE(p.has_errors());
        REQUIRE_THAT(p.confidence, WithinAbs(0.6, 1e-12));
    }
}

TEST_CASE("Rule 3 across the answer space", "[RiskProfiler][Rules]")
{
    RiskProfiler profiler;
    const optimizer::OptimizerConfig config;
    const int others[] = {0, 35, 70, 100};

    auto rule3 = [](const RiskProfile &p)
    {
        for (const auto &v : p.violations)
        {
            if (v.rule == 3)
                return true;
        }
        return false;
    };

    SECTION("Every low-capacity high-loss answer set is blocked")
    {
        size_t checked = 0;
        for (int capacity = 0; capacity < 40; ++capacity)
        {
            for (int loss = 61; loss <= 100; ++loss)
            {
                // Rotate the remaining answers so rules 1, 2 and 4 fire in some combinations
                const int horizon = others[(capacity + loss) % 4];
                const int experience = others[capacity % 4];
                const int goal = others[loss % 4];
                const int sleep = others[(capacity / 4 + loss) % 4];

                RiskProfile p = profiler.profile(KycResponse(horizon, loss, experience, capacity, goal, sleep));
                INFO("capacity=" << capacity << " loss=" << loss << " horizon=" << horizon);
                REQUIRE(rule3(p));
                REQUIRE(p.has_errors());
                REQUIRE_FALSE(p.is_eligible());
                REQUIRE_THROWS_AS(optimizer::AllocationConstraints::from_profile(p, config, 10.0), ValidationError);
                ++checked;
            }
        }
        REQUIRE(checked == 1600u);
    }

    SECTION("Answers just outside the thresholds never trigger it")
    {
        for (int capacity = 40; capacity <= 100; capacity += 3)
        {
            for (int loss = 61; loss <= 100; loss += 3)
            {
                RiskProfile p = profiler.profile(KycResponse(others[loss % 4], loss, 50, capacity, 50, loss));
                INFO("capacity=" << capacity << " loss=" << loss);
                REQUIRE_FALSE(rule3(p));
                REQUIRE(p.is_eligible());
                REQUIRE_NOTHROW(optimizer::AllocationConstraints::from_profile(p, config, 10.0));
            }
        }
        for (int capacity = 0; capacity < 40; capacity += 3)
        {
            for (int loss = 0; loss <= 60; loss += 4)
            {
                RiskProfile p = profiler.profile(KycResponse(others[capacity % 4], loss, 50, capacity, 50, loss));
                INFO("capacity=" << capacity << " loss=" << loss);
                REQUIRE_FALSE(rule3(p));
                REQUIRE(p.is_eligible());
            }
        }
        // Boundary pair
        REQUIRE_FALSE(rule3(profiler.profile(KycResponse(60, 61, 50, 40, 50, 61))));
        REQUIRE_FALSE(rule3(profiler.profile(KycResponse(60, 60, 50, 39, 50, 60))));
        REQUIRE(rule3(profiler.profile(KycResponse(60, 61, 50, 39, 50, 61))));
    }
}

TEST_CASE("Pre-resolved risk level", "[RiskProfiler]")
{
    RiskProfiler profiler;
    RiskProfile p = profiler.from_risk_level(7);
    REQUIRE(p.category == RiskCategory::AGGRESSIVE);
    REQUIRE(p.risk_level == 7);
    REQUIRE_FALSE(p.composite_score.has_value());
    REQUIRE(p.violations.empty());
    REQUIRE(p.is_eligible());
    REQUIRE_THROWS_AS(profiler.from_risk_level(0), ValidationError);

    nlohmann::json j = p.to_json();
    REQUIRE(j["category"] == "Aggressive");
    REQUIRE(j["composite_score"].is_null());
    REQUIRE(j["eligible"] == true);
}

TEST_CASE("Profiler configuration", "[RiskProfiler][Config]")
{
    SECTION("Custom weights")
    {
        nlohmann::json j = {{"weights", {{"time_horizon", 1.0},
                                         {"loss_tolerance", 0.0},
                                         {"experience", 0.0},
                                         {"financial_capacity", 0.0},
                                         {"goal_orientation", 0.0}}}};
        RiskProfiler profiler(ProfilerConfig::from_json(j));
        RiskProfile p = profiler.profile(KycResponse(90, 10, 10, 90, 10, 10));
        REQUIRE_THAT(*p.composite_score, WithinAbs(90.0, 1e-12));
    }

    SECTION("Invalid values")
    {
        REQUIRE_THROWS_AS(ProfilerConfig::from_json({{"thresholds", {{"short_horizon_multiplier", 1.5}}}}),
                          ValidationError);
        REQUIRE_THROWS_AS(ProfilerConfig::from_json({{"weights", {{"experience", -0.1}}}}), ValidationError);
    }
}

TEST_CASE("KYC questionnaire", "[KycResponse]")
{
    KycQuestionnaire q;
    REQUIRE_FALSE(q.is_complete());
    REQUIRE(q.missing_questions().size() == kNumKycQuestions);
    REQUIRE_THROWS_AS(q.response(), ValidationError);

    q.set_answer(KycQuestion::TIME_HORIZON, 70);
    q.set_answer(KycQuestion::LOSS_TOLERANCE, 60);
    q.set_answer(KycQuestion::EXPERIENCE, 50);
    q.set_answer(KycQuestion::FINANCIAL_CAPACITY, 80);
    q.set_answer(KycQuestion::GOAL_ORIENTATION, 40);
    REQUIRE(q.missing_questions() == std::vector<KycQuestion>{KycQuestion::SLEEP_TEST});
    REQUIRE_THROWS_AS(q.set_answer(KycQuestion::SLEEP_TEST, 120), ValidationError);

    q.set_answer(KycQuestion::SLEEP_TEST, 55);
    REQUIRE(q.is_complete());
    KycResponse r = q.response();
    REQUIRE(r.time_horizon == 70);
    REQUIRE(r.sleep_test == 55);
    REQUIRE(q.resolve(RiskProfiler()) == RiskProfiler().profile(r));

    SECTION("JSON")
    {
        REQUIRE(KycResponse::from_json(r.to_json()) == r);
        nlohmann::json partial = r.to_json();
        partial.erase("experience");
        REQUIRE_THROWS_AS(KycResponse::from_json(partial), ValidationError);
        nlohmann::json fractional = r.to_json();
        fractional["experience"] = 50.5;
        REQUIRE_THROWS_AS(KycResponse::from_json(fractional), ValidationError);
    }

    SECTION("Clearing an answer")
    {
        q.clear_answer(KycQuestion::EXPERIENCE);
        REQUIRE_FALSE(q.answer(KycQuestion::EXPERIENCE).has_value());
        REQUIRE(parse_question("sleep_test") == KycQuestion::SLEEP_TEST);
        REQUIRE_THROWS_AS(parse_question("age"), ValidationError);
    }
}
