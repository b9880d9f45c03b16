/**
 * @file risk_profiler.cpp
 * @brief Implementation of RiskProfiler
 */

#include "profile/risk_profiler.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <iterator>

namespace advisor
{
    namespace profile
    {

        namespace
        {
            constexpr double kConfidencePerRule = 0.1;
            constexpr double kMinConfidence = 0.5;
        } // namespace

        // ===================================================================
        // Configuration
        // ===================================================================

        void ProfilerConfig::validate() const
        {
            const ScoringWeights &w = weights;
            for (double v : {w.time_horizon, w.loss_tolerance, w.experience, w.financial_capacity, w.goal_orientation})
            {
                if (!std::isfinite(v) || v < 0.0)
                {
                    throw ValidationError("Scoring weights must be non-negative and finite");
                }
            }
            if (w.total() <= 0.0)
            {
                throw ValidationError("Scoring weights must not all be zero");
            }
            if (thresholds.short_horizon_multiplier <= 0.0 || thresholds.short_horizon_multiplier > 1.0)
            {
                throw ValidationError("short_horizon_multiplier must be in (0, 1], got: " +
                                      std::to_string(thresholds.short_horizon_multiplier));
            }
            if (thresholds.inexperienced_score_cap < 0.0 || thresholds.inexperienced_score_cap > 100.0 ||
                thresholds.capacity_score_cap < 0.0 || thresholds.capacity_score_cap > 100.0)
            {
                throw ValidationError("Score caps must be in [0, 100]");
            }
        }

        ProfilerConfig ProfilerConfig::from_json(const nlohmann::json &j)
        {
            ProfilerConfig config;

            if (j.contains("weights"))
            {
                const auto &w = j["weights"];
                config.weights.time_horizon = w.value("time_horizon", config.weights.time_horizon);
                config.weights.loss_tolerance = w.value("loss_tolerance", config.weights.loss_tolerance);
                config.weights.experience = w.value("experience", config.weights.experience);
                config.weights.financial_capacity = w.value("financial_capacity", config.weights.financial_capacity);
                config.weights.goal_orientation = w.value("goal_orientation", config.weights.goal_orientation);
            }

            if (j.contains("thresholds"))
            {
                const auto &t = j["thresholds"];
                ConsistencyThresholds &c = config.thresholds;
                c.short_horizon_below = t.value("short_horizon_below", c.short_horizon_below);
                c.high_loss_tolerance_above = t.value("high_loss_tolerance_above", c.high_loss_tolerance_above);
                c.short_horizon_multiplier = t.value("short_horizon_multiplier", c.short_horizon_multiplier);
                c.low_experience_below = t.value("low_experience_below", c.low_experience_below);
                c.aggressive_goal_above = t.value("aggressive_goal_above", c.aggressive_goal_above);
                c.inexperienced_score_cap = t.value("inexperienced_score_cap", c.inexperienced_score_cap);
                c.low_capacity_below = t.value("low_capacity_below", c.low_capacity_below);
                c.capacity_loss_tolerance_above = t.value("capacity_loss_tolerance_above", c.capacity_loss_tolerance_above);
                c.capacity_score_cap = t.value("capacity_score_cap", c.capacity_score_cap);
                c.sleep_gap_above = t.value("sleep_gap_above", c.sleep_gap_above);
            }

            config.validate();
            return config;
        }

        std::string to_string(Severity severity)
        {
            return severity == Severity::ERROR ? "error" : "warning";
        }

        bool RuleViolation::operator==(const RuleViolation &other) const
        {
            return rule == other.rule && code == other.code &&
                   severity == other.severity && message == other.message;
        }

        // ===================================================================
        // RiskProfile
        // ===================================================================

        bool RiskProfile::has_errors() const
        {
            return std::any_of(violations.begin(), violations.end(),
                               [](const RuleViolation &v) { return v.severity == Severity::ERROR; });
        }

        std::vector<RuleViolation> RiskProfile::errors() const
        {
            std::vector<RuleViolation> out;
            std::copy_if(violations.begin(), violations.end(), std::back_inserter(out),
                         [](const RuleViolation &v) { return v.severity == Severity::ERROR; });
            return out;
        }

        std::vector<RuleViolation> RiskProfile::warnings() const
        {
            std::vector<RuleViolation> out;
            std::copy_if(violations.begin(), violations.end(), std::back_inserter(out),
                         [](const RuleViolation &v) { return v.severity == Severity::WARNING; });
            return out;
        }

        nlohmann::json RiskProfile::to_json() const
        {
            const CategoryConstraints &c = constraints();
            nlohmann::json j;
            j["composite_score"] = composite_score ? nlohmann::json(*composite_score) : nlohmann::json(nullptr);
            j["category"] = c.name;
            j["risk_level"] = risk_level;
            j["confidence"] = confidence;
            j["eligible"] = is_eligible();
            j["constraints"] = {
                {"target_volatility", c.target_volatility},
                {"max_drawdown", c.max_drawdown},
                {"min_equity", c.min_equity},
                {"max_equity", c.max_equity},
                {"recovery_months", c.recovery_months}};

            nlohmann::json rules = nlohmann::json::array();
            for (const auto &v : violations)
            {
                rules.push_back({{"rule", v.rule},
                                 {"code", v.code},
                                 {"severity", to_string(v.severity)},
                                 {"message", v.message}});
            }
            j["violations"] = rules;
            return j;
        }

        void RiskProfile::print_summary() const
        {
            const CategoryConstraints &c = constraints();
            std::cout << "\n=== Risk Profile ===\n";
            if (composite_score)
            {
                std::cout << "Composite score: " << std::fixed << std::setprecision(1) << *composite_score << "\n";
            }
            else
            {
                std::cout << "Composite score: (pre-resolved risk level)\n";
            }
            std::cout << "Category:        " << c.name << " (level " << risk_level << "/10)\n";
            std::cout << "Confidence:      " << std::setprecision(0) << confidence * 100 << "%\n";
            std::cout << "Target vol:      " << std::setprecision(1) << c.target_volatility * 100 << "%"
                      << "  Max drawdown: " << c.max_drawdown * 100 << "%"
                      << "  Equity: " << c.min_equity * 100 << "-" << c.max_equity * 100 << "%\n";
            for (const auto &v : violations)
            {
                std::cout << "  [" << (v.severity == Severity::ERROR ? "ERROR" : "warn") << "] rule "
                          << v.rule << ": " << v.message << "\n";
            }
            std::cout << "====================\n"
                      << std::endl;
        }

        bool RiskProfile::operator==(const RiskProfile &other) const
        {
            return composite_score == other.composite_score &&
                   base_score == other.base_score &&
                   category == other.category &&
                   risk_level == other.risk_level &&
                   confidence == other.confidence &&
                   violations == other.violations;
        }

        // ===================================================================
        // RiskProfiler
        // ===================================================================

        RiskProfiler::RiskProfiler(ProfilerConfig config) : config_(config)
        {
            config_.validate();
        }

        std::vector<RuleViolation> RiskProfiler::evaluate_rules(const KycResponse &r) const
        {
            const ConsistencyThresholds &t = config_.thresholds;
            std::vector<RuleViolation> violations;

            if (r.time_horizon < t.short_horizon_below && r.loss_tolerance > t.high_loss_tolerance_above)
            {
                violations.push_back({1, "short_horizon_high_loss", Severity::WARNING,
                                      "Short investment horizon (" + std::to_string(r.time_horizon) +
                                          ") conflicts with high loss tolerance (" +
                                          std::to_string(r.loss_tolerance) + "); score reduced"});
            }

            if (r.experience < t.low_experience_below && r.goal_orientation > t.aggressive_goal_above)
            {
                violations.push_back({2, "inexperienced_aggressive_goal", Severity::WARNING,
                                      "Limited investment experience (" + std::to_string(r.experience) +
                                          ") with aggressive return goals (" +
                                          std::to_string(r.goal_orientation) + "); score capped"});
            }

            if (r.financial_capacity < t.low_capacity_below &&
                r.loss_tolerance > t.capacity_loss_tolerance_above)
            {
                violations.push_back({3, "low_capacity_high_loss", Severity::ERROR,
                                      "Financial capacity (" + std::to_string(r.financial_capacity) +
                                          ") cannot support the stated loss tolerance (" +
                                          std::to_string(r.loss_tolerance) +
                                          "); please review your answers"});
            }

            if (std::abs(r.sleep_test - r.loss_tolerance) > t.sleep_gap_above)
            {
                violations.push_back({4, "sleep_test_mismatch", Severity::WARNING,
                                      "Sleep test (" + std::to_string(r.sleep_test) +
                                          ") and stated loss tolerance (" + std::to_string(r.loss_tolerance) +
                                          ") disagree; the more conservative answer is used"});
            }

            return violations;
        }

        double RiskProfiler::weighted_score(const KycResponse &r, int loss_tolerance) const
        {
            const ScoringWeights &w = config_.weights;
            const double sum = w.time_horizon * r.time_horizon +
                               w.loss_tolerance * loss_tolerance +
                               w.experience * r.experience +
                               w.financial_capacity * r.financial_capacity +
                               w.goal_orientation * r.goal_orientation;
            return sum / w.total();
        }

        RiskProfile RiskProfiler::profile(const KycResponse &response) const
        {
            response.validate();

            RiskProfile result;
            result.violations = evaluate_rules(response);

            auto fired = [&result](int rule)
            {
                return std::any_of(result.violations.begin(), result.violations.end(),
                                   [rule](const RuleViolation &v) { return v.rule == rule; });
            };

            const ConsistencyThresholds &t = config_.thresholds;

            const int loss = fired(4) ? std::min(response.sleep_test, response.loss_tolerance)
                                      : response.loss_tolerance;
            double score = weighted_score(response, loss);
            result.base_score = score;

            if (fired(1))
            {
                score *= t.short_horizon_multiplier;
            }
            if (fired(2))
            {
                score = std::min(score, t.inexperienced_score_cap);
            }
            if (fired(3))
            {
                score = std::min(score, t.capacity_score_cap);
            }
            score = std::max(0.0, std::min(100.0, score));

            result.composite_score = score;
            result.category = category_for_score(score);
            result.risk_level = risk_level_for_score(score);
            result.confidence = std::max(kMinConfidence,
                                         1.0 - kConfidencePerRule * static_cast<double>(result.violations.size()));
            return result;
        }

        RiskProfile RiskProfiler::from_risk_level(int level) const
        {
            RiskProfile result;
            result.category = category_for_risk_level(level);
            result.risk_level = level;
            result.confidence = 1.0;
            return result;
        }

    } // namespace profile
} // namespace advisor
