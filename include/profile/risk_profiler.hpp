/**
 * @file risk_profiler.hpp
 * @brief Maps questionnaire answers to a composite score and risk category
 *
 * Scoring procedure:
 *   1. If the sleep test and the stated loss tolerance disagree by more
 *      than the gap threshold, the lower of the two replaces loss
 *      tolerance in the composite.
 *   2. Composite = weighted sum of horizon, loss tolerance, experience,
 *      financial capacity and goal scores (weights normalized to 1).
 *   3. Rule adjustments, in rule order: short-horizon multiplier,
 *      inexperience cap, capacity cap.
 *   4. Clamp to [0, 100] and bucket into a category.
 *
 * All four consistency rules are evaluated on every call. Rule 3 (low
 * financial capacity with high loss tolerance) has error severity and
 * makes the profile ineligible for optimization.
 */

#pragma once

#include "profile/kyc_response.hpp"
#include "profile/risk_category.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace advisor
{
    namespace profile
    {

        /**
         * @struct ScoringWeights
         * @brief Composite score weights (normalized before use)
         */
        struct ScoringWeights
        {
            double time_horizon = 0.25;
            double loss_tolerance = 0.30;
            double experience = 0.20;
            double financial_capacity = 0.15;
            double goal_orientation = 0.10;

            double total() const
            {
                return time_horizon + loss_tolerance + experience + financial_capacity + goal_orientation;
            }
        };

        /**
         * @struct ConsistencyThresholds
         * @brief Trigger points and adjustments of the four consistency rules
         */
        struct ConsistencyThresholds
        {
            int short_horizon_below = 30;           ///< Rule 1
            int high_loss_tolerance_above = 70;     ///< Rule 1
            double short_horizon_multiplier = 0.8;  ///< Rule 1 adjustment

            int low_experience_below = 30;          ///< Rule 2
            int aggressive_goal_above = 80;         ///< Rule 2
            double inexperienced_score_cap = 65.0;  ///< Rule 2 adjustment

            int low_capacity_below = 40;            ///< Rule 3
            int capacity_loss_tolerance_above = 60; ///< Rule 3
            double capacity_score_cap = 45.0;       ///< Rule 3 adjustment

            int sleep_gap_above = 40;               ///< Rule 4
        };

        /**
         * @struct ProfilerConfig
         * @brief Risk profiler configuration
         */
        struct ProfilerConfig
        {
            ScoringWeights weights;
            ConsistencyThresholds thresholds;

            /**
             * @throws ValidationError on negative weights, zero total, or bad adjustments
             */
            void validate() const;

            static ProfilerConfig from_json(const nlohmann::json &j);
        };

        enum class Severity
        {
            WARNING,
            ERROR
        };

        std::string to_string(Severity severity);

        /**
         * @struct RuleViolation
         * @brief A triggered consistency rule
         */
        struct RuleViolation
        {
            int rule = 0;          ///< 1-4, evaluation order
            std::string code;      ///< Stable identifier, e.g. "short_horizon_high_loss"
            Severity severity = Severity::WARNING;
            std::string message;   ///< User-facing explanation

            bool operator==(const RuleViolation &other) const;
        };

        /**
         * @struct RiskProfile
         * @brief Resolved profile: score, category and triggered rules
         *
         * composite_score is empty for profiles built from a pre-resolved
         * risk level.
         */
        struct RiskProfile
        {
            std::optional<double> composite_score; ///< Final score in [0, 100]
            std::optional<double> base_score;      ///< Weighted score before rule adjustments
            RiskCategory category = RiskCategory::MODERATE;
            int risk_level = 5;                    ///< 1-10
            double confidence = 1.0;               ///< 1 - 0.1 per triggered rule, floor 0.5
            std::vector<RuleViolation> violations; ///< In rule order

            bool has_errors() const;

            /// False when any error-severity rule fired; such profiles must not reach the optimizer
            bool is_eligible() const { return !has_errors(); }

            std::vector<RuleViolation> errors() const;
            std::vector<RuleViolation> warnings() const;

            const CategoryConstraints &constraints() const { return category_constraints(category); }

            nlohmann::json to_json() const;
            void print_summary() const;

            bool operator==(const RiskProfile &other) const;
        };

        /**
         * @class RiskProfiler
         * @brief Pure function from KycResponse to RiskProfile
         *
         * Holds only its configuration; identical responses always yield
         * identical profiles. Safe to share across threads.
         */
        class RiskProfiler
        {
        public:
            explicit RiskProfiler(ProfilerConfig config = ProfilerConfig());

            const ProfilerConfig &config() const { return config_; }

            /**
             * @brief Resolve a complete response
             */
            RiskProfile profile(const KycResponse &response) const;

            /**
             * @brief Profile for a caller that already knows the risk level
             * @throws ValidationError if level is outside [1, 10]
             */
            RiskProfile from_risk_level(int level) const;

            /**
             * @brief Evaluate all consistency rules (no score adjustments)
             */
            std::vector<RuleViolation> evaluate_rules(const KycResponse &response) const;

            /**
             * @brief Weighted composite before adjustments
             * @param response Answers
             * @param loss_tolerance Loss tolerance value to use (after rule 4 substitution)
             */
            double weighted_score(const KycResponse &response, int loss_tolerance) const;

        private:
            ProfilerConfig config_;
        };

    } // namespace profile
} // namespace advisor
