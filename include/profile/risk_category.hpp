/**
 * @file risk_category.hpp
 * @brief Five-tier risk category enumeration and its static constraint table
 *
 * Categories are ordered from most to least conservative. Score ranges
 * are closed-open [lower, next lower) with the top tier closed at 100,
 * so every score in [0, 100] maps to exactly one category.
 */

#pragma once

#include <array>
#include <string>

namespace advisor
{
    namespace profile
    {

        /**
         * @enum RiskCategory
         * @brief Risk tiers, most conservative first
         */
        enum class RiskCategory
        {
            ULTRA_CONSERVATIVE = 0,
            CONSERVATIVE,
            MODERATE,
            AGGRESSIVE,
            VERY_AGGRESSIVE
        };

        constexpr size_t kNumRiskCategories = 5;

        /**
         * @struct CategoryConstraints
         * @brief Portfolio limits attached to a risk category
         */
        struct CategoryConstraints
        {
            RiskCategory category;
            const char *name;
            double score_lower;         ///< Inclusive lower bound of the composite score range
            double target_volatility;   ///< Annualized
            double max_drawdown;        ///< Positive fraction
            int recovery_months;        ///< Acceptable time to recover from max drawdown
            double min_equity;          ///< Aggregate equity weight lower bound
            double max_equity;          ///< Aggregate equity weight upper bound
            double international_max;   ///< Cap on assets quoted outside the base currency
            double alternatives_max;    ///< Cap on alternative asset classes
        };

        /// One flat table, indexed by RiskCategory
        constexpr std::array<CategoryConstraints, kNumRiskCategories> kCategoryTable = {{
            {RiskCategory::ULTRA_CONSERVATIVE, "Ultra Conservative", 0.0, 0.04, 0.03, 6, 0.05, 0.20, 0.15, 0.02},
            {RiskCategory::CONSERVATIVE, "Conservative", 26.0, 0.08, 0.08, 12, 0.15, 0.40, 0.25, 0.05},
            {RiskCategory::MODERATE, "Moderate", 46.0, 0.12, 0.15, 24, 0.30, 0.65, 0.40, 0.10},
            {RiskCategory::AGGRESSIVE, "Aggressive", 66.0, 0.18, 0.25, 36, 0.55, 0.80, 0.60, 0.20},
            {RiskCategory::VERY_AGGRESSIVE, "Very Aggressive", 86.0, 0.22, 0.40, 48, 0.70, 0.95, 0.80, 0.30},
        }};

        constexpr const CategoryConstraints &category_constraints(RiskCategory category)
        {
            return kCategoryTable[static_cast<size_t>(category)];
        }

        std::string category_name(RiskCategory category);

        /**
         * @brief Parse a category name ("Moderate", "very_aggressive", ...)
         * @throws ValidationError for unknown names
         */
        RiskCategory parse_category(const std::string &text);

        /**
         * @brief Bucket a composite score
         * @throws ValidationError if score is outside [0, 100] or not finite
         */
        RiskCategory category_for_score(double score);

        /**
         * @brief Map a pre-resolved 1-10 risk level to a category
         *
         * 1-2 Ultra Conservative, 3-4 Conservative, 5-6 Moderate,
         * 7-8 Aggressive, 9-10 Very Aggressive.
         *
         * @throws ValidationError if level is outside [1, 10]
         */
        RiskCategory category_for_risk_level(int level);

        /**
         * @brief Position of a composite score on the 1-10 risk level scale
         *
         * Levels are interpolated inside each category band, so the level
         * always agrees with category_for_risk_level().
         */
        int risk_level_for_score(double score);

    } // namespace profile
} // namespace advisor
