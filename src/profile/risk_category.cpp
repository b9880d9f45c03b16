/**
 * @file risk_category.cpp
 * @brief Category lookup helpers
 */

#include "profile/risk_category.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <cmath>

namespace advisor
{
    namespace profile
    {

        std::string category_name(RiskCategory category)
        {
            return category_constraints(category).name;
        }

        RiskCategory parse_category(const std::string &text)
        {
            auto normalize = [](const std::string &s)
            {
                std::string out;
                for (unsigned char c : s)
                {
                    if (c == ' ' || c == '_' || c == '-')
                        continue;
                    out.push_back(static_cast<char>(std::tolower(c)));
                }
                return out;
            };

            const std::string key = normalize(text);
            for (const auto &entry : kCategoryTable)
            {
                if (normalize(entry.name) == key)
                {
                    return entry.category;
                }
            }
            throw ValidationError("Unknown risk category: '" + text + "'");
        }

        RiskCategory category_for_score(double score)
        {
            if (!std::isfinite(score) || score < 0.0 || score > 100.0)
            {
                throw ValidationError("Composite score must be in [0, 100], got: " + std::to_string(score));
            }

            // Highest tier whose lower bound the score reaches
            RiskCategory result = RiskCategory::ULTRA_CONSERVATIVE;
            for (const auto &entry : kCategoryTable)
            {
                if (score >= entry.score_lower)
                {
                    result = entry.category;
                }
            }
            return result;
        }

        RiskCategory category_for_risk_level(int level)
        {
            if (level < 1 || level > 10)
            {
                throw ValidationError("Risk level must be in [1, 10], got: " + std::to_string(level));
            }
            return static_cast<RiskCategory>((level - 1) / 2);
        }

        int risk_level_for_score(double score)
        {
            const RiskCategory category = category_for_score(score);
            const size_t idx = static_cast<size_t>(category);
            const double lower = kCategoryTable[idx].score_lower;
            const double upper = (idx + 1 < kNumRiskCategories) ? kCategoryTable[idx + 1].score_lower : 100.0;
            const double fraction = (upper > lower) ? (score - lower) / (upper - lower) : 0.0;
            return static_cast<int>(2 * idx + 1) + (fraction >= 0.5 ? 1 : 0);
        }

    } // namespace profile
} // namespace advisor
