/**
 * @file kyc_response.cpp
 * @brief Implementation of KycResponse and KycQuestionnaire
 */

#include "profile/kyc_response.hpp"
#include "profile/risk_profiler.hpp"
#include "core/errors.hpp"

namespace advisor
{
    namespace profile
    {

        namespace
        {
            const char *const kQuestionKeys[kNumKycQuestions] = {
                "time_horizon",
                "loss_tolerance",
                "experience",
                "financial_capacity",
                "goal_orientation",
                "sleep_test"};

            void check_score(KycQuestion question, int score)
            {
                if (score < kMinKycScore || score > kMaxKycScore)
                {
                    throw ValidationError("KYC score for " + question_key(question) + " must be in [" +
                                          std::to_string(kMinKycScore) + ", " + std::to_string(kMaxKycScore) +
                                          "], got: " + std::to_string(score));
                }
            }
        } // namespace

        std::string question_key(KycQuestion question)
        {
            return kQuestionKeys[static_cast<size_t>(question)];
        }

        KycQuestion parse_question(const std::string &key)
        {
            for (size_t i = 0; i < kNumKycQuestions; ++i)
            {
                if (key == kQuestionKeys[i])
                {
                    return static_cast<KycQuestion>(i);
                }
            }
            throw ValidationError("Unknown KYC question: '" + key + "'");
        }

        // =========================================
        // KycResponse
        // =========================================

        KycResponse::KycResponse(int horizon, int loss, int experience_score,
                                 int financial, int goal, int sleep)
            : time_horizon(horizon),
              loss_tolerance(loss),
              experience(experience_score),
              financial_capacity(financial),
              goal_orientation(goal),
              sleep_test(sleep)
        {
            validate();
        }

        int KycResponse::score(KycQuestion question) const
        {
            switch (question)
            {
            case KycQuestion::TIME_HORIZON:
                return time_horizon;
            case KycQuestion::LOSS_TOLERANCE:
                return loss_tolerance;
            case KycQuestion::EXPERIENCE:
                return experience;
            case KycQuestion::FINANCIAL_CAPACITY:
                return financial_capacity;
            case KycQuestion::GOAL_ORIENTATION:
                return goal_orientation;
            case KycQuestion::SLEEP_TEST:
                return sleep_test;
            }
            throw ValidationError("Unknown KYC question");
        }

        void KycResponse::validate() const
        {
            for (size_t i = 0; i < kNumKycQuestions; ++i)
            {
                const auto q = static_cast<KycQuestion>(i);
                check_score(q, score(q));
            }
        }

        nlohmann::json KycResponse::to_json() const
        {
            nlohmann::json j;
            for (size_t i = 0; i < kNumKycQuestions; ++i)
            {
                const auto q = static_cast<KycQuestion>(i);
                j[question_key(q)] = score(q);
            }
            return j;
        }

        KycResponse KycResponse::from_json(const nlohmann::json &j)
        {
            KycQuestionnaire questionnaire;
            for (size_t i = 0; i < kNumKycQuestions; ++i)
            {
                const auto q = static_cast<KycQuestion>(i);
                const std::string key = question_key(q);
                if (!j.contains(key))
                {
                    continue;
                }
                const auto &value = j.at(key);
                if (!value.is_number_integer())
                {
                    throw ValidationError("KYC field '" + key + "' must be an integer");
                }
                questionnaire.set_answer(q, value.get<int>());
            }
            return questionnaire.response();
        }

        bool KycResponse::operator==(const KycResponse &other) const
        {
            return time_horizon == other.time_horizon &&
                   loss_tolerance == other.loss_tolerance &&
                   experience == other.experience &&
                   financial_capacity == other.financial_capacity &&
                   goal_orientation == other.goal_orientation &&
                   sleep_test == other.sleep_test;
        }

        // =========================================
        // KycQuestionnaire
        // =========================================

        void KycQuestionnaire::set_answer(KycQuestion question, int score)
        {
            check_score(question, score);
            answers_[static_cast<size_t>(question)] = score;
        }

        void KycQuestionnaire::clear_answer(KycQuestion question)
        {
            answers_[static_cast<size_t>(question)].reset();
        }

        std::optional<int> KycQuestionnaire::answer(KycQuestion question) const
        {
            return answers_[static_cast<size_t>(question)];
        }

        bool KycQuestionnaire::is_complete() const
        {
            return missing_questions().empty();
        }

        std::vector<KycQuestion> KycQuestionnaire::missing_questions() const
        {
            std::vector<KycQuestion> missing;
            for (size_t i = 0; i < kNumKycQuestions; ++i)
            {
                if (!answers_[i])
                {
                    missing.push_back(static_cast<KycQuestion>(i));
                }
            }
            return missing;
        }

        KycResponse KycQuestionnaire::response() const
        {
            const auto missing = missing_questions();
            if (!missing.empty())
            {
                std::string names;
                for (size_t i = 0; i < missing.size(); ++i)
                {
                    names += (i > 0 ? ", " : "") + question_key(missing[i]);
                }
                throw ValidationError("KYC questionnaire incomplete, missing: " + names);
            }
            return KycResponse(*answers_[0], *answers_[1], *answers_[2],
                               *answers_[3], *answers_[4], *answers_[5]);
        }

        RiskProfile KycQuestionnaire::resolve(const RiskProfiler &profiler) const
        {
            return profiler.profile(response());
        }

    } // namespace profile
} // namespace advisor
