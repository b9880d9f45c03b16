/**
 * @file kyc_response.hpp
 * @brief Questionnaire answers and the collecting-state questionnaire
 */

#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace advisor
{
    namespace profile
    {

        /**
         * @enum KycQuestion
         * @brief The six scored questionnaire dimensions
         */
        enum class KycQuestion
        {
            TIME_HORIZON = 0,
            LOSS_TOLERANCE,
            EXPERIENCE,
            FINANCIAL_CAPACITY,
            GOAL_ORIENTATION,
            SLEEP_TEST
        };

        constexpr size_t kNumKycQuestions = 6;
        constexpr int kMinKycScore = 0;
        constexpr int kMaxKycScore = 100;

        /// JSON / display key, e.g. "time_horizon"
        std::string question_key(KycQuestion question);

        /**
         * @brief Parse a question key
         * @throws ValidationError for an unknown key
         */
        KycQuestion parse_question(const std::string &key);

        /**
         * @struct KycResponse
         * @brief A complete, validated questionnaire submission
         *
         * Every score lies in [0, 100]. Instances are never modified after
         * construction; build a new one when answers change.
         */
        struct KycResponse
        {
            int time_horizon = 0;
            int loss_tolerance = 0;
            int experience = 0;
            int financial_capacity = 0;
            int goal_orientation = 0;
            int sleep_test = 0;

            KycResponse() = default;

            /**
             * @throws ValidationError if any score is outside [0, 100]
             */
            KycResponse(int horizon, int loss, int experience_score,
                        int financial, int goal, int sleep);

            int score(KycQuestion question) const;

            /**
             * @throws ValidationError if any score is outside [0, 100]
             */
            void validate() const;

            nlohmann::json to_json() const;

            /**
             * @brief Parse {"time_horizon": 70, "loss_tolerance": 40, ...}
             * @throws ValidationError if a field is missing, not an integer, or out of range
             */
            static KycResponse from_json(const nlohmann::json &j);

            bool operator==(const KycResponse &other) const;
            bool operator!=(const KycResponse &other) const { return !(*this == other); }
        };

        class RiskProfiler;
        struct RiskProfile;

        /**
         * @class KycQuestionnaire
         * @brief Collecting state: answers arrive one at a time
         *
         * resolve() moves to the resolved state by producing a RiskProfile.
         * The questionnaire stays editable afterwards; changing an answer and
         * resolving again yields a fresh profile.
         *
         * @code
         * KycQuestionnaire q;
         * q.set_answer(KycQuestion::TIME_HORIZON, 80);
         * ...
         * if (q.is_complete())
         *     RiskProfile p = q.resolve(profiler);
         * @endcode
         */
        class KycQuestionnaire
        {
        public:
            /**
             * @throws ValidationError if score is outside [0, 100]
             */
            void set_answer(KycQuestion question, int score);

            void clear_answer(KycQuestion question);

            std::optional<int> answer(KycQuestion question) const;

            bool is_complete() const;

            std::vector<KycQuestion> missing_questions() const;

            /**
             * @brief Snapshot the answers as a response
             * @throws ValidationError listing unanswered questions
             */
            KycResponse response() const;

            /**
             * @brief Resolve the answers into a profile
             * @throws ValidationError listing unanswered questions
             */
            RiskProfile resolve(const RiskProfiler &profiler) const;

        private:
            std::array<std::optional<int>, kNumKycQuestions> answers_{};
        };

    } // namespace profile
} // namespace advisor
