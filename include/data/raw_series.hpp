/*
 * @file raw_series.hpp
 * @brief Immutable single-asset observation series as loaded from source.
 *
 * A RawSeries holds prices (or FX rates, or risk-free rate levels) exactly
 * as they were observed, in whatever frequency the source provided.
 * Normalization never modifies a RawSeries; every transformation returns
 * a new series.
 */

#ifndef ADVISOR_DATA_RAW_SERIES_HPP
#define ADVISOR_DATA_RAW_SERIES_HPP

#include "data/date.hpp"

#include <string>
#include <vector>

namespace advisor
{
    namespace data
    {
        /**
         * @enum Frequency
         * @brief Sampling frequency of a raw series.
         */
        enum class Frequency
        {
            DAILY,  /**< Trading-day (or finer) observations */
            MONTHLY /**< At most one observation per calendar month */
        };

        /**
         * @brief Parse "daily" / "monthly" (case-insensitive, also "d" / "m").
         * @throws ValidationError for any other text.
         */
        Frequency parse_frequency(const std::string &text);

        std::string to_string(Frequency frequency);

        /**
         * @struct Observation
         * @brief One (date, value) point of a raw series.
         */
        struct Observation
        {
            Date date;    ///< Observation date
            double value; ///< Price, FX rate or annual rate level
        };

        /**
         * @class RawSeries
         * @brief Ordered, validated observations for one identifier.
         *
         * @note Dates are strictly increasing and values finite; the
         *       constructor enforces both.
         * @note Instances are immutable after construction and safe for
         *       concurrent read access.
         */
        class RawSeries
        {
        public:
            /**
             * @brief Construct a validated series.
             * @param id Asset identifier (or FX / rate series name).
             * @param currency ISO currency code the values are quoted in.
             * @param observations Observations in strictly increasing date order.
             * @throws DataError if dates are not strictly increasing or a value is not finite.
             */
            RawSeries(std::string id,
                      std::string currency,
                      std::vector<Observation> observations);

            const std::string &id() const { return id_; }
            const std::string &currency() const { return currency_; }
            const std::vector<Observation> &observations() const { return observations_; }

            size_t size() const { return observations_.size(); }
            bool empty() const { return observations_.empty(); }

            /**
             * @brief First observation date.
             * @throws DataError if the series is empty.
             */
            const Date &first_date() const;

            /**
             * @brief Last observation date.
             * @throws DataError if the series is empty.
             */
            const Date &last_date() const;

            /**
             * @brief Derive a new series with the same identity and different points.
             * @param observations Replacement observations (validated like the constructor).
             */
            RawSeries with_observations(std::vector<Observation> observations) const;

        private:
            std::string id_;
            std::string currency_;
            std::vector<Observation> observations_;
        };

    } // namespace data
} // namespace advisor

#endif // ADVISOR_DATA_RAW_SERIES_HPP
