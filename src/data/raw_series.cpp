/**
 * @file raw_series.cpp
 * @brief Implementation of RawSeries
 */

#include "data/raw_series.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace advisor
{
    namespace data
    {

        Frequency parse_frequency(const std::string &text)
        {
            std::string s = text;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            if (s == "daily" || s == "d")
                return Frequency::DAILY;
            if (s == "monthly" || s == "m")
                return Frequency::MONTHLY;
            throw ValidationError("Invalid frequency: '" + text + "' (expected daily or monthly)");
        }

        std::string to_string(Frequency frequency)
        {
            return frequency == Frequency::DAILY ? "daily" : "monthly";
        }

        RawSeries::RawSeries(std::string id,
                             std::string currency,
                             std::vector<Observation> observations)
            : id_(std::move(id)), currency_(std::move(currency)), observations_(std::move(observations))
        {
            if (id_.empty())
            {
                throw DataError("Series identifier cannot be empty");
            }

            for (size_t i = 0; i < observations_.size(); ++i)
            {
                if (!std::isfinite(observations_[i].value))
                {
                    throw DataError("Non-finite value at " + observations_[i].date.to_string(), id_);
                }
                if (i > 0 && !(observations_[i - 1].date < observations_[i].date))
                {
                    throw DataError("Dates must be strictly increasing: " +
                                        observations_[i - 1].date.to_string() + " followed by " +
                                        observations_[i].date.to_string(),
                                    id_);
                }
            }
        }

        const Date &RawSeries::first_date() const
        {
            if (observations_.empty())
            {
                throw DataError("Series has no observations", id_);
            }
            return observations_.front().date;
        }

        const Date &RawSeries::last_date() const
        {
            if (observations_.empty())
            {
                throw DataError("Series has no observations", id_);
            }
            return observations_.back().date;
        }

        RawSeries RawSeries::with_observations(std::vector<Observation> observations) const
        {
            return RawSeries(id_, currency_, std::move(observations));
        }

    } // namespace data
} // namespace advisor
