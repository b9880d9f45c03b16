/**
 * @file date.hpp
 * @brief Calendar date value type and month arithmetic
 *
 * Dates in the data layer are plain civil dates (no time zone). All
 * month-end grid logic goes through the helpers declared here so the
 * normalizer, the reconstructor and the cache agree on one calendar.
 */

#pragma once

#include <string>

namespace advisor
{
    namespace data
    {

        /**
         * @struct Date
         * @brief Proleptic Gregorian calendar date
         *
         * Ordering and equality compare (year, month, day) lexicographically.
         *
         * Usage Example:
         * @code
         * Date d = Date::parse("2023-02-14");
         * Date eom = d.month_end();          // 2023-02-28
         * int idx = d.month_index();         // 2023*12 + 1
         * std::string s = eom.to_string();   // "2023-02-28"
         * @endcode
         */
        struct Date
        {
            int year = 1970;
            int month = 1;
            int day = 1;

            Date() = default;

            /**
             * @brief Construct and validate a calendar date
             * @throws ValidationError if month or day is out of range
             */
            Date(int y, int m, int d);

            /**
             * @brief Parse an ISO date string
             * @param text Date in YYYY-MM-DD form
             * @return Parsed date
             * @throws ValidationError on malformed text or an impossible date
             */
            static Date parse(const std::string &text);

            /// YYYY-MM-DD
            std::string to_string() const;

            /// Days since 1970-01-01 (negative before the epoch)
            long long days_since_epoch() const;

            /// Inverse of days_since_epoch()
            static Date from_days_since_epoch(long long days);

            /// Continuous month counter: year * 12 + (month - 1)
            int month_index() const { return year * 12 + (month - 1); }

            /// Last calendar day of the month identified by month_index
            static Date month_end_of(int month_index);

            /// Last calendar day of this date's month
            Date month_end() const { return month_end_of(month_index()); }

            bool is_month_end() const { return day == days_in_month(year, month); }

            static bool is_leap_year(int y);
            static int days_in_month(int y, int m);

            bool operator==(const Date &other) const;
            bool operator!=(const Date &other) const { return !(*this == other); }
            bool operator<(const Date &other) const;
            bool operator<=(const Date &other) const { return !(other < *this); }
            bool operator>(const Date &other) const { return other < *this; }
            bool operator>=(const Date &other) const { return !(*this < other); }
        };

        /**
         * @brief Span between two dates in years (365.25-day years)
         */
        double years_between(const Date &from, const Date &to);

        /**
         * @brief Signed number of whole calendar months from a to b by month index
         */
        inline int months_between(const Date &a, const Date &b)
        {
            return b.month_index() - a.month_index();
        }

    } // namespace data
} // namespace advisor
