/**
 * @file date.cpp
 * @brief Implementation of civil date arithmetic
 */

#include "data/date.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <cstdio>

namespace advisor
{
    namespace data
    {

        // ============================================================
        // Construction and Parsing
        // ============================================================

        Date::Date(int y, int m, int d) : year(y), month(m), day(d)
        {
            if (m < 1 || m > 12)
            {
                throw ValidationError("Invalid month " + std::to_string(m) + " in date");
            }
            if (d < 1 || d > days_in_month(y, m))
            {
                throw ValidationError("Invalid day " + std::to_string(d) + " for " +
                                      std::to_string(y) + "-" + std::to_string(m));
            }
        }

        Date Date::parse(const std::string &text)
        {
            // YYYY-MM-DD, exactly ten characters
            if (text.size() != 10 || text[4] != '-' || text[7] != '-')
            {
                throw ValidationError("Invalid date format (expected YYYY-MM-DD): '" + text + "'");
            }
            for (size_t i = 0; i < text.size(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(text[i])))
                {
                    throw ValidationError("Invalid date format (expected YYYY-MM-DD): '" + text + "'");
                }
            }

            const int y = std::stoi(text.substr(0, 4));
            const int m = std::stoi(text.substr(5, 2));
            const int d = std::stoi(text.substr(8, 2));
            return Date(y, m, d);
        }

        std::string Date::to_string() const
        {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
            return std::string(buffer);
        }

        // ============================================================
        // Calendar Arithmetic
        // ============================================================

        bool Date::is_leap_year(int y)
        {
            return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
        }

        int Date::days_in_month(int y, int m)
        {
            static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && is_leap_year(y))
            {
                return 29;
            }
            return days[m - 1];
        }

        long long Date::days_since_epoch() const
        {
            // Howard Hinnant's days_from_civil
            const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
            const long long era = (y >= 0 ? y : y - 399) / 400;
            const long long yoe = y - era * 400;
            const long long mp = (month + 9) % 12;
            const long long doy = (153 * mp + 2) / 5 + day - 1;
            const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        Date Date::from_days_since_epoch(long long days)
        {
            const long long z = days + 719468;
            const long long era = (z >= 0 ? z : z - 146096) / 146097;
            const long long doe = z - era * 146097;
            const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const long long mp = (5 * doy + 2) / 153;
            const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            const int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
            return Date(y, m, d);
        }

        Date Date::month_end_of(int month_index)
        {
            const int y = month_index / 12;
            const int m = month_index % 12 + 1;
            return Date(y, m, days_in_month(y, m));
        }

        bool Date::operator==(const Date &other) const
        {
            return year == other.year && month == other.month && day == other.day;
        }

        bool Date::operator<(const Date &other) const
        {
            if (year != other.year)
                return year < other.year;
            if (month != other.month)
                return month < other.month;
            return day < other.day;
        }

        double years_between(const Date &from, const Date &to)
        {
            return static_cast<double>(to.days_since_epoch() - from.days_since_epoch()) / 365.25;
        }

    } // namespace data
} // namespace advisor
