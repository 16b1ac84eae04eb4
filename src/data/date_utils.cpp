/**
 * @file date_utils.cpp
 * @brief Implementation of the ISO date helpers.
 */

#include "perfbook/data/date_utils.hpp"
#include "perfbook/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace perfbook
{
    namespace data
    {

        namespace
        {

            std::string to_lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return s;
            }

            bool is_leap_year(int year)
            {
                return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            }

            int days_in_month(int year, int month)
            {
                static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (month == 2 && is_leap_year(year))
                {
                    return 29;
                }
                return DAYS[month - 1];
            }

            // Howard Hinnant's days_from_civil / civil_from_days.
            long long days_from_civil(int y, int m, int d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const long long yoe = y - era * 400;
                const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + doe - 719468;
            }

        } // anonymous namespace

        // ===================================================================
        // Frequency
        // ===================================================================

        Frequency parse_frequency(const std::string &name)
        {
            const std::string s = to_lower(name);
            if (s == "daily" || s == "d")
                return Frequency::DAILY;
            if (s == "month_end" || s == "monthly" || s == "month-end" || s == "m")
                return Frequency::MONTH_END;
            throw InvalidRequest("Invalid frequency: " + name);
        }

        std::string to_string(Frequency frequency)
        {
            return frequency == Frequency::MONTH_END ? "month_end" : "daily";
        }

        int periods_per_year(Frequency frequency)
        {
            return frequency == Frequency::MONTH_END ? 12 : 252;
        }

        // ===================================================================
        // Validation and field extraction
        // ===================================================================

        bool is_valid_date(const std::string &date)
        {
            if (date.size() != 10 || date[4] != '-' || date[7] != '-')
            {
                return false;
            }
            for (size_t i = 0; i < date.size(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }
            const int month = std::stoi(date.substr(5, 2));
            const int day = std::stoi(date.substr(8, 2));
            if (month < 1 || month > 12)
            {
                return false;
            }
            return day >= 1 && day <= days_in_month(std::stoi(date.substr(0, 4)), month);
        }

        void require_valid_date(const std::string &date, const std::string &field)
        {
            if (!is_valid_date(date))
            {
                throw InvalidRequest("Expected YYYY-MM-DD date for '" + field + "', got: '" + date + "'");
            }
        }

        int extract_year(const std::string &date)
        {
            return std::stoi(date.substr(0, 4));
        }

        int extract_month(const std::string &date)
        {
            return std::stoi(date.substr(5, 2));
        }

        int extract_day(const std::string &date)
        {
            return std::stoi(date.substr(8, 2));
        }

        // ===================================================================
        // Day arithmetic
        // ===================================================================

        long long days_since_epoch(const std::string &date)
        {
            require_valid_date(date, "date");
            return days_from_civil(extract_year(date), extract_month(date), extract_day(date));
        }

        std::string date_from_days(long long days)
        {
            days += 719468;
            const long long era = (days >= 0 ? days : days - 146096) / 146097;
            const long long doe = days - era * 146097;
            const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const long long mp = (5 * doy + 2) / 153;
            const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);

            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02d", y, m, d);
            return std::string(buf);
        }

        long long days_between(const std::string &from, const std::string &to)
        {
            return days_since_epoch(to) - days_since_epoch(from);
        }

        std::string add_days(const std::string &date, long long days)
        {
            return date_from_days(days_since_epoch(date) + days);
        }

        std::string month_key(const std::string &date)
        {
            return date.substr(0, 7);
        }

        std::string date_part(const std::string &timestamp)
        {
            return timestamp.substr(0, 10);
        }

    } // namespace data
} // namespace perfbook
