/**
 * @file date_utils.hpp
 * @brief Calendar helpers for ISO "YYYY-MM-DD" date strings.
 *
 * Dates travel through the engine as ISO strings, which order correctly
 * under plain string comparison. Day arithmetic goes through a proleptic
 * Gregorian day count so results do not depend on the local time zone.
 */

#ifndef PERFBOOK_DATA_DATE_UTILS_HPP
#define PERFBOOK_DATA_DATE_UTILS_HPP

#include <string>

namespace perfbook
{
    namespace data
    {

        /**
         * @enum Frequency
         * @brief Sampling frequency for valuation and benchmark series.
         */
        enum class Frequency
        {
            DAILY,    ///< Every available observation
            MONTH_END ///< Last observation of each calendar month
        };

        /**
         * @brief Parse a frequency name ("daily", "month_end", "monthly", "m", "d").
         * @throws InvalidRequest If the name is not recognised.
         */
        Frequency parse_frequency(const std::string &name);

        /** @brief Canonical name of a frequency ("daily" or "month_end"). */
        std::string to_string(Frequency frequency);

        /**
         * @brief Annualization factor for a sampling frequency.
         * @return 12 for month-end sampling, 252 for daily.
         */
        int periods_per_year(Frequency frequency);

        /**
         * @brief Check that a string is a real calendar date in YYYY-MM-DD form.
         */
        bool is_valid_date(const std::string &date);

        /**
         * @brief Throw InvalidRequest unless @p date is a valid ISO date.
         * @param date Candidate date string.
         * @param field Name of the offending field, used in the message.
         */
        void require_valid_date(const std::string &date, const std::string &field);

        int extract_year(const std::string &date);
        int extract_month(const std::string &date);
        int extract_day(const std::string &date);

        /**
         * @brief Days since 1970-01-01 for an ISO date.
         * @throws InvalidRequest If the date is malformed.
         */
        long long days_since_epoch(const std::string &date);

        /** @brief Inverse of days_since_epoch(). */
        std::string date_from_days(long long days);

        /** @brief Signed day count from @p from to @p to. */
        long long days_between(const std::string &from, const std::string &to);

        /** @brief Shift a date by a (possibly negative) number of days. */
        std::string add_days(const std::string &date, long long days);

        /** @brief Calendar month key "YYYY-MM" of a date. */
        std::string month_key(const std::string &date);

        /**
         * @brief Date part of an ISO timestamp ("2025-01-31T16:00:00Z" -> "2025-01-31").
         */
        std::string date_part(const std::string &timestamp);

    } // namespace data
} // namespace perfbook

#endif // PERFBOOK_DATA_DATE_UTILS_HPP
