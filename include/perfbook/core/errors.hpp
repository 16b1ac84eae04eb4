/**
 * @file errors.hpp
 * @brief Exception types raised by the perfbook engine.
 *
 * Business-data problems (missing quantities, gaps in valuation history,
 * unconverged solvers) never throw; they surface as warnings and empty
 * optionals. Only malformed requests are hard failures.
 */

#ifndef PERFBOOK_CORE_ERRORS_HPP
#define PERFBOOK_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace perfbook
{

    /**
     * @class InvalidRequest
     * @brief A report or rebuild request that cannot be evaluated as given.
     *
     * Raised for end dates before start dates, malformed ISO dates, unknown
     * frequencies and negative grace windows.
     */
    class InvalidRequest : public std::invalid_argument
    {
    public:
        explicit InvalidRequest(const std::string &message)
            : std::invalid_argument(message)
        {
        }
    };

} // namespace perfbook

#endif // PERFBOOK_CORE_ERRORS_HPP
