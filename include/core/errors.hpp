/**
 * @file errors.hpp
 * @brief Exception taxonomy shared across the allocation pipeline
 *
 * Data problems and solver failures derive from std::runtime_error,
 * bad input from std::invalid_argument, so callers that only know the
 * standard hierarchy still catch them.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace advisor
{

    /**
     * @class DataError
     * @brief Fatal data problem for a run (empty window, short history, non-PSD covariance)
     */
    class DataError : public std::runtime_error
    {
    public:
        explicit DataError(const std::string &message, const std::string &asset = "")
            : std::runtime_error(asset.empty() ? message : message + " [asset: " + asset + "]"),
              asset_(asset)
        {
        }

        /// Offending asset id, empty when the problem is not asset-specific
        const std::string &asset() const { return asset_; }

    private:
        std::string asset_;
    };

    /**
     * @class ValidationError
     * @brief Caller or configuration input that cannot be accepted
     */
    class ValidationError : public std::invalid_argument
    {
    public:
        explicit ValidationError(const std::string &message)
            : std::invalid_argument(message)
        {
        }
    };

    /**
     * @class InfeasibleConstraintsError
     * @brief The allocation constraints describe an empty feasible region
     */
    class InfeasibleConstraintsError : public ValidationError
    {
    public:
        explicit InfeasibleConstraintsError(const std::string &message)
            : ValidationError(message)
        {
        }
    };

    /**
     * @class SolverError
     * @brief Quadratic solver did not produce a usable solution
     *
     * retryable() is true when the failure was a time or iteration limit,
     * i.e. the same request may succeed with a larger budget.
     */
    class SolverError : public std::runtime_error
    {
    public:
        SolverError(const std::string &message, bool retryable)
            : std::runtime_error(message), retryable_(retryable)
        {
        }

        bool retryable() const { return retryable_; }

    private:
        bool retryable_;
    };

} // namespace advisor
