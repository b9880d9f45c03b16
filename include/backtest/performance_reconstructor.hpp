// SPDX-License-Identifier: MIT
#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "data/date.hpp"
#include "data/series_normalizer.hpp"

namespace advisor
{
    namespace backtest
    {

        /**
         * @struct BacktestConfig
         * @brief "backtest" section of the pipeline configuration
         */
        struct BacktestConfig
        {
            /// 1 = target weights every month, k > 1 = reset every k months, 0 = buy-and-hold
            int rebalance_interval_months = 1;

            /**
             * @throws ValidationError if the interval is negative
             */
            void validate() const;

            static BacktestConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct PerformanceHistory
         * @brief Replayed value curve of a weight vector over the normalized window
         *
         * dates and values have one more entry than monthly_returns: the first
         * point is the base value at the month-end preceding the first return.
         */
        struct PerformanceHistory
        {
            std::vector<data::Date> dates;
            std::vector<double> values;
            std::vector<double> monthly_returns; ///< Simple portfolio return per month

            double base_value = 1.0;
            double total_return = 0.0;          ///< final / base - 1
            double max_drawdown = 0.0;          ///< Largest peak-to-trough decline, positive fraction
            data::Date peak_date;               ///< Peak preceding the max drawdown
            data::Date trough_date;             ///< Trough of the max drawdown
            double annualized_return = 0.0;     ///< Geometric, from total_return
            double annualized_volatility = 0.0; ///< stdev(monthly) * sqrt(12)
            int rebalance_interval_months = 1;

            double final_value() const { return values.empty() ? base_value : values.back(); }

            nlohmann::json to_json() const;

            void print_summary() const;

            bool operator==(const PerformanceHistory &other) const;
        };

        /**
         * @class PerformanceReconstructor
         * @brief Static-weight historical replay over aligned monthly returns
         *
         * With the default interval of 1 the portfolio return of month t is
         * sum_i w_i * r_i,t. Longer intervals let holdings drift between
         * resets; 0 never resets. Log-return universes are converted to
         * simple returns with expm1 before compounding.
         *
         * Usage Example:
         * @code
         * PerformanceReconstructor reconstructor;
         * PerformanceHistory history = reconstructor.reconstruct(
         *     {{"SPY", 0.6}, {"TLT", 0.4}}, universe, 100000.0);
         * history.print_summary();
         * @endcode
         *
         * Thread Safety: const and stateless; safe to share.
         */
        class PerformanceReconstructor
        {
        public:
            /**
             * @throws ValidationError if rebalance_interval_months is negative
             */
            explicit PerformanceReconstructor(int rebalance_interval_months = 1);

            /**
             * @brief Replay weights over the universe window
             * @param weights Asset id -> weight; ids absent from the map weigh 0
             * @param universe Aligned monthly returns
             * @param base_value Starting value (e.g. the investment amount)
             * @return Value curve and derived metrics
             * @throws ValidationError for unknown ids, negative weights, weights not summing to 1
             *         or a non-positive base value
             * @throws DataError if the universe has no return months
             */
            PerformanceHistory reconstruct(const std::map<std::string, double> &weights,
                                           const data::NormalizedUniverse &universe,
                                           double base_value = 1.0) const;

            int rebalance_interval_months() const { return rebalance_interval_months_; }

            /**
             * @brief Largest peak-to-trough decline of a value series
             * @param values Value curve
             * @param peak_index Output: index of the peak (may be null)
             * @param trough_index Output: index of the trough (may be null)
             * @return Positive fraction, 0 for a never-declining series
             */
            static double max_drawdown(const std::vector<double> &values,
                                       size_t *peak_index = nullptr,
                                       size_t *trough_index = nullptr);

        private:
            int rebalance_interval_months_;
        };

    } // namespace backtest
} // namespace advisor
