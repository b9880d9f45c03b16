// SPDX-License-Identifier: MIT
#include "backtest/performance_reconstructor.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>

namespace advisor
{
    namespace backtest
    {

        // ------------------------- BacktestConfig ------------------------------

        void BacktestConfig::validate() const
        {
            if (rebalance_interval_months < 0)
            {
                throw ValidationError("rebalance_interval_months must be >= 0, got: " +
                                      std::to_string(rebalance_interval_months));
            }
        }

        BacktestConfig BacktestConfig::from_json(const nlohmann::json &j)
        {
            BacktestConfig config;
            config.rebalance_interval_months = j.value("rebalance_interval_months", config.rebalance_interval_months);
            config.validate();
            return config;
        }

        // ------------------------- PerformanceHistory --------------------------

        nlohmann::json PerformanceHistory::to_json() const
        {
            nlohmann::json j;
            nlohmann::json curve = nlohmann::json::array();
            for (size_t i = 0; i < dates.size() && i < values.size(); ++i)
            {
                curve.push_back({{"date", dates[i].to_string()}, {"value", values[i]}});
            }
            j["curve"] = curve;
            j["monthly_returns"] = monthly_returns;
            j["base_value"] = base_value;
            j["final_value"] = final_value();
            j["total_return"] = total_return;
            j["max_drawdown"] = max_drawdown;
            j["peak_date"] = peak_date.to_string();
            j["trough_date"] = trough_date.to_string();
            j["annualized_return"] = annualized_return;
            j["annualized_volatility"] = annualized_volatility;
            j["rebalance_interval_months"] = rebalance_interval_months;
            return j;
        }

        void PerformanceHistory::print_summary() const
        {
            std::cout << "\n=== Historical Performance ===\n";
            if (!dates.empty())
            {
                std::cout << "Window: " << dates.front().to_string() << " to " << dates.back().to_string()
                          << " (" << monthly_returns.size() << " months)\n";
            }
            std::cout << std::string(50, '-') << "\n";
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "Base value:        " << base_value << "\n";
            std::cout << "Final value:       " << final_value() << "\n";
            std::cout << "Total return:      " << total_return * 100 << "%\n";
            std::cout << "Annualized return: " << annualized_return * 100 << "%\n";
            std::cout << "Annualized vol:    " << annualized_volatility * 100 << "%\n";
            std::cout << "Max drawdown:      " << max_drawdown * 100 << "%";
            if (max_drawdown > 0.0)
            {
                std::cout << " (" << peak_date.to_string() << " -> " << trough_date.to_string() << ")";
            }
            std::cout << "\n";
            std::cout << "==============================\n"
                      << std::endl;
        }

        bool PerformanceHistory::operator==(const PerformanceHistory &other) const
        {
            return dates == other.dates &&
                   values == other.values &&
                   monthly_returns == other.monthly_returns &&
                   base_value == other.base_value &&
                   total_return == other.total_return &&
                   max_drawdown == other.max_drawdown &&
                   peak_date == other.peak_date &&
                   trough_date == other.trough_date &&
                   annualized_return == other.annualized_return &&
                   annualized_volatility == other.annualized_volatility &&
                   rebalance_interval_months == other.rebalance_interval_months;
        }

        // ------------------------- PerformanceReconstructor --------------------

        PerformanceReconstructor::PerformanceReconstructor(int rebalance_interval_months)
            : rebalance_interval_months_(rebalance_interval_months)
        {
            if (rebalance_interval_months < 0)
            {
                throw ValidationError("rebalance_interval_months must be >= 0, got: " +
                                      std::to_string(rebalance_interval_months));
            }
        }

        double PerformanceReconstructor::max_drawdown(const std::vector<double> &values,
                                                      size_t *peak_index,
                                                      size_t *trough_index)
        {
            double max_dd = 0.0;
            size_t running_peak = 0;
            size_t best_peak = 0;
            size_t best_trough = 0;

            for (size_t i = 0; i < values.size(); ++i)
            {
                if (values[i] > values[running_peak])
                    running_peak = i;
                const double peak = values[running_peak];
                const double dd = peak > 0.0 ? (peak - values[i]) / peak : 0.0;
                if (dd > max_dd)
                {
                    max_dd = dd;
                    best_peak = running_peak;
                    best_trough = i;
                }
            }

            if (peak_index)
                *peak_index = best_peak;
            if (trough_index)
                *trough_index = best_trough;
            return max_dd;
        }

        PerformanceHistory PerformanceReconstructor::reconstruct(const std::map<std::string, double> &weights,
                                                                 const data::NormalizedUniverse &universe,
                                                                 double base_value) const
        {
            if (!std::isfinite(base_value) || base_value <= 0.0)
            {
                throw ValidationError("Base value must be positive, got: " + std::to_string(base_value));
            }

            const size_t periods = universe.num_periods();
            const size_t n = universe.num_assets();
            if (periods == 0 || n == 0 ||
                universe.returns.rows() != static_cast<Eigen::Index>(periods) ||
                universe.returns.cols() != static_cast<Eigen::Index>(n))
            {
                throw DataError("Universe has no aligned return window to replay");
            }

            // Target weights in universe column order
            Eigen::VectorXd target = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));
            double total_weight = 0.0;
            for (const auto &entry : weights)
            {
                const int idx = universe.find_asset(entry.first);
                if (idx < 0)
                {
                    throw ValidationError("Weight given for asset '" + entry.first + "' which is not in the universe");
                }
                if (!std::isfinite(entry.second) || entry.second < 0.0)
                {
                    throw ValidationError("Weight for asset '" + entry.first + "' must be a non-negative number");
                }
                target(idx) = entry.second;
                total_weight += entry.second;
            }
            if (std::abs(total_weight - 1.0) > 1e-6)
            {
                throw ValidationError("Weights must sum to 1, got: " + std::to_string(total_weight));
            }

            PerformanceHistory history;
            history.base_value = base_value;
            history.rebalance_interval_months = rebalance_interval_months_;
            history.dates.reserve(periods + 1);
            history.values.reserve(periods + 1);
            history.monthly_returns.reserve(periods);

            history.dates.push_back(data::Date::month_end_of(universe.dates.front().month_index() - 1));
            history.values.push_back(base_value);

            Eigen::VectorXd holdings = target * base_value;
            double value = base_value;

            for (size_t t = 0; t < periods; ++t)
            {
                const auto row = static_cast<Eigen::Index>(t);
                for (Eigen::Index i = 0; i < holdings.size(); ++i)
                {
                    const double r = universe.returns(row, i);
                    const double simple = universe.return_type == data::ReturnType::LOG ? std::expm1(r) : r;
                    holdings(i) *= 1.0 + simple;
                }

                const double next_value = holdings.sum();
                history.monthly_returns.push_back(next_value / value - 1.0);
                value = next_value;

                history.dates.push_back(universe.dates[t]);
                history.values.push_back(value);

                if (rebalance_interval_months_ > 0 && (t + 1) % static_cast<size_t>(rebalance_interval_months_) == 0)
                {
                    holdings = target * value;
                }
            }

            history.total_return = value / base_value - 1.0;

            size_t peak = 0;
            size_t trough = 0;
            history.max_drawdown = max_drawdown(history.values, &peak, &trough);
            history.peak_date = history.dates[peak];
            history.trough_date = history.dates[trough];

            const double years = static_cast<double>(periods) / 12.0;
            history.annualized_return = value > 0.0 ? std::pow(value / base_value, 1.0 / years) - 1.0 : -1.0;

            if (periods > 1)
            {
                const double mean = std::accumulate(history.monthly_returns.begin(), history.monthly_returns.end(), 0.0) /
                                    static_cast<double>(periods);
                double sumsq = 0.0;
                for (double r : history.monthly_returns)
                    sumsq += (r - mean) * (r - mean);
                history.annualized_volatility = std::sqrt(sumsq / static_cast<double>(periods - 1)) * std::sqrt(12.0);
            }

            return history;
        }

    } // namespace backtest
} // namespace advisor
