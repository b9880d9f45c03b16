/**
 * @file asset_statistics.hpp
 * @brief Annualized per-asset statistics and covariance for a normalized universe
 *
 * AssetStatistics is the input contract of the optimizer. It is a plain
 * value: once computed for a (universe, window, base currency) it never
 * changes, which is what makes it cacheable.
 */

#pragma once

#include "data/date.hpp"
#include "data/series_normalizer.hpp"
#include "risk/risk_model.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace advisor
{
    namespace risk
    {

        /**
         * @struct AssetStats
         * @brief Annualized figures for one asset
         */
        struct AssetStats
        {
            std::string id;
            std::string asset_class;            ///< Tag used for equity band and class constraints
            std::string currency;               ///< Quote currency before conversion; empty if unknown
            double annual_return = 0.0;         ///< mean(monthly) * 12
            double annual_volatility = 0.0;     ///< stdev(monthly) * sqrt(12)
            std::optional<double> sharpe_ratio; ///< Empty when volatility is ~0
        };

        /**
         * @struct AssetStatistics
         * @brief Everything the optimizer needs about the universe
         *
         * expected_returns, volatilities and covariance are indexed in the
         * same order as assets.
         */
        struct AssetStatistics
        {
            std::vector<AssetStats> assets;
            Eigen::VectorXd expected_returns; ///< Annualized
            Eigen::VectorXd volatilities;     ///< Annualized
            Eigen::MatrixXd covariance;       ///< Annualized, exactly symmetric
            Eigen::MatrixXd correlation;
            double mean_risk_free = 0.0;      ///< Mean annual risk-free rate over the window
            size_t observations = 0;          ///< Monthly returns used
            data::Date window_start;          ///< First return month-end
            data::Date window_end;            ///< Last return month-end
            std::string base_currency;
            data::ReturnType return_type = data::ReturnType::SIMPLE;
            bool positive_semidefinite = false;
            double min_eigenvalue = 0.0;
            std::vector<std::string> warnings;

            size_t num_assets() const { return assets.size(); }
            std::vector<std::string> tickers() const;

            /// Index of an asset, -1 if absent
            int find_asset(const std::string &id) const;

            /// True when asset i is quoted in a currency other than base_currency
            bool is_foreign(size_t i) const
            {
                return !assets[i].currency.empty() && assets[i].currency != base_currency;
            }

            nlohmann::json to_json() const;

            /**
             * @brief Rebuild from to_json() output
             * @throws DataError if fields are missing or dimensions disagree
             */
            static AssetStatistics from_json(const nlohmann::json &j);

            void print_summary() const;
        };

        /**
         * @class StatisticsEngine
         * @brief Computes AssetStatistics from a NormalizedUniverse
         *
         * Usage Example:
         * @code
         * StatisticsEngine engine;
         * AssetStatistics stats = engine.compute(universe, {{"SPY", "equity"}, {"TLT", "bond"}});
         * if (!stats.positive_semidefinite) { ... }
         * @endcode
         *
         * Thread Safety: const methods only; safe to share.
         */
        class StatisticsEngine
        {
        public:
            /**
             * @param model Covariance estimator on monthly returns (SampleCovariance if null)
             * @param periods_per_year Annualization factor for the return frequency
             */
            explicit StatisticsEngine(std::shared_ptr<const RiskModel> model = nullptr,
                                      int periods_per_year = 12);

            /**
             * @brief Compute annualized statistics
             * @param universe Aligned monthly returns and risk-free series
             * @param asset_classes Asset id -> class tag; missing ids are tagged "unknown"
             * @param currencies Asset id -> original quote currency; missing ids are
             *        taken to be quoted in the base currency
             * @return Statistics in universe ticker order
             * @throws DataError if the universe has fewer than 2 periods or no assets
             */
            AssetStatistics compute(const data::NormalizedUniverse &universe,
                                    const std::map<std::string, std::string> &asset_classes,
                                    const std::map<std::string, std::string> &currencies = {}) const;

            int periods_per_year() const { return periods_per_year_; }

        private:
            std::shared_ptr<const RiskModel> model_;
            int periods_per_year_;
        };

    } // namespace risk
} // namespace advisor
