/**
 * @file series_normalizer.hpp
 * @brief Converts mixed-frequency raw price series into aligned monthly returns
 *
 * Pipeline per asset:
 *   sanitize -> detect frequency (+ guard) -> collapse to month-end
 *   -> convert to base currency -> monthly returns
 * followed by universe-wide window selection and risk-free alignment.
 *
 * Frequency detection is heuristic (observations per year above a
 * threshold means daily). Because a daily series treated as monthly
 * understates annualized figures by roughly 20x, the classification is
 * cross-checked against the observed spacing and a mismatch is a hard
 * DataError rather than a silent reclassification.
 */

#pragma once

#include "data/data_context.hpp"
#include "data/date.hpp"
#include "data/raw_series.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace advisor
{
    namespace data
    {

        /**
         *  @enum ReturnType
         *  @brief Type of return calculation.
         */
        enum class ReturnType
        {
            SIMPLE, /**< Simple returns (P_t / P_{t-1} - 1) */
            LOG     /**< Logarithmic returns (log(P_t / P_{t-1})) */
        };

        ReturnType parse_return_type(const std::string &text);
        std::string to_string(ReturnType type);

        /**
         * @struct SanitizationRule
         * @brief Asset-scoped plausibility bounds on raw prices
         *
         * Observations outside [min_price, max_price] are removed from the
         * named asset only, before month-end collapse.
         */
        struct SanitizationRule
        {
            std::string asset;               ///< Asset id the rule applies to
            std::optional<double> max_price; ///< Remove prices strictly above
            std::optional<double> min_price; ///< Remove prices strictly below
            std::string reason;              ///< Free text carried into the report

            static SanitizationRule from_json(const nlohmann::json &j);
        };

        /**
         * @struct NormalizerConfig
         * @brief Tunables for frequency detection, windowing and sanitization
         */
        struct NormalizerConfig
        {
            ReturnType return_type = ReturnType::SIMPLE;
            double daily_threshold = 100.0;          ///< Observations/year above which a series is daily
            double max_daily_median_gap_days = 7.0;  ///< Guard: daily series must be at least weekly-dense
            int min_history_months = 24;             ///< Shorter return histories are dropped
            std::optional<Date> window_start;        ///< First return month (any day in the month)
            std::optional<Date> window_end;          ///< Last return month (any day in the month)
            int lookback_months = 0;                 ///< 0 = use the full common window
            std::vector<SanitizationRule> sanitization;
            bool verbose = false;

            /**
             * @brief Hash of every setting that can change the normalized returns
             *
             * verbose is excluded. Window settings are included even though
             * the resulting dates are part of the cache key as well.
             */
            std::string digest() const;
        };

        /**
         * @struct SeriesReport
         * @brief What normalization observed and did for one asset
         */
        struct SeriesReport
        {
            std::string id;
            Frequency frequency = Frequency::MONTHLY;
            bool frequency_overridden = false;
            double observations_per_year = 0.0;
            size_t raw_observations = 0;
            size_t missing_rows = 0;            ///< Rows without a price skipped at load time
            size_t sanitized_observations = 0; ///< Removed by sanitization rules
            size_t monthly_prices = 0;          ///< Month-end prices after collapse and FX
            size_t return_months = 0;           ///< Monthly returns before windowing
        };

        /**
         * @struct DroppedAsset
         * @brief An asset excluded from the run and why
         */
        struct DroppedAsset
        {
            std::string id;
            std::string reason;
        };

        /**
         * @struct NormalizationReport
         * @brief Everything the caller must see about data handling
         */
        struct NormalizationReport
        {
            std::vector<SeriesReport> series;
            std::vector<DroppedAsset> dropped;
            std::vector<std::string> warnings;
        };

        /**
         * @struct NormalizedUniverse
         * @brief Aligned monthly returns in one base currency
         *
         * returns has one row per month-end in dates and one column per
         * ticker. The risk-free vectors share the same rows.
         */
        struct NormalizedUniverse
        {
            std::vector<Date> dates;             ///< Month-end dates of each return
            std::vector<std::string> tickers;    ///< Surviving asset ids, in request order
            Eigen::MatrixXd returns;             ///< Monthly returns (months x assets)
            Eigen::VectorXd risk_free_annual;    ///< Forward-filled annual rate per month
            Eigen::VectorXd risk_free_monthly;   ///< (1 + annual)^(1/12) - 1
            ReturnType return_type = ReturnType::SIMPLE;
            std::string base_currency;
            std::string settings_digest;         ///< Normalizer settings and frequency overrides used
            NormalizationReport report;

            size_t num_periods() const { return dates.size(); }
            size_t num_assets() const { return tickers.size(); }

            /// Column index of an asset, -1 if absent
            int find_asset(const std::string &id) const;

            /**
             * @brief Monthly return column for an asset
             * @throws ValidationError if the asset is not in the universe
             */
            Eigen::VectorXd asset_returns(const std::string &id) const;

            void print_summary() const;
        };

        /**
         * @class SeriesNormalizer
         * @brief Builds a NormalizedUniverse from a DataContext
         *
         * Stateless apart from its configuration; safe to share across threads.
         *
         * Usage Example:
         * @code
         * NormalizerConfig cfg;
         * cfg.lookback_months = 120;
         * SeriesNormalizer normalizer(cfg);
         * NormalizedUniverse u = normalizer.normalize(*context, {"SPY", "TLT"});
         * for (const auto &d : u.report.dropped)
         *     std::cerr << d.id << ": " << d.reason << "\n";
         * @endcode
         */
        class SeriesNormalizer
        {
        public:
            explicit SeriesNormalizer(NormalizerConfig config = NormalizerConfig());

            const NormalizerConfig &config() const { return config_; }

            // ====================================================================
            // Per-series steps
            // ====================================================================

            /**
             * @brief Observations divided by span in years
             * @throws DataError if fewer than 2 observations or zero span
             */
            static double observations_per_year(const RawSeries &series);

            /**
             * @brief Classify a series as daily or monthly by observation density
             */
            Frequency detect_frequency(const RawSeries &series) const;

            /**
             * @brief Cross-check a classification against the observed spacing
             *
             * A monthly series may not have two observations in one calendar
             * month; a daily series must have a median gap of at most
             * max_daily_median_gap_days.
             *
             * @throws DataError naming the asset when the check fails
             */
            void verify_frequency(const RawSeries &series, Frequency frequency) const;

            /**
             * @brief Apply the sanitization rules for this asset
             * @param series Raw series (not modified)
             * @param removed Output: number of observations removed
             * @param matched Output, optional: one entry per rule that removed
             *        anything, "<reason or bounds>: <count>"
             * @return New series without implausible observations
             *
             * Non-positive prices are always removed. An observation outside
             * several rules counts once in removed and once per matching rule.
             * Removals are logged.
             */
            RawSeries sanitize(const RawSeries &series, size_t &removed,
                               std::vector<std::string> *matched = nullptr) const;

            /**
             * @brief Keep the last observation of each calendar month, stamped at month-end
             *
             * Months without any observation are absent from the result.
             */
            static RawSeries collapse_to_month_end(const RawSeries &series);

            /**
             * @brief Multiply month-end prices by the month-end FX rate
             * @param monthly_prices Month-end prices in the foreign currency
             * @param monthly_fx Month-end FX rates (base per foreign unit)
             * @return Prices in base currency; months without an FX rate are dropped
             */
            static RawSeries convert_currency(const RawSeries &monthly_prices,
                                              const RawSeries &monthly_fx,
                                              const std::string &base_currency);

            /**
             * @brief Returns between consecutive calendar months
             * @return Series stamped at the later month-end; gaps yield no return
             */
            RawSeries monthly_returns(const RawSeries &monthly_prices) const;

            /**
             * @brief Forward-fill annual rate levels onto every month-end in a range
             * @param rates Rate observations at irregular dates
             * @param first First month-end (any day in the month)
             * @param last Last month-end (any day in the month)
             * @return Exactly one observation per month, stamped at month-end
             * @throws DataError if a month precedes the first rate observation
             */
            static RawSeries forward_fill_rates(const RawSeries &rates,
                                                const Date &first,
                                                const Date &last);

            // ====================================================================
            // Universe
            // ====================================================================

            /**
             * @brief Normalize a universe drawn from a data context
             * @param context Loaded source data
             * @param universe Asset ids to include (empty = all assets in context)
             * @return Aligned returns, risk-free series and report
             * @throws ValidationError if a requested id is unknown
             * @throws DataError if no asset survives or the window has fewer than 2 months
             */
            NormalizedUniverse normalize(const DataContext &context,
                                         const std::vector<std::string> &universe = {}) const;

        private:
            NormalizerConfig config_;
        };

    } // namespace data
} // namespace advisor
