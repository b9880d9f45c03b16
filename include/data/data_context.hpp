/**
 * @file data_context.hpp
 * @brief Read-only snapshot of all loaded source data
 *
 * The pipeline never reaches for process-wide datasets. Everything it
 * reads comes from a DataContext handed in by the caller; reloading
 * source data means building a new context (and invalidating caches
 * derived from the old one).
 *
 * Thread Safety: immutable after construction; share it through
 * std::shared_ptr<const DataContext> across concurrent requests.
 */

#pragma once

#include "data/raw_series.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace advisor
{
    namespace data
    {

        /**
         * @struct AssetEntry
         * @brief Price history plus classification metadata for one asset
         */
        struct AssetEntry
        {
            RawSeries series;                   ///< Raw prices in the asset's own currency
            std::string asset_class;            ///< equity, bond, commodity, reit, currency, ...
            std::optional<Frequency> frequency; ///< Manual frequency override, if any
            size_t missing_rows = 0;            ///< Source rows without a price, skipped by the loader
        };

        /**
         * @class DataContext
         * @brief Immutable bundle of asset prices, FX rates and the risk-free rate
         *
         * FX series are keyed by the foreign currency code and quote units of
         * base currency per one unit of that currency (e.g. "USD" -> ILS per USD).
         * The risk-free series holds annual rates as decimals (0.045 = 4.5%).
         */
        class DataContext
        {
        public:
            /**
             * @brief Build a snapshot
             * @param assets Asset entries (ids must be unique)
             * @param fx_rates FX series keyed by currency code
             * @param risk_free Annual risk-free rate levels
             * @param base_currency Currency every return is expressed in
             * @param generation Caller-assigned load counter
             * @throws DataError on duplicate asset ids
             */
            DataContext(std::vector<AssetEntry> assets,
                        std::map<std::string, RawSeries> fx_rates,
                        RawSeries risk_free,
                        std::string base_currency,
                        std::uint64_t generation = 1);

            const std::vector<AssetEntry> &assets() const { return assets_; }
            const std::map<std::string, RawSeries> &fx_rates() const { return fx_rates_; }
            const RawSeries &risk_free() const { return risk_free_; }
            const std::string &base_currency() const { return base_currency_; }
            std::uint64_t generation() const { return generation_; }

            bool has_asset(const std::string &id) const;

            /**
             * @brief Look up an asset by id
             * @throws ValidationError if the id is unknown
             */
            const AssetEntry &asset(const std::string &id) const;

            /// All asset ids in load order
            std::vector<std::string> asset_ids() const;

            /**
             * @brief FX series for a currency, nullptr if none loaded
             */
            const RawSeries *fx_for(const std::string &currency) const;

            /**
             * @brief Content hash of every series and asset entry in the snapshot (hex string)
             *
             * Two contexts loaded from identical files share a fingerprint;
             * any changed observation, asset class or frequency override
             * changes it.
             */
            const std::string &fingerprint() const { return fingerprint_; }

        private:
            std::vector<AssetEntry> assets_;
            std::map<std::string, RawSeries> fx_rates_;
            RawSeries risk_free_;
            std::string base_currency_;
            std::uint64_t generation_;
            std::map<std::string, size_t> index_;
            std::string fingerprint_;

            std::string compute_fingerprint() const;
        };

        using DataContextPtr = std::shared_ptr<const DataContext>;

    } // namespace data
} // namespace advisor
