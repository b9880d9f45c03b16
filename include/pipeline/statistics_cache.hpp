/**
 * @file statistics_cache.hpp
 * @brief Shared read-mostly cache of AssetStatistics
 *
 * AssetStatistics for a fixed (universe, window, base currency, return
 * type, normalizer settings) never changes while the underlying data is
 * unchanged, so it is the one artifact shared across requests. The only
 * invalidation trigger is a data reload: invalidate() drops every entry
 * and bumps the generation.
 */

#pragma once

#include "data/series_normalizer.hpp"
#include "risk/asset_statistics.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace advisor
{
    namespace pipeline
    {

        /**
         * @class StatisticsCache
         * @brief Thread-safe map from universe key to computed statistics
         *
         * Usage Example:
         * @code
         * auto cache = std::make_shared<StatisticsCache>();
         * auto stats = cache->get_or_compute(StatisticsCache::make_key(universe),
         *                                    [&] { return engine.compute(universe, classes); });
         * cache->save("stats_cache.json", context->fingerprint());
         * @endcode
         *
         * Thread Safety: all methods may be called concurrently. Lookups take
         * a shared lock; computation runs outside any lock, so two threads
         * missing on the same key may both compute and the first insert wins.
         * A result whose computation started before an invalidate() is
         * returned to its caller but never stored.
         */
        class StatisticsCache
        {
        public:
            using ComputeFn = std::function<risk::AssetStatistics()>;

            StatisticsCache() = default;

            StatisticsCache(const StatisticsCache &) = delete;
            StatisticsCache &operator=(const StatisticsCache &) = delete;

            /**
             * @brief Cache key of a normalized universe
             *
             * Tickers are sorted, so the key does not depend on request order.
             * Format: "ID1,ID2|first-month|last-month|CCY|simple|settings", where
             * settings is the normalizer digest (omitted when the universe
             * carries none). Universes built under different sanitization
             * rules, thresholds or frequency overrides never share an entry.
             */
            static std::string make_key(const data::NormalizedUniverse &universe);

            /**
             * @brief Cached statistics for key, computing and storing them on a miss
             * @throws Whatever compute throws; nothing is stored in that case
             */
            std::shared_ptr<const risk::AssetStatistics> get_or_compute(const std::string &key,
                                                                        const ComputeFn &compute);

            /// Cached statistics for key, or null
            std::shared_ptr<const risk::AssetStatistics> find(const std::string &key) const;

            /// Drop all entries; call on every data reload
            void invalidate();

            size_t size() const;
            std::uint64_t hits() const { return hits_.load(); }
            std::uint64_t misses() const { return misses_.load(); }
            std::uint64_t generation() const { return generation_.load(); }

            /**
             * @brief Persist entries as JSON tagged with the data fingerprint
             * @throws std::runtime_error if the file cannot be written
             */
            void save(const std::string &path, const std::string &fingerprint) const;

            /**
             * @brief Load a persisted artifact
             *
             * The artifact is derived and disposable: a missing file, an
             * unreadable file or a fingerprint that does not match the current
             * data is logged and ignored.
             *
             * @return Number of entries loaded
             */
            size_t load(const std::string &path, const std::string &fingerprint);

        private:
            mutable std::shared_mutex mutex_;
            std::map<std::string, std::shared_ptr<const risk::AssetStatistics>> entries_;
            std::atomic<std::uint64_t> hits_{0};
            std::atomic<std::uint64_t> misses_{0};
            std::atomic<std::uint64_t> generation_{1};
        };

    } // namespace pipeline
} // namespace advisor
