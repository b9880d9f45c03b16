/**
 * @file statistics_cache.cpp
 * @brief Implementation of the shared statistics cache
 */

#include "pipeline/statistics_cache.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <mutex>

namespace advisor
{
    namespace pipeline
    {

        std::string StatisticsCache::make_key(const data::NormalizedUniverse &universe)
        {
            std::vector<std::string> tickers = universe.tickers;
            std::sort(tickers.begin(), tickers.end());

            std::string key;
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                if (i > 0)
                    key += ",";
                key += tickers[i];
            }
            key += "|";
            key += universe.dates.empty() ? std::string() : universe.dates.front().to_string();
            key += "|";
            key += universe.dates.empty() ? std::string() : universe.dates.back().to_string();
            key += "|" + universe.base_currency + "|" + data::to_string(universe.return_type);
            if (!universe.settings_digest.empty())
            {
                key += "|" + universe.settings_digest;
            }
            return key;
        }

        std::shared_ptr<const risk::AssetStatistics> StatisticsCache::get_or_compute(const std::string &key,
                                                                                     const ComputeFn &compute)
        {
            {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                auto it = entries_.find(key);
                if (it != entries_.end())
                {
                    ++hits_;
                    return it->second;
                }
            }

            ++misses_;
            const std::uint64_t started = generation_.load();
            auto computed = std::make_shared<const risk::AssetStatistics>(compute());

            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (generation_.load() != started)
            {
                // Data was reloaded while computing
                return computed;
            }
            auto inserted = entries_.emplace(key, std::move(computed));
            return inserted.first->second;
        }

        std::shared_ptr<const risk::AssetStatistics> StatisticsCache::find(const std::string &key) const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(key);
            return it == entries_.end() ? nullptr : it->second;
        }

        void StatisticsCache::invalidate()
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            entries_.clear();
            ++generation_;
        }

        size_t StatisticsCache::size() const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return entries_.size();
        }

        void StatisticsCache::save(const std::string &path, const std::string &fingerprint) const
        {
            nlohmann::json j;
            j["fingerprint"] = fingerprint;
            j["entries"] = nlohmann::json::array();
            {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                for (const auto &entry : entries_)
                {
                    j["entries"].push_back({{"key", entry.first}, {"statistics", entry.second->to_json()}});
                }
            }

            std::ofstream file(path);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open cache file for writing: " + path);
            }
            file << j.dump(2) << "\n";
        }

        size_t StatisticsCache::load(const std::string &path, const std::string &fingerprint)
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                return 0;
            }

            std::map<std::string, std::shared_ptr<const risk::AssetStatistics>> loaded;
            try
            {
                nlohmann::json j;
                file >> j;

                if (j.value("fingerprint", "") != fingerprint)
                {
                    std::cerr << "Warning: statistics cache " << path
                              << " was built from different data; ignoring it\n";
                    return 0;
                }

                for (const auto &entry : j.at("entries"))
                {
                    loaded.emplace(entry.at("key").get<std::string>(),
                                   std::make_shared<const risk::AssetStatistics>(
                                       risk::AssetStatistics::from_json(entry.at("statistics"))));
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                std::cerr << "Warning: statistics cache " << path << " is unreadable (" << e.what()
                          << "); ignoring it\n";
                return 0;
            }
            catch (const DataError &e)
            {
                std::cerr << "Warning: statistics cache " << path << " is inconsistent (" << e.what()
                          << "); ignoring it\n";
                return 0;
            }
            catch (const ValidationError &e)
            {
                std::cerr << "Warning: statistics cache " << path << " is inconsistent (" << e.what()
                          << "); ignoring it\n";
                return 0;
            }

            std::unique_lock<std::shared_mutex> lock(mutex_);
            for (auto &entry : loaded)
            {
                entries_[entry.first] = std::move(entry.second);
            }
            return loaded.size();
        }

    } // namespace pipeline
} // namespace advisor
