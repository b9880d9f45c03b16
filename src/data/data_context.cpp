/**
 * @file data_context.cpp
 * @brief Implementation of DataContext
 */

#include "data/data_context.hpp"
#include "core/errors.hpp"
#include "data/content_hash.hpp"

#include <utility>

namespace advisor
{
    namespace data
    {

        namespace
        {
            void hash_series(ContentHash &h, const RawSeries &series)
            {
                h.add(series.id());
                h.add(series.currency());
                for (const auto &obs : series.observations())
                {
                    h.add(obs.date.days_since_epoch());
                    h.add(obs.value);
                }
            }
        } // namespace

        DataContext::DataContext(std::vector<AssetEntry> assets,
                                 std::map<std::string, RawSeries> fx_rates,
                                 RawSeries risk_free,
                                 std::string base_currency,
                                 std::uint64_t generation)
            : assets_(std::move(assets)),
              fx_rates_(std::move(fx_rates)),
              risk_free_(std::move(risk_free)),
              base_currency_(std::move(base_currency)),
              generation_(generation)
        {
            for (size_t i = 0; i < assets_.size(); ++i)
            {
                const std::string &id = assets_[i].series.id();
                if (!index_.emplace(id, i).second)
                {
                    throw DataError("Duplicate asset id in data context", id);
                }
            }
            fingerprint_ = compute_fingerprint();
        }

        bool DataContext::has_asset(const std::string &id) const
        {
            return index_.count(id) > 0;
        }

        const AssetEntry &DataContext::asset(const std::string &id) const
        {
            auto it = index_.find(id);
            if (it == index_.end())
            {
                throw ValidationError("Unknown asset: " + id);
            }
            return assets_[it->second];
        }

        std::vector<std::string> DataContext::asset_ids() const
        {
            std::vector<std::string> ids;
            ids.reserve(assets_.size());
            for (const auto &entry : assets_)
            {
                ids.push_back(entry.series.id());
            }
            return ids;
        }

        const RawSeries *DataContext::fx_for(const std::string &currency) const
        {
            auto it = fx_rates_.find(currency);
            return it == fx_rates_.end() ? nullptr : &it->second;
        }

        std::string DataContext::compute_fingerprint() const
        {
            ContentHash h;
            h.add(base_currency_);
            for (const auto &entry : assets_)
            {
                hash_series(h, entry.series);
                h.add(entry.asset_class);
                h.add(entry.frequency ? to_string(*entry.frequency) : std::string("auto"));
            }
            for (const auto &fx : fx_rates_)
            {
                h.add(fx.first);
                hash_series(h, fx.second);
            }
            hash_series(h, risk_free_);
            return h.hex();
        }

    } // namespace data
} // namespace advisor
