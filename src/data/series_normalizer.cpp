/**
 * @file series_normalizer.cpp
 * @brief Implementation of SeriesNormalizer and NormalizedUniverse
 */

#include "data/series_normalizer.hpp"
#include "core/errors.hpp"
#include "data/content_hash.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace advisor
{
    namespace data
    {

        namespace
        {
            std::string month_label(int month_index)
            {
                return Date::month_end_of(month_index).to_string().substr(0, 7);
            }

            struct Candidate
            {
                std::string id;
                std::map<int, double> returns; // month index -> return
            };
        } // namespace

        // ============================================================================
        // Enumerations and configuration
        // ============================================================================

        ReturnType parse_return_type(const std::string &text)
        {
            std::string s = text;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            if (s == "simple")
                return ReturnType::SIMPLE;
            if (s == "log")
                return ReturnType::LOG;
            throw ValidationError("Invalid return type: '" + text + "' (expected simple or log)");
        }

        std::string to_string(ReturnType type)
        {
            return type == ReturnType::SIMPLE ? "simple" : "log";
        }

        SanitizationRule SanitizationRule::from_json(const nlohmann::json &j)
        {
            SanitizationRule rule;
            rule.asset = j.value("asset", "");
            if (rule.asset.empty())
            {
                throw ValidationError("Sanitization rule requires an 'asset'");
            }
            if (j.contains("max_price"))
            {
                rule.max_price = j.at("max_price").get<double>();
            }
            if (j.contains("min_price"))
            {
                rule.min_price = j.at("min_price").get<double>();
            }
            if (!rule.max_price && !rule.min_price)
            {
                throw ValidationError("Sanitization rule for '" + rule.asset +
                                      "' must set max_price and/or min_price");
            }
            rule.reason = j.value("reason", "");
            return rule;
        }

        std::string NormalizerConfig::digest() const
        {
            ContentHash h;
            h.add(to_string(return_type));
            h.add(daily_threshold);
            h.add(max_daily_median_gap_days);
            h.add(min_history_months);
            h.add(window_start ? window_start->to_string() : std::string());
            h.add(window_end ? window_end->to_string() : std::string());
            h.add(lookback_months);
            for (const auto &rule : sanitization)
            {
                h.add(rule.asset);
                h.add(rule.max_price.has_value());
                h.add(rule.max_price.value_or(0.0));
                h.add(rule.min_price.has_value());
                h.add(rule.min_price.value_or(0.0));
            }
            return h.hex();
        }

        // ============================================================================
        // NormalizedUniverse
        // ============================================================================

        int NormalizedUniverse::find_asset(const std::string &id) const
        {
            auto it = std::find(tickers.begin(), tickers.end(), id);
            if (it == tickers.end())
            {
                return -1;
            }
            return static_cast<int>(std::distance(tickers.begin(), it));
        }

        Eigen::VectorXd NormalizedUniverse::asset_returns(const std::string &id) const
        {
            const int idx = find_asset(id);
            if (idx < 0)
            {
                throw ValidationError("Asset not in normalized universe: " + id);
            }
            return returns.col(idx);
        }

        void NormalizedUniverse::print_summary() const
        {
            std::cout << "\n=== Normalized Universe ===\n";
            std::cout << "Dimensions: " << returns.rows() << " months x "
                      << returns.cols() << " assets\n";
            if (!dates.empty())
            {
                std::cout << "Window: " << dates.front().to_string() << " to "
                          << dates.back().to_string() << "\n";
            }
            std::cout << "Base currency: " << base_currency
                      << "  Returns: " << to_string(return_type) << "\n";
            std::cout << std::string(50, '-') << "\n";
            for (const auto &sr : report.series)
            {
                std::cout << "  " << std::left << std::setw(16) << sr.id << std::right
                          << std::setw(8) << to_string(sr.frequency)
                          << (sr.frequency_overridden ? "*" : " ")
                          << std::fixed << std::setprecision(1) << std::setw(8)
                          << sr.observations_per_year << " obs/yr  "
                          << sr.return_months << " months";
                if (sr.sanitized_observations > 0)
                {
                    std::cout << "  (" << sr.sanitized_observations << " sanitized)";
                }
                std::cout << "\n";
            }
            for (const auto &d : report.dropped)
            {
                std::cout << "  dropped " << d.id << ": " << d.reason << "\n";
            }
            std::cout << "===========================\n"
                      << std::endl;
        }

        // ============================================================================
        // Per-series steps
        // ============================================================================

        SeriesNormalizer::SeriesNormalizer(NormalizerConfig config) : config_(std::move(config))
        {
            if (config_.daily_threshold <= 0.0)
            {
                throw ValidationError("daily_threshold must be positive, got: " +
                                      std::to_string(config_.daily_threshold));
            }
            if (config_.max_daily_median_gap_days <= 0.0)
            {
                throw ValidationError("max_daily_median_gap_days must be positive");
            }
            if (config_.min_history_months < 2)
            {
                throw ValidationError("min_history_months must be at least 2, got: " +
                                      std::to_string(config_.min_history_months));
            }
            if (config_.lookback_months < 0)
            {
                throw ValidationError("lookback_months cannot be negative");
            }
            if (config_.window_start && config_.window_end &&
                config_.window_start->month_index() > config_.window_end->month_index())
            {
                throw ValidationError("Window start " + config_.window_start->to_string() +
                                      " is after window end " + config_.window_end->to_string());
            }
        }

        double SeriesNormalizer::observations_per_year(const RawSeries &series)
        {
            if (series.size() < 2)
            {
                throw DataError("At least 2 observations are needed to detect frequency, got " +
                                    std::to_string(series.size()),
                                series.id());
            }
            const double span_years = years_between(series.first_date(), series.last_date());
            if (span_years <= 0.0)
            {
                throw DataError("Series spans zero time", series.id());
            }
            return static_cast<double>(series.size()) / span_years;
        }

        Frequency SeriesNormalizer::detect_frequency(const RawSeries &series) const
        {
            return observations_per_year(series) > config_.daily_threshold ? Frequency::DAILY
                                                                           : Frequency::MONTHLY;
        }

        void SeriesNormalizer::verify_frequency(const RawSeries &series, Frequency frequency) const
        {
            const auto &obs = series.observations();
            if (obs.size() < 2)
            {
                return;
            }

            if (frequency == Frequency::MONTHLY)
            {
                for (size_t i = 1; i < obs.size(); ++i)
                {
                    if (obs[i].date.month_index() == obs[i - 1].date.month_index())
                    {
                        std::ostringstream msg;
                        msg << "Series treated as monthly has several observations in "
                            << month_label(obs[i].date.month_index())
                            << " (" << std::fixed << std::setprecision(1)
                            << observations_per_year(series) << " obs/year, daily threshold "
                            << config_.daily_threshold
                            << "); set a frequency override or lower the threshold";
                        throw DataError(msg.str(), series.id());
                    }
                }
                return;
            }

            std::vector<long long> gaps;
            gaps.reserve(obs.size() - 1);
            for (size_t i = 1; i < obs.size(); ++i)
            {
                gaps.push_back(obs[i].date.days_since_epoch() - obs[i - 1].date.days_since_epoch());
            }
            auto mid = gaps.begin() + static_cast<std::ptrdiff_t>(gaps.size() / 2);
            std::nth_element(gaps.begin(), mid, gaps.end());
            const double median_gap = static_cast<double>(*mid);
            if (median_gap > config_.max_daily_median_gap_days)
            {
                std::ostringstream msg;
                msg << "Series treated as daily has a median gap of " << median_gap
                    << " days (limit " << config_.max_daily_median_gap_days
                    << "); set a frequency override or raise the threshold";
                throw DataError(msg.str(), series.id());
            }
        }

        RawSeries SeriesNormalizer::sanitize(const RawSeries &series, size_t &removed,
                                             std::vector<std::string> *matched) const
        {
            std::vector<const SanitizationRule *> rules;
            for (const auto &rule : config_.sanitization)
            {
                if (rule.asset == series.id())
                {
                    rules.push_back(&rule);
                }
            }

            std::vector<Observation> kept;
            kept.reserve(series.size());
            size_t non_positive = 0;
            size_t out_of_bounds = 0;
            std::vector<size_t> removed_by_rule(rules.size(), 0);

            for (const auto &obs : series.observations())
            {
                if (obs.value <= 0.0)
                {
                    ++non_positive;
                    continue;
                }

                bool reject = false;
                for (size_t r = 0; r < rules.size(); ++r)
                {
                    const SanitizationRule *rule = rules[r];
                    if ((rule->max_price && obs.value > *rule->max_price) ||
                        (rule->min_price && obs.value < *rule->min_price))
                    {
                        ++removed_by_rule[r];
                        reject = true;
                    }
                }
                if (reject)
                {
                    ++out_of_bounds;
                    continue;
                }
                kept.push_back(obs);
            }

            removed = non_positive + out_of_bounds;
            if (non_positive > 0)
            {
                std::cerr << "Warning: removed " << non_positive << " non-positive price(s) from "
                          << series.id() << "\n";
            }
            for (size_t r = 0; r < rules.size(); ++r)
            {
                if (removed_by_rule[r] == 0)
                    continue;

                std::string label = rules[r]->reason;
                if (label.empty())
                {
                    std::ostringstream bounds;
                    bounds << "outside [" << (rules[r]->min_price ? std::to_string(*rules[r]->min_price) : "-")
                           << ", " << (rules[r]->max_price ? std::to_string(*rules[r]->max_price) : "-") << "]";
                    label = bounds.str();
                }
                std::cerr << "Warning: sanitization rule matched " << removed_by_rule[r]
                          << " observation(s) of " << series.id() << " (" << label << ")\n";
                if (matched)
                {
                    matched->push_back(label + ": " + std::to_string(removed_by_rule[r]));
                }
            }

            return series.with_observations(std::move(kept));
        }

        RawSeries SeriesNormalizer::collapse_to_month_end(const RawSeries &series)
        {
            std::vector<Observation> monthly;
            for (const auto &obs : series.observations())
            {
                const Date eom = obs.date.month_end();
                if (!monthly.empty() && monthly.back().date == eom)
                {
                    monthly.back().value = obs.value; // later observation in same month wins
                }
                else
                {
                    monthly.push_back(Observation{eom, obs.value});
                }
            }
            return series.with_observations(std::move(monthly));
        }

        RawSeries SeriesNormalizer::convert_currency(const RawSeries &monthly_prices,
                                                     const RawSeries &monthly_fx,
                                                     const std::string &base_currency)
        {
            std::map<int, double> fx_by_month;
            for (const auto &obs : monthly_fx.observations())
            {
                if (obs.value <= 0.0)
                {
                    throw DataError("Non-positive FX rate at " + obs.date.to_string(), monthly_fx.id());
                }
                fx_by_month[obs.date.month_index()] = obs.value;
            }

            std::vector<Observation> converted;
            converted.reserve(monthly_prices.size());
            for (const auto &obs : monthly_prices.observations())
            {
                auto it = fx_by_month.find(obs.date.month_index());
                if (it == fx_by_month.end())
                {
                    continue;
                }
                converted.push_back(Observation{obs.date, obs.value * it->second});
            }
            return RawSeries(monthly_prices.id(), base_currency, std::move(converted));
        }

        RawSeries SeriesNormalizer::monthly_returns(const RawSeries &monthly_prices) const
        {
            const auto &obs = monthly_prices.observations();
            std::vector<Observation> returns;
            if (obs.size() > 1)
            {
                returns.reserve(obs.size() - 1);
            }

            for (size_t i = 1; i < obs.size(); ++i)
            {
                if (obs[i].date.month_index() != obs[i - 1].date.month_index() + 1)
                {
                    continue; // calendar gap, no return for this month
                }
                const double ratio = obs[i].value / obs[i - 1].value;
                const double r = (config_.return_type == ReturnType::LOG) ? std::log(ratio) : ratio - 1.0;
                returns.push_back(Observation{obs[i].date, r});
            }
            return monthly_prices.with_observations(std::move(returns));
        }

        RawSeries SeriesNormalizer::forward_fill_rates(const RawSeries &rates,
                                                       const Date &first,
                                                       const Date &last)
        {
            const auto &obs = rates.observations();
            if (obs.empty())
            {
                throw DataError("Risk-free series is empty", rates.id());
            }

            std::vector<Observation> filled;
            size_t cursor = 0;
            for (int m = first.month_index(); m <= last.month_index(); ++m)
            {
                const Date eom = Date::month_end_of(m);
                if (eom < obs.front().date)
                {
                    throw DataError("Risk-free series starts " + obs.front().date.to_string() +
                                        ", after month-end " + eom.to_string() + " of the window",
                                    rates.id());
                }
                while (cursor + 1 < obs.size() && obs[cursor + 1].date <= eom)
                {
                    ++cursor;
                }
                filled.push_back(Observation{eom, obs[cursor].value});
            }
            return rates.with_observations(std::move(filled));
        }

        // ============================================================================
        // Universe normalization
        // ============================================================================

        NormalizedUniverse SeriesNormalizer::normalize(const DataContext &context,
                                                       const std::vector<std::string> &universe) const
        {
            const std::vector<std::string> ids = universe.empty() ? context.asset_ids() : universe;
            if (ids.empty())
            {
                throw DataError("Universe is empty");
            }
            std::set<std::string> seen;
            for (const auto &id : ids)
            {
                if (!seen.insert(id).second)
                {
                    throw ValidationError("Asset listed twice in universe: " + id);
                }
            }

            NormalizedUniverse result;
            result.return_type = config_.return_type;
            result.base_currency = context.base_currency();

            ContentHash settings;
            settings.add(config_.digest());
            for (const auto &id : ids)
            {
                const AssetEntry &entry = context.asset(id);
                settings.add(id);
                settings.add(entry.frequency ? to_string(*entry.frequency) : std::string("auto"));
            }
            result.settings_digest = settings.hex();

            NormalizationReport &report = result.report;

            auto drop = [&report](const std::string &id, const std::string &reason)
            {
                std::cerr << "Warning: dropping " << id << " from universe: " << reason << "\n";
                report.dropped.push_back(DroppedAsset{id, reason});
                report.warnings.push_back("Asset " + id + " excluded: " + reason);
            };

            // 1. Per-asset monthly returns in base currency
            std::vector<Candidate> candidates;
            for (const auto &id : ids)
            {
                const AssetEntry &entry = context.asset(id);

                SeriesReport sr;
                sr.id = id;
                sr.raw_observations = entry.series.size();
                sr.missing_rows = entry.missing_rows;
                if (entry.missing_rows > 0)
                {
                    report.warnings.push_back(std::to_string(entry.missing_rows) +
                                              " source row(s) without a price skipped for " + id);
                }

                size_t removed = 0;
                std::vector<std::string> matched;
                RawSeries clean = sanitize(entry.series, removed, &matched);
                sr.sanitized_observations = removed;
                if (removed > 0)
                {
                    std::string warning = "Sanitization removed " + std::to_string(removed) +
                                          " observation(s) from " + id;
                    for (size_t m = 0; m < matched.size(); ++m)
                    {
                        warning += (m == 0 ? " (" : "; ") + matched[m];
                    }
                    if (!matched.empty())
                    {
                        warning += ")";
                    }
                    report.warnings.push_back(warning);
                }

                if (clean.size() < 2)
                {
                    report.series.push_back(sr);
                    drop(id, "fewer than 2 valid price observations");
                    continue;
                }

                sr.observations_per_year = observations_per_year(clean);
                if (entry.frequency)
                {
                    sr.frequency = *entry.frequency;
                    sr.frequency_overridden = true;
                }
                else
                {
                    sr.frequency = detect_frequency(clean);
                }
                verify_frequency(clean, sr.frequency);

                RawSeries monthly = collapse_to_month_end(clean);
                if (entry.series.currency() != context.base_currency())
                {
                    const RawSeries *fx = context.fx_for(entry.series.currency());
                    if (fx == nullptr)
                    {
                        throw DataError("No FX series loaded for currency " + entry.series.currency() +
                                            " (base " + context.base_currency() + ")",
                                        id);
                    }
                    monthly = convert_currency(monthly, collapse_to_month_end(*fx), context.base_currency());
                }
                sr.monthly_prices = monthly.size();

                RawSeries returns = monthly_returns(monthly);
                sr.return_months = returns.size();
                report.series.push_back(sr);

                if (config_.verbose)
                {
                    std::cout << "  " << id << ": " << to_string(sr.frequency) << ", "
                              << std::fixed << std::setprecision(1) << sr.observations_per_year
                              << " obs/year, " << sr.return_months << " monthly returns\n";
                }

                if (static_cast<int>(returns.size()) < config_.min_history_months)
                {
                    drop(id, "insufficient history: " + std::to_string(returns.size()) +
                                 " monthly returns, need " + std::to_string(config_.min_history_months));
                    continue;
                }

                Candidate c;
                c.id = id;
                for (const auto &obs : returns.observations())
                {
                    c.returns[obs.date.month_index()] = obs.value;
                }
                candidates.push_back(std::move(c));
            }

            if (candidates.empty())
            {
                throw DataError("No asset in the universe has sufficient history");
            }

            // 2. Window selection
            int end_idx = std::numeric_limits<int>::max();
            if (config_.window_end)
            {
                end_idx = config_.window_end->month_index();
            }
            else
            {
                for (const auto &c : candidates)
                {
                    end_idx = std::min(end_idx, c.returns.rbegin()->first);
                }
            }

            int start_idx = std::numeric_limits<int>::min();
            if (config_.window_start)
            {
                start_idx = config_.window_start->month_index();
            }
            else if (config_.lookback_months > 0)
            {
                start_idx = end_idx - config_.lookback_months + 1;
            }
            else
            {
                // Latest start of the contiguous run ending at end_idx
                for (const auto &c : candidates)
                {
                    if (c.returns.count(end_idx) == 0)
                    {
                        continue;
                    }
                    int run_start = end_idx;
                    while (c.returns.count(run_start - 1) > 0)
                    {
                        --run_start;
                    }
                    start_idx = std::max(start_idx, run_start);
                }
                if (start_idx == std::numeric_limits<int>::min())
                {
                    start_idx = end_idx;
                }
            }

            if (start_idx > end_idx)
            {
                throw DataError("Empty common window: start " + month_label(start_idx) +
                                " is after end " + month_label(end_idx));
            }

            // 3. Coverage: every window month must have a return
            std::vector<const Candidate *> survivors;
            for (const auto &c : candidates)
            {
                int missing = -1;
                for (int m = start_idx; m <= end_idx; ++m)
                {
                    if (c.returns.count(m) == 0)
                    {
                        missing = m;
                        break;
                    }
                }
                if (missing >= 0)
                {
                    drop(c.id, "no return for " + month_label(missing) + " in window " +
                                   month_label(start_idx) + " to " + month_label(end_idx));
                    continue;
                }
                survivors.push_back(&c);
            }

            if (survivors.empty())
            {
                throw DataError("No asset covers the window " + month_label(start_idx) + " to " +
                                month_label(end_idx));
            }

            const int months = end_idx - start_idx + 1;
            if (months < 2)
            {
                throw DataError("Common window " + month_label(start_idx) + " to " + month_label(end_idx) +
                                " has fewer than 2 months");
            }

            // 4. Assemble aligned matrix
            result.dates.reserve(months);
            for (int m = start_idx; m <= end_idx; ++m)
            {
                result.dates.push_back(Date::month_end_of(m));
            }

            result.returns.resize(months, static_cast<Eigen::Index>(survivors.size()));
            for (size_t j = 0; j < survivors.size(); ++j)
            {
                result.tickers.push_back(survivors[j]->id);
                for (int m = start_idx; m <= end_idx; ++m)
                {
                    result.returns(m - start_idx, static_cast<Eigen::Index>(j)) = survivors[j]->returns.at(m);
                }
            }

            // 5. Risk-free on the same grid
            RawSeries rf = forward_fill_rates(context.risk_free(), result.dates.front(), result.dates.back());
            result.risk_free_annual.resize(months);
            result.risk_free_monthly.resize(months);
            for (int i = 0; i < months; ++i)
            {
                const double annual = rf.observations()[static_cast<size_t>(i)].value;
                result.risk_free_annual(i) = annual;
                result.risk_free_monthly(i) = std::pow(1.0 + annual, 1.0 / 12.0) - 1.0;
            }

            return result;
        }

    } // namespace data
} // namespace advisor
