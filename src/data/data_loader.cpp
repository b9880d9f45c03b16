/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "core/errors.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>

namespace advisor
{
namespace data
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    AssetSpec AssetSpec::from_json(const nlohmann::json &j)
    {
        AssetSpec spec;
        spec.id = j.value("id", "");
        spec.file = j.value("file", "");
        spec.currency = j.value("currency", "");
        spec.asset_class = j.value("asset_class", "equity");

        if (spec.id.empty())
        {
            throw ValidationError("Asset entry requires an 'id'");
        }
        if (spec.file.empty())
        {
            spec.file = spec.id + ".csv";
        }
        if (j.contains("frequency"))
        {
            spec.frequency = parse_frequency(j.at("frequency").get<std::string>());
        }
        return spec;
    }

    FxSpec FxSpec::from_json(const nlohmann::json &j)
    {
        FxSpec spec;
        spec.currency = j.value("currency", "");
        spec.file = j.value("file", "");
        if (spec.currency.empty() || spec.file.empty())
        {
            throw ValidationError("FX entry requires 'currency' and 'file'");
        }
        return spec;
    }

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_dir = j.value("data_dir", "");
        config.base_currency = j.value("base_currency", "ILS");
        config.risk_free_file = j.value("risk_free", "");

        if (j.contains("assets"))
        {
            for (const auto &a : j.at("assets"))
            {
                config.assets.push_back(AssetSpec::from_json(a));
            }
        }
        if (j.contains("fx"))
        {
            for (const auto &f : j.at("fx"))
            {
                config.fx.push_back(FxSpec::from_json(f));
            }
        }

        NormalizerConfig &norm = config.normalizer;
        norm.return_type = parse_return_type(j.value("return_type", "simple"));
        norm.daily_threshold = j.value("daily_threshold", 100.0);
        norm.max_daily_median_gap_days = j.value("max_daily_median_gap_days", 7.0);
        norm.min_history_months = j.value("min_history_months", 24);
        norm.verbose = j.value("verbose", false);

        if (j.contains("window"))
        {
            const auto &w = j.at("window");
            if (w.contains("start"))
            {
                norm.window_start = Date::parse(w.at("start").get<std::string>());
            }
            if (w.contains("end"))
            {
                norm.window_end = Date::parse(w.at("end").get<std::string>());
            }
            norm.lookback_months = w.value("lookback_months", 0);
        }

        if (j.contains("sanitization"))
        {
            for (const auto &r : j.at("sanitization"))
            {
                norm.sanitization.push_back(SanitizationRule::from_json(r));
            }
        }

        if (config.assets.empty())
        {
            throw ValidationError("Data configuration lists no assets");
        }
        if (config.risk_free_file.empty())
        {
            throw ValidationError("Data configuration requires a 'risk_free' file");
        }
        for (auto &asset : config.assets)
        {
            if (asset.currency.empty())
            {
                asset.currency = config.base_currency;
            }
        }

        return config;
    }

    // ======================
    // CSV Loading
    // ======================

    RawSeries DataLoader::load_price_csv(const std::string &filepath,
                                         const std::string &id,
                                         const std::string &currency,
                                         size_t *missing_rows)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::vector<Observation> observations;
        size_t line_number = 0;
        size_t missing = 0;

        // Skip header
        if (!std::getline(file, line))
        {
            throw DataError("Empty CSV file: " + filepath, id);
        }
        ++line_number;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 2)
            {
                throw DataError(filepath + ":" + std::to_string(line_number) +
                                    ": expected 'date,price', got '" + line + "'",
                                id);
            }

            const std::string date_text = trim(fields[0]);
            const std::string price_text = trim(fields[1]);

            if (price_text.empty() || price_text == "nan" || price_text == "NaN")
            {
                ++missing;
                continue;
            }

            Date date;
            try
            {
                date = Date::parse(date_text);
            }
            catch (const ValidationError &e)
            {
                throw DataError(filepath + ":" + std::to_string(line_number) + ": " + e.what(), id);
            }

            errno = 0;
            char *end = nullptr;
            const double price = std::strtod(price_text.c_str(), &end);
            if (end == price_text.c_str() || *end != '\0' || errno == ERANGE)
            {
                throw DataError(filepath + ":" + std::to_string(line_number) +
                                    ": invalid price '" + price_text + "'",
                                id);
            }

            observations.push_back(Observation{date, price});
        }

        file.close();

        if (missing > 0)
        {
            std::cerr << "Warning: skipped " << missing << " row(s) without a price in " << filepath << "\n";
        }
        if (missing_rows)
        {
            *missing_rows = missing;
        }

        if (observations.empty())
        {
            throw DataError("No valid data found in CSV file: " + filepath, id);
        }

        return RawSeries(id, currency, std::move(observations));
    }

    DataContextPtr DataLoader::load_context(const DataConfig &config, std::uint64_t generation)
    {
        std::vector<AssetEntry> assets;
        assets.reserve(config.assets.size());
        for (const auto &spec : config.assets)
        {
            size_t missing = 0;
            RawSeries series = load_price_csv(resolve_path(config.data_dir, spec.file),
                                              spec.id, spec.currency, &missing);
            assets.push_back(AssetEntry{std::move(series), spec.asset_class, spec.frequency, missing});
        }

        std::map<std::string, RawSeries> fx_rates;
        for (const auto &spec : config.fx)
        {
            RawSeries fx = load_price_csv(resolve_path(config.data_dir, spec.file),
                                          spec.currency + "/" + config.base_currency,
                                          config.base_currency);
            fx_rates.emplace(spec.currency, std::move(fx));
        }

        RawSeries risk_free = load_price_csv(resolve_path(config.data_dir, config.risk_free_file),
                                             "risk_free", config.base_currency);

        return std::make_shared<const DataContext>(std::move(assets), std::move(fx_rates),
                                                   std::move(risk_free), config.base_currency,
                                                   generation);
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_price_csv(const RawSeries &series, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,price\n";
        for (const auto &obs : series.observations())
        {
            file << obs.date.to_string() << "," << std::fixed << std::setprecision(6) << obs.value << "\n";
        }

        file.close();
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string DataLoader::resolve_path(const std::string &dir, const std::string &file)
    {
        if (dir.empty() || (!file.empty() && file.front() == '/'))
        {
            return file;
        }
        if (dir.back() == '/')
        {
            return dir + file;
        }
        return dir + "/" + file;
    }

} // namespace data
} // namespace advisor
