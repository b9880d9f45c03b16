/**
 * @file generate_sample_data.cpp
 * @brief Generate a deterministic sample data set for the allocation advisor
 *
 * Writes mixed-frequency, mixed-currency price files, a USD/ILS FX series,
 * an irregular risk-free rate file and a matching config.json.
 */

#include "data/data_loader.hpp"
#include "data/date.hpp"
#include "data/raw_series.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace advisor::data;

namespace
{
    struct SampleAsset
    {
        std::string id;
        std::string currency;
        std::string asset_class;
        bool daily;
        double annual_drift;
        double annual_volatility;
        double start_price;
    };

    std::vector<Date> business_days(const Date &start, const Date &end)
    {
        std::vector<Date> days;
        for (long long d = start.days_since_epoch(); d <= end.days_since_epoch(); ++d)
        {
            // 1970-01-01 was a Thursday
            const long long dow = ((d % 7) + 7 + 3) % 7; // 0=Mon
            if (dow < 5)
            {
                days.push_back(Date::from_days_since_epoch(d));
            }
        }
        return days;
    }

    std::vector<Date> month_ends(const Date &start, const Date &end)
    {
        std::vector<Date> dates;
        for (int m = start.month_index(); m <= end.month_index(); ++m)
        {
            dates.push_back(Date::month_end_of(m));
        }
        return dates;
    }

    RawSeries random_walk(const SampleAsset &asset,
                          const std::vector<Date> &dates,
                          double periods_per_year,
                          std::mt19937 &rng,
                          const std::vector<double> &market_shocks,
                          double market_beta)
    {
        std::normal_distribution<double> noise(0.0, 1.0);
        const double dt = 1.0 / periods_per_year;
        const double sigma = asset.annual_volatility * std::sqrt(dt);
        const double mu = (asset.annual_drift - 0.5 * asset.annual_volatility * asset.annual_volatility) * dt;
        const double idio = std::sqrt(std::max(0.0, 1.0 - market_beta * market_beta));

        std::vector<Observation> obs;
        obs.reserve(dates.size());
        double price = asset.start_price;
        for (size_t t = 0; t < dates.size(); ++t)
        {
            if (t > 0)
            {
                const double shock = market_beta * market_shocks[t % market_shocks.size()] + idio * noise(rng);
                price *= std::exp(mu + sigma * shock);
            }
            obs.push_back(Observation{dates[t], price});
        }
        return RawSeries(asset.id, asset.currency, std::move(obs));
    }
}

int main(int argc, char *argv[])
{
    std::string output_dir = "sample";
    unsigned seed = 42;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc)
        {
            output_dir = argv[++i];
        }
        else if (arg == "--seed" && i + 1 < argc)
        {
            seed = static_cast<unsigned>(std::stoul(argv[++i]));
        }
        else if (arg == "--help")
        {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output DIR   Output directory (default: sample)\n"
                      << "  --seed N       Random seed (default: 42)\n"
                      << "  --help         Show this help\n";
            return 0;
        }
    }

    std::cout << "\n=== Sample Data Generator ===\n"
              << std::endl;

    try
    {
        std::filesystem::create_directories(output_dir);

        const Date start(2012, 1, 2);
        const Date end(2024, 12, 31);
        const std::vector<Date> daily = business_days(start, end);
        const std::vector<Date> monthly = month_ends(start, end);

        const std::vector<SampleAsset> assets = {
            {"TA125", "ILS", "equity", true, 0.08, 0.17, 1000.0},
            {"SPX", "USD", "equity", true, 0.10, 0.16, 1300.0},
            {"MSCI_EM", "USD", "equity", true, 0.06, 0.21, 40.0},
            {"GOV_IL", "ILS", "bond", false, 0.025, 0.04, 100.0},
            {"CORP_IL", "ILS", "bond", false, 0.035, 0.06, 100.0},
            {"GOLD", "USD", "commodity", true, 0.04, 0.15, 1600.0}};

        std::mt19937 rng(seed);
        std::normal_distribution<double> noise(0.0, 1.0);

        std::vector<double> daily_market(daily.size());
        for (auto &s : daily_market)
            s = noise(rng);
        std::vector<double> monthly_market(monthly.size());
        for (auto &s : monthly_market)
            s = noise(rng);

        nlohmann::json asset_specs = nlohmann::json::array();
        for (const auto &asset : assets)
        {
            const double beta = asset.asset_class == "equity" ? 0.7 : (asset.asset_class == "bond" ? 0.2 : 0.1);
            RawSeries series = asset.daily
                                   ? random_walk(asset, daily, 252.0, rng, daily_market, beta)
                                   : random_walk(asset, monthly, 12.0, rng, monthly_market, beta);

            const std::string file = asset.id + ".csv";
            DataLoader::save_price_csv(series, output_dir + "/" + file);
            std::cout << "  " << asset.id << ": " << series.size() << " "
                      << (asset.daily ? "daily" : "monthly") << " prices in " << asset.currency << "\n";

            asset_specs.push_back({{"id", asset.id},
                                   {"file", file},
                                   {"currency", asset.currency},
                                   {"asset_class", asset.asset_class}});
        }

        // USD/ILS drifting around 3.6
        SampleAsset usd{"USD/ILS", "ILS", "currency", true, 0.0, 0.07, 3.6};
        std::vector<double> no_market(1, 0.0);
        RawSeries fx = random_walk(usd, daily, 252.0, rng, no_market, 0.0);
        DataLoader::save_price_csv(fx, output_dir + "/usd_ils.csv");
        std::cout << "  USD/ILS: " << fx.size() << " daily rates\n";

        // Risk-free rate published only when the policy rate changes
        std::vector<Observation> rate_points;
        double rate = 0.0025;
        std::uniform_int_distribution<int> gap(2, 9);
        for (int m = start.month_index(); m <= end.month_index(); m += gap(rng))
        {
            rate = std::max(0.001, std::min(0.0475, rate + 0.0025 * noise(rng)));
            rate_points.push_back(Observation{Date::month_end_of(m), rate});
        }
        RawSeries risk_free("risk_free", "ILS", std::move(rate_points));
        DataLoader::save_price_csv(risk_free, output_dir + "/risk_free.csv");
        std::cout << "  risk_free: " << risk_free.size() << " irregular observations\n";

        nlohmann::json config;
        config["data"] = {{"data_dir", "."},
                          {"base_currency", "ILS"},
                          {"assets", asset_specs},
                          {"fx", nlohmann::json::array({nlohmann::json{{"currency", "USD"}, {"file", "usd_ils.csv"}}})},
                          {"risk_free", "risk_free.csv"},
                          {"return_type", "simple"},
                          {"min_history_months", 36}};
        config["optimizer"] = {{"max_single_asset", 0.40},
                               {"min_weight_threshold", 0.01},
                               {"dust_policy", "zero"},
                               {"risk_aversion_coefficient", 0.5}};
        config["backtest"] = {{"rebalance_interval_months", 1}};
        config["cache"] = {{"path", "stats_cache.json"}};

        const std::string config_path = output_dir + "/config.json";
        std::ofstream out(config_path);
        if (!out.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + config_path);
        }
        out << config.dump(2) << "\n";

        std::cout << "\nConfiguration written to " << config_path << "\n";
        std::cout << "You can now run:\n";
        std::cout << "  ./build/bin/advisor --config " << config_path
                  << " --risk-level 5 --amount 100000 --horizon 10\n"
                  << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
