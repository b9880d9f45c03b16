/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and DataContext
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "pipeline/pipeline_config.hpp"

#include <filesystem>
#include <fstream>

using namespace advisor;
using namespace advisor::data;
using Catch::Matchers::WithinAbs;

namespace
{
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name)
            : path_(std::filesystem::temp_directory_path() / name)
        {
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }
        ~TempDir() { std::filesystem::remove_all(path_); }

        std::string file(const std::string &name) const { return (path_ / name).string(); }
        std::string str() const { return path_.string(); }

        void write(const std::string &name, const std::string &content) const
        {
            std::ofstream out(file(name));
            out << content;
        }

    private:
        std::filesystem::path path_;
    };
}

TEST_CASE("Price CSV loading", "[DataLoader]")
{
    TempDir dir("advisor_test_loader_csv");

    SECTION("Well-formed file with missing values")
    {
        dir.write("a.csv", "date,price\n2020-01-31,100.0\n2020-02-29,nan\n2020-03-31,\n2020-04-30,104.5\n\n");
        size_t missing = 99;
        RawSeries s = DataLoader::load_price_csv(dir.file("a.csv"), "A", "ILS", &missing);
        REQUIRE(missing == 2);
        REQUIRE(s.id() == "A");
        REQUIRE(s.currency() == "ILS");
        REQUIRE(s.size() == 2);
        REQUIRE(s.first_date() == Date(2020, 1, 31));
        REQUIRE_THAT(s.observations()[1].value, WithinAbs(104.5, 1e-12));
    }

    SECTION("Missing file")
    {
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(dir.file("nope.csv"), "A", "ILS"), std::runtime_error);
    }

    SECTION("Malformed price")
    {
        dir.write("bad.csv", "date,price\n2020-01-31,abc\n");
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(dir.file("bad.csv"), "BAD", "ILS"), DataError);
    }

    SECTION("Malformed date")
    {
        dir.write("bad_date.csv", "date,price\n31/01/2020,100\n");
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(dir.file("bad_date.csv"), "BAD", "ILS"), DataError);
    }

    SECTION("Dates out of order")
    {
        dir.write("order.csv", "date,price\n2020-02-29,100\n2020-01-31,101\n");
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(dir.file("order.csv"), "ORD", "ILS"), DataError);
    }

    SECTION("Header only")
    {
        dir.write("empty.csv", "date,price\n");
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(dir.file("empty.csv"), "E", "ILS"), DataError);
    }

    SECTION("Save and reload")
    {
        RawSeries original("B", "ILS", {{Date(2021, 1, 29), 10.25}, {Date(2021, 2, 26), 10.5}});
        DataLoader::save_price_csv(original, dir.file("b.csv"));
        RawSeries reloaded = DataLoader::load_price_csv(dir.file("b.csv"), "B", "ILS");
        REQUIRE(reloaded.size() == 2);
        REQUIRE(reloaded.last_date() == Date(2021, 2, 26));
        REQUIRE_THAT(reloaded.observations()[0].value, WithinAbs(10.25, 1e-9));
    }
}

TEST_CASE("Data configuration parsing", "[DataLoader][Config]")
{
    SECTION("Defaults and currency fallback")
    {
        nlohmann::json j = {{"data_dir", "data"},
                            {"base_currency", "ILS"},
                            {"risk_free", "rf.csv"},
                            {"assets", {{{"id", "TA125"}}, {{"id", "SPX"}, {"currency", "USD"}, {"frequency", "daily"}}}}};
        DataConfig config = DataConfig::from_json(j);
        REQUIRE(config.assets.size() == 2);
        REQUIRE(config.assets[0].file == "TA125.csv");
        REQUIRE(config.assets[0].currency == "ILS");
        REQUIRE(config.assets[0].asset_class == "equity");
        REQUIRE_FALSE(config.assets[0].frequency.has_value());
        REQUIRE(config.assets[1].currency == "USD");
        REQUIRE(config.assets[1].frequency == Frequency::DAILY);
        REQUIRE(config.normalizer.min_history_months == 24);
    }

    SECTION("Window and sanitization")
    {
        nlohmann::json j = {{"risk_free", "rf.csv"},
                            {"assets", {{{"id", "A"}}}},
                            {"return_type", "log"},
                            {"window", {{"start", "2015-01-31"}, {"end", "2020-12-31"}}},
                            {"sanitization", {{{"asset", "A"}, {"max_price", 1000.0}, {"reason", "bad tick"}}}}};
        DataConfig config = DataConfig::from_json(j);
        REQUIRE(config.normalizer.return_type == ReturnType::LOG);
        REQUIRE(config.normalizer.window_start == Date(2015, 1, 31));
        REQUIRE(config.normalizer.window_end == Date(2020, 12, 31));
        REQUIRE(config.normalizer.sanitization.size() == 1);
        REQUIRE(config.normalizer.sanitization[0].max_price == 1000.0);
    }

    SECTION("Invalid entries")
    {
        REQUIRE_THROWS_AS(DataConfig::from_json({{"risk_free", "rf.csv"}}), ValidationError);
        REQUIRE_THROWS_AS(DataConfig::from_json({{"assets", {{{"id", "A"}}}}}), ValidationError);
        REQUIRE_THROWS_AS(DataConfig::from_json({{"risk_free", "rf.csv"}, {"assets", {{{"file", "x.csv"}}}}}),
                          ValidationError);
        REQUIRE_THROWS_AS(DataConfig::from_json({{"risk_free", "rf.csv"},
                                                 {"assets", {{{"id", "A"}, {"frequency", "weekly"}}}}}),
                          ValidationError);
    }
}

TEST_CASE("Context loading from a configuration file", "[DataLoader][Context]")
{
    TempDir dir("advisor_test_loader_context");
    dir.write("a.csv", "date,price\n2020-01-31,100\n2020-02-14,nan\n2020-02-29,101\n2020-03-31,102\n");
    dir.write("b.csv", "date,price\n2020-01-31,50\n2020-02-29,49\n2020-03-31,51\n");
    dir.write("usd.csv", "date,price\n2020-01-31,3.4\n2020-02-29,3.45\n2020-03-31,3.5\n");
    dir.write("rf.csv", "date,rate\n2019-12-31,0.0025\n");

    nlohmann::json config = {{"data", {{"data_dir", "."},
                                       {"base_currency", "ILS"},
                                       {"risk_free", "rf.csv"},
                                       {"fx", {{{"currency", "USD"}, {"file", "usd.csv"}}}},
                                       {"assets", {{{"id", "A"}, {"file", "a.csv"}},
                                                   {{"id", "B"}, {"file", "b.csv"}, {"currency", "USD"}, {"asset_class", "bond"}}}}}},
                             {"cache", {{"path", "cache.json"}}}};
    {
        std::ofstream out(dir.file("config.json"));
        out << config.dump(2);
    }

    pipeline::PipelineConfig pc = pipeline::load_pipeline_config(dir.file("config.json"));
    REQUIRE(std::filesystem::path(pc.data_config.data_dir) == std::filesystem::path(dir.str()) / ".");
    REQUIRE(std::filesystem::path(pc.cache_path) == std::filesystem::path(dir.str()) / "cache.json");

    DataContextPtr context = DataLoader::load_context(pc.data_config);

    SECTION("Contents")
    {
        REQUIRE(context->asset_ids() == std::vector<std::string>{"A", "B"});
        REQUIRE(context->asset("B").asset_class == "bond");
        REQUIRE(context->asset("A").missing_rows == 1);
        REQUIRE(context->asset("B").missing_rows == 0);
        REQUIRE(context->asset("B").series.currency() == "USD");
        REQUIRE(context->fx_for("USD") != nullptr);
        REQUIRE(context->fx_for("EUR") == nullptr);
        REQUIRE(context->risk_free().size() == 1);
        REQUIRE_THROWS_AS(context->asset("C"), ValidationError);
    }

    SECTION("Fingerprint tracks content")
    {
        DataContextPtr again = DataLoader::load_context(pc.data_config, 2);
        REQUIRE(again->generation() == 2);
        REQUIRE(again->fingerprint() == context->fingerprint());

        dir.write("b.csv", "date,price\n2020-01-31,50\n2020-02-29,49\n2020-03-31,52\n");
        DataContextPtr changed = DataLoader::load_context(pc.data_config, 3);
        REQUIRE(changed->fingerprint() != context->fingerprint());
    }

    SECTION("Duplicate asset ids")
    {
        std::vector<AssetEntry> assets{context->asset("A"), context->asset("A")};
        REQUIRE_THROWS_AS(DataContext(assets, {}, context->risk_free(), "ILS"), DataError);
    }

    SECTION("Missing JSON file")
    {
        REQUIRE_THROWS_AS(DataLoader::load_json(dir.file("missing.json")), std::runtime_error);
    }
}
