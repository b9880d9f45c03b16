/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads per-asset price histories, FX rates and the risk-free rate from
 * CSV files described by a JSON data configuration, and assembles them
 * into an immutable DataContext.
 */

#ifndef ADVISOR_DATA_LOADER_HPP
#define ADVISOR_DATA_LOADER_HPP

#include "data/data_context.hpp"
#include "data/raw_series.hpp"
#include "data/series_normalizer.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace advisor {
namespace data {

/**
 * @struct AssetSpec
 * @brief One asset entry of the data configuration
 */
struct AssetSpec {
    std::string id;                        ///< Asset identifier
    std::string file;                      ///< CSV path (relative to data_dir)
    std::string currency;                  ///< Quote currency (defaults to base currency)
    std::string asset_class;               ///< equity, bond, commodity, reit, currency
    std::optional<Frequency> frequency;    ///< Optional frequency override

    static AssetSpec from_json(const nlohmann::json& j);
};

/**
 * @struct FxSpec
 * @brief FX series for one foreign currency (base units per foreign unit)
 */
struct FxSpec {
    std::string currency;                  ///< Foreign currency code
    std::string file;                      ///< CSV path (relative to data_dir)

    static FxSpec from_json(const nlohmann::json& j);
};

/**
 * @struct DataConfig
 * @brief Configuration parameters for data loading and normalization
 */
struct DataConfig {
    std::string data_dir;                  ///< Directory that relative file paths resolve against
    std::string base_currency = "ILS";     ///< Currency all returns are expressed in
    std::vector<AssetSpec> assets;         ///< Asset universe available to requests
    std::vector<FxSpec> fx;                ///< FX series, one per foreign currency
    std::string risk_free_file;            ///< Annual risk-free rate levels (decimal)
    NormalizerConfig normalizer;           ///< Frequency, window and sanitization settings

    /**
     * @brief Load from JSON object
     * @throws ValidationError on missing required fields or bad values
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @class DataLoader
 * @brief Loads and parses source data files
 *
 * Price files are two-column CSV with a header row:
 * @code
 * date,price
 * 2020-01-02,3251.84
 * 2020-01-03,3234.85
 * @endcode
 * Rows with an empty or "nan" price are treated as missing observations,
 * skipped and counted (logged, and kept on the AssetEntry for asset
 * files); any other unparseable row is an error.
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load a date,price CSV as a raw series
     * @param filepath Path to CSV file
     * @param id Identifier assigned to the series
     * @param currency Quote currency of the values
     * @param missing_rows Output, optional: rows skipped for an empty or "nan" price
     * @return Validated RawSeries
     * @throws std::runtime_error if file cannot be opened
     * @throws DataError on malformed rows or out-of-order dates
     */
    static RawSeries load_price_csv(const std::string& filepath,
                                    const std::string& id,
                                    const std::string& currency,
                                    size_t* missing_rows = nullptr);

    /**
     * @brief Load every file named in a data configuration
     * @param config Data configuration
     * @param generation Load counter stamped on the snapshot
     * @return Shared immutable snapshot
     */
    static DataContextPtr load_context(const DataConfig& config,
                                       std::uint64_t generation = 1);

    // ========================================================================
    // JSON
    // ========================================================================

    /**
     * @brief Load and parse a JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    // ========================================================================
    // Export
    // ========================================================================

    /**
     * @brief Write a raw series as date,price CSV
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_price_csv(const RawSeries& series, const std::string& filepath);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);
    static std::string resolve_path(const std::string& dir, const std::string& file);
};

} // namespace data
} // namespace advisor

#endif // ADVISOR_DATA_LOADER_HPP
