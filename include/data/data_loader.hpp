/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 * 
 * Loads per-asset price histories from CSV or JSON files and the engine
 * configuration from JSON files.
 */

#ifndef ALLOCATION_DATA_DATA_LOADER_HPP
#define ALLOCATION_DATA_DATA_LOADER_HPP

#include "asset_series.hpp"
#include "core/config.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace allocation {
namespace data {

/**
 * @struct RunConfig
 * @brief What the command-line front end should run
 */
struct RunConfig {
    std::string data_file;                       ///< Price file (.csv long format or .json records)
    std::vector<std::string> symbols;            ///< Universe filter (all symbols if empty)
    std::string method = "max_sharpe";           ///< Optimization method name
    std::optional<double> target_return;         ///< Mean-variance target return
    std::map<std::string, double> market_weights;///< Black-Litterman market portfolio
    std::map<std::string, double> current_weights;///< Current holdings (Sharpe baseline)
    std::string output_path;                     ///< JSON report path (no report if empty)
    std::string benchmark;                       ///< Benchmark symbol for risk metrics (none if empty)
    bool compute_risk = false;                   ///< Compute risk metrics for the result

    static RunConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AppConfig
 * @brief Complete engine configuration
 */
struct AppConfig {
    OptimizerConfig optimizer;
    RunConfig run;
};

/**
 * @class DataLoader
 * @brief Loads asset records and configuration from files
 * 
 * Supported price formats:
 * - CSV (long format): date,symbol,close[,volume]
 * - JSON: [{"symbol": ..., "sector": ..., "market_cap": ..., "liquidity_score": ...,
 *           "price_data": [{"close": ..., "volume": ...}, ...]}, ...]
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;
    
    // ========================================================================
    // Price Loading Methods
    // ========================================================================
    
    /**
     * @brief Load asset records from a long-format CSV file
     * 
     * Expected format:
     * date,symbol,close,volume
     * 2024-01-02,AAA,100.0,120000
     * 2024-01-02,BBB,50.0,
     * 
     * Empty or "nan" cells are missing values. Rows with an invalid date
     * are skipped. Samples are ordered by date within each symbol; symbols
     * keep the order of their first appearance.
     * 
     * @param filepath Path to CSV file
     * @param symbols Optional list of symbols to load (loads all if empty)
     * @throws std::runtime_error if the file cannot be read or holds no data
     */
    static std::vector<AssetRecord> load_price_csv(const std::string& filepath,
                                                   const std::vector<std::string>& symbols = {});
    
    /**
     * @brief Load asset records from a JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static std::vector<AssetRecord> load_asset_json(const std::string& filepath);
    
    /**
     * @brief Parse asset records from a JSON array
     * @throws std::runtime_error if the document is not an array of records
     */
    static std::vector<AssetRecord> asset_records_from_json(const nlohmann::json& j);
    
    /**
     * @brief Load by extension (.json records, otherwise long-format CSV)
     */
    static std::vector<AssetRecord> load_assets(const std::string& filepath,
                                                const std::vector<std::string>& symbols = {});
    
    /**
     * @brief Load a single symbol, typically a benchmark
     * @return nullopt when the file has no data for the symbol
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static std::optional<AssetRecord> load_symbol(const std::string& filepath,
                                                  const std::string& symbol);
    
    /**
     * @brief Save records as long-format CSV (date,symbol,close,volume)
     * 
     * Sample k of every record is dated k business days after start_date.
     * Missing values are written as empty cells.
     * 
     * @throws std::runtime_error if the file cannot be written
     * @throws std::invalid_argument if start_date is not YYYY-MM-DD
     */
    static void save_price_csv(const std::vector<AssetRecord>& records,
                               const std::string& filepath,
                               const std::string& start_date = "2022-01-03");
    
    // ========================================================================
    // Configuration Loading
    // ========================================================================
    
    /**
     * @brief Load JSON file
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);
    
    /**
     * @brief Load complete configuration ("optimizer" and "run" sections)
     * @throws std::runtime_error if the file cannot be loaded
     * @throws std::invalid_argument if the optimizer section is invalid
     */
    static AppConfig load_config(const std::string& config_path);
    
    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================
    
    /**
     * @brief Generate reproducible synthetic asset records
     * 
     * Prices follow a geometric random walk starting at 100 with daily
     * returns drawn from N(drift, volatility). Each symbol gets a distinct
     * stream derived from the seed.
     */
    static std::vector<AssetRecord> generate_synthetic_records(
        const std::vector<std::string>& symbols,
        size_t num_days,
        unsigned int seed = 42,
        double volatility = 0.02,
        double drift = 0.0005
    );

private:
    /**
     * @brief CSV reader shared by load_price_csv and load_symbol; may return no records
     */
    static std::vector<AssetRecord> read_price_csv(const std::string& filepath,
                                                   const std::vector<std::string>& symbols);
    
    static std::vector<std::string> parse_csv_line(const std::string& line);
    
    /**
     * @brief Validate date format (YYYY-MM-DD)
     */
    static bool is_valid_date_format(const std::string& date);
    
    static std::string trim(const std::string& str);
    
    /**
     * @brief Consecutive business days (Mon-Fri) starting at start_date
     */
    static std::vector<std::string> business_days(const std::string& start_date, size_t count);
    
    /**
     * @brief Parse a number; empty, "nan" or malformed cells give nullopt
     */
    static std::optional<double> parse_optional_double(const std::string& str);
};

} // namespace data
} // namespace allocation

#endif // ALLOCATION_DATA_DATA_LOADER_HPP
