/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and run configuration
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>

namespace allocation
{
    namespace data
    {

        // =============================================
        // Configuration Structures - from_json Methods
        // =============================================

        RunConfig RunConfig::from_json(const nlohmann::json &j)
        {
            RunConfig config;
            config.data_file = j.value("data_file", "");
            config.symbols = j.value("symbols", std::vector<std::string>{});
            config.method = j.value("method", config.method);
            config.output_path = j.value("output_path", "");
            config.benchmark = j.value("benchmark", "");
            config.compute_risk = j.value("compute_risk", false);

            if (j.contains("target_return") && !j.at("target_return").is_null())
            {
                config.target_return = j.at("target_return").get<double>();
            }

            if (j.contains("market_weights"))
            {
                config.market_weights = j.at("market_weights").get<std::map<std::string, double>>();
            }

            if (j.contains("current_weights"))
            {
                config.current_weights = j.at("current_weights").get<std::map<std::string, double>>();
            }

            return config;
        }

        // ===========================
        // CSV Loading - Long Format
        // ===========================

        std::vector<AssetRecord> DataLoader::load_price_csv(const std::string &filepath,
                                                            const std::vector<std::string> &symbols)
        {
            std::vector<AssetRecord> records = read_price_csv(filepath, symbols);
            if (records.empty())
            {
                throw std::runtime_error("No valid data found in CSV file: " + filepath);
            }
            return records;
        }

        std::vector<AssetRecord> DataLoader::read_price_csv(const std::string &filepath,
                                                            const std::vector<std::string> &symbols)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            std::vector<std::string> order;                                  // first-appearance order
            std::map<std::string, std::map<std::string, PriceSample>> data; // symbol -> date -> sample

            // Skip header
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            while (std::getline(file, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                if (fields.size() < 3)
                    continue;

                std::string date = trim(fields[0]);
                std::string symbol = trim(fields[1]);

                if (!is_valid_date_format(date) || symbol.empty())
                    continue;

                if (!symbols.empty() &&
                    std::find(symbols.begin(), symbols.end(), symbol) == symbols.end())
                {
                    continue;
                }

                PriceSample sample;
                sample.close = parse_optional_double(fields[2]);
                if (fields.size() > 3)
                {
                    sample.volume = parse_optional_double(fields[3]);
                }

                if (data.find(symbol) == data.end())
                {
                    order.push_back(symbol);
                }
                data[symbol][date] = sample;
            }

            std::vector<AssetRecord> records;
            records.reserve(order.size());

            for (const auto &symbol : order)
            {
                AssetRecord record;
                record.symbol = symbol;
                for (const auto &entry : data[symbol])
                {
                    record.samples.push_back(entry.second);
                }
                records.push_back(std::move(record));
            }

            return records;
        }

        // ================
        // JSON Loading
        // ================

        std::vector<AssetRecord> DataLoader::asset_records_from_json(const nlohmann::json &j)
        {
            if (!j.is_array())
            {
                throw std::runtime_error("Asset document must be a JSON array of records");
            }

            std::vector<AssetRecord> records;
            records.reserve(j.size());

            try
            {
                for (const auto &item : j)
                {
                    AssetRecord record;
                    record.symbol = item.at("symbol").get<std::string>();
                    record.sector = item.value("sector", record.sector);
                    record.market_cap = item.value("market_cap", record.market_cap);

                    if (item.contains("liquidity_score") && !item.at("liquidity_score").is_null())
                    {
                        record.liquidity_score = item.at("liquidity_score").get<double>();
                    }

                    if (item.contains("price_data"))
                    {
                        for (const auto &point : item.at("price_data"))
                        {
                            PriceSample sample;
                            if (point.contains("close") && point.at("close").is_number())
                            {
                                sample.close = point.at("close").get<double>();
                            }
                            if (point.contains("volume") && point.at("volume").is_number())
                            {
                                sample.volume = point.at("volume").get<double>();
                            }
                            record.samples.push_back(sample);
                        }
                    }

                    records.push_back(std::move(record));
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid asset record: " + std::string(e.what()));
            }

            return records;
        }

        std::vector<AssetRecord> DataLoader::load_asset_json(const std::string &filepath)
        {
            return asset_records_from_json(load_json(filepath));
        }

        std::vector<AssetRecord> DataLoader::load_assets(const std::string &filepath,
                                                         const std::vector<std::string> &symbols)
        {
            const std::string ext = ".json";
            const bool is_json = filepath.size() >= ext.size() &&
                                 filepath.compare(filepath.size() - ext.size(), ext.size(), ext) == 0;

            if (!is_json)
            {
                return load_price_csv(filepath, symbols);
            }

            std::vector<AssetRecord> records = load_asset_json(filepath);
            if (symbols.empty())
            {
                return records;
            }

            std::vector<AssetRecord> selected;
            for (auto &record : records)
            {
                if (std::find(symbols.begin(), symbols.end(), record.symbol) != symbols.end())
                {
                    selected.push_back(std::move(record));
                }
            }
            return selected;
        }

        std::optional<AssetRecord> DataLoader::load_symbol(const std::string &filepath,
                                                           const std::string &symbol)
        {
            const std::string ext = ".json";
            const bool is_json = filepath.size() >= ext.size() &&
                                 filepath.compare(filepath.size() - ext.size(), ext.size(), ext) == 0;

            std::vector<AssetRecord> records = is_json ? load_assets(filepath, {symbol})
                                                       : read_price_csv(filepath, {symbol});
            if (records.empty())
            {
                return std::nullopt;
            }
            return records.front();
        }

        void DataLoader::save_price_csv(const std::vector<AssetRecord> &records,
                                        const std::string &filepath,
                                        const std::string &start_date)
        {
            size_t num_days = 0;
            for (const auto &record : records)
            {
                num_days = std::max(num_days, record.samples.size());
            }

            const std::vector<std::string> dates = business_days(start_date, num_days);

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "date,symbol,close,volume\n";
            file << std::setprecision(10);

            for (const auto &record : records)
            {
                for (size_t k = 0; k < record.samples.size(); ++k)
                {
                    const auto &sample = record.samples[k];
                    file << dates[k] << "," << record.symbol << ",";
                    if (sample.close)
                    {
                        file << *sample.close;
                    }
                    file << ",";
                    if (sample.volume)
                    {
                        file << *sample.volume;
                    }
                    file << "\n";
                }
            }
        }

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
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            return j;
        }

        AppConfig DataLoader::load_config(const std::string &config_path)
        {
            auto j = load_json(config_path);

            AppConfig config;

            try
            {
                if (j.contains("optimizer"))
                {
                    config.optimizer = OptimizerConfig::from_json(j.at("optimizer"));
                }

                if (j.contains("run"))
                {
                    config.run = RunConfig::from_json(j.at("run"));
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
            }

            return config;
        }

        // ===========================
        // Synthetic Data Generation
        // ===========================

        std::vector<AssetRecord> DataLoader::generate_synthetic_records(
            const std::vector<std::string> &symbols,
            size_t num_days,
            unsigned int seed,
            double volatility,
            double drift)
        {
            std::vector<AssetRecord> records;
            records.reserve(symbols.size());

            for (size_t j = 0; j < symbols.size(); ++j)
            {
                std::mt19937 gen(seed + static_cast<unsigned int>(j) * 7919u);
                std::normal_distribution<double> returns(drift, volatility);
                std::uniform_real_distribution<double> volume(5.0e5, 1.5e6);

                AssetRecord record;
                record.symbol = symbols[j];
                record.samples.reserve(num_days);

                double price = 100.0;
                for (size_t i = 0; i < num_days; ++i)
                {
                    if (i > 0)
                    {
                        price *= std::exp(returns(gen));
                    }
                    record.samples.push_back(PriceSample{price, volume(gen)});
                }

                records.push_back(std::move(record));
            }

            return records;
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

        bool DataLoader::is_valid_date_format(const std::string &date)
        {
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }

            return true;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        std::vector<std::string> DataLoader::business_days(const std::string &start_date, size_t count)
        {
            if (!is_valid_date_format(start_date))
            {
                throw std::invalid_argument("Invalid start date (expected YYYY-MM-DD): " + start_date);
            }

            std::tm day{};
            day.tm_year = std::stoi(start_date.substr(0, 4)) - 1900;
            day.tm_mon = std::stoi(start_date.substr(5, 2)) - 1;
            day.tm_mday = std::stoi(start_date.substr(8, 2));
            day.tm_hour = 12; // away from DST transitions
            std::mktime(&day);

            std::vector<std::string> dates;
            dates.reserve(count);

            while (dates.size() < count)
            {
                if (day.tm_wday != 0 && day.tm_wday != 6)
                {
                    char buffer[11];
                    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &day);
                    dates.emplace_back(buffer);
                }
                day.tm_mday += 1;
                std::mktime(&day);
            }

            return dates;
        }

        std::optional<double> DataLoader::parse_optional_double(const std::string &str)
        {
            std::string trimmed = trim(str);
            if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
            {
                return std::nullopt;
            }

            try
            {
                size_t consumed = 0;
                double value = std::stod(trimmed, &consumed);
                if (consumed != trimmed.size() || !std::isfinite(value))
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        }

    } // namespace data
} // namespace allocation
