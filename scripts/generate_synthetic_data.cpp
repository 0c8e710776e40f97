/**
 * @file generate_synthetic_data.cpp
 * @brief Generate a synthetic long-format price file for the allocation engine
 */

#include "data/data_loader.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>

using namespace allocation;
using namespace allocation::data;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Price Generator ===\n" << std::endl;
    
    std::vector<std::string> symbols = {
        "AAPL", "MSFT", "JPM", "JNJ", "XOM",
        "WMT", "GOOGL", "BAC", "PFE", "CVX"
    };
    
    // Two years of trading days
    size_t num_days = 504;
    std::string start_date = "2022-01-03";
    std::string output_file = "data/market/historical_prices.csv";
    double volatility = 0.015;   // daily
    double drift = 0.0003;       // daily
    unsigned int seed = 42;
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            num_days = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--volatility" && i + 1 < argc) {
            volatility = std::stod(argv[++i]);
        } else if (arg == "--drift" && i + 1 < argc) {
            drift = std::stod(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output FILE      Output CSV file (default: data/market/historical_prices.csv)\n"
                      << "  --days N           Trading days per symbol (default: 504)\n"
                      << "  --volatility VAL   Daily volatility (default: 0.015)\n"
                      << "  --drift VAL        Daily drift (default: 0.0003)\n"
                      << "  --seed N           Random seed (default: 42)\n"
                      << "  --help             Show this help\n";
            return 0;
        } else {
            std::cerr << "Warning: Unknown argument: " << arg << std::endl;
        }
    }
    
    try {
        std::cout << "Generating " << num_days << " days for " << symbols.size() << " symbols..." << std::endl;
        auto records = DataLoader::generate_synthetic_records(symbols, num_days, seed, volatility, drift);
        
        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_price_csv(records, output_file, start_date);
        
        // Summary from the same return pipeline the engine uses
        ReturnSeriesBuilder builder;
        auto universe = builder.build_universe(records);
        
        std::cout << "\nAsset Statistics (Annualized):\n";
        std::cout << std::string(60, '-') << "\n";
        std::cout << std::setw(8) << "Symbol"
                  << std::setw(15) << "Mean Return"
                  << std::setw(15) << "Volatility"
                  << std::setw(15) << "Last Price" << "\n";
        std::cout << std::string(60, '-') << "\n";
        
        for (const auto& series : universe) {
            double ann_return = series.returns.mean() * 252.0;
            std::cout << std::setw(8) << series.symbol
                      << std::setw(14) << std::fixed << std::setprecision(2)
                      << (ann_return * 100) << "%"
                      << std::setw(14) << (series.volatility * 100) << "%"
                      << std::setw(15) << series.last_price() << "\n";
        }
        std::cout << std::string(60, '-') << "\n";
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
    
    std::cout << "\nData generation complete.\n";
    std::cout << "You can now run:\n";
    std::cout << "  ./build/allocation_engine --config data/config/engine_config.json --risk\n";
    std::cout << std::endl;
    
    return 0;
}
