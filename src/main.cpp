/**
 * @file main.cpp
 * @brief Main entry point for the allocation engine
 *
 * Command-line application that loads configuration and price history,
 * runs one portfolio optimization, optionally computes risk metrics for
 * the resulting weights and writes a JSON report.
 */

#include "data/data_loader.hpp"
#include "optimizer/portfolio_optimizer.hpp"
#include "optimizer/optimizer_interface.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace allocation;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Allocation Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --method NAME         max_sharpe | mean_variance | min_variance |\n"
              << "                        black_litterman | risk_parity | equal_risk_contribution\n"
              << "  --output PATH         Path to JSON report (overrides run.output_path)\n"
              << "  --risk                Compute risk metrics for the optimized weights\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/engine_config.json --risk\n"
              << "  " << program_name << " --config data/config/engine_config.json --method risk_parity\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Allocation Engine v1.0.0                                 \n"
              << "       Multi-Method Portfolio Optimization and Risk Metrics     \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string method;
    std::string output_path;
    bool compute_risk = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--method" && i + 1 < argc)
            {
                args.method = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--risk")
            {
                args.compute_risk = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Print risk metrics
 */
void print_risk_metrics(const analytics::RiskMetrics &metrics)
{
    std::cout << "\nRISK METRICS (daily portfolio returns)\n";
    std::cout << std::string(60, '-') << "\n";
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "  VaR 95% / 99%:     " << metrics.var_95 * 100 << "% / " << metrics.var_99 * 100 << "%\n";
    std::cout << "  CVaR 95% / 99%:    " << metrics.cvar_95 * 100 << "% / " << metrics.cvar_99 * 100 << "%\n";
    std::cout << "  Max Drawdown:      " << metrics.max_drawdown * 100 << "%\n";
    std::cout << "  Volatility (ann.): " << metrics.volatility * 100 << "%\n";
    std::cout << "  Sharpe / Sortino:  " << metrics.sharpe_ratio << " / " << metrics.sortino_ratio << "\n";
    std::cout << "  Calmar:            " << metrics.calmar_ratio << "\n";
    std::cout << "  Beta / Alpha:      " << metrics.beta << " / " << metrics.jensen_alpha << "\n";
    std::cout << "  Information:       " << metrics.information_ratio << "\n";
    std::cout << "  Treynor:           " << metrics.treynor_ratio << "\n";
    std::cout << "  Skew / Kurtosis:   " << metrics.skewness << " / " << metrics.kurtosis << "\n";
    std::cout << std::string(60, '-') << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        auto config = data::DataLoader::load_config(args.config_path);

        if (args.verbose)
        {
            config.optimizer.verbose = true;
        }
        if (!args.method.empty())
        {
            config.run.method = args.method;
        }
        if (!args.output_path.empty())
        {
            config.run.output_path = args.output_path;
        }
        if (args.compute_risk)
        {
            config.run.compute_risk = true;
        }

        if (config.run.data_file.empty())
        {
            throw std::runtime_error("Configuration has no run.data_file");
        }

        const auto method = optimizer::method_from_string(config.run.method);

        if (args.verbose)
        {
            std::cout << "  - Data file: " << config.run.data_file << "\n";
            std::cout << "  - Method: " << optimizer::to_string(method) << "\n";
            std::cout << "  - Weight range: [" << config.optimizer.min_position_weight
                      << ", " << config.optimizer.max_position_weight << "]\n";
        }

        // ====================================================================
        // 2. Load Price History
        // ====================================================================
        std::cout << "[2/5] Loading price history..." << std::endl;

        auto records = data::DataLoader::load_assets(config.run.data_file, config.run.symbols);

        std::vector<double> benchmark;
        if (!config.run.benchmark.empty())
        {
            auto benchmark_record = data::DataLoader::load_symbol(config.run.data_file,
                                                                  config.run.benchmark);
            data::ReturnSeriesBuilder builder(config.optimizer);
            std::optional<data::AssetSeries> series;
            if (benchmark_record)
            {
                series = builder.build(*benchmark_record);
            }
            if (series)
            {
                benchmark.assign(series->returns.data(), series->returns.data() + series->returns.size());
            }
            else
            {
                std::cerr << "Warning: benchmark " << config.run.benchmark
                          << " has no usable price history\n";
            }

            // The benchmark is not part of the investable universe
            records.erase(std::remove_if(records.begin(), records.end(),
                                         [&](const data::AssetRecord &r)
                                         { return r.symbol == config.run.benchmark; }),
                          records.end());
        }

        std::cout << "  - Loaded " << records.size() << " assets" << std::endl;

        // ====================================================================
        // 3. Portfolio Optimization
        // ====================================================================
        std::cout << "[3/5] Running " << optimizer::to_string(method) << " optimization..." << std::endl;

        optimizer::PortfolioOptimizer engine(config.optimizer);

        optimizer::OptimizationRequest request;
        request.assets = records;
        request.method = method;
        request.target_return = config.run.target_return;
        request.market_weights = config.run.market_weights;
        request.current_weights = config.run.current_weights;

        auto outcome = engine.optimize(request);

        std::cout << "  - Status: " << optimizer::to_string(outcome.status)
                  << " (" << outcome.message << ")\n";
        outcome.result.print_summary();

        const auto &improvement = outcome.sharpe_improvement;
        std::cout << "Sharpe improvement vs "
                  << (config.run.current_weights.empty() ? "equal weight" : "current holdings") << ": " << std::fixed << std::setprecision(2)
                  << improvement.improvement_ratio * 100 << "% (target "
                  << improvement.target * 100 << "%, "
                  << (improvement.target_achieved ? "achieved" : "not achieved") << ")\n";

        // ====================================================================
        // 4. Risk Metrics (Optional)
        // ====================================================================
        nlohmann::json report = outcome.to_json();

        if (config.run.compute_risk && outcome.ok())
        {
            std::cout << "\n[4/5] Computing risk metrics..." << std::endl;

            auto metrics = engine.evaluate_risk(outcome.result.weights, records, benchmark);
            print_risk_metrics(metrics);
            report["risk_metrics"] = metrics.to_json();
        }
        else
        {
            std::cout << "\n[4/5] Skipping risk metrics (use --risk to enable)\n";
        }

        // ====================================================================
        // 5. Report
        // ====================================================================
        if (!config.run.output_path.empty())
        {
            std::cout << "[5/5] Writing report..." << std::endl;

            report["config"] = config.optimizer.to_json();

            std::ofstream out(config.run.output_path);
            if (!out.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + config.run.output_path);
            }
            out << report.dump(2) << "\n";

            std::cout << "  - Report written to: " << config.run.output_path << "\n";
        }
        else
        {
            std::cout << "[5/5] No output path configured; report not written\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Run completed in " << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return outcome.status == optimizer::OutcomeStatus::FAILED ? 1 : 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
