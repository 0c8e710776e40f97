/**
 * @file optimization_result.cpp
 * @brief Implementation of OptimizationResult
 */

#include "optimizer/optimization_result.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace allocation
{
    namespace optimizer
    {

        std::string to_string(RiskLevel level)
        {
            switch (level)
            {
            case RiskLevel::LOW:
                return "LOW";
            case RiskLevel::MEDIUM:
                return "MEDIUM";
            case RiskLevel::HIGH:
                return "HIGH";
            case RiskLevel::VERY_HIGH:
                return "VERY_HIGH";
            }
            return "LOW";
        }

        std::string current_timestamp()
        {
            const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local_tm{};
            localtime_r(&now, &local_tm);

            std::ostringstream oss;
            oss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
            return oss.str();
        }

        OptimizationResult OptimizationResult::neutral(const std::string &method)
        {
            OptimizationResult result;
            result.method = method;
            result.timestamp = current_timestamp();
            return result;
        }

        nlohmann::json OptimizationResult::to_json() const
        {
            return nlohmann::json{
                {"weights", weights.to_json()},
                {"expected_return", expected_return},
                {"volatility", volatility},
                {"sharpe_ratio", sharpe_ratio},
                {"diversification_score", diversification_score},
                {"risk_level", to_string(risk_level)},
                {"confidence", confidence},
                {"method", method},
                {"iterations", iterations},
                {"convergence", convergence},
                {"timestamp", timestamp}};
        }

        void OptimizationResult::print_summary() const
        {
            std::cout << "\n=== Optimization Result ===\n";
            std::cout << "Method:     " << method << "\n";
            std::cout << "Converged:  " << (convergence ? "yes" : "no")
                      << " (" << iterations << " iterations)\n";
            std::cout << std::string(50, '-') << "\n";

            std::cout << "Portfolio Statistics:\n";
            std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                      << expected_return * 100 << "%\n";
            std::cout << "  Volatility:       " << volatility * 100 << "%\n";
            std::cout << "  Sharpe Ratio:     " << std::setprecision(3) << sharpe_ratio << "\n";
            std::cout << "  Diversification:  " << diversification_score << "\n";
            std::cout << "  Risk Level:       " << to_string(risk_level) << "\n";
            std::cout << "  Confidence:       " << confidence << "\n";

            if (!weights.empty())
            {
                std::cout << "\nWeights:\n";
                for (const auto &symbol : weights.symbols())
                {
                    std::cout << "  " << std::left << std::setw(10) << symbol << std::right
                              << std::setprecision(2) << weights.weight(symbol) * 100 << "%\n";
                }
            }

            std::cout << "===========================\n"
                      << std::endl;
        }

    } // namespace optimizer
} // namespace allocation
