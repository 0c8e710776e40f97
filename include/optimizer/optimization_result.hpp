/**
 * @file optimization_result.hpp
 * @brief Final, post-processed optimization result
 */

#pragma once

#include "weight_vector.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @enum RiskLevel
         * @brief Volatility bucket: <= 0.10, <= 0.20, <= 0.30, above
         */
        enum class RiskLevel
        {
            LOW,
            MEDIUM,
            HIGH,
            VERY_HIGH
        };

        /**
         * @brief "LOW", "MEDIUM", "HIGH" or "VERY_HIGH"
         */
        std::string to_string(RiskLevel level);

        /**
         * @brief Current local time as ISO-8601 (YYYY-MM-DDTHH:MM:SS)
         */
        std::string current_timestamp();

        /**
         * @struct OptimizationResult
         * @brief Immutable record of one optimization call
         */
        struct OptimizationResult
        {
            WeightVector weights;               ///< Final weights (empty for the neutral result)
            double expected_return = 0.0;       ///< Portfolio expected return
            double volatility = 0.0;            ///< Portfolio volatility
            double sharpe_ratio = 0.0;          ///< Sharpe ratio
            double diversification_score = 0.0; ///< Entropy and correlation composite in [0, 1]
            RiskLevel risk_level = RiskLevel::LOW;
            double confidence = 0.0;            ///< Optimization confidence in [0, 1]
            std::string method;                 ///< Objective profile name
            int iterations = 0;                 ///< Solver iterations
            bool convergence = false;           ///< Solver converged
            std::string timestamp;              ///< ISO-8601 creation time

            /**
             * @brief Neutral result: empty weights, zero statistics, LOW, no convergence
             */
            static OptimizationResult neutral(const std::string &method);

            /**
             * @brief Convert to JSON
             */
            nlohmann::json to_json() const;

            /**
             * @brief Print summary statistics
             */
            void print_summary() const;
        };

    } // namespace optimizer
} // namespace allocation
