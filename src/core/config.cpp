/**
 * @file config.cpp
 * @brief Validation and JSON mapping of OptimizerConfig
 */

#include "core/config.hpp"
#include <stdexcept>
#include <string>

namespace allocation
{

    void OptimizerConfig::validate() const
    {
        if (max_iterations <= 0)
        {
            throw std::invalid_argument(
                "max_iterations must be positive, got: " +
                std::to_string(max_iterations));
        }

        if (tolerance <= 0.0)
        {
            throw std::invalid_argument(
                "tolerance must be positive, got: " +
                std::to_string(tolerance));
        }

        if (min_position_weight < 0.0)
        {
            throw std::invalid_argument(
                "min_position_weight must be non-negative, got: " +
                std::to_string(min_position_weight));
        }

        if (max_position_weight <= 0.0 || max_position_weight > 1.0)
        {
            throw std::invalid_argument(
                "max_position_weight must be in (0, 1], got: " +
                std::to_string(max_position_weight));
        }

        if (min_position_weight > max_position_weight)
        {
            throw std::invalid_argument(
                "min_position_weight (" + std::to_string(min_position_weight) +
                ") cannot exceed max_position_weight (" +
                std::to_string(max_position_weight) + ")");
        }

        if (black_litterman_risk_aversion <= 0.0)
        {
            throw std::invalid_argument(
                "black_litterman_risk_aversion must be positive, got: " +
                std::to_string(black_litterman_risk_aversion));
        }

        if (eigenvalue_floor <= 0.0)
        {
            throw std::invalid_argument(
                "eigenvalue_floor must be positive, got: " +
                std::to_string(eigenvalue_floor));
        }

        if (trading_days_per_year <= 0)
        {
            throw std::invalid_argument(
                "trading_days_per_year must be positive, got: " +
                std::to_string(trading_days_per_year));
        }

        // Log-returns need at least two points; a volatility estimate needs three
        if (min_price_points < 3)
        {
            throw std::invalid_argument(
                "min_price_points must be at least 3, got: " +
                std::to_string(min_price_points));
        }
    }

    OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &j)
    {
        OptimizerConfig config;

        config.max_iterations = j.value("max_iterations", config.max_iterations);
        config.tolerance = j.value("tolerance", config.tolerance);
        config.risk_free_rate = j.value("risk_free_rate", config.risk_free_rate);
        config.sharpe_improvement_target =
            j.value("sharpe_improvement_target", config.sharpe_improvement_target);
        config.black_litterman_risk_aversion =
            j.value("black_litterman_risk_aversion", config.black_litterman_risk_aversion);
        config.eigenvalue_floor = j.value("eigenvalue_floor", config.eigenvalue_floor);
        config.trading_days_per_year =
            j.value("trading_days_per_year", config.trading_days_per_year);
        config.min_price_points = j.value("min_price_points", config.min_price_points);
        config.verbose = j.value("verbose", config.verbose);

        // Position limits may be nested under "constraints" or given flat
        const nlohmann::json &limits = j.contains("constraints") ? j.at("constraints") : j;
        config.max_position_weight =
            limits.value("max_position_weight", config.max_position_weight);
        config.min_position_weight =
            limits.value("min_position_weight", config.min_position_weight);

        config.validate();
        return config;
    }

    nlohmann::json OptimizerConfig::to_json() const
    {
        return nlohmann::json{
            {"max_iterations", max_iterations},
            {"tolerance", tolerance},
            {"risk_free_rate", risk_free_rate},
            {"constraints", {
                {"max_position_weight", max_position_weight},
                {"min_position_weight", min_position_weight}
            }},
            {"sharpe_improvement_target", sharpe_improvement_target},
            {"black_litterman_risk_aversion", black_litterman_risk_aversion},
            {"eigenvalue_floor", eigenvalue_floor},
            {"trading_days_per_year", trading_days_per_year},
            {"min_price_points", min_price_points},
            {"verbose", verbose}
        };
    }

} // namespace allocation
