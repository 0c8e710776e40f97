/**
 * @file config.hpp
 * @brief Optimizer configuration shared by every pipeline stage
 *
 * Holds every tunable threshold of the allocation engine as a named field
 * with a documented default. The struct is validated once when a
 * PortfolioOptimizer is constructed and is never re-read per call.
 */

#pragma once

#include <nlohmann/json.hpp>

namespace allocation
{

    /**
     * @struct OptimizerConfig
     * @brief Tunable parameters of the optimization engine
     *
     * All values have defaults; no behavior requires external configuration.
     *
     * Usage Example:
     * @code
     * OptimizerConfig config;
     * config.max_position_weight = 0.40;
     * config.validate();
     * PortfolioOptimizer optimizer(config);
     * @endcode
     */
    struct OptimizerConfig
    {
        int max_iterations = 1000;                  ///< Hard cap on solver iterations
        double tolerance = 1e-6;                    ///< Solver convergence tolerance
        double risk_free_rate = 0.02;               ///< Annualized risk-free rate
        double max_position_weight = 0.20;          ///< Upper bound per asset
        double min_position_weight = 0.01;          ///< Lower bound per asset
        double sharpe_improvement_target = 0.20;    ///< Target relative Sharpe improvement
        double black_litterman_risk_aversion = 3.0; ///< Risk aversion for BL posterior returns
        double eigenvalue_floor = 1e-8;             ///< Minimum eigenvalue after covariance repair
        int trading_days_per_year = 252;            ///< Annualization factor
        int min_price_points = 3;                   ///< Minimum valid closes per asset
        bool verbose = false;                       ///< Log routine warnings to stderr

        /**
         * @brief Validate configuration
         * @throws std::invalid_argument if any field is out of range
         */
        void validate() const;

        /**
         * @brief Create from JSON configuration (missing keys keep defaults)
         * @throws std::invalid_argument if the resulting config is invalid
         */
        static OptimizerConfig from_json(const nlohmann::json &j);

        /**
         * @brief Convert to JSON
         */
        nlohmann::json to_json() const;
    };

} // namespace allocation
