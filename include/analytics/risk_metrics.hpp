/**
 * @file risk_metrics.hpp
 * @brief Risk and risk-adjusted performance metrics for a weighted portfolio
 *
 * Computes, from a weight vector and an assets x observations return matrix:
 * historical VaR/CVaR (95%, 99%), maximum drawdown, Sharpe, Sortino and
 * Calmar ratios, annualized volatility, skewness and excess kurtosis.
 * Benchmark-relative metrics (beta, information ratio, Treynor ratio,
 * Jensen's alpha) are computed when a benchmark return series is supplied
 * and take neutral values (beta = 1, others 0) otherwise.
 *
 * VaR and CVaR are reported as signed returns (a loss is negative).
 */

#ifndef ALLOCATION_ANALYTICS_RISK_METRICS_HPP
#define ALLOCATION_ANALYTICS_RISK_METRICS_HPP

#include "core/config.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <vector>

namespace allocation
{
    namespace analytics
    {

        /**
         * @struct RiskMetrics
         * @brief Plain record of portfolio risk statistics
         */
        struct RiskMetrics
        {
            double var_95 = 0.0;            ///< 5th percentile of portfolio returns
            double var_99 = 0.0;            ///< 1st percentile of portfolio returns
            double cvar_95 = 0.0;           ///< Mean of returns <= var_95
            double cvar_99 = 0.0;           ///< Mean of returns <= var_99
            double max_drawdown = 0.0;      ///< Most negative (E - runmax(E)) / runmax(E)
            double sharpe_ratio = 0.0;
            double sortino_ratio = 0.0;
            double calmar_ratio = 0.0;
            double information_ratio = 0.0;
            double treynor_ratio = 0.0;
            double jensen_alpha = 0.0;
            double beta = 1.0;
            double volatility = 0.0;        ///< Annualized
            double skewness = 0.0;
            double kurtosis = 0.0;          ///< Excess kurtosis

            nlohmann::json to_json() const;
        };

        /**
         * @class RiskMetricsCalculator
         * @brief Stateless risk-metric computation
         *
         * Usage Example:
         * @code
         * RiskMetricsCalculator calculator(config);
         * RiskMetrics metrics = calculator.calculate(weights, return_matrix);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class RiskMetricsCalculator
        {
        public:
            explicit RiskMetricsCalculator(const OptimizerConfig &config = OptimizerConfig());

            /**
             * @brief Metrics of the portfolio series R^T * w
             * @param weights Portfolio weights (N x 1)
             * @param return_matrix Returns (N assets x T observations)
             * @param benchmark Optional benchmark return series
             * @throws std::invalid_argument if weights and matrix rows disagree
             */
            RiskMetrics calculate(const Eigen::VectorXd &weights,
                                  const Eigen::MatrixXd &return_matrix,
                                  const std::vector<double> &benchmark = {}) const;

            /**
             * @brief Metrics of an already aggregated portfolio return series
             *
             * An empty series yields the neutral RiskMetrics.
             */
            RiskMetrics calculate_from_series(const std::vector<double> &portfolio_returns,
                                              const std::vector<double> &benchmark = {}) const;

            /**
             * @brief Percentile with linear interpolation between closest ranks
             * @param percent Percentile in [0, 100]
             */
            static double percentile(std::vector<double> values, double percent);

            /**
             * @brief Minimum of (E - runmax(E)) / runmax(E) with E = cumprod(1 + r)
             */
            static double max_drawdown(const std::vector<double> &returns);

            /**
             * @brief Population skewness m3 / m2^1.5 (0 on degenerate input)
             */
            static double skewness(const std::vector<double> &returns);

            /**
             * @brief Population excess kurtosis m4 / m2^2 - 3 (0 on degenerate input)
             */
            static double kurtosis(const std::vector<double> &returns);

        private:
            double risk_free_rate_;
            int trading_days_per_year_;

            void apply_benchmark(RiskMetrics &metrics,
                                 const std::vector<double> &portfolio_returns,
                                 const std::vector<double> &benchmark) const;
        };

    } // namespace analytics
} // namespace allocation

#endif // ALLOCATION_ANALYTICS_RISK_METRICS_HPP
