/**
 * @file risk_metrics.cpp
 * @brief Implementation of RiskMetricsCalculator
 */

#include "analytics/risk_metrics.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace allocation
{
    namespace analytics
    {

        namespace
        {

            double mean_of(const std::vector<double> &values)
            {
                if (values.empty())
                {
                    return 0.0;
                }
                return std::accumulate(values.begin(), values.end(), 0.0) /
                       static_cast<double>(values.size());
            }

            /**
             * @brief Standard deviation with the given delta degrees of freedom
             */
            double std_of(const std::vector<double> &values, int ddof)
            {
                const int n = static_cast<int>(values.size());
                if (n - ddof <= 0)
                {
                    return 0.0;
                }

                const double mean = mean_of(values);
                double sum_sq = 0.0;
                for (double v : values)
                {
                    sum_sq += (v - mean) * (v - mean);
                }
                return std::sqrt(sum_sq / static_cast<double>(n - ddof));
            }

            /**
             * @brief Central moment of the given order (population)
             */
            double central_moment(const std::vector<double> &values, double mean, int order)
            {
                double sum = 0.0;
                for (double v : values)
                {
                    sum += std::pow(v - mean, order);
                }
                return sum / static_cast<double>(values.size());
            }

            double tail_mean(const std::vector<double> &values, double threshold)
            {
                double sum = 0.0;
                int count = 0;
                for (double v : values)
                {
                    if (v <= threshold)
                    {
                        sum += v;
                        ++count;
                    }
                }
                return count > 0 ? sum / static_cast<double>(count) : threshold;
            }

        } // namespace

        // ============================================================================
        // RiskMetrics
        // ============================================================================

        nlohmann::json RiskMetrics::to_json() const
        {
            return nlohmann::json{
                {"var_95", var_95},
                {"var_99", var_99},
                {"cvar_95", cvar_95},
                {"cvar_99", cvar_99},
                {"max_drawdown", max_drawdown},
                {"sharpe_ratio", sharpe_ratio},
                {"sortino_ratio", sortino_ratio},
                {"calmar_ratio", calmar_ratio},
                {"information_ratio", information_ratio},
                {"treynor_ratio", treynor_ratio},
                {"jensen_alpha", jensen_alpha},
                {"beta", beta},
                {"volatility", volatility},
                {"skewness", skewness},
                {"kurtosis", kurtosis}};
        }

        // ============================================================================
        // RiskMetricsCalculator
        // ============================================================================

        RiskMetricsCalculator::RiskMetricsCalculator(const OptimizerConfig &config)
            : risk_free_rate_(config.risk_free_rate),
              trading_days_per_year_(config.trading_days_per_year)
        {
        }

        RiskMetrics RiskMetricsCalculator::calculate(const Eigen::VectorXd &weights,
                                                     const Eigen::MatrixXd &return_matrix,
                                                     const std::vector<double> &benchmark) const
        {
            if (weights.size() != return_matrix.rows())
            {
                throw std::invalid_argument(
                    "Weight count (" + std::to_string(weights.size()) +
                    ") does not match return matrix rows (" + std::to_string(return_matrix.rows()) + ")");
            }

            if (!weights.allFinite() || !return_matrix.allFinite())
            {
                throw std::invalid_argument("Weights or returns contain NaN or Inf values");
            }

            Eigen::VectorXd series = return_matrix.transpose() * weights;
            std::vector<double> portfolio_returns(series.data(), series.data() + series.size());

            return calculate_from_series(portfolio_returns, benchmark);
        }

        RiskMetrics RiskMetricsCalculator::calculate_from_series(const std::vector<double> &portfolio_returns,
                                                                 const std::vector<double> &benchmark) const
        {
            RiskMetrics metrics;
            if (portfolio_returns.empty())
            {
                return metrics;
            }

            metrics.var_95 = percentile(portfolio_returns, 5.0);
            metrics.var_99 = percentile(portfolio_returns, 1.0);
            metrics.cvar_95 = tail_mean(portfolio_returns, metrics.var_95);
            metrics.cvar_99 = tail_mean(portfolio_returns, metrics.var_99);

            metrics.max_drawdown = max_drawdown(portfolio_returns);

            const double mean = mean_of(portfolio_returns);
            const double std_dev = std_of(portfolio_returns, 0);

            metrics.sharpe_ratio = std_dev > 0.0 ? (mean - risk_free_rate_) / std_dev : 0.0;

            std::vector<double> downside;
            for (double r : portfolio_returns)
            {
                if (r < 0.0)
                {
                    downside.push_back(r);
                }
            }
            const double downside_std = downside.empty() ? 0.0 : std_of(downside, 0);
            metrics.sortino_ratio = downside_std > 0.0 ? (mean - risk_free_rate_) / downside_std : 0.0;

            metrics.calmar_ratio = metrics.max_drawdown != 0.0 ? mean / std::abs(metrics.max_drawdown) : 0.0;

            metrics.volatility = std_dev * std::sqrt(static_cast<double>(trading_days_per_year_));
            metrics.skewness = skewness(portfolio_returns);
            metrics.kurtosis = kurtosis(portfolio_returns);

            if (!benchmark.empty())
            {
                apply_benchmark(metrics, portfolio_returns, benchmark);
            }

            return metrics;
        }

        void RiskMetricsCalculator::apply_benchmark(RiskMetrics &metrics,
                                                    const std::vector<double> &portfolio_returns,
                                                    const std::vector<double> &benchmark) const
        {
            // Align on the most recent common observations
            const size_t n = std::min(portfolio_returns.size(), benchmark.size());
            if (n < 2)
            {
                return;
            }

            std::vector<double> port(portfolio_returns.end() - static_cast<std::ptrdiff_t>(n),
                                     portfolio_returns.end());
            std::vector<double> bench(benchmark.end() - static_cast<std::ptrdiff_t>(n), benchmark.end());

            for (double b : bench)
            {
                if (!std::isfinite(b))
                {
                    throw std::invalid_argument("Benchmark returns contain NaN or Inf values");
                }
            }

            const double port_mean = mean_of(port);
            const double bench_mean = mean_of(bench);

            double covariance = 0.0;
            double bench_var = 0.0;
            for (size_t i = 0; i < n; ++i)
            {
                covariance += (port[i] - port_mean) * (bench[i] - bench_mean);
                bench_var += (bench[i] - bench_mean) * (bench[i] - bench_mean);
            }
            covariance /= static_cast<double>(n - 1);
            bench_var /= static_cast<double>(n - 1);

            metrics.beta = bench_var > 0.0 ? covariance / bench_var : 1.0;

            std::vector<double> active(n);
            for (size_t i = 0; i < n; ++i)
            {
                active[i] = port[i] - bench[i];
            }
            const double tracking_error = std_of(active, 1);
            metrics.information_ratio = tracking_error > 0.0 ? mean_of(active) / tracking_error : 0.0;

            const double daily_rf = risk_free_rate_ / static_cast<double>(trading_days_per_year_);
            metrics.treynor_ratio = metrics.beta != 0.0 ? (port_mean - daily_rf) / metrics.beta : 0.0;

            // OLS intercept of excess portfolio returns on excess benchmark returns
            metrics.jensen_alpha = (port_mean - daily_rf) - metrics.beta * (bench_mean - daily_rf);
        }

        double RiskMetricsCalculator::percentile(std::vector<double> values, double percent)
        {
            if (values.empty())
            {
                throw std::invalid_argument("Cannot compute percentile of an empty series");
            }

            if (percent < 0.0 || percent > 100.0)
            {
                throw std::invalid_argument("Percentile must be in [0, 100], got: " + std::to_string(percent));
            }

            std::sort(values.begin(), values.end());

            const double index = percent / 100.0 * static_cast<double>(values.size() - 1);
            const size_t lower = static_cast<size_t>(std::floor(index));
            const size_t upper = static_cast<size_t>(std::ceil(index));

            if (lower == upper || upper >= values.size())
            {
                return values[lower];
            }

            const double frac = index - static_cast<double>(lower);
            return values[lower] * (1.0 - frac) + values[upper] * frac;
        }

        double RiskMetricsCalculator::max_drawdown(const std::vector<double> &returns)
        {
            double equity = 1.0;
            double running_max = -std::numeric_limits<double>::infinity();
            double worst = 0.0;

            for (double r : returns)
            {
                equity *= (1.0 + r);
                running_max = std::max(running_max, equity);

                if (running_max != 0.0)
                {
                    worst = std::min(worst, (equity - running_max) / running_max);
                }
            }

            return worst;
        }

        double RiskMetricsCalculator::skewness(const std::vector<double> &returns)
        {
            if (returns.empty())
            {
                return 0.0;
            }

            const double mean = mean_of(returns);
            const double m2 = central_moment(returns, mean, 2);
            if (m2 == 0.0)
            {
                return 0.0;
            }

            const double value = central_moment(returns, mean, 3) / std::pow(m2, 1.5);
            return std::isfinite(value) ? value : 0.0;
        }

        double RiskMetricsCalculator::kurtosis(const std::vector<double> &returns)
        {
            if (returns.empty())
            {
                return 0.0;
            }

            const double mean = mean_of(returns);
            const double m2 = central_moment(returns, mean, 2);
            if (m2 == 0.0)
            {
                return 0.0;
            }

            const double value = central_moment(returns, mean, 4) / (m2 * m2) - 3.0;
            return std::isfinite(value) ? value : 0.0;
        }

    } // namespace analytics
} // namespace allocation
