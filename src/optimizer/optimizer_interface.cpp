/**
 * @file optimizer_interface.cpp
 * @brief Implementation of optimizer interface and common structures
 */

#include "optimizer/optimizer_interface.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        // ============================================================================
        // OptimizationMethod
        // ============================================================================

        std::string to_string(OptimizationMethod method)
        {
            switch (method)
            {
            case OptimizationMethod::MAX_SHARPE:
                return "max_sharpe";
            case OptimizationMethod::MEAN_VARIANCE:
                return "mean_variance";
            case OptimizationMethod::BLACK_LITTERMAN:
                return "black_litterman";
            case OptimizationMethod::RISK_PARITY:
                return "risk_parity";
            case OptimizationMethod::EQUAL_RISK_CONTRIBUTION:
                return "equal_risk_contribution";
            }
            return "max_sharpe";
        }

        OptimizationMethod method_from_string(const std::string &name)
        {
            std::string key = name;
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            if (key == "mean_variance" || key == "min_variance")
                return OptimizationMethod::MEAN_VARIANCE;
            if (key == "black_litterman")
                return OptimizationMethod::BLACK_LITTERMAN;
            if (key == "risk_parity")
                return OptimizationMethod::RISK_PARITY;
            if (key == "equal_risk_contribution")
                return OptimizationMethod::EQUAL_RISK_CONTRIBUTION;

            return OptimizationMethod::MAX_SHARPE;
        }

        // ============================================================================
        // OptimizationConstraints Implementation
        // ============================================================================

        void OptimizationConstraints::validate() const
        {
            if (min_weight < 0.0)
            {
                throw std::invalid_argument(
                    "min_weight must be non-negative, got: " + std::to_string(min_weight));
            }

            if (max_weight <= 0.0 || max_weight > 1.0)
            {
                throw std::invalid_argument(
                    "max_weight must be in (0, 1], got: " + std::to_string(max_weight));
            }

            if (min_weight > max_weight)
            {
                throw std::invalid_argument(
                    "min_weight (" + std::to_string(min_weight) +
                    ") cannot exceed max_weight (" + std::to_string(max_weight) + ")");
            }

            if (target_return && !std::isfinite(*target_return))
            {
                throw std::invalid_argument("target_return must be finite");
            }
        }

        bool OptimizationConstraints::is_feasible(Eigen::Index n_assets) const
        {
            const double n = static_cast<double>(n_assets);
            return n_assets > 0 && n * min_weight <= 1.0 + 1e-12 && n * max_weight >= 1.0 - 1e-12;
        }

        // ============================================================================
        // WeightSolution Implementation
        // ============================================================================

        WeightSolution::WeightSolution()
            : expected_return(0.0),
              volatility(0.0),
              sharpe_ratio(0.0),
              objective_value(0.0),
              iterations(0),
              converged(false),
              method(OptimizationMethod::MAX_SHARPE)
        {
        }

        // ============================================================================
        // OptimizerInterface Static Methods
        // ============================================================================

        void OptimizerInterface::validate_inputs(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance)
        {
            if (expected_returns.size() == 0)
            {
                throw std::invalid_argument("Expected returns vector is empty");
            }

            if (covariance.rows() == 0 || covariance.cols() == 0)
            {
                throw std::invalid_argument("Covariance matrix is empty");
            }

            if (expected_returns.size() != covariance.rows() ||
                expected_returns.size() != covariance.cols())
            {
                throw std::invalid_argument(
                    "Dimension mismatch: expected returns size (" +
                    std::to_string(expected_returns.size()) +
                    ") does not match covariance dimensions (" +
                    std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) + ")");
            }

            if (!expected_returns.allFinite())
            {
                throw std::invalid_argument("Expected returns contain NaN or Inf values");
            }

            if (!covariance.allFinite())
            {
                throw std::invalid_argument("Covariance matrix contains NaN or Inf values");
            }

            double asymmetry = (covariance - covariance.transpose()).cwiseAbs().maxCoeff();
            if (asymmetry > 1e-8)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not symmetric (max asymmetry: " +
                    std::to_string(asymmetry) + ")");
            }
        }

        bool OptimizerInterface::check_constraints(
            const Eigen::VectorXd &weights,
            const OptimizationConstraints &constraints,
            double tolerance)
        {
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (weights(i) < constraints.min_weight - tolerance ||
                    weights(i) > constraints.max_weight + tolerance)
                {
                    return false;
                }
            }

            return std::abs(weights.sum() - 1.0) <= tolerance;
        }

        void OptimizerInterface::calculate_statistics(
            WeightSolution &solution,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate)
        {
            const Eigen::VectorXd &w = solution.weights;

            solution.expected_return = w.dot(expected_returns);

            double variance = w.dot(covariance * w);
            solution.volatility = std::sqrt(std::max(0.0, variance));

            solution.sharpe_ratio = solution.volatility > 0.0
                                        ? (solution.expected_return - risk_free_rate) / solution.volatility
                                        : 0.0;
        }

    } // namespace optimizer
} // namespace allocation
