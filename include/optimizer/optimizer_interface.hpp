/**
 * @file optimizer_interface.hpp
 * @brief Abstract interface for portfolio weight optimizers
 *
 * Provides the constraint shape, the optimization-method enumeration and the
 * raw solution record shared by every objective profile.
 *
 * Design follows the RiskModel pattern from the risk layer.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @enum OptimizationMethod
         * @brief Mutually exclusive objective profiles
         */
        enum class OptimizationMethod
        {
            MAX_SHARPE,             ///< Maximize (w^T mu - r_f) / sqrt(w^T Sigma w)
            MEAN_VARIANCE,          ///< Minimize w^T Sigma w, optional target return
            BLACK_LITTERMAN,        ///< Max-Sharpe on simplified Black-Litterman returns
            RISK_PARITY,            ///< Closed form w_i proportional to 1 / sigma_i
            EQUAL_RISK_CONTRIBUTION ///< Minimize dispersion of risk contributions
        };

        /**
         * @brief Canonical lowercase name ("max_sharpe", "mean_variance", ...)
         */
        std::string to_string(OptimizationMethod method);

        /**
         * @brief Parse a method name
         *
         * "min_variance" is accepted as an alias of mean_variance. Unknown
         * names fall back to MAX_SHARPE.
         */
        OptimizationMethod method_from_string(const std::string &name);

        /**
         * @struct OptimizationConstraints
         * @brief Container for portfolio constraints
         *
         * Every objective shares: sum(w) = 1 and min_weight <= w_i <= max_weight.
         */
        struct OptimizationConstraints
        {
            double min_weight = 0.01;            ///< Minimum asset weight
            double max_weight = 0.20;            ///< Maximum asset weight
            std::optional<double> target_return; ///< Mean-variance equality w^T mu = target

            /**
             * @brief Validate constraints
             * @throws std::invalid_argument if constraints are inconsistent
             */
            void validate() const;

            /**
             * @brief True when n assets can satisfy the bounds and sum to one
             */
            bool is_feasible(Eigen::Index n_assets) const;
        };

        /**
         * @struct WeightSolution
         * @brief Raw output of a weight optimizer, before post-processing
         */
        struct WeightSolution
        {
            Eigen::VectorXd weights;        ///< Solver weights (universe order)
            Eigen::VectorXd return_vector;  ///< Expected returns that drove the solve
            double expected_return;         ///< w^T mu
            double volatility;              ///< sqrt(w^T Sigma w)
            double sharpe_ratio;            ///< (return - r_f) / volatility, 0 if volatility is 0
            double objective_value;         ///< Final objective value
            int iterations;                 ///< Solver iterations
            bool converged;                 ///< Solver reported success
            std::string message;            ///< Status message
            OptimizationMethod method;      ///< Objective profile used

            WeightSolution();
        };

        /**
         * @class OptimizerInterface
         * @brief Abstract base class for portfolio weight optimizers
         *
         * Usage Example:
         * @code
         * auto optimizer = std::make_unique<WeightOptimizer>(OptimizationMethod::MAX_SHARPE, config);
         * WeightSolution solution = optimizer->optimize(mu, covariance, constraints);
         * @endcode
         */
        class OptimizerInterface
        {
        public:
            virtual ~OptimizerInterface() = default;

            /**
             * @brief Optimize portfolio weights
             * @param expected_returns Expected returns for each asset (N x 1)
             * @param covariance Covariance matrix (N x N)
             * @param constraints Portfolio constraints
             * @return Raw solution; non-convergence is reported, not thrown
             * @throws std::invalid_argument if inputs are invalid
             */
            virtual WeightSolution optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const = 0;

            /**
             * @brief Get optimizer name
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Get optimizer parameters as JSON
             */
            virtual nlohmann::json get_parameters() const = 0;

            /**
             * @brief Validate input data
             * @throws std::invalid_argument on empty, mismatched, non-finite or
             *         asymmetric inputs
             */
            static void validate_inputs(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance);

            /**
             * @brief Check if weights satisfy constraints
             */
            static bool check_constraints(
                const Eigen::VectorXd &weights,
                const OptimizationConstraints &constraints,
                double tolerance = 1e-6);

            /**
             * @brief Fill return, volatility and Sharpe ratio for the given weights
             */
            static void calculate_statistics(
                WeightSolution &solution,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double risk_free_rate);
        };

    } // namespace optimizer
} // namespace allocation
