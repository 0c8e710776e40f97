/**
 * @file solver_types.hpp
 * @brief Problem, option and result structures shared by the solvers
 *
 * Two problem shapes are supported:
 *
 * Quadratic (solved by OSQPSolver):
 *     Minimize:     (1/2) * x^T * P * x + q^T * x
 *     Subject to:   A_eq * x = b_eq
 *                   l <= x <= u
 *
 * Smooth nonlinear (solved by ProjectedGradientSolver):
 *     Minimize:     f(x)
 *     Subject to:   sum(x) = budget
 *                   l <= x <= u
 */

#pragma once

#include <Eigen/Dense>
#include <functional>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem definition
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N)
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix
            Eigen::VectorXd b_eq; ///< Equality constraint values

            Eigen::VectorXd lower_bounds; ///< Lower bounds
            Eigen::VectorXd upper_bounds; ///< Upper bounds

            /**
             * @brief Validate problem dimensions and values
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct NonlinearProblem
         * @brief Smooth objective over the budget simplex with box bounds
         *
         * The objective may return -inf or +inf for points it wants the
         * solver to avoid; such points are never accepted as iterates.
         */
        struct NonlinearProblem
        {
            std::function<double(const Eigen::VectorXd &)> objective;
            std::function<Eigen::VectorXd(const Eigen::VectorXd &)> gradient; ///< Optional; central differences if empty

            Eigen::VectorXd lower_bounds;  ///< Lower bounds (N x 1)
            Eigen::VectorXd upper_bounds;  ///< Upper bounds (N x 1)
            double budget = 1.0;           ///< Required sum of x
            Eigen::VectorXd initial_guess; ///< Starting point (N x 1)

            /**
             * @brief Validate problem dimensions and values
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;

            /** @brief True when some x satisfies the bounds and the budget */
            bool is_feasible() const;
        };

        /**
         * @struct SolverOptions
         * @brief Options shared by both solvers
         */
        struct SolverOptions
        {
            int max_iterations = 1000; ///< Maximum iterations
            double tolerance = 1e-6;   ///< Convergence tolerance
            double step_size = 1.0;    ///< Initial step size (projected gradient only)
            bool verbose = false;      ///< Print progress
        };

        /**
         * @struct SolverResult
         * @brief Result from a solver
         */
        struct SolverResult
        {
            Eigen::VectorXd solution; ///< Final iterate
            double objective_value;   ///< Objective at the final iterate
            bool success;             ///< Convergence achieved
            int iterations;           ///< Number of iterations
            std::string message;      ///< Status message

            SolverResult();
        };

    } // namespace optimizer
} // namespace allocation
