/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library for the mean-variance objective.
 *
 * Problem formulation:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   A_eq x = b_eq    (equality constraints)
 *                lb <= x <= ub     (box constraints)
 */

#pragma once

#include "solver_types.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using the OSQP library
         *
         * Usage Example:
         * @code
         * SolverOptions options;
         * options.max_iterations = 1000;
         * OSQPSolver solver(options);
         *
         * QuadraticProblem problem = ...;
         * SolverResult result = solver.solve(problem);
         * @endcode
         *
         * Thread Safety: Each call to solve owns its OSQP workspace
         */
        class OSQPSolver
        {
        public:
            explicit OSQPSolver(const SolverOptions &options = SolverOptions());

            /**
             * @brief Solve quadratic programming problem
             * @return Solution with status, iterations and objective value.
             *         success is true for OSQP_SOLVED and OSQP_SOLVED_INACCURATE.
             * @throws std::invalid_argument if the problem is ill-formed
             */
            SolverResult solve(const QuadraticProblem &problem) const;

        private:
            SolverOptions options_; ///< Solver configuration

            /**
             * @brief Convert dense matrix to CSC (upper triangle only for P)
             */
            static void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only);

            /**
             * @brief Build A = [A_eq; I] with l = [b_eq; lb], u = [b_eq; ub]
             * @return Number of constraint rows (m)
             */
            static OSQPInt build_constraint_matrix(
                const QuadraticProblem &problem,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u);
        };

    } // namespace optimizer
} // namespace allocation
