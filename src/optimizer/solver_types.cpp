/**
 * @file solver_types.cpp
 * @brief Validation of solver problem structures
 */

#include "optimizer/solver_types.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        // ============================================================================
        // QuadraticProblem Implementation
        // ============================================================================

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();

            if (n == 0)
            {
                throw std::invalid_argument("Problem dimension is zero");
            }

            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument("P matrix dimensions do not match q vector");
            }

            if (!P.allFinite() || !q.allFinite())
            {
                throw std::invalid_argument("Objective terms contain NaN or Inf");
            }

            if (A_eq.rows() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument("A_eq columns do not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size does not match A_eq rows");
                }
                if (!A_eq.allFinite() || !b_eq.allFinite())
                {
                    throw std::invalid_argument("Equality constraints contain NaN or Inf");
                }
            }

            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw std::invalid_argument("Bounds size does not match problem dimension");
            }

            if (!lower_bounds.allFinite() || !upper_bounds.allFinite())
            {
                throw std::invalid_argument("Bounds contain NaN or Inf");
            }
        }

        // ============================================================================
        // NonlinearProblem Implementation
        // ============================================================================

        void NonlinearProblem::validate() const
        {
            const Eigen::Index n = initial_guess.size();

            if (n == 0)
            {
                throw std::invalid_argument("Problem dimension is zero");
            }

            if (!objective)
            {
                throw std::invalid_argument("Objective function is not set");
            }

            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw std::invalid_argument("Bounds size does not match problem dimension");
            }

            if (!lower_bounds.allFinite() || !upper_bounds.allFinite() || !initial_guess.allFinite())
            {
                throw std::invalid_argument("Bounds or initial guess contain NaN or Inf");
            }

            if ((lower_bounds.array() > upper_bounds.array()).any())
            {
                throw std::invalid_argument("Lower bound exceeds upper bound");
            }
        }

        bool NonlinearProblem::is_feasible() const
        {
            const double slack = 1e-12 * std::max(1.0, std::abs(budget));
            return lower_bounds.sum() <= budget + slack && upper_bounds.sum() >= budget - slack;
        }

        // ============================================================================
        // SolverResult Implementation
        // ============================================================================

        SolverResult::SolverResult()
            : objective_value(0.0),
              success(false),
              iterations(0)
        {
        }

    } // namespace optimizer
} // namespace allocation
