/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library (v1 API) behind QuadraticSolverInterface.
 * OSQP (Operator Splitting Quadratic Program) is deterministic for a
 * given problem and settings, supports a wall-clock time limit, and
 * detects primal infeasibility, which the allocation model relies on.
 *
 * Problem formulation:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   l <= A x <= u
 * where A stacks the equality rows, the inequality rows and an identity
 * block for the variable bounds.
 */

#pragma once

#include "quadratic_solver.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace advisor
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using OSQP library
         *
         * Usage Example:
         * @code
         * OSQPSolver solver;
         * SolverOptions options;
         * options.tolerance = 1e-7;
         * options.time_limit_seconds = 2.0;
         *
         * QuadraticProblem problem = ...;
         * SolverResult result = solver.solve(problem, options);
         * if (!result.success && result.is_retryable()) { ... }
         * @endcode
         *
         * Thread Safety: solve() allocates its own OSQP workspace per call
         * and may run concurrently.
         */
        class OSQPSolver : public QuadraticSolverInterface
        {
        public:
            OSQPSolver() = default;
            ~OSQPSolver() override = default;

            /**
             * @brief Solve quadratic programming problem
             * @param problem QP problem specification
             * @param options Tolerance, iteration and time budget
             * @return Solution with status, iterations, and objective value
             * @throws ValidationError if the problem is ill-formed
             */
            SolverResult solve(const QuadraticProblem &problem,
                               const SolverOptions &options) const override;

            std::string get_name() const override { return "OSQP"; }

            /**
             * @brief Map an OSQP status_val to the solver-independent status
             */
            static SolverStatus map_status(OSQPInt status_val);

        private:
            /**
             * @brief Convert Eigen dense matrix to OSQP sparse CSC format
             * @param dense Dense matrix (Eigen)
             * @param data Output: non-zero values
             * @param indices Output: row indices
             * @param indptr Output: column pointers
             * @param upper_triangular_only Only store upper triangle (OSQP requires this for P)
             */
            static void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only = false);

            /**
             * @brief Build stacked constraint matrix [A_eq; A_ineq; I] and bounds
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
} // namespace advisor
