/**
 * @file quadratic_solver.hpp
 * @brief Solver-agnostic quadratic program and the solver strategy interface
 *
 * Solves problems of the form:
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq                    (equality constraints)
 *               b_lower <= A_ineq * x <= b_upper   (two-sided inequality rows)
 *               l <= x <= u                         (box constraints)
 *
 * The allocation model builds a QuadraticProblem and hands it to any
 * QuadraticSolverInterface implementation; nothing above this header
 * knows which solver runs.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace advisor
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem specification
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N), symmetric PSD
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix
            Eigen::VectorXd b_eq; ///< Equality constraint values

            Eigen::MatrixXd A_ineq;       ///< Inequality constraint matrix
            Eigen::VectorXd b_ineq_lower; ///< Inequality lower bounds (for A_ineq * x)
            Eigen::VectorXd b_ineq_upper; ///< Inequality upper bounds (for A_ineq * x)

            Eigen::VectorXd lower_bounds; ///< Lower bounds
            Eigen::VectorXd upper_bounds; ///< Upper bounds

            QuadraticProblem() = default;

            size_t num_variables() const { return static_cast<size_t>(q.size()); }

            /**
             * @brief Validate problem specification
             * @throws ValidationError if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct SolverOptions
         * @brief Options for quadratic solver
         */
        struct SolverOptions
        {
            int max_iterations = 10000;      ///< Maximum iterations
            double tolerance = 1e-7;         ///< Absolute and relative convergence tolerance
            double time_limit_seconds = 5.0; ///< Wall-clock bound on one solve (0 = none)
            bool polish = true;              ///< Refine the solution on the active set
            bool verbose = false;            ///< Print solver progress
        };

        /**
         * @enum SolverStatus
         * @brief Solver-independent outcome of a solve
         */
        enum class SolverStatus
        {
            SOLVED,
            SOLVED_INACCURATE,
            PRIMAL_INFEASIBLE,
            DUAL_INFEASIBLE,
            MAX_ITERATIONS,
            TIME_LIMIT,
            NON_CONVEX,
            SETUP_FAILED,
            UNKNOWN
        };

        std::string to_string(SolverStatus status);

        /**
         * @struct SolverResult
         * @brief Result from quadratic solver
         */
        struct SolverResult
        {
            Eigen::VectorXd solution;                    ///< Primal solution (valid when success)
            double objective_value = 0.0;                ///< Final objective value
            bool success = false;                        ///< Usable solution produced
            SolverStatus status = SolverStatus::UNKNOWN; ///< Detailed outcome
            int iterations = 0;                          ///< Number of iterations
            double solve_time_seconds = 0.0;             ///< Wall-clock time reported by the solver
            std::string message;                         ///< Solver status text

            /// A larger budget or looser tolerance may succeed
            bool is_retryable() const
            {
                return status == SolverStatus::MAX_ITERATIONS ||
                       status == SolverStatus::TIME_LIMIT ||
                       status == SolverStatus::SOLVED_INACCURATE ||
                       status == SolverStatus::UNKNOWN;
            }
        };

        /**
         * @class QuadraticSolverInterface
         * @brief Strategy boundary: any convex QP solver
         *
         * Implementations must be deterministic for identical inputs and
         * safe to call concurrently on distinct problems.
         */
        class QuadraticSolverInterface
        {
        public:
            virtual ~QuadraticSolverInterface() = default;

            /**
             * @brief Solve a quadratic program
             * @param problem Validated problem
             * @param options Tolerance, iteration and time budget
             * @return Result; failures are reported through status, not exceptions
             * @throws ValidationError if the problem is ill-formed
             */
            virtual SolverResult solve(const QuadraticProblem &problem,
                                       const SolverOptions &options) const = 0;

            virtual std::string get_name() const = 0;
        };

    } // namespace optimizer
} // namespace advisor
