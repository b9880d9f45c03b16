/**
 * @file quadratic_solver.cpp
 * @brief QuadraticProblem validation and status names
 */

#include "optimizer/quadratic_solver.hpp"
#include "core/errors.hpp"

namespace advisor
{
    namespace optimizer
    {

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();

            if (n == 0)
            {
                throw ValidationError("Problem dimension is zero");
            }

            if (P.rows() != n || P.cols() != n)
            {
                throw ValidationError("P matrix dimensions do not match q vector");
            }

            if (!P.allFinite() || !q.allFinite())
            {
                throw ValidationError("Objective contains NaN or Inf");
            }

            if (A_eq.rows() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw ValidationError("A_eq columns do not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw ValidationError("b_eq size does not match A_eq rows");
                }
                if (!A_eq.allFinite() || !b_eq.allFinite())
                {
                    throw ValidationError("Equality constraints contain NaN or Inf");
                }
            }

            if (A_ineq.rows() > 0)
            {
                if (A_ineq.cols() != n)
                {
                    throw ValidationError("A_ineq columns do not match problem dimension");
                }
                if (b_ineq_lower.size() != A_ineq.rows() || b_ineq_upper.size() != A_ineq.rows())
                {
                    throw ValidationError("Inequality bounds do not match A_ineq rows");
                }
                if (!A_ineq.allFinite())
                {
                    throw ValidationError("Inequality constraints contain NaN or Inf");
                }
                for (Eigen::Index i = 0; i < A_ineq.rows(); ++i)
                {
                    if (b_ineq_lower(i) > b_ineq_upper(i))
                    {
                        throw ValidationError("Inequality row " + std::to_string(i) +
                                              " has lower bound above upper bound");
                    }
                }
            }

            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw ValidationError("Bound vectors do not match problem dimension");
            }
            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (lower_bounds(i) > upper_bounds(i))
                {
                    throw ValidationError("Lower bound exceeds upper bound for variable " + std::to_string(i));
                }
            }
        }

        std::string to_string(SolverStatus status)
        {
            switch (status)
            {
            case SolverStatus::SOLVED:
                return "solved";
            case SolverStatus::SOLVED_INACCURATE:
                return "solved inaccurate";
            case SolverStatus::PRIMAL_INFEASIBLE:
                return "primal infeasible";
            case SolverStatus::DUAL_INFEASIBLE:
                return "dual infeasible";
            case SolverStatus::MAX_ITERATIONS:
                return "maximum iterations reached";
            case SolverStatus::TIME_LIMIT:
                return "time limit reached";
            case SolverStatus::NON_CONVEX:
                return "problem non convex";
            case SolverStatus::SETUP_FAILED:
                return "setup failed";
            case SolverStatus::UNKNOWN:
                break;
            }
            return "unknown";
        }

    } // namespace optimizer
} // namespace advisor
