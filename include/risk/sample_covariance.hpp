/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator
 *
 * Formula (with bias correction):
 *     Cov = (1/(n-1)) * (X - mean(X))^T * (X - mean(X))
 */

#pragma once

#include "risk_model.hpp"

namespace advisor
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Positive semidefinite in exact arithmetic; with fewer observations
         * than assets the matrix is singular and rounding can push the
         * smallest eigenvalue slightly below zero, which callers must check.
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @param bias_correction Divide by n-1 (default) instead of n
             */
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            /**
             * @brief Estimate covariance matrix
             * @param returns Matrix of returns (T x N: observations x assets)
             * @return Covariance matrix (N x N)
             * @throws DataError if returns is empty or has < 2 observations
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_;
        };

    } // namespace risk
} // namespace advisor
