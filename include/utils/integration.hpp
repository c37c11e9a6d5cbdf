#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef FEM1D_INTEGRATION_HPP
#define FEM1D_INTEGRATION_HPP

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "models/templates.hpp"
#include "utils/exceptions.hpp"
#include "utils/operations.hpp"

namespace utils {
    class integration{
        public:

        integration(const QuadratureSettings& settings = QuadratureSettings{}, bool debug = false);
        ~integration() = default;

        // ============================================================================
        // GENERAL INTEGRATION METHODS
        // ============================================================================

        /**
         * @brief Get Gauss-Legendre quadrature points and weights on [-1, 1]
         * 
         * @param n_points Number of points (1 to 5). An n-point rule is exact up to degree 2n-1
         * @param points Vector of quadrature points
         * @param weights Vector of quadrature weights
         */
        static void get_gauss_quadrature_rule(
            int n_points, 
            std::vector<double>& points, 
            std::vector<double>& weights
        );

        /**
         * @brief Reference 2-point Gauss-Legendre rule on [x0, x1]
         * 
         * q_i = 0.5(x1-x0)ksi_i + 0.5(x1+x0), result 0.5(x1-x0) * sum w_i g(q_i).
         * Exact for polynomials up to degree 3.
         * 
         * @param g Integrand
         * @param x0 Left end of the interval
         * @param x1 Right end of the interval
         * @return Value of the integral
         */
        static double gaussian_quad(const ScalarFunction& g, double x0, double x1);

        // n-point Gauss-Legendre rule on [x0, x1]
        static double gauss_legendre(const ScalarFunction& g, double x0, double x1, int n_points);

        // closed trapezoid rule, endpoint evaluations only
        static double trapezoid(const ScalarFunction& g, double x0, double x1);

        /**
         * @brief Adaptive bisection with a 2-point Gauss-Legendre rule
         * 
         * Each interval is accepted when the whole-interval estimate and the sum over
         * its two halves agree within max(local tolerance, relative_tolerance * |sum|).
         * The local tolerance is halved at each bisection level.
         * 
         * @param g Integrand
         * @param x0 Left end of the interval
         * @param x1 Right end of the interval
         * @param tolerance Absolute tolerance on the whole interval
         * @param max_depth Maximum number of bisection levels
         * @param relative_tolerance Tolerance relative to the local estimate
         * @return Value of the integral
         * @throws IntegrandEvaluationError if the tolerance is not reached within max_depth
         */
        static double adaptive(
            const ScalarFunction& g,
            double x0,
            double x1,
            double tolerance,
            int max_depth,
            double relative_tolerance = 1e-12
        );

        // integrate g on [x0, x1] with the configured rule
        double integrate(const ScalarFunction& g, double x0, double x1) const;

        // ============================================================================
        // BASIS FUNCTION INTEGRATION METHODS
        // ============================================================================

        /**
         * @brief Compute ∫_{x0}^{x1} f φ0 dx, φ0 = (x1-x)/(x1-x0) is 1 at x0
         */
        double integrate_phi0(const ScalarFunction& f, double x0, double x1) const;

        /**
         * @brief Compute ∫_{x0}^{x1} f φ1 dx, φ1 = (x-x0)/(x1-x0) is 1 at x1
         */
        double integrate_phi1(const ScalarFunction& f, double x0, double x1) const;

        const QuadratureSettings& settings() const { return settings_; }

        private:
            QuadratureSettings settings_;
            bool debug_ = false;

            // evaluate g and reject non-finite values
            static double evaluate(const ScalarFunction& g, double x);

            static double adaptive_step(
                const ScalarFunction& g,
                double a,
                double b,
                double whole,
                double tolerance,
                double relative_tolerance,
                int depth,
                int max_depth
            );
    };
}

#endif
