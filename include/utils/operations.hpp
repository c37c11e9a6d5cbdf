#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef FEM1D_OPERATIONS_HPP
#define FEM1D_OPERATIONS_HPP

#include <cmath>
#include <iostream>
#include <vector>

#include <Eigen/Dense>

#include "models/enums.hpp"
#include "models/templates.hpp"



namespace utils {
    class operations{
    public:
        // ============================================================================
        // GEOMETRIC OPERATIONS
        // ============================================================================
        // calculate a segment length
        static double calcLength(double x0, double x1){
            return std::abs(x1 - x0);
        }

        // element widths H[k] = X[k+1] - X[k]
        static Eigen::VectorXd calcElementWidths(const Eigen::VectorXd& nodes);

        // ============================================================================
        // BASIS FUNCTIONS
        // ============================================================================

        // first half of the hat function, peak at x1
        static double hat_up(double x, double x0, double x1){
            return (x - x0) / (x1 - x0);
        }

        // last half of the hat function, peak at x0
        static double hat_down(double x, double x0, double x1){
            return (x1 - x) / (x1 - x0);
        }

        // ============================================================================
        // ASSEMBLY
        // ============================================================================

        // assemble a local matrix into the global matrix
        static void assembleMatrix(Eigen::MatrixXd& K, const Eigen::MatrixXd& Kloc, const Eigen::VectorXi& indices);

        // assemble a local vector into the global vector
        static void assembleVector(Eigen::VectorXd& fb, const Eigen::VectorXd& floc, const Eigen::VectorXi& indices);

        // global indices of element k in a linear 1D mesh
        static Eigen::VectorXi getElementIndices(int k){
            return (Eigen::Vector2i() << k, k + 1).finished();
        }

        // ============================================================================
        // POLYNOMIALS
        // ============================================================================

        // evaluate sum_i coefficients[i] * x^i (Horner)
        static double evaluate_polynomial(const std::vector<double>& coefficients, double x);
    };
}

#endif
