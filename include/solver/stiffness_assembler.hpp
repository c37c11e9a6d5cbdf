/**
 * @file stiffness_assembler.hpp
 * @brief Defines the stiffness matrix assembler for 1D linear elements
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef FEM1D_SOLVER_STIFFNESS_ASSEMBLER_HPP
#define FEM1D_SOLVER_STIFFNESS_ASSEMBLER_HPP

#include <iostream>
#include <cmath>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include "models/templates.hpp"
#include "utils/exceptions.hpp"
#include "utils/operations.hpp"

namespace solver {

/**
 * @class stiffness_assembler
 * @brief Global system matrix of -alpha*u'' + b*u' + c*u with hat functions
 * 
 * Element-local 2x2 bilinear forms are summed into an M x M matrix and the
 * first and last rows are replaced by Dirichlet identity rows.
 */
class stiffness_assembler {
    public:
        // diffusion, advection and reaction coefficients
        Coefficients coefficients;

        stiffness_assembler(const Coefficients& coeffs, bool debug = false)
            : coefficients(coeffs), debug_(debug) {}

        // set diffusion, advection and reaction coefficients
        void setCoefficients(const Coefficients& coeffs);

        /**
         * @brief Build the local matrix of an element of width h
         * 
         * [ alpha/h + b/2 + c*h/3 ,  -alpha/h + b/2 + c*h/6 ]
         * [ -alpha/h - b/2 + c*h/6,  alpha/h - b/2 + c*h/3  ]
         */
        Eigen::Matrix2d buildLocalK(double h) const;

        // build global stiffness matrix, boundary rows untouched
        Eigen::MatrixXd buildGlobalK(const Eigen::VectorXd& H, int M) const;

        // apply Dirichlet boundary conditions in a matrix
        Eigen::MatrixXd applyDBCMatrix(Eigen::MatrixXd K) const;

        /**
         * @brief Assemble the M x M stiffness matrix with Dirichlet rows
         * 
         * @param H Element widths, size M-1
         * @param M Number of nodes
         * @throws utils::InvalidMeshError if M < 2 or a width is not positive
         * @throws utils::DimensionMismatchError if H.size() != M-1
         */
        Eigen::MatrixXd assemble(const Eigen::VectorXd& H, int M) const;

        // same operator in compressed sparse storage
        Eigen::SparseMatrix<double> assembleSparse(const Eigen::VectorXd& H, int M) const;

    private:
        bool debug_ = false;

        void checkShape(const Eigen::VectorXd& H, int M) const;
};

/**
 * @brief Assemble the stiffness matrix from scalar coefficients
 * 
 * @param alpha Diffusion coefficient
 * @param b Advection coefficient
 * @param c Reaction coefficient
 * @param H Element widths, size M-1
 * @param M Number of nodes
 */
Eigen::MatrixXd assemble_stiffness_matrix(double alpha, double b, double c, const Eigen::VectorXd& H, int M);

}

#endif
