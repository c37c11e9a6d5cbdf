/**
 * @file load_assembler.hpp
 * @brief Defines the load vector assembler for 1D linear elements
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef FEM1D_SOLVER_LOAD_ASSEMBLER_HPP
#define FEM1D_SOLVER_LOAD_ASSEMBLER_HPP

#include <functional>
#include <iostream>
#include <cmath>
#include <string>

#include <Eigen/Dense>

#include "models/enums.hpp"
#include "models/templates.hpp"
#include "mesh/interval.hpp"
#include "utils/exceptions.hpp"
#include "utils/integration.hpp"
#include "utils/operations.hpp"

namespace solver {

/**
 * @class load_assembler
 * @brief Right-hand side of the reduced Dirichlet system
 * 
 * Elemental load vectors are summed into a vector of length M, the Dirichlet
 * values are added at the first and last interior unknowns and the two
 * boundary entries are dropped.
 */
class load_assembler {
    public:
        /**
         * @brief Strategy producing the length-2 elemental load vector of [x0, x1]
         * 
         * Entry 0 belongs to the node at x0, entry 1 to the node at x1.
         */
        using ElementalLoadFunction = std::function<Eigen::Vector2d(const ScalarFunction&, double, double)>;

        load_assembler(
            const utils::integration& quadrature = utils::integration(),
            LoadCoverage coverage = LoadCoverage::InteriorElements,
            bool debug = false
        ) : quadrature_(quadrature), coverage_(coverage), debug_(debug) {}

        // build local load vector [∫ f φ0, ∫ f φ1] with the configured quadrature
        Eigen::Vector2d buildLocalLoad(const ScalarFunction& f, double x0, double x1) const;

        // default strategy, bound to a copy of this assembler's quadrature engine
        ElementalLoadFunction defaultElementalLoad() const;

        // build global load vector of length M, before boundary corrections
        Eigen::VectorXd buildGlobalLoad(
            const ScalarFunction& f,
            const Eigen::VectorXd& X,
            int M,
            const ElementalLoadFunction& elemental_load
        ) const;

        // apply Dirichlet boundary corrections in a vector of length M
        Eigen::VectorXd applyDBCVec(Eigen::VectorXd F, const Eigen::VectorXd& X, double g0, double g1) const;

        // drop the boundary entries, keeping the M-2 interior unknowns
        static Eigen::VectorXd restrictToInterior(const Eigen::VectorXd& F);

        /**
         * @brief Assemble the reduced load vector with the default elemental strategy
         * 
         * @param f Source term
         * @param X Grid points, size M
         * @param M Number of nodes
         * @param g0 Dirichlet value at X[0]
         * @param g1 Dirichlet value at X[M-1]
         * @return Load vector of length M-2
         * @throws utils::InvalidMeshError if M is below minNodes() or X is not strictly increasing
         * @throws utils::DimensionMismatchError if X.size() != M
         */
        Eigen::VectorXd assemble(
            const ScalarFunction& f,
            const Eigen::VectorXd& X,
            int M,
            double g0 = 0.0,
            double g1 = 0.0
        ) const;

        // same, with an explicitly injected elemental strategy
        Eigen::VectorXd assemble(
            const ScalarFunction& f,
            const Eigen::VectorXd& X,
            int M,
            double g0,
            double g1,
            const ElementalLoadFunction& elemental_load
        ) const;

        // smallest node count accepted with the current coverage
        int minNodes() const;

        LoadCoverage coverage() const { return coverage_; }
        const utils::integration& quadrature() const { return quadrature_; }

        // ============================================================================
        // NON-SMOOTH SOLUTION
        // ============================================================================

        /**
         * @brief Elemental load of a known solution part u
         * 
         * With h = x1 - x0 and A = alpha*(u(x1) - u(x0))/h, the exact diffusive flux:
         * 
         *   entry0 = ∫ (b*u/h + c*u*φ0) dx - A
         *   entry1 = ∫ (-b*u/h + c*u*φ1) dx + A
         * 
         * Integrals use the 2-point Gauss-Legendre rule.
         * 
         * @param coeffs Coefficients of the operator
         * @param u Known function on the element
         * @param x0 Left end of the element
         * @param x1 Right end of the element
         */
        static Eigen::Vector2d elemental_load_non_smooth(
            const Coefficients& coeffs,
            const ScalarFunction& u,
            double x0,
            double x1
        );

        // adapt elemental_load_non_smooth to the strategy signature
        static ElementalLoadFunction non_smooth_strategy(const Coefficients& coeffs);

    private:
        utils::integration quadrature_;
        LoadCoverage coverage_;
        bool debug_ = false;

        void checkShape(const Eigen::VectorXd& X, int M) const;
};

/**
 * @brief Assemble the reduced load vector with 2-point Gauss-Legendre and interior coverage
 */
Eigen::VectorXd assemble_load_vector(
    const ScalarFunction& f,
    const Eigen::VectorXd& X,
    int M,
    double g0 = 0.0,
    double g1 = 0.0
);

}

#endif
