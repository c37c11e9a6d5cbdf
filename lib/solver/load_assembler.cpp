#include "solver/load_assembler.hpp"

Eigen::Vector2d solver::load_assembler::buildLocalLoad(const ScalarFunction& f, double x0, double x1) const{
    Eigen::Vector2d floc;

    floc(0) = quadrature_.integrate_phi0(f, x0, x1);
    floc(1) = quadrature_.integrate_phi1(f, x0, x1);

    return floc;
}

solver::load_assembler::ElementalLoadFunction solver::load_assembler::defaultElementalLoad() const{
    utils::integration quadrature = quadrature_;
    return [quadrature](const ScalarFunction& f, double x0, double x1){
        Eigen::Vector2d floc;
        floc(0) = quadrature.integrate_phi0(f, x0, x1);
        floc(1) = quadrature.integrate_phi1(f, x0, x1);
        return floc;
    };
}

int solver::load_assembler::minNodes() const{
    // interior coverage skips both boundary-adjacent elements
    return coverage_ == LoadCoverage::InteriorElements ? 4 : 3;
}

void solver::load_assembler::checkShape(const Eigen::VectorXd& X, int M) const{
    if (M < minNodes()) {
        throw utils::InvalidMeshError("load assembly needs at least " + std::to_string(minNodes())
                                      + " nodes, got " + std::to_string(M));
    }
    if (X.size() != M) {
        throw utils::DimensionMismatchError("expected " + std::to_string(M) + " grid points, got "
                                            + std::to_string(X.size()));
    }
    mesh::interval::validate(X, minNodes());
}

Eigen::VectorXd solver::load_assembler::buildGlobalLoad(
    const ScalarFunction& f,
    const Eigen::VectorXd& X,
    int M,
    const ElementalLoadFunction& elemental_load
) const{
    checkShape(X, M);

    Eigen::VectorXd fb = Eigen::VectorXd::Zero(M);

    int first = 0;
    int last = M - 2;
    if (coverage_ == LoadCoverage::InteriorElements) {
        first = 1;
        last = M - 3;
    }

    if (debug_) {
        std::cout << "Number of nodes: " << M << std::endl;
        std::cout << "Loaded elements: " << first << " to " << last << std::endl;
    }

    for(int i=first; i<=last; i++){
        Eigen::VectorXd floc = elemental_load(f, X(i), X(i+1));
        utils::operations::assembleVector(fb, floc, utils::operations::getElementIndices(i));
    }

    return fb;
}

Eigen::VectorXd solver::load_assembler::applyDBCVec(Eigen::VectorXd F, const Eigen::VectorXd& X, double g0, double g1) const{
    const int M = static_cast<int>(F.size());
    if (M < 3 || X.size() != M) {
        throw utils::DimensionMismatchError("boundary correction needs matching F and X with at least 3 entries");
    }

    // known Dirichlet values enter the first and last interior equations
    F(1) += g0 / (X(1) - X(0));
    F(M-2) += g1 / (X(M-1) - X(M-2));

    return F;
}

Eigen::VectorXd solver::load_assembler::restrictToInterior(const Eigen::VectorXd& F){
    if (F.size() < 2) {
        throw utils::DimensionMismatchError("cannot drop boundary entries of a vector with fewer than 2 entries");
    }
    return F.segment(1, F.size() - 2);
}

Eigen::VectorXd solver::load_assembler::assemble(
    const ScalarFunction& f,
    const Eigen::VectorXd& X,
    int M,
    double g0,
    double g1
) const{
    return assemble(f, X, M, g0, g1, defaultElementalLoad());
}

Eigen::VectorXd solver::load_assembler::assemble(
    const ScalarFunction& f,
    const Eigen::VectorXd& X,
    int M,
    double g0,
    double g1,
    const ElementalLoadFunction& elemental_load
) const{
    if (!elemental_load) {
        throw std::invalid_argument("Elemental load strategy is empty");
    }
    Eigen::VectorXd F = buildGlobalLoad(f, X, M, elemental_load);
    F = applyDBCVec(F, X, g0, g1);
    return restrictToInterior(F);
}

Eigen::Vector2d solver::load_assembler::elemental_load_non_smooth(
    const Coefficients& coeffs,
    const ScalarFunction& u,
    double x0,
    double x1
){
    const double alpha = coeffs.alpha;
    const double b = coeffs.b;
    const double c = coeffs.c;
    const double h = x1 - x0;

    double u0 = u(x0);
    if (!std::isfinite(u0)) {
        throw utils::IntegrandEvaluationError("non-finite value", x0);
    }
    double u1 = u(x1);
    if (!std::isfinite(u1)) {
        throw utils::IntegrandEvaluationError("non-finite value", x1);
    }

    // exact integral of alpha u' φ'
    double A = alpha * (u1 - u0) / h;

    Eigen::Vector2d floc;

    floc(0) = utils::integration::gaussian_quad([&](double x){
        double ux = u(x);
        return b*ux/h + c*ux*utils::operations::hat_down(x, x0, x1);
    }, x0, x1) - A;

    floc(1) = utils::integration::gaussian_quad([&](double x){
        double ux = u(x);
        return -b*ux/h + c*ux*utils::operations::hat_up(x, x0, x1);
    }, x0, x1) + A;

    return floc;
}

solver::load_assembler::ElementalLoadFunction solver::load_assembler::non_smooth_strategy(const Coefficients& coeffs){
    return [coeffs](const ScalarFunction& u, double x0, double x1){
        return elemental_load_non_smooth(coeffs, u, x0, x1);
    };
}

Eigen::VectorXd solver::assemble_load_vector(
    const ScalarFunction& f,
    const Eigen::VectorXd& X,
    int M,
    double g0,
    double g1
){
    load_assembler assembler;
    return assembler.assemble(f, X, M, g0, g1);
}
