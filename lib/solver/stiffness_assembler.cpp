#include "solver/stiffness_assembler.hpp"

void solver::stiffness_assembler::setCoefficients(const Coefficients& coeffs){
    coefficients = coeffs;
}

Eigen::Matrix2d solver::stiffness_assembler::buildLocalK(double h) const{
    const double alpha = coefficients.alpha;
    const double b = coefficients.b;
    const double c = coefficients.c;

    Eigen::Matrix2d K;

    K(0,0) = alpha/h + b/2 + c*h/3;
    K(0,1) = -alpha/h + b/2 + c*h/6;
    K(1,0) = -alpha/h - b/2 + c*h/6;
    K(1,1) = alpha/h - b/2 + c*h/3;

    return K;
}

void solver::stiffness_assembler::checkShape(const Eigen::VectorXd& H, int M) const{
    if (M < 2) {
        throw utils::InvalidMeshError("stiffness assembly needs at least 2 nodes, got " + std::to_string(M));
    }
    if (H.size() != M - 1) {
        throw utils::DimensionMismatchError("expected " + std::to_string(M - 1) + " element widths, got "
                                            + std::to_string(H.size()));
    }
    for (int k=0; k<H.size(); k++) {
        if (!std::isfinite(H(k)) || H(k) <= 0.0) {
            throw utils::InvalidMeshError("element " + std::to_string(k) + " has non-positive width");
        }
    }
}

Eigen::MatrixXd solver::stiffness_assembler::buildGlobalK(const Eigen::VectorXd& H, int M) const{
    checkShape(H, M);

    if (debug_) {
        std::cout << "Number of degrees of freedom: " << M << std::endl;
    }

    Eigen::MatrixXd K = Eigen::MatrixXd::Zero(M, M);

    for(int k=0; k<M-1; k++){
        Eigen::Matrix2d Kloc = buildLocalK(H(k));
        utils::operations::assembleMatrix(K, Kloc, utils::operations::getElementIndices(k));
    }

    return K;
}

Eigen::MatrixXd solver::stiffness_assembler::applyDBCMatrix(Eigen::MatrixXd K) const{
    const int M = static_cast<int>(K.rows());
    if (M < 2 || K.cols() != M) {
        throw utils::DimensionMismatchError("Dirichlet rows need a square matrix with at least 2 rows");
    }

    // first row: u(X[0]) = g0
    K(0,0) = 1;
    K(0,1) = 0;

    // last row: u(X[M-1]) = g1
    K(M-1,M-1) = 1;
    K(M-1,M-2) = 0;

    return K;
}

Eigen::MatrixXd solver::stiffness_assembler::assemble(const Eigen::VectorXd& H, int M) const{
    return applyDBCMatrix(buildGlobalK(H, M));
}

Eigen::SparseMatrix<double> solver::stiffness_assembler::assembleSparse(const Eigen::VectorXd& H, int M) const{
    checkShape(H, M);

    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(4 * (M - 1));

    for(int k=0; k<M-1; k++){
        Eigen::Matrix2d Kloc = buildLocalK(H(k));
        for(int i=0; i<2; i++){
            for(int j=0; j<2; j++){
                triplets.emplace_back(k + i, k + j, Kloc(i,j));
            }
        }
    }

    Eigen::SparseMatrix<double> K(M, M);
    K.setFromTriplets(triplets.begin(), triplets.end());

    K.coeffRef(0,0) = 1;
    K.coeffRef(0,1) = 0;
    K.coeffRef(M-1,M-1) = 1;
    K.coeffRef(M-1,M-2) = 0;
    K.prune(0.0);
    K.makeCompressed();

    return K;
}

Eigen::MatrixXd solver::assemble_stiffness_matrix(double alpha, double b, double c, const Eigen::VectorXd& H, int M){
    stiffness_assembler assembler(Coefficients{alpha, b, c});
    return assembler.assemble(H, M);
}
