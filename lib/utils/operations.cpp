#include "utils/operations.hpp"

namespace utils {
    Eigen::VectorXd operations::calcElementWidths(const Eigen::VectorXd& nodes){
        if (nodes.size() < 2) {
            return Eigen::VectorXd::Zero(0);
        }
        Eigen::VectorXd H(nodes.size() - 1);
        for(int k=0; k<H.size(); k++){
            H(k) = nodes(k+1) - nodes(k);
        }
        return H;
    }

    void operations::assembleMatrix(Eigen::MatrixXd& K, const Eigen::MatrixXd& Kloc, const Eigen::VectorXi& indices){
        for(int i=0; i<Kloc.rows(); i++){
            for(int j=0; j<Kloc.cols(); j++){
                K(indices(i), indices(j)) += Kloc(i,j);
            }
        }
    }

    void operations::assembleVector(Eigen::VectorXd& fb, const Eigen::VectorXd& floc, const Eigen::VectorXi& indices){
        for(int i=0; i<floc.rows(); i++){
            fb(indices(i)) += floc(i);
        }
    }

    double operations::evaluate_polynomial(const std::vector<double>& coefficients, double x){
        double value = 0.0;
        for (auto it = coefficients.rbegin(); it != coefficients.rend(); ++it) {
            value = value * x + *it;
        }
        return value;
    }
}
