#include "mesh/interval.hpp"

/**
 * Discretize [start, end] by receiving the number of desired elements.
 * Grid points are computed from their index so the last one matches end exactly.
 */
void mesh::interval::uniformDisc(double start, double end, int num_elements){
    if (num_elements < 1) {
        throw utils::InvalidMeshError("number of elements must be at least 1, got " + std::to_string(num_elements));
    }
    if (!(end > start)) {
        throw utils::InvalidMeshError("domain end must be greater than its start");
    }

    nodes = Eigen::VectorXd::Zero(num_elements+1);

    // mesh increment
    double inc = (end - start) / num_elements;

    for(int i=0; i<num_elements; i++){
        nodes(i) = start + i * inc;
    }
    nodes(num_elements) = end;

    if (debug_) {
        std::cout << "Uniform mesh created:" << std::endl;
        std::cout << "  Nodes: " << nodes.size() << std::endl;
        std::cout << "  Elements: " << num_elements << std::endl;
        std::cout << "  Element size h = " << std::fixed << std::setprecision(6) << inc << std::defaultfloat << std::endl;
    }
}

void mesh::interval::setNodes(const Eigen::VectorXd& coordinates){
    validate(coordinates);
    nodes = coordinates;

    if (debug_) {
        std::cout << "Mesh with " << nodes.size() << " nodes on ["
                  << nodes(0) << ", " << nodes(nodes.size()-1) << "]" << std::endl;
    }
}

void mesh::interval::setNodes(const std::vector<double>& coordinates){
    setNodes(Eigen::VectorXd(Eigen::Map<const Eigen::VectorXd>(coordinates.data(), static_cast<Eigen::Index>(coordinates.size()))));
}

Eigen::VectorXd mesh::interval::widths() const{
    return utils::operations::calcElementWidths(nodes);
}

void mesh::interval::validate(const Eigen::VectorXd& X, int min_nodes){
    if (X.size() < min_nodes) {
        throw utils::InvalidMeshError("at least " + std::to_string(min_nodes) + " nodes required, got "
                                      + std::to_string(X.size()));
    }
    for (int i=0; i<X.size(); i++) {
        if (!std::isfinite(X(i))) {
            throw utils::InvalidMeshError("node " + std::to_string(i) + " is not finite");
        }
        if (i > 0 && !(X(i) > X(i-1))) {
            throw utils::InvalidMeshError("nodes must be strictly increasing (node " + std::to_string(i) + ")");
        }
    }
}
