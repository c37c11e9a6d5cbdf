/**
 * @file interval.hpp
 * @brief Defines the interval class for 1D linear element meshes
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#ifndef FEM1D_MESH_INTERVAL_HPP
#define FEM1D_MESH_INTERVAL_HPP

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "utils/exceptions.hpp"
#include "utils/operations.hpp"


namespace mesh {

/**
 * @class interval
 * @brief Ordered grid points of a one-dimensional domain
 * 
 * M strictly increasing points X[0..M-1] define M-1 linear elements,
 * element k spanning [X[k], X[k+1]].
 */
class interval{
    public:
        /**
         * @brief Grid point coordinates
         */
        Eigen::VectorXd nodes;

        interval(bool debug = false) : debug_(debug) {}
        ~interval() = default;

        /**
         * @brief Discretize [start, end] with uniform elements
         * 
         * @param start Left end of the domain
         * @param end Right end of the domain
         * @param num_elements Number of elements in the mesh
         * @throws utils::InvalidMeshError if num_elements < 1 or end <= start
         */
        void uniformDisc(double start, double end, int num_elements);

        /**
         * @brief Adopt caller-supplied grid points
         * 
         * @param coordinates Strictly increasing grid points, at least 2
         * @throws utils::InvalidMeshError if the points do not form a valid mesh
         */
        void setNodes(const Eigen::VectorXd& coordinates);
        void setNodes(const std::vector<double>& coordinates);

        // element widths H, size M-1
        Eigen::VectorXd widths() const;

        int numNodes() const { return static_cast<int>(nodes.size()); }
        int numElements() const { return nodes.size() > 0 ? static_cast<int>(nodes.size()) - 1 : 0; }

        /**
         * @brief Check that X holds at least min_nodes strictly increasing finite points
         * 
         * @throws utils::InvalidMeshError otherwise
         */
        static void validate(const Eigen::VectorXd& X, int min_nodes = 2);

    private:
        bool debug_ = false;
};
}
#endif
