/**
 * @file datasource.hpp
 * @brief Defines the datasource class for problem input and assembly output
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef FEM1D_DATASOURCE_HPP
#define FEM1D_DATASOURCE_HPP

#include <iostream>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "mesh/interval.hpp"
#include "models/enums.hpp"
#include "models/templates.hpp"
#include "utils/operations.hpp"

namespace mesh {
    /**
     * @class datasource
     * @brief Reads problem files and writes assembled artifacts as JSON
     * 
     * A problem file looks like
     * 
     *   {
     *     "mesh": {"start": 0.0, "end": 1.0, "num_elements": 4},
     *     "coefficients": {"alpha": 1.0, "b": 0.0, "c": 0.0},
     *     "boundary": {"g0": 0.0, "g1": 0.0},
     *     "quadrature": {"rule": "gauss_legendre", "points": 2},
     *     "load": {"coverage": "interior"},
     *     "source": {"polynomial": [1.0]},
     *     "debug": false,
     *     "log_directory": "log"
     *   }
     * 
     * "mesh" may instead carry an explicit "nodes" array. Missing keys keep
     * the values of ProblemConfig::default_config().
     */
    class datasource{
        public:
            datasource(bool debug = false) : debug_(debug) {}
            ~datasource() = default;

            void setDebug(bool debug) { debug_ = debug; }
            bool debug() const { return debug_; }

            /**
             * @brief Read a problem configuration from a JSON file
             * 
             * @param filename Path of the JSON file
             * @throws std::runtime_error if the file cannot be read or a value is malformed
             */
            ProblemConfig readProblemConfig(const std::string& filename) const;

            // parse a problem configuration from an already loaded document
            static ProblemConfig parseProblemConfig(const nlohmann::json& j);

            // build the mesh described by the configuration
            interval buildMesh(const ProblemConfig& config) const;

            // source term evaluating the configured polynomial
            static ScalarFunction sourceFunction(const ProblemConfig& config);

            /**
             * @brief Save grid points, stiffness matrix and reduced load vector
             * 
             * @param K Stiffness matrix, one JSON array per row
             * @param F Reduced load vector
             * @param X Grid points
             * @param filename Output path, parent directories are created
             * @throws std::runtime_error if the file cannot be opened
             */
            void saveAssemblyToJson(
                const Eigen::MatrixXd& K,
                const Eigen::VectorXd& F,
                const Eigen::VectorXd& X,
                const std::string& filename
            ) const;

            static QuadratureRule parseQuadratureRule(const std::string& name);
            static LoadCoverage parseLoadCoverage(const std::string& name);

        private:
            bool debug_ = false;
    };
}

#endif
