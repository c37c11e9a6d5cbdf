#include <iostream>
#include <iomanip>
#include <cmath>
#include <map>
#include <sstream>
#include <string>

#include <Eigen/Dense>

#include "mesh/datasource.hpp"
#include "mesh/interval.hpp"
#include "solver/load_assembler.hpp"
#include "solver/stiffness_assembler.hpp"
#include "utils/exceptions.hpp"
#include "utils/integration.hpp"
#include "utils/logging.hpp"
#include "utils/matrix_helper.hpp"
#include "utils/scope_timer.hpp"

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(50, '=') << std::endl;
}

std::string to_string_precise(double value) {
    std::ostringstream stream;
    stream << std::setprecision(17) << value;
    return stream.str();
}

int main(int argc, char** argv) {

    try {
        mesh::datasource source;
        ProblemConfig config = ProblemConfig::default_config();
        if (argc > 1) {
            config = source.readProblemConfig(argv[1]);
        }
        source.setDebug(config.debug);

        mesh::interval grid = source.buildMesh(config);
        const int M = grid.numNodes();

        print_separator("Mesh");
        std::cout << "Nodes: " << M << ", elements: " << grid.numElements() << std::endl;

        Eigen::MatrixXd K;
        Eigen::VectorXd F;
        {
            utils::ScopeTimer timer("Assembly");

            solver::stiffness_assembler stiffness(config.coefficients, config.debug);
            K = stiffness.assemble(grid.widths(), M);

            utils::integration quadrature(config.quadrature, config.debug);
            solver::load_assembler load(quadrature, config.coverage, config.debug);
            F = load.assemble(mesh::datasource::sourceFunction(config), grid.nodes, M,
                              config.boundary.g0, config.boundary.g1);
        }

        print_separator("Stiffness matrix");
        utils::MatrixHelper::display_matrix(K, "K", 4, 12, 12);
        MatrixInfo info = utils::MatrixHelper::check_matrix_properties(K);
        std::cout << "Symmetric: " << (info.is_symmetric ? "yes" : "no")
                  << ", bandwidth: " << info.bandwidth
                  << ", trace: " << info.trace_value << std::endl;

        print_separator("Load vector (interior unknowns)");
        std::cout << F.transpose() << std::endl;

        std::string output = config.log_directory + "/assembly_" + utils::logging().generateTimestamp() + ".json";
        source.saveAssemblyToJson(K, F, grid.nodes, output);

        std::map<std::string, std::string> dataMap;
        dataMap["nodes"] = std::to_string(M);
        dataMap["alpha"] = to_string_precise(config.coefficients.alpha);
        dataMap["b"] = to_string_precise(config.coefficients.b);
        dataMap["c"] = to_string_precise(config.coefficients.c);
        dataMap["g0"] = to_string_precise(config.boundary.g0);
        dataMap["g1"] = to_string_precise(config.boundary.g1);
        dataMap["load_norm"] = to_string_precise(F.norm());
        dataMap["stiffness_trace"] = to_string_precise(info.trace_value);
        dataMap["output"] = output;

        utils::logging log;
        log.buildLogFile(dataMap, config.log_directory);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
