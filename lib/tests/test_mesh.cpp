#include "tests/test_mesh.hpp"

namespace TestMesh {

    namespace {
        std::filesystem::path scratch_directory(const std::string& name) {
            std::filesystem::path dir = std::filesystem::temp_directory_path() / ("fem1d_tests_" + name);
            std::filesystem::remove_all(dir);
            std::filesystem::create_directories(dir);
            return dir;
        }
    }

    void test_uniform_mesh(TestResults& results) {
        mesh::interval grid;
        grid.uniformDisc(-1.0, 2.0, 7);

        results.check(grid.numNodes() == 8 && grid.numElements() == 7, "7 elements give 8 nodes");
        results.check(grid.nodes(0) == -1.0 && grid.nodes(7) == 2.0, "end points are exact");

        Eigen::VectorXd H = grid.widths();
        results.check(H.size() == 7, "widths has M - 1 entries");
        results.check((H.array() - 3.0/7.0).abs().maxCoeff() < 1e-14, "uniform widths equal (end - start) / n");

        results.check_throws<utils::InvalidMeshError>([]{
            mesh::interval g;
            g.uniformDisc(0.0, 1.0, 0);
        }, "zero elements raise InvalidMeshError");

        results.check_throws<utils::InvalidMeshError>([]{
            mesh::interval g;
            g.uniformDisc(1.0, 1.0, 4);
        }, "empty domain raises InvalidMeshError");
    }

    void test_explicit_nodes(TestResults& results) {
        mesh::interval grid;
        grid.setNodes(std::vector<double>{0.0, 0.1, 0.5, 1.0});
        results.check(grid.numNodes() == 4, "explicit nodes are adopted");
        results.check_close(grid.widths()(2), 0.5, 1e-15, "width of the last element");

        results.check_throws<utils::InvalidMeshError>([]{
            mesh::interval g;
            g.setNodes(std::vector<double>{0.0, 0.5, 0.5, 1.0});
        }, "repeated node raises InvalidMeshError");

        results.check_throws<utils::InvalidMeshError>([]{
            mesh::interval g;
            g.setNodes(std::vector<double>{0.3});
        }, "single node raises InvalidMeshError");

        results.check_throws<utils::InvalidMeshError>([]{
            mesh::interval::validate((Eigen::VectorXd(3) << 0.0, std::nan(""), 1.0).finished());
        }, "NaN node raises InvalidMeshError");
    }

    void test_problem_config(TestResults& results) {
        nlohmann::json j = {
            {"mesh", {{"nodes", {0.0, 0.2, 0.6, 0.8, 1.0}}}},
            {"coefficients", {{"alpha", 0.5}, {"b", 1.0}}},
            {"boundary", {{"g1", 2.0}}},
            {"quadrature", {{"rule", "adaptive"}, {"tolerance", 1e-8}}},
            {"load", {{"coverage", "all"}}},
            {"source", {{"polynomial", {1.0, 0.0, 3.0}}}}
        };

        ProblemConfig config = mesh::datasource::parseProblemConfig(j);
        results.check(config.nodes.size() == 5, "explicit nodes are read");
        results.check(config.coefficients.alpha == 0.5 && config.coefficients.b == 1.0 && config.coefficients.c == 0.0,
                      "missing coefficients keep their defaults");
        results.check(config.boundary.g0 == 0.0 && config.boundary.g1 == 2.0, "boundary values are read");
        results.check(config.quadrature.rule == QuadratureRule::Adaptive && config.quadrature.tolerance == 1e-8,
                      "quadrature settings are read");
        results.check(config.coverage == LoadCoverage::AllElements, "load coverage is read");

        ScalarFunction f = mesh::datasource::sourceFunction(config);
        results.check_close(f(2.0), 13.0, 1e-14, "source polynomial 1 + 3x^2 evaluated at 2");

        mesh::datasource source;
        mesh::interval grid = source.buildMesh(config);
        results.check(grid.numNodes() == 5 && grid.nodes(1) == 0.2, "mesh built from explicit nodes");

        ProblemConfig uniform = mesh::datasource::parseProblemConfig(nlohmann::json{{"mesh", {{"num_elements", 10}}}});
        results.check(source.buildMesh(uniform).numElements() == 10, "uniform mesh built from the element count");

        results.check_throws<std::runtime_error>([]{
            mesh::datasource::parseProblemConfig(nlohmann::json{{"quadrature", {{"rule", "simpson"}}}});
        }, "unknown quadrature rule is rejected");

        results.check_throws<std::runtime_error>([]{
            mesh::datasource::parseProblemConfig(nlohmann::json{{"coefficients", {{"alpha", "one"}}}});
        }, "malformed coefficient is rejected");

        results.check_throws<std::runtime_error>([]{
            mesh::datasource source;
            source.readProblemConfig("/nonexistent/problem.json");
        }, "missing problem file is rejected");

        std::filesystem::path dir = scratch_directory("config");
        std::filesystem::path file = dir / "problem.json";
        {
            std::ofstream out(file);
            out << j.dump(4);
        }
        mesh::datasource reader;
        ProblemConfig from_file = reader.readProblemConfig(file.string());
        results.check(from_file.nodes == config.nodes && from_file.source_polynomial == config.source_polynomial,
                      "problem file matches the parsed document");

        // one datasource reads the file, takes its debug flag and builds the mesh
        reader.setDebug(true);
        results.check(reader.debug(), "debug flag is switched after reading");
        mesh::interval from_file_grid = reader.buildMesh(from_file);
        results.check(from_file_grid.numNodes() == 5 && from_file_grid.nodes(4) == 1.0,
                      "mesh built by the reading datasource");
        std::filesystem::remove_all(dir);
    }

    void test_assembly_output(TestResults& results) {
        std::filesystem::path dir = scratch_directory("output");
        std::filesystem::path file = dir / "nested" / "assembly.json";

        Eigen::MatrixXd K = Eigen::MatrixXd::Identity(3, 3);
        K(1,0) = -4.0;
        Eigen::VectorXd F = (Eigen::VectorXd(1) << 0.25).finished();
        Eigen::VectorXd X = (Eigen::VectorXd(3) << 0.0, 0.5, 1.0).finished();

        mesh::datasource source;
        source.saveAssemblyToJson(K, F, X, file.string());

        results.check(std::filesystem::exists(file), "assembly file is written with its parent directories");

        std::ifstream in(file);
        nlohmann::json j;
        in >> j;
        results.check(j["stiffness"][1][0].get<double>() == -4.0, "stiffness rows are stored row by row");
        results.check(j["load"].size() == 1 && j["load"][0].get<double>() == 0.25, "load vector is stored");
        results.check(j["metadata"]["nodeCount"].get<int>() == 3, "metadata records the node count");

        std::filesystem::remove_all(dir);
    }

    void test_run_log(TestResults& results) {
        std::filesystem::path dir = scratch_directory("log");

        std::map<std::string, std::string> dataMap;
        dataMap["nodes"] = "5";

        utils::logging log;
        std::string path = log.buildLogFile(dataMap, dir.string());

        results.check(std::filesystem::exists(path), "log file is written to the requested directory");
        results.check(dataMap.count("date") == 1 && dataMap.count("timestamp") == 1, "date and timestamp are added");

        std::ifstream in(path);
        nlohmann::json j;
        in >> j;
        results.check(j["nodes"] == "5", "log entries are stored");

        std::filesystem::remove_all(dir);
    }

    void test_matrix_helper(TestResults& results) {
        Eigen::MatrixXd A(3, 3);
        A << 2, -1, 0,
             -1, 2, -1,
             0, -1, 2;

        MatrixInfo info = utils::MatrixHelper::check_matrix_properties(A);
        results.check(info.is_symmetric && info.bandwidth == 1, "tridiagonal symmetric matrix is recognised");
        results.check_close(info.trace_value, 6.0, 1e-15, "trace of the 1D Laplacian");

        A(0,2) = 0.5;
        results.check(!utils::MatrixHelper::is_tridiagonal(A), "corner entry widens the bandwidth");
        results.check_close(utils::MatrixHelper::compute_symmetry_error(A), 0.5, 1e-15, "symmetry error is the largest asymmetry");

        Eigen::SparseMatrix<double> S = A.sparseView();
        results.check(utils::MatrixHelper::compute_bandwidth(S) == 2, "sparse bandwidth matches dense");
        results.check(utils::MatrixHelper::check_matrix_properties(S).is_sparse, "sparse matrix is flagged");
    }

    void run_all(TestResults& results) {
        print_suite_header("MESH, CONFIGURATION AND OUTPUT");
        test_uniform_mesh(results);
        test_explicit_nodes(results);
        test_problem_config(results);
        test_assembly_output(results);
        test_run_log(results);
        test_matrix_helper(results);
    }
}
