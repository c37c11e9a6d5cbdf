#include "mesh/datasource.hpp"

QuadratureRule mesh::datasource::parseQuadratureRule(const std::string& name){
    if (name == "trapezoid") return QuadratureRule::Trapezoid;
    if (name == "gauss_legendre" || name == "gauss") return QuadratureRule::GaussLegendre;
    if (name == "adaptive") return QuadratureRule::Adaptive;
    throw std::runtime_error("Unknown quadrature rule: " + name);
}

LoadCoverage mesh::datasource::parseLoadCoverage(const std::string& name){
    if (name == "interior") return LoadCoverage::InteriorElements;
    if (name == "all") return LoadCoverage::AllElements;
    throw std::runtime_error("Unknown load coverage: " + name);
}

ProblemConfig mesh::datasource::parseProblemConfig(const nlohmann::json& j){
    ProblemConfig config = ProblemConfig::default_config();

    try {
        if (j.contains("mesh")) {
            const auto& m = j.at("mesh");
            if (m.contains("nodes")) {
                config.nodes = m.at("nodes").get<std::vector<double>>();
            }
            config.domain_start = m.value("start", config.domain_start);
            config.domain_end = m.value("end", config.domain_end);
            config.num_elements = m.value("num_elements", config.num_elements);
        }

        if (j.contains("coefficients")) {
            const auto& c = j.at("coefficients");
            config.coefficients.alpha = c.value("alpha", config.coefficients.alpha);
            config.coefficients.b = c.value("b", config.coefficients.b);
            config.coefficients.c = c.value("c", config.coefficients.c);
        }

        if (j.contains("boundary")) {
            const auto& bc = j.at("boundary");
            config.boundary.g0 = bc.value("g0", config.boundary.g0);
            config.boundary.g1 = bc.value("g1", config.boundary.g1);
        }

        if (j.contains("quadrature")) {
            const auto& q = j.at("quadrature");
            if (q.contains("rule")) {
                config.quadrature.rule = parseQuadratureRule(q.at("rule").get<std::string>());
            }
            config.quadrature.gauss_points = q.value("points", config.quadrature.gauss_points);
            config.quadrature.tolerance = q.value("tolerance", config.quadrature.tolerance);
            config.quadrature.relative_tolerance = q.value("relative_tolerance", config.quadrature.relative_tolerance);
            config.quadrature.max_depth = q.value("max_depth", config.quadrature.max_depth);
        }

        if (j.contains("load") && j.at("load").contains("coverage")) {
            config.coverage = parseLoadCoverage(j.at("load").at("coverage").get<std::string>());
        }

        if (j.contains("source") && j.at("source").contains("polynomial")) {
            config.source_polynomial = j.at("source").at("polynomial").get<std::vector<double>>();
            if (config.source_polynomial.empty()) {
                throw std::runtime_error("Source polynomial must have at least one coefficient");
            }
        }

        config.debug = j.value("debug", config.debug);
        config.log_directory = j.value("log_directory", config.log_directory);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed problem configuration: ") + e.what());
    }

    return config;
}

ProblemConfig mesh::datasource::readProblemConfig(const std::string& filename) const{
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Unable to parse JSON file " + filename + ": " + e.what());
    }

    ProblemConfig config = parseProblemConfig(j);

    if (debug_) {
        std::cout << "Problem configuration read from " << filename << std::endl;
        std::cout << "  alpha = " << config.coefficients.alpha
                  << ", b = " << config.coefficients.b
                  << ", c = " << config.coefficients.c << std::endl;
        std::cout << "  g0 = " << config.boundary.g0 << ", g1 = " << config.boundary.g1 << std::endl;
    }

    return config;
}

mesh::interval mesh::datasource::buildMesh(const ProblemConfig& config) const{
    interval grid(debug_);
    if (!config.nodes.empty()) {
        grid.setNodes(config.nodes);
    } else {
        grid.uniformDisc(config.domain_start, config.domain_end, config.num_elements);
    }
    return grid;
}

ScalarFunction mesh::datasource::sourceFunction(const ProblemConfig& config){
    std::vector<double> coefficients = config.source_polynomial;
    return [coefficients](double x){
        return utils::operations::evaluate_polynomial(coefficients, x);
    };
}

void mesh::datasource::saveAssemblyToJson(
    const Eigen::MatrixXd& K,
    const Eigen::VectorXd& F,
    const Eigen::VectorXd& X,
    const std::string& filename
) const{
    nlohmann::json outputJson;

    outputJson["nodes"] = std::vector<double>(X.data(), X.data() + X.size());

    nlohmann::json rows = nlohmann::json::array();
    for (int i = 0; i < K.rows(); i++) {
        std::vector<double> row(K.cols());
        for (int j = 0; j < K.cols(); j++) {
            row[j] = K(i, j);
        }
        rows.push_back(row);
    }
    outputJson["stiffness"] = rows;
    outputJson["load"] = std::vector<double>(F.data(), F.data() + F.size());

    outputJson["metadata"] = {
        {"nodeCount", X.size()},
        {"elementCount", X.size() > 0 ? X.size() - 1 : 0},
        {"interiorUnknowns", F.size()}
    };

    std::filesystem::path dir = std::filesystem::path(filename).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir);
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }

    file << outputJson.dump(4);
    file.close();

    if (debug_) {
        std::cout << "Assembly saved to " << filename << std::endl;
    }
}
