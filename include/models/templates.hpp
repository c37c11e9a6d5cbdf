/**
 * @file templates.hpp
 * @brief Defines data structures shared by the assemblers
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#ifndef FEM1D_MODELS_TEMPLATES_HPP
#define FEM1D_MODELS_TEMPLATES_HPP

#include <functional>
#include <string>
#include <vector>

#include "models/enums.hpp"

// Real scalar function evaluated at a real argument (source term, known solution part)
using ScalarFunction = std::function<double(double)>;

// Coefficients of -alpha*u'' + b*u' + c*u = f
struct Coefficients {
    double alpha = 1.0; // diffusion
    double b = 0.0;     // advection
    double c = 0.0;     // reaction
};

// Dirichlet values at the left and right end of the domain
struct BoundaryValues {
    double g0 = 0.0;
    double g1 = 0.0;
};

struct QuadratureSettings {
    QuadratureRule rule = QuadratureRule::GaussLegendre;
    int gauss_points = 2;       // used by GaussLegendre
    double tolerance = 1e-10;           // used by Adaptive
    double relative_tolerance = 1e-12;  // used by Adaptive
    int max_depth = 50;                 // used by Adaptive
};

// Problem configuration
struct ProblemConfig {
    // mesh: explicit nodes take precedence over the uniform description
    std::vector<double> nodes;
    double domain_start = 0.0;
    double domain_end = 1.0;
    int num_elements = 4;

    Coefficients coefficients;
    BoundaryValues boundary;
    QuadratureSettings quadrature;
    LoadCoverage coverage = LoadCoverage::InteriorElements;

    // source polynomial coefficients, lowest degree first
    std::vector<double> source_polynomial = {0.0};

    bool debug = false;
    std::string log_directory = "log";

    // Static factory method for default configuration
    static ProblemConfig default_config() {
        ProblemConfig config;
        config.domain_start = 0.0;
        config.domain_end = 1.0;
        config.num_elements = 4;
        config.coefficients = Coefficients{1.0, 0.0, 0.0};
        config.boundary = BoundaryValues{0.0, 0.0};
        config.quadrature = QuadratureSettings{};
        config.coverage = LoadCoverage::InteriorElements;
        config.source_polynomial = {0.0};
        config.debug = false;
        config.log_directory = "log";
        return config;
    }
};

#endif // FEM1D_MODELS_TEMPLATES_HPP
