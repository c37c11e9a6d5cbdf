#include "utils/integration.hpp"


namespace utils {
    integration::integration(const QuadratureSettings& settings, bool debug)
        : settings_(settings), debug_(debug)
    {
        if (settings_.rule == QuadratureRule::GaussLegendre &&
            (settings_.gauss_points < 1 || settings_.gauss_points > 5)) {
            throw std::invalid_argument("Gauss-Legendre rule supports 1 to 5 points");
        }
        if (settings_.rule == QuadratureRule::Adaptive) {
            if (settings_.tolerance <= 0.0) {
                throw std::invalid_argument("Adaptive quadrature tolerance must be positive");
            }
            if (settings_.max_depth < 0) {
                throw std::invalid_argument("Adaptive quadrature depth must be non-negative");
            }
            if (!(settings_.relative_tolerance >= 0.0)) {
                throw std::invalid_argument("Adaptive quadrature relative tolerance must be non-negative");
            }
        }

        if (debug_) {
            std::cout << "Quadrature rule: ";
            switch (settings_.rule) {
                case QuadratureRule::Trapezoid:
                    std::cout << "trapezoid" << std::endl;
                    break;
                case QuadratureRule::GaussLegendre:
                    std::cout << settings_.gauss_points << "-point Gauss-Legendre" << std::endl;
                    break;
                case QuadratureRule::Adaptive:
                    std::cout << "adaptive (tol = " << std::scientific << settings_.tolerance
                              << ", rel tol = " << settings_.relative_tolerance
                              << ", max depth = " << settings_.max_depth << ")" << std::defaultfloat << std::endl;
                    break;
            }
        }
    }

    void integration::get_gauss_quadrature_rule(
        int n_points, 
        std::vector<double>& points, 
        std::vector<double>& weights
    ){
        points.clear();
        weights.clear();

        if (n_points == 1){
            // 1-point rule (degree of precision = 1)
            points = {0.0};
            weights = {2.0};
        } else if (n_points == 2){
            // 2-point rule (degree of precision = 3)
            points = {-1.0/std::sqrt(3.0), 1.0/std::sqrt(3.0)};
            weights = {1.0, 1.0};
        } else if (n_points == 3){
            // 3-point rule (degree of precision = 5)
            points = {-std::sqrt(3.0/5.0), 0.0, std::sqrt(3.0/5.0)};
            weights = {5.0/9.0, 8.0/9.0, 5.0/9.0};
        } else if (n_points == 4){
            // 4-point rule (degree of precision = 7)
            double sqrt_30 = std::sqrt(30.0);
            points = {-std::sqrt((3.0 + 2.0*std::sqrt(6.0/5.0))/7.0), 
                      -std::sqrt((3.0 - 2.0*std::sqrt(6.0/5.0))/7.0),
                       std::sqrt((3.0 - 2.0*std::sqrt(6.0/5.0))/7.0),
                       std::sqrt((3.0 + 2.0*std::sqrt(6.0/5.0))/7.0)};
            weights = {(18.0 - sqrt_30)/36.0, 
                       (18.0 + sqrt_30)/36.0,
                       (18.0 + sqrt_30)/36.0, 
                       (18.0 - sqrt_30)/36.0};
        } else if (n_points == 5){
            // 5-point rule (degree of precision = 9)
            double sqrt_70 = std::sqrt(70.0);
            points = {-std::sqrt(5.0 + 2.0*std::sqrt(10.0/7.0))/3.0,
                      -std::sqrt(5.0 - 2.0*std::sqrt(10.0/7.0))/3.0,
                       0.0,
                       std::sqrt(5.0 - 2.0*std::sqrt(10.0/7.0))/3.0,
                       std::sqrt(5.0 + 2.0*std::sqrt(10.0/7.0))/3.0};
            weights = {(322.0 - 13.0*sqrt_70)/900.0,
                       (322.0 + 13.0*sqrt_70)/900.0,
                       128.0/225.0,
                       (322.0 + 13.0*sqrt_70)/900.0,
                       (322.0 - 13.0*sqrt_70)/900.0};
        } else {
            throw std::invalid_argument("Gauss-Legendre rule supports 1 to 5 points, got " + std::to_string(n_points));
        }
    }

    double integration::evaluate(const ScalarFunction& g, double x){
        double value = g(x);
        if (!std::isfinite(value)) {
            throw IntegrandEvaluationError("non-finite value", x);
        }
        return value;
    }

    double integration::gaussian_quad(const ScalarFunction& g, double x0, double x1){
        return gauss_legendre(g, x0, x1, 2);
    }

    double integration::gauss_legendre(const ScalarFunction& g, double x0, double x1, int n_points){
        std::vector<double> ksi, w;
        get_gauss_quadrature_rule(n_points, ksi, w);

        double half_length = 0.5 * (x1 - x0);
        double midpoint = 0.5 * (x1 + x0);

        double integral = 0.0;
        for (size_t i = 0; i < ksi.size(); ++i){
            double q = half_length * ksi[i] + midpoint;
            integral += w[i] * evaluate(g, q);
        }

        return half_length * integral;
    }

    double integration::trapezoid(const ScalarFunction& g, double x0, double x1){
        return 0.5 * (x1 - x0) * (evaluate(g, x0) + evaluate(g, x1));
    }

    double integration::adaptive(
        const ScalarFunction& g,
        double x0,
        double x1,
        double tolerance,
        int max_depth,
        double relative_tolerance
    ){
        if (tolerance <= 0.0) {
            throw std::invalid_argument("Adaptive quadrature tolerance must be positive");
        }
        if (!(relative_tolerance >= 0.0)) {
            throw std::invalid_argument("Adaptive quadrature relative tolerance must be non-negative");
        }
        double whole = gaussian_quad(g, x0, x1);
        return adaptive_step(g, x0, x1, whole, tolerance, relative_tolerance, 0, max_depth);
    }

    double integration::adaptive_step(
        const ScalarFunction& g,
        double a,
        double b,
        double whole,
        double tolerance,
        double relative_tolerance,
        int depth,
        int max_depth
    ){
        double m = 0.5 * (a + b);
        double left = gaussian_quad(g, a, m);
        double right = gaussian_quad(g, m, b);
        double delta = left + right - whole;

        // relative floor keeps rounding in delta from blocking large integrands
        double bound = std::max(tolerance, relative_tolerance * std::abs(left + right));

        // 2-point rule error scales with h^5: halving reduces it by 16
        if (std::abs(delta) <= 15.0 * bound) {
            return left + right + delta / 15.0;
        }
        if (depth >= max_depth) {
            throw IntegrandEvaluationError("adaptive quadrature did not converge", m);
        }

        return adaptive_step(g, a, m, left, 0.5 * tolerance, relative_tolerance, depth + 1, max_depth)
             + adaptive_step(g, m, b, right, 0.5 * tolerance, relative_tolerance, depth + 1, max_depth);
    }

    double integration::integrate(const ScalarFunction& g, double x0, double x1) const{
        switch (settings_.rule) {
            case QuadratureRule::Trapezoid:
                return trapezoid(g, x0, x1);
            case QuadratureRule::Adaptive:
                return adaptive(g, x0, x1, settings_.tolerance, settings_.max_depth, settings_.relative_tolerance);
            case QuadratureRule::GaussLegendre:
                return gauss_legendre(g, x0, x1, settings_.gauss_points);
        }
        throw std::invalid_argument("Unknown quadrature rule");
    }

    // ============================================================================
    // BASIS FUNCTION INTEGRATION METHODS
    // ============================================================================

    double integration::integrate_phi0(const ScalarFunction& f, double x0, double x1) const{
        return integrate([&f, x0, x1](double x){
            return f(x) * operations::hat_down(x, x0, x1);
        }, x0, x1);
    }

    double integration::integrate_phi1(const ScalarFunction& f, double x0, double x1) const{
        return integrate([&f, x0, x1](double x){
            return f(x) * operations::hat_up(x, x0, x1);
        }, x0, x1);
    }
}
