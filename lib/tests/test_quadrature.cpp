#include "tests/test_quadrature.hpp"

namespace TestQuadrature {

    namespace {
        // closed forms of ∫_a^b x^p φ dx for p = 1, 2
        double phi0_x(double a, double b)  { return (b*(b*b - a*a)/2.0 - (b*b*b - a*a*a)/3.0) / (b - a); }
        double phi1_x(double a, double b)  { return ((b*b*b - a*a*a)/3.0 - a*(b*b - a*a)/2.0) / (b - a); }
        double phi0_x2(double a, double b) { return (b*(b*b*b - a*a*a)/3.0 - (b*b*b*b - a*a*a*a)/4.0) / (b - a); }
        double phi1_x2(double a, double b) { return ((b*b*b*b - a*a*a*a)/4.0 - a*(b*b*b - a*a*a)/3.0) / (b - a); }

        struct SourceFailure {};
    }

    void test_gauss_rules(TestResults& results) {
        for (int n = 1; n <= 5; ++n) {
            std::vector<double> points, weights;
            utils::integration::get_gauss_quadrature_rule(n, points, weights);

            double weight_sum = 0.0;
            double first_moment = 0.0;
            for (size_t i = 0; i < weights.size(); ++i) {
                weight_sum += weights[i];
                first_moment += weights[i] * points[i];
            }
            results.check(static_cast<int>(points.size()) == n, std::to_string(n) + "-point rule has " + std::to_string(n) + " nodes");
            results.check_close(weight_sum, 2.0, 1e-14, std::to_string(n) + "-point weights sum to 2");
            results.check_close(first_moment, 0.0, 1e-14, std::to_string(n) + "-point rule is symmetric");
        }

        // n-point rule integrates x^(2n-2) exactly on [-1, 1]
        for (int n = 1; n <= 5; ++n) {
            int p = 2*n - 2;
            double value = utils::integration::gauss_legendre([p](double x){ return std::pow(x, p); }, -1.0, 1.0, n);
            results.check_close(value, 2.0 / (p + 1), 1e-13, std::to_string(n) + "-point rule exact for x^" + std::to_string(p));
        }

        results.check_throws<std::invalid_argument>([]{
            std::vector<double> points, weights;
            utils::integration::get_gauss_quadrature_rule(6, points, weights);
        }, "6-point rule is rejected");
    }

    void test_gaussian_quad_cubic_exactness(TestResults& results) {
        const double a = 0.3;
        const double b = 1.7;

        double cubic = utils::integration::gaussian_quad([](double x){ return 2.0*x*x*x - x + 4.0; }, a, b);
        double expected = 0.5*(std::pow(b, 4) - std::pow(a, 4)) - 0.5*(b*b - a*a) + 4.0*(b - a);
        results.check_close(cubic, expected, 1e-13, "2-point Gauss-Legendre is exact for a cubic");

        double quartic = utils::integration::gaussian_quad([](double x){ return x*x*x*x; }, 0.0, 1.0);
        results.check(std::abs(quartic - 0.2) > 1e-4, "2-point Gauss-Legendre is not exact for x^4");
    }

    void test_basis_integrals_polynomials(TestResults& results) {
        utils::integration quadrature;
        const double a = 0.25;
        const double b = 0.5;

        auto linear = [](double x){ return x; };
        auto square = [](double x){ return x*x; };

        results.check_close(quadrature.integrate_phi0(linear, a, b), phi0_x(a, b), 1e-15, "integrate_phi0 exact for f(x) = x");
        results.check_close(quadrature.integrate_phi1(linear, a, b), phi1_x(a, b), 1e-15, "integrate_phi1 exact for f(x) = x");
        results.check_close(quadrature.integrate_phi0(square, a, b), phi0_x2(a, b), 1e-15, "integrate_phi0 exact for f(x) = x^2");
        results.check_close(quadrature.integrate_phi1(square, a, b), phi1_x2(a, b), 1e-15, "integrate_phi1 exact for f(x) = x^2");

        results.check_close(quadrature.integrate_phi0(linear, 0.0, 1.0), 1.0/6.0, 1e-15, "∫ x φ0 on [0, 1] is 1/6");
        results.check_close(quadrature.integrate_phi0(square, 0.0, 1.0), 1.0/12.0, 1e-15, "∫ x^2 φ0 on [0, 1] is 1/12");
    }

    void test_constant_source_all_rules(TestResults& results) {
        const double k = 3.5;
        const double x0 = 0.25;
        const double x1 = 0.5;
        const double h = x1 - x0;
        auto constant = [k](double){ return k; };

        QuadratureSettings trapezoid;
        trapezoid.rule = QuadratureRule::Trapezoid;
        QuadratureSettings gauss;
        QuadratureSettings adaptive;
        adaptive.rule = QuadratureRule::Adaptive;

        const std::vector<std::pair<std::string, QuadratureSettings>> rules = {
            {"trapezoid", trapezoid}, {"gauss-legendre", gauss}, {"adaptive", adaptive}
        };

        for (const auto& rule : rules) {
            utils::integration quadrature(rule.second);
            results.check_close(quadrature.integrate_phi0(constant, x0, x1), k*h/2.0, 1e-14, rule.first + ": ∫ k φ0 = k h / 2");
            results.check_close(quadrature.integrate_phi1(constant, x0, x1), k*h/2.0, 1e-14, rule.first + ": ∫ k φ1 = k h / 2");
        }
    }

    void test_trapezoid_endpoint_behaviour(TestResults& results) {
        QuadratureSettings settings;
        settings.rule = QuadratureRule::Trapezoid;
        utils::integration quadrature(settings);

        auto f = [](double x){ return 1.0 + x*x; };
        const double x0 = 1.0;
        const double x1 = 2.0;

        results.check_close(quadrature.integrate_phi0(f, x0, x1), 0.5*(x1 - x0)*f(x0), 1e-15, "trapezoid φ0 integral uses f(x0) only");
        results.check_close(quadrature.integrate_phi1(f, x0, x1), 0.5*(x1 - x0)*f(x1), 1e-15, "trapezoid φ1 integral uses f(x1) only");
        results.check_close(utils::integration::trapezoid(f, x0, x1), 0.5*(f(x0) + f(x1)), 1e-15, "trapezoid rule on [1, 2]");
    }

    void test_adaptive(TestResults& results) {
        auto sine = [](double x){ return std::sin(x); };
        double value = utils::integration::adaptive(sine, 0.0, M_PI, 1e-10, 30);
        results.check_close(value, 2.0, 1e-8, "adaptive rule integrates sin on [0, pi]");

        QuadratureSettings settings;
        settings.rule = QuadratureRule::Adaptive;
        settings.tolerance = 1e-12;
        utils::integration quadrature(settings);
        auto exponential = [](double x){ return std::exp(x); };
        // ∫_0^1 e^x (1 - x) dx = e - 2
        results.check_close(quadrature.integrate_phi0(exponential, 0.0, 1.0), std::exp(1.0) - 2.0, 1e-10, "adaptive ∫ e^x φ0 on [0, 1]");

        results.check_throws<utils::IntegrandEvaluationError>([]{
            utils::integration::adaptive([](double x){ return std::pow(x, 6); }, 0.0, 1.0, 1e-14, 0);
        }, "adaptive rule reports non-convergence");

        utils::integration defaults([]{
            QuadratureSettings s;
            s.rule = QuadratureRule::Adaptive;
            return s;
        }());

        // ∫ e^x φ0 on [x0, x1] = (e^x1 - (1 + h) e^x0) / h
        const double x0 = 0.25;
        const double x1 = 0.5;
        const double h = x1 - x0;
        double large_expected = 1e8 * (std::exp(x1) - (1.0 + h)*std::exp(x0)) / h;
        bool large_ok = false;
        try {
            double large = defaults.integrate_phi0([](double x){ return 1e8 * std::exp(x); }, x0, x1);
            large_ok = std::abs(large - large_expected) <= 1e-9 * std::abs(large_expected);
        } catch (const utils::IntegrandEvaluationError& e) {
            std::cout << "       " << e.what() << std::endl;
        }
        results.check(large_ok, "adaptive ∫ 1e8 e^x φ0 converges to the closed form");

        // ∫_0^a sqrt(x) (a - x) / a dx = 4 a^1.5 / 15
        bool root_ok = false;
        try {
            double root = defaults.integrate_phi0([](double x){ return std::sqrt(x); }, 0.0, 0.25);
            root_ok = std::abs(root - 1.0/30.0) <= 1e-8;
        } catch (const utils::IntegrandEvaluationError& e) {
            std::cout << "       " << e.what() << std::endl;
        }
        results.check(root_ok, "adaptive ∫ sqrt(x) φ0 converges despite the infinite slope at 0");

        results.check_throws<std::invalid_argument>([]{
            QuadratureSettings s;
            s.rule = QuadratureRule::Adaptive;
            s.relative_tolerance = -1.0;
            utils::integration quadrature(s);
        }, "negative relative tolerance is rejected");
    }

    void test_rule_dispatch(TestResults& results) {
        auto square = [](double x){ return x*x; };

        QuadratureSettings trapezoid;
        trapezoid.rule = QuadratureRule::Trapezoid;
        QuadratureSettings one_point;
        one_point.gauss_points = 1;
        QuadratureSettings two_point;
        QuadratureSettings adaptive;
        adaptive.rule = QuadratureRule::Adaptive;

        results.check_close(utils::integration(trapezoid).integrate(square, 0.0, 1.0), 0.5, 1e-15, "trapezoid rule selected for x^2");
        results.check_close(utils::integration(one_point).integrate(square, 0.0, 1.0), 0.25, 1e-15, "1-point Gauss-Legendre selected for x^2");
        results.check_close(utils::integration(two_point).integrate(square, 0.0, 1.0), 1.0/3.0, 1e-15, "2-point Gauss-Legendre selected for x^2");
        results.check_close(utils::integration(adaptive).integrate(square, 0.0, 1.0), 1.0/3.0, 1e-14, "adaptive rule selected for x^2");
    }

    void test_integrand_failures(TestResults& results) {
        utils::integration quadrature;

        results.check_throws<utils::IntegrandEvaluationError>([&]{
            quadrature.integrate_phi0([](double){ return std::nan(""); }, 0.0, 1.0);
        }, "NaN integrand raises IntegrandEvaluationError");

        results.check_throws<utils::IntegrandEvaluationError>([&]{
            quadrature.integrate_phi1([](double x){ return x > 0.5 ? std::numeric_limits<double>::infinity() : 1.0; }, 0.0, 1.0);
        }, "infinite integrand raises IntegrandEvaluationError");

        bool propagated = false;
        try {
            quadrature.integrate_phi0([](double) -> double { throw SourceFailure{}; }, 0.0, 1.0);
        } catch (const SourceFailure&) {
            propagated = true;
        }
        results.check(propagated, "exception thrown by the source propagates unchanged");

        utils::IntegrandEvaluationError small("non-finite value", 3.0e-5);
        std::string message = small.what();
        results.check(small.where() == 3.0e-5, "failure abscissa is kept exactly");
        results.check(message.find("0.000000") == std::string::npos && message.find("e-05") != std::string::npos,
                      "small failure abscissa is printed in full precision");

        bool located = false;
        try {
            quadrature.integrate_phi0([](double x){ return x < 1e-3 ? std::nan("") : 1.0; }, 0.0, 1e-4);
        } catch (const utils::IntegrandEvaluationError& e) {
            located = e.where() > 0.0 && e.where() < 1e-4
                && std::string(e.what()).find("e-05") != std::string::npos;
        }
        results.check(located, "NaN near the origin reports where it was found");
    }

    void test_invalid_settings(TestResults& results) {
        results.check_throws<std::invalid_argument>([]{
            QuadratureSettings settings;
            settings.gauss_points = 7;
            utils::integration quadrature(settings);
        }, "Gauss-Legendre with 7 points is rejected");

        results.check_throws<std::invalid_argument>([]{
            QuadratureSettings settings;
            settings.rule = QuadratureRule::Adaptive;
            settings.tolerance = 0.0;
            utils::integration quadrature(settings);
        }, "adaptive rule with zero tolerance is rejected");
    }

    void run_all(TestResults& results) {
        print_suite_header("QUADRATURE ENGINE");
        test_gauss_rules(results);
        test_gaussian_quad_cubic_exactness(results);
        test_basis_integrals_polynomials(results);
        test_constant_source_all_rules(results);
        test_trapezoid_endpoint_behaviour(results);
        test_adaptive(results);
        test_rule_dispatch(results);
        test_integrand_failures(results);
        test_invalid_settings(results);
    }
}
