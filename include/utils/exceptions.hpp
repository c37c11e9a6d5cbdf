/**
 * @file exceptions.hpp
 * @brief Exception types raised by mesh validation, quadrature and assembly
 */

#ifndef FEM1D_EXCEPTIONS_HPP
#define FEM1D_EXCEPTIONS_HPP

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace utils {

    /**
     * @brief Mesh too small for the requested assembly, or grid points not strictly increasing
     */
    class InvalidMeshError : public std::invalid_argument {
        public:
            explicit InvalidMeshError(const std::string& message)
                : std::invalid_argument("Invalid mesh: " + message) {}
    };

    /**
     * @brief Lengths of X, H or coefficient arrays disagree with the node count M
     */
    class DimensionMismatchError : public std::invalid_argument {
        public:
            explicit DimensionMismatchError(const std::string& message)
                : std::invalid_argument("Dimension mismatch: " + message) {}
    };

    /**
     * @brief Integrand returned a non-finite value, or an adaptive rule did not converge
     */
    class IntegrandEvaluationError : public std::runtime_error {
        public:
            IntegrandEvaluationError(const std::string& message, double x)
                : std::runtime_error("Integrand evaluation failed at x = " + format(x) + ": " + message),
                  x_(x) {}

            // abscissa where the failure was detected
            double where() const { return x_; }

        private:
            double x_;

            static std::string format(double x) {
                std::ostringstream stream;
                stream << std::setprecision(17) << x;
                return stream.str();
            }
    };
}

#endif
