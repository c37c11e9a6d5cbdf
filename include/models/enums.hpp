/**
 * @file enums.hpp
 * @brief Defines enumerations used throughout the library
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#ifndef FEM1D_MODELS_ENUMS_HPP
#define FEM1D_MODELS_ENUMS_HPP

/**
 * @enum QuadratureRule
 * @brief Enumeration of integration rules used on a single element
 */
enum class QuadratureRule {
    /**
     * @brief Closed trapezoid rule (endpoint evaluations only)
     */
    Trapezoid,

    /**
     * @brief Fixed Gauss-Legendre rule (2 points by default)
     */
    GaussLegendre,

    /**
     * @brief Adaptive bisection driven by a 2-point Gauss-Legendre rule
     */
    Adaptive
};

/**
 * @enum LoadCoverage
 * @brief Which elements contribute to the load vector through the source term
 */
enum class LoadCoverage {
    /**
     * @brief Elements 1..M-3, the two boundary-adjacent elements are skipped
     */
    InteriorElements,

    /**
     * @brief Every element 0..M-2
     */
    AllElements
};

#endif // FEM1D_MODELS_ENUMS_HPP
