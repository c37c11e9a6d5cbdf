#include "fem1d_python.hpp"

void init_enums(py::module_ &m) {
    py::enum_<QuadratureRule>(m, "QuadratureRule")
        .value("TRAPEZOID", QuadratureRule::Trapezoid)
        .value("GAUSS_LEGENDRE", QuadratureRule::GaussLegendre)
        .value("ADAPTIVE", QuadratureRule::Adaptive)
        .export_values();

    py::enum_<LoadCoverage>(m, "LoadCoverage")
        .value("INTERIOR_ELEMENTS", LoadCoverage::InteriorElements)
        .value("ALL_ELEMENTS", LoadCoverage::AllElements)
        .export_values();
}
