#include "fem1d_python.hpp"

PYBIND11_MODULE(fem1d_py, m) {
    m.doc() = "Python bindings for the fem1d assembly library";

    py::register_exception<utils::InvalidMeshError>(m, "InvalidMeshError", PyExc_ValueError);
    py::register_exception<utils::DimensionMismatchError>(m, "DimensionMismatchError", PyExc_ValueError);
    py::register_exception<utils::IntegrandEvaluationError>(m, "IntegrandEvaluationError", PyExc_ArithmeticError);

    auto enums_module = m.def_submodule("enums", "Enums module");
    auto mesh_module = m.def_submodule("mesh", "Mesh module containing the 1D interval mesh");
    auto utils_module = m.def_submodule("utils", "Quadrature engine");
    auto solver_module = m.def_submodule("solver", "Stiffness matrix and load vector assemblers");

    init_enums(enums_module);
    init_mesh(mesh_module);
    init_quadrature(utils_module);
    init_assembly(solver_module);
}
