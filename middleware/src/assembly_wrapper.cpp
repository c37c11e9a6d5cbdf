#include "fem1d_python.hpp"

void init_assembly(py::module_ &m) {
    py::class_<Coefficients>(m, "Coefficients")
        .def(py::init([](double alpha, double b, double c){ return Coefficients{alpha, b, c}; }),
            py::arg("alpha") = 1.0, py::arg("b") = 0.0, py::arg("c") = 0.0)
        .def_readwrite("alpha", &Coefficients::alpha)
        .def_readwrite("b", &Coefficients::b)
        .def_readwrite("c", &Coefficients::c);

    py::class_<solver::stiffness_assembler>(m, "StiffnessAssembler")
        .def(py::init<const Coefficients&, bool>(), py::arg("coefficients"), py::arg("debug") = false)
        .def("build_local_k", &solver::stiffness_assembler::buildLocalK, py::arg("h"))
        .def("build_global_k", &solver::stiffness_assembler::buildGlobalK, py::arg("H"), py::arg("M"))
        .def("apply_dbc_matrix", &solver::stiffness_assembler::applyDBCMatrix, py::arg("K"))
        .def("assemble", &solver::stiffness_assembler::assemble, py::arg("H"), py::arg("M"))
        .def("assemble_sparse", &solver::stiffness_assembler::assembleSparse, py::arg("H"), py::arg("M"));

    py::class_<solver::load_assembler>(m, "LoadAssembler")
        .def(py::init<const utils::integration&, LoadCoverage, bool>(),
            py::arg("quadrature") = utils::integration(),
            py::arg("coverage") = LoadCoverage::InteriorElements,
            py::arg("debug") = false)
        .def("build_local_load", &solver::load_assembler::buildLocalLoad, py::arg("f"), py::arg("x0"), py::arg("x1"))
        .def("assemble",
            py::overload_cast<const ScalarFunction&, const Eigen::VectorXd&, int, double, double>(
                &solver::load_assembler::assemble, py::const_),
            py::arg("f"), py::arg("X"), py::arg("M"), py::arg("g0") = 0.0, py::arg("g1") = 0.0)
        .def("assemble_non_smooth",
            [](const solver::load_assembler& self, const Coefficients& coeffs, const ScalarFunction& u,
               const Eigen::VectorXd& X, int M, double g0, double g1){
                return self.assemble(u, X, M, g0, g1, solver::load_assembler::non_smooth_strategy(coeffs));
            },
            py::arg("coefficients"), py::arg("u"), py::arg("X"), py::arg("M"), py::arg("g0") = 0.0, py::arg("g1") = 0.0)
        .def_static("elemental_load_non_smooth", &solver::load_assembler::elemental_load_non_smooth,
            py::arg("coefficients"), py::arg("u"), py::arg("x0"), py::arg("x1"));

    m.def("assemble_stiffness_matrix", &solver::assemble_stiffness_matrix,
        py::arg("alpha"), py::arg("b"), py::arg("c"), py::arg("H"), py::arg("M"));
    m.def("assemble_load_vector", &solver::assemble_load_vector,
        py::arg("f"), py::arg("X"), py::arg("M"), py::arg("g0") = 0.0, py::arg("g1") = 0.0);
}
