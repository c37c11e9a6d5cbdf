#include "fem1d_python.hpp"

void init_quadrature(py::module_ &m) {
    py::class_<QuadratureSettings>(m, "QuadratureSettings")
        .def(py::init<>())
        .def_readwrite("rule", &QuadratureSettings::rule)
        .def_readwrite("gauss_points", &QuadratureSettings::gauss_points)
        .def_readwrite("tolerance", &QuadratureSettings::tolerance)
        .def_readwrite("relative_tolerance", &QuadratureSettings::relative_tolerance)
        .def_readwrite("max_depth", &QuadratureSettings::max_depth);

    py::class_<utils::integration>(m, "Integration")
        .def(py::init<const QuadratureSettings&, bool>(),
            py::arg("settings") = QuadratureSettings{},
            py::arg("debug") = false)
        .def("integrate", &utils::integration::integrate, py::arg("g"), py::arg("x0"), py::arg("x1"))
        .def("integrate_phi0", &utils::integration::integrate_phi0, py::arg("f"), py::arg("x0"), py::arg("x1"))
        .def("integrate_phi1", &utils::integration::integrate_phi1, py::arg("f"), py::arg("x0"), py::arg("x1"))
        .def_static("gaussian_quad", &utils::integration::gaussian_quad, py::arg("g"), py::arg("x0"), py::arg("x1"));
}
