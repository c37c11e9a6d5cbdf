#include "fem1d_python.hpp"

void init_mesh(py::module_ &m) {
    py::class_<mesh::interval>(m, "Interval")
        .def(py::init<bool>(), py::arg("debug") = false)
        .def("uniform_disc", &mesh::interval::uniformDisc,
            py::arg("start"), py::arg("end"), py::arg("num_elements"),
            "Create a uniform mesh")
        .def("set_nodes", py::overload_cast<const Eigen::VectorXd&>(&mesh::interval::setNodes),
            py::arg("coordinates"),
            "Adopt strictly increasing grid points")
        .def("widths", &mesh::interval::widths, "Element widths")
        .def("num_nodes", &mesh::interval::numNodes)
        .def("num_elements", &mesh::interval::numElements)
        .def_readonly("nodes", &mesh::interval::nodes, "Grid point coordinates");
}
