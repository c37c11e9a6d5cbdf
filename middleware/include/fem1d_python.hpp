/**
 * @file fem1d_python.hpp
 * @brief Header file for Python bindings of the fem1d library
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef FEM1D_PYTHON_HPP
#define FEM1D_PYTHON_HPP

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "mesh/interval.hpp"
#include "models/enums.hpp"
#include "models/templates.hpp"
#include "solver/load_assembler.hpp"
#include "solver/stiffness_assembler.hpp"
#include "utils/exceptions.hpp"
#include "utils/integration.hpp"

namespace py = pybind11;

// Function declarations for module components
void init_enums(py::module_ &m);
void init_mesh(py::module_ &m);
void init_quadrature(py::module_ &m);
void init_assembly(py::module_ &m);

#endif // FEM1D_PYTHON_HPP
