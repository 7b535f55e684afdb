#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include <random>

#include "grid.hpp"
#include "patterns.hpp"

namespace py = pybind11;

PYBIND11_MODULE(lifeGrid_cpp, m)
{
    // ---------------- Errors ----------------
    py::register_exception<InvalidDimension>(m, "InvalidDimension", PyExc_ValueError);
    py::register_exception<InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);

    // ---------------- Grid ----------------
    py::class_<Grid>(m, "Grid")
        .def(py::init<int, int>(), py::arg("rows"), py::arg("cols"))

        .def("randomize",
             [](Grid& g, double density, py::object seed) {
                 if (seed.is_none()) {
                     std::random_device rd;
                     g.randomize(density, static_cast<uint32_t>(rd()));
                 } else {
                     g.randomize(density, seed.cast<uint32_t>());
                 }
             },
             py::arg("density") = 0.3, py::arg("seed") = py::none())

        .def("populate", &Grid::populate, py::arg("coords"))
        .def("clear", &Grid::clear)
        .def("step", &Grid::step)
        .def("step_n", &Grid::stepN, py::arg("n"))

        .def("generation", &Grid::getGeneration)
        .def("population", &Grid::population)
        .def("shape",
             [](const Grid& g) {
                 return py::make_tuple(g.getRows(), g.getCols());
             })

        // Copy, never a view: a renderer must not write into the board.
        .def("numpy",
             [](const Grid& g) {
                 return g.snapshot().cells;
             });

    // ---------------- Patterns ----------------
    m.def("patterns",
          []() {
              std::vector<std::string> names;
              for (const auto& p : pattern_catalog())
                  names.push_back(p.name);
              return names;
          });

    m.def("get_pattern",
          [](const std::string& name, int row, int col) {
              return place_pattern(find_pattern(name), row, col);
          },
          py::arg("name"), py::arg("row") = 0, py::arg("col") = 0);
}
