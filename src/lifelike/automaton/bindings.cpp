#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "automaton.hpp"
#include "convolution.hpp"
#include "direct.hpp"
#include "grid.hpp"
#include "rule.hpp"
#include "spectral.hpp"

namespace py = pybind11;

namespace {

// Zero-copy view of a grid; keeps the owner alive.
py::array_t<uint8_t> gridView(const Grid& g, py::handle owner)
{
    return py::array_t<uint8_t>(
        {g.numx(), g.numy()},
        {sizeof(uint8_t) * g.numy(), sizeof(uint8_t)},
        g.raw().data(),
        owner);
}

template <typename Engine>
void bindAutomaton(py::module_& m, const char* name)
{
    py::class_<Engine, Automaton>(m, name)
        .def(py::init<Grid, const Rule&>(), py::arg("grid"), py::arg("rule"));
}

} // namespace

PYBIND11_MODULE(lifelike_cpp, m)
{
    py::register_exception<InvalidRuleError>(m, "InvalidRuleError", PyExc_ValueError);
    py::register_exception<GridDimensionError>(m, "GridDimensionError", PyExc_ValueError);

    // ---------------- NeighborMode ----------------
    py::enum_<NeighborMode>(m, "NeighborMode")
        .value("MOORE", NEIGHBOR_MOORE)
        .value("VON_NEUMANN", NEIGHBOR_VON_NEUMANN);

    m.def("parse_neighbor_mode", &parseNeighborMode);

    // ---------------- Rule ----------------
    py::class_<Rule>(m, "Rule")
        .def(py::init([](const std::vector<int>& survival,
                         const std::vector<int>& birth,
                         int maxState,
                         NeighborMode mode) {
                 return Rule(CountSpec::numbers(survival),
                             CountSpec::numbers(birth), maxState, mode);
             }),
             py::arg("survival"), py::arg("birth"),
             py::arg("max_state") = 1, py::arg("neighbor") = NEIGHBOR_MOORE)
        .def_static("from_masks",
                    [](const CountMask& survival,
                       const CountMask& birth,
                       int maxState,
                       NeighborMode mode) {
                        return Rule(CountSpec::raw(survival),
                                    CountSpec::raw(birth), maxState, mode);
                    },
                    py::arg("survival"), py::arg("birth"),
                    py::arg("max_state") = 1, py::arg("neighbor") = NEIGHBOR_MOORE)
        .def_static("standard", &Rule::standard)
        .def_static("parse", &Rule::parse)
        .def_property_readonly("survival", &Rule::survivalMask)
        .def_property_readonly("birth", &Rule::birthMask)
        .def_property_readonly("max_state", &Rule::getMaxState)
        .def_property_readonly("neighbor", &Rule::getNeighborMode)
        .def("__str__", &Rule::toString)
        .def("__eq__", [](const Rule& a, const Rule& b) { return a == b; });

    // ---------------- Grid ----------------
    py::class_<Grid>(m, "Grid")
        .def(py::init<const std::vector<std::vector<int>>&>())
        .def(py::init<std::size_t, std::size_t>())
        .def_static("random",
                    [](std::size_t numx, std::size_t numy, double probability,
                       uint8_t maxState, unsigned seed) {
                        std::mt19937 rng(seed);
                        return Grid::random(numx, numy, probability, maxState, rng);
                    },
                    py::arg("numx"), py::arg("numy"), py::arg("probability"),
                    py::arg("max_state") = 1, py::arg("seed") = 0)
        .def("cell", &Grid::cell)
        .def("set", &Grid::set)
        .def("numx", &Grid::numx)
        .def("numy", &Grid::numy)
        .def("shape",
             [](const Grid& g) {
                 return py::make_tuple(g.numx(), g.numy());
             })
        .def("numpy",
             [](py::object self) {
                 return gridView(self.cast<const Grid&>(), self);
             });

    // ---------------- Automata ----------------
    py::class_<Automaton>(m, "Automaton")
        .def("step", &Automaton::step)
        .def("cell", &Automaton::cell)
        .def("numx", &Automaton::numx)
        .def("numy", &Automaton::numy)
        .def("max_state", &Automaton::maxState)
        .def("generation", &Automaton::generation)
        .def_property_readonly("name", &Automaton::name)
        .def("grid", &Automaton::grid, py::return_value_policy::copy)

        // ZERO-COPY NumPy view, valid until the next step
        .def("numpy",
             [](py::object self) {
                 return gridView(self.cast<const Automaton&>().grid(), self);
             });

    bindAutomaton<DirectAutomaton>(m, "DirectAutomaton");
    bindAutomaton<ConvolutionAutomaton>(m, "ConvolutionAutomaton");
    bindAutomaton<SpectralAutomaton>(m, "SpectralAutomaton");
}
