#include <pybind11/pybind11.h>
#include <pybind11/stl_bind.h>
#include <pybind11/stl.h>

#include "nlsolvers/global/timer.hpp"
#include "nlsolvers/maths/root_finding_params.hpp"

namespace py = pybind11;
using namespace nlsolvers;

void pybind_global(py::module& m)
{
    using namespace pybind11::literals;  // bring in '_a' literal

    // Expose Timer class
    py::class_<Timer> timer(m, "Timer", R"pbdoc(
            This class contains timers of the root finding methods.
            )pbdoc");

    py::enum_<Timer::timer>(timer, "timer", "Timer keys")
        .value("NEWTON", Timer::timer::NEWTON)
        .value("BISECTION", Timer::timer::BISECTION)
        .value("SOLVE", Timer::timer::SOLVE)
        .value("TOTAL", Timer::timer::TOTAL)
        .export_values()
        ;

    timer.def(py::init<>())
        .def("start", &Timer::start, R"pbdoc(
            :param key: Timer key
            :type key: Timer.timer
            )pbdoc", "key"_a)
        .def("stop", &Timer::stop, R"pbdoc(
            :param key: Timer key
            :type key: Timer.timer
            )pbdoc", "key"_a)
        .def("reset", &Timer::reset)
        .def("elapsed_seconds", &Timer::elapsedSeconds, "key"_a)
        .def("get_calls", &Timer::get_calls, "key"_a)
        .def("print_timers", &Timer::print_timers, R"pbdoc(
            This method prints all tracked timers.
            )pbdoc")
        ;

    // Expose RootFindingParams
    py::class_<RootFindingParams>(m, "RootFindingParams", R"pbdoc(
            This class contains the tolerance, iteration caps and verbosity of the root finding methods.
            )pbdoc")
        .def(py::init<>())
        .def(py::init<double, int, int, bool>(), R"pbdoc(
            :param eps: Solver tolerance, convergence is achieved when abs(f(x)) < eps
            :type eps: float
            :param max_its_newton: Maximum number of Newton-Raphson iterations
            :type max_its_newton: int
            :param max_its_bisection: Maximum number of bisection iterations
            :type max_its_bisection: int
            :param verbose: Print solver failures
            :type verbose: bool
            )pbdoc", "eps"_a, "max_its_newton"_a, "max_its_bisection"_a, "verbose"_a=false)
        .def_readwrite("timer", &RootFindingParams::timer)
        .def_readwrite("eps", &RootFindingParams::eps)
        .def_readwrite("max_its_newton", &RootFindingParams::max_its_newton)
        .def_readwrite("max_its_bisection", &RootFindingParams::max_its_bisection)
        .def_readwrite("verbose", &RootFindingParams::verbose)
        ;
}
