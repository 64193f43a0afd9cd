#include <string>
#include <stdexcept>
#include <functional>

#include <pybind11/pybind11.h>
#include <pybind11/stl_bind.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/eigen.h>

#include "nlsolvers/maths/root_finding.hpp"
#include "nlsolvers/maths/root_sweep.hpp"

namespace py = pybind11;
using namespace nlsolvers;

namespace {

// Translated into the Python ConvergenceError
class ConvergenceError : public std::runtime_error
{
public:
    explicit ConvergenceError(const std::string& what) : std::runtime_error(what) {}
};

// Return the root of a finished RootFinding call or raise the Python exception matching its output code
double root_or_raise(RootFinding& rootfinding, int output)
{
    switch (output)
    {
        case RootFinding::Output::SUCCESS:
        {
            return rootfinding.getx();
        }
        case RootFinding::Output::CONVERGENCE_FAILURE:
        {
            throw ConvergenceError(rootfinding.get_message());
        }
        case RootFinding::Output::INVALID_BRACKET_SIGN:
        {
            throw py::value_error(rootfinding.get_message());
        }
        default:
        {
            throw std::runtime_error("Unknown RootFinding output code " + std::to_string(output));
        }
    }
}

} // namespace

void pybind_maths(py::module& m)
{
    using namespace pybind11::literals;  // bring in '_a' literal

    py::register_exception<ConvergenceError>(m, "ConvergenceError", PyExc_Exception)
        .attr("__doc__") = "Exception raised if a solver fails to converge.";

    m.def("newton_raphson", [](std::function<double(double)> f, std::function<double(double)> df,
                               double x_0, double eps, int max_its)
        {
            RootFinding rootfinding;
            int output = rootfinding.newton_raphson(f, df, x_0, eps, max_its);
            return root_or_raise(rootfinding, output);
        }, R"pbdoc(
            Solve f == 0 using Newton-Raphson iteration.

            :param f: The function whose root is being found
            :param df: The derivative of f
            :param x_0: The initial value of x in the iteration
            :param eps: The solver tolerance, convergence is achieved when abs(f(x)) < eps
            :param max_its: The maximum number of iterations before the solver is taken to have failed
            :returns: The approximate root
            :raises ConvergenceError: if the solver fails to converge
            )pbdoc", "f"_a, "df"_a, "x_0"_a, "eps"_a=1.0e-5, "max_its"_a=20);

    m.def("bisection", [](std::function<double(double)> f, double x_0, double x_1, double eps, int max_its)
        {
            RootFinding rootfinding;
            int output = rootfinding.bisection(f, x_0, x_1, eps, max_its);
            return root_or_raise(rootfinding, output);
        }, R"pbdoc(
            Solve f == 0 using bisection starting with the interval [x_0, x_1]. f(x_0) and f(x_1) must differ in sign.

            :raises ConvergenceError: if the solver fails to converge
            :raises ValueError: if f(x) has the same sign at both endpoints
            )pbdoc", "f"_a, "x_0"_a, "x_1"_a, "eps"_a=1.0e-5, "max_its"_a=20);

    m.def("solve", [](std::function<double(double)> f, std::function<double(double)> df,
                      double x_0, double x_1, double eps, int max_its_n, int max_its_b)
        {
            RootFinding rootfinding;
            int output = rootfinding.solve(f, df, x_0, x_1, eps, max_its_n, max_its_b);
            return root_or_raise(rootfinding, output);
        }, R"pbdoc(
            Solve f == 0 using Newton-Raphson iteration, falling back to bisection if the former fails.

            :raises ConvergenceError: if the bisection fallback fails to converge
            :raises ValueError: if the bisection fallback finds f(x) of the same sign at both endpoints
            )pbdoc", "f"_a, "df"_a, "x_0"_a, "x_1"_a, "eps"_a=1.0e-5, "max_its_n"_a=20, "max_its_b"_a=20);

    py::class_<RootFinding> rootfinding(m, "RootFinding", R"pbdoc(
            This class contains methods to find the root of an equation using Newton-Raphson, bisection or both.
            Methods return an output code, the root is obtained with getx().
            )pbdoc");

    py::enum_<RootFinding::Output>(rootfinding, "Output", "Output codes of the root finding methods")
        .value("SUCCESS", RootFinding::Output::SUCCESS)
        .value("CONVERGENCE_FAILURE", RootFinding::Output::CONVERGENCE_FAILURE)
        .value("INVALID_BRACKET_SIGN", RootFinding::Output::INVALID_BRACKET_SIGN)
        .export_values()
        ;

    rootfinding.def(py::init<>())
        .def(py::init<const RootFindingParams&>(), "params"_a)

        .def("newton_raphson", py::overload_cast<std::function<double(double)>, std::function<double(double)>, double, double, int>(&RootFinding::newton_raphson),
             "f"_a, "df"_a, "x_0"_a, "eps"_a, "max_its"_a)
        .def("newton_raphson", py::overload_cast<std::function<double(double)>, std::function<double(double)>, double>(&RootFinding::newton_raphson),
             "f"_a, "df"_a, "x_0"_a)
        .def("bisection", py::overload_cast<std::function<double(double)>, double, double, double, int>(&RootFinding::bisection),
             "f"_a, "x_0"_a, "x_1"_a, "eps"_a, "max_its"_a)
        .def("bisection", py::overload_cast<std::function<double(double)>, double, double>(&RootFinding::bisection),
             "f"_a, "x_0"_a, "x_1"_a)
        .def("solve", py::overload_cast<std::function<double(double)>, std::function<double(double)>, double, double, double, int, int>(&RootFinding::solve),
             "f"_a, "df"_a, "x_0"_a, "x_1"_a, "eps"_a, "max_its_n"_a, "max_its_b"_a)
        .def("solve", py::overload_cast<std::function<double(double)>, std::function<double(double)>, double, double>(&RootFinding::solve),
             "f"_a, "df"_a, "x_0"_a, "x_1"_a)

        .def("getx", &RootFinding::getx)
        .def("get_last_x", &RootFinding::get_last_x)
        .def("get_last_residual", &RootFinding::get_last_residual)
        .def("get_iterations", &RootFinding::get_iterations)
        .def("get_function_evaluations", &RootFinding::get_function_evaluations)
        .def("get_gradient_evaluations", &RootFinding::get_gradient_evaluations)
        .def("used_fallback", &RootFinding::used_fallback)
        .def("get_message", &RootFinding::get_message)
        .def("get_params", &RootFinding::get_params, py::return_value_policy::reference_internal)
        ;

    py::class_<RootSweep>(m, "RootSweep", R"pbdoc(
            This class solves f(x, p) == 0 for each entry of an array of parameter values p.
            )pbdoc")
        .def(py::init<>())
        .def(py::init<const RootFindingParams&>(), "params"_a)

        .def("solve", py::overload_cast<RootSweep::ParametrisedFunction, RootSweep::ParametrisedFunction,
                                        const Eigen::VectorXd&, const Eigen::VectorXd&, const Eigen::VectorXd&>(&RootSweep::solve),
             R"pbdoc(
            :param f: Function f(x, p)
            :param df: Derivative of f with respect to x
            :param p: Parameter values
            :param x_0: Initial values of x and left ends of the brackets
            :param x_1: Right ends of the brackets
            :returns: Number of failed entries
            )pbdoc", "f"_a, "df"_a, "p"_a, "x_0"_a, "x_1"_a)
        .def("solve", py::overload_cast<RootSweep::ParametrisedFunction, RootSweep::ParametrisedFunction,
                                        const Eigen::VectorXd&, double, double>(&RootSweep::solve),
             "f"_a, "df"_a, "p"_a, "x_0"_a, "x_1"_a)
        .def("roots", &RootSweep::roots)
        .def("status", &RootSweep::status)
        .def("get_failed", &RootSweep::get_failed)
        .def("get_params", &RootSweep::get_params, py::return_value_policy::reference_internal)
        ;
}
