#include <pybind11/pybind11.h>
#include <pybind11/stl_bind.h>
#include <pybind11/stl.h>

namespace py = pybind11;

void pybind_global(py::module &);
void pybind_maths(py::module &);


PYBIND11_MODULE(libnlsolvers, m) {
    m.doc() = R"pbdoc(
        This is the documentation of `nlsolvers.libnlsolvers`.

        In the libnlsolvers module, the user can find roots of scalar nonlinear equations f(x) = 0:
        - Newton-Raphson iteration
        - Bisection of a bracketing interval
        - Newton-Raphson with bisection fallback, for single equations and parameter sweeps
        )pbdoc" ;

    pybind_global(m);
    pybind_maths(m);
}
