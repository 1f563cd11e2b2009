#include <pybind11/complex.h>
#include <pybind11/pybind11.h>

#include <complex>

#include <orthopoly.hpp>
#include <orthopoly/revision.hpp>

namespace py = pybind11;
using OrthoPoly::Complex;

/*
 * Each family is registered with its integer degree overload first so that a
 * Python int degree selects the recurrence, and a float degree the
 * hypergeometric form (real or complex argument).
 */
PYBIND11_MODULE(PyOrthoPoly, m) {
  m.attr("revision") = OrthoPoly::version::revision;
  m.attr("git_state") = OrthoPoly::version::git_state;

  m.def("eval_jacobi",
        static_cast<double (*)(long, double, double, double)>(
            &OrthoPoly::jacobi),
        py::arg("n"), py::arg("alpha"), py::arg("beta"), py::arg("x"))
      .def("eval_jacobi", &OrthoPoly::jacobi<double>, py::arg("n"),
           py::arg("alpha"), py::arg("beta"), py::arg("x"))
      .def("eval_jacobi", &OrthoPoly::jacobi<Complex>, py::arg("n"),
           py::arg("alpha"), py::arg("beta"), py::arg("x"));

  m.def("eval_sh_jacobi",
        static_cast<double (*)(long, double, double, double)>(
            &OrthoPoly::sh_jacobi),
        py::arg("n"), py::arg("p"), py::arg("q"), py::arg("x"))
      .def("eval_sh_jacobi", &OrthoPoly::sh_jacobi<double>, py::arg("n"),
           py::arg("p"), py::arg("q"), py::arg("x"))
      .def("eval_sh_jacobi", &OrthoPoly::sh_jacobi<Complex>, py::arg("n"),
           py::arg("p"), py::arg("q"), py::arg("x"));

  m.def("eval_gegenbauer",
        static_cast<double (*)(long, double, double)>(
            &OrthoPoly::gegenbauer),
        py::arg("n"), py::arg("alpha"), py::arg("x"))
      .def("eval_gegenbauer", &OrthoPoly::gegenbauer<double>, py::arg("n"),
           py::arg("alpha"), py::arg("x"))
      .def("eval_gegenbauer", &OrthoPoly::gegenbauer<Complex>, py::arg("n"),
           py::arg("alpha"), py::arg("x"));

  m.def("eval_genlaguerre",
        static_cast<double (*)(long, double, double)>(
            &OrthoPoly::genlaguerre),
        py::arg("n"), py::arg("alpha"), py::arg("x"))
      .def("eval_genlaguerre", &OrthoPoly::genlaguerre<double>, py::arg("n"),
           py::arg("alpha"), py::arg("x"))
      .def("eval_genlaguerre", &OrthoPoly::genlaguerre<Complex>, py::arg("n"),
           py::arg("alpha"), py::arg("x"));

#define ORTHOPOLY_DEF_ONE_PARAMETER(name)                                      \
  m.def("eval_" #name,                                                         \
        static_cast<double (*)(long, double)>(&OrthoPoly::name),               \
        py::arg("n"), py::arg("x"))                                            \
      .def("eval_" #name, &OrthoPoly::name<double>, py::arg("n"),              \
           py::arg("x"))                                                       \
      .def("eval_" #name, &OrthoPoly::name<Complex>, py::arg("n"),             \
           py::arg("x"));

  ORTHOPOLY_DEF_ONE_PARAMETER(chebyt)
  ORTHOPOLY_DEF_ONE_PARAMETER(chebyu)
  ORTHOPOLY_DEF_ONE_PARAMETER(chebys)
  ORTHOPOLY_DEF_ONE_PARAMETER(chebyc)
  ORTHOPOLY_DEF_ONE_PARAMETER(sh_chebyt)
  ORTHOPOLY_DEF_ONE_PARAMETER(sh_chebyu)
  ORTHOPOLY_DEF_ONE_PARAMETER(legendre)
  ORTHOPOLY_DEF_ONE_PARAMETER(sh_legendre)
  ORTHOPOLY_DEF_ONE_PARAMETER(laguerre)
#undef ORTHOPOLY_DEF_ONE_PARAMETER

  // Hermite polynomials are only defined for integer degree
  m.def("eval_hermite", &OrthoPoly::hermite, py::arg("n"), py::arg("x"));
  m.def("eval_hermitenorm", &OrthoPoly::hermitenorm, py::arg("n"),
        py::arg("x"));
}
