#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "libthetamap/estimation_system.hpp"
#include "libthetamap/numeric_inverse.hpp"
#include "libthetamap/parameter_transform.hpp"
#include "libthetamap/state_space.hpp"
#include "libthetamap/theta_map.hpp"

namespace py = pybind11;
using namespace libthetamap;

PYBIND11_MODULE(_libthetamap, m) {
    m.doc() = "libthetamap python bindings";

    py::enum_<SystemParameter>(m, "SystemParameter")
        .value("Z", SystemParameter::Z)
        .value("d", SystemParameter::d)
        .value("beta", SystemParameter::beta)
        .value("H", SystemParameter::H)
        .value("T", SystemParameter::T)
        .value("c", SystemParameter::c)
        .value("gamma", SystemParameter::gamma)
        .value("R", SystemParameter::R)
        .value("Q", SystemParameter::Q)
        .value("a0", SystemParameter::a0)
        .value("P0", SystemParameter::P0)
        .export_values();

    py::register_exception<BoundViolation>(m, "BoundViolation", PyExc_ValueError);
    py::register_exception<InconsistentSystem>(m, "InconsistentSystem", PyExc_ValueError);

    // Time-invariant systems only; slices are exchanged as dense matrices.
    py::class_<StateSpace>(m, "StateSpace")
        .def(py::init([](const Eigen::MatrixXd& Z, const Eigen::MatrixXd& H, const Eigen::MatrixXd& T,
                         const Eigen::MatrixXd& Q) { return StateSpace(Z, H, T, Q); }),
             py::arg("Z"), py::arg("H"), py::arg("T"), py::arg("Q"))
        .def("with_matrix",
             [](const StateSpace& self, SystemParameter parameter, const Eigen::MatrixXd& value) {
                 return self.with(parameter, StateSpace::Matrix(value));
             },
             py::arg("parameter"), py::arg("value"))
        .def("without",
             [](const StateSpace& self, SystemParameter parameter) { return self.with(parameter, {}); },
             py::arg("parameter"))
        .def("get",
             [](const StateSpace& self, SystemParameter parameter) -> Eigen::MatrixXd {
                 if (!self.has(parameter)) {
                     throw py::key_error(std::string(parameter_name(parameter)));
                 }
                 return self[parameter].slices.front();
             },
             py::arg("parameter"))
        .def("has", &StateSpace::has)
        .def_property_readonly("p", &StateSpace::p)
        .def_property_readonly("m", &StateSpace::m)
        .def_property_readonly("g", &StateSpace::g);

    py::class_<IndexStateSpace>(m, "IndexStateSpace")
        .def("get",
             [](const IndexStateSpace& self, SystemParameter parameter) -> Eigen::MatrixXi {
                 if (!self.has(parameter)) {
                     throw py::key_error(std::string(parameter_name(parameter)));
                 }
                 return self[parameter].slices.front();
             },
             py::arg("parameter"))
        .def("has", &IndexStateSpace::has);

    py::class_<SolverOptions>(m, "SolverOptions")
        .def(py::init<>())
        .def_readwrite("max_iterations", &SolverOptions::max_iterations)
        .def_readwrite("max_function_evaluations", &SolverOptions::max_function_evaluations)
        .def_readwrite("random_seed", &SolverOptions::random_seed)
        .def_readwrite("restarts", &SolverOptions::restarts)
        .def_readwrite("tolerance", &SolverOptions::tolerance)
        .def_readwrite("residual_tolerance", &SolverOptions::residual_tolerance)
        .def_readwrite("max_linesearch", &SolverOptions::max_linesearch)
        .def_readwrite("verbose", &SolverOptions::verbose);

    py::class_<ComponentFit>(m, "ComponentFit")
        .def_readonly("theta_indexes", &ComponentFit::theta_indexes)
        .def_readonly("values", &ComponentFit::values)
        .def_readonly("residual", &ComponentFit::residual)
        .def_readonly("iterations", &ComponentFit::iterations)
        .def_readonly("function_evaluations", &ComponentFit::function_evaluations)
        .def_readonly("converged", &ComponentFit::converged)
        .def_readonly("message", &ComponentFit::message);

    py::class_<ThetaRecovery>(m, "ThetaRecovery")
        .def_readonly("theta", &ThetaRecovery::theta)
        .def_readonly("psi", &ThetaRecovery::psi)
        .def_readonly("components", &ThetaRecovery::components)
        .def_readonly("max_residual", &ThetaRecovery::max_residual)
        .def_readonly("warnings", &ThetaRecovery::warnings)
        .def("accurate", &ThetaRecovery::accurate);

    py::class_<EstimationSystem>(m, "EstimationSystem")
        .def(py::init<StateSpace>(), py::arg("values"))
        .def("set_variable",
             [](EstimationSystem& self, SystemParameter parameter, std::size_t row, std::size_t col,
                const std::string& name) { self.set_entry(parameter, row, col, FreeVariable{name}); },
             py::arg("parameter"), py::arg("row"), py::arg("col"), py::arg("name"))
        .def("set_value",
             [](EstimationSystem& self, SystemParameter parameter, std::size_t row, std::size_t col, double value) {
                 self.set_entry(parameter, row, col, Literal{value});
             },
             py::arg("parameter"), py::arg("row"), py::arg("col"), py::arg("value"))
        .def("set_expression",
             [](EstimationSystem& self, SystemParameter parameter, std::size_t row, std::size_t col,
                const std::string& key, const std::vector<std::string>& variables, PsiFunction evaluate,
                std::optional<PsiInverse> inverse) {
                 self.set_entry(parameter, row, col,
                                Expression{key, variables, std::move(evaluate), inverse ? *inverse : PsiInverse{}});
             },
             py::arg("parameter"), py::arg("row"), py::arg("col"), py::arg("key"), py::arg("variables"),
             py::arg("evaluate"), py::arg("inverse") = py::none());

    py::class_<ThetaMap>(m, "ThetaMap")
        .def_static("for_estimation", &ThetaMap::for_estimation, py::arg("system"))
        .def_static("for_all_parameters", &ThetaMap::for_all_parameters, py::arg("system"),
                    py::arg("include_initial") = false)
        .def("theta_to_system", &ThetaMap::theta_to_system, py::arg("theta"))
        .def("system_to_theta", &ThetaMap::system_to_theta, py::arg("system"),
             py::arg("options") = SolverOptions{})
        .def("recover_theta", &ThetaMap::recover_theta, py::arg("system"), py::arg("options") = SolverOptions{})
        .def("compute_psi", &ThetaMap::compute_psi, py::arg("theta"))
        .def("restrict_theta", &ThetaMap::restrict_theta, py::arg("unconstrained"))
        .def("unrestrict_theta", &ThetaMap::unrestrict_theta, py::arg("theta"))
        .def("restricted_theta_gradient", &ThetaMap::restricted_theta_gradient, py::arg("unconstrained"))
        .def("set_theta_bounds",
             py::overload_cast<const std::string&, std::optional<double>, std::optional<double>>(
                 &ThetaMap::set_theta_bounds, py::const_),
             py::arg("name"), py::arg("lower") = py::none(), py::arg("upper") = py::none())
        .def("set_theta_bounds",
             py::overload_cast<std::size_t, std::optional<double>, std::optional<double>>(
                 &ThetaMap::set_theta_bounds, py::const_),
             py::arg("index"), py::arg("lower") = py::none(), py::arg("upper") = py::none())
        .def("add_restrictions", &ThetaMap::add_restrictions, py::arg("lower"), py::arg("upper"))
        .def("update_initial", &ThetaMap::update_initial, py::arg("a0") = py::none(), py::arg("P0") = py::none())
        .def("compressed", &ThetaMap::compressed)
        .def("parameter_report", &ThetaMap::parameter_report)
        .def_property_readonly("n_theta", &ThetaMap::n_theta)
        .def_property_readonly("n_psi", &ThetaMap::n_psi)
        .def_property_readonly("theta_names", &ThetaMap::theta_names)
        .def_property_readonly("theta_lower_bound", &ThetaMap::theta_lower_bound)
        .def_property_readonly("theta_upper_bound", &ThetaMap::theta_upper_bound)
        .def_property_readonly("lower_bound", &ThetaMap::lower_bound)
        .def_property_readonly("upper_bound", &ThetaMap::upper_bound)
        .def_property_readonly("fixed", &ThetaMap::fixed)
        .def_property_readonly("index", &ThetaMap::index)
        .def_property_readonly("transformation_index", &ThetaMap::transformation_index)
        // Registry slot k is entry k - 1.
        .def_property_readonly("transforms",
                               [](const ThetaMap& self) {
                                   std::vector<std::string> names;
                                   for (const auto& transform : self.transforms().transforms()) {
                                       names.push_back(describe(transform));
                                   }
                                   return names;
                               })
        .def_property_readonly("explicit_a0", &ThetaMap::explicit_a0)
        .def_property_readonly("explicit_P0", &ThetaMap::explicit_P0)
        .def_property_readonly("P0_from_factor", &ThetaMap::P0_from_factor);
}
