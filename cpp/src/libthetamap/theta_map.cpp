#include "libthetamap/theta_map.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

namespace libthetamap {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

std::string violation_message(BoundSide side, const std::vector<std::string>& parameters) {
    return std::string(side == BoundSide::Lower ? "lower" : "upper") + " bound violated in " +
           join_names(parameters);
}

bool is_upper_triangle(const EntryLocation& location) noexcept {
    return is_symmetric_parameter(location.parameter) && location.row < location.col;
}

EntryLocation transposed(const EntryLocation& location) noexcept {
    return EntryLocation{location.parameter, location.slice, location.col, location.row};
}

bool psi_values_agree(double a, double b) noexcept {
    const double scale = std::max({1.0, std::abs(a), std::abs(b)});
    return std::abs(a - b) <= 1e4 * std::numeric_limits<double>::epsilon() * scale;
}

}  // namespace

BoundViolation::BoundViolation(BoundSide side, std::vector<std::string> parameters)
    : std::out_of_range(violation_message(side, parameters)), side_(side), parameters_(std::move(parameters)) {}

ThetaMap::ThetaMap(IndexSystem structure, TransformRegistry transforms, ThetaMapOptions options)
    : structure_(std::move(structure)), transforms_(std::move(transforms)) {
    const bool with_a0 = structure_.fixed.has_a0();
    const bool with_P0 = structure_.fixed.has_P0();
    structure_.fixed.validate();
    structure_.index.validate();
    structure_.transformation_index.validate();
    if (structure_.index.has_a0() != with_a0 || structure_.transformation_index.has_a0() != with_a0) {
        throw std::invalid_argument("a0 must be present in all index systems or none");
    }
    if (structure_.index.has_P0() != with_P0 || structure_.transformation_index.has_P0() != with_P0) {
        throw std::invalid_argument("P0 must be present in all index systems or none");
    }
    structure_.fixed.check_conforming(structure_.index, with_a0, with_P0);
    structure_.fixed.check_conforming(structure_.transformation_index, with_a0, with_P0);

    const auto index = structure_.index.vectorize(with_a0, with_P0);
    int max_index = 0;
    for (int value : index) {
        if (value < 0) {
            throw std::invalid_argument("psi indexes must be non-negative");
        }
        max_index = std::max(max_index, value);
    }

    std::size_t n_theta = 0;
    if (options.psi.empty()) {
        // theta and psi coincide
        n_theta = static_cast<std::size_t>(max_index);
        psi_.reserve(n_theta);
        for (std::size_t i = 0; i < n_theta; ++i) {
            psi_.push_back(PsiDefinition::identity(i));
        }
    } else {
        psi_ = std::move(options.psi);
        for (const auto& definition : psi_) {
            for (auto theta_index : definition.theta_indexes) {
                n_theta = std::max(n_theta, theta_index + 1);
            }
        }
    }
    if (static_cast<std::size_t>(max_index) > psi_.size()) {
        throw std::invalid_argument("index refers to psi slot " + std::to_string(max_index) + " but only " +
                                    std::to_string(psi_.size()) + " are defined");
    }

    if (options.names.empty()) {
        for (std::size_t i = 0; i < n_theta; ++i) {
            theta_.register_anonymous();
        }
    } else {
        if (options.names.size() < n_theta) {
            throw std::invalid_argument("theta names must cover every slot read by psi");
        }
        theta_ = ThetaCatalog(std::move(options.names));
    }
    theta_.conform_bounds();

    validate_structure();

    // Entries start out bounded by the range of their transform.
    const auto transformation = structure_.transformation_index.vectorize(with_a0, with_P0);
    std::vector<double> lower(index.size(), -kInf);
    std::vector<double> upper(index.size(), kInf);
    for (std::size_t i = 0; i < index.size(); ++i) {
        if (index[i] != 0) {
            const auto range = constrained_range(transforms_.at(static_cast<std::size_t>(transformation[i])));
            lower[i] = range.first;
            upper[i] = range.second;
        }
    }
    lower_bound_ = structure_.fixed.reshape(lower, with_a0, with_P0);
    upper_bound_ = structure_.fixed.reshape(upper, with_a0, with_P0);

    *this = add_restrictions(lower_bound_, upper_bound_);
}

void ThetaMap::validate_structure() const {
    const bool with_a0 = explicit_a0();
    const bool with_P0 = explicit_P0();
    const auto fixed = structure_.fixed.vectorize(with_a0, with_P0);
    const auto index = structure_.index.vectorize(with_a0, with_P0);
    const auto transformation = structure_.transformation_index.vectorize(with_a0, with_P0);
    const auto locations = structure_.fixed.entry_locations(with_a0, with_P0);

    for (std::size_t i = 0; i < fixed.size(); ++i) {
        const std::string name(parameter_name(locations[i].parameter));
        if (std::isnan(fixed[i])) {
            throw std::invalid_argument("fixed values of " + name + " must be defined");
        }
        if (transformation[i] < 0) {
            throw std::invalid_argument("transformation indexes of " + name + " must be non-negative");
        }
        if (index[i] == 0) {
            continue;
        }
        if (fixed[i] != 0.0) {
            throw std::invalid_argument("entries of " + name + " determined by theta must be 0 in the fixed system");
        }
        if (transformation[i] == 0 || static_cast<std::size_t>(transformation[i]) > transforms_.size()) {
            throw std::invalid_argument("entries of " + name + " need a transformation index between 1 and " +
                                        std::to_string(transforms_.size()));
        }
    }

    for (std::size_t j = 0; j < psi_.size(); ++j) {
        const auto& definition = psi_[j];
        if (definition.theta_indexes.empty()) {
            throw std::invalid_argument("psi slot " + std::to_string(j + 1) + " reads no theta");
        }
        if (!definition.evaluate) {
            throw std::invalid_argument("psi slot " + std::to_string(j + 1) + " has no evaluator");
        }
        if (definition.inverse && definition.theta_indexes.size() != 1) {
            throw std::invalid_argument("psi slot " + std::to_string(j + 1) +
                                        " has a closed-form inverse but reads several theta");
        }
        for (auto theta_index : definition.theta_indexes) {
            if (theta_index >= theta_.size()) {
                throw std::invalid_argument("psi slot " + std::to_string(j + 1) + " reads a missing theta");
            }
        }
    }
}

ThetaMap ThetaMap::for_estimation(const EstimationSystem& system) {
    const StateSpace& shape = system.shape();
    const bool with_a0 = shape.has_a0();
    const bool with_P0 = shape.has_P0();
    const auto locations = system.locations();
    const auto& entries = system.entries();
    const std::size_t count = entries.size();

    ThetaCatalog catalog;
    std::vector<PsiDefinition> psi;
    std::map<std::string, std::size_t> shared_psi;
    std::map<std::string, std::vector<std::string>> expression_variables;
    std::vector<int> index(count, 0);
    std::vector<double> fixed(count, 0.0);

    // Named variables and expressions take the first theta slots, in order of
    // first appearance.
    for (std::size_t i = 0; i < count; ++i) {
        if (is_upper_triangle(locations[i])) {
            continue;
        }
        const auto& entry = entries[i];
        if (const auto* literal = std::get_if<Literal>(&entry)) {
            fixed[i] = literal->value;
        } else if (const auto* variable = std::get_if<FreeVariable>(&entry)) {
            if (variable->name.empty()) {
                continue;
            }
            const std::string key = "var:" + variable->name;
            auto it = shared_psi.find(key);
            if (it == shared_psi.end()) {
                psi.push_back(PsiDefinition::identity(catalog.register_theta(variable->name)));
                it = shared_psi.emplace(key, psi.size()).first;
            }
            index[i] = static_cast<int>(it->second);
        } else {
            const auto& expression = std::get<Expression>(entry);
            const std::string key = "expr:" + expression.key;
            auto it = shared_psi.find(key);
            if (it == shared_psi.end()) {
                PsiDefinition definition;
                for (const auto& variable_name : expression.variables) {
                    definition.theta_indexes.push_back(catalog.register_theta(variable_name));
                }
                definition.evaluate = expression.evaluate;
                definition.inverse = expression.inverse;
                psi.push_back(std::move(definition));
                expression_variables.emplace(expression.key, expression.variables);
                it = shared_psi.emplace(key, psi.size()).first;
            } else if (expression_variables[expression.key] != expression.variables) {
                throw std::invalid_argument("expression " + expression.key +
                                            " is used with different variables");
            }
            index[i] = static_cast<int>(it->second);
        }
    }

    // Anonymous free entries follow, one slot each.
    for (std::size_t i = 0; i < count; ++i) {
        if (is_upper_triangle(locations[i])) {
            continue;
        }
        const auto* variable = std::get_if<FreeVariable>(&entries[i]);
        if (variable != nullptr && variable->name.empty()) {
            psi.push_back(PsiDefinition::identity(catalog.register_anonymous()));
            index[i] = static_cast<int>(psi.size());
        }
    }

    // Upper triangles of H, Q and P0 mirror the lower triangle.
    for (std::size_t i = 0; i < count; ++i) {
        if (!is_upper_triangle(locations[i])) {
            continue;
        }
        const std::size_t mirror = shape.offset_of(transposed(locations[i]), with_a0, with_P0);
        const std::string name(parameter_name(locations[i].parameter));
        if (is_free(entries[i]) != is_free(entries[mirror])) {
            throw std::invalid_argument("free entries of " + name + " must be symmetric");
        }
        const auto* literal = std::get_if<Literal>(&entries[i]);
        if (literal != nullptr && literal->value != fixed[mirror]) {
            throw std::invalid_argument("fixed entries of " + name + " must be symmetric");
        }
        index[i] = index[mirror];
        fixed[i] = fixed[mirror];
    }

    std::vector<int> transformation(count, 0);
    for (std::size_t i = 0; i < count; ++i) {
        transformation[i] = index[i] != 0 ? 1 : 0;
    }

    IndexSystem structure{shape.reshape(fixed, with_a0, with_P0), shape.reshape(index, with_a0, with_P0),
                          shape.reshape(transformation, with_a0, with_P0)};
    ThetaMapOptions options{std::move(psi), catalog.names()};
    return ThetaMap(std::move(structure), TransformRegistry::identity_only(), std::move(options));
}

ThetaMap ThetaMap::for_all_parameters(const StateSpace& system, bool include_initial) {
    auto map = for_estimation(EstimationSystem(system.filled(kNaN, false)));
    if (!include_initial) {
        return map;
    }
    const auto m = static_cast<Eigen::Index>(system.m());
    return map.update_initial(Eigen::VectorXd::Constant(m, kNaN).eval(), Eigen::MatrixXd::Constant(m, m, kNaN).eval());
}

std::vector<double> ThetaMap::compute_psi(const std::vector<double>& theta) const {
    if (theta.size() != n_theta()) {
        throw std::invalid_argument("theta vector size mismatch: expected " + std::to_string(n_theta()) +
                                    ", got " + std::to_string(theta.size()));
    }
    std::vector<double> psi(psi_.size());
    for (std::size_t j = 0; j < psi_.size(); ++j) {
        psi[j] = psi_[j](theta);
    }
    return psi;
}

StateSpace ThetaMap::theta_to_system(const std::vector<double>& theta) const {
    for (double value : theta) {
        if (std::isnan(value)) {
            throw std::invalid_argument("theta must be fully defined");
        }
    }
    const auto psi = compute_psi(theta);

    const bool with_a0 = explicit_a0();
    const bool with_P0 = explicit_P0();
    auto values = structure_.fixed.vectorize(with_a0, with_P0);
    const auto index = structure_.index.vectorize(with_a0, with_P0);
    const auto transformation = structure_.transformation_index.vectorize(with_a0, with_P0);
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (index[i] != 0) {
            const auto& transform = transforms_.at(static_cast<std::size_t>(transformation[i]));
            values[i] = to_constrained(transform, psi[static_cast<std::size_t>(index[i]) - 1]);
        }
    }
    auto system = structure_.fixed.reshape(values, with_a0, with_P0);
    if (P0_from_factor_) {
        const Eigen::MatrixXd root = system[SystemParameter::P0].slices.front().triangularView<Eigen::Lower>();
        Eigen::MatrixXd lower = Eigen::MatrixXd::Zero(root.rows(), root.cols());
        lower.selfadjointView<Eigen::Lower>().rankUpdate(root);
        const Eigen::MatrixXd P0 = lower.selfadjointView<Eigen::Lower>();
        system = system.with(SystemParameter::P0, StateSpace::Matrix(P0));
    }
    return system;
}

std::vector<double> ThetaMap::system_to_theta(const StateSpace& system, const SolverOptions& options) const {
    return recover_theta(system, options).theta;
}

ThetaRecovery ThetaMap::recover_theta(const StateSpace& system, const SolverOptions& options) const {
    const bool with_a0 = explicit_a0();
    const bool with_P0 = explicit_P0();
    structure_.fixed.check_conforming(system, with_a0, with_P0);

    auto values = system.vectorize(with_a0, with_P0);
    if (P0_from_factor_) {
        factor_P0(system, values);
    }
    const auto index = structure_.index.vectorize(with_a0, with_P0);
    const auto transformation = structure_.transformation_index.vectorize(with_a0, with_P0);
    const auto lower = lower_bound_.vectorize(with_a0, with_P0);
    const auto upper = upper_bound_.vectorize(with_a0, with_P0);
    const auto locations = structure_.fixed.entry_locations(with_a0, with_P0);

    std::vector<bool> below(values.size(), false);
    std::vector<bool> above(values.size(), false);
    bool any_below = false;
    bool any_above = false;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (index[i] == 0) {
            continue;
        }
        if (std::isnan(values[i])) {
            throw std::invalid_argument("estimated entries of " + std::string(parameter_name(locations[i].parameter)) +
                                        " must be defined");
        }
        below[i] = values[i] < lower[i];
        above[i] = values[i] > upper[i];
        any_below = any_below || below[i];
        any_above = any_above || above[i];
    }
    if (any_below) {
        throw BoundViolation(BoundSide::Lower, parameters_with(below));
    }
    if (any_above) {
        throw BoundViolation(BoundSide::Upper, parameters_with(above));
    }

    ThetaRecovery recovery;
    recovery.psi.assign(psi_.size(), kNaN);
    std::vector<bool> finite_seen(psi_.size(), false);
    std::vector<bool> disagreeing(values.size(), false);
    std::vector<std::size_t> first_entry(psi_.size(), values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (index[i] == 0) {
            continue;
        }
        const auto slot = static_cast<std::size_t>(index[i]) - 1;
        const auto& transform = transforms_.at(static_cast<std::size_t>(transformation[i]));
        const double value = to_unconstrained(transform, values[i]);
        if (first_entry[slot] == values.size()) {
            first_entry[slot] = i;
        }
        if (!std::isfinite(value)) {
            // On a bound; any finite neighbour takes precedence.
            if (!finite_seen[slot]) {
                recovery.psi[slot] = value;
            }
            continue;
        }
        if (finite_seen[slot] && !psi_values_agree(recovery.psi[slot], value)) {
            disagreeing[first_entry[slot]] = true;
            disagreeing[i] = true;
            throw InconsistentSystem("entries sharing psi slot " + std::to_string(slot + 1) +
                                     " imply different values in " + join_names(parameters_with(disagreeing)));
        }
        if (!finite_seen[slot]) {
            recovery.psi[slot] = value;
            finite_seen[slot] = true;
        }
    }

    recovery.theta.assign(n_theta(), kNaN);
    std::vector<bool> unresolved(n_theta(), true);
    for (std::size_t j = 0; j < psi_.size(); ++j) {
        const auto& definition = psi_[j];
        if (!definition.has_closed_form_inverse()) {
            continue;
        }
        const auto theta_index = definition.theta_indexes.front();
        if (unresolved[theta_index]) {
            recovery.theta[theta_index] = definition.inverse(recovery.psi[j]);
            unresolved[theta_index] = false;
        }
    }

    const auto components = codetermined_components(psi_, unresolved);
    if (components.empty()) {
        return recovery;
    }

    const NumericInverseSolver solver(options);
    for (std::size_t k = 0; k < components.size(); ++k) {
        auto fit = solver.solve(psi_, recovery.psi, components[k], recovery.theta, theta_.lower_bounds(),
                                theta_.upper_bounds(), k);
        for (std::size_t i = 0; i < fit.theta_indexes.size(); ++i) {
            recovery.theta[fit.theta_indexes[i]] = fit.values[i];
        }
        recovery.max_residual = std::max(recovery.max_residual, fit.residual);
        if (!(fit.residual <= options.residual_tolerance)) {
            std::vector<std::string> names;
            for (auto theta_index : fit.theta_indexes) {
                names.push_back(theta_.names()[theta_index]);
            }
            std::ostringstream warning;
            warning << "bad numeric inverse from psi to theta for " << join_names(names)
                    << ": residual " << fit.residual << " (" << fit.message << ")";
            recovery.warnings.push_back(warning.str());
            std::cerr << "ThetaMap warning: " << warning.str() << std::endl;
        }
        recovery.components.push_back(std::move(fit));
    }
    return recovery;
}

std::vector<double> ThetaMap::restrict_theta(const std::vector<double>& unconstrained) const {
    return theta_.constrain(unconstrained);
}

std::vector<double> ThetaMap::unrestrict_theta(const std::vector<double>& theta) const {
    return theta_.unconstrain(theta);
}

Eigen::MatrixXd ThetaMap::restricted_theta_gradient(const std::vector<double>& unconstrained) const {
    const auto derivatives = theta_.constrained_derivatives(unconstrained);
    Eigen::VectorXd diagonal = Eigen::Map<const Eigen::VectorXd>(derivatives.data(),
                                                                 static_cast<Eigen::Index>(derivatives.size()));
    return Eigen::MatrixXd(diagonal.asDiagonal());
}

ThetaMap ThetaMap::set_theta_bounds(std::size_t theta_index, std::optional<double> lower,
                                    std::optional<double> upper) const {
    if (theta_index >= n_theta()) {
        throw std::out_of_range("theta index " + std::to_string(theta_index) + " out of range");
    }
    ThetaMap result = *this;
    result.theta_.set_bounds(theta_index, lower.value_or(theta_.lower_bounds()[theta_index]),
                             upper.value_or(theta_.upper_bounds()[theta_index]));
    return result;
}

ThetaMap ThetaMap::set_theta_bounds(const std::string& name, std::optional<double> lower,
                                    std::optional<double> upper) const {
    const auto theta_index = theta_.find_index(name);
    if (theta_index == ThetaCatalog::npos) {
        throw std::invalid_argument("unknown theta name: " + name);
    }
    return set_theta_bounds(theta_index, lower, upper);
}

std::vector<std::string> ThetaMap::parameter_report() const {
    const bool with_a0 = explicit_a0();
    const bool with_P0 = explicit_P0();
    const auto index = structure_.index.vectorize(with_a0, with_P0);

    std::vector<std::string> report;
    report.reserve(n_theta());
    for (std::size_t t = 0; t < n_theta(); ++t) {
        std::vector<bool> touched(index.size(), false);
        for (std::size_t i = 0; i < index.size(); ++i) {
            if (index[i] != 0) {
                touched[i] = psi_[static_cast<std::size_t>(index[i]) - 1].reads(t);
            }
        }
        report.push_back(join_names(parameters_with(touched)));
    }
    return report;
}

void ThetaMap::factor_P0(const StateSpace& system, std::vector<double>& values) const {
    const auto& P0 = system[SystemParameter::P0].slices.front();
    if (P0.hasNaN()) {
        throw std::invalid_argument("estimated entries of P0 must be defined");
    }
    for (Eigen::Index col = 0; col < P0.cols(); ++col) {
        for (Eigen::Index row = col + 1; row < P0.rows(); ++row) {
            if (!psi_values_agree(P0(row, col), P0(col, row))) {
                throw InconsistentSystem("P0 is not symmetric");
            }
        }
    }
    const Eigen::LLT<Eigen::MatrixXd> llt(P0);
    if (llt.info() != Eigen::Success) {
        // Every assembled P0 is positive definite.
        throw BoundViolation(BoundSide::Lower, std::vector<std::string>{"P0"});
    }
    const Eigen::MatrixXd root = llt.matrixL();
    for (Eigen::Index col = 0; col < root.cols(); ++col) {
        for (Eigen::Index row = 0; row < root.rows(); ++row) {
            const EntryLocation location{SystemParameter::P0, 0, static_cast<std::size_t>(row),
                                         static_cast<std::size_t>(col)};
            values[structure_.fixed.offset_of(location, explicit_a0(), true)] = root(row, col);
        }
    }
}

std::vector<std::string> ThetaMap::parameters_with(const std::vector<bool>& entry_flags) const {
    const auto locations = structure_.fixed.entry_locations(explicit_a0(), explicit_P0());
    std::vector<bool> flagged(kParameterCount, false);
    for (std::size_t i = 0; i < locations.size() && i < entry_flags.size(); ++i) {
        if (entry_flags[i]) {
            flagged[parameter_position(locations[i].parameter)] = true;
        }
    }
    std::vector<std::string> names;
    for (auto parameter : kAllParameters) {
        if (flagged[parameter_position(parameter)]) {
            names.emplace_back(parameter_name(parameter));
        }
    }
    return names;
}

}  // namespace libthetamap
