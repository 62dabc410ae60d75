#include "libthetamap/theta_map.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace libthetamap {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// Value of `bounds` at `location`, or `fallback` when the matrix is absent.
double supplied_bound(const StateSpace& bounds, const EntryLocation& location, double fallback) {
    if (!bounds.has(location.parameter)) {
        return fallback;
    }
    const auto& slice = bounds[location.parameter].slices[location.slice];
    return slice(static_cast<Eigen::Index>(location.row), static_cast<Eigen::Index>(location.col));
}

void check_bound_system(const StateSpace& shape, const StateSpace& bounds, bool with_a0, bool with_P0) {
    shape.check_conforming(bounds, false, false);
    if (with_a0 && bounds.has_a0() && !shape[SystemParameter::a0].same_shape(bounds[SystemParameter::a0])) {
        throw std::invalid_argument("system does not conform in a0");
    }
    if (with_P0 && bounds.has_P0() && !shape[SystemParameter::P0].same_shape(bounds[SystemParameter::P0])) {
        throw std::invalid_argument("system does not conform in P0");
    }
}

}  // namespace

ThetaMap ThetaMap::add_restrictions(const StateSpace& lower, const StateSpace& upper) const {
    const bool with_a0 = explicit_a0();
    const bool with_P0 = explicit_P0();
    check_bound_system(structure_.fixed, lower, with_a0, with_P0);
    check_bound_system(structure_.fixed, upper, with_a0, with_P0);

    auto fixed = structure_.fixed.vectorize(with_a0, with_P0);
    auto index = structure_.index.vectorize(with_a0, with_P0);
    auto transformation = structure_.transformation_index.vectorize(with_a0, with_P0);
    auto lower_values = lower_bound_.vectorize(with_a0, with_P0);
    auto upper_values = upper_bound_.vectorize(with_a0, with_P0);
    const auto locations = structure_.fixed.entry_locations(with_a0, with_P0);

    ThetaMap result = *this;
    for (std::size_t i = 0; i < fixed.size(); ++i) {
        const auto& location = locations[i];
        // The upper triangle of a covariance follows the lower triangle. A
        // root factor of P0 has its own, fixed, upper triangle.
        const bool mirrored = is_symmetric_parameter(location.parameter) && location.row < location.col &&
                              !(location.parameter == SystemParameter::P0 && P0_from_factor_);
        const EntryLocation source =
            mirrored ? EntryLocation{location.parameter, location.slice, location.col, location.row} : location;
        double new_lower = std::max(lower_values[i], supplied_bound(lower, source, -kInf));
        double new_upper = std::min(upper_values[i], supplied_bound(upper, source, kInf));
        if (index[i] != 0 && is_symmetric_parameter(location.parameter) && location.row == location.col) {
            new_lower = std::max(new_lower, kVarianceFloor);
        }

        const bool changed = new_lower != lower_values[i] || new_upper != upper_values[i];
        if (index[i] != 0 && changed) {
            if (new_lower == new_upper) {
                fixed[i] = new_lower;
                index[i] = 0;
                transformation[i] = 0;
            } else if (new_lower < new_upper) {
                transformation[i] =
                    static_cast<int>(result.transforms_.find_or_add(make_bounded_transform(new_lower, new_upper)));
            }
        }
        lower_values[i] = new_lower;
        upper_values[i] = new_upper;
    }

    result.structure_.fixed = structure_.fixed.reshape(fixed, with_a0, with_P0);
    result.structure_.index = structure_.fixed.reshape(index, with_a0, with_P0);
    result.structure_.transformation_index = structure_.fixed.reshape(transformation, with_a0, with_P0);
    result.lower_bound_ = structure_.fixed.reshape(lower_values, with_a0, with_P0);
    result.upper_bound_ = structure_.fixed.reshape(upper_values, with_a0, with_P0);
    result.compress();
    return result;
}

ThetaMap ThetaMap::update_initial(const std::optional<Eigen::VectorXd>& a0,
                                  const std::optional<Eigen::MatrixXd>& P0) const {
    const auto m = static_cast<Eigen::Index>(structure_.fixed.m());
    ThetaMap result = *this;

    auto set_initial = [&result](SystemParameter parameter, const Eigen::MatrixXd& fixed, const Eigen::MatrixXi& index,
                                 const Eigen::MatrixXi& transformation, const Eigen::MatrixXd& lower,
                                 const Eigen::MatrixXd& upper) {
        result.structure_.fixed = result.structure_.fixed.with(parameter, StateSpace::Matrix(fixed));
        result.structure_.index = result.structure_.index.with(parameter, IndexStateSpace::Matrix(index));
        result.structure_.transformation_index =
            result.structure_.transformation_index.with(parameter, IndexStateSpace::Matrix(transformation));
        result.lower_bound_ = result.lower_bound_.with(parameter, StateSpace::Matrix(lower));
        result.upper_bound_ = result.upper_bound_.with(parameter, StateSpace::Matrix(upper));
    };
    auto clear_initial = [&result](SystemParameter parameter) {
        result.structure_.fixed = result.structure_.fixed.with(parameter, {});
        result.structure_.index = result.structure_.index.with(parameter, {});
        result.structure_.transformation_index = result.structure_.transformation_index.with(parameter, {});
        result.lower_bound_ = result.lower_bound_.with(parameter, {});
        result.upper_bound_ = result.upper_bound_.with(parameter, {});
    };
    auto new_psi_slot = [&result]() {
        result.psi_.push_back(PsiDefinition::identity(result.theta_.register_anonymous()));
        return static_cast<int>(result.psi_.size());
    };

    if (a0) {
        if (a0->size() != m) {
            throw std::invalid_argument("a0 must have " + std::to_string(m) + " entries");
        }
        Eigen::MatrixXd fixed = Eigen::MatrixXd::Zero(m, 1);
        Eigen::MatrixXi index = Eigen::MatrixXi::Zero(m, 1);
        Eigen::MatrixXi transformation = Eigen::MatrixXi::Zero(m, 1);
        Eigen::MatrixXd lower(m, 1);
        Eigen::MatrixXd upper(m, 1);
        const auto identity = static_cast<int>(result.transforms_.find_or_add(IdentityTransform{}));
        for (Eigen::Index i = 0; i < m; ++i) {
            const double value = (*a0)[i];
            if (std::isnan(value)) {
                index(i, 0) = new_psi_slot();
                transformation(i, 0) = identity;
                lower(i, 0) = -kInf;
                upper(i, 0) = kInf;
            } else {
                fixed(i, 0) = value;
                lower(i, 0) = value;
                upper(i, 0) = value;
            }
        }
        set_initial(SystemParameter::a0, fixed, index, transformation, lower, upper);
    } else {
        clear_initial(SystemParameter::a0);
    }

    if (P0) {
        if (P0->rows() != m || P0->cols() != m) {
            throw std::invalid_argument("P0 must be " + std::to_string(m) + "x" + std::to_string(m));
        }
        for (Eigen::Index col = 0; col < m; ++col) {
            for (Eigen::Index row = col + 1; row < m; ++row) {
                const double below = (*P0)(row, col);
                const double above = (*P0)(col, row);
                const bool mirrored = std::isnan(below) ? std::isnan(above) : below == above;
                if (!mirrored) {
                    throw std::invalid_argument("P0 must be symmetric");
                }
            }
        }
        Eigen::MatrixXd fixed = *P0;
        Eigen::MatrixXi index = Eigen::MatrixXi::Zero(m, m);
        Eigen::MatrixXi transformation = Eigen::MatrixXi::Zero(m, m);
        Eigen::MatrixXd lower = *P0;
        Eigen::MatrixXd upper = *P0;
        const bool from_factor = P0->hasNaN();
        if (from_factor) {
            // Entries describe the root factor L, so the upper triangle is zero.
            const auto covariance = static_cast<int>(result.transforms_.find_or_add(IdentityTransform{}));
            const auto variance =
                static_cast<int>(result.transforms_.find_or_add(LowerBoundedTransform(kVarianceFloor)));
            for (Eigen::Index col = 0; col < m; ++col) {
                for (Eigen::Index row = 0; row < m; ++row) {
                    const double value = (*P0)(row, col);
                    if (row < col) {
                        fixed(row, col) = 0.0;
                        lower(row, col) = -kInf;
                        upper(row, col) = kInf;
                    } else if (std::isnan(value)) {
                        fixed(row, col) = 0.0;
                        index(row, col) = new_psi_slot();
                        transformation(row, col) = row == col ? variance : covariance;
                        lower(row, col) = row == col ? kVarianceFloor : -kInf;
                        upper(row, col) = kInf;
                    } else if (row == col) {
                        if (value < 0.0) {
                            throw std::invalid_argument("P0 variances must be non-negative");
                        }
                        fixed(row, col) = lower(row, col) = upper(row, col) = std::sqrt(value);
                    }
                }
            }
        }
        set_initial(SystemParameter::P0, fixed, index, transformation, lower, upper);
        result.P0_from_factor_ = from_factor;
    } else {
        clear_initial(SystemParameter::P0);
        result.P0_from_factor_ = false;
    }

    result.compress();
    return result;
}

ThetaMap ThetaMap::compressed() const {
    ThetaMap result = *this;
    result.compress();
    return result;
}

void ThetaMap::compress() {
    const bool with_a0 = explicit_a0();
    const bool with_P0 = explicit_P0();
    if (!structure_.fixed.conforms(structure_.index, with_a0, with_P0) ||
        !structure_.fixed.conforms(structure_.transformation_index, with_a0, with_P0) ||
        !structure_.fixed.conforms(lower_bound_, with_a0, with_P0) ||
        !structure_.fixed.conforms(upper_bound_, with_a0, with_P0)) {
        throw std::logic_error("index and bound systems must conform to the fixed system");
    }

    const auto fixed = structure_.fixed.vectorize(with_a0, with_P0);
    auto index = structure_.index.vectorize(with_a0, with_P0);
    auto transformation = structure_.transformation_index.vectorize(with_a0, with_P0);
    const auto lower = lower_bound_.vectorize(with_a0, with_P0);
    const auto upper = upper_bound_.vectorize(with_a0, with_P0);

    // Psi slots: keep the referenced ones, in order.
    std::vector<bool> psi_used(psi_.size() + 1, false);
    for (int value : index) {
        if (value < 0 || static_cast<std::size_t>(value) > psi_.size()) {
            throw std::logic_error("index refers to a missing psi slot");
        }
        psi_used[static_cast<std::size_t>(value)] = true;
    }
    std::vector<int> psi_relabel(psi_.size() + 1, 0);
    std::vector<PsiDefinition> kept_psi;
    for (std::size_t slot = 1; slot <= psi_.size(); ++slot) {
        if (psi_used[slot]) {
            kept_psi.push_back(std::move(psi_[slot - 1]));
            psi_relabel[slot] = static_cast<int>(kept_psi.size());
        }
    }
    for (auto& value : index) {
        value = psi_relabel[static_cast<std::size_t>(value)];
    }

    // Theta slots: keep those some surviving psi reads.
    theta_.conform_bounds();
    std::vector<bool> theta_used(theta_.size(), false);
    for (const auto& definition : kept_psi) {
        for (auto theta_index : definition.theta_indexes) {
            if (theta_index >= theta_.size()) {
                throw std::logic_error("psi definition reads a missing theta slot");
            }
            theta_used[theta_index] = true;
        }
    }
    std::vector<std::size_t> theta_relabel(theta_.size(), 0);
    std::vector<std::size_t> kept_theta;
    for (std::size_t t = 0; t < theta_.size(); ++t) {
        if (theta_used[t]) {
            theta_relabel[t] = kept_theta.size();
            kept_theta.push_back(t);
        }
    }
    for (auto& definition : kept_psi) {
        for (auto& theta_index : definition.theta_indexes) {
            theta_index = theta_relabel[theta_index];
        }
    }
    psi_ = std::move(kept_psi);
    theta_ = theta_.select(kept_theta);

    // Transforms: fixed entries carry none; unused slots go and equal ones merge.
    std::vector<bool> transform_used(transforms_.size() + 1, false);
    for (std::size_t i = 0; i < index.size(); ++i) {
        if (index[i] == 0) {
            transformation[i] = 0;
            continue;
        }
        if (transformation[i] <= 0 || static_cast<std::size_t>(transformation[i]) > transforms_.size()) {
            throw std::logic_error("estimated entry has no valid transformation index");
        }
        if (fixed[i] != 0.0) {
            throw std::logic_error("entry is both fixed and determined by theta");
        }
        transform_used[static_cast<std::size_t>(transformation[i])] = true;
    }
    const auto transform_relabel = transforms_.compress(transform_used);
    for (auto& value : transformation) {
        value = static_cast<int>(transform_relabel[static_cast<std::size_t>(value)]);
    }

    std::vector<bool> crossed(lower.size(), false);
    bool any_crossed = false;
    for (std::size_t i = 0; i < lower.size(); ++i) {
        crossed[i] = lower[i] > upper[i];
        any_crossed = any_crossed || crossed[i];
    }

    structure_.index = structure_.fixed.reshape(index, with_a0, with_P0);
    structure_.transformation_index = structure_.fixed.reshape(transformation, with_a0, with_P0);

    if (any_crossed) {
        std::string names;
        for (const auto& name : parameters_with(crossed)) {
            names += names.empty() ? name : ", " + name;
        }
        throw std::logic_error("lower bound is greater than upper bound in " + names);
    }
}

}  // namespace libthetamap
