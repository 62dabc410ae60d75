#include "libthetamap/theta_catalog.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace libthetamap {

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kEps = std::numeric_limits<double>::epsilon();
}  // namespace

ThetaCatalog::ThetaCatalog(std::vector<std::string> names)
    : names_(std::move(names)) {
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (names_[i].empty()) {
            throw std::invalid_argument("theta name must be non-empty");
        }
        if (!index_.emplace(names_[i], i).second) {
            throw std::invalid_argument("duplicate theta name: " + names_[i]);
        }
    }
}

std::size_t ThetaCatalog::register_theta(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("theta name must be non-empty");
    }
    auto it = index_.find(name);
    if (it != index_.end()) {
        return it->second;
    }

    conform_bounds();
    names_.push_back(name);
    lower_.push_back(-kInf);
    upper_.push_back(kInf);
    std::size_t idx = names_.size() - 1;
    index_.emplace(name, idx);
    return idx;
}

std::size_t ThetaCatalog::register_anonymous() {
    std::string name = "theta_" + std::to_string(names_.size() + 1);
    while (contains(name)) {
        name += "'";
    }
    return register_theta(name);
}

bool ThetaCatalog::contains(const std::string& name) const noexcept {
    return index_.contains(name);
}

std::size_t ThetaCatalog::find_index(const std::string& name) const noexcept {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return npos;
    }
    return it->second;
}

void ThetaCatalog::set_bounds(std::size_t index, double lower, double upper) {
    if (index >= names_.size()) {
        throw std::out_of_range("theta index " + std::to_string(index) + " out of range");
    }
    if (!(lower < upper)) {
        throw std::invalid_argument("theta lower bound must be below upper bound for " + names_[index]);
    }
    conform_bounds();
    lower_[index] = lower;
    upper_[index] = upper;
}

void ThetaCatalog::conform_bounds() {
    if (lower_.size() > names_.size() || upper_.size() > names_.size()) {
        throw std::logic_error("theta bound vectors are longer than theta");
    }
    lower_.resize(names_.size(), -kInf);
    upper_.resize(names_.size(), kInf);
}

ThetaCatalog ThetaCatalog::select(const std::vector<std::size_t>& kept) const {
    ThetaCatalog result;
    for (auto idx : kept) {
        if (idx >= names_.size()) {
            throw std::out_of_range("theta index " + std::to_string(idx) + " out of range");
        }
        result.index_.emplace(names_[idx], result.names_.size());
        result.names_.push_back(names_[idx]);
        if (idx < lower_.size() && idx < upper_.size()) {
            result.lower_.push_back(lower_[idx]);
            result.upper_.push_back(upper_[idx]);
        } else {
            result.lower_.push_back(-kInf);
            result.upper_.push_back(kInf);
        }
    }
    return result;
}

BoundTransform ThetaCatalog::transform(std::size_t index) const {
    if (index >= lower_.size() || index >= upper_.size()) {
        throw std::logic_error("theta bound vectors do not cover slot " + std::to_string(index));
    }
    return make_bounded_transform(lower_[index], upper_[index]);
}

void ThetaCatalog::check_size(std::size_t count) const {
    if (count != names_.size()) {
        throw std::invalid_argument("theta vector size mismatch: expected " + std::to_string(names_.size()) +
                                    ", got " + std::to_string(count));
    }
    if (lower_.size() != names_.size() || upper_.size() != names_.size()) {
        throw std::logic_error("theta bound vectors do not match theta");
    }
}

std::vector<double> ThetaCatalog::constrain(const std::vector<double>& unconstrained) const {
    check_size(unconstrained.size());
    std::vector<double> constrained(names_.size());
    for (std::size_t i = 0; i < names_.size(); ++i) {
        constrained[i] = to_constrained(transform(i), unconstrained[i]);
    }
    return constrained;
}

std::vector<double> ThetaCatalog::unconstrain(const std::vector<double>& constrained) const {
    check_size(constrained.size());
    std::vector<double> unconstrained(names_.size());
    for (std::size_t i = 0; i < names_.size(); ++i) {
        const double value = constrained[i];
        if (!(value + kEps > lower_[i])) {
            throw std::out_of_range("theta lower bound violated for " + names_[i]);
        }
        if (!(value - kEps < upper_[i])) {
            throw std::out_of_range("theta upper bound violated for " + names_[i]);
        }
        // Within machine epsilon of a bound counts as on it.
        const double clamped = std::min(std::max(value, lower_[i]), upper_[i]);
        unconstrained[i] = to_unconstrained(transform(i), clamped);
    }
    return unconstrained;
}

std::vector<double> ThetaCatalog::constrained_derivatives(const std::vector<double>& unconstrained) const {
    check_size(unconstrained.size());
    std::vector<double> derivatives(names_.size());
    for (std::size_t i = 0; i < names_.size(); ++i) {
        derivatives[i] = constrained_derivative(transform(i), unconstrained[i]);
    }
    return derivatives;
}

}  // namespace libthetamap
