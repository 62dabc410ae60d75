#include "libthetamap/parameter_transform.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace libthetamap {

double IdentityTransform::to_constrained(double unconstrained) const noexcept {
    return unconstrained;
}

double IdentityTransform::to_unconstrained(double constrained) const noexcept {
    return constrained;
}

bool IdentityTransform::is_valid_constrained(double /*constrained*/) const noexcept {
    return true;
}

double IdentityTransform::constrained_derivative(double /*unconstrained*/) const noexcept {
    return 1.0;
}

LowerBoundedTransform::LowerBoundedTransform(double lower_bound)
    : lower_(lower_bound) {
    if (!std::isfinite(lower_)) {
        throw std::invalid_argument("lower bounded transform requires a finite lower bound");
    }
}

double LowerBoundedTransform::to_constrained(double unconstrained) const noexcept {
    return lower_ + std::exp(unconstrained);
}

double LowerBoundedTransform::to_unconstrained(double constrained) const {
    if (!is_valid_constrained(constrained)) {
        throw std::domain_error("lower bounded transform input below lower bound");
    }
    return std::log(constrained - lower_);
}

bool LowerBoundedTransform::is_valid_constrained(double constrained) const noexcept {
    return constrained >= lower_;
}

double LowerBoundedTransform::constrained_derivative(double unconstrained) const noexcept {
    return std::exp(unconstrained);
}

UpperBoundedTransform::UpperBoundedTransform(double upper_bound)
    : upper_(upper_bound) {
    if (!std::isfinite(upper_)) {
        throw std::invalid_argument("upper bounded transform requires a finite upper bound");
    }
}

double UpperBoundedTransform::to_constrained(double unconstrained) const noexcept {
    return upper_ - std::exp(unconstrained);
}

double UpperBoundedTransform::to_unconstrained(double constrained) const {
    if (!is_valid_constrained(constrained)) {
        throw std::domain_error("upper bounded transform input above upper bound");
    }
    return std::log(upper_ - constrained);
}

bool UpperBoundedTransform::is_valid_constrained(double constrained) const noexcept {
    return constrained <= upper_;
}

double UpperBoundedTransform::constrained_derivative(double unconstrained) const noexcept {
    return -std::exp(unconstrained);
}

LogisticTransform::LogisticTransform(double lower_bound, double upper_bound)
    : lower_(lower_bound), upper_(upper_bound) {
    if (!std::isfinite(lower_) || !std::isfinite(upper_)) {
        throw std::invalid_argument("logistic transform requires finite bounds");
    }
    if (!(upper_ > lower_)) {
        throw std::invalid_argument("logistic transform requires upper > lower");
    }
}

double LogisticTransform::to_constrained(double unconstrained) const noexcept {
    const double span = upper_ - lower_;
    const double logistic = 1.0 / (1.0 + std::exp(-unconstrained));
    return lower_ + span * logistic;
}

double LogisticTransform::to_unconstrained(double constrained) const {
    if (!is_valid_constrained(constrained)) {
        throw std::domain_error("logistic transform input outside closed interval");
    }
    return std::log((constrained - lower_) / (upper_ - constrained));
}

bool LogisticTransform::is_valid_constrained(double constrained) const noexcept {
    return (constrained >= lower_) && (constrained <= upper_);
}

double LogisticTransform::constrained_derivative(double unconstrained) const noexcept {
    const double span = upper_ - lower_;
    const double logistic = 1.0 / (1.0 + std::exp(-unconstrained));
    return span * logistic * (1.0 - logistic);
}

double to_constrained(const BoundTransform& transform, double unconstrained) {
    return std::visit([unconstrained](const auto& t) { return t.to_constrained(unconstrained); }, transform);
}

double to_unconstrained(const BoundTransform& transform, double constrained) {
    return std::visit([constrained](const auto& t) { return t.to_unconstrained(constrained); }, transform);
}

double constrained_derivative(const BoundTransform& transform, double unconstrained) {
    return std::visit([unconstrained](const auto& t) { return t.constrained_derivative(unconstrained); },
                      transform);
}

bool is_valid_constrained(const BoundTransform& transform, double constrained) {
    return std::visit([constrained](const auto& t) { return t.is_valid_constrained(constrained); }, transform);
}

std::pair<double, double> constrained_range(const BoundTransform& transform) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    if (const auto* lower = std::get_if<LowerBoundedTransform>(&transform)) {
        return {lower->lower(), inf};
    }
    if (const auto* upper = std::get_if<UpperBoundedTransform>(&transform)) {
        return {-inf, upper->upper()};
    }
    if (const auto* logistic = std::get_if<LogisticTransform>(&transform)) {
        return {logistic->lower(), logistic->upper()};
    }
    return {-inf, inf};
}

std::string describe(const BoundTransform& transform) {
    std::ostringstream out;
    if (std::holds_alternative<IdentityTransform>(transform)) {
        out << "identity";
    } else if (const auto* lower = std::get_if<LowerBoundedTransform>(&transform)) {
        out << "exp(x) + " << lower->lower();
    } else if (const auto* upper = std::get_if<UpperBoundedTransform>(&transform)) {
        out << upper->upper() << " - exp(x)";
    } else {
        const auto& logistic = std::get<LogisticTransform>(transform);
        out << "logistic(" << logistic.lower() << ", " << logistic.upper() << ")";
    }
    return out.str();
}

BoundTransform make_bounded_transform(double lower_bound, double upper_bound) {
    const bool finite_lower = std::isfinite(lower_bound);
    const bool finite_upper = std::isfinite(upper_bound);
    if (finite_lower && finite_upper) {
        return LogisticTransform(lower_bound, upper_bound);
    }
    if (finite_lower) {
        return LowerBoundedTransform(lower_bound);
    }
    if (finite_upper) {
        return UpperBoundedTransform(upper_bound);
    }
    return IdentityTransform{};
}

}  // namespace libthetamap
