#pragma once

#include <string>
#include <utility>
#include <variant>

namespace libthetamap {

class IdentityTransform final {
public:
    [[nodiscard]] double to_constrained(double unconstrained) const noexcept;

    [[nodiscard]] double to_unconstrained(double constrained) const noexcept;

    [[nodiscard]] bool is_valid_constrained(double constrained) const noexcept;

    [[nodiscard]] double constrained_derivative(double unconstrained) const noexcept;

    bool operator==(const IdentityTransform&) const = default;
};

// x -> lower + exp(x)
class LowerBoundedTransform final {
public:
    explicit LowerBoundedTransform(double lower_bound);

    [[nodiscard]] double to_constrained(double unconstrained) const noexcept;

    [[nodiscard]] double to_unconstrained(double constrained) const;

    [[nodiscard]] bool is_valid_constrained(double constrained) const noexcept;

    [[nodiscard]] double constrained_derivative(double unconstrained) const noexcept;

    [[nodiscard]] double lower() const noexcept { return lower_; }

    bool operator==(const LowerBoundedTransform&) const = default;

private:
    double lower_;
};

// x -> upper - exp(x)
class UpperBoundedTransform final {
public:
    explicit UpperBoundedTransform(double upper_bound);

    [[nodiscard]] double to_constrained(double unconstrained) const noexcept;

    [[nodiscard]] double to_unconstrained(double constrained) const;

    [[nodiscard]] bool is_valid_constrained(double constrained) const noexcept;

    [[nodiscard]] double constrained_derivative(double unconstrained) const noexcept;

    [[nodiscard]] double upper() const noexcept { return upper_; }

    bool operator==(const UpperBoundedTransform&) const = default;

private:
    double upper_;
};

class LogisticTransform final {
public:
    LogisticTransform(double lower_bound, double upper_bound);

    [[nodiscard]] double to_constrained(double unconstrained) const noexcept;

    [[nodiscard]] double to_unconstrained(double constrained) const;

    [[nodiscard]] bool is_valid_constrained(double constrained) const noexcept;

    [[nodiscard]] double constrained_derivative(double unconstrained) const noexcept;

    [[nodiscard]] double lower() const noexcept { return lower_; }

    [[nodiscard]] double upper() const noexcept { return upper_; }

    bool operator==(const LogisticTransform&) const = default;

private:
    double lower_;
    double upper_;
};

/// Monotone map from the real line onto an interval. Two transforms compare
/// equal exactly when they are the same kind with the same bounds.
using BoundTransform = std::variant<IdentityTransform, LowerBoundedTransform, UpperBoundedTransform, LogisticTransform>;

[[nodiscard]] double to_constrained(const BoundTransform& transform, double unconstrained);

/// Inverse of to_constrained. Values on a finite bound map to +/-infinity.
[[nodiscard]] double to_unconstrained(const BoundTransform& transform, double constrained);

[[nodiscard]] double constrained_derivative(const BoundTransform& transform, double unconstrained);

[[nodiscard]] bool is_valid_constrained(const BoundTransform& transform, double constrained);

/// Closed interval the transform maps onto, infinite ends included.
[[nodiscard]] std::pair<double, double> constrained_range(const BoundTransform& transform);

[[nodiscard]] std::string describe(const BoundTransform& transform);

/// Picks the transform for an interval: logistic when both ends are finite,
/// shifted exponential for one finite end, identity otherwise.
[[nodiscard]] BoundTransform make_bounded_transform(double lower_bound, double upper_bound);

}  // namespace libthetamap
