#pragma once

#include "libthetamap/parameter_transform.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace libthetamap {

/// Names and box bounds of the theta vector.
class ThetaCatalog {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    ThetaCatalog() = default;

    /// Names only; bounds are filled in by conform_bounds().
    explicit ThetaCatalog(std::vector<std::string> names);

    /// Returns the slot of `name`, registering it unbounded if it is new.
    std::size_t register_theta(const std::string& name);

    /// Registers a slot named theta_<k>, k being its 1-based position.
    std::size_t register_anonymous();

    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

    [[nodiscard]] bool contains(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_index(const std::string& name) const noexcept;

    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

    [[nodiscard]] const std::vector<double>& lower_bounds() const noexcept { return lower_; }

    [[nodiscard]] const std::vector<double>& upper_bounds() const noexcept { return upper_; }

    void set_bounds(std::size_t index, double lower, double upper);

    /// Grows the bound vectors with unbounded entries up to size(); throws
    /// std::logic_error if they are longer than the name list.
    void conform_bounds();

    /// Keeps the listed slots, in the given order.
    [[nodiscard]] ThetaCatalog select(const std::vector<std::size_t>& kept) const;

    [[nodiscard]] BoundTransform transform(std::size_t index) const;

    [[nodiscard]] std::vector<double> constrain(const std::vector<double>& unconstrained) const;

    [[nodiscard]] std::vector<double> unconstrain(const std::vector<double>& constrained) const;

    [[nodiscard]] std::vector<double> constrained_derivatives(const std::vector<double>& unconstrained) const;

private:
    void check_size(std::size_t count) const;

    std::vector<std::string> names_;
    std::vector<double> lower_;
    std::vector<double> upper_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace libthetamap
