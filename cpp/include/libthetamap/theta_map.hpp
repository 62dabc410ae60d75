#pragma once

#include "libthetamap/estimation_system.hpp"
#include "libthetamap/numeric_inverse.hpp"
#include "libthetamap/psi_definition.hpp"
#include "libthetamap/state_space.hpp"
#include "libthetamap/theta_catalog.hpp"
#include "libthetamap/transform_registry.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace libthetamap {

/// Lower bound given to free variances so covariance diagonals stay positive.
inline constexpr double kVarianceFloor = 10.0 * std::numeric_limits<double>::epsilon();

enum class BoundSide {
    Lower,
    Upper
};

/// A system entry lies outside the bounds recorded for it.
class BoundViolation : public std::out_of_range {
public:
    BoundViolation(BoundSide side, std::vector<std::string> parameters);

    [[nodiscard]] BoundSide side() const noexcept { return side_; }

    [[nodiscard]] const std::vector<std::string>& parameters() const noexcept { return parameters_; }

private:
    BoundSide side_;
    std::vector<std::string> parameters_;
};

/// Entries that share a psi slot imply different psi values.
class InconsistentSystem : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Fixed values plus the psi and transform slot of every entry. Fixed entries
/// have index 0 and transformation index 0; a0 and P0 are present only when
/// the initial conditions are explicit.
struct IndexSystem {
    StateSpace fixed;
    IndexStateSpace index;
    IndexStateSpace transformation_index;
};

struct ThetaMapOptions {
    std::vector<PsiDefinition> psi;  // empty: theta and psi coincide
    std::vector<std::string> names;  // empty: theta_<k>
};

struct ThetaRecovery {
    std::vector<double> theta;
    std::vector<double> psi;
    std::vector<ComponentFit> components;  // numerically inverted sets
    double max_residual{0.0};
    std::vector<std::string> warnings;

    [[nodiscard]] bool accurate() const noexcept { return warnings.empty(); }
};

/// Maps a vector of free parameters theta onto a StateSpace and back.
///
/// Each non-fixed entry of the system is transform(psi[index]) where psi is a
/// vector of values each computed from a few elements of theta. Entries can
/// share a psi slot, and transforms keep entries inside per-entry bounds set
/// with add_restrictions(). Every structural operation returns a new,
/// validated map and leaves the original untouched.
class ThetaMap {
public:
    /// Takes a caller-built structure. Validates conformance, index ranges and
    /// that no entry is both fixed and indexed, then applies the default
    /// restrictions (positive variances) and compresses.
    ThetaMap(IndexSystem structure, TransformRegistry transforms, ThetaMapOptions options = {});

    /// One theta slot per free entry (per lower-triangle entry for H, Q and
    /// P0); named variables and shared expressions are deduplicated.
    [[nodiscard]] static ThetaMap for_estimation(const EstimationSystem& system);

    /// Estimates every entry of `system`; a0 and P0 are included when
    /// `include_initial` is set.
    [[nodiscard]] static ThetaMap for_all_parameters(const StateSpace& system, bool include_initial = false);

    [[nodiscard]] StateSpace theta_to_system(const std::vector<double>& theta) const;

    [[nodiscard]] std::vector<double> system_to_theta(const StateSpace& system,
                                                      const SolverOptions& options = {}) const;

    /// system_to_theta() with psi, the numeric fits and any accuracy warnings.
    [[nodiscard]] ThetaRecovery recover_theta(const StateSpace& system, const SolverOptions& options = {}) const;

    [[nodiscard]] std::vector<double> compute_psi(const std::vector<double>& theta) const;

    /// Unconstrained working vector -> bounded theta.
    [[nodiscard]] std::vector<double> restrict_theta(const std::vector<double>& unconstrained) const;

    /// Bounded theta -> unconstrained working vector.
    [[nodiscard]] std::vector<double> unrestrict_theta(const std::vector<double>& theta) const;

    /// Diagonal Jacobian of restrict_theta() at `unconstrained`.
    [[nodiscard]] Eigen::MatrixXd restricted_theta_gradient(const std::vector<double>& unconstrained) const;

    [[nodiscard]] ThetaMap set_theta_bounds(std::size_t theta_index,
                                            std::optional<double> lower,
                                            std::optional<double> upper) const;

    [[nodiscard]] ThetaMap set_theta_bounds(const std::string& name,
                                            std::optional<double> lower,
                                            std::optional<double> upper) const;

    /// Intersects the recorded entry bounds with `lower` and `upper`.
    [[nodiscard]] ThetaMap add_restrictions(const StateSpace& lower, const StateSpace& upper) const;

    /// Makes a0 and/or P0 explicit. NaN entries become new theta slots;
    /// an absent argument leaves that moment to the filter. A P0 with free
    /// entries is stored as its lower-triangular root factor L and assembled
    /// as L * L^T; its defined entries fix the matching entries of L, with a
    /// defined variance d fixing the factor diagonal at sqrt(d).
    [[nodiscard]] ThetaMap update_initial(const std::optional<Eigen::VectorXd>& a0,
                                          const std::optional<Eigen::MatrixXd>& P0) const;

    /// Removes unused psi, theta and transform slots and merges equal
    /// transforms. Idempotent.
    [[nodiscard]] ThetaMap compressed() const;

    /// For each theta slot, the matrices it influences, e.g. "T, Q".
    [[nodiscard]] std::vector<std::string> parameter_report() const;

    [[nodiscard]] std::size_t n_theta() const noexcept { return theta_.size(); }

    [[nodiscard]] std::size_t n_psi() const noexcept { return psi_.size(); }

    [[nodiscard]] const std::vector<std::string>& theta_names() const noexcept { return theta_.names(); }

    [[nodiscard]] const std::vector<double>& theta_lower_bound() const noexcept { return theta_.lower_bounds(); }

    [[nodiscard]] const std::vector<double>& theta_upper_bound() const noexcept { return theta_.upper_bounds(); }

    [[nodiscard]] const StateSpace& lower_bound() const noexcept { return lower_bound_; }

    [[nodiscard]] const StateSpace& upper_bound() const noexcept { return upper_bound_; }

    [[nodiscard]] const StateSpace& fixed() const noexcept { return structure_.fixed; }

    [[nodiscard]] const IndexStateSpace& index() const noexcept { return structure_.index; }

    [[nodiscard]] const IndexStateSpace& transformation_index() const noexcept {
        return structure_.transformation_index;
    }

    [[nodiscard]] const TransformRegistry& transforms() const noexcept { return transforms_; }

    [[nodiscard]] const std::vector<PsiDefinition>& psi_definitions() const noexcept { return psi_; }

    [[nodiscard]] bool explicit_a0() const noexcept { return structure_.fixed.has_a0(); }

    [[nodiscard]] bool explicit_P0() const noexcept { return structure_.fixed.has_P0(); }

    /// The P0 entries of the index system describe the root factor of P0.
    [[nodiscard]] bool P0_from_factor() const noexcept { return P0_from_factor_; }

private:
    void validate_structure() const;

    void compress();

    [[nodiscard]] std::vector<std::string> parameters_with(const std::vector<bool>& entry_flags) const;

    // Replaces the P0 entries of a vectorized system by its root factor.
    void factor_P0(const StateSpace& system, std::vector<double>& values) const;

    IndexSystem structure_;
    TransformRegistry transforms_;
    std::vector<PsiDefinition> psi_;
    ThetaCatalog theta_;
    StateSpace lower_bound_;
    StateSpace upper_bound_;
    bool P0_from_factor_{false};
};

}  // namespace libthetamap
