#pragma once

#include "libthetamap/psi_definition.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace libthetamap {

struct SolverOptions {
    std::size_t max_iterations{10000};
    std::size_t max_function_evaluations{0};  // 0: 10000 per theta slot in the component
    std::optional<std::uint32_t> random_seed;  // unset: seeded from std::random_device
    std::size_t restarts{1};                   // random starts per component, best kept
    double tolerance{1e-10};                   // projected gradient norm for convergence
    double residual_tolerance{1e-4};           // largest acceptable |psi(theta) - psi|
    int max_linesearch{40};
    bool verbose{false};
};

/// Groups the theta slots flagged in `unresolved` into codetermined sets: two
/// slots are linked when a psi definition reads both. Slots not flagged are
/// neither grouped nor used as links. Components are ordered by their
/// smallest slot, members ascending.
[[nodiscard]] std::vector<std::vector<std::size_t>> codetermined_components(
    const std::vector<PsiDefinition>& psi,
    const std::vector<bool>& unresolved);

struct ComponentFit {
    std::vector<std::size_t> theta_indexes;
    std::vector<double> values;
    double residual{0.0};  // max |psi(theta) - target| over the component's psi slots
    std::size_t iterations{0};
    std::size_t function_evaluations{0};
    bool converged{false};
    std::string message;
};

/// Recovers theta from psi where no closed-form inverse exists, by bounded
/// nonlinear least squares (L-BFGS-B) from randomized starting points.
class NumericInverseSolver {
public:
    explicit NumericInverseSolver(SolverOptions options = {});

    [[nodiscard]] const SolverOptions& options() const noexcept { return options_; }

    /// Solves for the slots of `component`. `theta` supplies values for the
    /// slots already known; its entries for the component are ignored.
    [[nodiscard]] ComponentFit solve(const std::vector<PsiDefinition>& psi,
                                     const std::vector<double>& psi_targets,
                                     const std::vector<std::size_t>& component,
                                     const std::vector<double>& theta,
                                     const std::vector<double>& lower,
                                     const std::vector<double>& upper,
                                     std::size_t component_number) const;

private:
    SolverOptions options_;
};

}  // namespace libthetamap
