#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace libthetamap {

using PsiFunction = std::function<double(const std::vector<double>&)>;
using PsiInverse = std::function<double(double)>;

/// One psi slot: the theta slots it reads and how it combines them.
struct PsiDefinition {
    std::vector<std::size_t> theta_indexes;  // 0-based, in argument order
    PsiFunction evaluate;
    PsiInverse inverse;  // psi -> theta; single-argument definitions only

    [[nodiscard]] static PsiDefinition identity(std::size_t theta_index);

    /// Evaluates on the full theta vector.
    [[nodiscard]] double operator()(const std::vector<double>& theta) const;

    [[nodiscard]] bool reads(std::size_t theta_index) const noexcept;

    [[nodiscard]] bool has_closed_form_inverse() const noexcept {
        return theta_indexes.size() == 1 && static_cast<bool>(inverse);
    }
};

}  // namespace libthetamap
