#pragma once

#include "libthetamap/psi_definition.hpp"
#include "libthetamap/state_space.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace libthetamap {

struct Literal {
    double value{0.0};
};

/// A free scalar. Entries naming the same variable share one theta slot and
/// one psi slot; an empty name gives the entry a slot of its own.
struct FreeVariable {
    std::string name;
};

/// A value computed from several named variables. Entries with the same key
/// share one psi slot.
struct Expression {
    std::string key;
    std::vector<std::string> variables;
    PsiFunction evaluate;
    PsiInverse inverse;  // optional, single-variable expressions only
};

using FreeEntry = std::variant<Literal, FreeVariable, Expression>;

[[nodiscard]] bool is_free(const FreeEntry& entry) noexcept;

/// A partially specified system handed to ThetaMap::for_estimation. Built from
/// a StateSpace whose NaN entries are free; individual entries can then be
/// replaced with named variables or expressions.
class EstimationSystem {
public:
    explicit EstimationSystem(StateSpace values);

    /// Sets one entry. For H, Q and P0 the transposed entry is set as well.
    void set_entry(SystemParameter parameter, std::size_t row, std::size_t col, FreeEntry entry,
                   std::size_t slice = 0);

    [[nodiscard]] const FreeEntry& entry(const EntryLocation& location) const;

    [[nodiscard]] const StateSpace& shape() const noexcept { return values_; }

    /// Entries in vectorize() order, including a0 and P0 when present.
    [[nodiscard]] const std::vector<FreeEntry>& entries() const noexcept { return entries_; }

    [[nodiscard]] std::vector<EntryLocation> locations() const;

private:
    [[nodiscard]] std::size_t offset_of(const EntryLocation& location) const;

    StateSpace values_;
    std::vector<FreeEntry> entries_;
};

}  // namespace libthetamap
