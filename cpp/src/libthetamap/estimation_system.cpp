#include "libthetamap/estimation_system.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace libthetamap {

bool is_free(const FreeEntry& entry) noexcept {
    return !std::holds_alternative<Literal>(entry);
}

EstimationSystem::EstimationSystem(StateSpace values)
    : values_(std::move(values)) {
    values_.validate();
    const auto flat = values_.vectorize(values_.has_a0(), values_.has_P0());
    entries_.reserve(flat.size());
    for (double value : flat) {
        if (std::isnan(value)) {
            entries_.emplace_back(FreeVariable{});
        } else {
            entries_.emplace_back(Literal{value});
        }
    }
}

void EstimationSystem::set_entry(SystemParameter parameter, std::size_t row, std::size_t col, FreeEntry entry,
                                 std::size_t slice) {
    if (const auto* expression = std::get_if<Expression>(&entry)) {
        if (expression->key.empty()) {
            throw std::invalid_argument("expression key must be non-empty");
        }
        if (expression->variables.empty()) {
            throw std::invalid_argument("expression " + expression->key + " must read at least one variable");
        }
        if (!expression->evaluate) {
            throw std::invalid_argument("expression " + expression->key + " has no evaluator");
        }
        if (expression->inverse && expression->variables.size() != 1) {
            throw std::invalid_argument("expression " + expression->key +
                                        " has a closed-form inverse but several variables");
        }
    }
    if (const auto* literal = std::get_if<Literal>(&entry); literal != nullptr && std::isnan(literal->value)) {
        throw std::invalid_argument("literal entries must be defined");
    }

    const std::size_t offset = offset_of(EntryLocation{parameter, slice, row, col});
    if (is_symmetric_parameter(parameter) && row != col) {
        entries_[offset_of(EntryLocation{parameter, slice, col, row})] = entry;
    }
    entries_[offset] = std::move(entry);
}

const FreeEntry& EstimationSystem::entry(const EntryLocation& location) const {
    return entries_[offset_of(location)];
}

std::vector<EntryLocation> EstimationSystem::locations() const {
    return values_.entry_locations(values_.has_a0(), values_.has_P0());
}

std::size_t EstimationSystem::offset_of(const EntryLocation& location) const {
    return values_.offset_of(location, values_.has_a0(), values_.has_P0());
}

}  // namespace libthetamap
