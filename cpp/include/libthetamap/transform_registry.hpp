#pragma once

#include "libthetamap/parameter_transform.hpp"

#include <cstddef>
#include <vector>

namespace libthetamap {

/// Indexed list of the transforms applied to psi values. Slots are 1-based so
/// that 0 can mark a fixed entry in a transformation index.
class TransformRegistry {
public:
    TransformRegistry() = default;

    explicit TransformRegistry(std::vector<BoundTransform> transforms);

    /// Registry holding only the identity transform, at slot 1.
    [[nodiscard]] static TransformRegistry identity_only();

    /// Appends without looking for an equal entry; returns the new slot.
    std::size_t add(BoundTransform transform);

    /// Returns the slot of an equal entry, appending one if none exists.
    std::size_t find_or_add(const BoundTransform& transform);

    [[nodiscard]] const BoundTransform& at(std::size_t slot) const;

    [[nodiscard]] std::size_t size() const noexcept { return transforms_.size(); }

    [[nodiscard]] const std::vector<BoundTransform>& transforms() const noexcept { return transforms_; }

    /// Drops slots not flagged in `used` (indexed by slot, entry 0 ignored) and
    /// merges equal transforms onto the lowest surviving slot. Returns the
    /// old-slot to new-slot relabeling, with 0 for dropped slots.
    std::vector<std::size_t> compress(const std::vector<bool>& used);

    bool operator==(const TransformRegistry&) const = default;

private:
    std::vector<BoundTransform> transforms_;
};

}  // namespace libthetamap
