#include "libthetamap/transform_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace libthetamap {

TransformRegistry::TransformRegistry(std::vector<BoundTransform> transforms)
    : transforms_(std::move(transforms)) {}

TransformRegistry TransformRegistry::identity_only() {
    TransformRegistry registry;
    registry.add(IdentityTransform{});
    return registry;
}

std::size_t TransformRegistry::add(BoundTransform transform) {
    transforms_.push_back(std::move(transform));
    return transforms_.size();
}

std::size_t TransformRegistry::find_or_add(const BoundTransform& transform) {
    auto it = std::find(transforms_.begin(), transforms_.end(), transform);
    if (it != transforms_.end()) {
        return static_cast<std::size_t>(it - transforms_.begin()) + 1;
    }
    return add(transform);
}

const BoundTransform& TransformRegistry::at(std::size_t slot) const {
    if (slot == 0 || slot > transforms_.size()) {
        throw std::out_of_range("transform slot " + std::to_string(slot) + " outside registry of size " +
                                std::to_string(transforms_.size()));
    }
    return transforms_[slot - 1];
}

std::vector<std::size_t> TransformRegistry::compress(const std::vector<bool>& used) {
    std::vector<std::size_t> relabel(transforms_.size() + 1, 0);
    std::vector<BoundTransform> kept;
    kept.reserve(transforms_.size());

    for (std::size_t slot = 1; slot <= transforms_.size(); ++slot) {
        if (slot >= used.size() || !used[slot]) {
            continue;
        }
        const auto& transform = transforms_[slot - 1];
        auto it = std::find(kept.begin(), kept.end(), transform);
        if (it != kept.end()) {
            relabel[slot] = static_cast<std::size_t>(it - kept.begin()) + 1;
        } else {
            kept.push_back(transform);
            relabel[slot] = kept.size();
        }
    }

    transforms_ = std::move(kept);
    return relabel;
}

}  // namespace libthetamap
