#include "tile_timeline/grid_size_resolver.hpp"

#include <stdexcept>

namespace tile_timeline {

std::size_t integer_sqrt(std::size_t value) noexcept {
    if (value < 2) {
        return value;
    }
    // Newton iteration from above converges monotonically to floor(sqrt).
    // value / 2 + 1 bounds the root from above and keeps the first sum in range.
    std::size_t estimate = value / 2 + 1;
    std::size_t next = (estimate + value / estimate) / 2;
    while (next < estimate) {
        estimate = next;
        next = (estimate + value / estimate) / 2;
    }
    return estimate;
}

GridSizeResolver::GridSizeResolver()
    : GridSizeResolver(GridSizePolicy{}) {}

GridSizeResolver::GridSizeResolver(GridSizePolicy policy)
    : policy_(policy) {
    if (policy_.irregular == IrregularGridPolicy::Fallback && policy_.fallback_grid_size == 0) {
        throw std::invalid_argument("Fallback grid size must be positive");
    }
}

std::optional<std::size_t> GridSizeResolver::resolve(std::size_t tile_count) const {
    if (tile_count == 0) {
        throw std::invalid_argument("Cannot resolve a grid for an empty tile set");
    }
    const std::size_t root = integer_sqrt(tile_count);
    if (root * root == tile_count) {
        return root;
    }
    if (policy_.irregular == IrregularGridPolicy::Strict) {
        return std::nullopt;
    }
    return policy_.fallback_grid_size;
}

const GridSizePolicy& GridSizeResolver::policy() const noexcept {
    return policy_;
}

}  // namespace tile_timeline
