#include "tile_timeline/bounds_aggregator.hpp"

#include <algorithm>

namespace tile_timeline {

void BoundsAggregator::add(const BoundingBox& box) noexcept {
    ++count_;
    if (!optional_extent_.has_value()) {
        optional_extent_ = box;
        return;
    }
    BoundingBox& extent = optional_extent_.value();
    extent.west = std::min(extent.west, box.west);
    extent.south = std::min(extent.south, box.south);
    extent.east = std::max(extent.east, box.east);
    extent.north = std::max(extent.north, box.north);
}

std::size_t BoundsAggregator::count() const noexcept {
    return count_;
}

std::optional<BoundingBox> BoundsAggregator::result() const noexcept {
    return optional_extent_;
}

std::optional<BoundingBox> aggregate_bounds(const std::vector<BoundingBox>& boxes) {
    BoundsAggregator aggregator;
    for (const BoundingBox& box : boxes) {
        aggregator.add(box);
    }
    return aggregator.result();
}

BoundingBox resolve_bounds(const std::vector<BoundingBox>& boxes, const BoundingBox& fallback) {
    return aggregate_bounds(boxes).value_or(fallback);
}

}  // namespace tile_timeline
