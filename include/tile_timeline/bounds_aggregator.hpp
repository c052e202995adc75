// === Bounds Aggregator =======================================================
//
// Merges the per-year extents of a region's vector layers into one overall
// bounding box. Aggregation is a plain componentwise min/max; when no layer
// contributes, callers substitute the region's static fallback box.

#pragma once

#include <optional>
#include <vector>

#include "tile_timeline/types.hpp"

namespace tile_timeline {

/** @brief Running union of bounding boxes. */
class BoundsAggregator final {
  public:
    /** @brief Extend the running extent by @p box. */
    void add(const BoundingBox& box) noexcept;

    /** @brief Number of boxes added so far. */
    [[nodiscard]] std::size_t count() const noexcept;

    /** @brief Aggregated extent, or std::nullopt when nothing was added. */
    [[nodiscard]] std::optional<BoundingBox> result() const noexcept;

  private:
    std::optional<BoundingBox> optional_extent_;
    std::size_t count_{0};
};

/** @brief Componentwise union of @p boxes; std::nullopt for an empty list. */
[[nodiscard]] std::optional<BoundingBox> aggregate_bounds(const std::vector<BoundingBox>& boxes);

/** @brief Union of @p boxes, or @p fallback when the list is empty. */
[[nodiscard]] BoundingBox resolve_bounds(const std::vector<BoundingBox>& boxes, const BoundingBox& fallback);

}  // namespace tile_timeline
