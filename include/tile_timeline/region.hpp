// === Region Catalog ==========================================================
//
// Describes the geographic areas the builder knows about. Each region carries
// a display name and the static extent used when none of its years produced a
// vector layer to measure.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tile_timeline/types.hpp"

namespace tile_timeline {

/** @brief Identity and fallback extent of one region. */
struct RegionDescriptor final {
    std::string id{};               /**< Directory-safe identifier, e.g. `hudson_yards`. */
    std::string display_name{};     /**< Label shown by the client's region selector. */
    BoundingBox fallback_bounds{};  /**< Extent used when no vector layer converts. */

    /** @brief Output tile identifier, `<id>_tile_0`. */
    [[nodiscard]] std::string tile_id() const;
};

using RegionList = std::vector<RegionDescriptor>;

/** @brief `east_harlem` -> `East Harlem`. */
[[nodiscard]] std::string display_name_for(std::string_view region_id);

/** @brief Regions with surveyed fallback extents. */
[[nodiscard]] const RegionList& builtin_regions();

/**
 * @brief Descriptor for @p region_id.
 *
 * Unknown identifiers receive the generic city-wide fallback extent. Throws
 * std::invalid_argument for an empty identifier.
 */
[[nodiscard]] RegionDescriptor find_region(std::string_view region_id);

}  // namespace tile_timeline
