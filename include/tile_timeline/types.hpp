// === Core Types ==============================================================
//
// Collects shared lightweight structs used throughout the pipeline: geographic
// extents, grid cells, and the year/identifier aliases that key every output.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tile_timeline {

/**
 * @brief Calendar year used to key imagery and vector layers.
 */
using Year = int;

/**
 * @brief Ordered list of years (order is significant to callers).
 */
using YearList = std::vector<Year>;

/**
 * @brief West/south/east/north extent in WGS84 decimal degrees.
 *
 * No ordering between west/east or south/north is enforced.
 */
struct BoundingBox final {
    double west{};   /**< Minimum longitude. */
    double south{};  /**< Minimum latitude. */
    double east{};   /**< Maximum longitude. */
    double north{};  /**< Maximum latitude. */

    friend bool operator==(const BoundingBox&, const BoundingBox&) = default;
};

/**
 * @brief Zero-based row/column of a cell in a square mosaic grid.
 */
struct GridCell final {
    std::size_t row{};  /**< Row index, grows downward on the canvas. */
    std::size_t col{};  /**< Column index, grows rightward on the canvas. */

    friend bool operator==(const GridCell&, const GridCell&) = default;
};

}  // namespace tile_timeline
