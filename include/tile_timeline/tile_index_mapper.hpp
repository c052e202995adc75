// === Tile Index Mapper =======================================================
//
// Converts exported tile identifiers into canvas cells. Identifiers follow the
// exporter's `<prefix>_<layer>_<index>` stem convention; the linear index is
// row-major in the exporter's enumeration, and the canvas cell is its
// transpose.

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "tile_timeline/types.hpp"

namespace tile_timeline {

/**
 * @brief Extract the linear index from the third underscore-delimited segment.
 *
 * Returns std::nullopt when the identifier has fewer than three segments or
 * the third segment is not a base-10 non-negative integer.
 */
[[nodiscard]] std::optional<std::size_t> parse_tile_index(std::string_view identifier);

/**
 * @brief Map a row-major linear index to its transposed destination cell.
 *
 * source = (index / grid_size, index % grid_size); destination swaps the two.
 * Returns std::nullopt when the destination falls outside the grid.
 */
[[nodiscard]] std::optional<GridCell> map_tile_index(std::size_t tile_index, std::size_t grid_size);

}  // namespace tile_timeline
