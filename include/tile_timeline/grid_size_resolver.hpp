// === Grid Size Resolver ======================================================
//
// Infers the side length (in tiles) of a square mosaic from the number of
// tiles exported for it. Exports are nominally complete square grids; a count
// that is not a perfect square is handled by a configurable policy that either
// substitutes a fixed degraded-mode grid or refuses the tile set.

#pragma once

#include <cstddef>
#include <optional>

namespace tile_timeline {

/** @brief How to treat tile counts that are not perfect squares. */
enum class IrregularGridPolicy {
    Fallback,  /**< Substitute GridSizePolicy::fallback_grid_size. */
    Strict     /**< Refuse the tile set (resolve() yields no value). */
};

/** @brief Policy bundle consumed by GridSizeResolver. */
struct GridSizePolicy final {
    IrregularGridPolicy irregular{IrregularGridPolicy::Fallback};
    std::size_t fallback_grid_size{4};
};

/** @brief Maps a tile count onto a square grid dimension. */
class GridSizeResolver final {
  public:
    GridSizeResolver();
    explicit GridSizeResolver(GridSizePolicy policy);

    /**
     * @brief Resolve the grid size for @p tile_count tiles.
     *
     * Perfect squares resolve to their exact root. Other counts resolve to the
     * fallback grid size, or to std::nullopt under the strict policy.
     * Throws std::invalid_argument for a zero count.
     */
    [[nodiscard]] std::optional<std::size_t> resolve(std::size_t tile_count) const;

    [[nodiscard]] const GridSizePolicy& policy() const noexcept;

  private:
    GridSizePolicy policy_;
};

/** @brief Largest r such that r*r <= value, computed without floating point. */
[[nodiscard]] std::size_t integer_sqrt(std::size_t value) noexcept;

}  // namespace tile_timeline
