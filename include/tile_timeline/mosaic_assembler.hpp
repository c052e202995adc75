// === Mosaic Assembler ========================================================
//
// Reconstructs one square mosaic from exported tiles. The assembler owns the
// canvas for the duration of a call: it allocates a black 3-channel image,
// places every tile whose identifier maps into the grid, and reports which
// tiles were dropped and why. Dropping a tile is never fatal; only an
// undecodable image escapes as MosaicError.

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "tile_timeline/grid_size_resolver.hpp"
#include "tile_timeline/logging.hpp"
#include "tile_timeline/tile_discovery.hpp"

namespace tile_timeline {

/** @brief Raised when a mosaic cannot be produced at all. */
class MosaicError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Reasons a tile is left off the canvas. */
enum class TileRejection {
    MalformedIdentifier, /**< Stem lacks a numeric third segment. */
    OutOfGrid,           /**< Transposed cell falls outside the grid. */
    SizeMismatch         /**< Image is not tile_side x tile_side. */
};

/** @brief A dropped tile and the reason it was dropped. */
struct RejectedTile final {
    std::string identifier{};
    TileRejection reason{TileRejection::MalformedIdentifier};
};

/** @brief Canvas plus placement statistics for one assembly call. */
struct MosaicResult final {
    cv::Mat canvas{};                   /**< CV_8UC3, (grid*side) x (grid*side). */
    std::size_t grid_size{};            /**< Tiles per side. */
    int tile_side_px{};                 /**< Pixel side of one tile. */
    std::size_t placed_count{};         /**< Tiles composited onto the canvas. */
    std::size_t total_count{};          /**< Tiles offered to the assembler. */
    std::vector<RejectedTile> rejected; /**< Tiles dropped, in processing order. */
};

/** @brief Loads the pixels of a tile; must throw on undecodable input. */
using TileReader = std::function<cv::Mat(const Tile&)>;

/** @brief Reader decoding tiles from disk with cv::imread. */
TileReader make_file_tile_reader();

/** @brief Human-readable label for a rejection reason. */
[[nodiscard]] const char* to_string(TileRejection reason) noexcept;

/** @brief Composites tile sets onto square canvases. */
class MosaicAssembler final {
  public:
    MosaicAssembler();
    explicit MosaicAssembler(GridSizePolicy policy, TileReader reader = make_file_tile_reader());

    /**
     * @brief Place @p tiles on a grid_size x grid_size canvas of tile_side_px tiles.
     *
     * Tiles are processed in the given order; later tiles overwrite earlier
     * ones that land on the same cell.
     */
    [[nodiscard]] MosaicResult assemble(const TileSet& tiles, std::size_t grid_size, int tile_side_px) const;

    /**
     * @brief Infer grid size and tile side from @p tiles, then assemble.
     *
     * The side is the width of the first tile, which is decoded only once.
     * Throws std::invalid_argument for an empty set and MosaicError when the
     * grid policy refuses the tile count.
     */
    [[nodiscard]] MosaicResult stitch(const TileSet& tiles) const;

  private:
    /** @brief Shared body of assemble/stitch; a non-empty @p decoded_first_tile stands in for tiles[0]. */
    MosaicResult place_tiles(const TileSet& tiles, std::size_t grid_size, int tile_side_px,
                             const cv::Mat& decoded_first_tile) const;

    GridSizeResolver resolver_;
    TileReader reader_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Convert an 8/16-bit gray, BGR or BGRA image to 8-bit BGR. */
[[nodiscard]] cv::Mat to_bgr8(const cv::Mat& image);

/** @brief Write @p canvas as PNG to @p path; throws MosaicError on failure. */
void save_mosaic_png(const cv::Mat& canvas, const std::filesystem::path& path);

}  // namespace tile_timeline
