// === Tile Discovery ==========================================================
//
// Filesystem helpers that locate exported tiles and the per-year input
// folders. Every listing is sorted lexically so runs are reproducible no
// matter how the underlying filesystem orders directory entries.

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tile_timeline {

/** @brief One exported tile file. */
struct Tile final {
    std::string identifier{};      /**< Filename stem, e.g. `tile_layer_5`. */
    std::filesystem::path path{};  /**< Location of the encoded image. */
};

/** @brief Tiles of a single mosaic in lexical filename order. */
using TileSet = std::vector<Tile>;

/**
 * @brief List regular files in @p directory whose extension equals @p extension.
 *
 * The comparison is case sensitive and @p extension includes the dot. A
 * missing directory yields an empty set.
 */
[[nodiscard]] TileSet discover_tiles(const std::filesystem::path& directory, const std::string& extension);

/** @brief Lexically first subdirectory of @p directory, if any. */
[[nodiscard]] std::optional<std::filesystem::path> first_subdirectory(const std::filesystem::path& directory);

/** @brief Lexically first regular file in @p directory with @p extension, if any. */
[[nodiscard]] std::optional<std::filesystem::path> first_file_with_extension(const std::filesystem::path& directory,
                                                                             const std::string& extension);

}  // namespace tile_timeline
