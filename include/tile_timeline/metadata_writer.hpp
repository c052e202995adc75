// === Metadata Writer =========================================================
//
// Serializes the documents the map client reads: one metadata record per
// region (extent, available years, layer styling) and the region index that
// populates the client's region selector. Documents are 2-space indented
// UTF-8 JSON.

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "tile_timeline/types.hpp"

namespace tile_timeline {

/** @brief Raised when a metadata document cannot be written or parsed. */
class MetadataError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Name and display color of a vector layer class. */
struct LayerStyle final {
    std::string name{};
    std::string color{};  /**< CSS hex color, e.g. `#4A90E2`. */

    friend bool operator==(const LayerStyle&, const LayerStyle&) = default;
};

/** @brief Per-region document consumed by the client. */
struct RegionMetadata final {
    std::string area_name{};          /**< Region identifier. */
    std::string tile_id{};            /**< Output folder name under `tiles/`. */
    std::string name{};               /**< Display name. */
    BoundingBox bounds{};             /**< Overall WGS84 extent. */
    YearList years{};                 /**< Years with output, newest first. */
    std::vector<LayerStyle> layers{}; /**< Layer classes in display order. */
};

/** @brief Summary row of the region index. */
struct RegionIndexEntry final {
    std::string tile_id{};
    std::string name{};
    BoundingBox bounds{};
};

/** @brief Sidewalk, road and crosswalk styling shared by all regions. */
[[nodiscard]] const std::vector<LayerStyle>& default_layer_styles();

/** @brief Write @p metadata to @p path, replacing any existing file. */
void write_region_metadata(const std::filesystem::path& path, const RegionMetadata& metadata);

/** @brief Parse a document produced by write_region_metadata(). */
[[nodiscard]] RegionMetadata read_region_metadata(const std::filesystem::path& path);

/** @brief Write the region index array to @p path. */
void write_region_index(const std::filesystem::path& path, const std::vector<RegionIndexEntry>& entries);

/**
 * @brief Build index entries from every `<tiles_root>/<tile_id>/metadata.json`.
 *
 * Folders are visited in lexical order; unreadable documents are logged and
 * skipped.
 */
[[nodiscard]] std::vector<RegionIndexEntry> collect_region_index(const std::filesystem::path& tiles_root);

}  // namespace tile_timeline
