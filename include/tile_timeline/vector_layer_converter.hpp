// === Vector Layer Converter ==================================================
//
// Turns one year's source polygon layer (any OGR-readable format, any CRS)
// into a WGS84 GeoJSON file the map client can load directly, and reports the
// extent of what was written so the region bounds can be aggregated.

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>

#include "tile_timeline/logging.hpp"
#include "tile_timeline/types.hpp"

namespace tile_timeline {

/** @brief Raised when a source layer cannot be reprojected or written. */
class VectorConversionError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Outcome of converting one layer. */
struct VectorLayerSummary final {
    std::size_t feature_count{};         /**< Features written to the GeoJSON output. */
    std::optional<BoundingBox> bounds{}; /**< Total WGS84 extent; empty when no geometry was written. */
};

/** @brief Seam between the batch driver and the geospatial library. */
class VectorLayerConverter {
  public:
    virtual ~VectorLayerConverter() = default;

    /**
     * @brief Reproject @p source_layer to WGS84 and write it as GeoJSON to @p destination.
     *
     * Existing output is replaced. Throws VectorConversionError on failure.
     */
    virtual VectorLayerSummary convert(const std::filesystem::path& source_layer,
                                       const std::filesystem::path& destination) = 0;
};

/** @brief GDAL/OGR-backed converter. */
class OgrVectorLayerConverter final : public VectorLayerConverter {
  public:
    OgrVectorLayerConverter();

    VectorLayerSummary convert(const std::filesystem::path& source_layer,
                               const std::filesystem::path& destination) override;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Locate the shapefile inside a year's `polygons/` folder.
 *
 * Uses the lexically first subdirectory and, within it, the lexically first
 * `.shp` file.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_source_layer(const std::filesystem::path& polygons_dir);

}  // namespace tile_timeline
