// === Batch Report ============================================================
//
// Typed outcome records the batch driver returns instead of swallowing step
// failures into console text. Every substep of every year resolves to exactly
// one StepOutcome; reports nest year -> region -> batch.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "tile_timeline/types.hpp"

namespace tile_timeline {

/** @brief Terminal state of one substep. */
enum class StepStatus {
    Succeeded, /**< Output was written. */
    Skipped,   /**< Input was missing; nothing attempted. */
    Failed     /**< Input existed but processing raised an error. */
};

/** @brief Status plus a short cause for logs and callers. */
struct StepOutcome final {
    StepStatus status{StepStatus::Skipped};
    std::string detail{};

    [[nodiscard]] bool succeeded() const noexcept {
        return status == StepStatus::Succeeded;
    }
};

/** @brief Result of processing one year of one region. */
struct YearReport final {
    Year year{};
    StepOutcome vector{};         /**< Shapefile -> GeoJSON substep. */
    StepOutcome imagery{};        /**< Tile stitching substep. */
    std::size_t feature_count{};  /**< Features written by the vector substep. */
    std::size_t tiles_placed{};   /**< Tiles composited into the mosaic. */
    std::size_t tiles_total{};    /**< Tiles discovered for the mosaic. */
    std::size_t grid_size{};      /**< Grid used for the mosaic, 0 when not stitched. */

    /** @brief True when either substep produced output. */
    [[nodiscard]] bool has_output() const noexcept {
        return vector.succeeded() || imagery.succeeded();
    }
};

/** @brief Result of processing one region across all configured years. */
struct RegionReport final {
    std::string region_id{};
    std::string tile_id{};
    StepOutcome metadata{};             /**< Scaffolding + metadata document. */
    std::vector<YearReport> years{};    /**< In configured order. */
    YearList available_years{};         /**< Years with output on disk, newest first. */
    BoundingBox bounds{};               /**< Bounds written to the metadata. */
    bool used_fallback_bounds{false};   /**< True when no vector layer contributed. */
    std::filesystem::path metadata_path{};
};

/** @brief Result of one invocation over one or more regions. */
struct BatchReport final {
    std::vector<RegionReport> regions{};
    StepOutcome index{};                /**< Region index rebuild. */
    std::filesystem::path index_path{};
};

/** @brief `succeeded`, `skipped` or `failed`. */
[[nodiscard]] std::string_view to_string(StepStatus status) noexcept;

}  // namespace tile_timeline
