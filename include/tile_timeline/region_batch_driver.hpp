// === Region Batch Driver =====================================================
//
// Coordinates one batch run: scaffolds the client data tree, processes every
// configured year of a region sequentially (vector layer, then imagery),
// aggregates bounds, writes the region metadata, and finally rebuilds the
// region index. Step failures are captured in the returned report and never
// abort the batch.

#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "tile_timeline/batch_report.hpp"
#include "tile_timeline/bounds_aggregator.hpp"
#include "tile_timeline/configuration.hpp"
#include "tile_timeline/logging.hpp"
#include "tile_timeline/mosaic_assembler.hpp"
#include "tile_timeline/vector_layer_converter.hpp"

namespace tile_timeline {

/** @brief Output locations for one region. */
struct RegionLayout final {
    std::filesystem::path region_dir{};    /**< `<output>/tiles/<tile_id>`. */
    std::filesystem::path imagery_dir{};   /**< Stitched PNGs, one per year. */
    std::filesystem::path networks_dir{};  /**< GeoJSON layers, one per year. */
    std::filesystem::path metadata_path{}; /**< Region metadata document. */
};

/** @brief Sequential per-region, per-year processing pipeline. */
class RegionBatchDriver final {
  public:
    /**
     * @brief Construct a driver.
     *
     * @param config Input/output roots, years and mosaic policy.
     * @param vector_converter Converter used for polygon layers; must not be null.
     * @param tile_reader Decoder for tile images (defaults to cv::imread).
     */
    RegionBatchDriver(BatchConfig config,
                      std::unique_ptr<VectorLayerConverter> vector_converter,
                      TileReader tile_reader = make_file_tile_reader());

    /** @brief Process every region in @p regions, then rebuild the region index. */
    [[nodiscard]] BatchReport run(const RegionList& regions);
    /** @brief Process every configured year of @p region and write its metadata. */
    [[nodiscard]] RegionReport run_region(const RegionDescriptor& region);
    /** @brief Rebuild the region index from all region metadata on disk. */
    StepOutcome write_index();

    /** @brief `<output>/regions.json`. */
    [[nodiscard]] std::filesystem::path index_path() const;

    /** @brief Output locations for @p region under the configured output root. */
    [[nodiscard]] RegionLayout layout_for(const RegionDescriptor& region) const;
    /** @brief Input folder `<base>/<year>/<region>_<year>`. */
    [[nodiscard]] std::filesystem::path year_input_dir(const RegionDescriptor& region, Year year) const;

    [[nodiscard]] const BatchConfig& config() const noexcept;

  private:
    /** @brief Run both substeps for one year. */
    YearReport process_year(const RegionDescriptor& region, const RegionLayout& layout, Year year,
                            BoundsAggregator& bounds);
    /** @brief Convert the year's polygon layer to GeoJSON. */
    StepOutcome convert_vector_layer(const std::filesystem::path& year_dir, const RegionLayout& layout, Year year,
                                     YearReport& year_report, BoundsAggregator& bounds);
    /** @brief Stitch the year's tiles into a PNG mosaic. */
    StepOutcome stitch_imagery(const std::filesystem::path& year_dir, const RegionLayout& layout, Year year,
                               YearReport& year_report);
    /** @brief Years with a GeoJSON or PNG present in @p layout, newest first. */
    [[nodiscard]] YearList available_years(const RegionLayout& layout) const;

    BatchConfig config_;
    std::unique_ptr<VectorLayerConverter> vector_converter_;
    MosaicAssembler mosaic_assembler_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Log a human-readable summary of @p report. */
void summarize(const BatchReport& report, const YearList& configured_years);

}  // namespace tile_timeline
