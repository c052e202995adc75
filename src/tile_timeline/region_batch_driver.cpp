#include "tile_timeline/region_batch_driver.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "tile_timeline/metadata_writer.hpp"
#include "tile_timeline/tile_discovery.hpp"

namespace tile_timeline {

namespace {

constexpr char k_tiles_folder[] = "tiles";
constexpr char k_imagery_folder[] = "imagery";
constexpr char k_networks_folder[] = "networks";
constexpr char k_metadata_file_name[] = "metadata.json";
constexpr char k_region_index_file_name[] = "regions.json";
constexpr char k_polygons_folder[] = "polygons";
constexpr char k_stitched_folder[] = "stitched";

StepOutcome skipped(std::string detail) {
    return StepOutcome{StepStatus::Skipped, std::move(detail)};
}

StepOutcome failed(std::string detail) {
    return StepOutcome{StepStatus::Failed, std::move(detail)};
}

StepOutcome succeeded(const std::filesystem::path& output) {
    return StepOutcome{StepStatus::Succeeded, output.string()};
}

bool exists_as_file(const std::filesystem::path& path) {
    std::error_code error_status;
    return std::filesystem::is_regular_file(path, error_status);
}

bool exists_as_directory(const std::filesystem::path& path) {
    std::error_code error_status;
    return std::filesystem::is_directory(path, error_status);
}

std::filesystem::path geojson_path(const RegionLayout& layout, Year year) {
    return layout.networks_dir / fmt::format("{}.geojson", year);
}

std::filesystem::path imagery_path(const RegionLayout& layout, Year year) {
    return layout.imagery_dir / fmt::format("{}.png", year);
}

}  // namespace

RegionBatchDriver::RegionBatchDriver(BatchConfig config,
                                     std::unique_ptr<VectorLayerConverter> vector_converter,
                                     TileReader tile_reader)
    : config_(std::move(config)),
      vector_converter_(std::move(vector_converter)),
      mosaic_assembler_(config_.grid_policy, std::move(tile_reader)),
      logger_(get_logger()) {
    if (!vector_converter_) {
        throw std::invalid_argument("RegionBatchDriver requires a vector layer converter");
    }
    if (config_.tile_extension.empty()) {
        throw std::invalid_argument("RegionBatchDriver requires a tile extension");
    }
}

const BatchConfig& RegionBatchDriver::config() const noexcept {
    return config_;
}

RegionLayout RegionBatchDriver::layout_for(const RegionDescriptor& region) const {
    RegionLayout layout{};
    layout.region_dir = config_.output_dir / k_tiles_folder / region.tile_id();
    layout.imagery_dir = layout.region_dir / k_imagery_folder;
    layout.networks_dir = layout.region_dir / k_networks_folder;
    layout.metadata_path = layout.region_dir / k_metadata_file_name;
    return layout;
}

std::filesystem::path RegionBatchDriver::year_input_dir(const RegionDescriptor& region, Year year) const {
    return config_.base_dir / std::to_string(year) / fmt::format("{}_{}", region.id, year);
}

std::filesystem::path RegionBatchDriver::index_path() const {
    return config_.output_dir / k_region_index_file_name;
}

/**
 * @brief Process each region in order and rebuild the region index.
 */
BatchReport RegionBatchDriver::run(const RegionList& regions) {
    BatchReport report{};
    for (const RegionDescriptor& region : regions) {
        report.regions.push_back(run_region(region));
    }
    report.index = write_index();
    report.index_path = index_path();
    return report;
}

/**
 * @brief Scaffold outputs, process every year, then persist the region metadata.
 */
RegionReport RegionBatchDriver::run_region(const RegionDescriptor& region) {
    RegionReport report{};
    report.region_id = region.id;
    report.tile_id = region.tile_id();

    const RegionLayout layout = layout_for(region);
    report.metadata_path = layout.metadata_path;

    logger_->info("Preparing {} into {}", region.id, layout.region_dir.string());
    for (const std::filesystem::path& directory : {layout.imagery_dir, layout.networks_dir}) {
        std::error_code error_directory;
        std::filesystem::create_directories(directory, error_directory);
        if (error_directory) {
            logger_->error("Unable to create {}: {}", directory.string(), error_directory.message());
            report.metadata = failed(fmt::format("unable to create {}: {}", directory.string(), error_directory.message()));
            return report;
        }
    }

    BoundsAggregator bounds;
    for (const Year year : config_.years) {
        report.years.push_back(process_year(region, layout, year, bounds));
    }

    report.available_years = available_years(layout);

    const std::optional<BoundingBox> aggregated_bounds = bounds.result();
    if (aggregated_bounds.has_value()) {
        report.bounds = aggregated_bounds.value();
    } else {
        logger_->warn("No GeoJSON bounds found for {}, using estimated bounds", region.id);
        report.bounds = region.fallback_bounds;
        report.used_fallback_bounds = true;
    }

    RegionMetadata metadata{};
    metadata.area_name = region.id;
    metadata.tile_id = region.tile_id();
    metadata.name = region.display_name;
    metadata.bounds = report.bounds;
    metadata.years = report.available_years;
    metadata.layers = default_layer_styles();

    try {
        write_region_metadata(layout.metadata_path, metadata);
        report.metadata = succeeded(layout.metadata_path);
        logger_->info("Metadata saved to {}", layout.metadata_path.string());
    } catch (const MetadataError& exc) {
        logger_->error("Metadata write failed for {}: {}", region.id, exc.what());
        report.metadata = failed(exc.what());
    }
    return report;
}

StepOutcome RegionBatchDriver::write_index() {
    const std::filesystem::path path_index = index_path();
    try {
        const std::vector<RegionIndexEntry> entries = collect_region_index(config_.output_dir / k_tiles_folder);
        write_region_index(path_index, entries);
        logger_->info("Region index lists {} regions", entries.size());
        return succeeded(path_index);
    } catch (const std::exception& exc) {
        logger_->error("Region index write failed: {}", exc.what());
        return failed(exc.what());
    }
}

YearReport RegionBatchDriver::process_year(const RegionDescriptor& region, const RegionLayout& layout, Year year,
                                           BoundsAggregator& bounds) {
    YearReport year_report{};
    year_report.year = year;
    logger_->info("Processing {} {}", region.id, year);

    const std::filesystem::path year_dir = year_input_dir(region, year);
    if (!exists_as_directory(year_dir)) {
        logger_->warn("Year folder {} not found, skipping", year_dir.string());
        year_report.vector = skipped("year folder not found");
        year_report.imagery = skipped("year folder not found");
        return year_report;
    }

    year_report.vector = convert_vector_layer(year_dir, layout, year, year_report, bounds);
    year_report.imagery = stitch_imagery(year_dir, layout, year, year_report);
    return year_report;
}

StepOutcome RegionBatchDriver::convert_vector_layer(const std::filesystem::path& year_dir, const RegionLayout& layout,
                                                    Year year, YearReport& year_report, BoundsAggregator& bounds) {
    const std::filesystem::path polygons_dir = year_dir / k_polygons_folder;
    if (!exists_as_directory(polygons_dir)) {
        logger_->warn("No polygons folder found for {}", year);
        return skipped("no polygons folder");
    }

    const std::optional<std::filesystem::path> source_layer = find_source_layer(polygons_dir);
    if (!source_layer.has_value()) {
        logger_->warn("No shapefile found in {}", polygons_dir.string());
        return skipped("no shapefile in polygons folder");
    }

    const std::filesystem::path output_path = geojson_path(layout, year);
    try {
        const VectorLayerSummary summary = vector_converter_->convert(source_layer.value(), output_path);
        year_report.feature_count = summary.feature_count;
        if (summary.bounds.has_value()) {
            bounds.add(summary.bounds.value());
        }
        logger_->info("GeoJSON for {}: {} features", year, summary.feature_count);
        return succeeded(output_path);
    } catch (const std::exception& exc) {
        logger_->error("GeoJSON conversion failed for {}: {}", year, exc.what());
        return failed(exc.what());
    }
}

StepOutcome RegionBatchDriver::stitch_imagery(const std::filesystem::path& year_dir, const RegionLayout& layout,
                                              Year year, YearReport& year_report) {
    const std::filesystem::path stitched_dir = year_dir / k_tiles_folder / k_stitched_folder;
    if (!exists_as_directory(stitched_dir)) {
        logger_->warn("No stitched tiles folder found for {}", year);
        return skipped("no stitched tiles folder");
    }

    const std::optional<std::filesystem::path> tiles_folder = first_subdirectory(stitched_dir);
    if (!tiles_folder.has_value()) {
        logger_->warn("No subfolders found in {}", stitched_dir.string());
        return skipped("no subfolder in stitched folder");
    }

    const TileSet tiles = discover_tiles(tiles_folder.value(), config_.tile_extension);
    if (tiles.empty()) {
        logger_->warn("No {} tiles found in {}", config_.tile_extension, tiles_folder->filename().string());
        return skipped(fmt::format("no {} tiles", config_.tile_extension));
    }

    const std::filesystem::path output_path = imagery_path(layout, year);
    try {
        const MosaicResult mosaic = mosaic_assembler_.stitch(tiles);
        year_report.tiles_placed = mosaic.placed_count;
        year_report.tiles_total = mosaic.total_count;
        year_report.grid_size = mosaic.grid_size;

        save_mosaic_png(mosaic.canvas, output_path);
        logger_->info("Imagery for {}: {}/{} tiles stitched ({}x{})",
                      year, mosaic.placed_count, mosaic.total_count, mosaic.grid_size, mosaic.grid_size);
        return succeeded(output_path);
    } catch (const std::exception& exc) {
        logger_->error("Image stitching failed for {}: {}", year, exc.what());
        return failed(exc.what());
    }
}

YearList RegionBatchDriver::available_years(const RegionLayout& layout) const {
    YearList list_years;
    for (const Year year : config_.years) {
        if (exists_as_file(geojson_path(layout, year)) || exists_as_file(imagery_path(layout, year))) {
            list_years.push_back(year);
        }
    }
    std::sort(list_years.begin(), list_years.end(), std::greater<>{});
    list_years.erase(std::unique(list_years.begin(), list_years.end()), list_years.end());
    return list_years;
}

void summarize(const BatchReport& report, const YearList& configured_years) {
    auto logger = get_logger();
    for (const RegionReport& region : report.regions) {
        std::size_t geojson_count = 0;
        std::size_t imagery_count = 0;
        YearList list_missing_years;
        for (const YearReport& year_report : region.years) {
            geojson_count += year_report.vector.succeeded() ? 1 : 0;
            imagery_count += year_report.imagery.succeeded() ? 1 : 0;
            if (!year_report.has_output()) {
                list_missing_years.push_back(year_report.year);
            }
        }

        logger->info("Summary for {}: {} of {} years available, {} GeoJSON files, {} PNG images, metadata {}",
                     region.region_id,
                     region.available_years.size(),
                     configured_years.size(),
                     geojson_count,
                     imagery_count,
                     to_string(region.metadata.status));
        if (region.used_fallback_bounds) {
            logger->info("Bounds for {} are estimated", region.region_id);
        }
        if (!list_missing_years.empty()) {
            logger->warn("Failed/missing years for {}: {}", region.region_id, fmt::join(list_missing_years, ", "));
        }
    }
    logger->info("Region index {}: {}", to_string(report.index.status), report.index_path.string());
}

}  // namespace tile_timeline
