// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the batch driver and
// the CLI. `ConfigurationLoader` translates environment variables into this
// structure so downstream modules never touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <string>

#include "tile_timeline/grid_size_resolver.hpp"
#include "tile_timeline/region.hpp"
#include "tile_timeline/types.hpp"

namespace tile_timeline {

/**
 * @brief Everything one batch run needs to know about its inputs and outputs.
 *
 * Populated by ConfigurationLoader (optionally overridden by CLI flags) and
 * treated as immutable once the driver is constructed.
 */
struct BatchConfig final {
    std::filesystem::path base_dir{};    /**< Root of the per-year exports. */
    std::filesystem::path output_dir{};  /**< Root of the client data tree. */
    RegionList regions{};                /**< Regions processed by `--all`. */
    YearList years{};                    /**< Years in processing order. */
    GridSizePolicy grid_policy{};        /**< Treatment of irregular tile counts. */
    std::string tile_extension{};        /**< Tile file extension including the dot. */
};

/** @brief Process-level configuration: logging plus the batch settings. */
struct Configuration final {
    std::string log_directory{};  /**< Destination directory for structured logs. */
    BatchConfig batch{};          /**< Settings handed to RegionBatchDriver. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Initialize logging and read every `TIMELINE_*` variable. */
    static Configuration load();

    /** @brief Parse `2024, 2022,...`; malformed entries are dropped with a warning. */
    static YearList parse_years(const std::string& raw_years);
    /** @brief Parse `a,b,...` into region descriptors; blanks are ignored. */
    static RegionList parse_regions(const std::string& raw_regions);
};

}  // namespace tile_timeline
