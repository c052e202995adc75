// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the batch driver. This implementation provides a narrow interface
// (`ConfigurationLoader`) that transforms raw environment variables into the
// strongly-typed `Configuration` structure consumed by downstream modules.
//
// Responsibilities
// - Enforce defaults for input/output roots, regions, years and the
//   irregular-grid policy.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// Note: This file intentionally avoids reading from disk; callers are expected
// to populate the process environment ahead of time (e.g., a shell-sourced
// `.env`). Command-line overrides are applied by the application.

#include "tile_timeline/configuration.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "tile_timeline/logging.hpp"

namespace tile_timeline {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_base_dir{"data/raw"};
constexpr std::string_view k_default_output_dir{"public/data"};
constexpr std::string_view k_default_regions{"hudson_yards,east_harlem"};
constexpr std::string_view k_default_tile_extension{".png"};
constexpr std::size_t k_default_fallback_grid_size{4};
constexpr std::array<Year, 11> k_default_years{2024, 2022, 2020, 2018, 2016, 2014, 2012, 2010, 2008, 2006, 2004};

std::string trim(std::string_view text) {
    const auto is_space = [](char character) {
        return std::isspace(static_cast<unsigned char>(character)) != 0;
    };
    const auto first = std::find_if_not(text.begin(), text.end(), is_space);
    const auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    return first < last ? std::string{first, last} : std::string{};
}

std::vector<std::string> split_list(const std::string& raw_list) {
    std::vector<std::string> list_items;
    std::size_t item_begin = 0;
    while (item_begin <= raw_list.size()) {
        const std::size_t comma = raw_list.find(',', item_begin);
        const std::size_t item_end = comma == std::string::npos ? raw_list.size() : comma;
        std::string item = trim(std::string_view{raw_list}.substr(item_begin, item_end - item_begin));
        if (!item.empty()) {
            list_items.push_back(std::move(item));
        }
        if (comma == std::string::npos) {
            break;
        }
        item_begin = comma + 1;
    }
    return list_items;
}

std::string env_or(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::size_t parse_grid_size(const char* raw_value, std::size_t fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn("Fallback grid size must be positive; using {}", fallback);
            return fallback;
        }
        return static_cast<std::size_t>(parsed_value);
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse fallback grid size from environment; using {}", fallback);
        return fallback;
    }
}

bool parse_flag(const char* raw_value) {
    if (raw_value == nullptr) {
        return false;
    }
    std::string value = trim(raw_value);
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

}  // namespace

YearList ConfigurationLoader::parse_years(const std::string& raw_years) {
    YearList list_years;
    for (const std::string& item : split_list(raw_years)) {
        try {
            std::size_t consumed = 0;
            const int year = std::stoi(item, &consumed);
            if (consumed != item.size()) {
                throw std::invalid_argument(item);
            }
            list_years.push_back(year);
        } catch (const std::exception&) {
            get_logger()->warn("Ignoring malformed year '{}'", item);
        }
    }
    return list_years;
}

RegionList ConfigurationLoader::parse_regions(const std::string& raw_regions) {
    RegionList list_regions;
    for (const std::string& region_id : split_list(raw_regions)) {
        list_regions.push_back(find_region(region_id));
    }
    return list_regions;
}

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = env_or("TIMELINE_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    BatchConfig& batch = config.batch;
    batch.base_dir = env_or("TIMELINE_BASE_DIR", k_default_base_dir);
    batch.output_dir = env_or("TIMELINE_OUTPUT_DIR", k_default_output_dir);
    batch.tile_extension = env_or("TIMELINE_TILE_EXTENSION", k_default_tile_extension);
    if (batch.tile_extension.front() != '.') {
        batch.tile_extension.insert(batch.tile_extension.begin(), '.');
    }

    batch.regions = parse_regions(env_or("TIMELINE_REGIONS", k_default_regions));
    if (batch.regions.empty()) {
        logger->warn("TIMELINE_REGIONS lists no regions; using defaults");
        batch.regions = parse_regions(std::string{k_default_regions});
    }

    if (const char* raw_years = std::getenv("TIMELINE_YEARS"); raw_years != nullptr) {
        batch.years = parse_years(raw_years);
    }
    if (batch.years.empty()) {
        batch.years.assign(k_default_years.begin(), k_default_years.end());
    }

    batch.grid_policy.fallback_grid_size = parse_grid_size(std::getenv("TIMELINE_FALLBACK_GRID"), k_default_fallback_grid_size);
    batch.grid_policy.irregular = parse_flag(std::getenv("TIMELINE_STRICT_GRID"))
        ? IrregularGridPolicy::Strict
        : IrregularGridPolicy::Fallback;

    logger->info("Configuration loaded: base_dir={} output_dir={} regions={} years={} fallback_grid={} strict_grid={}",
                 batch.base_dir.string(),
                 batch.output_dir.string(),
                 batch.regions.size(),
                 batch.years.size(),
                 batch.grid_policy.fallback_grid_size,
                 batch.grid_policy.irregular == IrregularGridPolicy::Strict);

    return config;
}

}  // namespace tile_timeline
