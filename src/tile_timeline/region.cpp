#include "tile_timeline/region.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tile_timeline {

namespace {
constexpr BoundingBox k_east_harlem_bounds{-73.979239, 40.777385, -73.970209, 40.784245};
constexpr BoundingBox k_hudson_yards_bounds{-74.003421, 40.750033, -73.997934, 40.755121};
constexpr BoundingBox k_city_wide_bounds{-74.01, 40.70, -73.97, 40.76}; /**< Generic NYC extent. */
constexpr char k_tile_suffix[] = "_tile_0";
}  // namespace

std::string RegionDescriptor::tile_id() const {
    return id + k_tile_suffix;
}

std::string display_name_for(std::string_view region_id) {
    std::string display_name;
    display_name.reserve(region_id.size());
    bool start_of_word = true;
    for (const char character : region_id) {
        if (character == '_') {
            display_name.push_back(' ');
            start_of_word = true;
            continue;
        }
        const auto byte = static_cast<unsigned char>(character);
        display_name.push_back(static_cast<char>(start_of_word ? std::toupper(byte) : std::tolower(byte)));
        start_of_word = false;
    }
    return display_name;
}

const RegionList& builtin_regions() {
    static const RegionList list_regions{
        RegionDescriptor{"east_harlem", display_name_for("east_harlem"), k_east_harlem_bounds},
        RegionDescriptor{"hudson_yards", display_name_for("hudson_yards"), k_hudson_yards_bounds},
    };
    return list_regions;
}

RegionDescriptor find_region(std::string_view region_id) {
    if (region_id.empty()) {
        throw std::invalid_argument("Region identifier must not be empty");
    }
    const RegionList& list_regions = builtin_regions();
    const auto iterator_region = std::find_if(list_regions.begin(), list_regions.end(), [region_id](const RegionDescriptor& region) {
        return region.id == region_id;
    });
    if (iterator_region != list_regions.end()) {
        return *iterator_region;
    }
    return RegionDescriptor{std::string{region_id}, display_name_for(region_id), k_city_wide_bounds};
}

}  // namespace tile_timeline
