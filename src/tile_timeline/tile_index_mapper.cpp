#include "tile_timeline/tile_index_mapper.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>

namespace tile_timeline {

namespace {
constexpr char k_segment_delimiter{'_'};
constexpr std::size_t k_index_segment{2};
}  // namespace

std::optional<std::size_t> parse_tile_index(std::string_view identifier) {
    std::size_t segment_begin = 0;
    for (std::size_t segment = 0; segment < k_index_segment; ++segment) {
        const std::size_t delimiter = identifier.find(k_segment_delimiter, segment_begin);
        if (delimiter == std::string_view::npos) {
            return std::nullopt;
        }
        segment_begin = delimiter + 1;
    }

    const std::size_t segment_end = identifier.find(k_segment_delimiter, segment_begin);
    const std::string_view index_text = identifier.substr(
        segment_begin,
        segment_end == std::string_view::npos ? std::string_view::npos : segment_end - segment_begin
    );
    if (index_text.empty()) {
        return std::nullopt;
    }

    std::size_t tile_index = 0;
    const char* const first = index_text.data();
    const char* const last = index_text.data() + index_text.size();
    const auto [end_ptr, error_code] = std::from_chars(first, last, tile_index);
    if (error_code != std::errc{} || end_ptr != last) {
        return std::nullopt;
    }
    return tile_index;
}

std::optional<GridCell> map_tile_index(std::size_t tile_index, std::size_t grid_size) {
    if (grid_size == 0) {
        throw std::invalid_argument("Grid size must be positive");
    }
    const std::size_t source_row = tile_index / grid_size;
    const std::size_t source_col = tile_index % grid_size;

    // The exporter enumerates column-major relative to the canvas.
    const GridCell destination{source_col, source_row};
    if (destination.row >= grid_size || destination.col >= grid_size) {
        return std::nullopt;
    }
    return destination;
}

}  // namespace tile_timeline
