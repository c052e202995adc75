#include "tile_timeline/mosaic_assembler.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <fmt/format.h>

#include "tile_timeline/tile_index_mapper.hpp"

namespace tile_timeline {

namespace {
const cv::Scalar k_background_bgr{0, 0, 0};
constexpr int k_png_compression_level{9};
constexpr double k_sixteen_to_eight_bit_scale{1.0 / 257.0};
}  // namespace

TileReader make_file_tile_reader() {
    return [](const Tile& tile) {
        cv::Mat image = cv::imread(tile.path.string(), cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            throw MosaicError(fmt::format("Unable to decode tile {}", tile.path.string()));
        }
        return image;
    };
}

const char* to_string(TileRejection reason) noexcept {
    switch (reason) {
        case TileRejection::MalformedIdentifier:
            return "malformed_identifier";
        case TileRejection::OutOfGrid:
            return "out_of_grid";
        case TileRejection::SizeMismatch:
            return "size_mismatch";
    }
    return "unknown";
}

cv::Mat to_bgr8(const cv::Mat& image) {
    cv::Mat image_8u;
    switch (image.depth()) {
        case CV_8U:
            image_8u = image;
            break;
        case CV_16U:
            image.convertTo(image_8u, CV_8U, k_sixteen_to_eight_bit_scale);
            break;
        default:
            throw MosaicError(fmt::format("Unsupported tile pixel depth {}", image.depth()));
    }

    cv::Mat image_bgr;
    switch (image_8u.channels()) {
        case 1:
            cv::cvtColor(image_8u, image_bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            image_bgr = image_8u;
            break;
        case 4:
            cv::cvtColor(image_8u, image_bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw MosaicError(fmt::format("Unsupported tile channel count {}", image_8u.channels()));
    }
    return image_bgr;
}

MosaicAssembler::MosaicAssembler()
    : MosaicAssembler(GridSizePolicy{}) {}

MosaicAssembler::MosaicAssembler(GridSizePolicy policy, TileReader reader)
    : resolver_(policy),
      reader_(std::move(reader)),
      logger_(get_logger()) {
    if (!reader_) {
        throw std::invalid_argument("MosaicAssembler requires a tile reader");
    }
}

MosaicResult MosaicAssembler::assemble(const TileSet& tiles, std::size_t grid_size, int tile_side_px) const {
    return place_tiles(tiles, grid_size, tile_side_px, cv::Mat{});
}

MosaicResult MosaicAssembler::place_tiles(const TileSet& tiles, std::size_t grid_size, int tile_side_px,
                                          const cv::Mat& decoded_first_tile) const {
    if (grid_size == 0 || tile_side_px <= 0) {
        throw std::invalid_argument("Grid size and tile side must be positive");
    }

    MosaicResult result{};
    result.grid_size = grid_size;
    result.tile_side_px = tile_side_px;
    result.total_count = tiles.size();

    const int canvas_side_px = tile_side_px * static_cast<int>(grid_size);
    result.canvas = cv::Mat(canvas_side_px, canvas_side_px, CV_8UC3, k_background_bgr);

    for (std::size_t position = 0; position < tiles.size(); ++position) {
        const Tile& tile = tiles[position];
        const std::optional<std::size_t> tile_index = parse_tile_index(tile.identifier);
        if (!tile_index.has_value()) {
            logger_->debug("Tile {} has no numeric index, skipping", tile.identifier);
            result.rejected.push_back(RejectedTile{tile.identifier, TileRejection::MalformedIdentifier});
            continue;
        }

        const std::optional<GridCell> cell = map_tile_index(tile_index.value(), grid_size);
        if (!cell.has_value()) {
            logger_->warn("Tile {} out of bounds, skipping", tile_index.value());
            result.rejected.push_back(RejectedTile{tile.identifier, TileRejection::OutOfGrid});
            continue;
        }

        const bool reuse_decoded = position == 0 && !decoded_first_tile.empty();
        const cv::Mat image = to_bgr8(reuse_decoded ? decoded_first_tile : reader_(tile));
        if (image.cols != tile_side_px || image.rows != tile_side_px) {
            logger_->warn("Tile {} is {}x{}, expected {}x{}, skipping",
                          tile.identifier, image.cols, image.rows, tile_side_px, tile_side_px);
            result.rejected.push_back(RejectedTile{tile.identifier, TileRejection::SizeMismatch});
            continue;
        }

        const cv::Rect target{
            static_cast<int>(cell->col) * tile_side_px,
            static_cast<int>(cell->row) * tile_side_px,
            tile_side_px,
            tile_side_px
        };
        image.copyTo(result.canvas(target));
        ++result.placed_count;
    }

    return result;
}

MosaicResult MosaicAssembler::stitch(const TileSet& tiles) const {
    if (tiles.empty()) {
        throw std::invalid_argument("Cannot stitch an empty tile set");
    }

    const cv::Mat first_image = reader_(tiles.front());
    const int tile_side_px = first_image.cols;
    if (tile_side_px <= 0) {
        throw MosaicError(fmt::format("First tile {} has no pixels", tiles.front().identifier));
    }

    const std::optional<std::size_t> grid_size = resolver_.resolve(tiles.size());
    if (!grid_size.has_value()) {
        throw MosaicError(fmt::format("{} tiles do not form a square grid", tiles.size()));
    }
    if (grid_size.value() * grid_size.value() != tiles.size()) {
        logger_->warn("{} tiles doesn't form perfect square, using {}x{}",
                      tiles.size(), grid_size.value(), grid_size.value());
    }

    return place_tiles(tiles, grid_size.value(), tile_side_px, first_image);
}

void save_mosaic_png(const cv::Mat& canvas, const std::filesystem::path& path) {
    if (canvas.empty()) {
        throw MosaicError("Mosaic is empty, nothing to save");
    }
    const std::vector<int> params{cv::IMWRITE_PNG_COMPRESSION, k_png_compression_level};
    if (!cv::imwrite(path.string(), canvas, params)) {
        throw MosaicError(fmt::format("Failed to save {}", path.string()));
    }
}

}  // namespace tile_timeline
