#include <algorithm>
#include <map>
#include <filesystem>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "tile_timeline/mosaic_assembler.hpp"
#include "tile_timeline/tile_index_mapper.hpp"

using namespace tile_timeline;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    tile_timeline::test::ensure_logger_initialized();
    return true;
}();

constexpr int k_tile_side_px{256};

cv::Vec3b color_for(std::size_t tile_index) {
    return cv::Vec3b{
        static_cast<uchar>(10 + tile_index * 10),
        static_cast<uchar>(250 - tile_index * 10),
        static_cast<uchar>(7)
    };
}

/** Solid tiles colored by index; identifiers without an index get white. */
TileReader solid_color_reader(int side_px) {
    return [side_px](const Tile& tile) {
        const auto tile_index = parse_tile_index(tile.identifier);
        const cv::Vec3b color = tile_index.has_value() ? color_for(tile_index.value()) : cv::Vec3b{255, 255, 255};
        return cv::Mat(side_px, side_px, CV_8UC3, cv::Scalar(color[0], color[1], color[2]));
    };
}

TileSet make_tiles(std::size_t tile_count) {
    TileSet tiles;
    for (std::size_t tile_index = 0; tile_index < tile_count; ++tile_index) {
        const std::string identifier = "tile_layer_" + std::to_string(tile_index);
        tiles.push_back(Tile{identifier, identifier + ".png"});
    }
    return tiles;
}

cv::Vec3b cell_center(const MosaicResult& mosaic, std::size_t row, std::size_t col) {
    const int half = mosaic.tile_side_px / 2;
    return mosaic.canvas.at<cv::Vec3b>(static_cast<int>(row) * mosaic.tile_side_px + half,
                                       static_cast<int>(col) * mosaic.tile_side_px + half);
}

bool byte_identical(const cv::Mat& lhs, const cv::Mat& rhs) {
    return lhs.size() == rhs.size() && lhs.type() == rhs.type() && lhs.isContinuous() && rhs.isContinuous()
        && std::equal(lhs.datastart, lhs.dataend, rhs.datastart);
}
}  // namespace

TEST_CASE("MosaicAssembler stitches a complete 4x4 export with transposition") {
    const MosaicAssembler assembler{GridSizePolicy{}, solid_color_reader(k_tile_side_px)};
    const MosaicResult mosaic = assembler.stitch(make_tiles(16));

    REQUIRE(mosaic.grid_size == 4);
    REQUIRE(mosaic.tile_side_px == k_tile_side_px);
    REQUIRE(mosaic.canvas.cols == 1024);
    REQUIRE(mosaic.canvas.rows == 1024);
    REQUIRE(mosaic.canvas.type() == CV_8UC3);
    REQUIRE(mosaic.placed_count == 16);
    REQUIRE(mosaic.total_count == 16);
    REQUIRE(mosaic.rejected.empty());

    // Index 5 sits on the diagonal; index 2 lands in row 2, column 0.
    REQUIRE(cell_center(mosaic, 1, 1) == color_for(5));
    REQUIRE(cell_center(mosaic, 2, 0) == color_for(2));
    REQUIRE(cell_center(mosaic, 0, 2) == color_for(8));
}

TEST_CASE("MosaicAssembler falls back to a 4x4 canvas for ten tiles") {
    const MosaicAssembler assembler{GridSizePolicy{}, solid_color_reader(k_tile_side_px)};
    const MosaicResult mosaic = assembler.stitch(make_tiles(10));

    REQUIRE(mosaic.grid_size == 4);
    REQUIRE(mosaic.canvas.cols == 1024);
    REQUIRE(mosaic.placed_count == 10);
    REQUIRE(mosaic.total_count == 10);
    // Index 10 was never exported: its cell (2, 2) stays black.
    REQUIRE(cell_center(mosaic, 2, 2) == cv::Vec3b{0, 0, 0});
    REQUIRE(cell_center(mosaic, 1, 2) == color_for(9));
}

TEST_CASE("MosaicAssembler drops a malformed identifier and leaves its cell black") {
    TileSet tiles = make_tiles(3);
    tiles.push_back(Tile{"tilelayer3", "tilelayer3.png"});

    const MosaicAssembler assembler{GridSizePolicy{}, solid_color_reader(64)};
    const MosaicResult mosaic = assembler.stitch(tiles);

    REQUIRE(mosaic.grid_size == 2);
    REQUIRE(mosaic.total_count == 4);
    REQUIRE(mosaic.placed_count == mosaic.total_count - 1);
    REQUIRE(mosaic.rejected.size() == 1);
    REQUIRE(mosaic.rejected.front().identifier == "tilelayer3");
    REQUIRE(mosaic.rejected.front().reason == TileRejection::MalformedIdentifier);
    REQUIRE(cell_center(mosaic, 1, 1) == cv::Vec3b{0, 0, 0});
    REQUIRE(cell_center(mosaic, 1, 0) == color_for(1));
}

TEST_CASE("MosaicAssembler drops indices that fall outside the grid") {
    TileSet tiles = make_tiles(3);
    tiles.push_back(Tile{"tile_layer_7", "tile_layer_7.png"});

    const MosaicAssembler assembler{GridSizePolicy{}, solid_color_reader(32)};
    const MosaicResult mosaic = assembler.assemble(tiles, 2, 32);

    REQUIRE(mosaic.placed_count == 3);
    REQUIRE(mosaic.rejected.size() == 1);
    REQUIRE(mosaic.rejected.front().reason == TileRejection::OutOfGrid);
    REQUIRE(std::string{to_string(TileRejection::OutOfGrid)} == "out_of_grid");
}

TEST_CASE("MosaicAssembler rejects tiles whose side disagrees with the first tile") {
    const TileReader base_reader = solid_color_reader(k_tile_side_px);
    const TileReader uneven_reader = [base_reader](const Tile& tile) {
        if (tile.identifier == "tile_layer_3") {
            return cv::Mat(128, 128, CV_8UC3, cv::Scalar(255, 255, 255));
        }
        return base_reader(tile);
    };

    const MosaicAssembler assembler{GridSizePolicy{}, uneven_reader};
    const MosaicResult mosaic = assembler.stitch(make_tiles(4));

    REQUIRE(mosaic.placed_count == 3);
    REQUIRE(mosaic.rejected.size() == 1);
    REQUIRE(mosaic.rejected.front().identifier == "tile_layer_3");
    REQUIRE(mosaic.rejected.front().reason == TileRejection::SizeMismatch);
    REQUIRE(cell_center(mosaic, 1, 1) == cv::Vec3b{0, 0, 0});
}

TEST_CASE("MosaicAssembler produces byte-identical canvases for identical input") {
    const MosaicAssembler assembler{GridSizePolicy{}, solid_color_reader(48)};
    const TileSet tiles = make_tiles(9);

    const MosaicResult first = assembler.assemble(tiles, 3, 48);
    const MosaicResult second = assembler.assemble(tiles, 3, 48);

    REQUIRE(byte_identical(first.canvas, second.canvas));
}

TEST_CASE("MosaicAssembler decodes every tile exactly once per stitch") {
    std::map<std::string, int> decode_counts;
    const TileReader base_reader = solid_color_reader(16);
    const TileReader counting_reader = [&decode_counts, base_reader](const Tile& tile) {
        ++decode_counts[tile.identifier];
        return base_reader(tile);
    };

    const MosaicAssembler assembler{GridSizePolicy{}, counting_reader};
    const MosaicResult mosaic = assembler.stitch(make_tiles(9));

    REQUIRE(mosaic.placed_count == 9);
    REQUIRE(decode_counts.size() == 9);
    for (const auto& [identifier, count] : decode_counts) {
        INFO(identifier);
        REQUIRE(count == 1);
    }
    REQUIRE(cell_center(mosaic, 0, 0) == color_for(0));
}

TEST_CASE("MosaicAssembler normalizes gray and alpha tiles to three channels") {
    const TileReader mixed_reader = [](const Tile& tile) {
        if (tile.identifier == "tile_layer_0") {
            return cv::Mat(16, 16, CV_8UC1, cv::Scalar(90));
        }
        return cv::Mat(16, 16, CV_8UC4, cv::Scalar(1, 2, 3, 0));
    };

    const MosaicAssembler assembler{GridSizePolicy{}, mixed_reader};
    const MosaicResult mosaic = assembler.stitch(make_tiles(4));

    REQUIRE(mosaic.placed_count == 4);
    REQUIRE(cell_center(mosaic, 0, 0) == cv::Vec3b{90, 90, 90});
    REQUIRE(cell_center(mosaic, 1, 1) == cv::Vec3b{1, 2, 3});
}

TEST_CASE("MosaicAssembler surfaces unreadable tiles and strict-policy refusals") {
    SECTION("decode failure propagates") {
        const TileReader failing_reader = [](const Tile& tile) -> cv::Mat {
            if (tile.identifier == "tile_layer_1") {
                throw MosaicError("corrupt tile");
            }
            return cv::Mat(8, 8, CV_8UC3, cv::Scalar(0, 0, 255));
        };
        const MosaicAssembler assembler{GridSizePolicy{}, failing_reader};
        REQUIRE_THROWS_AS(assembler.stitch(make_tiles(4)), MosaicError);
    }
    SECTION("strict policy refuses irregular counts") {
        const MosaicAssembler assembler{GridSizePolicy{IrregularGridPolicy::Strict, 4}, solid_color_reader(8)};
        REQUIRE_THROWS_AS(assembler.stitch(make_tiles(10)), MosaicError);
    }
    SECTION("empty sets are a caller error") {
        const MosaicAssembler assembler{GridSizePolicy{}, solid_color_reader(8)};
        REQUIRE_THROWS_AS(assembler.stitch(TileSet{}), std::invalid_argument);
    }
}

TEST_CASE("MosaicAssembler reads encoded tiles discovered on disk") {
    const auto scratch = tile_timeline::test::make_scratch_directory("mosaic");
    for (std::size_t tile_index = 0; tile_index < 4; ++tile_index) {
        const cv::Vec3b color = color_for(tile_index);
        const cv::Mat tile(20, 20, CV_8UC3, cv::Scalar(color[0], color[1], color[2]));
        REQUIRE(cv::imwrite((scratch / ("tile_layer_" + std::to_string(tile_index) + ".png")).string(), tile));
    }
    REQUIRE(cv::imwrite((scratch / "notes_preview.jpg").string(), cv::Mat(4, 4, CV_8UC3, cv::Scalar(0, 0, 0))));

    const TileSet tiles = discover_tiles(scratch, ".png");
    REQUIRE(tiles.size() == 4);
    REQUIRE(tiles.front().identifier == "tile_layer_0");

    const MosaicAssembler assembler{};
    const MosaicResult mosaic = assembler.stitch(tiles);
    REQUIRE(mosaic.placed_count == 4);
    REQUIRE(cell_center(mosaic, 0, 1) == color_for(2));

    const auto output_path = scratch / "mosaic.png";
    save_mosaic_png(mosaic.canvas, output_path);
    const cv::Mat reloaded = cv::imread(output_path.string(), cv::IMREAD_UNCHANGED);
    REQUIRE(reloaded.channels() == 3);
    REQUIRE(byte_identical(reloaded, mosaic.canvas));

    std::filesystem::remove_all(scratch);
}
