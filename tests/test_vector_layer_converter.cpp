#include <cmath>
#include <filesystem>
#include <memory>
#include <numbers>
#include <utility>
#include <vector>

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <ogrsf_frmts.h>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "tile_timeline/vector_layer_converter.hpp"

using namespace tile_timeline;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    tile_timeline::test::ensure_logger_initialized();
    return true;
}();

constexpr double k_web_mercator_radius_m{6378137.0};
constexpr double k_degree_tolerance{1e-6};

struct DatasetCloser final {
    void operator()(GDALDataset* dataset) const noexcept {
        GDALClose(dataset);
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;
using Coordinates = std::vector<std::pair<double, double>>;

/** Lon/lat degrees to spherical web mercator metres. */
std::pair<double, double> to_web_mercator(double lon, double lat) {
    const double x = k_web_mercator_radius_m * lon * std::numbers::pi / 180.0;
    const double y = k_web_mercator_radius_m * std::log(std::tan(std::numbers::pi / 4.0 + lat * std::numbers::pi / 360.0));
    return {x, y};
}

/** Writes a point shapefile; @p epsg of 0 leaves the layer without a spatial reference. */
void write_point_layer(const std::filesystem::path& path, int epsg, const Coordinates& points) {
    GDALAllRegister();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("ESRI Shapefile");
    REQUIRE(driver != nullptr);

    DatasetPtr dataset{driver->Create(path.string().c_str(), 0, 0, 0, GDT_Unknown, nullptr)};
    REQUIRE(dataset);

    OGRSpatialReference srs;
    if (epsg != 0) {
        REQUIRE(srs.importFromEPSG(epsg) == OGRERR_NONE);
        srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    }
    OGRLayer* layer = dataset->CreateLayer("sidewalks", epsg != 0 ? &srs : nullptr, wkbPoint, nullptr);
    REQUIRE(layer != nullptr);

    OGRFieldDefn kind_field("kind", OFTString);
    REQUIRE(layer->CreateField(&kind_field) == OGRERR_NONE);

    for (const auto& [x, y] : points) {
        OGRFeatureUniquePtr feature{OGRFeature::CreateFeature(layer->GetLayerDefn())};
        feature->SetField("kind", "sidewalk");
        OGRPoint point(x, y);
        REQUIRE(feature->SetGeometry(&point) == OGRERR_NONE);
        REQUIRE(layer->CreateFeature(feature.get()) == OGRERR_NONE);
    }
}

/** Number of features in the first layer of a vector dataset. */
GIntBig count_features(const std::filesystem::path& path) {
    DatasetPtr dataset{static_cast<GDALDataset*>(
        GDALOpenEx(path.string().c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)
    )};
    REQUIRE(dataset);
    return dataset->GetLayer(0)->GetFeatureCount();
}
}  // namespace

TEST_CASE("OgrVectorLayerConverter reprojects web mercator layers to lon/lat") {
    const auto scratch = tile_timeline::test::make_scratch_directory("vector_mercator");
    const auto source = scratch / "sidewalks.shp";
    const auto destination = scratch / "2024.geojson";
    write_point_layer(source, 3857, {to_web_mercator(-74.0, 40.70), to_web_mercator(-73.97, 40.76)});

    OgrVectorLayerConverter converter;
    const VectorLayerSummary summary = converter.convert(source, destination);

    REQUIRE(summary.feature_count == 2);
    REQUIRE(summary.bounds.has_value());
    CHECK(summary.bounds->west == Approx(-74.0).margin(k_degree_tolerance));
    CHECK(summary.bounds->south == Approx(40.70).margin(k_degree_tolerance));
    CHECK(summary.bounds->east == Approx(-73.97).margin(k_degree_tolerance));
    CHECK(summary.bounds->north == Approx(40.76).margin(k_degree_tolerance));
    REQUIRE(count_features(destination) == 2);

    std::filesystem::remove_all(scratch);
}

TEST_CASE("OgrVectorLayerConverter passes WGS84 layers through and replaces old output") {
    const auto scratch = tile_timeline::test::make_scratch_directory("vector_wgs84");
    const auto source = scratch / "roads.shp";
    const auto destination = scratch / "2022.geojson";
    write_point_layer(source, 4326, {{-73.979239, 40.777385}, {-73.970209, 40.784245}, {-73.975, 40.78}});

    OgrVectorLayerConverter converter;
    const VectorLayerSummary first = converter.convert(source, destination);
    const VectorLayerSummary second = converter.convert(source, destination);

    REQUIRE(second.feature_count == 3);
    REQUIRE(second.bounds.has_value());
    CHECK(second.bounds->west == Approx(-73.979239).margin(1e-9));
    CHECK(second.bounds->south == Approx(40.777385).margin(1e-9));
    CHECK(second.bounds->east == Approx(-73.970209).margin(1e-9));
    CHECK(second.bounds->north == Approx(40.784245).margin(1e-9));
    REQUIRE(first.bounds == second.bounds);
    REQUIRE(count_features(destination) == 3);

    std::filesystem::remove_all(scratch);
}

TEST_CASE("OgrVectorLayerConverter refuses layers it cannot place on the globe") {
    const auto scratch = tile_timeline::test::make_scratch_directory("vector_invalid");
    OgrVectorLayerConverter converter;

    SECTION("layer without a spatial reference") {
        const auto source = scratch / "crosswalks.shp";
        write_point_layer(source, 0, {{1.0, 2.0}});
        REQUIRE_THROWS_AS(converter.convert(source, scratch / "out.geojson"), VectorConversionError);
    }
    SECTION("missing source") {
        REQUIRE_THROWS_AS(converter.convert(scratch / "absent.shp", scratch / "out.geojson"), VectorConversionError);
    }

    std::filesystem::remove_all(scratch);
}

TEST_CASE("find_source_layer picks the first shapefile of the first layer folder") {
    const auto scratch = tile_timeline::test::make_scratch_directory("vector_layout");
    const auto polygons_dir = scratch / "polygons";
    REQUIRE_FALSE(find_source_layer(polygons_dir).has_value());

    std::filesystem::create_directories(polygons_dir / "b_layer");
    std::filesystem::create_directories(polygons_dir / "a_layer");
    REQUIRE_FALSE(find_source_layer(polygons_dir).has_value());

    write_point_layer(polygons_dir / "a_layer" / "zeta.shp", 4326, {{0.0, 0.0}});
    write_point_layer(polygons_dir / "a_layer" / "alpha.shp", 4326, {{0.0, 0.0}});
    write_point_layer(polygons_dir / "b_layer" / "aardvark.shp", 4326, {{0.0, 0.0}});

    const auto source_layer = find_source_layer(polygons_dir);
    REQUIRE(source_layer.has_value());
    REQUIRE(source_layer.value() == polygons_dir / "a_layer" / "alpha.shp");

    std::filesystem::remove_all(scratch);
}
