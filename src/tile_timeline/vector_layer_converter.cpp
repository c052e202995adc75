#include "tile_timeline/vector_layer_converter.hpp"

#include <mutex>
#include <system_error>

#include <cpl_error.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <ogrsf_frmts.h>

#include <fmt/format.h>

#include "tile_timeline/tile_discovery.hpp"

namespace tile_timeline {

namespace {

constexpr int k_wgs84_epsg{4326};
constexpr char k_geojson_driver[] = "GeoJSON";
constexpr char k_shapefile_extension[] = ".shp";

std::once_flag gdal_once_flag;

struct DatasetCloser final {
    void operator()(GDALDataset* dataset) const noexcept {
        GDALClose(dataset);
    }
};

struct TransformDestroyer final {
    void operator()(OGRCoordinateTransformation* transformation) const noexcept {
        OGRCoordinateTransformation::DestroyCT(transformation);
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;
using TransformPtr = std::unique_ptr<OGRCoordinateTransformation, TransformDestroyer>;

std::string last_gdal_error() {
    const char* message = CPLGetLastErrorMsg();
    return (message != nullptr && *message != '\0') ? std::string{message} : std::string{"no detail"};
}

}  // namespace

OgrVectorLayerConverter::OgrVectorLayerConverter()
    : logger_(get_logger()) {
    std::call_once(gdal_once_flag, []() { GDALAllRegister(); });
}

VectorLayerSummary OgrVectorLayerConverter::convert(const std::filesystem::path& source_layer,
                                                    const std::filesystem::path& destination) {
    DatasetPtr source_dataset{static_cast<GDALDataset*>(
        GDALOpenEx(source_layer.string().c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)
    )};
    if (!source_dataset) {
        throw VectorConversionError(fmt::format("Unable to open {}: {}", source_layer.string(), last_gdal_error()));
    }

    OGRLayer* layer_source = source_dataset->GetLayer(0);
    if (layer_source == nullptr) {
        throw VectorConversionError(fmt::format("{} contains no layers", source_layer.string()));
    }

    const OGRSpatialReference* source_srs = layer_source->GetSpatialRef();
    if (source_srs == nullptr) {
        throw VectorConversionError(fmt::format("{} has no spatial reference", source_layer.string()));
    }

    OGRSpatialReference target_srs;
    if (target_srs.importFromEPSG(k_wgs84_epsg) != OGRERR_NONE) {
        throw VectorConversionError(fmt::format("Unable to build EPSG:{}: {}", k_wgs84_epsg, last_gdal_error()));
    }
    target_srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    TransformPtr transformation;
    if (!source_srs->IsSame(&target_srs)) {
        transformation.reset(OGRCreateCoordinateTransformation(source_srs, &target_srs));
        if (!transformation) {
            throw VectorConversionError(fmt::format("No transformation from {} to EPSG:{}: {}",
                                                    source_layer.string(), k_wgs84_epsg, last_gdal_error()));
        }
        logger_->debug("Reprojecting {} to EPSG:{}", source_layer.filename().string(), k_wgs84_epsg);
    }

    GDALDriver* geojson_driver = GetGDALDriverManager()->GetDriverByName(k_geojson_driver);
    if (geojson_driver == nullptr) {
        throw VectorConversionError("GDAL was built without the GeoJSON driver");
    }

    std::error_code error_remove;
    std::filesystem::remove(destination, error_remove);
    if (error_remove) {
        throw VectorConversionError(fmt::format("Unable to replace {}: {}", destination.string(), error_remove.message()));
    }

    DatasetPtr destination_dataset{geojson_driver->Create(destination.string().c_str(), 0, 0, 0, GDT_Unknown, nullptr)};
    if (!destination_dataset) {
        throw VectorConversionError(fmt::format("Unable to create {}: {}", destination.string(), last_gdal_error()));
    }

    OGRLayer* layer_destination = destination_dataset->CreateLayer(
        layer_source->GetName(), &target_srs, layer_source->GetGeomType(), nullptr
    );
    if (layer_destination == nullptr) {
        throw VectorConversionError(fmt::format("Unable to create layer in {}: {}", destination.string(), last_gdal_error()));
    }

    OGRFeatureDefn* source_definition = layer_source->GetLayerDefn();
    for (int field_index = 0; field_index < source_definition->GetFieldCount(); ++field_index) {
        if (layer_destination->CreateField(source_definition->GetFieldDefn(field_index)) != OGRERR_NONE) {
            throw VectorConversionError(fmt::format("Unable to copy field {} of {}",
                                                    source_definition->GetFieldDefn(field_index)->GetNameRef(),
                                                    source_layer.string()));
        }
    }

    VectorLayerSummary summary{};
    OGREnvelope total_extent;
    bool has_extent = false;

    layer_source->ResetReading();
    for (OGRFeatureUniquePtr source_feature{layer_source->GetNextFeature()};
         source_feature != nullptr;
         source_feature.reset(layer_source->GetNextFeature())) {
        OGRFeatureUniquePtr output_feature{OGRFeature::CreateFeature(layer_destination->GetLayerDefn())};
        if (output_feature->SetFrom(source_feature.get(), TRUE) != OGRERR_NONE) {
            throw VectorConversionError(fmt::format("Unable to copy feature {} of {}",
                                                    source_feature->GetFID(), source_layer.string()));
        }

        OGRGeometry* geometry = output_feature->GetGeometryRef();
        if (geometry != nullptr && !geometry->IsEmpty()) {
            if (transformation && geometry->transform(transformation.get()) != OGRERR_NONE) {
                throw VectorConversionError(fmt::format("Unable to reproject feature {} of {}",
                                                        source_feature->GetFID(), source_layer.string()));
            }
            OGREnvelope feature_extent;
            geometry->getEnvelope(&feature_extent);
            if (has_extent) {
                total_extent.Merge(feature_extent);
            } else {
                total_extent = feature_extent;
                has_extent = true;
            }
        }

        if (layer_destination->CreateFeature(output_feature.get()) != OGRERR_NONE) {
            throw VectorConversionError(fmt::format("Unable to write feature to {}: {}", destination.string(), last_gdal_error()));
        }
        ++summary.feature_count;
    }

    if (has_extent) {
        summary.bounds = BoundingBox{total_extent.MinX, total_extent.MinY, total_extent.MaxX, total_extent.MaxY};
    }
    return summary;
}

std::optional<std::filesystem::path> find_source_layer(const std::filesystem::path& polygons_dir) {
    const std::optional<std::filesystem::path> layer_folder = first_subdirectory(polygons_dir);
    if (!layer_folder.has_value()) {
        return std::nullopt;
    }
    return first_file_with_extension(layer_folder.value(), k_shapefile_extension);
}

}  // namespace tile_timeline
