#include "tile_timeline/metadata_writer.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <system_error>

#include <json/json.h>

#include <fmt/format.h>

#include "tile_timeline/logging.hpp"

namespace tile_timeline {

namespace {

constexpr char k_metadata_file_name[] = "metadata.json";
constexpr int k_coordinate_precision{15};

Json::Value bounds_to_json(const BoundingBox& bounds) {
    Json::Value json_bounds(Json::objectValue);
    json_bounds["west"] = bounds.west;
    json_bounds["south"] = bounds.south;
    json_bounds["east"] = bounds.east;
    json_bounds["north"] = bounds.north;
    return json_bounds;
}

BoundingBox bounds_from_json(const Json::Value& json_bounds, const std::filesystem::path& path) {
    if (!json_bounds.isObject()) {
        throw MetadataError(fmt::format("{}: bounds is missing or not an object", path.string()));
    }
    for (const char* key : {"west", "south", "east", "north"}) {
        if (!json_bounds.isMember(key) || !json_bounds[key].isNumeric()) {
            throw MetadataError(fmt::format("{}: bounds.{} is missing or not a number", path.string(), key));
        }
    }
    return BoundingBox{
        json_bounds["west"].asDouble(),
        json_bounds["south"].asDouble(),
        json_bounds["east"].asDouble(),
        json_bounds["north"].asDouble()
    };
}

std::string required_string(const Json::Value& root, const char* key, const std::filesystem::path& path) {
    if (!root.isMember(key) || !root[key].isString()) {
        throw MetadataError(fmt::format("{}: {} is missing or not a string", path.string(), key));
    }
    return root[key].asString();
}

/** Absent members read as empty; present ones must have the expected type. */
const Json::Value& optional_member(const Json::Value& root, const char* key, Json::ValueType expected_type,
                                   const std::filesystem::path& path) {
    static const Json::Value k_absent{};
    if (!root.isMember(key)) {
        return k_absent;
    }
    const Json::Value& member = root[key];
    if (member.type() != expected_type) {
        throw MetadataError(fmt::format("{}: {} has the wrong type", path.string(), key));
    }
    return member;
}

void write_json(const std::filesystem::path& path, const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    builder["precision"] = k_coordinate_precision;
    const std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

    std::ofstream output_stream(path, std::ios::out | std::ios::trunc);
    if (!output_stream) {
        throw MetadataError(fmt::format("Unable to open {} for writing", path.string()));
    }
    writer->write(root, &output_stream);
    output_stream << '\n';
    if (!output_stream) {
        throw MetadataError(fmt::format("Failed writing {}", path.string()));
    }
}

}  // namespace

const std::vector<LayerStyle>& default_layer_styles() {
    static const std::vector<LayerStyle> list_styles{
        LayerStyle{"sidewalk", "#4A90E2"},
        LayerStyle{"road", "#FF6B6B"},
        LayerStyle{"crosswalk", "#4ECDC4"},
    };
    return list_styles;
}

void write_region_metadata(const std::filesystem::path& path, const RegionMetadata& metadata) {
    Json::Value root(Json::objectValue);
    root["area_name"] = metadata.area_name;
    root["tile_id"] = metadata.tile_id;
    root["name"] = metadata.name;
    root["bounds"] = bounds_to_json(metadata.bounds);

    Json::Value json_years(Json::arrayValue);
    for (const Year year : metadata.years) {
        json_years.append(year);
    }
    root["years"] = json_years;

    Json::Value json_layers(Json::arrayValue);
    Json::Value json_colors(Json::objectValue);
    for (const LayerStyle& layer : metadata.layers) {
        json_layers.append(layer.name);
        json_colors[layer.name] = layer.color;
    }
    root["layers"] = json_layers;
    root["layer_colors"] = json_colors;

    write_json(path, root);
}

RegionMetadata read_region_metadata(const std::filesystem::path& path) {
    std::ifstream input_stream(path);
    if (!input_stream) {
        throw MetadataError(fmt::format("Unable to open {}", path.string()));
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string str_errors;
    if (!Json::parseFromStream(builder, input_stream, &root, &str_errors)) {
        throw MetadataError(fmt::format("{}: {}", path.string(), str_errors));
    }
    if (!root.isObject()) {
        throw MetadataError(fmt::format("{}: document is not an object", path.string()));
    }

    RegionMetadata metadata{};
    metadata.tile_id = required_string(root, "tile_id", path);
    metadata.name = required_string(root, "name", path);
    metadata.area_name = optional_member(root, "area_name", Json::stringValue, path).asString();
    metadata.bounds = bounds_from_json(root["bounds"], path);

    for (const Json::Value& json_year : optional_member(root, "years", Json::arrayValue, path)) {
        if (!json_year.isInt()) {
            throw MetadataError(fmt::format("{}: years must be integers", path.string()));
        }
        metadata.years.push_back(json_year.asInt());
    }

    const Json::Value& json_colors = optional_member(root, "layer_colors", Json::objectValue, path);
    for (const Json::Value& json_layer : optional_member(root, "layers", Json::arrayValue, path)) {
        if (!json_layer.isString()) {
            throw MetadataError(fmt::format("{}: layer names must be strings", path.string()));
        }
        const std::string layer_name = json_layer.asString();
        const Json::Value& json_color = json_colors.isObject() ? json_colors[layer_name] : Json::Value::nullSingleton();
        if (!json_color.isNull() && !json_color.isString()) {
            throw MetadataError(fmt::format("{}: color of layer {} is not a string", path.string(), layer_name));
        }
        metadata.layers.push_back(LayerStyle{layer_name, json_color.asString()});
    }
    return metadata;
}

void write_region_index(const std::filesystem::path& path, const std::vector<RegionIndexEntry>& entries) {
    Json::Value root(Json::arrayValue);
    for (const RegionIndexEntry& entry : entries) {
        Json::Value json_entry(Json::objectValue);
        json_entry["tile_id"] = entry.tile_id;
        json_entry["name"] = entry.name;
        json_entry["bounds"] = bounds_to_json(entry.bounds);
        root.append(json_entry);
    }
    write_json(path, root);
}

std::vector<RegionIndexEntry> collect_region_index(const std::filesystem::path& tiles_root) {
    std::vector<std::filesystem::path> list_documents;
    std::error_code error_listing;
    for (std::filesystem::directory_iterator iterator_entry{tiles_root, error_listing}, end_entry;
         !error_listing && iterator_entry != end_entry;
         iterator_entry.increment(error_listing)) {
        const std::filesystem::path document = iterator_entry->path() / k_metadata_file_name;
        std::error_code error_status;
        if (iterator_entry->is_directory(error_status) && std::filesystem::is_regular_file(document, error_status)) {
            list_documents.push_back(document);
        }
    }
    std::sort(list_documents.begin(), list_documents.end());

    std::vector<RegionIndexEntry> entries;
    for (const std::filesystem::path& document : list_documents) {
        try {
            const RegionMetadata metadata = read_region_metadata(document);
            entries.push_back(RegionIndexEntry{metadata.tile_id, metadata.name, metadata.bounds});
        } catch (const MetadataError& exc) {
            get_logger()->warn("Skipping unreadable region metadata: {}", exc.what());
        } catch (const Json::Exception& exc) {
            get_logger()->warn("Skipping unreadable region metadata {}: {}", document.string(), exc.what());
        }
    }
    return entries;
}

}  // namespace tile_timeline
