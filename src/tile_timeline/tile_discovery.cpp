#include "tile_timeline/tile_discovery.hpp"

#include <algorithm>
#include <system_error>

namespace tile_timeline {

namespace {

std::vector<std::filesystem::path> sorted_entries(const std::filesystem::path& directory, bool want_directories,
                                                  const std::string& extension) {
    std::vector<std::filesystem::path> list_entries;
    std::error_code error_listing;
    if (!std::filesystem::is_directory(directory, error_listing)) {
        return list_entries;
    }

    for (std::filesystem::directory_iterator iterator_entry{directory, error_listing}, end_entry;
         !error_listing && iterator_entry != end_entry;
         iterator_entry.increment(error_listing)) {
        std::error_code error_status;
        if (want_directories) {
            if (iterator_entry->is_directory(error_status)) {
                list_entries.push_back(iterator_entry->path());
            }
            continue;
        }
        if (!iterator_entry->is_regular_file(error_status)) {
            continue;
        }
        if (iterator_entry->path().extension().string() == extension) {
            list_entries.push_back(iterator_entry->path());
        }
    }

    std::sort(list_entries.begin(), list_entries.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.filename().string() < rhs.filename().string();
    });
    return list_entries;
}

}  // namespace

TileSet discover_tiles(const std::filesystem::path& directory, const std::string& extension) {
    TileSet tiles;
    for (const std::filesystem::path& tile_path : sorted_entries(directory, false, extension)) {
        tiles.push_back(Tile{tile_path.stem().string(), tile_path});
    }
    return tiles;
}

std::optional<std::filesystem::path> first_subdirectory(const std::filesystem::path& directory) {
    const auto list_directories = sorted_entries(directory, true, {});
    if (list_directories.empty()) {
        return std::nullopt;
    }
    return list_directories.front();
}

std::optional<std::filesystem::path> first_file_with_extension(const std::filesystem::path& directory,
                                                               const std::string& extension) {
    const auto list_files = sorted_entries(directory, false, extension);
    if (list_files.empty()) {
        return std::nullopt;
    }
    return list_files.front();
}

}  // namespace tile_timeline
