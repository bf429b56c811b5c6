#pragma once

#include "engine/Torrent.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tb::engine
{

// Parsed .torrent file. The raw bytes are kept for re-registration with the
// remote client.
struct MetadataFile
{
    std::filesystem::path path;
    std::vector<std::uint8_t> bytes;
    std::string name;
    std::string info_hash;
    std::int64_t total_size = 0;
    std::vector<ClientFile> files;
};

struct MetadataLoadResult
{
    std::optional<MetadataFile> metadata;
    bool missing = false;
    std::string error;
};

std::filesystem::path metadata_path_for(std::filesystem::path const &directory,
                                        std::string const &id);

MetadataLoadResult load_metadata_file(std::filesystem::path const &path);
std::optional<MetadataFile>
parse_metadata(std::vector<std::uint8_t> bytes, std::string *error = nullptr);

// Deduplicated first path components, in first-seen order.
std::vector<std::string> top_level_paths(std::vector<ClientFile> const &files);

} // namespace tb::engine
