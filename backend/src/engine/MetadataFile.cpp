#include "engine/MetadataFile.hpp"

#include "utils/FS.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <system_error>

#include <libtorrent/bdecode.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/span.hpp>
#include <libtorrent/torrent_info.hpp>

namespace tb::engine
{

namespace
{

std::string sha1_to_hex(libtorrent::sha1_hash const &hash)
{
    constexpr char kHexDigits[] = "0123456789abcdef";
    std::string result;
    result.reserve(static_cast<std::size_t>(hash.size()) * 2);
    for (std::ptrdiff_t i = 0; i < hash.size(); ++i)
    {
        auto byte = static_cast<unsigned char>(hash[i]);
        result.push_back(kHexDigits[byte >> 4]);
        result.push_back(kHexDigits[byte & 0x0F]);
    }
    return result;
}

} // namespace

std::filesystem::path metadata_path_for(std::filesystem::path const &directory,
                                        std::string const &id)
{
    return directory / (id + ".torrent");
}

MetadataLoadResult load_metadata_file(std::filesystem::path const &path)
{
    MetadataLoadResult result;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        result.missing = true;
        result.error = "Metadata file not found: " + path.string();
        return result;
    }
    auto bytes = utils::read_file_bytes(path);
    if (!bytes)
    {
        result.error = "Failed to read metadata file: " + path.string();
        return result;
    }
    std::string parse_error;
    auto metadata = parse_metadata(std::move(*bytes), &parse_error);
    if (!metadata)
    {
        result.error =
            "Invalid metadata file " + path.string() + ": " + parse_error;
        return result;
    }
    metadata->path = path;
    result.metadata = std::move(metadata);
    return result;
}

std::optional<MetadataFile> parse_metadata(std::vector<std::uint8_t> bytes,
                                           std::string *error)
{
    libtorrent::error_code ec;
    libtorrent::span<char const> span(
        reinterpret_cast<char const *>(bytes.data()),
        static_cast<std::ptrdiff_t>(bytes.size()));
    auto node = libtorrent::bdecode(span, ec);
    if (ec)
    {
        if (error != nullptr)
        {
            *error = ec.message();
        }
        return std::nullopt;
    }
    auto info = std::make_shared<libtorrent::torrent_info>(node, ec);
    if (ec)
    {
        if (error != nullptr)
        {
            *error = ec.message();
        }
        return std::nullopt;
    }

    MetadataFile metadata;
    metadata.name = info->name();
    auto const hashes = info->info_hashes();
    metadata.info_hash =
        sha1_to_hex(hashes.has_v1() ? hashes.v1 : hashes.get_best());
    metadata.total_size = info->total_size();
    auto const &storage = info->files();
    for (auto index : storage.file_range())
    {
        if (storage.pad_file_at(index))
        {
            continue;
        }
        metadata.files.push_back(
            {storage.file_path(index), storage.file_size(index)});
    }
    metadata.bytes = std::move(bytes);
    return metadata;
}

std::vector<std::string> top_level_paths(std::vector<ClientFile> const &files)
{
    std::vector<std::string> result;
    for (auto const &file : files)
    {
        auto relative = std::filesystem::path(file.path).relative_path();
        if (relative.empty())
        {
            continue;
        }
        auto first = relative.begin()->string();
        if (first.empty() || first == "." || first == "..")
        {
            continue;
        }
        if (std::find(result.begin(), result.end(), first) == result.end())
        {
            result.push_back(std::move(first));
        }
    }
    return result;
}

} // namespace tb::engine
