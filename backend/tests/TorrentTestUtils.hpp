#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace tb::tests
{

inline std::string bencode_string(std::string const &value)
{
    return std::to_string(value.size()) + ":" + value;
}

inline std::string piece_hashes(std::int64_t total_size)
{
    constexpr std::int64_t kPieceLength = 16384;
    auto pieces = (total_size + kPieceLength - 1) / kPieceLength;
    if (pieces < 1)
    {
        pieces = 1;
    }
    return bencode_string(std::string(static_cast<std::size_t>(pieces) * 20, 'x'));
}

// Minimal single-file .torrent accepted by libtorrent.
inline std::vector<std::uint8_t> single_file_torrent(std::string const &name,
                                                     std::int64_t length)
{
    std::string info = "d6:lengthi" + std::to_string(length) + "e" +
                       "4:name" + bencode_string(name) +
                       "12:piece lengthi16384e" + "6:pieces" +
                       piece_hashes(length) + "e";
    auto encoded = "d4:info" + info + "e";
    return {encoded.begin(), encoded.end()};
}

// Multi-file .torrent; every file sits under the `name` directory.
inline std::vector<std::uint8_t>
multi_file_torrent(std::string const &name,
                   std::vector<std::pair<std::string, std::int64_t>> const &files)
{
    std::string list = "l";
    std::int64_t total = 0;
    for (auto const &[path, length] : files)
    {
        list += "d6:lengthi" + std::to_string(length) + "e4:pathl" +
                bencode_string(path) + "ee";
        total += length;
    }
    list += "e";
    std::string info = "d5:files" + list + "4:name" + bencode_string(name) +
                       "12:piece lengthi16384e" + "6:pieces" +
                       piece_hashes(total) + "e";
    auto encoded = "d4:info" + info + "e";
    return {encoded.begin(), encoded.end()};
}

inline void write_bytes(std::filesystem::path const &path,
                        std::vector<std::uint8_t> const &bytes)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<char const *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
}

inline void write_text(std::filesystem::path const &path, std::string const &text)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

} // namespace tb::tests
