#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace tb::utils
{

// Standard alphabet with '=' padding, as expected by Deluge's
// core.add_torrent_file file dump argument.
inline std::string encode_base64(std::span<std::uint8_t const> data)
{
    static constexpr char const kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);
    std::size_t index = 0;
    for (; index + 3 <= data.size(); index += 3)
    {
        std::uint32_t group = (static_cast<std::uint32_t>(data[index]) << 16) |
                              (static_cast<std::uint32_t>(data[index + 1]) << 8) |
                              static_cast<std::uint32_t>(data[index + 2]);
        encoded.push_back(kAlphabet[(group >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(group >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(group >> 6) & 0x3F]);
        encoded.push_back(kAlphabet[group & 0x3F]);
    }
    auto remaining = data.size() - index;
    if (remaining == 1)
    {
        std::uint32_t group = static_cast<std::uint32_t>(data[index]) << 16;
        encoded.push_back(kAlphabet[(group >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(group >> 12) & 0x3F]);
        encoded.append("==");
    }
    else if (remaining == 2)
    {
        std::uint32_t group = (static_cast<std::uint32_t>(data[index]) << 16) |
                              (static_cast<std::uint32_t>(data[index + 1]) << 8);
        encoded.push_back(kAlphabet[(group >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(group >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(group >> 6) & 0x3F]);
        encoded.push_back('=');
    }
    return encoded;
}

} // namespace tb::utils
