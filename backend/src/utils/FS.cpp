#include "utils/FS.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace tb::utils
{

namespace
{

std::mutex g_root_mutex;
std::optional<std::filesystem::path> g_root_override;

std::optional<std::filesystem::path>
ensure_directory(std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}

} // namespace

std::optional<std::filesystem::path> executable_path()
{
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
}

void set_data_root(std::filesystem::path root)
{
    std::lock_guard<std::mutex> lock(g_root_mutex);
    g_root_override = std::move(root);
}

std::filesystem::path data_root()
{
    {
        std::lock_guard<std::mutex> lock(g_root_mutex);
        if (g_root_override)
        {
            if (auto ensured = ensure_directory(*g_root_override))
            {
                return *ensured;
            }
            return *g_root_override;
        }
    }
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

bool write_file_atomic(std::filesystem::path const &path,
                       std::string_view content)
{
    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return false;
        }
    }
    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            return false;
        }
        output.write(content.data(),
                     static_cast<std::streamsize>(content.size()));
        output.flush();
        if (!output)
        {
            return false;
        }
    }
    std::filesystem::rename(temp, path, ec);
    if (ec)
    {
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

std::optional<std::vector<std::uint8_t>>
read_file_bytes(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)),
                                   std::istreambuf_iterator<char>());
    if (input.bad())
    {
        return std::nullopt;
    }
    return data;
}

std::optional<std::string> read_file_text(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    std::string data((std::istreambuf_iterator<char>(input)),
                     std::istreambuf_iterator<char>());
    if (input.bad())
    {
        return std::nullopt;
    }
    return data;
}

} // namespace tb::utils
