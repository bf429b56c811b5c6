#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace tb::log
{

namespace
{

std::atomic<int> g_min_rank{1};

int level_rank(char level) noexcept
{
    switch (level)
    {
    case 'D':
        return 0;
    case 'I':
        return 1;
    case 'W':
        return 2;
    case 'E':
        return 3;
    default:
        return 1;
    }
}

} // namespace

bool level_enabled(char level) noexcept
{
    return level_rank(level) >= g_min_rank.load(std::memory_order_relaxed);
}

void set_min_level(char level) noexcept
{
    g_min_rank.store(level_rank(level), std::memory_order_relaxed);
}

char parse_level(std::string_view name) noexcept
{
    std::string lowered;
    lowered.reserve(name.size());
    for (char ch : name)
    {
        lowered.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lowered == "debug")
    {
        return 'D';
    }
    if (lowered == "warning" || lowered == "warn")
    {
        return 'W';
    }
    if (lowered == "error")
    {
        return 'E';
    }
    return 'I';
}

void append_log_line_to_file(std::string const &line)
{
    static std::mutex s_mutex;
    static std::ofstream s_ofs;
    static std::optional<std::filesystem::path> s_path;
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        s_path = tb::utils::data_root() / "torrentbridge.log";
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace tb::log
