#include "services/ScpFileTransport.hpp"

#include "utils/Log.hpp"

#include <cstdlib>
#include <format>
#include <system_error>

#include <sys/wait.h>

namespace tb::services
{

namespace
{

constexpr int kDefaultSshPort = 22;

std::uint64_t size_on_disk(std::filesystem::path const &path)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec))
    {
        auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : static_cast<std::uint64_t>(size);
    }
    std::uint64_t total = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(path, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec))
    {
        if (it->is_regular_file(ec))
        {
            total += static_cast<std::uint64_t>(it->file_size(ec));
        }
    }
    return total;
}

int run_shell(std::string const &command)
{
    int status = std::system(command.c_str());
    if (status == -1)
    {
        return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

std::string escape_shell_argument(std::string const &value)
{
    std::string result;
    result.reserve(value.size() + 4);
    result.push_back('\'');
    for (char ch : value)
    {
        if (ch == '\'')
        {
            result += "'\\''";
            continue;
        }
        result.push_back(ch);
    }
    result.push_back('\'');
    return result;
}

ScpFileTransport::ScpFileTransport(engine::TransferConfig config,
                                   CommandRunner runner)
    : config_(std::move(config)), runner_(std::move(runner))
{
    if (!runner_)
    {
        runner_ = &run_shell;
    }
}

std::string
ScpFileTransport::build_command(std::filesystem::path const &local_path,
                                std::string const &remote_dir,
                                bool recursive) const
{
    std::string command = "scp -B -q";
    if (recursive)
    {
        command += " -r";
    }
    if (config_.port > 0 && config_.port != kDefaultSshPort)
    {
        command += std::format(" -P {}", config_.port);
    }
    auto destination = config_.user.empty()
                           ? config_.host
                           : config_.user + "@" + config_.host;
    auto directory = remote_dir;
    if (directory.empty() || directory.back() != '/')
    {
        directory.push_back('/');
    }
    command += " " + escape_shell_argument(local_path.string());
    command += " " + escape_shell_argument(destination + ":" + directory);
    return command;
}

engine::TransportResult
ScpFileTransport::send(std::filesystem::path const &local_path,
                       std::string const &remote_dir,
                       engine::ProgressCallback const &progress)
{
    engine::TransportResult result;
    std::error_code ec;
    if (!std::filesystem::exists(local_path, ec))
    {
        result.message = "source not found: " + local_path.string();
        return result;
    }
    auto recursive = std::filesystem::is_directory(local_path, ec);
    auto command = build_command(local_path, remote_dir, recursive);
    TB_LOG_DEBUG("running {}", command);
    auto status = runner_(command);
    if (status != 0)
    {
        result.message = std::format("scp exited with status {}", status);
        return result;
    }
    result.success = true;
    result.bytes_sent = size_on_disk(local_path);
    if (progress)
    {
        progress(result.bytes_sent);
    }
    return result;
}

} // namespace tb::services
