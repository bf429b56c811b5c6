#include "services/LocalFileTransport.hpp"

#include "utils/Log.hpp"

#include <fstream>
#include <system_error>
#include <vector>

namespace tb::services
{

LocalFileTransport::LocalFileTransport(std::size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? 1 : chunk_size)
{
}

engine::TransportResult
LocalFileTransport::send(std::filesystem::path const &local_path,
                         std::string const &remote_dir,
                         engine::ProgressCallback const &progress)
{
    engine::TransportResult result;
    std::error_code ec;
    auto status = std::filesystem::status(local_path, ec);
    if (ec || !std::filesystem::exists(status))
    {
        result.message = "source not found: " + local_path.string();
        return result;
    }
    auto destination_dir = std::filesystem::path(remote_dir);
    std::filesystem::create_directories(destination_dir, ec);
    if (ec)
    {
        result.message = "cannot create " + destination_dir.string() + ": " +
                         ec.message();
        return result;
    }
    auto destination = destination_dir / local_path.filename();

    if (!std::filesystem::is_directory(status))
    {
        result.success = copy_file(local_path, destination, result, progress);
        return result;
    }

    std::filesystem::create_directories(destination, ec);
    if (ec)
    {
        result.message =
            "cannot create " + destination.string() + ": " + ec.message();
        return result;
    }
    std::filesystem::recursive_directory_iterator it(local_path, ec);
    if (ec)
    {
        result.message =
            "cannot read " + local_path.string() + ": " + ec.message();
        return result;
    }
    for (auto end = std::filesystem::recursive_directory_iterator(); it != end;
         it.increment(ec))
    {
        if (ec)
        {
            result.message = "directory walk failed: " + ec.message();
            return result;
        }
        auto target =
            destination / std::filesystem::relative(it->path(), local_path);
        if (it->is_directory(ec))
        {
            std::filesystem::create_directories(target, ec);
            if (ec)
            {
                result.message =
                    "cannot create " + target.string() + ": " + ec.message();
                return result;
            }
            continue;
        }
        if (!copy_file(it->path(), target, result, progress))
        {
            return result;
        }
    }
    if (ec)
    {
        result.message = "directory walk failed: " + ec.message();
        return result;
    }
    result.success = true;
    return result;
}

bool LocalFileTransport::copy_file(std::filesystem::path const &source,
                                   std::filesystem::path const &destination,
                                   engine::TransportResult &result,
                                   engine::ProgressCallback const &progress)
{
    std::ifstream input(source, std::ios::binary);
    if (!input)
    {
        result.message = "cannot open " + source.string();
        return false;
    }
    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output)
    {
        result.message = "cannot write " + destination.string();
        return false;
    }
    std::vector<char> buffer(chunk_size_);
    while (input)
    {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = input.gcount();
        if (count <= 0)
        {
            break;
        }
        output.write(buffer.data(), count);
        if (!output)
        {
            result.message = "write failed for " + destination.string();
            return false;
        }
        result.bytes_sent += static_cast<std::uint64_t>(count);
        if (progress)
        {
            progress(result.bytes_sent);
        }
    }
    if (input.bad())
    {
        result.message = "read failed for " + source.string();
        return false;
    }
    TB_LOG_DEBUG("copied {} -> {}", source.string(), destination.string());
    return true;
}

} // namespace tb::services
