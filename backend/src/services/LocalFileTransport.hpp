#pragma once

#include "engine/Adapters.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace tb::services
{

// Copies into a directory on the local (or locally mounted) filesystem.
class LocalFileTransport : public engine::FileTransport
{
  public:
    explicit LocalFileTransport(std::size_t chunk_size = 1 << 20);

    engine::TransportResult send(std::filesystem::path const &local_path,
                                 std::string const &remote_dir,
                                 engine::ProgressCallback const &progress) override;

  private:
    bool copy_file(std::filesystem::path const &source,
                   std::filesystem::path const &destination,
                   engine::TransportResult &result,
                   engine::ProgressCallback const &progress);

    std::size_t chunk_size_;
};

} // namespace tb::services
