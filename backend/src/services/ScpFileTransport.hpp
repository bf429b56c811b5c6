#pragma once

#include "engine/Adapters.hpp"
#include "engine/ConfigurationService.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace tb::services
{

// Shells out to scp(1). Progress is reported once, after the copy finished.
class ScpFileTransport : public engine::FileTransport
{
  public:
    // Runs a shell command and returns its exit status.
    using CommandRunner = std::function<int(std::string const &)>;

    explicit ScpFileTransport(engine::TransferConfig config,
                              CommandRunner runner = {});

    engine::TransportResult send(std::filesystem::path const &local_path,
                                 std::string const &remote_dir,
                                 engine::ProgressCallback const &progress) override;

    std::string build_command(std::filesystem::path const &local_path,
                              std::string const &remote_dir,
                              bool recursive) const;

  private:
    engine::TransferConfig config_;
    CommandRunner runner_;
};

std::string escape_shell_argument(std::string const &value);

} // namespace tb::services
