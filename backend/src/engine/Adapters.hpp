#pragma once

#include "engine/Torrent.hpp"
#include "engine/TorrentRegistry.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tb::engine
{

struct AdapterResult
{
    bool success = false;
    std::string message;
};

struct AddTorrentOptions
{
    std::optional<std::string> download_location;
    bool add_paused = false;
};

class DownloadClient
{
  public:
    virtual ~DownloadClient() = default;

    virtual std::string const &name() const = 0;
    // Bulk poll keyed on the lower-case content id. nullopt when the client
    // could not be reached.
    virtual std::optional<StatusMap> get_status_map() = 0;
    virtual AdapterResult
    add_torrent_file(std::string const &remote_path,
                     std::vector<std::uint8_t> const &metadata,
                     AddTorrentOptions const &options) = 0;
    virtual AdapterResult remove_torrent(std::string const &id,
                                         bool delete_data) = 0;
};

class MediaManager
{
  public:
    virtual ~MediaManager() = default;

    // "radarr" or "sonarr".
    virtual std::string const &kind() const = 0;
    virtual std::optional<std::vector<QueueItem>> get_queue_updates() = 0;
    virtual bool ready_to_remove(Torrent const &torrent) = 0;
};

struct TransportResult
{
    bool success = false;
    std::string message;
    std::uint64_t bytes_sent = 0;
};

// Receives the cumulative byte count of the current send() call.
using ProgressCallback = std::function<void(std::uint64_t)>;

class FileTransport
{
  public:
    virtual ~FileTransport() = default;

    // Copies a file or a directory tree into `remote_dir` on the configured
    // destination.
    virtual TransportResult send(std::filesystem::path const &local_path,
                                 std::string const &remote_dir,
                                 ProgressCallback const &progress) = 0;
};

} // namespace tb::engine
