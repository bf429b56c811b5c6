#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tb::engine
{

enum class TorrentState
{
    Queued,
    LocalDownloading,
    LocalPaused,
    LocalSeeding,
    Copying,
    Copied,
    RemoteSeeding,
    Error,
    Missing,
    Failed,
};

struct ClientFile
{
    std::string path;
    std::int64_t size = 0;
};

// One torrent as reported by a download client poll.
struct ClientStatus
{
    std::string name;
    std::string state;
    double progress = 0.0;
    std::int64_t total_size = 0;
    std::vector<ClientFile> files;
};

struct Torrent
{
    std::string name;
    // Lower-case hex info hash; empty until a download client reports it.
    std::string id;
    TorrentState state = TorrentState::Queued;
    std::optional<ClientStatus> local_client_info;
    std::optional<ClientStatus> remote_client_info;
    std::string metadata_file_path;

    std::string home_client;
    std::string target_client;
    std::string connection;
    std::string media_manager;
    std::int64_t size_bytes = 0;

    int retry_count = 0;
    std::int64_t next_retry_at = 0;
    int not_found_attempts = 0;
    int metadata_missing_cycles = 0;
    std::int64_t first_seen_at = 0;
    std::string last_error;
};

} // namespace tb::engine
