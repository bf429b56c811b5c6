#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tb::engine
{

struct MediaManagerConfig
{
    std::string type;
    std::string host;
    int port = 0;
    std::string api_key;
    bool use_tls = false;
};

struct DownloadClientConfig
{
    std::string name;
    std::string type = "deluge";
    std::string host = "127.0.0.1";
    int port = 8112;
    std::string password;
    bool use_tls = false;
};

struct TransferConfig
{
    std::string type = "local";
    std::string host;
    int port = 22;
    std::string user;
};

struct ConnectionConfig
{
    std::string name;
    std::string from;
    std::string to;
    TransferConfig transfer;
    std::string source_dot_torrent_path;
    std::string source_torrent_download_path;
    std::string destination_dot_torrent_tmp_dir;
    std::string destination_torrent_download_path;
};

struct HistorySettings
{
    bool enabled = true;
    int retention_days = 90;
    bool track_progress = true;
};

struct RetrySettings
{
    int max_retries = 3;
    int base_backoff_seconds = 60;
    int max_backoff_seconds = 3600;
};

struct MatchingSettings
{
    int first_seen_window_seconds = 3600;
    int max_not_found_attempts = 10;
    int metadata_wait_cycles = 120;
};

struct BridgeConfig
{
    std::filesystem::path state_dir;
    std::string state_file = "torrents_state.json";
    std::string log_level = "info";
    std::string rpc_bind = "http://127.0.0.1:10445";
    std::string rpc_path = "/rpc";
    std::optional<std::string> rpc_token;
    int poll_interval_seconds = 5;
    std::vector<MediaManagerConfig> media_managers;
    std::vector<DownloadClientConfig> download_clients;
    std::vector<ConnectionConfig> connections;
    HistorySettings history;
    RetrySettings retry;
    MatchingSettings matching;
};

struct ConfigLoadResult
{
    std::optional<BridgeConfig> config;
    std::string error;
};

ConfigLoadResult parse_config(std::string_view payload);
ConfigLoadResult load_config(std::filesystem::path const &path);
// Secrets (passwords, api keys, the rpc token) are written only when
// `include_secrets` is set.
std::string config_to_json(BridgeConfig const &config, bool include_secrets,
                           bool pretty = false);

class ConfigurationService
{
  public:
    ConfigurationService(std::filesystem::path path, BridgeConfig config);

    BridgeConfig get() const;
    HistorySettings history() const;
    std::filesystem::path const &path() const noexcept
    {
        return path_;
    }

    void set_history(std::optional<bool> enabled,
                     std::optional<int> retention_days,
                     std::optional<bool> track_progress);

    bool is_dirty() const noexcept
    {
        return dirty_.load(std::memory_order_acquire);
    }
    bool persist_if_dirty();
    bool persist_now();

  private:
    void mark_dirty();

    std::filesystem::path path_;
    mutable std::shared_mutex mutex_;
    BridgeConfig config_;

    std::atomic_bool dirty_{false};
};

} // namespace tb::engine
