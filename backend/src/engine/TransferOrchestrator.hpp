#pragma once

#include "engine/Adapters.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/StateMachine.hpp"
#include "engine/TorrentRegistry.hpp"
#include "engine/TransferHistoryStore.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tb::engine
{

struct OrchestratorSettings
{
    RetrySettings retry;
    MatchingSettings matching;
    bool track_progress = true;
};

// Per-cycle driver: refreshes the registry from the adapters, moves ready
// torrents to the remote side and cleans up finished ones. run_cycle() is
// called from a single thread; published() and the enqueue_* calls are safe
// from any thread.
class TransferOrchestrator
{
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using CommandCallback = std::function<void(AdapterResult)>;
    using TorrentList = std::vector<Torrent>;

    TransferOrchestrator(TorrentRegistry &registry,
                         TransferHistoryStore *history,
                         OrchestratorSettings settings, Clock clock = {});

    void add_media_manager(std::shared_ptr<MediaManager> manager);
    void add_download_client(std::shared_ptr<DownloadClient> client);
    // Both clients named by the connection must be registered first.
    bool add_connection(ConnectionConfig config,
                        std::shared_ptr<FileTransport> transport);

    void set_track_progress(bool enabled) noexcept;

    void run_cycle();

    std::shared_ptr<TorrentList const> published() const;
    void enqueue_reset(std::string name, CommandCallback callback);
    void enqueue_remove(std::string name, CommandCallback callback);

    std::uint64_t cycles() const noexcept
    {
        return cycles_.load(std::memory_order_relaxed);
    }

  private:
    struct Connection
    {
        ConnectionConfig config;
        DownloadClient *from = nullptr;
        DownloadClient *to = nullptr;
        std::shared_ptr<FileTransport> transport;
    };

    struct Command
    {
        enum class Kind
        {
            Reset,
            Remove,
        };
        Kind kind;
        std::string name;
        CommandCallback callback;
    };

    using PollResults = std::unordered_map<std::string, std::optional<StatusMap>>;

    void apply_commands();
    bool refresh_media_managers(std::int64_t now);
    PollResults poll_clients();
    void refresh_torrent(Torrent &torrent, PollResults const &polls,
                         std::int64_t now);
    void assign_connection(Torrent &torrent, PollResults const &polls,
                           std::int64_t now);
    void count_not_found(Torrent &torrent);
    void evaluate(Torrent &torrent, PollResults const &polls,
                  std::int64_t now);
    void run_transfer(Torrent &torrent, Connection const &connection,
                      std::int64_t now);
    void register_failure(Torrent &torrent, std::string const &message,
                          std::int64_t now);
    // Returns true when the torrent should be dropped from the registry.
    bool cleanup(Torrent &torrent);

    bool set_state(Torrent &torrent, TorrentState state);
    void persist(PersistEffect effect);
    void publish();

    Connection const *connection_for(Torrent const &torrent) const;
    DownloadClient *client(std::string const &name) const;
    MediaManager *manager(std::string const &kind) const;
    std::int64_t backoff_seconds(int retry_count) const;
    std::int64_t now_seconds() const;

    TorrentRegistry &registry_;
    TransferHistoryStore *history_;
    OrchestratorSettings settings_;
    Clock clock_;
    std::atomic<bool> track_progress_;
    // Bookkeeping changed without a state transition.
    bool snapshot_dirty_ = false;

    std::vector<std::shared_ptr<MediaManager>> managers_;
    std::vector<std::shared_ptr<DownloadClient>> clients_;
    std::vector<Connection> connections_;

    std::mutex command_mutex_;
    std::deque<Command> commands_;

    mutable std::mutex published_mutex_;
    std::shared_ptr<TorrentList const> published_;
    std::atomic<std::uint64_t> cycles_{0};
};

} // namespace tb::engine
