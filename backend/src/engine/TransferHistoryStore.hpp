#pragma once

#include "engine/Torrent.hpp"
#include "utils/TransferStore.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace tb::engine
{

struct TransferStats
{
    std::int64_t total = 0;
    std::int64_t completed = 0;
    std::int64_t failed = 0;
    std::int64_t pending = 0;
    std::int64_t transferring = 0;
    double success_rate = 0.0;
    std::int64_t total_bytes_transferred = 0;
};

// Durable audit log of transfer attempts. All database work runs on a single
// worker thread once start() has been called; before that (and after stop())
// tasks execute inline on the caller.
class TransferHistoryStore
{
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr char const *kInterruptedMessage =
        "Interrupted by application restart";
    static constexpr auto kProgressInterval = std::chrono::seconds(5);
    static constexpr auto kThrottleSweepInterval = std::chrono::minutes(5);
    static constexpr auto kThrottleEntryTtl = std::chrono::hours(1);

    explicit TransferHistoryStore(std::filesystem::path db_path,
                                  Clock clock = {});
    TransferHistoryStore(TransferHistoryStore const &) = delete;
    TransferHistoryStore &operator=(TransferHistoryStore const &) = delete;
    ~TransferHistoryStore();

    void start();
    void stop();
    bool is_valid() const noexcept;

    // Number of records finalized as failed by the restart recovery.
    int recovered_count() const noexcept
    {
        return recovered_count_;
    }

    std::optional<std::string>
    create_transfer(Torrent const &torrent, std::string const &source_client,
                    std::string const &target_client,
                    std::optional<std::string> connection_name = std::nullopt);
    bool start_transfer(std::string const &id);
    // Returns false when the write was throttled or the record is not active.
    bool update_progress(std::string const &id, std::int64_t bytes,
                         bool force = false);
    bool complete_transfer(std::string const &id);
    bool fail_transfer(std::string const &id, std::string const &message);
    bool cancel_transfer(std::string const &id);

    std::optional<storage::TransferRecord> get_transfer(std::string const &id);
    storage::TransferPage list_transfers(storage::TransferQuery const &query);
    std::vector<storage::TransferRecord> get_active_transfers();
    TransferStats get_stats();

    int prune_old_entries(int retention_days);
    bool delete_transfer(std::string const &id);
    int clear_history(std::optional<std::string> status = std::nullopt);

    std::size_t throttle_entries() const;

  private:
    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> schedule_task_async(Fn &&fn);

    void worker_loop();
    bool finish(std::string const &id, std::string const &status,
                std::optional<std::string> message);
    bool should_write_progress(std::string const &id, bool force,
                               std::chrono::system_clock::time_point now);
    void forget_progress(std::string const &id);
    std::chrono::system_clock::time_point now() const;

    std::unique_ptr<storage::Database> database_;
    Clock clock_;
    int recovered_count_ = 0;

    mutable std::mutex throttle_mutex_;
    std::unordered_map<std::string, std::chrono::system_clock::time_point>
        last_progress_write_;
    std::chrono::system_clock::time_point last_throttle_sweep_;

    std::atomic<bool> worker_running_{false};
    std::atomic<bool> exit_requested_{false};
    std::thread worker_thread_;
    std::mutex task_mutex_;
    std::condition_variable task_cv_;
    // Serializes database access between the worker and inline callers.
    std::mutex db_mutex_;
    std::deque<std::function<void()>> tasks_;
};

} // namespace tb::engine
