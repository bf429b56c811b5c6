#include "engine/TransferHistoryStore.hpp"

#include "utils/Log.hpp"
#include "utils/Time.hpp"
#include "utils/Uuid.hpp"

#include <cmath>
#include <exception>

namespace tb::engine
{

namespace
{

std::string media_type_for(std::string const &manager)
{
    if (manager == "radarr")
    {
        return "movie";
    }
    if (manager == "sonarr")
    {
        return "episode";
    }
    return "unknown";
}

} // namespace

template <typename Fn>
std::future<std::invoke_result_t<Fn>>
TransferHistoryStore::schedule_task_async(Fn &&fn)
{
    using result_t = std::invoke_result_t<Fn>;
    auto task =
        std::make_shared<std::packaged_task<result_t()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        if (worker_running_.load(std::memory_order_acquire) &&
            !exit_requested_.load(std::memory_order_acquire))
        {
            tasks_.emplace_back([task]() mutable { (*task)(); });
            task_cv_.notify_one();
            return future;
        }
    }
    // No worker: run on the caller, still one task at a time.
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    (*task)();
    return future;
}

TransferHistoryStore::TransferHistoryStore(std::filesystem::path db_path,
                                           Clock clock)
    : database_(std::make_unique<storage::Database>(std::move(db_path))),
      clock_(std::move(clock))
{
    last_throttle_sweep_ = now();
    if (!database_->is_valid())
    {
        TB_LOG_ERROR("transfer history unavailable: {}",
                     database_->path().string());
        return;
    }
    auto recovered = database_->fail_unfinished(
        kInterruptedMessage, utils::format_iso8601(now()));
    if (recovered > 0)
    {
        recovered_count_ = recovered;
        TB_LOG_WARN("marked {} interrupted transfer(s) as failed", recovered);
    }
    else if (recovered < 0)
    {
        TB_LOG_ERROR("failed to recover interrupted transfers");
    }
}

TransferHistoryStore::~TransferHistoryStore()
{
    stop();
}

void TransferHistoryStore::start()
{
    if (!database_ || !database_->is_valid())
    {
        return;
    }
    if (worker_thread_.joinable())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        exit_requested_.store(false, std::memory_order_release);
        worker_running_.store(true, std::memory_order_release);
    }
    worker_thread_ = std::thread([this] { worker_loop(); });
}

void TransferHistoryStore::stop()
{
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    task_cv_.notify_all();
    // The worker drains everything queued before the flag was set.
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    std::lock_guard<std::mutex> lock(task_mutex_);
    worker_running_.store(false, std::memory_order_release);
}

bool TransferHistoryStore::is_valid() const noexcept
{
    return database_ && database_->is_valid();
}

std::chrono::system_clock::time_point TransferHistoryStore::now() const
{
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::optional<std::string> TransferHistoryStore::create_transfer(
    Torrent const &torrent, std::string const &source_client,
    std::string const &target_client,
    std::optional<std::string> connection_name)
{
    storage::TransferRecord record;
    record.id = utils::generate_uuid4();
    record.torrent_name = torrent.name;
    record.torrent_hash = torrent.id;
    record.source_client = source_client;
    record.target_client = target_client;
    record.connection_name = std::move(connection_name);
    record.media_type = media_type_for(torrent.media_manager);
    if (record.media_type != "unknown")
    {
        record.media_manager = torrent.media_manager;
    }
    if (torrent.size_bytes > 0)
    {
        record.size_bytes = torrent.size_bytes;
    }
    record.created_at = utils::format_iso8601(now());

    auto future = schedule_task_async(
        [this, record]()
        {
            if (!database_ || !database_->is_valid())
            {
                return false;
            }
            return database_->insert_transfer(record);
        });
    if (!future.valid() || !future.get())
    {
        TB_LOG_ERROR("failed to record transfer for {}", torrent.name);
        return std::nullopt;
    }
    TB_LOG_DEBUG("created transfer {} for {}", record.id, torrent.name);
    return record.id;
}

bool TransferHistoryStore::start_transfer(std::string const &id)
{
    auto timestamp = utils::format_iso8601(now());
    auto future = schedule_task_async(
        [this, id, timestamp]()
        {
            if (!database_ || !database_->is_valid())
            {
                return false;
            }
            return database_->mark_started(id, timestamp);
        });
    return future.valid() ? future.get() : false;
}

bool TransferHistoryStore::update_progress(std::string const &id,
                                           std::int64_t bytes, bool force)
{
    if (!should_write_progress(id, force, now()))
    {
        return false;
    }
    auto future = schedule_task_async(
        [this, id, bytes, force]()
        {
            if (!database_ || !database_->is_valid())
            {
                return false;
            }
            return database_->update_bytes(id, bytes, force);
        });
    return future.valid() ? future.get() : false;
}

bool TransferHistoryStore::complete_transfer(std::string const &id)
{
    return finish(id, "completed", std::nullopt);
}

bool TransferHistoryStore::fail_transfer(std::string const &id,
                                         std::string const &message)
{
    return finish(id, "failed", message);
}

bool TransferHistoryStore::cancel_transfer(std::string const &id)
{
    return finish(id, "cancelled", std::string("Cancelled by operator"));
}

bool TransferHistoryStore::finish(std::string const &id,
                                  std::string const &status,
                                  std::optional<std::string> message)
{
    forget_progress(id);
    auto timestamp = utils::format_iso8601(now());
    auto future = schedule_task_async(
        [this, id, status, message = std::move(message), timestamp]()
        {
            if (!database_ || !database_->is_valid())
            {
                return false;
            }
            return database_->finish_transfer(id, status, message, timestamp);
        });
    bool finished = future.valid() ? future.get() : false;
    if (!finished)
    {
        TB_LOG_WARN("transfer {} could not be marked {}", id, status);
    }
    return finished;
}

std::optional<storage::TransferRecord>
TransferHistoryStore::get_transfer(std::string const &id)
{
    auto future = schedule_task_async(
        [this, id]() -> std::optional<storage::TransferRecord>
        {
            if (!database_ || !database_->is_valid())
            {
                return std::nullopt;
            }
            return database_->get_transfer(id);
        });
    return future.valid() ? future.get() : std::nullopt;
}

storage::TransferPage
TransferHistoryStore::list_transfers(storage::TransferQuery const &query)
{
    auto future = schedule_task_async(
        [this, query]()
        {
            if (!database_ || !database_->is_valid())
            {
                return storage::TransferPage{};
            }
            return database_->list_transfers(query);
        });
    return future.valid() ? future.get() : storage::TransferPage{};
}

std::vector<storage::TransferRecord>
TransferHistoryStore::get_active_transfers()
{
    auto future = schedule_task_async(
        [this]()
        {
            if (!database_ || !database_->is_valid())
            {
                return std::vector<storage::TransferRecord>{};
            }
            return database_->active_transfers();
        });
    return future.valid() ? future.get()
                          : std::vector<storage::TransferRecord>{};
}

TransferStats TransferHistoryStore::get_stats()
{
    auto future = schedule_task_async(
        [this]() -> std::optional<storage::TransferCounts>
        {
            if (!database_ || !database_->is_valid())
            {
                return std::nullopt;
            }
            return database_->counts();
        });
    TransferStats stats;
    auto counts = future.valid() ? future.get() : std::nullopt;
    if (!counts)
    {
        return stats;
    }
    stats.total = counts->total;
    stats.completed = counts->completed;
    stats.failed = counts->failed;
    stats.pending = counts->pending;
    stats.transferring = counts->transferring;
    stats.total_bytes_transferred = counts->completed_bytes;
    auto finished = counts->completed + counts->failed;
    if (finished > 0)
    {
        auto rate = static_cast<double>(counts->completed) * 100.0 /
                    static_cast<double>(finished);
        stats.success_rate = std::round(rate * 10.0) / 10.0;
    }
    return stats;
}

int TransferHistoryStore::prune_old_entries(int retention_days)
{
    std::optional<std::string> cutoff;
    if (retention_days > 0)
    {
        cutoff = utils::format_iso8601(now() -
                                       std::chrono::hours(24) * retention_days);
    }
    auto future = schedule_task_async(
        [this, cutoff]()
        {
            if (!database_ || !database_->is_valid())
            {
                return -1;
            }
            return cutoff ? database_->delete_finished_before(*cutoff)
                          : database_->delete_finished(std::nullopt);
        });
    auto deleted = future.valid() ? future.get() : -1;
    if (deleted > 0)
    {
        TB_LOG_INFO("pruned {} transfer record(s)", deleted);
    }
    return deleted;
}

bool TransferHistoryStore::delete_transfer(std::string const &id)
{
    forget_progress(id);
    auto future = schedule_task_async(
        [this, id]()
        {
            if (!database_ || !database_->is_valid())
            {
                return false;
            }
            return database_->delete_transfer(id);
        });
    return future.valid() ? future.get() : false;
}

int TransferHistoryStore::clear_history(std::optional<std::string> status)
{
    auto future = schedule_task_async(
        [this, status = std::move(status)]()
        {
            if (!database_ || !database_->is_valid())
            {
                return -1;
            }
            return database_->delete_finished(status);
        });
    return future.valid() ? future.get() : -1;
}

std::size_t TransferHistoryStore::throttle_entries() const
{
    std::lock_guard<std::mutex> lock(throttle_mutex_);
    return last_progress_write_.size();
}

bool TransferHistoryStore::should_write_progress(
    std::string const &id, bool force,
    std::chrono::system_clock::time_point now)
{
    std::lock_guard<std::mutex> lock(throttle_mutex_);
    if (now - last_throttle_sweep_ >= kThrottleSweepInterval)
    {
        for (auto it = last_progress_write_.begin();
             it != last_progress_write_.end();)
        {
            if (now - it->second > kThrottleEntryTtl)
            {
                it = last_progress_write_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        last_throttle_sweep_ = now;
    }
    auto it = last_progress_write_.find(id);
    if (!force && it != last_progress_write_.end() &&
        now - it->second < kProgressInterval)
    {
        return false;
    }
    last_progress_write_[id] = now;
    return true;
}

void TransferHistoryStore::forget_progress(std::string const &id)
{
    std::lock_guard<std::mutex> lock(throttle_mutex_);
    last_progress_write_.erase(id);
}

void TransferHistoryStore::worker_loop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(task_mutex_);
            task_cv_.wait(lock,
                          [this]
                          {
                              return !tasks_.empty() ||
                                     exit_requested_.load(
                                         std::memory_order_acquire);
                          });
            if (tasks_.empty())
            {
                if (exit_requested_.load(std::memory_order_acquire))
                {
                    break;
                }
                continue;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try
        {
            std::lock_guard<std::mutex> db_lock(db_mutex_);
            task();
        }
        catch (std::exception const &ex)
        {
            TB_LOG_ERROR("history worker task exception: {}", ex.what());
        }
        catch (...)
        {
            TB_LOG_ERROR("history worker task exception");
        }
    }
}

} // namespace tb::engine
