#include "engine/TransferOrchestrator.hpp"

#include "engine/MetadataFile.hpp"
#include "utils/Log.hpp"
#include "utils/Time.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <format>

namespace tb::engine
{

namespace
{

bool is_pre_copy(TorrentState state) noexcept
{
    return state == TorrentState::Queued ||
           state == TorrentState::LocalDownloading ||
           state == TorrentState::LocalPaused ||
           state == TorrentState::LocalSeeding;
}

} // namespace

TransferOrchestrator::TransferOrchestrator(TorrentRegistry &registry,
                                           TransferHistoryStore *history,
                                           OrchestratorSettings settings,
                                           Clock clock)
    : registry_(registry), history_(history), settings_(std::move(settings)),
      clock_(std::move(clock)), track_progress_(settings_.track_progress)
{
    publish();
}

void TransferOrchestrator::add_media_manager(
    std::shared_ptr<MediaManager> manager)
{
    if (manager)
    {
        managers_.push_back(std::move(manager));
    }
}

void TransferOrchestrator::add_download_client(
    std::shared_ptr<DownloadClient> client)
{
    if (client)
    {
        clients_.push_back(std::move(client));
    }
}

bool TransferOrchestrator::add_connection(
    ConnectionConfig config, std::shared_ptr<FileTransport> transport)
{
    Connection connection;
    connection.from = client(config.from);
    connection.to = client(config.to);
    if (connection.from == nullptr || connection.to == nullptr || !transport)
    {
        TB_LOG_ERROR("connection {} is incomplete", config.name);
        return false;
    }
    connection.config = std::move(config);
    connection.transport = std::move(transport);
    connections_.push_back(std::move(connection));
    return true;
}

void TransferOrchestrator::set_track_progress(bool enabled) noexcept
{
    track_progress_.store(enabled, std::memory_order_relaxed);
}

void TransferOrchestrator::run_cycle()
{
    auto now = now_seconds();
    apply_commands();

    if (refresh_media_managers(now))
    {
        snapshot_dirty_ = true;
    }
    auto polls = poll_clients();

    std::vector<std::string> finished;
    for (auto &torrent : registry_.torrents())
    {
        try
        {
            refresh_torrent(torrent, polls, now);
            evaluate(torrent, polls, now);
            if (cleanup(torrent))
            {
                finished.push_back(torrent.name);
            }
        }
        catch (std::exception const &ex)
        {
            TB_LOG_ERROR("cycle failed for '{}': {}", torrent.name, ex.what());
        }
    }
    for (auto const &name : finished)
    {
        registry_.remove(name);
        snapshot_dirty_ = true;
    }
    if (snapshot_dirty_)
    {
        persist(PersistEffect::SaveSnapshot);
    }
    cycles_.fetch_add(1, std::memory_order_relaxed);
    publish();
}

std::shared_ptr<TransferOrchestrator::TorrentList const>
TransferOrchestrator::published() const
{
    std::lock_guard<std::mutex> lock(published_mutex_);
    return published_;
}

void TransferOrchestrator::enqueue_reset(std::string name,
                                         CommandCallback callback)
{
    std::lock_guard<std::mutex> lock(command_mutex_);
    commands_.push_back(
        {Command::Kind::Reset, std::move(name), std::move(callback)});
}

void TransferOrchestrator::enqueue_remove(std::string name,
                                          CommandCallback callback)
{
    std::lock_guard<std::mutex> lock(command_mutex_);
    commands_.push_back(
        {Command::Kind::Remove, std::move(name), std::move(callback)});
}

void TransferOrchestrator::apply_commands()
{
    std::deque<Command> pending;
    {
        std::lock_guard<std::mutex> lock(command_mutex_);
        pending.swap(commands_);
    }
    if (pending.empty())
    {
        return;
    }
    for (auto &command : pending)
    {
        AdapterResult result;
        if (command.kind == Command::Kind::Reset)
        {
            if (auto *torrent = registry_.find_by_name(command.name))
            {
                auto transition = reset_torrent(*torrent);
                if (torrent->id.empty())
                {
                    // Reopen the name-matching window.
                    torrent->first_seen_at = now_seconds();
                }
                persist(transition.persist);
                TB_LOG_INFO("'{}' reset from {} by operator", command.name,
                            to_string(transition.from));
                result = {true, "torrent reset"};
            }
            else
            {
                result = {false, "torrent not found"};
            }
        }
        else if (registry_.remove(command.name))
        {
            persist(PersistEffect::SaveSnapshot);
            TB_LOG_INFO("'{}' removed from tracking by operator", command.name);
            result = {true, "torrent removed"};
        }
        else
        {
            result = {false, "torrent not found"};
        }
        if (command.callback)
        {
            command.callback(std::move(result));
        }
    }
    publish();
}

bool TransferOrchestrator::refresh_media_managers(std::int64_t now)
{
    bool changed = false;
    for (auto const &manager : managers_)
    {
        auto items = manager->get_queue_updates();
        if (!items)
        {
            TB_LOG_WARN("{} queue unavailable this cycle", manager->kind());
            continue;
        }
        if (registry_.apply_queue_updates(manager->kind(), *items, now))
        {
            changed = true;
        }
    }
    return changed;
}

TransferOrchestrator::PollResults TransferOrchestrator::poll_clients()
{
    PollResults polls;
    for (auto const &download_client : clients_)
    {
        auto statuses = download_client->get_status_map();
        if (!statuses)
        {
            TB_LOG_WARN("download client {} unreachable",
                        download_client->name());
        }
        polls[download_client->name()] = std::move(statuses);
    }
    return polls;
}

void TransferOrchestrator::refresh_torrent(Torrent &torrent,
                                           PollResults const &polls,
                                           std::int64_t now)
{
    if (is_absorbing(torrent.state))
    {
        return;
    }
    if (connection_for(torrent) == nullptr)
    {
        assign_connection(torrent, polls, now);
        if (connection_for(torrent) == nullptr)
        {
            return;
        }
    }
    auto const *connection = connection_for(torrent);
    auto local_poll = polls.find(connection->config.from);
    if (local_poll == polls.end() || !local_poll->second)
    {
        return;
    }

    auto local = registry_.match(torrent, *local_poll->second, now);
    if (local)
    {
        if (torrent.not_found_attempts != 0 ||
            (local->total_size > 0 && torrent.size_bytes != local->total_size))
        {
            snapshot_dirty_ = true;
        }
        torrent.not_found_attempts = 0;
        if (local->total_size > 0)
        {
            torrent.size_bytes = local->total_size;
        }
        torrent.local_client_info = *local;
    }
    else
    {
        torrent.local_client_info.reset();
        if (is_pre_copy(torrent.state) || torrent.state == TorrentState::Copying ||
            torrent.state == TorrentState::Error)
        {
            count_not_found(torrent);
            if (torrent.state == TorrentState::Missing)
            {
                return;
            }
        }
    }

    bool remote_known = false;
    auto remote_poll = polls.find(connection->config.to);
    if (remote_poll != polls.end() && remote_poll->second && !torrent.id.empty())
    {
        remote_known = true;
        auto remote = remote_poll->second->find(torrent.id);
        if (remote != remote_poll->second->end())
        {
            torrent.remote_client_info = remote->second;
        }
        else
        {
            torrent.remote_client_info.reset();
        }
    }

    if (local && is_pre_copy(torrent.state))
    {
        if (auto mapped = local_state_for(local->state))
        {
            if (*mapped == TorrentState::Error)
            {
                torrent.last_error = "download client reported an error";
                snapshot_dirty_ = true;
            }
            set_state(torrent, *mapped);
        }
    }
    else if (local && torrent.state == TorrentState::Error &&
             torrent.next_retry_at <= now)
    {
        auto mapped = local_state_for(local->state);
        if (mapped && (*mapped == TorrentState::LocalDownloading ||
                       *mapped == TorrentState::LocalPaused))
        {
            set_state(torrent, *mapped);
        }
    }

    if (remote_known && (torrent.state == TorrentState::Copied ||
                         torrent.state == TorrentState::RemoteSeeding))
    {
        if (!torrent.remote_client_info)
        {
            if (local && is_seeding(*local))
            {
                TB_LOG_WARN("'{}' vanished from {}; falling back to local "
                            "seeding",
                            torrent.name, connection->config.to);
                set_state(torrent, TorrentState::LocalSeeding);
            }
        }
        else if (auto mapped = remote_state_for(torrent.remote_client_info->state))
        {
            set_state(torrent, *mapped);
        }
    }
}

void TransferOrchestrator::assign_connection(Torrent &torrent,
                                             PollResults const &polls,
                                             std::int64_t now)
{
    bool polled = false;
    for (auto const &connection : connections_)
    {
        auto poll = polls.find(connection.config.from);
        if (poll == polls.end() || !poll->second)
        {
            continue;
        }
        polled = true;
        if (registry_.match(torrent, *poll->second, now))
        {
            torrent.home_client = connection.config.from;
            torrent.target_client = connection.config.to;
            torrent.connection = connection.config.name;
            snapshot_dirty_ = true;
            TB_LOG_INFO("'{}' found on {} (connection {})", torrent.name,
                        torrent.home_client, torrent.connection);
            return;
        }
    }
    if (polled)
    {
        count_not_found(torrent);
    }
}

void TransferOrchestrator::count_not_found(Torrent &torrent)
{
    ++torrent.not_found_attempts;
    snapshot_dirty_ = true;
    if (torrent.not_found_attempts > settings_.matching.max_not_found_attempts)
    {
        TB_LOG_WARN("'{}' not found after {} attempts; marking missing",
                    torrent.name, torrent.not_found_attempts);
        set_state(torrent, TorrentState::Missing);
    }
}

void TransferOrchestrator::evaluate(Torrent &torrent, PollResults const &polls,
                                    std::int64_t now)
{
    if (torrent.state != TorrentState::LocalSeeding &&
        torrent.state != TorrentState::Copying &&
        torrent.state != TorrentState::Error)
    {
        return;
    }
    if (torrent.state == TorrentState::Error && torrent.next_retry_at > now)
    {
        return;
    }
    auto const *connection = connection_for(torrent);
    if (connection == nullptr || torrent.id.empty())
    {
        return;
    }
    if (!torrent.local_client_info || !is_seeding(*torrent.local_client_info))
    {
        return;
    }
    auto remote_poll = polls.find(connection->config.to);
    if (remote_poll == polls.end() || !remote_poll->second)
    {
        return;
    }
    if (torrent.remote_client_info)
    {
        auto target = remote_state_for(torrent.remote_client_info->state)
                          .value_or(TorrentState::Copied);
        TB_LOG_INFO("'{}' already present on {}; skipping transfer",
                    torrent.name, connection->config.to);
        if (torrent.state == TorrentState::Copying)
        {
            set_state(torrent, TorrentState::Copied);
        }
        torrent.retry_count = 0;
        torrent.next_retry_at = 0;
        torrent.metadata_missing_cycles = 0;
        set_state(torrent, target);
        snapshot_dirty_ = true;
        return;
    }
    run_transfer(torrent, *connection, now);
}

void TransferOrchestrator::run_transfer(Torrent &torrent,
                                        Connection const &connection,
                                        std::int64_t now)
{
    if (torrent.state != TorrentState::Copying &&
        !set_state(torrent, TorrentState::Copying))
    {
        return;
    }
    TB_LOG_INFO("transferring '{}' via {}", torrent.name,
                connection.config.name);

    auto metadata_path =
        metadata_path_for(connection.config.source_dot_torrent_path, torrent.id);
    torrent.metadata_file_path = metadata_path.string();
    auto loaded = load_metadata_file(metadata_path);
    // A wait for the metadata file is one attempt; its record was already
    // failed on the first miss.
    bool const waiting = loaded.missing && torrent.metadata_missing_cycles > 0;

    std::optional<std::string> record_id;
    if (history_ != nullptr && !waiting)
    {
        record_id = history_->create_transfer(torrent, connection.from->name(),
                                              connection.to->name(),
                                              connection.config.name);
        if (record_id)
        {
            history_->start_transfer(*record_id);
        }
    }
    auto fail = [&](std::string const &message)
    {
        TB_LOG_ERROR("transfer of '{}' failed: {}", torrent.name, message);
        if (record_id)
        {
            history_->fail_transfer(*record_id, message);
        }
    };

    if (!loaded.metadata)
    {
        fail(loaded.error);
        if (loaded.missing &&
            ++torrent.metadata_missing_cycles <
                settings_.matching.metadata_wait_cycles)
        {
            snapshot_dirty_ = true;
            return;
        }
        torrent.metadata_missing_cycles = 0;
        register_failure(torrent, loaded.error, now);
        return;
    }
    torrent.metadata_missing_cycles = 0;
    auto const &metadata = *loaded.metadata;

    auto sent = connection.transport->send(
        metadata_path, connection.config.destination_dot_torrent_tmp_dir, {});
    if (!sent.success)
    {
        auto message = "Failed to transfer metadata file: " + sent.message;
        fail(message);
        register_failure(torrent, message, now);
        return;
    }

    auto paths = top_level_paths(torrent.local_client_info
                                     ? torrent.local_client_info->files
                                     : std::vector<ClientFile>{});
    if (paths.empty())
    {
        paths = top_level_paths(metadata.files);
    }
    if (paths.empty())
    {
        auto message = std::string("No content paths to transfer");
        fail(message);
        register_failure(torrent, message, now);
        return;
    }

    bool track = track_progress_.load(std::memory_order_relaxed);
    std::uint64_t moved = 0;
    for (auto const &path : paths)
    {
        auto source =
            std::filesystem::path(connection.config.source_torrent_download_path) /
            path;
        ProgressCallback progress;
        if (track && record_id)
        {
            auto base = moved;
            progress = [this, &record_id, base](std::uint64_t bytes)
            {
                history_->update_progress(
                    *record_id, static_cast<std::int64_t>(base + bytes));
            };
        }
        auto result = connection.transport->send(
            source, connection.config.destination_torrent_download_path,
            progress);
        if (!result.success)
        {
            auto message =
                std::format("Failed to transfer {}: {}", path, result.message);
            fail(message);
            register_failure(torrent, message, now);
            return;
        }
        moved += result.bytes_sent;
    }
    if (record_id)
    {
        history_->update_progress(*record_id, static_cast<std::int64_t>(moved),
                                  true);
    }

    set_state(torrent, TorrentState::Copied);
    AddTorrentOptions options;
    options.download_location =
        connection.config.destination_torrent_download_path;
    auto remote_path =
        (std::filesystem::path(connection.config.destination_dot_torrent_tmp_dir) /
         (torrent.id + ".torrent"))
            .string();
    auto added = connection.to->add_torrent_file(remote_path, metadata.bytes,
                                                 options);
    if (!added.success)
    {
        auto message = "Failed to add torrent to " + connection.to->name() +
                       ": " + added.message;
        fail(message);
        register_failure(torrent, message, now);
        return;
    }

    torrent.retry_count = 0;
    torrent.next_retry_at = 0;
    torrent.last_error.clear();
    set_state(torrent, TorrentState::RemoteSeeding);
    if (record_id)
    {
        history_->complete_transfer(*record_id);
    }
    TB_LOG_INFO("'{}' is now on {} ({} bytes moved)", torrent.name,
                connection.to->name(), moved);
}

void TransferOrchestrator::register_failure(Torrent &torrent,
                                            std::string const &message,
                                            std::int64_t now)
{
    ++torrent.retry_count;
    torrent.last_error = message;
    if (torrent.retry_count > settings_.retry.max_retries)
    {
        torrent.next_retry_at = 0;
        if (torrent.state != TorrentState::Error)
        {
            set_state(torrent, TorrentState::Error);
        }
        set_state(torrent, TorrentState::Failed);
        TB_LOG_ERROR("'{}' failed permanently after {} attempts: {}",
                     torrent.name, torrent.retry_count, message);
        return;
    }
    auto delay = backoff_seconds(torrent.retry_count);
    torrent.next_retry_at = now + delay;
    if (!set_state(torrent, TorrentState::Error))
    {
        snapshot_dirty_ = true;
    }
    TB_LOG_WARN("'{}' will be retried in {}s (attempt {} of {})", torrent.name,
                delay, torrent.retry_count, settings_.retry.max_retries);
}

bool TransferOrchestrator::cleanup(Torrent &torrent)
{
    if (torrent.state != TorrentState::RemoteSeeding)
    {
        return false;
    }
    if (!torrent.remote_client_info || !is_seeding(*torrent.remote_client_info))
    {
        return false;
    }
    if (!torrent.media_manager.empty())
    {
        auto *media_manager = manager(torrent.media_manager);
        if (media_manager != nullptr && !media_manager->ready_to_remove(torrent))
        {
            return false;
        }
    }
    auto const *connection = connection_for(torrent);
    if (connection == nullptr)
    {
        return false;
    }
    if (!torrent.local_client_info)
    {
        TB_LOG_INFO("'{}' already gone from {}; dropping", torrent.name,
                    connection->config.from);
        return true;
    }
    auto removed = connection->from->remove_torrent(torrent.id, true);
    if (!removed.success)
    {
        TB_LOG_WARN("failed to remove '{}' from {}: {}", torrent.name,
                    connection->config.from, removed.message);
        return false;
    }
    TB_LOG_INFO("removed '{}' from {}", torrent.name, connection->config.from);
    return true;
}

bool TransferOrchestrator::set_state(Torrent &torrent, TorrentState state)
{
    auto transition = apply_transition(torrent, state);
    if (transition.rejected)
    {
        TB_LOG_WARN("rejected transition {} -> {} for '{}'",
                    to_string(transition.from), to_string(transition.to),
                    torrent.name);
        return false;
    }
    if (transition.changed)
    {
        TB_LOG_DEBUG("'{}': {} -> {}", torrent.name, to_string(transition.from),
                     to_string(transition.to));
    }
    persist(transition.persist);
    return transition.changed;
}

void TransferOrchestrator::persist(PersistEffect effect)
{
    if (effect != PersistEffect::SaveSnapshot)
    {
        return;
    }
    if (registry_.snapshot_path().empty() || registry_.save())
    {
        snapshot_dirty_ = false;
    }
}

void TransferOrchestrator::publish()
{
    auto snapshot = std::make_shared<TorrentList const>(registry_.torrents());
    std::lock_guard<std::mutex> lock(published_mutex_);
    published_ = std::move(snapshot);
}

TransferOrchestrator::Connection const *
TransferOrchestrator::connection_for(Torrent const &torrent) const
{
    if (torrent.connection.empty())
    {
        return nullptr;
    }
    for (auto const &connection : connections_)
    {
        if (connection.config.name == torrent.connection)
        {
            return &connection;
        }
    }
    return nullptr;
}

DownloadClient *TransferOrchestrator::client(std::string const &name) const
{
    for (auto const &candidate : clients_)
    {
        if (candidate->name() == name)
        {
            return candidate.get();
        }
    }
    return nullptr;
}

MediaManager *TransferOrchestrator::manager(std::string const &kind) const
{
    for (auto const &candidate : managers_)
    {
        if (candidate->kind() == kind)
        {
            return candidate.get();
        }
    }
    return nullptr;
}

std::int64_t TransferOrchestrator::backoff_seconds(int retry_count) const
{
    std::int64_t delay = settings_.retry.base_backoff_seconds;
    std::int64_t const cap = settings_.retry.max_backoff_seconds;
    for (int attempt = 1; attempt < retry_count && delay < cap; ++attempt)
    {
        delay *= 2;
    }
    return std::min(delay, cap);
}

std::int64_t TransferOrchestrator::now_seconds() const
{
    return utils::to_unix_seconds(clock_ ? clock_()
                                         : std::chrono::system_clock::now());
}

} // namespace tb::engine
