#include "engine/TorrentRegistry.hpp"

#include "utils/FS.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>

namespace tb::engine
{

namespace
{

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return value;
}

yyjson_mut_val *status_to_json(yyjson_mut_doc *doc, ClientStatus const &status)
{
    auto *entry = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_strcpy(doc, entry, "name", status.name.c_str());
    yyjson_mut_obj_add_strcpy(doc, entry, "state", status.state.c_str());
    yyjson_mut_obj_add_real(doc, entry, "progress", status.progress);
    yyjson_mut_obj_add_sint(doc, entry, "total_size", status.total_size);
    auto *files = yyjson_mut_arr(doc);
    for (auto const &file : status.files)
    {
        auto *item = yyjson_mut_obj(doc);
        yyjson_mut_obj_add_strcpy(doc, item, "path", file.path.c_str());
        yyjson_mut_obj_add_sint(doc, item, "size", file.size);
        yyjson_mut_arr_append(files, item);
    }
    yyjson_mut_obj_add_val(doc, entry, "files", files);
    return entry;
}

std::optional<ClientStatus> status_from_json(yyjson_val *value)
{
    if (value == nullptr || !yyjson_is_obj(value))
    {
        return std::nullopt;
    }
    ClientStatus status;
    status.name = json::get_string(value, "name").value_or("");
    status.state = json::get_string(value, "state").value_or("");
    status.progress = json::get_double(value, "progress").value_or(0.0);
    status.total_size = json::get_int(value, "total_size").value_or(0);
    auto *files = yyjson_obj_get(value, "files");
    if (files != nullptr && yyjson_is_arr(files))
    {
        size_t idx, max;
        yyjson_val *item;
        yyjson_arr_foreach(files, idx, max, item)
        {
            auto path = json::get_string(item, "path");
            if (!path)
            {
                continue;
            }
            status.files.push_back(
                {*path, json::get_int(item, "size").value_or(0)});
        }
    }
    return status;
}

} // namespace

TorrentRegistry::TorrentRegistry(std::filesystem::path snapshot_path,
                                 std::chrono::seconds first_seen_window)
    : snapshot_path_(std::move(snapshot_path)),
      first_seen_window_(first_seen_window)
{
}

Torrent *TorrentRegistry::add(Torrent torrent)
{
    if (torrent.name.empty())
    {
        TB_LOG_WARN("refusing to track a torrent without a name");
        return nullptr;
    }
    if (find_by_name(torrent.name) != nullptr)
    {
        TB_LOG_WARN("torrent '{}' is already tracked; ignoring duplicate",
                    torrent.name);
        return nullptr;
    }
    if (!torrent.id.empty() && find_by_id(torrent.id) != nullptr)
    {
        TB_LOG_WARN("torrent id {} is already tracked; ignoring '{}'",
                    torrent.id, torrent.name);
        return nullptr;
    }
    torrents_.push_back(std::move(torrent));
    return &torrents_.back();
}

bool TorrentRegistry::remove(std::string const &name)
{
    auto it = std::find_if(torrents_.begin(), torrents_.end(),
                           [&](Torrent const &torrent)
                           { return torrent.name == name; });
    if (it == torrents_.end())
    {
        return false;
    }
    torrents_.erase(it);
    return true;
}

Torrent *TorrentRegistry::find_by_name(std::string const &name)
{
    for (auto &torrent : torrents_)
    {
        if (torrent.name == name)
        {
            return &torrent;
        }
    }
    return nullptr;
}

Torrent *TorrentRegistry::find_by_id(std::string const &id)
{
    if (id.empty())
    {
        return nullptr;
    }
    for (auto &torrent : torrents_)
    {
        if (torrent.id == id)
        {
            return &torrent;
        }
    }
    return nullptr;
}

bool TorrentRegistry::rename(Torrent &torrent, std::string const &new_name)
{
    if (new_name.empty() || torrent.name == new_name)
    {
        return false;
    }
    if (auto *other = find_by_name(new_name); other != nullptr && other != &torrent)
    {
        TB_LOG_WARN("cannot rename '{}' to '{}': name already tracked",
                    torrent.name, new_name);
        return false;
    }
    TB_LOG_INFO("torrent '{}' renamed to '{}'", torrent.name, new_name);
    torrent.name = new_name;
    return true;
}

std::optional<ClientStatus> TorrentRegistry::match(Torrent &torrent,
                                                   StatusMap const &statuses,
                                                   std::int64_t now)
{
    if (!torrent.id.empty())
    {
        auto it = statuses.find(torrent.id);
        if (it == statuses.end())
        {
            return std::nullopt;
        }
        if (!it->second.name.empty() && it->second.name != torrent.name)
        {
            rename(torrent, it->second.name);
        }
        return it->second;
    }
    if (now - torrent.first_seen_at > first_seen_window_.count())
    {
        return std::nullopt;
    }
    for (auto const &[id, status] : statuses)
    {
        if (status.name != torrent.name)
        {
            continue;
        }
        auto pinned = to_lower(id);
        if (auto *owner = find_by_id(pinned); owner != nullptr && owner != &torrent)
        {
            TB_LOG_WARN("'{}' matches id {} already owned by '{}'",
                        torrent.name, pinned, owner->name);
            return std::nullopt;
        }
        torrent.id = std::move(pinned);
        TB_LOG_DEBUG("pinned '{}' to id {}", torrent.name, torrent.id);
        return status;
    }
    return std::nullopt;
}

bool TorrentRegistry::apply_queue_updates(std::string const &manager_kind,
                                          std::vector<QueueItem> const &items,
                                          std::int64_t now)
{
    bool changed = false;
    for (auto const &item : items)
    {
        auto id = to_lower(item.download_id);
        auto *torrent = find_by_id(id);
        if (torrent == nullptr)
        {
            torrent = find_by_name(item.title);
            if (torrent != nullptr && torrent->id.empty() && !id.empty())
            {
                torrent->id = id;
                changed = true;
            }
        }
        if (torrent != nullptr)
        {
            if (torrent->media_manager.empty())
            {
                torrent->media_manager = manager_kind;
                changed = true;
            }
            if (torrent->size_bytes == 0 && item.size > 0)
            {
                torrent->size_bytes = item.size;
                changed = true;
            }
            continue;
        }
        Torrent fresh;
        fresh.name = item.title;
        fresh.id = id;
        fresh.media_manager = manager_kind;
        fresh.size_bytes = item.size;
        fresh.first_seen_at = now;
        if (add(std::move(fresh)) != nullptr)
        {
            TB_LOG_INFO("tracking '{}' from {}", item.title, manager_kind);
            changed = true;
        }
    }
    return changed;
}

bool TorrentRegistry::save() const
{
    if (snapshot_path_.empty())
    {
        return false;
    }
    if (!utils::write_file_atomic(snapshot_path_, to_json()))
    {
        TB_LOG_ERROR("failed to write registry snapshot {}",
                     snapshot_path_.string());
        return false;
    }
    return true;
}

bool TorrentRegistry::load()
{
    if (snapshot_path_.empty())
    {
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::exists(snapshot_path_, ec))
    {
        return true;
    }
    auto payload = utils::read_file_text(snapshot_path_);
    if (!payload)
    {
        TB_LOG_ERROR("failed to read registry snapshot {}",
                     snapshot_path_.string());
        return false;
    }
    if (!from_json(*payload))
    {
        TB_LOG_ERROR("registry snapshot {} is malformed",
                     snapshot_path_.string());
        return false;
    }
    TB_LOG_INFO("loaded {} torrent(s) from {}", torrents_.size(),
                snapshot_path_.string());
    return true;
}

std::string TorrentRegistry::to_json() const
{
    json::MutableDocument document;
    auto *doc = document.doc();
    if (doc == nullptr)
    {
        return "[]";
    }
    auto *root = yyjson_mut_arr(doc);
    document.set_root(root);
    for (auto const &torrent : torrents_)
    {
        yyjson_mut_arr_append(root, torrent_to_json(doc, torrent));
    }
    return document.write("[]", true);
}

bool TorrentRegistry::from_json(std::string_view payload)
{
    auto document = json::Document::parse(payload);
    if (!document.is_valid())
    {
        return false;
    }
    auto *root = document.root();
    if (root == nullptr || !yyjson_is_arr(root))
    {
        return false;
    }
    std::vector<Torrent> loaded;
    size_t idx, max;
    yyjson_val *item;
    yyjson_arr_foreach(root, idx, max, item)
    {
        auto torrent = torrent_from_json(item);
        if (!torrent)
        {
            TB_LOG_WARN("skipping malformed registry entry {}", idx);
            continue;
        }
        loaded.push_back(std::move(*torrent));
    }
    torrents_.clear();
    for (auto &torrent : loaded)
    {
        add(std::move(torrent));
    }
    return true;
}

yyjson_mut_val *torrent_to_json(yyjson_mut_doc *doc, Torrent const &torrent)
{
    auto *entry = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_strcpy(doc, entry, "name", torrent.name.c_str());
    yyjson_mut_obj_add_strcpy(doc, entry, "id", torrent.id.c_str());
    auto state = to_string(torrent.state);
    yyjson_mut_obj_add_strncpy(doc, entry, "state", state.data(), state.size());
    if (torrent.local_client_info)
    {
        yyjson_mut_obj_add_val(doc, entry, "local_client_info",
                               status_to_json(doc, *torrent.local_client_info));
    }
    else
    {
        yyjson_mut_obj_add_null(doc, entry, "local_client_info");
    }
    if (torrent.remote_client_info)
    {
        yyjson_mut_obj_add_val(doc, entry, "remote_client_info",
                               status_to_json(doc, *torrent.remote_client_info));
    }
    else
    {
        yyjson_mut_obj_add_null(doc, entry, "remote_client_info");
    }
    yyjson_mut_obj_add_strcpy(doc, entry, "metadata_file_path",
                              torrent.metadata_file_path.c_str());
    yyjson_mut_obj_add_strcpy(doc, entry, "home_client",
                              torrent.home_client.c_str());
    yyjson_mut_obj_add_strcpy(doc, entry, "target_client",
                              torrent.target_client.c_str());
    yyjson_mut_obj_add_strcpy(doc, entry, "connection",
                              torrent.connection.c_str());
    yyjson_mut_obj_add_strcpy(doc, entry, "media_manager",
                              torrent.media_manager.c_str());
    yyjson_mut_obj_add_sint(doc, entry, "size_bytes", torrent.size_bytes);
    yyjson_mut_obj_add_int(doc, entry, "retry_count", torrent.retry_count);
    yyjson_mut_obj_add_sint(doc, entry, "next_retry_at", torrent.next_retry_at);
    yyjson_mut_obj_add_int(doc, entry, "not_found_attempts",
                           torrent.not_found_attempts);
    yyjson_mut_obj_add_int(doc, entry, "metadata_missing_cycles",
                           torrent.metadata_missing_cycles);
    yyjson_mut_obj_add_sint(doc, entry, "first_seen_at", torrent.first_seen_at);
    yyjson_mut_obj_add_strcpy(doc, entry, "last_error",
                              torrent.last_error.c_str());
    return entry;
}

std::optional<Torrent> torrent_from_json(yyjson_val *value)
{
    auto name = json::get_string(value, "name");
    if (!name || name->empty())
    {
        return std::nullopt;
    }
    Torrent torrent;
    torrent.name = *name;
    torrent.id = to_lower(json::get_string(value, "id").value_or(""));
    auto state = state_from_string(json::get_string(value, "state").value_or(""));
    torrent.state = state.value_or(TorrentState::Queued);
    torrent.local_client_info =
        status_from_json(yyjson_obj_get(value, "local_client_info"));
    torrent.remote_client_info =
        status_from_json(yyjson_obj_get(value, "remote_client_info"));
    torrent.metadata_file_path =
        json::get_string(value, "metadata_file_path").value_or("");
    torrent.home_client = json::get_string(value, "home_client").value_or("");
    torrent.target_client =
        json::get_string(value, "target_client").value_or("");
    torrent.connection = json::get_string(value, "connection").value_or("");
    torrent.media_manager =
        json::get_string(value, "media_manager").value_or("");
    torrent.size_bytes = json::get_int(value, "size_bytes").value_or(0);
    torrent.retry_count =
        static_cast<int>(json::get_int(value, "retry_count").value_or(0));
    torrent.next_retry_at = json::get_int(value, "next_retry_at").value_or(0);
    torrent.not_found_attempts = static_cast<int>(
        json::get_int(value, "not_found_attempts").value_or(0));
    torrent.metadata_missing_cycles = static_cast<int>(
        json::get_int(value, "metadata_missing_cycles").value_or(0));
    torrent.first_seen_at = json::get_int(value, "first_seen_at").value_or(0);
    torrent.last_error = json::get_string(value, "last_error").value_or("");
    return torrent;
}

} // namespace tb::engine
