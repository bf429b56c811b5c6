#pragma once

#include "engine/StateMachine.hpp"
#include "engine/Torrent.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <yyjson.h>

namespace tb::engine
{

struct QueueItem
{
    std::string download_id;
    std::string title;
    std::int64_t size = 0;
};

using StatusMap = std::unordered_map<std::string, ClientStatus>;

// In-memory set of tracked torrents, keyed by name until a client id is
// known. At most one torrent per name.
class TorrentRegistry
{
  public:
    explicit TorrentRegistry(
        std::filesystem::path snapshot_path = {},
        std::chrono::seconds first_seen_window = std::chrono::hours(1));

    // Returns nullptr (and logs) when a torrent with the same name exists.
    Torrent *add(Torrent torrent);
    bool remove(std::string const &name);
    Torrent *find_by_name(std::string const &name);
    Torrent *find_by_id(std::string const &id);

    // Renames a torrent whose id is pinned. Fails when another torrent already
    // owns `new_name`.
    bool rename(Torrent &torrent, std::string const &new_name);

    // Looks the torrent up in a client's status map: by id once pinned,
    // otherwise by name while the torrent is within its first-seen window.
    // A name match pins the id; a pinned torrent reported under another name
    // is renamed.
    std::optional<ClientStatus> match(Torrent &torrent,
                                      StatusMap const &statuses,
                                      std::int64_t now);

    // Merges a media manager queue into the registry. New items become
    // Queued torrents; known ones gain the manager association. Returns true
    // when anything changed.
    bool apply_queue_updates(std::string const &manager_kind,
                             std::vector<QueueItem> const &items,
                             std::int64_t now);

    std::vector<Torrent> &torrents() noexcept
    {
        return torrents_;
    }
    std::vector<Torrent> const &torrents() const noexcept
    {
        return torrents_;
    }
    std::size_t size() const noexcept
    {
        return torrents_.size();
    }

    std::filesystem::path const &snapshot_path() const noexcept
    {
        return snapshot_path_;
    }
    // Rewrites the whole snapshot atomically.
    bool save() const;
    bool load();

    std::string to_json() const;
    bool from_json(std::string_view payload);

  private:
    std::filesystem::path snapshot_path_;
    std::chrono::seconds first_seen_window_;
    std::vector<Torrent> torrents_;
};

yyjson_mut_val *torrent_to_json(yyjson_mut_doc *doc, Torrent const &torrent);
std::optional<Torrent> torrent_from_json(yyjson_val *value);

} // namespace tb::engine
