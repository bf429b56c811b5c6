#pragma once

#include "engine/Torrent.hpp"

#include <optional>
#include <string_view>

namespace tb::engine
{

enum class PersistEffect
{
    None,
    SaveSnapshot,
};

struct Transition
{
    TorrentState from = TorrentState::Queued;
    TorrentState to = TorrentState::Queued;
    bool changed = false;
    bool rejected = false;
    PersistEffect persist = PersistEffect::None;
};

// Pure lifecycle rules. Nothing here performs I/O; callers execute the
// returned persist effect.
bool is_transition_allowed(TorrentState from, TorrentState to) noexcept;
bool is_absorbing(TorrentState state) noexcept;

// Applies `to` when allowed. A rejected transition leaves the torrent
// untouched; assigning the current state is a no-op.
Transition apply_transition(Torrent &torrent, TorrentState to);

// Operator reset: any state back to Queued with the retry bookkeeping
// cleared. The only way out of Missing and Failed.
Transition reset_torrent(Torrent &torrent);

std::string_view to_string(TorrentState state) noexcept;
std::optional<TorrentState> state_from_string(std::string_view name) noexcept;

// Maps a download client's state string ("Seeding", "Paused", ...) onto the
// lifecycle from the local and the remote side respectively.
std::optional<TorrentState> local_state_for(std::string_view client_state) noexcept;
std::optional<TorrentState> remote_state_for(std::string_view client_state) noexcept;

bool is_seeding(ClientStatus const &status) noexcept;

} // namespace tb::engine
