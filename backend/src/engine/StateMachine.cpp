#include "engine/StateMachine.hpp"

#include <array>
#include <initializer_list>
#include <utility>

namespace tb::engine
{

namespace
{

using State = TorrentState;

struct StateName
{
    State state;
    std::string_view name;
};

constexpr std::array<StateName, 10> kStateNames = {{
    {State::Queued, "QUEUED"},
    {State::LocalDownloading, "LOCAL_DOWNLOADING"},
    {State::LocalPaused, "LOCAL_PAUSED"},
    {State::LocalSeeding, "LOCAL_SEEDING"},
    {State::Copying, "COPYING"},
    {State::Copied, "COPIED"},
    {State::RemoteSeeding, "REMOTE_SEEDING"},
    {State::Error, "ERROR"},
    {State::Missing, "MISSING"},
    {State::Failed, "FAILED"},
}};

bool contains(std::initializer_list<State> states, State state) noexcept
{
    for (auto candidate : states)
    {
        if (candidate == state)
        {
            return true;
        }
    }
    return false;
}

bool is_known_client_state(std::string_view state) noexcept
{
    return state == "Seeding" || state == "Paused" || state == "Downloading" ||
           state == "Queued" || state == "Checking" ||
           state == "Allocating" || state == "Moving" || state == "Error";
}

} // namespace

bool is_absorbing(TorrentState state) noexcept
{
    return state == State::Missing || state == State::Failed;
}

bool is_transition_allowed(TorrentState from, TorrentState to) noexcept
{
    switch (from)
    {
    case State::Queued:
        return contains({State::LocalDownloading, State::LocalPaused,
                         State::LocalSeeding, State::Copied,
                         State::RemoteSeeding, State::Error, State::Missing},
                        to);
    case State::LocalDownloading:
    case State::LocalPaused:
        return contains({State::LocalDownloading, State::LocalPaused,
                         State::LocalSeeding, State::Copied,
                         State::RemoteSeeding, State::Error, State::Missing},
                        to);
    case State::LocalSeeding:
        return contains({State::LocalDownloading, State::LocalPaused,
                         State::Copying, State::Copied, State::RemoteSeeding,
                         State::Error, State::Missing},
                        to);
    case State::Copying:
        return contains({State::LocalSeeding, State::Copied, State::Error,
                         State::Missing},
                        to);
    case State::Copied:
        return contains({State::LocalSeeding, State::RemoteSeeding,
                         State::Error, State::Missing},
                        to);
    case State::RemoteSeeding:
        return contains({State::LocalSeeding, State::Copied, State::Missing},
                        to);
    case State::Error:
        return contains({State::LocalDownloading, State::LocalPaused,
                         State::LocalSeeding, State::Copying, State::Copied,
                         State::RemoteSeeding, State::Failed, State::Missing},
                        to);
    case State::Missing:
    case State::Failed:
        return false;
    }
    return false;
}

Transition apply_transition(Torrent &torrent, TorrentState to)
{
    Transition transition;
    transition.from = torrent.state;
    transition.to = to;
    if (torrent.state == to)
    {
        return transition;
    }
    if (!is_transition_allowed(torrent.state, to))
    {
        transition.rejected = true;
        return transition;
    }
    torrent.state = to;
    transition.changed = true;
    transition.persist = PersistEffect::SaveSnapshot;
    return transition;
}

Transition reset_torrent(Torrent &torrent)
{
    Transition transition;
    transition.from = torrent.state;
    transition.to = State::Queued;
    transition.changed = torrent.state != State::Queued;
    torrent.state = State::Queued;
    torrent.retry_count = 0;
    torrent.next_retry_at = 0;
    torrent.not_found_attempts = 0;
    torrent.metadata_missing_cycles = 0;
    torrent.last_error.clear();
    transition.persist = PersistEffect::SaveSnapshot;
    return transition;
}

std::string_view to_string(TorrentState state) noexcept
{
    for (auto const &entry : kStateNames)
    {
        if (entry.state == state)
        {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

std::optional<TorrentState> state_from_string(std::string_view name) noexcept
{
    for (auto const &entry : kStateNames)
    {
        if (entry.name == name)
        {
            return entry.state;
        }
    }
    return std::nullopt;
}

std::optional<TorrentState>
local_state_for(std::string_view client_state) noexcept
{
    if (client_state == "Seeding")
    {
        return State::LocalSeeding;
    }
    if (client_state == "Paused")
    {
        return State::LocalPaused;
    }
    if (client_state == "Error")
    {
        return State::Error;
    }
    if (is_known_client_state(client_state))
    {
        return State::LocalDownloading;
    }
    return std::nullopt;
}

std::optional<TorrentState>
remote_state_for(std::string_view client_state) noexcept
{
    if (client_state == "Seeding")
    {
        return State::RemoteSeeding;
    }
    if (is_known_client_state(client_state))
    {
        return State::Copied;
    }
    return std::nullopt;
}

bool is_seeding(ClientStatus const &status) noexcept
{
    return status.state == "Seeding";
}

} // namespace tb::engine
