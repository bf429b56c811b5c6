#include "engine/StateMachine.hpp"

#include <array>

#include <doctest/doctest.h>

using tb::engine::TorrentState;

namespace
{

constexpr std::array<TorrentState, 10> kAllStates = {
    TorrentState::Queued,       TorrentState::LocalDownloading,
    TorrentState::LocalPaused,  TorrentState::LocalSeeding,
    TorrentState::Copying,      TorrentState::Copied,
    TorrentState::RemoteSeeding, TorrentState::Error,
    TorrentState::Missing,      TorrentState::Failed,
};

} // namespace

TEST_CASE("absorbing states allow no outgoing transitions")
{
    for (auto absorbing : {TorrentState::Missing, TorrentState::Failed})
    {
        CHECK(tb::engine::is_absorbing(absorbing));
        for (auto target : kAllStates)
        {
            CHECK_FALSE(tb::engine::is_transition_allowed(absorbing, target));
        }
    }
    CHECK_FALSE(tb::engine::is_absorbing(TorrentState::Error));
}

TEST_CASE("only an errored torrent can fail permanently")
{
    for (auto from : kAllStates)
    {
        CHECK(tb::engine::is_transition_allowed(from, TorrentState::Failed) ==
              (from == TorrentState::Error));
    }
}

TEST_CASE("copying is entered only from local seeding or a retry")
{
    for (auto from : kAllStates)
    {
        bool expected = from == TorrentState::LocalSeeding ||
                        from == TorrentState::Error;
        CHECK(tb::engine::is_transition_allowed(from, TorrentState::Copying) ==
              expected);
    }
    CHECK(tb::engine::is_transition_allowed(TorrentState::Copying,
                                            TorrentState::Copied));
    CHECK(tb::engine::is_transition_allowed(TorrentState::Copying,
                                            TorrentState::Error));
    CHECK_FALSE(tb::engine::is_transition_allowed(TorrentState::Copying,
                                                  TorrentState::Queued));
    CHECK(tb::engine::is_transition_allowed(TorrentState::RemoteSeeding,
                                            TorrentState::LocalSeeding));
    CHECK_FALSE(tb::engine::is_transition_allowed(TorrentState::RemoteSeeding,
                                                  TorrentState::Error));
}

TEST_CASE("apply_transition reports changes, no-ops and rejections")
{
    tb::engine::Torrent torrent;
    torrent.name = "Movie";

    auto first = tb::engine::apply_transition(torrent, TorrentState::LocalSeeding);
    CHECK(first.changed);
    CHECK_FALSE(first.rejected);
    CHECK(first.persist == tb::engine::PersistEffect::SaveSnapshot);
    CHECK(torrent.state == TorrentState::LocalSeeding);

    auto repeat = tb::engine::apply_transition(torrent, TorrentState::LocalSeeding);
    CHECK_FALSE(repeat.changed);
    CHECK_FALSE(repeat.rejected);
    CHECK(repeat.persist == tb::engine::PersistEffect::None);

    auto rejected = tb::engine::apply_transition(torrent, TorrentState::Failed);
    CHECK(rejected.rejected);
    CHECK(rejected.persist == tb::engine::PersistEffect::None);
    CHECK(torrent.state == TorrentState::LocalSeeding);
}

TEST_CASE("reset_torrent returns any state to queued")
{
    tb::engine::Torrent torrent;
    torrent.state = TorrentState::Failed;
    torrent.retry_count = 4;
    torrent.next_retry_at = 99;
    torrent.not_found_attempts = 3;
    torrent.metadata_missing_cycles = 7;
    torrent.last_error = "boom";

    auto transition = tb::engine::reset_torrent(torrent);
    CHECK(transition.changed);
    CHECK(transition.from == TorrentState::Failed);
    CHECK(transition.persist == tb::engine::PersistEffect::SaveSnapshot);
    CHECK(torrent.state == TorrentState::Queued);
    CHECK(torrent.retry_count == 0);
    CHECK(torrent.next_retry_at == 0);
    CHECK(torrent.not_found_attempts == 0);
    CHECK(torrent.metadata_missing_cycles == 0);
    CHECK(torrent.last_error.empty());
}

TEST_CASE("state names round-trip through the snapshot spelling")
{
    CHECK(tb::engine::to_string(TorrentState::LocalSeeding) == "LOCAL_SEEDING");
    CHECK(tb::engine::to_string(TorrentState::RemoteSeeding) == "REMOTE_SEEDING");
    for (auto state : kAllStates)
    {
        auto parsed =
            tb::engine::state_from_string(tb::engine::to_string(state));
        REQUIRE(parsed);
        CHECK(*parsed == state);
    }
    CHECK_FALSE(tb::engine::state_from_string("SEEDING_SOMEWHERE"));
}

TEST_CASE("client states map onto the local and remote sides")
{
    using tb::engine::local_state_for;
    using tb::engine::remote_state_for;

    CHECK(local_state_for("Seeding") == TorrentState::LocalSeeding);
    CHECK(local_state_for("Paused") == TorrentState::LocalPaused);
    CHECK(local_state_for("Downloading") == TorrentState::LocalDownloading);
    CHECK(local_state_for("Checking") == TorrentState::LocalDownloading);
    CHECK(local_state_for("Error") == TorrentState::Error);
    CHECK_FALSE(local_state_for("Exploded"));

    CHECK(remote_state_for("Seeding") == TorrentState::RemoteSeeding);
    CHECK(remote_state_for("Downloading") == TorrentState::Copied);
    CHECK(remote_state_for("Paused") == TorrentState::Copied);
    CHECK_FALSE(remote_state_for(""));

    tb::engine::ClientStatus status;
    status.state = "Seeding";
    CHECK(tb::engine::is_seeding(status));
    status.state = "Paused";
    CHECK_FALSE(tb::engine::is_seeding(status));
}
