#include "engine/TorrentRegistry.hpp"
#include "utils/FS.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include <doctest/doctest.h>

namespace
{

constexpr std::int64_t kNow = 1700000000;

std::filesystem::path make_temp_root(std::string_view tag)
{
    auto root = std::filesystem::temp_directory_path() / "tbtest" / tag;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

tb::engine::Torrent make_torrent(std::string name, std::string id = {})
{
    tb::engine::Torrent torrent;
    torrent.name = std::move(name);
    torrent.id = std::move(id);
    torrent.first_seen_at = kNow;
    return torrent;
}

tb::engine::ClientStatus status_named(std::string name,
                                      std::string state = "Seeding")
{
    tb::engine::ClientStatus status;
    status.name = std::move(name);
    status.state = std::move(state);
    status.progress = 100.0;
    status.total_size = 1024;
    return status;
}

} // namespace

TEST_CASE("registry refuses duplicate names and ids")
{
    tb::engine::TorrentRegistry registry;
    REQUIRE(registry.add(make_torrent("Movie", "abc")) != nullptr);
    CHECK(registry.add(make_torrent("Movie", "def")) == nullptr);
    CHECK(registry.add(make_torrent("Other", "abc")) == nullptr);
    CHECK(registry.add(make_torrent("")) == nullptr);
    CHECK(registry.size() == 1);

    CHECK(registry.find_by_name("Movie") != nullptr);
    CHECK(registry.find_by_id("abc") != nullptr);
    CHECK(registry.find_by_id("") == nullptr);
    CHECK(registry.remove("Movie"));
    CHECK_FALSE(registry.remove("Movie"));
}

TEST_CASE("match pins the id on a name match inside the first-seen window")
{
    tb::engine::TorrentRegistry registry({}, std::chrono::seconds(3600));
    auto *torrent = registry.add(make_torrent("Movie"));
    REQUIRE(torrent != nullptr);

    tb::engine::StatusMap statuses;
    statuses.emplace("ABCDEF", status_named("Movie"));
    statuses.emplace("123456", status_named("Something Else"));

    auto matched = registry.match(*torrent, statuses, kNow + 60);
    REQUIRE(matched);
    CHECK(matched->name == "Movie");
    CHECK(torrent->id == "abcdef");
}

TEST_CASE("name matching stops once the first-seen window has passed")
{
    tb::engine::TorrentRegistry registry({}, std::chrono::seconds(3600));
    auto *torrent = registry.add(make_torrent("Movie"));
    REQUIRE(torrent != nullptr);

    tb::engine::StatusMap statuses;
    statuses.emplace("abcdef", status_named("Movie"));

    CHECK_FALSE(registry.match(*torrent, statuses, kNow + 3601));
    CHECK(torrent->id.empty());
}

TEST_CASE("a pinned torrent follows its id and picks up renames")
{
    tb::engine::TorrentRegistry registry;
    auto *torrent = registry.add(make_torrent("Movie", "abcdef"));
    REQUIRE(torrent != nullptr);
    REQUIRE(registry.add(make_torrent("Taken", "999")) != nullptr);
    torrent = registry.find_by_id("abcdef");
    REQUIRE(torrent != nullptr);

    tb::engine::StatusMap statuses;
    statuses.emplace("abcdef", status_named("Movie (2024)"));
    statuses.emplace("zzz", status_named("Movie"));

    auto matched = registry.match(*torrent, statuses, kNow + 10 * 3600);
    REQUIRE(matched);
    CHECK(torrent->name == "Movie (2024)");
    CHECK(registry.find_by_name("Movie (2024)") == torrent);

    // A rename onto a tracked name is refused.
    statuses.clear();
    statuses.emplace("abcdef", status_named("Taken"));
    REQUIRE(registry.match(*torrent, statuses, kNow));
    CHECK(torrent->name == "Movie (2024)");

    statuses.clear();
    CHECK_FALSE(registry.match(*torrent, statuses, kNow));
}

TEST_CASE("a name match never steals an id owned by another torrent")
{
    tb::engine::TorrentRegistry registry;
    REQUIRE(registry.add(make_torrent("Original", "abcdef")) != nullptr);
    auto *copy = registry.add(make_torrent("Movie"));
    REQUIRE(copy != nullptr);

    tb::engine::StatusMap statuses;
    statuses.emplace("abcdef", status_named("Movie"));
    CHECK_FALSE(registry.match(*copy, statuses, kNow));
    CHECK(copy->id.empty());
}

TEST_CASE("queue updates add new torrents and enrich known ones")
{
    tb::engine::TorrentRegistry registry;
    REQUIRE(registry.add(make_torrent("Known")) != nullptr);

    std::vector<tb::engine::QueueItem> items = {
        {"ABC123", "Known", 2048},
        {"DEF456", "Fresh", 4096},
    };
    CHECK(registry.apply_queue_updates("radarr", items, kNow));
    REQUIRE(registry.size() == 2);

    auto *known = registry.find_by_name("Known");
    REQUIRE(known != nullptr);
    CHECK(known->id == "abc123");
    CHECK(known->media_manager == "radarr");
    CHECK(known->size_bytes == 2048);

    auto *fresh = registry.find_by_id("def456");
    REQUIRE(fresh != nullptr);
    CHECK(fresh->name == "Fresh");
    CHECK(fresh->state == tb::engine::TorrentState::Queued);
    CHECK(fresh->first_seen_at == kNow);

    // The same queue a second time changes nothing.
    CHECK_FALSE(registry.apply_queue_updates("radarr", items, kNow + 5));
    CHECK(registry.size() == 2);
}

TEST_CASE("registry snapshot survives a save and load")
{
    auto root = make_temp_root("registry-snapshot");
    auto path = root / "torrents_state.json";
    {
        tb::engine::TorrentRegistry registry(path);
        auto torrent = make_torrent("Movie", "abcdef");
        torrent.state = tb::engine::TorrentState::Error;
        torrent.retry_count = 2;
        torrent.next_retry_at = kNow + 120;
        torrent.home_client = "home";
        torrent.target_client = "seedbox";
        torrent.connection = "home -> seedbox";
        torrent.media_manager = "sonarr";
        torrent.size_bytes = 1234;
        torrent.last_error = "Failed to transfer Movie: timeout";
        auto local = status_named("Movie");
        local.files.push_back({"Movie/movie.mkv", 1234});
        torrent.local_client_info = local;
        REQUIRE(registry.add(std::move(torrent)) != nullptr);
        REQUIRE(registry.add(make_torrent("Queued")) != nullptr);
        REQUIRE(registry.save());
    }
    CHECK(std::filesystem::exists(path));
    CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    tb::engine::TorrentRegistry loaded(path);
    REQUIRE(loaded.load());
    REQUIRE(loaded.size() == 2);
    auto *torrent = loaded.find_by_id("abcdef");
    REQUIRE(torrent != nullptr);
    CHECK(torrent->name == "Movie");
    CHECK(torrent->state == tb::engine::TorrentState::Error);
    CHECK(torrent->retry_count == 2);
    CHECK(torrent->next_retry_at == kNow + 120);
    CHECK(torrent->connection == "home -> seedbox");
    CHECK(torrent->media_manager == "sonarr");
    CHECK(torrent->size_bytes == 1234);
    CHECK(torrent->last_error == "Failed to transfer Movie: timeout");
    REQUIRE(torrent->local_client_info);
    REQUIRE(torrent->local_client_info->files.size() == 1);
    CHECK(torrent->local_client_info->files[0].path == "Movie/movie.mkv");
    CHECK_FALSE(torrent->remote_client_info);
}

TEST_CASE("registry load tolerates a missing file and rejects garbage")
{
    auto root = make_temp_root("registry-load");
    tb::engine::TorrentRegistry missing(root / "absent.json");
    CHECK(missing.load());
    CHECK(missing.size() == 0);

    auto garbage = root / "garbage.json";
    REQUIRE(tb::utils::write_file_atomic(garbage, "{not json"));
    tb::engine::TorrentRegistry broken(garbage);
    CHECK_FALSE(broken.load());

    tb::engine::TorrentRegistry partial;
    CHECK(partial.from_json(R"([{"name":"Good","state":"COPIED"},{"id":"x"}])"));
    REQUIRE(partial.size() == 1);
    CHECK(partial.torrents()[0].state == tb::engine::TorrentState::Copied);
}
