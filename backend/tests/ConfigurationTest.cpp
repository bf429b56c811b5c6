#include "engine/ConfigurationService.hpp"
#include "utils/FS.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include <doctest/doctest.h>

namespace
{

std::filesystem::path make_temp_root(std::string_view tag)
{
    auto root = std::filesystem::temp_directory_path() / "tbtest" / tag;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

constexpr char const *kFullConfig = R"({
  "state_dir": "/var/lib/torrentbridge",
  "log_level": "debug",
  "rpc_token": "s3cret",
  "poll_interval_seconds": 0,
  "media_managers": [
    {"type": "radarr", "api_key": "radarr-key"},
    {"type": "sonarr", "host": "tv.lan", "port": 9999, "api_key": "sonarr-key"}
  ],
  "download_clients": {
    "home": {"host": "10.0.0.2", "password": "deluge"},
    "seedbox": {"host": "seed.example", "port": 443, "use_tls": true,
                "password": "remote"}
  },
  "connections": [
    {
      "from": "home",
      "to": "seedbox",
      "transfer_config": {"type": "scp", "host": "seed.example", "user": "me"},
      "source_dot_torrent_path": "/deluge/state",
      "source_torrent_download_path": "/downloads",
      "destination_dot_torrent_tmp_dir": "/tmp/torrents",
      "destination_torrent_download_path": "/data"
    }
  ],
  "history": {"retention_days": 30, "track_progress": false},
  "retry": {"max_retries": 5, "base_backoff_seconds": 120,
            "max_backoff_seconds": 60}
})";

} // namespace

TEST_CASE("parse_config fills defaults for an empty object")
{
    auto result = tb::engine::parse_config("{}");
    REQUIRE_MESSAGE(result.config, result.error);
    auto const &config = *result.config;
    CHECK(config.state_file == "torrents_state.json");
    CHECK(config.log_level == "info");
    CHECK(config.rpc_bind == "http://127.0.0.1:10445");
    CHECK(config.rpc_path == "/rpc");
    CHECK_FALSE(config.rpc_token);
    CHECK(config.poll_interval_seconds == 5);
    CHECK(config.media_managers.empty());
    CHECK(config.download_clients.empty());
    CHECK(config.connections.empty());
    CHECK(config.history.enabled);
    CHECK(config.history.retention_days == 90);
    CHECK(config.retry.max_retries == 3);
    CHECK(config.matching.metadata_wait_cycles == 120);
}

TEST_CASE("parse_config reads every section")
{
    auto result = tb::engine::parse_config(kFullConfig);
    REQUIRE_MESSAGE(result.config, result.error);
    auto const &config = *result.config;
    CHECK(config.state_dir == std::filesystem::path("/var/lib/torrentbridge"));
    CHECK(config.log_level == "debug");
    REQUIRE(config.rpc_token);
    CHECK(*config.rpc_token == "s3cret");
    CHECK(config.poll_interval_seconds == 1);

    REQUIRE(config.media_managers.size() == 2);
    CHECK(config.media_managers[0].port == 7878);
    CHECK(config.media_managers[0].host == "127.0.0.1");
    CHECK(config.media_managers[1].host == "tv.lan");
    CHECK(config.media_managers[1].port == 9999);

    REQUIRE(config.download_clients.size() == 2);
    CHECK(config.download_clients[0].name == "home");
    CHECK(config.download_clients[0].port == 8112);
    CHECK(config.download_clients[1].name == "seedbox");
    CHECK(config.download_clients[1].use_tls);

    REQUIRE(config.connections.size() == 1);
    auto const &connection = config.connections[0];
    CHECK(connection.name == "home -> seedbox");
    CHECK(connection.transfer.type == "scp");
    CHECK(connection.transfer.port == 22);
    CHECK(connection.transfer.user == "me");
    CHECK(connection.destination_torrent_download_path == "/data");

    CHECK(config.history.enabled);
    CHECK(config.history.retention_days == 30);
    CHECK_FALSE(config.history.track_progress);
    CHECK(config.retry.max_retries == 5);
    CHECK(config.retry.base_backoff_seconds == 120);
    // The cap is never below the base delay.
    CHECK(config.retry.max_backoff_seconds == 120);
}

TEST_CASE("parse_config rejects invalid documents")
{
    CHECK(tb::engine::parse_config("{nope").error == "config is not valid JSON");
    CHECK(tb::engine::parse_config("[]").error == "config must be a JSON object");
    CHECK(tb::engine::parse_config(R"({"media_managers":[{"type":"lidarr"}]})")
              .error == "unknown media manager type 'lidarr'");
    CHECK(tb::engine::parse_config(
              R"({"download_clients":{"a":{"type":"transmission"}}})")
              .error == "unknown download client type 'transmission' for a");
    CHECK(tb::engine::parse_config(
              R"({"download_clients":{"a":{}},"connections":[{"from":"a","to":"b"}]})")
              .error == "connection 0 references unknown client 'b'");
    CHECK(tb::engine::parse_config(
              R"({"download_clients":{"a":{},"b":{}},
                  "connections":[{"from":"a","to":"b",
                                  "transfer_config":{"type":"scp"}}]})")
              .error == "scp transfer for a -> b requires a host");
    CHECK(tb::engine::parse_config(
              R"({"download_clients":{"a":{},"b":{}},
                  "connections":[{"name":"x","from":"a","to":"b",
                                  "transfer_config":{"type":"ftp"}}]})")
              .error == "unknown transfer type 'ftp' for x");
}

TEST_CASE("load_config reports unreadable files with their path")
{
    auto root = make_temp_root("config-load");
    auto missing = tb::engine::load_config(root / "absent.json");
    CHECK_FALSE(missing.config);
    CHECK(missing.error.find("absent.json") != std::string::npos);

    auto broken_path = root / "broken.json";
    REQUIRE(tb::utils::write_file_atomic(broken_path, "[1,2]"));
    auto broken = tb::engine::load_config(broken_path);
    CHECK_FALSE(broken.config);
    CHECK(broken.error == broken_path.string() + ": config must be a JSON object");
}

TEST_CASE("config_to_json omits secrets unless asked")
{
    auto parsed = tb::engine::parse_config(kFullConfig);
    REQUIRE(parsed.config);

    auto redacted = tb::engine::config_to_json(*parsed.config, false);
    CHECK(redacted.find("s3cret") == std::string::npos);
    CHECK(redacted.find("radarr-key") == std::string::npos);
    CHECK(redacted.find("remote") == std::string::npos);
    CHECK(redacted.find("seed.example") != std::string::npos);

    auto full = tb::engine::config_to_json(*parsed.config, true);
    CHECK(full.find("s3cret") != std::string::npos);
    CHECK(full.find("sonarr-key") != std::string::npos);

    auto reparsed = tb::engine::parse_config(full);
    REQUIRE_MESSAGE(reparsed.config, reparsed.error);
    CHECK(reparsed.config->connections.size() == 1);
    CHECK(reparsed.config->download_clients[1].password == "remote");
    CHECK(reparsed.config->history.retention_days == 30);
}

TEST_CASE("ConfigurationService persists history changes")
{
    auto root = make_temp_root("config-persist");
    auto path = root / "config.json";
    auto parsed = tb::engine::parse_config(kFullConfig);
    REQUIRE(parsed.config);

    tb::engine::ConfigurationService service(path, *parsed.config);
    CHECK_FALSE(service.is_dirty());
    CHECK(service.persist_if_dirty());
    CHECK_FALSE(std::filesystem::exists(path));

    service.set_history(std::nullopt, 30, false);
    CHECK_FALSE(service.is_dirty());

    service.set_history(false, 7, std::nullopt);
    CHECK(service.is_dirty());
    CHECK_FALSE(service.history().enabled);
    CHECK(service.history().retention_days == 7);
    CHECK_FALSE(service.history().track_progress);

    REQUIRE(service.persist_if_dirty());
    CHECK_FALSE(service.is_dirty());

    auto reloaded = tb::engine::load_config(path);
    REQUIRE_MESSAGE(reloaded.config, reloaded.error);
    CHECK_FALSE(reloaded.config->history.enabled);
    CHECK(reloaded.config->history.retention_days == 7);
    REQUIRE(reloaded.config->rpc_token);
    CHECK(*reloaded.config->rpc_token == "s3cret");
    CHECK(reloaded.config->media_managers[1].api_key == "sonarr-key");
}

TEST_CASE("ConfigurationService without a path cannot persist")
{
    tb::engine::ConfigurationService service({}, tb::engine::BridgeConfig{});
    service.set_history(std::nullopt, 1, std::nullopt);
    CHECK(service.is_dirty());
    CHECK_FALSE(service.persist_now());
    CHECK(service.is_dirty());
}
