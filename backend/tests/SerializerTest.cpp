#include "rpc/Serializer.hpp"
#include "RpcTestUtils.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>
#include <yyjson.h>

using namespace tb::tests;

TEST_CASE("serialize_error carries the message under arguments")
{
    ResponseView view(tb::rpc::serialize_error("transfer not found"));
    CHECK(view.result() == "error");
    expect_argument(view, "message", "transfer not found");

    ResponseView success(tb::rpc::serialize_success());
    CHECK(success.result() == "success");
    REQUIRE(success.arguments() != nullptr);
    CHECK(yyjson_obj_size(success.arguments()) == 0);

    ResponseView message(tb::rpc::serialize_message("torrent reset"));
    CHECK(message.result() == "success");
    expect_argument(message, "message", "torrent reset");
}

TEST_CASE("transfer records serialize missing optionals as null")
{
    tb::storage::TransferRecord record;
    record.id = "rec-1";
    record.torrent_name = "Movie";
    record.torrent_hash = "abc";
    record.source_client = "home";
    record.target_client = "seedbox";
    record.bytes_transferred = 42;
    record.status = "transferring";
    record.created_at = "2024-01-01T00:00:00Z";
    record.started_at = "2024-01-01T00:00:01Z";

    ResponseView view(tb::rpc::serialize_transfer(record));
    auto *transfer = view.argument("transfer");
    REQUIRE(transfer != nullptr);
    CHECK(to_view(yyjson_obj_get(transfer, "id")) == "rec-1");
    CHECK(to_view(yyjson_obj_get(transfer, "media_type")) == "unknown");
    CHECK(yyjson_get_sint(yyjson_obj_get(transfer, "bytes_transferred")) == 42);
    CHECK(yyjson_is_null(yyjson_obj_get(transfer, "connection_name")));
    CHECK(yyjson_is_null(yyjson_obj_get(transfer, "size_bytes")));
    CHECK(yyjson_is_null(yyjson_obj_get(transfer, "completed_at")));
    CHECK(to_view(yyjson_obj_get(transfer, "started_at")) ==
          "2024-01-01T00:00:01Z");
}

TEST_CASE("transfer pages report the page count")
{
    tb::storage::TransferPage page;
    page.total = 51;
    page.records.resize(25);
    ResponseView view(tb::rpc::serialize_transfer_page(page, 3, 25));
    CHECK(int_argument(view, "total") == 51);
    CHECK(int_argument(view, "page") == 3);
    CHECK(int_argument(view, "pages") == 3);
    CHECK(yyjson_arr_size(view.argument("transfers")) == 25);

    tb::storage::TransferPage empty;
    ResponseView empty_view(tb::rpc::serialize_transfer_page(empty, 1, 25));
    CHECK(int_argument(empty_view, "pages") == 0);
}

TEST_CASE("stats and history settings serialize their fields")
{
    tb::engine::TransferStats stats;
    stats.total = 3;
    stats.completed = 2;
    stats.failed = 1;
    stats.success_rate = 66.7;
    stats.total_bytes_transferred = 8192;
    ResponseView view(tb::rpc::serialize_transfer_stats(stats));
    CHECK(int_argument(view, "completed") == 2);
    CHECK(int_argument(view, "total_bytes_transferred") == 8192);
    CHECK(yyjson_get_real(view.argument("success_rate")) == doctest::Approx(66.7));

    tb::engine::HistorySettings history;
    history.retention_days = 7;
    history.track_progress = false;
    ResponseView settings(tb::rpc::serialize_history_config(history));
    expect_bool_argument(settings, "enabled", true);
    expect_bool_argument(settings, "track_progress", false);
    CHECK(int_argument(settings, "retention_days") == 7);
}

TEST_CASE("torrent listings use the snapshot state names")
{
    tb::engine::Torrent torrent;
    torrent.name = "Movie";
    torrent.id = "abc";
    torrent.state = tb::engine::TorrentState::RemoteSeeding;
    torrent.retry_count = 1;
    std::vector<tb::engine::Torrent> torrents{torrent};

    ResponseView view(tb::rpc::serialize_torrents(torrents));
    auto *first = yyjson_arr_get_first(view.argument("torrents"));
    REQUIRE(first != nullptr);
    CHECK(to_view(yyjson_obj_get(first, "name")) == "Movie");
    CHECK(to_view(yyjson_obj_get(first, "state")) == "REMOTE_SEEDING");
    CHECK(yyjson_is_null(yyjson_obj_get(first, "local_client_info")));
}

TEST_CASE("serialize_config never exposes secrets")
{
    tb::engine::BridgeConfig config;
    config.rpc_token = "hidden-token";
    tb::engine::DownloadClientConfig client;
    client.name = "home";
    client.password = "hidden-password";
    config.download_clients.push_back(client);

    auto payload = tb::rpc::serialize_config(config);
    CHECK(payload.find("hidden") == std::string::npos);
    ResponseView view(payload);
    CHECK(view.result() == "success");
    auto *clients = view.argument("download_clients");
    REQUIRE(clients != nullptr);
    CHECK(yyjson_obj_get(clients, "home") != nullptr);
}
