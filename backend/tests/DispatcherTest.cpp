#include "RpcTestUtils.hpp"

#include "utils/Shutdown.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include <doctest/doctest.h>

using tb::tests::ResponseView;
using tb::tests::dispatch_sync;
using tb::tests::int_argument;

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

tb::engine::Torrent make_torrent(std::string name, std::string id)
{
    tb::engine::Torrent torrent;
    torrent.name = std::move(name);
    torrent.id = std::move(id);
    torrent.size_bytes = 1000;
    return torrent;
}

std::string error_message(std::string const &payload)
{
    ResponseView view(payload);
    tb::tests::expect_result(view, "error", "error response");
    return std::string(tb::tests::to_view(view.argument("message")));
}

struct HistoryFixture
{
    explicit HistoryFixture(std::string_view tag)
        : root(make_temp_root(tag)), store(root / "history.db"),
          dispatcher(&store, nullptr, nullptr)
    {
    }

    std::string add(std::string name, std::string status)
    {
        auto id = store.create_transfer(make_torrent(name, name + "-hash"),
                                        "home", "seedbox", "home -> seedbox");
        REQUIRE(id);
        if (status == "pending")
        {
            return *id;
        }
        REQUIRE(store.start_transfer(*id));
        if (status == "completed")
        {
            REQUIRE(store.complete_transfer(*id));
        }
        else if (status == "failed")
        {
            REQUIRE(store.fail_transfer(*id, "boom"));
        }
        return *id;
    }

    std::filesystem::path root;
    tb::engine::TransferHistoryStore store;
    tb::rpc::Dispatcher dispatcher;
};

} // namespace

TEST_CASE("dispatcher rejects malformed requests")
{
    tb::rpc::Dispatcher dispatcher(nullptr, nullptr, nullptr);
    CHECK(error_message(dispatch_sync(dispatcher, "")) == "empty RPC payload");
    CHECK(error_message(dispatch_sync(dispatcher, "{")) == "invalid JSON");
    CHECK(error_message(dispatch_sync(dispatcher, "[1]")) ==
          "expected JSON object");
    CHECK(error_message(dispatch_sync(dispatcher, R"({"method":7})")) ==
          "missing method");
    CHECK(error_message(dispatch_sync(dispatcher, R"({"method":"session-get"})")) ==
          "unsupported method");
}

TEST_CASE("dispatcher reports missing services")
{
    tb::rpc::Dispatcher dispatcher(nullptr, nullptr, nullptr);
    CHECK(error_message(dispatch_sync(dispatcher, R"({"method":"transfer-list"})")) ==
          "transfer history disabled");
    CHECK(error_message(dispatch_sync(dispatcher, R"({"method":"transfer-stats"})")) ==
          "transfer history disabled");
    CHECK(error_message(dispatch_sync(dispatcher, R"({"method":"torrent-get"})")) ==
          "orchestrator unavailable");
    CHECK(error_message(dispatch_sync(
              dispatcher,
              R"({"method":"torrent-reset","arguments":{"name":"x"}})")) ==
          "orchestrator unavailable");
    CHECK(error_message(dispatch_sync(dispatcher, R"({"method":"config-get"})")) ==
          "configuration unavailable");
}

TEST_CASE("transfer-list pages, filters and validates its arguments")
{
    HistoryFixture fixture("dispatcher-list");
    for (int i = 0; i < 3; ++i)
    {
        fixture.add("Movie." + std::to_string(i), "completed");
    }
    fixture.add("Show.S01", "failed");

    auto response = dispatch_sync(
        fixture.dispatcher,
        R"({"method":"transfer-list","arguments":{"per_page":2,"page":2}})");
    ResponseView view(response);
    tb::tests::expect_result(view, "success", "transfer-list");
    CHECK(int_argument(view, "total") == 4);
    CHECK(int_argument(view, "page") == 2);
    CHECK(int_argument(view, "per_page") == 2);
    CHECK(int_argument(view, "pages") == 2);
    auto *transfers = view.argument("transfers");
    REQUIRE(yyjson_is_arr(transfers));
    CHECK(yyjson_arr_size(transfers) == 2);

    auto filtered = dispatch_sync(
        fixture.dispatcher,
        R"({"method":"transfer-list","arguments":{"status":"failed"}})");
    ResponseView filtered_view(filtered);
    CHECK(int_argument(filtered_view, "total") == 1);
    auto *first = yyjson_arr_get_first(filtered_view.argument("transfers"));
    REQUIRE(first != nullptr);
    CHECK(tb::tests::to_view(yyjson_obj_get(first, "torrent_name")) == "Show.S01");
    CHECK(tb::tests::to_view(yyjson_obj_get(first, "error_message")) == "boom");
    CHECK_FALSE(yyjson_is_null(yyjson_obj_get(first, "completed_at")));

    auto searched = dispatch_sync(
        fixture.dispatcher,
        R"({"method":"transfer-list","arguments":{"search":"Movie"}})");
    CHECK(int_argument(ResponseView(searched), "total") == 3);

    auto capped = dispatch_sync(
        fixture.dispatcher,
        R"({"method":"transfer-list","arguments":{"per_page":1000}})");
    CHECK(int_argument(ResponseView(capped), "per_page") == tb::rpc::kMaxPerPage);

    CHECK(error_message(dispatch_sync(
              fixture.dispatcher,
              R"({"method":"transfer-list","arguments":{"page":0}})")) ==
          "invalid page");
    CHECK(error_message(dispatch_sync(
              fixture.dispatcher,
              R"({"method":"transfer-list","arguments":{"per_page":-5}})")) ==
          "invalid per_page");
}

TEST_CASE("transfer-get, transfer-active and transfer-stats")
{
    HistoryFixture fixture("dispatcher-get");
    auto done = fixture.add("Movie", "completed");
    fixture.add("Running", "transferring");

    auto response = dispatch_sync(
        fixture.dispatcher,
        R"({"method":"transfer-get","arguments":{"id":")" + done + R"("}})");
    ResponseView view(response);
    auto *transfer = view.argument("transfer");
    REQUIRE(transfer != nullptr);
    CHECK(tb::tests::to_view(yyjson_obj_get(transfer, "status")) == "completed");
    CHECK(tb::tests::to_view(yyjson_obj_get(transfer, "connection_name")) ==
          "home -> seedbox");

    CHECK(error_message(dispatch_sync(
              fixture.dispatcher, R"({"method":"transfer-get","arguments":{}})")) ==
          "id required");
    CHECK(error_message(dispatch_sync(
              fixture.dispatcher,
              R"({"method":"transfer-get","arguments":{"id":"nope"}})")) ==
          "transfer not found");

    auto active = dispatch_sync(fixture.dispatcher, R"({"method":"transfer-active"})");
    ResponseView active_view(active);
    REQUIRE(yyjson_is_arr(active_view.argument("transfers")));
    CHECK(yyjson_arr_size(active_view.argument("transfers")) == 1);

    auto stats = dispatch_sync(fixture.dispatcher, R"({"method":"transfer-stats"})");
    ResponseView stats_view(stats);
    CHECK(int_argument(stats_view, "total") == 2);
    CHECK(int_argument(stats_view, "completed") == 1);
    CHECK(int_argument(stats_view, "transferring") == 1);
    CHECK(int_argument(stats_view, "total_bytes_transferred") == 1000);
}

TEST_CASE("transfer-delete and transfer-cancel respect active records")
{
    HistoryFixture fixture("dispatcher-delete");
    auto active = fixture.add("Running", "transferring");
    auto finished = fixture.add("Done", "completed");

    auto request = [](char const *method, std::string const &id,
                      char const *extra = "")
    {
        return std::string(R"({"method":")") + method +
               R"(","arguments":{"id":")" + id + "\"" + extra + "}}";
    };

    CHECK(error_message(dispatch_sync(fixture.dispatcher,
                                      request("transfer-delete", active))) ==
          "transfer is still active");
    CHECK(error_message(dispatch_sync(fixture.dispatcher,
                                      request("transfer-cancel", finished))) ==
          "transfer is not active");
    CHECK(error_message(dispatch_sync(fixture.dispatcher,
                                      request("transfer-cancel", "ghost"))) ==
          "transfer not found");

    ResponseView cancelled(
        dispatch_sync(fixture.dispatcher, request("transfer-cancel", active)));
    tb::tests::expect_result(cancelled, "success", "transfer-cancel");
    auto record = fixture.store.get_transfer(active);
    REQUIRE(record);
    CHECK(record->status == "cancelled");

    ResponseView deleted(
        dispatch_sync(fixture.dispatcher, request("transfer-delete", finished)));
    CHECK(int_argument(deleted, "deleted") == 1);
    CHECK_FALSE(fixture.store.get_transfer(finished));

    auto pending = fixture.add("Waiting", "pending");
    ResponseView forced(dispatch_sync(
        fixture.dispatcher,
        request("transfer-delete", pending, R"(,"force":true)")));
    CHECK(int_argument(forced, "deleted") == 1);
}

TEST_CASE("transfer-clear and transfer-prune remove finished records")
{
    HistoryFixture fixture("dispatcher-clear");
    fixture.add("A", "completed");
    fixture.add("B", "failed");
    fixture.add("C", "failed");
    fixture.add("D", "transferring");

    CHECK(error_message(dispatch_sync(
              fixture.dispatcher,
              R"({"method":"transfer-clear","arguments":{"status":"pending"}})")) ==
          "active transfers cannot be cleared");

    ResponseView cleared(dispatch_sync(
        fixture.dispatcher,
        R"({"method":"transfer-clear","arguments":{"status":"failed"}})"));
    CHECK(int_argument(cleared, "deleted") == 2);

    CHECK(error_message(dispatch_sync(
              fixture.dispatcher,
              R"({"method":"transfer-prune","arguments":{"retention_days":-1}})")) ==
          "invalid retention_days");
    CHECK(error_message(dispatch_sync(fixture.dispatcher,
                                      R"({"method":"transfer-prune"})")) ==
          "retention_days required");

    ResponseView pruned(dispatch_sync(
        fixture.dispatcher,
        R"({"method":"transfer-prune","arguments":{"retention_days":0}})"));
    CHECK(int_argument(pruned, "deleted") == 1);
    CHECK(fixture.store.get_stats().total == 1);
}

TEST_CASE("torrent commands complete through the response poster")
{
    tb::engine::TorrentRegistry registry;
    tb::engine::TransferOrchestrator orchestrator(registry, nullptr, {});
    REQUIRE(registry.add(make_torrent("Movie", "abc")) != nullptr);
    REQUIRE(registry.add(make_torrent("Show", "def")) != nullptr);
    orchestrator.run_cycle();

    std::vector<std::function<void()>> posted;
    tb::rpc::Dispatcher dispatcher(
        nullptr, &orchestrator, nullptr,
        [&posted](std::function<void()> task) { posted.push_back(std::move(task)); });

    auto listing = dispatch_sync(dispatcher, R"({"method":"torrent-get"})");
    ResponseView listing_view(listing);
    auto *torrents = listing_view.argument("torrents");
    REQUIRE(yyjson_is_arr(torrents));
    CHECK(yyjson_arr_size(torrents) == 2);

    CHECK(error_message(dispatch_sync(
              dispatcher, R"({"method":"torrent-remove","arguments":{}})")) ==
          "name required");

    std::vector<std::string> responses;
    auto collect = [&responses](std::string body)
    { responses.push_back(std::move(body)); };
    dispatcher.dispatch(R"({"method":"torrent-reset","arguments":{"name":"Movie"}})",
                        collect);
    dispatcher.dispatch(R"({"method":"torrent-remove","arguments":{"name":"Show"}})",
                        collect);
    dispatcher.dispatch(R"({"method":"torrent-remove","arguments":{"name":"Nope"}})",
                        collect);
    CHECK(responses.empty());
    CHECK(posted.empty());

    orchestrator.run_cycle();
    REQUIRE(posted.size() == 3);
    CHECK(responses.empty());
    for (auto &task : posted)
    {
        task();
    }
    REQUIRE(responses.size() == 3);

    ResponseView reset(responses[0]);
    tb::tests::expect_result(reset, "success", "torrent-reset");
    tb::tests::expect_argument(reset, "message", "torrent reset");
    ResponseView removed(responses[1]);
    tb::tests::expect_argument(removed, "message", "torrent removed");
    CHECK(error_message(responses[2]) == "torrent not found");

    ResponseView after(dispatch_sync(dispatcher, R"({"method":"torrent-get"})"));
    CHECK(yyjson_arr_size(after.argument("torrents")) == 1);
}

TEST_CASE("config-get hides secrets and history-config-set persists")
{
    auto root = make_temp_root("dispatcher-config");
    auto parsed = tb::engine::parse_config(R"({
        "rpc_token": "tok3n",
        "download_clients": {"home": {"password": "pa55"}}
    })");
    REQUIRE(parsed.config);
    tb::engine::ConfigurationService config(root / "config.json", *parsed.config);
    tb::engine::TorrentRegistry registry;
    tb::engine::TransferOrchestrator orchestrator(registry, nullptr, {});
    tb::rpc::Dispatcher dispatcher(nullptr, &orchestrator, &config);

    auto shown = dispatch_sync(dispatcher, R"({"method":"config-get"})");
    CHECK(shown.find("tok3n") == std::string::npos);
    CHECK(shown.find("pa55") == std::string::npos);
    ResponseView shown_view(shown);
    tb::tests::expect_result(shown_view, "success", "config-get");
    CHECK(shown_view.argument("download_clients") != nullptr);

    CHECK(error_message(dispatch_sync(dispatcher,
                                      R"({"method":"history-config-set"})")) ==
          "arguments required");
    CHECK(error_message(dispatch_sync(
              dispatcher,
              R"({"method":"history-config-set","arguments":{"retention_days":"soon"}})")) ==
          "invalid retention_days");

    ResponseView updated(dispatch_sync(
        dispatcher,
        R"({"method":"history-config-set","arguments":{"retention_days":14,"track_progress":false}})"));
    tb::tests::expect_result(updated, "success", "history-config-set");
    CHECK(int_argument(updated, "retention_days") == 14);
    tb::tests::expect_bool_argument(updated, "enabled", true);
    tb::tests::expect_bool_argument(updated, "track_progress", false);
    CHECK_FALSE(config.is_dirty());

    auto reloaded = tb::engine::load_config(root / "config.json");
    REQUIRE_MESSAGE(reloaded.config, reloaded.error);
    CHECK(reloaded.config->history.retention_days == 14);
    CHECK_FALSE(reloaded.config->history.track_progress);
}

TEST_CASE("app-shutdown requests a daemon shutdown")
{
    tb::rpc::Dispatcher dispatcher(nullptr, nullptr, nullptr);
    ResponseView view(dispatch_sync(dispatcher, R"({"method":"app-shutdown"})"));
    tb::tests::expect_result(view, "success", "app-shutdown");
    CHECK(tb::runtime::should_shutdown());
    tb::runtime::clear_shutdown_request();
}
