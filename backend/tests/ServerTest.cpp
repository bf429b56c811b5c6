#include "RpcTestUtils.hpp"
#include "rpc/Server.hpp"

#include <mongoose.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <doctest/doctest.h>

namespace
{

using namespace tb::tests;

struct HttpTestContext
{
    std::string request;
    std::string response;
    int status_code = 0;
    bool request_sent = false;
    bool done = false;
    bool failed = false;
};

void http_client_handler(struct mg_connection *conn, int ev, void *ev_data)
{
    auto *ctx = static_cast<HttpTestContext *>(conn->fn_data);
    if (ctx == nullptr)
    {
        return;
    }
    if (ev == MG_EV_CONNECT && !ctx->request_sent)
    {
        mg_send(conn, ctx->request.c_str(), ctx->request.size());
        ctx->request_sent = true;
    }
    else if (ev == MG_EV_HTTP_MSG)
    {
        auto *hm = static_cast<struct mg_http_message *>(ev_data);
        ctx->response.assign(hm->body.buf, hm->body.len);
        ctx->status_code = mg_http_status(hm);
        ctx->done = true;
        conn->is_closing = 1;
    }
    else if (ev == MG_EV_ERROR)
    {
        ctx->failed = true;
    }
    else if (ev == MG_EV_CLOSE && !ctx->done)
    {
        ctx->failed = true;
    }
}

struct HttpResponse
{
    int status_code = 0;
    std::string body;
};

HttpResponse send_request(std::uint16_t port, std::string_view method,
                          std::string_view path, std::string_view payload,
                          std::string const &extra_headers = {})
{
    auto host = std::string("127.0.0.1:") + std::to_string(port);
    HttpTestContext context;
    context.request = std::string(method) + " " + std::string(path) +
                      " HTTP/1.1\r\nHost: " + host +
                      "\r\nContent-Type: application/json\r\nContent-Length: " +
                      std::to_string(payload.size()) + "\r\n" + extra_headers +
                      "Connection: close\r\n\r\n" + std::string(payload);

    mg_mgr mgr;
    mg_mgr_init(&mgr);
    auto url = "http://" + host;
    auto *conn = mg_http_connect(&mgr, url.c_str(), http_client_handler, &context);
    if (conn == nullptr)
    {
        mg_mgr_free(&mgr);
        throw std::runtime_error("failed to connect to RPC endpoint");
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!context.done && !context.failed &&
           std::chrono::steady_clock::now() < deadline)
    {
        mg_mgr_poll(&mgr, 50);
    }
    mg_mgr_free(&mgr);
    if (!context.done)
    {
        throw std::runtime_error("RPC request did not complete");
    }
    return {context.status_code, std::move(context.response)};
}

struct ServerGuard
{
    explicit ServerGuard(tb::rpc::Server &srv) : server(srv)
    {
    }
    ~ServerGuard()
    {
        server.stop();
    }
    tb::rpc::Server &server;
};

} // namespace

TEST_CASE("rpc endpoint routes POST requests to the dispatcher")
{
    tb::rpc::Server server(nullptr, nullptr, nullptr, "http://127.0.0.1:0");
    REQUIRE(server.start());
    ServerGuard guard(server);
    REQUIRE(server.port() != 0);

    auto unsupported =
        send_request(server.port(), "POST", "/rpc", R"({"method":"nope"})");
    CHECK(unsupported.status_code == 200);
    ResponseView view(unsupported.body);
    CHECK(view.result() == "error");
    expect_argument(view, "message", "unsupported method");

    auto disabled = send_request(server.port(), "POST", "/rpc",
                                 R"({"method":"transfer-stats"})");
    ResponseView disabled_view(disabled.body);
    expect_argument(disabled_view, "message", "transfer history disabled");

    CHECK(send_request(server.port(), "GET", "/rpc", "").status_code == 405);
    CHECK(send_request(server.port(), "POST", "/other", "{}").status_code == 404);
}

TEST_CASE("rpc endpoint serves the history store")
{
    auto root = std::filesystem::temp_directory_path() / "tbtest" / "server-history";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);

    tb::engine::TransferHistoryStore store(root / "history.db");
    store.start();
    tb::engine::Torrent torrent;
    torrent.name = "Movie";
    torrent.id = "abc";
    REQUIRE(store.create_transfer(torrent, "home", "seedbox"));

    {
        tb::rpc::Server server(&store, nullptr, nullptr, "http://127.0.0.1:0");
        REQUIRE(server.start());
        ServerGuard guard(server);
        auto response = send_request(server.port(), "POST", "/rpc",
                                     R"({"method":"transfer-list"})");
        CHECK(response.status_code == 200);
        ResponseView view(response.body);
        CHECK(view.result() == "success");
        CHECK(int_argument(view, "total") == 1);
    }
    store.stop();
}

TEST_CASE("rpc endpoint enforces token authentication when configured")
{
    tb::rpc::ServerOptions options;
    options.token = "rpc-secret";
    tb::rpc::Server server(nullptr, nullptr, nullptr, "http://127.0.0.1:0",
                           options);
    REQUIRE(server.start());
    ServerGuard guard(server);

    auto rejected = send_request(server.port(), "POST", "/rpc",
                                 R"({"method":"torrent-get"})");
    CHECK(rejected.status_code == 401);

    auto wrong = send_request(server.port(), "POST", "/rpc",
                              R"({"method":"torrent-get"})",
                              "X-TB-Auth: guess\r\n");
    CHECK(wrong.status_code == 401);

    auto accepted = send_request(server.port(), "POST", "/rpc",
                                 R"({"method":"torrent-get"})",
                                 "X-TB-Auth: rpc-secret\r\n");
    CHECK(accepted.status_code == 200);
    ResponseView view(accepted.body);
    expect_argument(view, "message", "orchestrator unavailable");
}
