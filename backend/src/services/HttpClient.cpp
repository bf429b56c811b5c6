#include "services/HttpClient.hpp"

#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <mongoose.h>

namespace tb::services
{

namespace
{

constexpr int kPollIntervalMs = 50;

struct Exchange
{
    HttpRequest const *request = nullptr;
    HttpResponse response;
    bool done = false;
};

void send_request(struct mg_connection *conn, HttpRequest const &request)
{
    auto const *url = request.url.c_str();
    auto host = mg_url_host(url);
    if (mg_url_is_ssl(url))
    {
        struct mg_tls_opts opts = {};
        opts.name = host;
        mg_tls_init(conn, &opts);
    }
    mg_printf(conn,
              "%s %s HTTP/1.1\r\n"
              "Host: %.*s:%hu\r\n"
              "User-Agent: %s\r\n"
              "Content-Length: %lu\r\n"
              "Connection: close\r\n",
              request.method.c_str(), mg_url_uri(url),
              static_cast<int>(host.len), host.buf, mg_url_port(url),
              tb::version::kUserAgentVersion,
              static_cast<unsigned long>(request.body.size()));
    for (auto const &[name, value] : request.headers)
    {
        mg_printf(conn, "%s: %s\r\n", name.c_str(), value.c_str());
    }
    mg_printf(conn, "\r\n");
    if (!request.body.empty())
    {
        mg_send(conn, request.body.data(), request.body.size());
    }
}

void handle_event(struct mg_connection *conn, int ev, void *ev_data)
{
    auto *exchange = static_cast<Exchange *>(conn->fn_data);
    if (exchange == nullptr || exchange->done)
    {
        return;
    }
    switch (ev)
    {
    case MG_EV_CONNECT:
        send_request(conn, *exchange->request);
        break;
    case MG_EV_HTTP_MSG:
    {
        auto *hm = static_cast<struct mg_http_message *>(ev_data);
        auto &response = exchange->response;
        response.received = true;
        response.status = mg_http_status(hm);
        response.body.assign(hm->body.buf, hm->body.len);
        for (int i = 0; i < MG_MAX_HTTP_HEADERS && hm->headers[i].name.len > 0;
             ++i)
        {
            if (mg_strcasecmp(hm->headers[i].name, mg_str("Set-Cookie")) == 0)
            {
                response.set_cookies.emplace_back(hm->headers[i].value.buf,
                                                  hm->headers[i].value.len);
            }
        }
        exchange->done = true;
        conn->is_draining = 1;
        break;
    }
    case MG_EV_ERROR:
        exchange->response.error =
            ev_data != nullptr ? static_cast<char const *>(ev_data) : "error";
        exchange->done = true;
        break;
    case MG_EV_CLOSE:
        exchange->response.error = "connection closed before response";
        exchange->done = true;
        break;
    default:
        break;
    }
}

} // namespace

HttpClient::HttpClient(std::chrono::milliseconds timeout) : timeout_(timeout)
{
}

HttpResponse HttpClient::perform(HttpRequest const &request)
{
    Exchange exchange;
    exchange.request = &request;

    struct mg_mgr mgr;
    mg_mgr_init(&mgr);
    auto *conn =
        mg_http_connect(&mgr, request.url.c_str(), &handle_event, &exchange);
    if (conn == nullptr)
    {
        mg_mgr_free(&mgr);
        exchange.response.error = "unable to connect to " + request.url;
        return exchange.response;
    }
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (!exchange.done && std::chrono::steady_clock::now() < deadline)
    {
        mg_mgr_poll(&mgr, kPollIntervalMs);
    }
    if (!exchange.done)
    {
        exchange.response.error = "request timed out";
    }
    // Closing connections fires MG_EV_CLOSE; keep the exchange from being
    // rewritten after the result is final.
    exchange.done = true;
    mg_mgr_free(&mgr);
    if (!exchange.response.received)
    {
        TB_LOG_DEBUG("{} {} failed: {}", request.method, request.url,
                     exchange.response.error);
    }
    return exchange.response;
}

} // namespace tb::services
