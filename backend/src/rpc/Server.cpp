#include "rpc/Server.hpp"

#include "rpc/Serializer.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <arpa/inet.h>

#include <mongoose.h>

#include <cstring>
#include <exception>
#include <string_view>
#include <utility>

namespace
{
constexpr std::size_t kMaxHttpPayloadSize = 1 << 20;
constexpr char const *kJsonHeaders = "Content-Type: application/json\r\n";

std::string sanitize_request_uri(std::string_view uri)
{
    auto query = uri.find('?');
    if (query != std::string_view::npos)
    {
        uri = uri.substr(0, query);
    }
    return std::string(uri);
}

} // namespace

namespace tb::rpc
{

Server::Server(engine::TransferHistoryStore *history,
               engine::TransferOrchestrator *orchestrator,
               engine::ConfigurationService *config, std::string bind_url,
               ServerOptions options)
    : bind_url_(std::move(bind_url)), options_(std::move(options)),
      dispatcher_(history, orchestrator, config,
                  [this](std::function<void()> task)
                  { enqueue_task(std::move(task)); })
{
    mg_mgr_init(&mgr_);
    mgr_.userdata = this;
    if (!mg_wakeup_init(&mgr_))
    {
        TB_LOG_WARN("RPC wakeup pipe unavailable; responses follow the poll "
                    "interval");
    }
}

Server::~Server()
{
    // Callbacks fired by mg_mgr_free must not touch member state.
    destroying_.store(true, std::memory_order_release);
    stop();
    mg_mgr_free(&mgr_);
}

bool Server::start()
{
    if (running_.exchange(true))
    {
        return true;
    }
    listener_ =
        mg_http_listen(&mgr_, bind_url_.c_str(), &Server::handle_event, this);
    if (listener_ == nullptr)
    {
        TB_LOG_ERROR("Failed to bind RPC listener to {}", bind_url_);
        running_.store(false);
        return false;
    }
    port_ = static_cast<std::uint16_t>(ntohs(listener_->loc.port));
    TB_LOG_INFO("RPC listener bound to {} (port {}), exposing {}", bind_url_,
                port_, options_.rpc_path);
    worker_ = std::thread(&Server::run_loop, this);
    return true;
}

void Server::stop()
{
    running_.store(false);

    auto *listener = listener_;
    listener_ = nullptr;
    mg_wakeup(&mgr_, 0, nullptr, 0);

    if (worker_.joinable())
    {
        TB_LOG_INFO("Stopping RPC worker thread");
        worker_.join();
    }

    if (listener != nullptr)
    {
        mg_close_conn(listener);
    }
}

void Server::run_loop()
{
    try
    {
        while (running_.load(std::memory_order_relaxed) &&
               !tb::runtime::should_shutdown())
        {
            mg_mgr_poll(&mgr_, 50);
            process_pending_tasks();
        }
    }
    catch (std::exception const &ex)
    {
        TB_LOG_ERROR("RPC worker exception: {}", ex.what());
    }
    running_.store(false, std::memory_order_relaxed);
}

bool Server::authorize_request(struct mg_http_message *hm) const
{
    if (!options_.token)
    {
        return true;
    }
    auto *header = mg_http_get_header(hm, options_.token_header.c_str());
    if (header == nullptr)
    {
        return false;
    }
    return std::string_view(header->buf, header->len) == *options_.token;
}

void Server::handle_event(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *self = static_cast<Server *>(conn->fn_data);
    if (self == nullptr || self->destroying_.load(std::memory_order_acquire))
    {
        return;
    }

    switch (ev)
    {
    case MG_EV_HTTP_MSG:
        self->handle_http_message(
            conn, static_cast<struct mg_http_message *>(ev_data));
        break;
    case MG_EV_CLOSE:
        self->handle_connection_closed(conn);
        break;
    default:
        break;
    }
}

void Server::handle_http_message(struct mg_connection *conn,
                                 struct mg_http_message *hm)
{
    if (conn == nullptr || hm == nullptr)
    {
        return;
    }
    std::string_view uri(hm->uri.buf, hm->uri.len);
    std::string_view method(hm->method.buf, hm->method.len);
    TB_LOG_DEBUG("HTTP request {} {}", method, sanitize_request_uri(uri));

    bool is_rpc = uri.size() == options_.rpc_path.size() &&
                  std::memcmp(uri.data(), options_.rpc_path.data(),
                              uri.size()) == 0;
    if (!is_rpc)
    {
        mg_http_reply(conn, 404, "Content-Type: text/plain\r\n", "not found");
        return;
    }
    if (method != "POST")
    {
        auto payload = serialize_error("method not allowed");
        mg_http_reply(conn, 405, "Content-Type: application/json\r\nAllow: POST\r\n",
                      "%s", payload.c_str());
        return;
    }
    if (!authorize_request(hm))
    {
        TB_LOG_INFO("RPC request rejected; unauthorized");
        auto payload = serialize_error("unauthorized");
        mg_http_reply(conn, 401, kJsonHeaders, "%s", payload.c_str());
        return;
    }
    if (hm->body.len == static_cast<size_t>(-1) ||
        hm->body.len > kMaxHttpPayloadSize)
    {
        TB_LOG_INFO("RPC payload too large: {} bytes", hm->body.len);
        auto payload = serialize_error("payload too large");
        mg_http_reply(conn, 413, kJsonHeaders, "%s", payload.c_str());
        return;
    }

    std::string body;
    if (hm->body.len > 0 && hm->body.buf != nullptr)
    {
        body.assign(hm->body.buf, hm->body.len);
    }

    auto req_id = next_request_id_++;
    active_requests_[req_id] = {conn};
    dispatcher_.dispatch(body,
                         [this, req_id](std::string response)
                         {
                             enqueue_task(
                                 [this, req_id, response = std::move(response)]
                                 { send_response(req_id, response); });
                         });
}

void Server::handle_connection_closed(struct mg_connection *conn)
{
    for (auto it = active_requests_.begin(); it != active_requests_.end();)
    {
        if (it->second.conn == conn)
        {
            it = active_requests_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void Server::enqueue_task(std::function<void()> task)
{
    std::lock_guard<std::mutex> lock(tasks_mtx_);
    pending_tasks_.push_back(std::move(task));
    mg_wakeup(&mgr_, 0, nullptr, 0);
}

void Server::process_pending_tasks()
{
    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mtx_);
        tasks.swap(pending_tasks_);
    }
    for (auto &task : tasks)
    {
        task();
    }
}

void Server::send_response(std::uint64_t req_id, std::string const &response)
{
    auto it = active_requests_.find(req_id);
    if (it != active_requests_.end())
    {
        mg_http_reply(it->second.conn, 200, kJsonHeaders, "%s",
                      response.c_str());
        active_requests_.erase(it);
    }
}

} // namespace tb::rpc
