#pragma once
#include "rpc/Dispatcher.hpp"

#include <mongoose.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tb::rpc
{

struct ServerOptions
{
    std::optional<std::string> token;
    std::string token_header = "X-TB-Auth";
    std::string rpc_path = "/rpc";
};

class Server
{
  public:
    Server(engine::TransferHistoryStore *history,
           engine::TransferOrchestrator *orchestrator,
           engine::ConfigurationService *config,
           std::string bind_url = "http://127.0.0.1:10445",
           ServerOptions options = {});
    ~Server();

    Server(Server const &) = delete;
    Server &operator=(Server const &) = delete;

    // Returns false when the listener could not be bound.
    bool start();
    void stop();

    std::uint16_t port() const noexcept
    {
        return port_;
    }

  private:
    void run_loop();
    void handle_http_message(struct mg_connection *conn,
                             struct mg_http_message *hm);
    void handle_connection_closed(struct mg_connection *conn);
    static void handle_event(struct mg_connection *conn, int ev, void *ev_data);
    bool authorize_request(struct mg_http_message *hm) const;
    void process_pending_tasks();
    void enqueue_task(std::function<void()> task);
    void send_response(std::uint64_t req_id, std::string const &response);

    std::string bind_url_;
    ServerOptions options_;
    Dispatcher dispatcher_;
    mg_mgr mgr_;
    struct mg_connection *listener_ = nullptr;
    std::uint16_t port_ = 0;
    std::atomic_bool running_{false};
    std::atomic_bool destroying_{false};
    std::thread worker_;

    struct ActiveRequest
    {
        struct mg_connection *conn = nullptr;
    };
    using RequestId = std::uint64_t;
    RequestId next_request_id_ = 1;
    std::unordered_map<RequestId, ActiveRequest> active_requests_;

    std::vector<std::function<void()>> pending_tasks_;
    std::mutex tasks_mtx_;
};

} // namespace tb::rpc
