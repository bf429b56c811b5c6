#pragma once

#include "engine/ConfigurationService.hpp"
#include "engine/TransferHistoryStore.hpp"
#include "engine/TransferOrchestrator.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

struct yyjson_val;

namespace tb::rpc
{

using ResponseCallback = std::function<void(std::string)>;
using DispatchHandler = std::function<void(yyjson_val *, ResponseCallback)>;
using ResponsePoster = std::function<void(std::function<void()>)>;

// Maximum page size accepted by transfer-list.
constexpr int kMaxPerPage = 100;

class Dispatcher
{
  public:
    // Any of the services may be null; methods that need a missing service
    // answer with an error. Async completions are handed to `post_response`
    // so they run on the server thread.
    Dispatcher(engine::TransferHistoryStore *history,
               engine::TransferOrchestrator *orchestrator,
               engine::ConfigurationService *config,
               ResponsePoster post_response = {});
    void dispatch(std::string_view payload, ResponseCallback cb);

  private:
    void register_handlers();
    void complete_async(ResponseCallback cb, std::string response) const;

    std::string handle_transfer_list(yyjson_val *arguments);
    std::string handle_transfer_get(yyjson_val *arguments);
    std::string handle_transfer_active();
    std::string handle_transfer_stats();
    std::string handle_transfer_delete(yyjson_val *arguments);
    std::string handle_transfer_cancel(yyjson_val *arguments);
    std::string handle_transfer_clear(yyjson_val *arguments);
    std::string handle_transfer_prune(yyjson_val *arguments);
    std::string handle_torrent_get();
    void handle_torrent_command(yyjson_val *arguments, bool remove,
                                ResponseCallback cb);
    std::string handle_config_get();
    std::string handle_history_config_set(yyjson_val *arguments);

    engine::TransferHistoryStore *history_;
    engine::TransferOrchestrator *orchestrator_;
    engine::ConfigurationService *config_;
    ResponsePoster post_response_;
    std::unordered_map<std::string, DispatchHandler> handlers_;
};

} // namespace tb::rpc
