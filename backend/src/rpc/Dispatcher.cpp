#include "rpc/Dispatcher.hpp"

#include "rpc/Serializer.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <yyjson.h>

#include <algorithm>
#include <exception>
#include <format>
#include <optional>
#include <utility>

namespace tb::rpc
{

namespace
{

template <typename Handler> DispatchHandler wrap_sync_handler(Handler handler)
{
    return DispatchHandler(
        [handler = std::move(handler)](yyjson_val *arguments,
                                       ResponseCallback cb) mutable
        {
            try
            {
                cb(handler(arguments));
            }
            catch (std::exception const &ex)
            {
                TB_LOG_INFO("RPC handler threw: {}", ex.what());
                cb(serialize_error("internal error"));
            }
        });
}

bool is_active_status(std::string const &status)
{
    return status == "pending" || status == "transferring";
}

std::optional<std::string> non_empty_string(yyjson_val *arguments,
                                            char const *key)
{
    auto value = tb::json::get_string(arguments, key);
    if (value && value->empty())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

Dispatcher::Dispatcher(engine::TransferHistoryStore *history,
                       engine::TransferOrchestrator *orchestrator,
                       engine::ConfigurationService *config,
                       ResponsePoster post_response)
    : history_(history), orchestrator_(orchestrator), config_(config),
      post_response_(std::move(post_response))
{
    register_handlers();
}

void Dispatcher::complete_async(ResponseCallback cb, std::string response) const
{
    if (post_response_)
    {
        post_response_([cb = std::move(cb), response = std::move(response)]()
                       { cb(response); });
        return;
    }
    cb(std::move(response));
}

std::string Dispatcher::handle_transfer_list(yyjson_val *arguments)
{
    if (history_ == nullptr)
    {
        return serialize_error("transfer history disabled");
    }
    storage::TransferQuery query;
    query.status = non_empty_string(arguments, "status");
    query.source = non_empty_string(arguments, "source");
    query.target = non_empty_string(arguments, "target");
    query.search = non_empty_string(arguments, "search");
    query.start_date = non_empty_string(arguments, "from_date");
    query.end_date = non_empty_string(arguments, "to_date");
    if (auto sort = non_empty_string(arguments, "sort"))
    {
        query.sort = *sort;
    }
    if (auto order = non_empty_string(arguments, "order"))
    {
        query.order = *order;
    }
    if (auto page = tb::json::get_int(arguments, "page"))
    {
        if (*page < 1)
        {
            return serialize_error("invalid page");
        }
        query.page = static_cast<int>(*page);
    }
    if (auto per_page = tb::json::get_int(arguments, "per_page"))
    {
        if (*per_page < 1)
        {
            return serialize_error("invalid per_page");
        }
        query.per_page =
            static_cast<int>(std::min<std::int64_t>(*per_page, kMaxPerPage));
    }
    auto page = history_->list_transfers(query);
    return serialize_transfer_page(page, query.page, query.per_page);
}

std::string Dispatcher::handle_transfer_get(yyjson_val *arguments)
{
    if (history_ == nullptr)
    {
        return serialize_error("transfer history disabled");
    }
    auto id = non_empty_string(arguments, "id");
    if (!id)
    {
        return serialize_error("id required");
    }
    auto record = history_->get_transfer(*id);
    if (!record)
    {
        return serialize_error("transfer not found");
    }
    return serialize_transfer(*record);
}

std::string Dispatcher::handle_transfer_active()
{
    if (history_ == nullptr)
    {
        return serialize_error("transfer history disabled");
    }
    return serialize_transfers(history_->get_active_transfers());
}

std::string Dispatcher::handle_transfer_stats()
{
    if (history_ == nullptr)
    {
        return serialize_error("transfer history disabled");
    }
    return serialize_transfer_stats(history_->get_stats());
}

std::string Dispatcher::handle_transfer_delete(yyjson_val *arguments)
{
    if (history_ == nullptr)
    {
        return serialize_error("transfer history disabled");
    }
    auto id = non_empty_string(arguments, "id");
    if (!id)
    {
        return serialize_error("id required");
    }
    auto record = history_->get_transfer(*id);
    if (!record)
    {
        return serialize_error("transfer not found");
    }
    bool force = tb::json::get_bool(arguments, "force").value_or(false);
    if (is_active_status(record->status) && !force)
    {
        return serialize_error("transfer is still active");
    }
    if (!history_->delete_transfer(*id))
    {
        return serialize_error("failed to delete transfer");
    }
    TB_LOG_INFO("Deleted transfer {} ({})", *id, record->torrent_name);
    return serialize_deleted(1);
}

std::string Dispatcher::handle_transfer_cancel(yyjson_val *arguments)
{
    if (history_ == nullptr)
    {
        return serialize_error("transfer history disabled");
    }
    auto id = non_empty_string(arguments, "id");
    if (!id)
    {
        return serialize_error("id required");
    }
    if (history_->cancel_transfer(*id))
    {
        return serialize_success();
    }
    if (!history_->get_transfer(*id))
    {
        return serialize_error("transfer not found");
    }
    return serialize_error("transfer is not active");
}

std::string Dispatcher::handle_transfer_clear(yyjson_val *arguments)
{
    if (history_ == nullptr)
    {
        return serialize_error("transfer history disabled");
    }
    auto status = non_empty_string(arguments, "status");
    if (status && is_active_status(*status))
    {
        return serialize_error("active transfers cannot be cleared");
    }
    auto deleted = history_->clear_history(status);
    if (deleted < 0)
    {
        return serialize_error("failed to clear history");
    }
    return serialize_deleted(deleted);
}

std::string Dispatcher::handle_transfer_prune(yyjson_val *arguments)
{
    if (history_ == nullptr)
    {
        return serialize_error("transfer history disabled");
    }
    std::optional<std::int64_t> days =
        tb::json::get_int(arguments, "retention_days");
    if (!days && config_ != nullptr)
    {
        days = config_->history().retention_days;
    }
    if (!days)
    {
        return serialize_error("retention_days required");
    }
    if (*days < 0)
    {
        return serialize_error("invalid retention_days");
    }
    auto deleted = history_->prune_old_entries(static_cast<int>(*days));
    if (deleted < 0)
    {
        return serialize_error("failed to prune history");
    }
    return serialize_deleted(deleted);
}

std::string Dispatcher::handle_torrent_get()
{
    if (orchestrator_ == nullptr)
    {
        return serialize_error("orchestrator unavailable");
    }
    auto torrents = orchestrator_->published();
    if (!torrents)
    {
        return serialize_torrents({});
    }
    return serialize_torrents(*torrents);
}

void Dispatcher::handle_torrent_command(yyjson_val *arguments, bool remove,
                                        ResponseCallback cb)
{
    if (orchestrator_ == nullptr)
    {
        cb(serialize_error("orchestrator unavailable"));
        return;
    }
    auto name = non_empty_string(arguments, "name");
    if (!name)
    {
        cb(serialize_error("name required"));
        return;
    }
    auto done = [this, cb = std::move(cb)](engine::AdapterResult result) mutable
    {
        complete_async(std::move(cb), result.success
                                          ? serialize_message(result.message)
                                          : serialize_error(result.message));
    };
    if (remove)
    {
        orchestrator_->enqueue_remove(std::move(*name), std::move(done));
    }
    else
    {
        orchestrator_->enqueue_reset(std::move(*name), std::move(done));
    }
}

std::string Dispatcher::handle_config_get()
{
    if (config_ == nullptr)
    {
        return serialize_error("configuration unavailable");
    }
    return serialize_config(config_->get());
}

std::string Dispatcher::handle_history_config_set(yyjson_val *arguments)
{
    if (config_ == nullptr)
    {
        return serialize_error("configuration unavailable");
    }
    if (arguments == nullptr || !yyjson_is_obj(arguments))
    {
        return serialize_error("arguments required");
    }
    std::optional<int> retention_days;
    if (yyjson_obj_get(arguments, "retention_days") != nullptr)
    {
        auto days = tb::json::get_int(arguments, "retention_days");
        if (!days || *days < 0)
        {
            return serialize_error("invalid retention_days");
        }
        retention_days = static_cast<int>(*days);
    }
    auto enabled = tb::json::get_bool(arguments, "enabled");
    auto track_progress = tb::json::get_bool(arguments, "track_progress");
    config_->set_history(enabled, retention_days, track_progress);
    if (config_->is_dirty() && !config_->persist_if_dirty())
    {
        return serialize_error("failed to persist configuration");
    }
    auto history = config_->history();
    if (orchestrator_ != nullptr)
    {
        orchestrator_->set_track_progress(history.track_progress);
    }
    TB_LOG_INFO("History settings updated (enabled={}, retention_days={}, "
                "track_progress={})",
                history.enabled, history.retention_days,
                history.track_progress);
    return serialize_history_config(history);
}

void Dispatcher::register_handlers()
{
    auto add_sync = [this](std::string method, auto handler)
    {
        handlers_.emplace(std::move(method),
                          wrap_sync_handler(std::move(handler)));
    };
    auto add_async = [this](std::string method, DispatchHandler handler)
    { handlers_.emplace(std::move(method), std::move(handler)); };

    add_sync("transfer-list", [this](yyjson_val *arguments)
             { return handle_transfer_list(arguments); });
    add_sync("transfer-get", [this](yyjson_val *arguments)
             { return handle_transfer_get(arguments); });
    add_sync("transfer-active",
             [this](yyjson_val *) { return handle_transfer_active(); });
    add_sync("transfer-stats",
             [this](yyjson_val *) { return handle_transfer_stats(); });
    add_sync("transfer-delete", [this](yyjson_val *arguments)
             { return handle_transfer_delete(arguments); });
    add_sync("transfer-cancel", [this](yyjson_val *arguments)
             { return handle_transfer_cancel(arguments); });
    add_sync("transfer-clear", [this](yyjson_val *arguments)
             { return handle_transfer_clear(arguments); });
    add_sync("transfer-prune", [this](yyjson_val *arguments)
             { return handle_transfer_prune(arguments); });
    add_sync("torrent-get", [this](yyjson_val *) { return handle_torrent_get(); });
    add_async("torrent-reset", [this](yyjson_val *arguments, ResponseCallback cb)
              { handle_torrent_command(arguments, false, std::move(cb)); });
    add_async("torrent-remove", [this](yyjson_val *arguments, ResponseCallback cb)
              { handle_torrent_command(arguments, true, std::move(cb)); });
    add_sync("config-get", [this](yyjson_val *) { return handle_config_get(); });
    add_sync("history-config-set", [this](yyjson_val *arguments)
             { return handle_history_config_set(arguments); });
    add_sync("app-shutdown",
             [](yyjson_val *)
             {
                 tb::runtime::request_shutdown();
                 return serialize_success();
             });
}

void Dispatcher::dispatch(std::string_view payload, ResponseCallback cb)
{
    if (payload.empty())
    {
        cb(serialize_error("empty RPC payload"));
        return;
    }

    auto doc = tb::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        cb(serialize_error("invalid JSON"));
        return;
    }

    yyjson_val *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        cb(serialize_error("expected JSON object"));
        return;
    }

    yyjson_val *method_value = yyjson_obj_get(root, "method");
    if (method_value == nullptr || !yyjson_is_str(method_value))
    {
        cb(serialize_error("missing method"));
        return;
    }

    std::string method(yyjson_get_str(method_value));
    TB_LOG_DEBUG("Dispatching RPC method={}", method);

    yyjson_val *arguments = yyjson_obj_get(root, "arguments");
    auto handler_it = handlers_.find(method);
    if (handler_it == handlers_.end())
    {
        cb(serialize_error("unsupported method"));
        return;
    }
    try
    {
        handler_it->second(arguments, std::move(cb));
    }
    catch (std::exception const &ex)
    {
        TB_LOG_INFO("RPC handler failed for method {}: {}", method, ex.what());
        cb(serialize_error("internal error", ex.what()));
    }
}

} // namespace tb::rpc
