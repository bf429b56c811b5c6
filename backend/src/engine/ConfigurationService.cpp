#include "engine/ConfigurationService.hpp"

#include "utils/FS.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace tb::engine
{

namespace
{

int read_int(yyjson_val *object, char const *key, int fallback)
{
    if (auto value = json::get_int(object, key))
    {
        return static_cast<int>(*value);
    }
    return fallback;
}

std::string read_string(yyjson_val *object, char const *key,
                        std::string fallback = {})
{
    return json::get_string(object, key).value_or(std::move(fallback));
}

std::string parse_media_managers(yyjson_val *value, BridgeConfig &config)
{
    if (value == nullptr)
    {
        return {};
    }
    if (!yyjson_is_arr(value))
    {
        return "media_managers must be an array";
    }
    size_t idx, max;
    yyjson_val *item;
    yyjson_arr_foreach(value, idx, max, item)
    {
        MediaManagerConfig manager;
        manager.type = read_string(item, "type");
        if (manager.type != "radarr" && manager.type != "sonarr")
        {
            return std::format("unknown media manager type '{}'", manager.type);
        }
        manager.host = read_string(item, "host", "127.0.0.1");
        manager.port =
            read_int(item, "port", manager.type == "radarr" ? 7878 : 8989);
        manager.api_key = read_string(item, "api_key");
        manager.use_tls = json::get_bool(item, "use_tls").value_or(false);
        config.media_managers.push_back(std::move(manager));
    }
    return {};
}

std::string parse_download_clients(yyjson_val *value, BridgeConfig &config)
{
    if (value == nullptr)
    {
        return {};
    }
    if (!yyjson_is_obj(value))
    {
        return "download_clients must be an object";
    }
    size_t idx, max;
    yyjson_val *key;
    yyjson_val *item;
    yyjson_obj_foreach(value, idx, max, key, item)
    {
        DownloadClientConfig client;
        client.name = std::string(yyjson_get_str(key), yyjson_get_len(key));
        client.type = read_string(item, "type", "deluge");
        if (client.type != "deluge")
        {
            return std::format("unknown download client type '{}' for {}",
                               client.type, client.name);
        }
        client.host = read_string(item, "host", client.host);
        client.port = read_int(item, "port", client.port);
        client.password = read_string(item, "password");
        client.use_tls = json::get_bool(item, "use_tls").value_or(false);
        config.download_clients.push_back(std::move(client));
    }
    return {};
}

std::string parse_connections(yyjson_val *value, BridgeConfig &config)
{
    if (value == nullptr)
    {
        return {};
    }
    if (!yyjson_is_arr(value))
    {
        return "connections must be an array";
    }
    auto known_client = [&](std::string const &name)
    {
        return std::any_of(config.download_clients.begin(),
                           config.download_clients.end(),
                           [&](DownloadClientConfig const &client)
                           { return client.name == name; });
    };
    size_t idx, max;
    yyjson_val *item;
    yyjson_arr_foreach(value, idx, max, item)
    {
        ConnectionConfig connection;
        connection.from = read_string(item, "from");
        connection.to = read_string(item, "to");
        if (!known_client(connection.from))
        {
            return std::format("connection {} references unknown client '{}'",
                               idx, connection.from);
        }
        if (!known_client(connection.to))
        {
            return std::format("connection {} references unknown client '{}'",
                               idx, connection.to);
        }
        connection.name = read_string(
            item, "name", std::format("{} -> {}", connection.from, connection.to));
        auto *transfer = yyjson_obj_get(item, "transfer_config");
        connection.transfer.type = read_string(transfer, "type", "local");
        connection.transfer.host = read_string(transfer, "host");
        connection.transfer.port = read_int(transfer, "port", 22);
        connection.transfer.user = read_string(transfer, "user");
        if (connection.transfer.type != "local" &&
            connection.transfer.type != "scp")
        {
            return std::format("unknown transfer type '{}' for {}",
                               connection.transfer.type, connection.name);
        }
        if (connection.transfer.type == "scp" && connection.transfer.host.empty())
        {
            return std::format("scp transfer for {} requires a host",
                               connection.name);
        }
        connection.source_dot_torrent_path =
            read_string(item, "source_dot_torrent_path");
        connection.source_torrent_download_path =
            read_string(item, "source_torrent_download_path");
        connection.destination_dot_torrent_tmp_dir =
            read_string(item, "destination_dot_torrent_tmp_dir");
        connection.destination_torrent_download_path =
            read_string(item, "destination_torrent_download_path");
        config.connections.push_back(std::move(connection));
    }
    return {};
}

} // namespace

ConfigLoadResult parse_config(std::string_view payload)
{
    ConfigLoadResult result;
    auto document = json::Document::parse(payload);
    if (!document.is_valid())
    {
        result.error = "config is not valid JSON";
        return result;
    }
    auto *root = document.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        result.error = "config must be a JSON object";
        return result;
    }

    BridgeConfig config;
    if (auto state_dir = json::get_string(root, "state_dir"))
    {
        config.state_dir = *state_dir;
    }
    config.state_file = read_string(root, "state_file", config.state_file);
    config.log_level = read_string(root, "log_level", config.log_level);
    config.rpc_bind = read_string(root, "rpc_bind", config.rpc_bind);
    config.rpc_path = read_string(root, "rpc_path", config.rpc_path);
    if (auto token = json::get_string(root, "rpc_token"); token && !token->empty())
    {
        config.rpc_token = *token;
    }
    config.poll_interval_seconds =
        std::max(1, read_int(root, "poll_interval_seconds",
                             config.poll_interval_seconds));

    auto error = parse_media_managers(yyjson_obj_get(root, "media_managers"),
                                      config);
    if (error.empty())
    {
        error = parse_download_clients(yyjson_obj_get(root, "download_clients"),
                                       config);
    }
    if (error.empty())
    {
        error = parse_connections(yyjson_obj_get(root, "connections"), config);
    }
    if (!error.empty())
    {
        result.error = std::move(error);
        return result;
    }

    auto *history = yyjson_obj_get(root, "history");
    config.history.enabled =
        json::get_bool(history, "enabled").value_or(config.history.enabled);
    config.history.retention_days =
        read_int(history, "retention_days", config.history.retention_days);
    config.history.track_progress = json::get_bool(history, "track_progress")
                                        .value_or(config.history.track_progress);

    auto *retry = yyjson_obj_get(root, "retry");
    config.retry.max_retries =
        std::max(0, read_int(retry, "max_retries", config.retry.max_retries));
    config.retry.base_backoff_seconds = std::max(
        1, read_int(retry, "base_backoff_seconds",
                    config.retry.base_backoff_seconds));
    config.retry.max_backoff_seconds =
        std::max(config.retry.base_backoff_seconds,
                 read_int(retry, "max_backoff_seconds",
                          config.retry.max_backoff_seconds));

    auto *matching = yyjson_obj_get(root, "matching");
    config.matching.first_seen_window_seconds =
        std::max(0, read_int(matching, "first_seen_window_seconds",
                             config.matching.first_seen_window_seconds));
    config.matching.max_not_found_attempts =
        std::max(0, read_int(matching, "max_not_found_attempts",
                             config.matching.max_not_found_attempts));
    config.matching.metadata_wait_cycles =
        std::max(1, read_int(matching, "metadata_wait_cycles",
                             config.matching.metadata_wait_cycles));

    result.config = std::move(config);
    return result;
}

ConfigLoadResult load_config(std::filesystem::path const &path)
{
    auto payload = utils::read_file_text(path);
    if (!payload)
    {
        ConfigLoadResult result;
        result.error = "unable to read config file " + path.string();
        return result;
    }
    auto result = parse_config(*payload);
    if (!result.config)
    {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

std::string config_to_json(BridgeConfig const &config, bool include_secrets,
                           bool pretty)
{
    json::MutableDocument document;
    auto *doc = document.doc();
    if (doc == nullptr)
    {
        return "{}";
    }
    auto *root = yyjson_mut_obj(doc);
    document.set_root(root);
    yyjson_mut_obj_add_strcpy(doc, root, "state_dir",
                              config.state_dir.string().c_str());
    yyjson_mut_obj_add_strcpy(doc, root, "state_file", config.state_file.c_str());
    yyjson_mut_obj_add_strcpy(doc, root, "log_level", config.log_level.c_str());
    yyjson_mut_obj_add_strcpy(doc, root, "rpc_bind", config.rpc_bind.c_str());
    yyjson_mut_obj_add_strcpy(doc, root, "rpc_path", config.rpc_path.c_str());
    if (include_secrets && config.rpc_token)
    {
        yyjson_mut_obj_add_strcpy(doc, root, "rpc_token",
                                  config.rpc_token->c_str());
    }
    yyjson_mut_obj_add_int(doc, root, "poll_interval_seconds",
                           config.poll_interval_seconds);

    auto *managers = yyjson_mut_arr(doc);
    for (auto const &manager : config.media_managers)
    {
        auto *entry = yyjson_mut_obj(doc);
        yyjson_mut_obj_add_strcpy(doc, entry, "type", manager.type.c_str());
        yyjson_mut_obj_add_strcpy(doc, entry, "host", manager.host.c_str());
        yyjson_mut_obj_add_int(doc, entry, "port", manager.port);
        yyjson_mut_obj_add_bool(doc, entry, "use_tls", manager.use_tls);
        if (include_secrets)
        {
            yyjson_mut_obj_add_strcpy(doc, entry, "api_key",
                                      manager.api_key.c_str());
        }
        yyjson_mut_arr_append(managers, entry);
    }
    yyjson_mut_obj_add_val(doc, root, "media_managers", managers);

    auto *clients = yyjson_mut_obj(doc);
    for (auto const &client : config.download_clients)
    {
        auto *entry = yyjson_mut_obj(doc);
        yyjson_mut_obj_add_strcpy(doc, entry, "type", client.type.c_str());
        yyjson_mut_obj_add_strcpy(doc, entry, "host", client.host.c_str());
        yyjson_mut_obj_add_int(doc, entry, "port", client.port);
        yyjson_mut_obj_add_bool(doc, entry, "use_tls", client.use_tls);
        if (include_secrets)
        {
            yyjson_mut_obj_add_strcpy(doc, entry, "password",
                                      client.password.c_str());
        }
        yyjson_mut_obj_put(clients, yyjson_mut_strcpy(doc, client.name.c_str()),
                           entry);
    }
    yyjson_mut_obj_add_val(doc, root, "download_clients", clients);

    auto *connections = yyjson_mut_arr(doc);
    for (auto const &connection : config.connections)
    {
        auto *entry = yyjson_mut_obj(doc);
        yyjson_mut_obj_add_strcpy(doc, entry, "name", connection.name.c_str());
        yyjson_mut_obj_add_strcpy(doc, entry, "from", connection.from.c_str());
        yyjson_mut_obj_add_strcpy(doc, entry, "to", connection.to.c_str());
        auto *transfer = yyjson_mut_obj(doc);
        yyjson_mut_obj_add_strcpy(doc, transfer, "type",
                                  connection.transfer.type.c_str());
        yyjson_mut_obj_add_strcpy(doc, transfer, "host",
                                  connection.transfer.host.c_str());
        yyjson_mut_obj_add_int(doc, transfer, "port", connection.transfer.port);
        yyjson_mut_obj_add_strcpy(doc, transfer, "user",
                                  connection.transfer.user.c_str());
        yyjson_mut_obj_add_val(doc, entry, "transfer_config", transfer);
        yyjson_mut_obj_add_strcpy(doc, entry, "source_dot_torrent_path",
                                  connection.source_dot_torrent_path.c_str());
        yyjson_mut_obj_add_strcpy(
            doc, entry, "source_torrent_download_path",
            connection.source_torrent_download_path.c_str());
        yyjson_mut_obj_add_strcpy(
            doc, entry, "destination_dot_torrent_tmp_dir",
            connection.destination_dot_torrent_tmp_dir.c_str());
        yyjson_mut_obj_add_strcpy(
            doc, entry, "destination_torrent_download_path",
            connection.destination_torrent_download_path.c_str());
        yyjson_mut_arr_append(connections, entry);
    }
    yyjson_mut_obj_add_val(doc, root, "connections", connections);

    auto *history = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_bool(doc, history, "enabled", config.history.enabled);
    yyjson_mut_obj_add_int(doc, history, "retention_days",
                           config.history.retention_days);
    yyjson_mut_obj_add_bool(doc, history, "track_progress",
                            config.history.track_progress);
    yyjson_mut_obj_add_val(doc, root, "history", history);

    auto *retry = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_int(doc, retry, "max_retries", config.retry.max_retries);
    yyjson_mut_obj_add_int(doc, retry, "base_backoff_seconds",
                           config.retry.base_backoff_seconds);
    yyjson_mut_obj_add_int(doc, retry, "max_backoff_seconds",
                           config.retry.max_backoff_seconds);
    yyjson_mut_obj_add_val(doc, root, "retry", retry);

    auto *matching = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_int(doc, matching, "first_seen_window_seconds",
                           config.matching.first_seen_window_seconds);
    yyjson_mut_obj_add_int(doc, matching, "max_not_found_attempts",
                           config.matching.max_not_found_attempts);
    yyjson_mut_obj_add_int(doc, matching, "metadata_wait_cycles",
                           config.matching.metadata_wait_cycles);
    yyjson_mut_obj_add_val(doc, root, "matching", matching);

    return document.write("{}", pretty);
}

ConfigurationService::ConfigurationService(std::filesystem::path path,
                                           BridgeConfig config)
    : path_(std::move(path)), config_(std::move(config))
{
}

BridgeConfig ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_;
}

HistorySettings ConfigurationService::history() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_.history;
}

void ConfigurationService::set_history(std::optional<bool> enabled,
                                       std::optional<int> retention_days,
                                       std::optional<bool> track_progress)
{
    bool changed = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (enabled && *enabled != config_.history.enabled)
        {
            config_.history.enabled = *enabled;
            changed = true;
        }
        if (retention_days && *retention_days != config_.history.retention_days)
        {
            config_.history.retention_days = *retention_days;
            changed = true;
        }
        if (track_progress &&
            *track_progress != config_.history.track_progress)
        {
            config_.history.track_progress = *track_progress;
            changed = true;
        }
    }
    if (changed)
    {
        mark_dirty();
    }
}

void ConfigurationService::mark_dirty()
{
    dirty_.store(true, std::memory_order_release);
}

bool ConfigurationService::persist_if_dirty()
{
    if (!dirty_.load(std::memory_order_acquire))
        return true;
    return persist_now();
}

bool ConfigurationService::persist_now()
{
    if (path_.empty())
        return false;

    auto payload = config_to_json(get(), true, true);
    if (utils::write_file_atomic(path_, payload))
    {
        dirty_.store(false, std::memory_order_release);
        return true;
    }
    TB_LOG_ERROR("failed to persist config to {}", path_.string());
    return false;
}

} // namespace tb::engine
