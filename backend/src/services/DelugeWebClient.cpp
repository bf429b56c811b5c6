#include "services/DelugeWebClient.hpp"

#include "utils/Base64.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <span>

namespace tb::services
{

namespace
{

constexpr std::int64_t kAuthErrorCode = 1;
constexpr char const *kStatusFields[] = {"name", "state", "files", "progress",
                                         "total_size"};

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return value;
}

// "_session_id=abc; Expires=...; Path=/json" -> "_session_id=abc"
std::string cookie_pair(std::string const &header)
{
    auto end = header.find(';');
    return header.substr(0, end);
}

} // namespace

DelugeWebClient::DelugeWebClient(engine::DownloadClientConfig config,
                                 std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http))
{
    if (!http_)
    {
        http_ = std::make_shared<HttpClient>();
    }
}

std::string DelugeWebClient::endpoint() const
{
    return std::format("{}://{}:{}/json", config_.use_tls ? "https" : "http",
                       config_.host, config_.port);
}

DelugeWebClient::Reply DelugeWebClient::call_once(char const *method,
                                                  ParamsBuilder const &params)
{
    Reply reply;
    json::MutableDocument request_doc;
    auto *doc = request_doc.doc();
    if (doc == nullptr)
    {
        reply.error = "allocation failure";
        return reply;
    }
    auto *root = yyjson_mut_obj(doc);
    request_doc.set_root(root);
    yyjson_mut_obj_add_str(doc, root, "method", method);
    auto *param_array = yyjson_mut_arr(doc);
    if (params)
    {
        params(doc, param_array);
    }
    yyjson_mut_obj_add_val(doc, root, "params", param_array);
    yyjson_mut_obj_add_uint(doc, root, "id", next_request_id_++);

    HttpRequest request;
    request.method = "POST";
    request.url = endpoint();
    request.headers.emplace_back("Content-Type", "application/json");
    request.headers.emplace_back("Accept", "application/json");
    if (session_cookie_)
    {
        request.headers.emplace_back("Cookie", *session_cookie_);
    }
    request.body = request_doc.write();

    auto response = http_->perform(request);
    if (!response.ok())
    {
        reply.error = response.received
                          ? std::format("HTTP {}", response.status)
                          : response.error;
        return reply;
    }
    for (auto const &cookie : response.set_cookies)
    {
        if (cookie.rfind("_session_id=", 0) == 0)
        {
            session_cookie_ = cookie_pair(cookie);
        }
    }
    reply.document = json::Document::parse(response.body);
    auto *response_root = reply.document.root();
    if (response_root == nullptr || !yyjson_is_obj(response_root))
    {
        reply.error = "malformed JSON-RPC response";
        return reply;
    }
    auto *error = yyjson_obj_get(response_root, "error");
    if (error != nullptr && !yyjson_is_null(error))
    {
        reply.error = json::get_string(error, "message").value_or("rpc error");
        reply.auth_error = json::get_int(error, "code") == kAuthErrorCode;
        return reply;
    }
    reply.result = yyjson_obj_get(response_root, "result");
    reply.success = true;
    return reply;
}

DelugeWebClient::Reply DelugeWebClient::call(char const *method,
                                             ParamsBuilder const &params)
{
    if (!session_cookie_ && !login())
    {
        Reply reply;
        reply.error = "authentication failed";
        return reply;
    }
    auto reply = call_once(method, params);
    if (reply.auth_error)
    {
        TB_LOG_DEBUG("{}: session expired, logging in again", config_.name);
        session_cookie_.reset();
        if (!login())
        {
            return reply;
        }
        reply = call_once(method, params);
    }
    return reply;
}

bool DelugeWebClient::login()
{
    auto reply = call_once("auth.login",
                           [this](yyjson_mut_doc *doc, yyjson_mut_val *params)
                           {
                               yyjson_mut_arr_add_strcpy(
                                   doc, params, config_.password.c_str());
                           });
    if (!reply.success || reply.result == nullptr ||
        !yyjson_is_true(reply.result))
    {
        TB_LOG_WARN("{}: login failed{}", config_.name,
                    reply.error.empty() ? "" : ": " + reply.error);
        session_cookie_.reset();
        return false;
    }
    return session_cookie_.has_value();
}

std::optional<engine::StatusMap> DelugeWebClient::get_status_map()
{
    auto reply = call("core.get_torrents_status",
                      [](yyjson_mut_doc *doc, yyjson_mut_val *params)
                      {
                          yyjson_mut_arr_append(params, yyjson_mut_obj(doc));
                          auto *fields = yyjson_mut_arr(doc);
                          for (auto const *field : kStatusFields)
                          {
                              yyjson_mut_arr_add_str(doc, fields, field);
                          }
                          yyjson_mut_arr_append(params, fields);
                      });
    if (!reply.success)
    {
        TB_LOG_WARN("{}: status poll failed: {}", config_.name, reply.error);
        return std::nullopt;
    }
    return parse_status_result(reply.result);
}

engine::StatusMap DelugeWebClient::parse_status_result(yyjson_val *result)
{
    engine::StatusMap statuses;
    if (result == nullptr || !yyjson_is_obj(result))
    {
        return statuses;
    }
    size_t idx, max;
    yyjson_val *key;
    yyjson_val *value;
    yyjson_obj_foreach(result, idx, max, key, value)
    {
        engine::ClientStatus status;
        status.name = json::get_string(value, "name").value_or("");
        status.state = json::get_string(value, "state").value_or("");
        status.progress = json::get_double(value, "progress").value_or(0.0);
        status.total_size = json::get_int(value, "total_size").value_or(0);
        auto *files = yyjson_obj_get(value, "files");
        if (files != nullptr && yyjson_is_arr(files))
        {
            size_t file_idx, file_max;
            yyjson_val *file;
            yyjson_arr_foreach(files, file_idx, file_max, file)
            {
                if (auto path = json::get_string(file, "path"))
                {
                    status.files.push_back(
                        {*path, json::get_int(file, "size").value_or(0)});
                }
            }
        }
        statuses.emplace(
            to_lower(std::string(yyjson_get_str(key), yyjson_get_len(key))),
            std::move(status));
    }
    return statuses;
}

engine::AdapterResult
DelugeWebClient::add_torrent_file(std::string const &remote_path,
                                  std::vector<std::uint8_t> const &metadata,
                                  engine::AddTorrentOptions const &options)
{
    auto encoded = utils::encode_base64(std::span<std::uint8_t const>(metadata));
    auto filename = std::filesystem::path(remote_path).filename().string();
    auto reply = call(
        "core.add_torrent_file",
        [&](yyjson_mut_doc *doc, yyjson_mut_val *params)
        {
            yyjson_mut_arr_add_strcpy(doc, params, filename.c_str());
            yyjson_mut_arr_add_strcpy(doc, params, encoded.c_str());
            auto *opts = yyjson_mut_obj(doc);
            if (options.download_location)
            {
                yyjson_mut_obj_add_strcpy(doc, opts, "download_location",
                                          options.download_location->c_str());
            }
            yyjson_mut_obj_add_bool(doc, opts, "add_paused", options.add_paused);
            yyjson_mut_arr_append(params, opts);
        });
    if (!reply.success)
    {
        return {false, reply.error};
    }
    if (reply.result == nullptr || !yyjson_is_str(reply.result))
    {
        return {false, "torrent was not added"};
    }
    return {true, yyjson_get_str(reply.result)};
}

engine::AdapterResult DelugeWebClient::remove_torrent(std::string const &id,
                                                      bool delete_data)
{
    auto reply = call("core.remove_torrent",
                      [&](yyjson_mut_doc *doc, yyjson_mut_val *params)
                      {
                          yyjson_mut_arr_add_strcpy(doc, params, id.c_str());
                          yyjson_mut_arr_add_bool(doc, params, delete_data);
                      });
    if (!reply.success)
    {
        return {false, reply.error};
    }
    if (reply.result == nullptr || !yyjson_is_true(reply.result))
    {
        return {false, "client refused removal"};
    }
    return {true, {}};
}

} // namespace tb::services
