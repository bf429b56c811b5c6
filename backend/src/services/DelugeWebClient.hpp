#pragma once

#include "engine/Adapters.hpp"
#include "engine/ConfigurationService.hpp"
#include "services/HttpClient.hpp"
#include "utils/Json.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tb::services
{

// Deluge Web UI JSON-RPC adapter (POST /json). Logs in lazily and once more
// when the session cookie has expired.
class DelugeWebClient : public engine::DownloadClient
{
  public:
    explicit DelugeWebClient(engine::DownloadClientConfig config,
                             std::shared_ptr<HttpClient> http = {});

    std::string const &name() const override
    {
        return config_.name;
    }
    std::optional<engine::StatusMap> get_status_map() override;
    engine::AdapterResult
    add_torrent_file(std::string const &remote_path,
                     std::vector<std::uint8_t> const &metadata,
                     engine::AddTorrentOptions const &options) override;
    engine::AdapterResult remove_torrent(std::string const &id,
                                         bool delete_data) override;

    // Parses the `result` object of core.get_torrents_status.
    static engine::StatusMap parse_status_result(yyjson_val *result);

  private:
    using ParamsBuilder = std::function<void(yyjson_mut_doc *, yyjson_mut_val *)>;

    struct Reply
    {
        bool success = false;
        bool auth_error = false;
        std::string error;
        json::Document document;
        yyjson_val *result = nullptr;
    };

    Reply call(char const *method, ParamsBuilder const &params);
    Reply call_once(char const *method, ParamsBuilder const &params);
    bool login();
    std::string endpoint() const;

    engine::DownloadClientConfig config_;
    std::shared_ptr<HttpClient> http_;
    std::optional<std::string> session_cookie_;
    std::uint64_t next_request_id_ = 1;
};

} // namespace tb::services
