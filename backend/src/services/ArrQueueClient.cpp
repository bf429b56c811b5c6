#include "services/ArrQueueClient.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace tb::services
{

namespace
{

constexpr int kQueuePageSize = 1000;

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return value;
}

} // namespace

ArrQueueClient::ArrQueueClient(engine::MediaManagerConfig config,
                               std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http))
{
    if (!http_)
    {
        http_ = std::make_shared<HttpClient>();
    }
}

std::string ArrQueueClient::queue_url() const
{
    return std::format("{}://{}:{}/api/v3/queue?page=1&pageSize={}",
                       config_.use_tls ? "https" : "http", config_.host,
                       config_.port, kQueuePageSize);
}

std::optional<std::vector<engine::QueueItem>> ArrQueueClient::get_queue_updates()
{
    HttpRequest request;
    request.url = queue_url();
    request.headers.emplace_back("X-Api-Key", config_.api_key);
    request.headers.emplace_back("Accept", "application/json");
    auto response = http_->perform(request);
    if (!response.ok())
    {
        TB_LOG_WARN("{} queue request failed: {}", config_.type,
                    response.received ? std::format("HTTP {}", response.status)
                                      : response.error);
        return std::nullopt;
    }
    auto items = parse_queue(response.body);
    if (!items)
    {
        TB_LOG_WARN("{} returned a malformed queue", config_.type);
    }
    return items;
}

bool ArrQueueClient::ready_to_remove(engine::Torrent const &torrent)
{
    auto items = get_queue_updates();
    if (!items)
    {
        return false;
    }
    return std::none_of(items->begin(), items->end(),
                        [&](engine::QueueItem const &item)
                        { return item.download_id == torrent.id; });
}

std::optional<std::vector<engine::QueueItem>>
ArrQueueClient::parse_queue(std::string_view body)
{
    auto document = json::Document::parse(body);
    auto *root = document.root();
    if (root == nullptr)
    {
        return std::nullopt;
    }
    // Paged responses wrap the items in "records"; older endpoints return a
    // bare array.
    auto *records = yyjson_is_obj(root) ? yyjson_obj_get(root, "records") : root;
    if (records == nullptr || !yyjson_is_arr(records))
    {
        return std::nullopt;
    }
    std::vector<engine::QueueItem> items;
    size_t idx, max;
    yyjson_val *record;
    yyjson_arr_foreach(records, idx, max, record)
    {
        auto download_id = json::get_string(record, "downloadId");
        auto title = json::get_string(record, "title");
        if (!download_id || !title || download_id->empty())
        {
            continue;
        }
        engine::QueueItem item;
        item.download_id = to_lower(*download_id);
        item.title = *title;
        item.size = json::get_int(record, "size").value_or(0);
        items.push_back(std::move(item));
    }
    return items;
}

} // namespace tb::services
