#pragma once

#include "engine/Adapters.hpp"
#include "engine/ConfigurationService.hpp"
#include "services/HttpClient.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tb::services
{

// Radarr / Sonarr v3 download queue reader.
class ArrQueueClient : public engine::MediaManager
{
  public:
    explicit ArrQueueClient(engine::MediaManagerConfig config,
                            std::shared_ptr<HttpClient> http = {});

    std::string const &kind() const override
    {
        return config_.type;
    }
    std::optional<std::vector<engine::QueueItem>> get_queue_updates() override;
    // True once the torrent's id has left the queue. A failed fetch is
    // reported as not ready.
    bool ready_to_remove(engine::Torrent const &torrent) override;

    static std::optional<std::vector<engine::QueueItem>>
    parse_queue(std::string_view body);

  private:
    std::string queue_url() const;

    engine::MediaManagerConfig config_;
    std::shared_ptr<HttpClient> http_;
};

} // namespace tb::services
