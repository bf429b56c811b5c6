#pragma once

#include "engine/ConfigurationService.hpp"
#include "engine/Torrent.hpp"
#include "engine/TransferHistoryStore.hpp"
#include "utils/TransferStore.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tb::rpc
{

std::string serialize_success();
std::string serialize_message(std::string_view message);
std::string serialize_transfer(storage::TransferRecord const &record);
std::string serialize_transfer_page(storage::TransferPage const &page,
                                    int page_number, int per_page);
std::string
serialize_transfers(std::vector<storage::TransferRecord> const &records);
std::string serialize_transfer_stats(engine::TransferStats const &stats);
std::string serialize_deleted(std::int64_t deleted);
std::string serialize_torrents(std::vector<engine::Torrent> const &torrents);
std::string serialize_config(engine::BridgeConfig const &config);
std::string serialize_history_config(engine::HistorySettings const &history);
std::string serialize_error(std::string_view message,
                            std::optional<std::string_view> details = std::nullopt);

} // namespace tb::rpc
