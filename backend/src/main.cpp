#include "app/DaemonMain.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/SchedulerService.hpp"
#include "engine/TorrentRegistry.hpp"
#include "engine/TransferHistoryStore.hpp"
#include "engine/TransferOrchestrator.hpp"
#include "rpc/Server.hpp"
#include "services/ArrQueueClient.hpp"
#include "services/DelugeWebClient.hpp"
#include "services/HttpClient.hpp"
#include "services/LocalFileTransport.hpp"
#include "services/ScpFileTransport.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace
{

constexpr char const *kHistoryDatabaseName = "transfer_history.db";

void print_usage()
{
    tb::log::print_status("usage: torrentbridge [--config <path>]");
}

std::shared_ptr<tb::engine::FileTransport>
make_transport(tb::engine::TransferConfig const &config)
{
    if (config.type == "scp")
    {
        return std::make_shared<tb::services::ScpFileTransport>(config);
    }
    return std::make_shared<tb::services::LocalFileTransport>();
}

} // namespace

namespace tb::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        std::signal(SIGINT, [](int) { tb::runtime::request_shutdown(); });
        std::signal(SIGTERM, [](int) { tb::runtime::request_shutdown(); });

        std::filesystem::path config_path = "config.json";
        for (int index = 1; index < argc; ++index)
        {
            if (argv[index] == nullptr)
            {
                continue;
            }
            std::string_view arg = argv[index];
            if (arg == "--config" && index + 1 < argc)
            {
                config_path = argv[++index];
            }
            else if (arg.starts_with("--config="))
            {
                config_path = std::string(arg.substr(9));
            }
            else if (arg == "--help" || arg == "-h")
            {
                print_usage();
                return 0;
            }
            else
            {
                tb::log::print_status("unknown argument: {}", arg);
                print_usage();
                return 1;
            }
        }

        auto loaded = tb::engine::load_config(config_path);
        if (!loaded.config)
        {
            tb::log::print_status("Failed to load {}: {}", config_path.string(),
                                  loaded.error);
            return 1;
        }
        auto config = std::move(*loaded.config);

        if (!config.state_dir.empty())
        {
            tb::utils::set_data_root(config.state_dir);
        }
        auto root = tb::utils::data_root();
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        if (ec)
        {
            tb::log::print_status("Cannot create state directory {}: {}",
                                  root.string(), ec.message());
            return 1;
        }
        config.state_dir = root;
        tb::log::set_min_level(tb::log::parse_level(config.log_level));

        TB_LOG_INFO("torrentbridge {} starting; state in {}",
                    tb::version::kUserAgentVersion, root.string());

        tb::engine::ConfigurationService configuration(config_path, config);

        std::unique_ptr<tb::engine::TransferHistoryStore> history;
        if (config.history.enabled)
        {
            history = std::make_unique<tb::engine::TransferHistoryStore>(
                root / kHistoryDatabaseName);
            if (!history->is_valid())
            {
                TB_LOG_ERROR("Transfer history unavailable; continuing "
                             "without it");
                history.reset();
            }
            else
            {
                if (history->recovered_count() > 0)
                {
                    TB_LOG_WARN("Marked {} interrupted transfers as failed",
                                history->recovered_count());
                }
                if (config.history.retention_days > 0)
                {
                    auto pruned = history->prune_old_entries(
                        config.history.retention_days);
                    TB_LOG_INFO("Pruned {} transfer records older than {} days",
                                pruned, config.history.retention_days);
                }
                history->start();
            }
        }
        else
        {
            TB_LOG_INFO("Transfer history disabled by configuration");
        }

        tb::engine::TorrentRegistry registry(
            root / config.state_file,
            std::chrono::seconds(config.matching.first_seen_window_seconds));
        if (!registry.load())
        {
            TB_LOG_ERROR("Registry snapshot {} is unreadable; starting empty",
                         registry.snapshot_path().string());
        }
        TB_LOG_INFO("Loaded {} torrents from {}", registry.size(),
                    registry.snapshot_path().string());

        tb::engine::OrchestratorSettings settings;
        settings.retry = config.retry;
        settings.matching = config.matching;
        settings.track_progress = config.history.track_progress;
        tb::engine::TransferOrchestrator orchestrator(registry, history.get(),
                                                      settings);

        auto http = std::make_shared<tb::services::HttpClient>();
        for (auto const &manager : config.media_managers)
        {
            orchestrator.add_media_manager(
                std::make_shared<tb::services::ArrQueueClient>(manager, http));
        }
        for (auto const &client : config.download_clients)
        {
            orchestrator.add_download_client(
                std::make_shared<tb::services::DelugeWebClient>(client, http));
        }
        for (auto const &connection : config.connections)
        {
            if (!orchestrator.add_connection(connection,
                                             make_transport(connection.transfer)))
            {
                tb::log::print_status("Connection '{}' references unknown "
                                      "clients",
                                      connection.name);
                return 1;
            }
        }

        tb::rpc::ServerOptions rpc_options;
        rpc_options.rpc_path = config.rpc_path;
        rpc_options.token = config.rpc_token;
        tb::rpc::Server rpc(history.get(), &orchestrator, &configuration,
                            config.rpc_bind, rpc_options);
        if (!rpc.start())
        {
            TB_LOG_ERROR("RPC unavailable; continuing without operator access");
        }

        tb::engine::SchedulerService scheduler;
        scheduler.schedule(
            std::chrono::seconds(config.poll_interval_seconds),
            [&orchestrator]() { orchestrator.run_cycle(); },
            tb::engine::SchedulerService::Clock::now(), true);

        tb::log::print_status("torrentbridge running; CTRL+C to stop.");

        while (!tb::runtime::should_shutdown())
        {
            scheduler.tick(tb::engine::SchedulerService::Clock::now());
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        TB_LOG_INFO("Shutdown requested; stopping RPC and history...");
        rpc.stop();
        if (history)
        {
            history->stop();
        }
        if (!registry.save())
        {
            TB_LOG_ERROR("Final registry snapshot failed");
        }
        if (!configuration.persist_if_dirty())
        {
            TB_LOG_ERROR("Failed to persist configuration to {}",
                         config_path.string());
        }

        tb::log::print_status("Shutdown complete.");
        TB_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "torrentbridge failed: %s\n", ex.what());
    }
    return 1;
}

} // namespace tb::app

int main(int argc, char *argv[])
{
    return tb::app::daemon_main(argc, argv);
}
