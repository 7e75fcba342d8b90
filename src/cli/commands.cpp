#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "channels/channel_manager.hpp"
#include "cli/runtime.hpp"
#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "media/media_fetcher.hpp"
#include "media/media_store.hpp"
#include "pipeline/worker_pool.hpp"
#include "queue/queue_json.hpp"
#include "store/sqlite_message_store.hpp"
#include "store/store_json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetPidFilePath() {
    return osintpipe::utils::GetHomePath() / ".osintpipe" / "gateway.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    std::ifstream input(GetPidFilePath());
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

struct PidFileGuard {
    ~PidFileGuard() { RemovePidFile(); }
};

void HandleSignal(int signal) {
    g_signal = signal;
}

void EnsureParentDir(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
}

std::unique_ptr<osintpipe::queue::MessageQueue> OpenQueue(const osintpipe::config::Config& config) {
    auto options = osintpipe::cli::MakeQueueOptions(config);
    EnsureParentDir(options.db_path);
    return std::make_unique<osintpipe::queue::MessageQueue>(std::move(options));
}

std::unique_ptr<osintpipe::store::SqliteMessageStore> OpenStore(const osintpipe::config::Config& config) {
    const auto path = osintpipe::utils::ExpandHome(config.store.path);
    EnsureParentDir(path);
    return std::make_unique<osintpipe::store::SqliteMessageStore>(path);
}

nlohmann::json BuildQueueStatsJson(const osintpipe::queue::QueueStats& stats) {
    return {
        {"entries", stats.entries},
        {"backlog", stats.backlog},
        {"pending", stats.pending},
        {"retryReady", stats.retry_ready},
        {"retryWaiting", stats.retry_waiting},
        {"poisoned", stats.poisoned},
        {"acked", stats.acked},
        {"deadLettered", stats.dead_lettered}
    };
}

nlohmann::json BuildWorkerStatsJson(const osintpipe::pipeline::WorkerStats& stats) {
    return {
        {"processed", stats.processed},
        {"spam", stats.spam},
        {"partial", stats.partial},
        {"full", stats.full},
        {"failed", stats.failed},
        {"deadLettered", stats.dead_lettered}
    };
}

nlohmann::json BuildStoreStatsJson(osintpipe::store::SqliteMessageStore& store) {
    nlohmann::json partitions = nlohmann::json::object();
    for (const auto& [partition, count] : store.CountByPartition()) {
        partitions[partition] = count;
    }
    return {
        {"messages", store.CountMessages()},
        {"deadLetters", store.CountDeadLetters()},
        {"partitions", std::move(partitions)}
    };
}

nlohmann::json BuildDeadLettersJson(osintpipe::store::MessageStore& store, std::size_t limit) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& entry : store.ListDeadLetters(limit)) {
        json.push_back(osintpipe::queue::DeadLetterToJson(entry));
    }
    return json;
}

std::size_t ParseLimit(const std::string& value, std::size_t fallback) {
    try {
        const auto parsed = std::stoll(value);
        return parsed > 0 ? static_cast<std::size_t>(parsed) : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

int RunGateway(const osintpipe::config::Config& config) {
    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "osintpipe gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }
    PidFileGuard pid_guard;

    auto queue = OpenQueue(config);
    auto store = OpenStore(config);
    queue->SetDeadLetterSink([&store](const osintpipe::queue::DeadLetterEntry& entry) {
        store->InsertDeadLetter(entry);
    });

    osintpipe::media::FileMediaStore media_store(osintpipe::utils::ExpandHome(config.media.root));
    osintpipe::media::UriMediaFetcher fetcher(osintpipe::media::FetchOptions{
        .timeout_s = config.media.fetch_timeout_s,
        .max_bytes = config.media.max_bytes,
    });
    osintpipe::spam::SpamFilter spam_filter;
    osintpipe::cli::LoadSpamRules(spam_filter, config.rules);
    osintpipe::routing::MessageRouter router;
    osintpipe::cli::LoadRoutingRules(router, config.rules);
    auto orchestrator = osintpipe::cli::BuildOrchestrator(config);

    osintpipe::pipeline::WorkerPool pool(
        osintpipe::pipeline::WorkerContext{*queue, *store, media_store, fetcher, spam_filter, *orchestrator, router},
        osintpipe::cli::MakePoolOptions(config));

    osintpipe::channels::ChannelManager channel_manager(config, [&queue](const osintpipe::queue::MessageEnvelope& envelope) {
        return queue->Enqueue(envelope);
    });

    const auto group = config.queue.consumer_group;
    httplib::Server http_server;
    http_server.Get("/health", [&pool, &channel_manager](const httplib::Request&, httplib::Response& res) {
        nlohmann::json status = nlohmann::json::object();
        for (const auto& [name, running] : channel_manager.Status()) {
            status[name] = running;
        }
        const nlohmann::json json = {
            {"status", "ok"},
            {"workers", pool.Size()},
            {"channels", std::move(status)},
            {"buffered", channel_manager.Buffered()},
            {"time", osintpipe::utils::NowIso()}
        };
        res.set_content(json.dump(2), "application/json");
    });
    http_server.Get("/stats", [&](const httplib::Request&, httplib::Response& res) {
        try {
            const nlohmann::json json = {
                {"queue", BuildQueueStatsJson(queue->Stats(group))},
                {"workers", BuildWorkerStatsJson(pool.Stats())},
                {"store", BuildStoreStatsJson(*store)},
                {"rules", {{"spam", spam_filter.Version()}, {"routing", router.Version()}}}
            };
            res.set_content(json.dump(2), "application/json");
        } catch (const osintpipe::PipelineError& ex) {
            res.status = 503;
            res.set_content(nlohmann::json({{"error", ex.what()}}).dump(), "application/json");
        }
    });
    http_server.Get("/dead-letters", [&store](const httplib::Request& req, httplib::Response& res) {
        const auto limit = req.has_param("limit") ? ParseLimit(req.get_param_value("limit"), 50) : 50;
        try {
            res.set_content(BuildDeadLettersJson(*store, limit).dump(2), "application/json");
        } catch (const osintpipe::StoreUnavailable& ex) {
            res.status = 503;
            res.set_content(nlohmann::json({{"error", ex.what()}}).dump(), "application/json");
        }
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    pool.Start();
    std::thread http_thread;
    if (config.api.enabled) {
        const std::string host = config.api.host;
        const int port = config.api.port;
        http_thread = std::thread([&http_server, host, port]() {
            if (!http_server.listen(host, port)) {
                osintpipe::utils::Log(osintpipe::utils::LogLevel::kError, "api", "http server failed to listen",
                    {{"host", host}, {"port", std::to_string(port)}});
            }
        });
    }
    channel_manager.StartAll();

    std::cout << "osintpipe gateway started. Press Ctrl+C to stop." << std::endl;
    while (true) {
        const int signal = g_signal;
        if (signal == SIGHUP) {
            g_signal = 0;
            osintpipe::utils::Log(osintpipe::utils::LogLevel::kInfo, "gateway", "SIGHUP received; reloading rules");
            osintpipe::cli::LoadSpamRules(spam_filter, config.rules);
            osintpipe::cli::LoadRoutingRules(router, config.rules);
        } else if (signal != 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    osintpipe::utils::Log(osintpipe::utils::LogLevel::kInfo, "gateway", "shutting down");
    channel_manager.StopAll();
    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    pool.Stop();
    queue->Shutdown();
    return 0;
}

int HupGateway() {
    const auto pid = ReadPidFile();
    if (!pid || !IsProcessRunning(*pid)) {
        std::cout << "osintpipe gateway not running." << std::endl;
        return 1;
    }
    ::kill(*pid, SIGHUP);
    std::cout << "Sent SIGHUP to gateway (pid=" << *pid << ")." << std::endl;
    return 0;
}

int RunEnqueue(const osintpipe::config::Config& config, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cout << "Usage: osintpipe enqueue <source_id> <message_id> <text> [media_uri...]" << std::endl;
        return 1;
    }
    osintpipe::queue::MessageEnvelope envelope{};
    envelope.source_id = args[0];
    envelope.message_id = args[1];
    envelope.text = args[2];
    envelope.media_refs.assign(args.begin() + 3, args.end());
    envelope.posted_at = osintpipe::utils::Now();
    auto queue = OpenQueue(config);
    const auto position = queue->Enqueue(envelope);
    std::cout << "Enqueued " << envelope.Key() << " at position " << position << std::endl;
    return 0;
}

int RunDeadLetters(const osintpipe::config::Config& config, const std::vector<std::string>& args) {
    const auto limit = args.empty() ? std::size_t{50} : ParseLimit(args[0], 50);
    auto store = OpenStore(config);
    std::cout << BuildDeadLettersJson(*store, limit).dump(2) << std::endl;
    return 0;
}

int RunReplay(const osintpipe::config::Config& config, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cout << "Usage: osintpipe replay <source_id> <message_id>" << std::endl;
        return 1;
    }
    auto store = OpenStore(config);
    const auto entry = store->GetDeadLetter(args[0], args[1]);
    if (!entry) {
        std::cout << "No dead letter for " << args[0] << ":" << args[1] << std::endl;
        return 1;
    }
    auto queue = OpenQueue(config);
    const auto position = queue->Enqueue(entry->envelope);
    store->DeleteDeadLetter(args[0], args[1]);
    std::cout << "Replayed " << entry->envelope.Key() << " at position " << position << std::endl;
    return 0;
}

int RunRoute(const osintpipe::config::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: osintpipe route <text> [topic...]" << std::endl;
        return 1;
    }
    osintpipe::routing::MessageRouter router;
    if (!osintpipe::cli::LoadRoutingRules(router, config.rules)) {
        return 1;
    }
    const std::vector<std::string> topics(args.begin() + 1, args.end());
    const auto decision = router.Route(args[0], topics);
    nlohmann::json json = {
        {"targetPartition", decision.target_partition},
        {"matchedTrigger", decision.matched_trigger ? nlohmann::json(*decision.matched_trigger)
                                                    : nlohmann::json(nullptr)},
        {"matchedPriority", decision.matched_priority ? nlohmann::json(*decision.matched_priority)
                                                      : nlohmann::json(nullptr)},
        {"rulesVersion", decision.rules_version}
    };
    std::cout << json.dump(2) << std::endl;
    return 0;
}

int RunStats(const osintpipe::config::Config& config) {
    auto queue = OpenQueue(config);
    auto store = OpenStore(config);
    const nlohmann::json json = {
        {"queue", BuildQueueStatsJson(queue->Stats(config.queue.consumer_group))},
        {"store", BuildStoreStatsJson(*store)}
    };
    std::cout << json.dump(2) << std::endl;
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: osintpipe [--config <path>] <command>\n"
              << "  gateway                                   run workers, listener and HTTP API\n"
              << "  enqueue <source> <message_id> <text> [media...]\n"
              << "  dead-letters [limit]\n"
              << "  replay <source> <message_id>\n"
              << "  route <text> [topic...]\n"
              << "  reload                                    send SIGHUP to the gateway\n"
              << "  stats" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    std::optional<std::filesystem::path> config_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    const auto command = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "reload") {
        return HupGateway();
    }

    auto config = osintpipe::config::LoadConfig(config_path);
    osintpipe::utils::SetLogConfig(osintpipe::utils::LogConfig{
        .min_level = osintpipe::utils::ParseLogLevel(config.log.level).value_or(osintpipe::utils::LogLevel::kInfo),
    });
    try {
        osintpipe::config::ValidateConfig(config);
    } catch (const std::invalid_argument& ex) {
        std::cout << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }

    try {
        if (command == "gateway") {
            return RunGateway(config);
        }
        if (command == "enqueue") {
            return RunEnqueue(config, rest);
        }
        if (command == "dead-letters") {
            return RunDeadLetters(config, rest);
        }
        if (command == "replay") {
            return RunReplay(config, rest);
        }
        if (command == "route") {
            return RunRoute(config, rest);
        }
        if (command == "stats") {
            return RunStats(config);
        }
    } catch (const osintpipe::PipelineError& ex) {
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& ex) {
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }
    PrintUsage();
    return 1;
}
