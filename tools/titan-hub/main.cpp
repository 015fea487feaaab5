#include "SimulatedHandlers.h"

#include <titan/hub/IntelligenceHub.h>
#include <titan/hub/SettingsStore.h>
#include <titan/hub/components/WorkCoordinator.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

void configureLogging(const std::string& level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!logFile.empty()) {
        try {
            std::filesystem::path p(logFile);
            if (p.has_parent_path()) {
                std::filesystem::create_directories(p.parent_path());
            }
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, max_size, max_files));
        } catch (const std::exception& e) {
            std::cerr << "Cannot open log file " << logFile << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("titan-hub", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Titan Intelligence Hub - task scheduling and insight host"};

    std::string settingsPath;
    std::size_t workers = 0;
    std::string logLevel = "info";
    std::string logFile;
    std::vector<std::string> tabs;
    std::vector<std::string> commands;
    int durationSeconds = 10;
    int reaperIntervalMs = 10000;
    int insightIntervalMs = 120000;
    int latencyMs = 200;
    double failureRate = 0.0;
    std::size_t maxConcurrent = 0;
    bool printStats = false;

    app.add_option("--settings", settingsPath,
                   "Settings file (default: $TITAN_SETTINGS_PATH or XDG config dir)");
    app.add_option("--workers", workers, "Number of worker threads (0 = hardware concurrency)")
        ->default_val(0);
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)")
        ->default_val("info");
    app.add_option("--log-file", logFile, "Also log to this rotating file");
    app.add_option("--tab", tabs, "Register a simulated tab (repeatable)");
    app.add_option("--command", commands, "Run a command on the first tab (repeatable)");
    app.add_option("--duration", durationSeconds, "Seconds to run before shutting down")
        ->default_val(10)
        ->check(CLI::NonNegativeNumber);
    app.add_option("--reaper-interval-ms", reaperIntervalMs, "Stuck-task sweep period")
        ->default_val(10000)
        ->check(CLI::PositiveNumber);
    app.add_option("--insight-interval-ms", insightIntervalMs, "Trend insight period")
        ->default_val(120000)
        ->check(CLI::PositiveNumber);
    app.add_option("--latency-ms", latencyMs, "Simulated handler latency")
        ->default_val(200)
        ->check(CLI::NonNegativeNumber);
    app.add_option("--failure-rate", failureRate, "Fraction of simulated handler failures")
        ->default_val(0.0)
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--max-concurrent", maxConcurrent,
                   "Override the concurrency cap (1-20) and persist it");
    app.add_flag("--stats", printStats, "Print hub statistics as JSON on exit");

    CLI11_PARSE(app, argc, argv);

    configureLogging(logLevel, logFile);

    std::filesystem::path settingsFile =
        settingsPath.empty() ? titan::hub::resolveDefaultSettingsPath()
                             : std::filesystem::path(settingsPath);
    spdlog::info("Using settings file {}", settingsFile.string());

    titan::hub::WorkCoordinator coordinator;
    coordinator.start(workers == 0 ? std::nullopt : std::optional<std::size_t>(workers));

    int exitCode = 0;
    {
        titan::hub::IntelligenceHub::Options options;
        options.reaperInterval = std::chrono::milliseconds(reaperIntervalMs);
        options.insightInterval = std::chrono::milliseconds(insightIntervalMs);

        titan::hub::IntelligenceHub hub(
            {coordinator.getExecutor(),
             std::make_shared<titan::hub::JsonFileSettingsStore>(settingsFile)},
            options);

        titan::tools::SimulationOptions simulation;
        simulation.latency = std::chrono::milliseconds(latencyMs);
        simulation.failureRate = failureRate;
        auto registered = titan::tools::registerSimulatedHandlers(hub.capabilities(), simulation);
        spdlog::info("Registered {} simulated handler(s)", registered);

        if (maxConcurrent > 0) {
            titan::hub::IntelligenceConfigUpdate update;
            update.maxConcurrentTasks = maxConcurrent;
            if (auto res = hub.configure(update); !res) {
                spdlog::warn("Could not persist concurrency cap: {}", res.error().message);
            }
        }

        hub.subscribeInsights([](const titan::hub::IntelligenceInsight& insight) {
            spdlog::info("Insight: {} - {} (confidence {:.2f})", insight.title,
                         insight.description, insight.confidence);
        });

        hub.start();

        if (tabs.empty() && !commands.empty()) {
            tabs.push_back("tab1");
        }
        for (const auto& tab : tabs) {
            hub.subscribeTaskUpdates(tab, [](const titan::hub::IntelligenceTask& task) {
                spdlog::info("Task {} -> {}{}", task.id, titan::hub::statusName(task.status),
                             task.error ? " (" + *task.error + ")" : std::string());
            });
            auto target = std::make_shared<titan::tools::SimulatedRenderTarget>(
                "https://example.com/" + tab, "Tab " + tab);
            if (auto res = hub.registerTab(tab, target); !res) {
                spdlog::error("Cannot register tab {}: {}", tab, res.error().message);
                exitCode = 1;
            }
        }

        std::mutex mutex;
        std::condition_variable cv;
        bool interrupted = false;

        boost::asio::signal_set signals(*coordinator.getIOContext(), SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signo);
            std::lock_guard<std::mutex> lock(mutex);
            interrupted = true;
            cv.notify_all();
        });

        if (!tabs.empty()) {
            for (const auto& command : commands) {
                auto reply = boost::asio::co_spawn(coordinator.getExecutor(),
                                                   hub.executeCommand(tabs.front(), command),
                                                   boost::asio::use_future);
                try {
                    std::cout << command << ": " << reply.get() << std::endl;
                } catch (const std::exception& e) {
                    spdlog::error("Command '{}' aborted: {}", command, e.what());
                    exitCode = 1;
                }
            }
        }

        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, std::chrono::seconds(durationSeconds), [&] { return interrupted; });
        }

        boost::system::error_code ignored;
        signals.cancel(ignored);
        hub.stop();

        if (printStats) {
            std::cout << hub.getIntelligenceStats().dump(2) << std::endl;
        }
    }

    coordinator.stop();
    coordinator.join();
    spdlog::shutdown();
    return exitCode;
}
