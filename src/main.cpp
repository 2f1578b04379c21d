#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <chrono>
#include "common/structured_logger.h"
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "common/string_utils.h"
#include "metrics/metrics_sink.h"
#include "orchestrator/agent_runner.h"
#include "orchestrator/emergency_monitor.h"
#include "simulation/scenario.h"

using namespace deskpilot;

namespace {

const char* const VERSION = "0.3.0";

void printUsage() {
    std::cout << "Deskpilot Desktop Automation Agent\n";
    std::cout << "Usage: deskpilot --scenario <path> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>    Configuration file (default: config/deskpilot.json)\n";
    std::cout << "  --scenario <path>  Scripted desktop to run against\n";
    std::cout << "  --goal <text>      Override the scenario objective\n";
    std::cout << "  --metrics <path>   Write metrics events as JSON lines\n";
    std::cout << "  --auto-deny        Deny every confirmation and abort when paused\n";
    std::cout << "  --help, -h         Show this help message\n";
    std::cout << "  --version, -v      Show version information\n";
}

void configureLogging(const ConfigManager& config) {
    auto& slogger = StructuredLogger::getInstance();
    slogger.setLogLevel(parseLogLevel(config.getLogLevel()));

    std::shared_ptr<ILogFormatter> formatter;
    if (utils::StringUtils::toLowerCase(config.getLogFormat()) == "json") {
        formatter = std::make_shared<JsonLogFormatter>();
    } else {
        formatter = std::make_shared<TextLogFormatter>();
    }
    slogger.clearSinks();
    slogger.addSink(std::make_shared<ConsoleLogSink>(formatter));

    const std::string logFile = config.getLogFile();
    if (!logFile.empty()) {
        RotatingFileLogSink::Config fileConfig;
        fileConfig.base_path = logFile;
        fileConfig.max_file_size = static_cast<size_t>(config.getLogMaxSizeMb()) * 1024 * 1024;
        fileConfig.max_files = static_cast<size_t>(config.getLogMaxFiles());
        slogger.addSink(std::make_shared<RotatingFileLogSink>(fileConfig, std::make_shared<JsonLogFormatter>()));
    }

    slogger.setAsyncLogging(config.getLogAsync());

    SLOG_DEBUG().message("Structured logging configured")
        .context("log_level", config.getLogLevel())
        .context("log_file", logFile)
        .context("async_logging", config.getLogAsync());
}

bool isYes(const std::string& answer) {
    std::string trimmed = utils::StringUtils::toLowerCase(utils::StringUtils::trim(answer));
    return trimmed == "y" || trimmed == "yes";
}

// Reads operator answers from stdin: y/n for a pending confirmation, r to
// resume a paused run, anything else aborts it. Detached because a blocking
// read cannot be interrupted; it holds only a weak reference to the run.
void startConsoleReader(std::weak_ptr<RunHandle> weakHandle) {
    std::thread([weakHandle]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            auto handle = weakHandle.lock();
            if (!handle || handle->finished()) {
                return;
            }

            auto pending = handle->confirmations()->pendingSequence();
            if (pending) {
                handle->confirm(*pending, isYes(line));
            } else if (handle->isPaused()) {
                std::string command = utils::StringUtils::toLowerCase(utils::StringUtils::trim(line));
                if (command == "r" || command == "resume") {
                    handle->resume();
                } else {
                    handle->abort();
                }
            }
        }
    }).detach();
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config/deskpilot.json";
    std::string scenarioPath;
    std::string goalOverride;
    std::string metricsPath;
    bool autoDeny = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        else if (arg == "--version" || arg == "-v") {
            std::cout << "Deskpilot v" << VERSION << " - Desktop Automation Agent\n";
            return 0;
        }
        else if (arg == "--auto-deny") {
            autoDeny = true;
        }
        else if (arg == "--config" || arg == "--scenario" || arg == "--goal" || arg == "--metrics") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " option requires an argument\n";
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--config") configPath = value;
            else if (arg == "--scenario") scenarioPath = value;
            else if (arg == "--goal") goalOverride = value;
            else metricsPath = value;
        }
        else {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (scenarioPath.empty()) {
        std::cerr << "Error: --scenario is required; this build has no live desktop backend\n";
        printUsage();
        return 1;
    }

    try {
        auto& config = ConfigManager::getInstance();
        config.loadConfig(configPath);
        configureLogging(config);

        RunConfig runConfig = config.buildRunConfig();
        simulation::Scenario scenario = simulation::Scenario::load(scenarioPath);

        Goal goal = scenario.goal;
        if (!goalOverride.empty()) {
            goal.objective = goalOverride;
        }

        auto metrics = std::make_shared<AsyncMetricsSink>(runConfig.metricsQueueCapacity);
        if (metricsPath.empty()) {
            metricsPath = runConfig.metricsFile;
        }
        std::shared_ptr<JsonlMetricsWriter> metricsWriter;
        if (!metricsPath.empty()) {
            metricsWriter = std::make_shared<JsonlMetricsWriter>(metricsPath);
            metrics->addListener([metricsWriter](const MetricsEvent& event) {
                metricsWriter->write(event);
            });
        }

        auto confirmations = std::make_shared<ConfirmationChannel>();
        std::weak_ptr<ConfirmationChannel> weakConfirmations = confirmations;
        confirmations->setRequestListener(
            [weakConfirmations, autoDeny](uint64_t sequence, const ActionProposal& proposal,
                                          const SafetyDecision& decision) {
                if (autoDeny) {
                    if (auto channel = weakConfirmations.lock()) {
                        channel->deliver(sequence, false);
                    }
                    return;
                }
                std::cout << "\n[CONFIRM] cycle " << sequence << ": " << actionKindToString(proposal.kind)
                          << " " << proposal.target.describe() << "\n"
                          << "          " << proposal.rationale << " (" << decision.reason << ")\n"
                          << "          Allow? [y/N] " << std::flush;
            });

        AgentCollaborators collaborators;
        collaborators.perception = scenario.perception;
        collaborators.actions = scenario.actions;
        collaborators.endpoints = scenario.buildEndpoints(runConfig);
        collaborators.metrics = metrics;
        collaborators.confirmations = confirmations;

        SignalTriggerSource::install();

        std::shared_ptr<RunHandle> handle = AgentRunner::start(goal, runConfig, collaborators);

        EmergencyMonitor monitor(handle->token(), runConfig.cancellationPoll);
        monitor.addSource(std::make_shared<SignalTriggerSource>());
#ifdef _WIN32
        monitor.addSource(std::make_shared<HotkeyTriggerSource>());
#endif
        monitor.start();

        if (!autoDeny) {
            startConsoleReader(handle);
        }

        size_t announcedPauses = 0;
        while (!handle->waitFor(std::chrono::milliseconds(200))) {
            if (!handle->isPaused()) {
                continue;
            }
            auto paused = handle->lastPausedOutcome();
            if (!paused || paused->report.pauses == announcedPauses) {
                continue;
            }
            announcedPauses = paused->report.pauses;
            if (autoDeny) {
                handle->abort();
            } else {
                std::cout << "\n[PAUSED] " << paused->detail << "\n"
                          << "         Enter r to resume, anything else to abort: " << std::flush;
            }
        }

        RunOutcome outcome = handle->wait();
        monitor.stop();
        handle.reset();

        metrics->flush();
        metrics->stop();
        auto stats = metrics->getStatistics();
        SLOG_INFO().message("Metrics delivered")
            .context("recorded", stats.recorded)
            .context("delivered", stats.delivered)
            .context("dropped", stats.dropped);

        StructuredLogger::getInstance().flush();
        std::cout << outcome.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

        if (outcome.goalSatisfied()) {
            return 0;
        }
        return 2;

    } catch (const DeskpilotException& e) {
        SLOG_CRITICAL().message("Deskpilot failed to start")
            .context("type", errorTypeToString(e.type()))
            .context("error", e.what());
        StructuredLogger::getInstance().flush();
        return 1;
    } catch (const std::exception& e) {
        SLOG_CRITICAL().message("Fatal error").context("error", e.what());
        StructuredLogger::getInstance().flush();
        return 1;
    }
}
