/**
 * @file app.cpp
 * @brief Command line entry point for tandem
 *
 * Launches editor sessions, stops them from any shell, and waits for their
 * completion. Results are printed to stdout; logs go to stderr.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "config/session_config.hpp"
#include "session/session.hpp"
#include "utils/logging/spdlog_config.hpp"

namespace fs = std::filesystem;
using namespace tandem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

std::atomic<bool> g_interrupted{false};

/**
 * @brief Signal handler for graceful shutdown
 */
void signalHandler(int) { g_interrupted = true; }

struct CommandLine {
    std::string command;
    std::optional<fs::path> configPath;
    std::optional<std::string> stateDirectory;
    bool verbose{false};
    bool help{false};
    std::optional<fs::path> resourcePath;
    std::optional<fs::path> workDirectory;
    std::optional<std::string> sessionId;
    std::vector<std::string> editorArguments;
    bool explicitArguments{false};
};

void printUsage(const char* program) {
    std::cout
        << "Usage: " << program << " [options] <command> [command options]\n"
        << "Commands:\n"
        << "  launch --resource <dir> --workdir <dir> [-- <args>...]\n"
        << "                      Launch a session and wait for it to finish\n"
        << "  stop [--session <id>]\n"
        << "                      Stop a session (default: the current one)\n"
        << "  wait <id>           Wait for a session launched elsewhere\n"
        << "  list                Print active sessions as JSON\n"
        << "Options:\n"
        << "  --config <file>     JSON configuration file\n"
        << "  --state-dir <dir>   Session state directory\n"
        << "  --verbose           Debug logging\n"
        << "  --help, -h          Show this help message\n";
}

std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--") {
            cmd.explicitArguments = true;
            cmd.editorArguments.assign(argv + i + 1, argv + argc);
            break;
        }
        if (arg == "--config" && i + 1 < argc) {
            cmd.configPath = fs::path(argv[++i]);
        } else if (arg == "--state-dir" && i + 1 < argc) {
            cmd.stateDirectory = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--resource" && i + 1 < argc) {
            cmd.resourcePath = fs::path(argv[++i]);
        } else if (arg == "--workdir" && i + 1 < argc) {
            cmd.workDirectory = fs::path(argv[++i]);
        } else if (arg == "--session" && i + 1 < argc) {
            cmd.sessionId = argv[++i];
        } else if (arg.starts_with("-")) {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (cmd.command.empty()) {
            cmd.command = arg;
        } else if (cmd.command == "wait" && !cmd.sessionId) {
            cmd.sessionId = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return cmd;
}

int reportError(session::SessionError error) {
    std::cerr << "Error: " << session::sessionErrorToString(error) << "\n";
    return kExitError;
}

int printResult(const session::CompletionResult& result, size_t maxLength) {
    std::cout << session::describe(result, maxLength) << std::endl;
    return kExitOk;
}

/**
 * @brief Block on a wait; Ctrl+C stops the session being waited on
 */
session::Result<session::CompletionResult> awaitResult(
    session::SessionOrchestrator& orchestrator, const std::string& sessionId,
    bool stopOnInterrupt) {
    auto future = orchestrator.waitFor(sessionId);
    bool stopRequested = false;
    while (future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (g_interrupted && stopOnInterrupt && !stopRequested) {
            stopRequested = true;
            spdlog::warn("Interrupted, stopping session {}", sessionId);
            if (auto stopped = orchestrator.stopById(sessionId); !stopped) {
                return std::unexpected(stopped.error());
            }
        } else if (g_interrupted && !stopOnInterrupt) {
            return std::unexpected(session::SessionError::WaitFailed);
        }
    }
    return future.get();
}

int runLaunch(session::SessionOrchestrator& orchestrator, const CommandLine& cmd) {
    if (!cmd.resourcePath || !cmd.workDirectory) {
        std::cerr << "launch requires --resource and --workdir\n";
        return kExitUsage;
    }

    session::LaunchRequest request;
    request.resourcePath = fs::absolute(*cmd.resourcePath);
    request.workDirectory = fs::absolute(*cmd.workDirectory);
    if (cmd.explicitArguments) {
        request.arguments = cmd.editorArguments;
    } else {
        request.arguments = {"--extensionDevelopmentPath=" + request.resourcePath.string(),
                             "--disable-extensions", "--wait",
                             request.workDirectory.string()};
    }

    auto sessionId = orchestrator.launchSession(request);
    if (!sessionId) {
        return reportError(sessionId.error());
    }
    std::cerr << "Launched session " << *sessionId << ", waiting for completion\n";

    auto result = awaitResult(orchestrator, *sessionId, true);
    if (!result) {
        return reportError(result.error());
    }
    return printResult(*result, orchestrator.getConfig().maxSummaryLength);
}

int runStop(session::SessionOrchestrator& orchestrator, const CommandLine& cmd) {
    auto result = cmd.sessionId ? orchestrator.stopById(*cmd.sessionId)
                                : orchestrator.stopCurrent();
    if (!result) {
        return reportError(result.error());
    }
    return printResult(*result, orchestrator.getConfig().maxSummaryLength);
}

int runWait(session::SessionOrchestrator& orchestrator, const CommandLine& cmd) {
    if (!cmd.sessionId) {
        std::cerr << "wait requires a session id\n";
        return kExitUsage;
    }
    auto result = awaitResult(orchestrator, *cmd.sessionId, false);
    if (!result) {
        return reportError(result.error());
    }
    return printResult(*result, orchestrator.getConfig().maxSummaryLength);
}

int runList(session::SessionOrchestrator& orchestrator) {
    auto sessions = orchestrator.listSessions();
    if (!sessions) {
        return reportError(sessions.error());
    }
    auto current = orchestrator.currentSession();
    if (!current) {
        return reportError(current.error());
    }

    session::json document = session::json::array();
    for (const auto& record : *sessions) {
        auto entry = record.toJson();
        entry["current"] = *current == record.sessionId;
        document.push_back(std::move(entry));
    }
    std::cout << document.dump(2, ' ', false, session::json::error_handler_t::replace) << std::endl;
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Default logging until the configuration is known
    logging::LogConfig::initialize();

    auto cmd = parseCommandLine(argc, argv);
    if (!cmd) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (cmd->help) {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (cmd->command.empty()) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    auto settings = config::loadSessionConfig(cmd->configPath);
    if (!settings) {
        return reportError(settings.error());
    }
    if (cmd->stateDirectory) {
        settings->stateDirectory = *cmd->stateDirectory;
    }
    if (cmd->verbose) {
        settings->logLevel = "debug";
    }

    logging::LoggerConfig loggerConfig;
    loggerConfig.level = logging::logLevelFromString(settings->logLevel);
    if (!settings->logFile.empty()) {
        loggerConfig.file_output = true;
        loggerConfig.log_file_path = settings->logFile;
    }
    if (!logging::LogConfig::initialize(loggerConfig)) {
        std::cerr << "Error: cannot open log file " << settings->logFile << "\n";
        return kExitError;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int status = kExitUsage;
    {
        session::SessionOrchestrator orchestrator(*settings);
        if (cmd->command == "launch") {
            status = runLaunch(orchestrator, *cmd);
        } else if (cmd->command == "stop") {
            status = runStop(orchestrator, *cmd);
        } else if (cmd->command == "wait") {
            status = runWait(orchestrator, *cmd);
        } else if (cmd->command == "list") {
            status = runList(orchestrator);
        } else {
            std::cerr << "Unknown command: " << cmd->command << "\n";
            printUsage(argv[0]);
        }
    }

    logging::LogConfig::flushAll();
    return status;
}
