/**
 * FetchKit - Resumable transfer manager
 *
 * Command-line entry point. Downloads one resource through a TaskRegistry,
 * reporting progress through the logger.
 *
 * @version 1.0.0
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/transfer/DiagnosticsReport.hpp"
#include "core/transfer/TaskRegistry.hpp"
#include "core/transfer/TransferSettings.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using namespace fetchkit;

namespace {

constexpr const char* kVersion = "1.0.0";

// Set from the signal handler, polled by the main loop
std::atomic<bool> g_interrupted{false};

struct Options {
    std::string url;
    std::string destination;
    std::string id;
    std::string name;
    core::transfer::HeaderMap headers;
    int retries{-1};
    std::string configPath;
    std::string reportPath;
    bool debug{false};
    bool logFile{true};
};

void signalHandler(int) {
    g_interrupted = true;
}

/**
 * Setup signal handlers for graceful cancellation
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

void printUsage(const char* program) {
    std::cout << "FetchKit - resumable transfer manager\n"
              << "\nUsage: " << program << " [options] <url> <destination>\n"
              << "\nOptions:\n"
              << "  -i, --id <id>            Task id (default: download)\n"
              << "  -n, --name <name>        Display name (default: destination file name)\n"
              << "  -H, --header <k: v>      Extra request header, repeatable\n"
              << "  -r, --retries <n>        Retry budget for this transfer\n"
              << "  -c, --config <path>      Configuration file\n"
              << "      --report <path>      Write a diagnostics report when done\n"
              << "  -d, --debug              Enable debug logging\n"
              << "      --no-log-file        Log to the console only\n"
              << "  -h, --help               Show this help message\n"
              << "  -v, --version            Show version information\n"
              << std::endl;
}

/**
 * Parse command line arguments
 * @return Exit code to return immediately, or -1 to continue
 */
int parseArguments(int argc, char* argv[], Options& options) {
    auto needValue = [&](int& i, const std::string& arg) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "fetchkit v" << kVersion << std::endl;
            return 0;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--no-log-file") {
            options.logFile = false;
        } else if (arg == "--id" || arg == "-i" ||
                   arg == "--name" || arg == "-n" ||
                   arg == "--header" || arg == "-H" ||
                   arg == "--retries" || arg == "-r" ||
                   arg == "--config" || arg == "-c" ||
                   arg == "--report") {
            const char* value = needValue(i, arg);
            if (!value) return 2;

            if (arg == "--id" || arg == "-i") {
                options.id = value;
            } else if (arg == "--name" || arg == "-n") {
                options.name = value;
            } else if (arg == "--header" || arg == "-H") {
                auto header = utils::StringUtils::parseHeader(value);
                if (!header) {
                    std::cerr << "Invalid header: " << value << std::endl;
                    return 2;
                }
                options.headers[header->first] = header->second;
            } else if (arg == "--retries" || arg == "-r") {
                options.retries = utils::StringUtils::parseInt(value, -1);
                if (options.retries < 0) {
                    std::cerr << "Invalid retry count: " << value << std::endl;
                    return 2;
                }
            } else if (arg == "--config" || arg == "-c") {
                options.configPath = value;
            } else {
                options.reportPath = value;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 2;
        } else if (options.url.empty()) {
            options.url = arg;
        } else if (options.destination.empty()) {
            options.destination = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 2;
        }
    }

    if (options.url.empty() || options.destination.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    if (options.id.empty()) {
        options.id = "download";
    }
    if (options.name.empty()) {
        options.name = fs::path(options.destination).filename().string();
    }
    return -1;
}

/**
 * Load and apply configuration, creating the file with defaults if missing
 */
bool loadConfiguration(const std::string& path) {
    auto& config = core::Config::instance();
    config.setDefaults();

    try {
        if (fs::exists(path)) {
            if (!config.load(path)) {
                std::cerr << "Failed to parse configuration: " << path << std::endl;
                return false;
            }
        } else if (!config.save(path)) {
            std::cerr << "Could not create default configuration at " << path << std::endl;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return false;
    }
}

void initializeLogging(const Options& options) {
    auto& config = core::Config::instance();

    auto level = core::Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    if (options.debug) {
        level = core::LogLevel::Debug;
    }

    std::string logDir = config.get<std::string>("logging.directory", "");
    if (logDir.empty()) {
        logDir = utils::PathUtils::getLogsPath().string();
    }

    bool fileOutput = options.logFile && config.get<bool>("logging.file", true);
    core::Logger::instance().initialize(level, logDir, fileOutput);
}

/**
 * Log progress at most once per second, and every state change
 */
core::transfer::GlobalCallback makeProgressReporter() {
    auto lastReport = std::make_shared<std::chrono::steady_clock::time_point>();

    return [lastReport](const std::string& taskId,
                        const core::transfer::TaskSnapshot& task,
                        core::transfer::TaskEvent event) {
        using core::transfer::TaskEvent;
        const auto& metrics = task.metrics;

        if (event != TaskEvent::Progress) {
            LOG_INFO("[{}] {}", taskId, core::transfer::toString(event));
            return;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - *lastReport < std::chrono::seconds(1)) {
            return;
        }
        *lastReport = now;

        std::string done = utils::StringUtils::formatBytes(static_cast<int64_t>(metrics.downloadedSize));
        std::string speed = utils::StringUtils::formatSpeed(metrics.speedBps);
        std::string eta = utils::StringUtils::formatEta(metrics.etaSeconds);

        if (metrics.progressPercent) {
            LOG_INFO("[{}] {} of {} ({}) at {}, ETA {}", taskId, done,
                     utils::StringUtils::formatBytes(static_cast<int64_t>(metrics.totalSize)),
                     utils::StringUtils::formatPercentage(*metrics.progressPercent),
                     speed, eta);
        } else {
            LOG_INFO("[{}] {} at {}", taskId, done, speed);
        }
    };
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;
    int exitCode = parseArguments(argc, argv, options);
    if (exitCode >= 0) {
        return exitCode;
    }

    std::string configPath = options.configPath.empty()
        ? utils::PathUtils::getConfigPath().string()
        : options.configPath;
    if (!loadConfiguration(configPath)) {
        return 1;
    }

    initializeLogging(options);
    auto& logger = core::Logger::instance();
    logger.info("fetchkit v{} starting", kVersion);
    logger.debug("Configuration: {}", configPath);

    setupSignalHandlers();

    try {
        using namespace core::transfer;

        TaskRegistry registry(TransferSettings::fromConfig(core::Config::instance()));
        registry.subscribeAll(makeProgressReporter());

        registry.create(options.id, options.name, options.url, options.destination, "", options.headers);
        if (options.retries >= 0 && !registry.setMaxRetries(options.id, options.retries)) {
            logger.warn("Could not apply retry budget {} to {}", options.retries, options.id);
        }

        if (!registry.start(options.id)) {
            logger.critical("Failed to start transfer {}", options.id);
            return 1;
        }

        std::optional<TaskSnapshot> result;
        bool cancelRequested = false;
        while (true) {
            if (g_interrupted && !cancelRequested) {
                logger.warn("Interrupted, cancelling {}", options.id);
                cancelRequested = true;
                registry.cancel(options.id);
            }

            result = registry.waitFor(options.id, std::chrono::milliseconds(200));
            if (!result || result->isTerminal()) {
                break;
            }
        }

        if (!options.reportPath.empty() && !DiagnosticsReport::writeTo(registry, options.reportPath)) {
            logger.warn("Diagnostics report not written");
        }

        registry.shutdown();

        if (!result) {
            logger.critical("Task {} disappeared", options.id);
            return 1;
        }

        switch (result->status) {
            case TaskStatus::Completed:
                logger.info("Saved {} ({}) to {}", options.url,
                            utils::StringUtils::formatBytes(static_cast<int64_t>(result->metrics.downloadedSize)),
                            options.destination);
                return 0;
            case TaskStatus::Failed:
                logger.error("Transfer failed after {} retries: {}", result->retryCount,
                             result->errorMessage.value_or("unknown error"));
                return 1;
            default:
                logger.warn("Transfer ended as {}", toString(result->status));
                return 1;
        }

    } catch (const core::FetchError& e) {
        logger.critical("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
