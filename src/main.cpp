/**
 * Ferry - resumable single-file downloader
 *
 * Command line front end: recovers interrupted downloads, starts or
 * resumes the requested one and pauses cleanly on SIGINT/SIGTERM.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadOptions.hpp"
#include "core/downloader/HttpSource.hpp"
#include "core/downloader/IntegrityVerifier.hpp"
#include "core/downloader/SessionManager.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using namespace ferry::core::downloader;

namespace {

std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler: only flags the request, the main loop pauses
 */
void signalHandler(int) {
    g_stopRequested = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct CommandLine {
    bool debug{false};
    std::optional<std::string> root;
    std::optional<std::string> expectedHash;
    std::optional<std::string> configPath;
    std::string url;
    std::string destination;
};

void printUsage(const char* program) {
    std::cout << "Ferry - resumable single-file downloader\n"
              << "\nUsage: " << program << " [options] URL DEST\n"
              << "\nOptions:\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -r, --root DIR       Directory downloads must stay in\n"
              << "  -s, --sha256 HEX     Expected SHA-256 of the file (or algo:hex)\n"
              << "  -c, --config FILE    Configuration file\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * @return exit code if the program should stop, nullopt to continue
 */
std::optional<int> parseArguments(int argc, char* argv[], CommandLine& cmd) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto takeValue = [&](const std::string& name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--debug" || arg == "-d") {
            cmd.debug = true;
        } else if (arg == "--root" || arg == "-r") {
            cmd.root = takeValue(arg);
            if (!cmd.root) return 2;
        } else if (arg == "--sha256" || arg == "-s") {
            cmd.expectedHash = takeValue(arg);
            if (!cmd.expectedHash) return 2;
        } else if (arg == "--config" || arg == "-c") {
            cmd.configPath = takeValue(arg);
            if (!cmd.configPath) return 2;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "Ferry v1.0.0" << std::endl;
            return 0;
        } else if (ferry::utils::StringUtils::startsWith(arg, "-")) {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        printUsage(argv[0]);
        return 2;
    }

    cmd.url = positional[0];
    cmd.destination = positional[1];
    return std::nullopt;
}

/**
 * Load configuration, writing the defaults on first run
 */
void loadConfiguration(const CommandLine& cmd) {
    auto& logger = ferry::core::Logger::instance();
    auto& config = ferry::core::Config::instance();

    fs::path configPath = cmd.configPath ? fs::path(*cmd.configPath)
                                         : ferry::utils::PathUtils::getConfigPath();

    if (config.load(configPath.string())) {
        logger.info("Configuration loaded from {}", configPath.string());
    } else if (!fs::exists(configPath) && config.save(configPath.string())) {
        logger.info("Default configuration created at {}", configPath.string());
    } else {
        logger.warn("Using built-in defaults, cannot use {}", configPath.string());
    }
}

ferry::core::LogLevel parseLogLevel(const std::string& name) {
    std::string level = ferry::utils::StringUtils::toLower(name);
    if (level == "trace") return ferry::core::LogLevel::Trace;
    if (level == "debug") return ferry::core::LogLevel::Debug;
    if (level == "info") return ferry::core::LogLevel::Info;
    if (level == "error") return ferry::core::LogLevel::Error;
    if (level == "critical") return ferry::core::LogLevel::Critical;
    if (level == "off") return ferry::core::LogLevel::Off;
    return ferry::core::LogLevel::Warn;
}

/**
 * Progress line from a status event
 */
void printStatus(const nlohmann::json& status) {
    std::cout << "\r" << status.value("state", "") << " "
              << ferry::utils::StringUtils::formatBytes(status.value("bytes_downloaded", uint64_t(0)));
    auto expected = status.find("expected_size");
    if (expected != status.end() && expected->is_number_unsigned() && expected->get<uint64_t>() > 0) {
        uint64_t total = expected->get<uint64_t>();
        double fraction = static_cast<double>(status.value("bytes_downloaded", uint64_t(0))) /
                          static_cast<double>(total);
        std::cout << " / " << ferry::utils::StringUtils::formatBytes(total)
                  << " (" << static_cast<int>(fraction * 100.0) << "%)";
    }
    std::cout << "        " << std::flush;
}

/**
 * Start the download, or resume it when a recovered task matches
 */
std::string startOrResume(SessionManager& session, const CommandLine& cmd,
                          const std::vector<std::string>& recovered) {
    auto destination = session.store().resolveDestination(cmd.destination);

    for (const auto& id : recovered) {
        DownloadStatus status = session.getDownloadStatus(id);
        if (destination && fs::path(status.destination) == *destination && status.url == cmd.url) {
            ferry::core::Logger::instance().info("Resuming interrupted download {} at byte {}",
                                                 id, status.bytesDownloaded);
            if (cmd.expectedHash) {
                auto digest = IntegrityVerifier::parse(*cmd.expectedHash);
                if (digest && status.expectedHash != digest->toString()) {
                    ferry::core::Logger::instance().warn("Download {} now expects {}", id, digest->toString());
                }
            }
            session.resumeDownload(id, cmd.expectedHash);
            return id;
        }
    }

    StartDownloadRequest request(cmd.url, cmd.destination);
    request.expectedHash = cmd.expectedHash;
    return session.startDownload(request);
}

} // namespace

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (auto exitCode = parseArguments(argc, argv, cmd)) {
        return *exitCode;
    }

    ferry::core::Logger::instance().initialize(
        cmd.debug ? ferry::core::LogLevel::Debug : ferry::core::LogLevel::Warn,
        ferry::utils::PathUtils::getLogsPath().string()
    );
    auto& logger = ferry::core::Logger::instance();
    logger.info("Ferry v1.0.0 starting...");

    setupSignalHandlers();
    loadConfiguration(cmd);

    if (!cmd.debug) {
        logger.setLevel(parseLogLevel(ferry::core::Config::instance().get<std::string>("log.level", "warn")));
    }

    DownloadOptions options = DownloadOptions::fromConfig();
    if (cmd.root) {
        options.root = *cmd.root;
    }

    auto sources = std::make_shared<SourceFactory>();
    auto http = std::make_shared<HttpSource>(HttpSourceOptions::fromConfig());
    sources->registerSource("http", http);
    sources->registerSource("https", http);

    int exitCode = 1;

    try {
        SessionManager session(options, sources);

        auto recovered = session.recover();

        std::string downloadId;
        try {
            downloadId = startOrResume(session, cmd, recovered);
        } catch (const DownloadError& e) {
            if (e.kind() == ErrorKind::AlreadyCompleted) {
                std::cout << "Already downloaded: " << cmd.destination << std::endl;
                return 0;
            }
            std::cerr << "Error [" << e.code() << "]: " << e.what() << std::endl;
            return 2;
        }

        // Events arrive on the worker thread, once per persisted chunk
        auto printed = std::make_shared<std::mutex>();
        auto lastPrint = std::make_shared<std::chrono::steady_clock::time_point>();
        auto progress = session.events().subscribe(kStatusEvent, [downloadId, printed, lastPrint](const auto& data) {
            if (data.value("download_id", "") != downloadId) return;
            std::lock_guard<std::mutex> lock(*printed);
            auto now = std::chrono::steady_clock::now();
            if (now - *lastPrint < std::chrono::milliseconds(100) && data.value("state", "") == "PersistingProgress") {
                return;
            }
            *lastPrint = now;
            printStatus(data);
        });
        auto restarts = session.events().subscribe(kRestartEvent, [downloadId, printed](const auto& data) {
            if (data.value("download_id", "") != downloadId) return;
            std::lock_guard<std::mutex> lock(*printed);
            std::cout << std::endl << "Source changed (" << data.value("reason", "")
                      << "), restarting from zero" << std::endl;
        });

        while (!session.waitForIdle(downloadId, std::chrono::milliseconds(200))) {
            if (g_stopRequested) {
                std::cout << std::endl << "Pausing..." << std::endl;
                session.pauseDownload(downloadId);
                break;
            }
        }

        session.events().unsubscribe(progress);
        session.events().unsubscribe(restarts);
        DownloadStatus status = session.getDownloadStatus(downloadId);
        std::cout << std::endl;

        switch (status.state) {
            case DownloadState::Completed:
                std::cout << "Saved " << status.destination;
                if (status.finalHash) std::cout << " (" << *status.finalHash << ")";
                std::cout << std::endl;
                exitCode = 0;
                break;
            case DownloadState::Paused:
                std::cout << "Paused at " << status.bytesDownloaded
                          << " bytes; run the same command again to resume" << std::endl;
                exitCode = 130;
                break;
            default:
                if (status.lastError) {
                    std::cerr << "Failed [" << status.lastError->code << "]: "
                              << status.lastError->message << std::endl;
                }
                exitCode = 1;
                break;
        }

        session.shutdown();

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    logger.info("Ferry shutdown complete");
    return exitCode;
}
