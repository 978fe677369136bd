/**
 * @file main.cpp
 * @brief FingerLaunch command line entry point
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#include <QGuiApplication>

#include <fingerlaunch/app/GestureLauncher.hpp>
#include <fingerlaunch/app/LauncherConfiguration.hpp>
#include <fingerlaunch/core/Logger.hpp>
#include <fingerlaunch/core/exception.h>
#include <fingerlaunch/platform/QtCapabilities.hpp>
#include <fingerlaunch/platform/QtLogHandler.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

using namespace fingerlaunch;

// Set by SIGINT/SIGTERM, polled by the tick loop
static volatile std::sig_atomic_t stop_requested = 0;

static void signal_handler(int) {
    stop_requested = 1;
}

namespace {

struct CommandLine {
    std::string config_path;
    std::optional<int> camera;
    std::optional<core::LogLevel> log_level;
    bool no_voice = false;
    bool help = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Launch applications with finger-count hand gestures.\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>      YAML configuration file\n"
              << "  --camera <index>     Webcam index (overrides configuration)\n"
              << "  --log-level <level>  TRACE, DEBUG, INFO, WARNING, ERROR or CRITICAL\n"
              << "  --no-voice           Disable spoken confirmations\n"
              << "  --help               Show this help\n";
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                        flag + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (arg == "--config") {
            cli.config_path = value(arg);
        } else if (arg == "--camera") {
            const std::string index = value(arg);
            try {
                cli.camera = std::stoi(index);
            } catch (const std::exception&) {
                FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                        "--camera expects an integer, got '" + index + "'");
            }
        } else if (arg == "--log-level") {
            const std::string name = value(arg);
            core::LogLevel level;
            if (!core::parseLogLevel(name, level)) {
                FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                        "unknown log level '" + name + "'");
            }
            cli.log_level = level;
        } else if (arg == "--no-voice") {
            cli.no_voice = true;
        } else {
            FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                    "unknown option '" + arg + "'");
        }
    }
    return cli;
}

void initializeLogging(const app::LoggingConfig& logging) {
    auto& logger = core::Logger::getInstance();

    if (logging.file) {
        if (logger.initializeWithTimestamp(logging.directory, logging.level)) {
            logger.info("Log file: " + logger.getCurrentLogFile());
        } else {
            std::cerr << "[LOGGING] Warning: File logging initialization failed, using console only" << std::endl;
        }
    } else {
        logger.configure(logging.level, logging.console);
    }
    logger.setConsoleOutput(logging.console);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    CommandLine cli;
    app::LauncherConfiguration config;
    try {
        cli = parseCommandLine(argc, argv);
        if (cli.help) {
            printUsage(argv[0]);
            return 0;
        }

        config = cli.config_path.empty()
            ? app::LauncherConfiguration::defaults()
            : app::LauncherConfiguration::loadFromFile(cli.config_path);

        if (cli.camera) {
            config.capture.webcam_index = *cli.camera;
        }
        if (cli.log_level) {
            config.logging.level = *cli.log_level;
        }
        if (cli.no_voice) {
            config.feedback.voice = false;
        }
        config.validate();
    } catch (const core::Exception& e) {
        std::cerr << "Error: " << e.getMessage() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    QGuiApplication application(argc, argv);
    application.setApplicationName("FingerLaunch");
    application.setOrganizationName("FingerLaunch Project");

    initializeLogging(config.logging);
    auto& logger = core::Logger::getInstance();

    platform::QtLogHandler::install();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int result = 0;
    try {
        logger.info("=== FingerLaunch ===");
        if (!cli.config_path.empty()) {
            logger.info("Configuration: " + cli.config_path);
        }

        action::CapabilitySet capabilities;
        capabilities.url_opener = std::make_shared<platform::QtUrlOpener>();
        capabilities.process_launcher = std::make_shared<platform::QtProcessLauncher>();
        capabilities.speech_engine = platform::QtSpeechEngine::create();
        if (!capabilities.speech_engine) {
            logger.warning("No text-to-speech backend, say_text actions are disabled");
        }

        app::GestureLauncher launcher(config, std::move(capabilities));
        launcher.setStopCondition([]() { return stop_requested != 0; });
        launcher.start();

        result = application.exec();
        launcher.stop();

        logger.info("=== Shutdown, exit code " + std::to_string(result) + " ===");

    } catch (const core::Exception& e) {
        logger.critical(std::string("FATAL ERROR: ") + e.what());
        std::cerr << "FATAL ERROR: " << e.getMessage() << std::endl;
        result = 1;
    } catch (const std::exception& e) {
        logger.critical(std::string("FATAL ERROR: ") + e.what());
        std::cerr << "FATAL ERROR: " << e.what() << std::endl;
        result = 1;
    }

    logger.flush();
    platform::QtLogHandler::uninstall();
    return result;
}
