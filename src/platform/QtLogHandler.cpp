#include <fingerlaunch/platform/QtLogHandler.hpp>
#include <fingerlaunch/core/Logger.hpp>

#include <cstdlib>

namespace fingerlaunch {
namespace platform {

QtMessageHandler QtLogHandler::previousHandler_ = nullptr;

void QtLogHandler::install() {
    previousHandler_ = qInstallMessageHandler(messageHandler);
}

void QtLogHandler::uninstall() {
    qInstallMessageHandler(previousHandler_);
    previousHandler_ = nullptr;
}

void QtLogHandler::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    core::LogLevel level;
    switch (type) {
        case QtDebugMsg:
            level = core::LogLevel::DEBUG;
            break;
        case QtInfoMsg:
            level = core::LogLevel::INFO;
            break;
        case QtWarningMsg:
            level = core::LogLevel::WARNING;
            break;
        case QtCriticalMsg:
            level = core::LogLevel::ERROR;
            break;
        case QtFatalMsg:
            level = core::LogLevel::CRITICAL;
            break;
        default:
            level = core::LogLevel::INFO;
            break;
    }

    std::string message = "[Qt] " + msg.toStdString();
    if (context.function) {
        message += " [" + std::string(context.function) + "]";
    }

    auto& logger = core::Logger::getInstance();
    if (context.file && context.line > 0) {
        logger.log(level, message, context.file, context.line);
    } else {
        logger.log(level, message);
    }

    // Qt requires the handler to terminate on fatal messages
    if (type == QtFatalMsg) {
        logger.flush();
        std::abort();
    }
}

} // namespace platform
} // namespace fingerlaunch
