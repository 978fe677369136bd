#pragma once

#include <QString>
#include <QMessageLogContext>

namespace fingerlaunch {
namespace platform {

/**
 * Routes qDebug/qInfo/qWarning/qCritical output into core::Logger
 *
 * Call install() after the Logger has been initialized.
 */
class QtLogHandler {
public:
    static void install();

    /**
     * Restore the previously installed handler
     */
    static void uninstall();

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

    static QtMessageHandler previousHandler_;
};

} // namespace platform
} // namespace fingerlaunch
