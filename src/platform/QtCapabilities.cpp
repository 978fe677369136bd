#include <fingerlaunch/platform/QtCapabilities.hpp>
#include <fingerlaunch/core/Logger.hpp>
#include <fingerlaunch/core/exception.h>

#include <QDesktopServices>
#include <QProcess>
#include <QStringList>
#include <QTextToSpeech>
#include <QUrl>

namespace fingerlaunch {
namespace platform {

void QtUrlOpener::openUrl(const std::string& url) {
    const QUrl qurl = QUrl::fromUserInput(QString::fromStdString(url));
    if (!qurl.isValid()) {
        FINGERLAUNCH_THROW_CODE(core::CapabilityException, core::ResultCode::ERROR_INVALID_PARAMETER,
                                "Invalid URL '" + url + "'");
    }
    if (!QDesktopServices::openUrl(qurl)) {
        FINGERLAUNCH_THROW(core::CapabilityException, "No handler could open '" + url + "'");
    }
}

void QtProcessLauncher::launchDetached(const std::string& executable,
                                       const std::vector<std::string>& arguments) {
    QStringList args;
    for (const auto& arg : arguments) {
        args << QString::fromStdString(arg);
    }

    QProcess process;
    process.setProgram(QString::fromStdString(executable));
    process.setArguments(args);
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());

    qint64 pid = 0;
    if (!process.startDetached(&pid)) {
        FINGERLAUNCH_THROW(core::CapabilityException,
                           "Failed to start '" + executable + "': " + process.errorString().toStdString());
    }
    LOG_DEBUG("QtProcessLauncher: started " + executable + " (pid " + std::to_string(pid) + ")");
}

std::unique_ptr<QtSpeechEngine> QtSpeechEngine::create() {
    const QStringList engines = QTextToSpeech::availableEngines();
    if (engines.isEmpty()) {
        LOG_INFO("QtSpeechEngine: no text-to-speech engine available");
        return nullptr;
    }

    std::unique_ptr<QTextToSpeech> tts(new QTextToSpeech());
    if (tts->state() == QTextToSpeech::BackendError) {
        LOG_WARNING("QtSpeechEngine: text-to-speech backend failed to initialize");
        return nullptr;
    }

    LOG_INFO("QtSpeechEngine: using engine '" + engines.first().toStdString() + "'");
    return std::unique_ptr<QtSpeechEngine>(new QtSpeechEngine(std::move(tts)));
}

QtSpeechEngine::QtSpeechEngine(std::unique_ptr<QTextToSpeech> tts)
    : tts_(std::move(tts))
{
}

QtSpeechEngine::~QtSpeechEngine() = default;

void QtSpeechEngine::say(const std::string& text) {
    if (tts_->state() == QTextToSpeech::BackendError) {
        FINGERLAUNCH_THROW_CODE(core::CapabilityException, core::ResultCode::ERROR_CAPABILITY_UNAVAILABLE,
                                "Speech backend is in error state");
    }
    // Queued; QTextToSpeech returns immediately
    tts_->say(QString::fromStdString(text));
}

} // namespace platform
} // namespace fingerlaunch
