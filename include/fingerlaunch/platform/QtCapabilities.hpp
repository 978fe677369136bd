#pragma once

/**
 * @file QtCapabilities.hpp
 * @brief Qt5 implementations of the dispatcher capabilities
 *
 * All three require a QCoreApplication (or subclass) to exist.
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#include <fingerlaunch/action/Capabilities.hpp>

#include <memory>

class QTextToSpeech;

namespace fingerlaunch {
namespace platform {

/**
 * @brief Opens URLs through QDesktopServices (system default browser)
 */
class QtUrlOpener : public action::UrlOpener {
public:
    void openUrl(const std::string& url) override;
};

/**
 * @brief Starts programs with QProcess::startDetached
 *
 * The child's stdout and stderr are discarded; the launcher never waits on it.
 */
class QtProcessLauncher : public action::ProcessLauncher {
public:
    void launchDetached(const std::string& executable,
                        const std::vector<std::string>& arguments = {}) override;
};

/**
 * @brief Non-blocking speech through QtTextToSpeech
 */
class QtSpeechEngine : public action::SpeechEngine {
public:
    /**
     * @brief Create an engine on the default backend
     * @return nullptr when no text-to-speech backend is usable
     */
    static std::unique_ptr<QtSpeechEngine> create();

    ~QtSpeechEngine() override;

    void say(const std::string& text) override;

private:
    explicit QtSpeechEngine(std::unique_ptr<QTextToSpeech> tts);

    std::unique_ptr<QTextToSpeech> tts_;
};

} // namespace platform
} // namespace fingerlaunch
