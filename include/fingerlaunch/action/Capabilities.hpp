/**
 * @file Capabilities.hpp
 * @brief Narrow interfaces to the external collaborators the dispatcher drives
 *
 * Each call is fire-and-forget: it returns once the request has been handed
 * off (browser asked, process spawned, utterance queued) and throws on a
 * fault. Implementations must not block on the launched program.
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_ACTION_CAPABILITIES_HPP
#define FINGERLAUNCH_ACTION_CAPABILITIES_HPP

#include <string>
#include <vector>

namespace fingerlaunch {
namespace action {

/**
 * @brief Opens URLs in the user's browser
 */
class UrlOpener {
public:
    virtual ~UrlOpener() = default;

    /**
     * @throws core::CapabilityException (or any std::exception) on fault
     */
    virtual void openUrl(const std::string& url) = 0;
};

/**
 * @brief Spawns detached processes
 */
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /**
     * @param executable Resolved executable path or command name
     * @param arguments Command line arguments (without argv[0])
     * @throws core::CapabilityException (or any std::exception) on fault
     */
    virtual void launchDetached(const std::string& executable,
                                const std::vector<std::string>& arguments = {}) = 0;
};

/**
 * @brief Queues text for speech output
 */
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;

    /**
     * @throws core::CapabilityException (or any std::exception) on fault
     */
    virtual void say(const std::string& text) = 0;
};

} // namespace action
} // namespace fingerlaunch

#endif // FINGERLAUNCH_ACTION_CAPABILITIES_HPP
