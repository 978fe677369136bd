/**
 * @file ActionDispatcher.hpp
 * @brief Executes action descriptors through the external capabilities
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_ACTION_DISPATCHER_HPP
#define FINGERLAUNCH_ACTION_DISPATCHER_HPP

#include <memory>
#include <string>
#include "ActionTypes.hpp"
#include "Capabilities.hpp"
#include "ExecutableResolver.hpp"

namespace fingerlaunch {
namespace action {

/**
 * @brief Capabilities available to the dispatcher
 *
 * Any member may be null: the matching action kind then reports
 * not-acted instead of pretending to succeed.
 */
struct CapabilitySet {
    std::shared_ptr<UrlOpener> url_opener;
    std::shared_ptr<ProcessLauncher> process_launcher;
    std::shared_ptr<SpeechEngine> speech_engine;
};

/**
 * @brief Maps an ActionDescriptor onto one capability call
 *
 * dispatch() returns true only when the action was actually performed:
 * - NoOp: always false
 * - OpenUrl: true once the browser request was issued without a fault
 * - OpenProgram: true if an executable was resolved and launched without a fault
 * - SayText: false without a speech engine; with one, speech faults are
 *   logged and the action still counts as performed
 *
 * Capability faults are caught here and never reach the tick loop.
 *
 * Thread-safety: Not thread-safe. Owned by the single tick loop.
 */
class ActionDispatcher {
public:
    /**
     * @param capabilities External collaborators (members may be null)
     * @param resolver Executable resolver for OpenProgram
     * @throws core::Exception with ERROR_INVALID_PARAMETER if resolver is null
     */
    ActionDispatcher(CapabilitySet capabilities,
                     std::unique_ptr<ExecutableResolver> resolver);

    ~ActionDispatcher();

    // Disable copy, allow move
    ActionDispatcher(const ActionDispatcher&) = delete;
    ActionDispatcher& operator=(const ActionDispatcher&) = delete;
    ActionDispatcher(ActionDispatcher&&) noexcept;
    ActionDispatcher& operator=(ActionDispatcher&&) noexcept;

    /**
     * @brief Perform the action
     * @return true if the action was performed
     */
    bool dispatch(const ActionDescriptor& descriptor);

    /**
     * @brief Speak a short confirmation for an acted descriptor
     *
     * Advisory only: does nothing when voice feedback is off or no speech
     * engine is present, and never throws.
     */
    void announce(const ActionDescriptor& descriptor);

    void setVoiceFeedback(bool enable);

    bool isVoiceFeedbackEnabled() const;

    bool hasSpeech() const;

    /**
     * @brief Diagnostic for the last dispatch that returned false
     */
    std::string getLastError() const;

    const ExecutableResolver& resolver() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

} // namespace action
} // namespace fingerlaunch

#endif // FINGERLAUNCH_ACTION_DISPATCHER_HPP
