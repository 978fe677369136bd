/**
 * @file ActionDispatcher.cpp
 * @brief Implementation of the action dispatcher
 */

#include "fingerlaunch/action/ActionDispatcher.hpp"
#include "fingerlaunch/core/exception.h"
#include "fingerlaunch/core/Logger.hpp"
#include <exception>

namespace fingerlaunch {
namespace action {

/**
 * @brief PIMPL implementation for ActionDispatcher
 */
class ActionDispatcher::Impl {
public:
    CapabilitySet capabilities;
    std::unique_ptr<ExecutableResolver> resolver;
    bool voice_feedback = true;
    std::string last_error;

    Impl(CapabilitySet caps, std::unique_ptr<ExecutableResolver> res)
        : capabilities(std::move(caps))
        , resolver(std::move(res)) {}

    bool fail(const std::string& message, core::LogLevel level) {
        last_error = message;
        core::Logger::getInstance().log(level, "ActionDispatcher: " + message);
        return false;
    }

    bool openUrl(const ActionDescriptor& descriptor) {
        if (!descriptor.has_parameter()) {
            return fail("open_url mapping has no URL specified", core::LogLevel::WARNING);
        }
        if (!capabilities.url_opener) {
            return fail("Browser capability unavailable, cannot open " + *descriptor.parameter,
                        core::LogLevel::WARNING);
        }

        try {
            capabilities.url_opener->openUrl(*descriptor.parameter);
        } catch (const std::exception& e) {
            return fail("Could not open URL " + *descriptor.parameter + ": " + e.what(),
                        core::LogLevel::ERROR);
        } catch (...) {
            return fail("Could not open URL " + *descriptor.parameter + ": unknown fault",
                        core::LogLevel::ERROR);
        }

        LOG_INFO("ActionDispatcher: Opened URL " + *descriptor.parameter);
        return true;
    }

    bool openProgram(const ActionDescriptor& descriptor) {
        if (!descriptor.has_parameter()) {
            return fail("open_program mapping has no program specified", core::LogLevel::INFO);
        }
        const std::string& program = *descriptor.parameter;

        if (!capabilities.process_launcher) {
            return fail("Process launcher unavailable, cannot start " + program,
                        core::LogLevel::WARNING);
        }

        auto executable = resolver->resolve(program);
        if (!executable) {
            return fail("No executable found for '" + program + "'", core::LogLevel::INFO);
        }

        try {
            capabilities.process_launcher->launchDetached(executable->string());
        } catch (const std::exception& e) {
            if (resolver->platform() == "darwin") {
                return launchWithOpen(program, e.what());
            }
            return fail("Could not launch " + executable->string() + ": " + e.what(),
                        core::LogLevel::WARNING);
        } catch (...) {
            if (resolver->platform() == "darwin") {
                return launchWithOpen(program, "unknown fault");
            }
            return fail("Could not launch " + executable->string() + ": unknown fault",
                        core::LogLevel::WARNING);
        }

        LOG_INFO("ActionDispatcher: Launched " + executable->string());
        return true;
    }

    // macOS can still start application bundles by name through open(1)
    bool launchWithOpen(const std::string& program, const std::string& first_error) {
        LOG_DEBUG("ActionDispatcher: Direct launch failed (" + first_error + "), retrying with open -a");
        try {
            capabilities.process_launcher->launchDetached("open", {"-a", program});
        } catch (const std::exception& e) {
            return fail("Could not launch " + program + ": " + first_error + "; open -a: " + e.what(),
                        core::LogLevel::WARNING);
        } catch (...) {
            return fail("Could not launch " + program + ": " + first_error + "; open -a: unknown fault",
                        core::LogLevel::WARNING);
        }
        LOG_INFO("ActionDispatcher: Launched " + program + " via open -a");
        return true;
    }

    bool sayText(const ActionDescriptor& descriptor) {
        if (!descriptor.has_parameter()) {
            return fail("say_text mapping has no text specified", core::LogLevel::WARNING);
        }
        if (!capabilities.speech_engine) {
            return fail("Speech engine unavailable, not speaking \"" + *descriptor.parameter + "\"",
                        core::LogLevel::INFO);
        }

        try {
            capabilities.speech_engine->say(*descriptor.parameter);
        } catch (const std::exception& e) {
            // Best-effort output, the request still counts as performed
            LOG_WARNING("ActionDispatcher: Speech failed: " + std::string(e.what()));
        } catch (...) {
            LOG_WARNING("ActionDispatcher: Speech failed: unknown fault");
        }
        return true;
    }
};

ActionDispatcher::ActionDispatcher(CapabilitySet capabilities,
                                   std::unique_ptr<ExecutableResolver> resolver) {
    if (!resolver) {
        FINGERLAUNCH_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                "ActionDispatcher requires an ExecutableResolver");
    }
    pImpl = std::make_unique<Impl>(std::move(capabilities), std::move(resolver));
}

ActionDispatcher::~ActionDispatcher() = default;

ActionDispatcher::ActionDispatcher(ActionDispatcher&&) noexcept = default;
ActionDispatcher& ActionDispatcher::operator=(ActionDispatcher&&) noexcept = default;

bool ActionDispatcher::dispatch(const ActionDescriptor& descriptor) {
    pImpl->last_error.clear();

    switch (descriptor.kind) {
        case ActionKind::NoOp:
            pImpl->last_error = "noop action";
            LOG_DEBUG("ActionDispatcher: noop action, nothing to do");
            return false;
        case ActionKind::OpenUrl:
            return pImpl->openUrl(descriptor);
        case ActionKind::OpenProgram:
            return pImpl->openProgram(descriptor);
        case ActionKind::SayText:
            return pImpl->sayText(descriptor);
        default:
            return pImpl->fail("Unknown action kind " +
                               std::to_string(static_cast<int>(descriptor.kind)),
                               core::LogLevel::WARNING);
    }
}

void ActionDispatcher::announce(const ActionDescriptor& descriptor) {
    if (!pImpl->voice_feedback || !pImpl->capabilities.speech_engine) {
        return;
    }

    std::string phrase;
    switch (descriptor.kind) {
        case ActionKind::OpenUrl:
            phrase = "Opening website.";
            break;
        case ActionKind::OpenProgram:
            phrase = "Opening program.";
            break;
        case ActionKind::SayText:
            // The action itself was speech
            return;
        default:
            phrase = "Action performed.";
            break;
    }

    try {
        pImpl->capabilities.speech_engine->say(phrase);
    } catch (const std::exception& e) {
        LOG_DEBUG("ActionDispatcher: Voice feedback failed: " + std::string(e.what()));
    } catch (...) {
        LOG_DEBUG("ActionDispatcher: Voice feedback failed: unknown fault");
    }
}

void ActionDispatcher::setVoiceFeedback(bool enable) {
    pImpl->voice_feedback = enable;
}

bool ActionDispatcher::isVoiceFeedbackEnabled() const {
    return pImpl->voice_feedback;
}

bool ActionDispatcher::hasSpeech() const {
    return static_cast<bool>(pImpl->capabilities.speech_engine);
}

std::string ActionDispatcher::getLastError() const {
    return pImpl->last_error;
}

const ExecutableResolver& ActionDispatcher::resolver() const {
    return *pImpl->resolver;
}

} // namespace action
} // namespace fingerlaunch
