/**
 * @file mock_capabilities.hpp
 * @brief Recording capability fakes shared by the dispatcher and emitter tests
 */

#pragma once

#include <fingerlaunch/action/Capabilities.hpp>
#include <fingerlaunch/core/exception.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Records every URL it is asked to open, optionally faulting
 *
 * fail throws a CapabilityException, fail_foreign throws a non-std value.
 */
class MockUrlOpener : public fingerlaunch::action::UrlOpener {
public:
    void openUrl(const std::string& url) override {
        calls.push_back(url);
        if (fail) {
            throw fingerlaunch::core::CapabilityException("browser unavailable");
        }
        if (fail_foreign) {
            throw 42;
        }
    }

    std::vector<std::string> calls;
    bool fail = false;
    bool fail_foreign = false;
};

/**
 * @brief Records launches; can fault on every call or only on a given executable
 */
class MockProcessLauncher : public fingerlaunch::action::ProcessLauncher {
public:
    using Launch = std::pair<std::string, std::vector<std::string>>;

    void launchDetached(const std::string& executable,
                        const std::vector<std::string>& arguments) override {
        launches.emplace_back(executable, arguments);
        if (fail || (!fail_executable.empty() && executable == fail_executable)) {
            throw fingerlaunch::core::CapabilityException("spawn failed");
        }
        if (fail_foreign) {
            throw 42;
        }
    }

    std::vector<Launch> launches;
    bool fail = false;
    bool fail_foreign = false;
    std::string fail_executable;
};

class MockSpeechEngine : public fingerlaunch::action::SpeechEngine {
public:
    void say(const std::string& text) override {
        spoken.push_back(text);
        if (fail) {
            throw std::runtime_error("audio device busy");
        }
        if (fail_foreign) {
            throw 42;
        }
    }

    std::vector<std::string> spoken;
    bool fail = false;
    bool fail_foreign = false;
};
