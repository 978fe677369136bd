/**
 * @file LauncherConfiguration.hpp
 * @brief Static launcher configuration loaded once at startup
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_APP_LAUNCHER_CONFIGURATION_HPP
#define FINGERLAUNCH_APP_LAUNCHER_CONFIGURATION_HPP

#include <string>
#include <fingerlaunch/core/Logger.hpp>
#include <fingerlaunch/gesture/GestureTypes.hpp>
#include <fingerlaunch/action/ActionTypes.hpp>

namespace fingerlaunch {
namespace app {

/**
 * @brief Frame source and hand tracker settings
 */
struct CaptureConfig {
    int webcam_index = 0;
    bool mirror_frame = true;               ///< Flip frames horizontally before tracking
    int tick_interval_ms = 15;              ///< Tick timer period
    float min_detection_confidence = 0.6f;
    float min_tracking_confidence = 0.6f;
    int max_num_hands = 1;
};

struct LoggingConfig {
    core::LogLevel level = core::LogLevel::INFO;
    bool console = true;
    bool file = false;
    std::string directory = "/tmp/fingerlaunch/log";
};

struct FeedbackConfig {
    bool voice = true;   ///< Spoken confirmation after an acted gesture
};

/**
 * @brief Complete launcher configuration
 *
 * Immutable after startup. YAML layout:
 * @code
 * gesture:  { stable_frames: 6, cooldown_seconds: 3.0 }
 * capture:  { webcam_index: 0, mirror_frame: true, tick_interval_ms: 15 }
 * feedback: { voice: true }
 * logging:  { level: INFO, console: true, file: false, directory: /tmp/fingerlaunch/log }
 * actions:
 *   1: { action: open_url, param: "https://www.youtube.com/" }
 *   2: { action: open_program, param: chrome }
 * program_lookup:
 *   chrome:
 *     linux: [google-chrome, chromium]
 * @endcode
 *
 * Missing keys keep their defaults. A present `actions` section replaces
 * the default mapping; `program_lookup` entries replace defaults per name.
 */
struct LauncherConfiguration {
    gesture::GestureConfig gesture;
    CaptureConfig capture;
    FeedbackConfig feedback;
    LoggingConfig logging;
    action::ActionMapping actions;
    action::ProgramLookupTable program_lookup;

    /**
     * @brief Built-in defaults (stock finger-count mapping and lookup table)
     */
    static LauncherConfiguration defaults();

    /**
     * @brief Load a YAML file over the defaults
     * @throws core::ConfigurationException if the file is unreadable or invalid
     */
    static LauncherConfiguration loadFromFile(const std::string& path);

    /**
     * @brief Load YAML text over the defaults
     * @throws core::ConfigurationException if the text is malformed or invalid
     */
    static LauncherConfiguration loadFromString(const std::string& yaml);

    /**
     * @throws core::ConfigurationException describing the first violation
     */
    void validate() const;
};

action::ActionMapping defaultActionMapping();

action::ProgramLookupTable defaultProgramLookup();

} // namespace app
} // namespace fingerlaunch

#endif // FINGERLAUNCH_APP_LAUNCHER_CONFIGURATION_HPP
