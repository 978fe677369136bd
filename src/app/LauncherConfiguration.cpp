/**
 * @file LauncherConfiguration.cpp
 * @brief YAML loading and validation of the launcher configuration
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#include <fingerlaunch/app/LauncherConfiguration.hpp>
#include <fingerlaunch/core/exception.h>

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>

namespace fingerlaunch {
namespace app {

namespace {

template <typename T>
void readScalar(const YAML::Node& section, const char* key, T& target, const std::string& where) {
    const YAML::Node node = section[key];
    if (!node) {
        return;
    }
    try {
        target = node.as<T>();
    } catch (const YAML::Exception& e) {
        FINGERLAUNCH_THROW(core::ConfigurationException,
                           where + "." + key + ": " + e.what());
    }
}

action::ActionDescriptor parseAction(const YAML::Node& node, int count) {
    const std::string where = "actions." + std::to_string(count);
    std::string name;
    std::optional<std::string> param;

    if (node.IsScalar()) {
        // Shorthand: "3: noop"
        name = node.as<std::string>();
    } else if (node.IsMap()) {
        if (!node["action"]) {
            FINGERLAUNCH_THROW(core::ConfigurationException, where + ": missing 'action'");
        }
        name = node["action"].as<std::string>();
        const YAML::Node p = node["param"];
        if (p && !p.IsNull()) {
            if (!p.IsScalar()) {
                FINGERLAUNCH_THROW(core::ConfigurationException, where + ".param must be a string");
            }
            param = p.as<std::string>();
        }
    } else {
        FINGERLAUNCH_THROW(core::ConfigurationException, where + ": expected a map or an action name");
    }

    action::ActionKind kind;
    if (!action::action_kind_from_string(name, kind)) {
        FINGERLAUNCH_THROW(core::ConfigurationException, where + ": unknown action '" + name + "'");
    }
    return action::ActionDescriptor(kind, param);
}

action::ActionMapping parseActions(const YAML::Node& node) {
    if (!node.IsMap()) {
        FINGERLAUNCH_THROW(core::ConfigurationException, "actions must be a map");
    }
    action::ActionMapping mapping;
    for (const auto& entry : node) {
        int count = 0;
        try {
            count = entry.first.as<int>();
        } catch (const YAML::Exception&) {
            FINGERLAUNCH_THROW(core::ConfigurationException,
                               "actions: key '" + entry.first.Scalar() + "' is not a finger count");
        }
        mapping[count] = parseAction(entry.second, count);
    }
    return mapping;
}

std::vector<action::PlatformCandidates> parseCandidateGroups(const std::string& name, const YAML::Node& node) {
    const std::string where = "program_lookup." + name;
    if (!node.IsMap()) {
        FINGERLAUNCH_THROW(core::ConfigurationException, where + " must map platforms to candidate lists");
    }

    std::vector<action::PlatformCandidates> groups;
    for (const auto& entry : node) {
        action::PlatformCandidates group;
        group.platform = entry.first.as<std::string>();
        const YAML::Node list = entry.second;
        if (list.IsScalar()) {
            group.candidates.push_back(list.as<std::string>());
        } else if (list.IsSequence()) {
            for (const auto& item : list) {
                group.candidates.push_back(item.as<std::string>());
            }
        } else if (!list.IsNull()) {
            FINGERLAUNCH_THROW(core::ConfigurationException,
                               where + "." + group.platform + " must be a list of executables");
        }
        groups.push_back(std::move(group));
    }
    return groups;
}

void applyDocument(LauncherConfiguration& config, const YAML::Node& root) {
    if (root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        FINGERLAUNCH_THROW(core::ConfigurationException, "top level must be a map");
    }

    if (const YAML::Node gesture = root["gesture"]) {
        readScalar(gesture, "stable_frames", config.gesture.stable_frames, "gesture");
        readScalar(gesture, "cooldown_seconds", config.gesture.cooldown_seconds, "gesture");
    }

    if (const YAML::Node capture = root["capture"]) {
        readScalar(capture, "webcam_index", config.capture.webcam_index, "capture");
        readScalar(capture, "mirror_frame", config.capture.mirror_frame, "capture");
        readScalar(capture, "tick_interval_ms", config.capture.tick_interval_ms, "capture");
        readScalar(capture, "min_detection_confidence", config.capture.min_detection_confidence, "capture");
        readScalar(capture, "min_tracking_confidence", config.capture.min_tracking_confidence, "capture");
        readScalar(capture, "max_num_hands", config.capture.max_num_hands, "capture");
    }

    if (const YAML::Node feedback = root["feedback"]) {
        readScalar(feedback, "voice", config.feedback.voice, "feedback");
    }

    if (const YAML::Node logging = root["logging"]) {
        std::string level;
        readScalar(logging, "level", level, "logging");
        if (!level.empty() && !core::parseLogLevel(level, config.logging.level)) {
            FINGERLAUNCH_THROW(core::ConfigurationException, "logging.level: unknown level '" + level + "'");
        }
        readScalar(logging, "console", config.logging.console, "logging");
        readScalar(logging, "file", config.logging.file, "logging");
        readScalar(logging, "directory", config.logging.directory, "logging");
    }

    if (const YAML::Node actions = root["actions"]) {
        config.actions = parseActions(actions);
    }

    if (const YAML::Node lookup = root["program_lookup"]) {
        if (!lookup.IsMap()) {
            FINGERLAUNCH_THROW(core::ConfigurationException, "program_lookup must be a map");
        }
        for (const auto& entry : lookup) {
            const std::string name = entry.first.as<std::string>();
            config.program_lookup[name] = parseCandidateGroups(name, entry.second);
        }
    }
}

} // anonymous namespace

action::ActionMapping defaultActionMapping() {
    action::ActionMapping mapping;
    mapping[0] = action::ActionDescriptor::noop();
    mapping[1] = action::ActionDescriptor::openUrl("https://www.youtube.com/");
    mapping[2] = action::ActionDescriptor::openProgram("chrome");
    mapping[3] = action::ActionDescriptor::openProgram("code");
#ifdef _WIN32
    mapping[4] = action::ActionDescriptor::openProgram("explorer");
#else
    mapping[4] = action::ActionDescriptor::openProgram("nautilus");
#endif
    mapping[5] = action::ActionDescriptor(action::ActionKind::OpenProgram);
    return mapping;
}

action::ProgramLookupTable defaultProgramLookup() {
    action::ProgramLookupTable table;
    table["chrome"] = {
        {"win32", {"chrome",
                   "C:\\Program Files\\Google\\Chrome\\Application\\chrome.exe",
                   "C:\\Program Files (x86)\\Google\\Chrome\\Application\\chrome.exe"}},
        {"darwin", {"/Applications/Google Chrome.app/Contents/MacOS/Google Chrome"}},
        {"linux", {"google-chrome", "chrome", "chromium", "chromium-browser"}}
    };
    table["code"] = {
        {"win32", {"code"}},
        {"darwin", {"code", "/Applications/Visual Studio Code.app/Contents/Resources/app/bin/code"}},
        {"linux", {"code"}}
    };
    table["explorer"] = {
        {"win32", {"explorer"}},
        {"darwin", {"open"}},
        {"linux", {"xdg-open", "nautilus", "nemo"}}
    };
    return table;
}

LauncherConfiguration LauncherConfiguration::defaults() {
    LauncherConfiguration config;
    config.actions = defaultActionMapping();
    config.program_lookup = defaultProgramLookup();
    return config;
}

LauncherConfiguration LauncherConfiguration::loadFromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        FINGERLAUNCH_THROW(core::ConfigurationException, "cannot read configuration file: " + path);
    } catch (const YAML::Exception& e) {
        FINGERLAUNCH_THROW(core::ConfigurationException, path + ": " + e.what());
    }

    LauncherConfiguration config = defaults();
    try {
        applyDocument(config, root);
    } catch (const YAML::Exception& e) {
        FINGERLAUNCH_THROW(core::ConfigurationException, path + ": " + e.what());
    }
    config.validate();
    return config;
}

LauncherConfiguration LauncherConfiguration::loadFromString(const std::string& yaml) {
    LauncherConfiguration config = defaults();
    try {
        applyDocument(config, YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        FINGERLAUNCH_THROW(core::ConfigurationException, e.what());
    }
    config.validate();
    return config;
}

void LauncherConfiguration::validate() const {
    if (gesture.stable_frames < 1) {
        FINGERLAUNCH_THROW(core::ConfigurationException,
                           "gesture.stable_frames must be >= 1, got " + std::to_string(gesture.stable_frames));
    }
    if (!std::isfinite(gesture.cooldown_seconds) || gesture.cooldown_seconds < 0.0) {
        std::ostringstream oss;
        oss << "gesture.cooldown_seconds must be a finite value >= 0, got " << gesture.cooldown_seconds;
        FINGERLAUNCH_THROW(core::ConfigurationException, oss.str());
    }
    if (capture.webcam_index < 0) {
        FINGERLAUNCH_THROW(core::ConfigurationException, "capture.webcam_index must be >= 0");
    }
    if (capture.tick_interval_ms <= 0) {
        FINGERLAUNCH_THROW(core::ConfigurationException, "capture.tick_interval_ms must be positive");
    }
    if (!(capture.min_detection_confidence > 0.0f && capture.min_detection_confidence <= 1.0f) ||
        !(capture.min_tracking_confidence > 0.0f && capture.min_tracking_confidence <= 1.0f)) {
        FINGERLAUNCH_THROW(core::ConfigurationException, "capture confidences must be in (0, 1]");
    }
    if (capture.max_num_hands < 1 || capture.max_num_hands > 2) {
        FINGERLAUNCH_THROW(core::ConfigurationException, "capture.max_num_hands must be 1 or 2");
    }
    for (const auto& entry : actions) {
        if (!gesture::is_valid_finger_count(entry.first)) {
            FINGERLAUNCH_THROW(core::ConfigurationException,
                               "actions: finger count " + std::to_string(entry.first) + " outside 0..5");
        }
    }
}

} // namespace app
} // namespace fingerlaunch
