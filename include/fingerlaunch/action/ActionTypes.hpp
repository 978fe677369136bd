/**
 * @file ActionTypes.hpp
 * @brief Action descriptors and lookup tables
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_ACTION_TYPES_HPP
#define FINGERLAUNCH_ACTION_TYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fingerlaunch {
namespace action {

/**
 * @brief What a triggered gesture does
 */
enum class ActionKind {
    NoOp = 0,       ///< Nothing, never counts as acted
    OpenUrl,        ///< Open parameter in the default browser
    OpenProgram,    ///< Launch parameter as a program (path, PATH name or lookup key)
    SayText         ///< Speak parameter through the speech engine
};

/**
 * @brief Immutable action bound to a finger count
 */
struct ActionDescriptor {
    ActionKind kind = ActionKind::NoOp;
    std::optional<std::string> parameter;

    ActionDescriptor() = default;

    ActionDescriptor(ActionKind action_kind, std::optional<std::string> param = std::nullopt)
        : kind(action_kind), parameter(std::move(param)) {}

    /// Parameter present and non-empty
    bool has_parameter() const {
        return parameter.has_value() && !parameter->empty();
    }

    static ActionDescriptor noop() { return ActionDescriptor(ActionKind::NoOp); }
    static ActionDescriptor openUrl(const std::string& url) { return ActionDescriptor(ActionKind::OpenUrl, url); }
    static ActionDescriptor openProgram(const std::string& program) { return ActionDescriptor(ActionKind::OpenProgram, program); }
    static ActionDescriptor sayText(const std::string& text) { return ActionDescriptor(ActionKind::SayText, text); }
};

/**
 * @brief Finger count (0..5) to action; a missing key means NoOp
 */
using ActionMapping = std::map<int, ActionDescriptor>;

/**
 * @brief Candidate executables for one platform key ("win32", "darwin", "linux")
 */
struct PlatformCandidates {
    std::string platform;
    std::vector<std::string> candidates;
};

/**
 * @brief Logical program name to per-platform candidate groups
 *
 * Group order is significant: it is the order of the cross-platform
 * fallback search.
 */
using ProgramLookupTable = std::map<std::string, std::vector<PlatformCandidates>>;

/**
 * @brief Look up the descriptor for a count, NoOp when unmapped
 */
inline ActionDescriptor lookup_action(const ActionMapping& mapping, int count) {
    auto it = mapping.find(count);
    if (it == mapping.end()) {
        return ActionDescriptor::noop();
    }
    return it->second;
}

/**
 * @brief Config-file name of an action kind ("noop", "open_url", ...)
 */
inline std::string action_kind_to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::NoOp: return "noop";
        case ActionKind::OpenUrl: return "open_url";
        case ActionKind::OpenProgram: return "open_program";
        case ActionKind::SayText: return "say_text";
        default: return "invalid";
    }
}

/**
 * @brief Parse a config-file action name
 * @return true if the name is known
 */
inline bool action_kind_from_string(const std::string& name, ActionKind& kind) {
    if (name == "noop") {
        kind = ActionKind::NoOp;
    } else if (name == "open_url") {
        kind = ActionKind::OpenUrl;
    } else if (name == "open_program") {
        kind = ActionKind::OpenProgram;
    } else if (name == "say_text") {
        kind = ActionKind::SayText;
    } else {
        return false;
    }
    return true;
}

} // namespace action
} // namespace fingerlaunch

#endif // FINGERLAUNCH_ACTION_TYPES_HPP
