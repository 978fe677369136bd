#include "fingerlaunch/action/ExecutableResolver.hpp"
#include <cstdlib>
#include <system_error>
#include <unistd.h>

namespace fingerlaunch {
namespace action {

namespace fs = std::filesystem;

ExecutableResolver::ExecutableResolver(ProgramLookupTable table,
                                       std::vector<Path> search_path,
                                       std::string platform)
    : table_(std::move(table))
    , search_path_(std::move(search_path))
    , platform_(std::move(platform)) {

    strategies_.push_back([](const std::string& name) {
        return resolveAbsolute(name);
    });
    strategies_.push_back([this](const std::string& name) {
        return findOnSearchPath(name, search_path_);
    });
    strategies_.push_back([this](const std::string& name) {
        return resolveFromTable(name, table_, platform_, search_path_);
    });
}

std::optional<ExecutableResolver::Path> ExecutableResolver::resolve(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    for (const auto& strategy : strategies_) {
        if (auto path = strategy(name)) {
            return path;
        }
    }
    return std::nullopt;
}

std::optional<ExecutableResolver::Path> ExecutableResolver::resolveAbsolute(const std::string& candidate) {
    Path path(candidate);
    if (!path.is_absolute()) {
        return std::nullopt;
    }
    std::error_code ec;
    if (fs::exists(path, ec) && !ec) {
        return path;
    }
    return std::nullopt;
}

std::optional<ExecutableResolver::Path> ExecutableResolver::findOnSearchPath(const std::string& name,
                                                                             const std::vector<Path>& dirs) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        Path direct(name);
        if (isExecutableFile(direct)) {
            return direct;
        }
        return std::nullopt;
    }

    for (const auto& dir : dirs) {
        Path candidate = dir / name;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<ExecutableResolver::Path> ExecutableResolver::resolveCandidate(const std::string& candidate,
                                                                             const std::vector<Path>& dirs) {
    if (auto path = resolveAbsolute(candidate)) {
        return path;
    }
    return findOnSearchPath(candidate, dirs);
}

std::optional<ExecutableResolver::Path> ExecutableResolver::resolveFromTable(const std::string& name,
                                                                             const ProgramLookupTable& table,
                                                                             const std::string& platform,
                                                                             const std::vector<Path>& dirs) {
    auto entry = table.find(name);
    if (entry == table.end()) {
        return std::nullopt;
    }

    // Groups whose key is a prefix of the platform come first
    for (const auto& group : entry->second) {
        if (platform.rfind(group.platform, 0) != 0) {
            continue;
        }
        for (const auto& candidate : group.candidates) {
            if (auto path = resolveCandidate(candidate, dirs)) {
                return path;
            }
        }
    }

    // Cross-platform fallback over every group
    for (const auto& group : entry->second) {
        for (const auto& candidate : group.candidates) {
            if (auto path = resolveCandidate(candidate, dirs)) {
                return path;
            }
        }
    }

    return std::nullopt;
}

bool ExecutableResolver::isExecutableFile(const Path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

std::vector<ExecutableResolver::Path> ExecutableResolver::splitSearchPath(const std::string& value) {
    std::vector<Path> dirs;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(':', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        if (end > start) {
            dirs.emplace_back(value.substr(start, end - start));
        }
        start = end + 1;
    }
    return dirs;
}

std::vector<ExecutableResolver::Path> ExecutableResolver::systemSearchPath() {
    const char* env = std::getenv("PATH");
    if (env == nullptr) {
        return {};
    }
    return splitSearchPath(env);
}

std::string ExecutableResolver::currentPlatform() {
#if defined(__APPLE__)
    return "darwin";
#elif defined(_WIN32)
    return "win32";
#else
    return "linux";
#endif
}

} // namespace action
} // namespace fingerlaunch
