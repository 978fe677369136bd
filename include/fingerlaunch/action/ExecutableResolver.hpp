/**
 * @file ExecutableResolver.hpp
 * @brief Resolves a program parameter to an executable path
 *
 * @copyright 2025 FingerLaunch Project
 * @license MIT License
 */

#ifndef FINGERLAUNCH_ACTION_EXECUTABLE_RESOLVER_HPP
#define FINGERLAUNCH_ACTION_EXECUTABLE_RESOLVER_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "ActionTypes.hpp"

namespace fingerlaunch {
namespace action {

/**
 * @brief Ordered pipeline of resolution strategies
 *
 * resolve(name) tries, stopping at the first hit:
 * 1. name as an existing absolute path
 * 2. an executable literally called name on the search path
 * 3. the lookup table entry for name: candidates of the groups matching the
 *    current platform first, then every group in table order. Each
 *    candidate is tried as an existing absolute path, then on the search path.
 *
 * Strategies are pure functions of the name, the search path, the platform
 * key and the lookup table; the only I/O is stat/access on candidates.
 */
class ExecutableResolver {
public:
    using Path = std::filesystem::path;
    using Strategy = std::function<std::optional<Path>(const std::string&)>;

    /**
     * @param table Logical-name lookup table
     * @param search_path Directories searched for bare names (normally $PATH)
     * @param platform Platform key matched against table groups by prefix
     */
    ExecutableResolver(ProgramLookupTable table,
                       std::vector<Path> search_path = systemSearchPath(),
                       std::string platform = currentPlatform());

    // Strategies capture this; disable copy and move
    ExecutableResolver(const ExecutableResolver&) = delete;
    ExecutableResolver& operator=(const ExecutableResolver&) = delete;
    ExecutableResolver(ExecutableResolver&&) = delete;
    ExecutableResolver& operator=(ExecutableResolver&&) = delete;

    /**
     * @brief Run the strategy pipeline
     * @return Resolved path, std::nullopt if no strategy matched
     */
    std::optional<Path> resolve(const std::string& name) const;

    const std::string& platform() const { return platform_; }

    const std::vector<Path>& searchPath() const { return search_path_; }

    // ===== Strategy building blocks =====

    /**
     * @brief Absolute path that exists on disk
     */
    static std::optional<Path> resolveAbsolute(const std::string& candidate);

    /**
     * @brief Executable regular file called name in one of dirs
     *
     * A name containing a directory separator is checked as given.
     */
    static std::optional<Path> findOnSearchPath(const std::string& name,
                                                const std::vector<Path>& dirs);

    /**
     * @brief Candidate as absolute path first, then on the search path
     */
    static std::optional<Path> resolveCandidate(const std::string& candidate,
                                                const std::vector<Path>& dirs);

    /**
     * @brief Lookup-table strategy (platform groups first, then all groups)
     */
    static std::optional<Path> resolveFromTable(const std::string& name,
                                                const ProgramLookupTable& table,
                                                const std::string& platform,
                                                const std::vector<Path>& dirs);

    static bool isExecutableFile(const Path& path);

    /**
     * @brief Split a PATH-style string into directories (empty entries skipped)
     */
    static std::vector<Path> splitSearchPath(const std::string& value);

    /**
     * @brief Directories from the PATH environment variable
     */
    static std::vector<Path> systemSearchPath();

    /**
     * @brief "linux", "darwin" or "win32"
     */
    static std::string currentPlatform();

private:
    ProgramLookupTable table_;
    std::vector<Path> search_path_;
    std::string platform_;
    std::vector<Strategy> strategies_;
};

} // namespace action
} // namespace fingerlaunch

#endif // FINGERLAUNCH_ACTION_EXECUTABLE_RESOLVER_HPP
