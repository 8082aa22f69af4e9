#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cycle_mcp {

/**
 * @brief Fatal input error: the scan root is missing or not a directory
 */
class ScanError : public std::runtime_error {
public:
    enum class Reason {
        NOT_FOUND,
        NOT_A_DIRECTORY,
        UNRESOLVABLE
    };

    ScanError(Reason reason, std::filesystem::path path, std::string detail = "");

    Reason reason() const { return reason_; }
    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Same message with the path spelled as shown_path
     *
     * Lets a caller report the path the way its user typed it instead of
     * the joined path that was actually checked.
     */
    std::string describe(const std::string& shown_path) const;

private:
    static std::string format(Reason reason, const std::string& path, const std::string& detail);

    Reason reason_;
    std::filesystem::path path_;
    std::string detail_;
};

/**
 * @brief Lists the source files of a project tree
 *
 * Walks the tree below a root directory, skipping dependency-cache,
 * version-control, build-output and coverage directories, and keeps files
 * with a supported extension. Every returned path goes through normalize(),
 * so later stages can compare nodes with plain string equality.
 */
class SourceEnumerator {
public:
    /**
     * @brief Validate and absolutize a scan root
     *
     * @param root Directory to scan
     * @return Canonical absolute path of the root
     * @throws ScanError if the root does not exist or is not a directory
     */
    static std::filesystem::path resolve_root(const std::filesystem::path& root);

    /**
     * @brief Recursively collect source files below root
     *
     * Unreadable subdirectories are skipped silently. Symbolic links are not
     * followed.
     *
     * @param root Directory to scan
     * @param include_node_modules If true, descend into node_modules directories
     * @return Normalized absolute file paths (sorted, no duplicates)
     * @throws ScanError if the root does not exist or is not a directory
     */
    static std::vector<std::string> enumerate(
        const std::filesystem::path& root,
        bool include_node_modules = false
    );

    /**
     * @brief Normalize a path to the single form used for graph nodes
     *
     * Lexically normalized, '/' separators, no trailing separator.
     */
    static std::string normalize(const std::filesystem::path& path);

private:
    /**
     * @brief Check if a directory should be skipped by name
     */
    static bool should_skip_directory(const std::string& name, bool include_node_modules);
};

} // namespace cycle_mcp
