#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cycle_mcp {

/**
 * @brief Maps a reference string to one of the known project files
 *
 * Resolution order, first hit wins:
 * 1. the joined path itself
 * 2. the joined path plus each source extension
 * 3. <joined path>/index plus each source extension
 * 4. for a ".js" reference, steps 1-3 on the path without ".js",
 *    probing .ts and .tsx only
 *
 * Paths are compared after SourceEnumerator::normalize(), so the known set
 * must hold normalized paths.
 */
class ReferenceResolver {
public:
    /**
     * @brief Construct resolver over a fixed file set
     * @param known_files Normalized absolute paths of all enumerated files
     */
    explicit ReferenceResolver(std::unordered_set<std::string> known_files);

    /**
     * @brief Resolve a reference written in a file located in from_dir
     *
     * @param reference Raw reference text (e.g., "./util", "../lib/index.js")
     * @param from_dir Normalized directory of the referencing file
     * @return Normalized path of the target, or nullopt if it is not a known file
     */
    std::optional<std::string> resolve(std::string_view reference,
                                       const std::string& from_dir) const;

    /**
     * @brief Join a reference onto a directory and normalize
     *
     * A rooted reference ("/x") replaces the directory.
     */
    static std::string join(const std::string& from_dir, std::string_view reference);

    /**
     * @brief Check if a normalized path is in the known set
     */
    bool is_known(const std::string& path) const;

private:
    /**
     * @brief Steps 1-3 against the given extension list
     */
    std::optional<std::string> probe(const std::string& base,
                                     const std::vector<std::string>& extensions) const;

    std::unordered_set<std::string> known_files_;
};

} // namespace cycle_mcp
