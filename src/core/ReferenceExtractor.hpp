#pragma once

#include "core/Language.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cycle_mcp {

/**
 * @brief A module reference as written in a source file
 */
struct RawReference {
    std::string source_file;  // Normalized path of the referencing file
    std::string text;         // Reference string between the quotes
    ReferenceKind kind;
};

/**
 * @brief Extracts module references from source text by pattern matching
 *
 * Recognizes four shapes:
 * - import ... from '...'
 * - export ... from '...'
 * - import('...')
 * - require('...')
 *
 * Matching is textual, so reference-shaped text inside strings or comments
 * is picked up as well. The scanner never backtracks, so long whitespace
 * runs or reference strings cost linear time and no stack. Only relative
 * ('.') and rooted ('/') references are returned; everything else is a
 * package reference.
 */
class ReferenceExtractor {
public:
    ReferenceExtractor() = default;

    /**
     * @brief Extract relative references from file content
     *
     * @param source_file Normalized path of the file (copied into each result)
     * @param content File text
     * @return References in discovery order, deduplicated by text
     */
    std::vector<RawReference> extract(const std::string& source_file,
                                      const std::string& content) const;

    /**
     * @brief Check if a reference points into the project tree
     * @return true if the reference starts with '.' or '/'
     */
    static bool is_relative_reference(std::string_view text);

private:
    /**
     * @brief Scan for "<keyword> ... from '<ref>'" statements
     *
     * The binding list between the keyword and "from" may span lines; the
     * nearest following from-clause closes the statement.
     */
    void collect_from_clauses(const std::string& content,
                              std::string_view keyword,
                              std::vector<std::pair<std::string, ReferenceKind>>& found) const;

    /**
     * @brief Scan for "<keyword>('<ref>')" calls, whitespace allowed around the parenthesis
     */
    void collect_calls(const std::string& content,
                       std::string_view keyword,
                       ReferenceKind kind,
                       std::vector<std::pair<std::string, ReferenceKind>>& found) const;

    /**
     * @brief Find the first "<ws>from<ws>'<ref>'" starting at or after start
     *
     * @param text Receives the reference between the quotes
     * @param end Receives the position one past the closing quote
     * @return false if there is no complete from-clause
     */
    static bool find_from_clause(const std::string& content, size_t start,
                                 std::string& text, size_t& end);

    /**
     * @brief Read a non-empty quoted string whose opening quote is at pos
     */
    static bool read_quoted(const std::string& content, size_t pos,
                            std::string& text, size_t& end);
};

} // namespace cycle_mcp
