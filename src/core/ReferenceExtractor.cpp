#include "ReferenceExtractor.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <set>

namespace cycle_mcp {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

size_t skip_spaces(const std::string& content, size_t pos) {
    while (pos < content.size() && is_space(content[pos])) {
        pos++;
    }
    return pos;
}

} // namespace

bool ReferenceExtractor::is_relative_reference(std::string_view text) {
    return !text.empty() && (text.front() == '.' || text.front() == '/');
}

bool ReferenceExtractor::read_quoted(const std::string& content, size_t pos,
                                     std::string& text, size_t& end) {
    if (pos >= content.size() || (content[pos] != '\'' && content[pos] != '"')) {
        return false;
    }

    // Either quote closes the string, matching the way references are written in practice
    size_t close = content.find_first_of("'\"", pos + 1);
    if (close == std::string::npos || close == pos + 1) {
        return false;
    }

    text = content.substr(pos + 1, close - pos - 1);
    end = close + 1;
    return true;
}

bool ReferenceExtractor::find_from_clause(const std::string& content, size_t start,
                                          std::string& text, size_t& end) {
    static const std::string from = "from";

    size_t candidate = start;
    while ((candidate = content.find(from, candidate)) != std::string::npos) {
        size_t after = candidate + from.size();

        if (candidate > start && is_space(content[candidate - 1]) &&
            after < content.size() && is_space(content[after]) &&
            read_quoted(content, skip_spaces(content, after), text, end)) {
            return true;
        }

        candidate = after;
    }
    return false;
}

void ReferenceExtractor::collect_from_clauses(
    const std::string& content,
    std::string_view keyword,
    std::vector<std::pair<std::string, ReferenceKind>>& found
) const {
    const ReferenceKind kind = (keyword == "import")
        ? ReferenceKind::IMPORT_FROM
        : ReferenceKind::EXPORT_FROM;

    size_t pos = 0;
    while ((pos = content.find(keyword, pos)) != std::string::npos) {
        size_t after = pos + keyword.size();

        // The keyword must be followed by whitespace ("import(" is a call)
        if (after >= content.size() || !is_space(content[after])) {
            pos = after;
            continue;
        }

        std::string text;
        size_t end = 0;
        if (!find_from_clause(content, after + 1, text, end)) {
            // No from-clause anywhere after this point
            break;
        }

        found.emplace_back(std::move(text), kind);
        pos = end;
    }
}

void ReferenceExtractor::collect_calls(
    const std::string& content,
    std::string_view keyword,
    ReferenceKind kind,
    std::vector<std::pair<std::string, ReferenceKind>>& found
) const {
    size_t pos = 0;
    while ((pos = content.find(keyword, pos)) != std::string::npos) {
        size_t open = skip_spaces(content, pos + keyword.size());
        pos += keyword.size();

        if (open >= content.size() || content[open] != '(') {
            continue;
        }

        std::string text;
        size_t end = 0;
        if (!read_quoted(content, skip_spaces(content, open + 1), text, end)) {
            continue;
        }

        size_t close = skip_spaces(content, end);
        if (close >= content.size() || content[close] != ')') {
            continue;
        }

        found.emplace_back(std::move(text), kind);
        pos = close + 1;
    }
}

std::vector<RawReference> ReferenceExtractor::extract(
    const std::string& source_file,
    const std::string& content
) const {
    std::vector<std::pair<std::string, ReferenceKind>> found;

    collect_from_clauses(content, "import", found);
    collect_from_clauses(content, "export", found);
    collect_calls(content, "import", ReferenceKind::DYNAMIC_IMPORT, found);
    collect_calls(content, "require", ReferenceKind::REQUIRE, found);

    std::vector<RawReference> references;
    std::set<std::string> seen;

    for (auto& [text, kind] : found) {
        if (!is_relative_reference(text)) {
            spdlog::trace("{}: skipping package reference '{}'", source_file, text);
            continue;
        }
        if (!seen.insert(text).second) {
            continue;
        }
        references.push_back(RawReference{source_file, std::move(text), kind});
    }

    return references;
}

} // namespace cycle_mcp
