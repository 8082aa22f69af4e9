#include "ReferenceResolver.hpp"
#include "Language.hpp"
#include "SourceEnumerator.hpp"
#include <filesystem>

namespace cycle_mcp {

ReferenceResolver::ReferenceResolver(std::unordered_set<std::string> known_files)
    : known_files_(std::move(known_files)) {
}

bool ReferenceResolver::is_known(const std::string& path) const {
    return known_files_.find(path) != known_files_.end();
}

std::string ReferenceResolver::join(const std::string& from_dir, std::string_view reference) {
    std::filesystem::path joined = std::filesystem::path(from_dir) / std::string(reference);
    return SourceEnumerator::normalize(joined);
}

std::optional<std::string> ReferenceResolver::probe(
    const std::string& base,
    const std::vector<std::string>& extensions
) const {
    // Exact path (reference carries its own extension)
    if (is_known(base)) {
        return base;
    }

    for (const auto& ext : extensions) {
        std::string with_ext = base + ext;
        if (is_known(with_ext)) {
            return with_ext;
        }
    }

    // Directory reference: look for an index file
    const std::string index_base = base + "/" + std::string(LanguageUtils::index_stem());
    for (const auto& ext : extensions) {
        std::string index_path = index_base + ext;
        if (is_known(index_path)) {
            return index_path;
        }
    }

    return std::nullopt;
}

std::optional<std::string> ReferenceResolver::resolve(
    std::string_view reference,
    const std::string& from_dir
) const {
    if (reference.empty()) {
        return std::nullopt;
    }

    std::string base = join(from_dir, reference);

    if (auto resolved = probe(base, LanguageUtils::source_extensions())) {
        return resolved;
    }

    // "./foo.js" written against build output, resolved to ./foo.ts
    std::string_view compiled_ext = LanguageUtils::compiled_output_extension();
    if (base.size() > compiled_ext.size() &&
        base.compare(base.size() - compiled_ext.size(), compiled_ext.size(), compiled_ext) == 0) {
        std::string source_base = base.substr(0, base.size() - compiled_ext.size());
        return probe(source_base, LanguageUtils::compiled_source_extensions());
    }

    return std::nullopt;
}

} // namespace cycle_mcp
