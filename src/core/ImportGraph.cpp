#include "ImportGraph.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace cycle_mcp {

bool GraphBuilder::read_file(const std::string& file, std::string& content) {
    std::ifstream in(file, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return false;
    }

    content = buffer.str();
    return true;
}

std::vector<std::string> GraphBuilder::resolve_references(
    const std::string& file,
    const std::string& content,
    const ReferenceResolver& resolver,
    ScanStats& stats
) const {
    std::vector<std::string> targets;
    std::unordered_set<std::string> seen;

    const std::string from_dir = std::filesystem::path(file).parent_path().generic_string();

    for (const auto& reference : extractor_.extract(file, content)) {
        stats.references_found++;

        auto resolved = resolver.resolve(reference.text, from_dir);
        if (!resolved) {
            spdlog::trace("{}: unresolved {} reference '{}'", file,
                          LanguageUtils::to_string(reference.kind), reference.text);
            continue;
        }

        stats.references_resolved++;
        if (seen.insert(*resolved).second) {
            targets.push_back(std::move(*resolved));
        }
    }

    stats.edges += targets.size();
    return targets;
}

GraphBuildResult GraphBuilder::build(const std::vector<std::string>& files) const {
    GraphBuildResult result;
    ReferenceResolver resolver(std::unordered_set<std::string>(files.begin(), files.end()));

    for (const auto& file : files) {
        result.stats.files_scanned++;

        std::string content;
        if (!read_file(file, content)) {
            spdlog::debug("Skipping unreadable file {}", file);
            result.stats.files_unreadable++;
            result.graph.emplace(file, std::vector<std::string>{});
            continue;
        }

        result.graph[file] = resolve_references(file, content, resolver, result.stats);
    }

    spdlog::debug("Built reference graph: {} nodes, {} edges", result.graph.size(), result.stats.edges);
    return result;
}

GraphBuildResult GraphBuilder::build_from_sources(
    const std::map<std::string, std::string>& sources
) const {
    GraphBuildResult result;

    std::unordered_set<std::string> known_files;
    for (const auto& [file, _] : sources) {
        known_files.insert(file);
    }
    ReferenceResolver resolver(std::move(known_files));

    for (const auto& [file, content] : sources) {
        result.stats.files_scanned++;
        result.graph[file] = resolve_references(file, content, resolver, result.stats);
    }

    return result;
}

} // namespace cycle_mcp
