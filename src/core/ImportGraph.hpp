#pragma once

#include "core/ReferenceExtractor.hpp"
#include "core/ReferenceResolver.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace cycle_mcp {

/**
 * @brief Directed reference graph: file -> files it references
 *
 * Every enumerated file is a key (possibly with an empty list); every target
 * is itself a key. Targets keep first-seen order without duplicates.
 */
using ReferenceGraph = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Counters collected while building a graph
 */
struct ScanStats {
    size_t files_scanned = 0;
    size_t files_unreadable = 0;
    size_t references_found = 0;     // Relative references after per-file dedup
    size_t references_resolved = 0;  // References that became edges
    size_t edges = 0;
};

/**
 * @brief Graph together with the statistics of its construction
 */
struct GraphBuildResult {
    ReferenceGraph graph;
    ScanStats stats;
};

/**
 * @brief Builds the reference graph of a set of source files
 *
 * Runs the extractor and the resolver for every file. References that do
 * not resolve to one of the given files are dropped.
 */
class GraphBuilder {
public:
    GraphBuilder() = default;

    /**
     * @brief Read each file from disk and build the graph
     *
     * An unreadable file still gets a node, with no outgoing edges.
     *
     * @param files Normalized absolute paths, as returned by SourceEnumerator
     * @return Graph with exactly one entry per file
     */
    GraphBuildResult build(const std::vector<std::string>& files) const;

    /**
     * @brief Build the graph from in-memory file contents
     * @param sources Map of normalized path -> file text
     * @return Graph with exactly one entry per source
     */
    GraphBuildResult build_from_sources(const std::map<std::string, std::string>& sources) const;

private:
    /**
     * @brief Extract and resolve the references of one file
     */
    std::vector<std::string> resolve_references(
        const std::string& file,
        const std::string& content,
        const ReferenceResolver& resolver,
        ScanStats& stats
    ) const;

    /**
     * @brief Read a whole file; false if it cannot be opened or read
     */
    static bool read_file(const std::string& file, std::string& content);

    ReferenceExtractor extractor_;
};

} // namespace cycle_mcp
