#pragma once

#include "core/CycleReport.hpp"
#include "core/ImportGraph.hpp"
#include "core/SourceEnumerator.hpp"
#include <filesystem>

namespace cycle_mcp {

/**
 * @brief Report of one scan plus its construction counters
 */
struct ScanResult {
    CycleReport report;
    ScanStats stats;
};

/**
 * @brief High-level API for circular module-reference detection
 *
 * Runs the whole pipeline on a project tree:
 * enumerate -> extract + resolve -> detect cycles -> assemble report.
 * A scan is synchronous and keeps no state between calls, so one analyzer
 * can be shared by several tools.
 */
class CircularDependencyAnalyzer {
public:
    CircularDependencyAnalyzer() = default;

    /**
     * @brief Scan a directory tree for reference cycles
     *
     * @param root Directory to scan; report paths are relative to it
     * @param include_node_modules If true, node_modules trees are scanned too
     * @return Report and statistics
     * @throws ScanError if root does not exist or is not a directory
     */
    ScanResult scan(const std::filesystem::path& root, bool include_node_modules = false) const;

    /**
     * @brief Scan and serialize the report
     * @return JSON object with "cycles", "count", "affected_files"
     * @throws ScanError if root does not exist or is not a directory
     */
    json scan_to_json(const std::filesystem::path& root, bool include_node_modules = false) const;

private:
    GraphBuilder builder_;
};

} // namespace cycle_mcp
