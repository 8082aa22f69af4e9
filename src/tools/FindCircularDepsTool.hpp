#pragma once

#include "core/CircularDependencyAnalyzer.hpp"
#include "mcp/MCPServer.hpp"
#include <filesystem>
#include <memory>

namespace cycle_mcp {

/**
 * @brief MCP tool for finding circular module references in a project tree
 *
 * Scans TypeScript/JavaScript sources below a directory, builds the graph of
 * relative import/export/require references and reports every cycle together
 * with the files taking part in one.
 *
 * Useful for:
 * - Locating initialization-order bugs caused by import cycles
 * - Checking that a refactoring broke a cycle
 * - Listing the modules that need to be untangled
 */
class FindCircularDepsTool {
public:
    /**
     * @brief Construct tool with analyzer and project root
     * @param analyzer Analyzer instance
     * @param project_root Directory that relative "path" arguments resolve against
     */
    FindCircularDepsTool(std::shared_ptr<CircularDependencyAnalyzer> analyzer,
                         std::filesystem::path project_root);

    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with optional "path" and "include_node_modules"
     * @return JSON report ("cycles", "count", "affected_files") or {"error": ...}
     */
    json execute(const json& args);

private:
    std::filesystem::path resolve_scan_path(const std::string& path) const;

    std::shared_ptr<CircularDependencyAnalyzer> analyzer_;
    std::filesystem::path project_root_;
};

} // namespace cycle_mcp
