#include "FindCircularDepsTool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace cycle_mcp {

FindCircularDepsTool::FindCircularDepsTool(std::shared_ptr<CircularDependencyAnalyzer> analyzer,
                                           std::filesystem::path project_root)
    : analyzer_(std::move(analyzer)), project_root_(std::move(project_root)) {
    if (!analyzer_) {
        throw std::invalid_argument("Analyzer cannot be null");
    }
}

ToolInfo FindCircularDepsTool::get_info() {
    return {
        "find_circular_deps",
        "Detect circular import dependencies between TypeScript/JavaScript files "
        "by building an import graph and searching it for cycles",
        {
            {"type", "object"},
            {"properties", {
                {"path", {
                    {"type", "string"},
                    {"description", "Directory to scan, absolute or relative to the project root (default: \".\")"}
                }},
                {"include_node_modules", {
                    {"type", "boolean"},
                    {"description", "Include node_modules in scan (default: false)"}
                }}
            }}
        }
    };
}

std::filesystem::path FindCircularDepsTool::resolve_scan_path(const std::string& path) const {
    std::filesystem::path scan_path(path);
    if (scan_path.is_absolute()) {
        return scan_path;
    }
    return project_root_ / scan_path;
}

json FindCircularDepsTool::execute(const json& args) {
    if (args.contains("path") && !args["path"].is_string()) {
        return {
            {"error", "Invalid argument: path must be a string"}
        };
    }
    if (args.contains("include_node_modules") && !args["include_node_modules"].is_boolean()) {
        return {
            {"error", "Invalid argument: include_node_modules must be a boolean"}
        };
    }

    std::string path = args.value("path", ".");
    bool include_node_modules = args.value("include_node_modules", false);

    spdlog::debug("FindCircularDepsTool: scanning {} (node_modules: {})", path, include_node_modules);

    try {
        ScanResult result = analyzer_->scan(resolve_scan_path(path), include_node_modules);

        spdlog::debug("FindCircularDepsTool: {} files, {} of {} references resolved, {} cycles",
                      result.stats.files_scanned, result.stats.references_resolved,
                      result.stats.references_found, result.report.count);
        if (result.stats.files_unreadable > 0) {
            spdlog::warn("FindCircularDepsTool: {} files could not be read and were skipped",
                         result.stats.files_unreadable);
        }

        return result.report;
    } catch (const ScanError& e) {
        // Report the path as the caller wrote it, not joined to the project root
        return {
            {"error", e.describe(path)}
        };
    } catch (const std::exception& e) {
        spdlog::error("FindCircularDepsTool error: {}", e.what());
        return {
            {"error", std::string("Failed to find circular dependencies: ") + e.what()}
        };
    }
}

} // namespace cycle_mcp
