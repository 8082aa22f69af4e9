#include "CircularDependencyAnalyzer.hpp"
#include "CycleDetector.hpp"
#include <spdlog/spdlog.h>

namespace cycle_mcp {

ScanResult CircularDependencyAnalyzer::scan(const std::filesystem::path& root,
                                            bool include_node_modules) const {
    std::filesystem::path base = SourceEnumerator::resolve_root(root);

    ScanResult result;

    std::vector<std::string> files = SourceEnumerator::enumerate(base, include_node_modules);
    if (files.empty()) {
        spdlog::debug("No source files under {}", base.string());
        return result;
    }

    GraphBuildResult built = builder_.build(files);
    result.stats = built.stats;

    std::vector<Cycle> cycles = CycleDetector::find_cycles(built.graph);
    result.report = ReportAssembler::assemble(cycles, base);

    spdlog::debug("Scanned {}: {} files ({} unreadable), {} edges, {} cycles",
                  base.string(), result.stats.files_scanned, result.stats.files_unreadable,
                  result.stats.edges, result.report.count);

    return result;
}

json CircularDependencyAnalyzer::scan_to_json(const std::filesystem::path& root,
                                              bool include_node_modules) const {
    return scan(root, include_node_modules).report;
}

} // namespace cycle_mcp
