#include "CycleReport.hpp"
#include <algorithm>
#include <set>

namespace cycle_mcp {

std::string ReportAssembler::relativize(const std::string& path,
                                        const std::filesystem::path& root) {
    std::filesystem::path relative = std::filesystem::path(path).lexically_relative(root);
    if (relative.empty()) {
        return path;
    }
    return relative.generic_string();
}

CycleReport ReportAssembler::assemble(const std::vector<Cycle>& cycles,
                                      const std::filesystem::path& root) {
    CycleReport report;
    std::set<std::string> affected;

    for (const auto& cycle : cycles) {
        Cycle relative;
        relative.length = cycle.length;
        for (const auto& file : cycle.path) {
            relative.path.push_back(relativize(file, root));
        }

        // The closing repeat is not a separate participant
        for (size_t i = 0; i + 1 < relative.path.size(); i++) {
            affected.insert(relative.path[i]);
        }

        report.cycles.push_back(std::move(relative));
    }

    std::stable_sort(report.cycles.begin(), report.cycles.end(),
        [](const Cycle& a, const Cycle& b) {
            if (a.length != b.length) {
                return a.length < b.length;
            }
            return a.path.front() < b.path.front();
        });

    report.count = report.cycles.size();
    report.affected_files.assign(affected.begin(), affected.end());
    return report;
}

void to_json(json& j, const Cycle& cycle) {
    j = json{
        {"path", cycle.path},
        {"length", cycle.length}
    };
}

void to_json(json& j, const CycleReport& report) {
    j = json{
        {"cycles", report.cycles},
        {"count", report.count},
        {"affected_files", report.affected_files}
    };
}

} // namespace cycle_mcp
