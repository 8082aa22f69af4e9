#pragma once

#include "core/CycleDetector.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace cycle_mcp {

using json = nlohmann::json;

/**
 * @brief Final, root-relative result of a scan
 */
struct CycleReport {
    std::vector<Cycle> cycles;                // Sorted by length, then first file
    size_t count = 0;
    std::vector<std::string> affected_files;  // Sorted union of cycle members
};

/**
 * @brief Turns detector output into a CycleReport
 */
class ReportAssembler {
public:
    /**
     * @brief Relativize, sort and aggregate cycles
     * @param cycles Cycles with absolute normalized paths
     * @param root Scan root the paths are made relative to
     * @return Report ready for serialization
     */
    static CycleReport assemble(const std::vector<Cycle>& cycles,
                                const std::filesystem::path& root);

    /**
     * @brief Make a normalized path relative to root, with '/' separators
     */
    static std::string relativize(const std::string& path,
                                  const std::filesystem::path& root);
};

void to_json(json& j, const Cycle& cycle);
void to_json(json& j, const CycleReport& report);

} // namespace cycle_mcp
