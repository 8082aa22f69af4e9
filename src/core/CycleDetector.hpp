#pragma once

#include "core/ImportGraph.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace cycle_mcp {

/**
 * @brief A reference cycle
 */
struct Cycle {
    std::vector<std::string> path;  // Files forming the cycle, first file repeated at the end
    size_t length = 0;              // Number of distinct files (path.size() - 1)
};

/**
 * @brief Finds reference cycles with a three-color depth-first search
 *
 * Every back-edge (an edge into a node still on the DFS stack) yields the
 * stack suffix starting at that node as a cycle. Cycles with the same
 * signature are reported once. The search keeps an explicit stack, so chain
 * length is not limited by the call stack.
 */
class CycleDetector {
public:
    /**
     * @brief Find all cycles in a graph
     *
     * DFS roots are taken in key order; neighbors in list order.
     *
     * @param graph Reference graph
     * @return Cycles in discovery order
     */
    static std::vector<Cycle> find_cycles(const ReferenceGraph& graph);

    /**
     * @brief Canonical signature of a cycle
     *
     * Rotates the nodes (without the closing repeat) to start at the
     * lexicographically smallest one and joins them with " -> ".
     */
    static std::string signature(const std::vector<std::string>& nodes);

private:
    enum class Color {
        WHITE,  // Not visited
        GRAY,   // On the current DFS stack
        BLACK   // Fully explored
    };
};

} // namespace cycle_mcp
