#include "CycleDetector.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <set>

namespace cycle_mcp {

std::string CycleDetector::signature(const std::vector<std::string>& nodes) {
    if (nodes.empty()) {
        return "";
    }

    auto min_it = std::min_element(nodes.begin(), nodes.end());

    std::vector<std::string> rotated(min_it, nodes.end());
    rotated.insert(rotated.end(), nodes.begin(), min_it);

    std::string result;
    for (size_t i = 0; i < rotated.size(); i++) {
        if (i > 0) {
            result += " -> ";
        }
        result += rotated[i];
    }
    return result;
}

std::vector<Cycle> CycleDetector::find_cycles(const ReferenceGraph& graph) {
    struct Frame {
        const std::string* node;
        const std::vector<std::string>* neighbors;
        size_t next;
    };

    std::vector<Cycle> cycles;
    std::set<std::string> signatures;
    std::map<std::string, Color> color;

    for (const auto& [node, _] : graph) {
        color[node] = Color::WHITE;
    }

    for (const auto& [root, root_neighbors] : graph) {
        if (color[root] != Color::WHITE) {
            continue;
        }

        std::vector<Frame> stack;
        color[root] = Color::GRAY;
        stack.push_back(Frame{&root, &root_neighbors, 0});

        while (!stack.empty()) {
            Frame& top = stack.back();

            if (top.next == top.neighbors->size()) {
                color[*top.node] = Color::BLACK;
                stack.pop_back();
                continue;
            }

            const std::string& neighbor = (*top.neighbors)[top.next++];

            auto it = graph.find(neighbor);
            if (it == graph.end()) {
                continue;
            }

            Color neighbor_color = color[neighbor];

            if (neighbor_color == Color::WHITE) {
                color[neighbor] = Color::GRAY;
                stack.push_back(Frame{&it->first, &it->second, 0});
            } else if (neighbor_color == Color::GRAY) {
                // Back edge: the cycle is the stack suffix starting at neighbor
                auto start = std::find_if(stack.rbegin(), stack.rend(),
                    [&neighbor](const Frame& frame) { return *frame.node == neighbor; });

                std::vector<std::string> nodes;
                for (auto frame = start.base() - 1; frame != stack.end(); ++frame) {
                    nodes.push_back(*frame->node);
                }

                if (signatures.insert(signature(nodes)).second) {
                    Cycle cycle;
                    cycle.length = nodes.size();
                    cycle.path = nodes;
                    cycle.path.push_back(nodes.front());
                    cycles.push_back(std::move(cycle));
                }
            }
        }
    }

    spdlog::debug("Cycle detection finished: {} cycles in {} nodes", cycles.size(), graph.size());
    return cycles;
}

} // namespace cycle_mcp
