#include "lifecycle/DependencyValidator.hpp"
#include "types/ServiceRecord.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <fmt/format.h>

using namespace sw::lifecycle;
using namespace sw::types;

namespace {

enum class Mark { None, Visiting, Done };

struct Walker {
    const DependencyValidator::Graph& graph;
    std::map<std::string, Mark> marks;
    std::vector<std::string> stack;
    std::vector<std::string> order;
    std::optional<std::vector<std::string>> cycle;

    void visit(const std::string& node) {
        if (cycle) return;

        auto& mark = marks[node];
        if (mark == Mark::Done) return;
        if (mark == Mark::Visiting) {
            const auto from = std::ranges::find(stack, node);
            std::vector<std::string> path(from, stack.end());
            path.push_back(node);
            cycle = std::move(path);
            return;
        }

        mark = Mark::Visiting;
        stack.push_back(node);

        if (const auto it = graph.find(node); it != graph.end())
            for (const auto& dep : it->second) visit(dep);

        stack.pop_back();
        marks[node] = Mark::Done;
        order.push_back(node);
    }

    void walkAll() {
        for (const auto& [node, _] : graph) {
            if (cycle) return;
            visit(node);
        }
    }
};

}

DependencyValidator::Graph DependencyValidator::graphOf(const std::vector<ServiceRecord>& records) {
    Graph graph;
    for (const auto& r : records) graph[r.id] = r.dependencies;
    return graph;
}

std::vector<std::string> DependencyValidator::validate(const std::string& id,
                                                       const std::vector<std::string>& deps,
                                                       Graph graph) {
    std::vector<std::string> errors;
    std::set<std::string> seen;

    for (const auto& dep : deps) {
        if (dep == id) {
            errors.emplace_back("A service cannot depend on itself");
            continue;
        }
        if (!seen.insert(dep).second) {
            errors.push_back(fmt::format("Duplicate dependency '{}'", dep));
            continue;
        }
        if (!graph.contains(dep)) errors.push_back(fmt::format("Unknown dependency '{}'", dep));
    }

    if (!errors.empty()) return errors;

    graph[id] = deps;
    if (const auto cycle = findCycle(graph)) {
        std::string path;
        for (const auto& node : *cycle) {
            if (!path.empty()) path += " -> ";
            path += node;
        }
        errors.push_back("Circular dependency: " + path);
    }

    return errors;
}

std::optional<std::vector<std::string>> DependencyValidator::findCycle(const Graph& graph) {
    Walker w{graph};
    w.walkAll();
    return w.cycle;
}

std::vector<std::string> DependencyValidator::startupOrder(const Graph& graph) {
    Walker w{graph};
    w.walkAll();
    if (w.cycle) throw std::invalid_argument("Dependency graph contains a cycle");
    return w.order;
}
