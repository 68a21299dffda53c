#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sw::types { struct ServiceRecord; }

namespace sw::lifecycle {

class DependencyValidator {
public:
    using Graph = std::map<std::string, std::vector<std::string>>;

    static Graph graphOf(const std::vector<types::ServiceRecord>& records);

    // Human-readable problems with giving `id` the dependency list `deps`.
    // `graph` is the current fleet; any existing entry for `id` is replaced.
    static std::vector<std::string> validate(const std::string& id,
                                             const std::vector<std::string>& deps,
                                             Graph graph);

    // First cycle found, as a closed path (a -> b -> a)
    static std::optional<std::vector<std::string>> findCycle(const Graph& graph);

    // Dependencies before dependents. Throws std::invalid_argument on a cycle.
    static std::vector<std::string> startupOrder(const Graph& graph);
};

}
