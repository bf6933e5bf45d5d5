#pragma once

#include <muster/engine/dep_graph.hpp>
#include <muster/engine/issue.hpp>

#include <string>
#include <vector>
#include <optional>

namespace muster {

struct Report {
    std::vector<Issue> fatal;
    std::vector<Issue> warnings;
    // Absent whenever any fatal issue exists
    std::optional<std::vector<std::string>> startup_order;

    bool ok() const { return fatal.empty(); }

    // Issues of one kind, fatal first
    std::vector<Issue> of_kind(Issue::Kind kind) const;

    // Human-readable summary; identical input gives identical text
    std::string format() const;
};

// Merge graph and validation findings. Fatal issues from both sources are
// kept side by side so one fix-and-retry pass can address all of them.
Report aggregate(const GraphOutcome& graph,
                 const std::vector<Issue>& validation);

} // namespace muster
