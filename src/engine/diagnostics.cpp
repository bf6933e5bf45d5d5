#include <muster/engine/diagnostics.hpp>

#include <sstream>

namespace muster {

Report aggregate(const GraphOutcome& graph,
                 const std::vector<Issue>& validation)
{
    Report report;
    for (const auto* source : {&graph.issues, &validation}) {
        for (const auto& issue : *source) {
            (issue.is_fatal() ? report.fatal : report.warnings).push_back(issue);
        }
    }

    if (report.fatal.empty()) {
        report.startup_order = graph.startup_order;
    }
    return report;
}

std::vector<Issue> Report::of_kind(Issue::Kind kind) const {
    std::vector<Issue> out;
    for (const auto* list : {&fatal, &warnings}) {
        for (const auto& issue : *list) {
            if (issue.kind == kind) out.push_back(issue);
        }
    }
    return out;
}

std::string Report::format() const {
    std::ostringstream out;
    for (const auto& issue : fatal) {
        out << issue.format() << "\n";
    }
    for (const auto& issue : warnings) {
        out << issue.format() << "\n";
    }

    if (startup_order) {
        out << "startup order:";
        for (size_t i = 0; i < startup_order->size(); ++i) {
            out << (i == 0 ? " " : " -> ") << (*startup_order)[i];
        }
        out << "\n";
    } else {
        out << "no startup order: " << fatal.size() << " fatal issue"
            << (fatal.size() == 1 ? "" : "s") << "\n";
    }

    out << fatal.size() << " error" << (fatal.size() == 1 ? "" : "s") << ", "
        << warnings.size() << " warning" << (warnings.size() == 1 ? "" : "s") << "\n";
    return out.str();
}

} // namespace muster
