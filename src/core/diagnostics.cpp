#include <trellis/core/diagnostics.h>

#include <sstream>
#include <utility>

namespace trellis::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Trace:   return "trace";
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Size:     return "size";
        case Stage::Grid:     return "grid";
        case Stage::Alloc:    return "alloc";
        case Stage::Overflow: return "overflow";
        case Stage::Scroll:   return "scroll";
        case Stage::Split:    return "split";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "] " << stage_name(event.stage);
    if (!event.node.empty()) oss << " " << event.node;
    if (event.pass_id != 0) oss << " (pass:" << event.pass_id << ")";
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, Stage stage, const std::string& node,
                             const std::string& message) {
    if (severity < min_severity_) return;
    ++counts_[static_cast<int>(severity)];

    DiagnosticEvent event{std::chrono::steady_clock::now(), severity, stage, node, message,
                          pass_id_};
    for (const auto& observer : observers_) {
        observer(event);
    }
    if (retain_events_) {
        events_.push_back(std::move(event));
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

template <typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred pred) const {
    std::vector<DiagnosticEvent> out;
    for (const auto& e : events_) {
        if (pred(e)) out.push_back(e);
    }
    return out;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(Stage stage) const {
    return select([stage](const DiagnosticEvent& e) { return e.stage == stage; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_pass(std::uint64_t pass_id) const {
    return select([pass_id](const DiagnosticEvent& e) { return e.pass_id == pass_id; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_subtree(const std::string& node) const {
    return select([&node](const DiagnosticEvent& e) {
        if (e.node.compare(0, node.size(), node) != 0) return false;
        // "/a/b" covers "/a/b" and "/a/b/c" but not "/a/bc"
        return e.node.size() == node.size() || e.node[node.size()] == '/';
    });
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return counts_[static_cast<int>(severity)];
}

void DiagnosticEmitter::clear() {
    events_.clear();
    for (auto& c : counts_) c = 0;
}

} // namespace trellis::core
