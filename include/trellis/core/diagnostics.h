#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace trellis::core {

enum class Severity {
    Trace,
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// Which part of a layout pass produced an event
enum class Stage {
    Size,      // bottom-up gather of need/pref/max
    Grid,      // grid size, cell assignment and tracks
    Alloc,     // linear and single-axis allocation
    Overflow,  // scrollbar attach/detach
    Scroll,    // scroll value changes, applied or deferred
    Split,     // split proportions
};

const char* stage_name(Stage stage);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    Stage stage = Stage::Size;
    std::string node;             // slash-joined path of the node concerned, may be empty
    std::string message;
    std::uint64_t pass_id = 0;    // layout pass that produced the event, 0 = outside a pass
};

// "[severity] stage node (pass:N): message"; node and pass omitted when unset
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects structured events from the layout engine. Observers run
// synchronously on every accepted event, in registration order.
class DiagnosticEmitter {
public:
    void emit(Severity severity, Stage stage, const std::string& node,
              const std::string& message);

    void set_pass_id(std::uint64_t id) { pass_id_ = id; }
    std::uint64_t pass_id() const { return pass_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    // When false, emitted events still reach observers but are not retained.
    void set_retain_events(bool retain) { retain_events_ = retain; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(Stage stage) const;
    std::vector<DiagnosticEvent> events_for_pass(std::uint64_t pass_id) const;
    // Events about node or any node below it
    std::vector<DiagnosticEvent> events_for_subtree(const std::string& node) const;

    // Accepted events per severity, counted even when events are not retained
    std::size_t count(Severity severity) const;

    void clear();
    std::size_t size() const { return events_.size(); }

private:
    template <typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const;

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t counts_[4] = {0, 0, 0, 0};
    std::uint64_t pass_id_ = 0;
    Severity min_severity_ = Severity::Trace;
    bool retain_events_ = true;
};

} // namespace trellis::core
