#pragma once
#include <trellis/layout/layout_data.h>
#include <optional>

namespace trellis::layout {

// Produced by a scrollbar whose value changed; the owning container
// consumes it synchronously instead of subscribing to a signal.
struct ScrollEvent {
    bool horizontal = false;
    float value = 0;
    float delta = 0;  // value minus the previous value
};

class ScrollBar {
public:
    explicit ScrollBar(bool horizontal) : horizontal_(horizontal) {}

    bool horizontal() const { return horizontal_; }
    Dim dim() const { return horizontal_ ? Dim::X : Dim::Y; }

    // Range and stepping, reconfigured on every overflow pass
    void configure(float min, float max, float step, float page_step, float thumb_size);

    float min() const { return min_; }
    float max() const { return max_; }
    float value() const { return value_; }
    float drag_value() const { return drag_value_; }
    float step() const { return step_; }
    float page_step() const { return page_step_; }
    float thumb_size() const { return thumb_size_; }

    // Largest reachable value: the thumb must stay inside the range
    float max_value() const;

    // Clamp and apply; empty when the value did not change
    std::optional<ScrollEvent> set_value(float v);

    // Drag path: while tracking, the value only follows the pointer once
    // it has moved at least track_threshold away
    std::optional<ScrollEvent> track(float v);

    std::optional<ScrollEvent> step_by(float steps) { return set_value(value_ + steps * step_); }
    std::optional<ScrollEvent> page_by(float pages) { return set_value(value_ + pages * page_step_); }

    bool tracking = true;
    float track_threshold = 0;

    // Geometry within the owning container
    LayoutData data;

    // Zero geometry while the bar is kept but not needed
    void deactivate();
    bool active() const { return !data.alloc_size.is_zero(); }

private:
    bool horizontal_ = false;
    float min_ = 0;
    float max_ = 0;
    float value_ = 0;
    float drag_value_ = 0;
    float step_ = 0;
    float page_step_ = 0;
    float thumb_size_ = 0;
};

} // namespace trellis::layout
