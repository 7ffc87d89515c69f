#include <trellis/layout/scroll_bar.h>

#include <algorithm>
#include <cmath>

namespace trellis::layout {

void ScrollBar::configure(float min, float max, float step, float page_step, float thumb_size) {
    min_ = min;
    max_ = std::max(min, max);
    step_ = step;
    page_step_ = page_step;
    thumb_size_ = std::max(thumb_size, 0.0f);
    // A shrunken range pulls the current value back inside it
    value_ = std::clamp(value_, min_, max_value());
    drag_value_ = value_;
}

float ScrollBar::max_value() const {
    return std::max(min_, max_ - thumb_size_);
}

std::optional<ScrollEvent> ScrollBar::set_value(float v) {
    float clamped = std::clamp(v, min_, max_value());
    if (clamped == value_) {
        return std::nullopt;
    }
    ScrollEvent event;
    event.horizontal = horizontal_;
    event.value = clamped;
    event.delta = clamped - value_;
    value_ = clamped;
    drag_value_ = clamped;
    return event;
}

std::optional<ScrollEvent> ScrollBar::track(float v) {
    drag_value_ = std::clamp(v, min_, max_value());
    if (tracking && std::abs(drag_value_ - value_) < track_threshold) {
        return std::nullopt;
    }
    return set_value(drag_value_);
}

void ScrollBar::deactivate() {
    data.alloc_pos = {};
    data.alloc_pos_rel = {};
    data.alloc_pos_orig = {};
    data.alloc_size = {};
}

} // namespace trellis::layout
