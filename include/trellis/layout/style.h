#pragma once
#include <trellis/core/config.h>
#include <trellis/layout/geometry.h>
#include <optional>

namespace trellis::layout {

// All alignment modes share one list; only start/middle/end/justify
// affect allocation, the rest are carried for the style layer.
enum class Align {
    Left,
    Top,
    Center,
    Middle,       // vertical version of center
    Right,
    Bottom,
    Baseline,
    Justify,      // same as CSS space-between
    SpaceAround,
    FlexStart,
    FlexEnd,
    TextTop,
    TextBottom,
    Sub,
    Super
};

bool is_align_start(Align a);
bool is_align_middle(Align a);
bool is_align_end(Align a);
const char* align_name(Align a);

// Visible and Scroll are treated the same as Auto
enum class Overflow {
    Auto,
    Scroll,
    Visible,
    Hidden
};

const char* overflow_name(Overflow o);

struct EdgeSizes {
    float top = 0, right = 0, bottom = 0, left = 0;

    void set_all(float v) { top = right = bottom = left = v; }
    float before(Dim d) const { return d == Dim::X ? left : top; }
    float after(Dim d) const { return d == Dim::X ? right : bottom; }
};

// Resolved layout style of one node. Every value is already in dots.
struct LayoutStyle {
    Align align_h = Align::Left;
    Align align_v = Align::Top;

    Vec2 pos;                // often superseded by the parent layout
    float width = 0;         // preferred size, 0 = unspecified
    float height = 0;
    float min_width = core::config::kDefaultMinSize;
    float min_height = core::config::kDefaultMinSize;
    float max_width = 0;     // 0 = no constraint, negative = stretch
    float max_height = 0;

    EdgeSizes margin, border, padding;
    Overflow overflow = Overflow::Auto;

    // Grid placement
    int columns = 0;             // explicit column count, 0 = derive
    std::optional<int> row;
    std::optional<int> col;
    int row_span = 1;
    int col_span = 1;

    float scrollbar_width = core::config::kDefaultScrollBarWidth;
    float line_height = core::config::kDefaultLineHeight;  // scroll step

    Align align_dim(Dim d) const { return d == Dim::X ? align_h : align_v; }

    // Box spacing: margin + border + padding on one side
    float space_before(Dim d) const { return margin.before(d) + border.before(d) + padding.before(d); }
    float space_after(Dim d) const { return margin.after(d) + border.after(d) + padding.after(d); }
    float space_total(Dim d) const { return space_before(d) + space_after(d); }

    Vec2 pos_dots() const { return pos; }
    Vec2 size_dots() const { return {width, height}; }
    Vec2 min_size_dots() const { return {min_width, min_height}; }
    Vec2 max_size_dots() const { return {max_width, max_height}; }
};

// Per-kind presets
LayoutStyle frame_style();
LayoutStyle stretch_style();
LayoutStyle space_style(float line_height = core::config::kDefaultLineHeight);
LayoutStyle split_view_style();

} // namespace trellis::layout
