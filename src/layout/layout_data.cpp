#include <trellis/layout/layout_data.h>

#include <sstream>

namespace trellis::layout {

std::string Vec2::to_string() const {
    std::ostringstream oss;
    oss << "(" << x << ", " << y << ")";
    return oss.str();
}

void LayoutData::defaults() {
    if (grid_span.x < 1) grid_span.x = 1;
    if (grid_span.y < 1) grid_span.y = 1;
}

void LayoutData::set_from_style(const LayoutStyle& style) {
    reset();
    size.need = style.min_size_dots();
    size.pref = style.size_dots();
    size.max = style.max_size_dots();
    margins.left = style.margin.left;
    margins.right = style.margin.right;
    margins.top = style.margin.top;
    margins.bottom = style.margin.bottom;
    grid_span = {style.col_span, style.row_span};
    defaults();

    // Initial desired position; a managing parent layout overwrites it
    alloc_pos_rel = style.pos_dots();
}

void LayoutData::reset() {
    alloc_size = {};
    alloc_pos = {};
    alloc_pos_rel = {};
    alloc_pos_orig = {};
}

void LayoutData::update_sizes() {
    size.need.set_max(alloc_size);      // need cannot be < alloc
    size.pref.set_max(size.need);       // pref cannot be < need
    size.need.set_min_pos(size.max);    // need cannot be > max
    size.pref.set_min_pos(size.max);    // pref cannot be > max
}

} // namespace trellis::layout
