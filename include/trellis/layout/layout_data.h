#pragma once
#include <trellis/layout/geometry.h>
#include <trellis/layout/style.h>

namespace trellis::layout {

struct SizePrefs {
    Vec2 need;  // minimum size needed, at least the allocated size
    Vec2 pref;  // preferred size, starting point for allocation
    Vec2 max;   // 0 = no constraint, negative = stretch without bound

    // Max < 0: may stretch infinitely along d
    bool has_max_stretch(Dim d) const { return max.dim(d) < 0.0f; }
    // Pref > Need: has room to grow toward its preference along d
    bool can_stretch_need(Dim d) const { return pref.dim(d) > need.dim(d); }
};

struct Margins {
    float left = 0, right = 0, top = 0, bottom = 0;

    void set_margin(float m) { left = right = top = bottom = m; }
};

// Everything needed to place one item within its parent layout. Grid
// containers also keep one of these per row and per column track.
struct LayoutData {
    SizePrefs size;
    Margins margins;
    GridPoint grid_pos;          // (col, row) cell assigned by a grid parent
    GridPoint grid_span{1, 1};
    Vec2 alloc_size;             // allocated by the parent layout
    Vec2 alloc_pos;              // absolute: parent alloc_pos + alloc_pos_rel (+ scroll delta)
    Vec2 alloc_pos_rel;          // canonical position within the parent
    Vec2 alloc_pos_orig;         // alloc_pos before any scroll delta

    // Spans below 1 count as 1
    void defaults();

    // Seed size hints and the desired position from style; resets alloc fields
    void set_from_style(const LayoutStyle& style);

    // Zero all alloc fields
    void reset();

    // Re-clamp: need >= alloc_size, pref >= need, both <= max when max > 0
    void update_sizes();
};

} // namespace trellis::layout
