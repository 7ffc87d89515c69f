#pragma once
#include <trellis/layout/layout_data.h>
#include <trellis/layout/style.h>
#include <cstddef>
#include <vector>

namespace trellis::layout {

// One item's constraints along the allocation axis
struct AllocItem {
    float need = 0;
    float pref = 0;
    float max = 0;  // negative = infinite stretch

    bool has_max_stretch() const { return max < 0.0f; }
    bool can_stretch_need() const { return pref > need; }

    static AllocItem from_prefs(const SizePrefs& size, Dim d) {
        return {size.need.dim(d), size.pref.dim(d), size.max.dim(d)};
    }
};

// Resolved placement of one item along the axis
struct AllocSpan {
    float pos = 0;
    float size = 0;
};

// Summary of one linear allocation, for tracing
struct AllocStats {
    float target = 0;      // sum of prefs, or of needs after fallback
    float extra = 0;       // leftover space, never negative
    bool use_pref = true;
    int stretch_count = 0;
    float stretch_total = 0;
    float justify_gap = 0;
};

// Distribute avail among items laid end to end, starting at offset.
// Extra space goes to stretch candidates in proportion to their pref,
// else to justify gaps, else to a single alignment offset.
std::vector<AllocSpan> allocate_linear(const std::vector<AllocItem>& items, float avail,
                                       Align align, float offset,
                                       AllocStats* stats = nullptr);

// Cross-axis case: one item placed independently within avail
AllocSpan allocate_single(const AllocItem& item, float avail, Align align, float offset);

} // namespace trellis::layout
