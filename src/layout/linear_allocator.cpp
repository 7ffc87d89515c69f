#include <trellis/layout/linear_allocator.h>

#include <trellis/core/config.h>

#include <algorithm>

namespace trellis::layout {

namespace {

enum class StretchMode {
    None,
    Max,   // only infinitely stretchy items (max < 0) grow
    Need   // anything below its preference may grow
};

bool is_stretch_candidate(const AllocItem& item, StretchMode mode) {
    switch (mode) {
        case StretchMode::Max:  return item.has_max_stretch();
        case StretchMode::Need: return item.has_max_stretch() || item.can_stretch_need();
        case StretchMode::None: return false;
    }
    return false;
}

} // namespace

std::vector<AllocSpan> allocate_linear(const std::vector<AllocItem>& items, float avail,
                                       Align align, float offset, AllocStats* stats) {
    std::vector<AllocSpan> spans(items.size());
    if (items.empty()) {
        if (stats) *stats = AllocStats{};
        return spans;
    }

    float sum_pref = 0;
    float sum_need = 0;
    for (const auto& item : items) {
        sum_pref += item.pref;
        sum_need += item.need;
    }

    bool use_pref = true;
    float target = sum_pref;
    float extra = avail - target;
    if (extra < -core::config::kFitTolerance) {  // preferred sizes do not fit
        use_pref = false;
        target = sum_need;
        extra = avail - target;
    }
    extra = std::max(extra, 0.0f);

    StretchMode mode = StretchMode::None;
    int stretch_count = 0;
    float stretch_total = 0;
    if (extra > 0.0f) {
        StretchMode candidate_mode = use_pref ? StretchMode::Max : StretchMode::Need;
        for (const auto& item : items) {
            if (is_stretch_candidate(item, candidate_mode)) {
                ++stretch_count;
                stretch_total += item.pref;
            }
        }
        if (stretch_count > 0) mode = candidate_mode;
    }

    float justify_gap = 0;
    if (mode == StretchMode::None && align == Align::Justify && items.size() > 1 && extra > 0.0f) {
        justify_gap = extra / static_cast<float>(items.size() - 1);
    }

    float pos = offset;
    if (mode == StretchMode::None && justify_gap == 0.0f) {
        if (is_align_middle(align)) {
            pos += 0.5f * extra;
        } else if (is_align_end(align)) {
            pos += extra;
        }
    }

    for (size_t i = 0; i < items.size(); ++i) {
        const AllocItem& item = items[i];
        float size = use_pref ? item.pref : item.need;
        if (mode != StretchMode::None && is_stretch_candidate(item, mode)) {
            // In proportion to pref; all-zero prefs share equally
            float share = stretch_total > 0.0f
                ? item.pref / stretch_total
                : 1.0f / static_cast<float>(stretch_count);
            size += extra * share;
        } else if (justify_gap > 0.0f && i > 0) {
            pos += justify_gap;
        }
        spans[i].pos = pos;
        spans[i].size = size;
        pos += size;
    }

    if (stats) {
        stats->target = target;
        stats->extra = extra;
        stats->use_pref = use_pref;
        stats->stretch_count = stretch_count;
        stats->stretch_total = stretch_total;
        stats->justify_gap = justify_gap;
    }
    return spans;
}

AllocSpan allocate_single(const AllocItem& item, float avail, Align align, float offset) {
    bool use_pref = true;
    float extra = avail - item.pref;
    if (extra < -core::config::kFitTolerance) {
        use_pref = false;
        extra = avail - item.need;
    }
    extra = std::max(extra, 0.0f);

    bool stretch = false;
    if (extra > 0.0f) {
        stretch = use_pref ? item.has_max_stretch()
                           : (item.has_max_stretch() || item.can_stretch_need());
    }

    AllocSpan span;
    span.pos = offset;
    span.size = use_pref ? item.pref : item.need;
    // Justify places a lone item at the start without growing it, so that
    // justify only ever turns extra space into gaps. Earlier layouts grew
    // the item to fill instead.
    if (stretch) {
        span.size += extra;
    } else if (is_align_middle(align)) {
        span.pos += 0.5f * extra;
    } else if (is_align_end(align)) {
        span.pos += extra;
    }
    return span;
}

} // namespace trellis::layout
