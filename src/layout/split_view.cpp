#include <trellis/layout/split_view.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace trellis::layout::split {

void update_splits(SplitState& state, std::size_t n) {
    if (n == 0) return;
    if (state.splits.size() != n) {
        state.splits.resize(n, 0.0f);
    }
    float sum = std::accumulate(state.splits.begin(), state.splits.end(), 0.0f);
    if (sum == 0.0f) {
        std::fill(state.splits.begin(), state.splits.end(), 1.0f / static_cast<float>(n));
        return;
    }
    float norm = 1.0f / sum;
    for (float& sp : state.splits) {
        sp *= norm;
    }
}

void set_splits(SplitState& state, std::size_t n, const std::vector<float>& values) {
    if (n == 0) return;
    update_splits(state, n);
    std::size_t count = std::min(n, values.size());
    for (std::size_t i = 0; i < count; ++i) {
        state.splits[i] = std::max(values[i], 0.0f);
    }
    update_splits(state, n);
}

void save_splits(SplitState& state) {
    if (state.splits.empty()) return;
    state.saved_splits = state.splits;
}

void restore_splits(SplitState& state, std::size_t n) {
    if (state.saved_splits.empty()) return;
    // Snapshots are already normalized; copy them back bit for bit
    state.splits = state.saved_splits;
    if (state.splits.size() != n) {
        update_splits(state, n);
    }
}

void collapse_children(SplitState& state, std::size_t n, const std::vector<std::size_t>& indices,
                       bool save) {
    for (std::size_t idx : indices) {
        if (idx >= n) {
            throw std::invalid_argument("split index " + std::to_string(idx) +
                                        " out of range for " + std::to_string(n) + " children");
        }
    }
    update_splits(state, n);
    if (save) {
        save_splits(state);
    }
    for (std::size_t idx : indices) {
        state.splits[idx] = 0.0f;
    }
    update_splits(state, n);
}

void layout_split(LayoutNode& node) {
    const std::size_t n = node.children.size();
    if (n == 0) return;
    SplitState& state = node.split;
    update_splits(state, n);

    const Dim dim = state.dim;
    const Dim odim = other_dim(dim);
    float avail = node.data.alloc_size.dim(dim) -
                  state.handle_size * static_cast<float>(n - 1);
    avail = std::max(avail, 0.0f);
    const float osz = node.data.alloc_size.dim(odim);

    float pos = 0;
    for (std::size_t i = 0; i < n; ++i) {
        float size = state.splits[i] * avail;
        LayoutNode* child = node.children[i].get();
        if (!child) continue;
        child->data.alloc_size.set_dim(dim, size);
        child->data.alloc_size.set_dim(odim, osz);
        child->data.alloc_pos_rel.set_dim(dim, pos);
        child->data.alloc_pos_rel.set_dim(odim, 0.0f);
        pos += size + state.handle_size;
    }
}

} // namespace trellis::layout::split
