#pragma once
#include <trellis/layout/layout_node.h>
#include <cstddef>
#include <vector>

namespace trellis::layout::split {

// Coerce splits to n entries (new entries 0) and normalize to sum 1.
// An all-zero set becomes n equal shares.
void update_splits(SplitState& state, std::size_t n);

// Copy the first min(n, values.size()) entries, then normalize. A zero
// share collapses that child.
void set_splits(SplitState& state, std::size_t n, const std::vector<float>& values);

// Snapshot the current splits for a later restore
void save_splits(SplitState& state);

// Re-apply the last snapshot; no-op when nothing was saved
void restore_splits(SplitState& state, std::size_t n);

// Zero the given children's shares, optionally saving first, and
// normalize. Throws std::invalid_argument if any index is >= n; nothing
// changes in that case.
void collapse_children(SplitState& state, std::size_t n, const std::vector<std::size_t>& indices,
                       bool save);

// Partition the node's allocation among its children along state.dim,
// leaving handle_size between neighbours. Never consults size prefs.
void layout_split(LayoutNode& node);

} // namespace trellis::layout::split
