#pragma once
#include <trellis/layout/layout_node.h>

namespace trellis::layout {

// Compare child_size against the allocation per axis and attach, size
// or retire scrollbars. A horizontal bar takes a strip of vertical space
// and vice versa; both checks use the same child_size snapshot.
void manage_overflow(LayoutNode& node);

// Bars are created lazily and reused; these destroy them outright
void delete_h_scroll(LayoutNode& node);
void delete_v_scroll(LayoutNode& node);

// delta plus this node's own scroll offset, for moving its children
Vec2 scroll_delta(const LayoutNode& node, Vec2 delta);

// alloc_pos = alloc_pos_orig + delta, then children follow with the
// node's scroll offset added. alloc_pos_rel is never touched.
void move_node(LayoutNode& node, Vec2 delta);
void move_children(LayoutNode& node, Vec2 delta);

// Re-apply the node's current scroll offsets to all descendants without
// running the size or allocation passes
void reposition(LayoutNode& node);

} // namespace trellis::layout
