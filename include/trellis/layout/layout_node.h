#pragma once
#include <trellis/layout/layout_data.h>
#include <trellis/layout/scroll_bar.h>
#include <trellis/layout/style.h>
#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trellis::layout {

enum class LayoutMode {
    Widget,   // leaf, or a parent that does not arrange its children
    Row,      // children across a row
    Column,   // children down a column
    Grid,     // children in grid cells
    Stacked,  // children on top of each other, stack_top is shown
    Split     // proportional split view
};

const char* layout_mode_name(LayoutMode mode);

enum RowCol {
    kRow = 0,
    kCol = 1
};

// Proportional split state: one share per child, normalized to sum 1
struct SplitState {
    std::vector<float> splits;
    std::vector<float> saved_splits;
    Dim dim = Dim::X;
    float handle_size = core::config::kSplitHandleSize;
};

struct LayoutNode {
    std::string name;
    LayoutMode mode = LayoutMode::Widget;
    LayoutStyle style;
    LayoutData data;

    // Intrinsic content size measured by the owning widget (e.g. shaped
    // text). Seeds alloc_size during gather so need covers the content.
    Vec2 content_size;

    // Container state
    Vec2 child_size;    // bounding box of all children as laid out
    Vec2 extra_size;    // space taken by scrollbars
    bool has_h_scroll = false;
    bool has_v_scroll = false;
    std::unique_ptr<ScrollBar> h_scroll;
    std::unique_ptr<ScrollBar> v_scroll;

    // Grid state: (cols, rows) and per-track data for rows [kRow] and cols [kCol]
    GridPoint grid_size;
    std::array<std::vector<LayoutData>, 2> grid_data;

    // Stacked: index of the one child that is shown
    std::optional<std::size_t> stack_top;

    SplitState split;

    // Tree
    LayoutNode* parent = nullptr;
    std::vector<std::unique_ptr<LayoutNode>> children;

    LayoutNode* append_child(std::unique_ptr<LayoutNode> child);

    std::size_t child_count() const { return children.size(); }

    // Throws std::invalid_argument when idx is out of range; the entry
    // itself may be null
    LayoutNode* child_at(std::size_t idx) const;

    bool is_container() const {
        return mode == LayoutMode::Row || mode == LayoutMode::Column ||
               mode == LayoutMode::Grid || mode == LayoutMode::Stacked;
    }

    // Select the child shown by a stacked layout.
    // Throws std::invalid_argument when idx is out of range.
    void show_child_at_index(std::size_t idx);

    // Non-null children that are shown: all of them, or for Stacked only
    // the stack_top child
    std::vector<LayoutNode*> visible_children() const;

    // Slash-joined names from the root, for diagnostics
    std::string path() const;
};

} // namespace trellis::layout
