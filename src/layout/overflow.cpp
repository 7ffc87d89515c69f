#include <trellis/layout/overflow.h>

#include <trellis/core/config.h>

namespace trellis::layout {

namespace {

bool has_children(const LayoutNode& node) {
    for (const auto& child : node.children) {
        if (child) return true;
    }
    return false;
}

ScrollBar& ensure_scroll(std::unique_ptr<ScrollBar>& slot, bool horizontal) {
    if (!slot) {
        slot = std::make_unique<ScrollBar>(horizontal);
    }
    return *slot;
}

void configure_scroll(LayoutNode& node, ScrollBar& sc) {
    const Dim d = sc.dim();
    const float step = node.style.line_height;  // step by lines
    const float thumb = node.data.alloc_size.dim(d) - node.style.space_after(d);
    sc.configure(0.0f, node.child_size.dim(d) + node.extra_size.dim(d), step,
                 core::config::kPageStepLines * step, thumb);
    sc.tracking = true;
    sc.track_threshold = step;
}

void anchor_scroll(const LayoutNode& node, ScrollBar& sc) {
    sc.data.alloc_pos = node.data.alloc_pos + sc.data.alloc_pos_rel;
    sc.data.alloc_pos_orig = sc.data.alloc_pos;
}

void layout_scrolls(LayoutNode& node) {
    const float sbw = node.style.scrollbar_width;
    const Vec2 alloc = node.data.alloc_size;
    if (node.has_h_scroll) {
        ScrollBar& sc = *node.h_scroll;
        sc.data.alloc_pos_rel = {0.0f, alloc.y - sbw};
        sc.data.alloc_size = {alloc.x - (node.has_v_scroll ? sbw : 0.0f), sbw};
        anchor_scroll(node, sc);
    } else if (node.h_scroll) {
        node.h_scroll->deactivate();
    }
    if (node.has_v_scroll) {
        ScrollBar& sc = *node.v_scroll;
        sc.data.alloc_pos_rel = {alloc.x - sbw, 0.0f};
        sc.data.alloc_size = {sbw, alloc.y - (node.has_h_scroll ? sbw : 0.0f)};
        anchor_scroll(node, sc);
    } else if (node.v_scroll) {
        node.v_scroll->deactivate();
    }
}

} // namespace

void manage_overflow(LayoutNode& node) {
    node.extra_size = {};
    node.has_h_scroll = false;
    node.has_v_scroll = false;

    if (node.style.overflow == Overflow::Hidden) {
        delete_h_scroll(node);
        delete_v_scroll(node);
        return;
    }
    if (!has_children(node)) {
        layout_scrolls(node);
        return;
    }

    Vec2 avail;
    avail.x = node.data.alloc_size.x - node.style.space_after(Dim::X);
    avail.y = node.data.alloc_size.y - node.style.space_after(Dim::Y);

    const float sbw = node.style.scrollbar_width;
    if (node.child_size.x > avail.x) {
        node.has_h_scroll = true;
        node.extra_size.y += sbw;
    }
    if (node.child_size.y > avail.y) {
        node.has_v_scroll = true;
        node.extra_size.x += sbw;
    }

    if (node.has_h_scroll) {
        configure_scroll(node, ensure_scroll(node.h_scroll, true));
    }
    if (node.has_v_scroll) {
        configure_scroll(node, ensure_scroll(node.v_scroll, false));
    }
    layout_scrolls(node);
}

void delete_h_scroll(LayoutNode& node) {
    node.h_scroll.reset();
    node.has_h_scroll = false;
}

void delete_v_scroll(LayoutNode& node) {
    node.v_scroll.reset();
    node.has_v_scroll = false;
}

Vec2 scroll_delta(const LayoutNode& node, Vec2 delta) {
    if (node.has_h_scroll && node.h_scroll) {
        delta.x -= node.h_scroll->value();
    }
    if (node.has_v_scroll && node.v_scroll) {
        delta.y -= node.v_scroll->value();
    }
    return delta;
}

void move_node(LayoutNode& node, Vec2 delta) {
    node.data.alloc_pos = node.data.alloc_pos_orig + delta;
    if (node.has_h_scroll && node.h_scroll) anchor_scroll(node, *node.h_scroll);
    if (node.has_v_scroll && node.v_scroll) anchor_scroll(node, *node.v_scroll);
    move_children(node, scroll_delta(node, delta));
}

void move_children(LayoutNode& node, Vec2 delta) {
    for (auto& child : node.children) {
        if (child) move_node(*child, delta);
    }
}

void reposition(LayoutNode& node) {
    Vec2 delta = node.data.alloc_pos - node.data.alloc_pos_orig;
    move_children(node, scroll_delta(node, delta));
}

} // namespace trellis::layout
