#include <trellis/layout/layout_engine.h>

#include <trellis/layout/grid_tracks.h>
#include <trellis/layout/overflow.h>
#include <trellis/layout/split_view.h>

#include <algorithm>
#include <sstream>

namespace trellis::layout {

namespace {

// Nodes that allocate space to their own children
bool manages_children(const LayoutNode& node) {
    return node.is_container() || node.mode == LayoutMode::Split;
}

// Do we sum up children along d? else max
bool sum_dim(const LayoutNode& node, Dim d) {
    return (d == Dim::X && node.mode == LayoutMode::Row) ||
           (d == Dim::Y && node.mode == LayoutMode::Column);
}

std::string format_stats(const AllocStats& st) {
    std::ostringstream oss;
    oss << "targ: " << st.target << " extra: " << st.extra
        << (st.use_pref ? " (pref)" : " (need)")
        << " nstretch: " << st.stretch_count << " stretch-tot: " << st.stretch_total;
    if (st.justify_gap > 0) oss << " gap: " << st.justify_gap;
    return oss.str();
}

} // namespace

LayoutEngine::LayoutEngine(core::DiagnosticEmitter* diagnostics)
    : diagnostics_(diagnostics) {}

void LayoutEngine::compute(LayoutNode& root, Vec2 available) {
    UpdateScope scope(*this);
    ++pass_count_;
    if (diagnostics_) diagnostics_->set_pass_id(pass_count_);

    gather(root);

    for (Dim d : {Dim::X, Dim::Y}) {
        float a = available.dim(d);
        root.data.alloc_size.set_dim(d, a > 0 ? a : root.data.size.pref.dim(d));
    }
    layout(root);
    scope.close();
}

// ---------------------------------------------------------------------------
// Size pass
// ---------------------------------------------------------------------------

void LayoutEngine::gather(LayoutNode& node) {
    for (auto& child : node.children) {
        if (child) gather(*child);
    }

    node.data.set_from_style(node.style);
    node.data.alloc_size = node.content_size;

    switch (node.mode) {
        case LayoutMode::Row:
        case LayoutMode::Column:
        case LayoutMode::Stacked:
            gather_sizes(node);
            break;
        case LayoutMode::Grid: {
            int shared = gather_grid_sizes(node);
            if (shared > 0) {
                warn(core::Stage::Grid, node,
                     std::to_string(shared) + " item(s) share a cell, grid is full");
            }
            if (tracing_) {
                std::ostringstream oss;
                oss << "grid size cols: " << node.grid_size.x
                    << " rows: " << node.grid_size.y
                    << " need: " << node.data.size.need.to_string()
                    << " pref: " << node.data.size.pref.to_string();
                trace(core::Stage::Size, node, oss.str());
            }
            break;
        }
        case LayoutMode::Widget:
        case LayoutMode::Split:
            node.data.update_sizes();
            break;
    }
}

void LayoutEngine::gather_sizes(LayoutNode& node) {
    Vec2 sum_need, sum_pref, max_need, max_pref;
    bool any = false;
    for (auto& child : node.children) {
        if (!child) continue;
        any = true;
        LayoutData& cd = child->data;
        cd.update_sizes();
        sum_need += cd.size.need;
        sum_pref += cd.size.pref;
        max_need.set_max(cd.size.need);
        max_pref.set_max(cd.size.pref);
    }

    LayoutData& ld = node.data;
    if (!any) {
        ld.update_sizes();
        return;
    }

    for (Dim d : {Dim::X, Dim::Y}) {
        if (sum_dim(node, d)) {
            ld.size.need.set_max_dim(d, sum_need.dim(d));
            ld.size.pref.set_max_dim(d, sum_pref.dim(d));
        } else {
            ld.size.need.set_max_dim(d, max_need.dim(d));
            ld.size.pref.set_max_dim(d, max_pref.dim(d));
        }
        ld.size.need.add_dim(d, node.style.space_total(d));
        ld.size.pref.add_dim(d, node.style.space_total(d));
    }

    ld.update_sizes();  // enforce max and ordering
    if (tracing_) {
        trace(core::Stage::Size, node, "gather sizes need: " + ld.size.need.to_string() +
                                       " pref: " + ld.size.pref.to_string());
    }
}

// ---------------------------------------------------------------------------
// Allocation pass
// ---------------------------------------------------------------------------

void LayoutEngine::layout(LayoutNode& node) {
    if (manages_children(node)) {
        alloc_from_parent(node);
    }
    anchor(node);

    switch (node.mode) {
        case LayoutMode::Row:
            layout_all(node, Dim::X);
            layout_single(node, Dim::Y);
            break;
        case LayoutMode::Column:
            layout_all(node, Dim::Y);
            layout_single(node, Dim::X);
            break;
        case LayoutMode::Grid: {
            AllocStats row_stats, col_stats;
            layout_grid(node, &row_stats, &col_stats);
            if (tracing_) {
                trace(core::Stage::Grid, node, "rows on y " + format_stats(row_stats));
                trace(core::Stage::Grid, node, "cols on x " + format_stats(col_stats));
            }
            break;
        }
        case LayoutMode::Stacked:
            layout_single(node, Dim::X);
            layout_single(node, Dim::Y);
            break;
        case LayoutMode::Split:
            split::layout_split(node);
            if (tracing_) {
                std::ostringstream oss;
                oss << "splits on " << dim_name(node.split.dim) << ":";
                for (float sp : node.split.splits) oss << " " << sp;
                trace(core::Stage::Split, node, oss.str());
            }
            break;
        case LayoutMode::Widget:
            break;
    }

    if (node.is_container()) {
        finalize_layout(node);
        manage_overflow(node);
        if (tracing_ && (node.has_h_scroll || node.has_v_scroll)) {
            std::ostringstream oss;
            oss << "overflow " << overflow_name(node.style.overflow)
                << " child size: " << node.child_size.to_string()
                << " alloc: " << node.data.alloc_size.to_string()
                << " hscroll: " << (node.has_h_scroll ? "on" : "off")
                << " vscroll: " << (node.has_v_scroll ? "on" : "off");
            trace(core::Stage::Overflow, node, oss.str());
        }
    }

    // children laid out with canonical positions
    for (auto& child : node.children) {
        if (child) layout(*child);
    }

    // scrolling is a separate move step on top of canonical positions
    Vec2 delta = scroll_delta(node, Vec2{});
    if (!delta.is_zero()) {
        move_children(node, delta);
    }
}

void LayoutEngine::alloc_from_parent(LayoutNode& node) {
    if (node.parent == nullptr || !node.data.alloc_size.is_zero()) return;
    if (manages_children(*node.parent)) return;
    for (const LayoutNode* p = node.parent; p != nullptr; p = p->parent) {
        if (!p->data.alloc_size.is_zero()) {
            node.data.alloc_size = p->data.alloc_size;
            if (tracing_) {
                trace(core::Stage::Alloc, node, "got parent alloc: " +
                                                node.data.alloc_size.to_string() + " from " +
                                                p->path());
            }
            return;
        }
    }
}

void LayoutEngine::anchor(LayoutNode& node) {
    Vec2 origin = node.parent ? node.parent->data.alloc_pos : Vec2{};
    node.data.alloc_pos = origin + node.data.alloc_pos_rel;
    node.data.alloc_pos_orig = node.data.alloc_pos;
}

void LayoutEngine::layout_all(LayoutNode& node, Dim d) {
    std::vector<LayoutNode*> kids;
    std::vector<AllocItem> items;
    for (auto& child : node.children) {
        if (!child) continue;
        kids.push_back(child.get());
        items.push_back(AllocItem::from_prefs(child->data.size, d));
    }
    if (kids.empty()) return;

    const float avail = node.data.alloc_size.dim(d) - node.style.space_total(d);
    AllocStats stats;
    auto spans = allocate_linear(items, avail, node.style.align_dim(d),
                                 node.style.space_before(d), &stats);
    if (tracing_) {
        trace(core::Stage::Alloc, node, std::string("all on dim ") + dim_name(d) + " avail: " +
                                        std::to_string(avail) + " " + format_stats(stats));
    }
    for (std::size_t i = 0; i < kids.size(); ++i) {
        kids[i]->data.alloc_size.set_dim(d, spans[i].size);
        kids[i]->data.alloc_pos_rel.set_dim(d, spans[i].pos);
        if (tracing_) {
            std::ostringstream oss;
            oss << "child: " << kids[i]->name << " pos: " << spans[i].pos
                << " size: " << spans[i].size;
            trace(core::Stage::Alloc, node, oss.str());
        }
    }
}

void LayoutEngine::layout_single(LayoutNode& node, Dim d) {
    const float spc = node.style.space_before(d);
    const float avail = node.data.alloc_size.dim(d) - node.style.space_total(d);
    for (auto& child : node.children) {
        if (!child) continue;
        AllocSpan span = allocate_single(AllocItem::from_prefs(child->data.size, d), avail,
                                         child->style.align_dim(d), spc);
        child->data.alloc_size.set_dim(d, span.size);
        child->data.alloc_pos_rel.set_dim(d, span.pos);
    }
}

void LayoutEngine::finalize_layout(LayoutNode& node) {
    node.child_size = {};
    for (auto& child : node.children) {
        if (!child) continue;
        node.child_size.set_max(child->data.alloc_pos_rel + child->data.alloc_size);
    }
}

// ---------------------------------------------------------------------------
// Scrolling
// ---------------------------------------------------------------------------

ScrollBar* LayoutEngine::active_scroll(LayoutNode& node, Dim d) {
    if (d == Dim::X) {
        return node.has_h_scroll ? node.h_scroll.get() : nullptr;
    }
    return node.has_v_scroll ? node.v_scroll.get() : nullptr;
}

bool LayoutEngine::scroll(LayoutNode& node, Dim d, float value) {
    ScrollBar* sc = active_scroll(node, d);
    if (!sc) return false;
    return consume_scroll(node, sc->set_value(value));
}

bool LayoutEngine::scroll_by_steps(LayoutNode& node, Dim d, float steps) {
    ScrollBar* sc = active_scroll(node, d);
    if (!sc) return false;
    return consume_scroll(node, sc->step_by(steps));
}

bool LayoutEngine::scroll_by_pages(LayoutNode& node, Dim d, float pages) {
    ScrollBar* sc = active_scroll(node, d);
    if (!sc) return false;
    return consume_scroll(node, sc->page_by(pages));
}

bool LayoutEngine::drag_scroll(LayoutNode& node, Dim d, float value) {
    ScrollBar* sc = active_scroll(node, d);
    if (!sc) return false;
    return consume_scroll(node, sc->track(value));
}

bool LayoutEngine::consume_scroll(LayoutNode& node, const std::optional<ScrollEvent>& event) {
    if (!event) return false;
    if (tracing_) {
        std::ostringstream oss;
        oss << (event->horizontal ? "hscroll" : "vscroll")
            << " value: " << event->value << " delta: " << event->delta;
        trace(core::Stage::Scroll, node, oss.str());
    }
    if (update_depth_ > 0) {
        warn(core::Stage::Scroll, node, "not ready to update, repositioning deferred");
        if (std::find(deferred_.begin(), deferred_.end(), &node) == deferred_.end()) {
            deferred_.push_back(&node);
        }
        return true;
    }
    reposition(node);
    request_render(node);
    return true;
}

void LayoutEngine::discard_pending(const LayoutNode& node) {
    auto inside = [&node](const LayoutNode* queued) {
        for (const LayoutNode* n = queued; n != nullptr; n = n->parent) {
            if (n == &node) return true;
        }
        return false;
    };
    deferred_.erase(std::remove_if(deferred_.begin(), deferred_.end(), inside), deferred_.end());
}

void LayoutEngine::request_render(LayoutNode& node) {
    if (render_request_) render_request_(node);
}

void LayoutEngine::begin_update() {
    ++update_depth_;
}

void LayoutEngine::end_update() {
    if (update_depth_ == 0) return;
    if (--update_depth_ > 0 || deferred_.empty()) return;

    std::vector<LayoutNode*> pending;
    pending.swap(deferred_);
    for (LayoutNode* node : pending) {
        reposition(*node);
        request_render(*node);
    }
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

void LayoutEngine::trace(core::Stage stage, const LayoutNode& node, const std::string& message) {
    if (!tracing_ || !diagnostics_) return;
    diagnostics_->emit(core::Severity::Trace, stage, node.path(), message);
}

void LayoutEngine::warn(core::Stage stage, const LayoutNode& node, const std::string& message) {
    if (!diagnostics_) return;
    diagnostics_->emit(core::Severity::Warning, stage, node.path(), message);
}

} // namespace trellis::layout
