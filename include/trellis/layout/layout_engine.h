#pragma once
#include <trellis/core/diagnostics.h>
#include <trellis/layout/layout_node.h>
#include <trellis/layout/linear_allocator.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trellis::layout {

// Asks whoever owns render scheduling to redraw a container
using RenderRequestFn = std::function<void(LayoutNode& node)>;

// Two-pass layout driver. The size pass runs depth-first (children
// before parents), the allocation pass runs parent-first; each container
// then records its child bounding box, manages overflow, recurses, and
// applies its scroll offset to its descendants.
class LayoutEngine {
public:
    explicit LayoutEngine(core::DiagnosticEmitter* diagnostics = nullptr);

    // Full pass over the tree rooted at root. available is the root's
    // allocation; a zero axis falls back to the root's preferred size.
    void compute(LayoutNode& root, Vec2 available);

    // Size pass only: reset, seed from style and aggregate, children first
    void gather(LayoutNode& node);

    // Allocation pass for a node whose own alloc_size and alloc_pos_rel
    // are already set
    void layout(LayoutNode& node);

    // Scroll a container along d. The change is applied right away, or
    // deferred until the outermost update finishes if one is running.
    // Returns false if there is no such scrollbar or nothing changed.
    // A deferred container must outlive the update, or be dropped from the
    // queue with discard_pending() before it is destroyed.
    bool scroll(LayoutNode& node, Dim d, float value);
    bool scroll_by_steps(LayoutNode& node, Dim d, float steps);
    bool scroll_by_pages(LayoutNode& node, Dim d, float pages);
    bool drag_scroll(LayoutNode& node, Dim d, float value);

    // The outermost end_update() repositions every deferred container and
    // requests a render for it; exceptions from the render callback
    // propagate after the depth has been lowered.
    void begin_update();
    void end_update();
    int update_depth() const { return update_depth_; }

    // Forget deferred scrolls for node and everything below it
    void discard_pending(const LayoutNode& node);

    // Call close() on the normal path so a throwing render callback
    // surfaces there. The destructor only closes a scope left open by an
    // exception, and then the callback must not throw.
    class UpdateScope {
    public:
        explicit UpdateScope(LayoutEngine& engine) : engine_(engine) { engine_.begin_update(); }
        ~UpdateScope() {
            if (open_) engine_.end_update();
        }

        void close() {
            if (!open_) return;
            open_ = false;
            engine_.end_update();
        }

        UpdateScope(const UpdateScope&) = delete;
        UpdateScope& operator=(const UpdateScope&) = delete;

    private:
        LayoutEngine& engine_;
        bool open_ = true;
    };

    void set_tracing(bool enabled) { tracing_ = enabled; }
    bool tracing() const { return tracing_; }

    // Called once per repositioned container after a scroll
    void set_render_request(RenderRequestFn fn) { render_request_ = std::move(fn); }

    std::uint64_t pass_count() const { return pass_count_; }

private:
    // Row, Column and Stacked: sum along the flow axis, max across it
    void gather_sizes(LayoutNode& node);

    // A container under a non-layout parent takes its size from the
    // nearest ancestor that has one
    void alloc_from_parent(LayoutNode& node);

    // alloc_pos from the parent's alloc_pos and our alloc_pos_rel
    void anchor(LayoutNode& node);

    // All children along d, sharing the free space
    void layout_all(LayoutNode& node, Dim d);
    // Each child independently along d
    void layout_single(LayoutNode& node, Dim d);

    void finalize_layout(LayoutNode& node);

    ScrollBar* active_scroll(LayoutNode& node, Dim d);
    bool consume_scroll(LayoutNode& node, const std::optional<ScrollEvent>& event);
    void request_render(LayoutNode& node);

    void trace(core::Stage stage, const LayoutNode& node, const std::string& message);
    void warn(core::Stage stage, const LayoutNode& node, const std::string& message);

    core::DiagnosticEmitter* diagnostics_ = nullptr;
    bool tracing_ = false;
    int update_depth_ = 0;
    std::uint64_t pass_count_ = 0;
    std::vector<LayoutNode*> deferred_;  // scrolled mid-update, repositioned at the end
    RenderRequestFn render_request_;
};

} // namespace trellis::layout
