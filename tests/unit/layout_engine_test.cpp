#include <trellis/layout/layout_engine.h>
#include <trellis/layout/split_view.h>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace trellis::layout;
using trellis::core::DiagnosticEmitter;
using trellis::core::Severity;
using trellis::core::Stage;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::unique_ptr<LayoutNode> make_box(const std::string& name, LayoutMode mode) {
    auto node = std::make_unique<LayoutNode>();
    node->name = name;
    node->mode = mode;
    return node;
}

static LayoutNode* add_leaf(LayoutNode& parent, const std::string& name, float w, float h) {
    auto leaf = make_box(name, LayoutMode::Widget);
    leaf->style.width = w;
    leaf->style.height = h;
    return parent.append_child(std::move(leaf));
}

static LayoutNode* add_rigid_leaf(LayoutNode& parent, const std::string& name, float w, float h) {
    LayoutNode* leaf = add_leaf(parent, name, w, h);
    leaf->style.min_width = w;
    leaf->style.min_height = h;
    return leaf;
}

// Column of five rigid 50x20 rows in a 100x50 viewport: overflows by 50 on y
static std::unique_ptr<LayoutNode> make_scrolling_column() {
    auto root = make_box("list", LayoutMode::Column);
    for (int i = 0; i < 5; ++i) {
        add_rigid_leaf(*root, "item" + std::to_string(i), 50.0f, 20.0f);
    }
    return root;
}

// Need <= Pref on both axes, and both <= Max wherever Max is positive,
// for node and everything below it
static void expect_ordered_sizes(const LayoutNode& node) {
    SCOPED_TRACE(node.path());
    const SizePrefs& sp = node.data.size;
    for (Dim d : {Dim::X, Dim::Y}) {
        EXPECT_LE(sp.need.dim(d), sp.pref.dim(d)) << dim_name(d);
        if (sp.max.dim(d) > 0.0f) {
            EXPECT_LE(sp.need.dim(d), sp.max.dim(d)) << dim_name(d);
            EXPECT_LE(sp.pref.dim(d), sp.max.dim(d)) << dim_name(d);
        }
    }
    for (const auto& child : node.children) {
        if (child) expect_ordered_sizes(*child);
    }
}

// ---------------------------------------------------------------------------
// Size pass
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, SizePassOrdersNeedPrefMaxEverywhere) {
    auto root = make_box("root", LayoutMode::Column);
    root->append_child(make_box("empty-row", LayoutMode::Row));
    root->append_child(make_box("empty-col", LayoutMode::Column));
    root->append_child(make_box("empty-grid", LayoutMode::Grid));
    root->append_child(make_box("empty-stack", LayoutMode::Stacked));
    root->append_child(make_box("empty-split", LayoutMode::Split));
    root->append_child(nullptr);

    LayoutNode* host = root->append_child(make_box("host", LayoutMode::Widget));
    host->append_child(make_box("hosted-grid", LayoutMode::Grid));
    host->append_child(make_box("hosted-stack", LayoutMode::Stacked));
    LayoutNode* hosted_row = host->append_child(make_box("hosted-row", LayoutMode::Row));
    add_leaf(*hosted_row, "a", 50.0f, 10.0f);
    add_leaf(*hosted_row, "b", 70.0f, 10.0f);
    hosted_row->style.max_width = 90.0f;

    LayoutNode* grid = root->append_child(make_box("grid", LayoutMode::Grid));
    grid->style.columns = 2;
    add_leaf(*grid, "c0", 40.0f, 40.0f)->style.max_width = 25.0f;
    add_leaf(*grid, "c1", 0.0f, 0.0f)->style.min_width = 30.0f;
    add_leaf(*grid, "c2", 10.0f, 10.0f)->style.max_height = -1.0f;

    LayoutNode* capped = add_leaf(*root, "capped", 80.0f, 20.0f);
    capped->style.min_width = 60.0f;
    capped->style.max_width = 50.0f;
    LayoutNode* text = add_leaf(*root, "text", 0.0f, 0.0f);
    text->content_size = {120.0f, 14.0f};

    LayoutEngine engine;
    engine.gather(*root);
    expect_ordered_sizes(*root);
}

TEST(LayoutEngineTest, EmptyContainerRootsOrderNeedAndPref) {
    for (LayoutMode mode : {LayoutMode::Row, LayoutMode::Column, LayoutMode::Grid,
                            LayoutMode::Stacked, LayoutMode::Split, LayoutMode::Widget}) {
        auto root = make_box("", mode);
        LayoutEngine engine;
        engine.compute(*root, {100.0f, 100.0f});
        expect_ordered_sizes(*root);
    }
}

TEST(LayoutEngineTest, EmptyGridUnderWidgetOrdersNeedAndPref) {
    auto window = make_box("window", LayoutMode::Widget);
    LayoutNode* grid = window->append_child(make_box("grid", LayoutMode::Grid));

    LayoutEngine engine;
    engine.gather(*window);
    EXPECT_LE(grid->data.size.need.x, grid->data.size.pref.x);
    EXPECT_LE(grid->data.size.need.y, grid->data.size.pref.y);
}

TEST(LayoutEngineTest, ColumnSumsHeightsAndMaxesWidths) {
    auto root = make_box("root", LayoutMode::Column);
    add_leaf(*root, "a", 50.0f, 20.0f);
    add_leaf(*root, "b", 70.0f, 30.0f);

    LayoutEngine engine;
    engine.gather(*root);
    EXPECT_FLOAT_EQ(root->data.size.pref.x, 70.0f);
    EXPECT_FLOAT_EQ(root->data.size.pref.y, 50.0f);
    EXPECT_FLOAT_EQ(root->data.size.need.x, 2.0f);
    EXPECT_FLOAT_EQ(root->data.size.need.y, 4.0f);
}

TEST(LayoutEngineTest, BoxSpacingAddsToContainerSize) {
    auto root = make_box("root", LayoutMode::Row);
    root->style = frame_style();
    add_leaf(*root, "a", 10.0f, 10.0f);

    LayoutEngine engine;
    engine.gather(*root);
    EXPECT_FLOAT_EQ(root->data.size.pref.x, 22.0f);
    EXPECT_FLOAT_EQ(root->data.size.pref.y, 22.0f);
}

TEST(LayoutEngineTest, ContentSizeRaisesNeed) {
    auto root = make_box("root", LayoutMode::Column);
    LayoutNode* text = add_leaf(*root, "text", 0.0f, 0.0f);
    text->content_size = {80.0f, 30.0f};

    LayoutEngine engine;
    engine.gather(*root);
    EXPECT_FLOAT_EQ(text->data.size.need.x, 80.0f);
    EXPECT_FLOAT_EQ(text->data.size.pref.y, 30.0f);
    EXPECT_FLOAT_EQ(root->data.size.need.x, 80.0f);
}

TEST(LayoutEngineTest, MaxClampsContainerPref) {
    auto root = make_box("root", LayoutMode::Row);
    root->style.max_width = 60.0f;
    add_leaf(*root, "a", 50.0f, 10.0f);
    add_leaf(*root, "b", 50.0f, 10.0f);

    LayoutEngine engine;
    engine.gather(*root);
    EXPECT_FLOAT_EQ(root->data.size.pref.x, 60.0f);
    EXPECT_LE(root->data.size.need.x, root->data.size.pref.x);
}

// ---------------------------------------------------------------------------
// Allocation pass
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, ColumnStacksChildrenFromTop) {
    auto root = make_box("root", LayoutMode::Column);
    root->style.pos = {5.0f, 5.0f};
    LayoutNode* a = add_leaf(*root, "a", 50.0f, 20.0f);
    LayoutNode* b = add_leaf(*root, "b", 50.0f, 20.0f);
    LayoutNode* c = add_leaf(*root, "c", 50.0f, 20.0f);

    LayoutEngine engine;
    engine.compute(*root, {100.0f, 100.0f});

    EXPECT_EQ(a->data.alloc_pos_rel, (Vec2{0.0f, 0.0f}));
    EXPECT_EQ(b->data.alloc_pos_rel, (Vec2{0.0f, 20.0f}));
    EXPECT_EQ(c->data.alloc_pos_rel, (Vec2{0.0f, 40.0f}));
    EXPECT_EQ(c->data.alloc_size, (Vec2{50.0f, 20.0f}));
    EXPECT_EQ(c->data.alloc_pos, (Vec2{5.0f, 45.0f}));
}

TEST(LayoutEngineTest, ZeroAvailableFallsBackToPref) {
    auto root = make_box("root", LayoutMode::Column);
    add_leaf(*root, "a", 50.0f, 20.0f);
    add_leaf(*root, "b", 40.0f, 40.0f);

    LayoutEngine engine;
    engine.compute(*root, {});
    EXPECT_EQ(root->data.alloc_size, (Vec2{50.0f, 60.0f}));
}

TEST(LayoutEngineTest, RowStretchFollowsPrefRatio) {
    auto root = make_box("root", LayoutMode::Row);
    auto one = std::make_unique<LayoutNode>();
    one->style = stretch_style();
    one->style.width = 10.0f;
    auto three = std::make_unique<LayoutNode>();
    three->style = stretch_style();
    three->style.width = 30.0f;
    LayoutNode* a = root->append_child(std::move(one));
    LayoutNode* b = root->append_child(std::move(three));

    LayoutEngine engine;
    engine.compute(*root, {200.0f, 20.0f});

    EXPECT_FLOAT_EQ(a->data.alloc_size.x, 50.0f);
    EXPECT_FLOAT_EQ(b->data.alloc_size.x, 150.0f);
    EXPECT_FLOAT_EQ(b->data.alloc_pos_rel.x, 50.0f);
    // cross axis stretches to fill
    EXPECT_FLOAT_EQ(a->data.alloc_size.y, 20.0f);
}

TEST(LayoutEngineTest, ChildrenFitInsideTheirParent) {
    auto root = make_box("root", LayoutMode::Row);
    root->style = frame_style();
    add_leaf(*root, "a", 100.0f, 10.0f)->style.min_width = 20.0f;
    add_leaf(*root, "b", 100.0f, 10.0f)->style.min_width = 30.0f;

    LayoutEngine engine;
    engine.compute(*root, {112.0f, 40.0f});

    float total = 0;
    for (const auto& child : root->children) {
        const LayoutData& cd = child->data;
        EXPECT_GE(cd.alloc_pos_rel.x, 6.0f);
        EXPECT_LE(cd.alloc_pos_rel.x + cd.alloc_size.x, 106.0f + 0.01f);
        EXPECT_GE(cd.alloc_size.x, cd.size.need.x);
        total += cd.alloc_size.x;
    }
    EXPECT_FLOAT_EQ(total, 100.0f);
}

TEST(LayoutEngineTest, GridPlacesChildrenInCells) {
    auto root = make_box("grid", LayoutMode::Grid);
    root->style.columns = 3;
    for (int i = 0; i < 7; ++i) {
        add_leaf(*root, "cell" + std::to_string(i), 10.0f, 10.0f);
    }

    LayoutEngine engine;
    engine.compute(*root, {30.0f, 30.0f});

    EXPECT_EQ(root->grid_size, (GridPoint{3, 3}));
    EXPECT_EQ(root->child_at(4)->data.alloc_pos, (Vec2{10.0f, 10.0f}));
    EXPECT_EQ(root->child_at(6)->data.alloc_pos, (Vec2{0.0f, 20.0f}));
}

TEST(LayoutEngineTest, StackedChildrenShareTheWholeArea) {
    auto root = make_box("stack", LayoutMode::Stacked);
    auto page = std::make_unique<LayoutNode>();
    page->style = stretch_style();
    LayoutNode* p0 = root->append_child(std::move(page));
    LayoutNode* p1 = add_leaf(*root, "small", 20.0f, 20.0f);
    p1->style.align_h = Align::Center;
    root->show_child_at_index(0);

    LayoutEngine engine;
    engine.compute(*root, {80.0f, 60.0f});

    EXPECT_EQ(p0->data.alloc_size, (Vec2{80.0f, 60.0f}));
    EXPECT_FLOAT_EQ(p1->data.alloc_pos_rel.x, 30.0f);
    ASSERT_EQ(root->visible_children().size(), 1u);
    EXPECT_EQ(root->visible_children()[0], p0);
}

TEST(LayoutEngineTest, SplitUnderWidgetTakesAncestorAllocation) {
    auto root = make_box("window", LayoutMode::Widget);
    auto split_node = make_box("split", LayoutMode::Split);
    split_node->style = split_view_style();
    LayoutNode* sv = root->append_child(std::move(split_node));
    LayoutNode* left = add_leaf(*sv, "left", 10.0f, 10.0f);
    LayoutNode* right = add_leaf(*sv, "right", 10.0f, 10.0f);

    LayoutEngine engine;
    engine.compute(*root, {210.0f, 40.0f});

    EXPECT_EQ(sv->data.alloc_size, (Vec2{210.0f, 40.0f}));
    EXPECT_FLOAT_EQ(left->data.alloc_size.x, 100.0f);
    EXPECT_FLOAT_EQ(right->data.alloc_pos.x, 110.0f);
    EXPECT_FLOAT_EQ(right->data.alloc_size.y, 40.0f);

    split::collapse_children(sv->split, sv->child_count(), {0}, true);
    engine.compute(*root, {210.0f, 40.0f});
    EXPECT_FLOAT_EQ(left->data.alloc_size.x, 0.0f);
    EXPECT_FLOAT_EQ(right->data.alloc_size.x, 200.0f);

    split::restore_splits(sv->split, sv->child_count());
    engine.compute(*root, {210.0f, 40.0f});
    EXPECT_FLOAT_EQ(left->data.alloc_size.x, 100.0f);
}

// ---------------------------------------------------------------------------
// Overflow and scrolling
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, OverflowingColumnGetsVerticalBar) {
    auto root = make_scrolling_column();
    LayoutEngine engine;
    engine.compute(*root, {100.0f, 50.0f});

    EXPECT_EQ(root->child_size, (Vec2{50.0f, 100.0f}));
    EXPECT_TRUE(root->has_v_scroll);
    EXPECT_FALSE(root->has_h_scroll);
    EXPECT_FLOAT_EQ(root->v_scroll->max_value(), 50.0f);
}

TEST(LayoutEngineTest, ScrollMovesAbsoluteButNotRelativePositions) {
    auto root = make_scrolling_column();
    LayoutEngine engine;
    int renders = 0;
    engine.set_render_request([&renders](LayoutNode&) { ++renders; });
    engine.compute(*root, {100.0f, 50.0f});

    LayoutNode* item2 = root->child_at(2);
    ASSERT_EQ(item2->data.alloc_pos, (Vec2{0.0f, 40.0f}));

    EXPECT_TRUE(engine.scroll(*root, Dim::Y, 50.0f));
    EXPECT_EQ(renders, 1);
    EXPECT_EQ(item2->data.alloc_pos, (Vec2{0.0f, -10.0f}));
    EXPECT_EQ(item2->data.alloc_pos_rel, (Vec2{0.0f, 40.0f}));

    EXPECT_TRUE(engine.scroll(*root, Dim::Y, 0.0f));
    EXPECT_EQ(item2->data.alloc_pos, (Vec2{0.0f, 40.0f}));
    EXPECT_EQ(renders, 2);
}

TEST(LayoutEngineTest, ScrollOffsetSurvivesRecompute) {
    auto root = make_scrolling_column();
    LayoutEngine engine;
    engine.compute(*root, {100.0f, 50.0f});
    engine.scroll(*root, Dim::Y, 30.0f);

    engine.compute(*root, {100.0f, 50.0f});
    EXPECT_FLOAT_EQ(root->v_scroll->value(), 30.0f);
    EXPECT_FLOAT_EQ(root->child_at(1)->data.alloc_pos.y, -10.0f);
    EXPECT_FLOAT_EQ(root->child_at(1)->data.alloc_pos_rel.y, 20.0f);
}

TEST(LayoutEngineTest, NestedScrollOffsetsCompose) {
    auto root = make_box("outer", LayoutMode::Column);
    auto inner_box = make_scrolling_column();
    inner_box->style.min_height = 50.0f;
    inner_box->style.height = 50.0f;
    inner_box->style.max_height = 50.0f;
    LayoutNode* inner = root->append_child(std::move(inner_box));
    add_rigid_leaf(*root, "tail", 50.0f, 100.0f);

    LayoutEngine engine;
    engine.compute(*root, {100.0f, 100.0f});
    ASSERT_TRUE(root->has_v_scroll);
    ASSERT_TRUE(inner->has_v_scroll);

    LayoutNode* item = inner->child_at(1);
    engine.scroll(*inner, Dim::Y, 20.0f);
    engine.scroll(*root, Dim::Y, 10.0f);
    EXPECT_FLOAT_EQ(inner->data.alloc_pos.y, -10.0f);
    EXPECT_FLOAT_EQ(item->data.alloc_pos.y, -10.0f);
    EXPECT_FLOAT_EQ(item->data.alloc_pos_rel.y, 20.0f);
}

TEST(LayoutEngineTest, StepPageAndDragScrolling) {
    auto root = make_scrolling_column();
    LayoutEngine engine;
    engine.compute(*root, {100.0f, 50.0f});

    EXPECT_TRUE(engine.scroll_by_steps(*root, Dim::Y, 2.0f));
    EXPECT_FLOAT_EQ(root->v_scroll->value(), 24.0f);
    EXPECT_TRUE(engine.scroll_by_pages(*root, Dim::Y, 1.0f));
    EXPECT_FLOAT_EQ(root->v_scroll->value(), 50.0f);
    EXPECT_FALSE(engine.scroll_by_pages(*root, Dim::Y, 1.0f));

    // drags closer than one line are held back
    EXPECT_FALSE(engine.drag_scroll(*root, Dim::Y, 45.0f));
    EXPECT_TRUE(engine.drag_scroll(*root, Dim::Y, 10.0f));
    EXPECT_FLOAT_EQ(root->child_at(0)->data.alloc_pos.y, -10.0f);
}

TEST(LayoutEngineTest, ScrollWithoutBarIsRejected) {
    auto root = make_scrolling_column();
    LayoutEngine engine;
    engine.compute(*root, {100.0f, 50.0f});
    EXPECT_FALSE(engine.scroll(*root, Dim::X, 10.0f));

    auto plain = make_box("plain", LayoutMode::Column);
    EXPECT_FALSE(engine.scroll(*plain, Dim::Y, 10.0f));
}

TEST(LayoutEngineTest, ScrollDuringUpdateIsDeferred) {
    auto root = make_scrolling_column();
    DiagnosticEmitter diag;
    LayoutEngine engine(&diag);
    int renders = 0;
    engine.set_render_request([&renders](LayoutNode&) { ++renders; });
    engine.compute(*root, {100.0f, 50.0f});
    LayoutNode* item0 = root->child_at(0);

    {
        LayoutEngine::UpdateScope outer(engine);
        {
            LayoutEngine::UpdateScope inner(engine);
            EXPECT_EQ(engine.update_depth(), 2);
            EXPECT_TRUE(engine.scroll(*root, Dim::Y, 40.0f));
            EXPECT_TRUE(engine.scroll(*root, Dim::Y, 45.0f));
        }
        EXPECT_EQ(renders, 0);
        EXPECT_FLOAT_EQ(item0->data.alloc_pos.y, 0.0f);
    }

    EXPECT_EQ(engine.update_depth(), 0);
    EXPECT_EQ(renders, 1);
    EXPECT_FLOAT_EQ(item0->data.alloc_pos.y, -45.0f);
    EXPECT_EQ(diag.events_by_severity(Severity::Warning).size(), 2u);
    EXPECT_EQ(diag.events_by_stage(Stage::Scroll).size(), 2u);
}

TEST(LayoutEngineTest, ThrowingRenderRequestSurfacesFromClose) {
    auto root = make_scrolling_column();
    LayoutEngine engine;
    engine.compute(*root, {100.0f, 50.0f});
    engine.set_render_request([](LayoutNode&) { throw std::runtime_error("render failed"); });

    LayoutEngine::UpdateScope scope(engine);
    EXPECT_TRUE(engine.scroll(*root, Dim::Y, 20.0f));
    EXPECT_THROW(scope.close(), std::runtime_error);
    EXPECT_EQ(engine.update_depth(), 0);
    // repositioned before the callback ran
    EXPECT_FLOAT_EQ(root->child_at(0)->data.alloc_pos.y, -20.0f);

    // already closed: leaving the block must not end another update
    engine.begin_update();
    scope.close();
    EXPECT_EQ(engine.update_depth(), 1);
    engine.set_render_request(nullptr);
    engine.end_update();
}

TEST(LayoutEngineTest, DiscardPendingDropsQueuedSubtree) {
    auto root = make_box("outer", LayoutMode::Column);
    auto inner_box = make_scrolling_column();
    inner_box->style.min_height = 50.0f;
    inner_box->style.max_height = 50.0f;
    LayoutNode* inner = root->append_child(std::move(inner_box));
    add_rigid_leaf(*root, "tail", 50.0f, 100.0f);

    LayoutEngine engine;
    int renders = 0;
    engine.set_render_request([&renders](LayoutNode&) { ++renders; });
    engine.compute(*root, {100.0f, 100.0f});
    ASSERT_TRUE(inner->has_v_scroll);
    ASSERT_TRUE(root->has_v_scroll);

    engine.begin_update();
    engine.scroll(*inner, Dim::Y, 20.0f);
    engine.scroll(*root, Dim::Y, 10.0f);
    engine.discard_pending(*inner);
    root->children.erase(root->children.begin());
    engine.end_update();

    // only the outer container was still queued
    EXPECT_EQ(renders, 1);

    engine.begin_update();
    engine.scroll(*root, Dim::Y, 0.0f);
    engine.discard_pending(*root);
    engine.end_update();
    EXPECT_EQ(renders, 1);
}

TEST(LayoutEngineTest, UnbalancedEndUpdateIsHarmless) {
    LayoutEngine engine;
    engine.end_update();
    EXPECT_EQ(engine.update_depth(), 0);
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, TracingEmitsStagedEventsPerPass) {
    auto root = make_scrolling_column();
    DiagnosticEmitter diag;
    LayoutEngine engine(&diag);
    engine.set_tracing(true);

    engine.compute(*root, {100.0f, 50.0f});
    EXPECT_EQ(engine.pass_count(), 1u);
    EXPECT_FALSE(diag.events_by_stage(Stage::Size).empty());
    EXPECT_FALSE(diag.events_by_stage(Stage::Alloc).empty());
    EXPECT_FALSE(diag.events_by_stage(Stage::Overflow).empty());
    for (const auto& event : diag.events()) {
        EXPECT_EQ(event.severity, Severity::Trace);
        EXPECT_EQ(event.node.rfind("/list", 0), 0u);
        EXPECT_EQ(event.pass_id, 1u);
    }

    diag.clear();
    engine.compute(*root, {100.0f, 50.0f});
    ASSERT_FALSE(diag.events().empty());
    EXPECT_EQ(diag.events().back().pass_id, 2u);
}

TEST(LayoutEngineTest, TracingOffIsSilent) {
    auto root = make_scrolling_column();
    DiagnosticEmitter diag;
    LayoutEngine engine(&diag);
    engine.compute(*root, {100.0f, 50.0f});
    EXPECT_EQ(diag.size(), 0u);
}

TEST(LayoutEngineTest, SharedGridCellWarns) {
    auto root = make_box("grid", LayoutMode::Grid);
    root->style.columns = 2;
    LayoutNode* a = add_leaf(*root, "a", 10.0f, 10.0f);
    LayoutNode* b = add_leaf(*root, "b", 10.0f, 10.0f);
    a->style.col = 0;
    a->style.row = 0;
    b->style.col = 0;
    b->style.row = 0;

    DiagnosticEmitter diag;
    std::vector<std::string> nodes;
    diag.add_observer([&nodes](const trellis::core::DiagnosticEvent& e) {
        nodes.push_back(e.node);
    });
    LayoutEngine engine(&diag);
    engine.compute(*root, {20.0f, 10.0f});

    auto warnings = diag.events_by_stage(Stage::Grid);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].severity, Severity::Warning);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0], "/grid");
    EXPECT_EQ(diag.count(Severity::Warning), 1u);
}
