#include <trellis/layout/grid_tracks.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace trellis::layout {

namespace {

std::size_t count_children(const LayoutNode& node) {
    std::size_t n = 0;
    for (const auto& child : node.children) {
        if (child) ++n;
    }
    return n;
}

bool has_explicit_cell(const LayoutNode& child) {
    return child.style.col.has_value() || child.style.row.has_value();
}

// Track sequences are only reallocated when their length changes, so
// tracks keep their identity (and their max) across passes
void ensure_tracks(std::vector<LayoutData>& tracks, int count) {
    if (tracks.size() != static_cast<std::size_t>(count)) {
        tracks.assign(static_cast<std::size_t>(count), LayoutData{});
    }
    for (auto& track : tracks) {
        track.size.need = {};
        track.size.pref = {};
    }
}

// Any stretching member makes the track stretch for good, otherwise the
// largest positive max wins
void absorb_max(LayoutData& track, const LayoutData& cell, Dim d) {
    if (track.size.max.dim(d) < 0.0f) return;
    if (cell.size.max.dim(d) < 0.0f) {
        track.size.max.set_dim(d, -1.0f);
    } else {
        track.size.max.set_max_dim(d, cell.size.max.dim(d));
    }
}

} // namespace

GridPoint resolve_grid_size(const LayoutNode& grid) {
    const std::size_t n = count_children(grid);
    if (n == 0) return {};

    int cols = std::max(grid.style.columns, 0);
    int rows = 0;
    for (const auto& child : grid.children) {
        if (!child) continue;
        const LayoutStyle& st = child->style;
        if (st.col) cols = std::max(cols, std::max(*st.col, 0) + std::max(st.col_span, 1));
        if (st.row) rows = std::max(rows, std::max(*st.row, 0) + std::max(st.row_span, 1));
    }

    if (cols == 0) {
        cols = std::max(1, static_cast<int>(std::lround(std::sqrt(static_cast<double>(n)))));
    }
    if (rows == 0) {
        rows = static_cast<int>(n) / cols;
    }
    // one cell per child, no multiple occupancy
    while (static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols) < n) {
        ++rows;
    }
    return {cols, rows};
}

int assign_grid_cells(LayoutNode& grid) {
    const int cols = grid.grid_size.x;
    const int rows = grid.grid_size.y;
    if (cols <= 0 || rows <= 0) return 0;

    const int total = cols * rows;
    std::vector<int> occupants(static_cast<std::size_t>(total), 0);

    int shared = 0;
    for (const auto& child : grid.children) {
        if (!child || !has_explicit_cell(*child)) continue;
        int col = std::clamp(child->style.col.value_or(0), 0, cols - 1);
        int row = std::clamp(child->style.row.value_or(0), 0, rows - 1);
        child->data.grid_pos = {col, row};
        if (occupants[static_cast<std::size_t>(row * cols + col)]++ > 0) ++shared;
    }

    int cursor = 0;
    for (const auto& child : grid.children) {
        if (!child || has_explicit_cell(*child)) continue;
        int cell = cursor;
        while (cell < total && occupants[static_cast<std::size_t>(cell)] > 0) ++cell;
        if (cell >= total) {
            // Grid is full; wrap around and share a cell
            cell = cursor % total;
            ++shared;
        }
        child->data.grid_pos = {cell % cols, cell / cols};
        ++occupants[static_cast<std::size_t>(cell)];
        cursor = cell + 1;
    }
    return shared;
}

int gather_grid_sizes(LayoutNode& grid) {
    if (count_children(grid) == 0) {
        grid.data.update_sizes();
        return 0;
    }

    grid.grid_size = resolve_grid_size(grid);
    ensure_tracks(grid.grid_data[kRow], grid.grid_size.y);
    ensure_tracks(grid.grid_data[kCol], grid.grid_size.x);

    int shared = assign_grid_cells(grid);

    //    c 0   1     col X = max(each in col)
    //  r +---+---+
    //  0 |   |   |   row Y = max(each in row)
    //    +---+---+
    //  1 |   |   |
    //    +---+---+
    for (const auto& child : grid.children) {
        if (!child) continue;
        LayoutData& cd = child->data;
        cd.update_sizes();
        LayoutData& row = grid.grid_data[kRow][static_cast<std::size_t>(cd.grid_pos.y)];
        LayoutData& col = grid.grid_data[kCol][static_cast<std::size_t>(cd.grid_pos.x)];

        row.size.need.set_max_dim(Dim::Y, cd.size.need.y);
        row.size.pref.set_max_dim(Dim::Y, cd.size.pref.y);
        col.size.need.set_max_dim(Dim::X, cd.size.need.x);
        col.size.pref.set_max_dim(Dim::X, cd.size.pref.x);

        absorb_max(row, cd, Dim::Y);
        absorb_max(col, cd, Dim::X);
    }

    Vec2 sum_need, sum_pref;
    for (const auto& row : grid.grid_data[kRow]) {
        sum_need.y += row.size.need.y;
        sum_pref.y += row.size.pref.y;
    }
    for (const auto& col : grid.grid_data[kCol]) {
        sum_need.x += col.size.need.x;
        sum_pref.x += col.size.pref.x;
    }

    LayoutData& ld = grid.data;
    ld.size.need.set_max(sum_need);
    ld.size.pref.set_max(sum_pref);
    for (Dim d : {Dim::X, Dim::Y}) {
        ld.size.need.add_dim(d, grid.style.space_total(d));
        ld.size.pref.add_dim(d, grid.style.space_total(d));
    }
    ld.update_sizes();
    return shared;
}

void layout_grid(LayoutNode& grid, AllocStats* row_stats, AllocStats* col_stats) {
    if (count_children(grid) == 0) return;

    auto layout_tracks = [&grid](std::vector<LayoutData>& tracks, Dim d, AllocStats* stats) {
        std::vector<AllocItem> items;
        items.reserve(tracks.size());
        for (const auto& track : tracks) {
            items.push_back(AllocItem::from_prefs(track.size, d));
        }
        float avail = grid.data.alloc_size.dim(d) - grid.style.space_total(d);
        auto spans = allocate_linear(items, avail, grid.style.align_dim(d),
                                     grid.style.space_before(d), stats);
        for (std::size_t i = 0; i < tracks.size(); ++i) {
            tracks[i].alloc_size.set_dim(d, spans[i].size);
            tracks[i].alloc_pos_rel.set_dim(d, spans[i].pos);
        }
    };
    layout_tracks(grid.grid_data[kRow], Dim::Y, row_stats);
    layout_tracks(grid.grid_data[kCol], Dim::X, col_stats);

    const int cols = static_cast<int>(grid.grid_data[kCol].size());
    const int rows = static_cast<int>(grid.grid_data[kRow].size());
    for (const auto& child : grid.children) {
        if (!child) continue;
        LayoutData& cd = child->data;
        int col = std::clamp(cd.grid_pos.x, 0, cols - 1);
        int row = std::clamp(cd.grid_pos.y, 0, rows - 1);
        const LayoutData* cells[2] = {
            &grid.grid_data[kCol][static_cast<std::size_t>(col)],  // X
            &grid.grid_data[kRow][static_cast<std::size_t>(row)],  // Y
        };
        for (Dim d : {Dim::X, Dim::Y}) {
            const LayoutData& track = *cells[d == Dim::X ? 0 : 1];
            AllocSpan span = allocate_single(AllocItem::from_prefs(cd.size, d),
                                             track.alloc_size.dim(d),
                                             child->style.align_dim(d), 0.0f);
            cd.alloc_size.set_dim(d, span.size);
            cd.alloc_pos_rel.set_dim(d, span.pos + track.alloc_pos_rel.dim(d));
        }
    }
}

} // namespace trellis::layout
