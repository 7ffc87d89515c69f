#pragma once
#include <trellis/layout/layout_node.h>
#include <trellis/layout/linear_allocator.h>

namespace trellis::layout {

// (cols, rows) for a grid container: explicit columns, widened by any
// explicit child position, else round(sqrt(n)); rows grow until every
// child has its own cell.
GridPoint resolve_grid_size(const LayoutNode& grid);

// Assign each non-null child a cell in data.grid_pos. Explicitly placed
// children claim their cells first, the rest fill free cells in
// row-major order. Returns how many children had to share a cell.
int assign_grid_cells(LayoutNode& grid);

// Size pass for a grid: resolve the grid, assign cells, aggregate
// per-track need/pref/max and fold the track sums into the container.
// Returns the number of children sharing a cell.
int gather_grid_sizes(LayoutNode& grid);

// Allocation pass: size the row and column tracks, then place each
// child within its cell.
void layout_grid(LayoutNode& grid, AllocStats* row_stats = nullptr,
                 AllocStats* col_stats = nullptr);

} // namespace trellis::layout
