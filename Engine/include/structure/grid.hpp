#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <vector>

namespace PriceSync {

// One spreadsheet cell as handed over by the document extractor. Empty
// optional = blank cell. Text keeps its original spacing and punctuation.
using Cell = std::optional<std::string>;
using GridRow = std::vector<Cell>;

// Rows x columns, 0-indexed. Rows may be ragged; missing cells read as blank.
using Grid = std::vector<GridRow>;

inline const std::string* cell_at(const Grid& grid, size_t row, size_t col) {
    if (row >= grid.size() || col >= grid[row].size()) return nullptr;
    const Cell& cell = grid[row][col];
    return cell ? &*cell : nullptr;
}

PRICESYNC_API bool is_blank(const Cell& cell);

PRICESYNC_API size_t non_empty_count(const GridRow& row);

// Widest row in the grid.
PRICESYNC_API size_t grid_width(const Grid& grid);

} // namespace PriceSync
