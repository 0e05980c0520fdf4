#include <structure/grid.hpp>
#include <utils/text.hpp>
#include <algorithm>

namespace PriceSync {

bool is_blank(const Cell& cell) {
    return !cell || trim(*cell).empty();
}

size_t non_empty_count(const GridRow& row) {
    return static_cast<size_t>(std::count_if(row.begin(), row.end(),
                                             [](const Cell& c) { return !is_blank(c); }));
}

size_t grid_width(const Grid& grid) {
    size_t width = 0;
    for (const auto& row : grid) width = std::max(width, row.size());
    return width;
}

} // namespace PriceSync
