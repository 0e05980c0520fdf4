/**
 * @file structure_detector.cpp
 * @brief Horizontal/vertical pricelist layout detection
 */

#include <structure/structure_detector.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <sstream>
#include <utility>

namespace PriceSync {

const char* to_string(Layout layout) {
    return layout == Layout::Horizontal ? "horizontal" : "vertical";
}

std::optional<int> BrandSegment::column_for(ColumnRole role) const {
    for (const auto& [col, r] : roles) {
        if (r == role) return col;
    }
    return std::nullopt;
}

std::vector<const BrandSegment*> Structure::resolved_segments() const {
    std::vector<const BrandSegment*> out;
    for (const auto& seg : segments) {
        if (seg.is_resolved()) out.push_back(&seg);
    }
    return out;
}

StructureDetector::StructureDetector(DetectorConfig config) : config_(std::move(config)) {}

Structure StructureDetector::detect(const Grid& grid) const {
    std::vector<BrandCell> brands;
    auto brand_row = find_brand_row(grid, brands);

    Structure structure = brand_row ? detect_horizontal(grid, *brand_row, brands) : detect_vertical(grid);

    structure.is_valid = std::any_of(structure.segments.begin(), structure.segments.end(),
                                     [](const BrandSegment& s) { return s.is_resolved(); });

    std::ostringstream msg;
    msg << "Detected " << to_string(structure.layout) << " structure: "
        << structure.segments.size() << " segment(s), "
        << structure.resolved_segments().size() << " resolved, data from row "
        << structure.data_start_row;
    if (structure.is_valid) {
        Logger::info(msg.str());
    } else {
        Logger::warn(msg.str() + " (no segment has both code and price columns)");
    }
    return structure;
}

std::optional<int> StructureDetector::find_brand_row(const Grid& grid, std::vector<BrandCell>& brands) const {
    const size_t rows = std::min(config_.brand_scan_rows, grid.size());
    for (size_t r = 0; r < rows; ++r) {
        std::vector<BrandCell> found;
        size_t header_cells = 0;
        for (size_t c = 0; c < grid[r].size(); ++c) {
            const Cell& cell = grid[r][c];
            if (!cell) continue;
            if (is_brand_token(*cell, config_)) {
                found.push_back({static_cast<int>(c), trim(*cell)});
            } else if (reads_as_header(*cell, config_)) {
                ++header_cells;
            }
        }
        // Brands sit above their column headers; past a header line only
        // data follows, and uppercase product codes are not brands.
        if (header_cells >= 2) break;
        if (found.size() >= config_.min_brands_per_row) {
            brands = std::move(found);
            return static_cast<int>(r);
        }
    }
    return std::nullopt;
}

Structure StructureDetector::detect_horizontal(const Grid& grid, int brand_row,
                                               const std::vector<BrandCell>& brands) const {
    Structure structure;
    structure.layout = Layout::Horizontal;
    structure.data_start_row = brand_row + 2;

    const int probe_end = brand_row + 1 + static_cast<int>(config_.header_probe_rows);

    for (size_t i = 0; i < brands.size(); ++i) {
        BrandSegment seg;
        seg.brand_name = brands[i].name;
        seg.start_column = brands[i].column;
        seg.end_column = (i + 1 < brands.size())
            ? brands[i + 1].column - 1
            : brands[i].column + std::max(0, config_.default_segment_span);
        seg.header_row = brand_row;

        assign_roles(grid, seg, brand_row + 1, probe_end);

        if (!seg.is_resolved()) {
            Logger::debug("Segment '" + seg.brand_name + "' has no code/price mapping");
        }
        structure.segments.push_back(std::move(seg));
    }
    return structure;
}

Structure StructureDetector::detect_vertical(const Grid& grid) const {
    Structure structure;
    structure.layout = Layout::Vertical;

    const size_t width = grid_width(grid);
    BrandSegment seg;
    seg.start_column = 0;
    seg.end_column = width > 0 ? static_cast<int>(width) - 1 : 0;

    // Headers come from the single row with the most role matches, so a
    // title line such as "DENON PRICELIST" cannot claim a column.
    const size_t header_rows = std::min(config_.vertical_header_rows, grid.size());
    size_t best_row = 0;
    size_t best_hits = 0;
    for (size_t r = 0; r < header_rows; ++r) {
        size_t hits = 0;
        for (const auto& cell : grid[r]) {
            if (cell && classify_header(*cell, config_) != ColumnRole::Unknown) ++hits;
        }
        if (hits > best_hits) {
            best_hits = hits;
            best_row = r;
        }
    }
    if (best_hits > 0) {
        const int row = static_cast<int>(best_row);
        seg.header_row = assign_roles(grid, seg, row, row + 1).value_or(row);
    }
    structure.segments.push_back(std::move(seg));

    const size_t scan = std::min(config_.data_scan_rows, grid.size());
    for (size_t r = 0; r < scan; ++r) {
        if (non_empty_count(grid[r]) >= 2) {
            structure.data_start_row = static_cast<int>(r);
            break;
        }
    }
    return structure;
}

std::optional<int> StructureDetector::assign_roles(const Grid& grid, BrandSegment& segment,
                                                   int first_row, int last_row) const {
    std::optional<int> header_row;
    std::map<int, bool> qualified_price;  // price column -> carries "excl"

    for (int col = segment.start_column; col <= segment.end_column; ++col) {
        for (int row = first_row; row < last_row; ++row) {
            const std::string* text = cell_at(grid, static_cast<size_t>(row), static_cast<size_t>(col));
            if (!text) continue;

            ColumnRole role = classify_header(*text, config_);
            if (role == ColumnRole::Unknown) continue;

            segment.roles[col] = role;
            if (role == ColumnRole::Price) qualified_price[col] = has_price_qualifier(*text, config_);
            if (!header_row || row < *header_row) header_row = row;
            break;
        }
    }

    // Prefer the qualified price column(s) when the segment has a choice.
    const bool any_qualified = std::any_of(qualified_price.begin(), qualified_price.end(),
                                           [](const auto& kv) { return kv.second; });
    if (any_qualified) {
        for (const auto& [col, qualified] : qualified_price) {
            if (!qualified) segment.roles.erase(col);
        }
    }

    return header_row;
}

} // namespace PriceSync
