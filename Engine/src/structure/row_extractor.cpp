/**
 * @file row_extractor.cpp
 * @brief Segment-wise product row extraction
 */

#include <structure/row_extractor.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <utility>

namespace PriceSync {

RowExtractor::RowExtractor(DetectorConfig config) : config_(std::move(config)) {}

bool RowExtractor::is_header_repeat(const std::string& code, const std::string& price) const {
    if (classify_header(code, config_) != ColumnRole::ProductCode) return false;
    const ColumnRole price_role = classify_header(price, config_);
    return price_role == ColumnRole::Price || price_role == ColumnRole::RetailPrice;
}

std::vector<RawProductRow> RowExtractor::extract(const Grid& grid, const Structure& structure,
                                                 const RowExtractionOptions& options) const {
    std::vector<RawProductRow> rows;

    if (!structure.is_valid) {
        Logger::warn("Invalid structure detected, cannot extract products");
        return rows;
    }

    for (const auto& seg : structure.segments) {
        auto code_col = seg.column_for(ColumnRole::ProductCode);
        auto price_col = seg.column_for(ColumnRole::Price);
        if (!code_col || !price_col) {
            Logger::warn("Incomplete mapping for brand '" + seg.brand_name + "', skipping");
            continue;
        }

        const size_t first = static_cast<size_t>(std::max(structure.data_start_row, seg.header_row + 1));
        size_t extracted = 0;

        for (size_t r = first; r < grid.size(); ++r) {
            const std::string* code_cell = cell_at(grid, r, static_cast<size_t>(*code_col));
            if (!code_cell) continue;

            const std::string code = trim(*code_cell);
            const std::string placeholder = to_lower(code);
            if (code.empty() || placeholder == "nan" || placeholder == "none") continue;

            const std::string* price_cell = cell_at(grid, r, static_cast<size_t>(*price_col));
            const std::string price = price_cell ? trim(*price_cell) : std::string();
            if (is_header_repeat(code, price)) continue;

            RawProductRow row;
            row.brand = seg.brand_name.empty() ? options.default_brand : seg.brand_name;
            row.code = code;
            row.raw_price_text = price;
            row.category_label = options.category_label;
            row.stock_qty = options.default_stock_qty;
            rows.push_back(std::move(row));
            ++extracted;
        }

        Logger::debug("Segment '" + seg.brand_name + "': " + std::to_string(extracted) + " rows");
    }

    Logger::info("Extracted " + std::to_string(rows.size()) + " products from " +
                 std::to_string(structure.resolved_segments().size()) + " segment(s)");
    return rows;
}

} // namespace PriceSync
