/**
 * @file structure_detector.hpp
 * @brief Layout inference for unlabeled supplier pricelists
 *
 * Two layouts are recognised:
 * - Horizontal: a brand row lists several brands as column headers, each
 *   owning a block of columns with its own header row underneath.
 * - Vertical: a single list with one header row somewhere near the top.
 *
 * Detection never throws. An unusable grid yields a Structure with
 * is_valid == false that still carries whatever segments were found, so the
 * caller can fall back to manual column mapping.
 */

#pragma once

#include <export.hpp>
#include <structure/grid.hpp>
#include <structure/header_keywords.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PriceSync {

enum class Layout {
    Horizontal,
    Vertical
};

PRICESYNC_API const char* to_string(Layout layout);

/**
 * @brief Contiguous column block belonging to one brand.
 *
 * header_row is the brand row for Horizontal layouts and the row the column
 * headers were found on for Vertical ones.
 */
struct BrandSegment {
    std::string brand_name;
    int start_column = 0;
    int end_column = 0;
    int header_row = 0;
    std::map<int, ColumnRole> roles;  // only columns with a known role

    /**
     * @brief First column carrying the role, if any.
     */
    std::optional<int> column_for(ColumnRole role) const;

    ColumnRole role_of(int column) const {
        auto it = roles.find(column);
        return it == roles.end() ? ColumnRole::Unknown : it->second;
    }

    // Both a product code and a price column were found.
    bool is_resolved() const {
        return column_for(ColumnRole::ProductCode).has_value() && column_for(ColumnRole::Price).has_value();
    }
};

struct Structure {
    Layout layout = Layout::Vertical;
    std::vector<BrandSegment> segments;
    int data_start_row = 0;
    bool is_valid = false;

    // Segments usable for row extraction.
    std::vector<const BrandSegment*> resolved_segments() const;
};

class PRICESYNC_API StructureDetector {
public:
    explicit StructureDetector(DetectorConfig config = DetectorConfig());

    /**
     * @brief Classify the grid's layout and map its columns to roles.
     *
     * Pure: the same grid always yields the same Structure.
     */
    Structure detect(const Grid& grid) const;

    const DetectorConfig& config() const { return config_; }

private:
    DetectorConfig config_;

    struct BrandCell {
        int column;
        std::string name;
    };

    // Row index of the first row (within brand_scan_rows, and above any
    // column-header line) holding enough brand tokens, along with the tokens.
    std::optional<int> find_brand_row(const Grid& grid, std::vector<BrandCell>& brands) const;

    Structure detect_horizontal(const Grid& grid, int brand_row, const std::vector<BrandCell>& brands) const;
    Structure detect_vertical(const Grid& grid) const;

    // Assign roles to the segment's columns from header cells found on rows
    // [first_row, last_row). Returns the first row on which a role matched.
    std::optional<int> assign_roles(const Grid& grid, BrandSegment& segment, int first_row, int last_row) const;
};

} // namespace PriceSync
