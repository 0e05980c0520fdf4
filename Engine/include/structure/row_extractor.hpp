/**
 * @file row_extractor.hpp
 * @brief Turn a detected Structure plus its grid into raw product rows
 */

#pragma once

#include <export.hpp>
#include <catalog/product.hpp>
#include <structure/structure_detector.hpp>
#include <string>
#include <vector>

namespace PriceSync {

struct RowExtractionOptions {
    std::string category_label;  // attached to every extracted row
    std::string default_brand;   // for segments without a brand (Vertical lists)
    int default_stock_qty = 0;   // pricelists carry no stock figures
};

class PRICESYNC_API RowExtractor {
public:
    explicit RowExtractor(DetectorConfig config = DetectorConfig());

    /**
     * @brief Extract one row per (resolved segment, data row).
     *
     * Rows with an empty product code, a "nan"/"none" placeholder, or a
     * repeated header line are skipped. Invalid structures yield nothing.
     */
    std::vector<RawProductRow> extract(const Grid& grid, const Structure& structure,
                                       const RowExtractionOptions& options = RowExtractionOptions()) const;

private:
    DetectorConfig config_;

    bool is_header_repeat(const std::string& code, const std::string& price) const;
};

} // namespace PriceSync
