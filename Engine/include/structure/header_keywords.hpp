/**
 * @file header_keywords.hpp
 * @brief Keyword tables and predicates driving layout detection
 *
 * Everything supplier-specific lives in DetectorConfig so that a new
 * pricelist format is onboarded by editing data. The predicates below are
 * pure and individually testable.
 */

#pragma once

#include <export.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace PriceSync {

/**
 * @brief Semantic role of one column inside a brand segment.
 */
enum class ColumnRole {
    Unknown,
    ProductCode,
    Price,
    RetailPrice
};

PRICESYNC_API const char* to_string(ColumnRole role);

struct DetectorConfig {
    // Words that disqualify a cell from being a brand name (compared per word,
    // uppercase). Checked before any brand pattern.
    std::vector<std::string> stoplist = {
        "PRICE", "PRICES", "PRICELIST", "LIST", "CODE", "STOCK", "ITEM", "UPDATED",
        "QTY", "QUANTITY", "DESCRIPTION", "EXCL", "INCL", "VAT", "RRP", "SKU",
        "MODEL", "TOTAL", "NOTE", "NOTES", "DATE", "BRAND", "SUPPLIER", "CATEGORY",
        "NAME", "PRODUCT", "COST", "RETAIL", "DEALER", "PAGE", "POA", "TBC", "CALL"
    };

    // Header keywords per role, matched as lowercase substrings.
    std::vector<std::string> product_code_keywords = {
        "stock code", "product code", "item code", "part number", "sku", "model"
    };
    std::vector<std::string> price_keywords = {"price", "cost"};
    std::vector<std::string> retail_keywords = {"rrp", "retail"};

    // When several Price headers share a segment, the one carrying this
    // qualifier is kept and the others fall back to Unknown.
    std::string price_qualifier = "excl";

    size_t brand_scan_rows = 5;      // rows searched for the brand row
    size_t min_brands_per_row = 2;   // brand tokens needed to call it Horizontal
    size_t header_probe_rows = 2;    // rows below the brand row holding headers
    size_t vertical_header_rows = 3; // rows searched for headers in Vertical
    size_t data_scan_rows = 10;      // rows searched for the first data row
    size_t min_brand_length = 3;
    size_t max_brand_length = 20;
    int default_segment_span = 3;    // extra columns given to the last brand
};

/**
 * @brief True if any whitespace-separated word of the token is stoplisted.
 */
PRICESYNC_API bool is_stoplisted(std::string_view token, const DetectorConfig& config);

/**
 * @brief Role of a header cell, or Unknown. Checked in the order
 * ProductCode, RetailPrice, Price so that "Retail Price" is RetailPrice.
 */
PRICESYNC_API ColumnRole classify_header(std::string_view header, const DetectorConfig& config);

/**
 * @brief Does a Price header carry the preferred qualifier ("excl")?
 */
PRICESYNC_API bool has_price_qualifier(std::string_view header, const DetectorConfig& config);

/**
 * @brief Does the cell contain a role keyword as whole words? Unlike
 * classify_header this never matches inside a word ("COSTAR" is not "cost").
 */
PRICESYNC_API bool reads_as_header(std::string_view cell, const DetectorConfig& config);

/**
 * @brief Brand-token heuristic for cells in the candidate brand row.
 *
 * Uppercase A-Z/0-9 plus '-', '&' and spaces, with at least one letter and a
 * trimmed length within [min_brand_length, max_brand_length]. Stoplisted words
 * and cells holding a role keyword as whole words are rejected first.
 */
PRICESYNC_API bool is_brand_token(std::string_view cell, const DetectorConfig& config);

} // namespace PriceSync
