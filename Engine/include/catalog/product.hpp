/**
 * @file product.hpp
 * @brief Raw pricelist/catalog rows and reconciled product records
 */

#pragma once

#include <hashing/blake3_fingerprint.hpp>
#include <pricing/price_normalizer.hpp>
#include <optional>
#include <string>
#include <vector>

namespace PriceSync {

/**
 * @brief One product row as produced by row extraction or a catalog export.
 *
 * Special-price eligibility (customer groups, date windows) is decided by the
 * producer of the row and arrives here as has_active_special.
 */
struct RawProductRow {
    std::string brand;
    std::string code;
    std::string name;
    std::string raw_price_text;
    std::string category_label;
    int stock_qty = 0;
    bool has_active_special = false;
    std::optional<double> special_price;
};

/**
 * @brief All rows sharing one fingerprint, folded into a single product.
 */
struct ProductRecord {
    Fingerprint fingerprint{};
    std::string brand;
    std::string code;
    std::string name;
    NormalizedPrice price;               // std::nullopt = unpriced
    std::optional<double> special_price;
    std::vector<std::string> categories; // first-seen order, no duplicates
    int stock_qty = 0;
    bool has_active_special = false;

    bool in_stock() const { return stock_qty > 0; }

    // Regular selling price (retail incl. VAT).
    std::optional<double> regular_price() const {
        if (!price) return std::nullopt;
        return price->retail_incl_vat;
    }

    // Special price when active, regular price otherwise.
    std::optional<double> effective_price() const {
        if (has_active_special && special_price) return special_price;
        return regular_price();
    }

    double savings() const {
        auto regular = regular_price();
        if (!has_active_special || !special_price || !regular) return 0.0;
        return *regular - *special_price;
    }

    size_t category_count() const { return categories.size(); }

    std::string fingerprint_hex() const { return BLAKE3Fingerprint::to_hex(fingerprint); }

    /**
     * @brief "A, B, C +2 more" style summary of the categories.
     */
    std::string categories_display(size_t shown = 3) const;

    /**
     * @brief Append a category unless already present.
     */
    void add_category(const std::string& category);
};

} // namespace PriceSync
