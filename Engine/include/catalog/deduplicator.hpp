/**
 * @file deduplicator.hpp
 * @brief Fold same-product rows into one ProductRecord
 *
 * Rows are keyed by a BLAKE3 fingerprint of their normalized brand and code.
 * Rows sharing a fingerprint are merged by a pure reducer:
 * - categories are always unioned
 * - the price/stock/identity fields come from the preferred row, chosen by
 *   a total order so that the result does not depend on arrival order
 *
 * Preference, first deciding rule wins:
 *   1. active special beats no special
 *   2. both special: lower special price
 *   3. neither special: in stock beats out of stock
 *   4. neither special, same stock state: lower regular price
 *   5. remaining ties: higher stock, lower price, then code/name/brand text
 */

#pragma once

#include <export.hpp>
#include <catalog/catalog.hpp>
#include <catalog/product.hpp>
#include <pricing/pricing_config.hpp>
#include <string>
#include <vector>

namespace PriceSync {

struct DeduplicatorConfig {
    // Lowercase brand names used to fill in a missing brand from the
    // product name or code. Checked in order; first substring hit wins.
    std::vector<std::string> known_brands = {
        "denon", "yamaha", "marantz", "onkyo", "pioneer", "sony", "bose", "jbl", "polk"
    };
};

class PRICESYNC_API ProductDeduplicator {
public:
    explicit ProductDeduplicator(PricingConfig pricing, DeduplicatorConfig config = DeduplicatorConfig());

    /**
     * @brief Brand for fingerprinting: the row's own, else the first known
     * brand found in its name or code, else "".
     */
    std::string resolve_brand(const RawProductRow& row) const;

    /**
     * @brief Normalized identity text, "<brand>_<code or name>", lowercase
     * alphanumerics only on either side of the underscore.
     */
    std::string identity_key(const RawProductRow& row) const;

    Fingerprint fingerprint(const RawProductRow& row) const;

    /**
     * @brief Single-row record: normalized price, validated special price,
     * one category. Never throws on bad input; unparseable prices become
     * unpriced.
     */
    ProductRecord make_record(const RawProductRow& row) const;

    /**
     * @brief True if a should replace b's price/stock fields.
     */
    static bool outranks(const ProductRecord& a, const ProductRecord& b);

    /**
     * @brief Merge two records with the same fingerprint. Commutative and
     * associative up to category order.
     */
    static ProductRecord merge(ProductRecord current, const ProductRecord& incoming);

    /**
     * @brief Fold all rows into a fresh catalog (reference implementation).
     */
    Catalog reconcile(const std::vector<RawProductRow>& rows) const;

    /**
     * @brief Fold rows into an existing caller-owned catalog.
     */
    void fold_into(Catalog& catalog, const std::vector<RawProductRow>& rows) const;

    /**
     * @brief Same result as reconcile(), folding chunks on separate threads
     * and merging the partial catalogs pairwise.
     * @param threads 0 = hardware concurrency
     */
    Catalog reconcile_parallel(const std::vector<RawProductRow>& rows, size_t threads = 0) const;

    /**
     * @brief Fold every record of b into a.
     */
    static void merge_catalogs(Catalog& a, const Catalog& b);

    const PricingConfig& pricing() const { return pricing_; }

private:
    PricingConfig pricing_;
    DeduplicatorConfig config_;
};

} // namespace PriceSync
