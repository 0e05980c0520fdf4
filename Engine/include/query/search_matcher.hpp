/**
 * @file search_matcher.hpp
 * @brief Spelling-tolerant product search over a reconciled catalog
 *
 * A query is expanded into a small ordered set of rewrites (normalized,
 * dashed, compacted, model-number separator toggled). A product matches when
 * any rewrite is a case-insensitive substring of its name, code or brand.
 */

#pragma once

#include <export.hpp>
#include <catalog/catalog.hpp>
#include <catalog/product.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace PriceSync {

struct MatcherConfig {
    // Product-line prefixes that precede a model number, e.g. AVR-X1800H.
    std::vector<std::string> model_prefixes = {"avr", "htp", "sr", "nr", "rx"};
    char separator = '-';
};

struct SearchOptions {
    size_t limit = 50;                 // 0 = unlimited
    std::string category;              // case-insensitive substring; empty = any
    bool include_out_of_stock = true;
};

using SearchVariantSet = std::vector<std::string>;

class PRICESYNC_API SearchMatcher {
public:
    explicit SearchMatcher(MatcherConfig config = MatcherConfig());

    /**
     * @brief Query rewrites, first occurrence kept:
     * raw, normalized, spaces->dashes, separators removed, dashes/underscores
     * -> spaces, then model number with and without separator.
     */
    SearchVariantSet expand(const std::string& query) const;

    /**
     * @brief Does any variant occur in the record's name, code or brand?
     */
    bool matches(const ProductRecord& record, const SearchVariantSet& variants) const;

    /**
     * @brief Matching records ordered in stock first, active special first,
     * then by ascending effective price (unpriced last). Stable.
     */
    std::vector<ProductRecord> match(const std::string& query, const Catalog& catalog,
                                     const SearchOptions& options = SearchOptions()) const;

    std::vector<ProductRecord> match(const std::string& query, const std::vector<ProductRecord>& records,
                                     const SearchOptions& options = SearchOptions()) const;

    /**
     * @brief Split a normalized token into (model prefix, remainder) if it
     * looks like a model number: a known prefix or a run of letters directly
     * followed by something containing a digit.
     */
    std::optional<std::pair<std::string, std::string>> split_model_token(const std::string& token) const;

private:
    MatcherConfig config_;

    void add_model_variants(const std::string& normalized, SearchVariantSet& variants) const;
};

} // namespace PriceSync
