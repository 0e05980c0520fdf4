/**
 * @file catalog.hpp
 * @brief Caller-owned set of reconciled products keyed by fingerprint
 */

#pragma once

#include <export.hpp>
#include <catalog/product.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PriceSync {

/**
 * @brief Reconciled catalog for one ingestion run.
 *
 * Records are kept in first-seen order. Every write goes through upsert(),
 * which either inserts a new fingerprint or folds the incoming record into
 * the existing one with the supplied reducer.
 */
class PRICESYNC_API Catalog {
public:
    using Reducer = std::function<ProductRecord(ProductRecord, const ProductRecord&)>;

    void upsert(ProductRecord record, const Reducer& reduce);

    const ProductRecord* find(const Fingerprint& fp) const;

    /**
     * @brief Look up by the hex form printed for a record (fingerprint_hex()).
     * @throws std::invalid_argument if the text is not a 32-char hex digest
     */
    const ProductRecord* find_by_hex(const std::string& hex) const;

    const std::vector<ProductRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    auto begin() const { return records_.begin(); }
    auto end() const { return records_.end(); }

private:
    std::vector<ProductRecord> records_;
    std::unordered_map<Fingerprint, size_t, FingerprintHasher> index_;
};

} // namespace PriceSync
