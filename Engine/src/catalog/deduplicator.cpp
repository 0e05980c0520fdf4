/**
 * @file deduplicator.cpp
 * @brief Fingerprinting and order-independent product merge
 */

#include <catalog/deduplicator.hpp>
#include <pricing/price_normalizer.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <thread>
#include <tuple>
#include <utility>

namespace PriceSync {

namespace {

constexpr double k_no_price = std::numeric_limits<double>::infinity();

// Sort key; lower is preferred. The leading fields encode the replacement
// rules, the trailing ones only break ties so that equal keys imply equal
// records.
auto preference_key(const ProductRecord& r) {
    const bool special = r.has_active_special && r.special_price && std::isfinite(*r.special_price);
    const double special_price = special ? *r.special_price : 0.0;
    const double regular = r.regular_price().value_or(k_no_price);

    return std::make_tuple(
        special ? 0 : 1,
        special_price,
        special ? 0 : (r.in_stock() ? 0 : 1),
        special ? 0.0 : regular,
        -static_cast<long long>(r.stock_qty),
        regular,
        (r.special_price && std::isfinite(*r.special_price)) ? *r.special_price : -1.0,
        std::cref(r.code),
        std::cref(r.name),
        std::cref(r.brand));
}

} // namespace

ProductDeduplicator::ProductDeduplicator(PricingConfig pricing, DeduplicatorConfig config)
    : pricing_(std::move(pricing)), config_(std::move(config)) {}

std::string ProductDeduplicator::resolve_brand(const RawProductRow& row) const {
    if (!trim(row.brand).empty()) return trim(row.brand);

    const std::string name = normalize_text(row.name);
    const std::string code = normalize_text(row.code);
    for (const auto& brand : config_.known_brands) {
        const std::string needle = normalize_text(brand);
        if (needle.empty()) continue;
        if (contains(name, needle) || contains(code, needle)) return brand;
    }
    return "";
}

std::string ProductDeduplicator::identity_key(const RawProductRow& row) const {
    const std::string& code_or_name = trim(row.code).empty() ? row.name : row.code;
    return compact_text(resolve_brand(row)) + "_" + compact_text(code_or_name);
}

Fingerprint ProductDeduplicator::fingerprint(const RawProductRow& row) const {
    return BLAKE3Fingerprint::hash(identity_key(row));
}

ProductRecord ProductDeduplicator::make_record(const RawProductRow& row) const {
    ProductRecord rec;
    rec.fingerprint = fingerprint(row);
    rec.brand = resolve_brand(row);
    rec.code = trim(row.code);
    rec.name = trim(row.name);
    rec.price = PriceNormalizer::normalize(row.raw_price_text, pricing_);
    rec.stock_qty = row.stock_qty;
    // NaN or infinite specials carry no information and would break the
    // preference order.
    if (row.special_price && std::isfinite(*row.special_price)) rec.special_price = row.special_price;
    rec.add_category(row.category_label);

    // A special only counts if it is a real discount on the regular price.
    if (row.has_active_special && rec.special_price && *rec.special_price > 0.0) {
        auto regular = rec.regular_price();
        rec.has_active_special = !regular || *rec.special_price < *regular;
    }
    return rec;
}

bool ProductDeduplicator::outranks(const ProductRecord& a, const ProductRecord& b) {
    return preference_key(a) < preference_key(b);
}

ProductRecord ProductDeduplicator::merge(ProductRecord current, const ProductRecord& incoming) {
    if (!outranks(incoming, current)) {
        for (const auto& category : incoming.categories) current.add_category(category);
        return current;
    }

    ProductRecord winner = incoming;
    winner.categories = std::move(current.categories);
    for (const auto& category : incoming.categories) winner.add_category(category);
    return winner;
}

void ProductDeduplicator::fold_into(Catalog& catalog, const std::vector<RawProductRow>& rows) const {
    for (const auto& row : rows) {
        catalog.upsert(make_record(row), &ProductDeduplicator::merge);
    }
}

Catalog ProductDeduplicator::reconcile(const std::vector<RawProductRow>& rows) const {
    Catalog catalog;
    fold_into(catalog, rows);
    Logger::info("Reconciled " + std::to_string(rows.size()) + " rows into " +
                 std::to_string(catalog.size()) + " products");
    return catalog;
}

void ProductDeduplicator::merge_catalogs(Catalog& a, const Catalog& b) {
    for (const auto& record : b) {
        a.upsert(record, &ProductDeduplicator::merge);
    }
}

Catalog ProductDeduplicator::reconcile_parallel(const std::vector<RawProductRow>& rows, size_t threads) const {
    size_t num_threads = threads ? threads : std::thread::hardware_concurrency();
    num_threads = std::max<size_t>(1, std::min(num_threads, rows.size()));

    if (num_threads <= 1) {
        return reconcile(rows);
    }

    const size_t chunk_size = (rows.size() + num_threads - 1) / num_threads;
    std::vector<Catalog> partials(num_threads);
    std::vector<std::thread> workers;

    for (size_t t = 0; t < num_threads; ++t) {
        const size_t start = t * chunk_size;
        const size_t end = std::min(start + chunk_size, rows.size());
        if (start >= rows.size()) break;

        workers.emplace_back([this, &rows, &partials, t, start, end]() {
            for (size_t i = start; i < end; ++i) {
                partials[t].upsert(make_record(rows[i]), &ProductDeduplicator::merge);
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    // Pairwise reduction: 0+1, 2+3, ... until one catalog is left.
    for (size_t stride = 1; stride < partials.size(); stride *= 2) {
        for (size_t i = 0; i + stride < partials.size(); i += 2 * stride) {
            merge_catalogs(partials[i], partials[i + stride]);
        }
    }

    Logger::info("Reconciled " + std::to_string(rows.size()) + " rows into " +
                 std::to_string(partials[0].size()) + " products on " +
                 std::to_string(workers.size()) + " threads");
    return std::move(partials[0]);
}

} // namespace PriceSync
