/**
 * @file config_loader.hpp
 * @brief JSON configuration for one ingestion batch
 *
 * Example:
 * {
 *   "pricing":      { "price_type": "cost_excl_vat", "vat_rate": 0.15,
 *                     "markup_percentage": 0.40, "currency": "ZAR",
 *                     "supplier_name": "Nology" },
 *   "detector":     { "stoplist": [...], "product_code_keywords": [...],
 *                     "price_keywords": [...], "retail_keywords": [...],
 *                     "price_qualifier": "excl", "brand_scan_rows": 5, ... },
 *   "deduplicator": { "known_brands": ["denon", "yamaha"] },
 *   "matcher":      { "model_prefixes": ["avr"], "separator": "-" }
 * }
 *
 * Every section and key is optional; anything missing keeps its default.
 */

#pragma once

#include <export.hpp>
#include <catalog/deduplicator.hpp>
#include <pricing/pricing_config.hpp>
#include <query/search_matcher.hpp>
#include <structure/header_keywords.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace PriceSync {

/**
 * @brief Raised for unreadable files and malformed or mistyped JSON.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct EngineConfig {
    PricingConfig pricing;
    DetectorConfig detector;
    DeduplicatorConfig deduplicator;
    MatcherConfig matcher;
};

class PRICESYNC_API ConfigLoader {
public:
    /**
     * @throws ConfigError on I/O or JSON errors
     * @throws InvalidConfig on out-of-range pricing values
     */
    static EngineConfig load_file(const std::filesystem::path& path);

    static EngineConfig parse(const std::string& json_text);
};

} // namespace PriceSync
