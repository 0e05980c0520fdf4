#include <config/config_loader.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

namespace PriceSync {

namespace {

using nlohmann::json;

template <typename T>
void read_if(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) {
        out = obj.at(key).get<T>();
    }
}

PricingConfig parse_pricing(const json& j) {
    PriceType type = PriceType::CostExclVAT;
    double vat = PricingConfig::DEFAULT_VAT_RATE;
    double markup = PricingConfig::DEFAULT_MARKUP;
    std::string currency = "ZAR";
    std::string supplier;

    if (j.contains("price_type")) type = parse_price_type(j.at("price_type").get<std::string>());
    read_if(j, "vat_rate", vat);
    read_if(j, "markup_percentage", markup);
    read_if(j, "currency", currency);
    read_if(j, "supplier_name", supplier);

    return PricingConfig(type, vat, markup, currency, supplier);
}

// Counts and depths: JSON integers >= 0. get<size_t>() alone would wrap -1.
template <typename T>
void read_count(const json& obj, const char* key, T& out) {
    if (!obj.contains(key)) return;
    const json& value = obj.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigError(std::string("detector.") + key + " must be a non-negative integer");
    }
    out = value.get<T>();
}

void parse_detector(const json& j, DetectorConfig& cfg) {
    read_if(j, "stoplist", cfg.stoplist);
    read_if(j, "product_code_keywords", cfg.product_code_keywords);
    read_if(j, "price_keywords", cfg.price_keywords);
    read_if(j, "retail_keywords", cfg.retail_keywords);
    read_if(j, "price_qualifier", cfg.price_qualifier);
    read_count(j, "brand_scan_rows", cfg.brand_scan_rows);
    read_count(j, "min_brands_per_row", cfg.min_brands_per_row);
    read_count(j, "header_probe_rows", cfg.header_probe_rows);
    read_count(j, "vertical_header_rows", cfg.vertical_header_rows);
    read_count(j, "data_scan_rows", cfg.data_scan_rows);
    read_count(j, "min_brand_length", cfg.min_brand_length);
    read_count(j, "max_brand_length", cfg.max_brand_length);
    read_count(j, "default_segment_span", cfg.default_segment_span);

    if (cfg.min_brands_per_row < 2) {
        throw ConfigError("detector.min_brands_per_row must be at least 2");
    }
    if (cfg.min_brand_length > cfg.max_brand_length) {
        throw ConfigError("detector.min_brand_length exceeds max_brand_length");
    }
}

void parse_matcher(const json& j, MatcherConfig& cfg) {
    read_if(j, "model_prefixes", cfg.model_prefixes);
    if (j.contains("separator")) {
        const std::string sep = j.at("separator").get<std::string>();
        if (sep.size() != 1) throw ConfigError("matcher.separator must be a single character");
        cfg.separator = sep[0];
    }
}

} // namespace

EngineConfig ConfigLoader::parse(const std::string& json_text) {
    EngineConfig cfg;
    try {
        const json root = json::parse(json_text);
        if (!root.is_object()) throw ConfigError("Configuration root must be a JSON object");

        if (root.contains("pricing")) cfg.pricing = parse_pricing(root.at("pricing"));
        if (root.contains("detector")) parse_detector(root.at("detector"), cfg.detector);
        if (root.contains("deduplicator")) read_if(root.at("deduplicator"), "known_brands", cfg.deduplicator.known_brands);
        if (root.contains("matcher")) parse_matcher(root.at("matcher"), cfg.matcher);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }
    return cfg;
}

EngineConfig ConfigLoader::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    EngineConfig cfg = parse(text);
    Logger::info("Loaded configuration from " + path.string() + " (" + to_string(cfg.pricing.price_type()) +
                 ", supplier '" + cfg.pricing.supplier_name() + "')");
    return cfg;
}

} // namespace PriceSync
