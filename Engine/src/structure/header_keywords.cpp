/**
 * @file header_keywords.cpp
 * @brief Brand and column-role predicates
 */

#include <structure/header_keywords.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <sstream>

namespace PriceSync {

namespace {

bool contains_any(const std::string& text, const std::vector<std::string>& keywords) {
    return std::any_of(keywords.begin(), keywords.end(),
                       [&](const std::string& kw) { return !kw.empty() && contains(text, to_lower(kw)); });
}

// Whole-word phrase match on normalized text: "sku" hits "SKU LIST" but not
// "SKULLCANDY".
bool contains_phrase(const std::string& normalized, const std::vector<std::string>& phrases) {
    const std::string padded = " " + normalized + " ";
    return std::any_of(phrases.begin(), phrases.end(), [&](const std::string& phrase) {
        const std::string needle = normalize_text(phrase);
        return !needle.empty() && contains(padded, " " + needle + " ");
    });
}

bool is_brand_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '&' || c == ' ';
}

} // namespace

const char* to_string(ColumnRole role) {
    switch (role) {
        case ColumnRole::Unknown:     return "unknown";
        case ColumnRole::ProductCode: return "product_code";
        case ColumnRole::Price:       return "price";
        case ColumnRole::RetailPrice: return "retail_price";
    }
    return "unknown";
}

bool is_stoplisted(std::string_view token, const DetectorConfig& config) {
    std::istringstream iss(to_upper(token));
    std::string word;
    while (iss >> word) {
        for (const auto& stop : config.stoplist) {
            if (word == to_upper(stop)) return true;
        }
    }
    return false;
}

ColumnRole classify_header(std::string_view header, const DetectorConfig& config) {
    const std::string text = to_lower(trim(header));
    if (text.empty()) return ColumnRole::Unknown;

    if (contains_any(text, config.product_code_keywords)) return ColumnRole::ProductCode;
    if (contains_any(text, config.retail_keywords)) return ColumnRole::RetailPrice;
    if (contains_any(text, config.price_keywords)) return ColumnRole::Price;
    return ColumnRole::Unknown;
}

bool has_price_qualifier(std::string_view header, const DetectorConfig& config) {
    return !config.price_qualifier.empty() && contains(to_lower(header), to_lower(config.price_qualifier));
}

bool reads_as_header(std::string_view cell, const DetectorConfig& config) {
    const std::string text = normalize_text(cell);
    return contains_phrase(text, config.product_code_keywords) ||
           contains_phrase(text, config.retail_keywords) ||
           contains_phrase(text, config.price_keywords);
}

bool is_brand_token(std::string_view cell, const DetectorConfig& config) {
    const std::string token = trim(cell);
    if (token.size() < config.min_brand_length || token.size() > config.max_brand_length) return false;

    // Stoplist and header keywords win over the brand pattern: a supplier
    // literally called "CODE" is still a header.
    if (is_stoplisted(token, config)) return false;
    if (reads_as_header(token, config)) return false;

    if (!std::all_of(token.begin(), token.end(), is_brand_char)) return false;
    return std::any_of(token.begin(), token.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
}

} // namespace PriceSync
