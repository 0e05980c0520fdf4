/**
 * @file pricing_config.cpp
 * @brief Pricing configuration validation
 */

#include <pricing/pricing_config.hpp>
#include <utils/text.hpp>
#include <cmath>
#include <sstream>
#include <utility>

namespace PriceSync {

std::string to_string(PriceType type) {
    switch (type) {
        case PriceType::CostExclVAT:   return "cost_excl_vat";
        case PriceType::CostInclVAT:   return "cost_incl_vat";
        case PriceType::RetailInclVAT: return "retail_incl_vat";
    }
    return "unknown";
}

PriceType parse_price_type(const std::string& text) {
    const std::string key = to_lower(trim(text));
    if (key == "cost_excl_vat") return PriceType::CostExclVAT;
    if (key == "cost_incl_vat") return PriceType::CostInclVAT;
    if (key == "retail_incl_vat") return PriceType::RetailInclVAT;
    throw InvalidConfig("Unknown price type: '" + text + "'");
}

PricingConfig::PricingConfig(PriceType price_type, double vat_rate, double markup_pct,
                             std::string currency, std::string supplier_name)
    : price_type_(price_type),
      vat_rate_(vat_rate),
      markup_pct_(markup_pct),
      currency_(std::move(currency)),
      supplier_name_(std::move(supplier_name)) {
    if (!std::isfinite(vat_rate_) || vat_rate_ < 0.0 || vat_rate_ > 1.0) {
        std::ostringstream oss;
        oss << "vat_rate must be within [0, 1], got " << vat_rate_;
        throw InvalidConfig(oss.str());
    }
    if (!std::isfinite(markup_pct_) || markup_pct_ < 0.0) {
        std::ostringstream oss;
        oss << "markup must be non-negative, got " << markup_pct_;
        throw InvalidConfig(oss.str());
    }
}

} // namespace PriceSync
