/**
 * @file pricing_config.hpp
 * @brief Per-batch supplier pricing settings
 */

#pragma once

#include <export.hpp>
#include <stdexcept>
#include <string>

namespace PriceSync {

/**
 * @brief Raised when a pricing configuration is rejected at construction.
 */
class InvalidConfig : public std::invalid_argument {
public:
    explicit InvalidConfig(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Which field a supplier's price column carries.
 */
enum class PriceType {
    CostExclVAT,
    CostInclVAT,
    RetailInclVAT
};

PRICESYNC_API std::string to_string(PriceType type);

/**
 * @brief Parse "cost_excl_vat" / "cost_incl_vat" / "retail_incl_vat".
 * @throws InvalidConfig for anything else
 */
PRICESYNC_API PriceType parse_price_type(const std::string& text);

/**
 * @brief Immutable pricing settings for one ingestion batch.
 *
 * vat_rate and markup are fractions (0.15 = 15 %). Validation happens in the
 * constructor, so an instance that exists is always usable.
 */
class PRICESYNC_API PricingConfig {
public:
    static constexpr double DEFAULT_VAT_RATE = 0.15;
    static constexpr double DEFAULT_MARKUP = 0.40;

    /**
     * @throws InvalidConfig if vat_rate is outside [0, 1] or markup is negative
     */
    PricingConfig(PriceType price_type = PriceType::CostExclVAT,
                  double vat_rate = DEFAULT_VAT_RATE,
                  double markup_pct = DEFAULT_MARKUP,
                  std::string currency = "ZAR",
                  std::string supplier_name = "");

    PriceType price_type() const { return price_type_; }
    double vat_rate() const { return vat_rate_; }
    double markup_pct() const { return markup_pct_; }
    const std::string& currency() const { return currency_; }
    const std::string& supplier_name() const { return supplier_name_; }

private:
    PriceType price_type_;
    double vat_rate_;
    double markup_pct_;
    std::string currency_;
    std::string supplier_name_;
};

} // namespace PriceSync
