/**
 * @file price_normalizer.hpp
 * @brief Raw price cell -> consistent cost/retail price triple
 *
 * The three price fields are always derived from the one the supplier quotes
 * using a single formula per price type, so the source value can be recovered
 * exactly (to floating-point tolerance) from the triple.
 */

#pragma once

#include <export.hpp>
#include <pricing/pricing_config.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PriceSync {

/**
 * @brief Fully populated price. An absent triple (std::nullopt) is the
 * "unpriced" outcome and is distinct from a price of zero.
 */
struct PriceTriple {
    double cost_excl_vat = 0.0;
    double cost_incl_vat = 0.0;
    double retail_incl_vat = 0.0;
    std::optional<double> margin_pct;  // absent when retail_incl_vat <= 0
};

using NormalizedPrice = std::optional<PriceTriple>;

class PRICESYNC_API PriceNormalizer {
public:
    /**
     * @brief Cell texts that mean "no price" (compared after trim + uppercase).
     */
    static const std::vector<std::string>& sentinels();

    /**
     * @brief Normalize one raw price cell.
     * @return the derived triple, or std::nullopt for sentinels ("P.O.R",
     *         "POA", ...), unparseable text, and values <= 0
     */
    static NormalizedPrice normalize(std::string_view raw_text, const PricingConfig& config);

    /**
     * @brief Parse a cell to a number without deriving anything.
     *
     * Strips currency symbols/codes (including config currency), thousands
     * separators and whitespace. Returns std::nullopt on sentinel or bad text.
     * Values <= 0 are returned as parsed; normalize() rejects them.
     */
    static std::optional<double> parse_amount(std::string_view raw_text, std::string_view currency = "");

    /**
     * @brief Derive the full triple from a positive source amount.
     */
    static PriceTriple derive(double source_amount, const PricingConfig& config);

    /**
     * @brief Recompute the source field from a triple via the inverse formula
     * for the given price type.
     */
    static double invert(const PriceTriple& triple, const PricingConfig& config);
};

} // namespace PriceSync
