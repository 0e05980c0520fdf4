/**
 * @file price_normalizer.cpp
 * @brief Price cell parsing and tax/markup derivation
 */

#include <pricing/price_normalizer.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace PriceSync {

namespace {

// Longest first so "ZAR" is tried before "R".
const std::vector<std::string> k_currency_tokens = {
    "ZAR", "USD", "EUR", "GBP", "\xE2\x82\xAC" /* € */, "\xC2\xA3" /* £ */, "R", "$"
};

bool starts_with_ci(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && to_upper(s.substr(0, prefix.size())) == to_upper(prefix);
}

bool ends_with_ci(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && to_upper(s.substr(s.size() - suffix.size())) == to_upper(suffix);
}

std::string strip_currency(std::string s, std::string_view currency) {
    std::vector<std::string> tokens;
    if (!currency.empty()) tokens.emplace_back(currency);
    tokens.insert(tokens.end(), k_currency_tokens.begin(), k_currency_tokens.end());

    bool stripped = true;
    while (stripped && !s.empty()) {
        stripped = false;
        for (const auto& tok : tokens) {
            if (starts_with_ci(s, tok)) {
                s = trim(s.substr(tok.size()));
                stripped = true;
                break;
            }
            if (ends_with_ci(s, tok)) {
                s = trim(s.substr(0, s.size() - tok.size()));
                stripped = true;
                break;
            }
        }
    }
    return s;
}

// Digits with at most one '.', optionally a leading '-'. Rejects what strtod
// would otherwise accept ("nan", "inf", hex, exponents).
bool is_plain_decimal(const std::string& s) {
    size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (i >= s.size()) return false;
    bool seen_dot = false;
    bool seen_digit = false;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c == '.') {
            if (seen_dot) return false;
            seen_dot = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
        } else {
            return false;
        }
    }
    return seen_digit;
}

// Commas are accepted only as thousands separators in the integer part:
// "1,250.00" -> "1250.00". Decimal commas ("1,25", "1.234,56") are rejected
// rather than guessed.
std::optional<std::string> remove_group_commas(const std::string& s) {
    if (s.find(',') == std::string::npos) return s;

    const size_t dot = s.find('.');
    if (dot != std::string::npos && s.find(',', dot) != std::string::npos) return std::nullopt;

    const std::string int_part = s.substr(0, dot);
    const size_t sign = (!int_part.empty() && int_part[0] == '-') ? 1 : 0;

    std::string out = int_part.substr(0, sign);
    size_t group_start = sign;
    bool first = true;
    while (true) {
        const size_t comma = int_part.find(',', group_start);
        const size_t group_end = comma == std::string::npos ? int_part.size() : comma;
        const size_t len = group_end - group_start;
        if (first ? (len < 1 || len > 3) : len != 3) return std::nullopt;
        for (size_t i = group_start; i < group_end; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(int_part[i]))) return std::nullopt;
        }
        out.append(int_part, group_start, len);
        if (comma == std::string::npos) break;
        group_start = comma + 1;
        first = false;
    }

    if (dot != std::string::npos) out.append(s, dot, std::string::npos);
    return out;
}

} // namespace

const std::vector<std::string>& PriceNormalizer::sentinels() {
    static const std::vector<std::string> values = {"P.O.R", "POA", "CALL", "N/A", "TBC", ""};
    return values;
}

std::optional<double> PriceNormalizer::parse_amount(std::string_view raw_text, std::string_view currency) {
    const std::string trimmed = trim(raw_text);
    const std::string upper = to_upper(trimmed);
    const auto& marks = sentinels();
    if (std::find(marks.begin(), marks.end(), upper) != marks.end()) {
        return std::nullopt;
    }

    std::string cleaned = strip_currency(trimmed, currency);

    // Embedded spaces (including NBSP) are digit grouping.
    std::string spaced;
    spaced.reserve(cleaned.size());
    for (size_t i = 0; i < cleaned.size(); ++i) {
        char c = cleaned[i];
        if (is_ascii_space(c)) continue;
        if (c == '\xC2' && i + 1 < cleaned.size() && cleaned[i + 1] == '\xA0') {
            ++i;
            continue;
        }
        spaced.push_back(c);
    }

    auto grouped = remove_group_commas(spaced);
    if (!grouped) return std::nullopt;
    const std::string& digits = *grouped;

    if (!is_plain_decimal(digits)) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(digits.c_str(), &end);
    if (errno == ERANGE || end != digits.c_str() + digits.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

PriceTriple PriceNormalizer::derive(double source_amount, const PricingConfig& config) {
    const double vat = config.vat_rate();
    const double markup = config.markup_pct();

    PriceTriple t;
    switch (config.price_type()) {
        case PriceType::CostExclVAT:
            t.cost_excl_vat = source_amount;
            t.cost_incl_vat = t.cost_excl_vat * (1.0 + vat);
            t.retail_incl_vat = t.cost_incl_vat * (1.0 + markup);
            break;
        case PriceType::CostInclVAT:
            t.cost_incl_vat = source_amount;
            t.cost_excl_vat = t.cost_incl_vat / (1.0 + vat);
            t.retail_incl_vat = t.cost_incl_vat * (1.0 + markup);
            break;
        case PriceType::RetailInclVAT:
            t.retail_incl_vat = source_amount;
            t.cost_incl_vat = t.retail_incl_vat / (1.0 + markup);
            t.cost_excl_vat = t.cost_incl_vat / (1.0 + vat);
            break;
    }

    if (t.retail_incl_vat > 0.0) {
        t.margin_pct = (t.retail_incl_vat - t.cost_incl_vat) / t.retail_incl_vat * 100.0;
    }
    return t;
}

double PriceNormalizer::invert(const PriceTriple& triple, const PricingConfig& config) {
    const double vat = config.vat_rate();
    const double markup = config.markup_pct();

    switch (config.price_type()) {
        case PriceType::CostExclVAT:
            return triple.retail_incl_vat / (1.0 + markup) / (1.0 + vat);
        case PriceType::CostInclVAT:
            return triple.cost_excl_vat * (1.0 + vat);
        case PriceType::RetailInclVAT:
            return triple.cost_excl_vat * (1.0 + vat) * (1.0 + markup);
    }
    return triple.cost_excl_vat;
}

NormalizedPrice PriceNormalizer::normalize(std::string_view raw_text, const PricingConfig& config) {
    auto amount = parse_amount(raw_text, config.currency());
    if (!amount || *amount <= 0.0) {
        return std::nullopt;
    }
    return derive(*amount, config);
}

} // namespace PriceSync
