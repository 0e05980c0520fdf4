/**
 * @file search_matcher.cpp
 * @brief Query variant expansion and ranked catalog matching
 */

#include <query/search_matcher.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <sstream>
#include <tuple>

namespace PriceSync {

namespace {

void push_unique(SearchVariantSet& variants, const std::string& v) {
    if (std::find(variants.begin(), variants.end(), v) == variants.end()) {
        variants.push_back(v);
    }
}

bool has_digit(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out += ' ';
        out += words[i];
    }
    return out;
}

} // namespace

SearchMatcher::SearchMatcher(MatcherConfig config) : config_(std::move(config)) {
    // Longest prefix first so "htp" is not shadowed by a shorter entry.
    std::stable_sort(config_.model_prefixes.begin(), config_.model_prefixes.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    for (auto& prefix : config_.model_prefixes) prefix = compact_text(prefix);
}

std::optional<std::pair<std::string, std::string>>
SearchMatcher::split_model_token(const std::string& token) const {
    for (const auto& prefix : config_.model_prefixes) {
        if (prefix.empty() || token.size() <= prefix.size()) continue;
        if (token.compare(0, prefix.size(), prefix) != 0) continue;
        std::string rest = token.substr(prefix.size());
        if (has_digit(rest)) return std::make_pair(prefix, rest);
    }

    size_t k = 0;
    while (k < token.size() && std::isalpha(static_cast<unsigned char>(token[k]))) ++k;
    if (k > 0 && k < token.size() && std::isdigit(static_cast<unsigned char>(token[k]))) {
        return std::make_pair(token.substr(0, k), token.substr(k));
    }
    return std::nullopt;
}

void SearchMatcher::add_model_variants(const std::string& normalized, SearchVariantSet& variants) const {
    std::vector<std::string> words = split_words(normalized);

    for (size_t i = 0; i < words.size(); ++i) {
        std::string prefix;
        std::string rest;
        size_t span = 1;

        // "avr x1800h": prefix and model number typed as separate words.
        const bool bare_prefix = std::find(config_.model_prefixes.begin(), config_.model_prefixes.end(),
                                           words[i]) != config_.model_prefixes.end();
        if (bare_prefix && i + 1 < words.size() && has_digit(words[i + 1])) {
            prefix = words[i];
            rest = words[i + 1];
            span = 2;
        } else if (auto split = split_model_token(words[i])) {
            prefix = split->first;
            rest = split->second;
        } else {
            continue;
        }

        std::vector<std::string> with_sep(words.begin(), words.begin() + i);
        with_sep.push_back(prefix + config_.separator + rest);
        with_sep.insert(with_sep.end(), words.begin() + i + span, words.end());

        std::vector<std::string> without_sep(words.begin(), words.begin() + i);
        without_sep.push_back(prefix + rest);
        without_sep.insert(without_sep.end(), words.begin() + i + span, words.end());

        push_unique(variants, join_words(with_sep));
        push_unique(variants, join_words(without_sep));
        return;  // first model token only
    }
}

SearchVariantSet SearchMatcher::expand(const std::string& query) const {
    SearchVariantSet variants;
    variants.push_back(query);

    const std::string normalized = normalize_text(query);
    if (normalized.empty()) return variants;

    std::string dashed = normalized;
    std::replace(dashed.begin(), dashed.end(), ' ', '-');

    std::string compact;
    std::copy_if(normalized.begin(), normalized.end(), std::back_inserter(compact),
                 [](char c) { return c != ' ' && c != '-' && c != '_'; });

    std::string spaced = normalized;
    std::replace(spaced.begin(), spaced.end(), '-', ' ');
    std::replace(spaced.begin(), spaced.end(), '_', ' ');

    push_unique(variants, normalized);
    push_unique(variants, dashed);
    push_unique(variants, compact);
    push_unique(variants, spaced);
    add_model_variants(normalized, variants);

    return variants;
}

bool SearchMatcher::matches(const ProductRecord& record, const SearchVariantSet& variants) const {
    const std::string fields[] = {to_lower(record.name), to_lower(record.code), to_lower(record.brand)};
    for (const auto& variant : variants) {
        const std::string needle = to_lower(variant);
        if (trim(needle).empty()) continue;
        for (const auto& field : fields) {
            if (contains(field, needle)) return true;
        }
    }
    return false;
}

std::vector<ProductRecord> SearchMatcher::match(const std::string& query, const Catalog& catalog,
                                                const SearchOptions& options) const {
    return match(query, catalog.records(), options);
}

std::vector<ProductRecord> SearchMatcher::match(const std::string& query, const std::vector<ProductRecord>& records,
                                                const SearchOptions& options) const {
    std::vector<ProductRecord> hits;
    if (normalize_text(query).empty()) return hits;

    const SearchVariantSet variants = expand(query);

    for (const auto& record : records) {
        if (!options.include_out_of_stock && !record.in_stock()) continue;
        if (!options.category.empty()) {
            const bool in_category = std::any_of(record.categories.begin(), record.categories.end(),
                                                 [&](const std::string& c) { return contains_ci(c, options.category); });
            if (!in_category) continue;
        }
        if (matches(record, variants)) hits.push_back(record);
    }

    std::stable_sort(hits.begin(), hits.end(), [](const ProductRecord& a, const ProductRecord& b) {
        auto key = [](const ProductRecord& r) {
            const double price = r.effective_price().value_or(std::numeric_limits<double>::infinity());
            return std::make_tuple(r.in_stock() ? 0 : 1, r.has_active_special ? 0 : 1, price);
        };
        return key(a) < key(b);
    });

    if (options.limit > 0 && hits.size() > options.limit) hits.resize(options.limit);

    Logger::debug("Search '" + query + "' matched " + std::to_string(hits.size()) + " products using " +
                  std::to_string(variants.size()) + " variants");
    return hits;
}

} // namespace PriceSync
