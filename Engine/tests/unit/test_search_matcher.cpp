/**
 * @file test_search_matcher.cpp
 * @brief Unit tests for query variant expansion and ranked matching
 */

#include <gtest/gtest.h>
#include <query/search_matcher.hpp>
#include <catalog/deduplicator.hpp>
#include <algorithm>
#include <string>
#include <vector>

using namespace PriceSync;

static ProductRecord product(const std::string& brand, const std::string& code, const std::string& name,
                             std::optional<double> retail, int stock,
                             std::optional<double> special = std::nullopt,
                             const std::string& category = "Receivers") {
    ProductRecord r;
    r.brand = brand;
    r.code = code;
    r.name = name;
    if (retail) r.price = PriceTriple{*retail, *retail, *retail, std::nullopt};
    r.stock_qty = stock;
    r.special_price = special;
    r.has_active_special = special.has_value();
    r.add_category(category);
    return r;
}

static bool has_variant(const SearchVariantSet& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// ============================================================================
// Variant expansion
// ============================================================================

TEST(SearchMatcherTest, VariantsInOrder) {
    SearchMatcher matcher;
    auto v = matcher.expand("Denon AVR-X1800H");

    ASSERT_GE(v.size(), 5u);
    EXPECT_EQ(v[0], "Denon AVR-X1800H");
    EXPECT_EQ(v[1], "denon avrx1800h");
    EXPECT_EQ(v[2], "denon-avrx1800h");
    EXPECT_EQ(v[3], "denonavrx1800h");
    EXPECT_TRUE(has_variant(v, "denon avr-x1800h"));
}

TEST(SearchMatcherTest, NoDuplicateVariants) {
    SearchMatcher matcher;
    for (const std::string q : {"avr x1800h", "yamaha rx-v6a", "JBL flip 6", "sr6015", "plain"}) {
        auto v = matcher.expand(q);
        auto sorted = v;
        std::sort(sorted.begin(), sorted.end());
        EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end()) << q;
    }
}

TEST(SearchMatcherTest, SeparatorInsertedForModelNumber) {
    SearchMatcher matcher;
    auto v = matcher.expand("denon avrx1800h");
    EXPECT_TRUE(has_variant(v, "denon avr-x1800h"));
}

TEST(SearchMatcherTest, PrefixTypedAsSeparateWord) {
    SearchMatcher matcher;
    auto v = matcher.expand("avr x1800h");
    EXPECT_TRUE(has_variant(v, "avr-x1800h"));
    EXPECT_TRUE(has_variant(v, "avrx1800h"));
}

TEST(SearchMatcherTest, GenericLettersThenDigits) {
    SearchMatcher matcher;
    auto v = matcher.expand("pm6007");
    EXPECT_TRUE(has_variant(v, "pm-6007"));

    auto split = matcher.split_model_token("pm6007");
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first, "pm");
    EXPECT_EQ(split->second, "6007");

    EXPECT_FALSE(matcher.split_model_token("denon").has_value());
    EXPECT_FALSE(matcher.split_model_token("1800").has_value());
}

TEST(SearchMatcherTest, ConfiguredSeparator) {
    MatcherConfig cfg;
    cfg.separator = '_';
    SearchMatcher matcher(cfg);
    EXPECT_TRUE(has_variant(matcher.expand("rxv6a"), "rx_v6a"));
}

TEST(SearchMatcherTest, RawQueryAlwaysPresent) {
    SearchMatcher matcher;
    EXPECT_EQ(matcher.expand("!!!")[0], "!!!");
    EXPECT_EQ(matcher.expand("!!!").size(), 1u);
    EXPECT_EQ(matcher.expand("")[0], "");
}

TEST(SearchMatcherTest, ExpansionIdempotentUnderNormalization) {
    SearchMatcher matcher;
    for (const std::string q : {"Denon AVR-X1800H", "  Yamaha   RX-V6A ", "JBL_Flip-6", "Bose S1 Pro"}) {
        auto from_raw = matcher.expand(q);
        auto from_normalized = matcher.expand(from_raw[1]);

        SearchVariantSet tail(from_raw.begin() + 1, from_raw.end());
        EXPECT_EQ(from_normalized, tail) << q;
    }
}

// ============================================================================
// Matching and ranking
// ============================================================================

TEST(SearchMatcherTest, CompactQueryMatchesDashedName) {
    SearchMatcher matcher;
    std::vector<ProductRecord> records = {
        product("DENON", "AVR-X1800H", "Denon AVR-X1800H 7.2ch Receiver", 19990, 2),
        product("YAMAHA", "RX-V6A", "Yamaha RX-V6A", 12990, 1),
    };

    auto hits = matcher.match("denon avrx1800h", records);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].code, "AVR-X1800H");
}

TEST(SearchMatcherTest, MatchesCodeAndBrandCaseInsensitive) {
    SearchMatcher matcher;
    std::vector<ProductRecord> records = {
        product("Marantz", "PM6007", "Integrated amplifier", 9990, 1),
    };
    EXPECT_EQ(matcher.match("pm-6007", records).size(), 1u);
    EXPECT_EQ(matcher.match("MARANTZ", records).size(), 1u);
    EXPECT_TRUE(matcher.match("onkyo", records).empty());
}

TEST(SearchMatcherTest, EmptyQueryMatchesNothing) {
    SearchMatcher matcher;
    std::vector<ProductRecord> records = {product("DENON", "X", "Denon X", 100, 1)};
    EXPECT_TRUE(matcher.match("", records).empty());
    EXPECT_TRUE(matcher.match("  -- ", records).empty());
}

TEST(SearchMatcherTest, RankingStockThenSpecialThenPrice) {
    SearchMatcher matcher;
    std::vector<ProductRecord> records = {
        product("DENON", "A1", "Denon out of stock", 500, 0),
        product("DENON", "A2", "Denon unpriced", std::nullopt, 3),
        product("DENON", "A3", "Denon expensive", 3000, 3),
        product("DENON", "A4", "Denon cheap", 1000, 3),
        product("DENON", "A5", "Denon on special", 5000, 1, 4500.0),
        product("DENON", "A6", "Denon special no stock", 400, 0, 300.0),
    };

    auto hits = matcher.match("denon", records);
    ASSERT_EQ(hits.size(), records.size());

    std::vector<std::string> codes;
    for (const auto& h : hits) codes.push_back(h.code);
    EXPECT_EQ(codes, (std::vector<std::string>{"A5", "A4", "A3", "A2", "A6", "A1"}));
}

TEST(SearchMatcherTest, StableForEqualKeys) {
    SearchMatcher matcher;
    std::vector<ProductRecord> records = {
        product("JBL", "B", "JBL second", 999, 1),
        product("JBL", "A", "JBL first", 999, 1),
    };
    auto hits = matcher.match("jbl", records);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].code, "B");
    EXPECT_EQ(hits[1].code, "A");
}

TEST(SearchMatcherTest, OptionsFilterAndLimit) {
    SearchMatcher matcher;
    std::vector<ProductRecord> records;
    for (int i = 0; i < 60; ++i) {
        records.push_back(product("SONY", "HT" + std::to_string(i), "Sony soundbar", 1000 + i, i % 2,
                                  std::nullopt, i < 10 ? "Soundbars" : "TV Audio"));
    }

    EXPECT_EQ(matcher.match("sony", records).size(), 50u);

    SearchOptions unlimited;
    unlimited.limit = 0;
    EXPECT_EQ(matcher.match("sony", records, unlimited).size(), 60u);

    SearchOptions in_stock;
    in_stock.include_out_of_stock = false;
    in_stock.limit = 0;
    auto stocked = matcher.match("sony", records, in_stock);
    EXPECT_EQ(stocked.size(), 30u);
    for (const auto& r : stocked) EXPECT_TRUE(r.in_stock());

    SearchOptions category;
    category.category = "soundbar";
    EXPECT_EQ(matcher.match("sony", records, category).size(), 10u);
}

TEST(SearchMatcherTest, MatchesReconciledCatalog) {
    ProductDeduplicator dedup(PricingConfig(PriceType::RetailInclVAT));
    RawProductRow a;
    a.brand = "DENON";
    a.code = "AVR-X1800H";
    a.name = "Denon AVR-X1800H";
    a.raw_price_text = "19990";
    a.category_label = "Receivers";
    RawProductRow b = a;
    b.category_label = "Home Theater";
    b.has_active_special = true;
    b.special_price = 15990.0;

    Catalog catalog = dedup.reconcile({a, b});
    SearchMatcher matcher;
    auto hits = matcher.match("denon avrx1800h", catalog);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_DOUBLE_EQ(*hits[0].effective_price(), 15990.0);
    EXPECT_EQ(hits[0].category_count(), 2u);
}
