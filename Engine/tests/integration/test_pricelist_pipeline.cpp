/**
 * @file test_pricelist_pipeline.cpp
 * @brief Integration: grid -> structure -> rows -> reconciled catalog -> search
 */

#include <gtest/gtest.h>
#include <catalog/deduplicator.hpp>
#include <query/search_matcher.hpp>
#include <structure/row_extractor.hpp>
#include <structure/structure_detector.hpp>
#include <algorithm>
#include <initializer_list>
#include <map>
#include <set>
#include <string>

using namespace PriceSync;

namespace {

GridRow row(std::initializer_list<const char*> cells) {
    GridRow r;
    for (const char* c : cells) {
        if (std::string(c).empty()) r.emplace_back(std::nullopt);
        else r.emplace_back(std::string(c));
    }
    return r;
}

Grid nology_sheet() {
    return {
        row({"Updated - 02/07/2025", "", "Updated - 25/06/2025", ""}),
        row({"YEALINK", "", "JABRA", ""}),
        row({"Stock Code", "Price (excl. VAT)", "Stock Code", "Price (excl. VAT)"}),
        row({"16WALIC", "P.O.R", "EVOLVE-20", "890"}),
        row({"280M-S8", "R1,029.00", "4999-823-109", "1250.50"}),
        row({"", "", "", ""}),
        row({"Stock Code", "Price (excl. VAT)", "", ""}),
    };
}

// Single-brand list straight from the brand's own distributor
Grid jabra_sheet() {
    return {
        row({"Stock Code", "Description", "Price excl VAT"}),
        row({"EVOLVE-20", "Headset", "850"}),
        row({"EVOLVE-30", "Headset", "1100"}),
    };
}

std::vector<RawProductRow> extract(const Grid& grid, const std::string& category, const std::string& brand = "") {
    Structure structure = StructureDetector().detect(grid);
    EXPECT_TRUE(structure.is_valid);
    RowExtractionOptions options;
    options.category_label = category;
    options.default_brand = brand;
    return RowExtractor().extract(grid, structure, options);
}

std::map<std::string, std::pair<std::optional<double>, std::set<std::string>>> snapshot(const Catalog& catalog) {
    std::map<std::string, std::pair<std::optional<double>, std::set<std::string>>> out;
    for (const auto& r : catalog) {
        out[r.fingerprint_hex()] = {r.effective_price(),
                                    std::set<std::string>(r.categories.begin(), r.categories.end())};
    }
    return out;
}

} // namespace

class PricelistPipelineTest : public ::testing::Test {
protected:
    ProductDeduplicator dedup{PricingConfig(PriceType::CostExclVAT, 0.15, 0.40)};
    SearchMatcher matcher;
};

TEST_F(PricelistPipelineTest, HorizontalSheetToCatalog) {
    auto rows = extract(nology_sheet(), "Nology");
    ASSERT_EQ(rows.size(), 4u);

    Catalog catalog = dedup.reconcile(rows);
    ASSERT_EQ(catalog.size(), 4u);

    RawProductRow probe;
    probe.brand = "yealink";
    probe.code = "16walic";
    const ProductRecord* unpriced = catalog.find(dedup.fingerprint(probe));
    ASSERT_NE(unpriced, nullptr);
    EXPECT_FALSE(unpriced->price.has_value());

    probe.code = "280M S8";
    const ProductRecord* priced = catalog.find(dedup.fingerprint(probe));
    ASSERT_NE(priced, nullptr);
    ASSERT_TRUE(priced->price.has_value());
    EXPECT_NEAR(priced->price->cost_excl_vat, 1029.00, 1e-9);
    EXPECT_NEAR(priced->price->cost_incl_vat, 1183.35, 1e-6);
    EXPECT_NEAR(priced->price->retail_incl_vat, 1656.69, 1e-6);
}

TEST_F(PricelistPipelineTest, SecondSupplierMergesIntoCatalog) {
    Catalog catalog;
    dedup.fold_into(catalog, extract(nology_sheet(), "Nology"));
    dedup.fold_into(catalog, extract(jabra_sheet(), "Jabra Direct", "JABRA"));

    ASSERT_EQ(catalog.size(), 5u);

    RawProductRow probe;
    probe.brand = "Jabra";
    probe.code = "evolve20";
    const ProductRecord* merged = catalog.find(dedup.fingerprint(probe));
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(merged->categories, (std::vector<std::string>{"Nology", "Jabra Direct"}));
    // Neither in stock: lower regular price wins
    EXPECT_NEAR(*merged->regular_price(), 850.0 * 1.15 * 1.40, 1e-6);
}

TEST_F(PricelistPipelineTest, SheetOrderDoesNotMatter) {
    auto nology = extract(nology_sheet(), "Nology");
    auto jabra = extract(jabra_sheet(), "Jabra Direct", "JABRA");

    Catalog forward;
    dedup.fold_into(forward, nology);
    dedup.fold_into(forward, jabra);

    Catalog backward;
    dedup.fold_into(backward, jabra);
    dedup.fold_into(backward, nology);

    EXPECT_EQ(snapshot(forward), snapshot(backward));

    std::vector<RawProductRow> all = nology;
    all.insert(all.end(), jabra.begin(), jabra.end());
    EXPECT_EQ(snapshot(dedup.reconcile_parallel(all, 3)), snapshot(forward));
}

TEST_F(PricelistPipelineTest, SearchReconciledCatalog) {
    Catalog catalog;
    dedup.fold_into(catalog, extract(nology_sheet(), "Nology"));
    dedup.fold_into(catalog, extract(jabra_sheet(), "Jabra Direct", "JABRA"));

    auto hits = matcher.match("evolve20", catalog);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].code, "EVOLVE-20");

    auto jabra = matcher.match("jabra", catalog);
    ASSERT_EQ(jabra.size(), 3u);
    EXPECT_EQ(jabra[0].code, "EVOLVE-20");
    EXPECT_EQ(jabra[1].code, "EVOLVE-30");
    EXPECT_EQ(jabra[2].code, "4999-823-109");

    SearchOptions options;
    options.category = "direct";
    EXPECT_EQ(matcher.match("jabra", catalog, options).size(), 2u);
}
