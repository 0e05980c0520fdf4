// pricesync_reconcile.cpp
// Run the full pipeline on one CSV export of a supplier pricelist:
//   grid -> structure -> rows -> normalized prices -> reconciled catalog
// and optionally search the result.
//
// Usage: pricesync_reconcile <grid.csv> [--config cfg.json] [--category LABEL] [--brand NAME] [--query TEXT] [--product FINGERPRINT]
// Exit codes: 0 ok, 1 usage/config error, 2 structure not recognised.

#include <catalog/deduplicator.hpp>
#include <config/config_loader.hpp>
#include <query/search_matcher.hpp>
#include <structure/row_extractor.hpp>
#include <structure/structure_detector.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace PriceSync {

// ─────────────────────────────────────────────
// CSV -> Grid
// ─────────────────────────────────────────────

// RFC 4180-ish: quoted fields may contain commas and doubled quotes. Blank
// fields become empty cells.
GridRow parse_csv_line(const std::string& line) {
    GridRow row;
    std::string field;
    bool quoted = false;
    bool was_quoted = false;

    auto flush = [&]() {
        if (field.empty() && !was_quoted) row.emplace_back(std::nullopt);
        else row.emplace_back(field);
        field.clear();
        was_quoted = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') { field.push_back('"'); ++i; }
            else if (c == '"') quoted = false;
            else field.push_back(c);
        } else if (c == '"') {
            quoted = true;
            was_quoted = true;
        } else if (c == ',') {
            flush();
        } else if (c != '\r') {
            field.push_back(c);
        }
    }
    flush();
    return row;
}

Grid load_csv_grid(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open grid file: " + path);

    Grid grid;
    std::string line;
    while (std::getline(in, line)) grid.push_back(parse_csv_line(line));
    return grid;
}

// ─────────────────────────────────────────────
// Output
// ─────────────────────────────────────────────

std::string format_amount(const std::optional<double>& v) {
    if (!v) return "unpriced";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << *v;
    return oss.str();
}

void print_record(const ProductRecord& r) {
    std::cout << std::left << std::setw(14) << r.brand << " " << std::setw(20) << r.code
              << " excl " << std::setw(10) << format_amount(r.price ? std::optional<double>(r.price->cost_excl_vat) : std::nullopt)
              << " retail " << std::setw(10) << format_amount(r.regular_price());
    if (r.has_active_special) std::cout << " special " << format_amount(r.special_price);
    if (r.price && r.price->margin_pct) {
        std::cout << " margin " << std::fixed << std::setprecision(1) << *r.price->margin_pct << "%";
    }
    std::cout << "  [" << r.categories_display() << "]  " << r.fingerprint_hex() << std::endl;
}

} // namespace PriceSync

int main(int argc, char** argv) {
    using namespace PriceSync;

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <grid.csv> [--config cfg.json] [--category LABEL] [--brand NAME] [--query TEXT] [--product FINGERPRINT]" << std::endl;
        return 1;
    }

    std::string grid_path = argv[1];
    std::string config_path;
    std::string category;
    std::string brand;
    std::string query;
    std::string product;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) { std::cerr << "Missing value for " << arg << std::endl; return 1; }
        if (arg == "--config") config_path = argv[++i];
        else if (arg == "--category") category = argv[++i];
        else if (arg == "--brand") brand = argv[++i];
        else if (arg == "--query") query = argv[++i];
        else if (arg == "--product") product = argv[++i];
        else { std::cerr << "Unknown option: " << arg << std::endl; return 1; }
    }

    EngineConfig config;
    Grid grid;
    try {
        if (!config_path.empty()) config = ConfigLoader::load_file(config_path);
        grid = load_csv_grid(grid_path);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    Logger::step("Detecting structure of " + grid_path + " (" + std::to_string(grid.size()) + " rows)");
    StructureDetector detector(config.detector);
    Structure structure = detector.detect(grid);

    for (const auto& seg : structure.segments) {
        std::ostringstream oss;
        oss << "  " << (seg.brand_name.empty() ? "(implicit)" : seg.brand_name)
            << " cols " << seg.start_column << "-" << seg.end_column << ":";
        for (const auto& [col, role] : seg.roles) oss << " " << col << "=" << to_string(role);
        Logger::info(oss.str());
    }

    if (!structure.is_valid) {
        Logger::error("Structure not recognised; map columns manually");
        return 2;
    }

    Logger::step("Extracting rows");
    RowExtractor extractor(config.detector);
    RowExtractionOptions options;
    options.category_label = category.empty() ? config.pricing.supplier_name() : category;
    options.default_brand = brand.empty() ? config.pricing.supplier_name() : brand;
    auto rows = extractor.extract(grid, structure, options);

    Logger::step("Reconciling");
    ProductDeduplicator dedup(config.pricing, config.deduplicator);
    Catalog catalog = dedup.reconcile(rows);

    for (const auto& record : catalog) print_record(record);

    if (!query.empty()) {
        SearchMatcher matcher(config.matcher);
        auto hits = matcher.match(query, catalog);
        Logger::step("Search '" + query + "': " + std::to_string(hits.size()) + " match(es)");
        for (const auto& record : hits) print_record(record);
    }

    if (!product.empty()) {
        try {
            const ProductRecord* record = catalog.find_by_hex(product);
            if (!record) {
                Logger::warn("No product with fingerprint " + product);
            } else {
                print_record(*record);
            }
        } catch (const std::invalid_argument& e) {
            Logger::error(e.what());
            return 1;
        }
    }

    Logger::success("Done");
    return 0;
}
