#include <catalog/product.hpp>
#include <algorithm>

namespace PriceSync {

std::string ProductRecord::categories_display(size_t shown) const {
    std::string out;
    const size_t n = std::min(shown, categories.size());
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) out += ", ";
        out += categories[i];
    }
    if (categories.size() > shown) {
        out += " +" + std::to_string(categories.size() - shown) + " more";
    }
    return out;
}

void ProductRecord::add_category(const std::string& category) {
    if (std::find(categories.begin(), categories.end(), category) == categories.end()) {
        categories.push_back(category);
    }
}

} // namespace PriceSync
