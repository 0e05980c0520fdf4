#include <catalog/catalog.hpp>
#include <utility>

namespace PriceSync {

void Catalog::upsert(ProductRecord record, const Reducer& reduce) {
    auto it = index_.find(record.fingerprint);
    if (it == index_.end()) {
        index_.emplace(record.fingerprint, records_.size());
        records_.push_back(std::move(record));
        return;
    }
    ProductRecord& current = records_[it->second];
    current = reduce(std::move(current), record);
}

const ProductRecord* Catalog::find(const Fingerprint& fp) const {
    auto it = index_.find(fp);
    return it == index_.end() ? nullptr : &records_[it->second];
}

const ProductRecord* Catalog::find_by_hex(const std::string& hex) const {
    return find(BLAKE3Fingerprint::from_hex(hex));
}

} // namespace PriceSync
