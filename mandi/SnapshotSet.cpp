#include <mandi/SnapshotSet.hpp>
#include <algorithm>

namespace mandi {

SnapshotSet::SnapshotSet(std::vector<MarketSnapshot> snapshots, uint64_t generation)
    : size_{snapshots.size()}, generation_{generation}
{
    for (auto &s : snapshots) {
        std::string key = normalize(s.product());
        by_product_[key].push_back(std::move(s));
    }
    for (auto &p : by_product_) {
        std::stable_sort(p.second.begin(), p.second.end(), [](const MarketSnapshot &a, const MarketSnapshot &b) {
            if (a.recordedAt() != b.recordedAt()) return a.recordedAt() < b.recordedAt();
            return normalize(a.location()) < normalize(b.location());
        });
    }
}

bool SnapshotSet::contains(const std::string &product) const {
    return by_product_.count(normalize(product)) > 0;
}

const std::vector<MarketSnapshot>& SnapshotSet::forProduct(const std::string &product) const {
    static const std::vector<MarketSnapshot> none;
    auto found = by_product_.find(normalize(product));
    return found == by_product_.end() ? none : found->second;
}

std::vector<std::string> SnapshotSet::products() const {
    std::vector<std::string> names;
    names.reserve(by_product_.size());
    for (const auto &p : by_product_) names.push_back(p.first);
    std::sort(names.begin(), names.end());
    return names;
}

}
