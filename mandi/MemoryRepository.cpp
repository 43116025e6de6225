#include <mandi/MemoryRepository.hpp>
#include <mandi/time.hpp>
#include <mandi/error.hpp>
#include <algorithm>
#include <cmath>

namespace mandi {

void MemoryRepository::add(MarketSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.push_back(std::move(snapshot));
}

size_t MemoryRepository::removeProduct(const std::string &product) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string p = normalize(product);
    auto before = snapshots_.size();
    snapshots_.erase(std::remove_if(snapshots_.begin(), snapshots_.end(),
                [&p](const MarketSnapshot &s) { return normalize(s.product()) == p; }),
            snapshots_.end());
    return before - snapshots_.size();
}

void MemoryRepository::recordOffer(const std::string &counterpart_id, Offer offer) {
    std::lock_guard<std::mutex> lock(mutex_);
    offers_[std::make_pair(counterpart_id, normalize(offer.product))].push_back(std::move(offer));
}

size_t MemoryRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

MarketSnapshot MemoryRepository::fetchSnapshot(const std::string &product, const std::string &location, timestamp when) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string p = normalize(product), l = normalize(location);
    const MarketSnapshot *best = nullptr;
    double best_gap = 0;
    for (const auto &s : snapshots_) {
        if (normalize(s.product()) != p or normalize(s.location()) != l) continue;
        double gap = std::fabs(days_between(s.recordedAt(), when));
        if (not best or gap < best_gap or (gap == best_gap and s.recordedAt() > best->recordedAt())) {
            best = &s;
            best_gap = gap;
        }
    }
    if (not best) throw NotFound("No snapshot for `" + product + "' at `" + location + "'");
    return *best;
}

std::vector<MarketSnapshot> MemoryRepository::fetchAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_;
}

std::vector<Offer> MemoryRepository::fetchHistory(const std::string &product, const std::string &counterpart_id, const TimeWindow &window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Offer> history;
    auto found = offers_.find(std::make_pair(counterpart_id, normalize(product)));
    if (found == offers_.end()) return history;
    for (const auto &o : found->second) {
        if (not o.submitted_at or window.contains(*o.submitted_at))
            history.push_back(o);
    }
    std::stable_sort(history.begin(), history.end(), [](const Offer &a, const Offer &b) {
        if (not a.submitted_at or not b.submitted_at) return not a.submitted_at and b.submitted_at;
        return *a.submitted_at < *b.submitted_at;
    });
    return history;
}

}
