#pragma once
#include <mandi/Repository.hpp>
#include <mandi/noncopyable.hpp>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mandi {

/** In-memory implementation of both collaborator interfaces.  It holds snapshots and offer
 * histories added by the caller, and is what the example program and the tests use in place of
 * a real market data service.  All methods are thread-safe, so records can be added while a
 * snapshot cache is refreshing from the same repository.
 */
class MemoryRepository : public SnapshotRepository, public HistorySource, private noncopyable {
    public:
        MemoryRepository() = default;

        /// Adds a snapshot.
        void add(MarketSnapshot snapshot);

        /// Removes every snapshot of a product; returns the number removed.
        size_t removeProduct(const std::string &product);

        /// Records an offer made towards `counterpart_id`.
        void recordOffer(const std::string &counterpart_id, Offer offer);

        /// Returns the number of snapshots held.
        size_t size() const;

        MarketSnapshot fetchSnapshot(const std::string &product, const std::string &location, timestamp date) const override;

        std::vector<MarketSnapshot> fetchAll() const override;

        std::vector<Offer> fetchHistory(const std::string &product, const std::string &counterpart_id, const TimeWindow &window) const override;

    private:
        mutable std::mutex mutex_;
        std::vector<MarketSnapshot> snapshots_;
        // (counterpart, product) -> offers, in insertion order
        std::map<std::pair<std::string, std::string>, std::vector<Offer>> offers_;
};

}
