#pragma once
#include <mandi/MarketSnapshot.hpp>
#include <mandi/Offer.hpp>
#include <string>
#include <vector>

namespace mandi {

/// A closed time interval `[from, to]`.
struct TimeWindow {
    /// Start of the window
    timestamp from;
    /// End of the window
    timestamp to;
    /// Returns true if `t` lies within the window.
    bool contains(timestamp t) const { return t >= from and t <= to; }
};

/** Abstract interface to the external market snapshot repository.  Implementations may be backed
 * by anything (a database, an RPC service, files); their latency and failure handling are the
 * caller's concern, since mandi itself only ever reads snapshot values.
 */
class SnapshotRepository {
    public:
        virtual ~SnapshotRepository() = default;

        /** Returns the snapshot for a product at a location that is nearest in time to `date`.
         *
         * \throws mandi::NotFound if the repository has no record for the product at the location
         */
        virtual MarketSnapshot fetchSnapshot(const std::string &product, const std::string &location, timestamp date) const = 0;

        /** Returns every snapshot the repository currently holds.  This is what the snapshot cache
         * loads when it builds a new generation.
         */
        virtual std::vector<MarketSnapshot> fetchAll() const = 0;
};

/** Abstract interface to the external offer history store, used by the ethics guard for pattern
 * detection across a negotiation.
 */
class HistorySource {
    public:
        virtual ~HistorySource() = default;

        /** Returns the offers made for `product` towards `counterpart_id` within `window`, oldest
         * first.  Offers without a submission time are included.
         */
        virtual std::vector<Offer> fetchHistory(const std::string &product, const std::string &counterpart_id, const TimeWindow &window) const = 0;
};

}
