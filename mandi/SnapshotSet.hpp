#pragma once
#include <mandi/MarketSnapshot.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mandi {

/** One immutable generation of market snapshots, indexed by (normalized) product name.  Within a
 * product, snapshots are ordered by recording time, oldest first, with ties broken by location
 * name so that iteration order never depends on the order the repository returned records in.
 *
 * A SnapshotSet is built once and never modified; the snapshot cache hands out shared pointers to
 * const sets, so any number of requests can read the same generation concurrently.
 */
class SnapshotSet {
    public:
        /// Constructs an empty set with generation 0.
        SnapshotSet() = default;

        /// Builds a set of the given generation from a collection of snapshots.
        SnapshotSet(std::vector<MarketSnapshot> snapshots, uint64_t generation);

        /// The generation number; each cache refresh produces a higher one.
        uint64_t generation() const { return generation_; }

        /// The total number of snapshots in the set.
        size_t size() const { return size_; }

        /// Returns true if the set holds no snapshots.
        bool empty() const { return size_ == 0; }

        /// Returns true if at least one snapshot exists for the product.
        bool contains(const std::string &product) const;

        /** Returns the snapshots for a product, oldest first.  The returned reference is empty if
         * there are none, and remains valid as long as the set does.
         */
        const std::vector<MarketSnapshot>& forProduct(const std::string &product) const;

        /// Returns the (normalized) names of all products in the set, sorted.
        std::vector<std::string> products() const;

    private:
        std::unordered_map<std::string, std::vector<MarketSnapshot>> by_product_;
        size_t size_ = 0;
        uint64_t generation_ = 0;
};

}
