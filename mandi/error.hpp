#pragma once
#include <stdexcept>
#include <string>

namespace mandi {

/** Exception thrown when no market snapshot exists for a product and no comparable product can
 * be substituted for it.  This is fatal for the request that raised it; mandi never retries.
 */
class NoComparableData : public std::runtime_error {
    public:
        /// Constructs the exception for the given (unmatched) product name.
        explicit NoComparableData(const std::string &product)
            : std::runtime_error("No comparable market data for product `" + product + "'"), product{product} {}
        /// The product that could not be priced.
        const std::string product;
};

/** Exception thrown for input that is rejected before any processing: non-positive quantities or
 * prices, unknown grades, units or roles, malformed snapshots, offers, estimates or configuration.
 */
class InvalidInput : public std::invalid_argument {
    public:
        /// Constructs the exception with the given message.
        explicit InvalidInput(const std::string &what) : std::invalid_argument(what) {}
};

/** Exception thrown when a query reaches a snapshot cache that has never been loaded (generation
 * 0).  Unlike NoComparableData this says nothing about the product: call SnapshotCache::refresh()
 * (or start a refresher) before serving queries.
 */
class CacheNotLoaded : public std::logic_error {
    public:
        /// Constructs the exception with the given message.
        explicit CacheNotLoaded(const std::string &what) : std::logic_error(what) {}
};

/** Exception thrown by a repository when it has no record for a request.  The pricing model
 * treats this as a signal to try its next fallback tier.
 */
class NotFound : public std::out_of_range {
    public:
        /// Constructs the exception with the given message.
        explicit NotFound(const std::string &what) : std::out_of_range(what) {}
};

}
