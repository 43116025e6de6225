#pragma once
#include <mandi/Repository.hpp>
#include <mandi/SnapshotSet.hpp>
#include <mandi/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/thread/locks.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mandi {

/** Process-wide, read-mostly cache of market snapshots.
 *
 * The cache holds one SnapshotSet generation at a time.  Readers call current() to obtain a
 * shared pointer to the current generation and keep using it for the whole of their request, so
 * a request never sees a mix of two generations.  A refresh loads every snapshot from the
 * repository and builds the new generation without holding the cache lock, then swaps the
 * pointer under a unique lock; readers only ever hold the shared lock for the duration of a
 * pointer copy.  Old generations are released when their last reader finishes.
 *
 * Refreshes can be triggered explicitly (refresh(), invalidate()) or periodically by a background
 * thread started with refreshEvery().  A scheduled refresh that fails keeps the previous
 * generation in place and records the failure in lastRefreshError().
 */
class SnapshotCache final : private noncopyable {
    public:
        /** Creates a cache over the given repository.  The cache starts out empty (generation 0);
         * call refresh() to load it.
         *
         * \throws mandi::InvalidInput if `repository` is null
         */
        explicit SnapshotCache(std::shared_ptr<const SnapshotRepository> repository);

        /// Destructor.  Stops the background refresher, if running, and joins its thread.
        ~SnapshotCache();

        /** Returns the current generation.  The returned set stays valid, and unchanged, for as
         * long as the caller holds the pointer, regardless of any refreshes that happen meanwhile.
         */
        std::shared_ptr<const SnapshotSet> current() const;

        /// Returns the generation number of the current set (0 if never refreshed).
        uint64_t generation() const;

        /** Loads all snapshots from the repository and swaps in a new generation.  Concurrent
         * refreshes are serialized.  Returns the new generation number.
         *
         * Any exception thrown by the repository propagates; the previous generation stays in
         * place.
         */
        uint64_t refresh();

        /** Discards the current generation in favour of a freshly loaded one.  Equivalent to
         * refresh(); provided for callers that know the repository has changed.
         */
        uint64_t invalidate();

        /** Starts a background thread that calls refresh() every `interval`.  If a refresher is
         * already running it is stopped and replaced.  Safe to call concurrently with itself,
         * stopRefreshing() and refreshing().
         *
         * \throws mandi::InvalidInput if `interval` is not positive
         */
        void refreshEvery(std::chrono::milliseconds interval);

        /// Stops the background refresher, if running, and waits for its thread to exit.
        void stopRefreshing();

        /// Returns true if a background refresher is currently running.
        bool refreshing() const;

        /** Returns the message of the most recent failed background refresh, or an empty optional
         * if the most recent background refresh succeeded (or none has happened).
         */
        boost::optional<std::string> lastRefreshError() const;

    private:
        std::shared_ptr<const SnapshotRepository> repository_;

        // Guards current_ (shared for readers, unique for the swap)
        mutable boost::shared_mutex current_mutex_;
        std::shared_ptr<const SnapshotSet> current_;

        // Serializes refreshes, and protects next_generation_
        std::mutex refresh_mutex_;
        uint64_t next_generation_ = 1;

        // Held across starting, stopping and joining the refresher; only refresher_ is touched
        // under it, and the refresher thread never takes it
        std::mutex control_mutex_;
        std::thread refresher_;

        // Background refresher state shared with the refresher thread
        mutable std::mutex refresher_mutex_;
        std::condition_variable refresher_cv_;
        bool stop_ = false;
        bool running_ = false;
        boost::optional<std::string> last_error_;

        // Stops and joins the refresher; control_mutex_ must be held
        void stopRefresher();
        void refresherLoop(std::chrono::milliseconds interval);
};

}
