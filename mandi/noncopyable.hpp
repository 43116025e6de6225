#pragma once

namespace mandi {

/** Simple utility class intended to be inherited (privately) by a class that should not be
 * copied, such as the shared snapshot cache.  This class has protected constructors and
 * destructors which are not accessible to non-derived classes.
 *
 * Typical use:
 *
 *     class SnapshotCache : private mandi::noncopyable { ... }
 */
class noncopyable {
    protected:
        /// Default empty constructor
        noncopyable() = default;
        /// Default Protected destructor
        ~noncopyable() = default;
        /// Deleted copy constructor
        noncopyable(const noncopyable&) = delete;
        /// Deleted copy assignment operator
        noncopyable& operator=(const noncopyable&) = delete;
};

}
