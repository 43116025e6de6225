#pragma once
#include <mandi/Config.hpp>
#include <mandi/MarketSnapshot.hpp>
#include <mandi/PriceEstimate.hpp>

namespace mandi {

/** Turns the quality of the market data behind a price into a confidence value and a confidence
 * band around the price.
 *
 * Confidence starts at 1 and is reduced by the weighted volatility of the snapshot's recent price
 * history, the weighted staleness of the snapshot relative to the query date, and a fixed penalty
 * for the snapshot's data quality tier:
 *
 * \f[
 *     c_0 = \mathrm{clamp}\left(1 - (w_v v + w_s s + q), 0.05, 0.99\right)
 * \f]
 *
 * The band extends \f$(1-c_0)p\f$ either side of the point price \f$p\f$.  When day-over-day
 * price changes have been growing, the upper half of the band is widened by a further fraction
 * \f$w\f$, and the reported confidence is lowered so that it still matches the total width.
 *
 * All methods are const and the estimator holds no mutable state, so one estimator can be shared
 * between any number of threads.
 */
class ConfidenceEstimator {
    public:
        /// Creates an estimator using the given configuration.
        explicit ConfidenceEstimator(Config config = Config());

        /// Volatility of a snapshot's history.
        struct Volatility {
            /// The coefficient of variation, or the fallback constant
            double value;
            /// False if too few history points were available and `value` is the fallback
            bool computed;
            /// The number of history points within the window
            size_t points;
        };

        /// The confidence band computed by bound().
        struct Bounds {
            /// Lower end of the band
            double lower;
            /// Upper end of the band
            double upper;
            /// The reported confidence
            double confidence;
            /// The staleness that was used
            double staleness;
            /// True if the band was widened for rising volatility
            bool widened;
        };

        /** Returns the coefficient of variation of the snapshot's modal price history within the
         * configured trailing window.  With fewer than `min_history_points` points the
         * configured fallback volatility is returned instead.
         */
        Volatility volatility(const MarketSnapshot &snapshot) const;

        /** Returns the snapshot's market trend: the direction of the modal price over the
         * trailing window, and whether day-over-day changes are growing.  With fewer than
         * `min_trend_points` history points the trend is stable and not rising.
         */
        MarketTrend trend(const MarketSnapshot &snapshot) const;

        /** Returns the staleness, in `[0,1]`, of a snapshot used to price for `date`.  A snapshot
         * recorded after `date` has staleness 0.
         */
        double staleness(const MarketSnapshot &snapshot, timestamp date) const;

        /** Returns the base confidence \f$c_0\f$ for the given volatility, staleness and data
         * quality, clamped to `[Config::confidence_floor, Config::confidence_ceiling]`.  The result
         * is non-increasing in both volatility and staleness.
         */
        double confidence(double volatility, double staleness, DataQuality quality) const;

        /** Computes the confidence band around `point_price` from a snapshot and its volatility,
         * for a query made at `date`.  `rising` widens the upper half of the band.
         *
         * \throws mandi::InvalidInput if `point_price` is not finite and positive
         */
        Bounds bound(double point_price, const MarketSnapshot &snapshot, const Volatility &volatility, bool rising, timestamp date) const;

        /** Convenience overload that computes the snapshot's volatility and trend itself. */
        Bounds bound(double point_price, const MarketSnapshot &snapshot, timestamp date) const;

        /// The configuration in use.
        const Config& config() const { return config_; }

    private:
        Config config_;
};

}
