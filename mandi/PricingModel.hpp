#pragma once
#include <mandi/Config.hpp>
#include <mandi/PricingTables.hpp>
#include <mandi/ConfidenceEstimator.hpp>
#include <mandi/SnapshotSet.hpp>
#include <mandi/PriceEstimate.hpp>

namespace mandi {

/** Deterministic multi-factor pricing model.
 *
 * The model finds the market snapshot that best matches a query (see match()), takes its modal
 * price as the basis, and applies the seasonal, quality, quantity and location adjustments from
 * its PricingTables in that order.  The resulting point price is bounded by a
 * ConfidenceEstimator.
 *
 * Estimates are a pure function of the query, the tables, the configuration and the snapshot set:
 * the same inputs always give the same estimate.
 */
class PricingModel {
    public:
        /** Creates a pricing model.
         *
         * \throws mandi::InvalidInput if `config` fails Config::validate()
         */
        explicit PricingModel(PricingTables tables = PricingTables(), Config config = Config());

        /// The result of snapshot matching.
        struct Match {
            /// The matched snapshot, with its data quality lowered for fallback tiers
            MarketSnapshot snapshot;
            /// How it was found, and the ratio to apply to its prices
            Basis basis;
        };

        /** Finds the snapshot to price `product` at `location` on `date` from:
         *
         * 1. a snapshot of the product at the location recorded within `date_window_days` of
         *    `date` (nearest in time; the later one on a tie);
         * 2. otherwise, the product's snapshot nearest in time at any location, preferring the
         *    requested location, then higher data quality, then location name;
         * 3. otherwise, for each comparable product in the substitution table, in table order, a
         *    snapshot chosen as in 2.
         *
         * Tier 2 lowers the snapshot's data quality by one tier, tier 3 by two.
         *
         * \throws mandi::NoComparableData if none of the tiers has a snapshot
         */
        Match match(const SnapshotSet &snapshots, const std::string &product, const std::string &location, timestamp date) const;

        /** Prices a query against a snapshot set.  The query date defaults to the current time.
         *
         * \throws mandi::InvalidInput if the query fails EstimateQuery::validate()
         * \throws mandi::NoComparableData if no snapshot can be matched
         */
        PriceEstimate estimate(const SnapshotSet &snapshots, const EstimateQuery &query) const;

        /// The adjustment tables in use.
        const PricingTables& tables() const { return tables_; }

        /// The configuration in use.
        const Config& config() const { return confidence_.config(); }

        /// The confidence estimator used to bound estimates.
        const ConfidenceEstimator& confidenceEstimator() const { return confidence_; }

    private:
        PricingTables tables_;
        ConfidenceEstimator confidence_;

        // Picks the best snapshot of a product at any location and date (tier 2 ordering), or
        // returns nullptr if there are none.
        const MarketSnapshot* nearest(const std::vector<MarketSnapshot> &candidates, const std::string &location, timestamp date) const;
};

}
