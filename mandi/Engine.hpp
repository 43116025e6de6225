#pragma once
#include <mandi/Config.hpp>
#include <mandi/PricingTables.hpp>
#include <mandi/SnapshotCache.hpp>
#include <mandi/PricingModel.hpp>
#include <mandi/ExplanationGenerator.hpp>
#include <mandi/FairnessScorer.hpp>
#include <mandi/EthicsGuard.hpp>
#include <mandi/Repository.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <vector>

namespace mandi {

/** The price discovery and negotiation fairness engine.  An Engine ties the pricing model,
 * confidence estimator, explanation generator, fairness scorer and ethics guard to a snapshot
 * cache and (optionally) an offer history source, and exposes the four operations callers use.
 *
 * Each operation takes the cache's current generation once and uses it throughout, so
 * concurrent cache refreshes never mix data from two generations into one response.  The engine
 * itself holds no mutable state; all operations may be called from any number of threads.
 */
class Engine {
    public:
        /** Creates an engine.
         *
         * \param cache the snapshot cache to price from
         * \param tables the pricing adjustment tables
         * \param config the tunable constants
         * \param history where to fetch offer history for guardedAssess() when the caller
         * supplies none; may be null
         *
         * \throws mandi::InvalidInput if `cache` is null or `config` fails Config::validate()
         */
        Engine(std::shared_ptr<SnapshotCache> cache,
                PricingTables tables = PricingTables(),
                Config config = Config(),
                std::shared_ptr<const HistorySource> history = nullptr);

        /** Prices a query against the current snapshot generation.
         *
         * \throws mandi::InvalidInput for an invalid query
         * \throws mandi::CacheNotLoaded if the cache has not been refreshed yet
         * \throws mandi::NoComparableData if there is no snapshot and no comparable product
         */
        PriceEstimate getPriceEstimate(const EstimateQuery &query) const;

        /** Explains an estimate's factors, largest first. */
        std::vector<FactorStatement> explainEstimate(const PriceEstimate &estimate) const;

        /** Assesses an offer against an estimate.  When a context is given the assessment is also
         * passed through the ethics guard.
         *
         * \throws mandi::InvalidInput for an invalid offer or estimate
         */
        FairnessAssessment assessOffer(const Offer &offer, const PriceEstimate &estimate,
                const boost::optional<InteractionContext> &context = boost::none) const;

        /** Prices the query, assesses the offer against the result and guards the assessment.  If
         * the context carries no offer history and a history source was given, the history is
         * fetched for the context's counterpart over the history window.
         *
         * \throws mandi::InvalidInput for an invalid offer or query
         * \throws mandi::NoComparableData if the query cannot be priced
         */
        FairnessAssessment guardedAssess(const Offer &offer, const EstimateQuery &query, InteractionContext context) const;

        /// The snapshot cache.
        SnapshotCache& cache() const { return *cache_; }
        /// The pricing model.
        const PricingModel& pricingModel() const { return model_; }
        /// The explanation generator.
        const ExplanationGenerator& explanations() const { return explainer_; }
        /// The configuration in use.
        const Config& config() const { return model_.config(); }

    private:
        std::shared_ptr<SnapshotCache> cache_;
        std::shared_ptr<const HistorySource> history_;
        PricingModel model_;
        ExplanationGenerator explainer_;
        FairnessScorer scorer_;
        EthicsGuard guard_;
};

}
