#include <mandi/Engine.hpp>
#include <mandi/time.hpp>
#include <mandi/error.hpp>
#include <mandi/debug.hpp>
#include <chrono>

namespace mandi {

Engine::Engine(std::shared_ptr<SnapshotCache> cache, PricingTables tables, Config config, std::shared_ptr<const HistorySource> history)
    : cache_(std::move(cache)), history_(std::move(history)),
    model_(std::move(tables), config), explainer_(config), scorer_(config), guard_(config)
{
    if (not cache_) throw InvalidInput("Engine requires a snapshot cache");
}

PriceEstimate Engine::getPriceEstimate(const EstimateQuery &query) const {
    auto snapshots = cache_->current();
    if (snapshots->generation() == 0)
        throw CacheNotLoaded("Snapshot cache has not been loaded; refresh it before querying");
    return model_.estimate(*snapshots, query);
}

std::vector<FactorStatement> Engine::explainEstimate(const PriceEstimate &estimate) const {
    return explainer_.explain(estimate);
}

FairnessAssessment Engine::assessOffer(const Offer &offer, const PriceEstimate &estimate, const boost::optional<InteractionContext> &context) const {
    auto assessment = scorer_.assess(offer, estimate);
    if (context) assessment = guard_.guard(std::move(assessment), *context);
    return assessment;
}

FairnessAssessment Engine::guardedAssess(const Offer &offer, const EstimateQuery &query, InteractionContext context) const {
    offer.validate();
    auto estimate = getPriceEstimate(query);

    if (context.recent_history.empty() and history_) {
        const timestamp now = context.now ? *context.now
            : offer.submitted_at ? *offer.submitted_at
            : std::chrono::system_clock::now();
        const double hours = context.history_window_hours ? *context.history_window_hours : config().history_window_hours;
        context.recent_history = history_->fetchHistory(offer.product, context.counterpart_id, {add_days(now, -hours / 24.0), now});
        MANDI_DBG("fetched " << context.recent_history.size() << " history offers for " << context.counterpart_id);
    }

    return guard_.guard(scorer_.assess(offer, estimate), context);
}

}
