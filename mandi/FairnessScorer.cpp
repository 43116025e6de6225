#include <mandi/FairnessScorer.hpp>
#include <mandi/algorithms.hpp>
#include <mandi/units.hpp>
#include <mandi/error.hpp>
#include <mandi/debug.hpp>
#include <algorithm>
#include <cmath>

namespace mandi {

FairnessScorer::FairnessScorer(Config config) : guard_(std::move(config)) {}

double FairnessScorer::score(double deviation) const {
    return 1.0 - std::min(1.0, std::fabs(deviation) / config().max_deviation);
}

Verdict FairnessScorer::verdict(double deviation, bool &strong) const {
    const double d = std::fabs(deviation);
    strong = false;
    if (d <= config().fair_threshold) return Verdict::fair;
    if (d <= config().directional_threshold) return deviation > 0 ? Verdict::favorable : Verdict::unfavorable;
    if (d <= config().exploitative_threshold) {
        strong = true;
        return Verdict::unfavorable;
    }
    return Verdict::exploitative;
}

Offer FairnessScorer::counterOffer(const Offer &offer, const PriceEstimate &estimate) const {
    const double p = estimate.point_price;
    const double target = p + 0.5 * (offer.priceIn(estimate.unit) - p);

    Offer counter(offer);
    counter.role = counterpart(offer.role);
    counter.unit_price = round_within(target, units::price_increment(estimate.unit), estimate.lower_bound, estimate.upper_bound);
    counter.quantity = units::convert_quantity(offer.quantity, offer.unit, estimate.unit);
    counter.unit = estimate.unit;
    counter.submitted_at = boost::none;
    return counter;
}

FairnessAssessment FairnessScorer::assess(const Offer &offer, const PriceEstimate &estimate) const {
    offer.validate();
    estimate.validate();
    if (normalize(offer.product) != normalize(estimate.product))
        throw InvalidInput("Offer for `" + offer.product + "' cannot be assessed against an estimate for `" + estimate.product + "'");
    if (offer.quality_grade and *offer.quality_grade != estimate.quality_grade)
        throw InvalidInput("Offer for " + to_string(*offer.quality_grade) + " grade `" + offer.product
                + "' cannot be assessed against a " + to_string(estimate.quality_grade) + " grade estimate");
    if (not normalize(offer.location).empty() and normalize(offer.location) != normalize(estimate.location))
        throw InvalidInput("Offer at `" + offer.location + "' cannot be assessed against an estimate for `" + estimate.location + "'");

    FairnessAssessment a;
    a.offer = offer;
    a.reference_price = estimate.point_price;
    a.lower_bound = estimate.lower_bound;
    a.upper_bound = estimate.upper_bound;
    a.unit = units::canonical(estimate.unit);
    a.degraded_confidence = estimate.degradedConfidence(config().low_confidence_threshold);

    a.raw_deviation_pct = (offer.priceIn(a.unit) - a.reference_price) / a.reference_price;
    a.deviation_pct = role_deviation(offer, a.reference_price, a.unit);
    a.score = score(a.deviation_pct);
    a.verdict = verdict(a.deviation_pct, a.strong);

    if (a.verdict == Verdict::exploitative) {
        if (auto flag = guard_.predatoryPricing(a.deviation_pct))
            a.risk_flags.add(*flag);
    }
    if (a.verdict != Verdict::fair)
        a.counter_offer = counterOffer(offer, estimate);

    MANDI_DBG(to_string(offer.role) << " offer " << offer.unit_price << " vs " << a.reference_price
            << ": deviation " << a.deviation_pct << ", " << to_string(a.verdict));
    return a;
}

}
