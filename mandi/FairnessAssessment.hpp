#pragma once
#include <mandi/Offer.hpp>
#include <mandi/EthicsFlag.hpp>
#include <boost/optional.hpp>
#include <string>

namespace mandi {

/** The fairness assessment of one offer against a price estimate.
 *
 * `deviation_pct` is oriented by the offer's role: positive values mean the offer favors the side
 * that made it (and so works against its counterpart).  `raw_deviation_pct` is the plain relative
 * difference between the offer price and the reference price.  The two agree for sellers and
 * differ in sign for buyers: a buyer offering 1200 against a reference of 2500 has a
 * `deviation_pct` of +0.52 and a `raw_deviation_pct` of -0.52.  Figures quoted as "price below
 * market" are the raw ones.
 *
 * An `exploitative` verdict always comes with at least one risk flag.
 */
struct FairnessAssessment {
    /// The offer assessed
    Offer offer;
    /// Fairness score in `[0,1]`; 1 is perfectly fair
    double score = 1;
    /// Role-oriented relative deviation from the reference price
    double deviation_pct = 0;
    /// `(offer price - reference price) / reference price`, independent of role
    double raw_deviation_pct = 0;
    /// The outcome class
    Verdict verdict = Verdict::fair;
    /// True if the deviation is in the strong band (beyond the directional threshold)
    bool strong = false;
    /// A suggested counter-offer from the counterpart, if any
    boost::optional<Offer> counter_offer;
    /// Ethical-risk flags raised
    FlagSet risk_flags;

    /// The estimate's point price the offer was measured against
    double reference_price = 0;
    /// Lower end of the estimate's confidence band
    double lower_bound = 0;
    /// Upper end of the estimate's confidence band
    double upper_bound = 0;
    /// The unit the reference price and bounds are per
    std::string unit = units::default_unit;
    /// True if the estimate's confidence was degraded
    bool degraded_confidence = false;
    /// True if the ethics guard suppressed the automated counter-offer
    bool recommendation_suppressed = false;
};

}
