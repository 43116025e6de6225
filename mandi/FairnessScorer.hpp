#pragma once
#include <mandi/Config.hpp>
#include <mandi/EthicsGuard.hpp>
#include <mandi/FairnessAssessment.hpp>
#include <mandi/Offer.hpp>
#include <mandi/PriceEstimate.hpp>

namespace mandi {

/** Scores an offer against a price estimate.
 *
 * The offer's price is converted into the estimate's unit and compared with the estimate's point
 * price.  The role-oriented deviation \f$d\f$ (see role_deviation()) determines the score,
 * \f$1 - \min(1, |d| / d_{max})\f$, and the verdict:
 *
 * - \f$|d| \le\f$ `fair_threshold`: fair
 * - \f$|d| \le\f$ `directional_threshold`: favorable if \f$d > 0\f$, otherwise unfavorable
 * - \f$|d| \le\f$ `exploitative_threshold`: unfavorable, with `strong` set
 * - beyond that: exploitative, with a PredatoryPricing flag from the EthicsGuard
 *
 * Every verdict except fair comes with a counter-offer from the counterpart: the point price moved
 * halfway towards the offer, kept within the estimate's confidence band and rounded to the
 * unit's price increment.
 *
 * The scorer is stateless; offer history is considered only by the EthicsGuard.
 */
class FairnessScorer {
    public:
        /** Creates a scorer using the given configuration.
         *
         * \throws mandi::InvalidInput if `config` fails Config::validate()
         */
        explicit FairnessScorer(Config config = Config());

        /** Assesses an offer against an estimate.
         *
         * \throws mandi::InvalidInput if the offer fails Offer::validate(), the estimate fails
         * PriceEstimate::validate(), or the offer is for a different product than the estimate.
         * Also thrown if the offer states a grade or a location and it differs from the
         * estimate's; request an estimate for the offer's grade and market instead.
         */
        FairnessAssessment assess(const Offer &offer, const PriceEstimate &estimate) const;

        /// Returns the fairness score for a role-oriented deviation.
        double score(double deviation) const;

        /** Returns the verdict for a role-oriented deviation; `strong` is set to true if the
         * deviation is in the strong unfavorable band.
         */
        Verdict verdict(double deviation, bool &strong) const;

        /// Returns the counter-offer for an offer assessed against an estimate.
        Offer counterOffer(const Offer &offer, const PriceEstimate &estimate) const;

        /// The configuration in use.
        const Config& config() const { return guard_.config(); }

    private:
        EthicsGuard guard_;
};

}
