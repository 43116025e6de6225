#pragma once
#include <mandi/Config.hpp>
#include <mandi/EthicsFlag.hpp>
#include <mandi/FairnessAssessment.hpp>
#include <mandi/InteractionContext.hpp>
#include <boost/optional.hpp>
#include <vector>

namespace mandi {

/** Gate on automated recommendations.  The guard inspects an assessed offer in its negotiation
 * context and raises ethics flags for exploitative pricing, exposure of vulnerable counterparts,
 * and offer patterns that suggest manipulation.
 *
 * The guard can add flags and raise an assessment's verdict (in the order fair, favorable,
 * unfavorable, exploitative) but never removes a flag or lowers the verdict.  Its rules are
 * independent of each other, so the outcome does not depend on the order they run in:
 *
 * - predatory pricing: the deviation magnitude is beyond `exploitative_threshold`; severity
 *   high, or critical beyond `critical_threshold`.  The verdict becomes exploitative.
 * - manipulation: the current offer and the `manipulation_run - 1` offers before it (same product
 *   and role, within the history window) all deviate against the counterpart by more than
 *   `fair_threshold`; severity medium, high for a run twice that long.
 * - vulnerable user exposure: the counterpart is flagged vulnerable, or its profile scores at
 *   least `vulnerability_threshold`, and the offer deviates against it by more than
 *   `fair_threshold`; severity high.  The verdict becomes at least unfavorable.
 * - gradual squeeze: the last three prices moved strictly against the counterpart by more than
 *   `squeeze_threshold` in total; reported as predatory pricing of medium severity.
 *
 * If any flag is critical, the automated counter-offer is withdrawn and the assessment is marked
 * `recommendation_suppressed`.
 */
class EthicsGuard {
    public:
        /** Creates a guard using the given configuration.
         *
         * \throws mandi::InvalidInput if `config` fails Config::validate()
         */
        explicit EthicsGuard(Config config = Config());

        /** Applies all rules to an assessment and returns the guarded assessment. */
        FairnessAssessment guard(FairnessAssessment assessment, const InteractionContext &context) const;

        /** The predatory pricing rule on its own: returns a flag if `deviation` is beyond the
         * exploitative threshold.  The fairness scorer uses this so that an exploitative verdict
         * never leaves the scorer without its flag.
         */
        boost::optional<EthicsFlag> predatoryPricing(double deviation) const;

        /** Returns true if the counterpart in `context` counts as vulnerable. */
        bool vulnerable(const InteractionContext &context) const;

        /** Returns the offers of `history` relevant to `offer`: those for the same product from the
         * same role, submitted within the history window ending at `now` (offers without a
         * submission time are always included), oldest first.
         */
        std::vector<Offer> relevantHistory(const Offer &offer, const InteractionContext &context) const;

        /// The configuration in use.
        const Config& config() const { return config_; }

    private:
        Config config_;

        void manipulation(FairnessAssessment &a, const std::vector<Offer> &history) const;
        void squeeze(FairnessAssessment &a, const std::vector<Offer> &history) const;
        void exposure(FairnessAssessment &a, const InteractionContext &context) const;
};

}
