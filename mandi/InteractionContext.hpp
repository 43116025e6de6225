#pragma once
#include <mandi/Offer.hpp>
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace mandi {

/** What is known about how exposed a trader is to unfair terms.  The score combines literacy,
 * trading experience, language proficiency and trading history into a value in `[0,1]`; higher
 * means more vulnerable.
 */
struct VulnerabilityProfile {
    /// Literacy levels, least literate first.
    enum class Literacy { low, basic, intermediate, high };
    /// Trading experience levels, least experienced first.
    enum class Experience { newcomer, beginner, intermediate, experienced };

    /// Literacy level
    Literacy literacy = Literacy::intermediate;
    /// Trading experience
    Experience experience = Experience::intermediate;
    /// Proficiency in the language of the negotiation, in `[0,1]`
    double language_proficiency = 1.0;
    /// Number of trades completed so far
    unsigned completed_trades = 0;

    /** Returns the vulnerability score: `0.4 * literacy term + 0.3 * experience term +
     * language term`, plus 0.1 for fewer than five completed trades, capped at 1.
     */
    double score() const;
};

/** The negotiation context an offer is made in: who it is made to, what is known about them, and
 * what was offered before.
 */
struct InteractionContext {
    /// Identifier of the counterpart, used to fetch history
    std::string counterpart_id;
    /// Set by the caller if the counterpart is known to be vulnerable
    bool counterpart_vulnerable = false;
    /// The counterpart's vulnerability profile, if known
    boost::optional<VulnerabilityProfile> profile;
    /// Prior offers from the same submitter to the same counterpart, oldest first
    std::vector<Offer> recent_history;
    /// The time of the assessment; defaults to the offer's submission time, or the current time
    boost::optional<timestamp> now;
    /// The history window in hours; defaults to Config::history_window_hours
    boost::optional<double> history_window_hours;
};

}
