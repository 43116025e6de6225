#pragma once
#include <mandi/Config.hpp>
#include <mandi/PriceEstimate.hpp>
#include <mandi/FairnessAssessment.hpp>
#include <string>
#include <vector>

namespace mandi {

/// A plain-language statement about one factor of a price estimate.
struct FactorStatement {
    /// The factor described
    FactorKind kind;
    /// Whether the factor raised or lowered the price
    Direction direction;
    /// The size band: "slight", "moderate", "significant" or "major"
    std::string descriptor;
    /// The full statement, e.g. "Premium quality grade caused a significant increase in price"
    std::string text;
};

/** Turns estimates and assessments into plain-language text for traders.  Statements never
 * contain raw percentages; factor sizes are described by fixed bands instead.
 */
class ExplanationGenerator {
    public:
        /// Creates a generator using the given configuration.
        explicit ExplanationGenerator(Config config = Config());

        /** Returns the size descriptor for a factor magnitude: below 2% "slight", below 8%
         * "moderate", below 20% "significant", otherwise "major".
         */
        static std::string descriptor(double magnitude);

        /** Returns one statement per factor of the estimate, largest magnitude first; factors of
         * equal magnitude are listed in the order seasonal, quality, quantity, location.
         */
        std::vector<FactorStatement> explain(const PriceEstimate &estimate) const;

        /** Returns notes on an estimate: where its data came from if it was not an exact match,
         * a warning if its confidence is degraded, the market trend, and the volatility risk level
         * with a recommendation.
         */
        std::vector<std::string> notes(const PriceEstimate &estimate) const;

        /** Returns statements explaining an assessment: where the offer sits relative to the fair
         * range, the counter-offer (or why there is none), and each ethics flag.
         */
        std::vector<std::string> reasoning(const FairnessAssessment &assessment) const;

    private:
        Config config_;
};

}
