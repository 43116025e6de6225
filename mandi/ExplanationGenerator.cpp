#include <mandi/ExplanationGenerator.hpp>
#include <mandi/time.hpp>
#include <boost/format.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace mandi {

using boost::format;

namespace {
std::string capitalize(std::string s) {
    if (not s.empty()) s[0] = std::toupper(static_cast<unsigned char>(s[0]));
    return s;
}
}

ExplanationGenerator::ExplanationGenerator(Config config) : config_(std::move(config)) {}

std::string ExplanationGenerator::descriptor(double magnitude) {
    if (magnitude < 0.02) return "slight";
    if (magnitude < 0.08) return "moderate";
    if (magnitude < 0.20) return "significant";
    return "major";
}

std::vector<FactorStatement> ExplanationGenerator::explain(const PriceEstimate &estimate) const {
    std::vector<Factor> factors(estimate.factors);
    // Magnitudes are ranked at 1e-9 resolution, so products of table values that are nominally
    // equal (e.g. 0.90 and 1.10) tie and fall back to the factor order
    auto rank = [](double magnitude) { return std::llround(magnitude * 1e9); };
    std::stable_sort(factors.begin(), factors.end(), [&rank](const Factor &a, const Factor &b) {
        const auto ra = rank(a.magnitude), rb = rank(b.magnitude);
        if (ra != rb) return ra > rb;
        return a.kind < b.kind;
    });

    std::vector<FactorStatement> statements;
    for (const auto &f : factors) {
        FactorStatement s;
        s.kind = f.kind;
        s.direction = f.direction;
        s.descriptor = descriptor(f.magnitude);

        std::string cause;
        switch (f.kind) {
            case FactorKind::seasonal: cause = "Seasonal demand in " + f.detail; break;
            case FactorKind::quality:  cause = capitalize(f.detail) + " quality grade"; break;
            case FactorKind::quantity: cause = "Bulk quantity of " + f.detail; break;
            case FactorKind::location: cause = "Market location " + capitalize(f.detail); break;
        }
        s.text = (format("%s caused a %s %s in price") % cause % s.descriptor % to_string(f.direction)).str();
        statements.push_back(std::move(s));
    }
    return statements;
}

std::vector<std::string> ExplanationGenerator::notes(const PriceEstimate &estimate) const {
    std::vector<std::string> notes;
    const Basis &b = estimate.basis;

    switch (b.tier) {
        case MatchTier::exact:
            break;
        case MatchTier::other_market:
            notes.push_back((format("No recent record of %s at %s; priced from the %s market on %s")
                        % estimate.product % capitalize(estimate.location) % capitalize(b.location) % iso_date(b.recorded_at)).str());
            break;
        case MatchTier::substitute:
            notes.push_back((format("No market record of %s; priced from the comparable product %s")
                        % estimate.product % b.product).str());
            break;
    }

    if (estimate.degradedConfidence(config_.low_confidence_threshold))
        notes.push_back("Confidence in this estimate is low; treat it as a rough guide only");

    switch (estimate.trend.direction) {
        case TrendDirection::rising:
            notes.push_back("Prices have been rising over the past month");
            break;
        case TrendDirection::falling:
            notes.push_back("Prices have been falling over the past month");
            break;
        case TrendDirection::stable:
            if (estimate.volatility_computed) notes.push_back("Prices have been stable over the past month");
            break;
    }
    if (estimate.trend.volatility_rising)
        notes.push_back("Price swings have been getting larger, so the upper end of the range is wider");

    if (estimate.volatility <= 0.2)
        notes.push_back("Volatility risk is low: stable market conditions, a good time for trading");
    else if (estimate.volatility <= 0.3)
        notes.push_back("Volatility risk is medium: monitor the market closely and consider smaller quantities initially");
    else
        notes.push_back("Volatility risk is high: consider waiting or hedging");

    return notes;
}

std::vector<std::string> ExplanationGenerator::reasoning(const FairnessAssessment &a) const {
    std::vector<std::string> lines;
    const Role role = a.offer.role, other = counterpart(role);
    const double price = a.offer.priceIn(a.unit);

    const char *position = price < a.lower_bound ? "below" : price > a.upper_bound ? "above" : "within";
    lines.push_back((format("The offered price of %.2f per %s is %s the fair range of %.2f to %.2f")
                % price % a.unit % position % a.lower_bound % a.upper_bound).str());

    if (a.verdict == Verdict::fair) {
        lines.push_back("The offer is fair to both sides");
    }
    else {
        const Role favored = a.deviation_pct > 0 ? role : other;
        const Role disadvantaged = counterpart(favored);
        if (a.verdict == Verdict::exploitative)
            lines.push_back((format("The offer is exploitative towards the %s") % to_string(disadvantaged)).str());
        else
            lines.push_back((format("The offer %sfavors the %s over the %s")
                        % (a.strong ? "strongly " : "") % to_string(favored) % to_string(disadvantaged)).str());
    }

    if (a.counter_offer)
        lines.push_back((format("A counter-offer of %.2f per %s from the %s is suggested")
                    % a.counter_offer->unit_price % a.counter_offer->unit % to_string(a.counter_offer->role)).str());
    else if (a.recommendation_suppressed)
        lines.push_back("No automated counter-offer is given because of a serious ethical concern");

    if (a.degraded_confidence)
        lines.push_back("The market estimate behind this assessment has low confidence");

    for (const auto &flag : a.risk_flags)
        lines.push_back((format("%s (%s): %s") % to_string(flag.kind()) % to_string(flag.severity()) % flag.rationale()).str());

    return lines;
}

}
