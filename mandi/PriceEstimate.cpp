#include <mandi/PriceEstimate.hpp>
#include <mandi/error.hpp>
#include <cmath>

namespace mandi {

std::string to_string(FactorKind kind) {
    switch (kind) {
        case FactorKind::seasonal: return "seasonal";
        case FactorKind::quality: return "quality";
        case FactorKind::quantity: return "quantity";
        case FactorKind::location: return "location";
    }
    return "";
}

std::string to_string(Direction direction) {
    return direction == Direction::increase ? "increase" : "decrease";
}

std::string to_string(MatchTier tier) {
    switch (tier) {
        case MatchTier::exact: return "exact";
        case MatchTier::other_market: return "other_market";
        case MatchTier::substitute: return "substitute";
    }
    return "";
}

std::string to_string(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::rising: return "rising";
        case TrendDirection::falling: return "falling";
        case TrendDirection::stable: return "stable";
    }
    return "";
}

void EstimateQuery::validate() const {
    if (normalize(product).empty()) throw InvalidInput("Price query requires a product");
    if (not (std::isfinite(quantity) and quantity > 0))
        throw InvalidInput("Price query for `" + product + "' requires a positive quantity");
    if (not units::known(unit)) throw InvalidInput("Price query for `" + product + "' uses unknown unit `" + unit + "'");
}

void PriceEstimate::validate() const {
    if (normalize(product).empty()) throw InvalidInput("Price estimate has no product");
    if (not units::known(unit)) throw InvalidInput("Price estimate uses unknown unit `" + unit + "'");
    if (not (std::isfinite(point_price) and std::isfinite(lower_bound) and std::isfinite(upper_bound)))
        throw InvalidInput("Price estimate for `" + product + "' has non-finite prices");
    if (not (lower_bound > 0 and lower_bound <= point_price and point_price <= upper_bound))
        throw InvalidInput("Price estimate for `" + product + "' requires 0 < lower_bound <= point_price <= upper_bound");
    if (not (confidence >= 0 and confidence <= 1))
        throw InvalidInput("Price estimate for `" + product + "' has a confidence outside [0,1]");
}

}
