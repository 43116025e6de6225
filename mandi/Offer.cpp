#include <mandi/Offer.hpp>
#include <mandi/error.hpp>
#include <cmath>

namespace mandi {

void Offer::validate() const {
    if (normalize(product).empty()) throw InvalidInput("Offer requires a product");
    if (not (std::isfinite(unit_price) and unit_price > 0))
        throw InvalidInput("Offer for `" + product + "' requires a positive unit price");
    if (not (std::isfinite(quantity) and quantity > 0))
        throw InvalidInput("Offer for `" + product + "' requires a positive quantity");
    if (not units::known(unit)) throw InvalidInput("Offer for `" + product + "' uses unknown unit `" + unit + "'");
}

double Offer::priceIn(const std::string &target) const {
    return units::convert_price(unit_price, unit, target);
}

double role_deviation(const Offer &offer, double reference_price, const std::string &reference_unit) {
    const double raw = (offer.priceIn(reference_unit) - reference_price) / reference_price;
    return offer.role == Role::seller ? raw : -raw;
}

}
