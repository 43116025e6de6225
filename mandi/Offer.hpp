#pragma once
#include <mandi/types.hpp>
#include <mandi/units.hpp>
#include <boost/optional.hpp>
#include <string>

namespace mandi {

/** A trade offer submitted by one side of a negotiation: a unit price for a quantity of a product
 * at a location, optionally of a stated grade.  Offers are plain values; once handed to the
 * fairness scorer they are only ever read.
 */
struct Offer {
    /// The side that submitted the offer
    Role role = Role::buyer;
    /// The proposed price per `unit`
    double unit_price = 0;
    /// The quantity, in `unit`s
    double quantity = 0;
    /// The product being traded
    std::string product;
    /// The market location of the deal, if stated; must match the estimate it is assessed against
    std::string location;
    /// The grade of the lot, if stated; must match the estimate it is assessed against
    boost::optional<QualityGrade> quality_grade;
    /// The unit that `unit_price` and `quantity` are quoted in
    std::string unit = units::default_unit;
    /// When the offer was made, if known; used to window offer history
    boost::optional<timestamp> submitted_at;

    /** Checks that the offer is well-formed: a finite, strictly positive price and quantity, a
     * non-empty product and a known unit.
     *
     * \throws mandi::InvalidInput describing the first problem found
     */
    void validate() const;

    /** Returns the offer's unit price converted to a price per `unit`.
     *
     * \throws mandi::InvalidInput if `unit` is unknown
     */
    double priceIn(const std::string &unit) const;
};

/** Returns the signed relative deviation of an offer's price from a reference price (quoted per
 * `reference_unit`), oriented by the offer's role: positive means the offer favors the role that
 * submitted it (a seller asking more, or a buyer offering less, than the reference), negative
 * means it works against that role.  The same price yields equal and opposite values for a
 * buyer and a seller.
 */
double role_deviation(const Offer &offer, double reference_price, const std::string &reference_unit);

}
