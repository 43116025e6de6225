#pragma once
#include <string>
#include <vector>

namespace mandi {
/** Namespace for the regional trading units that prices and quantities are quoted in.  Prices are
 * always per unit, so converting a price between units scales it by the ratio of the units'
 * weights.
 */
namespace units {

/// A weight unit used for quoting agricultural commodities.
struct Unit {
    /// Canonical (lower-case) name of the unit, e.g. "quintal"
    std::string name;
    /// The weight of one unit, in kilograms
    double kilograms;
    /// The smallest price step used when quoting a price per unit (e.g. whole rupees per quintal)
    double price_increment;
    /// Alternative spellings and abbreviations accepted for this unit
    std::vector<std::string> aliases;
};

/// The canonical name of the default pricing unit.
extern const std::string default_unit;

/** Looks up a unit by canonical name or alias; matching ignores case and surrounding whitespace.
 *
 * \throws mandi::InvalidInput if the unit is not known
 */
const Unit& find(const std::string &name);

/// Returns true if `name` is a known unit name or alias.
bool known(const std::string &name);

/** Returns the canonical name for a unit name or alias.
 *
 * \throws mandi::InvalidInput if the unit is not known
 */
const std::string& canonical(const std::string &name);

/** Converts a price quoted per `from` unit into a price per `to` unit.  For example, 2500 per
 * quintal is 25 per kg.
 *
 * \throws mandi::InvalidInput if either unit is unknown
 */
double convert_price(double price, const std::string &from, const std::string &to);

/** Converts a quantity measured in `from` units into `to` units.  For example, 3 quintal is 6
 * bags.
 *
 * \throws mandi::InvalidInput if either unit is unknown
 */
double convert_quantity(double quantity, const std::string &from, const std::string &to);

/** Returns the price granularity of a unit: the step that prices quoted per this unit are
 * rounded to.
 *
 * \throws mandi::InvalidInput if the unit is unknown
 */
double price_increment(const std::string &unit);

/// Returns all known units.
const std::vector<Unit>& all();

} }
