#pragma once
#include <mandi/types.hpp>
#include <mandi/units.hpp>
#include <mandi/Config.hpp>
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace mandi {

/// The adjustments the pricing model applies, in the canonical order they are applied in.
enum class FactorKind { seasonal, quality, quantity, location };

/// Returns the lower-case name of a factor kind.
std::string to_string(FactorKind kind);

/// Whether an adjustment raised or lowered the price.
enum class Direction { increase, decrease };

/// Returns "increase" or "decrease".
std::string to_string(Direction direction);

/// One multiplicative adjustment that moved a price estimate.
struct Factor {
    /// Which adjustment this is
    FactorKind kind;
    /// Whether it raised or lowered the price
    Direction direction;
    /// The relative size of the adjustment, `|multiplier - 1|`
    double magnitude;
    /// The multiplier that was applied
    double multiplier;
    /// What the adjustment was based on: the month, grade, quantity or location
    std::string detail;
};

/// How a price estimate's snapshot was found.
enum class MatchTier {
    /// Same product and location, within the date window
    exact,
    /// Same product, but another location or a date outside the window
    other_market,
    /// A comparable product from the substitution table
    substitute
};

/// Returns the lower-case name of a match tier.
std::string to_string(MatchTier tier);

/// The market record a price estimate was derived from.
struct Basis {
    /// How the record was found
    MatchTier tier = MatchTier::exact;
    /// The product of the record (differs from the query for substitutes)
    std::string product;
    /// The location of the record
    std::string location;
    /// When the record was made
    timestamp recorded_at;
    /// The substitution price ratio applied (1 unless substituted)
    double ratio = 1.0;
    /// The grade of the record's lot
    QualityGrade quality_grade = QualityGrade::standard;
    /// The record's data quality after fallback downgrades
    DataQuality data_quality = DataQuality::high;
    /// The record's modal price, ratio-scaled and converted to the estimate's unit
    double modal_price = 0;
};

/// Direction of the recent market price movement.
enum class TrendDirection { rising, falling, stable };

/// Returns the lower-case name of a trend direction.
std::string to_string(TrendDirection direction);

/// The recent movement of a market, as estimated from a snapshot's trailing history.
struct MarketTrend {
    /// The direction of price movement
    TrendDirection direction = TrendDirection::stable;
    /// The least-squares slope of the modal price, relative to its mean, per day
    double relative_slope = 0;
    /// True if day-over-day price changes have been getting larger
    bool volatility_rising = false;
};

/** The inputs of a price query: what is being priced, how much of it, where, of what grade, and
 * on what date.
 */
struct EstimateQuery {
    /// The product to price
    std::string product;
    /// The quantity being traded, in `unit`s
    double quantity = 0;
    /// The market location of the deal
    std::string location;
    /// The grade of the lot being priced
    QualityGrade quality_grade = QualityGrade::standard;
    /// The date to price for; defaults to the current time
    boost::optional<timestamp> date;
    /// The unit that the quantity and the resulting prices are in
    std::string unit = units::default_unit;

    /** Checks the query.
     *
     * \throws mandi::InvalidInput if the product is empty, the quantity is not a finite positive
     * value, or the unit is unknown
     */
    void validate() const;
};

/** A price estimate: a point price with a confidence band and the ordered list of factors that
 * moved it away from the basis price, together with the query it answers and the market data it
 * was derived from.  Estimates are produced per request and never cached.
 *
 * `lower_bound <= point_price <= upper_bound` always holds, and the band's relative width
 * `(upper_bound - lower_bound) / point_price` equals `2 (1 - confidence)` except where the
 * confidence has been clamped to its floor.
 */
struct PriceEstimate {
    /// The product priced
    std::string product;
    /// The location priced for
    std::string location;
    /// The unit the prices are per
    std::string unit = units::default_unit;
    /// The grade priced for
    QualityGrade quality_grade = QualityGrade::standard;
    /// The quantity priced, in `unit`s
    double quantity = 0;
    /// The date priced for
    timestamp date;

    /// The suggested price per unit
    double point_price = 0;
    /// Lower end of the confidence band
    double lower_bound = 0;
    /// Upper end of the confidence band
    double upper_bound = 0;
    /// Confidence in the point price, in `[Config::confidence_floor, Config::confidence_ceiling]`
    double confidence = 0;
    /// The adjustments applied, in canonical order; only those that moved the price appear
    std::vector<Factor> factors;

    /// The market record used
    Basis basis;
    /// The volatility that fed the confidence calculation
    double volatility = 0;
    /// Whether `volatility` was computed from history (false: the fallback constant was used)
    bool volatility_computed = false;
    /// The staleness (in `[0,1]`) that fed the confidence calculation
    double staleness = 0;
    /// The recent market trend
    MarketTrend trend;

    /** Returns true if the confidence is below `threshold`, in which case callers should present
     * the estimate as a rough guide only.
     */
    bool degradedConfidence(double threshold = Config::default_low_confidence_threshold) const {
        return confidence < threshold;
    }

    /** Checks that the estimate is usable for assessing offers: finite, strictly positive prices
     * with `lower_bound <= point_price <= upper_bound`, a confidence in `[0,1]`, a non-empty
     * product and a known unit.
     *
     * \throws mandi::InvalidInput describing the first problem found
     */
    void validate() const;
};

}
