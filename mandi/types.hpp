#pragma once
#include <chrono>
#include <cstdint>
#include <string>

/** \file mandi/types.hpp basic types and enumerations
 *
 * This header declares the timestamp type and the small closed enumerations (quality grades, data
 * quality tiers, offer roles, verdicts and severities) used throughout mandi, together with their
 * text conversions.
 */

/// Base namespace containing all mandi classes.
namespace mandi {

/** Point in time used for snapshot recording times, query dates and offer submission times.
 * Calendar calculations (such as the month used for seasonal adjustment) are done in UTC.
 */
typedef std::chrono::system_clock::time_point timestamp;

/// Quality grade of a traded commodity lot.
enum class QualityGrade { premium, standard, low };

/** Data quality tag of a market record.  Fallback matches lower the effective tier of the
 * record they use.
 */
enum class DataQuality { high, medium, low };

/// Which side of the deal an offer comes from.
enum class Role { buyer, seller };

/** Outcome class of a fairness assessment, ordered from least to most severe.  `favorable` and
 * `unfavorable` are relative to the role that submitted the offer.
 */
enum class Verdict { fair, favorable, unfavorable, exploitative };

/// Severity carried by an ethics flag, ordered from least to most severe.
enum class Severity { low, medium, high, critical };

/// Returns the lower-case name of a quality grade.
std::string to_string(QualityGrade grade);
/// Returns the lower-case name of a data quality tier.
std::string to_string(DataQuality quality);
/// Returns "buyer" or "seller".
std::string to_string(Role role);
/// Returns the lower-case name of a verdict.
std::string to_string(Verdict verdict);
/// Returns the lower-case name of a severity.
std::string to_string(Severity severity);

/** Parses a quality grade.  Accepts "premium", "standard" and "low", plus the market aliases
 * "good" and "average" (standard) and "below_average" (low); matching ignores case and
 * surrounding whitespace.
 *
 * \throws mandi::InvalidInput for any other value
 */
QualityGrade parse_grade(const std::string &text);

/** Parses a data quality tier ("high", "medium" or "low").
 *
 * \throws mandi::InvalidInput for any other value
 */
DataQuality parse_data_quality(const std::string &text);

/** Parses a role ("buyer" or "seller"; "buy" and "sell" are also accepted).
 *
 * \throws mandi::InvalidInput for any other value
 */
Role parse_role(const std::string &text);

/// Returns the data quality one tier below the given one; `low` stays `low`.
DataQuality downgrade(DataQuality quality);

/// Returns the other side of a deal.
Role counterpart(Role role);

/** Lower-cases and trims a product, location or unit name so that names can be compared
 * case-insensitively.
 */
std::string normalize(const std::string &name);

}
