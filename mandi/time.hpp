#pragma once
#include <mandi/types.hpp>
#include <string>

namespace mandi {

/** Returns the timestamp of midnight UTC on the given calendar date.
 *
 * \throws mandi::InvalidInput if month is not in [1,12] or day is not in [1,31]
 */
timestamp date(int year, unsigned month, unsigned day);

/// Returns the calendar month (1 through 12, UTC) of a timestamp.
unsigned month_of(timestamp t);

/** Returns the (fractional) number of days from `from` to `to`; negative if `to` is earlier
 * than `from`.
 */
double days_between(timestamp from, timestamp to);

/// Returns the timestamp `days` (possibly fractional or negative) days after `t`.
timestamp add_days(timestamp t, double days);

/// Formats a timestamp as an ISO 8601 (UTC) date, e.g. "2026-10-19".
std::string iso_date(timestamp t);

/// Returns the English name of a month, 1 through 12.
std::string month_name(unsigned month);

}
