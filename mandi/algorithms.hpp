#pragma once
#include <vector>

namespace mandi {

/** Returns `value` limited to `[lower, upper]`.  NaN values are returned as `lower`, so that a
 * degenerate input can never escape the range.
 */
double clamp(double value, double lower, double upper);

/// Returns the arithmetic mean of the given values, or 0 if `values` is empty.
double mean(const std::vector<double> &values);

/** Returns the coefficient of variation (population standard deviation divided by the mean) of
 * the given values.  Returns 0 when fewer than two values are given or when the mean is not
 * strictly positive.
 */
double coefficient_of_variation(const std::vector<double> &values);

/** Fits \f$y = a + bx\f$ by least squares and returns the slope \f$b\f$.  The fit is done with
 * Eigen's Householder QR decomposition of the \f$n \times 2\f$ design matrix, which copes with
 * badly scaled x values (such as day offsets) without forming \f$X^\top X\f$.
 *
 * Returns 0 when fewer than two points are given or when all x values are equal.
 *
 * \throws mandi::InvalidInput if x and y differ in size
 */
double least_squares_slope(const std::vector<double> &x, const std::vector<double> &y);

/** Rounds `value` to the nearest multiple of `increment` that lies within `[lower, upper]`.  If
 * the nearest multiple lies outside the range, the nearest multiple inside it is used instead; if
 * no multiple lies inside the range at all (or `increment` is not positive), `value` clamped to
 * the range is returned unrounded.
 */
double round_within(double value, double increment, double lower, double upper);

}
