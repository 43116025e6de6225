#include <mandi/algorithms.hpp>
#include <mandi/error.hpp>
#include <Eigen/Core>
#include <Eigen/QR>
#include <cmath>
#include <algorithm>

namespace mandi {

using namespace Eigen;

double clamp(double value, double lower, double upper) {
    if (std::isnan(value)) return lower;
    return std::min(upper, std::max(lower, value));
}

double mean(const std::vector<double> &values) {
    if (values.empty()) return 0.0;
    return Map<const VectorXd>(values.data(), values.size()).mean();
}

double coefficient_of_variation(const std::vector<double> &values) {
    if (values.size() < 2) return 0.0;
    Map<const VectorXd> v(values.data(), values.size());
    const double mu = v.mean();
    if (not (mu > 0)) return 0.0;
    const double variance = (v.array() - mu).square().mean();
    return std::sqrt(variance) / mu;
}

double least_squares_slope(const std::vector<double> &x, const std::vector<double> &y) {
    if (x.size() != y.size()) throw InvalidInput("least_squares_slope: x and y must have the same size");
    const auto n = x.size();
    if (n < 2) return 0.0;

    Map<const VectorXd> xv(x.data(), n), yv(y.data(), n);
    // A constant x has no slope to speak of (and would make the design matrix rank deficient)
    if (xv.maxCoeff() == xv.minCoeff()) return 0.0;

    // Centre x so that the intercept column doesn't dominate when x is something like a day count
    const double x_mean = xv.mean();
    MatrixXd X(n, 2);
    X.col(0).setOnes();
    X.col(1) = xv.array() - x_mean;

    VectorXd beta = X.householderQr().solve(yv);
    return beta[1];
}

double round_within(double value, double increment, double lower, double upper) {
    double clamped = clamp(value, lower, upper);
    if (not (increment > 0)) return clamped;

    double rounded = std::round(clamped / increment) * increment;
    if (rounded > upper) rounded = std::floor(upper / increment) * increment;
    if (rounded < lower) rounded = std::ceil(lower / increment) * increment;
    // Nothing in [lower, upper] is a multiple of the increment
    if (rounded < lower or rounded > upper) return clamped;
    return rounded;
}

}
