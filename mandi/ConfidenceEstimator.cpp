#include <mandi/ConfidenceEstimator.hpp>
#include <mandi/algorithms.hpp>
#include <mandi/time.hpp>
#include <mandi/error.hpp>
#include <mandi/debug.hpp>
#include <algorithm>
#include <cmath>

namespace mandi {

ConfidenceEstimator::ConfidenceEstimator(Config config) : config_(std::move(config)) {
    config_.validate();
}

ConfidenceEstimator::Volatility ConfidenceEstimator::volatility(const MarketSnapshot &snapshot) const {
    auto window = snapshot.trailingHistory(config_.volatility_window_days);
    if (window.size() < config_.min_history_points)
        return {config_.fallback_volatility, false, window.size()};

    std::vector<double> prices;
    prices.reserve(window.size());
    for (const auto &p : window) prices.push_back(p.modal_price);
    return {coefficient_of_variation(prices), true, window.size()};
}

MarketTrend ConfidenceEstimator::trend(const MarketSnapshot &snapshot) const {
    MarketTrend t;
    auto window = snapshot.trailingHistory(config_.volatility_window_days);
    if (window.size() < config_.min_trend_points) return t;

    std::vector<double> days, prices, change_days, changes;
    const timestamp origin = window.front().recorded_at;
    for (size_t i = 0; i < window.size(); i++) {
        days.push_back(days_between(origin, window[i].recorded_at));
        prices.push_back(window[i].modal_price);
        if (i > 0) {
            change_days.push_back(days.back());
            changes.push_back(std::fabs(window[i].modal_price / window[i-1].modal_price - 1));
        }
    }

    const double avg = mean(prices);
    t.relative_slope = least_squares_slope(days, prices) / avg;
    if (t.relative_slope > config_.trend_threshold) t.direction = TrendDirection::rising;
    else if (t.relative_slope < -config_.trend_threshold) t.direction = TrendDirection::falling;

    // Changes of the order of rounding error are not a trend
    t.volatility_rising = least_squares_slope(change_days, changes) > 1e-12;
    return t;
}

double ConfidenceEstimator::staleness(const MarketSnapshot &snapshot, timestamp date) const {
    double age = days_between(snapshot.recordedAt(), date);
    if (age <= 0) return 0.0;
    const double h = config_.staleness_horizon_days;
    switch (config_.staleness_decay) {
        case StalenessDecay::linear:
            return std::min(1.0, age / h);
        case StalenessDecay::exponential:
            return 1.0 - std::exp(-age / h);
    }
    return 1.0;
}

double ConfidenceEstimator::confidence(double volatility, double staleness, DataQuality quality) const {
    const double reduction = config_.volatility_weight * volatility
        + config_.staleness_weight * staleness
        + config_.qualityPenalty(quality);
    const double c = clamp(1.0 - reduction, Config::confidence_floor, Config::confidence_ceiling);
    if (c != 1.0 - reduction) MANDI_DBG("confidence " << 1.0 - reduction << " clamped to " << c);
    return c;
}

ConfidenceEstimator::Bounds ConfidenceEstimator::bound(double point_price, const MarketSnapshot &snapshot, const Volatility &vol, bool rising, timestamp date) const {
    if (not (std::isfinite(point_price) and point_price > 0))
        throw InvalidInput("Confidence band requires a positive point price");

    Bounds b;
    b.staleness = staleness(snapshot, date);
    const double c0 = confidence(vol.value, b.staleness, snapshot.dataQuality());
    const double half = (1.0 - c0) * point_price;
    b.widened = rising and config_.rising_widening > 0;
    b.lower = point_price - half;
    if (b.widened) {
        b.upper = point_price + half * (1.0 + config_.rising_widening);
        b.confidence = clamp(1.0 - (1.0 - c0) * (2.0 + config_.rising_widening) / 2.0,
                Config::confidence_floor, Config::confidence_ceiling);
    }
    else {
        b.upper = point_price + half;
        b.confidence = c0;
    }
    return b;
}

ConfidenceEstimator::Bounds ConfidenceEstimator::bound(double point_price, const MarketSnapshot &snapshot, timestamp date) const {
    return bound(point_price, snapshot, volatility(snapshot), trend(snapshot).volatility_rising, date);
}

}
