#include <mandi/ConfidenceEstimator.hpp>
#include <mandi/time.hpp>
#include <mandi/error.hpp>
#include <gtest/gtest.h>
#include <cmath>

using namespace mandi;

namespace {

const timestamp day = date(2026, 3, 10);

// A snapshot recorded on `day` whose history has the given prices on consecutive days up to the
// day before
MarketSnapshot with_history(const std::vector<double> &prices, DataQuality quality = DataQuality::high, timestamp when = day) {
    std::vector<PricePoint> history;
    const int n = prices.size();
    for (int i = 0; i < n; i++) history.push_back({add_days(when, i - n), prices[i]});
    return MarketSnapshot("rice", "mumbai", 90, 110, 100, "quintal", QualityGrade::standard, 10, when, quality, history);
}

}

TEST(Volatility, Fallback) {
    ConfidenceEstimator est;
    auto v = est.volatility(with_history({}));
    EXPECT_EQ(0.25, v.value);
    EXPECT_FALSE(v.computed);
    EXPECT_EQ(0, v.points);

    v = est.volatility(with_history({100, 110}));
    EXPECT_EQ(0.25, v.value);
    EXPECT_FALSE(v.computed);
    EXPECT_EQ(2, v.points);
}

TEST(Volatility, Computed) {
    ConfidenceEstimator est;
    auto v = est.volatility(with_history({90, 100, 110}));
    EXPECT_TRUE(v.computed);
    EXPECT_EQ(3, v.points);
    EXPECT_NEAR(std::sqrt(200.0 / 3) / 100, v.value, 1e-12);

    // Points older than the window are ignored
    MarketSnapshot s("rice", "mumbai", 90, 110, 100, "quintal", QualityGrade::standard, 10, day, DataQuality::high,
            {{add_days(day, -45), 500}, {add_days(day, -3), 90}, {add_days(day, -2), 100}, {add_days(day, -1), 110}});
    EXPECT_NEAR(std::sqrt(200.0 / 3) / 100, est.volatility(s).value, 1e-12);

    Config c;
    c.volatility_window_days = 60;
    EXPECT_EQ(4, ConfidenceEstimator(c).volatility(s).points);
}

TEST(Staleness, Decay) {
    ConfidenceEstimator linear;
    auto s = with_history({});
    EXPECT_EQ(0, linear.staleness(s, day));
    EXPECT_EQ(0, linear.staleness(s, add_days(day, -3)));
    EXPECT_DOUBLE_EQ(0.5, linear.staleness(s, add_days(day, 15)));
    EXPECT_EQ(1, linear.staleness(s, add_days(day, 60)));

    Config c;
    c.staleness_decay = StalenessDecay::exponential;
    ConfidenceEstimator expo(c);
    EXPECT_EQ(0, expo.staleness(s, day));
    EXPECT_NEAR(1 - std::exp(-0.5), expo.staleness(s, add_days(day, 15)), 1e-12);
    EXPECT_LT(expo.staleness(s, add_days(day, 600)), 1.0 + 1e-15);
}

TEST(Confidence, Formula) {
    ConfidenceEstimator est;
    EXPECT_NEAR(0.65, est.confidence(0.1, 0.5, DataQuality::medium), 1e-12);
    EXPECT_NEAR(0.75, est.confidence(0.25, 0, DataQuality::high), 1e-12);
    EXPECT_NEAR(0.60, est.confidence(0.0, 0.5, DataQuality::low), 1e-12);

    // Extremes are clamped, never rejected
    EXPECT_EQ(Config::confidence_floor, est.confidence(5, 1, DataQuality::low));
    EXPECT_EQ(Config::confidence_ceiling, est.confidence(0, 0, DataQuality::high));
    EXPECT_EQ(Config::confidence_floor, est.confidence(std::nan(""), 0, DataQuality::high));
}

TEST(Confidence, NonIncreasing) {
    ConfidenceEstimator est;
    for (auto q : {DataQuality::high, DataQuality::medium, DataQuality::low}) {
        double prev = 1;
        for (double v = 0; v <= 1.5; v += 0.01) {
            double c = est.confidence(v, 0.2, q);
            EXPECT_LE(c, prev);
            prev = c;
        }
        prev = 1;
        for (double s = 0; s <= 1; s += 0.01) {
            double c = est.confidence(0.1, s, q);
            EXPECT_LE(c, prev);
            prev = c;
        }
    }

    // Older snapshots never give higher confidence
    auto snap = with_history({90, 100, 110});
    double prev = 1;
    for (int d = 0; d <= 90; d += 3) {
        double c = est.bound(1000, snap, add_days(day, d)).confidence;
        EXPECT_LE(c, prev);
        prev = c;
    }
}

TEST(Trend, Direction) {
    ConfidenceEstimator est;

    auto up = est.trend(with_history({100, 102, 104, 106, 108}));
    EXPECT_EQ(TrendDirection::rising, up.direction);
    EXPECT_NEAR(2.0 / 104, up.relative_slope, 1e-12);
    EXPECT_FALSE(up.volatility_rising);

    auto down = est.trend(with_history({108, 106, 104, 102, 100}));
    EXPECT_EQ(TrendDirection::falling, down.direction);
    EXPECT_NEAR(-2.0 / 104, down.relative_slope, 1e-12);

    auto flat = est.trend(with_history({100, 100, 100, 100, 100}));
    EXPECT_EQ(TrendDirection::stable, flat.direction);
    EXPECT_FALSE(flat.volatility_rising);

    // Below the threshold of 0.2% a day
    auto drift = est.trend(with_history({1000, 1001, 1002, 1003}));
    EXPECT_EQ(TrendDirection::stable, drift.direction);

    // Too few points
    auto few = est.trend(with_history({100, 150, 200}));
    EXPECT_EQ(TrendDirection::stable, few.direction);
    EXPECT_EQ(0, few.relative_slope);
    EXPECT_FALSE(few.volatility_rising);
}

TEST(Trend, VolatilityRising) {
    ConfidenceEstimator est;
    EXPECT_TRUE(est.trend(with_history({100, 101, 99, 103, 97})).volatility_rising);
    EXPECT_FALSE(est.trend(with_history({100, 97, 103, 99, 101})).volatility_rising);
}

TEST(Bound, Symmetric) {
    ConfidenceEstimator est;
    auto snap = with_history({100, 97, 103, 99, 101});
    auto b = est.bound(1000, snap, day);
    EXPECT_FALSE(b.widened);
    EXPECT_NEAR(0.98, b.confidence, 1e-12);
    EXPECT_NEAR(980, b.lower, 1e-9);
    EXPECT_NEAR(1020, b.upper, 1e-9);
    EXPECT_NEAR(2 * (1 - b.confidence), (b.upper - b.lower) / 1000, 1e-12);
}

TEST(Bound, RisingVolatilityWidensUpper) {
    ConfidenceEstimator est;
    auto snap = with_history({100, 101, 99, 103, 97});
    auto b = est.bound(1000, snap, day);
    EXPECT_TRUE(b.widened);
    EXPECT_NEAR(980, b.lower, 1e-9);
    EXPECT_NEAR(1025, b.upper, 1e-9);
    EXPECT_NEAR(0.9775, b.confidence, 1e-12);
    EXPECT_NEAR(2 * (1 - b.confidence), (b.upper - b.lower) / 1000, 1e-12);

    Config c;
    c.rising_widening = 0;
    auto flat = ConfidenceEstimator(c).bound(1000, snap, day);
    EXPECT_FALSE(flat.widened);
    EXPECT_NEAR(1020, flat.upper, 1e-9);
}

TEST(Bound, Invariants) {
    ConfidenceEstimator est;
    const std::vector<std::vector<double>> histories{
        {}, {100, 100, 100}, {50, 150, 60, 140, 55}, {100, 101, 99, 103, 97}, {1, 1000, 1, 1000}};
    for (const auto &h : histories) {
        for (auto q : {DataQuality::high, DataQuality::medium, DataQuality::low}) {
            auto snap = with_history(h, q);
            for (double point : {0.01, 25.0, 3087.5, 1e7}) {
                for (int age : {0, 7, 45, 400}) {
                    auto b = est.bound(point, snap, add_days(day, age));
                    EXPECT_LT(b.lower, point);
                    EXPECT_GT(b.upper, point);
                    EXPECT_GT(b.lower, 0);
                    EXPECT_GE(b.confidence, 0.05);
                    EXPECT_LE(b.confidence, 0.99);
                }
            }
        }
    }
}

TEST(Bound, InvalidPoint) {
    ConfidenceEstimator est;
    auto snap = with_history({});
    EXPECT_THROW(est.bound(0, snap, day), InvalidInput);
    EXPECT_THROW(est.bound(-10, snap, day), InvalidInput);
    EXPECT_THROW(est.bound(std::nan(""), snap, day), InvalidInput);
}
