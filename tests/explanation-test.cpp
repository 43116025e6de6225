#include <mandi/ExplanationGenerator.hpp>
#include <mandi/FairnessScorer.hpp>
#include <mandi/PricingModel.hpp>
#include <mandi/time.hpp>
#include <gtest/gtest.h>
#include <algorithm>

using namespace mandi;

namespace {

PriceEstimate estimate() {
    PriceEstimate e;
    e.product = "rice";
    e.location = "mumbai";
    e.quantity = 500;
    e.date = date(2026, 3, 10);
    e.point_price = 2500;
    e.lower_bound = 2300;
    e.upper_bound = 2700;
    e.confidence = 0.92;
    e.volatility = 0.15;
    e.volatility_computed = true;
    e.basis.product = "rice";
    e.basis.location = "mumbai";
    e.basis.recorded_at = e.date;
    e.basis.modal_price = 2500;
    return e;
}

bool contains(const std::vector<std::string> &lines, const std::string &text) {
    return std::any_of(lines.begin(), lines.end(), [&](const std::string &l) { return l.find(text) != std::string::npos; });
}

}

TEST(Explain, Descriptors) {
    EXPECT_EQ("slight", ExplanationGenerator::descriptor(0.0));
    EXPECT_EQ("slight", ExplanationGenerator::descriptor(0.0199));
    EXPECT_EQ("moderate", ExplanationGenerator::descriptor(0.02));
    EXPECT_EQ("moderate", ExplanationGenerator::descriptor(0.0799));
    EXPECT_EQ("significant", ExplanationGenerator::descriptor(0.08));
    EXPECT_EQ("significant", ExplanationGenerator::descriptor(0.1999));
    EXPECT_EQ("major", ExplanationGenerator::descriptor(0.20));
    EXPECT_EQ("major", ExplanationGenerator::descriptor(0.45));
}

TEST(Explain, OrderAndText) {
    auto e = estimate();
    e.factors = {
        {FactorKind::seasonal, Direction::increase, 0.05, 1.05, "March"},
        {FactorKind::quality, Direction::increase, 0.30, 1.30, "premium"},
        {FactorKind::quantity, Direction::decrease, 0.05, 0.95, "500 quintal"},
        {FactorKind::location, Direction::increase, 0.10, 1.10, "mumbai"},
    };

    ExplanationGenerator gen;
    auto s = gen.explain(e);
    ASSERT_EQ(4, s.size());
    EXPECT_EQ(FactorKind::quality, s[0].kind);
    EXPECT_EQ(FactorKind::location, s[1].kind);
    // Equal magnitudes: canonical order
    EXPECT_EQ(FactorKind::seasonal, s[2].kind);
    EXPECT_EQ(FactorKind::quantity, s[3].kind);

    EXPECT_EQ("Premium quality grade caused a major increase in price", s[0].text);
    EXPECT_EQ("Market location Mumbai caused a significant increase in price", s[1].text);
    EXPECT_EQ("Seasonal demand in March caused a moderate increase in price", s[2].text);
    EXPECT_EQ("Bulk quantity of 500 quintal caused a moderate decrease in price", s[3].text);
    EXPECT_EQ("moderate", s[3].descriptor);
    EXPECT_EQ(Direction::decrease, s[3].direction);

    for (const auto &st : s) EXPECT_EQ(std::string::npos, st.text.find('%'));

    e.factors.clear();
    EXPECT_TRUE(gen.explain(e).empty());
}

TEST(Explain, ModelFactorsTieInFactorOrder) {
    // A 0.90 bulk step and a +10% location differential are equal in size, though the computed
    // magnitudes differ in the last bits
    PricingTables t;
    t.locationOffset("mumbai", 0.10);
    PricingModel model(t);
    const timestamp day = date(2026, 3, 10);
    SnapshotSet set({MarketSnapshot("rice", "nagpur", 2250, 2750, 2500, "quintal", QualityGrade::standard, 100, day, DataQuality::high)}, 1);

    EstimateQuery q;
    q.product = "rice";
    q.quantity = 2000;
    q.location = "mumbai";
    q.date = day;
    auto e = model.estimate(set, q);
    ASSERT_EQ(2, e.factors.size());

    auto s = ExplanationGenerator().explain(e);
    ASSERT_EQ(2, s.size());
    EXPECT_EQ(FactorKind::quantity, s[0].kind);
    EXPECT_EQ(FactorKind::location, s[1].kind);
    EXPECT_EQ("Bulk quantity of 2000 quintal caused a significant decrease in price", s[0].text);
    EXPECT_EQ("Market location Mumbai caused a significant increase in price", s[1].text);
}

TEST(Notes, Basis) {
    ExplanationGenerator gen;
    auto e = estimate();
    EXPECT_FALSE(contains(gen.notes(e), "priced from"));

    e.basis.tier = MatchTier::other_market;
    e.basis.location = "delhi";
    e.basis.recorded_at = date(2026, 2, 20);
    EXPECT_TRUE(contains(gen.notes(e), "No recent record of rice at Mumbai; priced from the Delhi market on 2026-02-20"));

    e.basis.tier = MatchTier::substitute;
    e.product = "basmati";
    e.basis.product = "rice";
    EXPECT_TRUE(contains(gen.notes(e), "priced from the comparable product rice"));
}

TEST(Notes, ConfidenceTrendAndRisk) {
    ExplanationGenerator gen;
    auto e = estimate();
    auto n = gen.notes(e);
    EXPECT_FALSE(contains(n, "rough guide"));
    EXPECT_TRUE(contains(n, "stable over the past month"));
    EXPECT_TRUE(contains(n, "Volatility risk is low"));

    e.confidence = 0.25;
    e.volatility = 0.25;
    e.trend.direction = TrendDirection::rising;
    e.trend.volatility_rising = true;
    n = gen.notes(e);
    EXPECT_TRUE(contains(n, "rough guide"));
    EXPECT_TRUE(contains(n, "rising over the past month"));
    EXPECT_TRUE(contains(n, "getting larger"));
    EXPECT_TRUE(contains(n, "Volatility risk is medium"));

    e.volatility = 0.45;
    e.trend.direction = TrendDirection::falling;
    n = gen.notes(e);
    EXPECT_TRUE(contains(n, "falling over the past month"));
    EXPECT_TRUE(contains(n, "Volatility risk is high"));

    // No history: no claim about the trend
    e.trend = MarketTrend();
    e.volatility_computed = false;
    EXPECT_FALSE(contains(gen.notes(e), "past month"));
}

TEST(Reasoning, Assessments) {
    ExplanationGenerator gen;
    FairnessScorer scorer;
    auto e = estimate();

    Offer seller;
    seller.role = Role::seller;
    seller.product = "rice";
    seller.quantity = 10;
    seller.unit_price = 2800;
    auto r = gen.reasoning(scorer.assess(seller, e));
    EXPECT_TRUE(contains(r, "The offered price of 2800.00 per quintal is above the fair range of 2300.00 to 2700.00"));
    EXPECT_TRUE(contains(r, "The offer favors the seller over the buyer"));
    EXPECT_TRUE(contains(r, "A counter-offer of 2650.00 per quintal from the buyer is suggested"));

    Offer fair(seller);
    fair.unit_price = 2520;
    r = gen.reasoning(scorer.assess(fair, e));
    EXPECT_TRUE(contains(r, "is within the fair range"));
    EXPECT_TRUE(contains(r, "fair to both sides"));
    EXPECT_FALSE(contains(r, "counter-offer"));

    Offer buyer(seller);
    buyer.role = Role::buyer;
    buyer.unit_price = 1200;
    r = gen.reasoning(scorer.assess(buyer, e));
    EXPECT_TRUE(contains(r, "below the fair range"));
    EXPECT_TRUE(contains(r, "exploitative towards the seller"));
    EXPECT_TRUE(contains(r, "PredatoryPricing (high)"));

    // A buyer paying well over the odds works against themselves
    buyer.unit_price = 3000;
    r = gen.reasoning(scorer.assess(buyer, e));
    EXPECT_TRUE(contains(r, "strongly favors the seller over the buyer"));
}
