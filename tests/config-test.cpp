#include <mandi/Config.hpp>
#include <mandi/PricingTables.hpp>
#include <mandi/error.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace mandi;

TEST(Config, Defaults) {
    Config c;
    EXPECT_EQ(7, c.date_window_days);
    EXPECT_EQ(30, c.volatility_window_days);
    EXPECT_EQ(3, c.min_history_points);
    EXPECT_EQ(0.25, c.fallback_volatility);
    EXPECT_EQ(StalenessDecay::linear, c.staleness_decay);
    EXPECT_EQ(0.05, c.fair_threshold);
    EXPECT_EQ(0.15, c.directional_threshold);
    EXPECT_EQ(0.35, c.exploitative_threshold);
    EXPECT_EQ(0.35, c.max_deviation);
    EXPECT_EQ(3, c.manipulation_run);
    EXPECT_EQ(0.0, c.qualityPenalty(DataQuality::high));
    EXPECT_EQ(0.1, c.qualityPenalty(DataQuality::medium));
    EXPECT_EQ(0.25, c.qualityPenalty(DataQuality::low));
    EXPECT_NO_THROW(c.validate());
}

TEST(Config, Load) {
    std::istringstream in(
            "[confidence]\n"
            "volatility_weight = 1.5\n"
            "staleness_decay = Exponential\n"
            "min_history_points = 5\n"
            "\n"
            "[fairness]\n"
            "exploitative_threshold = 0.40\n"
            "unknown_key = 12\n"
            "\n"
            "[ethics]\n"
            "manipulation_run = 4\n");
    Config c = Config::load(in);
    EXPECT_EQ(1.5, c.volatility_weight);
    EXPECT_EQ(StalenessDecay::exponential, c.staleness_decay);
    EXPECT_EQ(5, c.min_history_points);
    EXPECT_EQ(0.40, c.exploitative_threshold);
    EXPECT_EQ(4, c.manipulation_run);
    // Untouched values keep their defaults
    EXPECT_EQ(Config::default_fair_threshold, c.fair_threshold);
    EXPECT_EQ(Config::default_staleness_weight, c.staleness_weight);
}

TEST(Config, LoadErrors) {
    std::istringstream bad_number("[fairness]\nfair_threshold = lots\n");
    EXPECT_THROW(Config::load(bad_number), InvalidInput);

    std::istringstream bad_decay("[confidence]\nstaleness_decay = quadratic\n");
    EXPECT_THROW(Config::load(bad_decay), InvalidInput);

    std::istringstream bad_order("[fairness]\nfair_threshold = 0.2\ndirectional_threshold = 0.1\n");
    EXPECT_THROW(Config::load(bad_order), InvalidInput);

    std::istringstream not_ini("[fairness\nfair_threshold = 0.2\n");
    EXPECT_THROW(Config::load(not_ini), InvalidInput);

    EXPECT_THROW(Config::fromFile("/nonexistent/mandi.ini"), InvalidInput);
}

TEST(Config, Validate) {
    Config c;
    c.volatility_weight = -1;
    EXPECT_THROW(c.validate(), InvalidInput);

    c = Config();
    c.exploitative_threshold = 0.8;
    EXPECT_THROW(c.validate(), InvalidInput);

    c = Config();
    c.max_deviation = 0;
    EXPECT_THROW(c.validate(), InvalidInput);

    c = Config();
    c.vulnerability_threshold = 1.5;
    EXPECT_THROW(c.validate(), InvalidInput);
}

TEST(PricingTables, Defaults) {
    PricingTables t;
    EXPECT_EQ(1.30, t.gradeMultiplier(QualityGrade::premium));
    EXPECT_EQ(1.00, t.gradeMultiplier(QualityGrade::standard));
    EXPECT_EQ(0.70, t.gradeMultiplier(QualityGrade::low));

    EXPECT_EQ(1.0, t.bulkMultiplier(1));
    EXPECT_EQ(1.0, t.bulkMultiplier(499.99));
    EXPECT_EQ(0.95, t.bulkMultiplier(500));
    EXPECT_EQ(0.95, t.bulkMultiplier(1999));
    EXPECT_EQ(0.90, t.bulkMultiplier(2000));
    EXPECT_EQ(0.90, t.bulkMultiplier(1e6));

    EXPECT_FALSE(t.hasSeasonal("rice"));
    EXPECT_EQ(1.0, t.seasonal("rice", 10));
    EXPECT_EQ(0.0, t.locationOffset("mumbai"));
    EXPECT_TRUE(t.substitutes("basmati").empty());
}

TEST(PricingTables, Setters) {
    PricingTables t;
    t.seasonal("Rice", {{1.05, 1.03, 1.00, 0.98, 0.95, 0.93, 0.95, 0.98, 1.02, 1.08, 1.12, 1.10}});
    EXPECT_TRUE(t.hasSeasonal("rice"));
    EXPECT_EQ(1.05, t.seasonal("RICE", 1));
    EXPECT_EQ(1.12, t.seasonal("rice", 11));
    EXPECT_THROW(t.seasonal("rice", 0), InvalidInput);
    EXPECT_THROW(t.seasonal("rice", 13), InvalidInput);

    t.locationOffset("Mumbai", 0.10);
    EXPECT_EQ(0.10, t.locationOffset(" mumbai"));
    EXPECT_THROW(t.locationOffset("nowhere", -1), InvalidInput);

    t.bulkSteps({{1000, 0.9}, {100, 0.97}});
    EXPECT_EQ(1.0, t.bulkMultiplier(99));
    EXPECT_EQ(0.97, t.bulkMultiplier(100));
    EXPECT_EQ(0.9, t.bulkMultiplier(1000));
    EXPECT_THROW(t.bulkSteps({{100, 0}}), InvalidInput);

    t.addSubstitute("basmati", "Rice", 1.6);
    t.addSubstitute("basmati", "wheat");
    ASSERT_EQ(2, t.substitutes("Basmati").size());
    EXPECT_EQ("rice", t.substitutes("basmati")[0].product);
    EXPECT_EQ(1.6, t.substitutes("basmati")[0].ratio);
    EXPECT_EQ(1.0, t.substitutes("basmati")[1].ratio);
    EXPECT_THROW(t.addSubstitute("rice", "RICE"), InvalidInput);
    EXPECT_THROW(t.addSubstitute("rice", "wheat", 0), InvalidInput);

    EXPECT_THROW(t.gradeMultiplier(QualityGrade::low, -0.5), InvalidInput);
}

TEST(PricingTables, Load) {
    std::istringstream in(
            "[grades]\n"
            "premium = 1.25\n"
            "below_average = 0.6\n"
            "\n"
            "[bulk]\n"
            "100 = 0.98\n"
            "1000 = 0.92\n"
            "\n"
            "[seasonal]\n"
            "onion = 1.20, 1.25, 1.15, 1.00, 0.85, 0.80, 0.75, 0.80, 0.90, 1.05, 1.15, 1.18\n"
            "\n"
            "[location]\n"
            "delhi = 0.08\n"
            "remote = -0.12\n"
            "\n"
            "[substitutes]\n"
            "shallot = onion:1.4, garlic\n");
    auto t = PricingTables::load(in);
    EXPECT_EQ(1.25, t.gradeMultiplier(QualityGrade::premium));
    EXPECT_EQ(1.00, t.gradeMultiplier(QualityGrade::standard));
    EXPECT_EQ(0.6, t.gradeMultiplier(QualityGrade::low));
    EXPECT_EQ(0.98, t.bulkMultiplier(500));
    EXPECT_EQ(0.92, t.bulkMultiplier(5000));
    EXPECT_EQ(0.75, t.seasonal("onion", 7));
    EXPECT_EQ(-0.12, t.locationOffset("Remote"));
    ASSERT_EQ(2, t.substitutes("shallot").size());
    EXPECT_EQ("onion", t.substitutes("shallot")[0].product);
    EXPECT_EQ(1.4, t.substitutes("shallot")[0].ratio);
    EXPECT_EQ("garlic", t.substitutes("shallot")[1].product);
}

TEST(PricingTables, LoadErrors) {
    std::istringstream short_season("[seasonal]\nrice = 1, 1, 1\n");
    EXPECT_THROW(PricingTables::load(short_season), InvalidInput);

    std::istringstream bad_grade("[grades]\nexcellent = 1.5\n");
    EXPECT_THROW(PricingTables::load(bad_grade), InvalidInput);

    std::istringstream bad_number("[location]\npune = four percent\n");
    EXPECT_THROW(PricingTables::load(bad_number), InvalidInput);

    std::istringstream bad_ratio("[substitutes]\nbasmati = rice:x\n");
    EXPECT_THROW(PricingTables::load(bad_ratio), InvalidInput);

    EXPECT_THROW(PricingTables::fromFile("/nonexistent/tables.ini"), InvalidInput);
}
