/// Example of pricing and negotiating over a small set of mandi records.
///
/// Usage: price-query [config.ini [tables.ini]]

#include <mandi/Engine.hpp>
#include <mandi/MemoryRepository.hpp>
#include <mandi/time.hpp>
#include <mandi/error.hpp>
#include <boost/format.hpp>
#include <array>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

using namespace mandi;
using boost::format;

namespace {

struct Sample {
    const char *product;
    double base_price;
    double volatility;
    std::array<double, 12> seasonal;
};

const std::vector<Sample> samples{
    {"rice",   2500, 0.15, {{1.05, 1.03, 1.00, 0.98, 0.95, 0.93, 0.95, 0.98, 1.02, 1.08, 1.12, 1.10}}},
    {"wheat",  2200, 0.12, {{1.08, 1.10, 1.05, 1.00, 0.95, 0.90, 0.92, 0.95, 1.00, 1.05, 1.08, 1.10}}},
    {"onion",  3000, 0.35, {{1.20, 1.25, 1.15, 1.00, 0.85, 0.80, 0.75, 0.80, 0.90, 1.05, 1.15, 1.18}}},
    {"potato", 1800, 0.25, {{1.15, 1.20, 1.10, 1.00, 0.90, 0.85, 0.80, 0.85, 0.95, 1.05, 1.10, 1.12}}},
    {"tomato", 4000, 0.45, {{1.30, 1.35, 1.20, 1.00, 0.80, 0.70, 0.65, 0.70, 0.85, 1.10, 1.25, 1.28}}},
    {"cotton", 5500, 0.20, {{1.05, 1.03, 1.00, 0.98, 0.95, 0.93, 0.95, 0.98, 1.02, 1.08, 1.10, 1.08}}},
};

const std::map<std::string, double> locations{
    {"mumbai", 0.10}, {"delhi", 0.08}, {"bangalore", 0.06}, {"pune", 0.04}, {"rural", -0.08}, {"remote", -0.12}};

PricingTables sample_tables() {
    PricingTables t;
    for (const auto &s : samples) t.seasonal(s.product, s.seasonal);
    for (const auto &l : locations) t.locationOffset(l.first, l.second);
    t.addSubstitute("basmati", "rice", 1.6);
    t.addSubstitute("shallot", "onion", 1.4);
    return t;
}

// Daily history over the last month, oscillating with an amplitude that gives roughly the
// product's volatility
std::vector<PricePoint> sample_history(double price, double volatility, timestamp end) {
    std::vector<PricePoint> history;
    for (int d = 30; d >= 1; d--)
        history.push_back({add_days(end, -d), price * (1 + volatility * std::sqrt(2.0) * std::sin(0.7 * d))});
    return history;
}

void seed(MemoryRepository &repo, timestamp today) {
    const std::vector<std::string> markets{"delhi", "mumbai", "pune"};
    int i = 0;
    for (const auto &s : samples) {
        for (const auto &m : markets) {
            const double modal = s.base_price * (1 + locations.at(m));
            const timestamp recorded = add_days(today, -(i++ % 4));
            repo.add(MarketSnapshot(s.product, m, 0.9 * modal, 1.1 * modal, modal, "quintal", QualityGrade::standard,
                        120, recorded, DataQuality::high, sample_history(modal, s.volatility, recorded)));
        }
    }
}

void print_estimate(const Engine &engine, const PriceEstimate &e) {
    std::cout << format("%s at %s, %g %s of %s grade\n") % e.product % e.location % e.quantity % e.unit % to_string(e.quality_grade);
    std::cout << format("  suggested %10.2f per %s (range %.2f - %.2f), confidence %.2f\n")
        % e.point_price % e.unit % e.lower_bound % e.upper_bound % e.confidence;
    for (const auto &s : engine.explainEstimate(e)) std::cout << "  - " << s.text << "\n";
    for (const auto &n : engine.explanations().notes(e)) std::cout << "  * " << n << "\n";
}

void print_assessment(const Engine &engine, const FairnessAssessment &a) {
    std::cout << format("  %s offer of %.2f: %s (score %.2f)\n") % to_string(a.offer.role) % a.offer.unit_price
        % to_string(a.verdict) % a.score;
    for (const auto &line : engine.explanations().reasoning(a)) std::cout << "    " << line << "\n";
}

}

int main(int argc, char *argv[]) {
    try {
        Config config = argc > 1 ? Config::fromFile(argv[1]) : Config();
        PricingTables tables = argc > 2 ? PricingTables::fromFile(argv[2]) : sample_tables();

        const timestamp today = std::chrono::system_clock::now();
        auto repo = std::make_shared<MemoryRepository>();
        seed(*repo, today);

        auto cache = std::make_shared<SnapshotCache>(repo);
        cache->refresh();

        Engine engine(cache, tables, config, repo);

        for (const auto &q : std::vector<EstimateQuery>{
                {"rice", 500, "mumbai", QualityGrade::premium, today},
                {"onion", 50, "bangalore", QualityGrade::standard, today},
                {"basmati", 2500, "delhi", QualityGrade::standard, today},
                {"wheat", 800, "pune", QualityGrade::low, today, "bag"}}) {
            print_estimate(engine, engine.getPriceEstimate(q));
            std::cout << "\n";
        }

        EstimateQuery query{"potato", 100, "pune", QualityGrade::standard, today};
        auto estimate = engine.getPriceEstimate(query);
        print_estimate(engine, estimate);

        Offer seller;
        seller.role = Role::seller;
        seller.product = "potato";
        seller.location = "pune";
        seller.quantity = 100;
        seller.unit_price = estimate.point_price * 1.12;
        print_assessment(engine, engine.assessOffer(seller, estimate));

        Offer buyer(seller);
        buyer.role = Role::buyer;
        buyer.unit_price = estimate.point_price * 0.48;
        buyer.submitted_at = today;
        InteractionContext context;
        context.counterpart_id = "farmer-17";
        context.profile = VulnerabilityProfile{VulnerabilityProfile::Literacy::low, VulnerabilityProfile::Experience::newcomer, 0.4, 2};
        for (double f : {0.70, 0.60}) {
            Offer earlier(buyer);
            earlier.unit_price = estimate.point_price * f;
            earlier.submitted_at = add_days(today, -f / 10);
            repo->recordOffer(context.counterpart_id, earlier);
        }
        print_assessment(engine, engine.guardedAssess(buyer, query, context));

        try {
            engine.getPriceEstimate({"dragonfruit", 10, "delhi"});
        }
        catch (const NoComparableData &e) {
            std::cout << "\n" << e.what() << "\n";
        }
    }
    catch (const InvalidInput &e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
        return 1;
    }
}
