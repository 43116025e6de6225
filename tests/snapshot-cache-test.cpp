#include <mandi/SnapshotCache.hpp>
#include <mandi/MemoryRepository.hpp>
#include <mandi/time.hpp>
#include <mandi/error.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mandi;

namespace {

MarketSnapshot snap(const std::string &product, const std::string &location, double modal, timestamp when,
        DataQuality quality = DataQuality::high) {
    return MarketSnapshot(product, location, 0.9 * modal, 1.1 * modal, modal, "quintal", QualityGrade::standard,
            100, when, quality);
}

// Repository whose bulk load can be made to fail
class FlakyRepository : public SnapshotRepository {
    public:
        std::atomic<bool> fail{false};
        mutable std::atomic<int> loads{0};
        MemoryRepository data;

        MarketSnapshot fetchSnapshot(const std::string &product, const std::string &location, timestamp date) const override {
            return data.fetchSnapshot(product, location, date);
        }
        std::vector<MarketSnapshot> fetchAll() const override {
            loads++;
            if (fail) throw std::runtime_error("market feed unavailable");
            return data.fetchAll();
        }
};

// Polls `pred` for up to two seconds
template <class Pred> bool eventually(Pred pred) {
    for (int i = 0; i < 200; i++) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

}

TEST(MarketSnapshot, Validation) {
    const auto t = date(2026, 3, 10);
    EXPECT_NO_THROW(MarketSnapshot("rice", "mumbai", 2300, 2700, 2500, "quintal", QualityGrade::standard, 10, t, DataQuality::high));
    EXPECT_NO_THROW(MarketSnapshot("rice", "mumbai", 2500, 2500, 2500, "qtl", QualityGrade::standard, 0, t, DataQuality::high));
    EXPECT_THROW(MarketSnapshot("rice", "mumbai", 0, 2700, 2500, "quintal", QualityGrade::standard, 10, t, DataQuality::high), InvalidInput);
    EXPECT_THROW(MarketSnapshot("rice", "mumbai", 2600, 2700, 2500, "quintal", QualityGrade::standard, 10, t, DataQuality::high), InvalidInput);
    EXPECT_THROW(MarketSnapshot("rice", "mumbai", 2300, 2400, 2500, "quintal", QualityGrade::standard, 10, t, DataQuality::high), InvalidInput);
    EXPECT_THROW(MarketSnapshot("rice", "mumbai", 2300, 2700, 2500, "quintal", QualityGrade::standard, -1, t, DataQuality::high), InvalidInput);
    EXPECT_THROW(MarketSnapshot("", "mumbai", 2300, 2700, 2500, "quintal", QualityGrade::standard, 10, t, DataQuality::high), InvalidInput);
    EXPECT_THROW(MarketSnapshot("rice", "mumbai", 2300, 2700, 2500, "bushel", QualityGrade::standard, 10, t, DataQuality::high), InvalidInput);
    EXPECT_THROW(MarketSnapshot("rice", "mumbai", 2300, 2700, 2500, "quintal", QualityGrade::standard, 10, t, DataQuality::high,
                {{add_days(t, -1), -5}}), InvalidInput);
}

TEST(MarketSnapshot, History) {
    const auto t = date(2026, 3, 10);
    MarketSnapshot s("rice", "mumbai", 2300, 2700, 2500, "Qtl", QualityGrade::standard, 10, t, DataQuality::high,
            {{add_days(t, -2), 2450}, {add_days(t, -40), 2000}, {add_days(t, -1), 2480}, {add_days(t, 3), 2600}});
    EXPECT_EQ("quintal", s.unit());
    ASSERT_EQ(4, s.history().size());
    EXPECT_EQ(2000, s.history().front().modal_price);

    auto window = s.trailingHistory(30);
    ASSERT_EQ(2, window.size());
    EXPECT_EQ(2450, window[0].modal_price);
    EXPECT_EQ(2480, window[1].modal_price);

    auto lowered = s.withDataQuality(DataQuality::low);
    EXPECT_EQ(DataQuality::low, lowered.dataQuality());
    EXPECT_EQ(DataQuality::high, s.dataQuality());
    EXPECT_EQ(2500, lowered.modalPrice());
}

TEST(MemoryRepository, FetchSnapshot) {
    MemoryRepository repo;
    const auto t = date(2026, 3, 10);
    repo.add(snap("rice", "Mumbai", 2500, add_days(t, -5)));
    repo.add(snap("rice", "mumbai", 2550, add_days(t, 5)));
    repo.add(snap("rice", "delhi", 2400, t));
    EXPECT_EQ(3, repo.size());

    // Equally near: the later one wins
    EXPECT_EQ(2550, repo.fetchSnapshot("RICE", "mumbai", t).modalPrice());
    EXPECT_EQ(2500, repo.fetchSnapshot("rice", "mumbai", add_days(t, -4)).modalPrice());
    EXPECT_THROW(repo.fetchSnapshot("rice", "pune", t), NotFound);
    EXPECT_THROW(repo.fetchSnapshot("wheat", "delhi", t), NotFound);

    EXPECT_EQ(3, repo.removeProduct("Rice"));
    EXPECT_EQ(0, repo.size());
}

TEST(MemoryRepository, FetchHistory) {
    MemoryRepository repo;
    const auto t = date(2026, 3, 10);
    Offer o;
    o.product = "rice";
    o.quantity = 10;
    for (int i = 0; i < 3; i++) {
        o.unit_price = 2400 + i;
        o.submitted_at = add_days(t, -i);
        repo.recordOffer("farmer-1", o);
    }
    o.submitted_at = boost::none;
    o.unit_price = 9999;
    repo.recordOffer("farmer-1", o);
    o.unit_price = 1;
    repo.recordOffer("farmer-2", o);

    auto h = repo.fetchHistory("Rice", "farmer-1", {add_days(t, -1.5), t});
    ASSERT_EQ(3, h.size());
    // The undated offer comes first, then the dated ones in time order
    EXPECT_EQ(9999, h[0].unit_price);
    EXPECT_EQ(2401, h[1].unit_price);
    EXPECT_EQ(2400, h[2].unit_price);

    EXPECT_TRUE(repo.fetchHistory("wheat", "farmer-1", {add_days(t, -10), t}).empty());
    EXPECT_EQ(1, repo.fetchHistory("rice", "farmer-2", {add_days(t, -10), t}).size());
}

TEST(SnapshotSet, Index) {
    const auto t = date(2026, 3, 10);
    SnapshotSet set({snap("Rice", "pune", 2500, t), snap("rice", "delhi", 2400, t), snap("rice", "agra", 2300, add_days(t, -1)),
            snap("wheat", "delhi", 2200, t)}, 7);
    EXPECT_EQ(7, set.generation());
    EXPECT_EQ(4, set.size());
    EXPECT_TRUE(set.contains("RICE"));
    EXPECT_FALSE(set.contains("onion"));
    EXPECT_TRUE(set.forProduct("onion").empty());

    const auto &rice = set.forProduct("rice");
    ASSERT_EQ(3, rice.size());
    EXPECT_EQ("agra", rice[0].location());
    EXPECT_EQ("delhi", rice[1].location());
    EXPECT_EQ("pune", rice[2].location());

    EXPECT_EQ((std::vector<std::string>{"rice", "wheat"}), set.products());
}

TEST(SnapshotCache, RefreshAndSwap) {
    auto repo = std::make_shared<MemoryRepository>();
    const auto t = date(2026, 3, 10);
    repo->add(snap("rice", "mumbai", 2500, t));

    SnapshotCache cache(repo);
    EXPECT_EQ(0, cache.generation());
    EXPECT_TRUE(cache.current()->empty());

    EXPECT_EQ(1, cache.refresh());
    auto first = cache.current();
    EXPECT_EQ(1, first->size());

    repo->add(snap("wheat", "delhi", 2200, t));
    EXPECT_EQ(2, cache.invalidate());
    auto second = cache.current();
    EXPECT_EQ(2, second->size());
    EXPECT_EQ(2, second->generation());

    // A generation held by a reader is unaffected by later refreshes
    EXPECT_EQ(1, first->size());
    EXPECT_EQ(1, first->generation());
    EXPECT_FALSE(first->contains("wheat"));
}

TEST(SnapshotCache, Errors) {
    EXPECT_THROW(SnapshotCache(nullptr), InvalidInput);

    auto repo = std::make_shared<FlakyRepository>();
    repo->data.add(snap("rice", "mumbai", 2500, date(2026, 3, 10)));
    SnapshotCache cache(repo);
    cache.refresh();

    repo->fail = true;
    EXPECT_THROW(cache.refresh(), std::runtime_error);
    EXPECT_EQ(1, cache.generation());
    EXPECT_EQ(1, cache.current()->size());

    EXPECT_THROW(cache.refreshEvery(std::chrono::milliseconds(0)), InvalidInput);
}

TEST(SnapshotCache, BackgroundRefresh) {
    auto repo = std::make_shared<FlakyRepository>();
    repo->data.add(snap("rice", "mumbai", 2500, date(2026, 3, 10)));
    SnapshotCache cache(repo);
    cache.refresh();

    repo->fail = true;
    cache.refreshEvery(std::chrono::milliseconds(5));
    EXPECT_TRUE(cache.refreshing());
    ASSERT_TRUE(eventually([&] { return (bool) cache.lastRefreshError(); }));
    EXPECT_EQ("market feed unavailable", *cache.lastRefreshError());
    // The failed refresh kept the previous generation
    EXPECT_EQ(1, cache.generation());

    repo->data.add(snap("wheat", "delhi", 2200, date(2026, 3, 10)));
    repo->fail = false;
    ASSERT_TRUE(eventually([&] { return cache.current()->size() == 2 and not cache.lastRefreshError(); }));
    EXPECT_GT(cache.generation(), 1);

    cache.stopRefreshing();
    EXPECT_FALSE(cache.refreshing());
    const int loads = repo->loads;
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(loads, repo->loads);
}

TEST(SnapshotCache, ConcurrentReaders) {
    auto repo = std::make_shared<MemoryRepository>();
    const auto t = date(2026, 3, 10);
    repo->add(snap("rice", "mumbai", 2500, t));
    repo->add(snap("rice", "delhi", 2400, t));
    SnapshotCache cache(repo);
    cache.refresh();

    std::atomic<bool> consistent{true};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; r++) {
        readers.emplace_back([&] {
            for (int i = 0; i < 500; i++) {
                auto set = cache.current();
                if (set->size() != 2 or set->forProduct("rice").size() != 2) consistent = false;
            }
        });
    }
    for (int i = 0; i < 50; i++) cache.refresh();
    for (auto &th : readers) th.join();

    EXPECT_TRUE(consistent);
    EXPECT_EQ(51, cache.generation());
}

TEST(SnapshotCache, ConcurrentRefresherControl) {
    auto repo = std::make_shared<MemoryRepository>();
    repo->add(snap("rice", "mumbai", 2500, date(2026, 3, 10)));
    SnapshotCache cache(repo);

    // Starting, stopping and querying the refresher from several threads at once must neither
    // replace a running thread nor race on it
    std::vector<std::thread> controllers;
    for (int c = 0; c < 8; c++) {
        controllers.emplace_back([&cache, c] {
            for (int i = 0; i < 25; i++) {
                if ((c + i) % 3 == 0) cache.stopRefreshing();
                else cache.refreshEvery(std::chrono::milliseconds(1 + (c + i) % 4));
                cache.refreshing();
            }
        });
    }
    for (auto &th : controllers) th.join();

    cache.refreshEvery(std::chrono::milliseconds(2));
    EXPECT_TRUE(cache.refreshing());
    ASSERT_TRUE(eventually([&] { return cache.generation() > 0; }));
    cache.stopRefreshing();
    EXPECT_FALSE(cache.refreshing());
    cache.stopRefreshing();
    EXPECT_FALSE(cache.refreshing());
}
