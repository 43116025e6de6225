#include <mandi/PricingModel.hpp>
#include <mandi/time.hpp>
#include <mandi/units.hpp>
#include <mandi/error.hpp>
#include <mandi/debug.hpp>
#include <boost/format.hpp>
#include <cmath>
#include <tuple>

namespace mandi {

PricingModel::PricingModel(PricingTables tables, Config config)
    : tables_(std::move(tables)), confidence_(std::move(config))
{}

const MarketSnapshot* PricingModel::nearest(const std::vector<MarketSnapshot> &candidates, const std::string &location, timestamp date) const {
    const std::string loc = normalize(location);
    const MarketSnapshot *best = nullptr;
    // Sort key: (time gap, other location?, data quality rank, location name); smaller is better
    std::tuple<double, bool, int, std::string> best_key;
    for (const auto &s : candidates) {
        std::string s_loc = normalize(s.location());
        auto key = std::make_tuple(std::fabs(days_between(s.recordedAt(), date)), s_loc != loc,
                static_cast<int>(s.dataQuality()), s_loc);
        if (not best or key < best_key) {
            best = &s;
            best_key = std::move(key);
        }
    }
    return best;
}

PricingModel::Match PricingModel::match(const SnapshotSet &snapshots, const std::string &product, const std::string &location, timestamp date) const {
    const std::string loc = normalize(location);
    const auto &own = snapshots.forProduct(product);

    // Tier 1: same product and location, within the date window
    const MarketSnapshot *exact = nullptr;
    double exact_gap = 0;
    for (const auto &s : own) {
        if (normalize(s.location()) != loc) continue;
        double gap = std::fabs(days_between(s.recordedAt(), date));
        if (gap > config().date_window_days) continue;
        // own is in time order, so on equal gaps the later snapshot replaces the earlier one
        if (not exact or gap <= exact_gap) {
            exact = &s;
            exact_gap = gap;
        }
    }

    auto make = [](const MarketSnapshot &s, MatchTier tier, DataQuality quality, double ratio) {
        Basis b;
        b.tier = tier;
        b.product = s.product();
        b.location = s.location();
        b.recorded_at = s.recordedAt();
        b.ratio = ratio;
        b.quality_grade = s.qualityGrade();
        b.data_quality = quality;
        b.modal_price = s.modalPrice() * ratio;
        return Match{s.withDataQuality(quality), b};
    };

    if (exact) return make(*exact, MatchTier::exact, exact->dataQuality(), 1.0);

    // Tier 2: same product anywhere, any date
    if (auto other = nearest(own, location, date)) {
        MANDI_DBG("no exact match for " << product << " at " << location << "; using " << other->location() << " on " << iso_date(other->recordedAt()));
        return make(*other, MatchTier::other_market, downgrade(other->dataQuality()), 1.0);
    }

    // Tier 3: comparable products
    for (const auto &sub : tables_.substitutes(product)) {
        if (auto s = nearest(snapshots.forProduct(sub.product), location, date)) {
            MANDI_DBG("no record of " << product << "; substituting " << sub.product << " at ratio " << sub.ratio);
            return make(*s, MatchTier::substitute, downgrade(downgrade(s->dataQuality())), sub.ratio);
        }
    }

    MANDI_DBG("no comparable data for " << product);
    throw NoComparableData(product);
}

PriceEstimate PricingModel::estimate(const SnapshotSet &snapshots, const EstimateQuery &query) const {
    query.validate();
    const timestamp when = query.date ? *query.date : std::chrono::system_clock::now();

    Match m = match(snapshots, query.product, query.location, when);
    const MarketSnapshot &snap = m.snapshot;

    PriceEstimate e;
    e.product = query.product;
    e.location = query.location;
    e.unit = units::canonical(query.unit);
    e.quality_grade = query.quality_grade;
    e.quantity = query.quantity;
    e.date = when;
    e.basis = m.basis;
    e.basis.modal_price = units::convert_price(m.basis.modal_price, snap.unit(), e.unit);

    // Substitutes use their own seasonal pattern when the requested product has none
    const unsigned month = month_of(when);
    const double seasonal = tables_.hasSeasonal(query.product)
        ? tables_.seasonal(query.product, month)
        : tables_.seasonal(snap.product(), month);
    const double quality = tables_.gradeMultiplier(query.quality_grade) / tables_.gradeMultiplier(snap.qualityGrade());
    const double bulk = tables_.bulkMultiplier(units::convert_quantity(query.quantity, e.unit, units::default_unit));
    const double location = (1.0 + tables_.locationOffset(query.location)) / (1.0 + tables_.locationOffset(snap.location()));

    auto record = [&e](FactorKind kind, double multiplier, std::string detail) {
        if (std::fabs(multiplier - 1.0) <= 1e-12) return;
        e.factors.push_back({kind, multiplier > 1 ? Direction::increase : Direction::decrease,
                std::fabs(multiplier - 1.0), multiplier, std::move(detail)});
    };
    record(FactorKind::seasonal, seasonal, month_name(month));
    record(FactorKind::quality, quality, to_string(query.quality_grade));
    record(FactorKind::quantity, bulk, (boost::format("%g %s") % query.quantity % e.unit).str());
    record(FactorKind::location, location, query.location);

    e.point_price = e.basis.modal_price * seasonal * quality * bulk * location;

    const auto vol = confidence_.volatility(snap);
    e.trend = confidence_.trend(snap);
    const auto bounds = confidence_.bound(e.point_price, snap, vol, e.trend.volatility_rising, when);
    e.lower_bound = bounds.lower;
    e.upper_bound = bounds.upper;
    e.confidence = bounds.confidence;
    e.volatility = vol.value;
    e.volatility_computed = vol.computed;
    e.staleness = bounds.staleness;

    MANDI_DBG(query.product << " at " << query.location << ": " << e.point_price << " [" << e.lower_bound << ", "
            << e.upper_bound << "] confidence " << e.confidence);
    return e;
}

}
