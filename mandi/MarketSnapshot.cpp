#include <mandi/MarketSnapshot.hpp>
#include <mandi/units.hpp>
#include <mandi/time.hpp>
#include <mandi/error.hpp>
#include <algorithm>
#include <cmath>

namespace mandi {

MarketSnapshot::MarketSnapshot(
        std::string product,
        std::string location,
        double min_price,
        double max_price,
        double modal_price,
        std::string unit,
        QualityGrade quality_grade,
        double arrival_volume,
        timestamp recorded_at,
        DataQuality data_quality,
        std::vector<PricePoint> history)
    : product_(std::move(product)), location_(std::move(location)),
    min_{min_price}, max_{max_price}, modal_{modal_price}, unit_(units::canonical(unit)),
    grade_{quality_grade}, arrivals_{arrival_volume}, recorded_at_{recorded_at}, quality_{data_quality},
    history_(std::move(history))
{
    if (normalize(product_).empty()) throw InvalidInput("Market snapshot requires a product");
    if (not (std::isfinite(min_) and std::isfinite(max_) and std::isfinite(modal_)))
        throw InvalidInput("Market snapshot for `" + product_ + "' has non-finite prices");
    if (not (min_ > 0 and min_ <= modal_ and modal_ <= max_))
        throw InvalidInput("Market snapshot for `" + product_ + "' requires 0 < min_price <= modal_price <= max_price");
    if (not (arrivals_ >= 0)) throw InvalidInput("Market snapshot for `" + product_ + "' has a negative arrival volume");
    for (const auto &p : history_) {
        if (not (std::isfinite(p.modal_price) and p.modal_price > 0))
            throw InvalidInput("Market snapshot for `" + product_ + "' has a non-positive historical price");
    }
    std::stable_sort(history_.begin(), history_.end(),
            [](const PricePoint &a, const PricePoint &b) { return a.recorded_at < b.recorded_at; });
}

std::vector<PricePoint> MarketSnapshot::trailingHistory(double days) const {
    const timestamp from = add_days(recorded_at_, -days);
    std::vector<PricePoint> window;
    for (const auto &p : history_) {
        if (p.recorded_at >= from and p.recorded_at <= recorded_at_)
            window.push_back(p);
    }
    return window;
}

MarketSnapshot MarketSnapshot::withDataQuality(DataQuality quality) const {
    MarketSnapshot copy(*this);
    copy.quality_ = quality;
    return copy;
}

}
