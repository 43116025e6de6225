#pragma once
#include <mandi/types.hpp>
#include <string>
#include <vector>

namespace mandi {

/// One observation of a historical price series.
struct PricePoint {
    /// When the price was observed
    timestamp recorded_at;
    /// The modal price observed
    double modal_price;
};

/** An immutable market record for one product at one location on one date, as delivered by the
 * market snapshot repository: the minimum, maximum and modal prices, the unit they are quoted
 * in, the grade of the lot, the arrival volume, when it was recorded, and a data quality tag.
 *
 * Each snapshot also carries the trailing historical series of modal prices for its product and
 * market, which is what volatility and trend are computed from.  The series is kept sorted by
 * time.
 *
 * Snapshots are values: copying is cheap enough for the pricing model to hold on to the one it
 * matched, and withDataQuality() produces the downgraded copies used by fallback matching.
 */
class MarketSnapshot {
    public:
        /** Constructs a snapshot.
         *
         * \throws mandi::InvalidInput unless `0 < min_price <= modal_price <= max_price`, all
         * prices are finite, `arrival_volume >= 0`, the product is non-empty, the unit is a known
         * unit, and every history price is finite and strictly positive.
         */
        MarketSnapshot(
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
                std::vector<PricePoint> history = {});

        /// The product name (as given; compare with mandi::normalize)
        const std::string& product() const { return product_; }
        /// The market location name
        const std::string& location() const { return location_; }
        /// The lowest recorded price
        double minPrice() const { return min_; }
        /// The highest recorded price
        double maxPrice() const { return max_; }
        /// The modal (most frequent) recorded price; the pricing baseline
        double modalPrice() const { return modal_; }
        /// The canonical name of the unit the prices are quoted per
        const std::string& unit() const { return unit_; }
        /// The grade of the lot the prices were recorded for
        QualityGrade qualityGrade() const { return grade_; }
        /// The arrival volume at the market, in units
        double arrivalVolume() const { return arrivals_; }
        /// When the record was made
        timestamp recordedAt() const { return recorded_at_; }
        /// The data quality tag
        DataQuality dataQuality() const { return quality_; }
        /// The trailing historical series of modal prices, oldest first
        const std::vector<PricePoint>& history() const { return history_; }

        /** Returns the history points recorded within `days` days before (and including) this
         * snapshot's recording time, oldest first.
         */
        std::vector<PricePoint> trailingHistory(double days) const;

        /// Returns a copy of this snapshot with a different data quality tag.
        MarketSnapshot withDataQuality(DataQuality quality) const;

    private:
        std::string product_, location_;
        double min_, max_, modal_;
        std::string unit_;
        QualityGrade grade_;
        double arrivals_;
        timestamp recorded_at_;
        DataQuality quality_;
        std::vector<PricePoint> history_;
};

}
