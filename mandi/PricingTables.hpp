#pragma once
#include <mandi/types.hpp>
#include <array>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace mandi {

/** The fixed adjustment tables used by the pricing model: quality grade multipliers, stepped bulk
 * discounts, per-product seasonal (monthly) multipliers, per-location percentage differentials,
 * and the comparable-product substitution table.
 *
 * A default-constructed object has the standard grade multipliers (premium 1.30, standard 1.00,
 * low 0.70) and bulk steps (quantity >= 500: 0.95; >= 2000: 0.90), and empty seasonal, location
 * and substitution tables; absent entries mean "no adjustment".  All product and location keys
 * are compared case-insensitively.
 *
 * Tables can be loaded from INI files:
 *
 *     [grades]
 *     premium = 1.30
 *     low = 0.70
 *
 *     [bulk]
 *     500 = 0.95
 *     2000 = 0.90
 *
 *     [seasonal]
 *     rice = 1.05, 1.03, 1.00, 0.98, 0.95, 0.93, 0.95, 0.98, 1.02, 1.08, 1.12, 1.10
 *
 *     [location]
 *     mumbai = 0.10
 *     rural = -0.08
 *
 *     [substitutes]
 *     basmati = rice:1.6, wheat:1.2
 */
class PricingTables {
    public:
        /// One step of the bulk discount: quantities at or above `min_quantity` get `multiplier`.
        struct BulkStep {
            /// The smallest quantity this step applies to
            double min_quantity;
            /// The price multiplier applied at this step
            double multiplier;
        };

        /// A comparable product that can stand in for a product without market records.
        struct Substitute {
            /// The (normalized) name of the comparable product
            std::string product;
            /// Price ratio: the priced product is worth `ratio` times the comparable one
            double ratio;
        };

        /// The default grade multipliers
        static constexpr double default_premium_multiplier = 1.30,
                                default_standard_multiplier = 1.00,
                                default_low_multiplier = 0.70;

        /// Constructs the default tables.
        PricingTables();

        /// Returns the price multiplier for a quality grade.
        double gradeMultiplier(QualityGrade grade) const;

        /** Sets the price multiplier for a quality grade.
         *
         * \throws mandi::InvalidInput if `multiplier` is not strictly positive
         */
        void gradeMultiplier(QualityGrade grade, double multiplier);

        /** Returns the bulk multiplier for a quantity: the multiplier of the largest step whose
         * `min_quantity` is no more than `quantity`, or 1 if no step applies.
         */
        double bulkMultiplier(double quantity) const;

        /// Returns the bulk steps, sorted by increasing minimum quantity.
        const std::vector<BulkStep>& bulkSteps() const { return bulk_; }

        /** Replaces the bulk steps.
         *
         * \throws mandi::InvalidInput if a step has a non-positive quantity or multiplier
         */
        void bulkSteps(std::vector<BulkStep> steps);

        /** Returns the seasonal multiplier of a product for a calendar month (1-12), or 1 if the
         * product has no seasonal table.
         */
        double seasonal(const std::string &product, unsigned month) const;

        /// Returns true if the product has a seasonal table.
        bool hasSeasonal(const std::string &product) const;

        /** Sets the 12-month seasonal table of a product (January first).
         *
         * \throws mandi::InvalidInput if a multiplier is not strictly positive
         */
        void seasonal(const std::string &product, const std::array<double, 12> &multipliers);

        /** Returns the percentage differential of a location (e.g. 0.10 for 10% above the
         * reference markets), or 0 if the location is not in the table.
         */
        double locationOffset(const std::string &location) const;

        /** Sets the percentage differential of a location.
         *
         * \throws mandi::InvalidInput if `offset` is not greater than -1
         */
        void locationOffset(const std::string &location, double offset);

        /** Returns the comparable products for a product, in preference order; empty if none are
         * configured.
         */
        const std::vector<Substitute>& substitutes(const std::string &product) const;

        /** Appends a comparable product to a product's substitution list.
         *
         * \throws mandi::InvalidInput if `ratio` is not strictly positive or the product would
         * substitute for itself
         */
        void addSubstitute(const std::string &product, const std::string &substitute, double ratio = 1.0);

        /** Loads tables from an INI stream (see the class description for the format).  Sections
         * not present keep their defaults.
         *
         * \throws mandi::InvalidInput if the stream or any value is malformed
         */
        static PricingTables load(std::istream &in);

        /** Loads tables from the INI file at `path`.
         *
         * \throws mandi::InvalidInput if the file cannot be read or is malformed
         */
        static PricingTables fromFile(const std::string &path);

    private:
        std::array<double, 3> grades_;
        std::vector<BulkStep> bulk_;
        std::map<std::string, std::array<double, 12>> seasonal_;
        std::map<std::string, double> location_;
        std::map<std::string, std::vector<Substitute>> substitutes_;
};

}
