#pragma once
#include <mandi/types.hpp>
#include <iosfwd>
#include <string>

namespace mandi {

/// How the age of a market record is turned into a normalized staleness value in `[0,1]`.
enum class StalenessDecay {
    /// `min(1, age/horizon)`
    linear,
    /// `1 - exp(-age/horizon)`
    exponential
};

/** Tunable constants of the pricing, confidence, fairness and ethics components.  Every value has
 * a `default_` constant; a default-constructed Config uses those.  Values can be overridden
 * directly or loaded from an INI file with load(), for example:
 *
 *     [confidence]
 *     volatility_weight = 1.5
 *     staleness_decay = exponential
 *
 *     [fairness]
 *     exploitative_threshold = 0.40
 *
 * Section and key names match the member names below; see load() for the full list.
 */
class Config {
    public:
        /// Constructs a configuration holding all default values.
        Config() = default;

        /// The default number of days either side of the query date that counts as an exact match
        static constexpr double default_date_window_days = 7.0;
        /// The default trailing window, in days before the record time, used for volatility and trend
        static constexpr double default_volatility_window_days = 30.0;
        /// The default minimum number of historical points needed to compute volatility
        static constexpr unsigned default_min_history_points = 3;
        /// The default (conservative, high) volatility used when history is too short
        static constexpr double default_fallback_volatility = 0.25;
        /// The default weight of volatility in the confidence formula
        static constexpr double default_volatility_weight = 1.0;
        /// The default weight of staleness in the confidence formula
        static constexpr double default_staleness_weight = 0.3;
        /// The default age, in days, at which a record counts as fully stale (linear decay)
        static constexpr double default_staleness_horizon_days = 30.0;
        /// The default confidence penalties for high, medium and low data quality
        static constexpr double default_quality_penalty_high = 0.0,
                                default_quality_penalty_medium = 0.1,
                                default_quality_penalty_low = 0.25;
        /// The default extra fraction added to the upper half-width when volatility is rising
        static constexpr double default_rising_widening = 0.25;
        /// The default minimum number of historical points needed to estimate a trend
        static constexpr unsigned default_min_trend_points = 4;
        /// The default relative slope (per day) beyond which prices count as rising or falling
        static constexpr double default_trend_threshold = 0.002;
        /// The default confidence below which an estimate is flagged as degraded
        static constexpr double default_low_confidence_threshold = 0.3;
        /// The default largest deviation magnitude that is still fair
        static constexpr double default_fair_threshold = 0.05;
        /// The default largest deviation magnitude that is only mildly (directionally) off
        static constexpr double default_directional_threshold = 0.15;
        /// The default deviation magnitude beyond which an offer is exploitative
        static constexpr double default_exploitative_threshold = 0.35;
        /// The default deviation magnitude beyond which predatory pricing is critical
        static constexpr double default_critical_threshold = 0.70;
        /// The default deviation at which the fairness score reaches 0
        static constexpr double default_max_deviation = 0.35;
        /// The default number of consecutive unfavorable offers that suggests manipulation
        static constexpr unsigned default_manipulation_run = 3;
        /// The default window, in hours, of offer history considered by the ethics guard
        static constexpr double default_history_window_hours = 24.0;
        /// The default cumulative price move over three offers that counts as a squeeze
        static constexpr double default_squeeze_threshold = 0.15;
        /// The default vulnerability score at or above which a counterpart is vulnerable
        static constexpr double default_vulnerability_threshold = 0.6;

        /// Lowest confidence ever reported
        static constexpr double confidence_floor = 0.05;
        /// Highest confidence ever reported
        static constexpr double confidence_ceiling = 0.99;

        // [pricing]
        /// Days either side of the query date within which a same-location record is an exact match
        double date_window_days = default_date_window_days;

        // [confidence]
        /// Trailing window, in days, of history used for volatility and trend
        double volatility_window_days = default_volatility_window_days;
        /// Minimum number of history points needed for a computed volatility
        unsigned min_history_points = default_min_history_points;
        /// Volatility used when history is too short
        double fallback_volatility = default_fallback_volatility;
        /// Weight of volatility in the confidence formula
        double volatility_weight = default_volatility_weight;
        /// Weight of staleness in the confidence formula
        double staleness_weight = default_staleness_weight;
        /// Staleness horizon, in days
        double staleness_horizon_days = default_staleness_horizon_days;
        /// Staleness decay function
        StalenessDecay staleness_decay = StalenessDecay::linear;
        /// Confidence penalty for high quality data
        double quality_penalty_high = default_quality_penalty_high;
        /// Confidence penalty for medium quality data
        double quality_penalty_medium = default_quality_penalty_medium;
        /// Confidence penalty for low quality data
        double quality_penalty_low = default_quality_penalty_low;
        /// Extra upper half-width fraction when volatility is rising
        double rising_widening = default_rising_widening;
        /// Minimum number of history points needed for a trend
        unsigned min_trend_points = default_min_trend_points;
        /// Relative daily slope beyond which prices are rising or falling
        double trend_threshold = default_trend_threshold;
        /// Confidence below which an estimate is degraded
        double low_confidence_threshold = default_low_confidence_threshold;

        // [fairness]
        /// Largest fair deviation magnitude
        double fair_threshold = default_fair_threshold;
        /// Largest directional (favorable/unfavorable) deviation magnitude
        double directional_threshold = default_directional_threshold;
        /// Deviation magnitude beyond which an offer is exploitative
        double exploitative_threshold = default_exploitative_threshold;
        /// Deviation magnitude beyond which predatory pricing is critical
        double critical_threshold = default_critical_threshold;
        /// Deviation tolerance at which the fairness score reaches 0
        double max_deviation = default_max_deviation;

        // [ethics]
        /// Number of consecutive unfavorable offers that flags manipulation
        unsigned manipulation_run = default_manipulation_run;
        /// Offer history window, in hours
        double history_window_hours = default_history_window_hours;
        /// Cumulative move over three offers that flags a squeeze
        double squeeze_threshold = default_squeeze_threshold;
        /// Vulnerability score threshold
        double vulnerability_threshold = default_vulnerability_threshold;

        /** Returns the confidence penalty for the given data quality tier. */
        double qualityPenalty(DataQuality quality) const;

        /** Checks that the values are usable: weights and penalties non-negative, windows and
         * horizons positive, and `fair_threshold < directional_threshold <=
         * exploitative_threshold <= critical_threshold`, with `max_deviation` positive.
         *
         * \throws mandi::InvalidInput describing the first problem found
         */
        void validate() const;

        /** Loads a configuration from an INI stream.  Values not present keep their defaults;
         * unknown keys are ignored.  Recognized keys:
         * - `[pricing]` date_window_days
         * - `[confidence]` volatility_window_days, min_history_points, fallback_volatility,
         *   volatility_weight, staleness_weight, staleness_horizon_days, staleness_decay
         *   (`linear` or `exponential`), quality_penalty_high, quality_penalty_medium,
         *   quality_penalty_low, rising_widening, min_trend_points, trend_threshold,
         *   low_confidence_threshold
         * - `[fairness]` fair_threshold, directional_threshold, exploitative_threshold,
         *   critical_threshold, max_deviation
         * - `[ethics]` manipulation_run, history_window_hours, squeeze_threshold,
         *   vulnerability_threshold
         *
         * The loaded configuration is validated before being returned.
         *
         * \throws mandi::InvalidInput if the stream is not valid INI, a value cannot be parsed,
         * or the result fails validate()
         */
        static Config load(std::istream &in);

        /** Loads a configuration from the INI file at `path`.
         *
         * \throws mandi::InvalidInput if the file cannot be read or its content is invalid
         */
        static Config fromFile(const std::string &path);
};

}
