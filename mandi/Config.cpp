#include <mandi/Config.hpp>
#include <mandi/error.hpp>
#include <mandi/debug.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <fstream>
#include <istream>

namespace mandi {

namespace pt = boost::property_tree;

constexpr double Config::default_date_window_days, Config::default_volatility_window_days,
          Config::default_fallback_volatility, Config::default_volatility_weight,
          Config::default_staleness_weight, Config::default_staleness_horizon_days,
          Config::default_quality_penalty_high, Config::default_quality_penalty_medium,
          Config::default_quality_penalty_low, Config::default_rising_widening,
          Config::default_trend_threshold, Config::default_low_confidence_threshold,
          Config::default_fair_threshold, Config::default_directional_threshold,
          Config::default_exploitative_threshold, Config::default_critical_threshold,
          Config::default_max_deviation, Config::default_history_window_hours,
          Config::default_squeeze_threshold, Config::default_vulnerability_threshold,
          Config::confidence_floor, Config::confidence_ceiling;
constexpr unsigned Config::default_min_history_points, Config::default_min_trend_points,
          Config::default_manipulation_run;

double Config::qualityPenalty(DataQuality quality) const {
    switch (quality) {
        case DataQuality::high: return quality_penalty_high;
        case DataQuality::medium: return quality_penalty_medium;
        case DataQuality::low: return quality_penalty_low;
    }
    return quality_penalty_low;
}

#define MANDI_REQUIRE(cond, msg) if (not (cond)) throw InvalidInput(std::string("Invalid configuration: ") + msg)

void Config::validate() const {
    MANDI_REQUIRE(date_window_days >= 0, "date_window_days must be non-negative");
    MANDI_REQUIRE(volatility_window_days > 0, "volatility_window_days must be positive");
    MANDI_REQUIRE(min_history_points >= 2, "min_history_points must be at least 2");
    MANDI_REQUIRE(fallback_volatility >= 0, "fallback_volatility must be non-negative");
    MANDI_REQUIRE(volatility_weight >= 0, "volatility_weight must be non-negative");
    MANDI_REQUIRE(staleness_weight >= 0, "staleness_weight must be non-negative");
    MANDI_REQUIRE(staleness_horizon_days > 0, "staleness_horizon_days must be positive");
    MANDI_REQUIRE(quality_penalty_high >= 0 and quality_penalty_medium >= 0 and quality_penalty_low >= 0,
            "quality penalties must be non-negative");
    MANDI_REQUIRE(rising_widening >= 0, "rising_widening must be non-negative");
    MANDI_REQUIRE(min_trend_points >= 3, "min_trend_points must be at least 3");
    MANDI_REQUIRE(trend_threshold >= 0, "trend_threshold must be non-negative");
    MANDI_REQUIRE(low_confidence_threshold >= 0 and low_confidence_threshold <= 1, "low_confidence_threshold must be in [0,1]");
    MANDI_REQUIRE(fair_threshold > 0, "fair_threshold must be positive");
    MANDI_REQUIRE(fair_threshold < directional_threshold, "fair_threshold must be less than directional_threshold");
    MANDI_REQUIRE(directional_threshold <= exploitative_threshold, "directional_threshold must not exceed exploitative_threshold");
    MANDI_REQUIRE(exploitative_threshold <= critical_threshold, "exploitative_threshold must not exceed critical_threshold");
    MANDI_REQUIRE(max_deviation > 0, "max_deviation must be positive");
    MANDI_REQUIRE(manipulation_run >= 2, "manipulation_run must be at least 2");
    MANDI_REQUIRE(history_window_hours > 0, "history_window_hours must be positive");
    MANDI_REQUIRE(squeeze_threshold > 0, "squeeze_threshold must be positive");
    MANDI_REQUIRE(vulnerability_threshold > 0 and vulnerability_threshold <= 1, "vulnerability_threshold must be in (0,1]");
}

#undef MANDI_REQUIRE

Config Config::load(std::istream &in) {
    pt::ptree tree;
    try {
        pt::ini_parser::read_ini(in, tree);
    }
    catch (const pt::ini_parser_error &e) {
        throw InvalidInput(std::string("Invalid configuration file: ") + e.what());
    }

    Config c;
    try {
#define MANDI_CONFIG_LOAD(SECTION, FIELD) \
        if (auto node = tree.get_child_optional(#SECTION "." #FIELD)) c.FIELD = node->get_value<decltype(c.FIELD)>()

        MANDI_CONFIG_LOAD(pricing, date_window_days);

        MANDI_CONFIG_LOAD(confidence, volatility_window_days);
        MANDI_CONFIG_LOAD(confidence, min_history_points);
        MANDI_CONFIG_LOAD(confidence, fallback_volatility);
        MANDI_CONFIG_LOAD(confidence, volatility_weight);
        MANDI_CONFIG_LOAD(confidence, staleness_weight);
        MANDI_CONFIG_LOAD(confidence, staleness_horizon_days);
        MANDI_CONFIG_LOAD(confidence, quality_penalty_high);
        MANDI_CONFIG_LOAD(confidence, quality_penalty_medium);
        MANDI_CONFIG_LOAD(confidence, quality_penalty_low);
        MANDI_CONFIG_LOAD(confidence, rising_widening);
        MANDI_CONFIG_LOAD(confidence, min_trend_points);
        MANDI_CONFIG_LOAD(confidence, trend_threshold);
        MANDI_CONFIG_LOAD(confidence, low_confidence_threshold);

        MANDI_CONFIG_LOAD(fairness, fair_threshold);
        MANDI_CONFIG_LOAD(fairness, directional_threshold);
        MANDI_CONFIG_LOAD(fairness, exploitative_threshold);
        MANDI_CONFIG_LOAD(fairness, critical_threshold);
        MANDI_CONFIG_LOAD(fairness, max_deviation);

        MANDI_CONFIG_LOAD(ethics, manipulation_run);
        MANDI_CONFIG_LOAD(ethics, history_window_hours);
        MANDI_CONFIG_LOAD(ethics, squeeze_threshold);
        MANDI_CONFIG_LOAD(ethics, vulnerability_threshold);

#undef MANDI_CONFIG_LOAD

        if (auto decay = tree.get_optional<std::string>("confidence.staleness_decay")) {
            const std::string d = normalize(*decay);
            if (d == "linear") c.staleness_decay = StalenessDecay::linear;
            else if (d == "exponential") c.staleness_decay = StalenessDecay::exponential;
            else throw InvalidInput("Invalid configuration: unknown staleness_decay `" + *decay + "'");
        }
    }
    catch (const pt::ptree_bad_data &e) {
        throw InvalidInput(std::string("Invalid configuration value: ") + e.what());
    }

    c.validate();
    MANDI_DBG("loaded configuration; exploitative_threshold=" << c.exploitative_threshold << ", max_deviation=" << c.max_deviation);
    return c;
}

Config Config::fromFile(const std::string &path) {
    std::ifstream in(path);
    if (not in) throw InvalidInput("Unable to read configuration file `" + path + "'");
    return load(in);
}

}
