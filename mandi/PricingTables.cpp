#include <mandi/PricingTables.hpp>
#include <mandi/error.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <algorithm>
#include <fstream>
#include <istream>

namespace mandi {

namespace pt = boost::property_tree;

constexpr double PricingTables::default_premium_multiplier, PricingTables::default_standard_multiplier,
          PricingTables::default_low_multiplier;

PricingTables::PricingTables()
    : grades_{{default_premium_multiplier, default_standard_multiplier, default_low_multiplier}},
    bulk_{{500, 0.95}, {2000, 0.90}}
{}

double PricingTables::gradeMultiplier(QualityGrade grade) const {
    return grades_[static_cast<size_t>(grade)];
}

void PricingTables::gradeMultiplier(QualityGrade grade, double multiplier) {
    if (not (multiplier > 0)) throw InvalidInput("Grade multiplier for " + to_string(grade) + " must be positive");
    grades_[static_cast<size_t>(grade)] = multiplier;
}

double PricingTables::bulkMultiplier(double quantity) const {
    double m = 1.0;
    for (const auto &step : bulk_) {
        if (quantity >= step.min_quantity) m = step.multiplier;
        else break;
    }
    return m;
}

void PricingTables::bulkSteps(std::vector<BulkStep> steps) {
    for (const auto &s : steps) {
        if (not (s.min_quantity > 0) or not (s.multiplier > 0))
            throw InvalidInput("Bulk steps require positive quantities and multipliers");
    }
    std::sort(steps.begin(), steps.end(), [](const BulkStep &a, const BulkStep &b) { return a.min_quantity < b.min_quantity; });
    bulk_ = std::move(steps);
}

double PricingTables::seasonal(const std::string &product, unsigned month) const {
    if (month < 1 or month > 12) throw InvalidInput("Invalid month " + std::to_string(month));
    auto found = seasonal_.find(normalize(product));
    if (found == seasonal_.end()) return 1.0;
    return found->second[month - 1];
}

bool PricingTables::hasSeasonal(const std::string &product) const {
    return seasonal_.count(normalize(product)) > 0;
}

void PricingTables::seasonal(const std::string &product, const std::array<double, 12> &multipliers) {
    for (double m : multipliers) {
        if (not (m > 0)) throw InvalidInput("Seasonal multipliers for `" + product + "' must be positive");
    }
    seasonal_[normalize(product)] = multipliers;
}

double PricingTables::locationOffset(const std::string &location) const {
    auto found = location_.find(normalize(location));
    return found == location_.end() ? 0.0 : found->second;
}

void PricingTables::locationOffset(const std::string &location, double offset) {
    if (not (offset > -1)) throw InvalidInput("Location differential for `" + location + "' must be greater than -100%");
    location_[normalize(location)] = offset;
}

const std::vector<PricingTables::Substitute>& PricingTables::substitutes(const std::string &product) const {
    static const std::vector<Substitute> none;
    auto found = substitutes_.find(normalize(product));
    return found == substitutes_.end() ? none : found->second;
}

void PricingTables::addSubstitute(const std::string &product, const std::string &substitute, double ratio) {
    if (not (ratio > 0)) throw InvalidInput("Substitution ratio for `" + product + "' must be positive");
    std::string p = normalize(product), s = normalize(substitute);
    if (p == s) throw InvalidInput("Product `" + product + "' cannot substitute for itself");
    substitutes_[p].push_back({s, ratio});
}

namespace {
double parse_double(const std::string &text, const std::string &what) {
    try {
        return boost::lexical_cast<double>(normalize(text));
    }
    catch (const boost::bad_lexical_cast&) {
        throw InvalidInput("Invalid number `" + text + "' for " + what);
    }
}
}

PricingTables PricingTables::load(std::istream &in) {
    pt::ptree tree;
    try {
        pt::ini_parser::read_ini(in, tree);
    }
    catch (const pt::ini_parser_error &e) {
        throw InvalidInput(std::string("Invalid pricing tables file: ") + e.what());
    }

    PricingTables t;

    if (auto grades = tree.get_child_optional("grades")) {
        for (const auto &g : *grades)
            t.gradeMultiplier(parse_grade(g.first), parse_double(g.second.data(), "grade " + g.first));
    }

    if (auto bulk = tree.get_child_optional("bulk")) {
        std::vector<BulkStep> steps;
        for (const auto &b : *bulk)
            steps.push_back({parse_double(b.first, "bulk quantity"), parse_double(b.second.data(), "bulk step " + b.first)});
        t.bulkSteps(std::move(steps));
    }

    if (auto seasonal = tree.get_child_optional("seasonal")) {
        for (const auto &s : *seasonal) {
            std::vector<std::string> fields;
            boost::algorithm::split(fields, s.second.data(), boost::algorithm::is_any_of(","));
            if (fields.size() != 12)
                throw InvalidInput("Seasonal table for `" + s.first + "' needs 12 monthly values, found " + std::to_string(fields.size()));
            std::array<double, 12> months;
            for (size_t i = 0; i < 12; i++) months[i] = parse_double(fields[i], "seasonal " + s.first);
            t.seasonal(s.first, months);
        }
    }

    if (auto location = tree.get_child_optional("location")) {
        for (const auto &l : *location)
            t.locationOffset(l.first, parse_double(l.second.data(), "location " + l.first));
    }

    if (auto subs = tree.get_child_optional("substitutes")) {
        for (const auto &s : *subs) {
            std::vector<std::string> entries;
            boost::algorithm::split(entries, s.second.data(), boost::algorithm::is_any_of(","));
            for (const auto &entry : entries) {
                if (normalize(entry).empty()) continue;
                auto colon = entry.find(':');
                if (colon == std::string::npos)
                    t.addSubstitute(s.first, entry);
                else
                    t.addSubstitute(s.first, entry.substr(0, colon), parse_double(entry.substr(colon + 1), "substitute ratio for " + s.first));
            }
        }
    }

    return t;
}

PricingTables PricingTables::fromFile(const std::string &path) {
    std::ifstream in(path);
    if (not in) throw InvalidInput("Unable to read pricing tables file `" + path + "'");
    return load(in);
}

}
