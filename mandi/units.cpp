#include <mandi/units.hpp>
#include <mandi/types.hpp>
#include <mandi/error.hpp>
#include <algorithm>

namespace mandi { namespace units {

const std::string default_unit = "quintal";

const std::vector<Unit>& all() {
    static const std::vector<Unit> units{
        {"quintal", 100.0, 1.0, {"q", "qtl", "quintals"}},
        {"kg", 1.0, 0.05, {"kilogram", "kilograms", "kgs"}},
        {"tonne", 1000.0, 10.0, {"ton", "tons", "tonnes", "mt", "metric ton"}},
        {"bag", 50.0, 0.5, {"bags", "bori"}},
        {"maund", 37.32, 0.5, {"man", "maunds"}},
        {"ser", 0.933, 0.01, {"seer"}},
        {"candy", 254.0, 5.0, {"kandi"}},
    };
    return units;
}

namespace {
const Unit* lookup(const std::string &name) {
    const std::string n = normalize(name);
    for (const auto &u : all()) {
        if (u.name == n or std::find(u.aliases.begin(), u.aliases.end(), n) != u.aliases.end())
            return &u;
    }
    return nullptr;
}
}

const Unit& find(const std::string &name) {
    const Unit *u = lookup(name);
    if (not u) throw InvalidInput("Unknown unit `" + name + "'");
    return *u;
}

bool known(const std::string &name) {
    return lookup(name) != nullptr;
}

const std::string& canonical(const std::string &name) {
    return find(name).name;
}

double convert_price(double price, const std::string &from, const std::string &to) {
    const Unit &f = find(from), &t = find(to);
    if (&f == &t) return price;
    return price * t.kilograms / f.kilograms;
}

double convert_quantity(double quantity, const std::string &from, const std::string &to) {
    const Unit &f = find(from), &t = find(to);
    if (&f == &t) return quantity;
    return quantity * f.kilograms / t.kilograms;
}

double price_increment(const std::string &unit) {
    return find(unit).price_increment;
}

} }
