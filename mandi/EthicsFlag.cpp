#include <mandi/EthicsFlag.hpp>
#include <algorithm>

namespace mandi {

EthicsFlag::EthicsFlag(Kind kind, Severity severity, std::string rationale)
    : kind_{kind}, severity_{severity}, rationale_(std::move(rationale))
{}

std::string to_string(EthicsFlag::Kind kind) {
    switch (kind) {
        case EthicsFlag::Kind::predatory_pricing: return "PredatoryPricing";
        case EthicsFlag::Kind::vulnerable_user_exposure: return "VulnerableUserExposure";
        case EthicsFlag::Kind::market_manipulation_suspected: return "MarketManipulationSuspected";
    }
    return "";
}

void FlagSet::add(const EthicsFlag &flag) {
    auto it = std::lower_bound(flags_.begin(), flags_.end(), flag.kind(),
            [](const EthicsFlag &f, EthicsFlag::Kind k) { return f.kind() < k; });
    if (it != flags_.end() and it->kind() == flag.kind()) {
        it->severity_ = std::max(it->severity_, flag.severity_);
        if (it->rationale_.find(flag.rationale_) == std::string::npos)
            it->rationale_ += "; " + flag.rationale_;
    }
    else {
        flags_.insert(it, flag);
    }
}

bool FlagSet::contains(EthicsFlag::Kind kind) const {
    return std::any_of(flags_.begin(), flags_.end(), [kind](const EthicsFlag &f) { return f.kind() == kind; });
}

boost::optional<EthicsFlag> FlagSet::get(EthicsFlag::Kind kind) const {
    for (const auto &f : flags_) {
        if (f.kind() == kind) return f;
    }
    return boost::none;
}

boost::optional<Severity> FlagSet::maxSeverity() const {
    boost::optional<Severity> max;
    for (const auto &f : flags_) {
        if (not max or f.severity() > *max) max = f.severity();
    }
    return max;
}

}
