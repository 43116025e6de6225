#include <mandi/EthicsGuard.hpp>
#include <mandi/time.hpp>
#include <mandi/debug.hpp>
#include <boost/format.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace mandi {

using boost::format;

namespace {
// Raises a verdict to at least `to`
void raise(Verdict &v, Verdict to) {
    if (to > v) v = to;
}
}

EthicsGuard::EthicsGuard(Config config) : config_(std::move(config)) {
    config_.validate();
}

boost::optional<EthicsFlag> EthicsGuard::predatoryPricing(double deviation) const {
    const double d = std::fabs(deviation);
    if (not (d > config_.exploitative_threshold)) return boost::none;
    const Severity severity = d > config_.critical_threshold ? Severity::critical : Severity::high;
    MANDI_DBG("predatory pricing at deviation " << deviation << ", severity " << to_string(severity));
    return EthicsFlag(EthicsFlag::Kind::predatory_pricing, severity,
            (format("Offer price is more than %.0f%% away from the fair market price") % (100 * config_.exploitative_threshold)).str());
}

bool EthicsGuard::vulnerable(const InteractionContext &context) const {
    return context.counterpart_vulnerable
        or (context.profile and context.profile->score() >= config_.vulnerability_threshold);
}

std::vector<Offer> EthicsGuard::relevantHistory(const Offer &offer, const InteractionContext &context) const {
    const timestamp now = context.now ? *context.now
        : offer.submitted_at ? *offer.submitted_at
        : std::chrono::system_clock::now();
    const double hours = context.history_window_hours ? *context.history_window_hours : config_.history_window_hours;
    const timestamp from = add_days(now, -hours / 24.0);
    const std::string product = normalize(offer.product);

    std::vector<Offer> history;
    for (const auto &o : context.recent_history) {
        if (o.role != offer.role or normalize(o.product) != product) continue;
        if (o.submitted_at and (*o.submitted_at < from or *o.submitted_at > now)) continue;
        history.push_back(o);
    }
    std::stable_sort(history.begin(), history.end(), [](const Offer &a, const Offer &b) {
        if (not a.submitted_at or not b.submitted_at) return not a.submitted_at and b.submitted_at;
        return *a.submitted_at < *b.submitted_at;
    });
    return history;
}

void EthicsGuard::manipulation(FairnessAssessment &a, const std::vector<Offer> &history) const {
    if (not (a.deviation_pct > config_.fair_threshold)) return;

    unsigned run = 1;
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (role_deviation(*it, a.reference_price, a.unit) > config_.fair_threshold) run++;
        else break;
    }
    if (run < config_.manipulation_run) return;

    const Severity severity = run >= 2 * config_.manipulation_run ? Severity::high : Severity::medium;
    MANDI_DBG("manipulation run of " << run << " offers");
    a.risk_flags.add(EthicsFlag(EthicsFlag::Kind::market_manipulation_suspected, severity,
                (format("%d consecutive %s offers for %s were unfavorable to the %s")
                 % run % to_string(a.offer.role) % a.offer.product % to_string(counterpart(a.offer.role))).str()));
}

void EthicsGuard::squeeze(FairnessAssessment &a, const std::vector<Offer> &history) const {
    if (history.size() < 2) return;
    const double p1 = history[history.size() - 2].priceIn(a.unit),
                 p2 = history.back().priceIn(a.unit),
                 p3 = a.offer.priceIn(a.unit);

    double move;
    if (a.offer.role == Role::buyer) {
        if (not (p1 > p2 and p2 > p3)) return;
        move = (p1 - p3) / p1;
    }
    else {
        if (not (p1 < p2 and p2 < p3)) return;
        move = (p3 - p1) / p1;
    }
    if (not (move > config_.squeeze_threshold)) return;

    MANDI_DBG("squeeze: " << p1 << " -> " << p2 << " -> " << p3);
    a.risk_flags.add(EthicsFlag(EthicsFlag::Kind::predatory_pricing, Severity::medium,
                (format("Prices offered by the %s have moved steadily against the %s over the last three offers")
                 % to_string(a.offer.role) % to_string(counterpart(a.offer.role))).str()));
}

void EthicsGuard::exposure(FairnessAssessment &a, const InteractionContext &context) const {
    if (not vulnerable(context) or not (a.deviation_pct > config_.fair_threshold)) return;

    a.risk_flags.add(EthicsFlag(EthicsFlag::Kind::vulnerable_user_exposure, Severity::high,
                (format("The %s may be vulnerable and this offer is below fair terms for them")
                 % to_string(counterpart(a.offer.role))).str()));
    raise(a.verdict, Verdict::unfavorable);
}

FairnessAssessment EthicsGuard::guard(FairnessAssessment a, const InteractionContext &context) const {
    const auto history = relevantHistory(a.offer, context);

    if (auto flag = predatoryPricing(a.deviation_pct)) {
        a.risk_flags.add(*flag);
        raise(a.verdict, Verdict::exploitative);
    }
    manipulation(a, history);
    squeeze(a, history);
    exposure(a, context);

    auto max = a.risk_flags.maxSeverity();
    if (max and *max == Severity::critical) {
        MANDI_DBG("critical flag; suppressing counter-offer");
        a.counter_offer = boost::none;
        a.recommendation_suppressed = true;
    }
    return a;
}

}
