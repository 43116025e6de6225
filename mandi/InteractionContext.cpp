#include <mandi/InteractionContext.hpp>
#include <algorithm>

namespace mandi {

double VulnerabilityProfile::score() const {
    double s = 0;
    switch (literacy) {
        case Literacy::low:          s += 0.8 * 0.4; break;
        case Literacy::basic:        s += 0.6 * 0.4; break;
        case Literacy::intermediate: s += 0.4 * 0.4; break;
        case Literacy::high:         s += 0.2 * 0.4; break;
    }
    switch (experience) {
        case Experience::newcomer:     s += 0.7 * 0.3; break;
        case Experience::beginner:     s += 0.5 * 0.3; break;
        case Experience::intermediate: s += 0.3 * 0.3; break;
        case Experience::experienced:  s += 0.1 * 0.3; break;
    }
    if (language_proficiency < 0.5) s += 0.3;
    else if (language_proficiency < 0.7) s += 0.2;
    else if (language_proficiency < 0.9) s += 0.1;

    if (completed_trades < 5) s += 0.1;

    return std::min(1.0, s);
}

}
