#pragma once
#include <mandi/types.hpp>
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace mandi {

class EthicsGuard;
class FlagSet;

/** An ethical-risk flag attached to a fairness assessment.  Flags can only be created by the
 * EthicsGuard; everyone else can read them.
 */
class EthicsFlag {
    public:
        /// The kinds of risk that can be flagged.
        enum class Kind {
            /// The price deviates from the fair price far enough to be exploitative
            predatory_pricing,
            /// A vulnerable counterpart is being offered unfavorable terms
            vulnerable_user_exposure,
            /// The offer history shows a pattern suggesting manipulation
            market_manipulation_suspected
        };

        /// The kind of risk
        Kind kind() const { return kind_; }
        /// How serious the risk is
        Severity severity() const { return severity_; }
        /// A plain-language explanation of why the flag was raised
        const std::string& rationale() const { return rationale_; }

    private:
        EthicsFlag(Kind kind, Severity severity, std::string rationale);

        Kind kind_;
        Severity severity_;
        std::string rationale_;

        friend class EthicsGuard;
        friend class FlagSet;
};

/// Returns the name of a flag kind, e.g. "PredatoryPricing".
std::string to_string(EthicsFlag::Kind kind);

/** The set of flags on an assessment.  It holds at most one flag of each kind, iterated in kind
 * order.  Adding a flag of a kind already present keeps the more severe of the two severities and
 * appends the new rationale.
 */
class FlagSet {
    public:
        /// Adds or merges a flag.
        void add(const EthicsFlag &flag);

        /// Returns true if a flag of the given kind is present.
        bool contains(EthicsFlag::Kind kind) const;

        /// Returns the flag of the given kind, if present.
        boost::optional<EthicsFlag> get(EthicsFlag::Kind kind) const;

        /// Returns the highest severity in the set, or an empty optional if the set is empty.
        boost::optional<Severity> maxSeverity() const;

        /// The number of flags.
        size_t size() const { return flags_.size(); }
        /// Returns true if there are no flags.
        bool empty() const { return flags_.empty(); }

        /// Iterator access to the flags, in kind order.
        std::vector<EthicsFlag>::const_iterator begin() const { return flags_.begin(); }
        /// End iterator.
        std::vector<EthicsFlag>::const_iterator end() const { return flags_.end(); }

    private:
        std::vector<EthicsFlag> flags_;
};

}
