#ifndef SCOREKEEP_SOFTBALLRULES_HPP
#define SCOREKEEP_SOFTBALLRULES_HPP

#include "Rules.hpp"

namespace scorekeep::core
{
    class SoftballRules final : public Rules
    {
    public:
        auto StandardOutcome(BaserunnerState const& before,
                             BattingResult result,
                             PlayerId const& batter,
                             RuleConfiguration const& cfg) const -> std::optional<AdvancementOutcome> override;

        auto ValidOutcomes(PlayContext const& ctx,
                           RuleConfiguration const& cfg) const -> std::vector<AdvancementOutcome> override;

        auto Validate(ProposedPlay const& play, RuleConfiguration const& cfg) const -> CheckResult override;

        // Every outcome for the shape and result regardless of parameters, standard first.
        // Each outcome's `needs` says which parameters unlock it.
        auto AllOutcomes(BaserunnerState const& before,
                         BattingResult result,
                         PlayerId const& batter,
                         RuleConfiguration const& cfg) const -> std::vector<AdvancementOutcome>;

        // Integrity, backward movement, passing, accounting, max outs, RBI bound. In that order.
        static auto CheckNonNegotiable(ProposedPlay const& play, RuleConfiguration const& cfg) -> CheckResult;

        // Error attribution, running errors, strict matching; each only when enabled.
        auto CheckConfigurable(ProposedPlay const& play, RuleConfiguration const& cfg) const -> CheckResult;
    };
}

#endif //SCOREKEEP_SOFTBALLRULES_HPP
