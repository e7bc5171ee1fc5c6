#ifndef SCOREKEEP_RULES_HPP
#define SCOREKEEP_RULES_HPP

#include <optional>
#include <vector>

#include "Outcome.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace scorekeep::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Canonical outcome for standard parameters; nullopt when the play cannot happen
        // from this base state (a fielder's choice with nobody on).
        virtual auto StandardOutcome(BaserunnerState const& before,
                                     BattingResult result,
                                     PlayerId const& batter,
                                     RuleConfiguration const& cfg) const -> std::optional<AdvancementOutcome> = 0;

        // Every outcome the rules permit under ctx.parameters. Pure; safe to call concurrently.
        virtual auto ValidOutcomes(PlayContext const& ctx,
                                   RuleConfiguration const& cfg) const -> std::vector<AdvancementOutcome> = 0;

        // Returns unexpected(reason) for rejected plays (NOT exceptions).
        // Non-negotiable checks always run first; toggleable checks follow cfg.
        virtual auto Validate(ProposedPlay const& play, RuleConfiguration const& cfg) const -> CheckResult = 0;
    };
}

#endif //SCOREKEEP_RULES_HPP
