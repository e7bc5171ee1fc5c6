#ifndef SCOREKEEP_OUTCOME_HPP
#define SCOREKEEP_OUTCOME_HPP

#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "BaserunnerState.hpp"
#include "BattingResult.hpp"

namespace scorekeep::core
{
    struct SituationalParameters
    {
        Aggressiveness aggressiveness{Aggressiveness::Standard};
        bool error_occurred{false};
        bool running_error_occurred{false};

        friend auto operator==(SituationalParameters const&, SituationalParameters const&) -> bool = default;
    };

    // One permitted result of a plate appearance.
    struct AdvancementOutcome
    {
        BaserunnerState after{};
        // runner from first, second, third, then the batter
        std::vector<PlayerId> runs_scored{};
        uint8_t rbis{};
        uint8_t outs{};
        // retired on the bases by a running error; each counts in outs
        std::vector<PlayerId> running_errors{};
        std::string description{};
        // what the caller must have declared for this outcome to apply
        SituationalParameters needs{};

        // Caller's parameters admit this outcome.
        [[nodiscard]] auto IsAllowedUnder(SituationalParameters const& p) const noexcept -> bool
        {
            if (needs.aggressiveness != Aggressiveness::Standard && needs.aggressiveness != p.aggressiveness)
                return false;
            if (needs.error_occurred && !p.error_occurred) return false;
            if (needs.running_error_occurred && !p.running_error_occurred) return false;
            return true;
        }

        // Same play on the field, ignoring description and requirements.
        [[nodiscard]] auto SamePlay(AdvancementOutcome const& o) const -> bool
        {
            return after == o.after && runs_scored == o.runs_scored && rbis == o.rbis && outs == o.outs;
        }
    };

    // Key into the list of plays allowed to score runs without RBI credit.
    // An empty kind matches every result; an empty flag matches either error state.
    struct NoRbiException
    {
        std::optional<ResultKind> kind{};
        std::optional<bool> error_occurred{};

        [[nodiscard]] auto Matches(ResultKind k, bool err) const noexcept -> bool
        {
            return (!kind || *kind == k) && (!error_occurred || *error_occurred == err);
        }
    };

    inline auto DefaultNoRbiExceptions() -> std::vector<NoRbiException>
    {
        return {
            {ResultKind::GroundOut, std::nullopt},
            {ResultKind::DoublePlay, std::nullopt},
            {ResultKind::ReachedOnError, std::nullopt},
            {std::nullopt, true},
        };
    }

    // Which toggleable rules run. Passed into every engine call.
    struct RuleConfiguration
    {
        bool error_attribution{true};
        bool running_error_variations{true};
        bool strict_outcome_matching{false};
        std::vector<NoRbiException> no_rbi_exceptions{DefaultNoRbiExceptions()};

        [[nodiscard]] auto AllowsRunsWithoutRbi(ResultKind k, bool error_occurred) const noexcept -> bool
        {
            for (NoRbiException const& e : no_rbi_exceptions)
            {
                if (e.Matches(k, error_occurred)) return true;
            }
            return false;
        }
    };

    // Input to enumeration.
    struct PlayContext
    {
        BaserunnerState before{};
        BattingResult result{ResultKind::Single};
        PlayerId batter{};
        SituationalParameters parameters{};
    };

    // A caller-proposed transition to validate.
    struct ProposedPlay
    {
        PlayContext context{};
        BaserunnerState after{};
        std::vector<PlayerId> runs_scored{};
        int rbis{};
        // players retired on the bases by a running error
        std::vector<PlayerId> running_errors{};
        uint8_t outs_before{};

        [[nodiscard]] auto OutsOnPlay() const noexcept -> size_t
        {
            return context.result.OutsRecorded() + running_errors.size();
        }
    };
}

#endif //SCOREKEEP_OUTCOME_HPP
