#ifndef SCOREKEEP_ATBATRECORDER_HPP
#define SCOREKEEP_ATBATRECORDER_HPP

#include <expected>
#include <functional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "AtBat.hpp"
#include "Exception.hpp"
#include "Outcome.hpp"
#include "Ports.hpp"
#include "Rules.hpp"

namespace scorekeep::core
{
    class GameImpl;

    struct RecordAtBatCommand
    {
        GameId game_id;
        PlayerId batter_id;
        int inning{};
        Half half{Half::Top};
        BattingResult result{ResultKind::Single};
        std::string description;
        int rbis{};
        BaserunnerState before;
        BaserunnerState after;
        std::vector<PlayerId> runs_scored;
        SituationalParameters parameters;
        // retired on the bases; each adds one out to the result's own outs
        std::vector<PlayerId> running_errors;
    };

    // Validates one plate appearance and, only when every check passes, records it.
    // Callers serialize Record() per game; Preview() never writes.
    class AtBatRecorder
    {
    public:
        using ClockFn = std::function<Clock::time_point()>;

        AtBatRecorder(GameStore& games,
                      AtBatSink& sink,
                      Rules const& rules,
                      RuleConfiguration config,
                      ClockFn clock = [] { return Clock::now(); });

        auto RecordAtBat(RecordAtBatCommand const& cmd) -> std::expected<AtBat, error::RuleViolation>;
        auto Preview(RecordAtBatCommand const& cmd) const -> error::ValidateResult;

        auto Configuration() const noexcept -> RuleConfiguration const& { return cfg_; }

    private:
        auto Check(GameImpl const& game, RecordAtBatCommand const& cmd) const -> error::ValidateResult;

        GameStore& games_;
        AtBatSink& sink_;
        Rules const& rules_;
        RuleConfiguration cfg_;
        ClockFn clock_;
    };
}

#endif //SCOREKEEP_ATBATRECORDER_HPP
