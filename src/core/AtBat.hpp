#ifndef SCOREKEEP_ATBAT_HPP
#define SCOREKEEP_ATBAT_HPP

#include <string>
#include <vector>

#include "Types.hpp"
#include "BaserunnerState.hpp"
#include "BattingResult.hpp"
#include "Outcome.hpp"

namespace scorekeep::core
{
    struct AtBatFields
    {
        std::string id;
        GameId game_id;
        std::string inning_id;
        PlayerId batter_id;
        uint8_t batting_position{};
        BattingResult result{ResultKind::Single};
        std::string description;
        uint8_t rbis{};
        std::vector<PlayerId> runs_scored;
        std::vector<PlayerId> running_errors;
        BaserunnerState before;
        BaserunnerState after;
        SituationalParameters parameters;
        uint8_t outs{};
        Clock::time_point timestamp{};
    };

    // Immutable once recorded. A correction is a new AtBat, never an edit.
    class AtBat
    {
    public:
        explicit AtBat(AtBatFields f) : f_{std::move(f)} {}

        auto Id() const noexcept -> std::string const& { return f_.id; }
        auto Game() const noexcept -> GameId const& { return f_.game_id; }
        auto InningId() const noexcept -> std::string const& { return f_.inning_id; }
        auto Batter() const noexcept -> PlayerId const& { return f_.batter_id; }
        auto BattingPosition() const noexcept -> uint8_t { return f_.batting_position; }
        auto Result() const noexcept -> BattingResult { return f_.result; }
        auto Description() const noexcept -> std::string const& { return f_.description; }
        auto Rbis() const noexcept -> uint8_t { return f_.rbis; }
        auto RunsScored() const noexcept -> std::vector<PlayerId> const& { return f_.runs_scored; }
        auto RunningErrors() const noexcept -> std::vector<PlayerId> const& { return f_.running_errors; }
        auto Before() const noexcept -> BaserunnerState const& { return f_.before; }
        auto After() const noexcept -> BaserunnerState const& { return f_.after; }
        auto Parameters() const noexcept -> SituationalParameters const& { return f_.parameters; }
        auto Outs() const noexcept -> uint8_t { return f_.outs; }
        auto Timestamp() const noexcept -> Clock::time_point { return f_.timestamp; }
        auto Fields() const noexcept -> AtBatFields const& { return f_; }

    private:
        AtBatFields f_;
    };
}

#endif //SCOREKEEP_ATBAT_HPP
