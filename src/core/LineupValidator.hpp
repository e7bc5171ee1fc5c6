#ifndef SCOREKEEP_LINEUPVALIDATOR_HPP
#define SCOREKEEP_LINEUPVALIDATOR_HPP

#include <vector>

#include "Types.hpp"
#include "State.hpp"
#include "Exception.hpp"
#include "Ports.hpp"

namespace scorekeep::core
{
    class GameImpl;

    struct SetupLineupCommand
    {
        GameId game_id;
        std::vector<LineupEntry> entries;
        std::vector<PlayerId> substitutes;
    };

    // Gate into in_progress: a game starts only once a lineup passed here.
    class LineupValidator
    {
    public:
        LineupValidator(GameStore& games, PlayerDirectory const& players);

        // Attaches the lineup on success; leaves the game untouched on failure.
        auto SetupLineup(SetupLineupCommand const& cmd) -> error::ValidateResult;

    private:
        auto Check(GameImpl const& game, SetupLineupCommand const& cmd) const -> error::ValidateResult;

        GameStore& games_;
        PlayerDirectory const& players_;
    };
}

#endif //SCOREKEEP_LINEUPVALIDATOR_HPP
