#include "LineupValidator.hpp"

#include <algorithm>
#include <array>
#include <unordered_set>

#include "Game.hpp"

namespace
{
    using namespace scorekeep::core;

    inline auto Viol(error::RuleViolationCode code) -> error::RuleViolation
    {
        return error::RuleViolation{ .code = code };
    }
}

namespace scorekeep::core
{
    LineupValidator::LineupValidator(GameStore& games, PlayerDirectory const& players) :
        games_{games},
        players_{players}
    {
    }

    auto LineupValidator::Check(GameImpl const& game, SetupLineupCommand const& cmd) const -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;

        if (game.Status() != GameStatus::Setup)
            return std::unexpected(Viol(RVC::Game_NotInSetup).with_game(game.Id()).with_status(game.Status()));

        if (cmd.entries.size() != constants::LineupSize)
            return std::unexpected(Viol(RVC::Lineup_WrongSize)
                                   .with_attempted(static_cast<int>(cmd.entries.size()))
                                   .with_expected(constants::LineupSize));

        // each of 1..9 seen once; 9 entries make that exact
        std::array<bool, constants::LineupSize> order_seen{};
        for (LineupEntry const& e : cmd.entries)
        {
            bool const in_range = e.batting_order >= 1 && e.batting_order <= constants::LineupSize;
            if (!in_range || order_seen[e.batting_order - 1])
                return std::unexpected(Viol(RVC::Lineup_BattingOrderInvalid).with_attempted(e.batting_order));
            order_seen[e.batting_order - 1] = true;
        }

        std::unordered_set<PlayerId> starters;
        for (LineupEntry const& e : cmd.entries)
        {
            if (!starters.insert(e.player).second)
                return std::unexpected(Viol(RVC::Lineup_DuplicatePlayer).with_player(e.player));
        }

        std::array<bool, RequiredPositionCount> filled{};
        std::unordered_set<Position> positions;
        for (LineupEntry const& e : cmd.entries)
        {
            if (!positions.insert(e.position).second)
                return std::unexpected(Viol(RVC::Lineup_DuplicatePosition).with_position(e.position)
                                       .with_player(e.player));
            if (IsRequired(e.position)) filled[static_cast<size_t>(e.position)] = true;
        }
        for (size_t i{}; i < RequiredPositionCount; ++i)
        {
            if (!filled[i])
                return std::unexpected(Viol(RVC::Lineup_RequiredPositionMissing)
                                       .with_position(static_cast<Position>(i)));
        }

        for (LineupEntry const& e : cmd.entries)
        {
            if (!players_.Exists(e.player))
                return std::unexpected(Viol(RVC::Player_NotFound).with_player(e.player));
        }
        for (PlayerId const& id : cmd.substitutes)
        {
            if (!players_.Exists(id))
                return std::unexpected(Viol(RVC::Player_NotFound).with_player(id));
        }

        for (PlayerId const& id : cmd.substitutes)
        {
            if (starters.contains(id))
                return std::unexpected(Viol(RVC::Lineup_SubstituteIsStarter).with_player(id));
        }

        std::unordered_set<PlayerId> subs;
        for (PlayerId const& id : cmd.substitutes)
        {
            if (!subs.insert(id).second)
                return std::unexpected(Viol(RVC::Lineup_DuplicateSubstitute).with_player(id));
        }

        return {};
    }

    auto LineupValidator::SetupLineup(SetupLineupCommand const& cmd) -> error::ValidateResult
    {
        GameImpl* game = games_.Find(cmd.game_id);
        if (!game)
            return std::unexpected(Viol(error::RuleViolationCode::Game_NotFound).with_game(cmd.game_id));

        if (auto r = Check(*game, cmd); !r) return r;

        game->AttachLineup(Lineup{.entries = cmd.entries, .substitutes = cmd.substitutes});
        games_.Save(*game);
        return {};
    }
}
