#ifndef SCOREKEEP_STATE_HPP
#define SCOREKEEP_STATE_HPP

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "BaserunnerState.hpp"

namespace scorekeep::core
{
    struct LineupEntry
    {
        int batting_order{};
        PlayerId player;
        Position position{Position::Pitcher};
    };

    struct Lineup
    {
        // ordered by batting order 1..9
        std::vector<LineupEntry> entries;
        std::vector<PlayerId> substitutes;

        auto BatterAt(uint8_t order) const -> LineupEntry const& { return entries.at(order - 1u); }

        // Starters only; substitutes have no fixed order.
        auto OrderOf(PlayerId const& id) const -> std::optional<uint8_t>
        {
            for (LineupEntry const& e : entries)
            {
                if (e.player == id) return static_cast<uint8_t>(e.batting_order);
            }
            return std::nullopt;
        }
    };

    // One half-inning.
    struct Inning
    {
        std::string id;
        uint8_t number{1};
        Half half{Half::Top};
        std::vector<std::string> at_bat_ids;
        uint8_t outs{};
        uint32_t runs{};
        bool complete{false};
    };

    struct InningLine
    {
        uint8_t number{};
        uint32_t away{};
        uint32_t home{};
    };

    // Immutable snapshot for readers (hosts, loggers, the simulation driver).
    struct GameSnapshot
    {
        GameId game_id;
        GameStatus status{GameStatus::Setup};
        CompletionReason completion{CompletionReason::None};
        uint8_t inning{};
        Half half{Half::Top};
        uint8_t outs{};
        BaserunnerState bases{};
        uint32_t away_score{};
        uint32_t home_score{};
        std::vector<InningLine> linescore;
        uint32_t at_bats{};
        // next batting-order slot per side, indexed by Side
        std::array<uint8_t, 2> next_slot{1, 1};
        Side our_side{Side::Home};
        bool has_lineup{false};
    };
}

#endif //SCOREKEEP_STATE_HPP
