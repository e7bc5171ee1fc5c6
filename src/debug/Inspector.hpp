#ifndef SCOREKEEP_INSPECTOR_HPP
#define SCOREKEEP_INSPECTOR_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace scorekeep::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            GameStatus status{};
            CompletionReason completion{};
            uint8_t inning{};
            Half half{};
            uint8_t outs{};
            BaserunnerState bases{};
            std::array<uint32_t, 2> score{};
            std::array<uint8_t, 2> next_slot{};
            uint32_t at_bat_count{};
            std::vector<Inning> innings;
            std::vector<InningLine> linescore;
            bool has_lineup{};
            GameConfig cfg{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.status = g.status_;
            ret.completion = g.completion_;
            ret.inning = g.inning_;
            ret.half = g.half_;
            ret.outs = g.outs_;
            ret.bases = g.bases_;
            ret.score = g.score_;
            ret.next_slot = g.next_slot_;
            ret.at_bat_count = g.at_bat_count_;
            ret.innings = g.innings_;
            ret.linescore = g.linescore_;
            ret.has_lineup = g.lineup_.has_value();
            ret.cfg = g.cfg_;
            return ret;
        }
    };
}

#endif //SCOREKEEP_INSPECTOR_HPP
