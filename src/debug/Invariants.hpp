#ifndef SCOREKEEP_INVARIANTS_HPP
#define SCOREKEEP_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Exception.hpp"
#include "Inspector.hpp"
#include <numeric>

namespace scorekeep::core::debug
{
    // Cross-checks the bookkeeping after every recorded play. Throws AssertionError.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if SKP_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) lifecycle: innings exist exactly when play has begun
    SKP_ASSERT((s.status == GameStatus::Setup) == s.innings.empty(), "innings exist before start");
    SKP_ASSERT(s.status == GameStatus::Setup || s.has_lineup, "game left setup without a lineup");

    // 2) outs and bases of the live half-inning
    if (s.status == GameStatus::InProgress)
    {
        SKP_ASSERT(s.outs < constants::MaxOuts, "live half-inning has three outs");
        SKP_ASSERT(!s.innings.back().complete, "live half-inning marked complete");
        SKP_ASSERT(s.innings.back().outs == s.outs, "inning outs differ from game outs");
        SKP_ASSERT(s.innings.back().number == s.inning && s.innings.back().half == s.half, "current inning mismatch");
    }
    SKP_ASSERT(!s.bases.HasDuplicateRunner(), "runner on two bases");

    // 3) every closed half-inning except a walk-off ended on three outs
    for (size_t i{}; i < s.innings.size(); ++i)
    {
        Inning const& in = s.innings[i];
        bool const last = i + 1 == s.innings.size();
        SKP_ASSERT(in.outs <= constants::MaxOuts, "inning with more than three outs");
        if (in.complete && !(last && s.completion == CompletionReason::WalkOff))
            SKP_ASSERT(in.outs == constants::MaxOuts, "half-inning closed short of three outs");
        if (!last) SKP_ASSERT(in.complete, "earlier half-inning left open");
    }

    // 4) score equals the line score and the innings' runs
    uint32_t away{}, home{};
    for (InningLine const& l : s.linescore)
    {
        away += l.away;
        home += l.home;
    }
    SKP_ASSERT(away == s.score[static_cast<size_t>(Side::Away)], "away score != line score");
    SKP_ASSERT(home == s.score[static_cast<size_t>(Side::Home)], "home score != line score");

    uint32_t const by_inning = std::accumulate(s.innings.begin(), s.innings.end(), uint32_t{0},
                                               [](uint32_t acc, Inning const& in) { return acc + in.runs; });
    SKP_ASSERT(by_inning == away + home, "inning runs != total score");

    // 5) at-bat count and batting cursors
    size_t const listed = std::accumulate(s.innings.begin(), s.innings.end(), size_t{0},
                                          [](size_t acc, Inning const& in) { return acc + in.at_bat_ids.size(); });
    SKP_ASSERT(listed == s.at_bat_count, "at-bat ids != at-bat count");
    for (uint8_t const slot : s.next_slot)
        SKP_ASSERT(slot >= 1 && slot <= constants::LineupSize, "batting cursor out of range");

    // 6) completion reason agrees with status
    SKP_ASSERT((s.status == GameStatus::Completed) == (s.completion != CompletionReason::None),
               "completion reason without completed status");
#endif // SKP_ENABLE_TEST_HOOKS == true
    }
}
#endif //SCOREKEEP_INVARIANTS_HPP
