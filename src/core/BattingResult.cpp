#include "BattingResult.hpp"

namespace scorekeep::core
{
    namespace
    {
        //                                  notation name                 hit    out    reach  outs bases
        constexpr std::array<ResultTraits, ResultKindCount> kTraits{{
            {"1B",  "single",             true,  false, true,  0, 1},
            {"2B",  "double",             true,  false, true,  0, 2},
            {"3B",  "triple",             true,  false, true,  0, 3},
            {"HR",  "home run",           true,  false, true,  0, 4},
            {"BB",  "walk",               false, false, true,  0, 1},
            {"IBB", "intentional walk",   false, false, true,  0, 1},
            {"E",   "reached on error",   false, false, true,  0, 1},
            {"FC",  "fielder's choice",   false, false, true,  1, 1},
            {"SF",  "sacrifice fly",      false, true,  false, 1, 0},
            {"SO",  "strikeout",          false, true,  false, 1, 0},
            {"GO",  "groundout",          false, true,  false, 1, 0},
            {"AO",  "flyout",             false, true,  false, 1, 0},
            {"DP",  "double play",        false, true,  false, 2, 0},
        }};
    }

    auto BattingResult::Traits() const noexcept -> ResultTraits const&
    {
        return kTraits[static_cast<size_t>(kind_)];
    }

    auto BattingResult::Parse(std::string_view const notation) noexcept -> std::optional<BattingResult>
    {
        for (ResultKind const k : AllResultKinds)
        {
            if (kTraits[static_cast<size_t>(k)].notation == notation) return BattingResult{k};
        }
        return std::nullopt;
    }
}
