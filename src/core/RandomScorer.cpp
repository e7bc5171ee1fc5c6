#include "RandomScorer.hpp"

#include <array>
#include <format>
#include <ranges>

namespace scorekeep::core
{
    RandomScorer::RandomScorer(uint64_t rng_seed, Rules const& rules, RuleConfiguration cfg) :
        rng_(static_cast<std::mt19937::result_type>(rng_seed)),
        rules_{rules},
        cfg_{std::move(cfg)}
    {
    }

    auto RandomScorer::PickResult() -> BattingResult
    {
        // rough slow-pitch frequencies, indexed by ResultKind
        static constexpr std::array<double, ResultKindCount> weights{
            16, 5, 1, 2, 8, 1, 3, 4, 2, 14, 20, 16, 4
        };
        std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
        return BattingResult{AllResultKinds[dist(rng_)]};
    }

    auto RandomScorer::PickParameters() -> SituationalParameters
    {
        static constexpr std::array<Aggressiveness, 5> moods{
            Aggressiveness::Conservative, Aggressiveness::Standard, Aggressiveness::Standard,
            Aggressiveness::Standard, Aggressiveness::Aggressive
        };
        std::bernoulli_distribution error(0.08);
        std::bernoulli_distribution running(0.05);
        return SituationalParameters{
            .aggressiveness = moods[pick(moods)],
            .error_occurred = error(rng_),
            .running_error_occurred = running(rng_)
        };
    }

    auto RandomScorer::Next(GameSnapshot const& s, Lineup const& ours) -> RecordAtBatCommand
    {
        SKP_ASSERT(s.status == GameStatus::InProgress, "RandomScorer asked to score a game not in progress");

        Side const side = BattingSide(s.half);
        uint8_t const slot = s.next_slot[static_cast<size_t>(side)];
        PlayerId const batter = side == s.our_side
                                    ? ours.BatterAt(slot).player
                                    : std::format("opp-{}", static_cast<int>(slot));

        // a strikeout is always possible with fewer than three outs, so this terminates
        for (;;)
        {
            PlayContext const ctx{
                .before = s.bases, .result = PickResult(), .batter = batter, .parameters = PickParameters()
            };

            auto options = rules_.ValidOutcomes(ctx, cfg_);
            std::erase_if(options, [&](AdvancementOutcome const& o) { return s.outs + o.outs > constants::MaxOuts; });
            if (options.empty()) continue;

            AdvancementOutcome const& o = options[pick(options)];
            return RecordAtBatCommand{
                .game_id = s.game_id,
                .batter_id = batter,
                .inning = s.inning,
                .half = s.half,
                .result = ctx.result,
                .description = o.description,
                .rbis = o.rbis,
                .before = s.bases,
                .after = o.after,
                .runs_scored = o.runs_scored,
                .parameters = ctx.parameters,
                .running_errors = o.running_errors
            };
        }
    }
}
