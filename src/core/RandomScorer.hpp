#ifndef SCOREKEEP_RANDOMSCORER_HPP
#define SCOREKEEP_RANDOMSCORER_HPP

#include <random>

#include "AtBatRecorder.hpp"
#include "Rules.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace scorekeep::core
{
    // Plays the scorer's role in self-play: picks a plausible result, parameters and one of
    // the permitted outcomes, and phrases it as the command a UI would submit.
    class RandomScorer final
    {
    public:
        RandomScorer(uint64_t rng_seed, Rules const& rules, RuleConfiguration cfg);

        auto Next(GameSnapshot const& s, Lineup const& ours) -> RecordAtBatCommand;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto PickResult() -> BattingResult;
        auto PickParameters() -> SituationalParameters;

    private:
        std::mt19937 rng_;
        Rules const& rules_;
        RuleConfiguration cfg_;
    };
}

#endif //SCOREKEEP_RANDOMSCORER_HPP
