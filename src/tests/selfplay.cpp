#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <print>

#include "TestSupport.hpp"
#include "../core/RandomScorer.hpp"
#include "../codec/Codec.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/ScorebookLogger.hpp"

using namespace scorekeep::core;

namespace
{
    constexpr int MaxPlays = 2000;

    auto PlayOut(std::uint64_t seed, RuleConfiguration const& rule_cfg) -> void
    {
        namespace fs = std::filesystem;
        fs::create_directories("_artifacts");
        auto const path = fs::path(std::format("_artifacts/game_{}.log", seed));

        scorekeep::test::Harness h({}, rule_cfg);
        h.Start();

        RandomScorer scorer(seed, h.rules, rule_cfg);
        debug::ScorebookLogger log(path.string());
        log.start(*h.game.Snapshot(), seed, rule_cfg);

        int plays{};
        while (h.game.Status() == GameStatus::InProgress)
        {
            ASSERT_LT(plays, MaxPlays) << "seed " << seed << " never finished";

            size_t const half_index = h.game.Innings().size() - 1;
            RecordAtBatCommand const cmd = scorer.Next(*h.game.Snapshot(), *h.game.LineupOf());

            ASSERT_TRUE(h.recorder.Preview(cmd).has_value());
            auto const ab = h.recorder.RecordAtBat(cmd);
            if (!ab)
            {
                log.rejected(cmd, ab.error());
                log.flush();
                FAIL() << "seed " << seed << ": " << error::describe(ab.error());
            }
            ++plays;

            debug::CheckInvariants(h.game);
            log.play(*ab, *h.game.Snapshot());
            if (h.game.Innings()[half_index].complete) log.half_inning(h.game.Innings()[half_index]);

            auto const buf = codec::EncodeAtBat(*ab);
            auto const back = codec::DecodeAtBat({reinterpret_cast<std::byte const*>(buf.data()), buf.size()});
            ASSERT_TRUE(back.has_value());
            ASSERT_EQ(back->After(), ab->After());
        }

        log.end(*h.game.Snapshot());
        log.flush();

        EXPECT_EQ(h.game.Status(), GameStatus::Completed);
        EXPECT_NE(h.game.Completion(), CompletionReason::None);
        EXPECT_EQ(h.store.AtBats().size(), h.game.AtBatCount());
        ASSERT_TRUE(fs::exists(path));
        ASSERT_GT(fs::file_size(path), 0u);
    }
}

TEST(SelfPlay, Transcripts_And_End)
{
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull, 444ull})
        {
            SCOPED_TRACE(seed);
            PlayOut(seed, RuleConfiguration{});
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        FAIL() << e.what();
    }
}

TEST(SelfPlay, StrictAndLenientConfigurations)
{
    RuleConfiguration strict{};
    strict.strict_outcome_matching = true;

    RuleConfiguration lenient{};
    lenient.error_attribution = false;
    lenient.running_error_variations = false;

    try
    {
        for (std::uint64_t seed : {7ull, 8ull})
        {
            SCOPED_TRACE(seed);
            PlayOut(seed, strict);
            PlayOut(seed + 100, lenient);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        FAIL() << e.what();
    }
}
