#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "../debug/Invariants.hpp"

using namespace scorekeep::core;
using scorekeep::test::Harness;
using RVC = error::RuleViolationCode;

namespace
{
    auto Innings(uint8_t regulation) -> GameConfig
    {
        GameConfig cfg{};
        cfg.regulation_innings = regulation;
        return cfg;
    }
}

TEST(Progression, StartNeedsLineup)
{
    Harness h;
    EXPECT_THROW((void)h.game.CurrentInning(), error::StateError);

    auto const r = h.game.Start();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Game_LineupMissing);
    EXPECT_EQ(h.game.Status(), GameStatus::Setup);

    h.Start();
    EXPECT_EQ(h.game.Status(), GameStatus::InProgress);
    EXPECT_EQ(h.game.InningNow(), 1);
    EXPECT_EQ(h.game.HalfNow(), Half::Top);
    EXPECT_EQ(h.game.CurrentInning().id, "g1-1T");
    scorekeep::core::debug::CheckInvariants(h.game);
}

TEST(Progression, IllegalTransitions)
{
    Harness h;
    EXPECT_EQ(h.game.Suspend().error().code, RVC::Game_IllegalTransition);
    EXPECT_EQ(h.game.Complete().error().code, RVC::Game_IllegalTransition);

    h.Start();
    EXPECT_EQ(h.game.Start().error().code, RVC::Game_IllegalTransition);

    ASSERT_TRUE(h.game.Suspend().has_value());
    EXPECT_EQ(h.game.Status(), GameStatus::Suspended);
    EXPECT_EQ(h.game.Suspend().error().code, RVC::Game_IllegalTransition);
    EXPECT_EQ(h.game.Complete().error().code, RVC::Game_IllegalTransition);
    EXPECT_EQ(h.game.Start().error().code, RVC::Game_IllegalTransition);

    auto const r = h.Record(BattingResult::Single());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Game_NotInProgress);
}

TEST(Progression, DeclaredCompletion)
{
    Harness h;
    h.Start();
    ASSERT_TRUE(h.game.Complete().has_value());
    EXPECT_EQ(h.game.Status(), GameStatus::Completed);
    EXPECT_EQ(h.game.Completion(), CompletionReason::Declared);
    EXPECT_EQ(h.game.Complete().error().code, RVC::Game_IllegalTransition);
    scorekeep::core::debug::CheckInvariants(h.game);
}

TEST(Progression, ThreeOutsFlipTheHalf)
{
    Harness h;
    h.Start();
    ASSERT_TRUE(h.Record(BattingResult::Single()).has_value());
    h.Strikeouts(3);

    EXPECT_EQ(h.game.InningNow(), 1);
    EXPECT_EQ(h.game.HalfNow(), Half::Bottom);
    EXPECT_EQ(h.game.Outs(), 0);
    EXPECT_TRUE(h.game.Bases().IsEmpty());
    ASSERT_EQ(h.game.Innings().size(), 2u);
    EXPECT_TRUE(h.game.Innings()[0].complete);
    EXPECT_EQ(h.game.Innings()[0].outs, 3);
    EXPECT_EQ(h.game.Innings()[0].at_bat_ids.size(), 4u);
    EXPECT_EQ(h.game.CurrentInning().id, "g1-1B");
    EXPECT_EQ(h.game.NextSlot(Side::Away), 5);
    EXPECT_EQ(h.game.NextSlot(Side::Home), 1);
    scorekeep::core::debug::CheckInvariants(h.game);

    h.Strikeouts(3);
    EXPECT_EQ(h.game.InningNow(), 2);
    EXPECT_EQ(h.game.HalfNow(), Half::Top);
    EXPECT_EQ(h.game.CurrentInning().id, "g1-2T");
    scorekeep::core::debug::CheckInvariants(h.game);
}

TEST(Progression, DoublePlayCountsTwoOuts)
{
    Harness h;
    h.Start();
    ASSERT_TRUE(h.Record(BattingResult::Walk()).has_value());
    auto const ab = h.Record(BattingResult::DoublePlay());
    ASSERT_TRUE(ab.has_value());
    EXPECT_EQ(ab->Outs(), 2);
    EXPECT_EQ(h.game.Outs(), 2);
    EXPECT_TRUE(h.game.Bases().IsEmpty());
}

TEST(Progression, BattingOrderWrapsAfterNine)
{
    Harness h;
    h.Start();
    for (int i = 0; i < 9; ++i) ASSERT_TRUE(h.Record(BattingResult::HomeRun()).has_value());
    EXPECT_EQ(h.game.NextSlot(Side::Away), 1);
    EXPECT_EQ(h.game.Score(Side::Away), 9u);
    ASSERT_EQ(h.game.Snapshot()->linescore.size(), 1u);
    EXPECT_EQ(h.game.Snapshot()->linescore[0].away, 9u);
}

TEST(Progression, WalkOffEndsGame)
{
    Harness h(Innings(1));
    h.Start();
    h.Strikeouts(3);
    ASSERT_EQ(h.game.HalfNow(), Half::Bottom);

    ASSERT_TRUE(h.Record(BattingResult::HomeRun()).has_value());
    EXPECT_EQ(h.game.Status(), GameStatus::Completed);
    EXPECT_EQ(h.game.Completion(), CompletionReason::WalkOff);
    EXPECT_EQ(h.game.Score(Side::Home), 1u);
    EXPECT_TRUE(h.game.Innings().back().complete);
    EXPECT_EQ(h.game.Innings().back().outs, 0);
    scorekeep::core::debug::CheckInvariants(h.game);

    auto const after = h.Record(BattingResult::Single());
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, RVC::Game_NotInProgress);
}

TEST(Progression, HomeAheadSkipsFinalBottomHalf)
{
    Harness h(Innings(2));
    h.Start();
    h.Strikeouts(3);
    h.HomeRuns(1);
    EXPECT_EQ(h.game.Status(), GameStatus::InProgress);
    h.Strikeouts(3);
    h.Strikeouts(3);

    EXPECT_EQ(h.game.Status(), GameStatus::Completed);
    EXPECT_EQ(h.game.Completion(), CompletionReason::Regulation);
    EXPECT_EQ(h.game.Innings().size(), 3u);
    scorekeep::core::debug::CheckInvariants(h.game);
}

TEST(Progression, AwayWinsInRegulation)
{
    Harness h(Innings(1));
    h.Start();
    h.HomeRuns(2);
    h.Strikeouts(3);
    EXPECT_EQ(h.game.HalfNow(), Half::Bottom);
    h.Strikeouts(3);

    EXPECT_EQ(h.game.Completion(), CompletionReason::Regulation);
    EXPECT_EQ(h.game.Score(Side::Away), 2u);
    EXPECT_EQ(h.game.Score(Side::Home), 0u);
    scorekeep::core::debug::CheckInvariants(h.game);
}

TEST(Progression, TieGoesToExtraInnings)
{
    Harness h(Innings(1));
    h.Start();
    h.Strikeouts(6);

    EXPECT_EQ(h.game.Status(), GameStatus::InProgress);
    EXPECT_EQ(h.game.InningNow(), 2);
    EXPECT_EQ(h.game.HalfNow(), Half::Top);
    EXPECT_EQ(h.game.Snapshot()->linescore.size(), 2u);
    scorekeep::core::debug::CheckInvariants(h.game);
}

TEST(Progression, MercyRuleAfterTrailingSideBats)
{
    GameConfig cfg{};
    cfg.mercy_min_inning = 1;
    cfg.mercy_run_differential = 3;
    Harness h(cfg);
    h.Start();

    h.HomeRuns(3);
    h.Strikeouts(3);
    // home has not batted yet
    EXPECT_EQ(h.game.Status(), GameStatus::InProgress);

    h.Strikeouts(3);
    EXPECT_EQ(h.game.Status(), GameStatus::Completed);
    EXPECT_EQ(h.game.Completion(), CompletionReason::MercyRule);
    scorekeep::core::debug::CheckInvariants(h.game);
}

TEST(Progression, MercyRuleDisabled)
{
    GameConfig cfg{};
    cfg.mercy_rule = false;
    cfg.mercy_min_inning = 1;
    cfg.mercy_run_differential = 3;
    Harness h(cfg);
    h.Start();

    h.HomeRuns(3);
    h.Strikeouts(6);
    EXPECT_EQ(h.game.Status(), GameStatus::InProgress);
    EXPECT_EQ(h.game.InningNow(), 2);
}

TEST(Progression, SnapshotIsDetached)
{
    Harness h;
    h.Start();
    auto const before = h.game.Snapshot();
    ASSERT_TRUE(h.Record(BattingResult::Double()).has_value());

    EXPECT_TRUE(before->bases.IsEmpty());
    EXPECT_EQ(before->at_bats, 0u);
    EXPECT_EQ(h.game.Snapshot()->at_bats, 1u);
    EXPECT_EQ(h.game.Snapshot()->bases.Occupant(Base::Second), std::optional<PlayerId>{"bat1"});
}

TEST(Progression, InningCounterDoesNotWrap)
{
    Harness h(Innings(1));
    h.Start();
    for (int i = 1; i < constants::MaxInnings; ++i) h.Strikeouts(6);
    ASSERT_EQ(h.game.InningNow(), constants::MaxInnings);
    ASSERT_EQ(h.game.Status(), GameStatus::InProgress);

    h.Strikeouts(6);
    EXPECT_EQ(h.game.Status(), GameStatus::Completed);
    EXPECT_EQ(h.game.Completion(), CompletionReason::Declared);
    EXPECT_EQ(h.game.InningNow(), constants::MaxInnings);
    EXPECT_EQ(h.game.Snapshot()->linescore.size(), static_cast<size_t>(constants::MaxInnings));
    scorekeep::core::debug::CheckInvariants(h.game);
}
