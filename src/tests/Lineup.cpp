#include <gtest/gtest.h>
#include <algorithm>

#include "TestSupport.hpp"

using namespace scorekeep::core;
using scorekeep::test::Harness;
using scorekeep::test::StandardLineup;
using RVC = error::RuleViolationCode;

namespace
{
    auto Rejects(Harness& h, SetupLineupCommand const& cmd, RVC code) -> error::RuleViolation
    {
        auto const r = h.lineups.SetupLineup(cmd);
        EXPECT_FALSE(r.has_value());
        if (r) return {};
        EXPECT_EQ(r.error().code, code) << error::describe(r.error());
        EXPECT_EQ(h.game.Status(), GameStatus::Setup);
        EXPECT_FALSE(h.game.LineupOf().has_value());
        EXPECT_EQ(h.store.SaveCount("g1"), 0u);
        return r.error();
    }
}

TEST(Lineup, AcceptsStandardLineup)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    std::ranges::reverse(cmd.entries);

    ASSERT_TRUE(h.lineups.SetupLineup(cmd).has_value());
    ASSERT_TRUE(h.game.LineupOf().has_value());
    EXPECT_EQ(h.game.LineupOf()->BatterAt(1).player, "p1");
    EXPECT_EQ(h.game.LineupOf()->BatterAt(9).player, "p9");
    EXPECT_EQ(h.game.LineupOf()->substitutes, (std::vector<PlayerId>{"p10", "p11"}));
    EXPECT_EQ(h.game.Status(), GameStatus::Setup);
    EXPECT_EQ(h.store.SaveCount("g1"), 1u);
}

TEST(Lineup, BattingOrderOutOfRange)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    cmd.entries.back().batting_order = 10;

    auto const v = Rejects(h, cmd, RVC::Lineup_BattingOrderInvalid);
    EXPECT_EQ(error::to_string(v.code), "Batting orders must be exactly 1 through 9");
    EXPECT_EQ(v.attempted, 10);
}

TEST(Lineup, BattingOrderRepeated)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    cmd.entries[8].batting_order = 8;
    Rejects(h, cmd, RVC::Lineup_BattingOrderInvalid);
}

TEST(Lineup, WrongSize)
{
    Harness h;
    SetupLineupCommand eight = StandardLineup("g1");
    eight.entries.pop_back();
    Rejects(h, eight, RVC::Lineup_WrongSize);

    SetupLineupCommand ten = StandardLineup("g1");
    ten.entries.push_back(LineupEntry{10, "p10", Position::ExtraPlayer});
    ten.substitutes = {"p11"};
    Rejects(h, ten, RVC::Lineup_WrongSize);
}

TEST(Lineup, DuplicatePlayer)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    cmd.entries[8].player = "p1";
    auto const v = Rejects(h, cmd, RVC::Lineup_DuplicatePlayer);
    EXPECT_EQ(v.player, std::optional<PlayerId>{"p1"});
}

TEST(Lineup, TwoPitchers)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    cmd.entries[8].position = Position::Pitcher;
    auto const v = Rejects(h, cmd, RVC::Lineup_DuplicatePosition);
    EXPECT_EQ(v.position, Position::Pitcher);
    EXPECT_EQ(error::to_string(v.code), "Jersey/position conflict: position assigned twice");
}

TEST(Lineup, RequiredPositionMissing)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    cmd.entries[8].position = Position::ShortFielder;
    auto const v = Rejects(h, cmd, RVC::Lineup_RequiredPositionMissing);
    EXPECT_EQ(v.position, Position::RightField);
}

TEST(Lineup, UnknownPlayers)
{
    Harness h;
    SetupLineupCommand starter = StandardLineup("g1");
    starter.entries[4].player = "p99";
    auto const v = Rejects(h, starter, RVC::Player_NotFound);
    EXPECT_EQ(v.player, std::optional<PlayerId>{"p99"});

    SetupLineupCommand bench = StandardLineup("g1");
    bench.substitutes.push_back("p42");
    Rejects(h, bench, RVC::Player_NotFound);
}

TEST(Lineup, SubstituteAlreadyStarting)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    cmd.substitutes = {"p10", "p3"};
    auto const v = Rejects(h, cmd, RVC::Lineup_SubstituteIsStarter);
    EXPECT_EQ(v.player, std::optional<PlayerId>{"p3"});

    cmd.substitutes = {"p10"};
    EXPECT_TRUE(h.lineups.SetupLineup(cmd).has_value());
}

TEST(Lineup, DuplicateSubstitute)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    cmd.substitutes = {"p10", "p10"};
    Rejects(h, cmd, RVC::Lineup_DuplicateSubstitute);
}

TEST(Lineup, GameMustExistAndBeInSetup)
{
    Harness h;
    auto const missing = h.lineups.SetupLineup(StandardLineup("other"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, RVC::Game_NotFound);

    h.Start();
    auto const late = h.lineups.SetupLineup(StandardLineup("g1"));
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code, RVC::Game_NotInSetup);
    EXPECT_EQ(late.error().status, GameStatus::InProgress);
}

TEST(Lineup, RejectionIsRepeatable)
{
    Harness h;
    SetupLineupCommand cmd = StandardLineup("g1");
    cmd.entries.back().batting_order = 10;

    auto const a = h.lineups.SetupLineup(cmd);
    auto const b = h.lineups.SetupLineup(cmd);
    ASSERT_FALSE(a.has_value());
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(a.error(), b.error());
    EXPECT_FALSE(h.game.LineupOf().has_value());
}

TEST(Lineup, ResubmitReplacesInSetup)
{
    Harness h;
    ASSERT_TRUE(h.lineups.SetupLineup(StandardLineup("g1")).has_value());

    SetupLineupCommand swapped = StandardLineup("g1");
    std::swap(swapped.entries[0].player, swapped.entries[1].player);
    ASSERT_TRUE(h.lineups.SetupLineup(swapped).has_value());
    EXPECT_EQ(h.game.LineupOf()->BatterAt(1).player, "p2");
}
