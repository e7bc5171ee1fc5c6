#include <gtest/gtest.h>
#include <string>

#include "TestSupport.hpp"

using namespace scorekeep::core;
using scorekeep::test::Harness;
using RVC = error::RuleViolationCode;

namespace
{
    struct Before
    {
        uint32_t at_bats;
        uint8_t outs;
        BaserunnerState bases;
        uint32_t away;
        uint32_t home;
        size_t saves;
        size_t appended;
    };

    auto Capture(Harness const& h) -> Before
    {
        return Before{h.game.AtBatCount(), h.game.Outs(), h.game.Bases(), h.game.Score(Side::Away),
                      h.game.Score(Side::Home), h.store.SaveCount("g1"), h.store.AtBats().size()};
    }

    auto ExpectUnchanged(Harness const& h, Before const& b) -> void
    {
        EXPECT_EQ(h.game.AtBatCount(), b.at_bats);
        EXPECT_EQ(h.game.Outs(), b.outs);
        EXPECT_EQ(h.game.Bases(), b.bases);
        EXPECT_EQ(h.game.Score(Side::Away), b.away);
        EXPECT_EQ(h.game.Score(Side::Home), b.home);
        EXPECT_EQ(h.store.SaveCount("g1"), b.saves);
        EXPECT_EQ(h.store.AtBats().size(), b.appended);
    }

    auto Rejects(Harness& h, RecordAtBatCommand const& cmd, RVC code) -> void
    {
        Before const b = Capture(h);
        auto const r = h.recorder.RecordAtBat(cmd);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, code) << error::describe(r.error());
        ExpectUnchanged(h, b);
    }
}

TEST(Recorder, RecordsSingleAndMutatesGame)
{
    Harness h;
    h.Start();

    auto const ab = h.Record(BattingResult::Single());
    ASSERT_TRUE(ab.has_value());

    EXPECT_EQ(ab->Id(), "g1-ab-1");
    EXPECT_EQ(ab->Game(), "g1");
    EXPECT_EQ(ab->InningId(), "g1-1T");
    EXPECT_EQ(ab->Batter(), "bat1");
    EXPECT_EQ(ab->BattingPosition(), 1);
    EXPECT_EQ(ab->Outs(), 0);
    EXPECT_EQ(ab->Timestamp(), scorekeep::test::FixedClock());

    EXPECT_EQ(h.game.AtBatCount(), 1u);
    EXPECT_EQ(h.game.Bases(), BaserunnerState{"bat1"});
    EXPECT_EQ(h.game.NextSlot(Side::Away), 2);
    EXPECT_EQ(h.game.CurrentInning().at_bat_ids, (std::vector<std::string>{"g1-ab-1"}));
    EXPECT_EQ(h.store.AtBats().size(), 1u);
    EXPECT_EQ(h.store.SaveCount("g1"), 2u); // lineup, then the at-bat
}

TEST(Recorder, GameMustExist)
{
    Harness h;
    h.Start();
    RecordAtBatCommand cmd = h.StandardPlay(BattingResult::Single());
    cmd.game_id = "nope";
    Rejects(h, cmd, RVC::Game_NotFound);
}

TEST(Recorder, GameMustBeInProgress)
{
    Harness h;
    ASSERT_TRUE(h.lineups.SetupLineup(scorekeep::test::StandardLineup("g1")).has_value());
    RecordAtBatCommand cmd = h.Blank(BattingResult::Strikeout());
    cmd.inning = 1;
    Rejects(h, cmd, RVC::Game_NotInProgress);
}

TEST(Recorder, CompletedGameRejectsAtBat)
{
    Harness h;
    h.Start();
    RecordAtBatCommand const cmd = h.StandardPlay(BattingResult::Single());
    ASSERT_TRUE(h.game.Complete().has_value());

    auto const innings_before = h.game.Innings().size();
    auto const r = h.recorder.RecordAtBat(cmd);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Game_NotInProgress);
    EXPECT_EQ(r.error().status, GameStatus::Completed);
    EXPECT_EQ(error::category_of(r.error().code), error::Category::StateMachine);
    EXPECT_EQ(h.game.Innings().size(), innings_before);
    EXPECT_TRUE(h.game.CurrentInning().at_bat_ids.empty());
    EXPECT_EQ(h.game.AtBatCount(), 0u);
}

TEST(Recorder, BatterAndInningRequired)
{
    Harness h;
    h.Start();

    RecordAtBatCommand no_batter = h.StandardPlay(BattingResult::Strikeout());
    no_batter.batter_id.clear();
    Rejects(h, no_batter, RVC::AtBat_BatterRequired);

    RecordAtBatCommand blank_batter = h.StandardPlay(BattingResult::Strikeout());
    blank_batter.batter_id = " \t ";
    Rejects(h, blank_batter, RVC::AtBat_BatterRequired);

    RecordAtBatCommand zero_inning = h.StandardPlay(BattingResult::Strikeout());
    zero_inning.inning = 0;
    Rejects(h, zero_inning, RVC::AtBat_InningNotPositive);
}

TEST(Recorder, RbisAndDescriptionBounds)
{
    Harness h;
    h.Start();

    RecordAtBatCommand negative = h.StandardPlay(BattingResult::Single());
    negative.rbis = -1;
    Rejects(h, negative, RVC::AtBat_NegativeRbis);

    RecordAtBatCommand wordy = h.StandardPlay(BattingResult::Single());
    wordy.description = std::string(constants::MaxDescriptionLength + 1, 'x');
    Rejects(h, wordy, RVC::AtBat_DescriptionTooLong);

    RecordAtBatCommand at_limit = h.StandardPlay(BattingResult::Single());
    at_limit.description = std::string(constants::MaxDescriptionLength, 'x');
    EXPECT_TRUE(h.recorder.RecordAtBat(at_limit).has_value());

    RecordAtBatCommand empty = h.StandardPlay(BattingResult::Single());
    empty.description.clear();
    EXPECT_TRUE(h.recorder.RecordAtBat(empty).has_value());

    // two bytes per character: the bound is in characters
    std::string accents;
    for (size_t i{}; i < constants::MaxDescriptionLength; ++i) accents += "\xC3\xA9";
    RecordAtBatCommand multibyte = h.StandardPlay(BattingResult::Single());
    multibyte.description = accents;
    auto const ab = h.recorder.RecordAtBat(multibyte);
    ASSERT_TRUE(ab.has_value()) << error::describe(ab.error());
    EXPECT_EQ(ab->Description().size(), 2 * constants::MaxDescriptionLength);

    RecordAtBatCommand multibyte_over = h.StandardPlay(BattingResult::Single());
    multibyte_over.description = accents + "\xC3\xA9";
    Rejects(h, multibyte_over, RVC::AtBat_DescriptionTooLong);
}

TEST(Recorder, BattingPositionFromLineup)
{
    Harness h;
    h.Start();
    h.Strikeouts(3);
    ASSERT_EQ(h.game.HalfNow(), Half::Bottom);
    ASSERT_EQ(h.game.NextSlot(Side::Home), 1);

    RecordAtBatCommand cmd = h.Blank(BattingResult::Strikeout());
    cmd.batter_id = "p5";
    auto const ab = h.recorder.RecordAtBat(cmd);
    ASSERT_TRUE(ab.has_value());
    EXPECT_EQ(ab->BattingPosition(), 5);
    EXPECT_EQ(h.game.NextSlot(Side::Home), 6);

    // a substitute has no slot of its own and takes the next one
    RecordAtBatCommand sub = h.Blank(BattingResult::Strikeout());
    sub.batter_id = "p10";
    auto const sub_ab = h.recorder.RecordAtBat(sub);
    ASSERT_TRUE(sub_ab.has_value());
    EXPECT_EQ(sub_ab->BattingPosition(), 6);
    EXPECT_EQ(h.game.NextSlot(Side::Home), 7);
}

TEST(Recorder, OpponentPositionFollowsCursor)
{
    Harness h;
    h.Start();

    // away is the opponent: lineup ids mean nothing there
    RecordAtBatCommand cmd = h.Blank(BattingResult::Strikeout());
    cmd.batter_id = "p5";
    auto const ab = h.recorder.RecordAtBat(cmd);
    ASSERT_TRUE(ab.has_value());
    EXPECT_EQ(ab->BattingPosition(), 1);
    EXPECT_EQ(h.game.NextSlot(Side::Away), 2);
}

TEST(Recorder, WrongHalfInningOrBases)
{
    Harness h;
    h.Start();

    RecordAtBatCommand wrong_half = h.StandardPlay(BattingResult::Single());
    wrong_half.half = Half::Bottom;
    Rejects(h, wrong_half, RVC::Game_WrongHalfInning);

    RecordAtBatCommand wrong_inning = h.StandardPlay(BattingResult::Single());
    wrong_inning.inning = 2;
    Rejects(h, wrong_inning, RVC::Game_WrongHalfInning);

    RecordAtBatCommand phantom = h.Blank(BattingResult::Single());
    phantom.before = BaserunnerState{"p4"};
    phantom.after = BaserunnerState{phantom.batter_id, "p4"};
    Rejects(h, phantom, RVC::Game_BasesMismatch);
}

TEST(Recorder, StrikeoutWithRbiRejected)
{
    Harness h;
    h.Start();
    ASSERT_TRUE(h.Record(BattingResult::Triple()).has_value());

    RecordAtBatCommand cmd = h.StandardPlay(BattingResult::Strikeout());
    cmd.rbis = 1;
    Before const b = Capture(h);
    auto const r = h.recorder.RecordAtBat(cmd);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Rbi_OnOutResult);
    EXPECT_EQ(error::to_string(r.error().code), "Strikeouts and groundouts cannot have RBIs");
    ExpectUnchanged(h, b);
}

TEST(Recorder, RbisMustMatchRunsScored)
{
    Harness h;
    h.Start();
    ASSERT_TRUE(h.Record(BattingResult::Triple()).has_value());

    RecordAtBatCommand cmd = h.StandardPlay(BattingResult::Single());
    ASSERT_EQ(cmd.runs_scored, (std::vector<PlayerId>{"bat1"}));
    cmd.rbis = 0;
    Rejects(h, cmd, RVC::Rbi_CountMismatch);

    cmd.rbis = 1;
    auto const ab = h.recorder.RecordAtBat(cmd);
    ASSERT_TRUE(ab.has_value());
    EXPECT_EQ(ab->Rbis(), 1);
    EXPECT_EQ(h.game.Score(Side::Away), 1u);
}

TEST(Recorder, GrandSlamFourNotFive)
{
    Harness h;
    h.Start();
    for (int i = 0; i < 3; ++i) ASSERT_TRUE(h.Record(BattingResult::Walk()).has_value());
    ASSERT_TRUE(h.game.Bases().IsLoaded());

    RecordAtBatCommand cmd = h.StandardPlay(BattingResult::HomeRun());
    EXPECT_EQ(cmd.rbis, 4);
    cmd.rbis = 5;
    Rejects(h, cmd, RVC::Rbi_CountMismatch);

    cmd.rbis = 4;
    auto const ab = h.recorder.RecordAtBat(cmd);
    ASSERT_TRUE(ab.has_value());
    EXPECT_EQ(ab->RunsScored(), (std::vector<PlayerId>{"bat3", "bat2", "bat1", "bat4"}));
    EXPECT_TRUE(h.game.Bases().IsEmpty());
    EXPECT_EQ(h.game.Score(Side::Away), 4u);
    EXPECT_EQ(h.game.CurrentInning().runs, 4u);
}

TEST(Recorder, HomeRunMustClearBases)
{
    Harness h;
    h.Start();
    ASSERT_TRUE(h.Record(BattingResult::Single()).has_value());

    // batter ruled out on the bases, runner stays put
    RecordAtBatCommand cmd = h.Blank(BattingResult::HomeRun());
    cmd.parameters.running_error_occurred = true;
    cmd.running_errors = {cmd.batter_id};
    Rejects(h, cmd, RVC::HomeRun_BasesNotCleared);
}

TEST(Recorder, DuplicateScorerRejected)
{
    Harness h;
    h.Start();
    ASSERT_TRUE(h.Record(BattingResult::Triple()).has_value());

    RecordAtBatCommand cmd = h.StandardPlay(BattingResult::Single());
    cmd.runs_scored = {"bat1", "bat1"};
    cmd.rbis = 1;
    Rejects(h, cmd, RVC::Score_DuplicateScorer);
}

TEST(Recorder, RunningErrorAddsOut)
{
    Harness h;
    h.Start();
    ASSERT_TRUE(h.Record(BattingResult::Single()).has_value());

    RecordAtBatCommand cmd = h.Blank(BattingResult::Single());
    cmd.after = BaserunnerState{cmd.batter_id};
    cmd.running_errors = {"bat1"};
    Rejects(h, cmd, RVC::Config_RunningErrorWithoutFlag);

    cmd.parameters.running_error_occurred = true;
    auto const ab = h.recorder.RecordAtBat(cmd);
    ASSERT_TRUE(ab.has_value());
    EXPECT_EQ(ab->Outs(), 1);
    EXPECT_EQ(h.game.Outs(), 1);
    EXPECT_EQ(h.game.Bases(), BaserunnerState{"bat2"});
}

TEST(Recorder, PreviewNeverWrites)
{
    Harness h;
    h.Start();

    RecordAtBatCommand good = h.StandardPlay(BattingResult::Double());
    Before const b = Capture(h);
    EXPECT_TRUE(h.recorder.Preview(good).has_value());
    EXPECT_TRUE(h.recorder.Preview(good).has_value());
    ExpectUnchanged(h, b);

    RecordAtBatCommand bad = good;
    bad.rbis = 2;
    auto const first = h.recorder.Preview(bad);
    auto const second = h.recorder.Preview(bad);
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error(), second.error());
    ExpectUnchanged(h, b);

    EXPECT_TRUE(h.recorder.RecordAtBat(good).has_value());
}

TEST(Recorder, RejectionIsRepeatable)
{
    Harness h;
    h.Start();
    RecordAtBatCommand cmd = h.StandardPlay(BattingResult::Strikeout());
    cmd.rbis = 1;

    auto const a = h.recorder.RecordAtBat(cmd);
    auto const b = h.recorder.RecordAtBat(cmd);
    ASSERT_FALSE(a.has_value());
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(a.error(), b.error());
}

TEST(Recorder, StrictMatchingRejectsUndeclaredExtraBase)
{
    RuleConfiguration cfg{};
    cfg.strict_outcome_matching = true;
    Harness h({}, cfg);
    h.Start();
    ASSERT_TRUE(h.Record(BattingResult::Double()).has_value());

    RecordAtBatCommand cmd = h.Blank(BattingResult::Single());
    cmd.after = BaserunnerState{cmd.batter_id};
    cmd.runs_scored = {"bat1"};
    cmd.rbis = 1;
    Rejects(h, cmd, RVC::Config_OutcomeNotPermitted);

    cmd.parameters.aggressiveness = Aggressiveness::Aggressive;
    EXPECT_TRUE(h.recorder.RecordAtBat(cmd).has_value());
}
