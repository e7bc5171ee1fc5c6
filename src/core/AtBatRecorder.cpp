#include "AtBatRecorder.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_set>

#include "Game.hpp"

namespace
{
    using namespace scorekeep::core;

    inline auto Viol(error::RuleViolationCode code) -> error::RuleViolation
    {
        return error::RuleViolation{ .code = code };
    }

    auto CarriesNoRbi(ResultKind const k) -> bool
    {
        return k == ResultKind::Strikeout || k == ResultKind::GroundOut || k == ResultKind::AirOut;
    }

    auto IsBlank(std::string_view const s) -> bool
    {
        return std::ranges::all_of(s, [](char const c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    }

    // UTF-8 code points; continuation bytes are 10xxxxxx
    auto CharacterCount(std::string_view const s) -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(s, [](char const c)
        {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }
}

namespace scorekeep::core
{
    AtBatRecorder::AtBatRecorder(GameStore& games,
                                 AtBatSink& sink,
                                 Rules const& rules,
                                 RuleConfiguration config,
                                 ClockFn clock) :
        games_{games},
        sink_{sink},
        rules_{rules},
        cfg_{std::move(config)},
        clock_{std::move(clock)}
    {
    }

    auto AtBatRecorder::Check(GameImpl const& game, RecordAtBatCommand const& cmd) const -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;
        ResultKind const kind = cmd.result.Kind();

        if (game.Status() != GameStatus::InProgress)
            return std::unexpected(Viol(RVC::Game_NotInProgress).with_game(game.Id()).with_status(game.Status()));

        if (IsBlank(cmd.batter_id))
            return std::unexpected(Viol(RVC::AtBat_BatterRequired).with_game(game.Id()));

        if (cmd.inning <= 0)
            return std::unexpected(Viol(RVC::AtBat_InningNotPositive).with_attempted(cmd.inning));

        if (cmd.rbis < 0)
            return std::unexpected(Viol(RVC::AtBat_NegativeRbis).with_rbis(cmd.rbis));

        if (size_t const chars = CharacterCount(cmd.description); chars > game.Config().max_description_length)
            return std::unexpected(Viol(RVC::AtBat_DescriptionTooLong)
                                   .with_attempted(static_cast<int>(chars))
                                   .with_expected(static_cast<int>(game.Config().max_description_length)));

        if (cmd.inning != game.InningNow() || cmd.half != game.HalfNow())
            return std::unexpected(Viol(RVC::Game_WrongHalfInning).with_game(game.Id())
                                   .with_inning(game.InningNow(), game.HalfNow())
                                   .with_attempted(cmd.inning));

        if (cmd.before != game.Bases())
            return std::unexpected(Viol(RVC::Game_BasesMismatch).with_game(game.Id()));

        if (CarriesNoRbi(kind) && cmd.rbis != 0)
            return std::unexpected(Viol(RVC::Rbi_OnOutResult).with_rbis(cmd.rbis).with_result(kind));

        std::unordered_set<PlayerId> const distinct(cmd.runs_scored.begin(), cmd.runs_scored.end());
        auto const scorers = static_cast<int>(distinct.size());
        bool const exempt = cfg_.AllowsRunsWithoutRbi(kind, cmd.parameters.error_occurred);
        if ((exempt && cmd.rbis > scorers) || (!exempt && cmd.rbis != scorers))
            return std::unexpected(Viol(RVC::Rbi_CountMismatch).with_rbis(cmd.rbis).with_expected(scorers)
                                   .with_result(kind));

        if (cmd.rbis > constants::MaxRbis)
            return std::unexpected(Viol(RVC::Rbi_OutOfRange).with_rbis(cmd.rbis));

        if (distinct.size() != cmd.runs_scored.size())
        {
            std::unordered_set<PlayerId> seen;
            for (PlayerId const& id : cmd.runs_scored)
            {
                if (!seen.insert(id).second)
                    return std::unexpected(Viol(RVC::Score_DuplicateScorer).with_player(id));
            }
        }

        ProposedPlay const play{
            .context = PlayContext{.before = cmd.before, .result = cmd.result, .batter = cmd.batter_id,
                                   .parameters = cmd.parameters},
            .after = cmd.after,
            .runs_scored = cmd.runs_scored,
            .rbis = cmd.rbis,
            .running_errors = cmd.running_errors,
            .outs_before = game.Outs()
        };
        if (auto r = rules_.Validate(play, cfg_); !r) return r;

        if (kind == ResultKind::HomeRun && !cmd.after.IsEmpty())
            return std::unexpected(Viol(RVC::HomeRun_BasesNotCleared).with_player(cmd.batter_id));

        return {};
    }

    auto AtBatRecorder::Preview(RecordAtBatCommand const& cmd) const -> error::ValidateResult
    {
        GameImpl const* game = games_.Find(cmd.game_id);
        if (!game)
            return std::unexpected(Viol(error::RuleViolationCode::Game_NotFound).with_game(cmd.game_id));
        return Check(*game, cmd);
    }

    auto AtBatRecorder::RecordAtBat(RecordAtBatCommand const& cmd) -> std::expected<AtBat, error::RuleViolation>
    {
        GameImpl* game = games_.Find(cmd.game_id);
        if (!game)
            return std::unexpected(Viol(error::RuleViolationCode::Game_NotFound).with_game(cmd.game_id));

        if (auto r = Check(*game, cmd); !r) return std::unexpected(std::move(r.error()));

        // our starters bat from their lineup slot; opponents and substitutes take the next slot
        Side const side = BattingSide(game->HalfNow());
        uint8_t position = game->NextSlot(side);
        if (side == game->Config().our_side && game->LineupOf())
        {
            if (auto const order = game->LineupOf()->OrderOf(cmd.batter_id)) position = *order;
        }

        AtBat ab{AtBatFields{
            .id = game->NextAtBatId(),
            .game_id = game->Id(),
            .inning_id = game->CurrentInning().id,
            .batter_id = cmd.batter_id,
            .batting_position = position,
            .result = cmd.result,
            .description = cmd.description,
            .rbis = static_cast<uint8_t>(cmd.rbis),
            .runs_scored = cmd.runs_scored,
            .running_errors = cmd.running_errors,
            .before = cmd.before,
            .after = cmd.after,
            .parameters = cmd.parameters,
            .outs = static_cast<uint8_t>(cmd.result.OutsRecorded() + cmd.running_errors.size()),
            .timestamp = clock_()
        }};

        game->ApplyAtBat(ab);
        games_.Save(*game);
        sink_.Append(ab);
        return ab;
    }
}
