#include "Game.hpp"

#include <algorithm>
#include <format>

namespace
{
    using namespace scorekeep::core;

    inline auto Viol(error::RuleViolationCode code) -> error::RuleViolation
    {
        return error::RuleViolation{ .code = code };
    }

    constexpr auto Idx(Side s) noexcept -> size_t { return static_cast<size_t>(s); }
}

namespace scorekeep::core
{
    GameImpl::GameImpl(GameId id, GameConfig const& config) :
        id_{std::move(id)},
        cfg_{config}
    {
        SKP_ASSERT(!id_.empty(), "game id must not be empty");
        SKP_ASSERT(cfg_.regulation_innings > 0, "regulation must be at least one inning");
    }

    auto GameImpl::Transition(GameStatus const from, GameStatus const to) -> error::ValidateResult
    {
        if (status_ != from)
            return std::unexpected(Viol(error::RuleViolationCode::Game_IllegalTransition)
                                   .with_game(id_).with_status(status_));
        status_ = to;
        return {};
    }

    auto GameImpl::Start() -> error::ValidateResult
    {
        if (status_ == GameStatus::Setup && !lineup_)
            return std::unexpected(Viol(error::RuleViolationCode::Game_LineupMissing).with_game(id_));

        if (auto r = Transition(GameStatus::Setup, GameStatus::InProgress); !r) return r;
        OpenHalfInning(1, Half::Top);
        return {};
    }

    auto GameImpl::Suspend() -> error::ValidateResult
    {
        return Transition(GameStatus::InProgress, GameStatus::Suspended);
    }

    auto GameImpl::Complete() -> error::ValidateResult
    {
        if (auto r = Transition(GameStatus::InProgress, GameStatus::Completed); !r) return r;
        completion_ = CompletionReason::Declared;
        return {};
    }

    auto GameImpl::CurrentInning() const -> Inning const&
    {
        if (innings_.empty())
            SKP_THROW(error::Code::State, std::format("game {} has not started", id_));
        return innings_.back();
    }

    auto GameImpl::Snapshot() const -> std::shared_ptr<GameSnapshot const>
    {
        auto s = std::make_shared<GameSnapshot>();
        s->game_id = id_;
        s->status = status_;
        s->completion = completion_;
        s->inning = inning_;
        s->half = half_;
        s->outs = outs_;
        s->bases = bases_;
        s->away_score = score_[Idx(Side::Away)];
        s->home_score = score_[Idx(Side::Home)];
        s->linescore = linescore_;
        s->at_bats = at_bat_count_;
        s->next_slot = next_slot_;
        s->our_side = cfg_.our_side;
        s->has_lineup = lineup_.has_value();
        return s;
    }

    auto GameImpl::AttachLineup(Lineup lineup) -> void
    {
        SKP_ASSERT(status_ == GameStatus::Setup, "lineup attached outside setup");
        std::ranges::sort(lineup.entries, {}, &LineupEntry::batting_order);
        lineup_ = std::move(lineup);
    }

    auto GameImpl::InningId(uint8_t const number, Half const h) const -> std::string
    {
        return std::format("{}-{}{}", id_, static_cast<int>(number), h == Half::Top ? 'T' : 'B');
    }

    auto GameImpl::NextAtBatId() const -> std::string
    {
        return std::format("{}-ab-{}", id_, at_bat_count_ + 1);
    }

    auto GameImpl::OpenHalfInning(uint8_t const number, Half const h) -> void
    {
        inning_ = number;
        half_ = h;
        outs_ = 0;
        bases_ = BaserunnerState::Empty();
        innings_.push_back(Inning{.id = InningId(number, h), .number = number, .half = h});
        if (linescore_.size() < number) linescore_.push_back(InningLine{.number = number});
    }

    auto GameImpl::ApplyAtBat(AtBat const& ab) -> void
    {
        SKP_ASSERT(status_ == GameStatus::InProgress, "at-bat applied to a game not in progress");
        SKP_ASSERT(outs_ + ab.Outs() <= constants::MaxOuts, "at-bat pushes outs past three");

        Side const side = BattingSide(half_);
        auto const runs = static_cast<uint32_t>(ab.RunsScored().size());

        Inning& cur = innings_.back();
        cur.at_bat_ids.push_back(ab.Id());
        cur.runs += runs;
        cur.outs = static_cast<uint8_t>(cur.outs + ab.Outs());

        score_[Idx(side)] += runs;
        InningLine& line = linescore_[inning_ - 1u];
        (side == Side::Away ? line.away : line.home) += runs;

        outs_ = cur.outs;
        bases_ = ab.After();
        next_slot_[Idx(side)] = static_cast<uint8_t>(ab.BattingPosition() % constants::LineupSize + 1);
        ++at_bat_count_;

        bool const late = inning_ >= cfg_.regulation_innings;
        if (half_ == Half::Bottom && late && score_[Idx(Side::Home)] > score_[Idx(Side::Away)])
        {
            cur.complete = true;
            Finish(CompletionReason::WalkOff);
            return;
        }

        if (outs_ >= constants::MaxOuts) EndHalfInning();
    }

    auto GameImpl::EndHalfInning() -> void
    {
        innings_.back().complete = true;
        bases_ = BaserunnerState::Empty();

        uint32_t const away = score_[Idx(Side::Away)];
        uint32_t const home = score_[Idx(Side::Home)];
        bool const late = inning_ >= cfg_.regulation_innings;

        // home already ahead: the bottom half is not played
        if (half_ == Half::Top && late && home > away) return Finish(CompletionReason::Regulation);
        if (half_ == Half::Bottom && late && home != away) return Finish(CompletionReason::Regulation);

        if (cfg_.mercy_rule && inning_ >= cfg_.mercy_min_inning)
        {
            uint32_t const diff = home > away ? home - away : away - home;
            bool const trailing_has_batted = half_ == Half::Bottom || home > away;
            if (trailing_has_batted && diff >= cfg_.mercy_run_differential) return Finish(CompletionReason::MercyRule);
        }

        if (half_ == Half::Top) return OpenHalfInning(inning_, Half::Bottom);

        // the inning counter is a byte; a game still level after the last one is called
        if (inning_ == constants::MaxInnings) return Finish(CompletionReason::Declared);
        OpenHalfInning(static_cast<uint8_t>(inning_ + 1), Half::Top);
    }

    auto GameImpl::Finish(CompletionReason const reason) -> void
    {
        status_ = GameStatus::Completed;
        completion_ = reason;
        bases_ = BaserunnerState::Empty();
    }
}
