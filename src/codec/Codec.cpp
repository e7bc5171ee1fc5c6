#include "Codec.hpp"

#include <chrono>
#include <format>
#include <utility>
#include <vector>

namespace gen = scorekeep::gen;

namespace scorekeep::core::codec
{
    auto ToFbResult(ResultKind const k) noexcept -> gen::ResultKind
    {
        switch (k)
        {
        case ResultKind::Single: return gen::ResultKind::Single;
        case ResultKind::Double: return gen::ResultKind::Double;
        case ResultKind::Triple: return gen::ResultKind::Triple;
        case ResultKind::HomeRun: return gen::ResultKind::HomeRun;
        case ResultKind::Walk: return gen::ResultKind::Walk;
        case ResultKind::IntentionalWalk: return gen::ResultKind::IntentionalWalk;
        case ResultKind::ReachedOnError: return gen::ResultKind::ReachedOnError;
        case ResultKind::FieldersChoice: return gen::ResultKind::FieldersChoice;
        case ResultKind::SacrificeFly: return gen::ResultKind::SacrificeFly;
        case ResultKind::Strikeout: return gen::ResultKind::Strikeout;
        case ResultKind::GroundOut: return gen::ResultKind::GroundOut;
        case ResultKind::AirOut: return gen::ResultKind::AirOut;
        case ResultKind::DoublePlay: return gen::ResultKind::DoublePlay;
        }
        return gen::ResultKind::Single;
    }

    auto FromFbResult(gen::ResultKind const k) noexcept -> ResultKind
    {
        switch (k)
        {
        case gen::ResultKind::Single: return ResultKind::Single;
        case gen::ResultKind::Double: return ResultKind::Double;
        case gen::ResultKind::Triple: return ResultKind::Triple;
        case gen::ResultKind::HomeRun: return ResultKind::HomeRun;
        case gen::ResultKind::Walk: return ResultKind::Walk;
        case gen::ResultKind::IntentionalWalk: return ResultKind::IntentionalWalk;
        case gen::ResultKind::ReachedOnError: return ResultKind::ReachedOnError;
        case gen::ResultKind::FieldersChoice: return ResultKind::FieldersChoice;
        case gen::ResultKind::SacrificeFly: return ResultKind::SacrificeFly;
        case gen::ResultKind::Strikeout: return ResultKind::Strikeout;
        case gen::ResultKind::GroundOut: return ResultKind::GroundOut;
        case gen::ResultKind::AirOut: return ResultKind::AirOut;
        case gen::ResultKind::DoublePlay: return ResultKind::DoublePlay;
        }
        return ResultKind::Single;
    }

    auto ToFbHalf(Half const h) noexcept -> gen::Half
    {
        return h == Half::Top ? gen::Half::Top : gen::Half::Bottom;
    }

    auto FromFbHalf(gen::Half const h) noexcept -> Half
    {
        return h == gen::Half::Top ? Half::Top : Half::Bottom;
    }

    auto ToFbStatus(GameStatus const s) noexcept -> gen::GameStatus
    {
        switch (s)
        {
        case GameStatus::Setup: return gen::GameStatus::Setup;
        case GameStatus::InProgress: return gen::GameStatus::InProgress;
        case GameStatus::Completed: return gen::GameStatus::Completed;
        case GameStatus::Suspended: return gen::GameStatus::Suspended;
        }
        return gen::GameStatus::Setup;
    }

    auto FromFbStatus(gen::GameStatus const s) noexcept -> GameStatus
    {
        switch (s)
        {
        case gen::GameStatus::Setup: return GameStatus::Setup;
        case gen::GameStatus::InProgress: return GameStatus::InProgress;
        case gen::GameStatus::Completed: return GameStatus::Completed;
        case gen::GameStatus::Suspended: return GameStatus::Suspended;
        }
        return GameStatus::Setup;
    }

    auto ToFbCompletion(CompletionReason const r) noexcept -> gen::CompletionReason
    {
        switch (r)
        {
        case CompletionReason::None: return gen::CompletionReason::Unfinished;
        case CompletionReason::Regulation: return gen::CompletionReason::Regulation;
        case CompletionReason::WalkOff: return gen::CompletionReason::WalkOff;
        case CompletionReason::MercyRule: return gen::CompletionReason::MercyRule;
        case CompletionReason::Declared: return gen::CompletionReason::Declared;
        }
        return gen::CompletionReason::Unfinished;
    }

    auto FromFbCompletion(gen::CompletionReason const r) noexcept -> CompletionReason
    {
        switch (r)
        {
        case gen::CompletionReason::Unfinished: return CompletionReason::None;
        case gen::CompletionReason::Regulation: return CompletionReason::Regulation;
        case gen::CompletionReason::WalkOff: return CompletionReason::WalkOff;
        case gen::CompletionReason::MercyRule: return CompletionReason::MercyRule;
        case gen::CompletionReason::Declared: return CompletionReason::Declared;
        }
        return CompletionReason::None;
    }

    auto ToFbAggressiveness(Aggressiveness const a) noexcept -> gen::Aggressiveness
    {
        switch (a)
        {
        case Aggressiveness::Conservative: return gen::Aggressiveness::Conservative;
        case Aggressiveness::Standard: return gen::Aggressiveness::Standard;
        case Aggressiveness::Aggressive: return gen::Aggressiveness::Aggressive;
        }
        return gen::Aggressiveness::Standard;
    }

    auto FromFbAggressiveness(gen::Aggressiveness const a) noexcept -> Aggressiveness
    {
        switch (a)
        {
        case gen::Aggressiveness::Conservative: return Aggressiveness::Conservative;
        case gen::Aggressiveness::Standard: return Aggressiveness::Standard;
        case gen::Aggressiveness::Aggressive: return Aggressiveness::Aggressive;
        }
        return Aggressiveness::Standard;
    }
}

namespace
{
    using namespace scorekeep::core;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)ResultKind::DoublePlay == (int)gen::ResultKind::DoublePlay);
    static_assert((int)GameStatus::Suspended == (int)gen::GameStatus::Suspended);
    static_assert((int)Aggressiveness::Aggressive == (int)gen::Aggressiveness::Aggressive);

    template <class E>
    auto InRange(E const e) noexcept -> bool
    {
        return static_cast<int>(e) >= static_cast<int>(E::MIN) && static_cast<int>(e) <= static_cast<int>(E::MAX);
    }

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto Opt(flatbuffers::String const* s) -> std::optional<PlayerId>
    {
        if (!s) return std::nullopt;
        return s->str();
    }

    auto Ids(flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>> const* v) -> std::vector<PlayerId>
    {
        std::vector<PlayerId> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* s : *v) out.push_back(s->str());
        return out;
    }

    auto ToFbBases(flatbuffers::FlatBufferBuilder& fbb, BaserunnerState const& b) -> flatbuffers::Offset<gen::Bases>
    {
        auto str = [&](Base const base) -> flatbuffers::Offset<flatbuffers::String>
        {
            auto const& occ = b.Occupant(base);
            return occ ? fbb.CreateString(*occ) : flatbuffers::Offset<flatbuffers::String>{};
        };
        auto const f = str(Base::First);
        auto const s = str(Base::Second);
        auto const t = str(Base::Third);
        return gen::CreateBases(fbb, f, s, t);
    }

    auto FromFbBases(gen::Bases const* b) -> BaserunnerState
    {
        if (!b) return BaserunnerState{};
        return BaserunnerState{Opt(b->first()), Opt(b->second()), Opt(b->third())};
    }

    auto Verified(std::span<std::byte const> bytes, gen::Record const expected)
        -> std::expected<gen::Envelope const*, codec::ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(codec::ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!gen::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(codec::ParseError{"verification failed"});

        auto const* env = gen::GetEnvelope(data);
        if (env->record_type() != expected)
            return std::unexpected(codec::ParseError{std::format("unexpected record type {}",
                                                                 static_cast<int>(env->record_type()))});
        return env;
    }
} // anonymous

namespace scorekeep::core::codec
{
    auto EncodeAtBat(AtBat const& ab) -> flatbuffers::DetachedBuffer
    {
        if (ab.Id().empty())
            SKP_THROW(error::Code::Serialization, "at-bat without id cannot be encoded");

        flatbuffers::FlatBufferBuilder fbb;

        auto const id = fbb.CreateString(ab.Id());
        auto const game_id = fbb.CreateString(ab.Game());
        auto const inning_id = fbb.CreateString(ab.InningId());
        auto const batter_id = fbb.CreateString(ab.Batter());
        auto const description = fbb.CreateString(ab.Description());
        auto const runs = fbb.CreateVectorOfStrings(ab.RunsScored());
        auto const running = fbb.CreateVectorOfStrings(ab.RunningErrors());
        auto const before = ToFbBases(fbb, ab.Before());
        auto const after = ToFbBases(fbb, ab.After());
        auto const params = gen::CreateParameters(fbb,
                                                  ToFbAggressiveness(ab.Parameters().aggressiveness),
                                                  ab.Parameters().error_occurred,
                                                  ab.Parameters().running_error_occurred);
        auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(ab.Timestamp().time_since_epoch());

        gen::AtBatRecordBuilder rb(fbb);
        rb.add_id(id);
        rb.add_game_id(game_id);
        rb.add_inning_id(inning_id);
        rb.add_batter_id(batter_id);
        rb.add_batting_position(ab.BattingPosition());
        rb.add_result(ToFbResult(ab.Result().Kind()));
        rb.add_description(description);
        rb.add_rbis(ab.Rbis());
        rb.add_runs_scored(runs);
        rb.add_running_errors(running);
        rb.add_before(before);
        rb.add_after(after);
        rb.add_parameters(params);
        rb.add_outs(ab.Outs());
        rb.add_timestamp_ms(ms.count());
        auto const rec = rb.Finish();

        auto const env = gen::CreateEnvelope(fbb, gen::Record::AtBatRecord, rec.Union());
        gen::FinishEnvelopeBuffer(fbb, env);
        return fbb.Release();
    }

    auto EncodeSnapshot(GameSnapshot const& s) -> flatbuffers::DetachedBuffer
    {
        if (s.game_id.empty())
            SKP_THROW(error::Code::Serialization, "snapshot without game id cannot be encoded");

        flatbuffers::FlatBufferBuilder fbb;

        auto const game_id = fbb.CreateString(s.game_id);
        auto const bases = ToFbBases(fbb, s.bases);

        std::vector<flatbuffers::Offset<gen::InningLine>> lines;
        lines.reserve(s.linescore.size());
        for (InningLine const& l : s.linescore)
            lines.push_back(gen::CreateInningLine(fbb, l.number, l.away, l.home));
        auto const line_vec = fbb.CreateVector(lines);

        gen::GameSnapshotRecordBuilder sb(fbb);
        sb.add_game_id(game_id);
        sb.add_status(ToFbStatus(s.status));
        sb.add_completion(ToFbCompletion(s.completion));
        sb.add_inning(s.inning);
        sb.add_half(ToFbHalf(s.half));
        sb.add_outs(s.outs);
        sb.add_bases(bases);
        sb.add_away_score(s.away_score);
        sb.add_home_score(s.home_score);
        sb.add_linescore(line_vec);
        sb.add_at_bats(s.at_bats);
        sb.add_away_next_slot(s.next_slot[static_cast<size_t>(Side::Away)]);
        sb.add_home_next_slot(s.next_slot[static_cast<size_t>(Side::Home)]);
        sb.add_our_side_home(s.our_side == Side::Home);
        sb.add_has_lineup(s.has_lineup);
        auto const rec = sb.Finish();

        auto const env = gen::CreateEnvelope(fbb, gen::Record::GameSnapshotRecord, rec.Union());
        gen::FinishEnvelopeBuffer(fbb, env);
        return fbb.Release();
    }

    auto DecodeAtBat(std::span<std::byte const> bytes) -> std::expected<AtBat, ParseError>
    {
        auto env = Verified(bytes, gen::Record::AtBatRecord);
        if (!env) return std::unexpected(std::move(env.error()));

        auto const* r = (*env)->record_as_AtBatRecord();
        if (!r->id() || !r->game_id() || !r->batter_id())
            return std::unexpected(ParseError{"at-bat missing id, game or batter"});
        if (!InRange(r->result()))
            return std::unexpected(ParseError{std::format("unknown result kind {}", static_cast<int>(r->result()))});

        SituationalParameters params{};
        if (auto const* p = r->parameters())
        {
            if (!InRange(p->aggressiveness()))
                return std::unexpected(ParseError{"unknown aggressiveness"});
            params = SituationalParameters{
                .aggressiveness = FromFbAggressiveness(p->aggressiveness()),
                .error_occurred = p->error_occurred(),
                .running_error_occurred = p->running_error_occurred()
            };
        }

        return AtBat{AtBatFields{
            .id = r->id()->str(),
            .game_id = r->game_id()->str(),
            .inning_id = Str(r->inning_id()),
            .batter_id = r->batter_id()->str(),
            .batting_position = r->batting_position(),
            .result = BattingResult{FromFbResult(r->result())},
            .description = Str(r->description()),
            .rbis = r->rbis(),
            .runs_scored = Ids(r->runs_scored()),
            .running_errors = Ids(r->running_errors()),
            .before = FromFbBases(r->before()),
            .after = FromFbBases(r->after()),
            .parameters = params,
            .outs = r->outs(),
            .timestamp = Clock::time_point{std::chrono::duration_cast<Clock::duration>(
                std::chrono::milliseconds{r->timestamp_ms()})}
        }};
    }

    auto DecodeSnapshot(std::span<std::byte const> bytes) -> std::expected<GameSnapshot, ParseError>
    {
        auto env = Verified(bytes, gen::Record::GameSnapshotRecord);
        if (!env) return std::unexpected(std::move(env.error()));

        auto const* r = (*env)->record_as_GameSnapshotRecord();
        if (!r->game_id())
            return std::unexpected(ParseError{"snapshot missing game id"});
        if (!InRange(r->status()) || !InRange(r->completion()) || !InRange(r->half()))
            return std::unexpected(ParseError{"snapshot enum out of range"});

        GameSnapshot s{};
        s.game_id = r->game_id()->str();
        s.status = FromFbStatus(r->status());
        s.completion = FromFbCompletion(r->completion());
        s.inning = r->inning();
        s.half = FromFbHalf(r->half());
        s.outs = r->outs();
        s.bases = FromFbBases(r->bases());
        s.away_score = r->away_score();
        s.home_score = r->home_score();
        if (auto const* lines = r->linescore())
        {
            s.linescore.reserve(lines->size());
            for (auto const* l : *lines)
                s.linescore.push_back(InningLine{.number = l->number(), .away = l->away(), .home = l->home()});
        }
        s.at_bats = r->at_bats();
        s.next_slot[static_cast<size_t>(Side::Away)] = r->away_next_slot();
        s.next_slot[static_cast<size_t>(Side::Home)] = r->home_next_slot();
        s.our_side = r->our_side_home() ? Side::Home : Side::Away;
        s.has_lineup = r->has_lineup();
        return s;
    }
}
