#include "SoftballRules.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>
#include <unordered_set>

namespace
{
    using namespace scorekeep::core;
    using RVC = error::RuleViolationCode;

    inline auto Viol(RVC code) -> error::RuleViolation
    {
        return error::RuleViolation{ .code = code };
    }

    template <class>
    inline constexpr bool always_false = false;

    // Destinations: 0 = retired, 1..3 = base, 4 = scored.
    constexpr uint8_t Retired = 0;
    constexpr uint8_t Scored = constants::HomePlate;

    constexpr auto Cap(int d) noexcept -> uint8_t
    {
        return static_cast<uint8_t>(std::min<int>(d, Scored));
    }

    auto Range(int lo, int hi) -> std::vector<uint8_t>
    {
        std::vector<uint8_t> out;
        for (int d = lo; d <= std::min<int>(hi, Scored); ++d) out.push_back(static_cast<uint8_t>(d));
        return out;
    }

    struct Lane
    {
        uint8_t start;
        PlayerId id;
        // a batter taking first pushes this runner
        bool forced;
    };

    // Runners first to third.
    auto LanesOf(BaserunnerState const& s) -> std::vector<Lane>
    {
        return std::visit([]<typename T0>(T0 const& sh) -> std::vector<Lane>
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, BasesEmpty>)
                return {};
            else if constexpr (std::is_same_v<T, RunnerOnFirst>)
                return {{1, sh.first, true}};
            else if constexpr (std::is_same_v<T, RunnerOnSecond>)
                return {{2, sh.second, false}};
            else if constexpr (std::is_same_v<T, RunnerOnThird>)
                return {{3, sh.third, false}};
            else if constexpr (std::is_same_v<T, RunnersOnFirstSecond>)
                return {{1, sh.first, true}, {2, sh.second, true}};
            else if constexpr (std::is_same_v<T, RunnersOnFirstThird>)
                return {{1, sh.first, true}, {3, sh.third, false}};
            else if constexpr (std::is_same_v<T, RunnersOnSecondThird>)
                return {{2, sh.second, false}, {3, sh.third, false}};
            else if constexpr (std::is_same_v<T, BasesLoaded>)
                return {{1, sh.first, true}, {2, sh.second, true}, {3, sh.third, true}};
            else
                static_assert(always_false<T>, "unhandled base shape");
        }, s.Shape());
    }

    enum class Tier : uint8_t
    {
        Standard,
        Conservative,
        Aggressive,
        FieldingError,
        RunningError
    };
    constexpr std::array<Tier, 5> AllTiers{Tier::Standard, Tier::Conservative, Tier::Aggressive,
                                           Tier::FieldingError, Tier::RunningError};

    auto TierName(Tier t) -> std::string_view
    {
        switch (t)
        {
        case Tier::Standard: return "standard";
        case Tier::Conservative: return "runners hold";
        case Tier::Aggressive: return "extra base";
        case Tier::FieldingError: return "on error";
        case Tier::RunningError: return "out on the bases";
        }
        return "?";
    }

    auto NeedsFor(Tier t) -> SituationalParameters
    {
        switch (t)
        {
        case Tier::Standard: return {};
        case Tier::Conservative: return {.aggressiveness = Aggressiveness::Conservative};
        case Tier::Aggressive: return {.aggressiveness = Aggressiveness::Aggressive};
        case Tier::FieldingError: return {.error_occurred = true};
        case Tier::RunningError: return {.running_error_occurred = true};
        }
        return {};
    }

    // Candidate destinations for the batter and each lane, plus the exact outs the play makes.
    struct Plan
    {
        std::vector<uint8_t> batter;
        std::vector<std::vector<uint8_t>> lanes;
        uint8_t outs{};
    };

    // Runner retired on a force/choice play: the one on first, else the lead runner.
    auto VictimOf(std::vector<Lane> const& lanes) -> size_t
    {
        return lanes.front().start == 1 ? 0 : lanes.size() - 1;
    }

    auto PlanFor(BattingResult const result, Tier const tier, std::vector<Lane> const& lanes,
                 RuleConfiguration const& cfg) -> std::optional<Plan>
    {
        int const k = result.BatterBases();
        uint8_t const outs = result.OutsRecorded();

        auto per_lane = [&](auto&& fn) -> std::vector<std::vector<uint8_t>>
        {
            std::vector<std::vector<uint8_t>> out;
            out.reserve(lanes.size());
            for (size_t i{}; i < lanes.size(); ++i) out.push_back(fn(lanes[i], i));
            return out;
        };
        auto hit_dest = [&](Lane const& l) -> int { return Cap(l.start + k); };
        auto walk_dest = [&](Lane const& l) -> int { return l.forced ? l.start + 1 : l.start; };

        switch (result.Kind())
        {
        case ResultKind::Single:
        case ResultKind::Double:
        case ResultKind::Triple:
            switch (tier)
            {
            case Tier::Standard:
                return Plan{{static_cast<uint8_t>(k)},
                            per_lane([&](Lane const& l, size_t) { return Range(hit_dest(l), hit_dest(l)); }), 0};
            case Tier::Conservative:
                return Plan{{static_cast<uint8_t>(k)},
                            per_lane([&](Lane const& l, size_t) { return Range(l.start, hit_dest(l)); }), 0};
            case Tier::Aggressive:
                return Plan{{static_cast<uint8_t>(k)},
                            per_lane([&](Lane const& l, size_t) { return Range(hit_dest(l), hit_dest(l) + 1); }), 0};
            case Tier::FieldingError:
                return Plan{Range(k, k + 1),
                            per_lane([&](Lane const& l, size_t) { return Range(hit_dest(l), hit_dest(l) + 1); }), 0};
            case Tier::RunningError:
                if (!cfg.running_error_variations) return std::nullopt;
                return Plan{{static_cast<uint8_t>(k), Retired},
                            per_lane([&](Lane const& l, size_t)
                            {
                                return std::vector<uint8_t>{static_cast<uint8_t>(hit_dest(l)), Retired};
                            }), 1};
            }
            break;

        case ResultKind::HomeRun:
            if (tier != Tier::Standard) return std::nullopt;
            return Plan{{Scored}, per_lane([](Lane const&, size_t) { return std::vector<uint8_t>{Scored}; }), 0};

        case ResultKind::Walk:
        case ResultKind::IntentionalWalk:
        case ResultKind::ReachedOnError:
            switch (tier)
            {
            case Tier::Standard:
                return Plan{{1}, per_lane([&](Lane const& l, size_t) { return Range(walk_dest(l), walk_dest(l)); }), 0};
            case Tier::FieldingError:
                if (result.Kind() != ResultKind::ReachedOnError) return std::nullopt;
                return Plan{{1, 2},
                            per_lane([&](Lane const& l, size_t) { return Range(walk_dest(l), walk_dest(l) + 1); }), 0};
            case Tier::RunningError:
                if (!cfg.running_error_variations) return std::nullopt;
                return Plan{{1},
                            per_lane([&](Lane const& l, size_t)
                            {
                                return std::vector<uint8_t>{static_cast<uint8_t>(walk_dest(l)), Retired};
                            }), 1};
            case Tier::Conservative:
            case Tier::Aggressive:
                return std::nullopt;
            }
            break;

        case ResultKind::FieldersChoice:
        case ResultKind::DoublePlay:
        {
            if (lanes.empty()) return std::nullopt;
            bool const dp = result.Kind() == ResultKind::DoublePlay;
            std::vector<uint8_t> const batter{dp ? Retired : uint8_t{1}};
            if (tier == Tier::Standard)
            {
                size_t const victim = VictimOf(lanes);
                return Plan{batter, per_lane([&](Lane const& l, size_t i)
                {
                    return i == victim ? std::vector<uint8_t>{Retired} : std::vector<uint8_t>{l.start};
                }), outs};
            }
            if (tier == Tier::Aggressive)
            {
                return Plan{batter, per_lane([&](Lane const& l, size_t)
                {
                    auto v = Range(l.start, l.start + 1);
                    v.insert(v.begin(), Retired);
                    return v;
                }), outs};
            }
            return std::nullopt;
        }

        case ResultKind::SacrificeFly:
            if (tier == Tier::Standard)
                return Plan{{Retired}, per_lane([](Lane const& l, size_t) { return Range(l.start + 1, l.start + 1); }), outs};
            if (tier == Tier::Conservative)
                return Plan{{Retired}, per_lane([](Lane const& l, size_t)
                {
                    return l.start == 3 ? std::vector<uint8_t>{Scored} : Range(l.start, l.start + 1);
                }), outs};
            return std::nullopt;

        case ResultKind::Strikeout:
        case ResultKind::GroundOut:
        case ResultKind::AirOut:
            if (tier == Tier::Standard)
                return Plan{{Retired}, per_lane([](Lane const& l, size_t) { return std::vector<uint8_t>{l.start}; }), outs};
            if (tier == Tier::Aggressive && result.Kind() == ResultKind::GroundOut)
                return Plan{{Retired}, per_lane([](Lane const& l, size_t) { return Range(l.start, l.start + 1); }), outs};
            // a runner scoring from third on a caught fly is a sacrifice fly
            if (tier == Tier::Aggressive && result.Kind() == ResultKind::AirOut)
                return Plan{{Retired}, per_lane([](Lane const& l, size_t)
                {
                    return l.start == 3 ? std::vector<uint8_t>{3} : Range(l.start, l.start + 1);
                }), outs};
            return std::nullopt;
        }
        return std::nullopt;
    }

    struct Move
    {
        PlayerId const* id;
        uint8_t start;
        uint8_t dest;
    };

    // Index of a trailing runner who finished level with or ahead of a runner who started
    // ahead and neither scored nor was retired. Moves are ordered by start, batter first.
    auto FindPassing(std::span<Move const> moves) -> std::optional<size_t>
    {
        for (size_t t{}; t < moves.size(); ++t)
        {
            if (moves[t].dest == Retired) continue;
            for (size_t l = t + 1; l < moves.size(); ++l)
            {
                if (moves[l].dest == Retired || moves[l].dest == Scored) continue;
                if (moves[t].dest == Scored || moves[t].dest >= moves[l].dest) return t;
            }
        }
        return std::nullopt;
    }

    // Cartesian product of the plan, keeping placements with the plan's outs and no passing.
    auto Expand(Plan const& plan, std::vector<Lane> const& lanes, PlayerId const& batter)
        -> std::vector<std::vector<uint8_t>>
    {
        std::vector<std::vector<uint8_t>> partial{{}};
        std::vector<std::vector<uint8_t> const*> choices;
        choices.push_back(&plan.batter);
        for (auto const& c : plan.lanes) choices.push_back(&c);

        for (auto const* c : choices)
        {
            std::vector<std::vector<uint8_t>> next;
            next.reserve(partial.size() * c->size());
            for (auto const& p : partial)
            {
                for (uint8_t const d : *c)
                {
                    auto q = p;
                    q.push_back(d);
                    next.push_back(std::move(q));
                }
            }
            partial = std::move(next);
        }

        std::vector<std::vector<uint8_t>> out;
        for (auto& dests : partial)
        {
            auto const outs = std::ranges::count(dests, Retired);
            if (outs != plan.outs) continue;

            std::vector<Move> moves;
            moves.push_back({&batter, 0, dests[0]});
            for (size_t i{}; i < lanes.size(); ++i) moves.push_back({&lanes[i].id, lanes[i].start, dests[i + 1]});
            if (FindPassing(moves)) continue;

            out.push_back(std::move(dests));
        }
        return out;
    }

    auto Contains(std::vector<PlayerId> const& v, PlayerId const& id) -> bool
    {
        return std::ranges::find(v, id) != v.end();
    }

    // Scorers who would have scored without the error.
    auto EarnedRuns(std::vector<PlayerId> const& scored, std::optional<AdvancementOutcome> const& standard) -> int
    {
        if (!standard) return 0;
        return static_cast<int>(std::ranges::count_if(scored, [&](PlayerId const& id)
        {
            return Contains(standard->runs_scored, id);
        }));
    }

    auto IsUnearnedByRule(ResultKind const k) -> bool
    {
        return k == ResultKind::GroundOut || k == ResultKind::DoublePlay;
    }
}

namespace scorekeep::core
{
    auto SoftballRules::AllOutcomes(BaserunnerState const& before,
                                    BattingResult const result,
                                    PlayerId const& batter,
                                    RuleConfiguration const& cfg) const -> std::vector<AdvancementOutcome>
    {
        std::vector<Lane> const lanes = LanesOf(before);
        std::vector<AdvancementOutcome> out;
        std::optional<AdvancementOutcome> standard{};

        for (Tier const tier : AllTiers)
        {
            std::optional<Plan> const plan = PlanFor(result, tier, lanes, cfg);
            if (!plan) continue;

            for (auto const& dests : Expand(*plan, lanes, batter))
            {
                AdvancementOutcome o{};
                o.needs = NeedsFor(tier);

                for (size_t i{}; i < lanes.size(); ++i)
                {
                    uint8_t const d = dests[i + 1];
                    if (d == Scored) o.runs_scored.push_back(lanes[i].id);
                    else if (d == Retired) { if (tier == Tier::RunningError) o.running_errors.push_back(lanes[i].id); }
                    else o.after = o.after.With(static_cast<Base>(d), lanes[i].id);
                }
                if (dests[0] == Scored) o.runs_scored.push_back(batter);
                else if (dests[0] == Retired && tier == Tier::RunningError) o.running_errors.push_back(batter);
                else if (dests[0] != Retired) o.after = o.after.With(static_cast<Base>(dests[0]), batter);

                o.outs = static_cast<uint8_t>(std::ranges::count(dests, Retired));

                auto const runs = static_cast<int>(o.runs_scored.size());
                int rbis = runs;
                if (IsUnearnedByRule(result.Kind()))
                    rbis = 0;
                else if (result.Kind() == ResultKind::ReachedOnError && cfg.error_attribution)
                    rbis = 0;
                else if (tier == Tier::FieldingError && cfg.error_attribution)
                    rbis = EarnedRuns(o.runs_scored, standard);
                o.rbis = static_cast<uint8_t>(std::min<int>(rbis, constants::MaxRbis));

                o.description = std::format("{} ({}): {} -> {}, {} run(s), {} out(s)",
                                            result.Notation(), TierName(tier), before.ToString(),
                                            o.after.ToString(), runs, o.outs);

                bool const dup = std::ranges::any_of(out, [&](AdvancementOutcome const& e) { return e.SamePlay(o); });
                if (!dup) out.push_back(std::move(o));
                if (tier == Tier::Standard && !standard) standard = out.back();
            }
        }
        return out;
    }

    auto SoftballRules::StandardOutcome(BaserunnerState const& before,
                                        BattingResult const result,
                                        PlayerId const& batter,
                                        RuleConfiguration const& cfg) const -> std::optional<AdvancementOutcome>
    {
        auto all = AllOutcomes(before, result, batter, cfg);
        if (all.empty() || all.front().needs != SituationalParameters{}) return std::nullopt;
        return all.front();
    }

    auto SoftballRules::ValidOutcomes(PlayContext const& ctx,
                                      RuleConfiguration const& cfg) const -> std::vector<AdvancementOutcome>
    {
        auto all = AllOutcomes(ctx.before, ctx.result, ctx.batter, cfg);
        std::optional<AdvancementOutcome> standard{};
        if (!all.empty() && all.front().needs == SituationalParameters{}) standard = all.front();

        std::vector<AdvancementOutcome> out;
        for (AdvancementOutcome& o : all)
        {
            if (!o.IsAllowedUnder(ctx.parameters)) continue;
            // once an error is declared, runs beyond the clean play are the error's
            if (ctx.parameters.error_occurred && cfg.error_attribution)
                o.rbis = static_cast<uint8_t>(std::min<int>(o.rbis, EarnedRuns(o.runs_scored, standard)));
            bool const dup = std::ranges::any_of(out, [&](AdvancementOutcome const& e) { return e.SamePlay(o); });
            if (!dup) out.push_back(std::move(o));
        }
        return out;
    }

    auto SoftballRules::Validate(ProposedPlay const& play, RuleConfiguration const& cfg) const -> CheckResult
    {
        if (auto r = CheckNonNegotiable(play, cfg); !r) return r;
        return CheckConfigurable(play, cfg);
    }

    auto SoftballRules::CheckNonNegotiable(ProposedPlay const& play, RuleConfiguration const& cfg) -> CheckResult
    {
        BaserunnerState const& before = play.context.before;
        BaserunnerState const& after = play.after;
        PlayerId const& batter = play.context.batter;
        ResultKind const kind = play.context.result.Kind();

        auto involved = [&](PlayerId const& id) { return id == batter || before.HasRunner(id); };

        // 1) integrity
        if (before.HasDuplicateRunner() || after.HasDuplicateRunner())
            return std::unexpected(Viol(RVC::Bases_DuplicateRunner).with_result(kind));

        if (before.HasRunner(batter))
            return std::unexpected(Viol(RVC::Bases_BatterAlreadyOnBase).with_player(batter)
                                   .with_base(*before.BaseOf(batter)));

        for (Base const b : AllBases)
        {
            auto const& occ = after.Occupant(b);
            if (occ && !involved(*occ))
                return std::unexpected(Viol(RVC::Bases_UnknownRunner).with_player(*occ).with_base(b));
        }

        std::unordered_set<PlayerId> scorers;
        for (PlayerId const& id : play.runs_scored)
        {
            if (!involved(id))
                return std::unexpected(Viol(RVC::Bases_UnknownRunner).with_player(id));
            if (!scorers.insert(id).second)
                return std::unexpected(Viol(RVC::Score_DuplicateScorer).with_player(id));
            if (after.HasRunner(id))
                return std::unexpected(Viol(RVC::Advance_RunnerAccounting).with_player(id)
                                       .with_base(*after.BaseOf(id)));
        }

        std::unordered_set<PlayerId> retired;
        for (PlayerId const& id : play.running_errors)
        {
            if (!involved(id))
                return std::unexpected(Viol(RVC::Out_RunningErrorUnknownRunner).with_player(id));
            if (!retired.insert(id).second)
                return std::unexpected(Viol(RVC::Out_DuplicateRunningError).with_player(id));
            if (after.HasRunner(id) || scorers.contains(id))
                return std::unexpected(Viol(RVC::Out_RunningErrorRunnerStillActive).with_player(id));
        }

        // 2) no backward movement
        for (Base const b : AllBases)
        {
            auto const& occ = before.Occupant(b);
            if (!occ) continue;
            if (auto const now = after.BaseOf(*occ); now && *now < b)
                return std::unexpected(Viol(RVC::Advance_RunnerMovedBackward).with_player(*occ).with_base(*now));
        }

        // 3) no passing
        auto dest_of = [&](PlayerId const& id) -> uint8_t
        {
            if (auto const b = after.BaseOf(id)) return static_cast<uint8_t>(*b);
            if (scorers.contains(id)) return Scored;
            return Retired;
        };
        std::vector<Move> moves;
        moves.push_back({&batter, 0, dest_of(batter)});
        for (Base const b : AllBases)
        {
            if (auto const& occ = before.Occupant(b))
                moves.push_back({&*occ, static_cast<uint8_t>(b), dest_of(*occ)});
        }
        if (auto const passer = FindPassing(moves))
            return std::unexpected(Viol(RVC::Advance_RunnerPassed).with_player(*moves[*passer].id));

        // 4) accounting
        size_t const outs_on_play = play.OutsOnPlay();
        size_t const accounted = after.RunnerCount() + scorers.size() + outs_on_play;
        size_t const participants = before.RunnerCount() + 1;
        if (accounted != participants)
            return std::unexpected(Viol(RVC::Advance_RunnerAccounting)
                                   .with_expected(static_cast<int>(participants))
                                   .with_attempted(static_cast<int>(accounted)));

        // 5) max outs
        if (outs_on_play > constants::MaxOuts || play.outs_before + outs_on_play > constants::MaxOuts)
            return std::unexpected(Viol(RVC::Advance_TooManyOuts)
                                   .with_outs(play.outs_before)
                                   .with_attempted(static_cast<int>(outs_on_play))
                                   .with_expected(constants::MaxOuts - play.outs_before));

        // 6) RBI bound
        if (play.rbis < 0 || play.rbis > constants::MaxRbis)
            return std::unexpected(Viol(RVC::Rbi_OutOfRange).with_rbis(play.rbis));

        auto const distinct = static_cast<int>(scorers.size());
        bool const exempt = cfg.AllowsRunsWithoutRbi(kind, play.context.parameters.error_occurred);
        if ((exempt && play.rbis > distinct) || (!exempt && play.rbis != distinct))
            return std::unexpected(Viol(RVC::Rbi_CountMismatch).with_rbis(play.rbis).with_expected(distinct)
                                   .with_result(kind));

        return {};
    }

    auto SoftballRules::CheckConfigurable(ProposedPlay const& play, RuleConfiguration const& cfg) const -> CheckResult
    {
        PlayContext const& ctx = play.context;
        ResultKind const kind = ctx.result.Kind();

        if (cfg.error_attribution && (kind == ResultKind::ReachedOnError || ctx.parameters.error_occurred))
        {
            int const earned = kind == ResultKind::ReachedOnError
                                   ? 0
                                   : EarnedRuns(play.runs_scored, StandardOutcome(ctx.before, ctx.result, ctx.batter, cfg));
            if (play.rbis > earned)
                return std::unexpected(Viol(RVC::Config_ErrorRunCreditedAsRbi).with_rbis(play.rbis)
                                       .with_expected(earned).with_result(kind));
        }

        if (cfg.running_error_variations && !play.running_errors.empty() && !ctx.parameters.running_error_occurred)
            return std::unexpected(Viol(RVC::Config_RunningErrorWithoutFlag)
                                   .with_player(play.running_errors.front()));

        if (cfg.strict_outcome_matching)
        {
            std::unordered_set<PlayerId> const proposed(play.runs_scored.begin(), play.runs_scored.end());
            auto const permitted = ValidOutcomes(ctx, cfg);
            bool const found = std::ranges::any_of(permitted, [&](AdvancementOutcome const& o)
            {
                std::unordered_set<PlayerId> const runs(o.runs_scored.begin(), o.runs_scored.end());
                return o.after == play.after && runs == proposed && o.rbis == play.rbis
                    && o.outs == play.OutsOnPlay();
            });
            if (!found)
                return std::unexpected(Viol(RVC::Config_OutcomeNotPermitted).with_result(kind)
                                       .with_attempted(static_cast<int>(permitted.size())));
        }

        return {};
    }
}
