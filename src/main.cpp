#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "core/AtBatRecorder.hpp"
#include "core/Exception.hpp"
#include "core/Game.hpp"
#include "core/LineupValidator.hpp"
#include "core/RandomScorer.hpp"
#include "core/SoftballRules.hpp"
#include "codec/Codec.hpp"
#include "debug/MemoryStore.hpp"
#include "debug/ScorebookLogger.hpp"

namespace
{
    using namespace scorekeep::core;

    constexpr uint32_t MaxPlaysPerGame = 1000;

    struct CliConfig
    {
        std::string command{"simulate"};

        // simulate
        std::uint64_t seed{20251019ULL};
        std::uint32_t games{1};
        std::uint8_t innings{7};
        std::string log_dir{"_scorebooks"};
        std::optional<std::string> out{};

        // outcomes
        std::string bases{",,"};
        std::string result{"1B"};
        SituationalParameters params{};

        RuleConfiguration rules{};
    };

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        CliConfig cfg{};
        int i = 1;
        if (argc > 1 && argv[1][0] != '-')
        {
            cfg.command = argv[1];
            i = 2;
        }

        for (; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };
            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--games")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.games = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--innings")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0 && v <= constants::MaxInnings) { cfg.innings = static_cast<std::uint8_t>(v); }
                else std::println(stderr, "--innings must be 1..{}, keeping {}", constants::MaxInnings, cfg.innings);
            }
            else if (arg == "--log")
            {
                (void)next_str(cfg.log_dir);
            }
            else if (arg == "--out")
            {
                std::string v;
                if (next_str(v)) { cfg.out = v; }
            }
            else if (arg == "--bases")
            {
                (void)next_str(cfg.bases);
            }
            else if (arg == "--result")
            {
                (void)next_str(cfg.result);
            }
            else if (arg == "--aggressive")
            {
                cfg.params.aggressiveness = Aggressiveness::Aggressive;
            }
            else if (arg == "--conservative")
            {
                cfg.params.aggressiveness = Aggressiveness::Conservative;
            }
            else if (arg == "--error")
            {
                cfg.params.error_occurred = true;
            }
            else if (arg == "--running-error")
            {
                cfg.params.running_error_occurred = true;
            }
            else if (arg == "--strict")
            {
                cfg.rules.strict_outcome_matching = true;
            }
            else if (arg == "--no-error-attribution")
            {
                cfg.rules.error_attribution = false;
            }
            else if (arg == "--no-running-errors")
            {
                cfg.rules.running_error_variations = false;
            }
            else
            {
                std::println(stderr, "ignoring unknown argument {}", arg);
            }
        }
        return cfg;
    }

    // "p2,,p4" -> first p2, third p4
    auto ParseBases(std::string_view text) -> BaserunnerState
    {
        std::array<std::optional<PlayerId>, 3> slots{};
        size_t idx{};
        size_t from{};
        while (idx < slots.size())
        {
            size_t const comma = text.find(',', from);
            std::string_view const part = text.substr(from, comma == std::string_view::npos ? text.npos : comma - from);
            if (!part.empty()) slots[idx] = std::string{part};
            ++idx;
            if (comma == std::string_view::npos) break;
            from = comma + 1;
        }
        return BaserunnerState{slots[0], slots[1], slots[2]};
    }

    auto MakeLineup(GameId const& game_id) -> SetupLineupCommand
    {
        static constexpr std::array<Position, 9> fielders{
            Position::Pitcher, Position::Catcher, Position::FirstBase, Position::SecondBase, Position::ThirdBase,
            Position::Shortstop, Position::LeftField, Position::CenterField, Position::RightField
        };
        SetupLineupCommand cmd{.game_id = game_id};
        for (int i = 1; i <= 9; ++i)
            cmd.entries.push_back(LineupEntry{i, std::format("p{}", i), fielders[i - 1]});
        cmd.substitutes = {"p10", "p11"};
        return cmd;
    }

    auto WriteRecord(std::ofstream& out, flatbuffers::DetachedBuffer const& buf) -> void
    {
        auto const size = static_cast<std::uint32_t>(buf.size());
        std::array<char, 4> prefix{
            static_cast<char>(size & 0xFF), static_cast<char>((size >> 8) & 0xFF),
            static_cast<char>((size >> 16) & 0xFF), static_cast<char>((size >> 24) & 0xFF)
        };
        out.write(prefix.data(), prefix.size());
        out.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    }

    auto SimulateOne(CliConfig const& cfg, std::uint64_t seed, std::ofstream* records) -> int
    {
        GameId const id = std::format("g{}", seed);
        GameConfig game_cfg{};
        game_cfg.regulation_innings = cfg.innings;
        game_cfg.mercy_min_inning = std::min<std::uint8_t>(game_cfg.mercy_min_inning, cfg.innings);

        debug::MemoryStore store;
        GameImpl& game = store.Create(id, game_cfg);
        for (int i = 1; i <= 11; ++i) store.AddPlayer(std::format("p{}", i));

        SoftballRules const rules;
        LineupValidator lineups(store, store);
        AtBatRecorder recorder(store, store, rules, cfg.rules);
        RandomScorer scorer(seed, rules, cfg.rules);

        if (auto r = lineups.SetupLineup(MakeLineup(id)); !r)
        {
            std::println(stderr, "lineup rejected: {}", error::describe(r.error()));
            return 1;
        }
        if (auto r = game.Start(); !r)
        {
            std::println(stderr, "cannot start: {}", error::describe(r.error()));
            return 1;
        }

        debug::ScorebookLogger log(std::format("{}/{}.log", cfg.log_dir, id));
        log.start(*game.Snapshot(), seed, cfg.rules);

        uint32_t plays{};
        while (game.Status() == GameStatus::InProgress && plays < MaxPlaysPerGame)
        {
            auto const before = game.Snapshot();
            size_t const half_index = game.Innings().size() - 1;
            RecordAtBatCommand const cmd = scorer.Next(*before, *game.LineupOf());

            auto const ab = recorder.RecordAtBat(cmd);
            if (!ab)
            {
                log.rejected(cmd, ab.error());
                log.flush();
                std::println(stderr, "{}: scorer produced a rejected play: {}", id, error::describe(ab.error()));
                return 1;
            }
            ++plays;

            log.play(*ab, *game.Snapshot());
            if (game.Innings()[half_index].complete) log.half_inning(game.Innings()[half_index]);
            if (records) WriteRecord(*records, codec::EncodeAtBat(*ab));
        }

        if (game.Status() == GameStatus::InProgress)
        {
            if (auto r = game.Complete(); !r)
            {
                std::println(stderr, "cannot complete: {}", error::describe(r.error()));
                return 1;
            }
        }

        auto const final_snap = game.Snapshot();
        log.end(*final_snap);
        if (records) WriteRecord(*records, codec::EncodeSnapshot(*final_snap));

        std::println("{}: away {} - home {} after {} plate appearances ({})",
                     id, final_snap->away_score, final_snap->home_score, final_snap->at_bats,
                     to_string(final_snap->completion));
        return 0;
    }

    auto RunSimulate(CliConfig const& cfg) -> int
    {
        std::filesystem::create_directories(cfg.log_dir);

        std::optional<std::ofstream> records{};
        if (cfg.out)
        {
            records.emplace(*cfg.out, std::ios::binary | std::ios::trunc);
            if (!*records)
            {
                std::println(stderr, "cannot open {}", *cfg.out);
                return 1;
            }
        }

        for (std::uint32_t g = 0; g < cfg.games; ++g)
        {
            if (int const rc = SimulateOne(cfg, cfg.seed + g, records ? &*records : nullptr); rc != 0) return rc;
        }
        return 0;
    }

    auto RunOutcomes(CliConfig const& cfg) -> int
    {
        auto const result = BattingResult::Parse(cfg.result);
        if (!result)
        {
            std::println(stderr, "unknown result '{}' (use 1B 2B 3B HR BB IBB E FC SF SO GO AO DP)", cfg.result);
            return 2;
        }

        SoftballRules const rules;
        PlayContext const ctx{
            .before = ParseBases(cfg.bases), .result = *result, .batter = "batter", .parameters = cfg.params
        };
        if (ctx.before.HasDuplicateRunner() || ctx.before.HasRunner(ctx.batter))
        {
            std::println(stderr, "invalid base state {}", ctx.before.ToString());
            return 2;
        }

        auto const outcomes = rules.ValidOutcomes(ctx, cfg.rules);
        std::println("{} with {} ({}{}{}): {} outcome(s)", result->Name(), ctx.before.ToString(),
                     to_string(cfg.params.aggressiveness), cfg.params.error_occurred ? ", error" : "",
                     cfg.params.running_error_occurred ? ", running error" : "", outcomes.size());
        for (AdvancementOutcome const& o : outcomes)
        {
            std::println("  {} rbi={}", o.description, static_cast<int>(o.rbis));
        }
        return 0;
    }
} // anonymous namespace

int main(int argc, char** argv)
{
    CliConfig const cfg = ParseArgs(argc, argv);

    try
    {
        if (cfg.command == "simulate") return RunSimulate(cfg);
        if (cfg.command == "outcomes") return RunOutcomes(cfg);

        std::println(stderr, "usage: scorekeep simulate [--seed N] [--games N] [--innings N] [--log DIR] [--out FILE]");
        std::println(stderr, "       scorekeep outcomes --bases A,B,C --result 1B [--aggressive|--conservative]"
                             " [--error] [--running-error]");
        return 2;
    }
    catch (scorekeep::core::OmegaException<scorekeep::core::error::Code> const& e)
    {
        std::println(stderr, "{}", e);
        return 3;
    }
}
