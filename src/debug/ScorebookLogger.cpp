#include "ScorebookLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

using namespace scorekeep::core;

namespace
{

auto s_half(Half const h) -> std::string_view
{
    return h == Half::Top ? "T" : "B";
}

auto s_ids(std::vector<PlayerId> const& ids) -> std::string
{
    std::string body;
    for (size_t i{}; i < ids.size(); ++i)
    {
        body += (i ? "," : "");
        body += ids[i];
    }
    return body;
}

auto s_params(SituationalParameters const& p) -> std::string
{
    return std::format("{}{}{}", to_string(p.aggressiveness),
                       p.error_occurred ? "+E" : "",
                       p.running_error_occurred ? "+RE" : "");
}

} // anonymous namespace

namespace scorekeep::core::debug
{

ScorebookLogger::ScorebookLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

ScorebookLogger::~ScorebookLogger() = default;

auto ScorebookLogger::start(GameSnapshot const& s, std::uint64_t seed, RuleConfiguration const& cfg) -> void
{
    out_ << std::format("Game={}\n", s.game_id);
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Rules: error_attribution={} running_errors={} strict={}\n",
                        cfg.error_attribution, cfg.running_error_variations, cfg.strict_outcome_matching);
    out_.flush();
}

auto ScorebookLogger::play(AtBat const& ab, GameSnapshot const& after) -> void
{
    out_ << std::format(
        "{} #{} {:<8} {:<3} [{}] {} -> {} runs=[{}] rbi={} outs={} | {}-{} {}{} o={}\n",
        ab.Id(),
        static_cast<int>(ab.BattingPosition()),
        ab.Batter(),
        ab.Result().Notation(),
        s_params(ab.Parameters()),
        ab.Before().ToString(),
        ab.After().ToString(),
        s_ids(ab.RunsScored()),
        static_cast<int>(ab.Rbis()),
        static_cast<int>(ab.Outs()),
        after.away_score,
        after.home_score,
        s_half(after.half),
        static_cast<int>(after.inning),
        static_cast<int>(after.outs)
    );

    if (!ab.RunningErrors().empty())
    {
        out_ << std::format("  out on the bases: {}\n", s_ids(ab.RunningErrors()));
    }
}

auto ScorebookLogger::rejected(RecordAtBatCommand const& cmd, error::RuleViolation const& v) -> void
{
    out_ << std::format("Rejected {} {} [{}]: {}\n",
                        cmd.batter_id,
                        cmd.result.Notation(),
                        error::to_string(error::category_of(v.code)),
                        error::describe(v));
}

auto ScorebookLogger::half_inning(Inning const& inning) -> void
{
    out_ << std::format("End {}{}: runs={} outs={} at_bats={}\n",
                        s_half(inning.half),
                        static_cast<int>(inning.number),
                        inning.runs,
                        static_cast<int>(inning.outs),
                        inning.at_bat_ids.size());
}

auto ScorebookLogger::end(GameSnapshot const& s) -> void
{
    std::string away = "Away |";
    std::string home = "Home |";
    for (InningLine const& l : s.linescore)
    {
        away += std::format(" {:>2}", l.away);
        home += std::format(" {:>2}", l.home);
    }

    out_ << std::format("Final ({}, {}): {}-{}\n",
                        to_string(s.status), to_string(s.completion), s.away_score, s.home_score);
    out_ << std::format("{} | {}\n{} | {}\n", away, s.away_score, home, s.home_score);
    out_.flush();
}

auto ScorebookLogger::flush() -> void
{
    out_.flush();
}

}
