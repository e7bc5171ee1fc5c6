#include "Types.hpp"

#include <string_view>

namespace scorekeep::core
{
    auto to_string(Half const h) -> std::string_view
    {
        return h == Half::Top ? "top" : "bottom";
    }

    auto to_string(Side const s) -> std::string_view
    {
        return s == Side::Away ? "away" : "home";
    }

    auto to_string(GameStatus const s) -> std::string_view
    {
        switch (s)
        {
        case GameStatus::Setup: return "setup";
        case GameStatus::InProgress: return "in_progress";
        case GameStatus::Completed: return "completed";
        case GameStatus::Suspended: return "suspended";
        }
        return "?";
    }

    auto to_string(CompletionReason const r) -> std::string_view
    {
        switch (r)
        {
        case CompletionReason::None: return "none";
        case CompletionReason::Regulation: return "regulation";
        case CompletionReason::WalkOff: return "walk-off";
        case CompletionReason::MercyRule: return "mercy rule";
        case CompletionReason::Declared: return "declared";
        }
        return "?";
    }

    auto to_string(Aggressiveness const a) -> std::string_view
    {
        switch (a)
        {
        case Aggressiveness::Conservative: return "conservative";
        case Aggressiveness::Standard: return "standard";
        case Aggressiveness::Aggressive: return "aggressive";
        }
        return "?";
    }

    auto to_string(Position const p) -> std::string_view
    {
        switch (p)
        {
        case Position::Pitcher: return "P";
        case Position::Catcher: return "C";
        case Position::FirstBase: return "1B";
        case Position::SecondBase: return "2B";
        case Position::ThirdBase: return "3B";
        case Position::Shortstop: return "SS";
        case Position::LeftField: return "LF";
        case Position::CenterField: return "CF";
        case Position::RightField: return "RF";
        case Position::ShortFielder: return "SF";
        case Position::ExtraPlayer: return "EP";
        }
        return "?";
    }
}
