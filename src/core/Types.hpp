#ifndef SCOREKEEP_TYPES_HPP
#define SCOREKEEP_TYPES_HPP

#define SKP_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <chrono>

namespace scorekeep::core::constants
{
    inline constexpr uint8_t MaxOuts = 3;
    inline constexpr uint8_t LineupSize = 9;
    inline constexpr uint8_t MaxRbis = 4;
    inline constexpr size_t MaxDescriptionLength = 500;
    inline constexpr uint8_t MaxInnings = 255;
    inline constexpr uint8_t HomePlate = 4;
}
namespace scorekeep::core
{
    using PlayerId = std::string;
    using GameId = std::string;
    using Clock = std::chrono::system_clock;

    enum class Base : uint8_t
    {
        First = 1,
        Second,
        Third
    };
    inline constexpr std::array<Base, 3> AllBases{Base::First, Base::Second, Base::Third};

    enum class Half : uint8_t
    {
        Top = 0,
        Bottom
    };

    // Away bats in the top half, home in the bottom.
    enum class Side : uint8_t
    {
        Away = 0,
        Home
    };

    enum class GameStatus : uint8_t
    {
        Setup = 0,
        InProgress,
        Completed,
        Suspended
    };

    enum class CompletionReason : uint8_t
    {
        None = 0,
        Regulation,
        WalkOff,
        MercyRule,
        Declared
    };

    enum class Aggressiveness : uint8_t
    {
        Conservative = 0,
        Standard,
        Aggressive
    };

    enum class Position : uint8_t
    {
        Pitcher = 0,
        Catcher,
        FirstBase,
        SecondBase,
        ThirdBase,
        Shortstop,
        LeftField,
        CenterField,
        RightField,
        // softball extras, never fill a required slot
        ShortFielder,
        ExtraPlayer
    };
    inline constexpr size_t RequiredPositionCount = 9;

    inline constexpr auto IsRequired(Position const p) noexcept -> bool
    {
        return static_cast<size_t>(p) < RequiredPositionCount;
    }

    inline constexpr auto BattingSide(Half const h) noexcept -> Side
    {
        return h == Half::Top ? Side::Away : Side::Home;
    }

    struct GameConfig
    {
        uint8_t regulation_innings{7};
        bool    mercy_rule{true};
        uint32_t mercy_run_differential{10};
        uint8_t mercy_min_inning{5};
        size_t  max_description_length{constants::MaxDescriptionLength};
        // whose lineup SetupLineup attaches
        Side    our_side{Side::Home};
    };

    auto to_string(Half h) -> std::string_view;
    auto to_string(Side s) -> std::string_view;
    auto to_string(GameStatus s) -> std::string_view;
    auto to_string(CompletionReason r) -> std::string_view;
    auto to_string(Aggressiveness a) -> std::string_view;
    auto to_string(Position p) -> std::string_view;
}

#endif //SCOREKEEP_TYPES_HPP
