#ifndef SCOREKEEP_BATTINGRESULT_HPP
#define SCOREKEEP_BATTINGRESULT_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace scorekeep::core
{
    enum class ResultKind : uint8_t
    {
        Single = 0,
        Double,
        Triple,
        HomeRun,
        Walk,
        IntentionalWalk,
        ReachedOnError,
        FieldersChoice,
        SacrificeFly,
        Strikeout,
        GroundOut,
        AirOut,
        DoublePlay
    };
    inline constexpr size_t ResultKindCount = static_cast<size_t>(ResultKind::DoublePlay) + 1;

    // Fixed metadata per kind. batter_bases: 0 = batter retired, 4 = scores.
    struct ResultTraits
    {
        std::string_view notation;
        std::string_view name;
        bool is_hit;
        bool is_out;
        bool reaches_base;
        uint8_t outs_recorded;
        uint8_t batter_bases;
    };

    class BattingResult
    {
    public:
        constexpr explicit BattingResult(ResultKind k) noexcept : kind_{k} {}

        static constexpr auto Single() noexcept -> BattingResult { return BattingResult{ResultKind::Single}; }
        static constexpr auto Double() noexcept -> BattingResult { return BattingResult{ResultKind::Double}; }
        static constexpr auto Triple() noexcept -> BattingResult { return BattingResult{ResultKind::Triple}; }
        static constexpr auto HomeRun() noexcept -> BattingResult { return BattingResult{ResultKind::HomeRun}; }
        static constexpr auto Walk() noexcept -> BattingResult { return BattingResult{ResultKind::Walk}; }
        static constexpr auto IntentionalWalk() noexcept -> BattingResult { return BattingResult{ResultKind::IntentionalWalk}; }
        static constexpr auto ReachedOnError() noexcept -> BattingResult { return BattingResult{ResultKind::ReachedOnError}; }
        static constexpr auto FieldersChoice() noexcept -> BattingResult { return BattingResult{ResultKind::FieldersChoice}; }
        static constexpr auto SacrificeFly() noexcept -> BattingResult { return BattingResult{ResultKind::SacrificeFly}; }
        static constexpr auto Strikeout() noexcept -> BattingResult { return BattingResult{ResultKind::Strikeout}; }
        static constexpr auto GroundOut() noexcept -> BattingResult { return BattingResult{ResultKind::GroundOut}; }
        static constexpr auto AirOut() noexcept -> BattingResult { return BattingResult{ResultKind::AirOut}; }
        static constexpr auto DoublePlay() noexcept -> BattingResult { return BattingResult{ResultKind::DoublePlay}; }

        // "1B", "HR", "SO" ...; nullopt for unknown notation
        static auto Parse(std::string_view notation) noexcept -> std::optional<BattingResult>;

        [[nodiscard]] constexpr auto Kind() const noexcept -> ResultKind { return kind_; }
        [[nodiscard]] auto Traits() const noexcept -> ResultTraits const&;
        [[nodiscard]] auto IsHit() const noexcept -> bool { return Traits().is_hit; }
        [[nodiscard]] auto IsOut() const noexcept -> bool { return Traits().is_out; }
        [[nodiscard]] auto ReachesBase() const noexcept -> bool { return Traits().reaches_base; }
        [[nodiscard]] auto OutsRecorded() const noexcept -> uint8_t { return Traits().outs_recorded; }
        [[nodiscard]] auto BatterBases() const noexcept -> uint8_t { return Traits().batter_bases; }
        [[nodiscard]] auto Notation() const noexcept -> std::string_view { return Traits().notation; }
        [[nodiscard]] auto Name() const noexcept -> std::string_view { return Traits().name; }

        friend constexpr auto operator==(BattingResult, BattingResult) noexcept -> bool = default;

    private:
        ResultKind kind_;
    };

    inline constexpr std::array<ResultKind, ResultKindCount> AllResultKinds{
        ResultKind::Single, ResultKind::Double, ResultKind::Triple, ResultKind::HomeRun,
        ResultKind::Walk, ResultKind::IntentionalWalk, ResultKind::ReachedOnError,
        ResultKind::FieldersChoice, ResultKind::SacrificeFly, ResultKind::Strikeout,
        ResultKind::GroundOut, ResultKind::AirOut, ResultKind::DoublePlay
    };
}

#endif //SCOREKEEP_BATTINGRESULT_HPP
