#ifndef SCOREKEEP_BASERUNNERSTATE_HPP
#define SCOREKEEP_BASERUNNERSTATE_HPP

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace scorekeep::core
{
    // One tag per occupancy combination; carries the occupants.
    struct BasesEmpty {};
    struct RunnerOnFirst { PlayerId first; };
    struct RunnerOnSecond { PlayerId second; };
    struct RunnerOnThird { PlayerId third; };
    struct RunnersOnFirstSecond { PlayerId first; PlayerId second; };
    struct RunnersOnFirstThird { PlayerId first; PlayerId third; };
    struct RunnersOnSecondThird { PlayerId second; PlayerId third; };
    struct BasesLoaded { PlayerId first; PlayerId second; PlayerId third; };

    using BaseShape = std::variant<BasesEmpty,
                                   RunnerOnFirst,
                                   RunnerOnSecond,
                                   RunnerOnThird,
                                   RunnersOnFirstSecond,
                                   RunnersOnFirstThird,
                                   RunnersOnSecondThird,
                                   BasesLoaded>;

    inline constexpr size_t BaseShapeCount = std::variant_size_v<BaseShape>;

    // Immutable. Every transition builds a new value.
    class BaserunnerState
    {
    public:
        BaserunnerState() = default;
        explicit BaserunnerState(std::optional<PlayerId> first,
                                 std::optional<PlayerId> second = std::nullopt,
                                 std::optional<PlayerId> third = std::nullopt);

        static auto Empty() -> BaserunnerState const&;

        [[nodiscard]] auto IsOccupied(Base b) const noexcept -> bool { return slots_[Index(b)].has_value(); }
        [[nodiscard]] auto Occupant(Base b) const noexcept -> std::optional<PlayerId> const& { return slots_[Index(b)]; }
        [[nodiscard]] auto IsEmpty() const noexcept -> bool;
        [[nodiscard]] auto IsLoaded() const noexcept -> bool;
        [[nodiscard]] auto RunnerCount() const noexcept -> size_t;

        // Occupants ordered first to third.
        auto Runners() const -> std::vector<PlayerId>;
        auto HasRunner(PlayerId const& id) const noexcept -> bool;
        auto BaseOf(PlayerId const& id) const noexcept -> std::optional<Base>;
        // true when one id sits on two bases; such a value is only ever a rejected proposal
        auto HasDuplicateRunner() const noexcept -> bool;

        auto With(Base b, std::optional<PlayerId> id) const -> BaserunnerState;
        auto Shape() const -> BaseShape;
        auto ToString() const -> std::string;

        friend auto operator==(BaserunnerState const&, BaserunnerState const&) -> bool = default;

    private:
        static constexpr auto Index(Base b) noexcept -> size_t { return static_cast<size_t>(b) - 1; }

        std::array<std::optional<PlayerId>, 3> slots_{};
    };

    // Shape tag name, for transcripts and test names.
    auto ShapeName(BaseShape const& s) -> std::string_view;
}

#endif //SCOREKEEP_BASERUNNERSTATE_HPP
