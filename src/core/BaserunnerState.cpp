#include "BaserunnerState.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace scorekeep::core
{
    BaserunnerState::BaserunnerState(std::optional<PlayerId> first,
                                     std::optional<PlayerId> second,
                                     std::optional<PlayerId> third) :
        slots_{std::move(first), std::move(second), std::move(third)}
    {
    }

    auto BaserunnerState::Empty() -> BaserunnerState const&
    {
        static BaserunnerState const empty{};
        return empty;
    }

    auto BaserunnerState::IsEmpty() const noexcept -> bool
    {
        return std::ranges::none_of(slots_, [](auto const& s) { return s.has_value(); });
    }

    auto BaserunnerState::IsLoaded() const noexcept -> bool
    {
        return std::ranges::all_of(slots_, [](auto const& s) { return s.has_value(); });
    }

    auto BaserunnerState::RunnerCount() const noexcept -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(slots_, [](auto const& s) { return s.has_value(); }));
    }

    auto BaserunnerState::Runners() const -> std::vector<PlayerId>
    {
        std::vector<PlayerId> out;
        out.reserve(3);
        for (auto const& s : slots_)
        {
            if (s) out.push_back(*s);
        }
        return out;
    }

    auto BaserunnerState::HasRunner(PlayerId const& id) const noexcept -> bool
    {
        return BaseOf(id).has_value();
    }

    auto BaserunnerState::BaseOf(PlayerId const& id) const noexcept -> std::optional<Base>
    {
        for (Base const b : AllBases)
        {
            if (slots_[Index(b)] == id) return b;
        }
        return std::nullopt;
    }

    auto BaserunnerState::HasDuplicateRunner() const noexcept -> bool
    {
        for (size_t i{}; i < slots_.size(); ++i)
        {
            for (size_t j = i + 1; j < slots_.size(); ++j)
            {
                if (slots_[i] && slots_[j] && *slots_[i] == *slots_[j]) return true;
            }
        }
        return false;
    }

    auto BaserunnerState::With(Base const b, std::optional<PlayerId> id) const -> BaserunnerState
    {
        BaserunnerState copy = *this;
        copy.slots_[Index(b)] = std::move(id);
        return copy;
    }

    auto BaserunnerState::Shape() const -> BaseShape
    {
        auto const& [f, s, t] = slots_;
        unsigned const mask = (f ? 1u : 0u) | (s ? 2u : 0u) | (t ? 4u : 0u);
        switch (mask)
        {
        case 0b000: return BasesEmpty{};
        case 0b001: return RunnerOnFirst{*f};
        case 0b010: return RunnerOnSecond{*s};
        case 0b100: return RunnerOnThird{*t};
        case 0b011: return RunnersOnFirstSecond{*f, *s};
        case 0b101: return RunnersOnFirstThird{*f, *t};
        case 0b110: return RunnersOnSecondThird{*s, *t};
        default: return BasesLoaded{*f, *s, *t};
        }
    }

    auto BaserunnerState::ToString() const -> std::string
    {
        auto slot = [](std::optional<PlayerId> const& s) -> std::string { return s ? *s : std::string{"-"}; };
        return std::format("[{} {} {}]", slot(slots_[0]), slot(slots_[1]), slot(slots_[2]));
    }

    auto ShapeName(BaseShape const& s) -> std::string_view
    {
        static constexpr std::array<std::string_view, BaseShapeCount> names{
            "empty", "first", "second", "third", "first_second", "first_third", "second_third", "loaded"
        };
        return names[s.index()];
    }
}
