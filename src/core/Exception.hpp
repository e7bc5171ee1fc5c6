#ifndef SCOREKEEP_EXCEPTION_HPP
#define SCOREKEEP_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <optional>
#include <utility>
#include "Types.hpp"
#include "BattingResult.hpp"

namespace scorekeep::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a rejected play)
        State, // game state misuse (not a rejected play)
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Rules: throw RulesError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define SKP_THROW(code_enum, msg) ::scorekeep::core::error::fail((code_enum), (msg))
#define SKP_ASSERT(cond, msg) do { if(!(cond)) ::scorekeep::core::error::fail(::scorekeep::core::error::Code::Assertion, (msg)); } while(0)

    // Kinds a caller can branch on without string matching.
    enum class Category : uint8_t
    {
        NotFound,
        Structural,
        NonNegotiableRule,
        ConfigurableRule,
        StateMachine
    };

    // Fine-grained reasons; grouped by what they guard.
    enum class RuleViolationCode : std::uint16_t
    {
        // Lookup
        Game_NotFound,
        Player_NotFound,

        // Game lifecycle
        Game_NotInProgress,
        Game_NotInSetup,
        Game_WrongHalfInning,
        Game_BasesMismatch,
        Game_IllegalTransition,
        Game_LineupMissing,

        // At-bat command shape
        AtBat_BatterRequired,
        AtBat_InningNotPositive,
        AtBat_NegativeRbis,
        AtBat_DescriptionTooLong,

        // RBI / scoring
        Rbi_OnOutResult,
        Rbi_CountMismatch,
        Rbi_OutOfRange,
        Score_DuplicateScorer,
        HomeRun_BasesNotCleared,

        // Base-state transition (never disabled)
        Bases_DuplicateRunner,
        Bases_BatterAlreadyOnBase,
        Bases_UnknownRunner,
        Advance_RunnerMovedBackward,
        Advance_RunnerPassed,
        Advance_RunnerAccounting,
        Advance_TooManyOuts,
        Out_RunningErrorUnknownRunner,
        Out_RunningErrorRunnerStillActive,
        Out_DuplicateRunningError,

        // Toggleable rules
        Config_ErrorRunCreditedAsRbi,
        Config_RunningErrorWithoutFlag,
        Config_OutcomeNotPermitted,

        // Lineup
        Lineup_WrongSize,
        Lineup_BattingOrderInvalid,
        Lineup_DuplicatePlayer,
        Lineup_DuplicatePosition,
        Lineup_RequiredPositionMissing,
        Lineup_SubstituteIsStarter,
        Lineup_DuplicateSubstitute,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<GameId> game{};
        std::optional<PlayerId> player{};
        std::optional<GameStatus> status{};
        std::optional<std::uint8_t> inning{};
        std::optional<Half> half{};

        // Small integers useful in error messages
        std::optional<std::uint8_t> outs{};
        std::optional<int> rbis{};
        std::optional<int> expected{};
        std::optional<int> attempted{};

        std::optional<Base> base{};
        std::optional<ResultKind> result{};
        std::optional<Position> position{};

        auto with_game(GameId g) -> RuleViolation&
        {
            game = std::move(g);
            return *this;
        }

        auto with_player(PlayerId p) -> RuleViolation&
        {
            player = std::move(p);
            return *this;
        }

        auto with_status(GameStatus s) -> RuleViolation&
        {
            status = s;
            return *this;
        }

        auto with_inning(std::uint8_t n, Half h) -> RuleViolation&
        {
            inning = n;
            half = h;
            return *this;
        }

        auto with_outs(std::uint8_t v) -> RuleViolation&
        {
            outs = v;
            return *this;
        }

        auto with_rbis(int v) -> RuleViolation&
        {
            rbis = v;
            return *this;
        }

        auto with_expected(int v) -> RuleViolation&
        {
            expected = v;
            return *this;
        }

        auto with_attempted(int v) -> RuleViolation&
        {
            attempted = v;
            return *this;
        }

        auto with_base(Base b) -> RuleViolation&
        {
            base = b;
            return *this;
        }

        auto with_result(ResultKind k) -> RuleViolation&
        {
            result = k;
            return *this;
        }

        auto with_position(Position p) -> RuleViolation&
        {
            position = p;
            return *this;
        }

        friend auto operator==(RuleViolation const&, RuleViolation const&) -> bool = default;
    };

    inline auto category_of(RuleViolationCode c) -> Category
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Game_NotFound:
        case E::Player_NotFound:
            return Category::NotFound;

        case E::Game_NotInProgress:
        case E::Game_NotInSetup:
        case E::Game_WrongHalfInning:
        case E::Game_BasesMismatch:
        case E::Game_IllegalTransition:
        case E::Game_LineupMissing:
            return Category::StateMachine;

        case E::AtBat_BatterRequired:
        case E::AtBat_InningNotPositive:
        case E::AtBat_NegativeRbis:
        case E::AtBat_DescriptionTooLong:
        case E::Lineup_WrongSize:
        case E::Lineup_BattingOrderInvalid:
        case E::Lineup_DuplicatePlayer:
        case E::Lineup_DuplicatePosition:
        case E::Lineup_RequiredPositionMissing:
        case E::Lineup_SubstituteIsStarter:
        case E::Lineup_DuplicateSubstitute:
            return Category::Structural;

        case E::Config_ErrorRunCreditedAsRbi:
        case E::Config_RunningErrorWithoutFlag:
        case E::Config_OutcomeNotPermitted:
            return Category::ConfigurableRule;

        case E::Rbi_OnOutResult:
        case E::Rbi_CountMismatch:
        case E::Rbi_OutOfRange:
        case E::Score_DuplicateScorer:
        case E::HomeRun_BasesNotCleared:
        case E::Bases_DuplicateRunner:
        case E::Bases_BatterAlreadyOnBase:
        case E::Bases_UnknownRunner:
        case E::Advance_RunnerMovedBackward:
        case E::Advance_RunnerPassed:
        case E::Advance_RunnerAccounting:
        case E::Advance_TooManyOuts:
        case E::Out_RunningErrorUnknownRunner:
        case E::Out_RunningErrorRunnerStillActive:
        case E::Out_DuplicateRunningError:
        case E::Internal_Unreachable:
            return Category::NonNegotiableRule;
        }
        return Category::NonNegotiableRule;
    }

    inline auto to_string(Category c) -> std::string_view
    {
        switch (c)
        {
        case Category::NotFound: return "not-found";
        case Category::Structural: return "structural";
        case Category::NonNegotiableRule: return "rule";
        case Category::ConfigurableRule: return "configurable-rule";
        case Category::StateMachine: return "state";
        }
        return "unknown";
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Game_NotFound: return "Game not found";
        case E::Player_NotFound: return "Player not found";

        case E::Game_NotInProgress: return "Game is not in progress";
        case E::Game_NotInSetup: return "Game is not in setup";
        case E::Game_WrongHalfInning: return "At-bat does not belong to the current half-inning";
        case E::Game_BasesMismatch: return "Runners before the play do not match the game";
        case E::Game_IllegalTransition: return "Illegal game status transition";
        case E::Game_LineupMissing: return "Game cannot start without a lineup";

        case E::AtBat_BatterRequired: return "Batter is required";
        case E::AtBat_InningNotPositive: return "Inning must be a positive number";
        case E::AtBat_NegativeRbis: return "RBIs cannot be negative";
        case E::AtBat_DescriptionTooLong: return "Description is too long";

        case E::Rbi_OnOutResult: return "Strikeouts and groundouts cannot have RBIs";
        case E::Rbi_CountMismatch: return "RBI count must match runs scored";
        case E::Rbi_OutOfRange: return "RBIs must be between 0 and 4";
        case E::Score_DuplicateScorer: return "A player cannot score twice on one play";
        case E::HomeRun_BasesNotCleared: return "Home run must clear the bases";

        case E::Bases_DuplicateRunner: return "A player cannot occupy two bases";
        case E::Bases_BatterAlreadyOnBase: return "Batter is already on base";
        case E::Bases_UnknownRunner: return "Runner was not on base or at bat";
        case E::Advance_RunnerMovedBackward: return "Runner cannot move backward";
        case E::Advance_RunnerPassed: return "Runner cannot pass a runner ahead";
        case E::Advance_RunnerAccounting: return "Every runner and the batter must be on base, scored or out";
        case E::Advance_TooManyOuts: return "Play records too many outs";

        case E::Config_ErrorRunCreditedAsRbi: return "Runs scoring on an error cannot be RBIs";
        case E::Config_RunningErrorWithoutFlag: return "Running error recorded without running error flag";
        case E::Out_RunningErrorUnknownRunner: return "Running error names a player not involved in the play";
        case E::Out_RunningErrorRunnerStillActive: return "Runner retired on the bases is still on base or scored";
        case E::Out_DuplicateRunningError: return "A runner cannot be retired twice on one play";
        case E::Config_OutcomeNotPermitted: return "Outcome is not one of the permitted outcomes";

        case E::Lineup_WrongSize: return "Lineup must have exactly 9 players";
        case E::Lineup_BattingOrderInvalid: return "Batting orders must be exactly 1 through 9";
        case E::Lineup_DuplicatePlayer: return "Player appears more than once in the lineup";
        case E::Lineup_DuplicatePosition: return "Jersey/position conflict: position assigned twice";
        case E::Lineup_RequiredPositionMissing: return "All 9 defensive positions must be filled";
        case E::Lineup_SubstituteIsStarter: return "Substitute is already in the starting lineup";
        case E::Lineup_DuplicateSubstitute: return "Substitute listed more than once";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.game) s += std::format(" | game={}", *v.game);
        if (v.player) s += std::format(" | player={}", *v.player);
        if (v.status) s += std::format(" | status={}", to_string(*v.status));
        if (v.inning) s += std::format(" | inning={}", static_cast<int>(*v.inning));
        if (v.half) s += std::format(" | half={}", to_string(*v.half));
        if (v.outs) s += std::format(" | outs={}", static_cast<int>(*v.outs));
        if (v.rbis) s += std::format(" | rbis={}", *v.rbis);
        if (v.expected) s += std::format(" | expected={}", *v.expected);
        if (v.attempted) s += std::format(" | attempted={}", *v.attempted);
        if (v.base) s += std::format(" | base={}", static_cast<int>(std::to_underlying(*v.base)));
        if (v.result) s += std::format(" | result={}", BattingResult{*v.result}.Notation());
        if (v.position) s += std::format(" | position={}", to_string(*v.position));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //SCOREKEEP_EXCEPTION_HPP
