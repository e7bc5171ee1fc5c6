#ifndef SCOREKEEP_GAME_HPP
#define SCOREKEEP_GAME_HPP

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "State.hpp"
#include "AtBat.hpp"
#include "Exception.hpp"

namespace scorekeep::core::debug {struct Inspector;}
namespace scorekeep::core
{
    // Single owner of a game's score, outs and inning state. Only the recorder and the
    // lineup validator write through it; everyone else reads a Snapshot().
    class GameImpl
    {
    public:
        GameImpl() = delete;
        GameImpl(GameId id, GameConfig const& config);

        // setup -> in_progress, needs a lineup
        auto Start() -> error::ValidateResult;
        // in_progress -> suspended
        auto Suspend() -> error::ValidateResult;
        // in_progress -> completed, declared by the host
        auto Complete() -> error::ValidateResult;

        auto Snapshot() const -> std::shared_ptr<GameSnapshot const>;

        auto Id() const noexcept -> GameId const& { return id_; }
        auto Status() const noexcept -> GameStatus { return status_; }
        auto Completion() const noexcept -> CompletionReason { return completion_; }
        auto InningNow() const noexcept -> uint8_t { return inning_; }
        auto HalfNow() const noexcept -> Half { return half_; }
        auto Outs() const noexcept -> uint8_t { return outs_; }
        auto Bases() const noexcept -> BaserunnerState const& { return bases_; }
        auto Score(Side s) const noexcept -> uint32_t { return score_[static_cast<size_t>(s)]; }
        auto NextSlot(Side s) const noexcept -> uint8_t { return next_slot_[static_cast<size_t>(s)]; }
        auto AtBatCount() const noexcept -> uint32_t { return at_bat_count_; }
        auto LineupOf() const noexcept -> std::optional<Lineup> const& { return lineup_; }
        auto Config() const noexcept -> GameConfig const& { return cfg_; }
        auto Innings() const noexcept -> std::vector<Inning> const& { return innings_; }

        // Throws StateError before the first pitch.
        auto CurrentInning() const -> Inning const&;

        friend class AtBatRecorder;
        friend class LineupValidator;
        friend struct debug::Inspector;

    private:
        auto AttachLineup(Lineup lineup) -> void;
        // Caller has validated the play; this only does the bookkeeping.
        auto ApplyAtBat(AtBat const& ab) -> void;
        auto NextAtBatId() const -> std::string;
        auto InningId(uint8_t number, Half h) const -> std::string;

        auto OpenHalfInning(uint8_t number, Half h) -> void;
        auto EndHalfInning() -> void;
        auto Finish(CompletionReason reason) -> void;
        auto Transition(GameStatus from, GameStatus to) -> error::ValidateResult;

    private:
        GameId id_;
        GameConfig cfg_;

        GameStatus status_{GameStatus::Setup};
        CompletionReason completion_{CompletionReason::None};
        std::optional<Lineup> lineup_{};

        uint8_t inning_{0};
        Half half_{Half::Top};
        uint8_t outs_{0};
        BaserunnerState bases_{};
        std::array<uint32_t, 2> score_{};
        std::array<uint8_t, 2> next_slot_{1, 1};
        uint32_t at_bat_count_{0};

        std::vector<Inning> innings_;
        std::vector<InningLine> linescore_;
    };
}
#endif //SCOREKEEP_GAME_HPP
