#ifndef SCOREKEEP_SCOREBOOKLOGGER_HPP
#define SCOREKEEP_SCOREBOOKLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/AtBat.hpp"
#include "../core/AtBatRecorder.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace scorekeep::core::debug
{
    // Plain-text play-by-play. Written by the host; the engine itself never logs.
    class ScorebookLogger
    {
    public:
        explicit ScorebookLogger(std::string path);
        ~ScorebookLogger();

        ScorebookLogger(ScorebookLogger const&) = delete;
        auto operator=(ScorebookLogger const&) -> ScorebookLogger& = delete;

        ScorebookLogger(ScorebookLogger&&) noexcept = default;
        auto operator=(ScorebookLogger&&) noexcept -> ScorebookLogger& = default;

        // Game header (id, seed, rules)
        auto start(GameSnapshot const& s, std::uint64_t seed, RuleConfiguration const& cfg) -> void;

        // One accepted plate appearance, with the snapshot taken after it
        auto play(AtBat const& ab, GameSnapshot const& after) -> void;

        // A command the recorder turned down
        auto rejected(RecordAtBatCommand const& cmd, error::RuleViolation const& v) -> void;

        // Half-inning summary line
        auto half_inning(Inning const& inning) -> void;

        // Final line score
        auto end(GameSnapshot const& s) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //SCOREKEEP_SCOREBOOKLOGGER_HPP
