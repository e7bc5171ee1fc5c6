#ifndef SCOREKEEP_PORTS_HPP
#define SCOREKEEP_PORTS_HPP

#include "Types.hpp"
#include "AtBat.hpp"

namespace scorekeep::core
{
    class GameImpl;

    // Supplied by the host. The core never performs I/O itself.
    class GameStore
    {
    public:
        virtual ~GameStore() = default;

        // nullptr when unknown
        virtual auto Find(GameId const& id) -> GameImpl* = 0;
        // Called once per accepted command, after the game was mutated.
        virtual auto Save(GameImpl const& game) -> void = 0;
    };

    class PlayerDirectory
    {
    public:
        virtual ~PlayerDirectory() = default;

        virtual auto Exists(PlayerId const& id) const -> bool = 0;
    };

    class AtBatSink
    {
    public:
        virtual ~AtBatSink() = default;

        virtual auto Append(AtBat const& ab) -> void = 0;
    };
}

#endif //SCOREKEEP_PORTS_HPP
