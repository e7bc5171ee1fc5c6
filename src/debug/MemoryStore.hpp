#ifndef SCOREKEEP_MEMORYSTORE_HPP
#define SCOREKEEP_MEMORYSTORE_HPP

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "../core/Game.hpp"
#include "../core/Ports.hpp"

namespace scorekeep::core::debug
{
    // In-process collaborators for the CLI and tests.
    class MemoryStore final : public GameStore, public PlayerDirectory, public AtBatSink
    {
    public:
        auto Create(GameId const& id, GameConfig const& cfg = {}) -> GameImpl&
        {
            auto [it, inserted] = games_.insert_or_assign(id, std::make_unique<GameImpl>(id, cfg));
            return *it->second;
        }

        auto AddPlayer(PlayerId id) -> void { players_.insert(std::move(id)); }

        auto Find(GameId const& id) -> GameImpl* override
        {
            auto const it = games_.find(id);
            return it == games_.end() ? nullptr : it->second.get();
        }

        auto Save(GameImpl const& game) -> void override { ++saves_[game.Id()]; }

        auto Exists(PlayerId const& id) const -> bool override { return players_.contains(id); }

        auto Append(AtBat const& ab) -> void override { at_bats_.push_back(ab); }

        auto SaveCount(GameId const& id) const -> size_t
        {
            auto const it = saves_.find(id);
            return it == saves_.end() ? 0 : it->second;
        }
        auto AtBats() const noexcept -> std::vector<AtBat> const& { return at_bats_; }

    private:
        std::map<GameId, std::unique_ptr<GameImpl>> games_;
        std::map<GameId, size_t> saves_;
        std::set<PlayerId> players_;
        std::vector<AtBat> at_bats_;
    };
}

#endif //SCOREKEEP_MEMORYSTORE_HPP
