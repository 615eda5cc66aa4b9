//
// Created by Malik T on 19/10/2025.
//

#ifndef CLUEGAME_INSPECTOR_HPP
#define CLUEGAME_INSPECTOR_HPP

#include <optional>
#include <utility>
#include <vector>

#include "../core/TurnController.hpp"
#include "../core/Types.hpp"

namespace clue::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            GameState const* state{};
            TurnPhase phase{};
            PlyrIdxT cur{};
            PlyrIdxT next{};
            std::optional<int> roll;
            std::vector<MovementOption> movement_options;
            std::optional<Location> destination;
            std::optional<PlyrIdxT> winner;
            uint32_t turns{};
            uint8_t n_players{};
            bool elimination{};
        };

        static inline auto Gather(TurnController const& t) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.state = &t.state_;
            ret.phase = t.phase_;
            ret.cur = t.ctx_.cur;
            ret.next = t.ctx_.next;
            ret.roll = t.ctx_.roll;
            ret.movement_options = t.ctx_.movement_options;
            ret.destination = t.ctx_.destination;
            ret.winner = t.winner_;
            ret.turns = t.turns_;
            ret.n_players = static_cast<uint8_t>(t.state_.PlayerCount());
            ret.elimination = t.cfg_.deduce_by_elimination;
            return ret;
        }
    };
}

#endif //CLUEGAME_INSPECTOR_HPP
