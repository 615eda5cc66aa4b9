//
// Created by Malik T on 16/10/2025.
//

#ifndef CLUEGAME_BOARD_HPP
#define CLUEGAME_BOARD_HPP

#include <vector>
#include "State.hpp"
#include "Types.hpp"

namespace clue::core
{
    // Board geometry as the controller sees it.
    class Board
    {
    public:
        virtual ~Board() = default;

        // Top level choices for the seat: always a roll, plus any passage out of its room.
        virtual auto MoveOptions(GameState const& game, PlyrIdxT seat) const -> std::vector<MoveOption> = 0;

        // Destinations reachable from the seat's location with the given roll.
        virtual auto MovementOptions(GameState const& game, PlyrIdxT seat,
                                     int roll) const -> std::vector<MovementOption> = 0;
    };
}

#endif //CLUEGAME_BOARD_HPP
