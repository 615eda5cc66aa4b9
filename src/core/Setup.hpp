//
// Created by Malik T on 18/10/2025.
//

#ifndef CLUEGAME_SETUP_HPP
#define CLUEGAME_SETUP_HPP

#include "Definition.hpp"
#include "GraphBoard.hpp"
#include "Rng.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace clue::core
{
    // Checks the definition, draws the envelope, deals the rest round-robin from the first
    // listed player and opens every sheet. Throws Code::Definition on any inconsistency.
    auto ImportGame(GameDefinition const& def, Config const& config, Rng& rng) -> GameState;

    auto BuildBoard(GameDefinition const& def) -> GraphBoard;

    // Definition checks only; ImportGame runs this first.
    auto ValidateDefinition(GameDefinition const& def) -> void;

    auto UniverseOf(GameDefinition const& def) -> CardUniverse;
}

#endif //CLUEGAME_SETUP_HPP
