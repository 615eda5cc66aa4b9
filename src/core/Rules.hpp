//
// Created by Malik T on 16/10/2025.
//

#ifndef CLUEGAME_RULES_HPP
#define CLUEGAME_RULES_HPP

#include <optional>
#include <span>
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace clue::core
{
    // Referee seam: checks an agent's answer against what the game allows.
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto ValidateMove(GameState const& game, PlyrIdxT seat, std::span<MoveOption const> offered,
                                  MoveOption const& move) const -> CheckResult = 0;
        virtual auto ValidateMovement(GameState const& game, PlyrIdxT seat,
                                      std::span<MovementOption const> offered,
                                      MovementOption const& movement) const -> CheckResult = 0;
        // seat is expected to already stand on the destination room
        virtual auto ValidateGuess(GameState const& game, PlyrIdxT seat, Triple const& guess) const -> CheckResult = 0;
        virtual auto ValidateAccusation(GameState const& game, PlyrIdxT seat,
                                        Triple const& accusation) const -> CheckResult = 0;
        virtual auto ValidateReveal(GameState const& game, PlyrIdxT revealer, Triple const& guess,
                                    std::optional<Card> const& reveal) const -> CheckResult = 0;
    };
}

#endif //CLUEGAME_RULES_HPP
