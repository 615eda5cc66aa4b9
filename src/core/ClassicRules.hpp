//
// Created by Malik T on 16/10/2025.
//

#ifndef CLUEGAME_CLASSICRULES_HPP
#define CLUEGAME_CLASSICRULES_HPP
#include "Rules.hpp"

namespace clue::core
{
    // Table rules: guesses name the room you stand in, and a holder must show a card if able.
    class ClassicRules final : public Rules
    {
    public:
        auto ValidateMove(GameState const& game, PlyrIdxT seat, std::span<MoveOption const> offered,
                          MoveOption const& move) const -> CheckResult override;
        auto ValidateMovement(GameState const& game, PlyrIdxT seat, std::span<MovementOption const> offered,
                              MovementOption const& movement) const -> CheckResult override;
        auto ValidateGuess(GameState const& game, PlyrIdxT seat, Triple const& guess) const -> CheckResult override;
        auto ValidateAccusation(GameState const& game, PlyrIdxT seat,
                                Triple const& accusation) const -> CheckResult override;
        auto ValidateReveal(GameState const& game, PlyrIdxT revealer, Triple const& guess,
                            std::optional<Card> const& reveal) const -> CheckResult override;

        // Guess cards the seat holds in hand.
        static auto HeldCards(PlayerRecord const& p, Triple const& guess) -> std::vector<Card>;
    };
}

#endif //CLUEGAME_CLASSICRULES_HPP
