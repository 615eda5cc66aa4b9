//
// Created by Malik T on 19/10/2025.
//

#ifndef CLUEGAME_CONSOLEDISPLAY_HPP
#define CLUEGAME_CONSOLEDISPLAY_HPP

#include <cstdint>
#include <string_view>
#include "../core/Display.hpp"

namespace clue::cli
{
    enum class CardVisibility : uint8_t
    {
        Open,  // nobody at the keyboard plays, name every shown card
        Hidden // shared screen: the asker hears the card through its own agent
    };

    // Prints the game to stdout.
    class ConsoleDisplay final : public core::Display
    {
    public:
        explicit ConsoleDisplay(CardVisibility const visibility) : visibility_(visibility) {}

        auto PrintTurn(core::GameState const& game, core::PlyrIdxT seat) -> void override;
        auto PrintMove(core::PlayerId const& who, core::MoveOption const& move) -> void override;
        auto PrintDiceRoll(core::PlayerId const& who, int roll) -> void override;
        auto PrintMovement(core::PlayerId const& who, core::MovementOption const& movement) -> void override;
        auto PrintGuess(core::PlayerId const& who, core::Triple const& guess) -> void override;
        auto PrintReveal(core::PlayerId const& revealer, core::PlayerId const& asker, core::Card const& card) -> void override;
        auto PrintNoDisprove(core::PlayerId const& asker, core::Triple const& guess) -> void override;
        auto PrintAccusation(core::PlayerId const& who, core::Triple const& accusation) -> void override;
        auto DisplayMessage(std::string_view msg) -> void override;
        auto DisplayError(std::string_view msg) -> void override;
        auto DisplayVictory(core::PlayerId const& winner) -> void override;

    private:
        CardVisibility visibility_;
    };
}

#endif //CLUEGAME_CONSOLEDISPLAY_HPP
