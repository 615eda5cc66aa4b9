//
// Created by Malik T on 16/10/2025.
//

#ifndef CLUEGAME_DISPLAY_HPP
#define CLUEGAME_DISPLAY_HPP

#include <memory>
#include <string_view>
#include <utility>
#include <vector>
#include "State.hpp"
#include "Types.hpp"

namespace clue::core
{
    // Presentation sink. Nothing flows back into the game from here.
    class Display
    {
    public:
        virtual ~Display() = default;

        virtual auto PrintTurn(GameState const& game, PlyrIdxT seat) -> void = 0;
        virtual auto PrintMove(PlayerId const& who, MoveOption const& move) -> void = 0;
        virtual auto PrintDiceRoll(PlayerId const& who, int roll) -> void = 0;
        virtual auto PrintMovement(PlayerId const& who, MovementOption const& movement) -> void = 0;
        virtual auto PrintGuess(PlayerId const& who, Triple const& guess) -> void = 0;
        // sinks decide who may see the card itself
        virtual auto PrintReveal(PlayerId const& revealer, PlayerId const& asker, Card const& card) -> void = 0;
        virtual auto PrintNoDisprove(PlayerId const& asker, Triple const& guess) -> void = 0;
        virtual auto PrintAccusation(PlayerId const& who, Triple const& accusation) -> void = 0;
        virtual auto DisplayMessage(std::string_view msg) -> void = 0;
        virtual auto DisplayError(std::string_view msg) -> void = 0;
        virtual auto DisplayVictory(PlayerId const& winner) -> void = 0;
    };

    // Discards everything; for headless runs.
    class NullDisplay final : public Display
    {
    public:
        auto PrintTurn(GameState const&, PlyrIdxT) -> void override {}
        auto PrintMove(PlayerId const&, MoveOption const&) -> void override {}
        auto PrintDiceRoll(PlayerId const&, int) -> void override {}
        auto PrintMovement(PlayerId const&, MovementOption const&) -> void override {}
        auto PrintGuess(PlayerId const&, Triple const&) -> void override {}
        auto PrintReveal(PlayerId const&, PlayerId const&, Card const&) -> void override {}
        auto PrintNoDisprove(PlayerId const&, Triple const&) -> void override {}
        auto PrintAccusation(PlayerId const&, Triple const&) -> void override {}
        auto DisplayMessage(std::string_view) -> void override {}
        auto DisplayError(std::string_view) -> void override {}
        auto DisplayVictory(PlayerId const&) -> void override {}
    };
    // Forwards every event to each sink in order (console + transcript).
    class TeeDisplay final : public Display
    {
    public:
        explicit TeeDisplay(std::vector<std::shared_ptr<Display>> sinks) : sinks_(std::move(sinks)) {}

        auto PrintTurn(GameState const& game, PlyrIdxT seat) -> void override
        {
            for (auto const& s : sinks_) s->PrintTurn(game, seat);
        }
        auto PrintMove(PlayerId const& who, MoveOption const& move) -> void override
        {
            for (auto const& s : sinks_) s->PrintMove(who, move);
        }
        auto PrintDiceRoll(PlayerId const& who, int roll) -> void override
        {
            for (auto const& s : sinks_) s->PrintDiceRoll(who, roll);
        }
        auto PrintMovement(PlayerId const& who, MovementOption const& movement) -> void override
        {
            for (auto const& s : sinks_) s->PrintMovement(who, movement);
        }
        auto PrintGuess(PlayerId const& who, Triple const& guess) -> void override
        {
            for (auto const& s : sinks_) s->PrintGuess(who, guess);
        }
        auto PrintReveal(PlayerId const& revealer, PlayerId const& asker, Card const& card) -> void override
        {
            for (auto const& s : sinks_) s->PrintReveal(revealer, asker, card);
        }
        auto PrintNoDisprove(PlayerId const& asker, Triple const& guess) -> void override
        {
            for (auto const& s : sinks_) s->PrintNoDisprove(asker, guess);
        }
        auto PrintAccusation(PlayerId const& who, Triple const& accusation) -> void override
        {
            for (auto const& s : sinks_) s->PrintAccusation(who, accusation);
        }
        auto DisplayMessage(std::string_view msg) -> void override
        {
            for (auto const& s : sinks_) s->DisplayMessage(msg);
        }
        auto DisplayError(std::string_view msg) -> void override
        {
            for (auto const& s : sinks_) s->DisplayError(msg);
        }
        auto DisplayVictory(PlayerId const& winner) -> void override
        {
            for (auto const& s : sinks_) s->DisplayVictory(winner);
        }

    private:
        std::vector<std::shared_ptr<Display>> sinks_;
    };
}

#endif //CLUEGAME_DISPLAY_HPP
