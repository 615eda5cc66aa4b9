//
// Created by Malik T on 19/10/2025.
//

#include "ConsoleDisplay.hpp"

#include <print>
#include "../core/Util.hpp"

namespace clue::cli
{
    using namespace clue::core;

    auto ConsoleDisplay::PrintTurn(GameState const& game, PlyrIdxT const seat) -> void
    {
        PlayerRecord const& p = game.Player(seat);
        std::print("\n=== {}'s turn ({}) ===\n", p.id, p.location.name);
    }

    auto ConsoleDisplay::PrintMove(PlayerId const& who, MoveOption const& move) -> void
    {
        if (std::holds_alternative<RollMove>(move))
            std::print("{} rolls the dice.\n", who);
        else
            std::print("{} takes the {}.\n", who, util::MoveText(move));
    }

    auto ConsoleDisplay::PrintDiceRoll(PlayerId const& who, int const roll) -> void
    {
        std::print("{} rolled a {}.\n", who, roll);
    }

    auto ConsoleDisplay::PrintMovement(PlayerId const& who, MovementOption const& movement) -> void
    {
        if (movement.location.IsRoom())
            std::print("{} entered the {}.\n", who, movement.location.name);
        else
            std::print("{} landed on the {}.\n", who, movement.location.name);
    }

    auto ConsoleDisplay::PrintGuess(PlayerId const& who, Triple const& guess) -> void
    {
        std::print("{} suggests {}.\n", who, util::TripleText(guess));
    }

    auto ConsoleDisplay::PrintReveal(PlayerId const& revealer, PlayerId const& asker, Card const& card) -> void
    {
        if (visibility_ == CardVisibility::Open)
            std::print("{} showed {} the {}.\n", revealer, asker, NameOf(card));
        else
            std::print("{} showed {} a card.\n", revealer, asker);
    }

    auto ConsoleDisplay::PrintNoDisprove(PlayerId const& asker, Triple const& guess) -> void
    {
        std::print("Nobody could disprove {}'s suggestion of {}.\n", asker, util::TripleText(guess));
    }

    auto ConsoleDisplay::PrintAccusation(PlayerId const& who, Triple const& accusation) -> void
    {
        std::print("{} accuses {}!\n", who, util::TripleText(accusation));
    }

    auto ConsoleDisplay::DisplayMessage(std::string_view const msg) -> void
    {
        std::print("{}\n", msg);
    }

    auto ConsoleDisplay::DisplayError(std::string_view const msg) -> void
    {
        std::print(stderr, "Not allowed: {}\n", msg);
    }

    auto ConsoleDisplay::DisplayVictory(PlayerId const& winner) -> void
    {
        std::print("{} solved the case and wins!\n", winner);
    }
}
