//
// Created by Malik T on 18/10/2025.
//

#ifndef CLUEGAME_AUDITLOGGER_HPP
#define CLUEGAME_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Display.hpp"
#include "../core/State.hpp"
#include "../core/TurnController.hpp"
#include "../core/Types.hpp"

namespace clue::core::debug
{
    // Display sink writing a line per event. Sees everything, the revealed card included.
    class AuditLogger final : public Display
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger() override;

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Session header (seed, envelope, seating, hands)
        auto start(GameState const& game, std::uint64_t seed) -> void;

        // Per step outcome
        auto outcome(StepOutcome m) -> void;

        // Game end footer (winner or game over, turn count)
        auto end(TurnController const& ctl) -> void;

        auto flush() -> void;

        auto PrintTurn(GameState const& game, PlyrIdxT seat) -> void override;
        auto PrintMove(PlayerId const& who, MoveOption const& move) -> void override;
        auto PrintDiceRoll(PlayerId const& who, int roll) -> void override;
        auto PrintMovement(PlayerId const& who, MovementOption const& movement) -> void override;
        auto PrintGuess(PlayerId const& who, Triple const& guess) -> void override;
        auto PrintReveal(PlayerId const& revealer, PlayerId const& asker, Card const& card) -> void override;
        auto PrintNoDisprove(PlayerId const& asker, Triple const& guess) -> void override;
        auto PrintAccusation(PlayerId const& who, Triple const& accusation) -> void override;
        auto DisplayMessage(std::string_view msg) -> void override;
        auto DisplayError(std::string_view msg) -> void override;
        auto DisplayVictory(PlayerId const& winner) -> void override;

    private:
        std::ofstream out_;
    };
}

#endif //CLUEGAME_AUDITLOGGER_HPP
