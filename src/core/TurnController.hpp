//
// Created by Malik T on 17/10/2025.
//

#ifndef CLUEGAME_TURNCONTROLLER_HPP
#define CLUEGAME_TURNCONTROLLER_HPP

#include <memory>
#include <optional>
#include <vector>
#include "Agent.hpp"
#include "Board.hpp"
#include "Display.hpp"
#include "Rng.hpp"
#include "Rules.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace clue::core::debug {struct Inspector;}
namespace clue::core
{
    enum class TurnPhase : uint8_t
    {
        AwaitMove,
        AwaitMoveAgain, // a human's move was rejected; ask again without a new turn header
        AwaitMovement,
        Accusation,
        Guess,
        EndTurn,
        Win,
        GameOver
    };

    enum class StepOutcome : uint8_t
    {
        Invalid, // decision rejected, phase unchanged
        Applied,
        Skipped, // current seat is out
        TurnEnded,
        GameEnded
    };

    // Scratch for the turn in progress.
    struct TurnContext
    {
        PlyrIdxT cur{};
        PlyrIdxT next{};
        std::optional<int> roll;
        std::vector<MovementOption> movement_options;
        std::optional<Location> destination;
    };

    class TurnController
    {
    public:
        TurnController() = delete;
        TurnController(Config const& config,
                       GameState initial,
                       std::unique_ptr<Rules> rules,
                       std::unique_ptr<Board> board,
                       std::vector<std::unique_ptr<Agent>> agents,
                       std::shared_ptr<Display> display);

        // One state-machine transition. Terminal phases return GameEnded without side effects.
        auto Step() -> StepOutcome;
        // Steps until Win or GameOver.
        auto Run() -> TurnPhase;

        auto PhaseNow() const noexcept -> TurnPhase { return phase_; }
        auto IsOver() const noexcept -> bool { return phase_ == TurnPhase::Win || phase_ == TurnPhase::GameOver; }
        auto State() const noexcept -> GameState const& { return state_; }
        auto Winner() const -> std::optional<PlayerId>;
        auto TurnsPlayed() const noexcept -> uint32_t { return turns_; }
        auto AgentAt(PlyrIdxT seat) -> Agent* { return agents_.at(seat).get(); }

        //allows class to directly access private data on an instance
        friend struct debug::Inspector;

    private:
        auto ResolveCurrent() const -> CurNext;
        auto ViewFor(PlyrIdxT seat) const -> AgentView;

        auto StepMove() -> StepOutcome;
        auto StepMovement() -> StepOutcome;
        auto StepAccusation() -> StepOutcome;
        auto StepGuess() -> StepOutcome;
        auto StepEndTurn() -> StepOutcome;

        // Stores the destination on the player and picks the follow-up phase.
        auto MoveTo(PlyrIdxT seat, Location const& dest) -> void;
        auto AdvanceTo(PlyrIdxT next) -> void;
        auto EndGame(std::string_view msg) -> StepOutcome;
        // Human: report and ask again. Automated: broken invariant, throws.
        auto Reject(PlyrIdxT seat, error::RuleViolation const& v) -> StepOutcome;
        auto AskReveal(PlyrIdxT seat, Triple const& guess, PlayerId const& asker) -> std::optional<Card>;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::unique_ptr<Board> board_;
        std::vector<std::unique_ptr<Agent>> agents_;
        std::shared_ptr<Display> display_;
        Rng rng_;

        // Authoritative state
        GameState state_;
        TurnPhase phase_{TurnPhase::AwaitMove};
        TurnContext ctx_{};
        std::optional<PlyrIdxT> winner_;
        uint32_t turns_{0};
    };
}

#endif //CLUEGAME_TURNCONTROLLER_HPP
