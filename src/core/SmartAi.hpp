//
// Created by Malik T on 16/10/2025.
//

#ifndef CLUEGAME_SMARTAI_HPP
#define CLUEGAME_SMARTAI_HPP

#include "Agent.hpp"
#include "Rng.hpp"
#include "Types.hpp"

namespace clue::core
{
    // Automated seat: a thin adapter from Agent onto the deduction policy.
    class SmartAi final : public Agent
    {
    public:
        explicit SmartAi(uint64_t rng_seed);

        auto ChooseMove(AgentView const& view, std::span<MoveOption const> options) -> MoveOption override;
        auto ChooseMovement(AgentView const& view,
                            std::span<MovementOption const> options) -> MovementOption override;
        auto ChooseGuess(AgentView const& view) -> Triple override;
        auto ChooseAccusation(AgentView const& view) -> Triple override;
        auto ChooseReveal(AgentView const& view, Triple const& guess,
                          PlayerId const& asker) -> std::optional<Card> override;

    private:
        Rng rng_;
    };
}

#endif //CLUEGAME_SMARTAI_HPP
