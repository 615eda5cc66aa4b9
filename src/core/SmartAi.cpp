//
// Created by Malik T on 16/10/2025.
//

#include "SmartAi.hpp"

#include "Deduction.hpp"
#include "Exception.hpp"

namespace clue::core
{
    SmartAi::SmartAi(uint64_t const rng_seed) :
        rng_(rng_seed) {}

    auto SmartAi::ChooseMove(AgentView const& view, std::span<MoveOption const> options) -> MoveOption
    {
        return deduction::DecideMove(view.self.sheet, options, rng_);
    }

    auto SmartAi::ChooseMovement(AgentView const& view, std::span<MovementOption const> options) -> MovementOption
    {
        return deduction::DecideMovement(view.self.sheet, view.pub, options, rng_);
    }

    auto SmartAi::ChooseGuess(AgentView const& view) -> Triple
    {
        CLU_ASSERT(view.self.location.IsRoom(), "Trying to guess from outside a room");
        return deduction::DecideGuess(view.self.sheet, Room{view.self.location.name}, rng_);
    }

    auto SmartAi::ChooseAccusation(AgentView const& view) -> Triple
    {
        return deduction::DecideAccusation(view.self.sheet);
    }

    auto SmartAi::ChooseReveal(AgentView const& view, Triple const& guess,
                               PlayerId const& asker) -> std::optional<Card>
    {
        return deduction::DecideReveal(view.self.sheet, guess, asker, rng_);
    }
}
