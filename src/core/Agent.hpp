//
// Created by Malik T on 15/10/2025.
//

#ifndef CLUEGAME_AGENT_HPP
#define CLUEGAME_AGENT_HPP

#include <optional>
#include <span>
#include "CardUniverse.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace clue::core
{
    // What a seat may look at when deciding: its own record and public data only.
    struct AgentView
    {
        PlayerRecord const& self;
        PublicState const& pub;
        CardUniverse const& universe;
    };

    class Agent
    {
    public:
        virtual ~Agent() = default;

        // Called by the turn controller (local AI or human adapter).
        // Every answer is checked by the Rules before it is applied.
        virtual auto ChooseMove(AgentView const& view, std::span<MoveOption const> options) -> MoveOption = 0;
        virtual auto ChooseMovement(AgentView const& view,
                                    std::span<MovementOption const> options) -> MovementOption = 0;
        virtual auto ChooseGuess(AgentView const& view) -> Triple = 0;
        virtual auto ChooseAccusation(AgentView const& view) -> Triple = 0;
        // nullopt = nothing to show
        virtual auto ChooseReveal(AgentView const& view, Triple const& guess,
                                  PlayerId const& asker) -> std::optional<Card> = 0;

        // Only the guesser hears which card answered its guess.
        virtual auto SeeReveal(AgentView const& view, PlayerId const& revealer, Card const& card) -> void
        {
            (void)view;
            (void)revealer;
            (void)card;
        }
    };
}
#endif //CLUEGAME_AGENT_HPP
