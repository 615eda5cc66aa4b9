//
// Created by Malik T on 19/10/2025.
//

#ifndef CLUEGAME_HUMANAGENT_HPP
#define CLUEGAME_HUMANAGENT_HPP

#include <istream>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "../core/Agent.hpp"

namespace clue::cli
{
    // Numbered menus on stdout, answers read line by line from the given stream.
    // Throws Code::InvalidAction once the stream runs dry.
    class HumanAgent final : public core::Agent
    {
    public:
        explicit HumanAgent(std::istream& in) : in_(in) {}

        auto ChooseMove(core::AgentView const& view,
                        std::span<core::MoveOption const> options) -> core::MoveOption override;
        auto ChooseMovement(core::AgentView const& view,
                            std::span<core::MovementOption const> options) -> core::MovementOption override;
        auto ChooseGuess(core::AgentView const& view) -> core::Triple override;
        auto ChooseAccusation(core::AgentView const& view) -> core::Triple override;
        auto ChooseReveal(core::AgentView const& view, core::Triple const& guess,
                          core::PlayerId const& asker) -> std::optional<core::Card> override;
        auto SeeReveal(core::AgentView const& view, core::PlayerId const& revealer,
                       core::Card const& card) -> void override;

    private:
        // 0-based index into labels
        auto Ask(std::string const& prompt, std::vector<std::string> const& labels) -> size_t;
        auto AskCard(core::AgentView const& view, core::Category cat) -> core::Card;
        auto PrintSheet(core::AgentView const& view) const -> void;

        std::istream& in_;
    };
}

#endif //CLUEGAME_HUMANAGENT_HPP
