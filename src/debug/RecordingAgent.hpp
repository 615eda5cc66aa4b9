//
// Created by malikt on 10/19/25.
//

#ifndef CLUEGAME_RECORDINGAGENT_HPP
#define CLUEGAME_RECORDINGAGENT_HPP

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../core/Agent.hpp"

namespace clue::core::debug
{
    // Passes every decision through and keeps the most recent one of each kind.
    class RecordingAgent final : public Agent
    {
    public:
        explicit RecordingAgent(std::unique_ptr<Agent> inner)
            : inner_{std::move(inner)}
        {
        }

        auto ChooseMove(AgentView const& view, std::span<MoveOption const> options) -> MoveOption override
        {
            last_move_ = inner_->ChooseMove(view, options);
            ++decisions_;
            return *last_move_;
        }

        auto ChooseMovement(AgentView const& view, std::span<MovementOption const> options) -> MovementOption override
        {
            last_movement_ = inner_->ChooseMovement(view, options);
            ++decisions_;
            return *last_movement_;
        }

        auto ChooseGuess(AgentView const& view) -> Triple override
        {
            last_guess_ = inner_->ChooseGuess(view);
            ++decisions_;
            return *last_guess_;
        }

        auto ChooseAccusation(AgentView const& view) -> Triple override
        {
            last_accusation_ = inner_->ChooseAccusation(view);
            ++decisions_;
            return *last_accusation_;
        }

        auto ChooseReveal(AgentView const& view, Triple const& guess,
                          PlayerId const& asker) -> std::optional<Card> override
        {
            std::optional<Card> r = inner_->ChooseReveal(view, guess, asker);
            reveals_.push_back(r);
            ++decisions_;
            return r;
        }

        auto SeeReveal(AgentView const& view, PlayerId const& revealer, Card const& card) -> void override
        {
            inner_->SeeReveal(view, revealer, card);
        }

        auto Decisions() const -> size_t { return decisions_; }
        auto LastMove() const -> std::optional<MoveOption> const& { return last_move_; }
        auto LastMovement() const -> std::optional<MovementOption> const& { return last_movement_; }
        auto LastGuess() const -> std::optional<Triple> const& { return last_guess_; }
        auto LastAccusation() const -> std::optional<Triple> const& { return last_accusation_; }
        auto Reveals() const -> std::vector<std::optional<Card>> const& { return reveals_; }

    private:
        std::unique_ptr<Agent> inner_;
        std::optional<MoveOption> last_move_;
        std::optional<MovementOption> last_movement_;
        std::optional<Triple> last_guess_;
        std::optional<Triple> last_accusation_;
        std::vector<std::optional<Card>> reveals_;
        size_t decisions_{0};
    };

    // Helper to wrap a vector<unique_ptr<Agent>>
    inline auto WrapRecording(std::vector<std::unique_ptr<Agent>>& agents)
        -> std::vector<std::unique_ptr<Agent>>
    {
        std::vector<std::unique_ptr<Agent>> out;
        out.reserve(agents.size());

        for (auto& a : agents)
        {
            out.emplace_back(std::make_unique<RecordingAgent>(std::move(a)));
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(Agent* a) -> RecordingAgent*
    {
        return dynamic_cast<RecordingAgent*>(a);
    }
}

#endif //CLUEGAME_RECORDINGAGENT_HPP
