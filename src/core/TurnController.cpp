//
// Created by Malik T on 17/10/2025.
//
#include "TurnController.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>
#include "Exception.hpp"

namespace clue::core
{
    TurnController::TurnController(Config const& config,
                                   GameState initial,
                                   std::unique_ptr<Rules> rules,
                                   std::unique_ptr<Board> board,
                                   std::vector<std::unique_ptr<Agent>> agents,
                                   std::shared_ptr<Display> display) :
        cfg_(config),
        rules_(std::move(rules)),
        board_(std::move(board)),
        agents_(std::move(agents)),
        display_(std::move(display)),
        rng_{cfg_.seed},
        state_(std::move(initial))
    {
        CLU_ASSERT(rules_ && board_ && display_, "Missing collaborator while initialising controller");
        CLU_ASSERT(agents_.size() == state_.PlayerCount(), "One agent per seat is required");
        CLU_ASSERT(!std::ranges::any_of(agents_,
                                        [](std::unique_ptr<Agent> const& a) { return !a; }), "Invalid agent in controller");
    }

    auto TurnController::Winner() const -> std::optional<PlayerId>
    {
        if (!winner_) return std::nullopt;
        return state_.Player(*winner_).id;
    }

    auto TurnController::ResolveCurrent() const -> CurNext
    {
        auto const cn = state_.FindCurNext(state_.Public().current_player);
        if (!cn)
            CLU_THROW(error::Code::State,
                      std::format("{} ({})", error::to_string(cn.error()), state_.Public().current_player));
        return *cn;
    }

    auto TurnController::ViewFor(PlyrIdxT const seat) const -> AgentView
    {
        return AgentView{state_.Player(seat), state_.Public(), state_.Universe()};
    }

    auto TurnController::AdvanceTo(PlyrIdxT const next) -> void
    {
        state_.SetCurrentPlayer(state_.Player(next).id);
        ctx_ = TurnContext{};
        phase_ = TurnPhase::AwaitMove;
    }

    auto TurnController::EndGame(std::string_view const msg) -> StepOutcome
    {
        display_->DisplayMessage(msg);
        phase_ = TurnPhase::GameOver;
        return StepOutcome::GameEnded;
    }

    auto TurnController::Reject(PlyrIdxT const seat, error::RuleViolation const& v) -> StepOutcome
    {
        if (state_.Player(seat).kind == AgentKind::Ai)
            CLU_THROW(error::Code::InvalidAction, error::describe(v));
        display_->DisplayError(error::describe(v));
        return StepOutcome::Invalid;
    }

    auto TurnController::MoveTo(PlyrIdxT const seat, Location const& dest) -> void
    {
        PlayerRecord moved = state_.Player(seat);
        moved.location = dest;
        state_.ReplacePlayer(std::move(moved));
        ctx_.destination = dest;

        if (state_.IsAccusationRoom(dest)) phase_ = TurnPhase::Accusation;
        else if (dest.IsRoom()) phase_ = TurnPhase::Guess;
        else phase_ = TurnPhase::EndTurn;
    }

    auto TurnController::Step() -> StepOutcome
    {
        switch (phase_)
        {
        case TurnPhase::AwaitMove:
        case TurnPhase::AwaitMoveAgain: return StepMove();
        case TurnPhase::AwaitMovement: return StepMovement();
        case TurnPhase::Accusation: return StepAccusation();
        case TurnPhase::Guess: return StepGuess();
        case TurnPhase::EndTurn: return StepEndTurn();
        case TurnPhase::Win:
        case TurnPhase::GameOver: return StepOutcome::GameEnded;
        }
        CLU_THROW(error::Code::State, "Unknown turn phase");
    }

    auto TurnController::Run() -> TurnPhase
    {
        while (!IsOver())
        {
            (void)Step();
        }
        return phase_;
    }

    auto TurnController::StepMove() -> StepOutcome
    {
        auto const [cur, next] = ResolveCurrent();
        PlayerRecord const& p = state_.Player(cur);

        if (p.is_out)
        {
            if (!state_.AllOut())
            {
                AdvanceTo(next);
                return StepOutcome::Skipped;
            }
            return EndGame("Game over.");
        }

        if (phase_ == TurnPhase::AwaitMove)
        {
            if (cfg_.turn_limit != 0 && turns_ >= cfg_.turn_limit)
                return EndGame("Turn limit reached. Game over.");
            ++turns_;
            ctx_ = TurnContext{.cur = cur, .next = next};
            display_->PrintTurn(state_, cur);
        }

        std::vector<MoveOption> const options = board_->MoveOptions(state_, cur);
        MoveOption const move = agents_[cur]->ChooseMove(ViewFor(cur), options);
        if (auto const ok = rules_->ValidateMove(state_, cur, options, move); !ok.has_value())
        {
            phase_ = TurnPhase::AwaitMoveAgain;
            return Reject(cur, ok.error());
        }
        display_->PrintMove(p.id, move);

        if (auto const* passage = std::get_if<PassageMove>(&move))
        {
            MoveTo(cur, passage->to);
            return StepOutcome::Applied;
        }

        int const roll = rng_.RollDice();
        ctx_.roll = roll;
        display_->PrintDiceRoll(p.id, roll);
        ctx_.movement_options = board_->MovementOptions(state_, cur, roll);
        if (ctx_.movement_options.empty())
        {
            display_->DisplayMessage(std::format("{} has nowhere to go.", p.id));
            ctx_.destination = p.location;
            phase_ = TurnPhase::EndTurn;
            return StepOutcome::Applied;
        }
        phase_ = TurnPhase::AwaitMovement;
        return StepOutcome::Applied;
    }

    auto TurnController::StepMovement() -> StepOutcome
    {
        PlyrIdxT const cur = ctx_.cur;
        MovementOption const choice = agents_[cur]->ChooseMovement(ViewFor(cur), ctx_.movement_options);
        if (auto const ok = rules_->ValidateMovement(state_, cur, ctx_.movement_options, choice); !ok.has_value())
        {
            return Reject(cur, ok.error());
        }
        display_->PrintMovement(state_.Player(cur).id, choice);
        MoveTo(cur, choice.location);
        return StepOutcome::Applied;
    }

    auto TurnController::StepAccusation() -> StepOutcome
    {
        PlyrIdxT const cur = ctx_.cur;
        Triple const accusation = agents_[cur]->ChooseAccusation(ViewFor(cur));
        if (auto const ok = rules_->ValidateAccusation(state_, cur, accusation); !ok.has_value())
        {
            return Reject(cur, ok.error());
        }

        PlayerRecord out = state_.Player(cur);
        display_->PrintAccusation(out.id, accusation);

        if (accusation == state_.Solution())
        {
            winner_ = cur;
            phase_ = TurnPhase::Win;
            display_->DisplayVictory(out.id);
            return StepOutcome::GameEnded;
        }

        display_->DisplayMessage(std::format("{} guessed incorrectly, and is out of the game.", out.id));
        out.is_out = true;
        state_.ReplacePlayer(std::move(out));

        bool const guard = state_.Public().ai_only || state_.AnyActiveHuman();
        if (guard && !state_.AllOut())
        {
            AdvanceTo(ctx_.next);
            return StepOutcome::TurnEnded;
        }
        return EndGame("Game over.");
    }

    auto TurnController::AskReveal(PlyrIdxT const seat, Triple const& guess,
                                   PlayerId const& asker) -> std::optional<Card>
    {
        for (;;)
        {
            std::optional<Card> reveal = agents_[seat]->ChooseReveal(ViewFor(seat), guess, asker);
            auto const ok = rules_->ValidateReveal(state_, seat, guess, reveal);
            if (ok.has_value()) return reveal;
            (void)Reject(seat, ok.error());
        }
    }

    auto TurnController::StepGuess() -> StepOutcome
    {
        PlyrIdxT const cur = ctx_.cur;
        Triple const guess = agents_[cur]->ChooseGuess(ViewFor(cur));
        if (auto const ok = rules_->ValidateGuess(state_, cur, guess); !ok.has_value())
        {
            return Reject(cur, ok.error());
        }

        PlayerId const asker = state_.Player(cur).id;
        display_->PrintGuess(asker, guess);

        // Everyone after the guesser, once around, eliminated players included.
        std::optional<std::pair<PlyrIdxT, Card>> answer;
        for (PlyrIdxT seat = state_.NextSeat(cur); seat != cur; seat = state_.NextSeat(seat))
        {
            if (std::optional<Card> card = AskReveal(seat, guess, asker))
            {
                answer.emplace(seat, std::move(*card));
                break;
            }
        }

        PlayerRecord guesser = state_.Player(cur);
        if (answer)
        {
            auto const& [seat, card] = *answer;
            PlayerRecord revealer = state_.Player(seat);
            guesser.sheet.RecordShown(card, revealer.id);
            revealer.sheet.NoteShownTo(card, guesser.id);
            display_->PrintReveal(revealer.id, guesser.id, card);
            state_.ReplacePlayer(std::move(revealer));
        }
        else
        {
            guesser.sheet.MarkNoDisprove(guess);
            display_->PrintNoDisprove(guesser.id, guess);
        }

        if (cfg_.deduce_by_elimination)
        {
            (void)guesser.sheet.DeduceByElimination();
        }
        state_.ReplacePlayer(std::move(guesser));

        if (answer)
        {
            agents_[cur]->SeeReveal(ViewFor(cur), state_.Player(answer->first).id, answer->second);
        }

        AdvanceTo(ctx_.next);
        return StepOutcome::TurnEnded;
    }

    auto TurnController::StepEndTurn() -> StepOutcome
    {
        AdvanceTo(ctx_.next);
        return StepOutcome::TurnEnded;
    }
}
