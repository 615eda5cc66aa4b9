//
// Created by Malik T on 16/10/2025.
//

#include "ClassicRules.hpp"

#include <algorithm>
#include <ranges>

namespace
{
    inline auto Viol(clue::core::error::RuleViolationCode code) -> clue::core::error::RuleViolation
    {
        return clue::core::error::RuleViolation{ .code = code };
    }
}

namespace clue::core
{
    auto ClassicRules::HeldCards(PlayerRecord const& p, Triple const& guess) -> std::vector<Card>
    {
        std::vector<Card> held;
        for (Card const& c : guess.Cards())
        {
            Belief const* b = p.sheet.Find(c);
            if (b && IsMine(*b)) held.push_back(c);
        }
        return held;
    }

    auto ClassicRules::ValidateMove(GameState const& game, PlyrIdxT const seat, std::span<MoveOption const> offered,
                                    MoveOption const& move) const -> CheckResult
    {
        using RVC = ::clue::core::error::RuleViolationCode;

        if (std::ranges::find(offered, move) == std::end(offered))
            return std::unexpected(Viol(RVC::Move_NotOffered)
                                   .with_actor(game.Player(seat).id).with_offered(offered.size()));
        return {};
    }

    auto ClassicRules::ValidateMovement(GameState const& game, PlyrIdxT const seat,
                                        std::span<MovementOption const> offered,
                                        MovementOption const& movement) const -> CheckResult
    {
        using RVC = ::clue::core::error::RuleViolationCode;

        // parity flag is informational; the destination alone must be reachable
        bool const reachable = std::ranges::any_of(offered, [&](MovementOption const& o)
        {
            return o.location == movement.location;
        });
        if (!reachable)
            return std::unexpected(Viol(RVC::Movement_NotOffered)
                                   .with_actor(game.Player(seat).id)
                                   .with_location(movement.location)
                                   .with_offered(offered.size()));
        return {};
    }

    auto ClassicRules::ValidateGuess(GameState const& game, PlyrIdxT const seat, Triple const& guess) const -> CheckResult
    {
        using RVC = ::clue::core::error::RuleViolationCode;
        PlayerRecord const& p = game.Player(seat);

        if (!p.location.IsRoom())
            return std::unexpected(Viol(RVC::Guess_NotInRoom).with_actor(p.id).with_location(p.location));

        if (guess.room.name != p.location.name)
            return std::unexpected(Viol(RVC::Guess_RoomMismatch)
                                   .with_actor(p.id).with_card(guess.room).with_location(p.location));

        for (Card const& c : guess.Cards())
        {
            if (!game.Universe().Contains(c))
                return std::unexpected(Viol(RVC::Guess_CardNotInGame).with_actor(p.id).with_card(c));
        }
        return {};
    }

    auto ClassicRules::ValidateAccusation(GameState const& game, PlyrIdxT const seat,
                                          Triple const& accusation) const -> CheckResult
    {
        using RVC = ::clue::core::error::RuleViolationCode;

        for (Card const& c : accusation.Cards())
        {
            if (!game.Universe().Contains(c))
                return std::unexpected(Viol(RVC::Accusation_CardNotInGame)
                                       .with_actor(game.Player(seat).id).with_card(c));
        }
        return {};
    }

    auto ClassicRules::ValidateReveal(GameState const& game, PlyrIdxT const revealer, Triple const& guess,
                                      std::optional<Card> const& reveal) const -> CheckResult
    {
        using RVC = ::clue::core::error::RuleViolationCode;
        PlayerRecord const& p = game.Player(revealer);
        std::vector<Card> const held = HeldCards(p, guess);

        if (!reveal)
        {
            if (!held.empty())
                return std::unexpected(Viol(RVC::Reveal_Withheld).with_actor(p.id).with_offered(held.size()));
            return {};
        }

        auto const in_guess = guess.Cards();
        if (std::ranges::find(in_guess, *reveal) == std::end(in_guess))
            return std::unexpected(Viol(RVC::Reveal_CardNotInGuess).with_actor(p.id).with_card(*reveal));

        if (std::ranges::find(held, *reveal) == std::end(held))
            return std::unexpected(Viol(RVC::Reveal_CardNotHeld).with_actor(p.id).with_card(*reveal));

        return {};
    }
}
