//
// Created by Malik T on 19/10/2025.
//

#ifndef CLUEGAME_INVARIANTS_HPP
#define CLUEGAME_INVARIANTS_HPP

#include <algorithm>
#include <format>
#include <map>

#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "Inspector.hpp"

namespace clue::core::debug
{
    // A second layer of checks on top of the rules. Every deduction must agree with the
    // real deal, so any drift between a sheet and the cards shows up here first.
    inline auto CheckInvariants(GameState const& g) -> void
    {
#if CLU_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        Envelope const& env = g.Solution();
        auto const env_cards = env.Cards();
        auto const in_env = [&env_cards](Card const& c)
        {
            return std::ranges::find(env_cards, c) != std::cend(env_cards);
        };

        // 1) The solution is made of real cards
        for (Card const& c : env_cards)
        {
            CLU_ASSERT(g.Universe().Contains(c), "Envelope card outside the universe");
        }

        // 2) Every sheet tracks exactly the universe
        for (PlayerRecord const& p : g.Players())
        {
            CLU_ASSERT(p.sheet.Size() == g.Universe().Size(),
                       std::format("Sheet of {} tracks {} cards, universe has {}", p.id, p.sheet.Size(),
                                   g.Universe().Size()));
            for (Card const& c : g.Universe().Cards())
            {
                CLU_ASSERT(p.sheet.Find(c) != nullptr, std::format("Sheet of {} misses {}", p.id, NameOf(c)));
            }
        }

        // 3) A card is Mine in at most one hand, never for an envelope card
        std::map<Card, PlayerId> owner;
        for (PlayerRecord const& p : g.Players())
        {
            for (auto const& [card, belief] : p.sheet.Entries())
            {
                if (!IsMine(belief)) continue;
                CLU_ASSERT(!in_env(card), std::format("{} holds envelope card {}", p.id, NameOf(card)));
                CLU_ASSERT(owner.emplace(card, p.id).second, std::format("{} held twice", NameOf(card)));
            }
        }

        // 4) Deductions agree with the deal
        for (PlayerRecord const& p : g.Players())
        {
            for (auto const& [card, belief] : p.sheet.Entries())
            {
                if (IsEnvelope(belief))
                {
                    CLU_ASSERT(in_env(card), std::format("{} wrongly puts {} in the envelope", p.id, NameOf(card)));
                }
                else if (auto const* shown = std::get_if<ShownBy>(&belief))
                {
                    auto const it = owner.find(card);
                    CLU_ASSERT(it != owner.end() && it->second == shown->by,
                               std::format("{} thinks {} holds {}", p.id, shown->by, NameOf(card)));
                }
            }
        }

        // 5) The ring still knows whose turn it is
        CLU_ASSERT(g.SeatOf(g.Public().current_player).has_value(), "Current player is not seated");
#endif // CLU_ENABLE_TEST_HOOKS == true
    }

    inline auto CheckInvariants(TurnController const& t) -> void
    {
        Inspector::SnapshotAll const s = Inspector::Gather(t);
        CheckInvariants(*s.state);

        if (s.phase == TurnPhase::Win)
        {
            CLU_ASSERT(s.winner.has_value(), "Win without a winner");
            CLU_ASSERT(!s.state->Player(*s.winner).is_out, "Winner was eliminated");
        }
        if (s.phase == TurnPhase::AwaitMovement)
        {
            CLU_ASSERT(s.roll.has_value() && !s.movement_options.empty(), "Awaiting movement without options");
        }
    }
}

#endif //CLUEGAME_INVARIANTS_HPP
