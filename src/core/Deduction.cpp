//
// Created by Malik T on 16/10/2025.
//

#include "Deduction.hpp"

#include <algorithm>
#include <iterator>
#include <vector>
#include "Exception.hpp"

namespace clue::core::deduction
{
    namespace
    {
        using BeliefTest = bool (*)(Belief const&) noexcept;

        auto IsMineOrEnvelope(Belief const& b) noexcept -> bool
        {
            return IsMine(b) || IsEnvelope(b);
        }

        auto PassagesInto(KnowledgeSheet const& sheet, std::span<MoveOption const> options,
                          BeliefTest const test) -> std::vector<MoveOption>
        {
            std::vector<MoveOption> out;
            for (MoveOption const& m : options)
            {
                auto const* passage = std::get_if<PassageMove>(&m);
                if (!passage) continue;
                Belief const* b = RoomBelief(sheet, passage->to);
                if (b && test(*b)) out.push_back(m);
            }
            return out;
        }

        auto RoomsWhere(KnowledgeSheet const& sheet, std::vector<MovementOption> const& options,
                        BeliefTest const test, bool const exact_only) -> std::vector<MovementOption>
        {
            std::vector<MovementOption> out;
            std::ranges::copy_if(options, std::back_inserter(out), [&](MovementOption const& o)
            {
                if (exact_only && !o.exact_roll) return false;
                Belief const* b = RoomBelief(sheet, o.location);
                return b && test(*b);
            });
            return out;
        }

        // Solved: a card we hold (never helps a rival) else the envelope card. Unsolved: name an unknown.
        template <class T>
        auto GuessCard(KnowledgeSheet const& sheet, Category const cat, Rng& rng) -> T
        {
            if (sheet.CategorySolved(cat))
            {
                std::vector<Card> const mine = sheet.CardsIn(cat, IsMine);
                if (!mine.empty()) return std::get<T>(rng.Pick(mine));
                std::vector<Card> const env = sheet.CardsIn(cat, IsEnvelope);
                return std::get<T>(env.front());
            }
            return std::get<T>(rng.Pick(sheet.CardsIn(cat, IsUnknown)));
        }
    }

    auto RoomBelief(KnowledgeSheet const& sheet, Location const& loc) -> Belief const*
    {
        if (!loc.IsRoom()) return nullptr;
        return sheet.Find(Card{Room{loc.name}});
    }

    auto DecideMove(KnowledgeSheet const& sheet, std::span<MoveOption const> options, Rng& rng) -> MoveOption
    {
        if (!sheet.CategorySolved(Category::Room))
        {
            if (auto const mine = PassagesInto(sheet, options, IsMine); !mine.empty())
                return rng.Pick(mine);
            if (auto const env = PassagesInto(sheet, options, IsEnvelope); !env.empty())
                return rng.Pick(env);
            return RollMove{};
        }

        if (auto const unknown = PassagesInto(sheet, options, IsUnknown); !unknown.empty())
            return rng.Pick(unknown);
        return RollMove{};
    }

    auto DecideMovement(KnowledgeSheet const& sheet, PublicState const& pub,
                        std::span<MovementOption const> options, Rng& rng) -> MovementOption
    {
        auto const is_acc = [&pub](MovementOption const& o)
        {
            return o.location.IsRoom() && o.location.name == pub.accusation_room;
        };

        if (sheet.AllSolved())
        {
            std::vector<MovementOption> acc;
            std::ranges::copy_if(options, std::back_inserter(acc), is_acc);
            if (acc.size() != 1)
                CLU_THROW(error::Code::Deduction, "Can't find accusation room");
            return acc.front();
        }

        std::vector<MovementOption> cands;
        std::ranges::copy_if(options, std::back_inserter(cands), [&](MovementOption const& o) { return !is_acc(o); });

        bool const room_solved = sheet.CategorySolved(Category::Room);
        if (auto const t = RoomsWhere(sheet, cands, IsMine, true); !t.empty()) return rng.Pick(t);
        if (auto const t = RoomsWhere(sheet, cands, IsEnvelope, true); !t.empty()) return rng.Pick(t);
        if (auto const t = RoomsWhere(sheet, cands, IsMineOrEnvelope, false); !t.empty()) return rng.Pick(t);
        if (!room_solved)
        {
            if (auto const t = RoomsWhere(sheet, cands, IsUnknown, true); !t.empty()) return rng.Pick(t);
            if (auto const t = RoomsWhere(sheet, cands, IsUnknown, false); !t.empty()) return rng.Pick(t);
        }
        if (cands.empty())
            CLU_THROW(error::Code::Deduction, "No movement option outside the accusation room");
        return rng.Pick(cands);
    }

    auto DecideGuess(KnowledgeSheet const& sheet, Room const& current_room, Rng& rng) -> Triple
    {
        Suspect suspect = GuessCard<Suspect>(sheet, Category::Suspect, rng);
        Weapon weapon = GuessCard<Weapon>(sheet, Category::Weapon, rng);
        return Triple{std::move(suspect), std::move(weapon), current_room};
    }

    auto DecideAccusation(KnowledgeSheet const& sheet) -> Triple
    {
        return sheet.GuessSolution().ToTriple();
    }

    auto DecideReveal(KnowledgeSheet const& sheet, Triple const& guess, PlayerId const& asker,
                      Rng& rng) -> std::optional<Card>
    {
        std::vector<Card> matches;
        std::vector<Card> fresh;
        for (Card const& c : guess.Cards())
        {
            Belief const* b = sheet.Find(c);
            auto const* mine = b ? std::get_if<Mine>(b) : nullptr;
            if (!mine) continue;
            matches.push_back(c);
            if (std::ranges::find(mine->shown_to, asker) == std::cend(mine->shown_to))
                fresh.push_back(c);
        }

        if (matches.empty()) return std::nullopt;
        if (matches.size() == 1) return matches.front();
        // spread exposure: prefer a card this asker has not seen yet
        if (!fresh.empty()) return rng.Pick(fresh);
        return rng.Pick(matches);
    }
}
