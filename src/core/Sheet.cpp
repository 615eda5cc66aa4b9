//
// Created by Malik T on 15/10/2025.
//

#include "Sheet.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"

namespace clue::core
{
    auto SolutionGuess::ToTriple() const -> Triple
    {
        if (!IsComplete())
            CLU_THROW(error::Code::Deduction, "Solution requested while a category is unresolved");
        return Triple{*suspect, *weapon, *room};
    }

    auto KnowledgeSheet::Initialize(CardUniverse const& universe, std::span<Card const> hand) -> KnowledgeSheet
    {
        for (Card const& c : hand)
        {
            if (!universe.Contains(c))
                CLU_THROW(error::Code::Sheet, std::format("Hand card '{}' is not part of the game", NameOf(c)));
        }

        KnowledgeSheet sheet;
        for (Card const& c : universe.Cards())
        {
            bool const in_hand = std::ranges::find(hand, c) != std::end(hand);
            sheet.beliefs_.emplace(c, in_hand ? Belief{Mine{}} : Belief{Unknown{}});
        }
        return sheet;
    }

    auto KnowledgeSheet::Mutable(Card const& card) -> Belief&
    {
        auto const it = beliefs_.find(card);
        if (it == std::end(beliefs_))
            CLU_THROW(error::Code::Sheet, std::format("Card '{}' is not on the sheet", NameOf(card)));
        return it->second;
    }

    auto KnowledgeSheet::BeliefOf(Card const& card) const -> Belief const&
    {
        Belief const* b = Find(card);
        if (!b)
            CLU_THROW(error::Code::Sheet, std::format("Card '{}' is not on the sheet", NameOf(card)));
        return *b;
    }

    auto KnowledgeSheet::Find(Card const& card) const -> Belief const*
    {
        auto const it = beliefs_.find(card);
        return (it != std::cend(beliefs_)) ? &it->second : nullptr;
    }

    auto KnowledgeSheet::RecordShown(Card const& card, PlayerId const& by) -> void
    {
        Belief& b = Mutable(card);
        std::visit([&]<typename T0>(T0 const&)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Unknown>)
            {
                b = ShownBy{by};
            }
            else if constexpr (std::is_same_v<T, ShownBy>)
            {
                // already accounted for
            }
            else if constexpr (std::is_same_v<T, Mine>)
            {
                CLU_THROW(error::Code::Sheet, std::format("'{}' was shown by {} but is in own hand", NameOf(card), by));
            }
            else
            {
                CLU_THROW(error::Code::Sheet, std::format("'{}' was shown by {} but is marked as envelope", NameOf(card), by));
            }
        }, b);
    }

    auto KnowledgeSheet::MarkNoDisprove(Triple const& guess) -> void
    {
        for (Card const& c : guess.Cards())
        {
            Belief& b = Mutable(c);
            if (IsUnknown(b)) b = InEnvelope{};
        }
    }

    auto KnowledgeSheet::NoteShownTo(Card const& card, PlayerId const& viewer) -> void
    {
        Belief& b = Mutable(card);
        auto* mine = std::get_if<Mine>(&b);
        if (!mine)
            CLU_THROW(error::Code::Sheet, std::format("Showed '{}' to {} but it is not in hand", NameOf(card), viewer));

        if (std::ranges::find(mine->shown_to, viewer) == std::end(mine->shown_to))
            mine->shown_to.push_back(viewer);
    }

    auto KnowledgeSheet::DeduceByElimination() -> bool
    {
        bool changed = false;
        for (Category const cat : AllCategories)
        {
            size_t envelope = 0;
            size_t unknown = 0;
            Belief* last_unknown = nullptr;
            for (auto& [card, belief] : beliefs_)
            {
                if (CategoryOf(card) != cat) continue;
                envelope += IsEnvelope(belief);
                if (IsUnknown(belief))
                {
                    ++unknown;
                    last_unknown = &belief;
                }
            }
            if (envelope == 0 && unknown == 1)
            {
                *last_unknown = InEnvelope{};
                changed = true;
            }
        }
        return changed;
    }

    auto KnowledgeSheet::CategorySolved(Category const cat) const -> bool
    {
        auto const n = std::ranges::count_if(beliefs_, [cat](auto const& entry)
        {
            return CategoryOf(entry.first) == cat && IsEnvelope(entry.second);
        });
        return n == 1;
    }

    auto KnowledgeSheet::AllSolved() const -> bool
    {
        return std::ranges::all_of(AllCategories, [this](Category c) { return CategorySolved(c); });
    }

    auto KnowledgeSheet::GuessSolution() const -> SolutionGuess
    {
        SolutionGuess out{};
        for (Category const cat : AllCategories)
        {
            if (!CategorySolved(cat)) continue;
            auto const it = std::ranges::find_if(beliefs_, [cat](auto const& entry)
            {
                return CategoryOf(entry.first) == cat && IsEnvelope(entry.second);
            });
            std::visit([&]<typename T0>(T0 const& alt)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, Suspect>) out.suspect = alt;
                else if constexpr (std::is_same_v<T, Weapon>) out.weapon = alt;
                else out.room = alt;
            }, it->first);
        }
        return out;
    }

    auto KnowledgeSheet::CardsIn(Category const cat, BeliefPred const& pred) const -> std::vector<Card>
    {
        std::vector<Card> out;
        for (auto const& [card, belief] : beliefs_)
        {
            if (CategoryOf(card) == cat && pred(belief)) out.push_back(card);
        }
        return out;
    }
}
