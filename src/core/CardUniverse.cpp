//
// Created by Malik T on 15/10/2025.
//

#include "CardUniverse.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <set>
#include "Exception.hpp"

namespace clue::core
{
    CardUniverse::CardUniverse(std::vector<Suspect> const& suspects,
                               std::vector<Weapon> const& weapons,
                               std::vector<Room> const& rooms)
    {
        if (suspects.empty() || weapons.empty() || rooms.empty())
            CLU_THROW(error::Code::Definition, "Every card category needs at least one card");

        cards_.reserve(suspects.size() + weapons.size() + rooms.size());
        for (Suspect const& s : suspects) cards_.emplace_back(s);
        for (Weapon const& w : weapons) cards_.emplace_back(w);
        for (Room const& r : rooms) cards_.emplace_back(r);

        std::set<Card> seen;
        for (Card const& c : cards_)
        {
            if (!seen.insert(c).second)
                CLU_THROW(error::Code::Definition,
                          std::format("Duplicate {} card '{}'", to_string(CategoryOf(c)), NameOf(c)));
        }
    }

    auto CardUniverse::Contains(Card const& c) const -> bool
    {
        return std::ranges::find(cards_, c) != std::cend(cards_);
    }

    auto CardUniverse::OfCategory(Category const cat) const -> std::vector<Card>
    {
        std::vector<Card> out;
        std::ranges::copy_if(cards_, std::back_inserter(out),
                             [cat](Card const& c) { return CategoryOf(c) == cat; });
        return out;
    }
}
