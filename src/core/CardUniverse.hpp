//
// Created by Malik T on 15/10/2025.
//

#ifndef CLUEGAME_CARDUNIVERSE_HPP
#define CLUEGAME_CARDUNIVERSE_HPP

#include <vector>
#include "Types.hpp"

namespace clue::core
{
    // Every card in play, in definition order (suspects, weapons, rooms).
    class CardUniverse
    {
    public:
        CardUniverse() = default;
        // Throws Code::Definition on an empty category or a duplicate name.
        CardUniverse(std::vector<Suspect> const& suspects,
                     std::vector<Weapon> const& weapons,
                     std::vector<Room> const& rooms);

        [[nodiscard]]
        auto Cards() const noexcept -> std::vector<Card> const& { return cards_; }
        [[nodiscard]]
        auto Size() const noexcept -> size_t { return cards_.size(); }

        auto Contains(Card const& c) const -> bool;
        auto OfCategory(Category cat) const -> std::vector<Card>;

    private:
        std::vector<Card> cards_;
    };
}

#endif //CLUEGAME_CARDUNIVERSE_HPP
