//
// Created by Malik T on 18/10/2025.
//

#ifndef CLUEGAME_UTIL_HPP
#define CLUEGAME_UTIL_HPP

#include <format>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include "Types.hpp"

namespace clue::core::util
{
    template <typename T, typename Fn>
    inline auto Join(std::span<T const> items, std::string_view const sep, Fn&& fn) -> std::string
    {
        std::string body;
        for (size_t i{}; i < items.size(); ++i)
        {
            body += (i ? sep : std::string_view{});
            body += fn(items[i]);
        }
        return body;
    }

    inline auto CardText(Card const& c) -> std::string
    {
        return std::format("{}:{}", to_string(CategoryOf(c)), NameOf(c));
    }

    inline auto TripleText(Triple const& t) -> std::string
    {
        return std::format("{} with the {} in the {}", t.suspect.name, t.weapon.name, t.room.name);
    }

    inline auto MoveText(MoveOption const& m) -> std::string
    {
        return std::visit(
            [&]<typename T0>(T0 const& mv) -> std::string
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, PassageMove>)
                {
                    return std::format("Passage to {}", mv.to.name);
                }
                else
                {
                    return "Roll";
                }
            },
            m
        );
    }

    inline auto MovementText(MovementOption const& m) -> std::string
    {
        return std::format("{}{}", m.location.name, m.exact_roll ? "" : " (short of roll)");
    }
}

#endif //CLUEGAME_UTIL_HPP
