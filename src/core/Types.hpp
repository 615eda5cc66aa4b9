//
// Created by Malik T on 14/10/2025.
//

#ifndef CLUEGAME_TYPES_HPP
#define CLUEGAME_TYPES_HPP

#define CLU_ENABLE_TEST_HOOKS true

#include <array>
#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace clue::core::constants
{
    inline constexpr size_t CategoryCount = 3;
    inline constexpr int MinRoll = 2;
    inline constexpr int MaxRoll = 12;
    // seats are indexed by PlyrIdxT
    inline constexpr size_t MaxPlayers = 255;
}

namespace clue::core
{
    // Suspect names double as player ids.
    using PlayerId = std::string;
    using PlyrIdxT = uint8_t;
    static_assert(constants::MaxPlayers <= std::numeric_limits<PlyrIdxT>::max());

    enum class Category : uint8_t
    {
        Suspect = 0,
        Weapon,
        Room
    };

    inline constexpr std::array<Category, constants::CategoryCount> AllCategories{
        Category::Suspect, Category::Weapon, Category::Room
    };

    struct Suspect
    {
        std::string name;
        auto operator<=>(Suspect const&) const = default;
    };

    struct Weapon
    {
        std::string name;
        auto operator<=>(Weapon const&) const = default;
    };

    struct Room
    {
        std::string name;
        auto operator<=>(Room const&) const = default;
    };

    // Alternative order matches Category.
    using Card = std::variant<Suspect, Weapon, Room>;

    inline auto CategoryOf(Card const& c) noexcept -> Category
    {
        return static_cast<Category>(c.index());
    }

    inline auto NameOf(Card const& c) -> std::string const&
    {
        return std::visit([](auto const& alt) -> std::string const& { return alt.name; }, c);
    }

    inline auto to_string(Category const c) -> std::string_view
    {
        switch (c)
        {
        case Category::Suspect: return "Suspect";
        case Category::Weapon: return "Weapon";
        case Category::Room: return "Room";
        }
        return "?";
    }

    struct Triple
    {
        Suspect suspect;
        Weapon weapon;
        Room room;

        auto operator<=>(Triple const&) const = default;

        [[nodiscard]]
        auto Cards() const -> std::array<Card, constants::CategoryCount>
        {
            return {Card{suspect}, Card{weapon}, Card{room}};
        }
    };

    // The hidden solution; fixed at game start.
    using Envelope = Triple;

    enum class LocationKind : uint8_t
    {
        Room = 0,
        Space
    };

    struct Location
    {
        LocationKind kind{LocationKind::Space};
        std::string name;

        auto operator<=>(Location const&) const = default;

        [[nodiscard]]
        auto IsRoom() const noexcept -> bool { return kind == LocationKind::Room; }
    };

    struct RollMove
    {
        auto operator<=>(RollMove const&) const = default;
    };

    struct PassageMove
    {
        Location to;
        auto operator<=>(PassageMove const&) const = default;
    };

    using MoveOption = std::variant<RollMove, PassageMove>;

    struct MovementOption
    {
        Location location;
        // true when the whole roll can be used to get there
        bool exact_roll{true};

        auto operator<=>(MovementOption const&) const = default;
    };

    enum class AgentKind : uint8_t
    {
        Human = 0,
        Ai
    };

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        // eliminating every human does not stop the game early
        bool     ai_only{false};
        bool     deduce_by_elimination{true};
        // 0 = unlimited
        uint32_t turn_limit{0};
    };
}

#endif //CLUEGAME_TYPES_HPP
