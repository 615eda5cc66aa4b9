//
// Created by Malik T on 14/10/2025.
//

#ifndef CLUEGAME_EXCEPTION_HPP
#define CLUEGAME_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace clue::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        State, // player ring misuse (empty ring, unknown player)
        Sheet, // contradictory knowledge sheet update
        Deduction, // policy asked for something it cannot know
        InvalidAction, // automated agent proposed an illegal decision
        Definition, // malformed game definition
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    inline auto to_string(Code const c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "Unknown";
        case Code::State: return "State";
        case Code::Sheet: return "Sheet";
        case Code::Deduction: return "Deduction";
        case Code::InvalidAction: return "InvalidAction";
        case Code::Definition: return "Definition";
        case Code::Serialization: return "Serialization";
        case Code::Assertion: return "Assertion";
        }
        return "Unknown";
    }

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SheetError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct DeductionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct DefinitionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Sheet: throw SheetError(std::move(msg), c, loc);
        case Code::Deduction: throw DeductionError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Definition: throw DefinitionError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define CLU_THROW(code_enum, msg) ::clue::core::error::fail((code_enum), (msg))
#define CLU_ASSERT(cond, msg) do { if(!(cond)) ::clue::core::error::fail(::clue::core::error::Code::Assertion, (msg)); } while(0)

    // Ring lookup failures. Both are fatal to the controller.
    enum class LookupError : uint8_t
    {
        EmptyRing,
        PlayerNotFound
    };

    inline auto to_string(LookupError const e) -> std::string_view
    {
        switch (e)
        {
        case LookupError::EmptyRing: return "No players in game";
        case LookupError::PlayerNotFound: return "No player with suspect name";
        }
        return "Unknown lookup error";
    }

    // Fine-grained reasons; grouped by decision type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Move / movement
        Move_NotOffered,
        Movement_NotOffered,

        // Guess
        Guess_NotInRoom,
        Guess_RoomMismatch,
        Guess_CardNotInGame,

        // Accusation
        Accusation_CardNotInGame,

        // Reveal
        Reveal_CardNotHeld,
        Reveal_CardNotInGuess,
        Reveal_Withheld,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<PlayerId> actor{};
        std::optional<std::string> card{};
        std::optional<std::string> location{};
        std::optional<std::uint8_t> offered{}; // number of legal options

        auto with_actor(PlayerId p) -> RuleViolation&
        {
            actor = std::move(p);
            return *this;
        }

        auto with_card(Card const& c) -> RuleViolation&
        {
            card = NameOf(c);
            return *this;
        }

        auto with_location(Location const& l) -> RuleViolation&
        {
            location = l.name;
            return *this;
        }

        auto with_offered(std::size_t n) -> RuleViolation&
        {
            offered = static_cast<std::uint8_t>(n);
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Move_NotOffered: return "Move: option not offered";
        case E::Movement_NotOffered: return "Movement: destination not reachable";
        case E::Guess_NotInRoom: return "Guess: player is not in a room";
        case E::Guess_RoomMismatch: return "Guess: room must be the current room";
        case E::Guess_CardNotInGame: return "Guess: card not part of this game";
        case E::Accusation_CardNotInGame: return "Accusation: card not part of this game";
        case E::Reveal_CardNotHeld: return "Reveal: card not in hand";
        case E::Reveal_CardNotInGuess: return "Reveal: card not part of the guess";
        case E::Reveal_Withheld: return "Reveal: a matching card must be shown";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor={}", *v.actor);
        if (v.card) s += std::format(" | card={}", *v.card);
        if (v.location) s += std::format(" | loc={}", *v.location);
        if (v.offered) s += std::format(" | offered={}", *v.offered);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //CLUEGAME_EXCEPTION_HPP
