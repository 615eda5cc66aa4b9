//
// Created by Malik T on 16/10/2025.
//

#ifndef CLUEGAME_DEDUCTION_HPP
#define CLUEGAME_DEDUCTION_HPP

#include <optional>
#include <span>
#include "Rng.hpp"
#include "Sheet.hpp"
#include "State.hpp"
#include "Types.hpp"

// Heuristic policy for automated players. Every function reads only the acting
// player's own sheet plus public data; randomness comes from the caller's Rng.
namespace clue::core::deduction
{
    // Room unsolved: passage into a room we hold, else into an envelope room, else roll.
    // Room solved: passage into a room we know nothing about, else roll.
    auto DecideMove(KnowledgeSheet const& sheet, std::span<MoveOption const> options, Rng& rng) -> MoveOption;

    // With everything solved only the accusation room is acceptable (throws Code::Deduction
    // unless exactly one such option exists). Otherwise rooms are ranked by belief and parity,
    // the accusation room excluded: exact held, exact envelope, any held or envelope, then
    // unknown rooms while the room is open, then anything left.
    auto DecideMovement(KnowledgeSheet const& sheet, PublicState const& pub,
                        std::span<MovementOption const> options, Rng& rng) -> MovementOption;

    auto DecideGuess(KnowledgeSheet const& sheet, Room const& current_room, Rng& rng) -> Triple;

    // Caller checks AllSolved() first; throws Code::Deduction otherwise.
    auto DecideAccusation(KnowledgeSheet const& sheet) -> Triple;

    auto DecideReveal(KnowledgeSheet const& sheet, Triple const& guess, PlayerId const& asker,
                      Rng& rng) -> std::optional<Card>;

    // Belief about the room card a location stands for; nullptr for spaces and non-card rooms.
    auto RoomBelief(KnowledgeSheet const& sheet, Location const& loc) -> Belief const*;
}

#endif //CLUEGAME_DEDUCTION_HPP
