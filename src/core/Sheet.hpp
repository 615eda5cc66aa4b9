//
// Created by Malik T on 15/10/2025.
//

#ifndef CLUEGAME_SHEET_HPP
#define CLUEGAME_SHEET_HPP

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <vector>
#include "CardUniverse.hpp"
#include "Types.hpp"

namespace clue::core
{
    struct Unknown
    {
        auto operator==(Unknown const&) const -> bool = default;
    };

    struct Mine
    {
        // rivals that have already been shown this card
        std::vector<PlayerId> shown_to;
        auto operator==(Mine const&) const -> bool = default;
    };

    struct InEnvelope
    {
        auto operator==(InEnvelope const&) const -> bool = default;
    };

    struct ShownBy
    {
        PlayerId by;
        auto operator==(ShownBy const&) const -> bool = default;
    };

    using Belief = std::variant<Unknown, Mine, InEnvelope, ShownBy>;

    inline auto IsUnknown(Belief const& b) noexcept -> bool { return std::holds_alternative<Unknown>(b); }
    inline auto IsMine(Belief const& b) noexcept -> bool { return std::holds_alternative<Mine>(b); }
    inline auto IsEnvelope(Belief const& b) noexcept -> bool { return std::holds_alternative<InEnvelope>(b); }
    inline auto IsShown(Belief const& b) noexcept -> bool { return std::holds_alternative<ShownBy>(b); }

    // Per category: the unique card believed to be in the envelope, if any.
    struct SolutionGuess
    {
        std::optional<Suspect> suspect;
        std::optional<Weapon> weapon;
        std::optional<Room> room;

        [[nodiscard]]
        auto IsComplete() const noexcept -> bool { return suspect && weapon && room; }

        // Throws Code::Deduction if any category is unresolved.
        [[nodiscard]]
        auto ToTriple() const -> Triple;
    };

    // One player's private belief table over the whole card universe.
    class KnowledgeSheet
    {
    public:
        using BeliefPred = std::function<bool(Belief const&)>;

        KnowledgeSheet() = default;

        // Mine{} for every hand card, Unknown for the rest.
        // Throws Code::Sheet if the hand holds a card outside the universe.
        static auto Initialize(CardUniverse const& universe, std::span<Card const> hand) -> KnowledgeSheet;

        // Unknown -> ShownBy(by). Repeating the same observation is a no-op.
        auto RecordShown(Card const& card, PlayerId const& by) -> void;
        // Unknown -> InEnvelope for each card of the triple; others untouched.
        auto MarkNoDisprove(Triple const& guess) -> void;
        // Requires Mine; grows the shown-to set.
        auto NoteShownTo(Card const& card, PlayerId const& viewer) -> void;
        // A category with no envelope card and one Unknown left resolves to it.
        auto DeduceByElimination() -> bool;

        [[nodiscard]]
        auto CategorySolved(Category cat) const -> bool;
        [[nodiscard]]
        auto AllSolved() const -> bool;
        [[nodiscard]]
        auto GuessSolution() const -> SolutionGuess;

        // Throws Code::Sheet if the card is not tracked.
        auto BeliefOf(Card const& card) const -> Belief const&;
        // nullptr if the card is not tracked (e.g. the accusation room).
        auto Find(Card const& card) const -> Belief const*;

        auto CardsIn(Category cat, BeliefPred const& pred) const -> std::vector<Card>;

        [[nodiscard]]
        auto Size() const noexcept -> size_t { return beliefs_.size(); }
        auto Entries() const noexcept -> std::map<Card, Belief> const& { return beliefs_; }

    private:
        auto Mutable(Card const& card) -> Belief&;

        std::map<Card, Belief> beliefs_;
    };
}

#endif //CLUEGAME_SHEET_HPP
