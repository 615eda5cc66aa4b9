//
// Created by Malik T on 15/10/2025.
//

#ifndef CLUEGAME_STATE_HPP
#define CLUEGAME_STATE_HPP

#include <expected>
#include <vector>
#include "CardUniverse.hpp"
#include "Exception.hpp"
#include "Sheet.hpp"
#include "Types.hpp"

namespace clue::core
{
    struct PlayerRecord
    {
        PlayerId id;
        AgentKind kind{AgentKind::Ai};
        Location location;
        bool is_out{false};
        KnowledgeSheet sheet;
    };

    // Shared, read-mostly. Only the controller writes it.
    struct PublicState
    {
        PlayerId current_player;
        std::string accusation_room;
        bool ai_only{false};
    };

    struct CurNext
    {
        PlyrIdxT cur{};
        PlyrIdxT next{};
    };

    // Players are kept in turn order; the vector is read as a ring.
    class GameState
    {
    public:
        GameState() = default;
        GameState(std::vector<PlayerRecord> players, PublicState pub, Envelope envelope, CardUniverse universe);

        // (current, next) for the given id, wrapping after the last seat.
        auto FindCurNext(PlayerId const& id) const -> std::expected<CurNext, error::LookupError>;
        auto SeatOf(PlayerId const& id) const -> std::expected<PlyrIdxT, error::LookupError>;

        // Overwrites the record with the same id. Throws Code::State if absent.
        auto ReplacePlayer(PlayerRecord player) -> void;

        auto NextSeat(PlyrIdxT const idx) const -> PlyrIdxT
        {
            return static_cast<PlyrIdxT>((idx + 1) % players_.size());
        }

        auto AllOut() const -> bool;
        auto AnyActiveHuman() const -> bool;
        auto IsAccusationRoom(Location const& loc) const -> bool;

        auto Players() const noexcept -> std::vector<PlayerRecord> const& { return players_; }
        auto Player(PlyrIdxT const seat) const -> PlayerRecord const& { return players_.at(seat); }
        auto PlayerCount() const noexcept -> size_t { return players_.size(); }

        auto Public() const noexcept -> PublicState const& { return public_; }
        auto SetCurrentPlayer(PlayerId id) -> void { public_.current_player = std::move(id); }

        auto Solution() const noexcept -> Envelope const& { return envelope_; }
        auto Universe() const noexcept -> CardUniverse const& { return universe_; }

    private:
        std::vector<PlayerRecord> players_;
        PublicState public_;
        Envelope envelope_;
        CardUniverse universe_;
    };
}

#endif //CLUEGAME_STATE_HPP
