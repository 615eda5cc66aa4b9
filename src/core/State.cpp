//
// Created by Malik T on 15/10/2025.
//

#include "State.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace clue::core
{
    GameState::GameState(std::vector<PlayerRecord> players, PublicState pub, Envelope envelope,
                         CardUniverse universe) :
        players_(std::move(players)),
        public_(std::move(pub)),
        envelope_(std::move(envelope)),
        universe_(std::move(universe))
    {
    }

    auto GameState::SeatOf(PlayerId const& id) const -> std::expected<PlyrIdxT, error::LookupError>
    {
        if (players_.empty()) return std::unexpected(error::LookupError::EmptyRing);

        auto const it = std::ranges::find_if(players_, [&id](PlayerRecord const& p) { return p.id == id; });
        if (it == std::cend(players_)) return std::unexpected(error::LookupError::PlayerNotFound);
        return static_cast<PlyrIdxT>(std::distance(std::cbegin(players_), it));
    }

    auto GameState::FindCurNext(PlayerId const& id) const -> std::expected<CurNext, error::LookupError>
    {
        return SeatOf(id).transform([this](PlyrIdxT const cur)
        {
            return CurNext{cur, NextSeat(cur)};
        });
    }

    auto GameState::ReplacePlayer(PlayerRecord player) -> void
    {
        auto const seat = SeatOf(player.id);
        if (!seat)
            CLU_THROW(error::Code::State, std::format("{}: {}", error::to_string(seat.error()), player.id));
        players_[*seat] = std::move(player);
    }

    auto GameState::AllOut() const -> bool
    {
        return std::ranges::all_of(players_, [](PlayerRecord const& p) { return p.is_out; });
    }

    auto GameState::AnyActiveHuman() const -> bool
    {
        return std::ranges::any_of(players_, [](PlayerRecord const& p)
        {
            return !p.is_out && p.kind == AgentKind::Human;
        });
    }

    auto GameState::IsAccusationRoom(Location const& loc) const -> bool
    {
        return loc.IsRoom() && loc.name == public_.accusation_room;
    }
}
