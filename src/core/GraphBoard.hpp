//
// Created by Malik T on 18/10/2025.
//

#ifndef CLUEGAME_GRAPHBOARD_HPP
#define CLUEGAME_GRAPHBOARD_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Board.hpp"
#include "Definition.hpp"

namespace clue::core
{
    // Named locations joined by undirected edges, plus one-way secret passages between rooms.
    class GraphBoard final : public Board
    {
    public:
        // Throws Code::Definition on duplicate locations or edges to unknown names.
        GraphBoard(std::vector<LocationDef> const& locations,
                   std::vector<EdgeDef> const& edges,
                   std::vector<PassageDef> const& passages);

        auto MoveOptions(GameState const& game, PlyrIdxT seat) const -> std::vector<MoveOption> override;
        auto MovementOptions(GameState const& game, PlyrIdxT seat,
                             int roll) const -> std::vector<MovementOption> override;

        // Same as MovementOptions, from an explicit location.
        auto Reachable(Location const& from, int roll) const -> std::vector<MovementOption>;
        // Breadth-first step counts; rooms other than the origin are not walked through.
        auto Distances(Location const& from) const -> std::map<std::string, int>;

        auto Find(std::string const& name) const -> std::optional<Location>;
        auto Locations() const noexcept -> std::vector<Location> const& { return locations_; }

    private:
        auto IndexOf(std::string const& name) const -> std::optional<size_t>;

        std::vector<Location> locations_;
        std::vector<std::vector<size_t>> adjacency_;
        std::vector<std::vector<size_t>> passages_;
    };
}

#endif //CLUEGAME_GRAPHBOARD_HPP
