//
// Created by Malik T on 18/10/2025.
//

#include "GraphBoard.hpp"

#include <algorithm>
#include <deque>
#include <iterator>
#include <format>
#include "Exception.hpp"

namespace clue::core
{
    GraphBoard::GraphBoard(std::vector<LocationDef> const& locations,
                           std::vector<EdgeDef> const& edges,
                           std::vector<PassageDef> const& passages)
    {
        locations_.reserve(locations.size());
        for (LocationDef const& l : locations)
        {
            if (IndexOf(l.name))
                CLU_THROW(error::Code::Definition, std::format("Duplicate location '{}'", l.name));
            locations_.push_back(Location{l.kind, l.name});
        }
        adjacency_.resize(locations_.size());
        passages_.resize(locations_.size());

        auto const resolve = [this](std::string const& name) -> size_t
        {
            auto const idx = IndexOf(name);
            if (!idx)
                CLU_THROW(error::Code::Definition, std::format("Unknown location '{}'", name));
            return *idx;
        };

        for (EdgeDef const& e : edges)
        {
            size_t const a = resolve(e.a);
            size_t const b = resolve(e.b);
            if (a == b)
                CLU_THROW(error::Code::Definition, std::format("Self edge on '{}'", e.a));
            if (std::ranges::find(adjacency_[a], b) != adjacency_[a].end()) continue;
            adjacency_[a].push_back(b);
            adjacency_[b].push_back(a);
        }

        for (PassageDef const& p : passages)
        {
            size_t const from = resolve(p.from);
            size_t const to = resolve(p.to);
            if (!locations_[from].IsRoom() || !locations_[to].IsRoom() || from == to)
                CLU_THROW(error::Code::Definition,
                          std::format("Passage '{}' -> '{}' must join two different rooms", p.from, p.to));
            passages_[from].push_back(to);
        }
    }

    auto GraphBoard::IndexOf(std::string const& name) const -> std::optional<size_t>
    {
        auto const it = std::ranges::find(locations_, name, &Location::name);
        if (it == locations_.end()) return std::nullopt;
        return static_cast<size_t>(std::distance(locations_.begin(), it));
    }

    auto GraphBoard::Find(std::string const& name) const -> std::optional<Location>
    {
        auto const idx = IndexOf(name);
        if (!idx) return std::nullopt;
        return locations_[*idx];
    }

    auto GraphBoard::MoveOptions(GameState const& game, PlyrIdxT const seat) const -> std::vector<MoveOption>
    {
        Location const& at = game.Player(seat).location;
        auto const idx = IndexOf(at.name);
        if (!idx)
            CLU_THROW(error::Code::State, std::format("Player stands on unknown location '{}'", at.name));

        std::vector<MoveOption> options{RollMove{}};
        for (size_t const to : passages_[*idx])
        {
            options.emplace_back(PassageMove{locations_[to]});
        }
        return options;
    }

    auto GraphBoard::MovementOptions(GameState const& game, PlyrIdxT const seat,
                                     int const roll) const -> std::vector<MovementOption>
    {
        return Reachable(game.Player(seat).location, roll);
    }

    auto GraphBoard::Distances(Location const& from) const -> std::map<std::string, int>
    {
        auto const origin = IndexOf(from.name);
        if (!origin)
            CLU_THROW(error::Code::State, std::format("Unknown location '{}'", from.name));

        std::vector<int> dist(locations_.size(), -1);
        std::deque<size_t> frontier{*origin};
        dist[*origin] = 0;

        while (!frontier.empty())
        {
            size_t const cur = frontier.front();
            frontier.pop_front();

            // rooms end a walk; only the one being left is expanded
            if (cur != *origin && locations_[cur].IsRoom()) continue;

            for (size_t const nb : adjacency_[cur])
            {
                if (dist[nb] != -1) continue;
                dist[nb] = dist[cur] + 1;
                frontier.push_back(nb);
            }
        }

        std::map<std::string, int> out;
        for (size_t i{}; i < locations_.size(); ++i)
        {
            if (dist[i] >= 0) out.emplace(locations_[i].name, dist[i]);
        }
        return out;
    }

    auto GraphBoard::Reachable(Location const& from, int const roll) const -> std::vector<MovementOption>
    {
        auto const dist = Distances(from);
        std::vector<MovementOption> options;
        for (Location const& loc : locations_)
        {
            if (loc.name == from.name) continue;
            auto const it = dist.find(loc.name);
            if (it == dist.end() || it->second > roll) continue;

            bool const exact = (roll - it->second) % 2 == 0;
            // a space must absorb the whole roll by stepping back and forth
            if (!loc.IsRoom() && !exact) continue;
            options.push_back(MovementOption{loc, exact});
        }
        return options;
    }
}
