//
// Created by Malik T on 18/10/2025.
//

#ifndef CLUEGAME_DEFINITION_HPP
#define CLUEGAME_DEFINITION_HPP

#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

namespace clue::core
{
    struct LocationDef
    {
        std::string name;
        LocationKind kind{LocationKind::Space};
    };

    // undirected
    struct EdgeDef
    {
        std::string a;
        std::string b;
    };

    // directed, room to room
    struct PassageDef
    {
        std::string from;
        std::string to;
    };

    struct PlayerDef
    {
        PlayerId id;
        AgentKind kind{AgentKind::Ai};
        std::string start;
    };

    struct HandDef
    {
        PlayerId player;
        std::vector<Card> cards;
    };

    // Everything needed to start a game, before any dealing.
    // Players are listed in turn order; the first one moves first.
    struct GameDefinition
    {
        std::vector<std::string> suspects;
        std::vector<std::string> weapons;
        std::vector<std::string> rooms;
        // a board room that is not a card
        std::string accusation_room;

        std::vector<LocationDef> locations;
        std::vector<EdgeDef> edges;
        std::vector<PassageDef> passages;
        std::vector<PlayerDef> players;

        // Fixed deal, for scripted games. Hands require an envelope.
        std::optional<Envelope> envelope;
        std::vector<HandDef> hands;
    };
}

#endif //CLUEGAME_DEFINITION_HPP
