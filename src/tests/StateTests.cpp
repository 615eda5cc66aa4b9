//
// Created by Malik T on 19/10/2025.
//

#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "../core/CardUniverse.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "TestSupport.hpp"

using namespace clue::core;
using namespace clue::test;

namespace
{
    auto Ring(std::vector<PlayerId> const& ids) -> GameState
    {
        std::vector<PlayerRecord> players;
        for (PlayerId const& id : ids)
        {
            players.push_back(PlayerRecord{.id = id, .location = SpaceAt("Corridor")});
        }
        PublicState pub{.current_player = ids.empty() ? PlayerId{} : ids.front(), .accusation_room = "Pool"};
        return GameState{std::move(players), std::move(pub), MakeTriple("Red", "Rope", "Study"), CardUniverse{}};
    }
}

TEST(State, RingVisitsEverySeatOnce)
{
    std::vector<PlayerId> const ids{"A", "B", "C", "D", "E"};
    GameState const g = Ring(ids);

    for (PlayerId const& start : ids)
    {
        std::set<PlayerId> seen;
        PlayerId at = start;
        for (size_t i{}; i < ids.size(); ++i)
        {
            auto const cn = g.FindCurNext(at);
            ASSERT_TRUE(cn.has_value());
            EXPECT_TRUE(seen.insert(at).second) << at << " visited twice";
            at = g.Player(cn->next).id;
        }
        EXPECT_EQ(seen.size(), ids.size());
        EXPECT_EQ(at, start);
    }
}

TEST(State, LastSeatWrapsToFirst)
{
    GameState const g = Ring({"A", "B", "C"});
    auto const cn = g.FindCurNext("C");
    ASSERT_TRUE(cn.has_value());
    EXPECT_EQ(cn->cur, 2);
    EXPECT_EQ(cn->next, 0);
}

TEST(State, LookupFailuresAreValues)
{
    GameState const empty = Ring({});
    auto const e = empty.FindCurNext("A");
    ASSERT_FALSE(e.has_value());
    EXPECT_EQ(e.error(), error::LookupError::EmptyRing);

    GameState const g = Ring({"A", "B"});
    auto const nf = g.FindCurNext("Z");
    ASSERT_FALSE(nf.has_value());
    EXPECT_EQ(nf.error(), error::LookupError::PlayerNotFound);
}

TEST(State, ReplacePlayerKeepsSeat)
{
    GameState g = Ring({"A", "B", "C"});
    PlayerRecord b = g.Player(1);
    b.is_out = true;
    b.location = RoomAt("Hall");
    g.ReplacePlayer(b);

    EXPECT_TRUE(g.Player(1).is_out);
    EXPECT_EQ(g.Player(1).location, RoomAt("Hall"));
    EXPECT_EQ(g.PlayerCount(), 3u);

    PlayerRecord stranger{.id = "Z"};
    EXPECT_THROW(g.ReplacePlayer(stranger), error::StateError);
}

TEST(State, HumansAndElimination)
{
    GameState g = Ring({"A", "B"});
    EXPECT_FALSE(g.AnyActiveHuman());
    EXPECT_FALSE(g.AllOut());

    PlayerRecord a = g.Player(0);
    a.kind = AgentKind::Human;
    g.ReplacePlayer(a);
    EXPECT_TRUE(g.AnyActiveHuman());

    a.is_out = true;
    g.ReplacePlayer(a);
    EXPECT_FALSE(g.AnyActiveHuman());

    PlayerRecord b = g.Player(1);
    b.is_out = true;
    g.ReplacePlayer(b);
    EXPECT_TRUE(g.AllOut());
}

TEST(State, AccusationRoomIsARoomByName)
{
    GameState const g = Ring({"A", "B"});
    EXPECT_TRUE(g.IsAccusationRoom(RoomAt("Pool")));
    EXPECT_FALSE(g.IsAccusationRoom(SpaceAt("Pool")));
    EXPECT_FALSE(g.IsAccusationRoom(RoomAt("Hall")));
}
