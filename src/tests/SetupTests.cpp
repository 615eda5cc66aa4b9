//
// Created by Malik T on 19/10/2025.
//

#include <gtest/gtest.h>

#include <format>
#include <map>
#include <string>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Setup.hpp"
#include "TestSupport.hpp"

using namespace clue::core;
using namespace clue::test;
using clue::core::error::DefinitionError;

namespace
{
    auto HandOf(PlayerRecord const& p) -> std::vector<Card>
    {
        std::vector<Card> out;
        for (auto const& [card, belief] : p.sheet.Entries())
        {
            if (IsMine(belief)) out.push_back(card);
        }
        return out;
    }
}

TEST(Setup, EveryCardDealtOnce)
{
    for (uint64_t seed : {1ull, 2ull, 3ull, 42ull, 1337ull})
    {
        GameState const g = ImportMini(MiniDefinition(), Config{.seed = seed});

        std::map<Card, int> count;
        for (Card const& c : g.Solution().Cards()) ++count[c];
        for (PlayerRecord const& p : g.Players())
        {
            for (Card const& c : HandOf(p)) ++count[c];
        }

        ASSERT_EQ(count.size(), g.Universe().Size()) << "seed " << seed;
        for (auto const& [card, n] : count)
        {
            EXPECT_EQ(n, 1) << NameOf(card) << " seed " << seed;
        }
    }
}

TEST(Setup, HandsDifferByAtMostOne)
{
    GameState const g = ImportMini(MiniDefinition(), Config{.seed = 99});
    // 10 cards, 3 in the envelope, 7 over 3 seats starting with the first listed player
    EXPECT_EQ(HandOf(g.Player(0)).size(), 3u);
    EXPECT_EQ(HandOf(g.Player(1)).size(), 2u);
    EXPECT_EQ(HandOf(g.Player(2)).size(), 2u);
}

TEST(Setup, SeatingFollowsDefinition)
{
    GameState const g = ImportMini(MiniDefinition(), Config{.seed = 5, .ai_only = true});

    ASSERT_EQ(g.PlayerCount(), 3u);
    EXPECT_EQ(g.Player(0).id, "A");
    EXPECT_EQ(g.Player(1).id, "B");
    EXPECT_EQ(g.Player(2).id, "C");
    EXPECT_EQ(g.Player(0).location, SpaceAt("Corridor"));
    EXPECT_EQ(g.Player(2).location, SpaceAt("Landing"));
    EXPECT_FALSE(g.Player(1).is_out);

    EXPECT_EQ(g.Public().current_player, "A");
    EXPECT_EQ(g.Public().accusation_room, "Pool");
    EXPECT_TRUE(g.Public().ai_only);
}

TEST(Setup, SameSeedSameDeal)
{
    GameState const a = ImportMini(MiniDefinition(), Config{.seed = 77});
    GameState const b = ImportMini(MiniDefinition(), Config{.seed = 77});

    EXPECT_EQ(a.Solution(), b.Solution());
    for (PlyrIdxT seat{}; seat < a.PlayerCount(); ++seat)
    {
        EXPECT_EQ(HandOf(a.Player(seat)), HandOf(b.Player(seat)));
    }
}

TEST(Setup, FixedDealIsUsedAsIs)
{
    GameState const g = ImportMini(KnifeAtBDefinition());

    EXPECT_EQ(g.Solution(), MakeTriple("Red", "Rope", "Study"));
    EXPECT_TRUE(IsMine(g.Player(1).sheet.BeliefOf(W("Knife"))));
    EXPECT_TRUE(IsUnknown(g.Player(0).sheet.BeliefOf(W("Knife"))));
    EXPECT_EQ(HandOf(g.Player(2)), (std::vector<Card>{S("C"), R("Library")}));
}

TEST(Setup, FixedEnvelopeWithRandomHands)
{
    GameDefinition def = MiniDefinition();
    def.envelope = MakeTriple("B", "Pipe", "Hall");
    GameState const g = ImportMini(def);

    EXPECT_EQ(g.Solution(), MakeTriple("B", "Pipe", "Hall"));
    for (PlayerRecord const& p : g.Players())
    {
        EXPECT_FALSE(IsMine(p.sheet.BeliefOf(W("Pipe")))) << p.id;
    }
}

TEST(Setup, BadCardsAreRejected)
{
    GameDefinition dup = MiniDefinition();
    dup.weapons.push_back("Rope");
    EXPECT_THROW(ValidateDefinition(dup), DefinitionError);

    GameDefinition empty = MiniDefinition();
    empty.weapons.clear();
    EXPECT_THROW(ValidateDefinition(empty), DefinitionError);

    GameDefinition homeless = MiniDefinition();
    homeless.rooms.push_back("Ballroom");
    EXPECT_THROW(ValidateDefinition(homeless), DefinitionError);

    GameDefinition space_room = MiniDefinition();
    space_room.rooms.push_back("Landing");
    EXPECT_THROW(ValidateDefinition(space_room), DefinitionError);
}

TEST(Setup, AccusationRoomMustBeBoardRoomOutsideDeck)
{
    GameDefinition missing = MiniDefinition();
    missing.accusation_room = "Cellar";
    EXPECT_THROW(ValidateDefinition(missing), DefinitionError);

    GameDefinition space = MiniDefinition();
    space.accusation_room = "Corridor";
    EXPECT_THROW(ValidateDefinition(space), DefinitionError);

    GameDefinition card = MiniDefinition();
    card.accusation_room = "Hall";
    EXPECT_THROW(ValidateDefinition(card), DefinitionError);
}

TEST(Setup, EveryBoardRoomIsGuessable)
{
    GameDefinition stray = MiniDefinition();
    stray.locations.push_back(LocationDef{"Attic", LocationKind::Room});
    stray.edges.push_back(EdgeDef{"Landing", "Attic"});
    EXPECT_THROW(ValidateDefinition(stray), DefinitionError);

    // the same room as a card is fine
    stray.rooms.push_back("Attic");
    EXPECT_NO_THROW(ValidateDefinition(stray));
}

TEST(Setup, DefinitionErrorNamesCodeAndThrowSite)
{
    GameDefinition card = MiniDefinition();
    card.accusation_room = "Hall";
    try
    {
        ValidateDefinition(card);
        FAIL() << "expected a DefinitionError";
    }
    catch (DefinitionError const& e)
    {
        EXPECT_EQ(e.code(), error::Code::Definition);
        std::string const line = e.headline();
        EXPECT_TRUE(line.starts_with("Definition error: ")) << line;
        EXPECT_NE(line.find(e.what()), std::string::npos) << line;
        EXPECT_NE(line.find("[Setup.cpp:"), std::string::npos) << line;

        std::string const full = std::format("{}", e);
        EXPECT_TRUE(full.starts_with(line)) << full;
        EXPECT_NE(full.find("ValidateDefinition"), std::string::npos) << full;
    }
}

TEST(Setup, SeatCountFitsSeatIndex)
{
    GameDefinition crowd = MiniDefinition();
    crowd.players.clear();
    crowd.suspects.clear();
    for (size_t i{}; i <= constants::MaxPlayers; ++i)
    {
        std::string id = std::format("P{}", i);
        crowd.suspects.push_back(id);
        crowd.players.push_back(PlayerDef{std::move(id), AgentKind::Ai, "Corridor"});
    }
    ASSERT_EQ(crowd.players.size(), constants::MaxPlayers + 1);
    EXPECT_THROW(ValidateDefinition(crowd), DefinitionError);

    crowd.players.pop_back();
    EXPECT_NO_THROW(ValidateDefinition(crowd));
}

TEST(Setup, BadSeatingIsRejected)
{
    GameDefinition alone = MiniDefinition();
    alone.players.resize(1);
    EXPECT_THROW(ValidateDefinition(alone), DefinitionError);

    GameDefinition twice = MiniDefinition();
    twice.players.push_back(twice.players.front());
    EXPECT_THROW(ValidateDefinition(twice), DefinitionError);

    GameDefinition stranger = MiniDefinition();
    stranger.players.push_back(PlayerDef{"Zed", AgentKind::Ai, "Corridor"});
    EXPECT_THROW(ValidateDefinition(stranger), DefinitionError);

    GameDefinition lost = MiniDefinition();
    lost.players.back().start = "Garden";
    EXPECT_THROW(ValidateDefinition(lost), DefinitionError);

    EXPECT_NO_THROW(ValidateDefinition(MiniDefinition()));
}

TEST(Setup, BadFixedDealIsRejected)
{
    GameDefinition bogus_env = MiniDefinition();
    bogus_env.envelope = MakeTriple("Red", "Candlestick", "Study");
    EXPECT_THROW(ValidateDefinition(bogus_env), DefinitionError);

    GameDefinition no_env = KnifeAtBDefinition();
    no_env.envelope.reset();
    EXPECT_THROW(ValidateDefinition(no_env), DefinitionError);

    GameDefinition twice = KnifeAtBDefinition();
    twice.hands[0].cards.push_back(W("Knife"));
    EXPECT_THROW(ValidateDefinition(twice), DefinitionError);

    GameDefinition short_deal = KnifeAtBDefinition();
    short_deal.hands[2].cards.pop_back();
    EXPECT_THROW(ValidateDefinition(short_deal), DefinitionError);

    GameDefinition ghost = KnifeAtBDefinition();
    ghost.hands.push_back(HandDef{"Red", {}});
    EXPECT_THROW(ValidateDefinition(ghost), DefinitionError);

    GameDefinition two_hands = KnifeAtBDefinition();
    two_hands.hands.push_back(HandDef{"A", {}});
    EXPECT_THROW(ValidateDefinition(two_hands), DefinitionError);

    GameDefinition foreign = KnifeAtBDefinition();
    foreign.hands[0].cards.push_back(W("Candlestick"));
    EXPECT_THROW(ValidateDefinition(foreign), DefinitionError);
}
