//
// Created by Malik T on 19/10/2025.
//

#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "../core/Deduction.hpp"
#include "../core/Exception.hpp"
#include "TestSupport.hpp"

using namespace clue::core;
using namespace clue::test;
namespace dd = clue::core::deduction;

namespace
{
    auto SheetWith(std::vector<Card> const& hand) -> KnowledgeSheet
    {
        return KnowledgeSheet::Initialize(UniverseOf(MiniDefinition()), hand);
    }

    auto Pub() -> PublicState
    {
        return PublicState{.current_player = "A", .accusation_room = "Pool"};
    }

    auto Passage(std::string to) -> MoveOption
    {
        return PassageMove{RoomAt(std::move(to))};
    }

    auto Opt(Location loc, bool exact = true) -> MovementOption
    {
        return MovementOption{std::move(loc), exact};
    }

    constexpr int Trials = 50;
}

// ---------- moves ----------

TEST(DecideMove, UnsolvedRoomPrefersPassageToHeldRoom)
{
    KnowledgeSheet const sheet = SheetWith({R("Library")});
    std::vector<MoveOption> const options{RollMove{}, Passage("Hall"), Passage("Library")};
    Rng rng{3};
    for (int i{}; i < Trials; ++i)
    {
        EXPECT_EQ(dd::DecideMove(sheet, options, rng), Passage("Library"));
    }
}

TEST(DecideMove, UnsolvedRoomFallsBackToEnvelopePassage)
{
    KnowledgeSheet sheet = SheetWith({});
    // two candidate rooms for the envelope, so the room is still open
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Hall"));
    sheet.MarkNoDisprove(MakeTriple("C", "Knife", "Study"));
    ASSERT_FALSE(sheet.CategorySolved(Category::Room));

    std::vector<MoveOption> const options{RollMove{}, Passage("Library"), Passage("Hall")};
    Rng rng{3};
    EXPECT_EQ(dd::DecideMove(sheet, options, rng), Passage("Hall"));
}

TEST(DecideMove, UnsolvedRoomIgnoresUnknownPassage)
{
    KnowledgeSheet const sheet = SheetWith({});
    std::vector<MoveOption> const options{RollMove{}, Passage("Library")};
    Rng rng{3};
    EXPECT_EQ(dd::DecideMove(sheet, options, rng), MoveOption{RollMove{}});
}

TEST(DecideMove, SolvedRoomVisitsUnknownRoom)
{
    KnowledgeSheet sheet = SheetWith({S("A"), W("Knife")});
    sheet.MarkNoDisprove(MakeTriple("A", "Knife", "Study"));
    ASSERT_TRUE(sheet.CategorySolved(Category::Room));
    ASSERT_FALSE(sheet.AllSolved());

    std::vector<MoveOption> const options{RollMove{}, Passage("Study"), Passage("Library")};
    Rng rng{3};
    EXPECT_EQ(dd::DecideMove(sheet, options, rng), Passage("Library"));
}

TEST(DecideMove, SolvedRoomSkipsKnownPassages)
{
    KnowledgeSheet sheet = SheetWith({R("Hall")});
    sheet.RecordShown(R("Study"), "B");
    (void)sheet.DeduceByElimination();
    ASSERT_TRUE(sheet.CategorySolved(Category::Room));
    ASSERT_FALSE(sheet.AllSolved());

    std::vector<MoveOption> const options{RollMove{}, Passage("Hall"), Passage("Study")};
    Rng rng{3};
    EXPECT_EQ(dd::DecideMove(sheet, options, rng), MoveOption{RollMove{}});
}

TEST(DecideMove, UnsolvedRoomTakesHeldPassageOnceSuspectAndWeaponKnown)
{
    KnowledgeSheet sheet = SheetWith({R("Library")});
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Library"));
    ASSERT_TRUE(sheet.CategorySolved(Category::Suspect));
    ASSERT_TRUE(sheet.CategorySolved(Category::Weapon));
    ASSERT_FALSE(sheet.CategorySolved(Category::Room));

    std::vector<MoveOption> const options{RollMove{}, Passage("Library"), Passage("Hall")};
    Rng rng{3};
    for (int i{}; i < Trials; ++i)
    {
        EXPECT_EQ(dd::DecideMove(sheet, options, rng), Passage("Library"));
    }
}

TEST(DecideMove, SolvedSheetStillVisitsUnknownRoom)
{
    KnowledgeSheet sheet = SheetWith({R("Library")});
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Study"));
    ASSERT_TRUE(sheet.AllSolved());
    Rng rng{3};

    std::vector<MoveOption> const options{RollMove{}, Passage("Library"), Passage("Hall")};
    EXPECT_EQ(dd::DecideMove(sheet, options, rng), Passage("Hall"));

    std::vector<MoveOption> const known{RollMove{}, Passage("Library"), Passage("Study")};
    EXPECT_EQ(dd::DecideMove(sheet, known, rng), MoveOption{RollMove{}});
}

// ---------- movement ----------

TEST(DecideMovement, SolvedHeadsForAccusationRoom)
{
    KnowledgeSheet sheet = SheetWith({});
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Study"));
    Rng rng{5};

    std::vector<MovementOption> const options{Opt(RoomAt("Hall")), Opt(RoomAt("Pool"), false), Opt(SpaceAt("Corridor"))};
    EXPECT_EQ(dd::DecideMovement(sheet, Pub(), options, rng).location, RoomAt("Pool"));
}

TEST(DecideMovement, SolvedWithoutSingleAccusationRoomThrows)
{
    KnowledgeSheet sheet = SheetWith({});
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Study"));
    Rng rng{5};

    std::vector<MovementOption> const none{Opt(RoomAt("Hall")), Opt(SpaceAt("Corridor"))};
    EXPECT_THROW((void)dd::DecideMovement(sheet, Pub(), none, rng), clue::core::error::DeductionError);

    std::vector<MovementOption> const two{Opt(RoomAt("Pool")), Opt(RoomAt("Pool"), false)};
    EXPECT_THROW((void)dd::DecideMovement(sheet, Pub(), two, rng), clue::core::error::DeductionError);
}

TEST(DecideMovement, HeldRoomFirst)
{
    KnowledgeSheet const sheet = SheetWith({R("Hall")});
    std::vector<MovementOption> const options{
        Opt(RoomAt("Library")), Opt(RoomAt("Hall")), Opt(SpaceAt("Landing")), Opt(RoomAt("Pool"))
    };
    Rng rng{5};
    for (int i{}; i < Trials; ++i)
    {
        EXPECT_EQ(dd::DecideMovement(sheet, Pub(), options, rng).location, RoomAt("Hall"));
    }
}

TEST(DecideMovement, ExactEnvelopeRoomBeatsInexactHeldRoom)
{
    KnowledgeSheet sheet = SheetWith({R("Hall")});
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Library"));
    sheet.MarkNoDisprove(MakeTriple("C", "Knife", "Study"));
    ASSERT_FALSE(sheet.CategorySolved(Category::Room));

    std::vector<MovementOption> const options{Opt(RoomAt("Hall"), false), Opt(RoomAt("Library"), true)};
    Rng rng{5};
    EXPECT_EQ(dd::DecideMovement(sheet, Pub(), options, rng).location, RoomAt("Library"));
}

TEST(DecideMovement, InexactHeldRoomBeatsUnknownRoom)
{
    KnowledgeSheet const sheet = SheetWith({R("Hall")});
    std::vector<MovementOption> const options{Opt(RoomAt("Hall"), false), Opt(RoomAt("Library"), true)};
    Rng rng{5};
    EXPECT_EQ(dd::DecideMovement(sheet, Pub(), options, rng).location, RoomAt("Hall"));
}

TEST(DecideMovement, UnknownRoomWhenNothingBetter)
{
    KnowledgeSheet sheet = SheetWith({});
    sheet.RecordShown(R("Hall"), "B");
    std::vector<MovementOption> const options{
        Opt(RoomAt("Hall")), Opt(RoomAt("Library"), false), Opt(SpaceAt("Corridor"))
    };
    Rng rng{5};
    EXPECT_EQ(dd::DecideMovement(sheet, Pub(), options, rng).location, RoomAt("Library"));
}

TEST(DecideMovement, HeldRoomBeatsUnknownRoomOnceSuspectAndWeaponKnown)
{
    KnowledgeSheet sheet = SheetWith({R("Library")});
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Library"));
    ASSERT_FALSE(sheet.CategorySolved(Category::Room));
    ASSERT_FALSE(sheet.AllSolved());

    std::vector<MovementOption> const options{Opt(RoomAt("Library")), Opt(RoomAt("Study"))};
    Rng rng{5};
    for (int i{}; i < Trials; ++i)
    {
        EXPECT_EQ(dd::DecideMovement(sheet, Pub(), options, rng).location, RoomAt("Library"));
    }

    // the held room is not on offer: the unknown room comes next
    std::vector<MovementOption> const away{Opt(SpaceAt("Corridor")), Opt(RoomAt("Study"), false)};
    EXPECT_EQ(dd::DecideMovement(sheet, Pub(), away, rng).location, RoomAt("Study"));
}

TEST(DecideMovement, SolvedRoomSkipsUnknownRooms)
{
    KnowledgeSheet sheet = SheetWith({S("A"), W("Knife")});
    sheet.MarkNoDisprove(MakeTriple("A", "Knife", "Study"));
    ASSERT_TRUE(sheet.CategorySolved(Category::Room));
    ASSERT_FALSE(sheet.AllSolved());

    std::vector<MovementOption> const options{Opt(RoomAt("Library")), Opt(RoomAt("Study"), false)};
    Rng rng{5};
    EXPECT_EQ(dd::DecideMovement(sheet, Pub(), options, rng).location, RoomAt("Study"));
}

TEST(DecideMovement, NeverPicksAccusationRoomEarly)
{
    KnowledgeSheet const sheet = SheetWith({});
    std::vector<MovementOption> const options{Opt(RoomAt("Pool")), Opt(SpaceAt("Corridor"))};
    Rng rng{5};
    for (int i{}; i < Trials; ++i)
    {
        EXPECT_EQ(dd::DecideMovement(sheet, Pub(), options, rng).location, SpaceAt("Corridor"));
    }

    std::vector<MovementOption> const only_pool{Opt(RoomAt("Pool"))};
    EXPECT_THROW((void)dd::DecideMovement(sheet, Pub(), only_pool, rng), clue::core::error::DeductionError);
}

// ---------- guesses and accusations ----------

TEST(DecideGuess, SolvedCategoryNamesHeldCard)
{
    KnowledgeSheet sheet = SheetWith({S("A"), W("Rope")});
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Study"));
    Rng rng{9};

    for (int i{}; i < Trials; ++i)
    {
        Triple const t = dd::DecideGuess(sheet, Room{"Hall"}, rng);
        EXPECT_EQ(t.suspect.name, "A");
        EXPECT_EQ(t.weapon.name, "Rope");
        EXPECT_EQ(t.room.name, "Hall");
    }
}

TEST(DecideGuess, SolvedWithoutHeldCardNamesEnvelopeCard)
{
    KnowledgeSheet sheet = SheetWith({});
    sheet.MarkNoDisprove(MakeTriple("Red", "Knife", "Study"));
    Rng rng{9};
    Triple const t = dd::DecideGuess(sheet, Room{"Library"}, rng);
    EXPECT_EQ(t, MakeTriple("Red", "Knife", "Library"));
}

TEST(DecideGuess, UnsolvedCategoryNamesUnknownCards)
{
    KnowledgeSheet sheet = SheetWith({S("A"), W("Knife")});
    sheet.RecordShown(S("B"), "B");
    Rng rng{9};

    std::set<std::string> suspects;
    std::set<std::string> weapons;
    for (int i{}; i < 200; ++i)
    {
        Triple const t = dd::DecideGuess(sheet, Room{"Hall"}, rng);
        suspects.insert(t.suspect.name);
        weapons.insert(t.weapon.name);
    }
    EXPECT_EQ(suspects, (std::set<std::string>{"C", "Red"}));
    EXPECT_EQ(weapons, (std::set<std::string>{"Pipe", "Rope"}));
}

TEST(DecideAccusation, RequiresSolvedSheet)
{
    KnowledgeSheet sheet = SheetWith({});
    EXPECT_THROW((void)dd::DecideAccusation(sheet), clue::core::error::DeductionError);

    sheet.MarkNoDisprove(MakeTriple("Red", "Pipe", "Hall"));
    EXPECT_EQ(dd::DecideAccusation(sheet), MakeTriple("Red", "Pipe", "Hall"));
}

// ---------- reveals ----------

TEST(DecideReveal, NothingHeldShowsNothing)
{
    KnowledgeSheet const sheet = SheetWith({S("B")});
    Rng rng{11};
    EXPECT_FALSE(dd::DecideReveal(sheet, MakeTriple("Red", "Knife", "Library"), "A", rng).has_value());
}

TEST(DecideReveal, SingleMatchIsShown)
{
    KnowledgeSheet const sheet = SheetWith({S("B"), W("Knife")});
    Rng rng{11};
    EXPECT_EQ(dd::DecideReveal(sheet, MakeTriple("Red", "Knife", "Library"), "A", rng), W("Knife"));
}

TEST(DecideReveal, PrefersCardAskerHasNotSeen)
{
    KnowledgeSheet sheet = SheetWith({W("Knife"), R("Library")});
    sheet.NoteShownTo(W("Knife"), "A");
    Rng rng{11};
    for (int i{}; i < Trials; ++i)
    {
        EXPECT_EQ(dd::DecideReveal(sheet, MakeTriple("Red", "Knife", "Library"), "A", rng), R("Library"));
    }
}

TEST(DecideReveal, AllSeenPicksAnyMatch)
{
    KnowledgeSheet sheet = SheetWith({W("Knife"), R("Library")});
    sheet.NoteShownTo(W("Knife"), "A");
    sheet.NoteShownTo(R("Library"), "A");
    Rng rng{11};

    std::set<Card> shown;
    for (int i{}; i < 200; ++i)
    {
        auto const c = dd::DecideReveal(sheet, MakeTriple("Red", "Knife", "Library"), "A", rng);
        ASSERT_TRUE(c.has_value());
        shown.insert(*c);
    }
    EXPECT_EQ(shown, (std::set<Card>{W("Knife"), R("Library")}));
}

TEST(RoomBelief, OnlyRoomCards)
{
    KnowledgeSheet const sheet = SheetWith({R("Hall")});
    EXPECT_EQ(dd::RoomBelief(sheet, SpaceAt("Corridor")), nullptr);
    EXPECT_EQ(dd::RoomBelief(sheet, RoomAt("Pool")), nullptr);
    ASSERT_NE(dd::RoomBelief(sheet, RoomAt("Hall")), nullptr);
    EXPECT_TRUE(IsMine(*dd::RoomBelief(sheet, RoomAt("Hall"))));
}
