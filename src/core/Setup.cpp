//
// Created by Malik T on 18/10/2025.
//

#include "Setup.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <set>
#include <utility>
#include "Exception.hpp"

namespace clue::core
{
    namespace
    {
        template <class T>
        auto Named(std::vector<std::string> const& names) -> std::vector<T>
        {
            std::vector<T> out;
            out.reserve(names.size());
            for (std::string const& n : names) out.push_back(T{n});
            return out;
        }

        auto CheckEnvelope(CardUniverse const& universe, Envelope const& env) -> void
        {
            for (Card const& c : env.Cards())
            {
                if (!universe.Contains(c))
                    CLU_THROW(error::Code::Definition,
                              std::format("Envelope {} '{}' is not a card", to_string(CategoryOf(c)), NameOf(c)));
            }
        }

        // Every card lands in exactly one hand or the envelope.
        auto CheckHands(GameDefinition const& def, CardUniverse const& universe) -> void
        {
            if (!def.envelope)
                CLU_THROW(error::Code::Definition, "Fixed hands need a fixed envelope");

            std::set<PlayerId> owners;
            auto const env_cards = def.envelope->Cards();
            std::set<Card> dealt(std::cbegin(env_cards), std::cend(env_cards));
            for (HandDef const& h : def.hands)
            {
                bool const seated = std::ranges::any_of(def.players, [&](PlayerDef const& p) { return p.id == h.player; });
                if (!seated)
                    CLU_THROW(error::Code::Definition, std::format("Hand for unknown player '{}'", h.player));
                if (!owners.insert(h.player).second)
                    CLU_THROW(error::Code::Definition, std::format("Two hands for player '{}'", h.player));

                for (Card const& c : h.cards)
                {
                    if (!universe.Contains(c))
                        CLU_THROW(error::Code::Definition,
                                  std::format("Hand card '{}' of {} is not a card", NameOf(c), h.player));
                    if (!dealt.insert(c).second)
                        CLU_THROW(error::Code::Definition, std::format("Card '{}' dealt twice", NameOf(c)));
                }
            }
            if (dealt.size() != universe.Size())
                CLU_THROW(error::Code::Definition,
                          std::format("Fixed deal covers {} of {} cards", dealt.size(), universe.Size()));
        }

        auto DrawEnvelope(CardUniverse const& universe, Rng& rng) -> Envelope
        {
            return Envelope{
                std::get<Suspect>(rng.Pick(universe.OfCategory(Category::Suspect))),
                std::get<Weapon>(rng.Pick(universe.OfCategory(Category::Weapon))),
                std::get<Room>(rng.Pick(universe.OfCategory(Category::Room)))
            };
        }

        auto Deal(GameDefinition const& def, CardUniverse const& universe, Envelope const& env,
                  Rng& rng) -> std::vector<std::vector<Card>>
        {
            std::vector<std::vector<Card>> hands(def.players.size());

            if (!def.hands.empty())
            {
                for (size_t seat{}; seat < def.players.size(); ++seat)
                {
                    auto const it = std::ranges::find(def.hands, def.players[seat].id, &HandDef::player);
                    if (it != std::cend(def.hands)) hands[seat] = it->cards;
                }
                return hands;
            }

            auto const in_env = env.Cards();
            std::vector<Card> deck;
            std::ranges::copy_if(universe.Cards(), std::back_inserter(deck), [&](Card const& c)
            {
                return std::ranges::find(in_env, c) == std::cend(in_env);
            });
            rng.Shuffle(deck);

            for (size_t i{}; i < deck.size(); ++i)
            {
                hands[i % hands.size()].push_back(std::move(deck[i]));
            }
            return hands;
        }
    }

    auto UniverseOf(GameDefinition const& def) -> CardUniverse
    {
        return CardUniverse{Named<Suspect>(def.suspects), Named<Weapon>(def.weapons), Named<Room>(def.rooms)};
    }

    auto BuildBoard(GameDefinition const& def) -> GraphBoard
    {
        return GraphBoard{def.locations, def.edges, def.passages};
    }

    auto ValidateDefinition(GameDefinition const& def) -> void
    {
        CardUniverse const universe = UniverseOf(def);
        GraphBoard const board = BuildBoard(def);

        for (std::string const& room : def.rooms)
        {
            auto const loc = board.Find(room);
            if (!loc || !loc->IsRoom())
                CLU_THROW(error::Code::Definition, std::format("Room card '{}' has no room on the board", room));
        }

        // a room nobody can name in a guess would strand whoever walks in
        for (Location const& loc : board.Locations())
        {
            if (loc.IsRoom() && loc.name != def.accusation_room && !universe.Contains(Room{loc.name}))
                CLU_THROW(error::Code::Definition,
                          std::format("Board room '{}' is neither a room card nor the accusation room", loc.name));
        }

        auto const acc = board.Find(def.accusation_room);
        if (!acc || !acc->IsRoom())
            CLU_THROW(error::Code::Definition,
                      std::format("Accusation room '{}' is not a room on the board", def.accusation_room));
        if (universe.Contains(Room{def.accusation_room}))
            CLU_THROW(error::Code::Definition,
                      std::format("Accusation room '{}' cannot also be a card", def.accusation_room));

        if (def.players.size() < 2)
            CLU_THROW(error::Code::Definition, std::format("Need at least two players, got {}", def.players.size()));
        if (def.players.size() > constants::MaxPlayers)
            CLU_THROW(error::Code::Definition,
                      std::format("At most {} players can be seated, got {}", constants::MaxPlayers, def.players.size()));

        std::set<PlayerId> ids;
        for (PlayerDef const& p : def.players)
        {
            if (!ids.insert(p.id).second)
                CLU_THROW(error::Code::Definition, std::format("Player '{}' listed twice", p.id));
            if (!universe.Contains(Suspect{p.id}))
                CLU_THROW(error::Code::Definition, std::format("Player '{}' is not a suspect", p.id));
            if (!board.Find(p.start))
                CLU_THROW(error::Code::Definition,
                          std::format("Player '{}' starts on unknown location '{}'", p.id, p.start));
        }

        if (def.envelope) CheckEnvelope(universe, *def.envelope);
        if (!def.hands.empty()) CheckHands(def, universe);
    }

    auto ImportGame(GameDefinition const& def, Config const& config, Rng& rng) -> GameState
    {
        ValidateDefinition(def);

        CardUniverse universe = UniverseOf(def);
        GraphBoard const board = BuildBoard(def);
        Envelope envelope = def.envelope ? *def.envelope : DrawEnvelope(universe, rng);
        std::vector<std::vector<Card>> const hands = Deal(def, universe, envelope, rng);

        std::vector<PlayerRecord> players;
        players.reserve(def.players.size());
        for (size_t seat{}; seat < def.players.size(); ++seat)
        {
            PlayerDef const& p = def.players[seat];
            players.push_back(PlayerRecord{
                .id = p.id,
                .kind = p.kind,
                .location = *board.Find(p.start),
                .is_out = false,
                .sheet = KnowledgeSheet::Initialize(universe, hands[seat])
            });
        }

        PublicState pub{
            .current_player = def.players.front().id,
            .accusation_room = def.accusation_room,
            .ai_only = config.ai_only
        };
        return GameState{std::move(players), std::move(pub), std::move(envelope), std::move(universe)};
    }
}
