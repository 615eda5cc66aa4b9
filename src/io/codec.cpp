//
// Created by Malik T on 18/10/2025.
//

#include "codec.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

namespace fb = clue::gen::def;

namespace
{
    // one value per enum is enough to catch drift
    static_assert((int)clue::core::Category::Room == (int)fb::Category::Room);
    static_assert((int)clue::core::LocationKind::Space == (int)fb::LocationKind::Space);
    static_assert((int)clue::core::AgentKind::Ai == (int)fb::AgentKind::Ai);

    using StringVec = flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>;

    auto Strings(StringVec const* v) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        if (!v) return out;
        out.reserve(v->size());
        for (flatbuffers::String const* s : *v)
        {
            out.push_back(s->str());
        }
        return out;
    }

    auto MakeCard(clue::core::Category const cat, std::string name) -> clue::core::Card
    {
        using namespace clue::core;
        switch (cat)
        {
        case Category::Suspect: return Suspect{std::move(name)};
        case Category::Weapon: return Weapon{std::move(name)};
        case Category::Room: return Room{std::move(name)};
        }
        return Suspect{std::move(name)};
    }
}

namespace clue::core::io
{
    auto ToFbCategory(Category const c) noexcept -> fb::Category
    {
        switch (c)
        {
        case Category::Suspect: return fb::Category::Suspect;
        case Category::Weapon: return fb::Category::Weapon;
        case Category::Room: return fb::Category::Room;
        }
        return fb::Category::Suspect;
    }

    auto FromFbCategory(fb::Category const c) noexcept -> Category
    {
        switch (c)
        {
        case fb::Category::Suspect: return Category::Suspect;
        case fb::Category::Weapon: return Category::Weapon;
        case fb::Category::Room: return Category::Room;
        }
        return Category::Suspect;
    }

    auto ToFbLocationKind(LocationKind const k) noexcept -> fb::LocationKind
    {
        return k == LocationKind::Room ? fb::LocationKind::Room : fb::LocationKind::Space;
    }

    auto FromFbLocationKind(fb::LocationKind const k) noexcept -> LocationKind
    {
        return k == fb::LocationKind::Room ? LocationKind::Room : LocationKind::Space;
    }

    auto ToFbAgentKind(AgentKind const k) noexcept -> fb::AgentKind
    {
        return k == AgentKind::Human ? fb::AgentKind::Human : fb::AgentKind::Ai;
    }

    auto FromFbAgentKind(fb::AgentKind const k) noexcept -> AgentKind
    {
        return k == fb::AgentKind::Human ? AgentKind::Human : AgentKind::Ai;
    }

    auto DecodeDefinition(std::span<std::byte const> const bytes) -> std::expected<GameDefinition, ParseError>
    {
        if (bytes.empty())
            return std::unexpected(ParseError{"Empty buffer"});
        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());

        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyGameDefinitionBuffer(verifier))
            return std::unexpected(ParseError{"GameDefinition failed verification"});

        fb::GameDefinition const* root = fb::GetGameDefinition(data);

        GameDefinition def;
        def.suspects = Strings(root->suspects());
        def.weapons = Strings(root->weapons());
        def.rooms = Strings(root->rooms());
        def.accusation_room = root->accusation_room()->str();

        if (auto const* locs = root->locations())
        {
            for (fb::Location const* l : *locs)
            {
                def.locations.push_back(LocationDef{l->name()->str(), FromFbLocationKind(l->kind())});
            }
        }
        if (auto const* edges = root->edges())
        {
            for (fb::Edge const* e : *edges)
            {
                def.edges.push_back(EdgeDef{e->a()->str(), e->b()->str()});
            }
        }
        if (auto const* passages = root->passages())
        {
            for (fb::Passage const* p : *passages)
            {
                def.passages.push_back(PassageDef{p->from()->str(), p->to()->str()});
            }
        }
        if (auto const* players = root->players())
        {
            for (fb::Player const* p : *players)
            {
                def.players.push_back(PlayerDef{p->id()->str(), FromFbAgentKind(p->kind()), p->start()->str()});
            }
        }
        if (fb::Solution const* env = root->envelope())
        {
            def.envelope = Envelope{Suspect{env->suspect()->str()},
                                    Weapon{env->weapon()->str()},
                                    Room{env->room()->str()}};
        }
        if (auto const* hands = root->hands())
        {
            for (fb::Hand const* h : *hands)
            {
                HandDef hand{h->player()->str(), {}};
                if (auto const* cards = h->cards())
                {
                    for (fb::CardRef const* c : *cards)
                    {
                        hand.cards.push_back(MakeCard(FromFbCategory(c->category()), c->name()->str()));
                    }
                }
                def.hands.push_back(std::move(hand));
            }
        }
        return def;
    }

    auto LoadDefinition(std::filesystem::path const& path) -> std::expected<GameDefinition, ParseError>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            return std::unexpected(ParseError{std::format("Cannot open '{}'", path.string())});

        std::vector<char> const raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(raw.data()), raw.size()};
        return DecodeDefinition(bytes)
            .transform_error([&path](ParseError e)
            {
                e.message = std::format("{}: {}", path.string(), e.message);
                return e;
            });
    }

    auto BuildDefinition(GameDefinition const& def) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const suspects = fbb.CreateVectorOfStrings(def.suspects);
        auto const weapons = fbb.CreateVectorOfStrings(def.weapons);
        auto const rooms = fbb.CreateVectorOfStrings(def.rooms);
        auto const acc = fbb.CreateString(def.accusation_room);

        std::vector<flatbuffers::Offset<fb::Location>> locs;
        locs.reserve(def.locations.size());
        for (LocationDef const& l : def.locations)
        {
            locs.push_back(fb::CreateLocation(fbb, fbb.CreateString(l.name), ToFbLocationKind(l.kind)));
        }

        std::vector<flatbuffers::Offset<fb::Edge>> edges;
        edges.reserve(def.edges.size());
        for (EdgeDef const& e : def.edges)
        {
            auto const a = fbb.CreateString(e.a);
            auto const b = fbb.CreateString(e.b);
            edges.push_back(fb::CreateEdge(fbb, a, b));
        }

        std::vector<flatbuffers::Offset<fb::Passage>> passages;
        passages.reserve(def.passages.size());
        for (PassageDef const& p : def.passages)
        {
            auto const from = fbb.CreateString(p.from);
            auto const to = fbb.CreateString(p.to);
            passages.push_back(fb::CreatePassage(fbb, from, to));
        }

        std::vector<flatbuffers::Offset<fb::Player>> players;
        players.reserve(def.players.size());
        for (PlayerDef const& p : def.players)
        {
            auto const id = fbb.CreateString(p.id);
            auto const start = fbb.CreateString(p.start);
            players.push_back(fb::CreatePlayer(fbb, id, ToFbAgentKind(p.kind), start));
        }

        flatbuffers::Offset<fb::Solution> envelope{};
        if (def.envelope)
        {
            auto const s = fbb.CreateString(def.envelope->suspect.name);
            auto const w = fbb.CreateString(def.envelope->weapon.name);
            auto const r = fbb.CreateString(def.envelope->room.name);
            envelope = fb::CreateSolution(fbb, s, w, r);
        }

        std::vector<flatbuffers::Offset<fb::Hand>> hands;
        hands.reserve(def.hands.size());
        for (HandDef const& h : def.hands)
        {
            std::vector<flatbuffers::Offset<fb::CardRef>> cards;
            cards.reserve(h.cards.size());
            for (Card const& c : h.cards)
            {
                cards.push_back(fb::CreateCardRef(fbb, ToFbCategory(CategoryOf(c)), fbb.CreateString(NameOf(c))));
            }
            auto const player = fbb.CreateString(h.player);
            auto const card_vec = fbb.CreateVector(cards);
            hands.push_back(fb::CreateHand(fbb, player, card_vec));
        }

        auto const locs_vec = fbb.CreateVector(locs);
        auto const edges_vec = fbb.CreateVector(edges);
        auto const passages_vec = fbb.CreateVector(passages);
        auto const players_vec = fbb.CreateVector(players);
        auto const hands_vec = fbb.CreateVector(hands);

        auto const root = fb::CreateGameDefinition(fbb, suspects, weapons, rooms, acc,
                                                   locs_vec, edges_vec, passages_vec, players_vec,
                                                   envelope, hands_vec);
        fb::FinishGameDefinitionBuffer(fbb, root);
        return fbb.Release();
    }
}
