//
// Created by Malik T on 19/10/2025.
//

//
// main.cpp: local console game with humans at the keyboard and SmartAi in the other seats
//

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <vector>

#include "core/ClassicRules.hpp"
#include "core/Exception.hpp"
#include "core/Setup.hpp"
#include "core/SmartAi.hpp"
#include "core/TurnController.hpp"
#include "cli/ConsoleDisplay.hpp"
#include "cli/HumanAgent.hpp"
#include "debug/AuditLogger.hpp"
#include "io/codec.hpp"

#ifndef CLUE_DEFAULT_GAME
#define CLUE_DEFAULT_GAME "classic.bin"
#endif

namespace
{
    struct CliConfig
    {
        clue::core::Config game{};
        std::string definition{CLUE_DEFAULT_GAME};
        std::optional<std::string> audit_path;
        std::optional<std::string> human;
        bool all_ai{false};
        bool help{false};
    };

    auto PrintUsage() -> void
    {
        std::print("usage: clue [--game FILE] [--seed N] [--ai-only] [--elimination 0|1]\n"
                   "            [--turn-limit N] [--audit FILE] [--human SUSPECT | --all-ai]\n");
    }

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            auto next_str = [&](std::optional<std::string>& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.game.seed = v; }
            }
            else if (arg == "--turn-limit")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.game.turn_limit = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--elimination")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.game.deduce_by_elimination = (v != 0); }
            }
            else if (arg == "--ai-only")
            {
                cfg.game.ai_only = true;
            }
            else if (arg == "--game")
            {
                std::optional<std::string> v;
                if (next_str(v)) { cfg.definition = *v; }
            }
            else if (arg == "--audit")
            {
                (void)next_str(cfg.audit_path);
            }
            else if (arg == "--human")
            {
                (void)next_str(cfg.human);
            }
            else if (arg == "--all-ai")
            {
                cfg.all_ai = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                cfg.help = true;
            }
            else
            {
                std::print(stderr, "[clue] ignoring unknown argument '{}'\n", arg);
            }
        }

        // nobody left to stop the game for
        if (cfg.all_ai) { cfg.game.ai_only = true; }
        return cfg;
    }

    // --human / --all-ai override the seat kinds stored in the definition.
    auto ApplySeating(clue::core::GameDefinition& def, CliConfig const& cc) -> void
    {
        using clue::core::AgentKind;

        for (clue::core::PlayerDef& p : def.players)
        {
            if (cc.all_ai) { p.kind = AgentKind::Ai; }
            else if (cc.human) { p.kind = (p.id == *cc.human) ? AgentKind::Human : AgentKind::Ai; }
        }
    }
}

int main(int argc, char** argv)
{
    using namespace clue;
    using namespace clue::core;

    CliConfig const cc = ParseArgs(argc, argv);
    if (cc.help)
    {
        PrintUsage();
        return 0;
    }

    try
    {
        auto loaded = io::LoadDefinition(cc.definition);
        if (!loaded)
        {
            std::print(stderr, "[clue] {}\n", loaded.error().message);
            return 1;
        }
        GameDefinition def = std::move(*loaded);
        ApplySeating(def, cc);
        if (cc.human && !cc.all_ai)
        {
            bool const seated = std::ranges::any_of(def.players, [&](PlayerDef const& p) { return p.id == *cc.human; });
            if (!seated)
            {
                std::print(stderr, "[clue] '{}' is not seated in this game\n", *cc.human);
                return 1;
            }
        }

        std::print("[clue] {} with seed {}\n", cc.definition, cc.game.seed);

        Rng deal_rng{cc.game.seed};
        GameState initial = ImportGame(def, cc.game, deal_rng);

        std::vector<std::unique_ptr<Agent>> agents;
        agents.reserve(initial.PlayerCount());
        for (size_t seat{}; seat < initial.PlayerCount(); ++seat)
        {
            if (initial.Player(static_cast<PlyrIdxT>(seat)).kind == AgentKind::Human)
                agents.emplace_back(std::make_unique<cli::HumanAgent>(std::cin));
            else
                agents.emplace_back(std::make_unique<SmartAi>(cc.game.seed + static_cast<uint64_t>(seat * 1337u)));
        }

        std::vector<std::shared_ptr<Display>> sinks;
        cli::CardVisibility const visibility = initial.AnyActiveHuman() ? cli::CardVisibility::Hidden
                                                                        : cli::CardVisibility::Open;
        sinks.push_back(std::make_shared<cli::ConsoleDisplay>(visibility));

        std::shared_ptr<debug::AuditLogger> audit;
        if (cc.audit_path)
        {
            audit = std::make_shared<debug::AuditLogger>(*cc.audit_path);
            audit->start(initial, cc.game.seed);
            sinks.push_back(audit);
        }

        TurnController game(cc.game,
                            std::move(initial),
                            std::make_unique<ClassicRules>(),
                            std::make_unique<GraphBoard>(BuildBoard(def)),
                            std::move(agents),
                            std::make_shared<TeeDisplay>(std::move(sinks)));

        while (!game.IsOver())
        {
            StepOutcome const out = game.Step();
            if (audit) { audit->outcome(out); }
        }
        if (audit) { audit->end(game); }

        if (auto const w = game.Winner())
            std::print("[clue] {} wins after {} turns\n", *w, game.TurnsPlayed());
        else
            std::print("[clue] no winner after {} turns\n", game.TurnsPlayed());
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        return 2;
    }

    return 0;
}
