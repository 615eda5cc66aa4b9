//
// Created by Malik T on 19/10/2025.
//

#include "HumanAgent.hpp"

#include <charconv>
#include <format>
#include <print>
#include <span>
#include <type_traits>
#include <variant>
#include "../core/ClassicRules.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"

namespace clue::cli
{
    using namespace clue::core;

    namespace
    {
        auto BeliefText(Belief const& b) -> std::string
        {
            return std::visit(
                [&]<typename T0>(T0 const& v) -> std::string
                {
                    using T = std::decay_t<T0>;
                    if constexpr (std::is_same_v<T, Mine>)
                    {
                        if (v.shown_to.empty()) return "in hand";
                        return std::format("in hand, shown to {}",
                                           util::Join(std::span<PlayerId const>{v.shown_to}, ", ",
                                                      [](PlayerId const& p) { return p; }));
                    }
                    else if constexpr (std::is_same_v<T, InEnvelope>)
                    {
                        return "ENVELOPE";
                    }
                    else if constexpr (std::is_same_v<T, ShownBy>)
                    {
                        return std::format("held by {}", v.by);
                    }
                    else
                    {
                        return "unknown";
                    }
                },
                b
            );
        }
    }

    auto HumanAgent::Ask(std::string const& prompt, std::vector<std::string> const& labels) -> size_t
    {
        CLU_ASSERT(!labels.empty(), "Menu without options");
        for (;;)
        {
            std::print("{}\n", prompt);
            for (size_t i{}; i < labels.size(); ++i)
            {
                std::print("  {}) {}\n", i + 1, labels[i]);
            }
            std::print("> ");

            std::string line;
            if (!std::getline(in_, line))
                CLU_THROW(error::Code::InvalidAction, "Input closed while waiting for a choice");

            size_t pick{};
            auto const res = std::from_chars(line.data(), line.data() + line.size(), pick);
            if (res.ec == std::errc{} && pick >= 1 && pick <= labels.size())
                return pick - 1;
            std::print("Please enter a number between 1 and {}.\n", labels.size());
        }
    }

    auto HumanAgent::AskCard(AgentView const& view, Category const cat) -> Card
    {
        std::vector<Card> const cards = view.universe.OfCategory(cat);
        std::vector<std::string> labels;
        labels.reserve(cards.size());
        for (Card const& c : cards)
        {
            labels.push_back(std::format("{} ({})", NameOf(c), BeliefText(view.self.sheet.BeliefOf(c))));
        }
        return cards[Ask(std::format("Pick a {}:", to_string(cat)), labels)];
    }

    auto HumanAgent::PrintSheet(AgentView const& view) const -> void
    {
        std::print("Your notes:\n");
        for (Category const cat : AllCategories)
        {
            std::print(" {}s\n", to_string(cat));
            for (Card const& c : view.universe.OfCategory(cat))
            {
                std::print("   {:<18} {}\n", NameOf(c), BeliefText(view.self.sheet.BeliefOf(c)));
            }
        }
    }

    auto HumanAgent::ChooseMove(AgentView const& view, std::span<MoveOption const> options) -> MoveOption
    {
        PrintSheet(view);
        std::vector<std::string> labels;
        for (MoveOption const& m : options)
        {
            labels.push_back(util::MoveText(m));
        }
        return options[Ask("Roll the dice or take a passage?", labels)];
    }

    auto HumanAgent::ChooseMovement(AgentView const& view, std::span<MovementOption const> options) -> MovementOption
    {
        (void)view;
        std::vector<std::string> labels;
        for (MovementOption const& m : options)
        {
            labels.push_back(util::MovementText(m));
        }
        return options[Ask("Where do you want to go?", labels)];
    }

    auto HumanAgent::ChooseGuess(AgentView const& view) -> Triple
    {
        std::print("You are in the {}. Make a suggestion.\n", view.self.location.name);
        Suspect suspect = std::get<Suspect>(AskCard(view, Category::Suspect));
        Weapon weapon = std::get<Weapon>(AskCard(view, Category::Weapon));
        return Triple{std::move(suspect), std::move(weapon), Room{view.self.location.name}};
    }

    auto HumanAgent::ChooseAccusation(AgentView const& view) -> Triple
    {
        std::print("You reached the {}. Make your accusation; a wrong one puts you out.\n", view.self.location.name);
        Suspect suspect = std::get<Suspect>(AskCard(view, Category::Suspect));
        Weapon weapon = std::get<Weapon>(AskCard(view, Category::Weapon));
        Room room = std::get<Room>(AskCard(view, Category::Room));
        return Triple{std::move(suspect), std::move(weapon), std::move(room)};
    }

    auto HumanAgent::ChooseReveal(AgentView const& view, Triple const& guess,
                                  PlayerId const& asker) -> std::optional<Card>
    {
        std::vector<Card> const held = ClassicRules::HeldCards(view.self, guess);
        if (held.empty())
        {
            std::print("You cannot disprove {}'s suggestion.\n", asker);
            return std::nullopt;
        }

        std::vector<std::string> labels;
        for (Card const& c : held)
        {
            labels.push_back(NameOf(c));
        }
        return held[Ask(std::format("Show {} one of your cards:", asker), labels)];
    }

    auto HumanAgent::SeeReveal(AgentView const& view, PlayerId const& revealer, Card const& card) -> void
    {
        (void)view;
        std::print("{} showed you the {}.\n", revealer, NameOf(card));
    }
}
