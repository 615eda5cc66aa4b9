#include "AuditLogger.hpp"

#include <format>
#include <span>
#include <string_view>
#include <vector>

#include "../core/Util.hpp"

using namespace clue::core;

namespace
{

auto s_kind(AgentKind const k) -> std::string_view
{
    return k == AgentKind::Human ? "H" : "AI";
}

auto s_outcome(StepOutcome const m) -> std::string_view
{
    switch (m)
    {
        case StepOutcome::Invalid:   return "Invalid";
        case StepOutcome::Applied:   return "Applied";
        case StepOutcome::Skipped:   return "Skipped";
        case StepOutcome::TurnEnded: return "TurnEnded";
        case StepOutcome::GameEnded: return "GameEnded";
    }
    return "?";
}

auto s_hand(PlayerRecord const& p) -> std::string
{
    std::vector<Card> hand;
    for (Category const cat : AllCategories)
    {
        for (Card const& c : p.sheet.CardsIn(cat, IsMine)) hand.push_back(c);
    }
    return util::Join(std::span<Card const>{hand}, ",", [](Card const& c) { return NameOf(c); });
}

} // anonymous namespace

namespace clue::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& game, uint64_t const seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Envelope={}\n", util::TripleText(game.Solution()));
    out_ << std::format("Players={}\n", game.PlayerCount());

    for (PlayerRecord const& p : game.Players())
    {
        out_ << std::format("Seat {} ({}) at {} holds [{}]\n", p.id, s_kind(p.kind), p.location.name, s_hand(p));
    }
    out_.flush();
}

auto AuditLogger::outcome(StepOutcome const m) -> void
{
    out_ << std::format("Outcome: {}\n", s_outcome(m));
}

auto AuditLogger::end(TurnController const& ctl) -> void
{
    if (auto const w = ctl.Winner())
        out_ << std::format("Winner={}\n", *w);
    else
        out_ << "Winner=none\n";
    out_ << std::format("Turns={}\n", ctl.TurnsPlayed());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

auto AuditLogger::PrintTurn(GameState const& game, PlyrIdxT const seat) -> void
{
    PlayerRecord const& p = game.Player(seat);
    out_ << std::format("Turn actor={} at={}\n", p.id, p.location.name);
}

auto AuditLogger::PrintMove(PlayerId const& who, MoveOption const& move) -> void
{
    out_ << std::format("Move {}: {}\n", who, util::MoveText(move));
}

auto AuditLogger::PrintDiceRoll(PlayerId const& who, int const roll) -> void
{
    out_ << std::format("Roll {}: {}\n", who, roll);
}

auto AuditLogger::PrintMovement(PlayerId const& who, MovementOption const& movement) -> void
{
    out_ << std::format("Movement {}: {}\n", who, util::MovementText(movement));
}

auto AuditLogger::PrintGuess(PlayerId const& who, Triple const& guess) -> void
{
    out_ << std::format("Guess {}: {}\n", who, util::TripleText(guess));
}

auto AuditLogger::PrintReveal(PlayerId const& revealer, PlayerId const& asker, Card const& card) -> void
{
    out_ << std::format("Reveal {} -> {}: {}\n", revealer, asker, util::CardText(card));
}

auto AuditLogger::PrintNoDisprove(PlayerId const& asker, Triple const& guess) -> void
{
    out_ << std::format("NoDisprove {}: {}\n", asker, util::TripleText(guess));
}

auto AuditLogger::PrintAccusation(PlayerId const& who, Triple const& accusation) -> void
{
    out_ << std::format("Accuse {}: {}\n", who, util::TripleText(accusation));
}

auto AuditLogger::DisplayMessage(std::string_view const msg) -> void
{
    out_ << std::format("Note: {}\n", msg);
}

auto AuditLogger::DisplayError(std::string_view const msg) -> void
{
    out_ << std::format("Rejected: {}\n", msg);
}

auto AuditLogger::DisplayVictory(PlayerId const& winner) -> void
{
    out_ << std::format("Victory: {}\n", winner);
}

} // namespace clue::core::debug
