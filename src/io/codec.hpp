//
// Created by Malik T on 18/10/2025.
//

#ifndef CLUEGAME_CODEC_HPP
#define CLUEGAME_CODEC_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <flatbuffers/flatbuffers.h>

#include "../core/Definition.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/clue_game_generated.h"

namespace clue::core::io
{
    struct ParseError
    {
        std::string message;
    };

    auto ToFbCategory(Category c) noexcept -> clue::gen::def::Category;
    auto FromFbCategory(clue::gen::def::Category c) noexcept -> Category;
    auto ToFbLocationKind(LocationKind k) noexcept -> clue::gen::def::LocationKind;
    auto FromFbLocationKind(clue::gen::def::LocationKind k) noexcept -> LocationKind;
    auto ToFbAgentKind(AgentKind k) noexcept -> clue::gen::def::AgentKind;
    auto FromFbAgentKind(clue::gen::def::AgentKind k) noexcept -> AgentKind;

    // Verifies the buffer before touching it. Structure only: ImportGame checks the content.
    auto DecodeDefinition(std::span<std::byte const> bytes) -> std::expected<GameDefinition, ParseError>;

    auto LoadDefinition(std::filesystem::path const& path) -> std::expected<GameDefinition, ParseError>;

    auto BuildDefinition(GameDefinition const& def) -> flatbuffers::DetachedBuffer;
}

#endif //CLUEGAME_CODEC_HPP
