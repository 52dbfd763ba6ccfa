#pragma once
#include <Medgate/Conversation.hpp>

#include <span>
#include <string>
#include <string_view>

namespace Medgate::Gemma
{
inline constexpr std::string_view imagePlaceholder = "<image_soft_token>";
inline constexpr std::string_view audioPlaceholder = "<audio_soft_token>";

// Renders turns with the Gemma 3n chat format. Each attachment is rendered
// as a single placeholder that the tokenizer stage expands.
// The <bos> token is not part of the string, it is added when tokenizing.
// Throws std::invalid_argument if the roles do not alternate.
std::string
renderPrompt(std::span<const ConversationTurn> turns, bool addGenerationPrompt = true);
}
