#include "ChatTemplate.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <stdexcept>

namespace Medgate::Gemma
{
std::string
renderPrompt(std::span<const ConversationTurn> turns, bool addGenerationPrompt)
{
  std::string firstUserPrefix;
  if (!turns.empty() && turns.front().role == Role::System)
  {
    firstUserPrefix = boost::algorithm::trim_copy(turns.front().text) + "\n\n";
    turns = turns.subspan(1);
  }

  std::string prompt;
  bool first = true;
  Role expected = Role::User;
  for (const auto& turn : turns)
  {
    if (turn.role != expected)
      throw std::invalid_argument(
          "Conversation roles must alternate user/assistant/user/assistant/...");
    expected = expected == Role::User ? Role::Assistant : Role::User;

    prompt += "<start_of_turn>";
    prompt += turn.role == Role::Assistant ? "model" : "user";
    prompt += '\n';
    if (first)
    {
      prompt += firstUserPrefix;
      first = false;
    }

    if (turn.hasImage)
      prompt += imagePlaceholder;
    if (turn.hasAudio)
      prompt += audioPlaceholder;
    prompt += boost::algorithm::trim_copy(turn.text);
    prompt += "<end_of_turn>\n";
  }

  if (addGenerationPrompt)
    prompt += "<start_of_turn>model\n";
  return prompt;
}
}
