#pragma once
#include <QByteArray>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Medgate
{
enum class Role
{
  User,
  Assistant,
  System
};

const char* roleName(Role r) noexcept;
Role roleFromString(std::string_view role) noexcept;

struct ConversationTurn
{
  Role role{Role::User};
  std::string text;
  bool hasImage{};
  bool hasAudio{};
  // Inserted by the normalizer to restore alternation.
  bool placeholder{};
};

struct NewUserTurn
{
  std::string text;
  bool hasImage{};
  bool hasAudio{};
};

struct NormalizedConversation
{
  std::vector<ConversationTurn> turns;
  int insertedPlaceholders{};
};

// Repairs arbitrary history into: an optional leading System turn, then
// strictly alternating User / Assistant turns, ending with the new User turn.
// Never fails.
NormalizedConversation
normalizeConversation(std::span<const ConversationTurn> history, const NewUserTurn& turn);

bool isAlternating(std::span<const ConversationTurn> turns) noexcept;

// Lenient: malformed JSON yields an empty history.
std::vector<ConversationTurn> parseHistory(const QByteArray& json);
}
