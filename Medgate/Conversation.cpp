#include "Conversation.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <Medgate/Logging.hpp>

namespace Medgate
{
const char* roleName(Role r) noexcept
{
  switch (r)
  {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::System:
      return "system";
  }
  return "user";
}

Role roleFromString(std::string_view role) noexcept
{
  if (role == "assistant" || role == "model")
    return Role::Assistant;
  if (role == "system")
    return Role::System;
  return Role::User;
}

static ConversationTurn userTurn(const NewUserTurn& turn)
{
  return ConversationTurn{
      .role = Role::User,
      .text = turn.text,
      .hasImage = turn.hasImage,
      .hasAudio = turn.hasAudio};
}

NormalizedConversation
normalizeConversation(std::span<const ConversationTurn> history, const NewUserTurn& turn)
{
  NormalizedConversation res;
  auto& out = res.turns;
  out.reserve(history.size() * 2 + 2);

  std::size_t first = 0;
  if (!history.empty() && history.front().role == Role::System)
  {
    out.push_back(history.front());
    first = 1;
  }

  Role expected = Role::User;
  for (std::size_t i = first; i < history.size(); i++)
  {
    ConversationTurn msg = history[i];
    if (msg.role == Role::System)
    {
      qCInfo(lcConversation) << "System turn at position" << i
                             << "treated as a user turn";
      msg.role = Role::User;
    }

    if (msg.role != expected)
    {
      qCInfo(lcConversation) << "Unexpected" << roleName(msg.role)
                             << "turn at position" << i
                             << ", inserting an empty" << roleName(expected)
                             << "turn";
      out.push_back({.role = expected, .placeholder = true});
      res.insertedPlaceholders++;
    }

    out.push_back(std::move(msg));
    expected = out.back().role == Role::User ? Role::Assistant : Role::User;
  }

  if (expected != Role::User)
  {
    qCInfo(lcConversation)
        << "History ends with a user turn, inserting an empty assistant turn";
    out.push_back({.role = Role::Assistant, .placeholder = true});
    res.insertedPlaceholders++;
  }

  out.push_back(userTurn(turn));
  return res;
}

bool isAlternating(std::span<const ConversationTurn> turns) noexcept
{
  if (turns.empty())
    return false;

  std::size_t i = 0;
  if (turns.front().role == Role::System)
    i = 1;
  if (i == turns.size())
    return false;

  Role expected = Role::User;
  for (; i < turns.size(); i++)
  {
    if (turns[i].role != expected)
      return false;
    expected = expected == Role::User ? Role::Assistant : Role::User;
  }
  return turns.back().role == Role::User;
}

static std::string contentText(const QJsonValue& content)
{
  if (content.isString())
    return content.toString().toStdString();

  std::string text;
  if (content.isArray())
  {
    for (const auto& part : content.toArray())
    {
      const auto obj = part.toObject();
      if (obj.value(QLatin1String("type")).toString() == QLatin1String("text"))
        text += obj.value(QLatin1String("text")).toString().toStdString();
    }
  }
  return text;
}

std::vector<ConversationTurn> parseHistory(const QByteArray& json)
{
  std::vector<ConversationTurn> history;
  if (json.trimmed().isEmpty())
    return history;

  QJsonParseError err;
  const auto doc = QJsonDocument::fromJson(json, &err);
  if (err.error != QJsonParseError::NoError || !doc.isArray())
  {
    qCWarning(lcConversation)
        << "Ignoring unparseable conversation history:"
        << (err.error != QJsonParseError::NoError ? err.errorString()
                                                   : QStringLiteral("not an array"));
    return history;
  }

  const auto array = doc.array();
  history.reserve(array.size());
  for (const auto& entry : array)
  {
    const auto obj = entry.toObject();
    const auto role = obj.value(QLatin1String("role")).toString().toStdString();
    history.push_back(
        {.role = roleFromString(role),
         .text = contentText(obj.value(QLatin1String("content")))});
  }
  qCDebug(lcConversation) << "Parsed" << history.size() << "history turns";
  return history;
}
}
