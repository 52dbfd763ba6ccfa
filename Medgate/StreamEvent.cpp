#include "StreamEvent.hpp"

#include <QJsonDocument>

namespace Medgate
{
StreamEvent StreamEvent::metadata(QJsonObject fields)
{
  return {Type::Metadata, std::move(fields)};
}

StreamEvent StreamEvent::chunk(const QString& data)
{
  return {Type::Chunk, QJsonObject{{QStringLiteral("data"), data}}};
}

StreamEvent StreamEvent::complete(QJsonObject fields, const QString& fullResponse)
{
  fields.insert(QStringLiteral("fullResponse"), fullResponse);
  return {Type::Complete, std::move(fields)};
}

StreamEvent StreamEvent::error(const QString& message)
{
  return {Type::Error, QJsonObject{{QStringLiteral("error"), message}}};
}

QString StreamEvent::typeName() const
{
  switch (type)
  {
    case Type::Metadata:
      return QStringLiteral("metadata");
    case Type::Chunk:
      return QStringLiteral("chunk");
    case Type::Complete:
      return QStringLiteral("complete");
    case Type::Error:
      return QStringLiteral("error");
  }
  return {};
}

QJsonObject StreamEvent::toJson() const
{
  QJsonObject obj = fields;
  obj.insert(QStringLiteral("type"), typeName());
  return obj;
}

QByteArray StreamEvent::toLine() const
{
  QByteArray line = QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
  line.append('\n');
  return line;
}
}
