#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace Medgate
{
// One line of the newline-delimited JSON stream.
struct StreamEvent
{
  enum class Type
  {
    Metadata,
    Chunk,
    Complete,
    Error
  };

  Type type{Type::Chunk};
  QJsonObject fields;

  static StreamEvent metadata(QJsonObject fields);
  static StreamEvent chunk(const QString& data);
  static StreamEvent complete(QJsonObject fields, const QString& fullResponse);
  static StreamEvent error(const QString& message);

  QString typeName() const;
  QJsonObject toJson() const;
  // Compact JSON terminated by '\n'.
  QByteArray toLine() const;
};
}
