#pragma once
#include <QByteArray>
#include <QString>

#include <string_view>
#include <vector>

namespace Medgate::Http
{
struct FormPart
{
  QString name;
  QString fileName;
  QString contentType;
  QByteArray data;
  bool hasFile{};

  bool isFile() const noexcept { return hasFile; }
};

// Request body of a multipart/form-data or
// application/x-www-form-urlencoded POST.
struct FormData
{
  std::vector<FormPart> parts;

  // Throws RequestError on a malformed multipart body.
  static FormData parse(std::string_view contentType, std::string_view body);
  static FormData parseMultipart(std::string_view boundary, std::string_view body);
  static FormData parseUrlEncoded(std::string_view body);

  const FormPart* field(QStringView name) const noexcept;
  const FormPart* file(QStringView name) const noexcept;
  QString text(QStringView name) const;
};

// Value of the boundary parameter of a multipart Content-Type, empty if none.
std::string_view multipartBoundary(std::string_view contentType);
}
