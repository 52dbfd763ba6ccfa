#include "FormData.hpp"

#include <QUrlQuery>

#include <boost/algorithm/string/predicate.hpp>

#include <Medgate/Errors.hpp>

#include <optional>

namespace Medgate::Http
{
namespace
{
using namespace std::literals;

std::string_view trimmed(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);
  return s;
}

// Value of a `key=value` or `key="value"` parameter in a header value.
std::optional<std::string_view>
headerParameter(std::string_view header, std::string_view key)
{
  std::size_t pos = 0;
  while (pos < header.size())
  {
    auto semi = header.find(';', pos);
    if (semi == std::string_view::npos)
      semi = header.size();
    const auto item = trimmed(header.substr(pos, semi - pos));
    pos = semi + 1;

    const auto eq = item.find('=');
    if (eq == std::string_view::npos)
      continue;
    if (!boost::algorithm::iequals(trimmed(item.substr(0, eq)), key))
      continue;

    auto value = trimmed(item.substr(eq + 1));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
    {
      value.remove_prefix(1);
      value.remove_suffix(1);
    }
    return value;
  }
  return std::nullopt;
}

QString toQString(std::string_view s)
{
  return QString::fromUtf8(s.data(), qsizetype(s.size()));
}
}

std::string_view multipartBoundary(std::string_view contentType)
{
  if (!boost::algorithm::istarts_with(contentType, "multipart/"))
    return {};
  return headerParameter(contentType, "boundary").value_or(std::string_view{});
}

FormData FormData::parse(std::string_view contentType, std::string_view body)
{
  if (boost::algorithm::istarts_with(contentType, "multipart/form-data"))
  {
    const auto boundary = multipartBoundary(contentType);
    if (boundary.empty())
      throw RequestError("Multipart request without a boundary");
    return parseMultipart(boundary, body);
  }
  if (boost::algorithm::istarts_with(
          contentType, "application/x-www-form-urlencoded"))
    return parseUrlEncoded(body);
  return {};
}

FormData FormData::parseMultipart(std::string_view boundary, std::string_view body)
{
  const std::string delimiter = "--" + std::string(boundary);

  FormData form;
  auto pos = body.find(delimiter);
  if (pos == std::string_view::npos)
    throw RequestError("Malformed multipart body: no boundary found");
  pos += delimiter.size();

  // Some clients end lines with a bare LF; the first boundary line decides.
  const std::string_view eol = body.substr(pos, 1) == "\n"sv ? "\n"sv : "\r\n"sv;
  const std::string separator = std::string(eol) + delimiter;
  const std::string headerEnd = std::string(eol) + std::string(eol);

  while (true)
  {
    if (body.substr(pos, 2) == "--"sv)
      break;
    if (body.substr(pos, eol.size()) != eol)
      throw RequestError("Malformed multipart body: bad boundary line");
    pos += eol.size();

    const auto headersEnd = body.find(headerEnd, pos);
    if (headersEnd == std::string_view::npos)
      throw RequestError("Malformed multipart body: unterminated part headers");

    FormPart part;
    std::string_view headers = body.substr(pos, headersEnd - pos);
    while (!headers.empty())
    {
      auto next = headers.find(eol);
      auto line = headers.substr(0, next);
      headers = next == std::string_view::npos ? std::string_view{}
                                               : headers.substr(next + eol.size());
      if (line.ends_with('\r'))
        line.remove_suffix(1);

      const auto colon = line.find(':');
      if (colon == std::string_view::npos)
        continue;
      const auto key = trimmed(line.substr(0, colon));
      const auto value = trimmed(line.substr(colon + 1));
      if (boost::algorithm::iequals(key, "content-disposition"))
      {
        part.name = toQString(headerParameter(value, "name").value_or(""));
        if (auto fileName = headerParameter(value, "filename"))
        {
          part.fileName = toQString(*fileName);
          part.hasFile = true;
        }
      }
      else if (boost::algorithm::iequals(key, "content-type"))
      {
        part.contentType = toQString(value);
      }
    }

    const auto dataStart = headersEnd + headerEnd.size();
    const auto dataEnd = body.find(separator, dataStart);
    if (dataEnd == std::string_view::npos)
      throw RequestError("Malformed multipart body: missing closing boundary");

    part.data = QByteArray(body.data() + dataStart, qsizetype(dataEnd - dataStart));
    form.parts.push_back(std::move(part));
    pos = dataEnd + separator.size();
  }
  return form;
}

FormData FormData::parseUrlEncoded(std::string_view body)
{
  QString query = toQString(body);
  query.replace(QLatin1Char('+'), QLatin1Char(' '));

  FormData form;
  const QUrlQuery q(query);
  for (const auto& [key, value] : q.queryItems(QUrl::FullyDecoded))
  {
    FormPart part;
    part.name = key;
    part.data = value.toUtf8();
    form.parts.push_back(std::move(part));
  }
  return form;
}

const FormPart* FormData::field(QStringView name) const noexcept
{
  for (const auto& p : parts)
    if (p.name == name)
      return &p;
  return nullptr;
}

const FormPart* FormData::file(QStringView name) const noexcept
{
  for (const auto& p : parts)
    if (p.name == name && p.isFile())
      return &p;
  return nullptr;
}

QString FormData::text(QStringView name) const
{
  for (const auto& p : parts)
    if (p.name == name && !p.isFile())
      return QString::fromUtf8(p.data);
  return {};
}
}
