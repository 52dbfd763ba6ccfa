#include "ImageSource.hpp"

#include <QFile>
#include <QFileInfo>
#include <QUrl>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <Medgate/Errors.hpp>
#include <Medgate/Logging.hpp>
#include <Medgate/Uploads.hpp>

#include <format>

namespace Medgate
{
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static QByteArray readLocalFile(const QString& path, qint64 maxBytes)
{
  QFile f(path);
  if (!QFileInfo(path).isFile() || !f.open(QIODevice::ReadOnly))
    throw RequestError(std::format("Image not found: {}", path.toStdString()));
  if (f.size() > maxBytes)
    throw RequestError("Image file is too large");
  return f.readAll();
}

QByteArray httpGet(const QString& url, qint64 maxBytes, std::chrono::seconds timeout)
{
  const QUrl parsed(url);
  const std::string host = parsed.host().toStdString();
  const std::string port = std::to_string(parsed.port(80));
  std::string target = parsed.path(QUrl::FullyEncoded).toStdString();
  if (target.empty())
    target = "/";
  if (parsed.hasQuery())
    target += "?" + parsed.query(QUrl::FullyEncoded).toStdString();

  net::io_context ioc;
  tcp::resolver resolver{ioc};
  beast::tcp_stream stream{ioc};
  beast::flat_buffer buffer;

  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, "medgate");

  http::response_parser<http::string_body> parser;
  parser.body_limit(static_cast<std::uint64_t>(maxBytes));

  beast::error_code result;
  resolver.async_resolve(
      host,
      port,
      [&](beast::error_code ec, tcp::resolver::results_type results)
      {
        if (ec)
        {
          result = ec;
          return;
        }
        stream.expires_after(timeout);
        stream.async_connect(
            results,
            [&](beast::error_code ec, const tcp::endpoint&)
            {
              if (ec)
              {
                result = ec;
                return;
              }
              http::async_write(
                  stream,
                  req,
                  [&](beast::error_code ec, std::size_t)
                  {
                    if (ec)
                    {
                      result = ec;
                      return;
                    }
                    http::async_read(
                        stream,
                        buffer,
                        parser,
                        [&](beast::error_code ec, std::size_t)
                        { result = ec; });
                  });
            });
      });
  ioc.run();

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  if (result)
    throw RequestError(
        std::format("Could not download {}: {}", url.toStdString(), result.message()));

  auto res = parser.release();
  if (res.result() != http::status::ok)
    throw RequestError(std::format(
        "Could not download {}: HTTP {}", url.toStdString(), res.result_int()));
  return QByteArray::fromStdString(res.body());
}

QByteArray loadImageUrl(
    const QString& url,
    const UploadStore& uploads,
    qint64 maxBytes,
    std::chrono::seconds timeout)
{
  if (const auto name = uploads.fileNameFromUrl(url))
  {
    const auto path = uploads.resolve(*name);
    if (!path)
      throw RequestError(std::format("Image not found: {}", name->toStdString()));
    qCDebug(lcUploads) << "Using stored upload" << *name;
    return readLocalFile(*path, maxBytes);
  }

  const QUrl parsed(url);
  const QString scheme = parsed.scheme().toLower();
  if (scheme == QLatin1String("file"))
    return readLocalFile(parsed.toLocalFile(), maxBytes);
  if (scheme.isEmpty() || QFileInfo(url).isAbsolute())
    return readLocalFile(url, maxBytes);
  if (scheme == QLatin1String("http"))
  {
    qCInfo(lcHttp) << "Downloading image" << url;
    return httpGet(url, maxBytes, timeout);
  }
  throw RequestError(
      std::format("Unsupported image URL scheme: {}", scheme.toStdString()));
}
}
