#include "Responder.hpp"

#include <QJsonDocument>

#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/file_body.hpp>

#include <Medgate/Logging.hpp>

namespace Medgate::Http
{
namespace beast = boost::beast;
namespace net = boost::asio;

Responder::Responder(
    beast::tcp_stream& stream,
    unsigned version,
    bool keepAlive,
    std::chrono::seconds sendTimeout)
    : m_stream{stream}
    , m_sendTimeout{sendTimeout}
    , m_version{version}
    , m_keepAlive{keepAlive}
{
}

template <typename Fields>
void Responder::decorate(Fields& fields) const
{
  fields.set(http::field::server, "medgate");
  fields.set(http::field::access_control_allow_origin, "*");
}

template <typename Initiate>
bool Responder::await(const char* what, Initiate&& initiate)
{
  m_stream.expires_after(m_sendTimeout);
  try
  {
    std::forward<Initiate>(initiate)(net::use_future).get();
    return true;
  }
  catch (const boost::system::system_error& e)
  {
    m_failed = true;
    if (e.code() == beast::error::timeout)
      qCWarning(lcHttp) << what << "timed out, dropping the client";
    else
      qCInfo(lcHttp) << what << "failed:" << e.code().message().c_str();
    return false;
  }
}

template <typename Message>
void Responder::write(Message& msg, bool preparePayload)
{
  m_responded = true;
  if (m_failed)
    return;

  decorate(msg);
  msg.keep_alive(m_keepAlive);
  if (preparePayload)
    msg.prepare_payload();

  await("Response write", [&](auto token) {
    return http::async_write(m_stream, msg, token);
  });
}

void Responder::json(http::status status, const QJsonObject& body)
{
  http::response<http::string_body> res{status, m_version};
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.body() = QJsonDocument(body).toJson(QJsonDocument::Compact).toStdString();
  write(res);
}

void Responder::error(http::status status, const QString& message)
{
  json(status, QJsonObject{{QStringLiteral("error"), message}});
}

void Responder::bytes(
    http::status status,
    std::string_view contentType,
    const QByteArray& body)
{
  http::response<http::string_body> res{status, m_version};
  res.set(http::field::content_type, contentType);
  res.body().assign(body.constData(), body.size());
  write(res);
}

void Responder::file(const QString& path, std::string_view contentType, bool headOnly)
{
  beast::error_code ec;
  http::file_body::value_type body;
  body.open(path.toStdString().c_str(), beast::file_mode::scan, ec);
  if (ec)
  {
    error(http::status::not_found, QStringLiteral("Not found"));
    return;
  }

  const auto size = body.size();
  if (headOnly)
  {
    http::response<http::empty_body> res{http::status::ok, m_version};
    res.set(http::field::content_type, contentType);
    res.content_length(size);
    write(res, false);
    return;
  }

  http::response<http::file_body> res{
      std::piecewise_construct,
      std::make_tuple(std::move(body)),
      std::make_tuple(http::status::ok, m_version)};
  res.set(http::field::content_type, contentType);
  res.content_length(size);
  write(res, false);
}

void Responder::empty(http::status status)
{
  http::response<http::empty_body> res{status, m_version};
  res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
  res.set(http::field::access_control_allow_headers, "*");
  write(res);
}

bool Responder::open()
{
  m_responded = true;
  m_streaming = true;
  if (m_failed)
    return false;

  http::response<http::empty_body> res{http::status::ok, m_version};
  decorate(res);
  res.set(http::field::content_type, "application/x-ndjson; charset=utf-8");
  res.set(http::field::cache_control, "no-cache");
  res.keep_alive(m_keepAlive);
  res.chunked(true);

  http::response_serializer<http::empty_body> sr{res};
  return await("Stream header", [&](auto token) {
    return http::async_write_header(m_stream, sr, token);
  });
}

bool Responder::send(const StreamEvent& event)
{
  if (m_failed || !m_streaming)
    return false;

  const QByteArray line = event.toLine();
  return await("Stream chunk", [&](auto token) {
    return net::async_write(
        m_stream,
        http::make_chunk(net::const_buffer(line.constData(), std::size_t(line.size()))),
        token);
  });
}

void Responder::reject(int status, const QString& message)
{
  if (m_streaming)
    return;
  error(static_cast<http::status>(status), message);
}

void Responder::close() noexcept
{
  if (!m_streaming || m_failed)
    return;

  try
  {
    await("Stream end", [&](auto token) {
      return net::async_write(m_stream, http::make_chunk_last(), token);
    });
  }
  catch (const std::exception& e)
  {
    m_failed = true;
    qCWarning(lcHttp) << "Could not terminate the stream:" << e.what();
  }
}
}
