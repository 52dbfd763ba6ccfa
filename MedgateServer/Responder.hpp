#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include <Medgate/Generation.hpp>

#include <chrono>
#include <string_view>

namespace Medgate::Http
{
namespace http = boost::beast::http;

// Writes the response of one request from a session thread, waiting for each
// write to finish. A write that is still pending after sendTimeout fails and
// drops the client. Implements the newline-delimited JSON stream as a chunked
// body.
class Responder final : public EventSink
{
public:
  Responder(
      boost::beast::tcp_stream& stream,
      unsigned version,
      bool keepAlive,
      std::chrono::seconds sendTimeout = std::chrono::seconds{30});

  void json(http::status status, const QJsonObject& body);
  void error(http::status status, const QString& message);
  void bytes(http::status status, std::string_view contentType, const QByteArray& body);
  void file(const QString& path, std::string_view contentType, bool headOnly);
  void empty(http::status status);

  bool open() override;
  bool send(const StreamEvent& event) override;
  void reject(int status, const QString& message) override;
  void close() noexcept override;

  bool responded() const noexcept { return m_responded; }
  bool streaming() const noexcept { return m_streaming; }
  // False once a write failed or the client asked to close.
  bool keepAlive() const noexcept { return m_keepAlive && !m_failed; }

private:
  template <typename Fields>
  void decorate(Fields& fields) const;
  template <typename Message>
  void write(Message& msg, bool preparePayload = true);
  // Starts an asynchronous write and blocks until it completes or times out.
  template <typename Initiate>
  bool await(const char* what, Initiate&& initiate);

  boost::beast::tcp_stream& m_stream;
  std::chrono::seconds m_sendTimeout;
  unsigned m_version{};
  bool m_keepAlive{};
  bool m_responded{};
  bool m_streaming{};
  bool m_failed{};
};
}
