#include "Listener.hpp"

#include "HttpSession.hpp"
#include "ServerContext.hpp"
#include "SessionThreads.hpp"
#include "WebSocketSession.hpp"

#include <Medgate/Config.hpp>
#include <Medgate/Errors.hpp>
#include <Medgate/Logging.hpp>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include <chrono>
#include <format>
#include <optional>

namespace Medgate
{
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace
{
constexpr auto idleTimeout = std::chrono::seconds(30);

class RequestReader : public std::enable_shared_from_this<RequestReader>
{
public:
  RequestReader(tcp::socket&& socket, ServerContext& ctx, beast::flat_buffer&& buffer)
      : m_stream{std::move(socket)}
      , m_ctx{ctx}
      , m_buffer{std::move(buffer)}
  {
  }

  void run()
  {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&RequestReader::read, shared_from_this()));
  }

private:
  void read()
  {
    m_parser.emplace();
    m_parser->body_limit(std::uint64_t(m_ctx.config.maxBodyBytes));
    m_stream.expires_after(idleTimeout);
    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&RequestReader::onRead, shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t)
  {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout)
    {
      m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
      return;
    }
    if (ec)
    {
      if (ec == http::error::body_limit)
        qCWarning(lcHttp) << "Request body exceeds" << m_ctx.config.maxBodyBytes
                          << "bytes, closing the connection";
      else
        qCDebug(lcHttp) << "Read failed:" << ec.message().c_str();
      return;
    }

    m_stream.expires_never();
    auto request = m_parser->release();
    if (beast::websocket::is_upgrade(request))
    {
      std::make_shared<WebSocketSession>(m_stream.release_socket(), m_ctx)
          ->run(std::move(request));
      return;
    }

    // Generation blocks for as long as the model runs, so every HTTP request
    // gets its own session thread.
    auto session = std::make_shared<HttpSession>(
        m_stream.release_socket(), std::move(m_buffer), m_ctx);
    auto pending = std::make_shared<Http::Request>(std::move(request));
    auto task = [session = std::move(session), pending = std::move(pending)] {
      session->run(*pending);
    };
    if (!m_ctx.sessions.spawn(std::move(task)))
      qCDebug(lcHttp) << "Shutting down, request dropped";
  }

  beast::tcp_stream m_stream;
  ServerContext& m_ctx;
  beast::flat_buffer m_buffer;
  std::optional<http::request_parser<http::string_body>> m_parser;
};
}

void readRequest(tcp::socket socket, ServerContext& ctx, beast::flat_buffer buffer)
{
  std::make_shared<RequestReader>(std::move(socket), ctx, std::move(buffer))->run();
}

Listener::Listener(
    net::io_context& ioc,
    const tcp::endpoint& endpoint,
    ServerContext& ctx)
    : m_ioc{ioc}
    , m_acceptor{net::make_strand(ioc)}
    , m_ctx{ctx}
{
  beast::error_code ec;
  auto check = [&](const char* step) {
    if (ec)
      throw StartupError(std::format(
          "Cannot listen on {}:{} ({}): {}",
          endpoint.address().to_string(),
          endpoint.port(),
          step,
          ec.message()));
  };

  m_acceptor.open(endpoint.protocol(), ec);
  check("open");
  m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
  check("set_option");
  m_acceptor.bind(endpoint, ec);
  check("bind");
  m_acceptor.listen(net::socket_base::max_listen_connections, ec);
  check("listen");
}

void Listener::run()
{
  accept();
}

void Listener::stop()
{
  net::dispatch(m_acceptor.get_executor(), [self = shared_from_this()] {
    beast::error_code ec;
    self->m_acceptor.close(ec);
  });
}

void Listener::accept()
{
  m_acceptor.async_accept(
      net::make_strand(m_ioc),
      beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
}

void Listener::onAccept(beast::error_code ec, tcp::socket socket)
{
  if (ec == net::error::operation_aborted)
    return;
  if (ec)
    qCWarning(lcHttp) << "Accept failed:" << ec.message().c_str();
  else
    readRequest(std::move(socket), m_ctx);

  if (m_acceptor.is_open())
    accept();
}
}
