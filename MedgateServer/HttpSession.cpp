#include "HttpSession.hpp"

#include "Listener.hpp"
#include "Responder.hpp"
#include "ServerContext.hpp"
#include "SessionThreads.hpp"

#include <Medgate/Config.hpp>
#include <Medgate/Logging.hpp>

namespace Medgate
{
HttpSession::HttpSession(
    boost::asio::ip::tcp::socket socket,
    boost::beast::flat_buffer buffer,
    ServerContext& ctx)
    : m_stream{std::move(socket)}
    , m_buffer{std::move(buffer)}
    , m_ctx{ctx}
    , m_native{m_stream.socket().native_handle()}
{
  m_ctx.sessions.track(m_native);
}

HttpSession::~HttpSession()
{
  if (m_tracked)
    m_ctx.sessions.untrack(m_native);
}

void HttpSession::run(const Http::Request& request)
{
  Http::Responder out{
      m_stream,
      request.version(),
      request.keep_alive(),
      std::chrono::seconds{m_ctx.config.sendTimeoutSeconds}};
  Http::handleRequest(m_ctx, request, out);

  if (!out.responded())
  {
    qCWarning(lcHttp) << "No response was written, closing the connection";
    out.error(
        Http::http::status::internal_server_error,
        QStringLiteral("An internal server error occurred."));
  }

  if (out.keepAlive() && !m_ctx.sessions.stopped())
  {
    // The next request on this connection may be tracked by another session.
    m_ctx.sessions.untrack(m_native);
    m_tracked = false;
    readRequest(m_stream.release_socket(), m_ctx, std::move(m_buffer));
    return;
  }

  boost::system::error_code ec;
  m_stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}
}
