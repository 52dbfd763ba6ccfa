#include "WebSocketSession.hpp"

#include "ServerContext.hpp"

#include <Medgate/Errors.hpp>
#include <Medgate/Logging.hpp>
#include <Medgate/Config.hpp>
#include <Medgate/ModelHost.hpp>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace Medgate
{
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

WebSocketSession::WebSocketSession(net::ip::tcp::socket&& socket, ServerContext& ctx)
    : m_ws{std::move(socket)}
    , m_ctx{ctx}
{
}

WebSocketSession::~WebSocketSession()
{
  qCInfo(lcWebSocket) << "Client disconnected after" << m_processed << "frames,"
                      << m_mailbox.dropped() << "dropped";
}

void WebSocketSession::run(Http::Request upgrade)
{
  m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
  m_ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
    res.set(beast::http::field::server, "medgate");
  }));
  m_ws.read_message_max(std::uint64_t(m_ctx.config.maxBodyBytes));
  m_ws.async_accept(
      upgrade,
      beast::bind_front_handler(&WebSocketSession::onAccept, shared_from_this()));
}

void WebSocketSession::onAccept(beast::error_code ec)
{
  if (ec)
  {
    qCWarning(lcWebSocket) << "Handshake failed:" << ec.message().c_str();
    return;
  }
  qCInfo(lcWebSocket) << "Client connected for real-time pose estimation";
  m_ws.binary(true);
  read();
}

void WebSocketSession::read()
{
  m_ws.async_read(
      m_buffer,
      beast::bind_front_handler(&WebSocketSession::onRead, shared_from_this()));
}

void WebSocketSession::onRead(beast::error_code ec, std::size_t bytes)
{
  if (ec)
  {
    m_closed = true;
    if (ec != websocket::error::closed)
      qCDebug(lcWebSocket) << "Read failed:" << ec.message().c_str();
    return;
  }

  if (!m_ws.got_binary())
  {
    qCDebug(lcWebSocket) << "Ignoring text message of" << bytes << "bytes";
    m_buffer.consume(m_buffer.size());
    read();
    return;
  }

  const auto data = m_buffer.cdata();
  QByteArray frame{static_cast<const char*>(data.data()), qsizetype(data.size())};
  m_buffer.consume(m_buffer.size());

  const auto droppedBefore = m_mailbox.dropped();
  if (auto now = m_mailbox.offer(std::move(frame)))
    process(std::move(*now));
  else if (m_mailbox.dropped() != droppedBefore)
    qCDebug(lcWebSocket) << "Frame dropped, total" << m_mailbox.dropped();

  read();
}

void WebSocketSession::process(QByteArray frame)
{
  net::post(
      m_ctx.posePool,
      [self = shared_from_this(), frame = std::move(frame)] {
        std::optional<QByteArray> jpeg;
        try
        {
          jpeg = self->m_ctx.host.pose().estimate(frame);
        }
        catch (const std::exception& e)
        {
          qCWarning(lcWebSocket) << "Error processing frame:" << e.what();
        }
        net::post(
            self->m_ws.get_executor(),
            [self, jpeg = std::move(jpeg)]() mutable {
              self->onProcessed(std::move(jpeg));
            });
      });
}

void WebSocketSession::onProcessed(std::optional<QByteArray> jpeg)
{
  if (m_closed)
    return;
  if (!jpeg)
  {
    next();
    return;
  }

  m_processed++;
  m_outgoing = std::move(*jpeg);
  m_ws.async_write(
      net::buffer(m_outgoing.constData(), std::size_t(m_outgoing.size())),
      beast::bind_front_handler(&WebSocketSession::onWrite, shared_from_this()));
}

void WebSocketSession::onWrite(beast::error_code ec, std::size_t)
{
  if (ec)
  {
    m_closed = true;
    qCDebug(lcWebSocket) << "Write failed:" << ec.message().c_str();
    return;
  }
  next();
}

void WebSocketSession::next()
{
  if (auto frame = m_mailbox.finish())
    process(std::move(*frame));
}
}
