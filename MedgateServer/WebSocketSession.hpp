#pragma once
#include "Routes.hpp"

#include <Medgate/FrameMailbox.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <QByteArray>

#include <cstdint>
#include <memory>
#include <optional>

namespace Medgate
{
struct ServerContext;

// Real-time pose relay: binary frames in, annotated JPEG frames out.
// Keeps one frame in flight and the latest one pending, older pending frames
// are dropped.
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession>
{
public:
  WebSocketSession(boost::asio::ip::tcp::socket&& socket, ServerContext& ctx);
  ~WebSocketSession();

  void run(Http::Request upgrade);

private:
  void onAccept(boost::beast::error_code ec);
  void read();
  void onRead(boost::beast::error_code ec, std::size_t bytes);
  void process(QByteArray frame);
  void onProcessed(std::optional<QByteArray> jpeg);
  void onWrite(boost::beast::error_code ec, std::size_t bytes);
  void next();

  boost::beast::websocket::stream<boost::beast::tcp_stream> m_ws;
  ServerContext& m_ctx;
  boost::beast::flat_buffer m_buffer;
  FrameMailbox m_mailbox;
  QByteArray m_outgoing;
  std::uint64_t m_processed{};
  bool m_closed{};
};
}
