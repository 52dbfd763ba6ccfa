#pragma once
#include "Routes.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

namespace Medgate
{
struct ServerContext;

// Serves one request on a session thread, then returns the connection to the
// asynchronous reader if it is kept alive. The connection is registered with
// the session threads while it is served here.
class HttpSession
{
public:
  HttpSession(
      boost::asio::ip::tcp::socket socket,
      boost::beast::flat_buffer buffer,
      ServerContext& ctx);
  ~HttpSession();

  void run(const Http::Request& request);

private:
  boost::beast::tcp_stream m_stream;
  boost::beast::flat_buffer m_buffer;
  ServerContext& m_ctx;
  boost::asio::ip::tcp::socket::native_handle_type m_native{};
  bool m_tracked{true};
};
}
