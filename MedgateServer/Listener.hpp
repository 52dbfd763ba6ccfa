#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <memory>

namespace Medgate
{
struct ServerContext;

// Accepts connections and hands each one to a request reader.
class Listener : public std::enable_shared_from_this<Listener>
{
public:
  // Throws StartupError if the endpoint cannot be bound.
  Listener(
      boost::asio::io_context& ioc,
      const boost::asio::ip::tcp::endpoint& endpoint,
      ServerContext& ctx);

  void run();
  void stop();

private:
  void accept();
  void onAccept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

  boost::asio::io_context& m_ioc;
  boost::asio::ip::tcp::acceptor m_acceptor;
  ServerContext& m_ctx;
};

// Reads the next request of a connection asynchronously, then upgrades it to
// a WebSocket session or serves it on an HTTP thread.
void readRequest(
    boost::asio::ip::tcp::socket socket,
    ServerContext& ctx,
    boost::beast::flat_buffer buffer = {});
}
