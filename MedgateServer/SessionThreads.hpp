#pragma once
#include <boost/asio/ip/tcp.hpp>
#include <boost/container/flat_set.hpp>

#include <functional>
#include <list>
#include <mutex>
#include <thread>
#include <vector>

namespace Medgate
{
// Owns the threads that serve blocking HTTP requests. Every thread is joined
// before the server state they use goes away.
class SessionThreads
{
public:
  using NativeSocket = boost::asio::ip::tcp::socket::native_handle_type;

  SessionThreads() = default;
  SessionThreads(const SessionThreads&) = delete;
  SessionThreads& operator=(const SessionThreads&) = delete;
  ~SessionThreads();

  // Runs task on a new thread. Returns false once stop() was called.
  bool spawn(std::function<void()> task);

  // Refuses new tasks and shuts down every tracked connection, so that
  // blocked writes fail and streaming sessions wind down.
  void stop() noexcept;
  // Waits for every task to return.
  void join();

  bool stopped() const;
  std::size_t running() const;

  // Connections served by a task, shut down by stop().
  void track(NativeSocket socket);
  void untrack(NativeSocket socket);

private:
  void reapFinished();

  mutable std::mutex m_mutex;
  std::list<std::thread> m_threads;
  std::vector<std::thread::id> m_finished;
  boost::container::flat_set<NativeSocket> m_sockets;
  bool m_stopped{};
};
}
