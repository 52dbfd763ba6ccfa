#include "SessionThreads.hpp"

#include <Medgate/Logging.hpp>

#include <sys/socket.h>

#include <algorithm>

namespace Medgate
{
SessionThreads::~SessionThreads()
{
  stop();
  join();
}

bool SessionThreads::spawn(std::function<void()> task)
{
  std::lock_guard lock{m_mutex};
  if (m_stopped)
    return false;

  reapFinished();
  m_threads.emplace_back([this, task = std::move(task)]() mutable {
    try
    {
      task();
    }
    catch (const std::exception& e)
    {
      qCWarning(lcHttp) << "HTTP session failed:" << e.what();
    }
    // Whatever the task holds is released before the thread can be reaped.
    task = nullptr;

    std::lock_guard lock{m_mutex};
    m_finished.push_back(std::this_thread::get_id());
  });
  return true;
}

// Caller holds m_mutex. A finished thread has nothing left to do but return.
void SessionThreads::reapFinished()
{
  for (const auto id : m_finished)
  {
    const auto it = std::ranges::find_if(
        m_threads, [id](const std::thread& t) { return t.get_id() == id; });
    if (it != m_threads.end())
    {
      it->join();
      m_threads.erase(it);
    }
  }
  m_finished.clear();
}

void SessionThreads::stop() noexcept
{
  std::lock_guard lock{m_mutex};
  if (!m_stopped)
    qCInfo(lcHttp) << "Closing" << m_sockets.size() << "HTTP connections";
  m_stopped = true;
  for (const auto socket : m_sockets)
    ::shutdown(socket, SHUT_RDWR);
}

void SessionThreads::join()
{
  std::list<std::thread> threads;
  {
    std::lock_guard lock{m_mutex};
    threads.swap(m_threads);
    m_finished.clear();
  }
  for (auto& t : threads)
    if (t.joinable())
      t.join();
}

bool SessionThreads::stopped() const
{
  std::lock_guard lock{m_mutex};
  return m_stopped;
}

std::size_t SessionThreads::running() const
{
  std::lock_guard lock{m_mutex};
  return m_threads.size() - std::min(m_threads.size(), m_finished.size());
}

void SessionThreads::track(NativeSocket socket)
{
  std::lock_guard lock{m_mutex};
  m_sockets.insert(socket);
  if (m_stopped)
    ::shutdown(socket, SHUT_RDWR);
}

void SessionThreads::untrack(NativeSocket socket)
{
  std::lock_guard lock{m_mutex};
  m_sockets.erase(socket);
}
}
