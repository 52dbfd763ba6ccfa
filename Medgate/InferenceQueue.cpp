#include "InferenceQueue.hpp"

#include <Medgate/Errors.hpp>
#include <Medgate/Logging.hpp>

#include <utility>

namespace Medgate
{
InferenceQueue::InferenceQueue(std::size_t maxWaiting)
    : m_maxWaiting{maxWaiting}
{
}

InferenceQueue::Ticket::Ticket(Ticket&& other) noexcept
    : m_queue{std::exchange(other.m_queue, nullptr)}
{
}

InferenceQueue::Ticket& InferenceQueue::Ticket::operator=(Ticket&& other) noexcept
{
  if (this != &other)
  {
    if (m_queue)
      m_queue->release();
    m_queue = std::exchange(other.m_queue, nullptr);
  }
  return *this;
}

InferenceQueue::Ticket::~Ticket()
{
  if (m_queue)
    m_queue->release();
}

InferenceQueue::Ticket InferenceQueue::acquire()
{
  std::unique_lock lock{m_mutex};
  if (m_active || m_waiting > 0)
  {
    if (m_waiting >= m_maxWaiting)
    {
      qCInfo(lcGeneration) << "Rejecting request:" << m_waiting
                           << "already waiting";
      throw BusyError{};
    }
  }

  const auto ticket = m_nextTicket++;
  m_waiting++;
  if (m_active)
    qCDebug(lcGeneration) << "Waiting for the model, position" << m_waiting;
  m_cv.wait(lock, [&] { return !m_active && m_serving == ticket; });
  m_waiting--;
  m_serving++;
  m_active = true;
  return Ticket{this};
}

void InferenceQueue::release() noexcept
{
  {
    std::lock_guard lock{m_mutex};
    m_active = false;
  }
  m_cv.notify_all();
}

std::size_t InferenceQueue::waiting() const
{
  std::lock_guard lock{m_mutex};
  return m_waiting;
}

bool InferenceQueue::active() const
{
  std::lock_guard lock{m_mutex};
  return m_active;
}
}
