#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace Medgate
{
// Admits one generation at a time. Further callers wait in arrival order,
// up to maxWaiting of them; the next one is rejected with BusyError.
class InferenceQueue
{
public:
  explicit InferenceQueue(std::size_t maxWaiting);

  class Ticket
  {
  public:
    Ticket() = default;
    Ticket(const Ticket&) = delete;
    Ticket& operator=(const Ticket&) = delete;
    Ticket(Ticket&& other) noexcept;
    Ticket& operator=(Ticket&& other) noexcept;
    ~Ticket();

    explicit operator bool() const noexcept { return m_queue != nullptr; }

  private:
    friend class InferenceQueue;
    explicit Ticket(InferenceQueue* q) noexcept
        : m_queue{q}
    {
    }
    InferenceQueue* m_queue{};
  };

  // Blocks until this caller is at the front. Throws BusyError when the
  // waiting line is full.
  [[nodiscard]] Ticket acquire();

  std::size_t waiting() const;
  bool active() const;
  std::size_t maxWaiting() const noexcept { return m_maxWaiting; }

private:
  void release() noexcept;

  const std::size_t m_maxWaiting;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  bool m_active{};
  std::size_t m_waiting{};
  std::uint64_t m_nextTicket{};
  std::uint64_t m_serving{};
};
}
