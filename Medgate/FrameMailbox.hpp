#pragma once
#include <QByteArray>

#include <cstdint>
#include <optional>

namespace Medgate
{
// Latest-frame-wins slot: one frame in flight, at most one pending.
// Not synchronized, it lives on a single connection's strand.
class FrameMailbox
{
public:
  // Returns the frame to process right away, or nothing if one is already
  // in flight, in which case the frame replaces the pending one.
  std::optional<QByteArray> offer(QByteArray frame)
  {
    if (!m_busy)
    {
      m_busy = true;
      return frame;
    }
    if (m_pending)
      m_dropped++;
    m_pending = std::move(frame);
    return std::nullopt;
  }

  // Called when the in-flight frame is done. Returns the next one, if any.
  std::optional<QByteArray> finish()
  {
    if (m_pending)
    {
      std::optional<QByteArray> next = std::move(m_pending);
      m_pending.reset();
      return next;
    }
    m_busy = false;
    return std::nullopt;
  }

  bool busy() const noexcept { return m_busy; }
  bool hasPending() const noexcept { return m_pending.has_value(); }
  std::uint64_t dropped() const noexcept { return m_dropped; }

private:
  std::optional<QByteArray> m_pending;
  std::uint64_t m_dropped{};
  bool m_busy{};
};
}
