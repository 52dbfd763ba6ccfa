#pragma once
#include <stdexcept>
#include <string>

namespace Medgate
{
// Unrecoverable while starting up: the process reports and exits.
struct StartupError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// Errors that map onto an HTTP status before any byte has been streamed.
struct HttpError : std::runtime_error
{
  HttpError(int status, const std::string& message)
      : std::runtime_error(message)
      , m_status{status}
  {
  }

  int status() const noexcept { return m_status; }

private:
  int m_status{};
};

struct RequestError : HttpError
{
  explicit RequestError(const std::string& message)
      : HttpError(400, message)
  {
  }
};

struct BusyError : HttpError
{
  BusyError()
      : HttpError(503, "busy")
  {
  }
};

struct NotReadyError : HttpError
{
  explicit NotReadyError(const std::string& what)
      : HttpError(503, what + " is not ready")
  {
  }
};
}
