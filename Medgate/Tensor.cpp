#include "Tensor.hpp"

#include <Medgate/Logging.hpp>

#include <exception>

namespace Medgate
{
std::size_t ModelInputs::release() noexcept
{
  if (m_tensors.empty())
    return 0;

  std::size_t failures = 0;
  for (auto& [name, tensor] : m_tensors)
  {
    try
    {
      tensor->dispose();
    }
    catch (const std::exception& e)
    {
      failures++;
      qCWarning(lcGeneration) << "Failed to dispose tensor" << name.c_str()
                              << ":" << e.what();
    }
  }
  qCDebug(lcGeneration) << "Released" << m_tensors.size() << "input tensors";
  m_tensors.clear();
  return failures;
}
}
