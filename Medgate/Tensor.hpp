#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Medgate
{
class InputTensor
{
public:
  virtual ~InputTensor() = default;

  // Frees the tensor buffers. May throw, the owner logs it and moves on.
  virtual void dispose() = 0;
};

// Owns every tensor built for one generation and disposes all of them when
// it goes out of scope, whatever the reason.
class ModelInputs
{
public:
  ModelInputs() = default;
  ModelInputs(const ModelInputs&) = delete;
  ModelInputs& operator=(const ModelInputs&) = delete;
  ModelInputs(ModelInputs&& other) noexcept
      : m_tensors{std::exchange(other.m_tensors, {})}
  {
  }
  ModelInputs& operator=(ModelInputs&& other) noexcept
  {
    if (this != &other)
    {
      release();
      m_tensors = std::exchange(other.m_tensors, {});
    }
    return *this;
  }
  ~ModelInputs() { release(); }

  void add(std::string name, std::unique_ptr<InputTensor> tensor)
  {
    m_tensors.emplace_back(std::move(name), std::move(tensor));
  }

  template <typename T>
  T* get(std::string_view name) const noexcept
  {
    for (auto& [n, t] : m_tensors)
      if (n == name)
        return dynamic_cast<T*>(t.get());
    return nullptr;
  }

  bool contains(std::string_view name) const noexcept
  {
    for (auto& [n, t] : m_tensors)
      if (n == name)
        return true;
    return false;
  }

  std::size_t size() const noexcept { return m_tensors.size(); }
  bool empty() const noexcept { return m_tensors.empty(); }

  // Returns the number of tensors whose disposal failed.
  std::size_t release() noexcept;

private:
  std::vector<std::pair<std::string, std::unique_ptr<InputTensor>>> m_tensors;
};
}
