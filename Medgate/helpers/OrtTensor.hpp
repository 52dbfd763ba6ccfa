#pragma once
#include <boost/container/vector.hpp>

#include <Medgate/Tensor.hpp>
#include <Medgate/helpers/OnnxBase.hpp>
#include <Medgate/helpers/Utilities.hpp>

#include <span>
#include <vector>

namespace Medgate::Onnx
{
// Host buffer plus shape. view() wraps the buffer without copying, so the
// storage has to stay alive for as long as the view is used.
template <typename T>
struct OwnedTensor final : InputTensor
{
  boost::container::vector<T> storage;
  std::vector<int64_t> shape;

  OwnedTensor(boost::container::vector<T> data, std::vector<int64_t> s)
      : storage{std::move(data)}
      , shape{std::move(s)}
  {
  }

  Ort::Value view()
  {
    return tensorView<T>(std::span<T>(storage.data(), storage.size()), shape);
  }

  void dispose() override
  {
    storage.clear();
    storage.shrink_to_fit();
  }
};

// Tensor allocated by onnxruntime, e.g. an encoder output.
struct ResultTensor final : InputTensor
{
  Ort::Value value{nullptr};

  explicit ResultTensor(Ort::Value v)
      : value{std::move(v)}
  {
  }

  void dispose() override { value = Ort::Value{nullptr}; }
};
}
