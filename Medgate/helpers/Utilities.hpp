#pragma once

#include <Medgate/helpers/OnnxBase.hpp>

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

namespace Medgate::Onnx
{

// Non-owning view over data, which must outlive the returned value.
template <typename T>
Ort::Value
tensorView(std::span<T> data, const std::vector<std::int64_t>& shape)
{
  Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(
      OrtAllocatorType::OrtArenaAllocator, OrtMemType::OrtMemTypeDefault);
  return Ort::Value::CreateTensor<T>(
      mem_info, data.data(), data.size(), shape.data(), shape.size());
}

// Reads a float or float16 tensor into a float buffer.
inline void readAsFloat(const Ort::Value& value, std::vector<float>& out)
{
  auto info = value.GetTensorTypeAndShapeInfo();
  const auto count = info.GetElementCount();
  out.resize(count);
  switch (info.GetElementType())
  {
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
    {
      const float* src = value.GetTensorData<float>();
      std::copy_n(src, count, out.data());
      break;
    }
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
    {
      const Ort::Float16_t* src = value.GetTensorData<Ort::Float16_t>();
      for (std::size_t i = 0; i < count; i++)
        out[i] = src[i].ToFloat();
      break;
    }
    default:
      throw Ort::Exception(
          "expected a float or float16 tensor", ORT_INVALID_ARGUMENT);
  }
}
}
