#pragma once
#include <QDebug>

#include <Medgate/Logging.hpp>
#include <Medgate/helpers/ModelSpec.hpp>
#include <Medgate/helpers/OnnxBase.hpp>
#include <Medgate/helpers/Utilities.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Medgate::Onnx
{
struct Options
{
  std::string provider = "default";
  int device_id = 0;
  int intra_op_threads = 0;
};

// Provider names without the "ExecutionProvider" suffix, lower case.
inline std::vector<std::string> availableProviders()
{
  static constexpr std::string_view suffix = "ExecutionProvider";
  std::vector<std::string> names;
  for (std::string name : Ort::GetAvailableProviders())
  {
    if (name.ends_with(suffix))
      name.erase(name.size() - suffix.size());
    std::ranges::transform(
        name,
        name.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    names.push_back(std::move(name));
  }
  return names;
}

inline std::string
pickProvider(const std::string& requested, const std::vector<std::string>& available)
{
  if (requested != "default")
    return requested;
  for (std::string_view candidate : {"cuda", "rocm", "openvino"})
    if (std::ranges::find(available, candidate) != available.end())
      return std::string(candidate);
  return "cpu";
}

inline void appendCuda(Ort::SessionOptions& so, const std::string& device)
{
  const OrtApi& api = Ort::GetApi();
  OrtCUDAProviderOptionsV2* cuda = nullptr;
  Ort::ThrowOnError(api.CreateCUDAProviderOptions(&cuda));
  std::unique_ptr<OrtCUDAProviderOptionsV2, void (*)(OrtCUDAProviderOptionsV2*)>
      guard{cuda, api.ReleaseCUDAProviderOptions};

  const char* keys[]
      = {"device_id", "arena_extend_strategy", "cudnn_conv_algo_search"};
  const char* values[] = {device.c_str(), "kNextPowerOfTwo", "EXHAUSTIVE"};
  Ort::ThrowOnError(
      api.UpdateCUDAProviderOptions(cuda, keys, values, std::size(keys)));
  so.AppendExecutionProvider_CUDA_V2(*cuda);
}

inline void appendTensorRT(Ort::SessionOptions& so, const std::string& device)
{
  const OrtApi& api = Ort::GetApi();
  OrtTensorRTProviderOptionsV2* trt = nullptr;
  Ort::ThrowOnError(api.CreateTensorRTProviderOptions(&trt));
  std::unique_ptr<OrtTensorRTProviderOptionsV2, void (*)(OrtTensorRTProviderOptionsV2*)>
      guard{trt, api.ReleaseTensorRTProviderOptions};

  const char* keys[] = {"device_id", "trt_engine_cache_enable"};
  const char* values[] = {device.c_str(), "1"};
  Ort::ThrowOnError(
      api.UpdateTensorRTProviderOptions(trt, keys, values, std::size(keys)));
  so.AppendExecutionProvider_TensorRT_V2(*trt);
}

inline Ort::SessionOptions create_session_options(const Options& opts)
try
{
  Ort::SessionOptions so;
  if (opts.intra_op_threads > 0)
    so.SetIntraOpNumThreads(opts.intra_op_threads);

  const auto available = availableProviders();
  for (const auto& name : available)
    qCDebug(lcHost) << "Available provider:" << name.c_str();

  const std::string provider = pickProvider(opts.provider, available);
  if (std::ranges::find(available, provider) == available.end())
  {
    qCWarning(lcHost) << "Execution provider" << provider.c_str()
                      << "is not available, using cpu";
    return so;
  }
  qCInfo(lcHost) << "Execution provider:" << provider.c_str();

  const std::string device = std::to_string(std::max(opts.device_id, 0));
  if (provider == "cuda")
    appendCuda(so, device);
  else if (provider == "tensorrt")
    appendTensorRT(so, device);
  else if (provider == "rocm")
  {
    OrtROCMProviderOptions rocm{};
    rocm.device_id = std::max(opts.device_id, 0);
    so.AppendExecutionProvider_ROCM(rocm);
  }
  else if (provider == "openvino")
  {
    so.AppendExecutionProvider(
        "OpenVINO", {{"device_type", "GPU"}, {"precision", "FP32"}});
    so.SetGraphOptimizationLevel(ORT_DISABLE_ALL);
  }
  return so;
}
catch (const std::exception& e)
{
  qCWarning(lcHost) << "onnxruntime: falling back to CPU:" << e.what();
  return create_session_options(
      Options{.provider = "cpu", .device_id = 0, .intra_op_threads = opts.intra_op_threads});
}

inline ModelSpec readModelSpec(Ort::Session& session)
{
  ModelSpec spec;
  Ort::AllocatorWithDefaultOptions allocator;

  for (std::size_t i = 0; i < session.GetInputCount(); i++)
  {
    std::string name = session.GetInputNameAllocated(i, allocator).get();
    const Ort::TypeInfo input_type = session.GetInputTypeInfo(i);
    const auto input_tensor_type = input_type.GetTensorTypeAndShapeInfo();

    spec.inputs.push_back(
        {.name = QString::fromStdString(name),
         .element_type = input_tensor_type.GetElementType(),
         .shape = input_tensor_type.GetShape()});
    spec.input_names.push_back(std::move(name));
  }

  for (std::size_t i = 0; i < session.GetOutputCount(); i++)
  {
    std::string name = session.GetOutputNameAllocated(i, allocator).get();
    const Ort::TypeInfo output_type = session.GetOutputTypeInfo(i);
    const auto output_tensor_type = output_type.GetTensorTypeAndShapeInfo();

    spec.outputs.push_back(
        {.name = QString::fromStdString(name),
         .element_type = output_tensor_type.GetElementType(),
         .shape = output_tensor_type.GetShape()});
    spec.output_names.push_back(std::move(name));
  }

  for (const auto& name : spec.input_names)
    spec.input_names_char.push_back(name.c_str());
  for (const auto& name : spec.output_names)
    spec.output_names_char.push_back(name.c_str());

  return spec;
}

// One model file, one session.
struct OnnxRunContext
{
  Options opts;
  Ort::Env env;

  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};
  ModelSpec spec;

  OnnxRunContext(const std::filesystem::path& model, Options o)
      : opts(std::move(o))
      , env(ORT_LOGGING_LEVEL_WARNING, "medgate")
      , session_options(create_session_options(opts))
  {
    try
    {
      session = Ort::Session(env, model.c_str(), session_options);
      spec = readModelSpec(session);
    }
    catch (const Ort::Exception& e)
    {
      throw std::runtime_error(std::format(
          "Failed to load {}: {}", model.string(), e.what()));
    }
  }

  std::vector<Ort::Value> infer(std::span<Ort::Value> input_tensors)
  {
    try
    {
      return session.Run(
          Ort::RunOptions{nullptr},
          spec.input_names_char.data(),
          input_tensors.data(),
          std::min(input_tensors.size(), spec.input_names_char.size()),
          spec.output_names_char.data(),
          spec.output_names_char.size());
    }
    catch (const Ort::Exception& e)
    {
      throw std::runtime_error(
          std::format("Model inference failed: {}", e.what()));
    }
  }
};
}
