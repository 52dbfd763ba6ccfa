#include "ModelHost.hpp"

#include <Medgate/Errors.hpp>
#include <Medgate/Logging.hpp>

#include <format>

namespace Medgate
{
ModelHost::ModelHost(const ServerConfig& config)
    : m_config{config}
{
}

ModelHost::~ModelHost() = default;

Onnx::Options ModelHost::onnxOptions() const
{
  return {.provider = m_config.provider.toStdString(), .device_id = 0};
}

Gemma::ModelFiles ModelHost::modelFiles() const
{
  return {
      .directory = m_config.visionDir.toStdString(),
      .embed_dtype = m_config.embedDtype.toStdString(),
      .vision_dtype = m_config.visionDtype.toStdString(),
      .audio_dtype = m_config.audioDtype.toStdString(),
      .decoder_dtype = m_config.decoderDtype.toStdString()};
}

PoseSettings ModelHost::poseSettings() const
{
  PoseSettings s;
  s.modelFile = m_config.poseFile.toStdString();
  s.inputWidth = m_config.poseInputWidth;
  s.inputHeight = m_config.poseInputHeight;
  s.onnx = onnxOptions();
  return s;
}

void ModelHost::initializeVisionLanguage(const ProgressCallback& progress)
{
  const auto files = modelFiles();
  if (!std::filesystem::is_directory(files.directory))
    throw StartupError(std::format(
        "Model directory not found: {}", files.directory.string()));

  qCInfo(lcHost) << "Loading vision-language model from"
                 << files.directory.string().c_str();
  try
  {
    m_vision = std::make_unique<Gemma::GemmaInference>(
        files, onnxOptions(), progress);
  }
  catch (const std::exception& e)
  {
    throw StartupError(
        std::format("Failed to load the vision-language model: {}", e.what()));
  }
  m_visionReady.store(true, std::memory_order_release);
  qCInfo(lcHost) << "Vision-language model ready";
}

void ModelHost::setVisionLanguage(std::unique_ptr<GenerativeModel> model)
{
  m_vision = std::move(model);
  m_visionReady.store(m_vision != nullptr, std::memory_order_release);
}

void ModelHost::initializePose(const ProgressCallback& progress)
{
  const auto settings = poseSettings();
  qCInfo(lcHost) << "Loading pose model from"
                 << settings.modelFile.string().c_str();
  if (progress)
    progress({settings.modelFile.filename().string(), 0, 0});
  try
  {
    m_pose = std::make_unique<PoseEstimator>(settings);
  }
  catch (const std::exception& e)
  {
    throw StartupError(
        std::format("Failed to load the pose model: {}", e.what()));
  }
  m_poseReady.store(true, std::memory_order_release);
  qCInfo(lcHost) << "Pose model ready";
}

HealthStatus ModelHost::health() const noexcept
{
  return {
      m_visionReady.load(std::memory_order_acquire),
      m_poseReady.load(std::memory_order_acquire)};
}

GenerativeModel& ModelHost::visionLanguage()
{
  if (!m_visionReady.load(std::memory_order_acquire))
    throw NotReadyError("The vision-language model");
  return *m_vision;
}

const PoseEstimator& ModelHost::pose() const
{
  if (!m_poseReady.load(std::memory_order_acquire))
    throw NotReadyError("The pose model");
  return *m_pose;
}
}
