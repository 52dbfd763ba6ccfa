#include "PosePipeline.hpp"

#include <Medgate/Errors.hpp>
#include <Medgate/Logging.hpp>
#include <Medgate/helpers/Images.hpp>

#include <format>
#include <stdexcept>

namespace Medgate
{
const char* stageName(PoseStage s) noexcept
{
  switch (s)
  {
    case PoseStage::Idle:
      return "idle";
    case PoseStage::Preprocessing:
      return "preprocessing";
    case PoseStage::Inference:
      return "inference";
    case PoseStage::PostProcessing:
      return "post-processing";
    case PoseStage::Rendered:
      return "rendered";
  }
  return "?";
}

QImage decodeImage(const QByteArray& encoded)
{
  QImage img = QImage::fromData(encoded);
  if (img.isNull())
    throw RequestError("Could not decode the image");
  return img;
}

QImage renderPose(
    const QImage& image,
    const PoseDetection& detection,
    float minConfidence,
    float radius)
{
  return Onnx::drawKeypoints(image, minConfidence, radius, detection.keypoints);
}

PoseEstimator::PoseEstimator(const PoseSettings& settings)
    : m_settings{settings}
{
  if (!std::filesystem::exists(settings.modelFile))
    throw std::runtime_error(std::format(
        "Pose model not found: {}", settings.modelFile.string()));

  m_context = std::make_unique<Onnx::OnnxRunContext>(
      settings.modelFile, settings.onnx);
  m_decoder.min_confidence = settings.minBoxConfidence;

  const auto& spec = m_context->spec;
  if (spec.inputs.empty() || spec.outputs.empty())
    throw std::runtime_error("Pose model has no input or output");
  qCDebug(lcPose) << spec;
}

PoseDetection PoseEstimator::detect(const QImage& image) const
{
  auto stage = PoseStage::Idle;
  auto enter = [&stage](PoseStage next)
  {
    qCDebug(lcPose) << stageName(stage) << "->" << stageName(next);
    stage = next;
  };

  const int w = m_settings.inputWidth;
  const int h = m_settings.inputHeight;

  enter(PoseStage::Preprocessing);
  auto tensor = Onnx::planarTensor(image, w, h);

  enter(PoseStage::Inference);
  auto outputs = m_context->infer(std::span<Ort::Value>(&tensor.value, 1));
  if (outputs.empty())
    throw std::runtime_error("Pose model returned no output");

  enter(PoseStage::PostProcessing);
  auto info = outputs.front().GetTensorTypeAndShapeInfo();
  const auto shape = info.GetShape();
  if (shape.size() != 3 || shape[1] != Yolo::YOLO_pose::NUM_CHANNELS)
    throw std::runtime_error(std::format(
        "Unexpected pose output shape with {} dimensions", shape.size()));

  const float* data = outputs.front().GetTensorData<float>();
  return m_decoder.processOutput(
      {data, info.GetElementCount()},
      shape[2],
      image.width(),
      image.height(),
      w,
      h);
}

QByteArray PoseEstimator::estimate(const QByteArray& encoded) const
{
  const QImage image = decodeImage(encoded);
  const auto detection = detect(image);
  qCDebug(lcPose) << "Best detection confidence" << detection.confidence
                  << "with" << detection.keypoints.size() << "keypoints";

  QByteArray jpeg = Onnx::encodeJpeg(renderPose(
      image,
      detection,
      m_settings.minKeypointConfidence,
      m_settings.keypointRadius));
  if (jpeg.isEmpty())
    throw std::runtime_error("JPEG encoding failed");
  qCDebug(lcPose) << stageName(PoseStage::Rendered) << jpeg.size() << "bytes";
  return jpeg;
}
}
