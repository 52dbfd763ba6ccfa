#pragma once
#include <QByteArray>
#include <QImage>

#include <Medgate/helpers/OnnxContext.hpp>
#include <Medgate/helpers/Yolo.hpp>

#include <filesystem>
#include <memory>

namespace Medgate
{
struct PoseSettings
{
  std::filesystem::path modelFile;
  int inputWidth = 640;
  int inputHeight = 640;
  float minBoxConfidence = 0.25f;
  float minKeypointConfidence = 0.5f;
  float keypointRadius = 5.f;
  Onnx::Options onnx;
};

enum class PoseStage
{
  Idle,
  Preprocessing,
  Inference,
  PostProcessing,
  Rendered
};

const char* stageName(PoseStage s) noexcept;

using PoseDetection = Yolo::YOLO_pose::pose_type;

// Single-person YOLO pose: encoded frame in, annotated JPEG out.
// Thread-safe, onnxruntime sessions accept concurrent runs.
class PoseEstimator
{
public:
  explicit PoseEstimator(const PoseSettings& settings);

  // Throws RequestError if the frame cannot be decoded.
  QByteArray estimate(const QByteArray& encoded) const;
  PoseDetection detect(const QImage& image) const;

  const PoseSettings& settings() const noexcept { return m_settings; }

private:
  PoseSettings m_settings;
  std::unique_ptr<Onnx::OnnxRunContext> m_context;
  Yolo::YOLO_pose m_decoder;
};

QImage decodeImage(const QByteArray& encoded);
QImage renderPose(
    const QImage& image,
    const PoseDetection& detection,
    float minConfidence,
    float radius);
}
