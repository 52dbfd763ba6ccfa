#pragma once
#include <Medgate/Config.hpp>
#include <Medgate/GenerativeModel.hpp>
#include <Medgate/PosePipeline.hpp>
#include <Medgate/helpers/Gemma.hpp>

#include <atomic>
#include <memory>

namespace Medgate
{
struct HealthStatus
{
  bool visionReady{};
  bool poseReady{};
};

// Owns the vision-language and pose models. Each is loaded once and is
// read-only afterwards.
class ModelHost
{
public:
  explicit ModelHost(const ServerConfig& config);
  ~ModelHost();

  // Both throw StartupError on failure.
  void initializeVisionLanguage(const ProgressCallback& progress);
  void initializePose(const ProgressCallback& progress);

  // Serves an already loaded model instead of the Gemma export.
  void setVisionLanguage(std::unique_ptr<GenerativeModel> model);

  HealthStatus health() const noexcept;

  // Throws NotReadyError until the corresponding model is loaded.
  GenerativeModel& visionLanguage();
  const PoseEstimator& pose() const;

  Gemma::ModelFiles modelFiles() const;
  PoseSettings poseSettings() const;
  Onnx::Options onnxOptions() const;

private:
  const ServerConfig& m_config;
  std::unique_ptr<GenerativeModel> m_vision;
  std::unique_ptr<PoseEstimator> m_pose;
  std::atomic_bool m_visionReady{};
  std::atomic_bool m_poseReady{};
};
}
