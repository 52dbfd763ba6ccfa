#pragma once

#include <cstdint>
#include <format>
#include <span>
#include <stdexcept>
#include <vector>

namespace Medgate::Yolo
{

struct YOLO_pose
{
  static constexpr int NUM_KPS = 17;
  static constexpr int NUM_CHANNELS = 5 + 3 * NUM_KPS;

  struct keypoint
  {
    float x{}, y{}, confidence{};
  };

  struct pose_type
  {
    struct rect
    {
      float x, y, w, h;
    } geometry{};
    float confidence{};
    std::vector<keypoint> keypoints;
  };

  float min_confidence = 0.25f;

  // Keeps the single most confident box, no NMS.
  // data is the raw output, channel-major: [1, NUM_CHANNELS, num_boxes].
  pose_type processOutput(
      std::span<const float> data,
      int64_t num_boxes,
      int image_w,
      int image_h,
      int model_w = 640,
      int model_h = 640) const
  {
    if (num_boxes <= 0)
      return {};
    if (data.size() != static_cast<std::size_t>(NUM_CHANNELS * num_boxes))
      throw std::runtime_error(std::format(
          "Unexpected pose output size {} for {} boxes",
          data.size(),
          num_boxes));

    const float* recog = data.data() + 4 * num_boxes;
    int64_t best = 0;
    for (int64_t i = 1; i < num_boxes; i++)
    {
      if (recog[i] > recog[best])
        best = i;
    }

    const float sx = float(image_w) / float(model_w);
    const float sy = float(image_h) / float(model_h);
    auto at = [&](int channel) { return data[channel * num_boxes + best]; };

    pose_type p;
    p.confidence = recog[best];
    const float w = at(2), h = at(3);
    p.geometry = {(at(0) - w / 2) * sx, (at(1) - h / 2) * sy, w * sx, h * sy};
    if (p.confidence < min_confidence)
      return p;

    p.keypoints.reserve(NUM_KPS);
    for (int k = 0; k < NUM_KPS; k++)
    {
      const int c = 5 + 3 * k;
      p.keypoints.push_back({at(c) * sx, at(c + 1) * sy, at(c + 2)});
    }
    return p;
  }
};
}
