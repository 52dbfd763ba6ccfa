#pragma once
#include <boost/container/vector.hpp>

#include <QBuffer>
#include <QByteArray>
#include <QImage>
#include <QPainter>

#include <Medgate/helpers/OnnxBase.hpp>
#include <Medgate/helpers/Utilities.hpp>

#include <array>
#include <span>

namespace Medgate::Onnx
{

struct FloatTensor
{
  boost::container::vector<float> storage;
  Ort::Value value{nullptr};
};

// Writes an RGB888 image as three planes, (value - mean) / stddev per channel.
inline void toPlanar(
    const QImage& rgb,
    float* planes,
    const std::array<float, 3>& mean,
    const std::array<float, 3>& stddev)
{
  const int w = rgb.width();
  const int h = rgb.height();
  const std::size_t plane = std::size_t(w) * std::size_t(h);
  const std::array<float, 3> scale{1.f / stddev[0], 1.f / stddev[1], 1.f / stddev[2]};

  for (int y = 0; y < h; y++)
  {
    const uchar* px = rgb.constScanLine(y);
    float* row = planes + std::size_t(y) * std::size_t(w);
    for (int x = 0; x < w; x++, px += 3)
    {
      for (int c = 0; c < 3; c++)
        row[c * plane + x] = (float(px[c]) - mean[c]) * scale[c];
    }
  }
}

// Resizes without keeping the aspect ratio, then lays out the RGB planes.
inline void planarStretched(
    const QImage& source,
    int model_w,
    int model_h,
    boost::container::vector<float>& storage,
    std::array<float, 3> mean = {0.f, 0.f, 0.f},
    std::array<float, 3> stddev = {255.f, 255.f, 255.f})
{
  const QImage img = source
                         .scaled(
                             model_w,
                             model_h,
                             Qt::IgnoreAspectRatio,
                             Qt::SmoothTransformation)
                         .convertToFormat(QImage::Format_RGB888);

  storage.resize(3 * std::size_t(model_w) * model_h, boost::container::default_init);
  toPlanar(img, storage.data(), mean, stddev);
}

// [1, 3, h, w] tensor over its own storage.
inline FloatTensor planarTensor(
    const QImage& source,
    int model_w,
    int model_h,
    std::array<float, 3> mean = {0.f, 0.f, 0.f},
    std::array<float, 3> stddev = {255.f, 255.f, 255.f})
{
  FloatTensor f;
  planarStretched(source, model_w, model_h, f.storage, mean, stddev);
  f.value = tensorView<float>(
      std::span<float>(f.storage.data(), f.storage.size()),
      {1, 3, model_h, model_w});
  return f;
}

inline QImage drawKeypoints(
    QImage img,
    float min_confidence,
    float radius,
    const auto& keypoints)
{
  img = std::move(img).convertToFormat(QImage::Format_RGB32);
  {
    QPainter p(&img);
    p.setRenderHint(QPainter::Antialiasing);
    p.setPen(Qt::NoPen);
    p.setBrush(QColor(0, 255, 0));
    for (const auto& kp : keypoints)
    {
      if (kp.confidence > min_confidence)
        p.drawEllipse(QPointF(kp.x, kp.y), radius, radius);
    }
  }
  return img;
}

inline QByteArray encodeJpeg(const QImage& img, int quality = 90)
{
  QByteArray bytes;
  QBuffer buffer(&bytes);
  buffer.open(QIODevice::WriteOnly);
  if (!img.save(&buffer, "JPEG", quality))
    bytes.clear();
  return bytes;
}
}
