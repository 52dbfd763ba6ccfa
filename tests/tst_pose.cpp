#include <QBuffer>
#include <QTest>

#include <Medgate/Errors.hpp>
#include <Medgate/PosePipeline.hpp>
#include <Medgate/helpers/Images.hpp>

using namespace Medgate;
using Yolo::YOLO_pose;

namespace
{
// Channel-major [56, boxes] buffer with every box at the given confidence
// and all keypoints of box `best` placed at (x, y).
std::vector<float>
syntheticOutput(int boxes, int best, float bestConfidence, float x, float y)
{
  std::vector<float> data(std::size_t(YOLO_pose::NUM_CHANNELS * boxes), 0.f);
  auto at = [&](int channel, int box) -> float& {
    return data[std::size_t(channel * boxes + box)];
  };
  for (int b = 0; b < boxes; b++)
    at(4, b) = 0.01f;

  at(0, best) = x;
  at(1, best) = y;
  at(2, best) = 100.f;
  at(3, best) = 200.f;
  at(4, best) = bestConfidence;
  for (int k = 0; k < YOLO_pose::NUM_KPS; k++)
  {
    at(5 + 3 * k, best) = x;
    at(6 + 3 * k, best) = y;
    at(7 + 3 * k, best) = k % 2 ? 0.9f : 0.3f;
  }
  return data;
}
}

class PoseTest : public QObject
{
  Q_OBJECT

private slots:
  void belowThresholdHasNoKeypoints()
  {
    const auto data = syntheticOutput(8, 3, 0.24f, 320.f, 320.f);
    const auto pose = YOLO_pose{}.processOutput(data, 8, 640, 640);
    QVERIFY(pose.keypoints.empty());
    QCOMPARE(pose.confidence, 0.24f);
  }

  void aboveThresholdHasAllKeypoints()
  {
    const auto data = syntheticOutput(8, 5, 0.26f, 100.f, 50.f);
    const auto pose = YOLO_pose{}.processOutput(data, 8, 640, 640);
    QCOMPARE(pose.keypoints.size(), std::size_t(17));
    QCOMPARE(pose.keypoints[0].x, 100.f);
    QCOMPARE(pose.keypoints[0].y, 50.f);
  }

  void keypointsAreScaledToTheImage()
  {
    const auto data = syntheticOutput(4, 2, 0.8f, 320.f, 320.f);
    const auto pose = YOLO_pose{}.processOutput(data, 4, 1280, 960, 640, 640);
    QCOMPARE(pose.keypoints.size(), std::size_t(17));
    for (const auto& kp : pose.keypoints)
    {
      QCOMPARE(kp.x, 640.f);
      QCOMPARE(kp.y, 480.f);
    }
    QCOMPARE(pose.geometry.w, 200.f);
    QCOMPARE(pose.geometry.h, 300.f);
  }

  void pixelsAreLaidOutAsChannelPlanes()
  {
    QImage image(2, 1, QImage::Format_RGB32);
    image.setPixel(0, 0, qRgb(255, 0, 0));
    image.setPixel(1, 0, qRgb(0, 51, 255));

    boost::container::vector<float> planes;
    Onnx::planarStretched(image, 2, 1, planes);
    QCOMPARE(planes.size(), std::size_t(6));
    QCOMPARE(planes[0], 1.f);
    QCOMPARE(planes[1], 0.f);
    QCOMPARE(planes[2], 0.f);
    QCOMPARE(planes[3], 0.2f);
    QCOMPARE(planes[4], 0.f);
    QCOMPARE(planes[5], 1.f);

    Onnx::planarStretched(image, 2, 1, planes, {127.5f, 127.5f, 127.5f}, {127.5f, 127.5f, 127.5f});
    QCOMPARE(planes[0], 1.f);
    QCOMPARE(planes[1], -1.f);
  }

  void mismatchedOutputThrows()
  {
    std::vector<float> data(10);
    QVERIFY_THROWS_EXCEPTION(std::runtime_error, YOLO_pose{}.processOutput(data, 8, 640, 640));
  }

  void confidentKeypointsAreDrawnGreen()
  {
    QImage image(64, 48, QImage::Format_RGB32);
    image.fill(Qt::black);

    PoseDetection pose;
    pose.confidence = 0.9f;
    pose.keypoints = {{10.f, 10.f, 0.9f}, {40.f, 30.f, 0.4f}};

    const QImage out = renderPose(image, pose, 0.5f, 5.f);
    QCOMPARE(out.size(), image.size());
    QCOMPARE(QColor(out.pixel(10, 10)), QColor(0, 255, 0));
    QCOMPARE(QColor(out.pixel(40, 30)), QColor(Qt::black));
    QCOMPARE(QColor(out.pixel(60, 5)), QColor(Qt::black));
  }

  void undecodableFrameIsARequestError()
  {
    QVERIFY_THROWS_EXCEPTION(RequestError, decodeImage(QByteArray("not an image")));

    QImage image(4, 4, QImage::Format_RGB32);
    image.fill(Qt::white);
    QByteArray png;
    QBuffer buffer(&png);
    buffer.open(QIODevice::WriteOnly);
    QVERIFY(image.save(&buffer, "PNG"));
    QCOMPARE(decodeImage(png).size(), QSize(4, 4));
  }

  void missingModelFileFailsToLoad()
  {
    PoseSettings settings;
    settings.modelFile = "/nonexistent/yolov8n-pose.onnx";
    QVERIFY_THROWS_EXCEPTION(std::runtime_error, PoseEstimator{settings});
  }
};

QTEST_GUILESS_MAIN(PoseTest)
#include "tst_pose.moc"
