#pragma once
#include <QString>
#include <QStringList>

#include <cstdint>

namespace Medgate
{
struct ServerConfig
{
  QString host = QStringLiteral("0.0.0.0");
  quint16 port = 3010;
  QString publicHost = QStringLiteral("localhost");
  int ioThreads = 2;
  qint64 maxBodyBytes = 64 * 1024 * 1024;
  // A response write that makes no progress for this long drops the client.
  int sendTimeoutSeconds = 30;

  QString visionDir = QStringLiteral("models/gemma-3n-E2B-it-ONNX");
  QString poseFile = QStringLiteral("models/yolov8n-pose.onnx");
  QString provider = QStringLiteral("default");
  QString embedDtype = QStringLiteral("q8");
  QString visionDtype = QStringLiteral("fp16");
  QString audioDtype = QStringLiteral("q4");
  QString decoderDtype = QStringLiteral("q4");

  int maxNewTokens = 32000;
  int queueMaxWaiting = 4;

  int poseThreads = 1;
  int poseInputWidth = 640;
  int poseInputHeight = 640;

  QString uploadsDir = QStringLiteral("uploads");
  QString tesseract = QStringLiteral("tesseract");
  QString ocrLanguage = QStringLiteral("eng");

  QString logRules;
  bool verbose = false;

  QString publicBaseUrl() const;

  // Defaults, then the --config INI file, then command line options.
  // Throws StartupError on invalid arguments or values.
  static ServerConfig fromArguments(const QStringList& arguments);

  // Throws StartupError if the file is missing or malformed.
  void loadIni(const QString& path);
  void validate() const;
};

QString helpText();
}
