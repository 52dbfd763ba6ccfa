#include "Config.hpp"

#include <QCommandLineParser>
#include <QFileInfo>
#include <QSettings>

#include <Medgate/Errors.hpp>

#include <format>

namespace Medgate
{
namespace
{
struct Options
{
  QCommandLineOption config{
      QStringLiteral("config"),
      QStringLiteral("INI configuration file."),
      QStringLiteral("file")};
  QCommandLineOption host{
      QStringLiteral("host"),
      QStringLiteral("Address to listen on."),
      QStringLiteral("address")};
  QCommandLineOption port{
      QStringLiteral("port"),
      QStringLiteral("Port to listen on (3010)."),
      QStringLiteral("port")};
  QCommandLineOption publicHost{
      QStringLiteral("public-host"),
      QStringLiteral("Host name used in upload URLs (localhost)."),
      QStringLiteral("host")};
  QCommandLineOption modelDir{
      QStringLiteral("model-dir"),
      QStringLiteral("Gemma 3n ONNX export directory."),
      QStringLiteral("dir")};
  QCommandLineOption poseModel{
      QStringLiteral("pose-model"),
      QStringLiteral("YOLO pose ONNX file."),
      QStringLiteral("file")};
  QCommandLineOption uploadsDir{
      QStringLiteral("uploads-dir"),
      QStringLiteral("Directory for uploaded images."),
      QStringLiteral("dir")};
  QCommandLineOption provider{
      QStringLiteral("provider"),
      QStringLiteral("Execution provider: default, cpu, cuda, tensorrt, rocm, openvino."),
      QStringLiteral("name")};
  QCommandLineOption maxNewTokens{
      QStringLiteral("max-new-tokens"),
      QStringLiteral("Generation budget (32000)."),
      QStringLiteral("count")};
  QCommandLineOption queueWaiting{
      QStringLiteral("queue-waiting"),
      QStringLiteral("Requests allowed to wait for the model (4)."),
      QStringLiteral("count")};
  QCommandLineOption ioThreads{
      QStringLiteral("io-threads"),
      QStringLiteral("Network threads (2)."),
      QStringLiteral("count")};
  QCommandLineOption poseThreads{
      QStringLiteral("pose-threads"),
      QStringLiteral("Pose estimation worker threads (1)."),
      QStringLiteral("count")};
  QCommandLineOption tesseract{
      QStringLiteral("tesseract"),
      QStringLiteral("Path of the tesseract executable."),
      QStringLiteral("program")};
  QCommandLineOption verbose{
      QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
      QStringLiteral("Enable debug logging.")};

  void addTo(QCommandLineParser& parser) const
  {
    parser.setApplicationDescription(
        QStringLiteral("Local multimodal inference server."));
    parser.addHelpOption();
    parser.addOptions(
        {config,
         host,
         port,
         publicHost,
         modelDir,
         poseModel,
         uploadsDir,
         provider,
         maxNewTokens,
         queueWaiting,
         ioThreads,
         poseThreads,
         tesseract,
         verbose});
  }
};

int toInt(const QString& value, const char* what, int min, int max)
{
  bool ok = false;
  const int v = value.toInt(&ok);
  if (!ok || v < min || v > max)
    throw StartupError(std::format(
        "Invalid {}: '{}' (expected {}..{})", what, value.toStdString(), min, max));
  return v;
}

int intSetting(const QSettings& s, const char* key, int current, int min, int max)
{
  if (!s.contains(QLatin1String(key)))
    return current;
  return toInt(s.value(QLatin1String(key)).toString(), key, min, max);
}

QString stringSetting(const QSettings& s, const char* key, const QString& current)
{
  return s.value(QLatin1String(key), current).toString();
}
}

QString ServerConfig::publicBaseUrl() const
{
  return QStringLiteral("http://%1:%2").arg(publicHost).arg(port);
}

void ServerConfig::loadIni(const QString& path)
{
  if (!QFileInfo(path).isReadable())
    throw StartupError(
        std::format("Cannot read configuration file {}", path.toStdString()));

  QSettings s(path, QSettings::IniFormat);
  if (s.status() != QSettings::NoError)
    throw StartupError(
        std::format("Malformed configuration file {}", path.toStdString()));

  host = stringSetting(s, "server/host", host);
  port = quint16(intSetting(s, "server/port", port, 1, 65535));
  publicHost = stringSetting(s, "server/public_host", publicHost);
  ioThreads = intSetting(s, "server/io_threads", ioThreads, 1, 256);
  sendTimeoutSeconds = intSetting(s, "server/send_timeout", sendTimeoutSeconds, 1, 3600);
  if (s.contains(QStringLiteral("server/max_body_bytes")))
    maxBodyBytes = s.value(QStringLiteral("server/max_body_bytes")).toLongLong();

  visionDir = stringSetting(s, "models/vision_dir", visionDir);
  poseFile = stringSetting(s, "models/pose_file", poseFile);
  provider = stringSetting(s, "models/provider", provider);
  embedDtype = stringSetting(s, "models/embed_dtype", embedDtype);
  visionDtype = stringSetting(s, "models/vision_dtype", visionDtype);
  audioDtype = stringSetting(s, "models/audio_dtype", audioDtype);
  decoderDtype = stringSetting(s, "models/decoder_dtype", decoderDtype);

  maxNewTokens = intSetting(s, "generation/max_new_tokens", maxNewTokens, 1, 1 << 20);
  queueMaxWaiting = intSetting(s, "queue/max_waiting", queueMaxWaiting, 0, 1024);

  poseThreads = intSetting(s, "pose/threads", poseThreads, 1, 64);
  poseInputWidth = intSetting(s, "pose/input_width", poseInputWidth, 32, 4096);
  poseInputHeight = intSetting(s, "pose/input_height", poseInputHeight, 32, 4096);

  uploadsDir = stringSetting(s, "uploads/dir", uploadsDir);
  tesseract = stringSetting(s, "ocr/tesseract", tesseract);
  ocrLanguage = stringSetting(s, "ocr/language", ocrLanguage);
  logRules = stringSetting(s, "log/rules", logRules);
}

void ServerConfig::validate() const
{
  if (maxBodyBytes <= 0)
    throw StartupError("server/max_body_bytes must be positive");
  if (visionDir.isEmpty())
    throw StartupError("No vision-language model directory configured");
  if (poseFile.isEmpty())
    throw StartupError("No pose model configured");
  if (uploadsDir.isEmpty())
    throw StartupError("No uploads directory configured");
}

ServerConfig ServerConfig::fromArguments(const QStringList& arguments)
{
  QCommandLineParser parser;
  const Options opts;
  opts.addTo(parser);
  if (!parser.parse(arguments))
    throw StartupError(parser.errorText().toStdString());

  ServerConfig c;
  if (parser.isSet(opts.config))
    c.loadIni(parser.value(opts.config));

  if (parser.isSet(opts.host))
    c.host = parser.value(opts.host);
  if (parser.isSet(opts.port))
    c.port = quint16(toInt(parser.value(opts.port), "port", 1, 65535));
  if (parser.isSet(opts.publicHost))
    c.publicHost = parser.value(opts.publicHost);
  if (parser.isSet(opts.modelDir))
    c.visionDir = parser.value(opts.modelDir);
  if (parser.isSet(opts.poseModel))
    c.poseFile = parser.value(opts.poseModel);
  if (parser.isSet(opts.uploadsDir))
    c.uploadsDir = parser.value(opts.uploadsDir);
  if (parser.isSet(opts.provider))
    c.provider = parser.value(opts.provider);
  if (parser.isSet(opts.maxNewTokens))
    c.maxNewTokens = toInt(parser.value(opts.maxNewTokens), "max-new-tokens", 1, 1 << 20);
  if (parser.isSet(opts.queueWaiting))
    c.queueMaxWaiting = toInt(parser.value(opts.queueWaiting), "queue-waiting", 0, 1024);
  if (parser.isSet(opts.ioThreads))
    c.ioThreads = toInt(parser.value(opts.ioThreads), "io-threads", 1, 256);
  if (parser.isSet(opts.poseThreads))
    c.poseThreads = toInt(parser.value(opts.poseThreads), "pose-threads", 1, 64);
  if (parser.isSet(opts.tesseract))
    c.tesseract = parser.value(opts.tesseract);
  if (parser.isSet(opts.verbose))
    c.verbose = true;

  c.validate();
  return c;
}

QString helpText()
{
  QCommandLineParser parser;
  const Options opts;
  opts.addTo(parser);
  return parser.helpText();
}
}
