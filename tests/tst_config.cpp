#include <QFile>
#include <QTemporaryDir>
#include <QTest>

#include <Medgate/Config.hpp>
#include <Medgate/Errors.hpp>

using namespace Medgate;

class ConfigTest : public QObject
{
  Q_OBJECT

private:
  static QStringList args(QStringList rest)
  {
    rest.prepend(QStringLiteral("medgate-server"));
    return rest;
  }

private slots:
  void defaults()
  {
    const auto c = ServerConfig::fromArguments(args({}));
    QCOMPARE(c.port, quint16(3010));
    QCOMPARE(c.publicHost, QStringLiteral("localhost"));
    QCOMPARE(c.maxNewTokens, 32000);
    QCOMPARE(c.sendTimeoutSeconds, 30);
    QCOMPARE(c.embedDtype, QStringLiteral("q8"));
    QCOMPARE(c.visionDtype, QStringLiteral("fp16"));
    QCOMPARE(c.audioDtype, QStringLiteral("q4"));
    QCOMPARE(c.publicBaseUrl(), QStringLiteral("http://localhost:3010"));
    QVERIFY(!c.verbose);
  }

  void commandLineOverrides()
  {
    const auto c = ServerConfig::fromArguments(args(
        {QStringLiteral("--port"),
         QStringLiteral("8080"),
         QStringLiteral("--public-host"),
         QStringLiteral("clinic.lan"),
         QStringLiteral("--queue-waiting"),
         QStringLiteral("0"),
         QStringLiteral("--model-dir"),
         QStringLiteral("/models/gemma"),
         QStringLiteral("-v")}));
    QCOMPARE(c.port, quint16(8080));
    QCOMPARE(c.queueMaxWaiting, 0);
    QCOMPARE(c.visionDir, QStringLiteral("/models/gemma"));
    QCOMPARE(c.publicBaseUrl(), QStringLiteral("http://clinic.lan:8080"));
    QVERIFY(c.verbose);
  }

  void iniThenCommandLine()
  {
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("medgate.ini"));
    {
      QFile f(path);
      QVERIFY(f.open(QIODevice::WriteOnly));
      f.write(
          "[server]\n"
          "port=4000\n"
          "io_threads=3\n"
          "send_timeout=5\n"
          "[models]\n"
          "decoder_dtype=fp16\n"
          "pose_file=/models/pose.onnx\n"
          "[generation]\n"
          "max_new_tokens=256\n"
          "[log]\n"
          "rules=medgate.http.debug=true\n");
    }

    const auto c = ServerConfig::fromArguments(args(
        {QStringLiteral("--config"), path, QStringLiteral("--port"), QStringLiteral("5000")}));
    QCOMPARE(c.port, quint16(5000));
    QCOMPARE(c.ioThreads, 3);
    QCOMPARE(c.sendTimeoutSeconds, 5);
    QCOMPARE(c.decoderDtype, QStringLiteral("fp16"));
    QCOMPARE(c.poseFile, QStringLiteral("/models/pose.onnx"));
    QCOMPARE(c.maxNewTokens, 256);
    QCOMPARE(c.logRules, QStringLiteral("medgate.http.debug=true"));
  }

  void invalidValuesAreStartupErrors()
  {
    QVERIFY_THROWS_EXCEPTION(
        StartupError,
        ServerConfig::fromArguments(args({QStringLiteral("--port"), QStringLiteral("0")})));
    QVERIFY_THROWS_EXCEPTION(
        StartupError,
        ServerConfig::fromArguments(
            args({QStringLiteral("--max-new-tokens"), QStringLiteral("many")})));
    QVERIFY_THROWS_EXCEPTION(
        StartupError, ServerConfig::fromArguments(args({QStringLiteral("--bogus")})));
    QVERIFY_THROWS_EXCEPTION(
        StartupError,
        ServerConfig::fromArguments(
            args({QStringLiteral("--config"), QStringLiteral("/nonexistent/medgate.ini")})));
  }
};

QTEST_GUILESS_MAIN(ConfigTest)
#include "tst_config.moc"
