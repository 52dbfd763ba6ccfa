#include "Logging.hpp"

#include <QDateTime>

#include <cstdio>

namespace Medgate
{
Q_LOGGING_CATEGORY(lcHost, "medgate.host")
Q_LOGGING_CATEGORY(lcConversation, "medgate.conversation")
Q_LOGGING_CATEGORY(lcGeneration, "medgate.generation")
Q_LOGGING_CATEGORY(lcPose, "medgate.pose")
Q_LOGGING_CATEGORY(lcHttp, "medgate.http")
Q_LOGGING_CATEGORY(lcWebSocket, "medgate.ws")
Q_LOGGING_CATEGORY(lcOcr, "medgate.ocr")
Q_LOGGING_CATEGORY(lcUploads, "medgate.uploads")
Q_LOGGING_CATEGORY(lcAudio, "medgate.audio")

static const char* levelName(QtMsgType type) noexcept
{
  switch (type)
  {
    case QtDebugMsg:
      return "debug";
    case QtInfoMsg:
      return "info";
    case QtWarningMsg:
      return "warning";
    case QtCriticalMsg:
      return "critical";
    case QtFatalMsg:
      return "fatal";
  }
  return "?";
}

static void messageHandler(
    QtMsgType type,
    const QMessageLogContext& context,
    const QString& msg)
{
  const QByteArray line
      = QStringLiteral("%1 %2 [%3] %4\n")
            .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs))
            .arg(QLatin1String(levelName(type)), -8)
            .arg(QLatin1String(context.category ? context.category : "default"))
            .arg(msg)
            .toLocal8Bit();
  std::fwrite(line.constData(), 1, line.size(), stderr);
  std::fflush(stderr);
}

void installLogging(const QString& rules, bool verbose)
{
  qInstallMessageHandler(messageHandler);

  QString filter = QStringLiteral("medgate.*.info=true\n");
  if (verbose)
    filter += QStringLiteral("medgate.*.debug=true\n");
  else
    filter += QStringLiteral("medgate.*.debug=false\n");

  QString user = rules;
  user.replace(QLatin1Char(';'), QLatin1Char('\n'));
  filter += user;
  QLoggingCategory::setFilterRules(filter);
}
}
