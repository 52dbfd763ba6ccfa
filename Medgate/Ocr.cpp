#include "Ocr.hpp"

#include <QProcess>

#include <boost/algorithm/string/trim.hpp>

#include <Medgate/Logging.hpp>

#include <format>
#include <stdexcept>

namespace Medgate
{
TesseractRecognizer::TesseractRecognizer(QString program, QString language, int timeoutMs)
    : m_program{std::move(program)}
    , m_language{std::move(language)}
    , m_timeoutMs{timeoutMs}
{
}

std::string TesseractRecognizer::recognize(const QByteArray& image)
{
  QProcess proc;
  proc.start(
      m_program,
      {QStringLiteral("stdin"),
       QStringLiteral("stdout"),
       QStringLiteral("-l"),
       m_language});
  if (!proc.waitForStarted(m_timeoutMs))
    throw std::runtime_error(std::format(
        "Could not start {}: {}",
        m_program.toStdString(),
        proc.errorString().toStdString()));

  proc.write(image);
  proc.closeWriteChannel();
  if (!proc.waitForFinished(m_timeoutMs))
  {
    proc.kill();
    proc.waitForFinished();
    throw std::runtime_error("Text recognition timed out");
  }

  if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0)
    throw std::runtime_error(std::format(
        "Text recognition failed: {}",
        QString::fromLocal8Bit(proc.readAllStandardError()).trimmed().toStdString()));

  std::string text = proc.readAllStandardOutput().toStdString();
  boost::algorithm::trim(text);
  qCInfo(lcOcr) << "Extracted" << text.size() << "characters";
  return text;
}

std::string mergeOcrPrompt(std::string_view extracted, std::string_view prompt)
{
  const std::string text = boost::algorithm::trim_copy(std::string(extracted));
  if (text.empty())
    return std::format(
        "I couldn't extract any text from the image. User request: {}", prompt);

  return std::format(
      "Here is the text I extracted from the image:\n\n\"{}\"\n\nUser request: {}",
      text,
      prompt);
}

std::vector<ConversationTurn>
ocrConversation(std::string_view extracted, std::string_view prompt)
{
  return {ConversationTurn{
      .role = Role::User, .text = mergeOcrPrompt(extracted, prompt)}};
}
}
