#pragma once
#include <QByteArray>
#include <QString>

#include <Medgate/Conversation.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace Medgate
{
class TextRecognizer
{
public:
  virtual ~TextRecognizer() = default;
  // Throws std::runtime_error when the engine fails.
  virtual std::string recognize(const QByteArray& image) = 0;
};

// Runs the tesseract CLI, image on stdin, text on stdout.
class TesseractRecognizer final : public TextRecognizer
{
public:
  TesseractRecognizer(QString program, QString language, int timeoutMs = 60000);

  std::string recognize(const QByteArray& image) override;

private:
  QString m_program;
  QString m_language;
  int m_timeoutMs{};
};

std::string mergeOcrPrompt(std::string_view extracted, std::string_view prompt);

// Always a single, non-empty user turn.
std::vector<ConversationTurn>
ocrConversation(std::string_view extracted, std::string_view prompt);
}
