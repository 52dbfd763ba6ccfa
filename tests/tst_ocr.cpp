#include <QTest>

#include <Medgate/ChatTemplate.hpp>
#include <Medgate/Conversation.hpp>
#include <Medgate/Ocr.hpp>

using namespace Medgate;

class OcrTest : public QObject
{
  Q_OBJECT

private slots:
  void extractedTextIsQuoted()
  {
    QCOMPARE(
        QString::fromStdString(mergeOcrPrompt("  Take 2 pills daily \n", "Summarize")),
        QStringLiteral("Here is the text I extracted from the image:\n\n"
                       "\"Take 2 pills daily\"\n\nUser request: Summarize"));
  }

  void emptyTextStillYieldsOneUserTurn()
  {
    const auto turns = ocrConversation(" \n\t", "What does it say?");
    QCOMPARE(turns.size(), std::size_t(1));
    QCOMPARE(turns[0].role, Role::User);
    QCOMPARE(
        QString::fromStdString(turns[0].text),
        QStringLiteral(
            "I couldn't extract any text from the image. User request: What does it say?"));
    QVERIFY(!turns[0].hasImage);
    QVERIFY(isAlternating(turns));

    const auto prompt = Gemma::renderPrompt(turns);
    QVERIFY(prompt.starts_with("<start_of_turn>user\nI couldn't extract"));
  }

  void missingEngineIsReported()
  {
    TesseractRecognizer ocr{QStringLiteral("/nonexistent/tesseract"), QStringLiteral("eng"), 2000};
    QVERIFY_THROWS_EXCEPTION(std::runtime_error, ocr.recognize(QByteArray("\x89PNG")));
  }
};

QTEST_GUILESS_MAIN(OcrTest)
#include "tst_ocr.moc"
