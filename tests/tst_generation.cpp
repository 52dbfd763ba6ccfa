#include <QTest>

#include <Medgate/Generation.hpp>
#include <Medgate/TextStreamer.hpp>
#include <Medgate/helpers/Gemma.hpp>

#include <stdexcept>

using namespace Medgate;

namespace
{
struct Counters
{
  int constructed{};
  int disposed{};
};

class CountingTensor final : public InputTensor
{
public:
  explicit CountingTensor(Counters& c)
      : m_counters{c}
  {
    m_counters.constructed++;
  }

  void dispose() override
  {
    if (!m_disposed)
    {
      m_disposed = true;
      m_counters.disposed++;
    }
  }

private:
  Counters& m_counters;
  bool m_disposed{};
};

class ScriptedModel final : public GenerativeModel
{
public:
  Counters counters;
  std::vector<std::string> fragments{"Hel", "lo"};
  bool failPrepare{};
  int failAfter{-1};
  int forwarded{};
  bool stoppedByReceiver{};
  std::string lastPrompt;

  std::string applyChatTemplate(std::span<const ConversationTurn> turns) const override
  {
    return turns.empty() ? std::string{} : turns.back().text;
  }

  ModelInputs prepareInputs(
      std::string_view prompt,
      const QImage* image,
      std::span<const float> audio) override
  {
    lastPrompt = prompt;
    ModelInputs inputs;
    inputs.add("input_ids", std::make_unique<CountingTensor>(counters));
    if (image)
      inputs.add("pixel_values", std::make_unique<CountingTensor>(counters));
    if (!audio.empty())
      inputs.add("input_features", std::make_unique<CountingTensor>(counters));
    if (failPrepare)
      throw std::runtime_error("tokenizer exploded");
    return inputs;
  }

  void generate(ModelInputs& inputs, const GenerationOptions&, const TextCallback& onText)
      override
  {
    QVERIFY(inputs.contains("input_ids"));
    for (const auto& f : fragments)
    {
      if (forwarded == failAfter)
        throw std::runtime_error("decoder failed");
      forwarded++;
      if (!onText(f))
      {
        stoppedByReceiver = true;
        return;
      }
    }
  }
};

class RecordingSink final : public EventSink
{
public:
  std::vector<StreamEvent> events;
  int opened{};
  int closed{};
  int rejectedStatus{};
  QString rejectedMessage;
  // Number of successful send() calls before the client "disconnects".
  int sendBudget{-1};

  bool open() override
  {
    opened++;
    return true;
  }

  bool send(const StreamEvent& event) override
  {
    if (sendBudget == 0)
      return false;
    if (sendBudget > 0)
      sendBudget--;
    events.push_back(event);
    return true;
  }

  void reject(int status, const QString& message) override
  {
    rejectedStatus = status;
    rejectedMessage = message;
  }

  void close() noexcept override { closed++; }
};

GenerationJob textJob(std::string text)
{
  GenerationJob job;
  job.conversation.push_back({.role = Role::User, .text = std::move(text)});
  return job;
}
}

class GenerationTest : public QObject
{
  Q_OBJECT

private slots:
  void streamsChunksThenComplete()
  {
    ScriptedModel model;
    RecordingSink sink;
    GenerationSession session{model, sink, {}};

    QCOMPARE(session.run(textJob("hi")), StreamState::Complete);
    QCOMPARE(sink.opened, 1);
    QCOMPARE(sink.closed, 1);
    QCOMPARE(sink.events.size(), std::size_t(3));
    QCOMPARE(sink.events[0].type, StreamEvent::Type::Chunk);
    QCOMPARE(sink.events[0].fields.value("data").toString(), QStringLiteral("Hel"));
    QCOMPARE(sink.events[1].fields.value("data").toString(), QStringLiteral("lo"));
    QCOMPARE(sink.events[2].type, StreamEvent::Type::Complete);
    QCOMPARE(sink.events[2].fields.value("fullResponse").toString(), QStringLiteral("Hello"));
    QCOMPARE(session.response(), std::string("Hello"));
    QCOMPARE(model.lastPrompt, std::string("hi"));
  }

  void metadataComesFirstWithImage()
  {
    ScriptedModel model;
    RecordingSink sink;
    GenerationSession session{model, sink, {}};

    auto job = textJob("what is this");
    job.image = QImage(8, 8, QImage::Format_RGB32);
    job.metadata = QJsonObject{{"imageUrl", "http://localhost:3010/uploads/1-a.png"}};
    job.completeFields = QJsonObject{{"imageUrl", "http://localhost:3010/uploads/1-a.png"}};

    QCOMPARE(session.run(job), StreamState::Complete);
    QCOMPARE(sink.events.size(), std::size_t(4));
    QCOMPARE(sink.events.front().type, StreamEvent::Type::Metadata);
    QCOMPARE(
        sink.events.front().toJson().value("type").toString(), QStringLiteral("metadata"));
    const auto complete = sink.events.back().toJson();
    QCOMPARE(complete.value("type").toString(), QStringLiteral("complete"));
    QCOMPARE(complete.value("fullResponse").toString(), QStringLiteral("Hello"));
    QCOMPARE(
        complete.value("imageUrl").toString(),
        QStringLiteral("http://localhost:3010/uploads/1-a.png"));
    QCOMPARE(model.counters.constructed, 2);
    QCOMPARE(model.counters.disposed, 2);
  }

  void tensorsReleasedOnSuccess()
  {
    ScriptedModel model;
    RecordingSink sink;
    GenerationSession session{model, sink, {}};

    auto job = textJob("listen");
    job.audio = {0.f, 0.1f, 0.2f};
    session.run(job);
    QCOMPARE(model.counters.constructed, 2);
    QCOMPARE(model.counters.disposed, model.counters.constructed);
  }

  void tensorsReleasedWhenPrepareThrows()
  {
    ScriptedModel model;
    model.failPrepare = true;
    RecordingSink sink;
    GenerationSession session{model, sink, {}};

    QCOMPARE(session.run(textJob("x")), StreamState::Failed);
    QCOMPARE(model.counters.constructed, 1);
    QCOMPARE(model.counters.disposed, 1);
  }

  void errorBeforeStreamIsA500()
  {
    ScriptedModel model;
    model.failPrepare = true;
    RecordingSink sink;
    GenerationSession session{model, sink, {}};

    auto job = textJob("x");
    job.failureMessage = QStringLiteral("An internal server error occurred during OCR processing.");
    session.run(job);
    QCOMPARE(sink.opened, 0);
    QCOMPARE(sink.closed, 0);
    QVERIFY(sink.events.empty());
    QCOMPARE(sink.rejectedStatus, 500);
    QCOMPARE(sink.rejectedMessage, job.failureMessage);
  }

  void errorMidStreamIsAnEvent()
  {
    ScriptedModel model;
    model.failAfter = 1;
    RecordingSink sink;
    GenerationSession session{model, sink, {}};

    QCOMPARE(session.run(textJob("x")), StreamState::Failed);
    QCOMPARE(sink.rejectedStatus, 0);
    QCOMPARE(sink.events.size(), std::size_t(2));
    QCOMPARE(sink.events[0].type, StreamEvent::Type::Chunk);
    QCOMPARE(sink.events[1].type, StreamEvent::Type::Error);
    QCOMPARE(sink.events[1].fields.value("error").toString(), QStringLiteral("decoder failed"));
    QCOMPARE(sink.closed, 1);
    QCOMPARE(model.counters.disposed, model.counters.constructed);
  }

  void disconnectStopsDecoding()
  {
    ScriptedModel model;
    model.fragments = {"a", "b", "c", "d"};
    RecordingSink sink;
    sink.sendBudget = 1;
    GenerationSession session{model, sink, {}};

    QCOMPARE(session.run(textJob("x")), StreamState::Failed);
    QVERIFY(session.disconnected());
    QVERIFY(model.stoppedByReceiver);
    QCOMPARE(model.forwarded, 2);
    QCOMPARE(sink.events.size(), std::size_t(1));
    QCOMPARE(sink.closed, 0);
    QCOMPARE(model.counters.disposed, model.counters.constructed);
  }

  void disposalFailureIsContained()
  {
    struct Throwing final : InputTensor
    {
      void dispose() override { throw std::runtime_error("double free"); }
    };

    Counters counters;
    ModelInputs inputs;
    inputs.add("bad", std::make_unique<Throwing>());
    inputs.add("good", std::make_unique<CountingTensor>(counters));
    QCOMPARE(inputs.release(), std::size_t(1));
    QCOMPARE(counters.disposed, 1);
    QVERIFY(inputs.empty());
  }

  void streamerFlushesOnWordBoundaries()
  {
    const std::vector<std::string> pieces{"Hello", " wor", "ld", "!\n", "Bye"};
    std::vector<std::string> out;
    TextStreamer streamer{
        [&](std::span<const int64_t> ids) {
          std::string s;
          for (auto id : ids)
            s += pieces[std::size_t(id)];
          return s;
        },
        [&](std::string_view t) {
          out.emplace_back(t);
          return true;
        }};

    for (int64_t i = 0; i < int64_t(pieces.size()); i++)
      QVERIFY(streamer.put(i));
    QVERIFY(streamer.end());

    const std::vector<std::string> expected{"Hello ", "world!\n", "Bye"};
    QCOMPARE(out, expected);
  }

  void streamerFlushesAfterEachIdeograph()
  {
    // Two ideographs, then two more split inside the last one.
    const std::vector<std::string> pieces{
        "\xE4\xBD\xA0", "\xE5\xA5\xBD", "\xE4\xB8\x96\xE7\x95", "\x8C", " ok"};
    std::vector<std::string> out;
    TextStreamer streamer{
        [&](std::span<const int64_t> ids) {
          std::string s;
          for (auto id : ids)
            s += pieces[std::size_t(id)];
          return s;
        },
        [&](std::string_view t) {
          out.emplace_back(t);
          return true;
        }};

    for (int64_t i = 0; i < int64_t(pieces.size()); i++)
      QVERIFY(streamer.put(i));
    QVERIFY(streamer.end());

    const std::vector<std::string> expected{
        "\xE4\xBD\xA0", "\xE5\xA5\xBD", "\xE4\xB8\x96\xE7\x95\x8C", " ", "ok"};
    QCOMPARE(out, expected);

    QCOMPARE(lastCodePoint("a\xE4\xBD\xA0"), char32_t(0x4F60));
    QCOMPARE(lastCodePoint("\xE4\xBD"), char32_t(0));
    QVERIFY(isCjkIdeograph(0x4F60));
    QVERIFY(!isCjkIdeograph(U'a'));
    QVERIFY(!isCjkIdeograph(0x3042));
  }

  void streamerHoldsBackPartialUtf8()
  {
    QCOMPARE(completeUtf8Prefix("abc"), std::size_t(3));
    QCOMPARE(completeUtf8Prefix("ab\xC3"), std::size_t(2));
    QCOMPARE(completeUtf8Prefix("ab\xC3\xA9"), std::size_t(4));
    QCOMPARE(completeUtf8Prefix("\xE2\x82"), std::size_t(0));
  }

  void promptExpansionKeepsASingleBos()
  {
    auto encode = [](std::string_view text) {
      std::vector<int64_t> ids{Gemma::TokenIds::BOS};
      for (std::size_t i = 0; i < text.size(); i++)
        ids.push_back(1000 + int64_t(i));
      return ids;
    };

    const auto ids
        = Gemma::expandPrompt("ab<image_soft_token>c<audio_soft_token>", 3, 2, encode);
    const std::vector<int64_t> expected{
        Gemma::TokenIds::BOS,
        1000,
        1001,
        Gemma::TokenIds::BOI,
        Gemma::TokenIds::IMAGE_SOFT,
        Gemma::TokenIds::IMAGE_SOFT,
        Gemma::TokenIds::IMAGE_SOFT,
        Gemma::TokenIds::EOI,
        1000,
        Gemma::TokenIds::BOA,
        Gemma::TokenIds::AUDIO_SOFT,
        Gemma::TokenIds::AUDIO_SOFT,
        Gemma::TokenIds::EOA};
    QCOMPARE(ids, expected);
  }

  void modelFilesFollowTheExportLayout()
  {
    Gemma::ModelFiles files;
    files.directory = "/models/gemma";
    auto str = [](const std::filesystem::path& p) { return QString::fromStdString(p.string()); };
    QCOMPARE(str(files.embedTokens()), QStringLiteral("/models/gemma/onnx/embed_tokens_quantized.onnx"));
    QCOMPARE(str(files.visionEncoder()), QStringLiteral("/models/gemma/onnx/vision_encoder_fp16.onnx"));
    QCOMPARE(str(files.decoder()), QStringLiteral("/models/gemma/onnx/decoder_model_merged_q4.onnx"));
    QCOMPARE(
        QString::fromStdString(Gemma::ModelFiles::fileName("audio_encoder", "fp32")),
        QStringLiteral("audio_encoder.onnx"));
    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, Gemma::ModelFiles::fileName("decoder", "q3"));
  }
};

QTEST_GUILESS_MAIN(GenerationTest)
#include "tst_generation.moc"
