#pragma once
#include <QImage>
#include <QJsonObject>

#include <Medgate/Conversation.hpp>
#include <Medgate/GenerativeModel.hpp>
#include <Medgate/StreamEvent.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Medgate
{
enum class StreamState
{
  Idle,
  Streaming,
  Complete,
  Failed
};

const char* stateName(StreamState s) noexcept;

// Where a generation writes its events.
class EventSink
{
public:
  virtual ~EventSink() = default;

  // Flushes the response headers. Returns false if the client is gone.
  virtual bool open() = 0;
  // Returns false if the client is gone.
  virtual bool send(const StreamEvent& event) = 0;
  // Error response sent instead of a stream, before open().
  virtual void reject(int status, const QString& message) = 0;
  // Terminates the stream. Never throws.
  virtual void close() noexcept = 0;
};

struct GenerationJob
{
  std::vector<ConversationTurn> conversation;
  std::optional<QImage> image;
  std::vector<float> audio;

  // Sent right after the headers when set.
  std::optional<QJsonObject> metadata;
  // Merged into the complete event.
  QJsonObject completeFields;
  // Body of the 500 response when generation fails before streaming.
  QString failureMessage
      = QStringLiteral("An internal server error occurred during generation.");
};

// Runs one generation and streams it to a sink.
// Idle -> Streaming -> Complete, or Failed from either state.
class GenerationSession
{
public:
  GenerationSession(GenerativeModel& model, EventSink& sink, GenerationOptions options);

  StreamState run(const GenerationJob& job);

  StreamState state() const noexcept { return m_state; }
  bool disconnected() const noexcept { return m_disconnected; }
  const std::string& response() const noexcept { return m_response; }

private:
  bool start(const GenerationJob& job);
  bool forward(std::string_view fragment);
  void fail(const char* what);

  GenerativeModel& m_model;
  EventSink& m_sink;
  GenerationOptions m_options;

  StreamState m_state{StreamState::Idle};
  bool m_disconnected{};
  std::string m_response;
  QString m_failureMessage;
};
}
