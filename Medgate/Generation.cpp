#include "Generation.hpp"

#include <Medgate/Logging.hpp>

#include <exception>

namespace Medgate
{
const char* stateName(StreamState s) noexcept
{
  switch (s)
  {
    case StreamState::Idle:
      return "idle";
    case StreamState::Streaming:
      return "streaming";
    case StreamState::Complete:
      return "complete";
    case StreamState::Failed:
      return "failed";
  }
  return "?";
}

GenerationSession::GenerationSession(
    GenerativeModel& model,
    EventSink& sink,
    GenerationOptions options)
    : m_model{model}
    , m_sink{sink}
    , m_options{options}
{
}

StreamState GenerationSession::run(const GenerationJob& job)
{
  m_state = StreamState::Idle;
  m_disconnected = false;
  m_response.clear();
  m_failureMessage = job.failureMessage;

  try
  {
    const std::string prompt = m_model.applyChatTemplate(job.conversation);
    qCDebug(lcGeneration).noquote()
        << "Prompt:" << QString::fromStdString(prompt.substr(0, 500));

    ModelInputs inputs = m_model.prepareInputs(
        prompt, job.image ? &*job.image : nullptr, job.audio);

    if (start(job))
    {
      m_model.generate(
          inputs,
          m_options,
          [this](std::string_view fragment) { return forward(fragment); });

      if (m_state == StreamState::Streaming)
      {
        if (m_sink.send(StreamEvent::complete(
                job.completeFields, QString::fromStdString(m_response))))
          m_state = StreamState::Complete;
        else
        {
          m_disconnected = true;
          m_state = StreamState::Failed;
        }
      }
    }
  }
  catch (const std::exception& e)
  {
    fail(e.what());
  }

  if (m_disconnected)
    qCInfo(lcGeneration) << "Client disconnected, generation stopped after"
                         << m_response.size() << "bytes";
  if (!m_response.empty())
    qCInfo(lcGeneration).noquote()
        << "Full response:\n" << QString::fromStdString(m_response);

  if (m_state != StreamState::Idle && !m_disconnected)
    m_sink.close();

  qCDebug(lcGeneration) << "Generation finished:" << stateName(m_state);
  return m_state;
}

bool GenerationSession::start(const GenerationJob& job)
{
  if (!m_sink.open())
  {
    m_disconnected = true;
    m_state = StreamState::Failed;
    return false;
  }
  m_state = StreamState::Streaming;

  if (job.metadata && !m_sink.send(StreamEvent::metadata(*job.metadata)))
  {
    m_disconnected = true;
    m_state = StreamState::Failed;
    return false;
  }
  return true;
}

bool GenerationSession::forward(std::string_view fragment)
{
  if (m_state != StreamState::Streaming)
    return false;

  m_response.append(fragment);
  if (!m_sink.send(StreamEvent::chunk(
          QString::fromUtf8(fragment.data(), qsizetype(fragment.size())))))
  {
    m_disconnected = true;
    m_state = StreamState::Failed;
    return false;
  }
  return true;
}

void GenerationSession::fail(const char* what)
{
  qCWarning(lcGeneration) << "Generation failed in state"
                          << stateName(m_state) << ":" << what;
  switch (m_state)
  {
    case StreamState::Idle:
      m_state = StreamState::Failed;
      m_sink.reject(500, m_failureMessage);
      break;
    case StreamState::Streaming:
      m_state = StreamState::Failed;
      if (!m_sink.send(StreamEvent::error(QString::fromUtf8(what))))
        m_disconnected = true;
      break;
    case StreamState::Complete:
    case StreamState::Failed:
      break;
  }
}
}
