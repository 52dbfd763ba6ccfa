#pragma once
#include <QImage>

#include <Medgate/Conversation.hpp>
#include <Medgate/Tensor.hpp>

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace Medgate
{
struct LoadProgress
{
  std::string phase;
  std::uintmax_t bytesLoaded{};
  std::uintmax_t bytesTotal{};
};
using ProgressCallback = std::function<void(const LoadProgress&)>;

struct GenerationOptions
{
  int maxNewTokens = 32000;
};

// Receives each printable fragment. Returning false stops the decoding loop.
using TextCallback = std::function<bool(std::string_view)>;

class GenerativeModel
{
public:
  virtual ~GenerativeModel() = default;

  virtual std::string
  applyChatTemplate(std::span<const ConversationTurn> turns) const = 0;

  // Every tensor built here is owned by the returned guard.
  virtual ModelInputs prepareInputs(
      std::string_view prompt,
      const QImage* image,
      std::span<const float> audio)
      = 0;

  // Greedy decoding.
  virtual void generate(
      ModelInputs& inputs,
      const GenerationOptions& options,
      const TextCallback& onText)
      = 0;
};
}
