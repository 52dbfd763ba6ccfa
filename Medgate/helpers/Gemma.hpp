#pragma once

#include <Medgate/GenerativeModel.hpp>
#include <Medgate/helpers/AudioFeatures.hpp>
#include <Medgate/helpers/ModelSpec.hpp>
#include <Medgate/helpers/OnnxContext.hpp>
#include <Medgate/helpers/Tokenizer.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace Medgate::Gemma
{
struct TokenIds
{
  static constexpr int64_t EOS = 1;
  static constexpr int64_t BOS = 2;
  static constexpr int64_t END_OF_TURN = 106;
  static constexpr int64_t BOI = 255999;
  static constexpr int64_t BOA = 256000;
  static constexpr int64_t EOI = 262144;
  static constexpr int64_t IMAGE_SOFT = 262145;
  static constexpr int64_t EOA = 262272;
  static constexpr int64_t AUDIO_SOFT = 262273;
};

// onnx-community export layout: <dir>/onnx/<module><suffix>.onnx
struct ModelFiles
{
  std::filesystem::path directory;
  std::string embed_dtype = "q8";
  std::string vision_dtype = "fp16";
  std::string audio_dtype = "q4";
  std::string decoder_dtype = "q4";

  // Throws std::invalid_argument for an unknown dtype.
  static std::string fileName(std::string_view module, std::string_view dtype);

  std::filesystem::path embedTokens() const;
  std::filesystem::path visionEncoder() const;
  std::filesystem::path audioEncoder() const;
  std::filesystem::path decoder() const;
  std::filesystem::path tokenizer() const { return directory / "tokenizer.json"; }
};

// Splits prompt on the attachment placeholders and expands each of them to
// <start> soft*N <end>. A single BOS is kept at the front.
std::vector<int64_t> expandPrompt(
    std::string_view prompt,
    int64_t imageTokens,
    int64_t audioTokens,
    const std::function<std::vector<int64_t>(std::string_view)>& encode);

class GemmaInference final : public GenerativeModel
{
public:
  static constexpr int samplingRate = 16000;

  GemmaInference(
      const ModelFiles& files,
      const Onnx::Options& options,
      const ProgressCallback& progress);
  ~GemmaInference() override;

  std::string
  applyChatTemplate(std::span<const ConversationTurn> turns) const override;

  ModelInputs prepareInputs(
      std::string_view prompt,
      const QImage* image,
      std::span<const float> audio) override;

  void generate(
      ModelInputs& inputs,
      const GenerationOptions& options,
      const TextCallback& onText) override;

private:
  std::vector<Ort::Value> runEmbedTokens(std::span<int64_t> tokenIds);
  std::vector<Ort::Value> emptyCache();

  Ort::Env env;
  Ort::SessionOptions sessionOptions;
  Ort::AllocatorWithDefaultOptions allocator;

  Ort::Session embedSession{nullptr};
  Ort::Session visionSession{nullptr};
  Ort::Session audioSession{nullptr};
  Ort::Session decoderSession{nullptr};
  Onnx::ModelSpec embedSpec, visionSpec, audioSpec, decoderSpec;

  std::unique_ptr<Onnx::Tokenizer> tokenizer;
  Audio::LogMelExtractor melExtractor;

  // past_key_values.* input index -> present.* output index
  std::vector<std::pair<std::size_t, std::size_t>> cacheLinks;
  std::size_t logitsIndex{};
};
}
