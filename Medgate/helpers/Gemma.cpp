#include "Gemma.hpp"

#include <QElapsedTimer>

#include <Medgate/ChatTemplate.hpp>
#include <Medgate/Logging.hpp>
#include <Medgate/TextStreamer.hpp>
#include <Medgate/helpers/Images.hpp>
#include <Medgate/helpers/OrtTensor.hpp>
#include <Medgate/helpers/Utilities.hpp>

#include <algorithm>
#include <format>
#include <numeric>
#include <stdexcept>

namespace Medgate::Gemma
{
namespace
{
constexpr int DEFAULT_IMAGE_SIZE = 768;

std::uintmax_t modelBytes(const std::filesystem::path& path)
{
  std::error_code ec;
  std::uintmax_t bytes = std::filesystem::file_size(path, ec);
  if (ec)
    bytes = 0;

  // Large exports keep their weights next to the graph.
  auto external = path;
  external += "_data";
  const auto extra = std::filesystem::file_size(external, ec);
  if (!ec)
    bytes += extra;
  return bytes;
}

int64_t featureRows(const Ort::Value& v)
{
  const auto shape = v.GetTensorTypeAndShapeInfo().GetShape();
  return shape.size() >= 2 ? shape[shape.size() - 2] : 0;
}

Ort::Value addFloatTensor(
    ModelInputs& inputs,
    std::string name,
    std::span<const float> values,
    std::vector<int64_t> shape,
    ONNXTensorElementDataType type)
{
  if (type == ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16)
  {
    boost::container::vector<Ort::Float16_t> half(
        values.size(), boost::container::default_init);
    for (std::size_t i = 0; i < values.size(); i++)
      half[i] = Ort::Float16_t(values[i]);
    auto t = std::make_unique<Onnx::OwnedTensor<Ort::Float16_t>>(
        std::move(half), std::move(shape));
    auto view = t->view();
    inputs.add(std::move(name), std::move(t));
    return view;
  }

  auto t = std::make_unique<Onnx::OwnedTensor<float>>(
      boost::container::vector<float>(values.begin(), values.end()),
      std::move(shape));
  auto view = t->view();
  inputs.add(std::move(name), std::move(t));
  return view;
}

// Overwrites the embedding rows of the soft tokens with the encoder rows.
void mergeFeatures(
    Ort::Value& embeds,
    std::span<const int64_t> ids,
    int64_t softToken,
    const Ort::Value& features)
{
  auto info = embeds.GetTensorTypeAndShapeInfo();
  const int64_t hidden = info.GetShape().back();
  std::vector<float> rows;
  Onnx::readAsFloat(features, rows);
  if (hidden <= 0 || rows.size() % hidden != 0)
    throw std::runtime_error(std::format(
        "Encoder features do not match the embedding width {}", hidden));

  const std::size_t count = rows.size() / hidden;
  std::size_t r = 0;
  for (std::size_t pos = 0; pos < ids.size() && r < count; pos++)
  {
    if (ids[pos] != softToken)
      continue;

    const float* src = rows.data() + r * hidden;
    switch (info.GetElementType())
    {
      case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
        std::copy_n(
            src, hidden, embeds.GetTensorMutableData<float>() + pos * hidden);
        break;
      case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
      {
        auto* dst = embeds.GetTensorMutableData<Ort::Float16_t>() + pos * hidden;
        for (int64_t i = 0; i < hidden; i++)
          dst[i] = Ort::Float16_t(src[i]);
        break;
      }
      default:
        throw std::runtime_error("Unsupported embedding element type");
    }
    r++;
  }

  if (r != count)
    qCWarning(lcGeneration) << "Merged" << r << "of" << count
                            << "encoder rows";
}

int64_t argmaxLastRow(const Ort::Value& logits)
{
  auto info = logits.GetTensorTypeAndShapeInfo();
  const int64_t vocab = info.GetShape().back();
  const std::size_t offset = info.GetElementCount() - vocab;

  int64_t best = 0;
  switch (info.GetElementType())
  {
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
    {
      const float* row = logits.GetTensorData<float>() + offset;
      best = std::max_element(row, row + vocab) - row;
      break;
    }
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
    {
      const Ort::Float16_t* row = logits.GetTensorData<Ort::Float16_t>() + offset;
      float max = row[0].ToFloat();
      for (int64_t i = 1; i < vocab; i++)
      {
        const float v = row[i].ToFloat();
        if (v > max)
        {
          max = v;
          best = i;
        }
      }
      break;
    }
    default:
      throw std::runtime_error("Unsupported logits element type");
  }
  return best;
}
}

std::string ModelFiles::fileName(std::string_view module, std::string_view dtype)
{
  static constexpr std::pair<std::string_view, std::string_view> suffixes[]
      = {{"fp32", ""},
         {"", ""},
         {"fp16", "_fp16"},
         {"q8", "_quantized"},
         {"quantized", "_quantized"},
         {"int8", "_int8"},
         {"uint8", "_uint8"},
         {"q4", "_q4"},
         {"q4f16", "_q4f16"},
         {"bnb4", "_bnb4"}};

  for (auto [name, suffix] : suffixes)
    if (name == dtype)
      return std::format("{}{}.onnx", module, suffix);

  throw std::invalid_argument(std::format("Unknown model dtype '{}'", dtype));
}

std::filesystem::path ModelFiles::embedTokens() const
{
  return directory / "onnx" / fileName("embed_tokens", embed_dtype);
}

std::filesystem::path ModelFiles::visionEncoder() const
{
  return directory / "onnx" / fileName("vision_encoder", vision_dtype);
}

std::filesystem::path ModelFiles::audioEncoder() const
{
  return directory / "onnx" / fileName("audio_encoder", audio_dtype);
}

std::filesystem::path ModelFiles::decoder() const
{
  return directory / "onnx" / fileName("decoder_model_merged", decoder_dtype);
}

std::vector<int64_t> expandPrompt(
    std::string_view prompt,
    int64_t imageTokens,
    int64_t audioTokens,
    const std::function<std::vector<int64_t>(std::string_view)>& encode)
{
  std::vector<int64_t> out{TokenIds::BOS};
  auto appendText = [&](std::string_view text)
  {
    if (text.empty())
      return;
    const auto ids = encode(text);
    auto it = ids.begin();
    while (it != ids.end() && *it == TokenIds::BOS)
      ++it;
    out.insert(out.end(), it, ids.end());
  };

  std::size_t pos = 0;
  while (pos <= prompt.size())
  {
    const auto img = prompt.find(imagePlaceholder, pos);
    const auto aud = prompt.find(audioPlaceholder, pos);
    const auto next = std::min(img, aud);
    if (next == std::string_view::npos)
    {
      appendText(prompt.substr(pos));
      break;
    }

    appendText(prompt.substr(pos, next - pos));
    if (next == img)
    {
      out.push_back(TokenIds::BOI);
      out.insert(out.end(), imageTokens, TokenIds::IMAGE_SOFT);
      out.push_back(TokenIds::EOI);
      pos = next + imagePlaceholder.size();
    }
    else
    {
      out.push_back(TokenIds::BOA);
      out.insert(out.end(), audioTokens, TokenIds::AUDIO_SOFT);
      out.push_back(TokenIds::EOA);
      pos = next + audioPlaceholder.size();
    }
  }
  return out;
}

GemmaInference::GemmaInference(
    const ModelFiles& files,
    const Onnx::Options& options,
    const ProgressCallback& progress)
    : env(ORT_LOGGING_LEVEL_WARNING, "medgate")
    , sessionOptions(Onnx::create_session_options(options))
{
  const std::filesystem::path paths[]
      = {files.embedTokens(),
         files.visionEncoder(),
         files.audioEncoder(),
         files.decoder()};

  std::uintmax_t total = 0;
  for (const auto& path : paths)
  {
    if (!std::filesystem::exists(path))
      throw std::runtime_error(
          std::format("Model file not found: {}", path.string()));
    total += modelBytes(path);
  }

  std::uintmax_t loaded = 0;
  auto load = [&](Ort::Session& session,
                  Onnx::ModelSpec& spec,
                  const std::filesystem::path& path)
  {
    if (progress)
      progress({path.filename().string(), loaded, total});
    session = Ort::Session(env, path.c_str(), sessionOptions);
    spec = Onnx::readModelSpec(session);
    loaded += modelBytes(path);
    qCDebug(lcHost) << path.filename().c_str() << spec;
  };

  try
  {
    load(embedSession, embedSpec, paths[0]);
    load(visionSession, visionSpec, paths[1]);
    load(audioSession, audioSpec, paths[2]);
    load(decoderSession, decoderSpec, paths[3]);
  }
  catch (const Ort::Exception& e)
  {
    throw std::runtime_error(
        std::format("Failed to load ONNX models: {}", e.what()));
  }

  if (progress)
    progress({"tokenizer", loaded, total});
  tokenizer = std::make_unique<Onnx::Tokenizer>(files.directory);

  static constexpr std::string_view pastPrefix = "past_key_values";
  const auto& outs = decoderSpec.output_names;
  for (std::size_t i = 0; i < decoderSpec.input_names.size(); i++)
  {
    const auto& name = decoderSpec.input_names[i];
    if (!name.starts_with(pastPrefix))
      continue;

    const std::string present = "present" + name.substr(pastPrefix.size());
    const auto it = std::ranges::find(outs, present);
    if (it == outs.end())
      throw std::runtime_error(
          std::format("Decoder has no output matching {}", name));
    cacheLinks.emplace_back(i, std::size_t(it - outs.begin()));
  }

  const auto logits = std::ranges::find(outs, "logits");
  if (logits == outs.end())
    throw std::runtime_error("Decoder has no logits output");
  logitsIndex = logits - outs.begin();

  qCInfo(lcHost) << "Gemma model loaded from"
                 << files.directory.string().c_str() << "with"
                 << cacheLinks.size() << "cache tensors";
  if (progress)
    progress({"ready", total, total});
}

GemmaInference::~GemmaInference() = default;

std::string
GemmaInference::applyChatTemplate(std::span<const ConversationTurn> turns) const
{
  return renderPrompt(turns);
}

ModelInputs GemmaInference::prepareInputs(
    std::string_view prompt,
    const QImage* image,
    std::span<const float> audio)
{
  ModelInputs inputs;
  int64_t imageTokens = 0;
  int64_t audioTokens = 0;

  try
  {
    if (image && !image->isNull())
    {
      const auto& port = visionSpec.inputs.front();
      const auto& shape = port.shape;
      const int h = shape.size() == 4 && shape[2] > 0 ? int(shape[2]) : DEFAULT_IMAGE_SIZE;
      const int w = shape.size() == 4 && shape[3] > 0 ? int(shape[3]) : DEFAULT_IMAGE_SIZE;

      boost::container::vector<float> pixels;
      Onnx::planarStretched(*image, w, h, pixels);
      Ort::Value feed = addFloatTensor(
          inputs,
          "pixel_values",
          {pixels.data(), pixels.size()},
          {1, 3, h, w},
          port.element_type);

      auto out = visionSession.Run(
          Ort::RunOptions{nullptr},
          visionSpec.input_names_char.data(),
          &feed,
          1,
          visionSpec.output_names_char.data(),
          1);
      imageTokens = featureRows(out[0]);
      inputs.add(
          "image_features",
          std::make_unique<Onnx::ResultTensor>(std::move(out[0])));
    }

    if (!audio.empty())
    {
      const auto mel = melExtractor(audio);
      const auto frames = int64_t(mel.frames);

      std::vector<Ort::Value> feeds;
      for (std::size_t i = 0; i < audioSpec.input_names.size(); i++)
      {
        if (audioSpec.input_names[i] == "input_features_mask")
        {
          auto mask = std::make_unique<Onnx::OwnedTensor<bool>>(
              boost::container::vector<bool>(mel.frames, true),
              std::vector<int64_t>{1, frames});
          feeds.push_back(mask->view());
          inputs.add("input_features_mask", std::move(mask));
        }
        else
        {
          feeds.push_back(addFloatTensor(
              inputs,
              "input_features",
              mel.values,
              {1, frames, melExtractor.mel_bins},
              audioSpec.inputs[i].element_type));
        }
      }

      auto out = audioSession.Run(
          Ort::RunOptions{nullptr},
          audioSpec.input_names_char.data(),
          feeds.data(),
          feeds.size(),
          audioSpec.output_names_char.data(),
          1);
      audioTokens = featureRows(out[0]);
      inputs.add(
          "audio_features",
          std::make_unique<Onnx::ResultTensor>(std::move(out[0])));
    }

    const auto ids = expandPrompt(
        prompt,
        imageTokens,
        audioTokens,
        [this](std::string_view text) { return tokenizer->encode(text); });
    const auto length = int64_t(ids.size());
    inputs.add(
        "input_ids",
        std::make_unique<Onnx::OwnedTensor<int64_t>>(
            boost::container::vector<int64_t>(ids.begin(), ids.end()),
            std::vector<int64_t>{1, length}));

    qCInfo(lcGeneration) << "Prompt:" << length << "tokens," << imageTokens
                         << "image tokens," << audioTokens << "audio tokens";
  }
  catch (const Ort::Exception& e)
  {
    throw std::runtime_error(
        std::format("Failed to prepare model inputs: {}", e.what()));
  }
  return inputs;
}

std::vector<Ort::Value>
GemmaInference::runEmbedTokens(std::span<int64_t> tokenIds)
{
  const std::vector<int64_t> shape{1, static_cast<int64_t>(tokenIds.size())};
  auto input = Onnx::tensorView<int64_t>(tokenIds, shape);
  return embedSession.Run(
      Ort::RunOptions{nullptr},
      embedSpec.input_names_char.data(),
      &input,
      1,
      embedSpec.output_names_char.data(),
      embedSpec.output_names_char.size());
}

std::vector<Ort::Value> GemmaInference::emptyCache()
{
  std::vector<Ort::Value> cache;
  cache.reserve(cacheLinks.size());
  for (auto [input, output] : cacheLinks)
  {
    const auto& port = decoderSpec.inputs[input];
    auto shape = port.shape;
    // [batch, heads, past_sequence, head_dim]: batch of one, nothing cached yet
    for (std::size_t d = 0; d < shape.size(); d++)
      if (shape[d] < 0)
        shape[d] = d == 0 ? 1 : 0;
    cache.push_back(Ort::Value::CreateTensor(
        allocator, shape.data(), shape.size(), port.element_type));
  }
  return cache;
}

void GemmaInference::generate(
    ModelInputs& inputs,
    const GenerationOptions& options,
    const TextCallback& onText)
{
  auto* ids = inputs.get<Onnx::OwnedTensor<int64_t>>("input_ids");
  if (!ids || ids->storage.empty())
    throw std::runtime_error("Missing input_ids");
  std::span<int64_t> promptIds(ids->storage.data(), ids->storage.size());

  auto embedIndex = [this](std::string_view name) -> std::ptrdiff_t
  {
    const auto& names = embedSpec.output_names;
    const auto it = std::ranges::find(names, name);
    return it == names.end() ? -1 : it - names.begin();
  };
  const auto embedsOut = embedIndex("inputs_embeds");
  const auto perLayerOut = embedIndex("per_layer_inputs");
  if (embedsOut < 0)
    throw std::runtime_error("Embedding model has no inputs_embeds output");

  TextStreamer streamer(
      [this](std::span<const int64_t> t) { return tokenizer->decode(t); },
      onText);

  QElapsedTimer timer;
  timer.start();
  int generated = 0;
  bool stopped = false;

  try
  {
    auto embeds = runEmbedTokens(promptIds);
    if (auto* f = inputs.get<Onnx::ResultTensor>("image_features"))
      mergeFeatures(embeds[embedsOut], promptIds, TokenIds::IMAGE_SOFT, f->value);
    if (auto* f = inputs.get<Onnx::ResultTensor>("audio_features"))
      mergeFeatures(embeds[embedsOut], promptIds, TokenIds::AUDIO_SOFT, f->value);

    std::vector<Ort::Value> cache = emptyCache();
    std::vector<int64_t> positions;
    std::vector<int64_t> attention;
    bool useCache[1]{false};
    int64_t past = 0;
    auto step = static_cast<int64_t>(promptIds.size());

    while (generated < options.maxNewTokens)
    {
      positions.resize(step);
      std::iota(positions.begin(), positions.end(), past);
      attention.assign(past + step, 1);
      useCache[0] = past > 0;

      std::vector<Ort::Value> feeds;
      feeds.reserve(decoderSpec.input_names.size());
      std::size_t cacheSlot = 0;
      for (const auto& name : decoderSpec.input_names)
      {
        if (name == "inputs_embeds")
          feeds.push_back(std::move(embeds[embedsOut]));
        else if (name == "per_layer_inputs" && perLayerOut >= 0)
          feeds.push_back(std::move(embeds[perLayerOut]));
        else if (name == "position_ids")
          feeds.push_back(Onnx::tensorView<int64_t>(positions, {1, step}));
        else if (name == "cache_position")
          feeds.push_back(Onnx::tensorView<int64_t>(positions, {step}));
        else if (name == "attention_mask")
          feeds.push_back(
              Onnx::tensorView<int64_t>(attention, {1, past + step}));
        else if (name == "use_cache_branch")
          feeds.push_back(Onnx::tensorView<bool>(useCache, {1}));
        else if (name.starts_with("past_key_values"))
          feeds.push_back(std::move(cache[cacheSlot++]));
        else
          throw std::runtime_error(
              std::format("Unsupported decoder input {}", name));
      }

      auto outputs = decoderSession.Run(
          Ort::RunOptions{nullptr},
          decoderSpec.input_names_char.data(),
          feeds.data(),
          feeds.size(),
          decoderSpec.output_names_char.data(),
          decoderSpec.output_names_char.size());

      int64_t next = argmaxLastRow(outputs[logitsIndex]);
      for (std::size_t k = 0; k < cacheLinks.size(); k++)
        cache[k] = std::move(outputs[cacheLinks[k].second]);
      past += step;
      step = 1;

      if (next == TokenIds::EOS || next == TokenIds::END_OF_TURN)
        break;

      generated++;
      if (!streamer.put(next))
      {
        stopped = true;
        break;
      }
      embeds = runEmbedTokens(std::span<int64_t>(&next, 1));
    }

    if (!stopped)
      streamer.end();
  }
  catch (const Ort::Exception& e)
  {
    throw std::runtime_error(std::format("Generation failed: {}", e.what()));
  }

  const auto ms = std::max<qint64>(timer.elapsed(), 1);
  qCInfo(lcGeneration) << "Generated" << generated << "tokens in" << ms
                       << "ms (" << generated * 1000. / ms << "tokens/s)"
                       << (stopped ? "[stopped]" : "");
}
}
