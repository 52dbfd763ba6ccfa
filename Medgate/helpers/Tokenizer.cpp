#include "Tokenizer.hpp"

#include <format>
#include <stdexcept>

namespace Medgate::Onnx
{
namespace
{
template <typename T>
struct OrtxHandle
{
  T* ptr{};
  OrtxHandle() = default;
  OrtxHandle(const OrtxHandle&) = delete;
  OrtxHandle& operator=(const OrtxHandle&) = delete;
  ~OrtxHandle()
  {
    if (ptr)
      OrtxDispose((OrtxObject**)&ptr);
  }
};
}

Tokenizer::Tokenizer(const std::filesystem::path& directory)
{
  std::filesystem::path dir = directory;
  if (dir.filename() == "tokenizer.json")
    dir = dir.parent_path();

  extError_t result = OrtxCreateTokenizer(&m_tokenizer, dir.string().c_str());
  if (result != kOrtxOK)
  {
    throw std::runtime_error(std::format(
        "Failed to create tokenizer from {}: {}",
        dir.string(),
        OrtxGetLastErrorMessage()));
  }
}

Tokenizer::~Tokenizer()
{
  if (m_tokenizer)
    OrtxDispose((OrtxObject**)&m_tokenizer);
}

std::vector<int64_t> Tokenizer::encode(std::string_view text) const
{
  const std::string input(text);
  const char* inputs[] = {input.c_str()};
  OrtxHandle<OrtxTokenId2DArray> tokenIds;

  extError_t result = OrtxTokenize(m_tokenizer, inputs, 1, &tokenIds.ptr);
  if (result != kOrtxOK)
  {
    throw std::runtime_error(
        std::format("Tokenization failed: {}", OrtxGetLastErrorMessage()));
  }

  const extTokenId_t* ids = nullptr;
  size_t length = 0;
  result = OrtxTokenId2DArrayGetItem(tokenIds.ptr, 0, &ids, &length);
  if (result != kOrtxOK)
  {
    throw std::runtime_error(
        std::format("Failed to get tokens: {}", OrtxGetLastErrorMessage()));
  }
  return std::vector<int64_t>(ids, ids + length);
}

std::string Tokenizer::decode(std::span<const int64_t> ids) const
{
  std::vector<extTokenId_t> tokens(ids.begin(), ids.end());
  OrtxHandle<OrtxStringArray> texts;

  extError_t result
      = OrtxDetokenize1D(m_tokenizer, tokens.data(), tokens.size(), &texts.ptr);
  if (result != kOrtxOK)
  {
    throw std::runtime_error(
        std::format("Token decoding failed: {}", OrtxGetLastErrorMessage()));
  }

  const char* text = nullptr;
  result = OrtxStringArrayGetItem(texts.ptr, 0, &text);
  if (result != kOrtxOK)
  {
    throw std::runtime_error(std::format(
        "Failed to get decoded string: {}", OrtxGetLastErrorMessage()));
  }
  return text ? std::string(text) : std::string{};
}
}
