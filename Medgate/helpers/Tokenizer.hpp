#pragma once
#include <ortx_tokenizer.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Medgate::Onnx
{
// onnxruntime-extensions tokenizer loaded from a directory holding
// tokenizer.json and tokenizer_config.json.
class Tokenizer
{
public:
  explicit Tokenizer(const std::filesystem::path& directory);
  Tokenizer(const Tokenizer&) = delete;
  Tokenizer& operator=(const Tokenizer&) = delete;
  ~Tokenizer();

  std::vector<int64_t> encode(std::string_view text) const;
  std::string decode(std::span<const int64_t> ids) const;

private:
  OrtxTokenizer* m_tokenizer{};
};
}
