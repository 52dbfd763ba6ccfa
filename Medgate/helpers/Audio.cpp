#include "Audio.hpp"

#include <QtEndian>

#include <Medgate/Errors.hpp>
#include <Medgate/Logging.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <format>
#include <string_view>

namespace Medgate::Audio
{
namespace
{
constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
constexpr uint16_t WAVE_FORMAT_IEEE_FLOAT = 0x0003;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

struct WavFormat
{
  uint16_t format{};
  uint16_t channels{};
  uint32_t sampleRate{};
  uint16_t blockAlign{};
  uint16_t bitsPerSample{};
};

template <typename T>
T read_le(const char* p) noexcept
{
  return qFromLittleEndian<T>(p);
}

float decodeSample(const char* p, const WavFormat& fmt)
{
  if (fmt.format == WAVE_FORMAT_IEEE_FLOAT)
  {
    if (fmt.bitsPerSample == 32)
    {
      const uint32_t bits = read_le<uint32_t>(p);
      float f;
      std::memcpy(&f, &bits, sizeof(f));
      return f;
    }
    const uint64_t bits = read_le<uint64_t>(p);
    double d;
    std::memcpy(&d, &bits, sizeof(d));
    return static_cast<float>(d);
  }

  switch (fmt.bitsPerSample)
  {
    case 8:
      return (static_cast<uint8_t>(*p) - 128.f) / 128.f;
    case 16:
      return read_le<int16_t>(p) / 32768.f;
    case 24:
    {
      int32_t v = static_cast<uint8_t>(p[0])
                  | (static_cast<uint8_t>(p[1]) << 8)
                  | (static_cast<uint8_t>(p[2]) << 16);
      if (v & 0x800000)
        v |= ~0xFFFFFF;
      return v / 8388608.f;
    }
    case 32:
      return static_cast<float>(read_le<int32_t>(p) / 2147483648.);
  }
  return 0.f;
}

void validate(const WavFormat& fmt)
{
  if (fmt.channels == 0)
    throw RequestError("Invalid WAV file: no channels");
  if (fmt.sampleRate == 0)
    throw RequestError("Invalid WAV file: sample rate is zero");

  const bool pcm = fmt.format == WAVE_FORMAT_PCM
                   && (fmt.bitsPerSample == 8 || fmt.bitsPerSample == 16
                       || fmt.bitsPerSample == 24 || fmt.bitsPerSample == 32);
  const bool flt = fmt.format == WAVE_FORMAT_IEEE_FLOAT
                   && (fmt.bitsPerSample == 32 || fmt.bitsPerSample == 64);
  if (!pcm && !flt)
    throw RequestError(std::format(
        "Unsupported WAV encoding: format {}, {} bits",
        fmt.format,
        fmt.bitsPerSample));

  if (fmt.blockAlign < fmt.channels * (fmt.bitsPerSample / 8))
    throw RequestError("Invalid WAV file: inconsistent block alignment");
}
}

DecodedAudio decodeWav(std::span<const char> bytes)
{
  const char* data = bytes.data();
  const std::size_t size = bytes.size();
  if (size < 12 || std::string_view(data, 4) != "RIFF"
      || std::string_view(data + 8, 4) != "WAVE")
    throw RequestError("Invalid audio file: expected a RIFF/WAVE file");

  WavFormat fmt;
  bool haveFormat = false;
  const char* samples = nullptr;
  std::size_t sampleBytes = 0;

  std::size_t pos = 12;
  while (pos + 8 <= size)
  {
    const std::string_view id(data + pos, 4);
    const std::size_t chunkSize = read_le<uint32_t>(data + pos + 4);
    const std::size_t body = pos + 8;
    const std::size_t available = std::min(chunkSize, size - body);

    if (id == "fmt ")
    {
      if (available < 16)
        throw RequestError("Invalid WAV file: truncated format chunk");
      fmt.format = read_le<uint16_t>(data + body);
      fmt.channels = read_le<uint16_t>(data + body + 2);
      fmt.sampleRate = read_le<uint32_t>(data + body + 4);
      fmt.blockAlign = read_le<uint16_t>(data + body + 12);
      fmt.bitsPerSample = read_le<uint16_t>(data + body + 14);
      if (fmt.format == WAVE_FORMAT_EXTENSIBLE)
      {
        if (available < 26)
          throw RequestError("Invalid WAV file: truncated extensible format");
        // First two bytes of the sub-format GUID hold the actual format tag.
        fmt.format = read_le<uint16_t>(data + body + 24);
      }
      haveFormat = true;
    }
    else if (id == "data")
    {
      samples = data + body;
      sampleBytes = available;
      break;
    }

    pos = body + chunkSize + (chunkSize & 1);
  }

  if (!haveFormat)
    throw RequestError("Invalid WAV file: missing format chunk");
  if (!samples)
    throw RequestError("Invalid WAV file: missing data chunk");
  validate(fmt);

  const std::size_t bytesPerSample = fmt.bitsPerSample / 8;
  const std::size_t frames = sampleBytes / fmt.blockAlign;

  DecodedAudio res;
  res.sampleRate = static_cast<int>(fmt.sampleRate);
  res.channels.assign(fmt.channels, std::vector<float>(frames));
  for (std::size_t f = 0; f < frames; f++)
  {
    const char* frame = samples + f * fmt.blockAlign;
    for (std::size_t c = 0; c < fmt.channels; c++)
      res.channels[c][f] = decodeSample(frame + c * bytesPerSample, fmt);
  }

  qCDebug(lcAudio) << "Decoded WAV:" << fmt.channels << "channels,"
                   << fmt.sampleRate << "Hz," << fmt.bitsPerSample << "bits,"
                   << frames << "frames";
  return res;
}

std::vector<float>
resampleLinear(std::span<const float> input, int fromRate, int toRate)
{
  if (fromRate == toRate || input.empty())
    return {input.begin(), input.end()};

  const double ratio = double(fromRate) / double(toRate);
  const auto outSize = static_cast<std::size_t>(
      std::llround(double(input.size()) * toRate / fromRate));

  std::vector<float> out(outSize);
  const std::size_t last = input.size() - 1;
  for (std::size_t i = 0; i < outSize; i++)
  {
    const double src = i * ratio;
    const auto idx = std::min(static_cast<std::size_t>(src), last);
    const auto next = std::min(idx + 1, last);
    const float frac = static_cast<float>(src - double(idx));
    out[i] = input[idx] + (input[next] - input[idx]) * frac;
  }
  return out;
}

std::vector<float> downmix(const std::vector<std::vector<float>>& channels)
{
  if (channels.empty())
    return {};
  if (channels.size() == 1)
    return channels.front();

  const auto& left = channels[0];
  const auto& right = channels[1];
  const std::size_t n = std::min(left.size(), right.size());
  std::vector<float> mono(n);
  for (std::size_t i = 0; i < n; i++)
    mono[i] = (left[i] + right[i]) / 2.f;
  return mono;
}

std::vector<float> loadMono(const QByteArray& bytes, int targetRate)
{
  auto decoded = decodeWav({bytes.constData(), static_cast<std::size_t>(bytes.size())});
  if (decoded.frames() == 0)
    throw RequestError("Audio file contains no samples");

  for (auto& channel : decoded.channels)
    channel = resampleLinear(channel, decoded.sampleRate, targetRate);
  return downmix(decoded.channels);
}
}
