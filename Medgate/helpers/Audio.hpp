#pragma once
#include <QByteArray>

#include <cstddef>
#include <span>
#include <vector>

namespace Medgate::Audio
{
struct DecodedAudio
{
  int sampleRate{};
  std::vector<std::vector<float>> channels;

  std::size_t frames() const noexcept
  {
    return channels.empty() ? 0 : channels.front().size();
  }
};

// RIFF/WAVE: integer PCM 8/16/24/32 bits, IEEE float 32/64 bits and
// WAVE_FORMAT_EXTENSIBLE wrapping either. Samples are normalized to [-1, 1].
// Throws RequestError on malformed or unsupported input.
DecodedAudio decodeWav(std::span<const char> bytes);

std::vector<float>
resampleLinear(std::span<const float> input, int fromRate, int toRate);

// Averages the first two channels; a single channel is passed through.
std::vector<float> downmix(const std::vector<std::vector<float>>& channels);

// decode, resample every channel to targetRate, downmix.
std::vector<float> loadMono(const QByteArray& bytes, int targetRate);
}
