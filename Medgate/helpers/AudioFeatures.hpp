#pragma once
#include <cstddef>
#include <span>
#include <vector>

namespace Medgate::Audio
{
// Log-mel spectrogram front-end of the Gemma 3n audio encoder.
struct LogMelExtractor
{
  int sampling_rate = 16000;
  int frame_length = 512;
  int hop_length = 160;
  int fft_length = 1024;
  int mel_bins = 128;
  float min_frequency = 125.f;
  float max_frequency = 7600.f;
  float preemphasis = 0.97f;
  float mel_floor = 1e-5f;
  std::size_t max_samples = 480000;

  LogMelExtractor();

  // Row-major [frames, mel_bins].
  struct Features
  {
    std::vector<float> values;
    std::size_t frames{};
  };

  Features operator()(std::span<const float> waveform) const;

  const std::vector<float>& window() const noexcept { return m_window; }
  // Row-major [fft_length / 2 + 1, mel_bins].
  const std::vector<float>& filters() const noexcept { return m_filters; }

private:
  std::vector<float> m_window;
  std::vector<float> m_filters;
};
}
