#include "AudioFeatures.hpp"

#include <Medgate/Logging.hpp>

#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>

namespace Medgate::Audio
{
namespace
{
float hertzToMel(float f)
{
  return 2595.f * std::log10(1.f + f / 700.f);
}

float melToHertz(float m)
{
  return 700.f * (std::pow(10.f, m / 2595.f) - 1.f);
}

// In-place iterative radix-2 FFT, size must be a power of two.
void fft(std::vector<std::complex<float>>& a)
{
  const std::size_t n = a.size();
  for (std::size_t i = 1, j = 0; i < n; i++)
  {
    std::size_t bit = n >> 1;
    for (; j & bit; bit >>= 1)
      j ^= bit;
    j ^= bit;
    if (i < j)
      std::swap(a[i], a[j]);
  }

  for (std::size_t len = 2; len <= n; len <<= 1)
  {
    const float ang = -2.f * std::numbers::pi_v<float> / float(len);
    const std::complex<float> wlen(std::cos(ang), std::sin(ang));
    for (std::size_t i = 0; i < n; i += len)
    {
      std::complex<float> w(1.f, 0.f);
      for (std::size_t j = 0; j < len / 2; j++)
      {
        const auto u = a[i + j];
        const auto v = a[i + j + len / 2] * w;
        a[i + j] = u + v;
        a[i + j + len / 2] = u - v;
        w *= wlen;
      }
    }
  }
}
}

LogMelExtractor::LogMelExtractor()
{
  m_window.resize(frame_length);
  for (int i = 0; i < frame_length; i++)
    m_window[i] = 0.5f
                  - 0.5f
                        * std::cos(
                            2.f * std::numbers::pi_v<float> * i / frame_length);

  const int bins = fft_length / 2 + 1;
  const float mel_min = hertzToMel(min_frequency);
  const float mel_max = hertzToMel(max_frequency);
  std::vector<float> edges(mel_bins + 2);
  for (int i = 0; i < mel_bins + 2; i++)
    edges[i] = melToHertz(mel_min + (mel_max - mel_min) * i / (mel_bins + 1));

  m_filters.assign(std::size_t(bins) * mel_bins, 0.f);
  for (int k = 0; k < bins; k++)
  {
    const float f = float(sampling_rate) / 2.f * k / (bins - 1);
    for (int m = 0; m < mel_bins; m++)
    {
      const float down = (f - edges[m]) / (edges[m + 1] - edges[m]);
      const float up = (edges[m + 2] - f) / (edges[m + 2] - edges[m + 1]);
      m_filters[std::size_t(k) * mel_bins + m]
          = std::max(0.f, std::min(down, up));
    }
  }
}

LogMelExtractor::Features
LogMelExtractor::operator()(std::span<const float> waveform) const
{
  if (waveform.size() > max_samples)
  {
    qCInfo(lcAudio) << "Truncating audio from" << waveform.size() << "to"
                    << max_samples << "samples";
    waveform = waveform.first(max_samples);
  }

  // Each frame reads one extra sample for the pre-emphasis filter.
  const std::size_t span = frame_length + 1;
  std::vector<float> padded;
  if (waveform.size() < span)
  {
    padded.assign(waveform.begin(), waveform.end());
    padded.resize(span, 0.f);
    waveform = padded;
  }

  const int bins = fft_length / 2 + 1;
  Features res;
  res.frames = (waveform.size() - span) / hop_length + 1;
  res.values.resize(res.frames * mel_bins);

  std::vector<std::complex<float>> buf(fft_length);
  std::vector<float> magnitude(bins);
  for (std::size_t t = 0; t < res.frames; t++)
  {
    const float* frame = waveform.data() + t * hop_length;
    std::fill(buf.begin(), buf.end(), std::complex<float>{});
    buf[0] = frame[0] * (1.f - preemphasis) * m_window[0];
    for (int i = 1; i < frame_length; i++)
      buf[i] = (frame[i] - preemphasis * frame[i - 1]) * m_window[i];

    fft(buf);
    for (int k = 0; k < bins; k++)
      magnitude[k] = std::abs(buf[k]);

    float* out = res.values.data() + t * mel_bins;
    for (int m = 0; m < mel_bins; m++)
    {
      float acc = 0.f;
      for (int k = 0; k < bins; k++)
        acc += magnitude[k] * m_filters[std::size_t(k) * mel_bins + m];
      out[m] = std::log(std::max(acc, mel_floor));
    }
  }
  return res;
}
}
