#include <QTest>
#include <QtEndian>

#include <Medgate/Errors.hpp>
#include <Medgate/helpers/Audio.hpp>
#include <Medgate/helpers/AudioFeatures.hpp>

#include <cmath>

using namespace Medgate;

namespace
{
template <typename T>
void put(QByteArray& out, T value)
{
  char bytes[sizeof(T)];
  qToLittleEndian(value, bytes);
  out.append(bytes, sizeof(T));
}

QByteArray wav(quint16 format, quint16 channels, quint32 rate, quint16 bits, const QByteArray& samples)
{
  QByteArray out;
  const quint16 blockAlign = channels * bits / 8;
  out.append("RIFF");
  put<quint32>(out, quint32(36 + samples.size()));
  out.append("WAVE");
  out.append("fmt ");
  put<quint32>(out, 16);
  put<quint16>(out, format);
  put<quint16>(out, channels);
  put<quint32>(out, rate);
  put<quint32>(out, rate * blockAlign);
  put<quint16>(out, blockAlign);
  put<quint16>(out, bits);
  out.append("data");
  put<quint32>(out, quint32(samples.size()));
  out.append(samples);
  return out;
}
}

class AudioTest : public QObject
{
  Q_OBJECT

private slots:
  void downmixAveragesChannels()
  {
    const auto mono = Audio::downmix({{1.f, -1.f}, {0.f, 0.f}});
    QCOMPARE(mono, (std::vector<float>{0.5f, -0.5f}));
    QCOMPARE(Audio::downmix({{0.25f}}), std::vector<float>{0.25f});
  }

  void decodesPcm16()
  {
    QByteArray samples;
    for (qint16 s : {qint16(0), qint16(16384), qint16(-32768), qint16(32767)})
      put<qint16>(samples, s);

    const auto audio = Audio::decodeWav(wav(1, 1, 16000, 16, samples));
    QCOMPARE(audio.sampleRate, 16000);
    QCOMPARE(audio.channels.size(), std::size_t(1));
    QCOMPARE(audio.frames(), std::size_t(4));
    QCOMPARE(audio.channels[0][1], 0.5f);
    QCOMPARE(audio.channels[0][2], -1.f);
  }

  void decodesStereoFloat()
  {
    QByteArray samples;
    for (float s : {0.5f, -0.5f, 0.25f, 0.75f})
      put<float>(samples, s);

    const auto audio = Audio::decodeWav(wav(3, 2, 44100, 32, samples));
    QCOMPARE(audio.channels.size(), std::size_t(2));
    QCOMPARE(audio.channels[0], (std::vector<float>{0.5f, 0.25f}));
    QCOMPARE(audio.channels[1], (std::vector<float>{-0.5f, 0.75f}));
  }

  void rejectsBadHeader()
  {
    QVERIFY_THROWS_EXCEPTION(RequestError, Audio::decodeWav(QByteArray("RIFX1234WAVEfmt ")));
    QVERIFY_THROWS_EXCEPTION(RequestError, Audio::decodeWav(QByteArray()));

    QByteArray samples;
    put<qint16>(samples, 0);
    // A-law is not supported.
    QVERIFY_THROWS_EXCEPTION(RequestError, Audio::decodeWav(wav(6, 1, 8000, 8, samples)));
  }

  void resamplingKeepsDuration()
  {
    const std::vector<float> input(44100, 0.5f);
    const auto out = Audio::resampleLinear(input, 44100, 16000);
    QCOMPARE(out.size(), std::size_t(16000));
    QCOMPARE(out.front(), 0.5f);
    QCOMPARE(out.back(), 0.5f);

    QCOMPARE(Audio::resampleLinear(input, 16000, 16000).size(), input.size());
  }

  void loadMonoResamplesAndDownmixes()
  {
    QByteArray samples;
    for (int i = 0; i < 8000; i++)
    {
      put<qint16>(samples, qint16(16384));
      put<qint16>(samples, qint16(0));
    }
    const auto mono = Audio::loadMono(wav(1, 2, 8000, 16, samples), 16000);
    QCOMPARE(mono.size(), std::size_t(16000));
    QCOMPARE(mono[100], 0.25f);
  }

  void melFeaturesHaveExpectedShape()
  {
    Audio::LogMelExtractor mel;
    std::vector<float> tone(16000);
    for (std::size_t i = 0; i < tone.size(); i++)
      tone[i] = 0.5f * std::sin(2.f * 3.14159265f * 440.f * float(i) / 16000.f);

    const auto features = mel(tone);
    // One extra sample per frame for the pre-emphasis: (16000 - 513) / 160 + 1.
    QCOMPARE(features.frames, std::size_t(97));
    QCOMPARE(features.values.size(), features.frames * 128);
    for (float v : features.values)
      QVERIFY(std::isfinite(v));
    QVERIFY(features.values.front() >= std::log(mel.mel_floor) - 1e-3f);
  }
};

QTEST_GUILESS_MAIN(AudioTest)
#include "tst_audio.moc"
