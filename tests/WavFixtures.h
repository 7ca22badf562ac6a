#pragma once

#include <QByteArray>
#include <QDataStream>
#include <QFile>
#include <QString>
#include <QVector>
#include <sndfile.h>

// Helpers shared by the pipeline tests: hand-built input WAVs and a
// libsndfile reader for the produced mono files.
namespace WavFixtures {

// Canonical 44-byte RIFF header followed by data. formatTag 1 = PCM.
inline bool writeWav(const QString& path, int channels, int sampleRate,
                     int bitsPerSample, const QByteArray& data, quint16 formatTag = 1)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;

    const quint16 blockAlign = static_cast<quint16>(channels * bitsPerSample / 8);
    QDataStream out(&file);
    out.setByteOrder(QDataStream::LittleEndian);
    out.writeRawData("RIFF", 4);
    out << quint32(36 + data.size());
    out.writeRawData("WAVE", 4);
    out.writeRawData("fmt ", 4);
    out << quint32(16) << formatTag << quint16(channels) << quint32(sampleRate)
        << quint32(sampleRate * blockAlign) << blockAlign << quint16(bitsPerSample);
    out.writeRawData("data", 4);
    out << quint32(data.size());
    out.writeRawData(data.constData(), data.size());
    return out.status() == QDataStream::Ok;
}

// Interleaves equally long int16 channels into little-endian PCM bytes.
inline QByteArray interleaveS16(const QVector<QVector<qint16>>& channels)
{
    QByteArray bytes;
    if (channels.isEmpty())
        return bytes;
    QDataStream out(&bytes, QIODevice::WriteOnly);
    out.setByteOrder(QDataStream::LittleEndian);
    const int frames = channels.first().size();
    for (int i = 0; i < frames; ++i)
        for (const auto& ch : channels)
            out << ch[i];
    return bytes;
}

// Stereo 16-bit ramp with mixed signs; identical calls give identical data.
inline QVector<QVector<qint16>> stereoRamp(int frames)
{
    QVector<qint16> left(frames), right(frames);
    for (int i = 0; i < frames; ++i) {
        left[i]  = static_cast<qint16>((i * 37) % 2000 - 1000);
        right[i] = static_cast<qint16>((i * 91) % 3001 - 1500);
    }
    return {left, right};
}

inline bool writeStereoRamp(const QString& path, int frames, int sampleRate = 8000)
{
    return writeWav(path, 2, sampleRate, 16, interleaveS16(stereoRamp(frames)));
}

struct WavContents {
    bool ok = false;
    int channels = 0;
    int sampleRate = 0;
    int format = 0;
    QVector<qint16> samples;
};

inline WavContents readWav(const QString& path)
{
    WavContents contents;
    SF_INFO info{};
    SNDFILE* file = sf_open(QFile::encodeName(path).constData(), SFM_READ, &info);
    if (!file)
        return contents;

    contents.channels   = info.channels;
    contents.sampleRate = info.samplerate;
    contents.format     = info.format;
    contents.samples.resize(static_cast<int>(info.frames * info.channels));
    sf_count_t got = info.frames > 0
        ? sf_readf_short(file, contents.samples.data(), info.frames)
        : 0;
    sf_close(file);
    contents.ok = (got == info.frames);
    return contents;
}

} // namespace WavFixtures
