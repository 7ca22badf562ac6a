#pragma once

#include <QString>
#include <sndfile.h>
#include <vector>
#include "ConversionError.h"
#include "MonoDownmixer.h"

// Mono 16-bit PCM WAV writer. Samples are collected in a small block and
// handed to libsndfile; the RIFF lengths are only valid after finalize().
class WaveWriter : public SampleSink {
public:
    WaveWriter() = default;
    ~WaveWriter() override;

    WaveWriter(const WaveWriter&) = delete;
    WaveWriter& operator=(const WaveWriter&) = delete;

    bool open(const QString& filePath, int sampleRate, ConversionError* error = nullptr);
    bool isOpen() const { return m_file != nullptr; }
    bool isFinalized() const { return m_finalized; }

    bool writeSample(int16_t sample) override;

    // Flush and close. Must be called exactly once after the last sample.
    bool finalize(ConversionError* error = nullptr);

    // Close without finalizing and delete the file from disk.
    void discard();

    // Samples accepted, less any a failed flush could not store
    qint64 samplesWritten() const { return m_samplesWritten; }
    QString filePath() const { return m_filePath; }

private:
    bool flushBlock();

    SNDFILE* m_file = nullptr;
    QString m_filePath;
    std::vector<short> m_block;
    qint64 m_samplesWritten = 0;
    bool m_finalized = false;
};
