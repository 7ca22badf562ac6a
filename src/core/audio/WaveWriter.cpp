#include "WaveWriter.h"

#include <QDebug>
#include <QFile>

static constexpr size_t kBlockSamples = 4096;

WaveWriter::~WaveWriter()
{
    if (m_file) {
        // Unfinalized: close the handle, leave the file for the owner to judge.
        sf_close(m_file);
        m_file = nullptr;
    }
}

bool WaveWriter::open(const QString& filePath, int sampleRate, ConversionError* error)
{
    if (m_file) {
        return setError(error, ConversionError::OutputCreateError,
                        QStringLiteral("Failed to create WAV file: writer already open"));
    }

    SF_INFO info{};
    info.samplerate = sampleRate;
    info.channels   = 1;
    info.format     = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    if (!sf_format_check(&info)) {
        return setError(error, ConversionError::OutputCreateError,
                        QStringLiteral("Failed to create WAV file: invalid format (rate %1)")
                            .arg(sampleRate));
    }

    m_file = sf_open(QFile::encodeName(filePath).constData(), SFM_WRITE, &info);
    if (!m_file) {
        return setError(error, ConversionError::OutputCreateError,
                        QStringLiteral("Failed to create WAV file: %1")
                            .arg(QString::fromUtf8(sf_strerror(nullptr))));
    }

    m_filePath = filePath;
    m_block.clear();
    m_block.reserve(kBlockSamples);
    m_samplesWritten = 0;
    m_finalized = false;

    qDebug() << "[WaveWriter] Created" << filePath << "rate:" << sampleRate;
    return true;
}

bool WaveWriter::writeSample(int16_t sample)
{
    if (!m_file)
        return false;

    m_block.push_back(sample);
    ++m_samplesWritten;
    if (m_block.size() >= kBlockSamples)
        return flushBlock();
    return true;
}

bool WaveWriter::flushBlock()
{
    if (m_block.empty())
        return true;

    const sf_count_t count = static_cast<sf_count_t>(m_block.size());
    const sf_count_t written = sf_write_short(m_file, m_block.data(), count);
    m_block.clear();
    if (written != count) {
        // Only what reached the file counts as written
        m_samplesWritten -= count - qMax<sf_count_t>(written, 0);
        qWarning() << "[WaveWriter] Short write:" << written << "of" << count
                   << sf_strerror(m_file);
        return false;
    }
    return true;
}

bool WaveWriter::finalize(ConversionError* error)
{
    if (!m_file || m_finalized) {
        return setError(error, ConversionError::FinalizeError,
                        QStringLiteral("Finalize error"));
    }

    const bool flushed = flushBlock();
    const int rc = sf_close(m_file);
    m_file = nullptr;

    if (!flushed || rc != 0) {
        return setError(error, ConversionError::FinalizeError,
                        QStringLiteral("Finalize error"));
    }

    m_finalized = true;
    qDebug() << "[WaveWriter] Finalized" << m_filePath
             << "samples:" << m_samplesWritten;
    return true;
}

void WaveWriter::discard()
{
    if (m_file) {
        sf_close(m_file);
        m_file = nullptr;
    }
    m_block.clear();
    if (!m_filePath.isEmpty() && QFile::exists(m_filePath)) {
        if (QFile::remove(m_filePath))
            qDebug() << "[WaveWriter] Removed partial file" << m_filePath;
        else
            qWarning() << "[WaveWriter] Could not remove partial file" << m_filePath;
    }
    m_finalized = false;
}
