#include "CountingSource.h"

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/mem.h>
#include <libavutil/error.h>
}

#include <QDebug>
#include <cstdio>

static constexpr int kIoBufferSize = 32 * 1024;

CountingSource::CountingSource(std::atomic<quint64>* counter)
    : m_counter(counter ? counter : &m_ownCounter)
{
}

CountingSource::~CountingSource()
{
    close();
}

bool CountingSource::open(const QString& filePath, ConversionError* error)
{
    close();

    m_file.setFileName(filePath);
    if (!m_file.open(QIODevice::ReadOnly)) {
        return setError(error, ConversionError::IoOpenError,
                        QStringLiteral("Failed to open file: %1").arg(m_file.errorString()));
    }

    m_totalLength = m_file.size();
    if (m_file.isSequential() || m_totalLength < 0) {
        m_file.close();
        return setError(error, ConversionError::IoMetadataError,
                        QStringLiteral("Failed to get file metadata: %1").arg(filePath));
    }

    qDebug() << "[CountingSource] Opened" << filePath << "size:" << m_totalLength;
    return true;
}

void CountingSource::close()
{
    if (m_avio) {
        av_freep(&m_avio->buffer);
        avio_context_free(&m_avio);
    }
    if (m_file.isOpen())
        m_file.close();
    m_totalLength = 0;
}

qint64 CountingSource::read(char* data, qint64 maxSize)
{
    qint64 n = m_file.read(data, maxSize);
    if (n > 0)
        m_counter->fetch_add(static_cast<quint64>(n), std::memory_order_relaxed);
    return n;
}

bool CountingSource::seek(qint64 pos)
{
    return m_file.seek(pos);
}

AVIOContext* CountingSource::avioContext()
{
    if (m_avio)
        return m_avio;
    if (!m_file.isOpen())
        return nullptr;

    auto* buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
    if (!buffer)
        return nullptr;

    m_avio = avio_alloc_context(buffer, kIoBufferSize, 0, this,
                                &CountingSource::readPacket, nullptr,
                                &CountingSource::seekPacket);
    if (!m_avio) {
        av_free(buffer);
        return nullptr;
    }
    return m_avio;
}

// ── libavformat callbacks ───────────────────────────────────────────
int CountingSource::readPacket(void* opaque, uint8_t* buf, int bufSize)
{
    auto* self = static_cast<CountingSource*>(opaque);
    qint64 n = self->read(reinterpret_cast<char*>(buf), bufSize);
    if (n < 0)
        return AVERROR(EIO);
    if (n == 0)
        return AVERROR_EOF;
    return static_cast<int>(n);
}

int64_t CountingSource::seekPacket(void* opaque, int64_t offset, int whence)
{
    auto* self = static_cast<CountingSource*>(opaque);
    whence &= ~AVSEEK_FORCE;

    qint64 target = 0;
    switch (whence) {
    case AVSEEK_SIZE:
        return self->m_totalLength;
    case SEEK_SET:
        target = offset;
        break;
    case SEEK_CUR:
        target = self->pos() + offset;
        break;
    case SEEK_END:
        target = self->m_totalLength + offset;
        break;
    default:
        return AVERROR(EINVAL);
    }

    if (target < 0 || !self->seek(target))
        return AVERROR(EIO);
    return target;
}
