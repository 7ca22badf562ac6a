#pragma once

#include <QFile>
#include <QString>
#include <atomic>
#include "ConversionError.h"

struct AVIOContext;

// Seekable byte source over a local file that counts every byte handed out
// by read(). Seeking never touches the counter, so progress derived from it
// is read-volume based and only approximate for decoders that seek.
class CountingSource {
public:
    // counter may be shared with the owning job; nullptr uses a private one.
    explicit CountingSource(std::atomic<quint64>* counter = nullptr);
    ~CountingSource();

    CountingSource(const CountingSource&) = delete;
    CountingSource& operator=(const CountingSource&) = delete;

    bool open(const QString& filePath, ConversionError* error = nullptr);
    void close();
    bool isOpen() const { return m_file.isOpen(); }

    // Returns bytes read, 0 at end of file, -1 on failure.
    qint64 read(char* data, qint64 maxSize);
    bool seek(qint64 pos);
    qint64 pos() const { return m_file.pos(); }

    qint64 totalLength() const { return m_totalLength; }
    bool isSeekable() const { return true; }
    quint64 bytesRead() const { return m_counter->load(std::memory_order_relaxed); }

    // Custom I/O context for libavformat, owned by this source.
    AVIOContext* avioContext();

private:
    static int readPacket(void* opaque, uint8_t* buf, int bufSize);
    static int64_t seekPacket(void* opaque, int64_t offset, int whence);

    QFile m_file;
    qint64 m_totalLength = 0;

    std::atomic<quint64> m_ownCounter{0};
    std::atomic<quint64>* m_counter = nullptr;

    AVIOContext* m_avio = nullptr;
};
