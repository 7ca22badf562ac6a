#pragma once
#include <memory>
#include <QString>
#include "ConversionError.h"
#include "DecodedBuffer.h"

struct AVPacket;
class MediaDemuxer;

class AudioDecoder {
public:
    enum class ReceiveStatus { Buffer, Drained, Failed };

    AudioDecoder();
    ~AudioDecoder();

    AudioDecoder(const AudioDecoder&) = delete;
    AudioDecoder& operator=(const AudioDecoder&) = delete;

    bool open(const MediaDemuxer& demuxer, int trackId, ConversionError* error = nullptr);
    void close();
    bool isOpen() const;

    // Feed one packet. nullptr puts the decoder into drain mode.
    bool sendPacket(const AVPacket* packet, ConversionError* error = nullptr);

    // Pull the next decoded frame. Call until Drained after every sendPacket.
    ReceiveStatus receiveBuffer(DecodedBuffer* buffer, ConversionError* error = nullptr);

    // Returns the FFmpeg codec name (e.g. "flac", "pcm_s16le") or empty if not loaded
    QString codecName() const;

    // Maps an AVSampleFormat value to the downmixer's sample kind. 32-bit
    // integer frames that only carry 24 significant bits report Signed24.
    static SampleKind sampleKindFor(int sampleFormat, int bitsPerRawSample);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};
