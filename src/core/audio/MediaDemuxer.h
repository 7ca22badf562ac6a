#pragma once

#include <QString>
#include <QVector>
#include <optional>
#include "AudioFormat.h"
#include "ConversionError.h"

struct AVFormatContext;
struct AVCodecParameters;
struct AVPacket;
class CountingSource;

// Content-probed container reader on top of libavformat. Reads through a
// CountingSource so every byte pulled by the demuxer is accounted for.
class MediaDemuxer {
public:
    enum class PacketStatus {
        Packet,       // packet filled
        Reset,        // demuxer asked to be polled again
        EndOfStream   // EOF, or any read error past a successful probe
    };

    MediaDemuxer() = default;
    ~MediaDemuxer();

    MediaDemuxer(const MediaDemuxer&) = delete;
    MediaDemuxer& operator=(const MediaDemuxer&) = delete;

    bool open(CountingSource& source, ConversionError* error = nullptr);
    void close();
    bool isOpen() const { return m_fmtCtx != nullptr; }

    QVector<TrackInfo> tracks() const;

    // Index into tracks of the first audio track with a real codec, or -1.
    static int selectTrack(const QVector<TrackInfo>& tracks);
    std::optional<TrackInfo> selectDefaultTrack(ConversionError* error = nullptr) const;

    PacketStatus readPacket(AVPacket* packet);

    const AVCodecParameters* codecParameters(int trackId) const;
    QString formatName() const;

private:
    AVFormatContext* m_fmtCtx = nullptr;
};
