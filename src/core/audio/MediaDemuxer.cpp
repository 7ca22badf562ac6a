#include "MediaDemuxer.h"
#include "CountingSource.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/mathematics.h>
}

#include <QDebug>

MediaDemuxer::~MediaDemuxer()
{
    close();
}

bool MediaDemuxer::open(CountingSource& source, ConversionError* error)
{
    close();

    AVIOContext* avio = source.avioContext();
    if (!avio) {
        return setError(error, ConversionError::UnsupportedFormat,
                        QStringLiteral("Unsupported format: no readable input"));
    }

    m_fmtCtx = avformat_alloc_context();
    if (!m_fmtCtx) {
        return setError(error, ConversionError::UnsupportedFormat,
                        QStringLiteral("Unsupported format: %1").arg(avErrorString(AVERROR(ENOMEM))));
    }
    m_fmtCtx->pb = avio;
    m_fmtCtx->flags |= AVFMT_FLAG_CUSTOM_IO;

    // No filename and no input format: detection is purely content based.
    // avformat_open_input frees the context and nulls it on failure.
    int ret = avformat_open_input(&m_fmtCtx, nullptr, nullptr, nullptr);
    if (ret < 0) {
        qDebug() << "[MediaDemuxer] Probe failed:" << avErrorString(ret);
        return setError(error, ConversionError::UnsupportedFormat,
                        QStringLiteral("Unsupported format: %1").arg(avErrorString(ret)));
    }

    ret = avformat_find_stream_info(m_fmtCtx, nullptr);
    if (ret < 0) {
        close();
        return setError(error, ConversionError::UnsupportedFormat,
                        QStringLiteral("Unsupported format: %1").arg(avErrorString(ret)));
    }

    qDebug() << "[MediaDemuxer] Detected" << formatName()
             << "streams:" << m_fmtCtx->nb_streams;
    return true;
}

void MediaDemuxer::close()
{
    if (m_fmtCtx)
        avformat_close_input(&m_fmtCtx);
}

QVector<TrackInfo> MediaDemuxer::tracks() const
{
    QVector<TrackInfo> result;
    if (!m_fmtCtx)
        return result;

    result.reserve(static_cast<int>(m_fmtCtx->nb_streams));
    for (unsigned i = 0; i < m_fmtCtx->nb_streams; ++i) {
        const AVStream* stream = m_fmtCtx->streams[i];
        const AVCodecParameters* par = stream->codecpar;

        TrackInfo track;
        track.id        = static_cast<int>(i);
        track.codecId   = par->codec_id;
        track.mediaType = par->codec_type;
        track.codecName = QString::fromUtf8(avcodec_get_name(par->codec_id));

        AudioTrackDescriptor& d = track.descriptor;
        d.channels   = par->ch_layout.nb_channels;
        d.sampleRate = par->sample_rate;
        if (par->bits_per_raw_sample > 0)
            d.bitsPerSample = par->bits_per_raw_sample;
        else if (par->bits_per_coded_sample > 0)
            d.bitsPerSample = par->bits_per_coded_sample;

        if (stream->duration != AV_NOPTS_VALUE && par->sample_rate > 0) {
            d.totalFrames = av_rescale_q(stream->duration, stream->time_base,
                                         AVRational{1, par->sample_rate});
        }

        result.append(track);
    }
    return result;
}

int MediaDemuxer::selectTrack(const QVector<TrackInfo>& tracks)
{
    for (int i = 0; i < tracks.size(); ++i) {
        const TrackInfo& t = tracks.at(i);
        if (t.mediaType == AVMEDIA_TYPE_AUDIO && t.codecId != AV_CODEC_ID_NONE)
            return i;
    }
    return -1;
}

std::optional<TrackInfo> MediaDemuxer::selectDefaultTrack(ConversionError* error) const
{
    const QVector<TrackInfo> all = tracks();
    int idx = selectTrack(all);
    if (idx < 0) {
        setError(error, ConversionError::NoSupportedTrack,
                 QStringLiteral("No supported audio tracks"));
        return std::nullopt;
    }
    return all.at(idx);
}

MediaDemuxer::PacketStatus MediaDemuxer::readPacket(AVPacket* packet)
{
    if (!m_fmtCtx)
        return PacketStatus::EndOfStream;

    int ret = av_read_frame(m_fmtCtx, packet);
    if (ret >= 0)
        return PacketStatus::Packet;
    if (ret == AVERROR(EAGAIN))
        return PacketStatus::Reset;

    if (ret != AVERROR_EOF)
        qDebug() << "[MediaDemuxer] Read stopped:" << avErrorString(ret);
    return PacketStatus::EndOfStream;
}

const AVCodecParameters* MediaDemuxer::codecParameters(int trackId) const
{
    if (!m_fmtCtx || trackId < 0 || trackId >= static_cast<int>(m_fmtCtx->nb_streams))
        return nullptr;
    return m_fmtCtx->streams[trackId]->codecpar;
}

QString MediaDemuxer::formatName() const
{
    if (!m_fmtCtx || !m_fmtCtx->iformat)
        return QString();
    return QString::fromUtf8(m_fmtCtx->iformat->name);
}
