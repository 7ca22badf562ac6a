#include "AudioDecoder.h"
#include "MediaDemuxer.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
#include <libavutil/channel_layout.h>
}

#include <QDebug>

struct AudioDecoder::Impl {
    AVCodecContext* codecCtx = nullptr;
    AVFrame*        frame    = nullptr;
    bool            opened   = false;
    bool            draining = false;

    ~Impl() {
        cleanup();
    }

    void cleanup() {
        if (frame)    { av_frame_free(&frame); }
        if (codecCtx) { avcodec_free_context(&codecCtx); }
        opened = false;
        draining = false;
    }
};

AudioDecoder::AudioDecoder()
    : m_impl(std::make_unique<Impl>())
{
}

AudioDecoder::~AudioDecoder() = default;

bool AudioDecoder::open(const MediaDemuxer& demuxer, int trackId, ConversionError* error)
{
    close();

    auto& d = *m_impl;

    const AVCodecParameters* par = demuxer.codecParameters(trackId);
    if (!par) {
        return setError(error, ConversionError::UnsupportedCodec,
                        QStringLiteral("Unsupported codec: no track %1").arg(trackId));
    }

    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec) {
        return setError(error, ConversionError::UnsupportedCodec,
                        QStringLiteral("Unsupported codec: %1")
                            .arg(QString::fromUtf8(avcodec_get_name(par->codec_id))));
    }

    d.codecCtx = avcodec_alloc_context3(codec);
    if (!d.codecCtx) {
        return setError(error, ConversionError::UnsupportedCodec,
                        QStringLiteral("Unsupported codec: %1").arg(avErrorString(AVERROR(ENOMEM))));
    }

    int ret = avcodec_parameters_to_context(d.codecCtx, par);
    if (ret >= 0)
        ret = avcodec_open2(d.codecCtx, codec, nullptr);
    if (ret < 0) {
        d.cleanup();
        return setError(error, ConversionError::UnsupportedCodec,
                        QStringLiteral("Unsupported codec: %1").arg(avErrorString(ret)));
    }

    d.frame = av_frame_alloc();
    if (!d.frame) {
        d.cleanup();
        return setError(error, ConversionError::UnsupportedCodec,
                        QStringLiteral("Unsupported codec: %1").arg(avErrorString(AVERROR(ENOMEM))));
    }

    d.opened = true;
    qDebug() << "[AudioDecoder] Opened" << codecName()
             << "format:" << av_get_sample_fmt_name(d.codecCtx->sample_fmt)
             << "channels:" << d.codecCtx->ch_layout.nb_channels
             << "rate:" << d.codecCtx->sample_rate;
    return true;
}

void AudioDecoder::close()
{
    m_impl->cleanup();
}

bool AudioDecoder::isOpen() const
{
    return m_impl->opened;
}

bool AudioDecoder::sendPacket(const AVPacket* packet, ConversionError* error)
{
    auto& d = *m_impl;
    if (!d.opened)
        return setError(error, ConversionError::DecodeError,
                        QStringLiteral("Decode error: decoder not open"));

    if (!packet) {
        if (d.draining)
            return true;
        d.draining = true;
    }

    int ret = avcodec_send_packet(d.codecCtx, packet);
    if (ret < 0 && ret != AVERROR_EOF) {
        return setError(error, ConversionError::DecodeError,
                        QStringLiteral("Decode error: %1").arg(avErrorString(ret)));
    }
    return true;
}

AudioDecoder::ReceiveStatus AudioDecoder::receiveBuffer(DecodedBuffer* buffer, ConversionError* error)
{
    auto& d = *m_impl;
    if (!d.opened)
        return ReceiveStatus::Drained;

    av_frame_unref(d.frame);
    int ret = avcodec_receive_frame(d.codecCtx, d.frame);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
        return ReceiveStatus::Drained;
    if (ret < 0) {
        setError(error, ConversionError::DecodeError,
                 QStringLiteral("Decode error: %1").arg(avErrorString(ret)));
        return ReceiveStatus::Failed;
    }

    const AVFrame* f = d.frame;
    const auto fmt = static_cast<AVSampleFormat>(f->format);

    buffer->kind     = sampleKindFor(f->format, d.codecCtx->bits_per_raw_sample);
    buffer->channels = f->ch_layout.nb_channels;
    buffer->frames   = f->nb_samples;
    buffer->planes.clear();

    if (av_sample_fmt_is_planar(fmt)) {
        buffer->stride = 1;
        for (int ch = 0; ch < buffer->channels; ++ch)
            buffer->planes.append(f->extended_data[ch]);
    } else {
        const int bytesPerSample = av_get_bytes_per_sample(fmt);
        buffer->stride = buffer->channels;
        for (int ch = 0; ch < buffer->channels; ++ch)
            buffer->planes.append(f->extended_data[0] + ch * bytesPerSample);
    }
    return ReceiveStatus::Buffer;
}

QString AudioDecoder::codecName() const
{
    auto& d = *m_impl;
    if (!d.codecCtx) return QString();
    return QString::fromUtf8(avcodec_get_name(d.codecCtx->codec_id));
}

SampleKind AudioDecoder::sampleKindFor(int sampleFormat, int bitsPerRawSample)
{
    switch (static_cast<AVSampleFormat>(sampleFormat)) {
    case AV_SAMPLE_FMT_U8:
    case AV_SAMPLE_FMT_U8P:
        return SampleKind::Unsigned8;
    case AV_SAMPLE_FMT_S16:
    case AV_SAMPLE_FMT_S16P:
        return SampleKind::Signed16;
    case AV_SAMPLE_FMT_S32:
    case AV_SAMPLE_FMT_S32P:
        return bitsPerRawSample == 24 ? SampleKind::Signed24 : SampleKind::Signed32;
    case AV_SAMPLE_FMT_FLT:
    case AV_SAMPLE_FMT_FLTP:
        return SampleKind::Float32;
    case AV_SAMPLE_FMT_DBL:
    case AV_SAMPLE_FMT_DBLP:
        return SampleKind::Float64;
    default:
        return SampleKind::Unsupported;
    }
}
