#include "ConversionJob.h"
#include "../Settings.h"
#include "../audio/AudioDecoder.h"
#include "../audio/CountingSource.h"
#include "../audio/MediaDemuxer.h"
#include "../audio/MonoDownmixer.h"
#include "../audio/WaveWriter.h"

extern "C" {
#include <libavcodec/avcodec.h>
}

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QMutexLocker>
#include <memory>

namespace {

struct PacketDeleter {
    void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;

} // namespace

ConversionJob::ConversionJob(const QString& inputPath, const Options& options,
                             QObject* parent)
    : QObject(parent)
    , m_inputPath(inputPath)
    , m_outputPath(outputPathFor(inputPath, options.outputSuffix))
    , m_options(options)
{
}

ConversionJob::~ConversionJob() = default;

ConversionJob::Options ConversionJob::defaultOptions()
{
    auto* settings = Settings::instance();
    Options options;
    options.outputSuffix           = settings->outputSuffix();
    options.progressInterval       = settings->progressInterval();
    options.removePartialOnFailure = settings->removePartialOnFailure();
    return options;
}

QString ConversionJob::outputPathFor(const QString& inputPath, const QString& suffix)
{
    QFileInfo info(inputPath);
    const QString tag = suffix.isEmpty() ? QStringLiteral("_mono") : suffix;
    return info.dir().filePath(info.completeBaseName() + tag + QStringLiteral(".wav"));
}

bool ConversionJob::isFinished() const
{
    const State s = state();
    return s == State::Succeeded || s == State::Failed || s == State::Cancelled;
}

void ConversionJob::requestCancel()
{
    m_cancelRequested.store(true, std::memory_order_release);
}

QString ConversionJob::stateName(State state)
{
    switch (state) {
    case State::Idle:       return QStringLiteral("Idle");
    case State::Opening:    return QStringLiteral("Opening");
    case State::Probing:    return QStringLiteral("Probing");
    case State::Decoding:   return QStringLiteral("Decoding");
    case State::Finalizing: return QStringLiteral("Finalizing");
    case State::Succeeded:  return QStringLiteral("Succeeded");
    case State::Failed:     return QStringLiteral("Failed");
    case State::Cancelled:  return QStringLiteral("Cancelled");
    }
    return QString();
}

void ConversionJob::setState(State state)
{
    m_state.store(state, std::memory_order_release);
    qDebug() << "[ConversionJob]" << QFileInfo(m_inputPath).fileName()
             << "->" << stateName(state);
}

// ═════════════════════════════════════════════════════════════════════
//  Pipeline
// ═════════════════════════════════════════════════════════════════════

ConversionResult ConversionJob::run()
{
    QElapsedTimer timer;
    timer.start();
    qDebug() << "[ConversionJob] Converting file:" << m_inputPath;

    ConversionResult result;
    result.inputPath  = m_inputPath;
    result.outputPath = m_outputPath;

    WaveWriter writer;
    ConversionError error;

    auto fail = [&](const ConversionError& err) {
        result.success        = false;
        result.error          = err;
        result.packetCount    = packetCount();
        result.samplesWritten = writer.samplesWritten();

        if (err.kind == ConversionError::Cancelled) {
            writer.discard();
            setState(State::Cancelled);
            qInfo() << "[ConversionJob] Cancelled after" << result.packetCount << "packets";
        } else {
            if (m_options.removePartialOnFailure)
                writer.discard();
            setState(State::Failed);
            qWarning() << "[ConversionJob]" << ConversionError::kindName(err.kind)
                       << err.message;
        }
        postFinished(result);
        return result;
    };

    // ── Opening ──────────────────────────────────────────────────────
    setState(State::Opening);
    CountingSource source(&m_bytesRead);
    if (!source.open(m_inputPath, &error))
        return fail(error);
    m_totalBytes.store(static_cast<quint64>(source.totalLength()), std::memory_order_relaxed);

    // ── Probing ──────────────────────────────────────────────────────
    setState(State::Probing);
    MediaDemuxer demuxer;
    if (!demuxer.open(source, &error))
        return fail(error);

    std::optional<TrackInfo> track = demuxer.selectDefaultTrack(&error);
    if (!track)
        return fail(error);

    const int sampleRate = track->descriptor.sampleRate;
    if (sampleRate <= 0)
        return fail({ConversionError::UnknownSampleRate, QStringLiteral("Unknown sample rate")});

    AudioDecoder decoder;
    if (!decoder.open(demuxer, track->id, &error))
        return fail(error);

    if (!writer.open(m_outputPath, sampleRate, &error))
        return fail(error);

    PacketPtr packet(av_packet_alloc());
    if (!packet)
        return fail({ConversionError::DecodeError, QStringLiteral("Decode error: out of memory")});

    // ── Decoding ─────────────────────────────────────────────────────
    postProgress(QStringLiteral("Starting conversion..."), 0.0);
    setState(State::Decoding);

    const int interval = qMax(1, m_options.progressInterval);
    int packets = 0;

    for (;;) {
        if (isCancelRequested())
            return fail({ConversionError::Cancelled, QStringLiteral("Conversion cancelled")});

        av_packet_unref(packet.get());
        const MediaDemuxer::PacketStatus status = demuxer.readPacket(packet.get());
        if (status == MediaDemuxer::PacketStatus::Reset)
            continue;
        if (status == MediaDemuxer::PacketStatus::EndOfStream)
            break;

        if (packet->stream_index != track->id)
            continue;

        m_packetCount.store(++packets, std::memory_order_relaxed);
        if (packets % interval == 0) {
            const quint64 total = totalBytes();
            const double progress = total > 0
                ? static_cast<double>(bytesRead()) / static_cast<double>(total) * 100.0
                : 0.0;
            const QString text = QStringLiteral("%1%").arg(progress, 0, 'f', 1);
            qDebug() << "[ConversionJob] Progress:" << text << "(" << packets << "packets)";
            postProgress(text, progress);
        }

        if (!decoder.sendPacket(packet.get(), &error))
            return fail(error);
        if (!drainDecoder(decoder, writer, &error))
            return fail(error);
    }
    av_packet_unref(packet.get());

    // ── Finalizing ───────────────────────────────────────────────────
    setState(State::Finalizing);
    if (!decoder.sendPacket(nullptr, &error) || !drainDecoder(decoder, writer, &error))
        return fail(error);

    if (!writer.finalize(&error))
        return fail(error);

    result.success        = true;
    result.packetCount    = packets;
    result.samplesWritten = writer.samplesWritten();
    setState(State::Succeeded);

    qInfo() << "[ConversionJob] Converted to mono:" << m_outputPath
            << "packets:" << packets
            << "samples:" << result.samplesWritten
            << "in" << timer.elapsed() << "ms";

    postProgress(QStringLiteral("Conversion complete. Total packets: %1").arg(packets), 100.0);
    postFinished(result);
    return result;
}

bool ConversionJob::drainDecoder(AudioDecoder& decoder, WaveWriter& writer,
                                 ConversionError* error)
{
    DecodedBuffer buffer;
    for (;;) {
        switch (decoder.receiveBuffer(&buffer, error)) {
        case AudioDecoder::ReceiveStatus::Buffer:
            if (MonoDownmixer::process(buffer, writer, error) < 0)
                return false;
            break;
        case AudioDecoder::ReceiveStatus::Drained:
            return true;
        case AudioDecoder::ReceiveStatus::Failed:
            return false;
        }
    }
}

// ── Notifications ───────────────────────────────────────────────────
void ConversionJob::postProgress(const QString& message, double percent)
{
    {
        QMutexLocker locker(&m_progressMutex);
        m_pendingMessage = message;
        m_pendingPercent = percent;
        if (m_progressQueued)
            return;
        m_progressQueued = true;
    }

    QMetaObject::invokeMethod(this, [this]() {
        QString message;
        double percent = -1.0;
        {
            QMutexLocker locker(&m_progressMutex);
            message = m_pendingMessage;
            percent = m_pendingPercent;
            m_progressQueued = false;
        }
        emit progressChanged(message, percent);
    }, Qt::QueuedConnection);
}

void ConversionJob::postFinished(const ConversionResult& result)
{
    QMetaObject::invokeMethod(this, [this, result]() {
        emit finished(result);
    }, Qt::QueuedConnection);
}
