#include "AudioInspector.h"
#include "CountingSource.h"
#include "MediaDemuxer.h"

#include <QDebug>

std::optional<AudioTrackDescriptor> AudioInspector::inspect(const QString& filePath,
                                                            ConversionError* error)
{
    CountingSource source;
    if (!source.open(filePath, error))
        return std::nullopt;

    MediaDemuxer demuxer;
    if (!demuxer.open(source, error))
        return std::nullopt;

    std::optional<TrackInfo> track = demuxer.selectDefaultTrack(error);
    if (!track)
        return std::nullopt;

    auto descriptor = describe(*track, error);
    if (descriptor) {
        qDebug() << "[AudioInspector]" << filePath << demuxer.formatName()
                 << track->codecName << summary(*descriptor);
    }
    return descriptor;
}

std::optional<AudioTrackDescriptor> AudioInspector::describe(const TrackInfo& track,
                                                             ConversionError* error)
{
    if (track.descriptor.sampleRate <= 0) {
        setError(error, ConversionError::UnknownSampleRate,
                 QStringLiteral("Unknown sample rate"));
        return std::nullopt;
    }
    return track.descriptor;
}

QString AudioInspector::summary(const AudioTrackDescriptor& descriptor)
{
    const auto duration = descriptor.durationSecs();
    return QStringLiteral("Channels: %1, Sample Rate: %2 Hz, Bits: %3, Duration: %4")
        .arg(descriptor.channels)
        .arg(descriptor.sampleRate)
        .arg(descriptor.bitsPerSample)
        .arg(duration ? QStringLiteral("%1s").arg(*duration, 0, 'f', 2)
                      : QStringLiteral("Unknown"));
}
