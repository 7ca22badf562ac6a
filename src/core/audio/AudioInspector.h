#pragma once

#include <QString>
#include <optional>
#include "AudioFormat.h"
#include "ConversionError.h"

class AudioInspector {
public:
    // Probe-only query: opens, probes and describes the default track.
    static std::optional<AudioTrackDescriptor> inspect(const QString& filePath,
                                                       ConversionError* error = nullptr);

    // Validates a probed track. A missing sample rate is an error, never guessed.
    static std::optional<AudioTrackDescriptor> describe(const TrackInfo& track,
                                                        ConversionError* error = nullptr);

    // "Channels: 2, Sample Rate: 44100 Hz, Bits: 16, Duration: 3.25s"
    static QString summary(const AudioTrackDescriptor& descriptor);
};
