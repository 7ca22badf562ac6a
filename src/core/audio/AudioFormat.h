#pragma once
#include <QString>
#include <cstdint>
#include <optional>

struct AudioTrackDescriptor {
    int      channels      = 0;
    int      sampleRate    = 0;
    int      bitsPerSample = 16;
    std::optional<int64_t> totalFrames;

    std::optional<double> durationSecs() const
    {
        if (!totalFrames || sampleRate <= 0)
            return std::nullopt;
        return static_cast<double>(*totalFrames) / sampleRate;
    }
};

// One stream as discovered by MediaDemuxer. codecId/mediaType carry the raw
// libav enum values so this header stays free of FFmpeg includes.
struct TrackInfo {
    int     id        = -1;
    int     codecId   = 0;     // AV_CODEC_ID_NONE
    int     mediaType = -1;    // AVMEDIA_TYPE_UNKNOWN
    QString codecName;
    AudioTrackDescriptor descriptor;
};
