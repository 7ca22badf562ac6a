#pragma once

#include <QtGlobal>
#include <cstdint>
#include "ConversionError.h"
#include "DecodedBuffer.h"

// Receiver of the downmixed int16 stream (WaveWriter in production).
class SampleSink {
public:
    virtual ~SampleSink() = default;

    // Returns false when the sample could not be stored.
    virtual bool writeSample(int16_t sample) = 0;
};

// Per-kind rule applied to every source sample before channel averaging:
// normalized = value / scale + offset. When rescale is set the channel
// average is multiplied by 32767 before the int16 conversion.
struct Normalization {
    float scale     = 1.0f;
    float offset    = 0.0f;
    bool  rescale   = true;
    bool  supported = true;
};

class MonoDownmixer {
public:
    static Normalization normalizationFor(SampleKind kind);

    // Truncates toward zero, saturating at the int16 limits. NaN maps to 0.
    static int16_t toInt16(float value);

    // Downmixes every frame of buffer into sink. Returns the number of
    // samples written (0 for unsupported kinds) or -1 with WriteError set
    // when the sink rejected a sample.
    static qint64 process(const DecodedBuffer& buffer, SampleSink& sink,
                          ConversionError* error = nullptr);
};
