#include "MonoDownmixer.h"

#include <QDebug>
#include <cmath>

// ── Normalization table ─────────────────────────────────────────────
// Signed 16/32-bit averages are written without the x32767 step.
Normalization MonoDownmixer::normalizationFor(SampleKind kind)
{
    switch (kind) {
    case SampleKind::Unsigned8:  return { 128.0f,         -1.0f, true,  true };
    case SampleKind::Unsigned16: return { 32768.0f,       -1.0f, true,  true };
    case SampleKind::Unsigned32: return { 2147483648.0f,  -1.0f, true,  true };
    case SampleKind::Signed8:    return { 128.0f,          0.0f, true,  true };
    case SampleKind::Signed16:   return { 1.0f,            0.0f, false, true };
    case SampleKind::Signed32:   return { 32768.0f,        0.0f, false, true };
    case SampleKind::Float32:
    case SampleKind::Float64:    return { 1.0f,            0.0f, true,  true };
    case SampleKind::Unsigned24:
    case SampleKind::Signed24:
    case SampleKind::Unsupported:
        break;
    }
    return { 1.0f, 0.0f, false, false };
}

int16_t MonoDownmixer::toInt16(float value)
{
    if (std::isnan(value))
        return 0;
    if (value >= 32767.0f)
        return 32767;
    if (value <= -32768.0f)
        return -32768;
    return static_cast<int16_t>(value);
}

template<typename T>
static qint64 mixFrames(const DecodedBuffer& buffer, const Normalization& norm,
                        SampleSink& sink, ConversionError* error)
{
    const float channels = static_cast<float>(buffer.channels);
    qint64 written = 0;

    for (int i = 0; i < buffer.frames; ++i) {
        const int index = i * buffer.stride;
        float sum = 0.0f;
        for (int ch = 0; ch < buffer.channels; ++ch)
            sum += static_cast<float>(buffer.channel<T>(ch)[index]) / norm.scale + norm.offset;

        float mono = sum / channels;
        if (norm.rescale)
            mono *= 32767.0f;

        if (!sink.writeSample(MonoDownmixer::toInt16(mono))) {
            setError(error, ConversionError::WriteError, QStringLiteral("Write error"));
            return -1;
        }
        ++written;
    }
    return written;
}

qint64 MonoDownmixer::process(const DecodedBuffer& buffer, SampleSink& sink,
                              ConversionError* error)
{
    const Normalization norm = normalizationFor(buffer.kind);
    if (!norm.supported || buffer.channels <= 0 || buffer.frames <= 0)
        return 0;

    switch (buffer.kind) {
    case SampleKind::Unsigned8:  return mixFrames<uint8_t>(buffer, norm, sink, error);
    case SampleKind::Unsigned16: return mixFrames<uint16_t>(buffer, norm, sink, error);
    case SampleKind::Unsigned32: return mixFrames<uint32_t>(buffer, norm, sink, error);
    case SampleKind::Signed8:    return mixFrames<int8_t>(buffer, norm, sink, error);
    case SampleKind::Signed16:   return mixFrames<int16_t>(buffer, norm, sink, error);
    case SampleKind::Signed32:   return mixFrames<int32_t>(buffer, norm, sink, error);
    case SampleKind::Float32:    return mixFrames<float>(buffer, norm, sink, error);
    case SampleKind::Float64:    return mixFrames<double>(buffer, norm, sink, error);
    default:
        return 0;
    }
}
