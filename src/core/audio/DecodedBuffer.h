#pragma once

#include <QVarLengthArray>

enum class SampleKind {
    Unsigned8,
    Unsigned16,
    Unsigned24,
    Unsigned32,
    Signed8,
    Signed16,
    Signed24,
    Signed32,
    Float32,
    Float64,
    Unsupported
};

// Non-owning view of one decoded frame. Valid until the producing decoder
// is asked for the next buffer.
//
// Sample i of channel ch lives at channel<T>(ch)[i * stride]: planar data
// has one base pointer per channel and stride 1, interleaved data has the
// base pointers offset by one sample each and stride == channels.
struct DecodedBuffer {
    SampleKind kind     = SampleKind::Unsupported;
    int        channels = 0;
    int        frames   = 0;
    int        stride   = 1;
    QVarLengthArray<const void*, 8> planes;

    template<typename T>
    const T* channel(int ch) const { return static_cast<const T*>(planes[ch]); }
};
