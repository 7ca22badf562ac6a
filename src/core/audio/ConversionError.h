#pragma once

#include <QString>
#include <QMetaType>

struct ConversionError {
    enum Kind {
        None,
        IoOpenError,
        IoMetadataError,
        UnsupportedFormat,
        NoSupportedTrack,
        UnknownSampleRate,
        UnsupportedCodec,
        OutputCreateError,
        DecodeError,
        WriteError,
        FinalizeError,
        Cancelled
    };

    Kind    kind = None;
    QString message;

    bool isError() const { return kind != None; }

    static QString kindName(Kind kind);
};

// Fills *error when the caller asked for it. Returns false so failure paths
// can be written as `return setError(error, ...);`.
bool setError(ConversionError* error, ConversionError::Kind kind, const QString& message);

// Human-readable text for a negative libav return code.
QString avErrorString(int errnum);

struct ConversionResult {
    bool            success = false;
    QString         inputPath;
    QString         outputPath;
    ConversionError error;
    int             packetCount = 0;
    qint64          samplesWritten = 0;
};

Q_DECLARE_METATYPE(ConversionError)
Q_DECLARE_METATYPE(ConversionResult)
