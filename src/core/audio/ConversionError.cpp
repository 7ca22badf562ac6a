#include "ConversionError.h"

extern "C" {
#include <libavutil/error.h>
}

QString ConversionError::kindName(Kind kind)
{
    switch (kind) {
    case None:              return QStringLiteral("None");
    case IoOpenError:       return QStringLiteral("IoOpenError");
    case IoMetadataError:   return QStringLiteral("IoMetadataError");
    case UnsupportedFormat: return QStringLiteral("UnsupportedFormat");
    case NoSupportedTrack:  return QStringLiteral("NoSupportedTrack");
    case UnknownSampleRate: return QStringLiteral("UnknownSampleRate");
    case UnsupportedCodec:  return QStringLiteral("UnsupportedCodec");
    case OutputCreateError: return QStringLiteral("OutputCreateError");
    case DecodeError:       return QStringLiteral("DecodeError");
    case WriteError:        return QStringLiteral("WriteError");
    case FinalizeError:     return QStringLiteral("FinalizeError");
    case Cancelled:         return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

bool setError(ConversionError* error, ConversionError::Kind kind, const QString& message)
{
    if (error) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

QString avErrorString(int errnum)
{
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    if (av_strerror(errnum, buf, sizeof(buf)) < 0)
        return QStringLiteral("error %1").arg(errnum);
    return QString::fromUtf8(buf);
}
