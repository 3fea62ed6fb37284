#include "reporterror.h"

namespace Report {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NoError:                   return QStringLiteral("NoError");
    case ErrorCode::BlockTooLargeError:        return QStringLiteral("BlockTooLargeError");
    case ErrorCode::CanvasIOError:             return QStringLiteral("CanvasIOError");
    case ErrorCode::InvalidConfigurationError: return QStringLiteral("InvalidConfigurationError");
    }
    return QStringLiteral("UnknownError");
}

QString Error::toString() const
{
    QString result = errorCodeName(code);
    if (sectionIndex >= 0) {
        result += QStringLiteral(": section %1").arg(sectionIndex);
        if (blockIndex >= 0)
            result += QStringLiteral(", block %1").arg(blockIndex);
    }
    if (!message.isEmpty())
        result += QStringLiteral(": ") + message;
    return result;
}

} // namespace Report
