/*
 * reporterror.h — Error reporting for configuration, layout and output
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_REPORTERROR_H
#define REPORTFLOW_REPORTERROR_H

#include <QString>

namespace Report {

enum class ErrorCode {
    NoError,
    BlockTooLargeError,        // block cannot fit even on an empty page
    CanvasIOError,             // output could not be opened, written or flushed
    InvalidConfigurationError, // geometry, theme or block definition rejected
};

struct Error {
    ErrorCode code = ErrorCode::NoError;
    QString message;
    int sectionIndex = -1; // 0-based, -1 = not tied to a section
    int blockIndex = -1;   // 0-based within the section, -1 = section title / none

    bool isError() const { return code != ErrorCode::NoError; }

    // "BlockTooLargeError: section 2, block 5: ..." style one-liner for logs.
    QString toString() const;

    static Error none() { return {}; }
    static Error make(ErrorCode code, const QString &message,
                      int sectionIndex = -1, int blockIndex = -1)
    {
        return {code, message, sectionIndex, blockIndex};
    }
};

QString errorCodeName(ErrorCode code);

} // namespace Report

#endif // REPORTFLOW_REPORTERROR_H
