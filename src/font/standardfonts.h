/*
 * standardfonts.h — PDF base-14 fonts: names, WinAnsi encoding, metrics
 *
 * Reports are drawn with the standard Type 1 fonts every PDF viewer
 * ships, so nothing is embedded.  Widths are only needed to position
 * centered and right-aligned lines; text is never wrapped.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_STANDARDFONTS_H
#define REPORTFLOW_STANDARDFONTS_H

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace StandardFonts {

// Names accepted as-is by resolve(), e.g. "Helvetica-Bold", "Times-Italic".
QStringList fontNames();
bool isStandardFont(const QString &name);

// The base font name to write into the PDF; unknown names map to Helvetica.
QString resolve(const QString &name);

// Advance width in points of text set in the given font and size.
qreal textWidth(const QString &fontName, qreal fontSize, const QString &text);

// WinAnsiEncoding bytes; characters outside the encoding become '?'.
QByteArray toWinAnsi(const QString &text);

} // namespace StandardFonts

#endif // REPORTFLOW_STANDARDFONTS_H
