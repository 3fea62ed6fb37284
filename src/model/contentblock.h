/*
 * contentblock.h — Placeable report content (std::variant)
 *
 * Blocks arrive fully prepared: text is already split into lines and
 * images are already rendered.  The layout engine only needs each
 * block's height and never measures or wraps anything itself.
 *
 * NOTE: Qt GUI headers (QColor, QImage) must be included BEFORE
 * opening the Report namespace to avoid ADL issues with Qt6 macros.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_CONTENTBLOCK_H
#define REPORTFLOW_CONTENTBLOCK_H

#include <QColor>
#include <QImage>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>
#include <variant>

#include "style.h"

namespace Report {

struct TextLines {
    QStringList lines;
    Style style;
    qreal lineHeight = 15.0;
    Qt::Alignment alignment = Qt::AlignLeft; // AlignLeft, AlignHCenter or AlignRight
    std::optional<qreal> x;                  // unset = left margin
};

struct ImageBlock {
    QString source;          // path of the rendered raster
    QImage image;            // preloaded handle; takes precedence over source
    std::optional<qreal> x;  // unset = left margin
    qreal width = 0;
    qreal height = 0;
};

struct TableBlock {
    QStringList header;           // empty = no header row
    QList<QStringList> rows;
    QList<qreal> columnWidths;
    qreal rowHeight = 18.0;
    std::optional<qreal> x;       // unset = left margin

    QColor headerBackground = QColor(0x45, 0x7b, 0x9d);
    QColor bodyBackground;        // invalid = none
    QColor gridColor = QColor(0xa8, 0xda, 0xdc);
    qreal gridWidth = 0.5;

    static constexpr qreal kCellPadding = 4.0;

    bool hasHeader() const { return !header.isEmpty(); }
    qreal width() const;
};

struct Spacer {
    qreal height = 0;
};

using ContentBlock = std::variant<
    TextLines,
    ImageBlock,
    TableBlock,
    Spacer
>;

// Total vertical extent of a block in points.
qreal blockHeight(const ContentBlock &block);

// Short human-readable kind ("text", "image", "table", "spacer") for messages.
QString blockKind(const ContentBlock &block);

// Empty string if the block is well formed, otherwise the reason it is not.
QString validateBlock(const ContentBlock &block);

} // namespace Report

#endif // REPORTFLOW_CONTENTBLOCK_H
