/*
 * contentblock.cpp — Heights and validation for content blocks
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contentblock.h"

namespace Report {

qreal TableBlock::width() const
{
    qreal w = 0;
    for (qreal cw : columnWidths)
        w += cw;
    return w;
}

qreal blockHeight(const ContentBlock &block)
{
    return std::visit([](const auto &b) -> qreal {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, TextLines>) {
            return b.lines.size() * b.lineHeight;
        } else if constexpr (std::is_same_v<T, ImageBlock>) {
            return b.height;
        } else if constexpr (std::is_same_v<T, TableBlock>) {
            int rowCount = b.rows.size() + (b.hasHeader() ? 1 : 0);
            return rowCount * b.rowHeight;
        } else {
            return b.height;
        }
    }, block);
}

QString blockKind(const ContentBlock &block)
{
    return std::visit([](const auto &b) -> QString {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, TextLines>)
            return QStringLiteral("text");
        else if constexpr (std::is_same_v<T, ImageBlock>)
            return QStringLiteral("image");
        else if constexpr (std::is_same_v<T, TableBlock>)
            return QStringLiteral("table");
        else
            return QStringLiteral("spacer");
    }, block);
}

static QString validateTable(const TableBlock &table)
{
    if (table.rowHeight <= 0)
        return QStringLiteral("table row height must be positive");
    if (table.columnWidths.isEmpty())
        return QStringLiteral("table has no column widths");
    for (qreal w : table.columnWidths) {
        if (w <= 0)
            return QStringLiteral("table column widths must be positive");
    }
    if (table.header.size() > table.columnWidths.size())
        return QStringLiteral("table header has %1 cells for %2 columns")
            .arg(table.header.size()).arg(table.columnWidths.size());
    for (int i = 0; i < table.rows.size(); ++i) {
        if (table.rows[i].size() > table.columnWidths.size())
            return QStringLiteral("table row %1 has %2 cells for %3 columns")
                .arg(i).arg(table.rows[i].size()).arg(table.columnWidths.size());
    }
    return {};
}

QString validateBlock(const ContentBlock &block)
{
    return std::visit([](const auto &b) -> QString {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, TextLines>) {
            if (b.lineHeight <= 0)
                return QStringLiteral("text line height must be positive");
            if (!b.style.isValid())
                return QStringLiteral("text style is invalid");
            return {};
        } else if constexpr (std::is_same_v<T, ImageBlock>) {
            if (b.width <= 0 || b.height <= 0)
                return QStringLiteral("image size must be positive");
            if (b.image.isNull() && b.source.isEmpty())
                return QStringLiteral("image has neither a source nor a preloaded raster");
            return {};
        } else if constexpr (std::is_same_v<T, TableBlock>) {
            return validateTable(b);
        } else {
            if (b.height < 0)
                return QStringLiteral("spacer height must not be negative");
            return {};
        }
    }, block);
}

} // namespace Report
