/*
 * pagelayout.cpp — Validation and JSON serialization for PageLayout
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagelayout.h"

#include <QJsonObject>

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

QString PageLayout::validate() const
{
    if (pageSize.width() <= 0 || pageSize.height() <= 0)
        return QStringLiteral("page size must be positive (got %1 x %2)")
            .arg(pageSize.width()).arg(pageSize.height());

    if (margins.left() <= 0 || margins.top() <= 0
        || margins.right() <= 0 || margins.bottom() <= 0)
        return QStringLiteral("margins must be positive");

    if (margins.top() + margins.bottom() >= pageSize.height())
        return QStringLiteral("top and bottom margins (%1 + %2) leave no room on a %3 pt page")
            .arg(margins.top()).arg(margins.bottom()).arg(pageSize.height());

    if (margins.left() + margins.right() >= pageSize.width())
        return QStringLiteral("left and right margins (%1 + %2) leave no room on a %3 pt page")
            .arg(margins.left()).arg(margins.right()).arg(pageSize.width());

    if (lineHeight <= 0)
        return QStringLiteral("line height must be positive");
    if (titleHeight < 0)
        return QStringLiteral("title height must not be negative");
    if (titleHeight > usableHeight())
        return QStringLiteral("title height exceeds the usable page height");

    if (footerOffset < 0 || footerOffset >= pageSize.height())
        return QStringLiteral("footer offset must lie within the page");
    if (continuationOffset < 0 || continuationOffset >= pageSize.height())
        return QStringLiteral("continuation header offset must lie within the page");

    // Decorations are drawn inside the margins, never over content
    if (!footerText.isEmpty() && footerOffset > margins.bottom())
        return QStringLiteral("footer offset (%1) must not exceed the bottom margin (%2)")
            .arg(footerOffset).arg(margins.bottom());
    if (!continuationText.isEmpty() && continuationOffset > margins.top())
        return QStringLiteral("continuation header offset (%1) must not exceed the top margin (%2)")
            .arg(continuationOffset).arg(margins.top());

    return {};
}

// ---------------------------------------------------------------------------
// fromJson / toJson
// ---------------------------------------------------------------------------

static QSizeF pageSizeFromName(const QString &name, bool *ok)
{
    QPageSize::PageSizeId id = QPageSize::Letter;
    *ok = true;
    if (name == QLatin1String("Letter"))      id = QPageSize::Letter;
    else if (name == QLatin1String("A4"))     id = QPageSize::A4;
    else if (name == QLatin1String("A5"))     id = QPageSize::A5;
    else if (name == QLatin1String("Legal"))  id = QPageSize::Legal;
    else if (name == QLatin1String("B5"))     id = QPageSize::B5;
    else                                      *ok = false;
    return QPageSize(id).size(QPageSize::Point);
}

static QString pageSizeName(const QSizeF &size)
{
    static const QPageSize::PageSizeId known[] = {
        QPageSize::Letter, QPageSize::A4, QPageSize::A5,
        QPageSize::Legal, QPageSize::B5,
    };
    for (QPageSize::PageSizeId id : known) {
        if (QPageSize(id).size(QPageSize::Point) == size)
            return QPageSize(id).key();
    }
    return {};
}

PageLayout PageLayout::fromJson(const QJsonObject &obj)
{
    PageLayout pl;

    if (obj.contains(QLatin1String("pageSize"))) {
        bool ok = false;
        QSizeF size = pageSizeFromName(obj.value(QLatin1String("pageSize")).toString(), &ok);
        if (ok)
            pl.pageSize = size;
    }
    // Explicit dimensions win over a named size
    if (obj.contains(QLatin1String("width")))
        pl.pageSize.setWidth(obj.value(QLatin1String("width")).toDouble());
    if (obj.contains(QLatin1String("height")))
        pl.pageSize.setHeight(obj.value(QLatin1String("height")).toDouble());

    if (obj.contains(QLatin1String("margins"))) {
        QJsonObject m = obj.value(QLatin1String("margins")).toObject();
        pl.margins = QMarginsF(
            m.value(QLatin1String("left")).toDouble(pl.margins.left()),
            m.value(QLatin1String("top")).toDouble(pl.margins.top()),
            m.value(QLatin1String("right")).toDouble(pl.margins.right()),
            m.value(QLatin1String("bottom")).toDouble(pl.margins.bottom()));
    }

    pl.lineHeight  = obj.value(QLatin1String("lineHeight")).toDouble(pl.lineHeight);
    pl.titleHeight = obj.value(QLatin1String("titleHeight")).toDouble(pl.titleHeight);

    if (obj.contains(QLatin1String("footer"))) {
        QJsonObject f = obj.value(QLatin1String("footer")).toObject();
        pl.footerText   = f.value(QLatin1String("text")).toString(pl.footerText);
        pl.footerOffset = f.value(QLatin1String("offset")).toDouble(pl.footerOffset);
    }
    if (obj.contains(QLatin1String("continuation"))) {
        QJsonObject c = obj.value(QLatin1String("continuation")).toObject();
        pl.continuationText   = c.value(QLatin1String("text")).toString(pl.continuationText);
        pl.continuationOffset = c.value(QLatin1String("offset")).toDouble(pl.continuationOffset);
    }

    return pl;
}

QJsonObject PageLayout::toJson() const
{
    QJsonObject obj;

    QString name = pageSizeName(pageSize);
    if (!name.isEmpty())
        obj[QLatin1String("pageSize")] = name;
    obj[QLatin1String("width")]  = pageSize.width();
    obj[QLatin1String("height")] = pageSize.height();

    QJsonObject m;
    m[QLatin1String("left")]   = margins.left();
    m[QLatin1String("top")]    = margins.top();
    m[QLatin1String("right")]  = margins.right();
    m[QLatin1String("bottom")] = margins.bottom();
    obj[QLatin1String("margins")] = m;

    obj[QLatin1String("lineHeight")]  = lineHeight;
    obj[QLatin1String("titleHeight")] = titleHeight;

    QJsonObject f;
    f[QLatin1String("text")]   = footerText;
    f[QLatin1String("offset")] = footerOffset;
    obj[QLatin1String("footer")] = f;

    QJsonObject c;
    c[QLatin1String("text")]   = continuationText;
    c[QLatin1String("offset")] = continuationOffset;
    obj[QLatin1String("continuation")] = c;

    return obj;
}
