#ifndef REPORTFLOW_PAGELAYOUT_H
#define REPORTFLOW_PAGELAYOUT_H

#include <QJsonObject>
#include <QMarginsF>
#include <QPageSize>
#include <QSizeF>
#include <QString>

// Page geometry and per-page decoration for a report.  All lengths are
// in points (1/72 inch); the vertical axis grows upward from the page
// bottom, as in PDF.
struct PageLayout
{
    QSizeF pageSize = QPageSize(QPageSize::Letter).size(QPageSize::Point); // 612 x 792
    QMarginsF margins{50.0, 50.0, 50.0, 50.0}; // left, top, right, bottom

    qreal lineHeight = 15.0;   // default advance for text lines
    qreal titleHeight = 30.0;  // height consumed by a section title

    // Footer, drawn centered on every finalized page.
    // Fields: {page} {pages} {title} {section} {date} {date:fmt}
    QString footerText;
    qreal footerOffset = 20.0; // baseline distance above the page bottom

    // Drawn at the left margin after a break inside a section.
    QString continuationText{QStringLiteral("{section} (continued)")};
    qreal continuationOffset = 30.0; // baseline distance below the page top

    qreal pageWidth() const { return pageSize.width(); }
    qreal pageHeight() const { return pageSize.height(); }

    // Top of the content area (where the cursor starts on each page)
    qreal contentTop() const { return pageSize.height() - margins.top(); }
    qreal contentBottom() const { return margins.bottom(); }
    qreal usableHeight() const { return contentTop() - contentBottom(); }
    qreal contentWidth() const
    {
        return pageSize.width() - margins.left() - margins.right();
    }

    // Empty string if the geometry is usable, otherwise the first problem found.
    QString validate() const;

    static PageLayout fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

#endif // REPORTFLOW_PAGELAYOUT_H
