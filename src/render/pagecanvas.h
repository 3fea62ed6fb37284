/*
 * pagecanvas.h — Base class for page drawing backends
 *
 * Declares the primitives the layout engine draws with.  Backends (PDF
 * output, the recording canvas used for page counting and tests) only
 * implement the primitives; pagination lives entirely in the engine.
 *
 * Coordinates are in points with the origin at the bottom-left corner
 * of the page and y growing upward, as in PDF.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_PAGECANVAS_H
#define REPORTFLOW_PAGECANVAS_H

#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include "contentblock.h"
#include "style.h"

class PageCanvas
{
public:
    virtual ~PageCanvas();

    PageCanvas(const PageCanvas &) = delete;
    PageCanvas &operator=(const PageCanvas &) = delete;

    // --- Lifecycle ---

    /// Acquire the output.  Must be balanced by close() on every path.
    virtual bool open() = 0;

    /// Release the output.  With aborted = true the artifact is discarded.
    virtual bool close(bool aborted = false) = 0;

    virtual bool beginPage() = 0;
    virtual bool endPage() = 0;

    // --- Drawing primitives ---

    /// Draw one line of text with its baseline at y, using the current style.
    virtual void drawText(qreal x, qreal y, const QString &text) = 0;

    /// Draw an image into rect; rect.top() is the lower edge in page space.
    virtual bool drawImage(const QRectF &rect, const Report::ImageBlock &image) = 0;

    virtual void drawLine(const QPointF &p1, const QPointF &p2,
                          const QColor &color, qreal width = 0.5) = 0;

    /// Fill and/or stroke a rectangle (invalid colours are skipped).
    virtual void drawRect(const QRectF &rect, const QColor &fill,
                          const QColor &stroke = QColor(),
                          qreal strokeWidth = 0) = 0;

    // --- State ---

    void setStyle(const Report::Style &style) { m_style = style; }
    Report::Style style() const { return m_style; }

    void setPageSize(const QSizeF &size) { m_pageSize = size; }
    QSizeF pageSize() const { return m_pageSize; }

    /// Advance width of text in the current style.
    qreal textWidth(const QString &text) const;

    /// Pages begun since open().
    int pageCount() const { return m_pageCount; }

    bool hasError() const { return !m_errorString.isEmpty(); }
    QString errorString() const { return m_errorString; }

protected:
    PageCanvas() = default;

    void setError(const QString &message);
    void clearError() { m_errorString.clear(); }

    Report::Style m_style;
    QSizeF m_pageSize{612.0, 792.0};
    int m_pageCount = 0;
    bool m_pageOpen = false;

private:
    QString m_errorString;
};

#endif // REPORTFLOW_PAGECANVAS_H
