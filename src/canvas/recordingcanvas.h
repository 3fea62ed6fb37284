/*
 * recordingcanvas.h — PageCanvas backend that records draw operations
 *
 * Nothing is rasterised or written.  The layout engine runs against it
 * to count pages before the real output pass (for {pages} in footers),
 * and tests inspect the recorded operations page by page.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_RECORDINGCANVAS_H
#define REPORTFLOW_RECORDINGCANVAS_H

#include "pagecanvas.h"

#include <QList>

struct DrawOp {
    enum Kind { Text, Image, Line, Rect };

    Kind kind = Text;
    QString text;            // Text: the string; Image: the source path
    QPointF p1;              // Text: baseline origin; Line: start
    QPointF p2;              // Line: end
    QRectF rect;             // Image and Rect
    Report::Style style;     // canvas style when the op was drawn
    QColor fill;
    QColor stroke;
    qreal strokeWidth = 0;
};

struct RecordedPage {
    QList<DrawOp> ops;

    QList<DrawOp> textOps() const;
    QStringList texts() const;
};

class RecordingCanvas : public PageCanvas
{
public:
    RecordingCanvas() = default;

    bool open() override;
    bool close(bool aborted = false) override;
    bool beginPage() override;
    bool endPage() override;

    void drawText(qreal x, qreal y, const QString &text) override;
    bool drawImage(const QRectF &rect, const Report::ImageBlock &image) override;
    void drawLine(const QPointF &p1, const QPointF &p2,
                  const QColor &color, qreal width = 0.5) override;
    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(),
                  qreal strokeWidth = 0) override;

    const QList<RecordedPage> &pages() const { return m_pages; }

    bool isOpen() const { return m_open; }
    bool wasAborted() const { return m_aborted; }
    int openCount() const { return m_openCount; }

private:
    void record(const DrawOp &op);

    QList<RecordedPage> m_pages;
    bool m_open = false;
    bool m_aborted = false;
    int m_openCount = 0;
};

#endif // REPORTFLOW_RECORDINGCANVAS_H
