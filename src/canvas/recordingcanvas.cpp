/*
 * recordingcanvas.cpp — PageCanvas backend that records draw operations
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "recordingcanvas.h"

QList<DrawOp> RecordedPage::textOps() const
{
    QList<DrawOp> result;
    for (const DrawOp &op : ops) {
        if (op.kind == DrawOp::Text)
            result.append(op);
    }
    return result;
}

QStringList RecordedPage::texts() const
{
    QStringList result;
    for (const DrawOp &op : ops) {
        if (op.kind == DrawOp::Text)
            result.append(op.text);
    }
    return result;
}

bool RecordingCanvas::open()
{
    if (m_open) {
        setError(QStringLiteral("canvas is already open"));
        return false;
    }
    clearError();
    m_pages.clear();
    m_pageCount = 0;
    m_pageOpen = false;
    m_aborted = false;
    m_open = true;
    ++m_openCount;
    return true;
}

bool RecordingCanvas::close(bool aborted)
{
    if (!m_open)
        return false;
    m_open = false;
    m_pageOpen = false;
    m_aborted = aborted;
    return !aborted && !hasError();
}

bool RecordingCanvas::beginPage()
{
    if (!m_open || m_pageOpen) {
        setError(QStringLiteral("beginPage() without a closed page on an open canvas"));
        return false;
    }
    m_pages.append(RecordedPage());
    m_pageOpen = true;
    ++m_pageCount;
    return true;
}

bool RecordingCanvas::endPage()
{
    if (!m_pageOpen) {
        setError(QStringLiteral("endPage() without an open page"));
        return false;
    }
    m_pageOpen = false;
    return true;
}

void RecordingCanvas::record(const DrawOp &op)
{
    if (!m_pageOpen) {
        setError(QStringLiteral("draw outside of a page"));
        return;
    }
    m_pages.last().ops.append(op);
}

void RecordingCanvas::drawText(qreal x, qreal y, const QString &text)
{
    DrawOp op;
    op.kind = DrawOp::Text;
    op.text = text;
    op.p1 = QPointF(x, y);
    op.style = m_style;
    record(op);
}

bool RecordingCanvas::drawImage(const QRectF &rect, const Report::ImageBlock &image)
{
    DrawOp op;
    op.kind = DrawOp::Image;
    op.text = image.source;
    op.rect = rect;
    op.style = m_style;
    record(op);
    return m_pageOpen;
}

void RecordingCanvas::drawLine(const QPointF &p1, const QPointF &p2,
                               const QColor &color, qreal width)
{
    DrawOp op;
    op.kind = DrawOp::Line;
    op.p1 = p1;
    op.p2 = p2;
    op.stroke = color;
    op.strokeWidth = width;
    op.style = m_style;
    record(op);
}

void RecordingCanvas::drawRect(const QRectF &rect, const QColor &fill,
                               const QColor &stroke, qreal strokeWidth)
{
    DrawOp op;
    op.kind = DrawOp::Rect;
    op.rect = rect;
    op.fill = fill;
    op.stroke = stroke;
    op.strokeWidth = strokeWidth;
    op.style = m_style;
    record(op);
}
