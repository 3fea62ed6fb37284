/*
 * cursor.h — Vertical write position on the current page
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_CURSOR_H
#define REPORTFLOW_CURSOR_H

#include <QtGlobal>

namespace Layout {

// Result of offering a block to the cursor.  drawY is the top edge of
// the block (the cursor position before it was placed).
struct Placement {
    bool fits = false;
    qreal drawY = 0;
};

// Tracks y from the top of the content area (pageHeight - topMargin)
// down to bottomMargin.  y only decreases within a page; reset() is the
// only way back up.
class Cursor
{
public:
    static constexpr qreal kEpsilon = 1e-6;

    Cursor(qreal pageHeight, qreal topMargin, qreal bottomMargin, qreal lineHeight);

    qreal y() const { return m_y; }
    qreal top() const { return m_pageHeight - m_topMargin; }
    qreal bottomMargin() const { return m_bottomMargin; }
    qreal lineHeight() const { return m_lineHeight; }

    // Place a block of the given height.  On success y moves down by
    // height; otherwise nothing changes.
    Placement advance(qreal height);

    // advance(n * lineHeight)
    Placement advanceLines(int n);

    bool canFit(qreal height) const;
    qreal remaining() const { return m_y - m_bottomMargin; }
    qreal usableHeight() const { return top() - m_bottomMargin; }
    bool isAtTop() const;

    void reset();

private:
    qreal m_pageHeight;
    qreal m_topMargin;
    qreal m_bottomMargin;
    qreal m_lineHeight;
    qreal m_y;
};

} // namespace Layout

#endif // REPORTFLOW_CURSOR_H
