#include "cursor.h"

#include <QtMath>

namespace Layout {

Cursor::Cursor(qreal pageHeight, qreal topMargin, qreal bottomMargin, qreal lineHeight)
    : m_pageHeight(pageHeight)
    , m_topMargin(topMargin)
    , m_bottomMargin(bottomMargin)
    , m_lineHeight(lineHeight)
    , m_y(pageHeight - topMargin)
{
}

bool Cursor::canFit(qreal height) const
{
    return m_y - height >= m_bottomMargin - kEpsilon;
}

Placement Cursor::advance(qreal height)
{
    Placement p;
    if (height < 0 || !canFit(height))
        return p;

    p.fits = true;
    p.drawY = m_y;
    m_y -= height;
    // Absorb rounding so an exact fit lands on the margin
    if (qAbs(m_y - m_bottomMargin) <= kEpsilon)
        m_y = m_bottomMargin;
    return p;
}

Placement Cursor::advanceLines(int n)
{
    return advance(n * m_lineHeight);
}

bool Cursor::isAtTop() const
{
    return qAbs(m_y - top()) <= kEpsilon;
}

void Cursor::reset()
{
    m_y = top();
}

} // namespace Layout
