/*
 * pagecanvas.cpp — Base class for page drawing backends
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagecanvas.h"
#include "standardfonts.h"

#include <QDebug>

PageCanvas::~PageCanvas() = default;

qreal PageCanvas::textWidth(const QString &text) const
{
    return StandardFonts::textWidth(m_style.fontName(), m_style.fontSize(), text);
}

void PageCanvas::setError(const QString &message)
{
    if (m_errorString.isEmpty()) {
        qWarning() << "PageCanvas:" << message;
        m_errorString = message;
    }
}
