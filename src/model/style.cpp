/*
 * style.cpp — Immutable text style value
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "style.h"

namespace Report {

Style Style::withFont(const QString &fontName) const
{
    return Style(fontName, m_fontSize, m_color);
}

Style Style::withSize(qreal fontSize) const
{
    return Style(m_fontName, fontSize, m_color);
}

Style Style::withColor(const QColor &color) const
{
    return Style(m_fontName, m_fontSize, color);
}

bool Style::isValid() const
{
    return !m_fontName.isEmpty() && m_fontSize > 0 && m_color.isValid();
}

Style Style::fromJson(const QJsonObject &obj, const Style &fallback)
{
    QString font = obj.value(QLatin1String("font")).toString(fallback.fontName());
    qreal size = obj.value(QLatin1String("size")).toDouble(fallback.fontSize());

    QColor color = fallback.color();
    if (obj.contains(QLatin1String("color")))
        color = QColor(obj.value(QLatin1String("color")).toString());

    return Style(font, size, color);
}

QJsonObject Style::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("font")]  = m_fontName;
    obj[QLatin1String("size")]  = m_fontSize;
    obj[QLatin1String("color")] = m_color.name();
    return obj;
}

} // namespace Report
