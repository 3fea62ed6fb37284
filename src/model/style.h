/*
 * style.h — Immutable text style value (font, size, colour)
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_STYLE_H
#define REPORTFLOW_STYLE_H

#include <QColor>
#include <QJsonObject>
#include <QString>

namespace Report {

class Style
{
public:
    Style() = default;
    Style(const QString &fontName, qreal fontSize, const QColor &color)
        : m_fontName(fontName)
        , m_fontSize(fontSize)
        , m_color(color)
    {
    }

    QString fontName() const { return m_fontName; }
    qreal fontSize() const { return m_fontSize; }
    QColor color() const { return m_color; }

    // Derived copies; a Style itself is never mutated.
    Style withFont(const QString &fontName) const;
    Style withSize(qreal fontSize) const;
    Style withColor(const QColor &color) const;

    bool isValid() const;

    bool operator==(const Style &other) const
    {
        return m_fontName == other.m_fontName
            && m_fontSize == other.m_fontSize
            && m_color == other.m_color;
    }
    bool operator!=(const Style &other) const { return !(*this == other); }

    static Style fromJson(const QJsonObject &obj, const Style &fallback = Style());
    QJsonObject toJson() const;

private:
    QString m_fontName = QStringLiteral("Helvetica");
    qreal m_fontSize = 10.0;
    QColor m_color = QColor(0x33, 0x33, 0x33);
};

} // namespace Report

#endif // REPORTFLOW_STYLE_H
