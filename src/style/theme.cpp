/*
 * theme.cpp — Role name → text style mapping
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "theme.h"

#include <QJsonObject>

namespace Report {

Style Theme::style(const QString &role) const
{
    auto it = styles.constFind(role);
    if (it != styles.constEnd())
        return it.value();
    return styles.value(Roles::Body);
}

QStringList Theme::requiredRoles()
{
    return {Roles::Body, Roles::SectionTitle, Roles::Footer,
            Roles::TableHeader, Roles::TableCell};
}

QStringList Theme::missingRoles() const
{
    QStringList missing;
    const QStringList roles = requiredRoles();
    for (const QString &role : roles) {
        auto it = styles.constFind(role);
        if (it == styles.constEnd() || !it.value().isValid())
            missing.append(role);
    }
    return missing;
}

Theme Theme::defaultTheme()
{
    Theme theme;
    theme.id = QStringLiteral("default");
    theme.name = QStringLiteral("Default");

    const QColor primary(0x1e, 0x4d, 0x79);
    const QColor text(0x33, 0x33, 0x33);

    theme.setStyle(Roles::Body,
                   Style(QStringLiteral("Helvetica"), 10.0, text));
    theme.setStyle(Roles::SectionTitle,
                   Style(QStringLiteral("Helvetica-Bold"), 16.0, primary));
    theme.setStyle(Roles::Footer,
                   Style(QStringLiteral("Helvetica-Oblique"), 8.0, QColor(0x66, 0x66, 0x66)));
    theme.setStyle(Roles::TableHeader,
                   Style(QStringLiteral("Helvetica-Bold"), 10.0, QColor(0xff, 0xff, 0xff)));
    theme.setStyle(Roles::TableCell,
                   Style(QStringLiteral("Helvetica"), 9.0, text));
    return theme;
}

// ---------------------------------------------------------------------------
// JSON serialization
// ---------------------------------------------------------------------------

Theme Theme::fromJson(const QJsonObject &obj)
{
    Theme theme;

    theme.id   = obj.value(QLatin1String("id")).toString();
    theme.name = obj.value(QLatin1String("name")).toString();

    QJsonObject stylesObj = obj.value(QLatin1String("styles")).toObject();
    for (auto it = stylesObj.begin(); it != stylesObj.end(); ++it)
        theme.styles.insert(it.key(), Style::fromJson(it.value().toObject()));

    return theme;
}

QJsonObject Theme::toJson() const
{
    QJsonObject obj;

    if (!id.isEmpty())
        obj[QLatin1String("id")] = id;
    obj[QLatin1String("name")]    = name;
    obj[QLatin1String("version")] = 1;
    obj[QLatin1String("type")]    = QStringLiteral("reportTheme");

    QJsonObject stylesObj;
    for (auto it = styles.constBegin(); it != styles.constEnd(); ++it)
        stylesObj[it.key()] = it.value().toJson();
    obj[QLatin1String("styles")] = stylesObj;

    return obj;
}

} // namespace Report
