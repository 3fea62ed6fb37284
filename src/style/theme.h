/*
 * theme.h — Role name → text style mapping
 *
 * The layout engine looks up the roles listed in requiredRoles() when
 * drawing section titles, table cells and the page footer.  Content
 * blocks carry their own Style values and never go through the theme.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_THEME_H
#define REPORTFLOW_THEME_H

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "style.h"

namespace Report {

namespace Roles {
inline const QString Body         = QStringLiteral("body");
inline const QString SectionTitle = QStringLiteral("sectionTitle");
inline const QString Footer       = QStringLiteral("footer");
inline const QString TableHeader  = QStringLiteral("tableHeader");
inline const QString TableCell    = QStringLiteral("tableCell");
} // namespace Roles

class Theme
{
public:
    Theme() = default;

    QString id;          // kebab-case identifier, e.g. "insight-blue"
    QString name;        // display name

    QHash<QString, Style> styles; // role -> style

    bool contains(const QString &role) const { return styles.contains(role); }
    Style style(const QString &role) const;
    void setStyle(const QString &role, const Style &style) { styles.insert(role, style); }

    // Roles from requiredRoles() that are absent or carry an invalid style.
    QStringList missingRoles() const;

    static QStringList requiredRoles();
    static Theme defaultTheme();

    bool operator==(const Theme &other) const
    {
        return id == other.id && styles == other.styles;
    }

    static Theme fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

} // namespace Report

#endif // REPORTFLOW_THEME_H
