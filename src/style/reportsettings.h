/*
 * reportsettings.h — Page layout + theme loaded together from JSON
 *
 * File format:
 *   {
 *     "pageLayout": { "pageSize": "Letter", "margins": {...}, "footer": {...} },
 *     "theme":      { "id": "...", "styles": { "body": {...}, ... } }
 *   }
 * Either key may be omitted; the built-in defaults are used instead.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_REPORTSETTINGS_H
#define REPORTFLOW_REPORTSETTINGS_H

#include <QJsonObject>
#include <QString>

#include <optional>

#include "pagelayout.h"
#include "reporterror.h"
#include "theme.h"

struct ReportSettings
{
    PageLayout pageLayout;
    Report::Theme theme = Report::Theme::defaultTheme();

    // Geometry and theme checks; code is NoError when both are usable.
    Report::Error validate() const;

    static ReportSettings fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    // Reads and validates a settings file.  On failure returns nullopt and,
    // if error is non-null, fills it with an InvalidConfigurationError.
    static std::optional<ReportSettings> loadFromFile(const QString &path,
                                                      Report::Error *error = nullptr);
    bool saveToFile(const QString &path) const;
};

#endif // REPORTFLOW_REPORTSETTINGS_H
