/*
 * reportsettings.cpp — Page layout + theme loaded together from JSON
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportsettings.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

Report::Error ReportSettings::validate() const
{
    QString problem = pageLayout.validate();
    if (!problem.isEmpty())
        return Report::Error::make(Report::ErrorCode::InvalidConfigurationError, problem);

    const QStringList missing = theme.missingRoles();
    if (!missing.isEmpty())
        return Report::Error::make(
            Report::ErrorCode::InvalidConfigurationError,
            QStringLiteral("theme is missing or has invalid styles for: %1")
                .arg(missing.join(QStringLiteral(", "))));

    return Report::Error::none();
}

ReportSettings ReportSettings::fromJson(const QJsonObject &obj)
{
    ReportSettings settings;
    if (obj.contains(QLatin1String("pageLayout")))
        settings.pageLayout = PageLayout::fromJson(obj.value(QLatin1String("pageLayout")).toObject());
    if (obj.contains(QLatin1String("theme")))
        settings.theme = Report::Theme::fromJson(obj.value(QLatin1String("theme")).toObject());
    return settings;
}

QJsonObject ReportSettings::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("pageLayout")] = pageLayout.toJson();
    obj[QLatin1String("theme")]      = theme.toJson();
    return obj;
}

std::optional<ReportSettings> ReportSettings::loadFromFile(const QString &path,
                                                           Report::Error *error)
{
    auto fail = [&](const QString &message) -> std::optional<ReportSettings> {
        qWarning() << "ReportSettings:" << message;
        if (error)
            *error = Report::Error::make(Report::ErrorCode::InvalidConfigurationError, message);
        return std::nullopt;
    };

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return fail(QStringLiteral("cannot open %1: %2").arg(path, file.errorString()));

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull())
        return fail(QStringLiteral("%1: %2 at offset %3")
                        .arg(path, parseError.errorString())
                        .arg(parseError.offset));
    if (!doc.isObject())
        return fail(QStringLiteral("%1: top level is not a JSON object").arg(path));

    ReportSettings settings = fromJson(doc.object());
    Report::Error invalid = settings.validate();
    if (invalid.isError())
        return fail(QStringLiteral("%1: %2").arg(path, invalid.message));

    if (error)
        *error = Report::Error::none();
    return settings;
}

bool ReportSettings::saveToFile(const QString &path) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "ReportSettings: cannot open" << path << file.errorString();
        return false;
    }
    const QByteArray json = QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
    if (file.write(json) != json.size()) {
        qWarning() << "ReportSettings: write to" << path << "failed:" << file.errorString();
        file.cancelWriting();
        return false;
    }
    return file.commit();
}
