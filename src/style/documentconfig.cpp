/*
 * documentconfig.cpp — Document-wide layout settings
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentconfig.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

Style DocumentConfig::effectiveDefaultStyle() const
{
    if (hyphenationLanguage.isEmpty() || defaultStyle.hasLanguage())
        return defaultStyle;
    return defaultStyle.withLanguage(hyphenationLanguage);
}

DocumentConfig DocumentConfig::fromJson(const QJsonObject &obj)
{
    DocumentConfig config;
    if (obj.contains(QLatin1String("page")))
        config.pageLayout = PageLayout::fromJson(obj.value(QLatin1String("page")).toObject());
    if (obj.contains(QLatin1String("defaultStyle")))
        config.defaultStyle = Style::fromJson(obj.value(QLatin1String("defaultStyle")).toObject());
    if (obj.contains(QLatin1String("minimumRemainingHeight"))) {
        qreal h = obj.value(QLatin1String("minimumRemainingHeight"))
                      .toDouble(kDefaultMinimumRemainingHeight);
        if (h > 0)
            config.minimumRemainingHeight = h;
        else
            qWarning() << "DocumentConfig: minimumRemainingHeight must be positive, got" << h;
    }
    config.hyphenationLanguage = obj.value(QLatin1String("hyphenation")).toString();
    return config;
}

QJsonObject DocumentConfig::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("page")] = pageLayout.toJson();
    obj[QLatin1String("defaultStyle")] = defaultStyle.toJson();
    obj[QLatin1String("minimumRemainingHeight")] = minimumRemainingHeight;
    if (!hyphenationLanguage.isEmpty())
        obj[QLatin1String("hyphenation")] = hyphenationLanguage;
    return obj;
}

bool DocumentConfig::loadFromFile(const QString &path, DocumentConfig *config,
                                  QString *errorString)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString)
            *errorString = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        if (errorString) {
            *errorString = parseError.error != QJsonParseError::NoError
                ? QStringLiteral("%1: %2 at offset %3")
                      .arg(path, parseError.errorString()).arg(parseError.offset)
                : QStringLiteral("%1: top level is not an object").arg(path);
        }
        return false;
    }

    if (config)
        *config = fromJson(doc.object());
    return true;
}
