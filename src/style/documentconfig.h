/*
 * documentconfig.h — Document-wide layout settings
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_DOCUMENTCONFIG_H
#define FOLIO_DOCUMENTCONFIG_H

#include <QJsonObject>
#include <QString>

#include "pagelayout.h"
#include "style.h"

struct DocumentConfig
{
    static constexpr qreal kDefaultMinimumRemainingHeight = 1.0;

    PageLayout pageLayout;
    Style defaultStyle;
    // A page with less than this left is closed before the next element.
    qreal minimumRemainingHeight = kDefaultMinimumRemainingHeight;
    // Empty disables hyphenation unless a style names a language.
    QString hyphenationLanguage;

    // Default style with the document hyphenation language filled in
    Style effectiveDefaultStyle() const;

    static DocumentConfig fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    static bool loadFromFile(const QString &path, DocumentConfig *config,
                             QString *errorString = nullptr);
};

#endif // FOLIO_DOCUMENTCONFIG_H
