/*
 * pagelayout.cpp — JSON serialization for PageLayout
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagelayout.h"

#include <QDebug>
#include <QPageSize>

// ---------------------------------------------------------------------------
// fromJson / toJson for page layout
// ---------------------------------------------------------------------------

PageLayout PageLayout::fromJson(const QJsonObject &obj)
{
    PageLayout pl;

    if (obj.contains(QLatin1String("pageSize"))) {
        const QJsonValue v = obj.value(QLatin1String("pageSize"));
        if (v.isObject()) {
            QJsonObject s = v.toObject();
            pl.pageSize = QSizeF(s.value(QLatin1String("width")).toDouble(kA4Width),
                                 s.value(QLatin1String("height")).toDouble(kA4Height));
        } else {
            QString sizeStr = v.toString();
            QPageSize::PageSizeId id = QPageSize::A4;
            if (sizeStr == QLatin1String("Letter"))      id = QPageSize::Letter;
            else if (sizeStr == QLatin1String("A5"))      id = QPageSize::A5;
            else if (sizeStr == QLatin1String("Legal"))   id = QPageSize::Legal;
            else if (sizeStr == QLatin1String("B5"))      id = QPageSize::B5;
            else if (sizeStr != QLatin1String("A4"))
                qWarning() << "PageLayout: unknown page size" << sizeStr << "- using A4";
            pl.pageSize = id == QPageSize::A4 ? QSizeF(kA4Width, kA4Height)
                                              : QPageSize(id).size(QPageSize::Point);
        }
        if (obj.value(QLatin1String("orientation")).toString() == QLatin1String("landscape"))
            pl.pageSize.transpose();
    }
    if (obj.contains(QLatin1String("margins"))) {
        QJsonObject m = obj.value(QLatin1String("margins")).toObject();
        pl.margins = QMarginsF(
            m.value(QLatin1String("left")).toDouble(kDefaultMargin),
            m.value(QLatin1String("top")).toDouble(kDefaultMargin),
            m.value(QLatin1String("right")).toDouble(kDefaultMargin),
            m.value(QLatin1String("bottom")).toDouble(kDefaultMargin));
    }
    return pl;
}

QJsonObject PageLayout::toJson() const
{
    QJsonObject obj;

    QJsonObject size;
    size[QLatin1String("width")] = pageSize.width();
    size[QLatin1String("height")] = pageSize.height();
    obj[QLatin1String("pageSize")] = size;

    QJsonObject m;
    m[QLatin1String("left")] = margins.left();
    m[QLatin1String("top")] = margins.top();
    m[QLatin1String("right")] = margins.right();
    m[QLatin1String("bottom")] = margins.bottom();
    obj[QLatin1String("margins")] = m;

    return obj;
}
