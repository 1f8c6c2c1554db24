#ifndef FOLIO_PAGELAYOUT_H
#define FOLIO_PAGELAYOUT_H

#include <QJsonObject>
#include <QMarginsF>
#include <QRectF>
#include <QSizeF>

struct PageLayout
{
    // All values in points (1/72 inch)
    static constexpr qreal kA4Width = 595.0;
    static constexpr qreal kA4Height = 842.0;
    static constexpr qreal kDefaultMargin = 56.7; // 20 mm

    QSizeF pageSize{kA4Width, kA4Height};
    QMarginsF margins{kDefaultMargin, kDefaultMargin, kDefaultMargin, kDefaultMargin};

    // Page size minus margins, never negative
    QSizeF contentSize() const
    {
        return QSizeF(qMax(qreal(0), pageSize.width() - margins.left() - margins.right()),
                      qMax(qreal(0), pageSize.height() - margins.top() - margins.bottom()));
    }

    QRectF contentRect() const
    {
        return QRectF(QPointF(margins.left(), margins.top()), contentSize());
    }

    bool isValid() const
    {
        const QSizeF c = contentSize();
        return c.width() > 0 && c.height() > 0;
    }

    static PageLayout fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    bool operator==(const PageLayout &o) const
    {
        return pageSize == o.pageSize && margins == o.margins;
    }
};

#endif // FOLIO_PAGELAYOUT_H
