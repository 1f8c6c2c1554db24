/*
 * drawcommand.h — Positioned draw commands and laid-out pages
 *
 * Coordinates are in points, page-absolute, y growing downward from
 * the top edge of the page.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_DRAWCOMMAND_H
#define FOLIO_DRAWCOMMAND_H

#include <QColor>
#include <QImage>
#include <QList>
#include <QMarginsF>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include <variant>

#include "style.h"

namespace Layout {

struct DrawText {
    QPointF baseline;   // left end of the baseline
    QString text;
    Style style;
    qreal width = 0;    // measured advance

    bool operator==(const DrawText &o) const
    {
        return baseline == o.baseline && text == o.text && style == o.style
            && qFuzzyCompare(1.0 + width, 1.0 + o.width);
    }
};

struct DrawRect {
    QRectF rect;
    QColor fill;        // invalid = no fill
    QColor stroke;      // invalid = no stroke
    qreal strokeWidth = 0;

    bool operator==(const DrawRect &o) const
    {
        return rect == o.rect && fill == o.fill && stroke == o.stroke
            && qFuzzyCompare(1.0 + strokeWidth, 1.0 + o.strokeWidth);
    }
};

struct DrawImage {
    QRectF rect;
    QImage image;       // may be null for a placeholder
    QString imageId;

    bool operator==(const DrawImage &o) const
    {
        return rect == o.rect && imageId == o.imageId && image == o.image;
    }
};

using DrawCommand = std::variant<DrawText, DrawRect, DrawImage>;
using DrawList = QList<DrawCommand>;

// Shift a command by offset.
DrawCommand translated(const DrawCommand &cmd, const QPointF &offset);

struct Page {
    int pageNumber = 0;     // 0-based
    QSizeF pageSize;
    QMarginsF margins;
    DrawList commands;
    qreal contentHeight = 0; // vertical space consumed in the content area

    bool operator==(const Page &o) const
    {
        return pageNumber == o.pageNumber && pageSize == o.pageSize
            && margins == o.margins && commands == o.commands
            && qFuzzyCompare(1.0 + contentHeight, 1.0 + o.contentHeight);
    }
};

} // namespace Layout

#endif // FOLIO_DRAWCOMMAND_H
